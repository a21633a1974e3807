#pragma once

/**
 * @file Banner.hpp
 * @brief Report banners and rules
 */

#include <homestead/io/Console.hpp>

#include <string>

namespace homestead {

class Banner {
  public:
    static constexpr std::size_t kWidth = 72;

    /// Title block printed at the top of a comparison report
    [[nodiscard]] static std::string GetTitle(const std::string &scenario,
                                              const std::string &version) {
        std::string out = GetDoubleRule() + "\n";
        out += "  HOMESTEAD  |  RENT vs BUY  |  v" + version + "\n";
        if (!scenario.empty()) {
            out += "  Scenario: " + scenario + "\n";
        }
        out += GetDoubleRule();
        return out;
    }

    /// "─── [ TITLE ] ─────..." padded to the banner width
    [[nodiscard]] static std::string GetSectionHeader(const std::string &title) {
        std::string header = "─── [ " + title + " ] ";
        std::size_t used = title.size() + 9;
        for (std::size_t i = used; i < kWidth; ++i) {
            header += BoxChars::Horizontal;
        }
        return header;
    }

    [[nodiscard]] static std::string GetRule(std::size_t width = kWidth, char c = '=') {
        return std::string(width, c);
    }

    [[nodiscard]] static std::string GetDoubleRule(std::size_t width = kWidth) {
        std::string rule;
        for (std::size_t i = 0; i < width; ++i) {
            rule += BoxChars::HeavyHoriz;
        }
        return rule;
    }
};

} // namespace homestead
