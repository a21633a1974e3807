#pragma once

/**
 * @file Console.hpp
 * @brief Console abstraction with ANSI color support and money formatting
 *
 * Provides terminal-aware output with ANSI escape codes, box-drawing glyphs
 * for report tables, and currency formatting for net-worth figures.
 */

#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define STDOUT_FILENO 1
#else
#include <unistd.h>
#endif

namespace homestead {

// =============================================================================
// LogLevel
// =============================================================================

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    Trace,   ///< Per-month engine internals
    Debug,   ///< Per-year progress, derived parameters
    Info,    ///< Normal operation
    Event,   ///< Run milestones (scenario loaded, horizon settled)
    Warning, ///< Potential issues
    Error,   ///< Operation failed
    Fatal    ///< Unrecoverable
};

/**
 * @brief Parse a level name ("trace", "debug", "info", "event", "warning",
 * "error", "fatal"), case-insensitive
 */
inline std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "event")
        return LogLevel::Event;
    if (lower == "warning" || lower == "warn")
        return LogLevel::Warning;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "fatal")
        return LogLevel::Fatal;
    return std::nullopt;
}

// =============================================================================
// AnsiColor
// =============================================================================

struct AnsiColor {
    static constexpr const char *Reset = "\033[0m";
    static constexpr const char *Bold = "\033[1m";
    static constexpr const char *Dim = "\033[2m";

    static constexpr const char *Red = "\033[31m";
    static constexpr const char *Green = "\033[32m";
    static constexpr const char *Yellow = "\033[33m";
    static constexpr const char *Cyan = "\033[36m";
    static constexpr const char *White = "\033[37m";
    static constexpr const char *Gray = "\033[90m";

    static constexpr const char *BgRed = "\033[41m";
};

// =============================================================================
// BoxChars
// =============================================================================

/**
 * @brief Box-drawing characters (Unicode)
 */
struct BoxChars {
    static constexpr const char *TopLeft = "\u250C";     // ┌
    static constexpr const char *TopRight = "\u2510";    // ┐
    static constexpr const char *BottomLeft = "\u2514";  // └
    static constexpr const char *BottomRight = "\u2518"; // ┘
    static constexpr const char *Horizontal = "\u2500";  // ─
    static constexpr const char *Vertical = "\u2502";    // │
    static constexpr const char *TeeRight = "\u251C";    // ├
    static constexpr const char *TeeLeft = "\u2524";     // ┤
    static constexpr const char *TeeDown = "\u252C";     // ┬
    static constexpr const char *TeeUp = "\u2534";       // ┴
    static constexpr const char *Cross = "\u253C";       // ┼
    static constexpr const char *HeavyHoriz = "\u2550";  // ═
};

// =============================================================================
// Console
// =============================================================================

/**
 * @brief Console output with color and formatting support
 *
 * Detects if stdout is a terminal and enables/disables ANSI colors accordingly.
 */
class Console {
  public:
    Console() : is_tty_(isatty(STDOUT_FILENO) != 0), color_enabled_(is_tty_) {}

    [[nodiscard]] bool IsTerminal() const { return is_tty_; }

    void SetColorEnabled(bool enabled) { color_enabled_ = enabled; }
    [[nodiscard]] bool IsColorEnabled() const { return color_enabled_; }

    void SetLogLevel(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel GetLogLevel() const { return min_level_; }

    /// Log with explicit level
    void Log(LogLevel level, std::string_view msg) const {
        if (level < min_level_) {
            return;
        }
        std::string prefix = GetLevelPrefix(level);
        if (color_enabled_) {
            prefix = Colorize(prefix, GetLevelColor(level));
        }
        std::cout << prefix << " " << msg << "\n";
    }

    void Info(std::string_view msg) const { Log(LogLevel::Info, msg); }
    void Warning(std::string_view msg) const { Log(LogLevel::Warning, msg); }
    void Error(std::string_view msg) const { Log(LogLevel::Error, msg); }

    // === Formatting Helpers ===

    /// Apply color if enabled
    [[nodiscard]] std::string Colorize(std::string_view text, const char *color) const {
        if (!color_enabled_) {
            return std::string(text);
        }
        return std::string(color) + std::string(text) + AnsiColor::Reset;
    }

    [[nodiscard]] static std::string PadRight(std::string_view text, std::size_t width) {
        if (text.size() >= width) {
            return std::string(text);
        }
        return std::string(text) + std::string(width - text.size(), ' ');
    }

    [[nodiscard]] static std::string PadLeft(std::string_view text, std::size_t width) {
        if (text.size() >= width) {
            return std::string(text);
        }
        return std::string(width - text.size(), ' ') + std::string(text);
    }

    /// Fixed-point number with thousands separators, e.g. 1234567.891 -> "1,234,567.89"
    [[nodiscard]] static std::string FormatNumber(double value, int precision = 2) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << std::fabs(value);
        std::string digits = oss.str();

        std::size_t int_end = digits.find('.');
        if (int_end == std::string::npos) {
            int_end = digits.size();
        }

        std::string grouped;
        for (std::size_t i = 0; i < int_end; ++i) {
            if (i > 0 && (int_end - i) % 3 == 0) {
                grouped += ',';
            }
            grouped += digits[i];
        }
        grouped += digits.substr(int_end);

        // Suppress "-0" when the value rounds to zero
        bool negative = value < 0.0 && grouped.find_first_not_of("0.,") != std::string::npos;
        return negative ? "-" + grouped : grouped;
    }

    /// Whole-unit currency, e.g. 14449961.2 -> "$14,449,961"
    [[nodiscard]] static std::string FormatCurrency(double value) {
        std::string number = FormatNumber(value, 0);
        if (!number.empty() && number.front() == '-') {
            return "-$" + number.substr(1);
        }
        return "$" + number;
    }

    void Write(std::string_view text) const { std::cout << text; }
    void WriteLine(std::string_view text = "") const { std::cout << text << "\n"; }
    void Flush() const { std::cout.flush(); }

  private:
    bool is_tty_ = false;
    bool color_enabled_ = false;
    LogLevel min_level_ = LogLevel::Info;

    [[nodiscard]] static const char *GetLevelColor(LogLevel level) {
        switch (level) {
        case LogLevel::Trace:
            return AnsiColor::Gray;
        case LogLevel::Debug:
            return AnsiColor::Cyan;
        case LogLevel::Info:
            return AnsiColor::White;
        case LogLevel::Event:
            return AnsiColor::Green;
        case LogLevel::Warning:
            return AnsiColor::Yellow;
        case LogLevel::Error:
            return AnsiColor::Red;
        case LogLevel::Fatal:
            return AnsiColor::BgRed;
        }
        return AnsiColor::White;
    }

    [[nodiscard]] static const char *GetLevelPrefix(LogLevel level) {
        switch (level) {
        case LogLevel::Trace:
            return "[TRC]";
        case LogLevel::Debug:
            return "[DBG]";
        case LogLevel::Info:
            return "[INF]";
        case LogLevel::Event:
            return "[EVT]";
        case LogLevel::Warning:
            return "[WRN]";
        case LogLevel::Error:
            return "[ERR]";
        case LogLevel::Fatal:
            return "[FTL]";
        }
        return "[???]";
    }
};

} // namespace homestead
