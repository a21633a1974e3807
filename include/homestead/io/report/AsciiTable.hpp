#pragma once

/**
 * @file AsciiTable.hpp
 * @brief Box-drawn table for report sections
 */

#include <homestead/io/Console.hpp>

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

namespace homestead {

/**
 * @brief Box-drawn table with per-column alignment
 *
 * Example output:
 * ┌──────────────────────┬───────────────┐
 * │ PARAMETER            │         VALUE │
 * ├──────────────────────┼───────────────┤
 * │ house_price          │ 10,000,000.00 │
 * │ monthly_rent         │     25,000.00 │
 * ├──────────────────────┼───────────────┤
 * │ mortgage_years       │            30 │
 * └──────────────────────┴───────────────┘
 */
class AsciiTable {
  public:
    enum class Align { Left, Right, Center };

    struct Column {
        std::string header;
        std::size_t width = 0; ///< 0 = auto-size
        Align align = Align::Left;
    };

    void AddColumn(const std::string &header, std::size_t width = 0, Align align = Align::Left) {
        columns_.push_back(Column{header, width, align});
    }

    void AddRow(const std::vector<std::string> &cells) { rows_.push_back(Row{cells, false}); }

    /// Insert a horizontal rule between groups of rows
    void AddSeparator() { rows_.push_back(Row{{}, true}); }

    [[nodiscard]] std::size_t RowCount() const {
        return static_cast<std::size_t>(std::count_if(
            rows_.begin(), rows_.end(), [](const Row &r) { return !r.separator; }));
    }

    /**
     * @brief Render the table
     * @param indent Spaces prepended to every line
     */
    [[nodiscard]] std::string Render(std::size_t indent = 0) const {
        if (columns_.empty()) {
            return "";
        }

        const std::vector<std::size_t> widths = CalculateWidths();
        const std::string pad(indent, ' ');

        std::ostringstream oss;
        oss << pad << RenderRule(widths, BoxChars::TopLeft, BoxChars::TeeDown, BoxChars::TopRight)
            << "\n";

        std::vector<std::string> headers;
        headers.reserve(columns_.size());
        for (const auto &col : columns_) {
            headers.push_back(col.header);
        }
        // Headers follow the column alignment so numeric headers sit over numbers
        oss << pad << RenderCells(headers, widths) << "\n";
        oss << pad << RenderRule(widths, BoxChars::TeeRight, BoxChars::Cross, BoxChars::TeeLeft)
            << "\n";

        for (const auto &row : rows_) {
            if (row.separator) {
                oss << pad
                    << RenderRule(widths, BoxChars::TeeRight, BoxChars::Cross, BoxChars::TeeLeft)
                    << "\n";
            } else {
                oss << pad << RenderCells(row.cells, widths) << "\n";
            }
        }

        oss << pad
            << RenderRule(widths, BoxChars::BottomLeft, BoxChars::TeeUp, BoxChars::BottomRight)
            << "\n";
        return oss.str();
    }

    void ClearRows() { rows_.clear(); }

  private:
    struct Row {
        std::vector<std::string> cells;
        bool separator = false;
    };

    std::vector<Column> columns_;
    std::vector<Row> rows_;

    [[nodiscard]] std::vector<std::size_t> CalculateWidths() const {
        std::vector<std::size_t> widths;
        widths.reserve(columns_.size());

        for (std::size_t i = 0; i < columns_.size(); ++i) {
            std::size_t width = columns_[i].width;
            if (width == 0) {
                width = DisplayWidth(columns_[i].header);
                for (const auto &row : rows_) {
                    if (i < row.cells.size()) {
                        width = std::max(width, DisplayWidth(row.cells[i]));
                    }
                }
            }
            widths.push_back(width);
        }
        return widths;
    }

    [[nodiscard]] static std::string RenderRule(const std::vector<std::size_t> &widths,
                                                const char *left, const char *joint,
                                                const char *right) {
        std::ostringstream oss;
        oss << left;
        for (std::size_t i = 0; i < widths.size(); ++i) {
            for (std::size_t j = 0; j < widths[i] + 2; ++j) {
                oss << BoxChars::Horizontal;
            }
            if (i + 1 < widths.size()) {
                oss << joint;
            }
        }
        oss << right;
        return oss.str();
    }

    [[nodiscard]] std::string RenderCells(const std::vector<std::string> &cells,
                                          const std::vector<std::size_t> &widths) const {
        std::ostringstream oss;
        oss << BoxChars::Vertical;
        for (std::size_t i = 0; i < widths.size(); ++i) {
            const std::string cell = (i < cells.size()) ? cells[i] : "";
            oss << " " << AlignCell(cell, widths[i], columns_[i].align) << " ";
            oss << BoxChars::Vertical;
        }
        return oss.str();
    }

    /// Display width of a UTF-8 string (codepoints, not bytes)
    [[nodiscard]] static std::size_t DisplayWidth(const std::string &text) {
        std::size_t width = 0;
        for (char ch : text) {
            auto c = static_cast<unsigned char>(ch);
            if ((c & 0xC0) != 0x80) {
                ++width;
            }
        }
        return width;
    }

    [[nodiscard]] static std::string AlignCell(const std::string &text, std::size_t width,
                                               Align align) {
        std::size_t display_width = DisplayWidth(text);
        if (display_width >= width) {
            return text;
        }

        std::size_t padding = width - display_width;
        switch (align) {
        case Align::Left:
            return text + std::string(padding, ' ');
        case Align::Right:
            return std::string(padding, ' ') + text;
        case Align::Center: {
            std::size_t left = padding / 2;
            return std::string(left, ' ') + text + std::string(padding - left, ' ');
        }
        }
        return text;
    }
};

} // namespace homestead
