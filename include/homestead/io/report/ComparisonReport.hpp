#pragma once

/**
 * @file ComparisonReport.hpp
 * @brief Human-readable rent-vs-buy report
 *
 * Layout:
 *   title banner
 *   [ PARAMETERS ]  table of echoed inputs
 *   [ RESULT ]      buy / rent net worth and the verdict line
 *   [ DETAILS ]     terminal diagnostics, two decimals
 */

#include <homestead/io/Console.hpp>
#include <homestead/io/report/AsciiTable.hpp>
#include <homestead/io/report/Banner.hpp>
#include <homestead/sim/SimulationResult.hpp>

#include <cmath>
#include <sstream>
#include <string>

namespace homestead {

class ComparisonReport {
  public:
    ComparisonReport(const Console &console, const SimulationResult<double> &result)
        : console_(console), result_(result) {}

    void SetScenarioName(const std::string &name) { scenario_ = name; }

    /// "BUY better by $X", "RENT better by $X" or the tie message
    [[nodiscard]] static std::string VerdictLine(const SimulationResult<double> &result) {
        switch (result.Verdict()) {
        case Outcome::Buy:
            return "BUY better by " + Console::FormatCurrency(result.net_advantage_buy);
        case Outcome::Rent:
            return "RENT better by " + Console::FormatCurrency(-result.net_advantage_buy);
        case Outcome::Tie:
            break;
        }
        return "TIE: both strategies end with equal net worth";
    }

    [[nodiscard]] std::string Generate() const {
        std::ostringstream oss;
        oss << Banner::GetTitle(scenario_, Version()) << "\n\n";

        oss << Banner::GetSectionHeader("PARAMETERS") << "\n";
        oss << ParameterTable().Render(2) << "\n";

        oss << Banner::GetSectionHeader("RESULT") << "\n";
        oss << "  Horizon:           " << result_.months << " months\n";
        oss << "  Buy net worth:     " << Console::FormatCurrency(result_.buy_net_worth) << "\n";
        oss << "  Rent net worth:    " << Console::FormatCurrency(result_.rent_net_worth) << "\n";
        oss << "  Net advantage buy: " << Console::FormatCurrency(result_.net_advantage_buy)
            << "\n";
        oss << "  " << VerdictLine(result_) << "\n\n";

        oss << Banner::GetSectionHeader("DETAILS") << "\n";
        oss << DetailsTable().Render(2);
        oss << Banner::GetRule() << "\n";
        return oss.str();
    }

    /// Print with the verdict line highlighted when color is enabled
    void Print() const {
        std::string report = Generate();
        if (console_.IsColorEnabled()) {
            const std::string verdict = VerdictLine(result_);
            const auto pos = report.find(verdict);
            if (pos != std::string::npos) {
                const char *color =
                    result_.Verdict() == Outcome::Buy
                        ? AnsiColor::Green
                        : (result_.Verdict() == Outcome::Rent ? AnsiColor::Yellow : AnsiColor::Cyan);
                report.replace(pos, verdict.size(), console_.Colorize(verdict, color));
            }
        }
        console_.Write(report);
        console_.Flush();
    }

  private:
    const Console &console_;
    const SimulationResult<double> &result_;
    std::string scenario_;

    [[nodiscard]] AsciiTable ParameterTable() const {
        AsciiTable table;
        table.AddColumn("PARAMETER", 30);
        table.AddColumn("VALUE", 18, AsciiTable::Align::Right);
        for (const auto &[name, value] : result_.params) {
            // Fractions read better with more digits
            int precision = std::abs(value) < 1.0 ? 4 : 2;
            table.AddRow({name, Console::FormatNumber(value, precision)});
        }
        table.AddSeparator();
        table.AddRow({"mortgage_years", std::to_string(result_.mortgage_years)});
        table.AddRow({"horizon_years", std::to_string(result_.horizon_years)});
        table.AddRow({"invest_monthly_diffs", result_.invest_monthly_diffs ? "true" : "false"});
        return table;
    }

    [[nodiscard]] AsciiTable DetailsTable() const {
        AsciiTable table;
        table.AddColumn("DETAIL", 30);
        table.AddColumn("VALUE", 18, AsciiTable::Align::Right);
        for (const auto &[name, value] : result_.details) {
            table.AddRow({name, Console::FormatNumber(value, 2)});
        }
        return table;
    }
};

} // namespace homestead
