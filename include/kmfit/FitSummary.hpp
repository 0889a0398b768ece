#ifndef KMFIT_FIT_SUMMARY_HPP
#define KMFIT_FIT_SUMMARY_HPP

#include <vector>
#include <string>
#include <array>
#include <cstddef>
#include <algorithm>
#include <utility>

#include "fmt/format.h"

/**
 * @file FitSummary.hpp
 * @brief Per-iteration log of the fit.
 */

namespace kmfit {

/**
 * @brief Snapshot of the fit at one iteration.
 *
 * @tparam Float_ Floating-point type of the costs.
 */
template<typename Float_>
struct SummaryRow {
    /**
     * Iteration number.
     */
    int iteration = 0;

    /**
     * Whether the fit had converged.
     */
    bool converged = false;

    /**
     * Cost of the first iteration, i.e., the maximum total within-cluster cost.
     * This is negative infinity before the first iteration completes.
     */
    Float_ max_cost = 0;

    /**
     * Total within-cluster cost of the latest iteration.
     * This is positive infinity before the first iteration completes.
     */
    Float_ tss = 0;

    /**
     * Sum of the final within-cluster sums of squares.
     * This is NaN for all rows except the last row of a fit that iterated.
     */
    Float_ wss_sum = 0;

    /**
     * Final between-cluster sum of squares.
     * This is NaN for all rows except the last row of a fit that iterated.
     */
    Float_ bss = 0;

    /**
     * Wall time since the start of the fit, in seconds.
     */
    double wall = 0;
};

/**
 * @return Column names for the fit summary, in the order of the fields of `SummaryRow`.
 */
inline const std::array<std::string, 7>& summary_headers() {
    static const std::array<std::string, 7> headers{ "Iter. #", "Converged", "Max TSS", "Min TSS", "End WSS", "End BSS", "Wall" };
    return headers;
}

/**
 * @brief Append-only log of `SummaryRow`s.
 *
 * This is purely diagnostic and is not used to control the fit.
 *
 * @tparam Float_ Floating-point type of the costs.
 */
template<typename Float_>
class FitSummary {
private:
    std::vector<SummaryRow<Float_> > my_rows;

public:
    /**
     * @param row Row to append.
     */
    void add(SummaryRow<Float_> row) {
        my_rows.push_back(std::move(row));
    }

    /**
     * @return All rows, in the order in which they were added.
     */
    const std::vector<SummaryRow<Float_> >& rows() const {
        return my_rows;
    }

    /**
     * @return Number of rows.
     */
    std::size_t size() const {
        return my_rows.size();
    }

    /**
     * @return Whether the log is empty.
     */
    bool empty() const {
        return my_rows.empty();
    }

    /**
     * @param i Index of the row.
     * @return The `i`-th row.
     */
    const SummaryRow<Float_>& operator[](const std::size_t i) const {
        return my_rows[i];
    }

    /**
     * @return The most recently added row.
     * This should only be called if the log is not empty.
     */
    const SummaryRow<Float_>& back() const {
        return my_rows.back();
    }
};

/**
 * Render a fit summary as a fixed-width text table.
 * The first line contains the `summary_headers()`, the second line is a separator, and each subsequent line contains one row.
 * Columns are right-aligned and each column is as wide as its widest entry.
 *
 * @tparam Float_ Floating-point type of the costs.
 * @param summary The fit summary.
 * @return The formatted table, with each line terminated by a newline.
 */
template<typename Float_>
std::string format_summary(const FitSummary<Float_>& summary) {
    const auto& headers = summary_headers();
    constexpr std::size_t ncol = 7;

    std::vector<std::array<std::string, ncol> > cells;
    cells.reserve(summary.size());
    for (const auto& row : summary.rows()) {
        cells.push_back({
            fmt::format("{}", row.iteration),
            row.converged ? "true" : "false",
            fmt::format("{:.6g}", row.max_cost),
            fmt::format("{:.6g}", row.tss),
            fmt::format("{:.6g}", row.wss_sum),
            fmt::format("{:.6g}", row.bss),
            fmt::format("{:.4f}s", row.wall)
        });
    }

    std::array<std::size_t, ncol> widths;
    for (std::size_t c = 0; c < ncol; ++c) {
        widths[c] = headers[c].size();
        for (const auto& line : cells) {
            widths[c] = std::max(widths[c], line[c].size());
        }
    }

    std::string output;
    auto add_line = [&](const auto& line) -> void {
        for (std::size_t c = 0; c < ncol; ++c) {
            if (c) {
                output += " | ";
            }
            output += fmt::format("{:>{}}", line[c], widths[c]);
        }
        output += '\n';
    };

    add_line(headers);
    for (std::size_t c = 0; c < ncol; ++c) {
        if (c) {
            output += "-+-";
        }
        output += std::string(widths[c], '-');
    }
    output += '\n';
    for (const auto& line : cells) {
        add_line(line);
    }

    return output;
}

}

#endif
