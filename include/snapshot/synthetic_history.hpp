// SPDX-License-Identifier: MIT
/**
 * @file synthetic_history.hpp
 * @brief Deterministic price paths for seeding portfolio history outside production
 */

#ifndef JOURNAL_SNAPSHOT_SYNTHETIC_HISTORY_HPP
#define JOURNAL_SNAPSHOT_SYNTHETIC_HISTORY_HPP

#include <map>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include "core/decimal.hpp"
#include "ledger/ledger_types.hpp"

namespace journal {
namespace snapshot {

/**
 * @struct BackfillPolicy
 * @brief When and how far back synthetic history is generated
 */
struct BackfillPolicy {
    int min_existing_days = -1;    ///< Skip if this many past dates exist; negative means days_back / 2
    unsigned int seed = 42;        ///< Generator seed; same seed, same rows
    bool allow_clear = false;      ///< Backfill replaces past history; only set outside production

    /// Effective skip threshold for a window of @p days_back days.
    int threshold(int days_back) const;

    /// @throws ConfigError on invalid values.
    static BackfillPolicy from_json(const nlohmann::json& j);
};

/**
 * @struct SyntheticPaths
 * @brief Generated closing prices, one row per calendar day
 */
struct SyntheticPaths {
    std::vector<std::string> dates;     ///< Oldest first, ending the day before today
    std::vector<std::string> tickers;   ///< Same order as the position list
    Eigen::MatrixXd prices;             ///< dates x tickers

    Decimal price(size_t date_index, size_t ticker_index) const;
};

/**
 * @brief Generate an upward-trending noisy path for each base position.
 *
 * Day d (0 = oldest) is priced base * (1 + 0.02 d) * U(0.85, 1.15), floored at
 * half the position's buy price. The base price defaults to the buy price
 * when @p base_prices has no entry.
 *
 * @param today      Excluded; paths cover the @p days_back days before it
 * @throws ValidationError if days_back < 1 or today is not a valid date
 */
SyntheticPaths generate_price_paths(const std::string& today,
                                    int days_back,
                                    const std::vector<ledger::Position>& base_positions,
                                    const std::map<std::string, Decimal>& base_prices,
                                    unsigned int seed);

} // namespace snapshot
} // namespace journal

#endif // JOURNAL_SNAPSHOT_SYNTHETIC_HISTORY_HPP
