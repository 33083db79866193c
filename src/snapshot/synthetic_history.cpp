// SPDX-License-Identifier: MIT
/**
 * @file synthetic_history.cpp
 * @brief Implementation of the synthetic price path generator
 */

#include "snapshot/synthetic_history.hpp"
#include "calendar/date_utils.hpp"
#include "config/json_value.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <random>

namespace journal
{
    namespace snapshot
    {

        namespace
        {
            constexpr double kDailyTrend = 0.02;
            constexpr double kNoiseLow = 0.85;
            constexpr double kNoiseHigh = 1.15;
            constexpr double kPriceFloor = 0.5;   // fraction of buy price
        }

        int BackfillPolicy::threshold(int days_back) const
        {
            return min_existing_days >= 0 ? min_existing_days : days_back / 2;
        }

        BackfillPolicy BackfillPolicy::from_json(const nlohmann::json &j)
        {
            BackfillPolicy policy;
            if (j.contains("min_existing_days"))
                policy.min_existing_days = config::int_value(j["min_existing_days"], "backfill.min_existing_days");
            if (j.contains("seed"))
            {
                int seed = config::int_value(j["seed"], "backfill.seed");
                if (seed < 0)
                    throw ConfigError("backfill.seed must not be negative");
                policy.seed = static_cast<unsigned int>(seed);
            }

            return policy;
        }

        Decimal SyntheticPaths::price(size_t date_index, size_t ticker_index) const
        {
            return Decimal::from_double(prices(static_cast<Eigen::Index>(date_index),
                                               static_cast<Eigen::Index>(ticker_index)));
        }

        SyntheticPaths generate_price_paths(const std::string &today,
                                            int days_back,
                                            const std::vector<ledger::Position> &base_positions,
                                            const std::map<std::string, Decimal> &base_prices,
                                            unsigned int seed)
        {
            calendar::require_valid_date(today);
            if (days_back < 1)
            {
                throw ValidationError("days_back must be at least 1, got " + std::to_string(days_back));
            }

            std::mt19937 gen(seed);
            std::uniform_real_distribution<double> noise(kNoiseLow, kNoiseHigh);

            SyntheticPaths paths;
            paths.dates.reserve(days_back);
            for (int i = days_back; i > 0; --i)
            {
                paths.dates.push_back(calendar::add_days(today, -i));
            }

            Eigen::VectorXd base(base_positions.size());
            Eigen::VectorXd floor(base_positions.size());
            for (size_t j = 0; j < base_positions.size(); ++j)
            {
                const auto &pos = base_positions[j];
                paths.tickers.push_back(pos.ticker);

                auto it = base_prices.find(pos.ticker);
                base(j) = (it != base_prices.end() ? it->second : pos.buy_price).to_double();
                floor(j) = pos.buy_price.to_double() * kPriceFloor;
            }

            paths.prices.resize(days_back, static_cast<Eigen::Index>(base_positions.size()));
            for (int d = 0; d < days_back; ++d)
            {
                double trend = 1.0 + d * kDailyTrend;
                for (Eigen::Index j = 0; j < paths.prices.cols(); ++j)
                {
                    double price = base(j) * trend * noise(gen);
                    paths.prices(d, j) = std::max(price, floor(j));
                }
            }

            return paths;
        }

    } // namespace snapshot
} // namespace journal
