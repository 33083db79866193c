// SPDX-License-Identifier: MIT
/**
 * @file price_source.cpp
 * @brief Implementation of the price sources and manual overrides
 */

#include "market/price_source.hpp"
#include "calendar/date_utils.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>

namespace journal
{
    namespace market
    {

        namespace
        {

            std::string normalize(const std::string &ticker)
            {
                std::string out = trim(ticker);
                std::transform(out.begin(), out.end(), out.begin(),
                               [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
                return out;
            }

            std::optional<Decimal> parse_price_cell(const std::string &cell)
            {
                std::string text = trim(cell);
                if (text.empty() || text == "nan" || text == "NaN" || text == "null")
                {
                    return std::nullopt;
                }
                try
                {
                    Decimal price = Decimal::parse(text);
                    if (!price.is_positive())
                        return std::nullopt;
                    return price;
                }
                catch (const ValidationError &)
                {
                    return std::nullopt; // unparseable cell counts as missing
                }
            }

        } // anonymous namespace

        // ============
        // PriceSource
        // ============

        PriceLookup PriceSource::lookup_for(const std::string &date) const
        {
            return [this, date](const std::string &ticker) { return get_price(ticker, date); };
        }

        // ==================
        // StaticPriceSource
        // ==================

        StaticPriceSource::StaticPriceSource(std::map<std::string, Decimal> prices)
        {
            for (const auto &kv : prices)
            {
                set_price(kv.first, kv.second);
            }
        }

        void StaticPriceSource::set_price(const std::string &ticker, const Decimal &price)
        {
            undated_[normalize(ticker)] = price;
        }

        void StaticPriceSource::set_price(const std::string &ticker, const std::string &date,
                                          const Decimal &price)
        {
            dated_[normalize(ticker)][date] = price;
        }

        std::optional<Decimal> StaticPriceSource::get_price(const std::string &ticker,
                                                            const std::string &date) const
        {
            std::string key = normalize(ticker);

            auto by_ticker = dated_.find(key);
            if (by_ticker != dated_.end())
            {
                auto it = by_ticker->second.find(date);
                if (it != by_ticker->second.end())
                    return it->second;
            }

            auto it = undated_.find(key);
            if (it != undated_.end())
                return it->second;

            return std::nullopt;
        }

        // ===============
        // CsvPriceSource
        // ===============

        CsvPriceSource::CsvPriceSource(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw ConfigError("Could not open price file: " + filepath);
            }

            std::string line;
            if (!std::getline(file, line))
            {
                throw ConfigError("Empty price file: " + filepath);
            }

            auto header = parse_csv_line(line);
            for (auto &h : header)
                h = trim(h);

            if (header.empty() || header[0] != "date")
            {
                throw ConfigError("Price file must start with 'date' column: " + filepath);
            }

            // Long format: date, ticker, price
            // Wide format: date, ticker1, ticker2, ...
            if (header.size() == 3 && (header[1] == "ticker" || header[1] == "symbol"))
            {
                load_long(file);
            }
            else
            {
                load_wide(file, header);
            }

            if (count_ == 0)
            {
                throw ConfigError("No valid prices found in " + filepath);
            }
        }

        void CsvPriceSource::load_wide(std::istream &in, const std::vector<std::string> &header)
        {
            std::string line;
            while (std::getline(in, line))
            {
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);
                if (fields.size() < 2)
                    continue;

                std::string date = trim(fields[0]);
                if (!calendar::is_valid_date(date))
                    continue; // Skip invalid dates

                for (size_t i = 1; i < header.size() && i < fields.size(); ++i)
                {
                    insert(header[i], date, fields[i]);
                }
            }
        }

        void CsvPriceSource::load_long(std::istream &in)
        {
            std::string line;
            while (std::getline(in, line))
            {
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);
                if (fields.size() < 3)
                    continue;

                std::string date = trim(fields[0]);
                if (!calendar::is_valid_date(date))
                    continue;

                insert(fields[1], date, fields[2]);
            }
        }

        void CsvPriceSource::insert(const std::string &ticker, const std::string &date,
                                    const std::string &cell)
        {
            auto price = parse_price_cell(cell);
            std::string key = normalize(ticker);
            if (!price || key.empty())
                return;

            auto &series = prices_[key];
            if (series.find(date) == series.end())
                ++count_;
            series[date] = *price;
        }

        std::optional<Decimal> CsvPriceSource::get_price(const std::string &ticker,
                                                         const std::string &date) const
        {
            auto by_ticker = prices_.find(normalize(ticker));
            if (by_ticker == prices_.end())
                return std::nullopt;

            auto it = by_ticker->second.find(date);
            if (it == by_ticker->second.end())
                return std::nullopt;

            return it->second;
        }

        std::vector<std::string> CsvPriceSource::tickers() const
        {
            std::vector<std::string> out;
            for (const auto &kv : prices_)
                out.push_back(kv.first);
            return out;
        }

        std::vector<std::string> CsvPriceSource::dates() const
        {
            std::set<std::string> all;
            for (const auto &kv : prices_)
            {
                for (const auto &dp : kv.second)
                    all.insert(dp.first);
            }
            return std::vector<std::string>(all.begin(), all.end());
        }

        // ===============
        // PriceOverrides
        // ===============

        void PriceOverrides::set(const std::string &ticker, const Decimal &price)
        {
            std::string key = normalize(ticker);
            if (key.empty())
            {
                throw ValidationError("Ticker is required for a price override");
            }
            if (!price.is_positive())
            {
                throw ValidationError("Override price for " + key + " must be positive, got " +
                                      price.to_string());
            }
            std::lock_guard<std::mutex> lock(mutex_);
            prices_[key] = price;
        }

        void PriceOverrides::remove(const std::string &ticker)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            prices_.erase(normalize(ticker));
        }

        void PriceOverrides::clear()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            prices_.clear();
        }

        std::optional<Decimal> PriceOverrides::get(const std::string &ticker) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = prices_.find(normalize(ticker));
            if (it == prices_.end())
                return std::nullopt;
            return it->second;
        }

        bool PriceOverrides::contains(const std::string &ticker) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return prices_.count(normalize(ticker)) > 0;
        }

        std::map<std::string, Decimal> PriceOverrides::all() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return prices_;
        }

        // ====================
        // OverridePriceSource
        // ====================

        OverridePriceSource::OverridePriceSource(const PriceOverrides &overrides,
                                                 const PriceSource *fallback)
            : overrides_(overrides), fallback_(fallback)
        {
        }

        std::optional<Decimal> OverridePriceSource::get_price(const std::string &ticker,
                                                              const std::string &date) const
        {
            auto manual = overrides_.get(ticker);
            if (manual)
                return manual;
            if (fallback_)
                return fallback_->get_price(ticker, date);
            return std::nullopt;
        }

        // ========
        // Helpers
        // ========

        std::vector<std::string> parse_csv_line(const std::string &line)
        {
            std::vector<std::string> tokens;
            std::string token;
            bool in_quotes = false;

            for (char c : line)
            {
                if (c == '"')
                {
                    in_quotes = !in_quotes;
                }
                else if (c == ',' && !in_quotes)
                {
                    tokens.push_back(token);
                    token.clear();
                }
                else
                {
                    token += c;
                }
            }

            tokens.push_back(token);
            return tokens;
        }

        std::string trim(const std::string &str)
        {
            size_t first = str.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
                return "";

            size_t last = str.find_last_not_of(" \t\r\n");
            return str.substr(first, last - first + 1);
        }

    } // namespace market
} // namespace journal
