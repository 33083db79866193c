// SPDX-License-Identifier: MIT
/**
 * @file price_source.hpp
 * @brief Narrow interface to the market-data collaborator used by snapshots
 *
 * Supports:
 * - In-memory prices (tests, fixed valuations)
 * - CSV price files in wide (date,T1,T2,...) or long (date,ticker,price) form
 * - Manual overrides consulted before a fallback source
 */

#ifndef JOURNAL_MARKET_PRICE_SOURCE_HPP
#define JOURNAL_MARKET_PRICE_SOURCE_HPP

#include <functional>
#include <istream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/decimal.hpp"

namespace journal {
namespace market {

/// Function form consumed by the pure snapshot computation.
using PriceLookup = std::function<std::optional<Decimal>(const std::string& ticker)>;

/**
 * @class PriceSource
 * @brief Closing (or latest) price of a ticker on a date.
 *
 * Returns std::nullopt when no price is available; never a zero placeholder.
 */
class PriceSource {
public:
    virtual ~PriceSource() = default;

    virtual std::optional<Decimal> get_price(const std::string& ticker,
                                             const std::string& date) const = 0;

    /// Bind @p date, giving the lookup used by compute_snapshot().
    PriceLookup lookup_for(const std::string& date) const;
};

/**
 * @class StaticPriceSource
 * @brief In-memory prices, either date-independent or keyed by date.
 *
 * A dated price wins over an undated one for the same ticker.
 */
class StaticPriceSource : public PriceSource {
public:
    StaticPriceSource() = default;
    explicit StaticPriceSource(std::map<std::string, Decimal> prices);

    void set_price(const std::string& ticker, const Decimal& price);
    void set_price(const std::string& ticker, const std::string& date, const Decimal& price);

    std::optional<Decimal> get_price(const std::string& ticker,
                                     const std::string& date) const override;

private:
    std::map<std::string, Decimal> undated_;
    std::map<std::string, std::map<std::string, Decimal>> dated_;   // ticker -> date -> price
};

/**
 * @class CsvPriceSource
 * @brief Prices loaded once from a CSV file.
 *
 * Wide format:
 * date,AAPL,MSFT
 * 2024-01-02,185.64,370.87
 *
 * Long format:
 * date,ticker,price
 * 2024-01-02,AAPL,185.64
 *
 * Empty, "nan" or non-positive cells are treated as missing.
 */
class CsvPriceSource : public PriceSource {
public:
    /// @throws ConfigError if the file cannot be read or holds no prices.
    explicit CsvPriceSource(const std::string& filepath);

    std::optional<Decimal> get_price(const std::string& ticker,
                                     const std::string& date) const override;

    std::vector<std::string> tickers() const;
    std::vector<std::string> dates() const;
    size_t size() const { return count_; }

private:
    std::map<std::string, std::map<std::string, Decimal>> prices_;   // ticker -> date -> price
    size_t count_ = 0;

    void load_wide(std::istream& in, const std::vector<std::string>& header);
    void load_long(std::istream& in);
    void insert(const std::string& ticker, const std::string& date, const std::string& cell);
};

/**
 * @class PriceOverrides
 * @brief Manual prices entered when market data is unavailable.
 *
 * Owned by the caller and injected where needed. Tickers are normalised
 * (trimmed, upper-cased). Thread safe.
 */
class PriceOverrides {
public:
    /// @throws ValidationError if @p price is not positive.
    void set(const std::string& ticker, const Decimal& price);
    void remove(const std::string& ticker);
    void clear();

    std::optional<Decimal> get(const std::string& ticker) const;
    bool contains(const std::string& ticker) const;
    std::map<std::string, Decimal> all() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Decimal> prices_;
};

/**
 * @class OverridePriceSource
 * @brief Consults overrides first, then an optional fallback source.
 */
class OverridePriceSource : public PriceSource {
public:
    OverridePriceSource(const PriceOverrides& overrides, const PriceSource* fallback = nullptr);

    std::optional<Decimal> get_price(const std::string& ticker,
                                     const std::string& date) const override;

private:
    const PriceOverrides& overrides_;
    const PriceSource* fallback_;
};

/// Split one CSV line; double quotes group commas.
std::vector<std::string> parse_csv_line(const std::string& line);

std::string trim(const std::string& str);

} // namespace market
} // namespace journal

#endif // JOURNAL_MARKET_PRICE_SOURCE_HPP
