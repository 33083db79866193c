// SPDX-License-Identifier: MIT
#ifndef JOURNAL_CORE_ERRORS_HPP
#define JOURNAL_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace journal {

/**
 * @brief Bad caller input: ticker/shares/price/date shape or range, or a trade
 * the ledger policy refuses (e.g. insufficient cash).
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Base for runtime failures raised by the journal.
 */
class JournalError : public std::runtime_error {
public:
    explicit JournalError(const std::string& what) : std::runtime_error(what) {}
};

/// Operation targets a position (or other entity) that does not exist.
class NotFoundError : public JournalError {
public:
    explicit NotFoundError(const std::string& what) : JournalError(what) {}
};

/// Storage unavailable, lock timeout, constraint violation or write failure.
class RepositoryError : public JournalError {
public:
    explicit RepositoryError(const std::string& what) : JournalError(what) {}
};

/// Missing or invalid configuration.
class ConfigError : public JournalError {
public:
    explicit ConfigError(const std::string& what) : JournalError(what) {}
};

/// A required price could not be obtained from the price source.
class MarketDataError : public JournalError {
public:
    explicit MarketDataError(const std::string& what) : JournalError(what) {}
};

} // namespace journal

#endif // JOURNAL_CORE_ERRORS_HPP
