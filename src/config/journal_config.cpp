// SPDX-License-Identifier: MIT
/**
 * @file journal_config.cpp
 * @brief Implementation of configuration loading
 */

#include "config/journal_config.hpp"
#include "config/json_value.hpp"
#include "core/errors.hpp"
#include "ledger/validation.hpp"

#include <fstream>

namespace journal
{
    namespace config
    {

        namespace
        {
            nlohmann::json load_json(const std::string &filepath)
            {
                std::ifstream file(filepath);
                if (!file.is_open())
                {
                    throw ConfigError("Could not open JSON file: " + filepath);
                }

                nlohmann::json j;
                try
                {
                    file >> j;
                }
                catch (const nlohmann::json::exception &e)
                {
                    throw ConfigError("JSON parsing error in " + filepath + ": " + std::string(e.what()));
                }

                return j;
            }

            const nlohmann::json &section(const nlohmann::json &j, const char *name)
            {
                const auto &s = j.at(name);
                if (!s.is_object())
                {
                    throw ConfigError(std::string(name) + " section must be an object");
                }
                return s;
            }

            ledger::Position position_from_json(const nlohmann::json &item, size_t index)
            {
                const std::string key = "backfill.positions[" + std::to_string(index) + "]";
                if (!item.is_object())
                    throw ConfigError(key + " must be an object");
                if (!item.contains("ticker") || !item.contains("shares") || !item.contains("buy_price"))
                    throw ConfigError(key + " needs ticker, shares and buy_price");

                ledger::Position p;
                try
                {
                    p.ticker = ledger::normalize_ticker(string_value(item["ticker"], key + ".ticker"));
                    p.shares = int_value(item["shares"], key + ".shares");
                    ledger::validate_shares(p.shares);
                    p.buy_price = decimal_value(item["buy_price"], key + ".buy_price");
                    ledger::validate_price(p.buy_price, key + ".buy_price");
                    if (item.contains("stop_loss") && !item["stop_loss"].is_null())
                    {
                        p.stop_loss = decimal_value(item["stop_loss"], key + ".stop_loss");
                        ledger::validate_stop_loss(p.stop_loss);
                    }
                }
                catch (const ValidationError &e)
                {
                    throw ConfigError(key + ": " + e.what());
                }
                p.cost_basis = p.buy_price.times(p.shares);
                return p;
            }

            std::map<std::string, Decimal> price_map(const nlohmann::json &j, const std::string &key)
            {
                if (!j.is_object())
                    throw ConfigError(key + " must be an object of ticker: price");

                std::map<std::string, Decimal> out;
                for (auto it = j.begin(); it != j.end(); ++it)
                {
                    Decimal price = decimal_value(it.value(), key + "." + it.key());
                    try
                    {
                        ledger::validate_price(price, key + "." + it.key());
                        out[ledger::normalize_ticker(it.key())] = price;
                    }
                    catch (const ValidationError &e)
                    {
                        throw ConfigError(e.what());
                    }
                }
                return out;
            }
        }

        // ===========================
        // Sections
        // ===========================

        BackfillConfig BackfillConfig::from_json(const nlohmann::json &j)
        {
            BackfillConfig config;
            config.policy = snapshot::BackfillPolicy::from_json(j);

            if (j.contains("days_back"))
            {
                config.days_back = int_value(j["days_back"], "backfill.days_back");
                if (config.days_back < 1)
                    throw ConfigError("backfill.days_back must be at least 1");
            }

            if (j.contains("positions"))
            {
                const auto &arr = j["positions"];
                if (!arr.is_array())
                    throw ConfigError("backfill.positions must be an array");
                for (size_t i = 0; i < arr.size(); ++i)
                {
                    config.positions.push_back(position_from_json(arr[i], i));
                }
            }

            if (j.contains("base_prices"))
                config.base_prices = price_map(j["base_prices"], "backfill.base_prices");

            if (j.contains("cash"))
            {
                config.cash = decimal_value(j["cash"], "backfill.cash");
                if (config.cash.is_negative())
                    throw ConfigError("backfill.cash must not be negative");
            }

            return config;
        }

        void PricesConfig::apply_overrides(market::PriceOverrides &overrides) const
        {
            for (const auto &kv : this->overrides)
            {
                overrides.set(kv.first, kv.second);
            }
        }

        PricesConfig PricesConfig::from_json(const nlohmann::json &j)
        {
            PricesConfig config;
            if (j.contains("csv_file"))
                config.csv_file = string_value(j["csv_file"], "prices.csv_file");
            if (j.contains("overrides"))
                config.overrides = price_map(j["overrides"], "prices.overrides");
            return config;
        }

        AuditConfig AuditConfig::from_json(const nlohmann::json &j)
        {
            AuditConfig config;
            if (j.contains("jsonl_file"))
                config.jsonl_file = string_value(j["jsonl_file"], "audit.jsonl_file");
            if (j.contains("persist_events"))
                config.persist_events = bool_value(j["persist_events"], "audit.persist_events");
            return config;
        }

        // ===========================
        // JournalConfig
        // ===========================

        JournalConfig JournalConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw ConfigError("Configuration root must be a JSON object");
            }

            JournalConfig config;

            try
            {
                if (j.contains("environment"))
                {
                    config.environment = string_value(j["environment"], "environment");
                    if (config.environment != kDevStage && config.environment != kProduction)
                    {
                        throw ConfigError("environment must be 'dev_stage' or 'production', got '" +
                                          config.environment + "'");
                    }
                }

                if (j.contains("database"))
                {
                    config.database = storage::DatabaseConfig::from_json(section(j, "database"));
                }

                if (j.contains("ledger"))
                {
                    config.ledger = ledger::LedgerPolicy::from_json(section(j, "ledger"));
                }

                if (j.contains("calendar"))
                {
                    config.calendar = calendar::CalendarConfig::from_json(section(j, "calendar"));
                }

                if (j.contains("snapshot"))
                {
                    config.snapshot = snapshot::SnapshotConfig::from_json(section(j, "snapshot"));
                }

                if (j.contains("backfill"))
                {
                    config.backfill = BackfillConfig::from_json(section(j, "backfill"));
                }

                if (j.contains("prices"))
                {
                    config.prices = PricesConfig::from_json(section(j, "prices"));
                }

                if (j.contains("audit"))
                {
                    config.audit = AuditConfig::from_json(section(j, "audit"));
                }

                if (j.contains("risk"))
                {
                    config.risk = analytics::RiskThresholds::from_json(section(j, "risk"));
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw ConfigError("Invalid configuration value: " + std::string(e.what()));
            }

            config.backfill.policy.allow_clear = config.is_dev_stage();
            return config;
        }

        JournalConfig JournalConfig::load_from_file(const std::string &config_path)
        {
            return from_json(load_json(config_path));
        }

    } // namespace config
} // namespace journal
