/**
 * @file tax_estimator.cpp
 * @brief Implementation of TaxEstimator.
 */

#include "analytics/tax_estimator.hpp"

#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace wealth
{
    namespace analytics
    {

        namespace
        {
            constexpr double GAIN_EPSILON = 1e-9;

            std::string money(double value)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(2) << value;
                return oss.str();
            }
        } // namespace

        std::string to_string(GainClassification classification)
        {
            return classification == GainClassification::LONG_TERM ? "long_term" : "short_term";
        }

        // ===================================================================
        // TaxConfig
        // ===================================================================

        TaxConfig TaxConfig::default_config()
        {
            TaxConfig config;
            config.holding_period_days = {
                {data::AssetCategory::EQUITIES, 365},
                {data::AssetCategory::POOLED_FUNDS, 365},
                {data::AssetCategory::CRYPTO_ASSETS, 1095},
                {data::AssetCategory::REAL_ESTATE, 730},
                {data::AssetCategory::FIXED_INCOME, 1095},
                {data::AssetCategory::PRECIOUS_METALS, 1095},
                {data::AssetCategory::OTHER, 1095}};
            return config;
        }

        TaxConfig TaxConfig::from_json(const nlohmann::json &j)
        {
            TaxConfig config = default_config();
            config.long_term_rate_pct = j.value("long_term_rate_pct", 10.0);
            config.short_term_rate_pct = j.value("short_term_rate_pct", 15.0);
            config.long_term_exemption = j.value("long_term_exemption", 100000.0);
            config.near_threshold_days = j.value("near_threshold_days", 60);

            if (j.contains("holding_period_days"))
            {
                const auto &table = j["holding_period_days"];
                if (!table.is_object())
                {
                    throw ConfigurationError("tax.holding_period_days", "Expected an object keyed by category");
                }
                config.holding_period_days.clear();
                for (auto it = table.begin(); it != table.end(); ++it)
                {
                    config.holding_period_days[data::parse_category(it.key())] = it.value().get<int>();
                }
            }

            config.validate();
            return config;
        }

        nlohmann::json TaxConfig::to_json() const
        {
            nlohmann::json table = nlohmann::json::object();
            for (const auto &[category, days] : holding_period_days)
            {
                table[data::to_string(category)] = days;
            }
            return nlohmann::json{
                {"holding_period_days", table},
                {"long_term_rate_pct", long_term_rate_pct},
                {"short_term_rate_pct", short_term_rate_pct},
                {"long_term_exemption", long_term_exemption},
                {"near_threshold_days", near_threshold_days}};
        }

        void TaxConfig::validate() const
        {
            for (const auto &[category, days] : holding_period_days)
            {
                if (days < 0)
                {
                    throw ConfigurationError("tax.holding_period_days",
                                             "Expected non-negative threshold, got: " + std::to_string(days),
                                             data::to_string(category));
                }
            }
            for (const auto &[field, rate] : {std::make_pair("tax.long_term_rate_pct", long_term_rate_pct),
                                              std::make_pair("tax.short_term_rate_pct", short_term_rate_pct)})
            {
                if (!(rate >= 0.0 && rate <= 100.0))
                {
                    throw ConfigurationError(field, "Expected rate in 0..100, got: " + std::to_string(rate));
                }
            }
            if (!(long_term_exemption >= 0.0) || !std::isfinite(long_term_exemption))
            {
                throw ConfigurationError("tax.long_term_exemption",
                                         "Expected non-negative value, got: " + std::to_string(long_term_exemption));
            }
            if (near_threshold_days < 0)
            {
                throw ConfigurationError("tax.near_threshold_days",
                                         "Expected non-negative value, got: " + std::to_string(near_threshold_days));
            }
        }

        // ===================================================================
        // TaxEstimator
        // ===================================================================

        HoldingTaxDetail TaxEstimator::classify(const data::Holding &holding,
                                                const std::string &valuation_date,
                                                const TaxConfig &config)
        {
            auto it = config.holding_period_days.find(holding.category);
            if (it == config.holding_period_days.end())
            {
                throw ConfigurationError("tax.holding_period_days",
                                         "No holding-period threshold configured",
                                         data::to_string(holding.category));
            }

            HoldingTaxDetail detail;
            detail.name = holding.name;
            detail.category = holding.category;
            detail.gain = holding.gain();
            detail.holding_days = holding.holding_period_days(valuation_date);
            detail.threshold_days = it->second;
            detail.classification = detail.holding_days >= detail.threshold_days
                                        ? GainClassification::LONG_TERM
                                        : GainClassification::SHORT_TERM;
            return detail;
        }

        TaxEstimate TaxEstimator::estimate(const data::HoldingSnapshot &snapshot, const TaxConfig &config)
        {
            snapshot.validate();
            config.validate();

            // Reject missing thresholds before computing anything
            for (const auto &[category, value] : snapshot.value_by_category())
            {
                if (config.holding_period_days.find(category) == config.holding_period_days.end())
                {
                    throw ConfigurationError("tax.holding_period_days",
                                             "No holding-period threshold configured",
                                             data::to_string(category));
                }
            }

            TaxEstimate result;
            for (const auto &holding : snapshot.holdings)
            {
                HoldingTaxDetail detail = classify(holding, snapshot.valuation_date, config);
                if (detail.classification == GainClassification::LONG_TERM)
                {
                    result.long_term_gains += detail.gain;
                }
                else
                {
                    result.short_term_gains += detail.gain;
                }
                result.holdings.push_back(detail);
            }

            const double lt_rate = config.long_term_rate_pct / 100.0;
            const double st_rate = config.short_term_rate_pct / 100.0;

            result.long_term_liability = std::max(0.0, result.long_term_gains - config.long_term_exemption) * lt_rate;
            result.short_term_liability = std::max(0.0, result.short_term_gains) * st_rate;
            result.total_tax_liability = result.long_term_liability + result.short_term_liability;

            const double total_gain = result.long_term_gains + result.short_term_gains;
            result.effective_tax_rate = total_gain > GAIN_EPSILON
                                            ? result.total_tax_liability / total_gain * 100.0
                                            : 0.0;

            // ---- Loss harvesting
            for (const auto &detail : result.holdings)
            {
                if (detail.gain >= 0.0)
                {
                    continue;
                }
                const double rate = detail.classification == GainClassification::LONG_TERM ? lt_rate : st_rate;
                result.tax_saving_opportunities.push_back(
                    {"loss_harvesting", detail.name,
                     "Book the " + money(-detail.gain) + " " + to_string(detail.classification) +
                         " loss on " + detail.name + " to offset gains",
                     -detail.gain * rate});
            }

            // ---- Unused long-term exemption
            const double room = config.long_term_exemption - std::max(0.0, result.long_term_gains);
            if (room > 0.0)
            {
                for (const auto &detail : result.holdings)
                {
                    if (detail.classification != GainClassification::LONG_TERM || detail.gain <= 0.0)
                    {
                        continue;
                    }
                    result.tax_saving_opportunities.push_back(
                        {"exemption_room", detail.name,
                         "Up to " + money(room) + " of long-term gains can be realized tax-free; " +
                             detail.name + " has " + money(detail.gain) + " of long-term gain",
                         std::min(detail.gain, room) * lt_rate});
                }
            }

            // ---- Short-term holdings about to turn long-term
            for (const auto &detail : result.holdings)
            {
                if (detail.classification != GainClassification::SHORT_TERM || detail.gain <= 0.0)
                {
                    continue;
                }
                const int days_left = detail.threshold_days - detail.holding_days;
                if (days_left > config.near_threshold_days)
                {
                    continue;
                }
                std::optional<double> saving;
                if (st_rate > lt_rate)
                {
                    saving = detail.gain * (st_rate - lt_rate);
                }
                result.tax_saving_opportunities.push_back(
                    {"holding_period", detail.name,
                     "Hold " + detail.name + " " + std::to_string(days_left) +
                         " more days to qualify for long-term treatment",
                     saving});
            }

            return result;
        }

        // ===================================================================
        // Export
        // ===================================================================

        std::string TaxEstimate::report() const
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2);

            oss << "Capital Gains Tax Estimate\n";
            oss << "==========================\n\n";
            oss << "  Long-term gains:      " << std::setw(14) << long_term_gains << "\n";
            oss << "  Short-term gains:     " << std::setw(14) << short_term_gains << "\n";
            oss << "  Long-term liability:  " << std::setw(14) << long_term_liability << "\n";
            oss << "  Short-term liability: " << std::setw(14) << short_term_liability << "\n";
            oss << "  Total liability:      " << std::setw(14) << total_tax_liability << "\n";
            if (total_tax_liability > 0.0 && effective_tax_rate == 0.0)
            {
                // Long-term tax owed against a net loss
                oss << "  Effective rate:                 n/a (net gain is not positive)\n";
            }
            else
            {
                oss << "  Effective rate:       " << std::setw(13) << effective_tax_rate << "%\n";
            }

            if (!tax_saving_opportunities.empty())
            {
                oss << "\nTax-Saving Opportunities:\n";
                for (const auto &opportunity : tax_saving_opportunities)
                {
                    oss << "  - " << opportunity.description;
                    if (opportunity.potential_tax_saving)
                    {
                        oss << " (saves up to " << *opportunity.potential_tax_saving << ")";
                    }
                    oss << "\n";
                }
            }
            return oss.str();
        }

        nlohmann::json TaxEstimate::to_json() const
        {
            nlohmann::json j;
            j["total_tax_liability"] = total_tax_liability;
            j["effective_tax_rate"] = effective_tax_rate;
            j["long_term_liability"] = long_term_liability;
            j["short_term_liability"] = short_term_liability;
            j["current_period"] = {{"long_term_gains", long_term_gains},
                                   {"short_term_gains", short_term_gains}};

            j["tax_saving_opportunities"] = nlohmann::json::array();
            for (const auto &opportunity : tax_saving_opportunities)
            {
                nlohmann::json entry{{"type", opportunity.type},
                                     {"holding", opportunity.holding},
                                     {"description", opportunity.description}};
                entry["potential_tax_saving"] = opportunity.potential_tax_saving
                                                    ? nlohmann::json(*opportunity.potential_tax_saving)
                                                    : nlohmann::json();
                j["tax_saving_opportunities"].push_back(entry);
            }

            j["holdings"] = nlohmann::json::array();
            for (const auto &detail : holdings)
            {
                j["holdings"].push_back({{"name", detail.name},
                                         {"category", data::to_string(detail.category)},
                                         {"gain", detail.gain},
                                         {"holding_days", detail.holding_days},
                                         {"classification", to_string(detail.classification)}});
            }
            return j;
        }

    } // namespace analytics
} // namespace wealth
