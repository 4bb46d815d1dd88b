/**
 * @file holding.cpp
 * @brief Implementation of holding and snapshot helpers.
 */

#include "data/holding.hpp"

#include "common/errors.hpp"
#include "data/date_utils.hpp"

#include <algorithm>
#include <cctype>

namespace wealth
{
    namespace data
    {

        namespace
        {
            std::string to_lower(std::string s)
            {
                std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                               { return std::tolower(c); });
                return s;
            }

            double require_number(const nlohmann::json &j, const std::string &key,
                                  const std::string &context)
            {
                if (!j.contains(key) || !j[key].is_number())
                {
                    throw ValidationError(key, context + " must specify numeric '" + key + "'");
                }
                return j[key].get<double>();
            }

            // Missing and null keys both yield the fallback
            std::string optional_string(const nlohmann::json &j, const std::string &key,
                                        const std::string &fallback = "")
            {
                if (!j.contains(key) || j[key].is_null())
                {
                    return fallback;
                }
                if (!j[key].is_string())
                {
                    throw ValidationError(key, "Expected a string for '" + key + "', got: " + j[key].dump());
                }
                return j[key].get<std::string>();
            }

            double optional_number(const nlohmann::json &j, const std::string &key, double fallback)
            {
                if (!j.contains(key) || j[key].is_null())
                {
                    return fallback;
                }
                if (!j[key].is_number())
                {
                    throw ValidationError(key, "Expected a number for '" + key + "', got: " + j[key].dump());
                }
                return j[key].get<double>();
            }

            bool optional_bool(const nlohmann::json &j, const std::string &key, bool fallback)
            {
                if (!j.contains(key) || j[key].is_null())
                {
                    return fallback;
                }
                if (!j[key].is_boolean())
                {
                    throw ValidationError(key, "Expected true or false for '" + key + "', got: " + j[key].dump());
                }
                return j[key].get<bool>();
            }

            std::string holding_label(const Holding &h)
            {
                return h.id.empty() ? "'" + h.name + "'" : "'" + h.id + "'";
            }
        } // namespace

        // ===================================================================
        // AssetCategory
        // ===================================================================

        const std::vector<AssetCategory> &all_categories()
        {
            static const std::vector<AssetCategory> categories = {
                AssetCategory::EQUITIES,
                AssetCategory::POOLED_FUNDS,
                AssetCategory::CRYPTO_ASSETS,
                AssetCategory::REAL_ESTATE,
                AssetCategory::FIXED_INCOME,
                AssetCategory::PRECIOUS_METALS,
                AssetCategory::OTHER};
            return categories;
        }

        std::string to_string(AssetCategory category)
        {
            switch (category)
            {
            case AssetCategory::EQUITIES:
                return "equities";
            case AssetCategory::POOLED_FUNDS:
                return "pooled_funds";
            case AssetCategory::CRYPTO_ASSETS:
                return "crypto_assets";
            case AssetCategory::REAL_ESTATE:
                return "real_estate";
            case AssetCategory::FIXED_INCOME:
                return "fixed_income";
            case AssetCategory::PRECIOUS_METALS:
                return "precious_metals";
            case AssetCategory::OTHER:
                return "other";
            }
            return "other";
        }

        AssetCategory parse_category(const std::string &id)
        {
            auto s = to_lower(id);
            if (s == "equities" || s == "stocks")
                return AssetCategory::EQUITIES;
            if (s == "pooled_funds" || s == "mutual_funds")
                return AssetCategory::POOLED_FUNDS;
            if (s == "crypto_assets" || s == "cryptocurrency" || s == "crypto")
                return AssetCategory::CRYPTO_ASSETS;
            if (s == "real_estate")
                return AssetCategory::REAL_ESTATE;
            if (s == "fixed_income" || s == "fixed_deposits")
                return AssetCategory::FIXED_INCOME;
            if (s == "precious_metals" || s == "gold")
                return AssetCategory::PRECIOUS_METALS;
            if (s == "other" || s == "others")
                return AssetCategory::OTHER;
            throw ValidationError("category", "Unknown asset category: '" + id + "'");
        }

        // ===================================================================
        // ContributionSchedule
        // ===================================================================

        ContributionSchedule ContributionSchedule::from_json(const nlohmann::json &j)
        {
            ContributionSchedule schedule;
            schedule.amount = optional_number(j, "amount", 0.0);
            schedule.start_date = optional_string(j, "start_date");
            schedule.step_up_pct = optional_number(j, "step_up_pct", 0.0);
            schedule.active = optional_bool(j, "active", true);
            return schedule;
        }

        nlohmann::json ContributionSchedule::to_json() const
        {
            return nlohmann::json{
                {"amount", amount},
                {"start_date", start_date},
                {"step_up_pct", step_up_pct},
                {"active", active}};
        }

        // ===================================================================
        // Holding
        // ===================================================================

        double Holding::gain() const
        {
            return current_value - cost_basis;
        }

        double Holding::return_percentage() const
        {
            if (cost_basis <= 0.0)
            {
                throw ValidationError("cost_basis",
                                      "Cannot compute return for holding " + holding_label(*this) +
                                          " with non-positive cost basis: " + std::to_string(cost_basis));
            }
            return gain() / cost_basis * 100.0;
        }

        int Holding::holding_period_days(const std::string &as_of) const
        {
            return days_between(acquisition_date, as_of);
        }

        bool Holding::has_active_contribution() const
        {
            return contribution.has_value() && contribution->active;
        }

        double Holding::monthly_contribution() const
        {
            return has_active_contribution() ? contribution->amount : 0.0;
        }

        Holding Holding::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw ValidationError("holding", "Holding entry must be a JSON object");
            }

            Holding h;
            h.id = j.contains("id") && !j["id"].is_string() && !j["id"].is_null() ? j["id"].dump()
                                                                                  : optional_string(j, "id");
            h.name = optional_string(j, "name", h.id);

            std::string category = j.contains("category") ? optional_string(j, "category")
                                                          : optional_string(j, "asset_type");
            if (category.empty())
            {
                throw ValidationError("category", "Holding '" + h.name + "' must specify 'category'");
            }
            h.category = parse_category(category);

            const std::string context = "Holding '" + h.name + "'";
            h.cost_basis = j.contains("cost_basis") ? require_number(j, "cost_basis", context)
                                                    : require_number(j, "purchase_value", context);
            h.current_value = require_number(j, "current_value", context);
            h.acquisition_date = j.contains("acquisition_date") ? optional_string(j, "acquisition_date")
                                                                : optional_string(j, "purchase_date");

            if (j.contains("contribution") && j["contribution"].is_object())
            {
                h.contribution = ContributionSchedule::from_json(j["contribution"]);
            }
            else if (j.contains("monthly_sip_amount") && j["monthly_sip_amount"].is_number())
            {
                // Flat legacy layout
                ContributionSchedule schedule;
                schedule.amount = j["monthly_sip_amount"].get<double>();
                schedule.start_date = optional_string(j, "sip_start_date");
                schedule.step_up_pct = optional_number(j, "step_up_percentage", 0.0);
                schedule.active = optional_bool(j, "is_sip_active", true);
                h.contribution = schedule;
            }

            if (j.contains("metadata") && j["metadata"].is_object())
            {
                h.metadata = j["metadata"];
            }

            return h;
        }

        nlohmann::json Holding::to_json() const
        {
            nlohmann::json j{
                {"id", id},
                {"name", name},
                {"category", data::to_string(category)},
                {"cost_basis", cost_basis},
                {"current_value", current_value},
                {"acquisition_date", acquisition_date},
                {"metadata", metadata}};
            if (contribution)
            {
                j["contribution"] = contribution->to_json();
            }
            return j;
        }

        // ===================================================================
        // HoldingSnapshot
        // ===================================================================

        double HoldingSnapshot::total_current_value() const
        {
            double total = 0.0;
            for (const auto &h : holdings)
            {
                total += h.current_value;
            }
            return total;
        }

        double HoldingSnapshot::total_cost_basis() const
        {
            double total = 0.0;
            for (const auto &h : holdings)
            {
                total += h.cost_basis;
            }
            return total;
        }

        std::map<AssetCategory, double> HoldingSnapshot::value_by_category() const
        {
            std::map<AssetCategory, double> values;
            for (const auto &h : holdings)
            {
                values[h.category] += h.current_value;
            }
            return values;
        }

        std::vector<Holding> HoldingSnapshot::holdings_in(AssetCategory category) const
        {
            std::vector<Holding> result;
            std::copy_if(holdings.begin(), holdings.end(), std::back_inserter(result),
                         [category](const Holding &h)
                         { return h.category == category; });
            return result;
        }

        void HoldingSnapshot::validate() const
        {
            require_valid_date("valuation_date", valuation_date);

            for (const auto &h : holdings)
            {
                const std::string label = "holding " + holding_label(h);

                require_non_negative(label + ".cost_basis", h.cost_basis);
                require_non_negative(label + ".current_value", h.current_value);
                require_valid_date(label + ".acquisition_date", h.acquisition_date);

                if (days_between(valuation_date, h.acquisition_date) > 0)
                {
                    throw ValidationError(label + ".acquisition_date",
                                          "Acquisition date " + h.acquisition_date +
                                              " is after valuation date " + valuation_date);
                }

                if (h.contribution)
                {
                    require_non_negative(label + ".contribution.amount", h.contribution->amount);
                    require_non_negative(label + ".contribution.step_up_pct", h.contribution->step_up_pct);
                    if (!h.contribution->start_date.empty())
                    {
                        require_valid_date(label + ".contribution.start_date", h.contribution->start_date);
                    }
                }
            }
        }

        HoldingSnapshot HoldingSnapshot::from_json(const nlohmann::json &j)
        {
            HoldingSnapshot snapshot;
            if (!j.is_object())
            {
                throw ValidationError("snapshot", "Snapshot must be a JSON object");
            }
            snapshot.valuation_date = optional_string(j, "valuation_date", today());

            if (!j.contains("holdings") || !j["holdings"].is_array())
            {
                throw ValidationError("holdings", "Snapshot must contain a 'holdings' array");
            }

            for (const auto &entry : j["holdings"])
            {
                snapshot.holdings.push_back(Holding::from_json(entry));
            }

            snapshot.validate();
            return snapshot;
        }

        nlohmann::json HoldingSnapshot::to_json() const
        {
            nlohmann::json j;
            j["valuation_date"] = valuation_date;
            j["holdings"] = nlohmann::json::array();
            for (const auto &h : holdings)
            {
                j["holdings"].push_back(h.to_json());
            }
            return j;
        }

    } // namespace data
} // namespace wealth
