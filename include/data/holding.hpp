/**
 * @file holding.hpp
 * @brief Holdings, contribution schedules and the read-only portfolio snapshot.
 *
 * A HoldingSnapshot is the only input the engine reads about a user's
 * assets. It is an immutable, already-loaded view: the engine never
 * persists or mutates holdings.
 */

#ifndef WEALTH_DATA_HOLDING_HPP
#define WEALTH_DATA_HOLDING_HPP

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wealth
{
    namespace data
    {

        /**
         * @enum AssetCategory
         * @brief Fixed set of asset categories. Enum order is the reporting order.
         */
        enum class AssetCategory
        {
            EQUITIES,
            POOLED_FUNDS,
            CRYPTO_ASSETS,
            REAL_ESTATE,
            FIXED_INCOME,
            PRECIOUS_METALS,
            OTHER
        };

        /** @brief All categories in reporting order. */
        const std::vector<AssetCategory> &all_categories();

        /** @brief Canonical lowercase id ("equities", "pooled_funds", ...). */
        std::string to_string(AssetCategory category);

        /**
         * @brief Parse a category id (case-insensitive).
         *
         * Accepts canonical ids as well as the legacy ids "stocks",
         * "mutual_funds", "cryptocurrency", "fixed_deposits", "gold" and "others".
         *
         * @throws ValidationError for an unknown id
         */
        AssetCategory parse_category(const std::string &id);

        /**
         * @struct ContributionSchedule
         * @brief Systematic monthly investment plan attached to a holding.
         */
        struct ContributionSchedule
        {
            double amount = 0.0;     ///< Monthly contribution
            std::string start_date;  ///< First contribution date (YYYY-MM-DD), may be empty
            double step_up_pct = 0.0; ///< Annual increase of the monthly amount (%)
            bool active = true;      ///< Inactive schedules contribute nothing

            static ContributionSchedule from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct Holding
         * @brief A single asset position.
         */
        struct Holding
        {
            std::string id;
            std::string name;
            AssetCategory category = AssetCategory::OTHER;
            double cost_basis = 0.0;     ///< Total amount invested
            double current_value = 0.0;  ///< Market value at the valuation date
            std::string acquisition_date; ///< YYYY-MM-DD
            std::optional<ContributionSchedule> contribution;
            nlohmann::json metadata = nlohmann::json::object();

            /** @brief current_value - cost_basis */
            double gain() const;

            /**
             * @brief Simple return over cost basis in percent.
             * @throws ValidationError if cost_basis <= 0
             */
            double return_percentage() const;

            /** @brief Days held as of the given date. */
            int holding_period_days(const std::string &as_of) const;

            /** @brief True if an active contribution schedule is attached. */
            bool has_active_contribution() const;

            /** @brief Monthly amount of the active schedule, 0 otherwise. */
            double monthly_contribution() const;

            static Holding from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct HoldingSnapshot
         * @brief Ordered holdings valued as of one date.
         */
        struct HoldingSnapshot
        {
            std::string valuation_date;
            std::vector<Holding> holdings;

            bool empty() const { return holdings.empty(); }

            double total_current_value() const;
            double total_cost_basis() const;

            /** @brief Current value per category present in the snapshot. */
            std::map<AssetCategory, double> value_by_category() const;

            /** @brief Holdings of one category, in snapshot order. */
            std::vector<Holding> holdings_in(AssetCategory category) const;

            /**
             * @brief Check every holding against the data model rules.
             *
             * Rejects negative cost basis or current value, negative
             * contribution amounts or step-ups, malformed dates and
             * acquisition dates after the valuation date.
             *
             * @throws ValidationError naming the holding and field
             */
            void validate() const;

            /** @brief Parse and validate. Missing valuation_date means today. */
            static HoldingSnapshot from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

    } // namespace data
} // namespace wealth

#endif // WEALTH_DATA_HOLDING_HPP
