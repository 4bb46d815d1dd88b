/**
 * @file tax_estimator.hpp
 * @brief Capital-gains liability estimate with tax-saving suggestions.
 *
 * Each holding's unrealized gain is classified long-term or short-term by
 * comparing its holding period to the threshold of its category. Gains
 * are aggregated per classification:
 *
 *   long_term_tax  = max(0, LT_gains - exemption) * lt_rate
 *   short_term_tax = max(0, ST_gains) * st_rate
 *
 * Rates and thresholds are illustrative configuration, not tax law.
 */

#ifndef WEALTH_ANALYTICS_TAX_ESTIMATOR_HPP
#define WEALTH_ANALYTICS_TAX_ESTIMATOR_HPP

#include "data/holding.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wealth
{
    namespace analytics
    {

        /**
         * @struct TaxConfig
         * @brief Holding-period thresholds, rates and the long-term exemption.
         */
        struct TaxConfig
        {
            std::map<data::AssetCategory, int> holding_period_days; ///< Long-term threshold per category
            double long_term_rate_pct = 10.0;
            double short_term_rate_pct = 15.0;
            double long_term_exemption = 100000.0; ///< Long-term gains exempt per period
            int near_threshold_days = 60;          ///< Window for "wait to qualify" suggestions

            /** @brief Rates above with a threshold for every category. */
            static TaxConfig default_config();

            /**
             * @brief Parse configuration.
             *
             * A "holding_period_days" object replaces the default table
             * entirely; categories it omits have no threshold.
             */
            static TaxConfig from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;

            /** @throws ConfigurationError for negative thresholds or rates outside 0..100 */
            void validate() const;
        };

        enum class GainClassification
        {
            LONG_TERM,
            SHORT_TERM
        };

        std::string to_string(GainClassification classification);

        /**
         * @struct HoldingTaxDetail
         * @brief Classification of one holding.
         */
        struct HoldingTaxDetail
        {
            std::string name;
            data::AssetCategory category;
            double gain;
            int holding_days;
            int threshold_days;
            GainClassification classification;
        };

        /**
         * @struct TaxSavingOpportunity
         * @brief One suggestion, with the tax it could save where quantifiable.
         */
        struct TaxSavingOpportunity
        {
            std::string type;        ///< loss_harvesting, exemption_room or holding_period
            std::string holding;     ///< Holding name
            std::string description;
            std::optional<double> potential_tax_saving;
        };

        /**
         * @struct TaxEstimate
         * @brief Liability by classification and suggestions.
         */
        struct TaxEstimate
        {
            double total_tax_liability = 0.0;
            double effective_tax_rate = 0.0; ///< total tax / total gain * 100, 0 when gains are not positive
            double long_term_liability = 0.0;
            double short_term_liability = 0.0;
            double long_term_gains = 0.0;  ///< Net long-term gains this period
            double short_term_gains = 0.0; ///< Net short-term gains this period
            std::vector<TaxSavingOpportunity> tax_saving_opportunities;
            std::vector<HoldingTaxDetail> holdings;

            std::string report() const;
            nlohmann::json to_json() const;
        };

        /**
         * @class TaxEstimator
         * @brief Stateless estimator.
         *
         * Thread safety: all members are static pure functions.
         */
        class TaxEstimator
        {
        public:
            /**
             * @brief Estimate liability for a snapshot.
             * @throws ValidationError if the snapshot is invalid (e.g. acquired after valuation date)
             * @throws ConfigurationError if a category in the snapshot has no threshold
             */
            static TaxEstimate estimate(const data::HoldingSnapshot &snapshot, const TaxConfig &config);

            /**
             * @brief Classify one holding as of a valuation date.
             * @throws ConfigurationError if its category has no threshold
             */
            static HoldingTaxDetail classify(const data::Holding &holding,
                                             const std::string &valuation_date,
                                             const TaxConfig &config);
        };

    } // namespace analytics
} // namespace wealth

#endif // WEALTH_ANALYTICS_TAX_ESTIMATOR_HPP
