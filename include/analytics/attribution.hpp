/**
 * @file attribution.hpp
 * @brief Gain attribution by holding and by asset category.
 *
 * Per holding:
 *   return_pct = (current_value - cost_basis) / cost_basis * 100
 *
 * Per category:
 *   allocation_pct = category value / total value * 100
 *   average_return = unweighted mean of the category's holding returns
 *
 * The category average is count-weighted: a small holding with a large
 * return moves it as much as a large one. The value-weighted figure is
 * reported separately as portfolio_return_pct.
 *
 * Holdings with a zero cost basis have no defined return. They are left
 * out of rankings and averages but still count toward allocation.
 */

#ifndef WEALTH_ANALYTICS_ATTRIBUTION_HPP
#define WEALTH_ANALYTICS_ATTRIBUTION_HPP

#include "data/holding.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace wealth
{
    namespace analytics
    {

        /**
         * @struct HoldingPerformance
         * @brief Return of one holding.
         */
        struct HoldingPerformance
        {
            std::string id;
            std::string name;
            data::AssetCategory category;
            double return_percentage; ///< Gain over cost basis (%)
            double gain;              ///< current_value - cost_basis
            double current_value;
        };

        /**
         * @struct SectorPerformance
         * @brief Allocation and average return of one category.
         */
        struct SectorPerformance
        {
            double allocation_percentage = 0.0; ///< Share of total current value (%)
            double average_return = 0.0;        ///< Unweighted mean return (%), 0 if none qualify
            int holding_count = 0;              ///< All holdings in the category
            int returns_counted = 0;            ///< Holdings with a defined return
            double current_value = 0.0;
        };

        /**
         * @struct AttributionConfig
         * @brief Ranking size and diagnostics.
         */
        struct AttributionConfig
        {
            int top_k = 5;        ///< Number of best performers reported
            bool verbose = false; ///< Warn on stderr about excluded holdings

            static AttributionConfig from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct AttributionResult
         * @brief Best performers and per-category breakdown.
         */
        struct AttributionResult
        {
            std::vector<HoldingPerformance> best_performers; ///< Descending by return
            std::map<data::AssetCategory, SectorPerformance> sector_analysis;
            double portfolio_return_pct = 0.0;        ///< Value-weighted over holdings with a cost basis
            std::vector<std::string> excluded_holdings; ///< Names left out for zero cost basis

            std::string report() const;
            nlohmann::json to_json() const;
        };

        /**
         * @class AttributionAnalyzer
         * @brief Computes AttributionResult from a snapshot.
         *
         * Usage:
         * @code
         *   AttributionAnalyzer analyzer;
         *   auto result = analyzer.attribute(snapshot);
         *   std::cout << result.report();
         * @endcode
         */
        class AttributionAnalyzer
        {
        public:
            /** @throws ConfigurationError if top_k < 1 */
            explicit AttributionAnalyzer(const AttributionConfig &config = AttributionConfig{});

            /** @throws ValidationError if the snapshot is invalid */
            AttributionResult attribute(const data::HoldingSnapshot &snapshot) const;

            /**
             * @brief All holdings with a defined return, descending by return.
             *
             * Equal returns keep their snapshot order.
             */
            static std::vector<HoldingPerformance> rank_by_return(const data::HoldingSnapshot &snapshot);

            const AttributionConfig &config() const { return config_; }

        private:
            AttributionConfig config_;
        };

    } // namespace analytics
} // namespace wealth

#endif // WEALTH_ANALYTICS_ATTRIBUTION_HPP
