/**
 * @file portfolio_aggregator.hpp
 * @brief Merge per-category projections into one portfolio trajectory.
 */

#pragma once

#include "projection/growth_projector.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace wealth
{
    namespace projection
    {

        /**
         * @struct CategoryProjection
         * @brief Request and resulting trajectory for one category.
         */
        struct CategoryProjection
        {
            ProjectionRequest request;
            std::vector<ProjectionPoint> points;
        };

        /**
         * @struct PortfolioProjection
         * @brief Per-category trajectories plus their yearly sum.
         */
        struct PortfolioProjection
        {
            std::vector<CategoryProjection> categories;
            std::vector<ProjectionPoint> totals;

            /** @brief Total value in the final year, 0 if empty. */
            double final_value() const;

            void print_summary() const;

            /**
             * @brief Write totals as CSV (year,total_value,contribution_value,lumpsum_value).
             * @throws std::runtime_error if the file cannot be opened
             */
            void export_to_csv(const std::string &filepath) const;

            nlohmann::json to_json() const;
        };

        /**
         * @class PortfolioAggregator
         * @brief Sums same-year points across categories.
         */
        class PortfolioAggregator
        {
        public:
            /**
             * @brief Sum per-category trajectories year by year.
             * @param per_category_results One trajectory per category
             * @param horizon_years Expected length of every trajectory
             * @return Aggregated trajectory, years 1..horizon
             * @throws ValidationError if the input is empty or the horizon is invalid
             * @throws ConfigurationError if any trajectory length differs from horizon_years
             */
            static std::vector<ProjectionPoint> aggregate(
                const std::vector<std::vector<ProjectionPoint>> &per_category_results,
                int horizon_years);

            /**
             * @brief Project every request and aggregate the results.
             * @throws ValidationError if requests is empty or a request is invalid
             * @throws ConfigurationError if requests disagree on the horizon
             */
            static PortfolioProjection project_portfolio(const std::vector<ProjectionRequest> &requests);
        };

    } // namespace projection
} // namespace wealth
