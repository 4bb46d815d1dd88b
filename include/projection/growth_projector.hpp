/**
 * @file growth_projector.hpp
 * @brief Deterministic multi-year projection of one asset category.
 *
 * Projects a category's value year by year under a fixed annual growth
 * assumption, a yearly lump-sum investment and a monthly contribution
 * plan (SIP) whose amount steps up once a year. Growth is applied
 * monthly at the periodic rate equivalent to the annual assumption.
 *
 * Year y:
 *   base_y    = compound(base_{y-1} + lumpsum, 0, i, 12)
 *   deposit_y = P * (1 + s/100)^(y-1)
 *   contrib_y = compound(contrib_{y-1}, deposit_y, i, 12)   (month-start deposits)
 *   total_y   = base_y + contrib_y
 */

#pragma once

#include "data/holding.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace wealth
{
    namespace projection
    {

        constexpr int MIN_HORIZON_YEARS = 1;
        constexpr int MAX_HORIZON_YEARS = 50;
        constexpr int MONTHS_PER_YEAR = 12;

        /**
         * @struct ProjectionPoint
         * @brief Projected value at the end of one year.
         */
        struct ProjectionPoint
        {
            int year = 0;                   ///< 1..horizon
            double total_value = 0.0;       ///< contribution_value + lumpsum_value
            double contribution_value = 0.0; ///< Compounded periodic contributions to date
            double lumpsum_value = 0.0;     ///< Current value plus compounded lump-sums

            nlohmann::json to_json() const;
        };

        /**
         * @struct ProjectionRequest
         * @brief Projection inputs for one asset category.
         */
        struct ProjectionRequest
        {
            data::AssetCategory category = data::AssetCategory::OTHER;
            double current_value = 0.0;
            double annual_growth_rate_pct = 0.0;
            double annual_lumpsum = 0.0;
            int horizon_years = 10;
            double periodic_contribution = 0.0; ///< Monthly, summed over active schedules
            double step_up_pct = 0.0;           ///< Mean step-up of active schedules

            static ProjectionRequest from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct ProjectionSettings
         * @brief Assumptions used to derive per-category requests from a snapshot.
         */
        struct ProjectionSettings
        {
            int horizon_years = 10;
            double lumpsum_fraction = 0.05; ///< Yearly lump-sum as a fraction of current value
            std::map<data::AssetCategory, double> growth_rates_pct; ///< Overrides of the defaults

            /** @brief Built-in annual growth assumption for a category (%). */
            static double default_growth_rate(data::AssetCategory category);

            /** @brief Override if configured, default otherwise. */
            double growth_rate_for(data::AssetCategory category) const;

            static ProjectionSettings from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @class GrowthProjector
         * @brief Year-by-year projection with lump-sums and step-up contributions.
         *
         * Usage:
         * @code
         *   auto points = GrowthProjector::project(100000.0, 10.0, 0.0, 5000.0, 10.0, 20);
         * @endcode
         *
         * Thread safety: all members are static pure functions.
         */
        class GrowthProjector
        {
        public:
            /**
             * @brief Project one category.
             * @param current_value Value today (>= 0)
             * @param annual_growth_rate_pct Annual growth assumption (> -100, may be negative)
             * @param annual_lumpsum Lump-sum invested at the start of every year (>= 0)
             * @param periodic_contribution Monthly contribution in year 1 (>= 0)
             * @param step_up_pct Yearly increase of the monthly contribution (>= 0)
             * @param horizon_years Number of years, 1..50
             * @return One point per year, years 1..horizon in order
             * @throws ValidationError on any out-of-range input
             */
            static std::vector<ProjectionPoint> project(double current_value,
                                                        double annual_growth_rate_pct,
                                                        double annual_lumpsum,
                                                        double periodic_contribution,
                                                        double step_up_pct,
                                                        int horizon_years);

            /** @brief Project from a request. */
            static std::vector<ProjectionPoint> project(const ProjectionRequest &request);

            /**
             * @brief Derive one request per category present in the snapshot.
             *
             * Requests come out in category order. Contributions are the sum
             * of the monthly amounts of active schedules, step-up is their mean.
             */
            static std::vector<ProjectionRequest> build_requests(const data::HoldingSnapshot &snapshot,
                                                                 const ProjectionSettings &settings);

            /** @throws ValidationError if horizon is outside 1..50 */
            static void validate_horizon(int horizon_years);
        };

    } // namespace projection
} // namespace wealth
