/**
 * @file growth_projector.cpp
 * @brief Implementation of GrowthProjector.
 */

#include "projection/growth_projector.hpp"

#include "common/errors.hpp"
#include "projection/compounding.hpp"

#include <cmath>

namespace wealth
{
    namespace projection
    {

        // ===================================================================
        // Data structures
        // ===================================================================

        nlohmann::json ProjectionPoint::to_json() const
        {
            return nlohmann::json{
                {"year", year},
                {"total_value", total_value},
                {"contribution_value", contribution_value},
                {"lumpsum_value", lumpsum_value}};
        }

        ProjectionRequest ProjectionRequest::from_json(const nlohmann::json &j)
        {
            ProjectionRequest request;
            request.category = data::parse_category(j.value("category", "other"));
            request.current_value = j.value("current_value", 0.0);
            request.annual_growth_rate_pct = j.value("annual_growth_rate_pct", 0.0);
            request.annual_lumpsum = j.value("annual_lumpsum", 0.0);
            request.horizon_years = j.value("horizon_years", 10);
            request.periodic_contribution = j.value("periodic_contribution", 0.0);
            request.step_up_pct = j.value("step_up_pct", 0.0);
            return request;
        }

        nlohmann::json ProjectionRequest::to_json() const
        {
            return nlohmann::json{
                {"category", data::to_string(category)},
                {"current_value", current_value},
                {"annual_growth_rate_pct", annual_growth_rate_pct},
                {"annual_lumpsum", annual_lumpsum},
                {"horizon_years", horizon_years},
                {"periodic_contribution", periodic_contribution},
                {"step_up_pct", step_up_pct}};
        }

        double ProjectionSettings::default_growth_rate(data::AssetCategory category)
        {
            switch (category)
            {
            case data::AssetCategory::EQUITIES:
                return 12.0;
            case data::AssetCategory::POOLED_FUNDS:
                return 10.0;
            case data::AssetCategory::CRYPTO_ASSETS:
                return 15.0;
            case data::AssetCategory::REAL_ESTATE:
                return 8.0;
            case data::AssetCategory::FIXED_INCOME:
                return 6.0;
            case data::AssetCategory::PRECIOUS_METALS:
                return 8.0;
            case data::AssetCategory::OTHER:
                return 7.0;
            }
            return 7.0;
        }

        double ProjectionSettings::growth_rate_for(data::AssetCategory category) const
        {
            auto it = growth_rates_pct.find(category);
            return it != growth_rates_pct.end() ? it->second : default_growth_rate(category);
        }

        ProjectionSettings ProjectionSettings::from_json(const nlohmann::json &j)
        {
            ProjectionSettings settings;
            settings.horizon_years = j.value("horizon_years", 10);
            settings.lumpsum_fraction = j.value("lumpsum_fraction", 0.05);

            if (j.contains("growth_rates_pct"))
            {
                const auto &rates = j["growth_rates_pct"];
                for (auto it = rates.begin(); it != rates.end(); ++it)
                {
                    settings.growth_rates_pct[data::parse_category(it.key())] = it.value().get<double>();
                }
            }

            GrowthProjector::validate_horizon(settings.horizon_years);
            require_non_negative("projection.lumpsum_fraction", settings.lumpsum_fraction);
            return settings;
        }

        nlohmann::json ProjectionSettings::to_json() const
        {
            nlohmann::json rates = nlohmann::json::object();
            for (const auto &[category, rate] : growth_rates_pct)
            {
                rates[data::to_string(category)] = rate;
            }
            return nlohmann::json{
                {"horizon_years", horizon_years},
                {"lumpsum_fraction", lumpsum_fraction},
                {"growth_rates_pct", rates}};
        }

        // ===================================================================
        // GrowthProjector
        // ===================================================================

        void GrowthProjector::validate_horizon(int horizon_years)
        {
            if (horizon_years < MIN_HORIZON_YEARS || horizon_years > MAX_HORIZON_YEARS)
            {
                throw ValidationError("horizon_years",
                                      "Expected horizon between " + std::to_string(MIN_HORIZON_YEARS) +
                                          " and " + std::to_string(MAX_HORIZON_YEARS) +
                                          " years, got: " + std::to_string(horizon_years));
            }
        }

        std::vector<ProjectionPoint> GrowthProjector::project(double current_value,
                                                              double annual_growth_rate_pct,
                                                              double annual_lumpsum,
                                                              double periodic_contribution,
                                                              double step_up_pct,
                                                              int horizon_years)
        {
            validate_horizon(horizon_years);
            require_non_negative("current_value", current_value);
            require_non_negative("annual_lumpsum", annual_lumpsum);
            require_non_negative("periodic_contribution", periodic_contribution);
            require_non_negative("step_up_pct", step_up_pct);

            const double monthly_rate = periodic_rate_from_annual(annual_growth_rate_pct, MONTHS_PER_YEAR);
            const double step_up = 1.0 + step_up_pct / 100.0;

            std::vector<ProjectionPoint> points;
            points.reserve(horizon_years);

            double base = current_value;
            double contributions = 0.0;
            double monthly_deposit = periodic_contribution;

            for (int year = 1; year <= horizon_years; ++year)
            {
                base = compound(base + annual_lumpsum, 0.0, monthly_rate, MONTHS_PER_YEAR);
                contributions = compound(contributions, monthly_deposit, monthly_rate, MONTHS_PER_YEAR);

                ProjectionPoint point;
                point.year = year;
                point.lumpsum_value = base;
                point.contribution_value = contributions;
                point.total_value = base + contributions;
                points.push_back(point);

                monthly_deposit *= step_up;
            }

            return points;
        }

        std::vector<ProjectionPoint> GrowthProjector::project(const ProjectionRequest &request)
        {
            try
            {
                return project(request.current_value,
                               request.annual_growth_rate_pct,
                               request.annual_lumpsum,
                               request.periodic_contribution,
                               request.step_up_pct,
                               request.horizon_years);
            }
            catch (const ValidationError &e)
            {
                throw ValidationError(data::to_string(request.category) + "." + e.field(), e.message());
            }
        }

        std::vector<ProjectionRequest> GrowthProjector::build_requests(const data::HoldingSnapshot &snapshot,
                                                                       const ProjectionSettings &settings)
        {
            validate_horizon(settings.horizon_years);

            std::vector<ProjectionRequest> requests;
            for (const auto &[category, value] : snapshot.value_by_category())
            {
                ProjectionRequest request;
                request.category = category;
                request.current_value = value;
                request.annual_growth_rate_pct = settings.growth_rate_for(category);
                request.annual_lumpsum = value * settings.lumpsum_fraction;
                request.horizon_years = settings.horizon_years;

                int active_schedules = 0;
                double step_up_total = 0.0;
                for (const auto &holding : snapshot.holdings_in(category))
                {
                    if (!holding.has_active_contribution())
                    {
                        continue;
                    }
                    request.periodic_contribution += holding.contribution->amount;
                    step_up_total += holding.contribution->step_up_pct;
                    ++active_schedules;
                }
                request.step_up_pct = active_schedules > 0 ? step_up_total / active_schedules : 0.0;

                requests.push_back(request);
            }
            return requests;
        }

    } // namespace projection
} // namespace wealth
