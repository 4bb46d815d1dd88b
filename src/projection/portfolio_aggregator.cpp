/**
 * @file portfolio_aggregator.cpp
 * @brief Implementation of PortfolioAggregator.
 */

#include "projection/portfolio_aggregator.hpp"

#include "common/errors.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace wealth
{
    namespace projection
    {

        // ===================================================================
        // PortfolioProjection
        // ===================================================================

        double PortfolioProjection::final_value() const
        {
            return totals.empty() ? 0.0 : totals.back().total_value;
        }

        void PortfolioProjection::print_summary() const
        {
            std::cout << "\n=== Portfolio Projection ===\n";
            std::cout << "Categories: " << categories.size() << "\n";
            for (const auto &category : categories)
            {
                std::cout << "  " << std::left << std::setw(16) << data::to_string(category.request.category)
                          << std::right << std::fixed << std::setprecision(2)
                          << " now: " << std::setw(14) << category.request.current_value
                          << "  growth: " << std::setw(6) << category.request.annual_growth_rate_pct << "%"
                          << "  SIP: " << std::setw(10) << category.request.periodic_contribution << "/month\n";
            }
            std::cout << std::string(60, '-') << "\n";
            std::cout << std::setw(6) << "Year" << std::setw(18) << "Total"
                      << std::setw(18) << "Contributions" << std::setw(18) << "Lump-sum" << "\n";
            for (const auto &point : totals)
            {
                std::cout << std::setw(6) << point.year << std::fixed << std::setprecision(2)
                          << std::setw(18) << point.total_value
                          << std::setw(18) << point.contribution_value
                          << std::setw(18) << point.lumpsum_value << "\n";
            }
            std::cout << std::string(60, '-') << "\n";
        }

        void PortfolioProjection::export_to_csv(const std::string &filepath) const
        {
            std::filesystem::path path(filepath);
            if (path.has_parent_path())
            {
                std::filesystem::create_directories(path.parent_path());
            }

            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << "year,total_value,contribution_value,lumpsum_value\n";
            for (const auto &point : totals)
            {
                file << point.year << "," << std::fixed << std::setprecision(2)
                     << point.total_value << ","
                     << point.contribution_value << ","
                     << point.lumpsum_value << "\n";
            }
        }

        nlohmann::json PortfolioProjection::to_json() const
        {
            nlohmann::json j;
            j["totals"] = nlohmann::json::array();
            for (const auto &point : totals)
            {
                j["totals"].push_back(point.to_json());
            }

            j["categories"] = nlohmann::json::array();
            for (const auto &category : categories)
            {
                nlohmann::json entry;
                entry["request"] = category.request.to_json();
                entry["points"] = nlohmann::json::array();
                for (const auto &point : category.points)
                {
                    entry["points"].push_back(point.to_json());
                }
                j["categories"].push_back(entry);
            }
            return j;
        }

        // ===================================================================
        // PortfolioAggregator
        // ===================================================================

        std::vector<ProjectionPoint> PortfolioAggregator::aggregate(
            const std::vector<std::vector<ProjectionPoint>> &per_category_results,
            int horizon_years)
        {
            GrowthProjector::validate_horizon(horizon_years);
            if (per_category_results.empty())
            {
                throw ValidationError("per_category_results", "No category projections to aggregate");
            }

            for (size_t c = 0; c < per_category_results.size(); ++c)
            {
                const auto &points = per_category_results[c];
                if (static_cast<int>(points.size()) != horizon_years)
                {
                    throw ConfigurationError("horizon_years",
                                             "Category projection #" + std::to_string(c) + " has " +
                                                 std::to_string(points.size()) + " years, expected " +
                                                 std::to_string(horizon_years));
                }
            }

            std::vector<ProjectionPoint> totals(horizon_years);
            for (int y = 0; y < horizon_years; ++y)
            {
                totals[y].year = y + 1;
            }

            for (const auto &points : per_category_results)
            {
                for (int y = 0; y < horizon_years; ++y)
                {
                    totals[y].total_value += points[y].total_value;
                    totals[y].contribution_value += points[y].contribution_value;
                    totals[y].lumpsum_value += points[y].lumpsum_value;
                }
            }

            return totals;
        }

        PortfolioProjection PortfolioAggregator::project_portfolio(const std::vector<ProjectionRequest> &requests)
        {
            if (requests.empty())
            {
                throw ValidationError("requests", "At least one projection request is required");
            }

            const int horizon = requests.front().horizon_years;
            for (const auto &request : requests)
            {
                if (request.horizon_years != horizon)
                {
                    throw ConfigurationError("horizon_years",
                                             "Horizon " + std::to_string(request.horizon_years) +
                                                 " differs from portfolio horizon " + std::to_string(horizon),
                                             data::to_string(request.category));
                }
            }

            PortfolioProjection projection;
            std::vector<std::vector<ProjectionPoint>> trajectories;
            for (const auto &request : requests)
            {
                CategoryProjection category;
                category.request = request;
                category.points = GrowthProjector::project(request);
                trajectories.push_back(category.points);
                projection.categories.push_back(std::move(category));
            }

            projection.totals = aggregate(trajectories, horizon);
            return projection;
        }

    } // namespace projection
} // namespace wealth
