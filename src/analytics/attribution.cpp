/**
 * @file attribution.cpp
 * @brief Implementation of AttributionAnalyzer.
 */

#include "analytics/attribution.hpp"

#include "common/errors.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace wealth
{
    namespace analytics
    {

        // ===================================================================
        // Configuration
        // ===================================================================

        AttributionConfig AttributionConfig::from_json(const nlohmann::json &j)
        {
            AttributionConfig config;
            config.top_k = j.value("top_k", 5);
            config.verbose = j.value("verbose", false);
            return config;
        }

        nlohmann::json AttributionConfig::to_json() const
        {
            return nlohmann::json{{"top_k", top_k}, {"verbose", verbose}};
        }

        // ===================================================================
        // Analysis
        // ===================================================================

        AttributionAnalyzer::AttributionAnalyzer(const AttributionConfig &config)
            : config_(config)
        {
            if (config_.top_k < 1)
            {
                throw ConfigurationError("attribution.top_k",
                                         "Expected positive value, got: " + std::to_string(config_.top_k));
            }
        }

        std::vector<HoldingPerformance> AttributionAnalyzer::rank_by_return(const data::HoldingSnapshot &snapshot)
        {
            std::vector<HoldingPerformance> ranked;
            for (const auto &holding : snapshot.holdings)
            {
                if (holding.cost_basis <= 0.0)
                {
                    continue;
                }
                ranked.push_back(HoldingPerformance{holding.id, holding.name, holding.category,
                                                    holding.return_percentage(), holding.gain(),
                                                    holding.current_value});
            }

            std::stable_sort(ranked.begin(), ranked.end(),
                             [](const HoldingPerformance &a, const HoldingPerformance &b)
                             { return a.return_percentage > b.return_percentage; });
            return ranked;
        }

        AttributionResult AttributionAnalyzer::attribute(const data::HoldingSnapshot &snapshot) const
        {
            snapshot.validate();

            AttributionResult result;

            auto ranked = rank_by_return(snapshot);
            const size_t top = std::min(ranked.size(), static_cast<size_t>(config_.top_k));
            result.best_performers.assign(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(top));

            const double total_value = snapshot.total_current_value();
            std::map<data::AssetCategory, double> return_sums;
            double counted_cost = 0.0;
            double counted_gain = 0.0;

            for (const auto &holding : snapshot.holdings)
            {
                auto &sector = result.sector_analysis[holding.category];
                sector.holding_count += 1;
                sector.current_value += holding.current_value;

                if (holding.cost_basis <= 0.0)
                {
                    result.excluded_holdings.push_back(holding.name);
                    if (config_.verbose)
                    {
                        std::cerr << "Warning: holding '" << holding.name
                                  << "' has zero cost basis; excluded from return attribution" << std::endl;
                    }
                    continue;
                }

                return_sums[holding.category] += holding.return_percentage();
                sector.returns_counted += 1;
                counted_cost += holding.cost_basis;
                counted_gain += holding.gain();
            }

            for (auto &[category, sector] : result.sector_analysis)
            {
                sector.allocation_percentage = total_value > 0.0 ? sector.current_value / total_value * 100.0 : 0.0;
                sector.average_return = sector.returns_counted > 0
                                            ? return_sums[category] / sector.returns_counted
                                            : 0.0;
            }

            result.portfolio_return_pct = counted_cost > 0.0 ? counted_gain / counted_cost * 100.0 : 0.0;
            return result;
        }

        // ===================================================================
        // Export
        // ===================================================================

        std::string AttributionResult::report() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Performance Attribution Report\n";
            oss << "==============================\n\n";
            oss << "Portfolio Return (value-weighted): " << std::setprecision(2)
                << portfolio_return_pct << "%\n\n";

            oss << "Best Performers:\n";
            int rank = 1;
            for (const auto &performer : best_performers)
            {
                oss << "  " << rank++ << ". " << std::left << std::setw(24) << performer.name
                    << std::right << std::setw(10) << std::setprecision(2)
                    << performer.return_percentage << "%\n";
            }

            oss << "\nSector Analysis:\n";
            for (const auto &[category, sector] : sector_analysis)
            {
                oss << "  " << std::left << std::setw(16) << data::to_string(category)
                    << std::right << " Alloc: " << std::setw(7) << std::setprecision(2)
                    << sector.allocation_percentage << "%"
                    << " Avg Return: " << std::setw(8) << sector.average_return << "%"
                    << " Holdings: " << sector.holding_count << "\n";
            }

            if (!excluded_holdings.empty())
            {
                oss << "\nExcluded (no cost basis): ";
                for (size_t i = 0; i < excluded_holdings.size(); ++i)
                {
                    oss << (i > 0 ? ", " : "") << excluded_holdings[i];
                }
                oss << "\n";
            }

            return oss.str();
        }

        nlohmann::json AttributionResult::to_json() const
        {
            nlohmann::json j;
            j["best_performers"] = nlohmann::json::array();
            for (const auto &performer : best_performers)
            {
                j["best_performers"].push_back({{"id", performer.id},
                                                {"name", performer.name},
                                                {"category", data::to_string(performer.category)},
                                                {"return_percentage", performer.return_percentage}});
            }

            j["sector_analysis"] = nlohmann::json::object();
            for (const auto &[category, sector] : sector_analysis)
            {
                j["sector_analysis"][data::to_string(category)] = {
                    {"allocation_percentage", sector.allocation_percentage},
                    {"average_return", sector.average_return},
                    {"holding_count", sector.holding_count},
                    {"current_value", sector.current_value}};
            }

            j["portfolio_return_pct"] = portfolio_return_pct;
            j["excluded_holdings"] = excluded_holdings;
            return j;
        }

    } // namespace analytics
} // namespace wealth
