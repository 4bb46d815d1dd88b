/**
 * @file portfolio_summary.cpp
 * @brief Implementation of the portfolio summary and milestone tracking.
 */

#include "analytics/portfolio_summary.hpp"

#include "common/errors.hpp"
#include "data/date_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

namespace wealth
{
    namespace analytics
    {

        // ===================================================================
        // PortfolioSummary
        // ===================================================================

        PortfolioSummary PortfolioSummary::from_snapshot(const data::HoldingSnapshot &snapshot)
        {
            PortfolioSummary summary;
            summary.total_net_worth = snapshot.total_current_value();
            summary.total_investment = snapshot.total_cost_basis();
            summary.total_gain_loss = summary.total_net_worth - summary.total_investment;
            summary.gain_loss_percentage = summary.total_investment > 0.0
                                               ? summary.total_gain_loss / summary.total_investment * 100.0
                                               : 0.0;
            summary.asset_allocation = snapshot.value_by_category();
            return summary;
        }

        void PortfolioSummary::print_summary() const
        {
            std::cout << "\n=== Portfolio Summary ===\n";
            std::cout << std::fixed << std::setprecision(2);
            std::cout << "Net Worth:     " << total_net_worth << "\n";
            std::cout << "Invested:      " << total_investment << "\n";
            std::cout << "Gain/Loss:     " << total_gain_loss << " (" << gain_loss_percentage << "%)\n";
            std::cout << "Allocation:\n";
            for (const auto &[category, value] : asset_allocation)
            {
                double share = total_net_worth > 0.0 ? value / total_net_worth * 100.0 : 0.0;
                std::cout << "  " << std::left << std::setw(16) << data::to_string(category) << std::right
                          << std::setw(14) << value << "  (" << std::setw(6) << share << "%)\n";
            }
        }

        nlohmann::json PortfolioSummary::to_json() const
        {
            nlohmann::json allocation = nlohmann::json::object();
            for (const auto &[category, value] : asset_allocation)
            {
                allocation[data::to_string(category)] = value;
            }
            return nlohmann::json{
                {"total_net_worth", total_net_worth},
                {"total_investment", total_investment},
                {"total_gain_loss", total_gain_loss},
                {"gain_loss_percentage", gain_loss_percentage},
                {"asset_allocation", allocation}};
        }

        // ===================================================================
        // Milestones
        // ===================================================================

        void Milestone::validate() const
        {
            if (!(target_amount > 0.0))
            {
                throw ValidationError("milestone.target_amount",
                                      "Milestone '" + name + "' needs a positive target, got: " +
                                          std::to_string(target_amount));
            }
            data::require_valid_date("milestone.target_date", target_date);
        }

        Milestone Milestone::from_json(const nlohmann::json &j)
        {
            Milestone milestone;
            milestone.name = j.value("name", "");
            milestone.target_amount = j.value("target_amount", 0.0);
            milestone.target_date = j.value("target_date", "");
            milestone.validate();
            return milestone;
        }

        nlohmann::json Milestone::to_json() const
        {
            return nlohmann::json{
                {"name", name},
                {"target_amount", target_amount},
                {"target_date", target_date}};
        }

        nlohmann::json MilestoneProgress::to_json() const
        {
            return nlohmann::json{
                {"name", name},
                {"target_amount", target_amount},
                {"target_date", target_date},
                {"progress_pct", progress_pct},
                {"achieved", achieved},
                {"projected_year", projected_year ? nlohmann::json(*projected_year) : nlohmann::json()},
                {"on_track", on_track}};
        }

        std::vector<MilestoneProgress> track_milestones(const PortfolioSummary &summary,
                                                        const std::vector<Milestone> &milestones,
                                                        const std::vector<projection::ProjectionPoint> &projection,
                                                        const std::string &valuation_date)
        {
            std::vector<MilestoneProgress> progress;
            if (!milestones.empty())
            {
                data::require_valid_date("valuation_date", valuation_date);
            }

            for (const auto &milestone : milestones)
            {
                milestone.validate();

                MilestoneProgress entry;
                entry.name = milestone.name;
                entry.target_amount = milestone.target_amount;
                entry.target_date = milestone.target_date;
                entry.progress_pct = std::min(summary.total_net_worth / milestone.target_amount * 100.0, 100.0);
                entry.achieved = summary.total_net_worth >= milestone.target_amount;

                if (entry.achieved)
                {
                    entry.projected_year = 0;
                }
                else
                {
                    for (const auto &point : projection)
                    {
                        if (point.total_value >= milestone.target_amount)
                        {
                            entry.projected_year = point.year;
                            break;
                        }
                    }
                }

                if (entry.projected_year)
                {
                    const int years_available =
                        data::extract_year(milestone.target_date) - data::extract_year(valuation_date);
                    entry.on_track = *entry.projected_year <= years_available;
                }

                progress.push_back(entry);
            }
            return progress;
        }

    } // namespace analytics
} // namespace wealth
