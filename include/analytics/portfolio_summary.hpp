/**
 * @file portfolio_summary.hpp
 * @brief Net-worth summary and milestone tracking.
 */

#ifndef WEALTH_ANALYTICS_PORTFOLIO_SUMMARY_HPP
#define WEALTH_ANALYTICS_PORTFOLIO_SUMMARY_HPP

#include "data/holding.hpp"
#include "projection/growth_projector.hpp"

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
         * @struct PortfolioSummary
         * @brief Headline figures of a snapshot.
         */
        struct PortfolioSummary
        {
            double total_net_worth = 0.0;      ///< Sum of current values
            double total_investment = 0.0;     ///< Sum of cost bases
            double total_gain_loss = 0.0;      ///< Net worth minus investment
            double gain_loss_percentage = 0.0; ///< 0 when nothing is invested
            std::map<data::AssetCategory, double> asset_allocation; ///< Current value per category

            static PortfolioSummary from_snapshot(const data::HoldingSnapshot &snapshot);

            void print_summary() const;
            nlohmann::json to_json() const;
        };

        /**
         * @struct Milestone
         * @brief A net-worth target.
         */
        struct Milestone
        {
            std::string name;
            double target_amount = 0.0;
            std::string target_date; ///< YYYY-MM-DD

            /** @throws ValidationError for a non-positive target or malformed date */
            void validate() const;

            static Milestone from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct MilestoneProgress
         * @brief Progress toward one milestone.
         */
        struct MilestoneProgress
        {
            std::string name;
            double target_amount = 0.0;
            std::string target_date;
            double progress_pct = 0.0;        ///< min(net worth / target * 100, 100)
            bool achieved = false;
            std::optional<int> projected_year; ///< First projection year reaching the target
            bool on_track = false;             ///< Projected to be reached by the target date

            nlohmann::json to_json() const;
        };

        /**
         * @brief Progress of each milestone, in input order.
         * @param summary Current summary (net worth)
         * @param milestones Targets to track
         * @param projection Aggregated yearly projection; may be empty
         * @param valuation_date Date the projection's year 0 refers to
         * @throws ValidationError if a milestone is invalid
         */
        std::vector<MilestoneProgress> track_milestones(const PortfolioSummary &summary,
                                                        const std::vector<Milestone> &milestones,
                                                        const std::vector<projection::ProjectionPoint> &projection,
                                                        const std::string &valuation_date);

    } // namespace analytics
} // namespace wealth

#endif // WEALTH_ANALYTICS_PORTFOLIO_SUMMARY_HPP
