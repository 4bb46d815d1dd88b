/**
 * @file health_evaluators.cpp
 * @brief Implementation of the five health category evaluators.
 */

#include "analytics/health_evaluators.hpp"

#include <Eigen/Dense>
#include <iomanip>
#include <sstream>

namespace wealth
{
    namespace analytics
    {

        namespace
        {
            std::string format_number(double value, int precision)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(precision) << value;
                return oss.str();
            }
        } // namespace

        // ===================================================================
        // Diversification
        // ===================================================================

        CategoryEvaluation DiversificationEvaluator::evaluate(const data::HoldingSnapshot &snapshot,
                                                              const FinancialFacts &) const
        {
            CategoryEvaluation result;
            const double total = snapshot.total_current_value();
            if (total <= 0.0)
            {
                result.score = 0;
                result.message = "No holdings with a positive value to diversify";
                return result;
            }

            auto by_category = snapshot.value_by_category();
            Eigen::VectorXd shares(static_cast<Eigen::Index>(by_category.size()));
            Eigen::Index i = 0;
            for (const auto &[category, value] : by_category)
            {
                shares(i++) = value / total;
            }

            const double metric = 1.0 - shares.maxCoeff();
            result.metric = metric;
            result.score = rubric_.score(metric);
            result.message = "Largest category holds " + format_number(shares.maxCoeff() * 100.0, 1) +
                             "% of the portfolio across " + std::to_string(by_category.size()) + " categories";
            return result;
        }

        std::string DiversificationEvaluator::recommendation() const
        {
            return "Spread investments across more asset categories so no single category dominates";
        }

        std::string DiversificationEvaluator::strength() const
        {
            return "Well diversified across asset categories";
        }

        // ===================================================================
        // Liquidity
        // ===================================================================

        CategoryEvaluation LiquidityEvaluator::evaluate(const data::HoldingSnapshot &snapshot,
                                                        const FinancialFacts &facts) const
        {
            CategoryEvaluation result;
            if (!facts.monthly_expenses || *facts.monthly_expenses <= 0.0)
            {
                result.score = default_score_;
                result.message = "Monthly expenses not provided; default liquidity score applied";
                return result;
            }

            double fund = 0.0;
            std::string source = "emergency fund";
            if (facts.emergency_fund)
            {
                fund = *facts.emergency_fund;
            }
            else
            {
                for (const auto &holding : snapshot.holdings_in(data::AssetCategory::FIXED_INCOME))
                {
                    fund += holding.current_value;
                }
                source = "fixed-income holdings";
            }

            const double months = fund / *facts.monthly_expenses;
            result.metric = months;
            result.score = rubric_.score(months);
            result.message = format_number(months, 1) + " months of expenses covered by " + source;
            return result;
        }

        std::string LiquidityEvaluator::recommendation() const
        {
            return "Build an emergency fund covering at least six months of expenses";
        }

        std::string LiquidityEvaluator::strength() const
        {
            return "Emergency fund comfortably covers monthly expenses";
        }

        // ===================================================================
        // Debt burden
        // ===================================================================

        CategoryEvaluation DebtBurdenEvaluator::evaluate(const data::HoldingSnapshot &,
                                                         const FinancialFacts &facts) const
        {
            CategoryEvaluation result;
            if (!facts.monthly_income || *facts.monthly_income <= 0.0 || !facts.monthly_debt_payments)
            {
                result.score = default_score_;
                result.message = "Income or debt payments not provided; default debt score applied";
                return result;
            }

            const double ratio = *facts.monthly_debt_payments / *facts.monthly_income;
            result.metric = ratio;
            result.score = rubric_.score(ratio);
            result.message = "Debt payments take " + format_number(ratio * 100.0, 1) + "% of monthly income";
            return result;
        }

        std::string DebtBurdenEvaluator::recommendation() const
        {
            return "Reduce debt payments to below 20% of monthly income, starting with the costliest loans";
        }

        std::string DebtBurdenEvaluator::strength() const
        {
            return "Debt payments are a small share of income";
        }

        // ===================================================================
        // Savings rate
        // ===================================================================

        CategoryEvaluation SavingsRateEvaluator::evaluate(const data::HoldingSnapshot &,
                                                          const FinancialFacts &facts) const
        {
            CategoryEvaluation result;
            if (!facts.monthly_income || *facts.monthly_income <= 0.0 || !facts.monthly_expenses)
            {
                result.score = default_score_;
                result.message = "Income or expenses not provided; default savings score applied";
                return result;
            }

            const double rate = (*facts.monthly_income - *facts.monthly_expenses) / *facts.monthly_income;
            result.metric = rate;
            result.score = rubric_.score(rate);
            result.message = "Saving " + format_number(rate * 100.0, 1) + "% of monthly income";
            return result;
        }

        std::string SavingsRateEvaluator::recommendation() const
        {
            return "Increase the savings rate, for example by starting or stepping up a monthly SIP";
        }

        std::string SavingsRateEvaluator::strength() const
        {
            return "Healthy savings rate";
        }

        // ===================================================================
        // Growth trajectory
        // ===================================================================

        CategoryEvaluation GrowthTrajectoryEvaluator::evaluate(const data::HoldingSnapshot &snapshot,
                                                               const FinancialFacts &) const
        {
            CategoryEvaluation result;
            const double cost = snapshot.total_cost_basis();
            if (cost <= 0.0)
            {
                result.score = default_score_;
                result.message = "No invested amount recorded; default growth score applied";
                return result;
            }

            const double gain_pct = (snapshot.total_current_value() - cost) / cost * 100.0;
            result.metric = gain_pct;
            result.score = rubric_.score(gain_pct);
            result.message = "Portfolio is " + format_number(gain_pct, 2) + "% over invested amount";
            return result;
        }

        std::string GrowthTrajectoryEvaluator::recommendation() const
        {
            return "Review underperforming holdings and rebalance toward growth assets suited to your horizon";
        }

        std::string GrowthTrajectoryEvaluator::strength() const
        {
            return "Investments are growing strongly";
        }

    } // namespace analytics
} // namespace wealth
