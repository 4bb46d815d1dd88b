/**
 * @file health_evaluators.hpp
 * @brief Concrete evaluators for the five health categories.
 *
 * Metric and fallback per category:
 *   diversification    1 - largest category share of current value
 *                      (empty or zero-value snapshot scores 0)
 *   liquidity          emergency fund / monthly expenses, in months
 *                      (no expenses: default; no fund: fixed-income holdings)
 *   debt_burden        monthly debt payments / monthly income
 *                      (either figure missing: default)
 *   savings_rate       (income - expenses) / income
 *                      (either figure missing: default)
 *   growth_trajectory  total gain over total cost basis, in percent
 *                      (zero cost basis: default)
 */

#ifndef WEALTH_ANALYTICS_HEALTH_EVALUATORS_HPP
#define WEALTH_ANALYTICS_HEALTH_EVALUATORS_HPP

#include "analytics/health_scorer.hpp"

namespace wealth
{
    namespace analytics
    {

        class DiversificationEvaluator : public HealthEvaluator
        {
        public:
            explicit DiversificationEvaluator(const ScoreRubric &rubric) : rubric_(rubric) {}

            CategoryEvaluation evaluate(const data::HoldingSnapshot &snapshot,
                                        const FinancialFacts &facts) const override;

            HealthCategory category() const override { return HealthCategory::DIVERSIFICATION; }
            std::string recommendation() const override;
            std::string strength() const override;

        private:
            ScoreRubric rubric_;
        };

        class LiquidityEvaluator : public HealthEvaluator
        {
        public:
            LiquidityEvaluator(const ScoreRubric &rubric, int default_score)
                : rubric_(rubric), default_score_(default_score) {}

            CategoryEvaluation evaluate(const data::HoldingSnapshot &snapshot,
                                        const FinancialFacts &facts) const override;

            HealthCategory category() const override { return HealthCategory::LIQUIDITY; }
            std::string recommendation() const override;
            std::string strength() const override;

        private:
            ScoreRubric rubric_;
            int default_score_;
        };

        class DebtBurdenEvaluator : public HealthEvaluator
        {
        public:
            DebtBurdenEvaluator(const ScoreRubric &rubric, int default_score)
                : rubric_(rubric), default_score_(default_score) {}

            CategoryEvaluation evaluate(const data::HoldingSnapshot &snapshot,
                                        const FinancialFacts &facts) const override;

            HealthCategory category() const override { return HealthCategory::DEBT_BURDEN; }
            std::string recommendation() const override;
            std::string strength() const override;

        private:
            ScoreRubric rubric_;
            int default_score_;
        };

        class SavingsRateEvaluator : public HealthEvaluator
        {
        public:
            SavingsRateEvaluator(const ScoreRubric &rubric, int default_score)
                : rubric_(rubric), default_score_(default_score) {}

            CategoryEvaluation evaluate(const data::HoldingSnapshot &snapshot,
                                        const FinancialFacts &facts) const override;

            HealthCategory category() const override { return HealthCategory::SAVINGS_RATE; }
            std::string recommendation() const override;
            std::string strength() const override;

        private:
            ScoreRubric rubric_;
            int default_score_;
        };

        class GrowthTrajectoryEvaluator : public HealthEvaluator
        {
        public:
            GrowthTrajectoryEvaluator(const ScoreRubric &rubric, int default_score)
                : rubric_(rubric), default_score_(default_score) {}

            CategoryEvaluation evaluate(const data::HoldingSnapshot &snapshot,
                                        const FinancialFacts &facts) const override;

            HealthCategory category() const override { return HealthCategory::GROWTH_TRAJECTORY; }
            std::string recommendation() const override;
            std::string strength() const override;

        private:
            ScoreRubric rubric_;
            int default_score_;
        };

    } // namespace analytics
} // namespace wealth

#endif // WEALTH_ANALYTICS_HEALTH_EVALUATORS_HPP
