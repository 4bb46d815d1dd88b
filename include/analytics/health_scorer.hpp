/**
 * @file health_scorer.hpp
 * @brief Composite financial-health score built from five rubric evaluators.
 *
 * The score is the sum of five category scores, each 0-200, so the total
 * always lies in 0-1000. Each category maps one metric through a
 * piecewise-linear rubric. Categories whose inputs are missing fall back
 * to a fixed conservative score instead of failing the request.
 *
 * Category order (fixed): diversification, liquidity, debt_burden,
 * savings_rate, growth_trajectory.
 */

#ifndef WEALTH_ANALYTICS_HEALTH_SCORER_HPP
#define WEALTH_ANALYTICS_HEALTH_SCORER_HPP

#include "data/holding.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wealth
{
    namespace analytics
    {

        constexpr int MAX_CATEGORY_SCORE = 200;
        constexpr int MAX_OVERALL_SCORE = 1000;

        /**
         * @enum HealthCategory
         * @brief The five scored categories, in evaluation order.
         */
        enum class HealthCategory
        {
            DIVERSIFICATION,
            LIQUIDITY,
            DEBT_BURDEN,
            SAVINGS_RATE,
            GROWTH_TRAJECTORY
        };

        std::string to_string(HealthCategory category);

        /**
         * @struct FinancialFacts
         * @brief User-supplied monthly figures. Every field is optional.
         */
        struct FinancialFacts
        {
            std::optional<double> monthly_income;
            std::optional<double> monthly_expenses;
            std::optional<double> emergency_fund;
            std::optional<double> monthly_debt_payments;

            /** @throws ValidationError if a provided figure is negative */
            void validate() const;

            static FinancialFacts from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @class ScoreRubric
         * @brief Piecewise-linear map from a metric to a 0-200 score.
         *
         * Breakpoints are (metric, score) pairs with strictly increasing
         * metrics. Metrics below the first or above the last breakpoint take
         * the score of that breakpoint.
         */
        class ScoreRubric
        {
        public:
            ScoreRubric() = default;

            /** @throws ConfigurationError if breakpoints are empty, unordered or out of range */
            explicit ScoreRubric(std::vector<std::pair<double, double>> breakpoints);

            /** @brief Interpolated score, rounded to the nearest integer and clamped to 0..200. */
            int score(double metric) const;

            const std::vector<std::pair<double, double>> &breakpoints() const { return breakpoints_; }

            /** @brief Parse [[metric, score], ...]. */
            static ScoreRubric from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;

        private:
            std::vector<std::pair<double, double>> breakpoints_;
        };

        /**
         * @struct HealthConfig
         * @brief Rubrics, cutoffs and absent-facts defaults.
         */
        struct HealthConfig
        {
            ScoreRubric diversification = ScoreRubric({{0.0, 0.0}, {0.75, 200.0}});          ///< 1 - max category share
            ScoreRubric liquidity = ScoreRubric({{0.0, 0.0}, {6.0, 200.0}});                 ///< Months of expenses covered
            ScoreRubric debt_burden = ScoreRubric({{0.1, 200.0}, {0.5, 0.0}});               ///< Debt payments / income
            ScoreRubric savings_rate = ScoreRubric({{0.0, 0.0}, {0.3, 200.0}});              ///< (income - expenses) / income
            ScoreRubric growth_trajectory = ScoreRubric({{-20.0, 0.0}, {0.0, 80.0}, {40.0, 200.0}}); ///< Gain % over cost

            int needs_improvement_cutoff = 100; ///< Recommendation below this score
            int strong_cutoff = 160;            ///< Strength at or above this score

            int default_liquidity_score = 60; ///< No monthly expenses provided
            int default_debt_score = 80;      ///< Income or debt payments missing
            int default_savings_score = 60;   ///< Income or expenses missing
            int default_growth_score = 60;    ///< Zero total cost basis

            static HealthConfig default_config() { return HealthConfig{}; }
            static HealthConfig from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct CategoryEvaluation
         * @brief Result of one evaluator.
         */
        struct CategoryEvaluation
        {
            int score = 0;
            std::optional<double> metric; ///< Unset when a default score was used
            std::string message;          ///< Explanation of how the score was reached
        };

        /**
         * @class HealthEvaluator
         * @brief Scores one health category.
         */
        class HealthEvaluator
        {
        public:
            virtual ~HealthEvaluator() = default;

            virtual CategoryEvaluation evaluate(const data::HoldingSnapshot &snapshot,
                                                const FinancialFacts &facts) const = 0;

            virtual HealthCategory category() const = 0;

            /** @brief Advice shown when the category scores below the cutoff. */
            virtual std::string recommendation() const = 0;

            /** @brief Praise shown when the category scores at or above the strong cutoff. */
            virtual std::string strength() const = 0;
        };

        /**
         * @struct CategoryScore
         * @brief Score of one category within a HealthScore.
         */
        struct CategoryScore
        {
            HealthCategory category;
            int score;
            std::optional<double> metric;
            std::string message;
        };

        /**
         * @struct HealthScore
         * @brief Overall score, per-category breakdown and advice.
         */
        struct HealthScore
        {
            int overall_score = 0;                     ///< Sum of category scores, 0..1000
            std::vector<CategoryScore> category_scores; ///< Fixed category order
            std::vector<std::string> recommendations;
            std::vector<std::string> strengths;
            std::string rating;                         ///< Excellent / Good / Fair / Poor

            /** @throws std::out_of_range if the category is missing */
            int score_for(HealthCategory category) const;

            std::string report() const;
            nlohmann::json to_json() const;
        };

        /**
         * @class HealthScorer
         * @brief Runs the five evaluators in order and assembles a HealthScore.
         *
         * Thread safety: score() is const and may be called concurrently.
         */
        class HealthScorer
        {
        public:
            explicit HealthScorer(const HealthConfig &config = HealthConfig::default_config());

            /**
             * @brief Score a snapshot.
             * @throws ValidationError if the snapshot is invalid or a provided fact is negative
             */
            HealthScore score(const data::HoldingSnapshot &snapshot, const FinancialFacts &facts) const;

            /** @brief Excellent (>= 800), Good (>= 600), Fair (>= 400), Poor otherwise. */
            static std::string rating_for(int overall_score);

            const HealthConfig &config() const { return config_; }

        private:
            HealthConfig config_;
            std::vector<std::unique_ptr<HealthEvaluator>> evaluators_;
        };

        /**
         * @brief The five evaluators in scoring order.
         */
        std::vector<std::unique_ptr<HealthEvaluator>> create_health_evaluators(const HealthConfig &config);

    } // namespace analytics
} // namespace wealth

#endif // WEALTH_ANALYTICS_HEALTH_SCORER_HPP
