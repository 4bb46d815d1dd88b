/**
 * @file health_scorer.cpp
 * @brief Implementation of HealthScorer, rubrics and configuration.
 */

#include "analytics/health_scorer.hpp"

#include "analytics/health_evaluators.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace wealth
{
    namespace analytics
    {

        std::string to_string(HealthCategory category)
        {
            switch (category)
            {
            case HealthCategory::DIVERSIFICATION:
                return "diversification";
            case HealthCategory::LIQUIDITY:
                return "liquidity";
            case HealthCategory::DEBT_BURDEN:
                return "debt_burden";
            case HealthCategory::SAVINGS_RATE:
                return "savings_rate";
            case HealthCategory::GROWTH_TRAJECTORY:
                return "growth_trajectory";
            }
            return "unknown";
        }

        // ===================================================================
        // FinancialFacts
        // ===================================================================

        namespace
        {
            std::optional<double> optional_number(const nlohmann::json &j, const std::string &key)
            {
                if (j.contains(key) && j[key].is_number())
                {
                    return j[key].get<double>();
                }
                return std::nullopt;
            }

            void check_optional(const std::string &field, const std::optional<double> &value)
            {
                if (value)
                {
                    require_non_negative(field, *value);
                }
            }
        } // namespace

        void FinancialFacts::validate() const
        {
            check_optional("monthly_income", monthly_income);
            check_optional("monthly_expenses", monthly_expenses);
            check_optional("emergency_fund", emergency_fund);
            check_optional("monthly_debt_payments", monthly_debt_payments);
        }

        FinancialFacts FinancialFacts::from_json(const nlohmann::json &j)
        {
            FinancialFacts facts;
            facts.monthly_income = optional_number(j, "monthly_income");
            facts.monthly_expenses = optional_number(j, "monthly_expenses");
            facts.emergency_fund = optional_number(j, "emergency_fund");
            facts.monthly_debt_payments = optional_number(j, "monthly_debt_payments");
            facts.validate();
            return facts;
        }

        nlohmann::json FinancialFacts::to_json() const
        {
            nlohmann::json j = nlohmann::json::object();
            if (monthly_income)
                j["monthly_income"] = *monthly_income;
            if (monthly_expenses)
                j["monthly_expenses"] = *monthly_expenses;
            if (emergency_fund)
                j["emergency_fund"] = *emergency_fund;
            if (monthly_debt_payments)
                j["monthly_debt_payments"] = *monthly_debt_payments;
            return j;
        }

        // ===================================================================
        // ScoreRubric
        // ===================================================================

        ScoreRubric::ScoreRubric(std::vector<std::pair<double, double>> breakpoints)
            : breakpoints_(std::move(breakpoints))
        {
            if (breakpoints_.empty())
            {
                throw ConfigurationError("rubric", "Rubric needs at least one breakpoint");
            }
            for (size_t k = 0; k < breakpoints_.size(); ++k)
            {
                const auto &[metric, score] = breakpoints_[k];
                if (!std::isfinite(metric) || score < 0.0 || score > MAX_CATEGORY_SCORE)
                {
                    throw ConfigurationError("rubric",
                                             "Breakpoint scores must lie in 0.." + std::to_string(MAX_CATEGORY_SCORE) +
                                                 ", got: " + std::to_string(score));
                }
                if (k > 0 && metric <= breakpoints_[k - 1].first)
                {
                    throw ConfigurationError("rubric", "Breakpoint metrics must be strictly increasing");
                }
            }
        }

        int ScoreRubric::score(double metric) const
        {
            if (breakpoints_.empty())
            {
                throw std::logic_error("ScoreRubric used without breakpoints");
            }

            double value;
            if (!(metric > breakpoints_.front().first))
            {
                value = breakpoints_.front().second;
            }
            else if (metric >= breakpoints_.back().first)
            {
                value = breakpoints_.back().second;
            }
            else
            {
                auto upper = std::upper_bound(breakpoints_.begin(), breakpoints_.end(), metric,
                                              [](double m, const std::pair<double, double> &bp)
                                              { return m < bp.first; });
                auto lower = upper - 1;
                double frac = (metric - lower->first) / (upper->first - lower->first);
                value = lower->second + frac * (upper->second - lower->second);
            }

            long rounded = std::lround(value);
            return static_cast<int>(std::clamp<long>(rounded, 0, MAX_CATEGORY_SCORE));
        }

        ScoreRubric ScoreRubric::from_json(const nlohmann::json &j)
        {
            if (!j.is_array())
            {
                throw ConfigurationError("rubric", "Rubric must be an array of [metric, score] pairs");
            }
            std::vector<std::pair<double, double>> points;
            for (const auto &entry : j)
            {
                if (!entry.is_array() || entry.size() != 2)
                {
                    throw ConfigurationError("rubric", "Rubric entry must be a [metric, score] pair");
                }
                points.emplace_back(entry[0].get<double>(), entry[1].get<double>());
            }
            return ScoreRubric(std::move(points));
        }

        nlohmann::json ScoreRubric::to_json() const
        {
            nlohmann::json j = nlohmann::json::array();
            for (const auto &[metric, score] : breakpoints_)
            {
                j.push_back({metric, score});
            }
            return j;
        }

        // ===================================================================
        // HealthConfig
        // ===================================================================

        HealthConfig HealthConfig::from_json(const nlohmann::json &j)
        {
            HealthConfig config;

            if (j.contains("rubrics"))
            {
                const auto &rubrics = j["rubrics"];
                if (rubrics.contains("diversification"))
                    config.diversification = ScoreRubric::from_json(rubrics["diversification"]);
                if (rubrics.contains("liquidity"))
                    config.liquidity = ScoreRubric::from_json(rubrics["liquidity"]);
                if (rubrics.contains("debt_burden"))
                    config.debt_burden = ScoreRubric::from_json(rubrics["debt_burden"]);
                if (rubrics.contains("savings_rate"))
                    config.savings_rate = ScoreRubric::from_json(rubrics["savings_rate"]);
                if (rubrics.contains("growth_trajectory"))
                    config.growth_trajectory = ScoreRubric::from_json(rubrics["growth_trajectory"]);
            }

            config.needs_improvement_cutoff = j.value("needs_improvement_cutoff", 100);
            config.strong_cutoff = j.value("strong_cutoff", 160);

            if (j.contains("default_scores"))
            {
                const auto &defaults = j["default_scores"];
                config.default_liquidity_score = defaults.value("liquidity", 60);
                config.default_debt_score = defaults.value("debt_burden", 80);
                config.default_savings_score = defaults.value("savings_rate", 60);
                config.default_growth_score = defaults.value("growth_trajectory", 60);
            }

            for (int score : {config.needs_improvement_cutoff, config.strong_cutoff,
                              config.default_liquidity_score, config.default_debt_score,
                              config.default_savings_score, config.default_growth_score})
            {
                if (score < 0 || score > MAX_CATEGORY_SCORE)
                {
                    throw ConfigurationError("health",
                                             "Cutoffs and default scores must lie in 0.." +
                                                 std::to_string(MAX_CATEGORY_SCORE) + ", got: " + std::to_string(score));
                }
            }
            if (config.needs_improvement_cutoff > config.strong_cutoff)
            {
                throw ConfigurationError("health.needs_improvement_cutoff",
                                         "Must not exceed strong_cutoff");
            }

            return config;
        }

        nlohmann::json HealthConfig::to_json() const
        {
            return nlohmann::json{
                {"rubrics", {{"diversification", diversification.to_json()},
                             {"liquidity", liquidity.to_json()},
                             {"debt_burden", debt_burden.to_json()},
                             {"savings_rate", savings_rate.to_json()},
                             {"growth_trajectory", growth_trajectory.to_json()}}},
                {"needs_improvement_cutoff", needs_improvement_cutoff},
                {"strong_cutoff", strong_cutoff},
                {"default_scores", {{"liquidity", default_liquidity_score},
                                    {"debt_burden", default_debt_score},
                                    {"savings_rate", default_savings_score},
                                    {"growth_trajectory", default_growth_score}}}};
        }

        // ===================================================================
        // HealthScore
        // ===================================================================

        int HealthScore::score_for(HealthCategory category) const
        {
            for (const auto &entry : category_scores)
            {
                if (entry.category == category)
                {
                    return entry.score;
                }
            }
            throw std::out_of_range("No score for category: " + to_string(category));
        }

        std::string HealthScore::report() const
        {
            std::ostringstream oss;
            oss << "Financial Health Score\n";
            oss << "======================\n\n";
            oss << "Overall: " << overall_score << " / " << MAX_OVERALL_SCORE << " (" << rating << ")\n\n";

            for (const auto &entry : category_scores)
            {
                oss << "  " << std::left << std::setw(20) << to_string(entry.category)
                    << std::right << std::setw(4) << entry.score << " / " << MAX_CATEGORY_SCORE
                    << "  " << entry.message << "\n";
            }

            if (!strengths.empty())
            {
                oss << "\nStrengths:\n";
                for (const auto &s : strengths)
                {
                    oss << "  + " << s << "\n";
                }
            }
            if (!recommendations.empty())
            {
                oss << "\nRecommendations:\n";
                for (const auto &r : recommendations)
                {
                    oss << "  - " << r << "\n";
                }
            }
            return oss.str();
        }

        nlohmann::json HealthScore::to_json() const
        {
            nlohmann::json j;
            j["overall_score"] = overall_score;
            j["rating"] = rating;
            j["category_scores"] = nlohmann::json::object();
            j["category_details"] = nlohmann::json::object();
            for (const auto &entry : category_scores)
            {
                const auto name = to_string(entry.category);
                j["category_scores"][name] = entry.score;
                j["category_details"][name]["message"] = entry.message;
                j["category_details"][name]["metric"] = entry.metric ? nlohmann::json(*entry.metric) : nlohmann::json();
            }
            j["recommendations"] = recommendations;
            j["strengths"] = strengths;
            return j;
        }

        // ===================================================================
        // HealthScorer
        // ===================================================================

        std::vector<std::unique_ptr<HealthEvaluator>> create_health_evaluators(const HealthConfig &config)
        {
            std::vector<std::unique_ptr<HealthEvaluator>> evaluators;
            evaluators.push_back(std::make_unique<DiversificationEvaluator>(config.diversification));
            evaluators.push_back(std::make_unique<LiquidityEvaluator>(config.liquidity, config.default_liquidity_score));
            evaluators.push_back(std::make_unique<DebtBurdenEvaluator>(config.debt_burden, config.default_debt_score));
            evaluators.push_back(std::make_unique<SavingsRateEvaluator>(config.savings_rate, config.default_savings_score));
            evaluators.push_back(std::make_unique<GrowthTrajectoryEvaluator>(config.growth_trajectory, config.default_growth_score));
            return evaluators;
        }

        HealthScorer::HealthScorer(const HealthConfig &config)
            : config_(config),
              evaluators_(create_health_evaluators(config))
        {
        }

        HealthScore HealthScorer::score(const data::HoldingSnapshot &snapshot, const FinancialFacts &facts) const
        {
            snapshot.validate();
            facts.validate();

            HealthScore result;
            for (const auto &evaluator : evaluators_)
            {
                CategoryEvaluation evaluation = evaluator->evaluate(snapshot, facts);
                int category_score = std::clamp(evaluation.score, 0, MAX_CATEGORY_SCORE);

                result.category_scores.push_back(
                    CategoryScore{evaluator->category(), category_score, evaluation.metric, evaluation.message});
                result.overall_score += category_score;

                if (category_score < config_.needs_improvement_cutoff)
                {
                    result.recommendations.push_back(evaluator->recommendation());
                }
                if (category_score >= config_.strong_cutoff)
                {
                    result.strengths.push_back(evaluator->strength());
                }
            }

            result.rating = rating_for(result.overall_score);
            return result;
        }

        std::string HealthScorer::rating_for(int overall_score)
        {
            if (overall_score >= 800)
                return "Excellent";
            if (overall_score >= 600)
                return "Good";
            if (overall_score >= 400)
                return "Fair";
            return "Poor";
        }

    } // namespace analytics
} // namespace wealth
