/**
 * @file monte_carlo_simulator.cpp
 * @brief Implementation of MonteCarloSimulator.
 */

#include "simulation/monte_carlo_simulator.hpp"

#include "common/errors.hpp"
#include "projection/compounding.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <iomanip>
#include <iostream>
#include <random>
#include <thread>

namespace wealth
{
    namespace simulation
    {

        // ===================================================================
        // CancellationToken
        // ===================================================================

        CancellationToken CancellationToken::with_timeout(std::chrono::milliseconds timeout)
        {
            return CancellationToken(Clock::now() + timeout);
        }

        bool CancellationToken::is_cancelled() const
        {
            if (cancelled_.load())
            {
                return true;
            }
            return deadline_.has_value() && Clock::now() >= *deadline_;
        }

        std::string CancellationToken::reason() const
        {
            return cancelled_.load() ? "cancelled" : "deadline exceeded";
        }

        // ===================================================================
        // Configuration
        // ===================================================================

        MonteCarloParams MonteCarloParams::from_json(const nlohmann::json &j)
        {
            MonteCarloParams params;
            params.starting_value = j.value("starting_value", 0.0);
            params.expected_return_pct = j.value("expected_return_pct", 10.0);
            params.volatility_pct = j.value("volatility_pct", 15.0);
            params.horizon_years = j.value("horizon_years", 20);
            params.simulation_count = j.value("simulation_count", 5000);
            params.annual_contribution = j.value("annual_contribution", 0.0);
            if (j.contains("seed") && j["seed"].is_number_integer())
            {
                params.seed = j["seed"].get<std::uint64_t>();
            }
            return params;
        }

        MonteCarloConfig MonteCarloConfig::from_json(const nlohmann::json &j)
        {
            MonteCarloConfig config;
            config.min_simulations = j.value("min_simulations", 100);
            config.max_simulations = j.value("max_simulations", 1000000);
            config.batch_size = j.value("batch_size", 256);
            config.parallel_threshold = j.value("parallel_threshold", 2000);
            config.max_threads = j.value("max_threads", 0);
            config.default_horizon_years = j.value("horizon_years", 20);
            config.default_volatility_pct = j.value("volatility_pct", 15.0);
            config.default_simulation_count = j.value("simulation_count", 5000);

            if (config.min_simulations < 100)
            {
                throw ConfigurationError("monte_carlo.min_simulations",
                                         "Expected at least 100, got: " + std::to_string(config.min_simulations));
            }
            if (config.max_simulations < config.min_simulations)
            {
                throw ConfigurationError("monte_carlo.max_simulations",
                                         "Must not be below min_simulations");
            }
            if (config.batch_size < 1)
            {
                throw ConfigurationError("monte_carlo.batch_size",
                                         "Expected positive value, got: " + std::to_string(config.batch_size));
            }
            if (config.max_threads < 0)
            {
                throw ConfigurationError("monte_carlo.max_threads",
                                         "Expected non-negative value, got: " + std::to_string(config.max_threads));
            }
            return config;
        }

        nlohmann::json MonteCarloConfig::to_json() const
        {
            return nlohmann::json{
                {"min_simulations", min_simulations},
                {"max_simulations", max_simulations},
                {"batch_size", batch_size},
                {"parallel_threshold", parallel_threshold},
                {"max_threads", max_threads},
                {"horizon_years", default_horizon_years},
                {"volatility_pct", default_volatility_pct},
                {"simulation_count", default_simulation_count}};
        }

        // ===================================================================
        // MonteCarloResult
        // ===================================================================

        void MonteCarloResult::print_summary() const
        {
            std::cout << "\n=== Monte Carlo Simulation ===\n";
            std::cout << "Simulations: " << simulation_count << "  Seed: " << seed_used << "\n";
            std::cout << std::string(78, '-') << "\n";
            std::cout << std::setw(6) << "Year" << std::setw(14) << "P10" << std::setw(14) << "P25"
                      << std::setw(14) << "P50" << std::setw(14) << "P75" << std::setw(14) << "P90" << "\n";
            for (size_t t = 0; t < years.size(); ++t)
            {
                std::cout << std::setw(6) << years[t] << std::fixed << std::setprecision(0)
                          << std::setw(14) << percentile_10[t]
                          << std::setw(14) << percentile_25[t]
                          << std::setw(14) << percentile_50[t]
                          << std::setw(14) << percentile_75[t]
                          << std::setw(14) << percentile_90[t] << "\n";
            }
            std::cout << std::string(78, '-') << "\n";
            for (const auto &[label, value] : final_values)
            {
                std::cout << "  " << std::left << std::setw(12) << label << std::right
                          << std::fixed << std::setprecision(2) << value << "\n";
            }
        }

        nlohmann::json MonteCarloResult::to_json() const
        {
            nlohmann::json j;
            j["years"] = years;
            j["percentile_10"] = percentile_10;
            j["percentile_25"] = percentile_25;
            j["percentile_50"] = percentile_50;
            j["percentile_75"] = percentile_75;
            j["percentile_90"] = percentile_90;
            j["final_values"] = final_values;
            j["simulation_count"] = simulation_count;
            j["seed_used"] = seed_used;
            return j;
        }

        // ===================================================================
        // MonteCarloSimulator
        // ===================================================================

        MonteCarloSimulator::MonteCarloSimulator(const MonteCarloConfig &config)
            : config_(config),
              factory_(std::make_shared<MersenneStreamFactory>())
        {
        }

        MonteCarloSimulator::MonteCarloSimulator(const MonteCarloConfig &config,
                                                 std::shared_ptr<const RandomStreamFactory> factory)
            : config_(config),
              factory_(std::move(factory))
        {
            if (!factory_)
            {
                throw std::invalid_argument("Random stream factory cannot be null");
            }
        }

        MonteCarloResult MonteCarloSimulator::simulate(double starting_value,
                                                       double expected_annual_return_pct,
                                                       double volatility_pct,
                                                       int horizon_years,
                                                       int simulation_count) const
        {
            MonteCarloParams params;
            params.starting_value = starting_value;
            params.expected_return_pct = expected_annual_return_pct;
            params.volatility_pct = volatility_pct;
            params.horizon_years = horizon_years;
            params.simulation_count = simulation_count;
            return simulate(params);
        }

        MonteCarloResult MonteCarloSimulator::simulate(const MonteCarloParams &params,
                                                       const CancellationToken *cancel) const
        {
            validate_params(params);

            std::uint64_t seed = 0;
            if (params.seed)
            {
                seed = *params.seed;
            }
            else
            {
                std::random_device rd;
                seed = (static_cast<std::uint64_t>(rd()) << 32) | rd();
            }

            Eigen::MatrixXd paths = generate_paths(params, seed, cancel);

            MonteCarloResult result;
            result.simulation_count = params.simulation_count;
            result.seed_used = seed;

            std::vector<double> column(params.simulation_count);
            for (int t = 0; t < params.horizon_years; ++t)
            {
                for (int s = 0; s < params.simulation_count; ++s)
                {
                    column[s] = paths(s, t);
                }
                std::sort(column.begin(), column.end());

                result.years.push_back(t + 1);
                result.percentile_10.push_back(percentile(column, 0.10));
                result.percentile_25.push_back(percentile(column, 0.25));
                result.percentile_50.push_back(percentile(column, 0.50));
                result.percentile_75.push_back(percentile(column, 0.75));
                result.percentile_90.push_back(percentile(column, 0.90));
            }

            result.final_values["worst_case"] = result.percentile_10.back();
            result.final_values["pessimistic"] = result.percentile_25.back();
            result.final_values["most_likely"] = result.percentile_50.back();
            result.final_values["optimistic"] = result.percentile_75.back();
            result.final_values["best_case"] = result.percentile_90.back();

            return result;
        }

        Eigen::MatrixXd MonteCarloSimulator::generate_paths(const MonteCarloParams &params,
                                                            std::uint64_t seed,
                                                            const CancellationToken *cancel) const
        {
            validate_params(params);

            const int n_paths = params.simulation_count;
            const int n_years = params.horizon_years;
            const int batch_size = config_.batch_size;
            const int num_batches = (n_paths + batch_size - 1) / batch_size;
            const double mean = params.expected_return_pct / 100.0;
            const double stddev = params.volatility_pct / 100.0;

            Eigen::MatrixXd paths(n_paths, n_years);

            // Each batch fills its own rows, so workers never share output cells.
            auto run_batch = [&](int batch)
            {
                auto stream = factory_->create(seed, static_cast<std::uint64_t>(batch));
                const int first = batch * batch_size;
                const int last = std::min(first + batch_size, n_paths);

                for (int s = first; s < last; ++s)
                {
                    double value = params.starting_value;
                    for (int t = 0; t < n_years; ++t)
                    {
                        double annual_return = std::max(mean + stddev * stream->standard_normal(), -1.0);
                        value = projection::compound(value, params.annual_contribution, annual_return, 1);
                        paths(s, t) = value;
                    }
                }
            };

            const int workers = worker_count(n_paths, num_batches);

            auto run_worker = [&](int worker)
            {
                for (int batch = worker; batch < num_batches; batch += workers)
                {
                    if (cancel != nullptr && cancel->is_cancelled())
                    {
                        throw SimulationCancelled(cancel->reason());
                    }
                    run_batch(batch);
                }
            };

            if (workers <= 1)
            {
                run_worker(0);
            }
            else
            {
                std::vector<std::future<void>> futures;
                futures.reserve(workers);
                for (int w = 0; w < workers; ++w)
                {
                    futures.push_back(std::async(std::launch::async, run_worker, w));
                }
                // Wait for every worker before rethrowing so none outlives `paths`.
                for (auto &future : futures)
                {
                    future.wait();
                }
                for (auto &future : futures)
                {
                    future.get();
                }
            }

            if (cancel != nullptr && cancel->is_cancelled())
            {
                throw SimulationCancelled(cancel->reason());
            }

            return paths;
        }

        double MonteCarloSimulator::percentile(const std::vector<double> &sorted_values, double p)
        {
            if (sorted_values.empty())
            {
                throw std::invalid_argument("Cannot compute percentile of an empty sample");
            }
            if (p < 0.0 || p > 1.0)
            {
                throw std::invalid_argument("Percentile must be in [0, 1], got: " + std::to_string(p));
            }

            const int n = static_cast<int>(sorted_values.size());
            double index = p * static_cast<double>(n - 1);
            int lower = static_cast<int>(std::floor(index));
            int upper = static_cast<int>(std::ceil(index));

            if (lower == upper)
            {
                return sorted_values[lower];
            }

            double frac = index - static_cast<double>(lower);
            return sorted_values[lower] * (1.0 - frac) + sorted_values[upper] * frac;
        }

        double MonteCarloSimulator::blended_expected_return(const data::HoldingSnapshot &snapshot,
                                                            const projection::ProjectionSettings &settings)
        {
            const double total = snapshot.total_current_value();
            if (total <= 0.0)
            {
                return 0.0;
            }

            double blended = 0.0;
            for (const auto &[category, value] : snapshot.value_by_category())
            {
                blended += value / total * settings.growth_rate_for(category);
            }
            return blended;
        }

        // ===================================================================
        // Private helpers
        // ===================================================================

        void MonteCarloSimulator::validate_params(const MonteCarloParams &params) const
        {
            projection::GrowthProjector::validate_horizon(params.horizon_years);
            require_non_negative("starting_value", params.starting_value);
            require_non_negative("volatility_pct", params.volatility_pct);
            require_non_negative("annual_contribution", params.annual_contribution);
            require_finite("expected_return_pct", params.expected_return_pct);

            if (params.expected_return_pct <= -100.0)
            {
                throw ValidationError("expected_return_pct",
                                      "Expected return above -100%, got: " + std::to_string(params.expected_return_pct));
            }
            if (params.simulation_count < config_.min_simulations)
            {
                throw ValidationError("simulation_count",
                                      "At least " + std::to_string(config_.min_simulations) +
                                          " simulations are required for stable percentiles, got: " +
                                          std::to_string(params.simulation_count));
            }
            if (params.simulation_count > config_.max_simulations)
            {
                throw ValidationError("simulation_count",
                                      "At most " + std::to_string(config_.max_simulations) +
                                          " simulations are allowed, got: " + std::to_string(params.simulation_count));
            }
        }

        int MonteCarloSimulator::worker_count(int simulation_count, int num_batches) const
        {
            if (simulation_count < config_.parallel_threshold)
            {
                return 1;
            }

            int threads = config_.max_threads;
            if (threads <= 0)
            {
                threads = static_cast<int>(std::thread::hardware_concurrency());
            }
            return std::max(1, std::min(threads, num_batches));
        }

    } // namespace simulation
} // namespace wealth
