/**
 * @file monte_carlo_simulator.hpp
 * @brief Monte Carlo band of portfolio outcomes under random annual returns.
 *
 * Each path draws one normal annual return per year, clamped at -100%,
 * and compounds the starting value (plus an optional yearly contribution)
 * through the shared compounding primitive. Percentiles of the path
 * values are taken independently at every year.
 *
 * Paths are generated in fixed-size batches. Every batch owns a random
 * stream keyed by (seed, batch index), so a seeded run is bit-identical
 * whether it runs on one thread or many.
 */

#pragma once

#include "data/holding.hpp"
#include "projection/growth_projector.hpp"
#include "simulation/random_stream.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace wealth
{
    namespace simulation
    {

        /**
         * @class SimulationCancelled
         * @brief Thrown when a run is stopped by its token or deadline.
         */
        class SimulationCancelled : public std::runtime_error
        {
        public:
            explicit SimulationCancelled(const std::string &reason)
                : std::runtime_error("Simulation cancelled: " + reason) {}
        };

        /**
         * @class CancellationToken
         * @brief Cooperative stop signal with an optional deadline.
         *
         * cancel() may be called from any thread while a simulation runs.
         */
        class CancellationToken
        {
        public:
            using Clock = std::chrono::steady_clock;

            CancellationToken() = default;

            /** @brief Token that also expires at the given time point. */
            explicit CancellationToken(Clock::time_point deadline) : deadline_(deadline) {}

            /** @brief Token that expires after the given duration from now. */
            static CancellationToken with_timeout(std::chrono::milliseconds timeout);

            void cancel() { cancelled_.store(true); }

            bool is_cancelled() const;

            /** @brief "cancelled" or "deadline exceeded". */
            std::string reason() const;

        private:
            std::atomic<bool> cancelled_{false};
            std::optional<Clock::time_point> deadline_;
        };

        /**
         * @struct MonteCarloParams
         * @brief Inputs of one simulation run.
         */
        struct MonteCarloParams
        {
            double starting_value = 0.0;
            double expected_return_pct = 10.0;
            double volatility_pct = 15.0;
            int horizon_years = 20;
            int simulation_count = 5000;
            double annual_contribution = 0.0;   ///< Deposited at the start of each year
            std::optional<std::uint64_t> seed;  ///< Unset: drawn from std::random_device

            static MonteCarloParams from_json(const nlohmann::json &j);
        };

        /**
         * @struct MonteCarloConfig
         * @brief Engine limits, parallelism settings and request defaults.
         */
        struct MonteCarloConfig
        {
            int min_simulations = 100;
            int max_simulations = 1000000;
            int batch_size = 256;          ///< Paths per random stream
            int parallel_threshold = 2000; ///< Run single-threaded below this many paths
            int max_threads = 0;           ///< 0 = hardware concurrency

            int default_horizon_years = 20;
            double default_volatility_pct = 15.0;
            int default_simulation_count = 5000;

            static MonteCarloConfig default_config() { return MonteCarloConfig{}; }
            static MonteCarloConfig from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct MonteCarloResult
         * @brief Percentile band per year and final-year scenarios.
         */
        struct MonteCarloResult
        {
            std::vector<int> years;
            std::vector<double> percentile_10;
            std::vector<double> percentile_25;
            std::vector<double> percentile_50;
            std::vector<double> percentile_75;
            std::vector<double> percentile_90;

            /// worst_case (p10), pessimistic (p25), most_likely (p50),
            /// optimistic (p75), best_case (p90) at the final year
            std::map<std::string, double> final_values;

            int simulation_count = 0;
            std::uint64_t seed_used = 0;

            void print_summary() const;
            nlohmann::json to_json() const;
        };

        /**
         * @class MonteCarloSimulator
         * @brief Generates simulated paths and reduces them to percentile bands.
         *
         * Usage:
         * @code
         *   MonteCarloSimulator simulator;
         *   MonteCarloParams params;
         *   params.starting_value = 1000000.0;
         *   params.seed = 42;
         *   auto result = simulator.simulate(params);
         * @endcode
         *
         * Thread safety: simulate() is const and may be called concurrently.
         */
        class MonteCarloSimulator
        {
        public:
            explicit MonteCarloSimulator(const MonteCarloConfig &config = MonteCarloConfig::default_config());

            /**
             * @brief Simulator drawing from a caller-supplied stream factory.
             * @throws std::invalid_argument if factory is null
             */
            MonteCarloSimulator(const MonteCarloConfig &config,
                                std::shared_ptr<const RandomStreamFactory> factory);

            /**
             * @brief Run with an unseeded generator.
             * @throws ValidationError on invalid inputs
             */
            MonteCarloResult simulate(double starting_value,
                                      double expected_annual_return_pct,
                                      double volatility_pct,
                                      int horizon_years,
                                      int simulation_count) const;

            /**
             * @brief Run a fully specified simulation.
             * @param params Simulation inputs
             * @param cancel Optional token checked between batches
             * @throws ValidationError on invalid inputs
             * @throws SimulationCancelled if the token fires before completion
             */
            MonteCarloResult simulate(const MonteCarloParams &params,
                                      const CancellationToken *cancel = nullptr) const;

            /**
             * @brief Simulated values, rows = paths, columns = years.
             *
             * Same validation and cancellation behaviour as simulate().
             */
            Eigen::MatrixXd generate_paths(const MonteCarloParams &params,
                                           std::uint64_t seed,
                                           const CancellationToken *cancel = nullptr) const;

            /**
             * @brief Linear-interpolation percentile of ascending-sorted values.
             * @param sorted_values Values in ascending order (non-empty)
             * @param p Percentile as a fraction in [0, 1]
             */
            static double percentile(const std::vector<double> &sorted_values, double p);

            /**
             * @brief Value-weighted expected annual return of a snapshot (%).
             * @return 0 for an empty or zero-value snapshot
             */
            static double blended_expected_return(const data::HoldingSnapshot &snapshot,
                                                  const projection::ProjectionSettings &settings);

            const MonteCarloConfig &config() const { return config_; }

        private:
            void validate_params(const MonteCarloParams &params) const;

            int worker_count(int simulation_count, int num_batches) const;

            MonteCarloConfig config_;
            std::shared_ptr<const RandomStreamFactory> factory_;
        };

    } // namespace simulation
} // namespace wealth
