/**
 * @file random_stream.hpp
 * @brief Seedable sources of standard-normal draws for the simulator.
 *
 * The simulator never touches global randomness. It asks a factory for
 * one independent stream per batch of paths, keyed by (seed, stream index),
 * so a seeded run produces the same draws however batches are scheduled
 * across threads.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <string>

namespace wealth
{
    namespace simulation
    {

        /**
         * @class RandomStream
         * @brief Sequence of independent N(0, 1) draws.
         */
        class RandomStream
        {
        public:
            virtual ~RandomStream() = default;

            /** @brief Next standard-normal variate. */
            virtual double standard_normal() = 0;
        };

        /**
         * @class RandomStreamFactory
         * @brief Creates independent streams for a seed and a stream index.
         *
         * Implementations must be deterministic: equal (seed, stream_index)
         * pairs yield equal sequences. create() may be called concurrently.
         */
        class RandomStreamFactory
        {
        public:
            virtual ~RandomStreamFactory() = default;

            virtual std::unique_ptr<RandomStream> create(std::uint64_t seed,
                                                         std::uint64_t stream_index) const = 0;

            virtual std::string get_name() const = 0;
        };

        /**
         * @class MersenneStream
         * @brief std::mt19937_64 seeded from a seed_seq of (seed, stream index).
         */
        class MersenneStream : public RandomStream
        {
        public:
            MersenneStream(std::uint64_t seed, std::uint64_t stream_index);

            double standard_normal() override;

        private:
            std::mt19937_64 engine_;
            std::normal_distribution<double> normal_;
        };

        /**
         * @class MersenneStreamFactory
         * @brief Default factory producing MersenneStream instances.
         */
        class MersenneStreamFactory : public RandomStreamFactory
        {
        public:
            std::unique_ptr<RandomStream> create(std::uint64_t seed,
                                                 std::uint64_t stream_index) const override;

            std::string get_name() const override { return "mt19937_64"; }
        };

    } // namespace simulation
} // namespace wealth
