/**
 * @file random_stream.cpp
 * @brief Implementation of the Mersenne Twister random streams.
 */

#include "simulation/random_stream.hpp"

namespace wealth
{
    namespace simulation
    {

        MersenneStream::MersenneStream(std::uint64_t seed, std::uint64_t stream_index)
            : normal_(0.0, 1.0)
        {
            std::seed_seq sequence{
                static_cast<std::uint32_t>(seed & 0xffffffffu),
                static_cast<std::uint32_t>(seed >> 32),
                static_cast<std::uint32_t>(stream_index & 0xffffffffu),
                static_cast<std::uint32_t>(stream_index >> 32)};
            engine_.seed(sequence);
        }

        double MersenneStream::standard_normal()
        {
            return normal_(engine_);
        }

        std::unique_ptr<RandomStream> MersenneStreamFactory::create(std::uint64_t seed,
                                                                    std::uint64_t stream_index) const
        {
            return std::make_unique<MersenneStream>(seed, stream_index);
        }

    } // namespace simulation
} // namespace wealth
