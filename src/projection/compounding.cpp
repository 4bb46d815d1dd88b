/**
 * @file compounding.cpp
 * @brief Implementation of the compounding primitive.
 */

#include "projection/compounding.hpp"

#include "common/errors.hpp"

#include <cmath>
#include <string>

namespace wealth
{
    namespace projection
    {

        namespace
        {
            constexpr double ZERO_RATE_TOLERANCE = 1e-15;
        }

        double periodic_rate_from_annual(double annual_pct, int periods_per_year)
        {
            require_finite("annual_growth_rate_pct", annual_pct);
            if (annual_pct <= -100.0)
            {
                throw ValidationError("annual_growth_rate_pct",
                                      "Expected growth rate above -100%, got: " + std::to_string(annual_pct));
            }
            if (periods_per_year < 1)
            {
                throw ValidationError("periods_per_year",
                                      "Expected at least one period per year, got: " + std::to_string(periods_per_year));
            }

            if (annual_pct == 0.0)
            {
                return 0.0;
            }
            return std::pow(1.0 + annual_pct / 100.0, 1.0 / periods_per_year) - 1.0;
        }

        double compound(double opening_balance,
                        double deposit_per_period,
                        double periodic_rate,
                        int periods,
                        DepositTiming timing)
        {
            if (periods < 0)
            {
                throw ValidationError("periods", "Expected non-negative period count, got: " + std::to_string(periods));
            }
            if (!(periodic_rate >= -1.0))
            {
                throw ValidationError("periodic_rate",
                                      "Expected periodic rate >= -1, got: " + std::to_string(periodic_rate));
            }

            if (std::abs(periodic_rate) < ZERO_RATE_TOLERANCE)
            {
                return opening_balance + deposit_per_period * periods;
            }

            const double growth = std::pow(1.0 + periodic_rate, periods);
            double deposits = 0.0;
            if (deposit_per_period != 0.0)
            {
                deposits = deposit_per_period * (growth - 1.0) / periodic_rate;
                if (timing == DepositTiming::START_OF_PERIOD)
                {
                    deposits *= (1.0 + periodic_rate);
                }
            }

            return opening_balance * growth + deposits;
        }

    } // namespace projection
} // namespace wealth
