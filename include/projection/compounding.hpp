/**
 * @file compounding.hpp
 * @brief Shared compounding primitive for projections and simulations.
 *
 * Both the deterministic growth projector and the Monte Carlo simulator
 * grow balances through compound(), so the two never disagree on the
 * arithmetic of a period.
 */

#pragma once

namespace wealth
{
    namespace projection
    {

        /**
         * @enum DepositTiming
         * @brief When a level deposit lands within each period.
         */
        enum class DepositTiming
        {
            START_OF_PERIOD, ///< Annuity due: each deposit earns the full period
            END_OF_PERIOD    ///< Ordinary annuity
        };

        /**
         * @brief Convert an annual growth rate to its equivalent periodic rate.
         *
         * rate = (1 + annual_pct / 100)^(1 / periods_per_year) - 1
         *
         * @param annual_pct Annual growth in percent (must be > -100)
         * @param periods_per_year Compounding periods per year (12 for monthly)
         * @return Periodic rate as a fraction
         * @throws ValidationError if annual_pct <= -100 or periods_per_year < 1
         */
        double periodic_rate_from_annual(double annual_pct, int periods_per_year);

        /**
         * @brief Closing balance after compounding an opening balance with level deposits.
         *
         * balance = B * (1+r)^n + D * ((1+r)^n - 1) / r * (1+r if START_OF_PERIOD)
         *
         * With r == 0 this degrades to B + D * n.
         *
         * @param opening_balance Balance at the start of the first period
         * @param deposit_per_period Deposit made in every period
         * @param periodic_rate Growth per period as a fraction (must be >= -1)
         * @param periods Number of periods (>= 0)
         * @param timing Deposit timing within each period
         * @return Balance at the end of the last period
         * @throws ValidationError if periodic_rate < -1 or periods < 0
         */
        double compound(double opening_balance,
                        double deposit_per_period,
                        double periodic_rate,
                        int periods,
                        DepositTiming timing = DepositTiming::START_OF_PERIOD);

    } // namespace projection
} // namespace wealth
