/**
 * @file errors.cpp
 * @brief Shared validation helpers.
 */

#include "common/errors.hpp"

#include <cmath>

namespace wealth
{

    void require_finite(const std::string &field, double value)
    {
        if (!std::isfinite(value))
        {
            throw ValidationError(field, "Expected finite value, got: " + std::to_string(value));
        }
    }

    void require_non_negative(const std::string &field, double value)
    {
        require_finite(field, value);
        if (value < 0.0)
        {
            throw ValidationError(field, "Expected non-negative value for parameter '" + field +
                                             "', got: " + std::to_string(value));
        }
    }

} // namespace wealth
