/**
 * @file errors.hpp
 * @brief Exception types raised by the wealth engine.
 *
 * All engine components validate their inputs before computing anything
 * and report problems by throwing one of these types. Both derive from
 * std::invalid_argument so callers that only care about "bad input" can
 * catch the standard type.
 */

#ifndef WEALTH_COMMON_ERRORS_HPP
#define WEALTH_COMMON_ERRORS_HPP

#include <sstream>
#include <stdexcept>
#include <string>

namespace wealth
{

    /**
     * @class ValidationError
     * @brief Malformed or out-of-range input (negative amounts, bad dates,
     *        horizons outside the supported range, ...).
     */
    class ValidationError : public std::invalid_argument
    {
    public:
        ValidationError(const std::string &field, const std::string &message)
            : std::invalid_argument("Validation error [" + field + "]: " + message),
              field_(field),
              message_(message)
        {
        }

        /** @brief Name of the offending input field. */
        const std::string &field() const noexcept { return field_; }

        /** @brief Message without the field prefix. */
        const std::string &message() const noexcept { return message_; }

    private:
        std::string field_;
        std::string message_;
    };

    /**
     * @class ConfigurationError
     * @brief Missing or inconsistent configuration (absent tax thresholds,
     *        mismatched projection horizons, unreadable config files).
     */
    class ConfigurationError : public std::invalid_argument
    {
    public:
        ConfigurationError(const std::string &field, const std::string &message,
                           const std::string &category = "")
            : std::invalid_argument(format(field, message, category)),
              field_(field),
              category_(category)
        {
        }

        const std::string &field() const noexcept { return field_; }

        /** @brief Asset category the error refers to, empty if none. */
        const std::string &category() const noexcept { return category_; }

    private:
        static std::string format(const std::string &field, const std::string &message,
                                  const std::string &category)
        {
            std::ostringstream oss;
            oss << "Configuration error [" << field;
            if (!category.empty())
            {
                oss << ", category '" << category << "'";
            }
            oss << "]: " << message;
            return oss.str();
        }

        std::string field_;
        std::string category_;
    };

    /**
     * @brief Throw ValidationError unless value >= 0 and finite.
     */
    void require_non_negative(const std::string &field, double value);

    /**
     * @brief Throw ValidationError unless value is finite.
     */
    void require_finite(const std::string &field, double value);

} // namespace wealth

#endif // WEALTH_COMMON_ERRORS_HPP
