/**
 * @file errors.hpp
 * @brief Exception types raised by the risk metrics pipeline.
 *
 * Every failure is reported by throwing one of the types below at the point
 * of detection. Each derives from the standard exception that best matches
 * its category, so callers may catch either the specific type or the
 * standard base.
 */

#ifndef RISKMETRICS_COMMON_ERRORS_HPP
#define RISKMETRICS_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace riskmetrics
{

    /**
     * @class NotFoundError
     * @brief A required input file does not exist.
     */
    class NotFoundError : public std::runtime_error
    {
    public:
        explicit NotFoundError(const std::string &message)
            : std::runtime_error(message) {}
    };

    /**
     * @class ParseError
     * @brief An input could not be decoded as structured data.
     */
    class ParseError : public std::runtime_error
    {
    public:
        explicit ParseError(const std::string &message)
            : std::runtime_error(message) {}
    };

    /**
     * @class SchemaError
     * @brief A required key is absent or has the wrong shape.
     */
    class SchemaError : public std::invalid_argument
    {
    public:
        explicit SchemaError(const std::string &message)
            : std::invalid_argument(message) {}
    };

    /**
     * @class ValidationError
     * @brief A value is present but semantically invalid.
     */
    class ValidationError : public std::invalid_argument
    {
    public:
        explicit ValidationError(const std::string &message)
            : std::invalid_argument(message) {}
    };

    /**
     * @class DataUnavailableError
     * @brief Price history does not cover the requested sample period.
     *
     * The offending symbols are listed in the message and kept in
     * symbols() in the order of the configured ticker list.
     */
    class DataUnavailableError : public std::runtime_error
    {
    public:
        DataUnavailableError(const std::string &message,
                             std::vector<std::string> symbols)
            : std::runtime_error(message), symbols_(std::move(symbols)) {}

        const std::vector<std::string> &symbols() const { return symbols_; }

    private:
        std::vector<std::string> symbols_;
    };

    /**
     * @class ComputationError
     * @brief A statistical reduction could not be produced.
     */
    class ComputationError : public std::runtime_error
    {
    public:
        explicit ComputationError(const std::string &message)
            : std::runtime_error(message) {}
    };

} // namespace riskmetrics

#endif // RISKMETRICS_COMMON_ERRORS_HPP
