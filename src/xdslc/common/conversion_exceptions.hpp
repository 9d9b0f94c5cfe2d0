/**
 * @file conversion_exceptions.hpp
 */
#pragma once
#include "xdslc/common/common.hpp"
#include "xdslc/common/validation_report.hpp"

namespace xdslc
{

/**
 * @brief Error codes for fatal conversion failures.
 *
 * @details
 * Validation problems are not listed here; they are accumulated into a
 * `ValidationReport` and surfaced through `ValidationError`.
 */
enum class ConversionErrorCode
{
    MalformedDocument,
    InvalidState,
    InvariantViolation
};

/**
 * @brief Exception class for fatal conversion errors.
 *
 * @details
 * `ConversionError` is thrown when the input text is not well-formed markup
 * (`MalformedDocument`), when an operation is called on an object that cannot
 * honor it (`InvalidState`), or when a later stage detects that an upstream
 * guarantee was broken (`InvariantViolation`). The last one always indicates a
 * programming error.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class ConversionError : public std::exception
{
public:
    /**
     * @brief Construct a ConversionError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    ConversionError(ConversionErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    ConversionErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    ConversionErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Exception thrown when a graph fails validation before emission.
 *
 * @details
 * Carries the complete report so that callers can present every problem at
 * once. The message lists every error item.
 */
class ValidationError : public std::runtime_error
{
public:
    explicit ValidationError(const std::string& msg,
                             std::shared_ptr<ValidationReport> report)
        : std::runtime_error(msg)
        , m_report(std::move(report))
    {}

    /**
     * @brief Get the report that caused the validation failure.
     */
    const std::shared_ptr<ValidationReport>& report() const noexcept
    {
        return m_report;
    }

private:
    std::shared_ptr<ValidationReport> m_report;
};

} // namespace xdslc
