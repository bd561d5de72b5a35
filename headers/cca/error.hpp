#ifndef CCA_ERROR_HPP
#define CCA_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error type carried by Result<T, Error>.
 *
 * Error categories:
 * - InvalidArgument: the caller broke an entry point contract
 *   (e.g. neither source code nor any profiler text was supplied)
 * - NotFound: requested resource does not exist
 * - ParseError: input could not be parsed (configuration, not profiler tags;
 *   malformed profiler tags are dropped silently)
 * - IoError: file system operation failed
 * - ConfigError: configuration validation failed
 * - AnalysisError: an analyzer rule failed
 * - ProfilerError: the external profiler reported a failure
 * - InFlight: a recompute for the same content hash is already running
 * - InternalError: unexpected internal failure
 *
 * Usage:
 * @code
 *     auto report = engine.generate_complexity_report(input);
 *     if (report.is_err()) {
 *         std::cerr << report.error() << std::endl;
 *         // [ProfilerError] nargo exited with status 1 (context: main.nr)
 *     }
 * @endcode
 */

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace cca {

    enum class ErrorCode {
        None,
        InvalidArgument,
        NotFound,
        ParseError,
        IoError,
        ConfigError,
        AnalysisError,
        ProfilerError,
        InFlight,
        InternalError
    };

    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "None";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::AnalysisError:   return "AnalysisError";
            case ErrorCode::ProfilerError:   return "ProfilerError";
            case ErrorCode::InFlight:        return "InFlight";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Structured error with code, message and optional context.
     *
     * Errors are immutable after construction. The context usually names
     * the file or content hash the failure relates to.
     */
    class Error {
    public:
        Error(ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message))
            , context_(std::nullopt) {}

        Error(ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message) {
            return {ErrorCode::InvalidArgument, std::move(message)};
        }

        static Error invalid_argument(std::string message, std::string context) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message) {
            return {ErrorCode::ParseError, std::move(message)};
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message) {
            return {ErrorCode::ConfigError, std::move(message)};
        }

        static Error analysis_error(std::string message, std::string context) {
            return {ErrorCode::AnalysisError, std::move(message), std::move(context)};
        }

        static Error profiler_error(std::string message) {
            return {ErrorCode::ProfilerError, std::move(message)};
        }

        static Error profiler_error(std::string message, std::string context) {
            return {ErrorCode::ProfilerError, std::move(message), std::move(context)};
        }

        static Error in_flight(std::string message, std::string context) {
            return {ErrorCode::InFlight, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        /**
         * Returns a copy of this error with additional context appended.
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Formats the error as "[Code] message" or "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const {
            return code_ == other.code_ &&
                   message_ == other.message_ &&
                   context_ == other.context_;
        }

        bool operator!=(const Error& other) const {
            return !(*this == other);
        }

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace cca

#endif //CCA_ERROR_HPP
