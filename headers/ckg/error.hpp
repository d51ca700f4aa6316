#ifndef CKG_ERROR_HPP
#define CKG_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error types and error handling utilities.
 *
 * Provides a structured error type that carries an error code, a message
 * and optional context. Designed to work with Result<T, Error> so that
 * failure paths stay visible in the type system.
 *
 * Error categories:
 * - InvalidArgument: Invalid function arguments or parameters
 * - NotFound: Requested path or entity does not exist
 * - ParseError: Failed to parse input (configuration, JSON)
 * - IoError: File unreadable or directory unlistable
 * - ConfigError: Configuration validation failed
 * - ExtractionError: A lexical pattern matched ambiguously, or a file cannot be scanned lexically
 * - DimensionMismatch: Vectors of unequal length were compared
 * - QueryError: Malformed query text or filter
 * - Cancelled: A build was cancelled through its token
 * - InternalError: Unexpected internal error
 *
 * Usage:
 * @code
 *     Result<std::string, Error> content = file_utils::read_file(path);
 *     if (content.is_err()) {
 *         logging::get()->warn("{}", content.error().to_string());
 *         // [IoError] Failed to open file (context: src/app.ts)
 *     }
 * @endcode
 */

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace ckg {

    /**
     * Error category enumeration.
     */
    enum class ErrorCode {
        None,              ///< No error
        InvalidArgument,   ///< Invalid argument or parameter
        NotFound,          ///< Resource not found
        ParseError,        ///< Parsing failed
        IoError,           ///< I/O operation failed
        ConfigError,       ///< Configuration error
        ExtractionError,   ///< Ambiguous lexical match or unscannable file
        DimensionMismatch, ///< Vector length mismatch
        QueryError,        ///< Malformed query
        Cancelled,         ///< Operation cancelled
        InternalError      ///< Internal/unexpected error
    };

    /**
     * Converts an ErrorCode to its string representation.
     */
    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:              return "None";
            case ErrorCode::InvalidArgument:   return "InvalidArgument";
            case ErrorCode::NotFound:          return "NotFound";
            case ErrorCode::ParseError:        return "ParseError";
            case ErrorCode::IoError:           return "IoError";
            case ErrorCode::ConfigError:       return "ConfigError";
            case ErrorCode::ExtractionError:   return "ExtractionError";
            case ErrorCode::DimensionMismatch: return "DimensionMismatch";
            case ErrorCode::QueryError:        return "QueryError";
            case ErrorCode::Cancelled:         return "Cancelled";
            case ErrorCode::InternalError:     return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Structured error type with code, message, and optional context.
     *
     * Error objects are immutable after construction. The context usually
     * names the file path, node id or query text the error relates to.
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

        // Factory methods for common error types

        static Error invalid_argument(std::string message) {
            return {ErrorCode::InvalidArgument, std::move(message)};
        }

        static Error invalid_argument(std::string message, std::string context) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message) {
            return {ErrorCode::NotFound, std::move(message)};
        }

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message) {
            return {ErrorCode::ParseError, std::move(message)};
        }

        static Error parse_error(std::string message, std::string context) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message) {
            return {ErrorCode::IoError, std::move(message)};
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message) {
            return {ErrorCode::ConfigError, std::move(message)};
        }

        static Error config_error(std::string message, std::string context) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        /**
         * Creates an extraction error for a pattern that did not match cleanly.
         */
        static Error extraction_error(std::string message, std::string context) {
            return {ErrorCode::ExtractionError, std::move(message), std::move(context)};
        }

        static Error dimension_mismatch(std::string message) {
            return {ErrorCode::DimensionMismatch, std::move(message)};
        }

        static Error query_error(std::string message) {
            return {ErrorCode::QueryError, std::move(message)};
        }

        static Error query_error(std::string message, std::string context) {
            return {ErrorCode::QueryError, std::move(message), std::move(context)};
        }

        static Error cancelled(std::string message) {
            return {ErrorCode::Cancelled, std::move(message)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        static Error internal_error(std::string message, std::string context) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
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
         * Creates a new error with additional context appended.
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Formats the error as "[ErrorCode] message (context: ...)".
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

}  // namespace ckg

#endif //CKG_ERROR_HPP
