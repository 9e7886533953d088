/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <sstream>

namespace pngchunk {

    /**
     * @enum error_kind
     * @brief Classifies why a parse or validation step failed
     */
    enum class error_kind {
        invalid_character,   ///< Type tag text contains a non-letter
        invalid_type_bytes,  ///< Raw type tag bytes contain a non-letter
        invalid_length,      ///< Type tag text is not 4 characters, or a chunk length is wrong or out of range
        truncated,           ///< Buffer shorter than the frame it must hold
        checksum_mismatch,   ///< Stored CRC differs from the computed one
        not_utf8,            ///< Payload requested as text is not valid UTF-8
        bad_signature,       ///< PNG signature missing or wrong
        chunk_not_found      ///< No chunk of the requested type
    };

    /**
     * @brief Get a stable name for an error kind
     * @param kind Error kind
     * @return Lower-case identifier, e.g. "checksum_mismatch"
     */
    constexpr std::string_view to_string(error_kind kind) noexcept {
        switch (kind) {
            case error_kind::invalid_character: return "invalid_character";
            case error_kind::invalid_type_bytes: return "invalid_type_bytes";
            case error_kind::invalid_length: return "invalid_length";
            case error_kind::truncated: return "truncated";
            case error_kind::checksum_mismatch: return "checksum_mismatch";
            case error_kind::not_utf8: return "not_utf8";
            case error_kind::bad_signature: return "bad_signature";
            case error_kind::chunk_not_found: return "chunk_not_found";
        }
        // make compiler happy
        return "unknown";
    }

    /**
     * @class pngchunk_error
     * @brief Base exception class for all library errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every library error with a single catch block.
     */
    class pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when reading or writing a stream fails.
     */
    class io_error : public pngchunk_error {
    public:
        explicit io_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for malformed input
     *
     * Thrown when a type tag, chunk or PNG container violates the format.
     * The kind() tells callers which check failed.
     */
    class parse_error : public pngchunk_error {
    public:
        parse_error(error_kind kind, const std::string& msg)
            : pngchunk_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     *
     * Uses C++17 fold expressions to concatenate all arguments into
     * a single error message string.
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     * @param ... Variable arguments to format into error message
     */
    #define THROW_IO(...) \
        throw ::pngchunk::io_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error of the given kind with formatted message
     * @param kind error_kind enumerator name (without qualification)
     * @param ... Variable arguments to format into error message
     */
    #define THROW_PARSE(kind, ...) \
        throw ::pngchunk::parse_error(::pngchunk::error_kind::kind, ::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     * @param condition Condition to check
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     * @param condition Condition to check
     * @param kind error_kind enumerator name
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_PARSE_IF(condition, kind, ...) \
        do { if (condition) THROW_PARSE(kind, __VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     * @param condition Condition that must be true to avoid throwing
     * @param ... Variable arguments for error message if condition is false
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_UNLESS
     * @brief Throw a parse_error unless condition is true
     * @param condition Condition that must be true to avoid throwing
     * @param kind error_kind enumerator name
     * @param ... Variable arguments for error message if condition is false
     */
    #define THROW_PARSE_UNLESS(condition, kind, ...) \
        do { if (!(condition)) THROW_PARSE(kind, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
