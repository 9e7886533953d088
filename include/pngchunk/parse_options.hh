/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for chunks and PNG buffers
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing chunks
     *
     * Controls strictness, size limits, and warning handling.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a declared chunk length that disagrees with the buffer,
         * or exceeds max_chunk_size, is an error.
         * When false, the payload span is taken from the buffer size and a
         * warning is reported instead. Checksums are verified in both modes.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk payload size in bytes
         *
         * Default is the PNG limit of 2^31 - 1.
         */
        std::uint32_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset where warning occurred
         * @param category Warning category ("length_mismatch", "size_limit")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
