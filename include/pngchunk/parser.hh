/**
 * @file parser.hh
 * @brief PNG buffer walking utilities
 * @author Igor
 * @date 12/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include <pngchunk/png_file.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @brief Call a function for each chunk of a PNG buffer with custom options
     *
     * The whole buffer is validated before the first call, so @p func
     * never sees chunks from a file that fails to parse.
     *
     * @tparam Func Callable accepting (const chunk&, std::uint64_t offset)
     * @param data Pointer to the PNG buffer
     * @param size Size of the buffer in bytes
     * @param func Function to call for each chunk; offset is where the chunk starts
     * @param options Parse options for controlling parsing behavior
     */
    template<typename Func>
    void for_each_chunk(const void* data, std::size_t size, Func func, const parse_options& options) {
        auto png = png_file::from_bytes(data, size, options);

        std::uint64_t offset = png_file::signature.size();
        for (const auto& c : png.chunks()) {
            func(c, offset);
            offset += c.serialized_size();
        }
    }

    /**
     * @brief Call a function for each chunk of a PNG buffer
     *
     * Uses default parse options.
     */
    template<typename Func>
    void for_each_chunk(const std::vector<std::byte>& bytes, Func func) {
        for_each_chunk(bytes.data(), bytes.size(), func, parse_options{});
    }

    template<typename Func>
    void for_each_chunk(const std::vector<std::byte>& bytes, Func func, const parse_options& options) {
        for_each_chunk(bytes.data(), bytes.size(), func, options);
    }

} // namespace pngchunk
