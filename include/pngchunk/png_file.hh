/**
 * @file png_file.hh
 * @brief PNG container: signature followed by a sequence of chunks
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @class png_file
     * @brief In-memory PNG file as an ordered list of chunks
     *
     * Chunk boundaries inside a file are located through each chunk's
     * declared length; every chunk is then verified with chunk::from_bytes.
     * Image data is never decoded.
     */
    class PNGCHUNK_EXPORT png_file {
    public:
        using signature_type = std::array<std::uint8_t, 8>;

        static constexpr signature_type signature = {
            0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
        };

        png_file() = default;
        explicit png_file(std::vector<chunk> chunks);

        /**
         * @brief Parse a whole PNG buffer
         * @throws parse_error bad_signature, truncated, or any chunk::from_bytes error
         */
        static png_file from_bytes(const void* data, std::size_t size, const parse_options& options);
        static png_file from_bytes(const std::vector<std::byte>& bytes, const parse_options& options);
        static png_file from_bytes(const std::vector<std::byte>& bytes);

        /**
         * @brief Read a stream to its end and parse it
         * @throws io_error if the stream cannot be read
         */
        static png_file from_stream(std::istream& is, const parse_options& options);
        static png_file from_stream(std::istream& is);

        [[nodiscard]] static bool has_signature(const void* data, std::size_t size);

        [[nodiscard]] const signature_type& header() const noexcept { return signature; }
        [[nodiscard]] const std::vector<chunk>& chunks() const noexcept { return m_chunks; }

        void append(chunk c);

        /**
         * @brief Remove the first chunk of the given type
         * @return The removed chunk
         * @throws parse_error (chunk_not_found) if no chunk has that type
         */
        chunk remove_first(const chunk_type& type);

        /// First chunk of the given type, or nullptr
        [[nodiscard]] const chunk* find(const chunk_type& type) const;

        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        /**
         * @brief Serialize to a stream
         * @throws io_error if writing fails
         */
        void write_to(std::ostream& os) const;

        /// One chunk summary per line
        [[nodiscard]] std::string to_string() const;

    private:
        std::vector<chunk> m_chunks;
    };

} // namespace pngchunk
