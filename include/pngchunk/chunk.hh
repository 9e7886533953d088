/**
 * @file chunk.hh
 * @brief A single PNG chunk: type, payload and CRC
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @class chunk
     * @brief PNG chunk with a CRC that always matches its type and payload
     *
     * Wire layout:
     * @code
     *   offset 0       4 bytes  payload length, big-endian
     *   offset 4       4 bytes  chunk type
     *   offset 8       length   payload
     *   offset 8+len   4 bytes  CRC-32 of type and payload, big-endian
     * @endcode
     *
     * The length and CRC are derived from the type and payload at
     * construction and cannot be set independently.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        static constexpr std::size_t length_size = 4;
        static constexpr std::size_t type_size = 4;
        static constexpr std::size_t crc_size = 4;

        /// Smallest possible serialized chunk (empty payload)
        static constexpr std::size_t min_size = length_size + type_size + crc_size;

        /// PNG limits every length field to 2^31 - 1
        static constexpr std::uint32_t max_length = 0x7FFFFFFFu;

        /**
         * @brief Construct from a type and payload, computing length and CRC
         *
         * Any payload that fits a PNG length field is accepted. Larger
         * payloads could not be serialized, so they are rejected here
         * rather than at to_bytes().
         *
         * @throws parse_error (invalid_length) if the payload exceeds max_length
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Construct from a type and a text payload
         * @throws parse_error (invalid_length) if the payload exceeds max_length
         */
        chunk(chunk_type type, std::string_view text);

        /**
         * @brief Parse one serialized chunk occupying the whole buffer
         *
         * In strict mode the declared length must equal @p size - 12,
         * otherwise invalid_length is thrown.
         * In lenient mode the payload span is @p size - 12 and a
         * "length_mismatch" warning is reported when the declared length
         * differs. The stored CRC is verified in both modes.
         *
         * @param data Pointer to the serialized chunk
         * @param size Number of bytes at @p data
         * @param options Parse options
         * @throws parse_error truncated, invalid_type_bytes, invalid_length
         *         (declared length wrong or too large) or checksum_mismatch
         */
        static chunk from_bytes(const void* data, std::size_t size, const parse_options& options);

        /**
         * @brief Parse one serialized chunk with default (strict) options
         */
        static chunk from_bytes(const void* data, std::size_t size);

        static chunk from_bytes(const std::vector<std::byte>& bytes, const parse_options& options);
        static chunk from_bytes(const std::vector<std::byte>& bytes);

        [[nodiscard]] std::uint32_t length() const noexcept { return m_length; }
        [[nodiscard]] const chunk_type& type() const noexcept { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const noexcept { return m_data; }
        [[nodiscard]] std::uint32_t crc() const noexcept { return m_crc; }

        /**
         * @brief Payload decoded as UTF-8 text
         * @throws parse_error (not_utf8) with the offset of the first bad sequence
         */
        [[nodiscard]] std::string data_as_string() const;

        /// Number of bytes to_bytes() produces
        [[nodiscard]] std::size_t serialized_size() const noexcept {
            return min_size + m_data.size();
        }

        /// Serialize to the wire layout
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        /// Append the wire layout to @p out
        void write_to(std::vector<std::byte>& out) const;

        /// "Length: <n> Type: <type> Crc: <crc>"
        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk& o) const {
            return m_length == o.m_length && m_type == o.m_type &&
                   m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
