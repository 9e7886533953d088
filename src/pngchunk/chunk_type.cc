//
// Created by igor on 10/08/2025.
//

#include <pngchunk/chunk_type.hh>
#include <cstring>

namespace pngchunk {

    chunk_type::chunk_type(std::string_view text)
        : chunk_type(from_string(text)) {
    }

    chunk_type chunk_type::from_bytes(const bytes_type& bytes) {
        for (std::size_t i = 0; i < bytes.size(); i++) {
            THROW_PARSE_UNLESS(is_valid_byte(bytes[i]), invalid_type_bytes,
                               "Chunk type byte ", i, " (0x", std::hex, std::setw(2), std::setfill('0'),
                               static_cast<unsigned>(static_cast<unsigned char>(bytes[i])), ") is not an ASCII letter");
        }
        return chunk_type(bytes);
    }

    chunk_type chunk_type::from_bytes(const void* data) {
        THROW_PARSE_IF(!data, truncated, "Null chunk type buffer");
        bytes_type bytes;
        std::memcpy(bytes.data(), data, bytes.size());
        return from_bytes(bytes);
    }

    chunk_type chunk_type::from_string(std::string_view text) {
        THROW_PARSE_IF(text.size() != 4, invalid_length,
                       "Chunk type must be exactly 4 characters, got ", text.size(), " in '", text, "'");

        bytes_type bytes;
        for (std::size_t i = 0; i < 4; i++) {
            THROW_PARSE_UNLESS(is_valid_byte(text[i]), invalid_character,
                               "Chunk type '", text, "' has a non-letter character at position ", i);
            bytes[i] = text[i];
        }
        return chunk_type(bytes);
    }

    std::optional<chunk_type> chunk_type::try_parse(std::string_view text) noexcept {
        if (text.size() != 4) {
            return std::nullopt;
        }
        bytes_type bytes;
        for (std::size_t i = 0; i < 4; i++) {
            if (!is_valid_byte(text[i])) {
                return std::nullopt;
            }
            bytes[i] = text[i];
        }
        return chunk_type(bytes);
    }

    void chunk_type::to_bytes(void* dest) const {
        std::memcpy(dest, m_bytes.data(), m_bytes.size());
    }

} // namespace pngchunk
