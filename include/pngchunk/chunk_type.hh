//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/exceptions.hh>

namespace pngchunk {
    class chunk_type;
    constexpr chunk_type operator""_ct(const char* str, std::size_t len);

    /**
     * @class chunk_type
     * @brief Four ASCII letters naming a PNG chunk
     *
     * Bit 5 (0x20) of each letter carries a property flag: ancillary,
     * private, reserved, safe-to-copy. Instances are only created through
     * the validating factories, so every chunk_type holds letters only.
     */
    class PNGCHUNK_EXPORT chunk_type {
    public:
        using bytes_type = std::array<char, 4>;

        static constexpr char property_bit = 0x20;

        // Constructor from text; same rules as from_string
        explicit chunk_type(std::string_view text);

        /**
         * @brief Construct from 4 raw bytes
         * @throws parse_error (invalid_type_bytes) if a byte is not an ASCII letter
         */
        static chunk_type from_bytes(const bytes_type& bytes);

        /**
         * @brief Construct from 4 raw bytes at @p data
         * @throws parse_error (truncated) if @p data is null
         * @throws parse_error (invalid_type_bytes) if a byte is not an ASCII letter
         */
        static chunk_type from_bytes(const void* data);

        /**
         * @brief Construct from text
         * @throws parse_error (invalid_length) unless @p text has exactly 4 characters
         * @throws parse_error (invalid_character) if a character is not an ASCII letter
         */
        static chunk_type from_string(std::string_view text);

        // Non-throwing variant of from_string
        [[nodiscard]] static std::optional<chunk_type> try_parse(std::string_view text) noexcept;

        [[nodiscard]] static constexpr bool is_valid_byte(char b) noexcept {
            return (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z');
        }

        [[nodiscard]] bytes_type bytes() const { return m_bytes; }

        // Write to bytes
        void to_bytes(void* dest) const;

        // Value of the four bytes read as a big-endian integer
        [[nodiscard]] constexpr std::uint32_t to_uint32() const noexcept {
            return (byte_at(0) << 24) | (byte_at(1) << 16) | (byte_at(2) << 8) | byte_at(3);
        }

        // Convert to string
        [[nodiscard]] std::string to_string() const {
            return {m_bytes.data(), m_bytes.size()};
        }

        [[nodiscard]] constexpr bool is_critical() const noexcept {
            return (m_bytes[0] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_public() const noexcept {
            return (m_bytes[1] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_reserved_bit_valid() const noexcept {
            return (m_bytes[2] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_safe_to_copy() const noexcept {
            return (m_bytes[3] & property_bit) != 0;
        }

        // Only the reserved bit decides validity; the other flags are free
        [[nodiscard]] constexpr bool is_valid() const noexcept {
            return is_reserved_bit_valid();
        }

        // Comparison operators
        constexpr bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        constexpr bool operator!=(const chunk_type& o) const { return !(*this == o); }
        constexpr bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }
        constexpr bool operator<=(const chunk_type& o) const { return m_bytes <= o.m_bytes; }
        constexpr bool operator>(const chunk_type& o) const { return m_bytes > o.m_bytes; }
        constexpr bool operator>=(const chunk_type& o) const { return m_bytes >= o.m_bytes; }

        // Stream output
        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            // Check if hex format is set
            if (os.flags() & std::ios::hex) {
                // Save and restore format flags
                auto flags = os.flags();
                auto fill = os.fill();
                os << "0x" << std::hex << std::setfill('0') << std::setw(8)
                   << t.to_uint32();
                os.flags(flags);
                os.fill(fill);
            } else {
                os.write(t.m_bytes.data(), static_cast<std::streamsize>(t.m_bytes.size()));
            }
            return os;
        }

    private:
        // Unchecked; callers have validated the bytes
        constexpr explicit chunk_type(const bytes_type& bytes) noexcept
            : m_bytes(bytes) {}

        [[nodiscard]] constexpr std::uint32_t byte_at(std::size_t i) const noexcept {
            return static_cast<unsigned char>(m_bytes[i]);
        }

        friend constexpr chunk_type operator""_ct(const char* str, std::size_t len);

        bytes_type m_bytes;
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            // Better hash mixing using FNV-1a constants
            return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time chunk_type creation
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            THROW_PARSE(invalid_length, "Chunk type literal must be exactly 4 characters, got ", len);
        }
        chunk_type::bytes_type bytes{};
        for (std::size_t i = 0; i < 4; i++) {
            if (!chunk_type::is_valid_byte(str[i])) {
                THROW_PARSE(invalid_character, "Chunk type literal has a non-letter at position ", i);
            }
            bytes[i] = str[i];
        }
        return chunk_type(bytes);
    }

    // Standard chunk types
    namespace chunk_types {
        inline constexpr chunk_type IHDR = "IHDR"_ct;
        inline constexpr chunk_type PLTE = "PLTE"_ct;
        inline constexpr chunk_type IDAT = "IDAT"_ct;
        inline constexpr chunk_type IEND = "IEND"_ct;
    }

}
// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
