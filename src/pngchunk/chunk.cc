//
// Created by igor on 15/08/2025.
//

#include <pngchunk/chunk.hh>
#include <pngchunk/byte_order.hh>

#include <cstring>
#include <ostream>
#include <sstream>

#include "crc.hh"
#include "input.hh"
#include "utf8.hh"

namespace pngchunk {

    namespace {
        std::uint32_t checked_length(std::size_t size) {
            THROW_PARSE_IF(size > chunk::max_length, invalid_length,
                           "Chunk payload of ", size, " bytes exceeds the PNG limit of ",
                           chunk::max_length, " bytes");
            return static_cast<std::uint32_t>(size);
        }

        std::vector<std::byte> text_to_bytes(std::string_view text) {
            std::vector<std::byte> bytes(text.size());
            if (!text.empty()) {
                std::memcpy(bytes.data(), text.data(), text.size());
            }
            return bytes;
        }

        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_length(checked_length(data.size())),
          m_type(type),
          m_data(std::move(data)),
          m_crc(chunk_crc(m_type, m_data.data(), m_data.size())) {
    }

    chunk::chunk(chunk_type type, std::string_view text)
        : chunk(type, text_to_bytes(text)) {
    }

    chunk chunk::from_bytes(const void* data, std::size_t size, const parse_options& options) {
        THROW_PARSE_IF(size < min_size, truncated,
                       "Chunk buffer holds ", size, " bytes, at least ", min_size, " required");

        byte_reader in(data, size);
        auto declared = in.read<std::uint32_t>(byte_order::big);
        auto type = in.read_chunk_type();
        std::size_t payload_size = size - min_size;

        if (declared > options.max_chunk_size) {
            if (options.strict) {
                THROW_PARSE(invalid_length, "Chunk '", type, "' declares ", declared,
                            " payload bytes, which exceeds maximum allowed size of ",
                            options.max_chunk_size, " bytes");
            }
            warn(options, 0, "size_limit",
                 build_error_msg("Chunk '", type, "' declared size ", declared,
                                 " exceeds maximum ", options.max_chunk_size));
        }

        if (declared != payload_size) {
            if (options.strict) {
                THROW_PARSE(invalid_length, "Chunk '", type, "' declares ", declared,
                            " payload bytes but the buffer holds ", payload_size);
            }
            warn(options, 0, "length_mismatch",
                 build_error_msg("Chunk '", type, "' declares ", declared,
                                 " payload bytes, using the ", payload_size, " present"));
        }

        auto payload = in.read_exact(payload_size);
        auto stored_crc = in.read<std::uint32_t>(byte_order::big);

        chunk result(type, std::move(payload));
        THROW_PARSE_IF(result.crc() != stored_crc, checksum_mismatch,
                       "Chunk '", type, "' CRC mismatch: stored ", stored_crc,
                       ", computed ", result.crc());
        return result;
    }

    chunk chunk::from_bytes(const void* data, std::size_t size) {
        return from_bytes(data, size, parse_options{});
    }

    chunk chunk::from_bytes(const std::vector<std::byte>& bytes, const parse_options& options) {
        return from_bytes(bytes.data(), bytes.size(), options);
    }

    chunk chunk::from_bytes(const std::vector<std::byte>& bytes) {
        return from_bytes(bytes.data(), bytes.size(), parse_options{});
    }

    std::string chunk::data_as_string() const {
        auto bad = find_invalid_utf8(m_data.data(), m_data.size());
        THROW_PARSE_IF(bad.has_value(), not_utf8,
                       "Chunk '", m_type, "' payload is not valid UTF-8 at offset ", bad.value_or(0));
        std::string text(m_data.size(), '\0');
        if (!m_data.empty()) {
            std::memcpy(text.data(), m_data.data(), m_data.size());
        }
        return text;
    }

    std::vector<std::byte> chunk::to_bytes() const {
        std::vector<std::byte> out;
        write_to(out);
        return out;
    }

    void chunk::write_to(std::vector<std::byte>& out) const {
        auto start = out.size();
        out.resize(start + serialized_size());
        std::byte* p = out.data() + start;

        store<std::uint32_t>(p, m_length, byte_order::big);
        p += length_size;
        m_type.to_bytes(p);
        p += type_size;
        if (!m_data.empty()) {
            std::memcpy(p, m_data.data(), m_data.size());
            p += m_data.size();
        }
        store<std::uint32_t>(p, m_crc, byte_order::big);
    }

    std::string chunk::to_string() const {
        std::ostringstream oss;
        oss << *this;
        return oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        return os << "Length: " << c.length() << " Type: " << c.type() << " Crc: " << c.crc();
    }

} // namespace pngchunk
