//
// Created by igor on 12/08/2025.
//

#include "input.hh"

namespace pngchunk {

    byte_reader::byte_reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data)),
          m_size(size) {
        THROW_PARSE_IF(!m_data && m_size > 0, truncated, "Null buffer with size ", m_size);
    }

    void byte_reader::seek(std::size_t offset) {
        THROW_PARSE_IF(offset > m_size, truncated,
                       "Seek to offset ", offset, " past end of ", m_size, "-byte buffer");
        m_position = offset;
    }

    byte_reader byte_reader::subreader(std::size_t size) {
        THROW_PARSE_IF(size > remaining(), truncated,
                       "Region of ", size, " bytes at offset ", m_position,
                       " runs past end of buffer (", remaining(), " bytes left)");
        byte_reader sub(current(), size);
        m_position += size;
        return sub;
    }

    chunk_type byte_reader::read_chunk_type() {
        THROW_PARSE_IF(remaining() < 4, truncated, "Failed to read chunk type at offset ", m_position);
        auto type = chunk_type::from_bytes(current());
        m_position += 4;
        return type;
    }
}
