//
// Created by igor on 12/08/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include <pngchunk/exceptions.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    // Bounded cursor over an in-memory buffer - throws on overrun
    class byte_reader {
        public:
            byte_reader(const void* data, std::size_t size);

            void seek(std::size_t offset);

            [[nodiscard]] std::size_t tell() const { return m_position; }
            [[nodiscard]] std::size_t size() const { return m_size; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] const std::byte* current() const { return m_data + m_position; }

            // Reader over the next @p size bytes; advances this reader past them
            [[nodiscard]] byte_reader subreader(std::size_t size);

            // Convenience methods
            std::vector<std::byte> read_exact(std::size_t size) {
                THROW_PARSE_IF(size > remaining(), truncated,
                               "Unexpected end of buffer at offset ", m_position,
                               ": requested ", size, " bytes, ", remaining(), " available");
                std::vector<std::byte> buffer(current(), current() + size);
                m_position += size;
                return buffer;
            }

            template<typename T>
            T read(byte_order bo) {
                THROW_PARSE_IF(sizeof(T) > remaining(), truncated,
                               "Failed to read ", sizeof(T), " bytes at offset ", m_position);
                T value = load<T>(current(), bo);
                m_position += sizeof(T);
                return value;
            }

            chunk_type read_chunk_type();

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position = 0;
    };
}
