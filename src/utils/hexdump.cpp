/**
 * @file hexdump.cpp
 * @brief Line-by-line hexdump rendering.
 *
 * Every chunk of 16 bytes becomes one fixed-width line: hex bytes in groups of 4,
 * sanitized ASCII and the chunk offset. A trailing summary line carries the total
 * length, aligned under the offset column. Lines are produced lazily from either end.
 */

#include "hexdump.hpp"

#include <algorithm>
#include <iterator>
#include <fmt/format.h>

/**
 * @brief Maps a byte to a printable character.
 *
 * Printable ASCII (space through '~') is returned as is, everything else becomes '.'.
 *
 * @param byte Byte to sanitize.
 * @return Printable character.
 */
char sanitize_byte(uint8_t byte) {
    if( byte >= 0x20 && byte < 0x7f ){
        return (char)byte;
    }
    return '.';
}

/**
 * @brief Renders one chunk of input as a hexdump line.
 *
 * Short chunks are padded with spaces so that the ASCII and offset columns stay
 * aligned with full lines.
 *
 * @param chunk_index Zero-based chunk number, the offset is chunk_index * 16.
 * @param chunk Pointer to the chunk bytes.
 * @param chunk_len Number of bytes in the chunk, 0..16.
 * @return Rendered line.
 */
Line hexdump_chunk(size_t chunk_index, const uint8_t* chunk, size_t chunk_len) {
    Line line;
    auto out = std::back_inserter(line);

    line.push_back('|');

    size_t num_segments = 0;
    size_t num_bytes = 0;
    for( size_t i = 0; i < chunk_len; i += HEXDUMP_SEGMENT_SIZE ){
        if( num_segments > 0 ){
            line.push_back(' ');
        }

        num_bytes = 0;
        for( size_t j = i; j < chunk_len && j < i + HEXDUMP_SEGMENT_SIZE; j++ ){
            fmt::format_to(out, "{:02x}", chunk[j]);
            num_bytes++;
        }
        num_segments++;
    }

    line.append("| ");

    // rest of the last segment
    if( num_segments > 0 ){
        line.append((HEXDUMP_SEGMENT_SIZE - num_bytes) * 2, ' ');
    }

    // whole missing segments, each with its separator
    for( size_t i = num_segments; i < HEXDUMP_SEGMENTS_PER_CHUNK; i++ ){
        line.append(HEXDUMP_SEGMENT_SIZE * 2 + (i > 0 ? 1 : 0), ' ');
    }

    for( size_t i = 0; i < chunk_len; i++ ){
        line.push_back(sanitize_byte(chunk[i]));
    }
    line.append(HEXDUMP_CHUNK_SIZE - chunk_len, ' ');

    fmt::format_to(out, " {:08x}", chunk_index * HEXDUMP_CHUNK_SIZE);
    return line;
}

/**
 * @brief Renders the trailing summary line.
 *
 * No payload, only the total length in the offset column.
 *
 * @param buflen Total input length.
 * @return Rendered line.
 */
Line hexdump_summary(size_t buflen) {
    Line line;
    line.append(4, ' ');
    line.append(HEXDUMP_CHUNK_SIZE * 3, ' ');
    line.append(HEXDUMP_SEGMENTS_PER_CHUNK - 1, ' ');
    fmt::format_to(std::back_inserter(line), "{:08x}", buflen);
    return line;
}

/**
 * @brief Creates a lazy line sequence over a buffer.
 *
 * Nothing is rendered here, lines are produced by next() and next_back().
 *
 * @param ptr Pointer to the data, must outlive the sequence.
 * @param buflen Length of the data.
 */
Hexdump::Hexdump(const void *ptr, size_t buflen)
    : m_ptr(static_cast<const uint8_t*>(ptr)),
      m_size(buflen),
      m_back((buflen + HEXDUMP_CHUNK_SIZE - 1) / HEXDUMP_CHUNK_SIZE)
{
}

/**
 * @brief Renders the line for one chunk of the buffer.
 * @param chunk_index Chunk number, must be below the chunk count.
 * @return Rendered line, the last chunk may be short.
 */
Line Hexdump::chunk_line(size_t chunk_index) const {
    size_t start = chunk_index * HEXDUMP_CHUNK_SIZE;
    size_t len = std::min(HEXDUMP_CHUNK_SIZE, m_size - start);
    return hexdump_chunk(chunk_index, m_ptr + start, len);
}

/**
 * @brief Takes the next line from the front.
 *
 * Chunk lines come first, the summary is produced once all chunks are taken
 * (unless it was already taken from the back).
 *
 * @return The line, or std::nullopt when the sequence is exhausted.
 */
std::optional<Line> Hexdump::next() {
    if( m_front < m_back ){
        return chunk_line(m_front++);
    }
    if( !m_summary_done ){
        m_summary_done = true;
        return hexdump_summary(m_size);
    }
    return std::nullopt;
}

/**
 * @brief Takes the next line from the back.
 *
 * The summary comes first, then chunk lines from the last one down.
 *
 * @return The line, or std::nullopt when the sequence is exhausted.
 */
std::optional<Line> Hexdump::next_back() {
    if( !m_summary_done ){
        m_summary_done = true;
        return hexdump_summary(m_size);
    }
    if( m_front < m_back ){
        return chunk_line(--m_back);
    }
    return std::nullopt;
}

/**
 * @brief Creates a lazy hexdump of a buffer.
 * @param ptr Pointer to the data, must outlive the returned sequence.
 * @param buflen Length of the data.
 * @return Line sequence.
 */
Hexdump hexdump_iter(const void *ptr, size_t buflen) {
    return Hexdump(ptr, buflen);
}

/**
 * @brief Creates a lazy hexdump of a string.
 * @param str Data, must outlive the returned sequence.
 * @return Line sequence.
 */
Hexdump hexdump_iter(const std::string& str) {
    return hexdump_iter(str.data(), str.size());
}

/**
 * @brief Creates a lazy hexdump of a byte vector.
 * @param buf Data, must outlive the returned sequence.
 * @return Line sequence.
 */
Hexdump hexdump_iter(const std::vector<uint8_t>& buf) {
    return hexdump_iter(buf.data(), buf.size());
}

/**
 * @brief Prints a hexdump to stdout, one line per chunk plus the summary.
 *
 * @throws std::system_error if writing to stdout fails.
 */
void hexdump(const void *ptr, size_t buflen) {
    for( const Line& line : hexdump_iter(ptr, buflen) ){
        fmt::print("{}\n", std::string_view(line));
    }
}

/**
 * @brief Prints a hexdump of a string to stdout.
 * @throws std::system_error if writing to stdout fails.
 */
void hexdump(const std::string& str) {
    hexdump(str.data(), str.size());
}

/**
 * @brief Prints a hexdump of a byte vector to stdout.
 * @throws std::system_error if writing to stdout fails.
 */
void hexdump(const std::vector<uint8_t>& buf) {
    hexdump(buf.data(), buf.size());
}
