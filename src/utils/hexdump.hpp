#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

constexpr size_t HEXDUMP_SEGMENT_SIZE = 4;
constexpr size_t HEXDUMP_CHUNK_SIZE = 16;
static_assert(HEXDUMP_CHUNK_SIZE % HEXDUMP_SEGMENT_SIZE == 0, "chunk size must be a multiple of segment size");

constexpr size_t HEXDUMP_SEGMENTS_PER_CHUNK = (HEXDUMP_CHUNK_SIZE + HEXDUMP_SEGMENT_SIZE - 1) / HEXDUMP_SEGMENT_SIZE;
constexpr size_t HEXDUMP_OFFSET_DIGITS = 8;

// "|" + hex + separators + "| " + ascii + " " + offset
constexpr size_t HEXDUMP_LINE_WIDTH = 1 + HEXDUMP_CHUNK_SIZE*2 + (HEXDUMP_SEGMENTS_PER_CHUNK-1) + 2 + HEXDUMP_CHUNK_SIZE + 1 + HEXDUMP_OFFSET_DIGITS;

// offsets past 4Gb just print wider, room for a full size_t
constexpr size_t HEXDUMP_LINE_CAPACITY = HEXDUMP_LINE_WIDTH - HEXDUMP_OFFSET_DIGITS + sizeof(size_t)*2;

char sanitize_byte(uint8_t byte);

// one line of hexdump output, owns its characters
class Line {
    public:
    using value_type = char;

    Line() = default;

    void push_back(char c){
        if( m_size < HEXDUMP_LINE_CAPACITY ){
            m_buf[m_size++] = c;
            m_buf[m_size] = 0;
        }
    }
    void append(size_t count, char c){
        while( count-- ) push_back(c);
    }
    void append(std::string_view s){
        for( char c : s ) push_back(c);
    }

    const char* data() const { return m_buf.data(); }
    const char* c_str() const { return m_buf.data(); }
    size_t size() const { return m_size; }
    bool empty() const { return m_size == 0; }

    std::string str() const { return std::string(data(), size()); }
    explicit operator std::string_view() const { return std::string_view(data(), size()); }

    bool operator==(const Line& other) const { return std::string_view(*this) == std::string_view(other); }
    bool operator!=(const Line& other) const { return !(*this == other); }

    private:
    std::array<char, HEXDUMP_LINE_CAPACITY + 1> m_buf {};
    size_t m_size = 0;
};

Line hexdump_chunk(size_t chunk_index, const uint8_t* chunk, size_t chunk_len);
Line hexdump_summary(size_t buflen);

// lazy, double-ended sequence of lines: one per 16-byte chunk, then the summary.
// only borrows the buffer, it must outlive the sequence.
class Hexdump {
    public:
    Hexdump(const void *ptr, size_t buflen);

    std::optional<Line> next();
    std::optional<Line> next_back();

    // lines left, from both ends together
    size_t size() const {
        return (m_back - m_front) + (m_summary_done ? 0 : 1);
    }
    bool empty() const { return size() == 0; }

    // length of the whole input, not of what's left
    size_t length() const { return m_size; }

    class iterator {
        public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Line;
        using difference_type = std::ptrdiff_t;
        using pointer = const Line*;
        using reference = const Line&;

        iterator() = default;
        explicit iterator(Hexdump* hd) : m_hd(hd) { advance(); }

        reference operator*() const { return *m_line; }
        pointer operator->() const { return &*m_line; }

        iterator& operator++(){ advance(); return *this; }

        bool operator==(const iterator& other) const { return !m_line && !other.m_line; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

        private:
        void advance(){
            m_line = m_hd ? m_hd->next() : std::nullopt;
        }

        Hexdump* m_hd = nullptr;
        std::optional<Line> m_line;
    };

    // consumes from the front
    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    private:
    Line chunk_line(size_t chunk_index) const;

    const uint8_t *m_ptr;
    size_t m_size;
    size_t m_front = 0; // next chunk index from the front
    size_t m_back;      // one past the next chunk index from the back
    bool m_summary_done = false;
};

Hexdump hexdump_iter(const void *ptr, size_t buflen);
Hexdump hexdump_iter(const std::string& str);
Hexdump hexdump_iter(const std::vector<uint8_t>& buf);

void hexdump(const void *ptr, size_t buflen);
void hexdump(const std::string& str);
void hexdump(const std::vector<uint8_t>& buf);
