#pragma once
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/types.h>

// reads a regular file or a stream (stdin, pipe, character device) into memory.
// "-" means stdin.
//
// streams have no size until they're drained, so read_all() is the only way to read them.
class Reader {
    public:
    explicit Reader(const std::filesystem::path& fname);
    ~Reader();

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    class ReadError : public std::runtime_error {
        public:
        explicit ReadError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // either succeeds or throws an exception, returns less than count only at EOF
    size_t read_at(off_t offset, void* buf, size_t count);

    // whole input, or a window of it. size == 0 means "up to the end".
    // an offset past the end yields an empty buffer.
    std::vector<uint8_t> read_all(uint64_t offset = 0, uint64_t size = 0);

    // size of a regular file, 0 for streams
    size_t size() const { return m_size; }
    bool is_stream() const { return m_stream; }

    private:
    std::vector<uint8_t> drain();

    std::filesystem::path m_fname;
    int m_fd = -1;
    bool m_owned = false;
    bool m_stream = false;
    size_t m_size = 0;
};
