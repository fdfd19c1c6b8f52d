/**
 * @file Reader.cpp
 * @brief Implementation of the input reader for files and stdin.
 *
 * Regular files are read with positioned reads, so only the requested window is
 * loaded. Streams are drained completely and then sliced.
 */

#include "Reader.hpp"
#include "utils/common.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#ifndef O_BINARY
#define O_BINARY 0
#endif

/**
 * @brief Opens the input.
 * @param fname Path to the file, or "-" for stdin.
 * @throws Reader::ReadError if the file can't be opened or stat'ed.
 */
Reader::Reader(const std::filesystem::path& fname) : m_fname(fname) {
    if( fname == "-" ){
        m_fd = STDIN_FILENO;
        m_fname = "<stdin>";
    } else {
        m_fd = open(fname.string().c_str(), O_RDONLY | O_BINARY);
        if( m_fd == -1 ){
            throw ReadError(fmt::format("open(\"{}\"): {}", fname, strerror(errno)));
        }
        m_owned = true;
    }

    struct stat st;
    if( fstat(m_fd, &st) == -1 ){
        int err = errno;
        if( m_owned ){
            close(m_fd);
        }
        throw ReadError(fmt::format("fstat(\"{}\"): {}", m_fname, strerror(err)));
    }

    if( S_ISREG(st.st_mode) ){
        m_size = st.st_size;
    } else {
        m_stream = true;
    }
    logger->debug("Reader: opened {}, {}", m_fname, m_stream ? "stream" : fmt::format("{:x} bytes", m_size));
}

/**
 * @brief Closes the file, stdin is left open.
 */
Reader::~Reader() {
    if( m_owned && m_fd != -1 ){
        close(m_fd);
    }
}

/**
 * @brief Reads up to count bytes at the given offset, retrying short reads.
 *
 * @param offset File offset.
 * @param buf Destination buffer.
 * @param count Number of bytes to read.
 * @return Bytes read, less than count only at EOF.
 * @throws Reader::ReadError on read errors or when the input is a stream.
 */
size_t Reader::read_at(off_t offset, void* buf, size_t count) {
    if( m_stream ){
        throw ReadError(fmt::format("{}: positioned read on a stream", m_fname));
    }

    size_t total = 0;
    while( total < count ){
        ssize_t nread = pread(m_fd, (uint8_t*)buf + total, count - total, offset + total);
        if( nread == -1 ){
            if( errno == EINTR ){
                continue;
            }
            throw ReadError(fmt::format("pread(\"{}\", {:x}, {:x}): {}", m_fname, offset + total, count - total, strerror(errno)));
        }
        if( nread == 0 ){
            break; // EOF
        }
        total += nread;
    }
    return total;
}

/**
 * @brief Reads a stream until EOF.
 * @return Everything that was left in the stream.
 * @throws Reader::ReadError on read errors.
 */
std::vector<uint8_t> Reader::drain() {
    std::vector<uint8_t> result;
    uint8_t buf[0x10000];
    while( true ){
        ssize_t nread = read(m_fd, buf, sizeof(buf));
        if( nread == -1 ){
            if( errno == EINTR ){
                continue;
            }
            throw ReadError(fmt::format("read(\"{}\"): {}", m_fname, strerror(errno)));
        }
        if( nread == 0 ){
            break;
        }
        result.insert(result.end(), buf, buf + nread);
    }
    return result;
}

/**
 * @brief Reads the whole input or a window of it into memory.
 *
 * @param offset Start of the window.
 * @param size Window length, 0 means up to the end of input.
 * @return The bytes, possibly fewer than requested when the input is shorter.
 * @throws Reader::ReadError on read errors.
 */
std::vector<uint8_t> Reader::read_all(uint64_t offset, uint64_t size) {
    if( m_stream ){
        std::vector<uint8_t> data = drain();
        if( offset >= data.size() ){
            return {};
        }
        uint64_t avail = data.size() - offset;
        uint64_t count = size ? std::min(size, avail) : avail;
        return std::vector<uint8_t>(data.begin() + offset, data.begin() + offset + count);
    }

    if( offset >= m_size ){
        return {};
    }
    uint64_t avail = m_size - offset;
    uint64_t count = size ? std::min(size, avail) : avail;

    std::vector<uint8_t> data(count);
    size_t nread = read_at(offset, data.data(), data.size());
    if( nread != count ){
        logger->warn("{}: file shrunk while reading, got {:x} of {:x} bytes", m_fname, nread, count);
        data.resize(nread);
    }
    return data;
}
