/**
 * @file Reader.cpp
 * @brief Implementation of the sequential file/stdin reader.
 *
 * Wraps a POSIX file descriptor: opens named files itself, borrows stdin.
 * Interrupted reads are retried, every other failure is reported as
 * Reader::ReadError with the errno description.
 */

#include "Reader.hpp"
#include "utils/common.hpp"

#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

#ifdef O_BINARY
#define OPEN_MODE O_RDONLY|O_BINARY
#else
#define OPEN_MODE O_RDONLY
#endif

uint64_t Reader::get_size(int fd) {
    struct stat st;
    if( fstat(fd, &st) == -1 ) {
        throw std::runtime_error(fmt::format("fstat({}): {}", fd, strerror(errno)));
    }
    return S_ISREG(st.st_mode) ? static_cast<uint64_t>(st.st_size) : 0;
}

/**
 * @brief Opens the named file for reading.
 * @param fname Path to the file.
 * @throws std::runtime_error If the file can't be opened, a directory is given
 *         or its size can't be determined.
 */
Reader::Reader(const std::filesystem::path& fname) : m_name(fname.string()), m_owned(true) {
    m_fd = open(fname.string().c_str(), OPEN_MODE);
    if( m_fd == -1 ) {
        throw std::runtime_error(fmt::format("open(\"{}\"): {}", fname, strerror(errno)));
    }

    struct stat st;
    if( fstat(m_fd, &st) == 0 && S_ISDIR(st.st_mode) ) {
        close(m_fd);
        m_fd = -1;
        throw std::runtime_error(fmt::format("open(\"{}\"): {}", fname, strerror(EISDIR)));
    }

    try {
        m_size = get_size(m_fd);
    } catch( const std::runtime_error& ) {
        close(m_fd);
        m_fd = -1;
        throw;
    }
    logger->debug("opened {}, size: {}", fname, m_size);
}

/**
 * @brief Wraps an already open descriptor without taking ownership.
 * @param fd File descriptor, stays open after the reader is destroyed.
 * @param name Name used in diagnostics.
 * @throws std::runtime_error If fd is not an open descriptor.
 */
Reader::Reader(int fd, const std::string& name) : m_name(name), m_fd(fd), m_owned(false) {
    m_size = get_size(m_fd);
}

Reader::~Reader() {
    if( m_owned && m_fd != -1 ) {
        close(m_fd);
    }
}

/**
 * @brief Reads the next chunk of the stream.
 *
 * @param buf Buffer to read into.
 * @param count Maximum number of bytes to read.
 * @param[out] eof Set to true when read() reports end of stream.
 * @return Number of bytes read, 0 only at end of stream.
 * @throws ReadError On read error.
 */
size_t Reader::read(void* buf, size_t count, bool& eof) {
    while( true ) {
        ssize_t nread = ::read(m_fd, buf, count);
        if( nread == -1 ) {
            if( errno == EINTR ) continue;
            throw ReadError(fmt::format("read({}, {:#x}): {}", m_name, count, strerror(errno)));
        }
        eof = (nread == 0);
        return static_cast<size_t>(nread);
    }
}
