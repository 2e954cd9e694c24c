#pragma once
#include <cstdint>
#include <fcntl.h>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "io/InputStream.hpp"

// sequential reader over a file descriptor:
//  - a named file, opened and owned by the reader
//  - standard input (or any other already open fd), not owned
//
// pipes and terminals are supported, so there is no seek() and size() is only
// known for regular files
class Reader : public InputStream {
    public:
    explicit Reader(const std::filesystem::path& fname);
    Reader(int fd, const std::string& name);
    ~Reader() override;

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    class ReadError : public std::runtime_error {
        public:
        explicit ReadError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // either succeeds or throws ReadError, EINTR is retried
    size_t read(void* buf, size_t count, bool& eof) override;

    const std::string& name() const override { return m_name; }

    // size of a regular file, 0 if unknown (pipe, tty, device)
    uint64_t size() const { return m_size; }

    static uint64_t get_size(int fd);

    private:
        std::string m_name;
        int m_fd = -1;
        bool m_owned = false;
        uint64_t m_size = 0;
};
