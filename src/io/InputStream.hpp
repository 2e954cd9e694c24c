#pragma once
#include <cstddef>
#include <string>

// sequential byte source consumed by StreamScanner
class InputStream {
    public:
    virtual ~InputStream() {}

    // reads up to count bytes, sets eof once the source is exhausted
    // throws on I/O errors
    virtual size_t read(void* buf, size_t count, bool& eof) = 0;

    // for diagnostics only
    virtual const std::string& name() const = 0;
};
