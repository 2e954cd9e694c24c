#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <vector>

#include "checksum/Checksum.hpp"
#include "core/DigitWindow.hpp"
#include "core/MatchRecord.hpp"
#include "io/InputStream.hpp"

class Progress;

struct ScanConfig {
    size_t length = 16; // digits per number, check digit included
    Checksum::Algorithm algorithm = Checksum::Algorithm::Luhn;
    size_t block_size = 64 * 1024;
};

// single pass over a byte stream, yields every full digit window that passes
// the configured checksum.
//
// bytes are processed strictly in stream order. a non-digit empties the window,
// so only contiguous digit runs of at least cfg.length digits can match, and a
// longer run is checked at every position.
class StreamScanner {
    public:
    // the input stream broke its contract: no data, but no EOF either
    class EmptyReadError : public std::runtime_error {
        public:
        explicit EmptyReadError(const std::string& msg) : std::runtime_error(msg) {}
    };

    StreamScanner(InputStream& in, const ScanConfig& cfg);

    // next match, or nullopt at end of stream.
    // InputStream exceptions and EmptyReadError propagate, matches already
    // returned stay valid
    std::optional<MatchRecord> next();

    // drains the stream, returns the number of matches
    uint64_t scan(const std::function<void(const MatchRecord&)>& on_match);

    // not owned, may be nullptr
    void set_progress(Progress* progress) { m_progress = progress; }

    uint64_t bytes_read() const { return m_nread; }
    uint64_t lines_read() const { return m_nline; }
    uint64_t matches() const { return m_nmatch; }
    bool eof() const { return m_eof; }
    const DigitWindow& window() const { return m_window; }
    const ScanConfig& config() const { return m_cfg; }

    private:
    bool fill();
    bool feed(uint8_t c);

    InputStream& m_in;
    const ScanConfig m_cfg;
    DigitWindow m_window;

    std::vector<uint8_t> m_buf;
    size_t m_pos = 0;
    size_t m_len = 0;
    bool m_eof = false;
    bool m_finished = false; // end of stream reported

    uint64_t m_nread = 0;
    uint64_t m_nline = 0;
    uint64_t m_nmatch = 0;

    Progress* m_progress = nullptr;
};
