/**
 * @file StreamScanner.cpp
 * @brief Sequential digit-window scanner.
 *
 * Pulls blocks from an InputStream and walks them byte by byte, keeping the
 * byte and newline counters and the sliding window of the last digits. Every
 * time the window is full it is handed to the checksum validator.
 */

#include "StreamScanner.hpp"
#include "utils/common.hpp"
#include "utils/Progress.hpp"

StreamScanner::StreamScanner(InputStream& in, const ScanConfig& cfg)
    : m_in(in), m_cfg(cfg), m_window(cfg.length) {
    if( m_cfg.block_size == 0 ){
        throw std::invalid_argument("block size must be positive");
    }
    m_buf.resize(m_cfg.block_size);
    logger->debug("scanning {}: {} digits, {}", m_in.name(), m_cfg.length, Checksum::algorithm_name(m_cfg.algorithm));
}

/**
 * @brief Reads the next block into m_buf.
 * @return False at end of stream.
 * @throws EmptyReadError If the stream returned nothing without EOF.
 */
bool StreamScanner::fill() {
    m_pos = m_len = 0;
    if( m_eof ){
        return false;
    }

    bool eof = false;
    size_t n = m_in.read(m_buf.data(), m_buf.size(), eof);
    if( n == 0 && !eof ){
        throw EmptyReadError(fmt::format("{}: read returned no data at offset {} without end of stream", m_in.name(), m_nread));
    }

    // data and EOF may come together: consume the data, next fill() stops
    m_eof = eof;
    m_len = n;
    if( m_progress ){
        m_progress->update(m_nread);
    }
    if( n == 0 ){
        return false;
    }
    logger->trace("{}: read {:#x} bytes at {:#x}", m_in.name(), n, m_nread);
    return true;
}

// one byte of input, true if it completed a valid window
bool StreamScanner::feed(uint8_t c) {
    m_nread++;
    if( c == '\n' ){
        m_nline++;
    }

    if( !Checksum::is_digit(static_cast<char>(c)) ){
        if( !m_window.empty() ){
            m_window.clear();
        }
        return false;
    }

    m_window.push(static_cast<char>(c));
    return m_window.full() && Checksum::is_valid(m_window.view(), m_cfg.algorithm);
}

std::optional<MatchRecord> StreamScanner::next() {
    while( true ){
        if( m_pos == m_len && !fill() ){
            if( !m_finished ){
                m_finished = true;
                logger->debug("{}: EOF after {} bytes, {} lines, {} matches", m_in.name(), m_nread, m_nline, m_nmatch);
                if( m_progress ){
                    m_progress->finish(m_nread);
                }
            }
            return std::nullopt;
        }

        if( feed(m_buf[m_pos++]) ){
            m_nmatch++;
            if( m_progress ){
                m_progress->found("matches");
            }
            // m_nread already counts the last digit of the window
            return MatchRecord{ m_nread - m_cfg.length, m_nline, m_window.str() };
        }
    }
}

uint64_t StreamScanner::scan(const std::function<void(const MatchRecord&)>& on_match) {
    uint64_t n = 0;
    while( auto m = next() ){
        on_match(*m);
        n++;
    }
    return n;
}
