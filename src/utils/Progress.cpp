/**
 * @file Progress.cpp
 * @brief Progress indicator for long scans.
 *
 * Shows current position, completion percentage when the input size is known,
 * throughput and counts of found items. Drawn on stderr so it never mixes
 * with the results on stdout.
 */

#include "Progress.hpp"
#include "common.hpp"

#include <array>
#include <string_view>

static constexpr std::array<std::string_view, 4> SPINNER = {
    "|", "/", "-", "\\"
};

std::string Progress::bytes2human(uint64_t size){
    static const std::array<const char*, 5> units { "", "Kb", "Mb", "Gb", "Tb" };

    size_t i = 0;
    while( i < units.size()-1 && size >= 4096 ){
        i++;
        size /= 1024;
    }
    return std::to_string(size) + units[i];
}

/**
 * @brief Redraws the progress line.
 *
 * Throttled to ~10Hz unless final is true.
 *
 * @param offset Bytes consumed so far.
 * @param final If true, forces the update and ends the line.
 */
void Progress::update(uint64_t offset, bool final){
    struct timespec cur_time;
    clock_gettime(CLOCK_MONOTONIC, &cur_time);

    uint64_t dt = (cur_time.tv_sec - m_prev_time.tv_sec) * 1000000000L + (cur_time.tv_nsec - m_prev_time.tv_nsec);
    if( dt < 100000000 && !final ){
        return;
    }
    m_prev_time = cur_time;

    dt = (cur_time.tv_sec - m_start_time.tv_sec) * 1000000000L + (cur_time.tv_nsec - m_start_time.tv_nsec);
    dt /= 1000000; // elapsed ms
    if( dt == 0 ) dt = 1;

    std::string found_str;
    for(const auto& [key, count] : m_found_map) {
        if(!found_str.empty()) found_str += ", ";
        found_str += fmt::format("{} {}", count, key);
    }
    if (found_str.empty()) {
        found_str = "-";
    }

    std::string pos_str = m_fsize
        ? fmt::format("{}/{} = {:.1f}%", bytes2human(offset), bytes2human(m_fsize), 100.0*offset/m_fsize)
        : bytes2human(offset);

    fmt::print(m_out, "[{}] {}, {}/s, found: {}" ANSI_CLEAR_EOL "{}",
        SPINNER[m_spinner_idx++],
        pos_str,
        bytes2human(offset * 1000 / dt),
        found_str,
        final ? "\n" : "\r"
        );
    fflush(m_out);

    if (m_spinner_idx >= SPINNER.size()) {
        m_spinner_idx = 0;
    }
}
