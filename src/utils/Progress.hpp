#pragma once
#include <time.h>
#include <cstdint>
#include <cstdio>
#include <string>
#include <map>

// one-line progress indicator, redrawn in place at most 10 times per second.
// fsize == 0 means the total is unknown (pipe), no percentage is shown then
class Progress {
    public:
    Progress(uint64_t fsize, FILE* out = stderr) : m_fsize(fsize), m_out(out) {
        clock_gettime(CLOCK_MONOTONIC, &m_start_time);
        m_prev_time = m_start_time;
    }
    void update(uint64_t offset, bool final = false);
    void found(const std::string& key = "results") { m_found_map[key]++; }
    void finish(uint64_t offset) { update(offset, true); }

    static std::string bytes2human(uint64_t size);

    private:
    timespec m_start_time, m_prev_time;
    uint64_t m_fsize;
    FILE* m_out;
    std::map<std::string, size_t> m_found_map;
    size_t m_spinner_idx = 0;
};
