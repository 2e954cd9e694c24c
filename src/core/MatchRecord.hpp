#pragma once
#include <cstdint>
#include <string>

#include <spdlog/fmt/fmt.h>

// one window that passed the checksum
struct MatchRecord {
    uint64_t offset;    // 0-based stream offset of the first digit
    uint64_t line;      // newlines read before the match
    std::string digits; // the whole window, check digit included

    bool operator==(const MatchRecord& other) const {
        return offset == other.offset && line == other.line && digits == other.digits;
    }
    bool operator!=(const MatchRecord& other) const { return !(*this == other); }

    std::string to_string() const;
};

// column titles matching MatchRecord::to_string() layout
#define MATCH_HEADER "OFFSET  LINE  NUMBER"

template <>
struct fmt::formatter<MatchRecord> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const MatchRecord& m, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(m.to_string(), ctx);
    }
};
