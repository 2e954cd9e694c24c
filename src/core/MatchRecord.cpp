#include "MatchRecord.hpp"

// "%6u  %4u  %s": offset and line right-aligned
std::string MatchRecord::to_string() const {
    return fmt::format("{:>6}  {:>4}  {}", offset, line, digits);
}
