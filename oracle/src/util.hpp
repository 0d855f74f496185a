#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <functional>

// Source of "now" in epoch milliseconds
using Clock = std::function<int64_t()>;

namespace util {
    std::string current_iso8601();
    std::string iso8601_from_ms(int64_t timestamp_ms);
    std::vector<std::string> split(const std::string& str, char delim);
    int64_t current_timestamp_ms();
    std::string redact_dsn(const std::string& dsn);
    std::string short_address(const std::string& address);
}
