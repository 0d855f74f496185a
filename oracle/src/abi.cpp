#include "abi.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace abi {

namespace {

constexpr size_t kWordHexChars = 64;

bool is_hex(const std::string& s, size_t from) {
    return std::all_of(s.begin() + from, s.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

bool has_prefix(const std::string& s) {
    return s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    throw std::runtime_error(std::string("Invalid hex digit '") + c + "'");
}

std::string word_at(const std::string& data, int index) {
    if (index < 0) {
        throw std::runtime_error("Negative ABI word index");
    }
    size_t offset = has_prefix(data) ? 2 : 0;
    size_t start = offset + static_cast<size_t>(index) * kWordHexChars;
    if (data.size() < start + kWordHexChars) {
        throw std::runtime_error("Return data too short for word " + std::to_string(index));
    }
    return data.substr(start, kWordHexChars);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

bool is_selector(const std::string& s) {
    return s.size() == 10 && has_prefix(s) && is_hex(s, 2);
}

bool is_address(const std::string& s) {
    return s.size() == 42 && has_prefix(s) && is_hex(s, 2);
}

std::string encode_call(const std::string& selector,
                        const std::vector<std::string>& address_args) {
    if (!is_selector(selector)) {
        throw std::runtime_error("Invalid selector: " + selector);
    }

    std::string out = "0x" + lower(selector.substr(2));
    for (const auto& arg : address_args) {
        if (!is_address(arg)) {
            throw std::runtime_error("Invalid address argument: " + arg);
        }
        out += std::string(kWordHexChars - 40, '0') + lower(arg.substr(2));
    }
    return out;
}

double decode_word_double(const std::string& data, int index) {
    auto word = word_at(data, index);
    long double value = 0.0L;
    for (char c : word) {
        value = value * 16.0L + hex_value(c);
    }
    return static_cast<double>(value);
}

uint64_t decode_word_u64(const std::string& data, int index) {
    auto word = word_at(data, index);
    for (size_t i = 0; i < kWordHexChars - 16; ++i) {
        if (hex_value(word[i]) != 0) {
            throw std::runtime_error("ABI word " + std::to_string(index) +
                                     " does not fit in 64 bits");
        }
    }
    uint64_t value = 0;
    for (size_t i = kWordHexChars - 16; i < kWordHexChars; ++i) {
        value = (value << 4) | static_cast<uint64_t>(hex_value(word[i]));
    }
    return value;
}

} // namespace abi
