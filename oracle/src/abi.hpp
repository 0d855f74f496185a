#pragma once

#include <string>
#include <vector>
#include <cstdint>

// Minimal Solidity ABI helpers for read-only calls that take address
// arguments and return static 32-byte words.
namespace abi {
    bool is_selector(const std::string& s);
    bool is_address(const std::string& s);

    std::string encode_call(const std::string& selector,
                            const std::vector<std::string>& address_args);

    // Throw std::runtime_error when the data is not hex or too short.
    double decode_word_double(const std::string& data, int index);
    uint64_t decode_word_u64(const std::string& data, int index);
}
