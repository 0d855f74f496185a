#pragma once

#include <string>
#include <vector>

// Read-only access to on-chain contract state.
class ChainClient {
public:
    virtual ~ChainClient() = default;

    // Returns the raw 0x-prefixed return data of the call. Throws on
    // transport, RPC or timeout errors.
    virtual std::string call(const std::string& address,
                             const std::string& selector,
                             const std::vector<std::string>& args) = 0;
};
