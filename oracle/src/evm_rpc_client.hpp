#pragma once

#include "chain_client.hpp"
#include <atomic>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// JSON-RPC eth_call client over libcurl. Safe to use from several
// collector threads at once: every request owns its own easy handle.
class EvmRpcClient : public ChainClient {
public:
    explicit EvmRpcClient(const std::vector<std::string>& rpc_urls, int timeout_ms = 5000);

    std::string call(const std::string& address,
                     const std::string& selector,
                     const std::vector<std::string>& args) override;

    bool is_healthy();

private:
    std::vector<std::string> rpc_urls_;
    int timeout_ms_;
    std::atomic<size_t> current_rpc_index_;
    std::atomic<uint64_t> request_id_;

    nlohmann::json make_request(const std::string& method, const nlohmann::json& params);
    void rotate_rpc(size_t failed_index);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
