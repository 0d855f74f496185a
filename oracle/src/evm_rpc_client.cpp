#include "evm_rpc_client.hpp"
#include "abi.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <stdexcept>

EvmRpcClient::EvmRpcClient(const std::vector<std::string>& rpc_urls, int timeout_ms)
    : rpc_urls_(rpc_urls)
    , timeout_ms_(timeout_ms)
    , current_rpc_index_(0)
    , request_id_(1)
{
    if (rpc_urls_.empty()) {
        throw std::runtime_error("EvmRpcClient needs at least one RPC URL");
    }
}

size_t EvmRpcClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

void EvmRpcClient::rotate_rpc(size_t failed_index) {
    size_t next = (failed_index + 1) % rpc_urls_.size();
    // Another thread may already have moved on
    if (current_rpc_index_.compare_exchange_strong(failed_index, next)) {
        spdlog::warn("Rotated to RPC endpoint: {}", rpc_urls_[next]);
    }
}

nlohmann::json EvmRpcClient::make_request(const std::string& method,
                                          const nlohmann::json& params) {
    size_t index = current_rpc_index_.load();
    const std::string& url = rpc_urls_[index];

    nlohmann::json payload = {
        {"jsonrpc", "2.0"},
        {"id", request_id_.fetch_add(1)},
        {"method", method},
        {"params", params}
    };
    std::string body = payload.dump();
    std::string response_string;

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    struct curl_slist* headers = NULL;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    long http_status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        rotate_rpc(index);
        throw std::runtime_error(std::string("RPC request failed: ") + curl_easy_strerror(res));
    }
    if (http_status >= 500) {
        rotate_rpc(index);
        throw std::runtime_error("RPC endpoint returned HTTP " + std::to_string(http_status));
    }

    nlohmann::json response;
    try {
        response = nlohmann::json::parse(response_string);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse RPC response: ") + e.what());
    }

    if (response.contains("error")) {
        throw std::runtime_error("RPC error: " + response["error"].dump());
    }
    if (!response.contains("result")) {
        throw std::runtime_error("RPC response without result");
    }

    return response["result"];
}

std::string EvmRpcClient::call(const std::string& address,
                               const std::string& selector,
                               const std::vector<std::string>& args) {
    nlohmann::json tx = {
        {"to", address},
        {"data", abi::encode_call(selector, args)}
    };

    auto result = make_request("eth_call", nlohmann::json::array({tx, "latest"}));
    if (!result.is_string()) {
        throw std::runtime_error("eth_call returned a non-string result");
    }

    auto data = result.get<std::string>();
    spdlog::debug("eth_call {} {} -> {} bytes", util::short_address(address), selector,
                  data.size() > 2 ? (data.size() - 2) / 2 : 0);
    return data;
}

bool EvmRpcClient::is_healthy() {
    try {
        auto result = make_request("eth_blockNumber", nlohmann::json::array());
        return result.is_string();
    } catch (const std::exception& e) {
        spdlog::warn("RPC health check failed: {}", e.what());
        return false;
    }
}
