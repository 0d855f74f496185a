#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Static catalog of yield sources. Built once at startup, read-only afterwards.
class ProtocolRegistry {
public:
    explicit ProtocolRegistry(std::vector<ProtocolSource> sources);

    // Throws std::runtime_error on malformed entries or duplicate ids.
    static ProtocolRegistry from_json(const nlohmann::json& doc,
                                      const std::string& default_asset);
    static ProtocolRegistry from_file(const std::string& path,
                                      const std::string& default_asset);

    const std::vector<ProtocolSource>& all() const { return sources_; }
    const ProtocolSource* find(const std::string& id) const;
    size_t size() const { return sources_.size(); }

private:
    std::vector<ProtocolSource> sources_;

    static CallDescriptor parse_call(const nlohmann::json& j, const std::string& context);
};
