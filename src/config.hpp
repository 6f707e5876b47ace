#pragma once
#include "client.hpp"

#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace sturdy {

// Settings for every destination the process talks to. `defaults` applies
// to all clients; each entry in `clients` overrides fields for one named
// destination and supplies its base_url / api_key.
struct Config {
    ClientConfig defaults;
    std::unordered_map<std::string, nlohmann::json> clients;

    // Load from ~/.sturdy/config.json + env vars
    static Config load();

    // Load from an explicit path (created with defaults when missing) + env vars
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Merged settings for a named client. Throws std::out_of_range for an
    // unknown name.
    ClientConfig client_config_for(const std::string& name) const;

    std::vector<std::string> client_names() const;
};

// Overlay the fields present in `j` onto `base`. Fields of the wrong JSON
// type are ignored.
ClientConfig client_config_from_json(const nlohmann::json& j, ClientConfig base = {});

nlohmann::json client_config_to_json(const ClientConfig& config);

} // namespace sturdy
