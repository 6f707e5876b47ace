#include "config.hpp"
#include "util.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace sturdy {

nlohmann::json Config::defaults_json() {
    return {
        {"defaults", {
            {"timeout_seconds", 30},
            {"max_retries", 3},
            {"rate_limit_calls", 100},
            {"rate_limit_period_seconds", 60.0},
            {"burst_multiplier", 1.0},
            {"cache_enabled", true},
            {"cache_ttl_seconds", 3600},
            {"cache_max_size", 1000},
            {"cleanup_interval_seconds", 300},
            {"user_agent", "sturdy/1.0"},
            {"retry", {
                {"base_delay", 1.0},
                {"max_delay", 30.0},
                {"exponential_base", 2.0},
                {"jitter_factor", 0.5}
            }}
        }},
        {"clients", nlohmann::json::object()}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static bool is_count(const nlohmann::json& v) {
    return v.is_number_integer() && v.get<int64_t>() >= 0;
}

ClientConfig client_config_from_json(const nlohmann::json& j, ClientConfig base) {
    if (!j.is_object()) return base;

    if (j.contains("base_url") && j["base_url"].is_string())
        base.base_url = j["base_url"].get<std::string>();
    if (j.contains("api_key") && j["api_key"].is_string())
        base.api_key = j["api_key"].get<std::string>();
    if (j.contains("user_agent") && j["user_agent"].is_string())
        base.user_agent = j["user_agent"].get<std::string>();
    if (j.contains("timeout_seconds") && j["timeout_seconds"].is_number())
        base.timeout_seconds = j["timeout_seconds"].get<double>();
    if (j.contains("max_retries") && is_count(j["max_retries"]))
        base.max_retries = j["max_retries"].get<uint32_t>();
    if (j.contains("rate_limit_calls") && is_count(j["rate_limit_calls"]))
        base.rate_limit_calls = j["rate_limit_calls"].get<uint32_t>();
    if (j.contains("rate_limit_period_seconds") && j["rate_limit_period_seconds"].is_number())
        base.rate_limit_period_seconds = j["rate_limit_period_seconds"].get<double>();
    if (j.contains("burst_multiplier") && j["burst_multiplier"].is_number())
        base.burst_multiplier = j["burst_multiplier"].get<double>();
    if (j.contains("cache_enabled") && j["cache_enabled"].is_boolean())
        base.cache_enabled = j["cache_enabled"].get<bool>();
    if (j.contains("cache_ttl_seconds") && j["cache_ttl_seconds"].is_number())
        base.cache_ttl_seconds = j["cache_ttl_seconds"].get<double>();
    if (j.contains("cache_max_size") && is_count(j["cache_max_size"]))
        base.cache_max_size = j["cache_max_size"].get<size_t>();
    if (j.contains("cleanup_interval_seconds") && j["cleanup_interval_seconds"].is_number())
        base.cleanup_interval_seconds = j["cleanup_interval_seconds"].get<double>();

    if (j.contains("retry") && j["retry"].is_object()) {
        auto& r = j["retry"];
        if (r.contains("base_delay") && r["base_delay"].is_number())
            base.retry.base_delay = r["base_delay"].get<double>();
        if (r.contains("max_delay") && r["max_delay"].is_number())
            base.retry.max_delay = r["max_delay"].get<double>();
        if (r.contains("exponential_base") && r["exponential_base"].is_number())
            base.retry.exponential_base = r["exponential_base"].get<double>();
        if (r.contains("jitter_factor") && r["jitter_factor"].is_number())
            base.retry.jitter_factor = r["jitter_factor"].get<double>();
    }
    return base;
}

nlohmann::json client_config_to_json(const ClientConfig& config) {
    return {
        {"base_url", config.base_url},
        {"api_key", config.api_key},
        {"user_agent", config.user_agent},
        {"timeout_seconds", config.timeout_seconds},
        {"max_retries", config.max_retries},
        {"rate_limit_calls", config.rate_limit_calls},
        {"rate_limit_period_seconds", config.rate_limit_period_seconds},
        {"burst_multiplier", config.burst_multiplier},
        {"cache_enabled", config.cache_enabled},
        {"cache_ttl_seconds", config.cache_ttl_seconds},
        {"cache_max_size", config.cache_max_size},
        {"cleanup_interval_seconds", config.cleanup_interval_seconds},
        {"retry", {
            {"base_delay", config.retry.base_delay},
            {"max_delay", config.retry.max_delay},
            {"exponential_base", config.retry.exponential_base},
            {"jitter_factor", config.retry.jitter_factor}
        }}
    };
}

// "maps-api" -> "MAPS_API"
static std::string env_name(const std::string& client) {
    std::string out;
    for (unsigned char c : client)
        out += std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
    return out;
}

static void env_number(const char* name, double& target) {
    const char* v = std::getenv(name);
    if (!v) return;
    char* end = nullptr;
    double parsed = std::strtod(v, &end);
    if (end == v || *end != '\0') {
        std::cerr << "[config] Ignoring non-numeric " << name << "=" << v << "\n";
        return;
    }
    target = parsed;
}

static void env_count(const char* name, uint32_t& target) {
    double value = target;
    env_number(name, value);
    if (value >= 1.0) target = static_cast<uint32_t>(value);
}

static void apply_env(Config& cfg) {
    env_number("STURDY_TIMEOUT_SECONDS", cfg.defaults.timeout_seconds);
    env_count("STURDY_MAX_RETRIES", cfg.defaults.max_retries);
    env_count("STURDY_RATE_LIMIT_CALLS", cfg.defaults.rate_limit_calls);
    env_number("STURDY_RATE_LIMIT_PERIOD_SECONDS", cfg.defaults.rate_limit_period_seconds);
    env_number("STURDY_CACHE_TTL_SECONDS", cfg.defaults.cache_ttl_seconds);
    if (const char* v = std::getenv("STURDY_CACHE_ENABLED")) {
        std::string flag = to_lower(v);
        cfg.defaults.cache_enabled = (flag == "1" || flag == "true" || flag == "yes");
    }

    for (auto& [name, obj] : cfg.clients) {
        std::string prefix = "STURDY_" + env_name(name);
        if (const char* v = std::getenv((prefix + "_API_KEY").c_str()))
            obj["api_key"] = v;
        if (const char* v = std::getenv((prefix + "_BASE_URL").c_str()))
            obj["base_url"] = v;
    }
}

Config Config::load() {
    return load_from(expand_home("~/.sturdy/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    Config cfg;
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    if (j.contains("defaults") && j["defaults"].is_object())
        cfg.defaults = client_config_from_json(j["defaults"]);

    if (j.contains("clients") && j["clients"].is_object()) {
        for (auto& [name, obj] : j["clients"].items()) {
            if (obj.is_object())
                cfg.clients[name] = obj;
        }
    }

    // Environment variables always override the config file
    apply_env(cfg);
    return cfg;
}

ClientConfig Config::client_config_for(const std::string& name) const {
    auto it = clients.find(name);
    if (it == clients.end())
        throw std::out_of_range("no client configured under '" + name + "'");
    return client_config_from_json(it->second, defaults);
}

std::vector<std::string> Config::client_names() const {
    std::vector<std::string> names;
    names.reserve(clients.size());
    for (const auto& [name, obj] : clients) names.push_back(name);
    return names;
}

} // namespace sturdy
