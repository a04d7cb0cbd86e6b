#include "realdb/configuration.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>
#include <thread>

namespace realdb {

using json = nlohmann::json;

static size_t non_negative(const json& v, const char* key) {
    auto n = v.get<int64_t>();
    if (n < 0) {
        throw config_error(std::string(key) + " must not be negative");
    }
    return static_cast<size_t>(n);
}

size_t configuration::effective_worker_count() const {
    if (worker_count > 0) return worker_count;
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

configuration configuration::from_json(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw config_error(std::string("invalid configuration JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw config_error("configuration must be a JSON object");
    }

    configuration config;
    try {
        if (j.contains("host")) {
            config.host = j["host"].get<std::string>();
        }
        if (j.contains("port")) {
            auto port = j["port"].get<int64_t>();
            if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
                throw config_error("port out of range: " + std::to_string(port));
            }
            config.port = static_cast<uint16_t>(port);
        }
        if (j.contains("workers")) {
            config.worker_count = non_negative(j["workers"], "workers");
        }
        if (j.contains("max_body_bytes")) {
            config.max_body_bytes = non_negative(j["max_body_bytes"], "max_body_bytes");
        }
        if (j.contains("backlog")) {
            config.backlog = j["backlog"].get<int>();
        }
        if (j.contains("log_level")) {
            auto name = j["log_level"].get<std::string>();
            auto level = parse_log_level(name);
            if (!level) {
                throw config_error("unknown log_level: " + name);
            }
            config.level = *level;
        }
    } catch (const json::type_error& e) {
        throw config_error(std::string("invalid configuration value: ") + e.what());
    }
    return config;
}

configuration configuration::from_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw config_error("cannot open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return from_json(buffer.str());
}

} // namespace realdb
