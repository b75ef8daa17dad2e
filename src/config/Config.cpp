// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/config/Config.h"
#include "pingsift/io/TimestampFormat.h"
#include "pingsift/log/Log.h"

#include <yaml-cpp/yaml.h>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <nlohmann/json-schema.hpp>
#include <chrono>
#include <fstream>
#include <filesystem>
#include <iostream>

namespace pingsift {
namespace {

template <typename T>
void set_if_present(const YAML::Node& node, const char* key, T& target) {
    if (!node) return;
    if (auto child = node[key]) {
        target = child.as<T>();
    }
}

/**
 * @brief Iterate across alternative keys and copy the first match into @p target.
 */
template <typename T>
void set_if_present_any(const YAML::Node& node,
                        T& target,
                        std::initializer_list<const char*> keys) {
    if (!node) return;
    for (auto key : keys) {
        if (auto child = node[key]) {
            target = child.as<T>();
            return;
        }
    }
}

// YAML scalars carry no type, so try the narrowest JSON type first.
nlohmann::json yaml_scalar_to_json(const YAML::Node& node) {
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) return b;
    long long i = 0;
    if (YAML::convert<long long>::decode(node, i)) return i;
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) return d;
    return node.Scalar();
}

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Scalar:
        return yaml_scalar_to_json(node);
    case YAML::NodeType::Sequence: {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& elem : node) arr.push_back(yaml_to_json(elem));
        return arr;
    }
    case YAML::NodeType::Map: {
        nlohmann::json obj = nlohmann::json::object();
        for (auto it = node.begin(); it != node.end(); ++it) {
            obj[it->first.as<std::string>()] = yaml_to_json(it->second);
        }
        return obj;
    }
    default:
        return nullptr;
    }
}

std::optional<nlohmann::json> load_schema(const std::string& config_path) {
    namespace fs = std::filesystem;
    fs::path schema_path = fs::path(config_path).parent_path() / "config_schema.json";
    std::ifstream in(schema_path);
    if (!in) return std::nullopt;
    try {
        nlohmann::json schema;
        in >> schema;
        return schema;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

bool validate_root(const YAML::Node& root, const nlohmann::json& schema, std::string& error) {
    try {
        nlohmann::json_schema::json_validator validator(
            nullptr,
            nlohmann::json_schema::default_string_format_check);
        validator.set_root_schema(schema);
        validator.validate(yaml_to_json(root));
        return true;
    } catch (const std::exception& ex) {
        error = ex.what();
        return false;
    }
}

void apply_filter_config(const YAML::Node& filter, Config::FilterConfig& cfg) {
    if (!filter) return;
    set_if_present(filter, "max_roundtrip_ms", cfg.max_roundtrip_ms);
    set_if_present(filter, "allowed_sequence_gap", cfg.allowed_sequence_gap);
    set_if_present(filter, "forward_duplicates", cfg.forward_duplicates);
}

void apply_output_config(const YAML::Node& output, Config::OutputConfig& cfg) {
    if (!output) return;
    set_if_present(output, "timestamp_format", cfg.timestamp_format);
    set_if_present(output, "timestamp_source", cfg.timestamp_source);
    set_if_present(output, "status_format", cfg.status_format);
    set_if_present(output, "final_status", cfg.final_status);
}

// Flat keys named after the command line flags.
void apply_legacy_keys(const YAML::Node& root, Config& cfg) {
    set_if_present_any(root, cfg.filter.max_roundtrip_ms, {"max_time_ms", "max_roundtrip_ms"});
    set_if_present_any(root, cfg.filter.allowed_sequence_gap, {"allowed_seq_diff", "allowed_sequence_gap"});
    set_if_present_any(root, cfg.output.timestamp_format, {"fmt", "timestamp_format"});
    set_if_present(root, "heartbeat_interval", cfg.heartbeat.interval_seconds);
}

} // namespace

/**
 * @brief Populate a Config structure from a YAML document on disk.
 */
std::optional<Config> Config::from_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        return std::nullopt;
    } catch (const YAML::ParserException& ex) {
        std::cerr << "Config parse error: " << ex.what() << '\n';
        return std::nullopt;
    }

    auto schema = load_schema(path);
    if (!schema) {
        std::cerr << "Failed to load config schema near " << path << '\n';
        return std::nullopt;
    }

    std::string validation_error;
    if (!validate_root(root, *schema, validation_error)) {
        std::cerr << "Config validation failed: " << validation_error << '\n';
        return std::nullopt;
    }

    Config cfg;
    try {
        apply_legacy_keys(root, cfg);
        apply_filter_config(root["filter"], cfg.filter);
        apply_output_config(root["output"], cfg.output);

        if (auto heartbeat = root["heartbeat"]) {
            set_if_present_any(heartbeat, cfg.heartbeat.interval_seconds,
                               {"interval_seconds", "interval"});
        }
        if (auto rpc = root["status_rpc"]) {
            set_if_present(rpc, "listen", cfg.status_rpc.listen);
        }
        if (auto log = root["log"]) {
            set_if_present(log, "mode", cfg.log_mode);
            set_if_present(log, "level", cfg.log_level);
            set_if_present(log, "file", cfg.log_file);
        }
    } catch (const YAML::Exception& ex) {
        std::cerr << "Config value error: " << ex.what() << '\n';
        return std::nullopt;
    }

    if (auto err = cfg.validate()) {
        std::cerr << "Invalid config: " << *err << '\n';
        return std::nullopt;
    }

    return cfg;
}

std::optional<std::string> Config::validate() const {
    if (!(filter.max_roundtrip_ms >= 0.0)) {
        return "max_roundtrip_ms must be a non-negative number";
    }
    if (filter.allowed_sequence_gap < 1) {
        return "allowed_sequence_gap must be at least 1";
    }
    if (!(heartbeat.interval_seconds <= HeartbeatConfig::kMaxIntervalSeconds)) {
        return "heartbeat interval must be at most 31536000 seconds (one year)";
    }
    if (output.timestamp_format.empty()) {
        return "timestamp_format must not be empty";
    }
    if (format_wall_time(std::chrono::system_clock::now(), output.timestamp_format).empty()) {
        return "timestamp_format produces no output: " + output.timestamp_format;
    }
    if (output.timestamp_source != "arrival" && output.timestamp_source != "embedded") {
        return "timestamp_source must be arrival or embedded";
    }
    if (output.status_format != "text" && output.status_format != "json") {
        return "status_format must be text or json";
    }
    if (!parse_log_level(log_level)) {
        return "unknown log level: " + log_level;
    }
    if (!parse_log_mode(log_mode)) {
        return "unknown log mode: " + log_mode;
    }
    return std::nullopt;
}

} // namespace pingsift
