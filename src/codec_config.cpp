/**
 * @file codec_config.cpp
 * @brief Decode policy configuration implementation
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 */

#include <cstdlib>
#include <fstream>
#include <algorithm>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "../include/pattern/codec_config.hpp"

using json = nlohmann::json;

namespace sidfile {

    namespace {

        const char* const ENV_ACCEPT_MULTISID = "SIDFILE_ACCEPT_MULTISID";
        const char* const ENV_REJECT_WARNINGS = "SIDFILE_REJECT_WARNINGS";
        const char* const ENV_LOG_DIAGNOSTICS = "SIDFILE_LOG_DIAGNOSTICS";
        const char* const ENV_MAX_FILE_SIZE = "SIDFILE_MAX_FILE_SIZE";

        bool parse_bool(const std::string& key, const std::string& value) {
            std::string v = value;
            std::transform(v.begin(), v.end(), v.begin(), ::tolower);
            if (v == "true" || v == "1" || v == "yes") {
                return true;
            }
            if (v == "false" || v == "0" || v == "no") {
                return false;
            }
            throw std::invalid_argument("Invalid boolean for " + key + ": " + value);
        }

    } // namespace

    // === Configuration Validation ===

    void CodecConfig::validate() const {
        if (max_file_size < MIN_FILE_SIZE) {
            throw std::invalid_argument("Max file size must be at least " +
                std::to_string(MIN_FILE_SIZE) + " bytes");
        }
        if (max_file_size > MAX_FILE_SIZE) {
            throw std::invalid_argument("Max file size too large (max " +
                std::to_string(MAX_FILE_SIZE) + " bytes)");
        }
    }

    bool CodecConfig::is_acceptable(const Diagnostics& diagnostics) const {
        if (has_fatal(diagnostics)) {
            return false;
        }
        return !(reject_warnings && has_warnings(diagnostics));
    }

    // === Factory Methods ===

    CodecConfig CodecConfig::create_default() {
        CodecConfig config;
        config.accept_multisid = true;
        config.reject_warnings = false;
        config.log_diagnostics = false;
        config.max_file_size = 1024 * 1024;
        return config;
    }

    // === Environment Variable Helpers ===

    std::string CodecConfig::get_env(const std::string& name, const std::string& default_val) {
        const char* val = std::getenv(name.c_str());
        return val ? std::string(val) : default_val;
    }

    // === JSON Parsing ===

    CodecConfig CodecConfig::from_json(const json& j) {
        CodecConfig config = create_default();

        // Convert JSON to string map to reuse apply_config_map logic
        std::map<std::string, std::string> config_map;

        if (j.contains("codec_config")) {
            const auto& cc = j["codec_config"];

            if (cc.contains("accept_multisid")) {
                config_map[ENV_ACCEPT_MULTISID] =
                    cc["accept_multisid"].get<bool>() ? "true" : "false";
            }
            if (cc.contains("reject_warnings")) {
                config_map[ENV_REJECT_WARNINGS] =
                    cc["reject_warnings"].get<bool>() ? "true" : "false";
            }
            if (cc.contains("log_diagnostics")) {
                config_map[ENV_LOG_DIAGNOSTICS] =
                    cc["log_diagnostics"].get<bool>() ? "true" : "false";
            }
            if (cc.contains("max_file_size")) {
                config_map[ENV_MAX_FILE_SIZE] =
                    std::to_string(cc["max_file_size"].get<std::size_t>());
            }
        }

        apply_config_map(config, config_map);
        return config;
    }

    // === Configuration Application ===

    void CodecConfig::apply_config_map(CodecConfig& config,
        const std::map<std::string, std::string>& vars) {
        auto get_val = [&vars](const std::string& key) -> std::optional<std::string> {
                auto it = vars.find(key);
                if (it != vars.end()) {
                    return it->second;
                }
                return std::nullopt;
            };

        if (auto val = get_val(ENV_ACCEPT_MULTISID)) {
            config.accept_multisid = parse_bool(ENV_ACCEPT_MULTISID, *val);
        }
        if (auto val = get_val(ENV_REJECT_WARNINGS)) {
            config.reject_warnings = parse_bool(ENV_REJECT_WARNINGS, *val);
        }
        if (auto val = get_val(ENV_LOG_DIAGNOSTICS)) {
            config.log_diagnostics = parse_bool(ENV_LOG_DIAGNOSTICS, *val);
        }
        if (auto val = get_val(ENV_MAX_FILE_SIZE)) {
            config.max_file_size = std::stoul(*val, nullptr, 0);  // Support hex (0x...)
        }
    }

    // === Load Methods ===

    CodecConfig CodecConfig::from_file(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open JSON config file: " + filepath);
        }

        try {
            json j;
            file >> j;
            return from_json(j);
        } catch (const json::exception& e) {
            throw std::runtime_error("JSON parse error in " + filepath + ": " + e.what());
        }
    }

    CodecConfig CodecConfig::load(const std::optional<std::string>& config_file_path) {
        CodecConfig config = create_default();

        if (config_file_path.has_value()) {
            std::ifstream file(*config_file_path);
            if (file.is_open()) {
                try {
                    json j;
                    file >> j;
                    config = from_json(j);
                } catch (const json::exception& e) {
                    throw std::runtime_error("JSON parse error in " + *config_file_path + ": " +
                        e.what());
                }
            }
        }

        // Environment variables have the highest priority
        std::map<std::string, std::string> env_vars;
        for (const char* name : {ENV_ACCEPT_MULTISID, ENV_REJECT_WARNINGS, ENV_LOG_DIAGNOSTICS,
                ENV_MAX_FILE_SIZE}) {
            const std::string val = get_env(name);
            if (!val.empty()) {
                env_vars[name] = val;
            }
        }

        if (!env_vars.empty()) {
            apply_config_map(config, env_vars);
        }

        config.validate();
        return config;
    }

} // namespace sidfile
