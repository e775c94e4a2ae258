#include "config.hpp"
#include "utils.hpp"
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Postinstall {

    namespace {

        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return value;
        }

        // Reads a scalar child of `section` into `target` if present.
        void readString(const YAML::Node& section, const char* key, std::string& target) {
            const YAML::Node node = section[key];
            if (!node) {
                return;
            }
            if (!node.IsScalar()) {
                throw std::runtime_error(std::string("Configuration key '") + key +
                                         "' must be a scalar");
            }
            target = node.as<std::string>();
        }

        YAML::Node section(const YAML::Node& root, const char* name) {
            const YAML::Node node = root[name];
            if (node && !node.IsMap()) {
                throw std::runtime_error(std::string("Configuration section '") + name +
                                         "' must be a map");
            }
            return node;
        }
    }

    KeyMode parseKeyMode(const std::string& value) {
        std::string v = toLower(trim(value));
        if (v == "ask") return KeyMode::Ask;
        if (v == "yes") return KeyMode::Yes;
        if (v == "no")  return KeyMode::No;
        throw std::runtime_error("Invalid ssh.add_key value '" + value +
                                 "' (expected ask, yes or no)");
    }

    RcMode parseRcMode(const std::string& value) {
        std::string v = toLower(trim(value));
        if (v == "append")  return RcMode::Append;
        if (v == "managed") return RcMode::Managed;
        throw std::runtime_error("Invalid overlays.rc_mode value '" + value +
                                 "' (expected append or managed)");
    }

    void Config::setDirective(const std::string& name, const std::string& value) {
        for (auto& [existing, current] : sshdDirectives) {
            if (toLower(existing) == toLower(name)) {
                current = value;
                return;
            }
        }
        sshdDirectives.emplace_back(name, value);
    }

    Config Config::fromYaml(const YAML::Node& root) {
        Config config;

        if (!root || root.IsNull()) {
            return config; // Empty document, keep defaults
        }
        if (!root.IsMap()) {
            throw std::runtime_error("Configuration root must be a map");
        }

        if (YAML::Node paths = section(root, "paths")) {
            readString(paths, "log_dir", config.logDir);
            readString(paths, "config_dir", config.configDir);
            readString(paths, "package_list", config.packageList);
            readString(paths, "sshd_config", config.sshdConfig);
            readString(paths, "motd", config.motdTarget);
        }

        if (YAML::Node ssh = section(root, "ssh")) {
            readString(ssh, "service", config.sshService);
            readString(ssh, "public_key", config.publicKey);
            readString(ssh, "public_key_url", config.publicKeyUrl);

            std::string mode;
            readString(ssh, "add_key", mode);
            if (!mode.empty()) {
                config.addKey = parseKeyMode(mode);
            }

            if (YAML::Node directives = section(ssh, "directives")) {
                for (const auto& entry : directives) {
                    if (!entry.second.IsScalar()) {
                        throw std::runtime_error("sshd directive '" +
                                                 entry.first.as<std::string>() +
                                                 "' must have a scalar value");
                    }
                    config.setDirective(entry.first.as<std::string>(),
                                        entry.second.as<std::string>());
                }
            }
        }

        if (YAML::Node overlays = section(root, "overlays")) {
            std::string mode;
            readString(overlays, "rc_mode", mode);
            if (!mode.empty()) {
                config.rcMode = parseRcMode(mode);
            }
        }

        if (YAML::Node backup = section(root, "backup")) {
            if (backup["enabled"]) {
                try {
                    config.backupEnabled = backup["enabled"].as<bool>();
                } catch (const YAML::Exception&) {
                    throw std::runtime_error("backup.enabled must be true or false");
                }
            }
        }

        return config;
    }

    Config Config::loadFromFile(const std::string& path) {
        if (!fs::exists(path)) {
            throw std::runtime_error("Configuration file not found: " + path);
        }

        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Unable to parse configuration file " + path +
                                     ": " + e.what());
        }

        return fromYaml(root);
    }
}
