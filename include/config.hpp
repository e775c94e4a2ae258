#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace Postinstall {

/**
 * @brief How the SSH key registration step obtains its yes/no answer.
 */
enum class KeyMode
{
    Ask, ///< Prompt the operator on the console.
    Yes, ///< Register the configured key without asking.
    No   ///< Skip the step without asking.
};

/**
 * @brief How rc fragments are merged into the user's rc files.
 */
enum class RcMode
{
    Append,  ///< Plain append; content is duplicated on every run.
    Managed  ///< Marker-delimited block, replaced in place on reruns.
};

class Config
{
public:
    /**
     * @brief Directory receiving the run log and the backup archive.
     */
    std::string logDir = "./logs";

    /**
     * @brief Directory holding motd.txt, bashrc.append and nanorc.append.
     */
    std::string configDir = "./config";

    std::string packageList = "./lists/packages.txt";
    std::string sshdConfig  = "/etc/ssh/sshd_config";
    std::string motdTarget  = "/etc/motd";

    /**
     * @brief Service restarted after sshd_config is rewritten.
     */
    std::string sshService = "ssh";

    KeyMode addKey = KeyMode::Ask;
    std::string publicKey;
    std::string publicKeyUrl;

    /**
     * @brief Directives forced in sshd_config, in the order they are applied.
     */
    std::vector<std::pair<std::string, std::string>> sshdDirectives = {
        {"PasswordAuthentication", "no"},
        {"ChallengeResponseAuthentication", "no"},
        {"PubkeyAuthentication", "yes"}
    };

    RcMode rcMode = RcMode::Append;
    bool backupEnabled = true;

    /**
     * @brief Loads configuration from a YAML file on disk.
     * @param path Path to the configuration file.
     * @return Defaults overridden by the keys present in the file.
     * @throws std::runtime_error if the file cannot be read or is malformed.
     */
    static Config loadFromFile(const std::string& path);

    /**
     * @brief Builds a configuration from an already parsed YAML document.
     * @throws std::runtime_error on values of the wrong type or unknown enums.
     */
    static Config fromYaml(const YAML::Node& root);

    /**
     * @brief Sets (or adds) a forced sshd directive. Names compare
     *        case-insensitively, as sshd does.
     */
    void setDirective(const std::string& name, const std::string& value);
};

/**
 * @brief Parses "ask" / "yes" / "no" (case-insensitive).
 * @throws std::runtime_error for anything else.
 */
KeyMode parseKeyMode(const std::string& value);

/**
 * @brief Parses "append" / "managed" (case-insensitive).
 * @throws std::runtime_error for anything else.
 */
RcMode parseRcMode(const std::string& value);

} // namespace Postinstall

#endif // CONFIG_HPP
