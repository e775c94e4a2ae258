#include "ssh.hpp"
#include "context.hpp"
#include "sshd_config.hpp"
#include "utils.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <cerrno>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Postinstall {

namespace {

    void changeOwner(const fs::path& path, uid_t uid, gid_t gid) {
        if (lchown(path.c_str(), uid, gid) != 0) {
            throw std::system_error(errno, std::system_category(),
                                    "chown " + path.string());
        }
    }

    // chown -R
    void changeOwnerRecursive(const fs::path& root, uid_t uid, gid_t gid) {
        changeOwner(root, uid, gid);
        for (const auto& entry : fs::recursive_directory_iterator(root)) {
            changeOwner(entry.path(), uid, gid);
        }
    }
}

std::vector<std::string> SshSetup::splitKeyListing(const std::string& listing)
{
    std::vector<std::string> keys;
    std::istringstream in(listing);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (!line.empty()) {
            keys.push_back(line);
        }
    }
    return keys;
}

void SshSetup::installKeys(const std::string& home, uid_t uid, gid_t gid,
                           const std::vector<std::string>& keys)
{
    fs::path sshDir = fs::path(home) / ".ssh";
    fs::path keyFile = sshDir / "authorized_keys";

    for (const auto& path : {sshDir, keyFile}) {
        if (fs::is_symlink(path)) {
            throw std::runtime_error("Refusing to write through symbolic link " + path.string());
        }
    }

    fs::create_directories(sshDir);

    {
        std::ofstream out(keyFile, std::ios::app);
        if (!out.is_open()) {
            throw std::runtime_error("Unable to open " + keyFile.string() + " for writing");
        }
        for (const auto& key : keys) {
            out << key << "\n";
        }
        out.flush();
        if (!out) {
            throw std::runtime_error("Write error on " + keyFile.string());
        }
    }

    changeOwnerRecursive(sshDir, uid, gid);
    fs::permissions(sshDir, fs::perms::owner_all, fs::perm_options::replace);
    fs::permissions(keyFile, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace);
}

StepResult SshSetup::addAuthorizedKey(RunContext& ctx)
{
    const Config& config = ctx.config;

    if (config.addKey == KeyMode::No) {
        ctx.logger.log("SSH key registration disabled by configuration.");
        return StepResult::Skipped;
    }
    if (!ctx.user) {
        ctx.logger.warn("Target user could not be resolved. Skipping SSH key registration.");
        return StepResult::Skipped;
    }

    std::vector<std::string> keys;

    if (config.addKey == KeyMode::Ask) {
        if (!ctx.prompt.askYesNo("Would you like to add a public SSH key?")) {
            ctx.logger.log("SSH key registration skipped.");
            return StepResult::Skipped;
        }
        keys.push_back(ctx.prompt.readLine("Paste your public SSH key: "));
    } else if (!config.publicKeyUrl.empty()) {
        ctx.logger.log("Fetching public SSH keys from " + config.publicKeyUrl);
        try {
            keys = splitKeyListing(fetchRemoteText(config.publicKeyUrl));
        } catch (const std::exception& e) {
            ctx.logger.error(e.what());
            return StepResult::Failed;
        }
        if (keys.empty()) {
            ctx.logger.error("No keys found at " + config.publicKeyUrl);
            return StepResult::Failed;
        }
    } else if (!config.publicKey.empty()) {
        keys.push_back(config.publicKey);
    } else {
        keys.push_back(ctx.prompt.readLine("Paste your public SSH key: "));
    }

    fs::path keyFile = fs::path(ctx.user->home) / ".ssh" / "authorized_keys";
    backupBeforeChange(ctx, keyFile.string());

    try {
        installKeys(ctx.user->home, ctx.user->uid, ctx.user->gid, keys);
    } catch (const std::exception& e) {
        ctx.logger.error("Failed to add SSH public key: " + std::string(e.what()));
        return StepResult::Failed;
    }

    ctx.logger.log(keys.size() == 1 ? "SSH public key added."
                                    : std::to_string(keys.size()) + " SSH public keys added.");
    return StepResult::Done;
}

StepResult SshSetup::hardenDaemon(RunContext& ctx)
{
    const std::string& path = ctx.config.sshdConfig;
    if (!fs::is_regular_file(path)) {
        ctx.logger.log("sshd_config file not found.");
        return StepResult::Skipped;
    }

    backupBeforeChange(ctx, path);

    try {
        SshdConfig sshd = SshdConfig::loadFromFile(path);
        for (const auto& [keyword, value] : ctx.config.sshdDirectives) {
            sshd.set(keyword, value);
        }
        sshd.saveToFile(path);
    } catch (const std::exception& e) {
        ctx.logger.error("Failed to rewrite " + path + ": " + e.what());
        return StepResult::Failed;
    }

    if (!ctx.services.restartService(ctx.config.sshService)) {
        ctx.logger.error("sshd_config updated but restarting " + ctx.config.sshService +
                         " failed. The new settings apply after the next restart.");
        return StepResult::Failed;
    }

    ctx.logger.log("SSH configured to accept key-based authentication only.");
    return StepResult::Done;
}

} // namespace Postinstall
