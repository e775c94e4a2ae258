#include <iostream>
#include <string>
#include <memory>
#include <filesystem>
#include <unistd.h>

#include "config.hpp"
#include "context.hpp"
#include "orchestrator.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

const char* const kDefaultConfigPath = "./config/postinstall.yaml";

void printHelp()
{
    std::cout << "Usage: postinstall [--config <file>]\n\n"
              << "Post-installation provisioning for Debian/Ubuntu hosts. Must be run\n"
              << "as root, from the directory holding lists/ and config/.\n\n"
              << "Steps:\n"
              << "  1. apt-get update && apt-get upgrade\n"
              << "  2. install packages from lists/packages.txt\n"
              << "  3. copy config/motd.txt to /etc/motd\n"
              << "  4. append config/bashrc.append to ~/.bashrc\n"
              << "  5. append config/nanorc.append to ~/.nanorc\n"
              << "  6. optionally add an SSH public key to ~/.ssh/authorized_keys\n"
              << "  7. restrict sshd to key-based authentication\n\n"
              << "Options:\n"
              << "  --config <file>   YAML settings (default: " << kDefaultConfigPath
              << " if present)\n"
              << "  -h, --help        Show this help\n";
}

} // namespace

int main(int argc, char* argv[])
{
    std::string configPath;
    bool configSpecified = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 < argc) {
                configPath = argv[++i];
                configSpecified = true;
            }
            else {
                Postinstall::log_error("--config requires a file argument.");
                return 1;
            }
        }
        else if (arg == "-h" || arg == "--help") {
            printHelp();
            return 0;
        }
        else {
            Postinstall::log_error("Unknown argument: " + arg);
            printHelp();
            return 1;
        }
    }

    Postinstall::Config config;
    try {
        if (!configSpecified && fs::exists(kDefaultConfigPath)) {
            configPath = kDefaultConfigPath;
        }
        if (!configPath.empty()) {
            config = Postinstall::Config::loadFromFile(configPath);
            Postinstall::log_message("Loaded configuration from " + configPath);
        }
    } catch (const std::exception& e) {
        Postinstall::log_error(e.what());
        return 1;
    }

    std::unique_ptr<Postinstall::Logger> logger;
    try {
        logger = std::make_unique<Postinstall::Logger>(config.logDir);
    } catch (const std::exception& e) {
        Postinstall::log_error(e.what());
        return 1;
    }

    Postinstall::AptPackageManager packages(logger->path());
    Postinstall::SystemctlServiceManager services(logger->path());
    Postinstall::ConsolePrompt prompt;

    std::unique_ptr<Postinstall::Backup> backup;
    if (config.backupEnabled) {
        backup = std::make_unique<Postinstall::Backup>(
            (fs::path(config.logDir) / ("postinstall_" + logger->runStamp() + ".backup.tar")).string());
    }

    Postinstall::RunContext ctx{config, *logger, packages, services, prompt};
    ctx.user = Postinstall::UserIdentity::resolveLoginUser();
    ctx.effectiveUid = geteuid();
    ctx.backup = backup.get();

    int status = Postinstall::Orchestrator::run(ctx, Postinstall::Orchestrator::defaultSteps());

    if (backup) {
        backup->close();
        if (backup->size() > 0) {
            logger->log("Original files saved to " + backup->path());
        }
    }

    return status;
}
