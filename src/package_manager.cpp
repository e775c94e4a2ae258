#include "package_manager.hpp"
#include "process.hpp"

#include <string>
#include <utility>
#include <vector>

namespace Postinstall {

AptPackageManager::AptPackageManager(std::string outputLog)
    : outputLog(std::move(outputLog))
{
}

bool AptPackageManager::refreshIndex()
{
    return Process::run({"apt-get", "update"}, outputLog) == 0;
}

namespace {

    const std::vector<std::string> kConffileOptions = {
        "-o", "Dpkg::Options::=--force-confdef",
        "-o", "Dpkg::Options::=--force-confold",
    };

    std::vector<std::string> aptGet(std::vector<std::string> args)
    {
        std::vector<std::string> command = {"apt-get", "-y"};
        command.insert(command.end(), kConffileOptions.begin(), kConffileOptions.end());
        command.insert(command.end(), args.begin(), args.end());
        return command;
    }
}

std::vector<std::string> AptPackageManager::upgradeCommand()
{
    return aptGet({"upgrade"});
}

std::vector<std::string> AptPackageManager::installCommand(const std::string& packageName)
{
    return aptGet({"install", packageName});
}

bool AptPackageManager::upgradeAll()
{
    return Process::run(upgradeCommand(), outputLog) == 0;
}

bool AptPackageManager::isInstalled(const std::string& packageName)
{
    // `dpkg -s` also succeeds for removed-but-not-purged packages, so ask for
    // the status triple and require "install ok installed".
    std::string status;
    int rc = Process::capture({"dpkg-query", "-W", "-f=${Status}", packageName}, status);
    if (rc != 0) {
        return false;
    }
    return status.find("install ok installed") != std::string::npos;
}

bool AptPackageManager::install(const std::string& packageName)
{
    return Process::run(installCommand(packageName), outputLog) == 0;
}

} // namespace Postinstall
