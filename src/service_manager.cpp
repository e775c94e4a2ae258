#include "service_manager.hpp"
#include "process.hpp"

#include <utility>

namespace Postinstall {

SystemctlServiceManager::SystemctlServiceManager(std::string outputLog)
    : outputLog(std::move(outputLog))
{
}

bool SystemctlServiceManager::restartService(const std::string& serviceName)
{
    return Process::run({"systemctl", "restart", serviceName}, outputLog) == 0;
}

} // namespace Postinstall
