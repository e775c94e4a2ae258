#ifndef SERVICE_MANAGER_HPP
#define SERVICE_MANAGER_HPP

#include <string>

namespace Postinstall {

/**
 * @class ServiceManager
 * @brief Restarts system services after their configuration changed.
 */
class ServiceManager
{
public:
    virtual ~ServiceManager() = default;

    /**
     * @brief Restarts the named service.
     * @return True if the service manager reported success.
     */
    virtual bool restartService(const std::string& serviceName) = 0;
};

/**
 * @class SystemctlServiceManager
 * @brief ServiceManager backed by `systemctl restart`.
 */
class SystemctlServiceManager : public ServiceManager
{
public:
    explicit SystemctlServiceManager(std::string outputLog);

    bool restartService(const std::string& serviceName) override;

private:
    std::string outputLog;
};

} // namespace Postinstall

#endif // SERVICE_MANAGER_HPP
