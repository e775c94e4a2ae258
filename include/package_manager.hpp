#ifndef PACKAGE_MANAGER_HPP
#define PACKAGE_MANAGER_HPP

#include <string>
#include <vector>

namespace Postinstall {

/**
 * @class PackageManager
 * @brief The operations the provisioning steps need from the system's
 *        package manager.
 */
class PackageManager
{
public:
    virtual ~PackageManager() = default;

    /**
     * @brief Refreshes the package index (e.g. `apt-get update`).
     * @return True on success.
     */
    virtual bool refreshIndex() = 0;

    /**
     * @brief Upgrades every installed package (e.g. `apt-get upgrade -y`).
     * @return True on success.
     */
    virtual bool upgradeAll() = 0;

    /**
     * @brief Checks whether a package is currently installed.
     */
    virtual bool isInstalled(const std::string& packageName) = 0;

    /**
     * @brief Installs one package non-interactively.
     * @return True if the installer exited successfully.
     */
    virtual bool install(const std::string& packageName) = 0;
};

/**
 * @class AptPackageManager
 * @brief PackageManager backed by dpkg-query and apt-get. Output of the
 *        modifying commands is appended to a log file.
 */
class AptPackageManager : public PackageManager
{
public:
    /**
     * @param outputLog File receiving apt-get's stdout/stderr.
     */
    explicit AptPackageManager(std::string outputLog);

    bool refreshIndex() override;
    bool upgradeAll() override;
    bool isInstalled(const std::string& packageName) override;
    bool install(const std::string& packageName) override;

    /**
     * @brief Command lines run by upgradeAll() and install(). dpkg is told
     *        to keep locally modified conffiles, since no terminal is
     *        attached to answer its prompt.
     */
    static std::vector<std::string> upgradeCommand();
    static std::vector<std::string> installCommand(const std::string& packageName);

private:
    std::string outputLog;
};

} // namespace Postinstall

#endif // PACKAGE_MANAGER_HPP
