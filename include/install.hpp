#ifndef INSTALL_HPP
#define INSTALL_HPP

#include <string>            // For std::string
#include <vector>            // For std::vector
#include "step.hpp"          // For StepResult

namespace Postinstall {

struct RunContext;

/**
 * @brief What check_and_install did with one package.
 */
enum class InstallOutcome
{
    AlreadyInstalled,
    Installed,
    Failed
};

/**
 * @class Installer
 * @brief Provides static methods for the package stages of a run: the
 *        system upgrade and the idempotent installation of the declared
 *        package set.
 */
class Installer
{
public:
    /**
     * @brief Refreshes the package index, then upgrades all packages.
     *
     * The upgrade is not attempted when the refresh fails.
     *
     * @param ctx The run context.
     * @return StepResult::Done, or StepResult::Failed if either command failed.
     */
    static StepResult upgradeSystem(RunContext& ctx);

    /**
     * @brief Installs a package unless it is already present.
     *
     * Logs "already installed", or "Installing ..." followed by exactly one
     * of "successfully installed" / "Failed to install".
     *
     * @param ctx         The run context.
     * @param packageName The package to check.
     * @return What was done.
     */
    static InstallOutcome checkAndInstall(RunContext& ctx, const std::string& packageName);

    /**
     * @brief Runs checkAndInstall for every entry of the package list file.
     *
     * @param ctx The run context; the list path comes from its config.
     * @return StepResult::Skipped if the list does not exist,
     *         StepResult::Failed if it could not be read or any package
     *         failed, StepResult::Done otherwise.
     */
    static StepResult installFromList(RunContext& ctx);

    /**
     * @brief Installs the given packages in order, never stopping early.
     *
     * @return The number of packages that failed to install.
     */
    static size_t installAll(RunContext& ctx, const std::vector<std::string>& packageNames);
};

} // namespace Postinstall

#endif // INSTALL_HPP
