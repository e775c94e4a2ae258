//============================================================================
// Includes
//============================================================================

#include "install.hpp"         // Class definition and public static methods
#include "context.hpp"         // RunContext, logger and package manager
#include "package_list.hpp"    // Package list parsing

#include <filesystem>          // Modern C++ filesystem operations
#include <stdexcept>           // Standard exceptions (runtime_error, etc.)
#include <string>

// Alias for easier filesystem usage
namespace fs = std::filesystem;

namespace Postinstall {

    /**
     * ------------------------------------------------------------------------
     * Installer::upgradeSystem
     *
     * Brings the package index and the installed packages up to date. Later
     * installs presume a current index, so the orchestrator treats a failure
     * here as fatal.
     * ------------------------------------------------------------------------
     */
    StepResult Installer::upgradeSystem(RunContext& ctx) {
        ctx.logger.log("Updating system packages...");

        if (!ctx.packages.refreshIndex()) {
            ctx.logger.error("An error occurred while refreshing the package index.");
            return StepResult::Failed;
        }

        if (!ctx.packages.upgradeAll()) {
            ctx.logger.error("An error occurred while upgrading the system.");
            return StepResult::Failed;
        }

        ctx.logger.log("System packages are up to date.");
        return StepResult::Done;
    }

    /**
     * ------------------------------------------------------------------------
     * Installer::checkAndInstall
     * ------------------------------------------------------------------------
     */
    InstallOutcome Installer::checkAndInstall(RunContext& ctx, const std::string& packageName) {
        if (ctx.packages.isInstalled(packageName)) {
            ctx.logger.log(packageName + " is already installed.");
            return InstallOutcome::AlreadyInstalled;
        }

        ctx.logger.log("Installing " + packageName + "...");
        if (ctx.packages.install(packageName)) {
            ctx.logger.log(packageName + " successfully installed.");
            return InstallOutcome::Installed;
        }

        ctx.logger.warn("Failed to install " + packageName + ".");
        return InstallOutcome::Failed;
    }

    size_t Installer::installAll(RunContext& ctx, const std::vector<std::string>& packageNames) {
        size_t failures = 0;
        for (const auto& name : packageNames) {
            if (checkAndInstall(ctx, name) == InstallOutcome::Failed) {
                failures++;
            }
        }
        return failures;
    }

    /**
     * ------------------------------------------------------------------------
     * Installer::installFromList
     * ------------------------------------------------------------------------
     */
    StepResult Installer::installFromList(RunContext& ctx) {
        const std::string& listPath = ctx.config.packageList;

        if (!fs::is_regular_file(listPath)) {
            ctx.logger.log("Package list file " + listPath +
                           " not found. Skipping package installation.");
            return StepResult::Skipped;
        }

        ctx.logger.log("Reading package list from " + listPath);

        std::vector<std::string> packageNames;
        try {
            packageNames = PackageList::loadFromFile(listPath);
        } catch (const std::exception& e) {
            ctx.logger.error(e.what());
            return StepResult::Failed;
        }

        size_t failures = installAll(ctx, packageNames);
        if (failures > 0) {
            ctx.logger.warn(std::to_string(failures) + " of " +
                            std::to_string(packageNames.size()) +
                            " packages failed to install.");
            return StepResult::Failed;
        }
        return StepResult::Done;
    }

} // namespace Postinstall
