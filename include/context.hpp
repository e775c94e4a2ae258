#ifndef CONTEXT_HPP
#define CONTEXT_HPP

#include "config.hpp"
#include "utils.hpp"
#include "package_manager.hpp"
#include "service_manager.hpp"
#include "prompt.hpp"
#include "user_identity.hpp"
#include "backup.hpp"

#include <optional>
#include <string>
#include <sys/types.h>

namespace Postinstall {

/**
 * @struct RunContext
 * @brief Everything a provisioning step may touch, built once by main() and
 *        passed by reference to each step.
 */
struct RunContext
{
    const Config& config;
    Logger& logger;
    PackageManager& packages;
    ServiceManager& services;
    Prompt& prompt;

    /**
     * @brief The operator; empty if it could not be resolved, in which case
     *        the per-user steps are skipped.
     */
    std::optional<UserIdentity> user;

    /**
     * @brief Effective uid of the process, checked by the privilege guard.
     */
    uid_t effectiveUid = 0;

    /**
     * @brief Pre-change archive; null when backups are disabled.
     */
    Backup* backup = nullptr;
};

/**
 * @brief Saves @p path into the run's backup archive before it is modified.
 *        A failure is logged as a warning and otherwise ignored.
 */
inline void backupBeforeChange(RunContext& ctx, const std::string& path)
{
    if (ctx.backup && !ctx.backup->add(path)) {
        ctx.logger.warn("Could not back up " + path + ": " + ctx.backup->lastError());
    }
}

} // namespace Postinstall

#endif // CONTEXT_HPP
