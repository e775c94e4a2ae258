#include "orchestrator.hpp"
#include "context.hpp"
#include "install.hpp"
#include "overlay.hpp"
#include "ssh.hpp"

#include <stdexcept>
#include <string>

namespace Postinstall {

std::vector<Step> Orchestrator::defaultSteps()
{
    return {
        {"system upgrade", true, &Installer::upgradeSystem},
        {"package installation", false, &Installer::installFromList},
        {"motd", false, &Overlay::updateMotd},
        {".bashrc", false, [](RunContext& ctx) {
            return Overlay::mergeUserRc(ctx, "bashrc.append", ".bashrc");
        }},
        {".nanorc", false, [](RunContext& ctx) {
            return Overlay::mergeUserRc(ctx, "nanorc.append", ".nanorc");
        }},
        {"ssh public key", false, &SshSetup::addAuthorizedKey},
        {"sshd hardening", false, &SshSetup::hardenDaemon},
    };
}

bool Orchestrator::checkPrivileges(RunContext& ctx)
{
    if (ctx.effectiveUid != 0) {
        ctx.logger.error("This program must be run as root.");
        return false;
    }
    return true;
}

int Orchestrator::run(RunContext& ctx, const std::vector<Step>& steps, RunSummary* summary)
{
    RunSummary tally;

    ctx.logger.log("Starting post-installation. Logged user: " +
                   (ctx.user ? ctx.user->name : std::string("<unknown>")));

    if (!checkPrivileges(ctx)) {
        return 1;
    }

    for (const auto& step : steps) {
        StepResult result = StepResult::Failed;
        try {
            result = step.action(ctx);
        } catch (const std::exception& e) {
            ctx.logger.error("Step '" + step.name + "' failed: " + e.what());
        }

        switch (result) {
        case StepResult::Done:
            tally.done++;
            break;
        case StepResult::Skipped:
            tally.skipped++;
            break;
        case StepResult::Failed:
            tally.failed++;
            if (step.fatal) {
                ctx.logger.error("Aborting: " + step.name + " failed.");
                if (summary) *summary = tally;
                return 1;
            }
            break;
        }
    }

    ctx.logger.log("Post-installation completed: " +
                   std::to_string(tally.done) + " done, " +
                   std::to_string(tally.skipped) + " skipped, " +
                   std::to_string(tally.failed) + " failed.");
    if (summary) *summary = tally;
    return 0;
}

} // namespace Postinstall
