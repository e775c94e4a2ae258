#ifndef ORCHESTRATOR_HPP
#define ORCHESTRATOR_HPP

#include <vector>
#include "step.hpp"

namespace Postinstall {

struct RunContext;

/**
 * @brief Tally of step outcomes for the closing log line.
 */
struct RunSummary
{
    size_t done = 0;
    size_t skipped = 0;
    size_t failed = 0;
};

/**
 * @class Orchestrator
 * @brief Runs the provisioning steps once, in order.
 *
 * Only the privilege guard and steps flagged fatal can end a run early;
 * every other failure is logged and the next step runs.
 */
class Orchestrator
{
public:
    /**
     * @brief The standard sequence: system upgrade (fatal), package list,
     *        MOTD, .bashrc, .nanorc, SSH key, sshd hardening.
     */
    static std::vector<Step> defaultSteps();

    /**
     * @brief Logs and rejects a context whose effective uid is not root.
     * @return True if the run may proceed.
     */
    static bool checkPrivileges(RunContext& ctx);

    /**
     * @brief Executes @p steps after the privilege guard.
     *
     * @param ctx     The run context.
     * @param steps   Steps to run, in order.
     * @param summary Optional out-parameter receiving the outcome tally.
     * @return Process exit status: 0 after the full sequence, 1 if the guard
     *         or a fatal step stopped the run.
     */
    static int run(RunContext& ctx, const std::vector<Step>& steps,
                   RunSummary* summary = nullptr);
};

} // namespace Postinstall

#endif // ORCHESTRATOR_HPP
