#ifndef STEP_HPP
#define STEP_HPP

#include <functional>
#include <string>

namespace Postinstall {

struct RunContext;

/**
 * @brief Outcome of one provisioning step.
 */
enum class StepResult
{
    Done,     ///< The step applied its change.
    Skipped,  ///< A precondition was absent or the operator declined.
    Failed    ///< The step tried and failed; logged already.
};

/**
 * @struct Step
 * @brief A named provisioning action.
 *
 * A step marked fatal ends the run when it returns StepResult::Failed.
 */
struct Step
{
    std::string name;
    bool fatal = false;
    std::function<StepResult(RunContext&)> action;
};

} // namespace Postinstall

#endif // STEP_HPP
