#ifndef OVERLAY_HPP
#define OVERLAY_HPP

#include <string>
#include "step.hpp"

namespace Postinstall {

struct RunContext;

/**
 * @class Overlay
 * @brief Copies or appends the operator-supplied configuration fragments
 *        onto system and user files.
 */
class Overlay
{
public:
    /**
     * @brief Markers delimiting the block written in RcMode::Managed.
     */
    static const char* const kBlockBegin;
    static const char* const kBlockEnd;

    /**
     * @brief Copies `<config_dir>/motd.txt` over the MOTD file.
     *
     * @return StepResult::Skipped if the source is missing.
     */
    static StepResult updateMotd(RunContext& ctx);

    /**
     * @brief Merges `<config_dir>/<sourceName>` into `~/<targetName>` of the
     *        target user, then gives the file to that user.
     *
     * The destination is created if absent. In RcMode::Append the fragment
     * is appended on every run; in RcMode::Managed it replaces the previous
     * managed block.
     *
     * @param sourceName File name inside the configuration directory.
     * @param targetName File name inside the user's home directory.
     * @return StepResult::Skipped if the source is missing or no target user
     *         was resolved.
     */
    static StepResult mergeUserRc(RunContext& ctx,
                                  const std::string& sourceName,
                                  const std::string& targetName);

    /**
     * @brief Returns @p existing with @p fragment placed in the managed block,
     *        replacing a previous block or appending a new one.
     */
    static std::string applyManagedBlock(const std::string& existing,
                                         const std::string& fragment);
};

} // namespace Postinstall

#endif // OVERLAY_HPP
