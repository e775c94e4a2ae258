#ifndef SSH_HPP
#define SSH_HPP

#include <string>
#include <vector>
#include <sys/types.h>
#include "step.hpp"

namespace Postinstall {

struct RunContext;

/**
 * @class SshSetup
 * @brief The two SSH steps: registering an operator key and switching the
 *        daemon to key-only authentication.
 */
class SshSetup
{
public:
    /**
     * @brief Optionally appends a public key to ~/.ssh/authorized_keys.
     *
     * Whether to do it comes from `ssh.add_key`: ask the operator (default
     * no), always, or never. The key is the configured URL's listing, the
     * configured key, or one line read from the prompt, appended verbatim.
     * Afterwards ~/.ssh is owned by the target user, the directory is 0700
     * and authorized_keys is 0600.
     */
    static StepResult addAuthorizedKey(RunContext& ctx);

    /**
     * @brief Forces the configured directives into sshd_config and restarts
     *        the SSH service.
     *
     * @return StepResult::Skipped if sshd_config does not exist.
     */
    static StepResult hardenDaemon(RunContext& ctx);

    /**
     * @brief Appends @p keys to `<home>/.ssh/authorized_keys` and fixes
     *        ownership and modes.
     *
     * @throws std::runtime_error / std::filesystem::filesystem_error on failure.
     */
    static void installKeys(const std::string& home, uid_t uid, gid_t gid,
                            const std::vector<std::string>& keys);

    /**
     * @brief Non-empty lines of a downloaded key listing.
     */
    static std::vector<std::string> splitKeyListing(const std::string& listing);
};

} // namespace Postinstall

#endif // SSH_HPP
