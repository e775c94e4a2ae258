#ifndef USER_IDENTITY_HPP
#define USER_IDENTITY_HPP

#include <string>
#include <optional>
#include <vector>
#include <sys/types.h>

namespace Postinstall {

/**
 * @struct UserIdentity
 * @brief The human operator the per-user steps act on: the account that was
 *        logged in before privileges were raised, never root.
 */
struct UserIdentity
{
    std::string name;
    uid_t uid = 0;
    gid_t gid = 0;
    std::string home;

    /**
     * @brief Looks up a named account in the password database.
     *
     * @param name Login name.
     * @return The identity, or std::nullopt if the account does not exist.
     */
    static std::optional<UserIdentity> lookup(const std::string& name);

    /**
     * @brief Resolves the operator behind the current (root) process.
     *
     * Tries the controlling terminal's login name first (what `logname`
     * reports), then $SUDO_USER, then $PKEXEC_UID. Root itself is never
     * accepted as the result.
     *
     * @return The operator, or std::nullopt if none can be determined.
     */
    static std::optional<UserIdentity> resolveLoginUser();

    /**
     * @brief Returns the first candidate that exists and is not uid 0.
     */
    static std::optional<UserIdentity> pickOperator(const std::vector<std::string>& candidates);
};

} // namespace Postinstall

#endif // USER_IDENTITY_HPP
