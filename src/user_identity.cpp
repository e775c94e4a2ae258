#include "user_identity.hpp"

#include <pwd.h>
#include <unistd.h>
#include <cstdlib>
#include <vector>
#include <string>

namespace Postinstall {

std::optional<UserIdentity> UserIdentity::lookup(const std::string& name)
{
    if (name.empty()) {
        return std::nullopt;
    }

    long bufSize = sysconf(_SC_GETPW_R_SIZE_MAX);
    if (bufSize <= 0) {
        bufSize = 16384;
    }
    std::vector<char> buffer(static_cast<size_t>(bufSize));

    struct passwd pwd;
    struct passwd* result = nullptr;
    if (getpwnam_r(name.c_str(), &pwd, buffer.data(), buffer.size(), &result) != 0 ||
        result == nullptr) {
        return std::nullopt;
    }

    UserIdentity identity;
    identity.name = result->pw_name;
    identity.uid  = result->pw_uid;
    identity.gid  = result->pw_gid;
    identity.home = (result->pw_dir && *result->pw_dir) ? result->pw_dir
                                                        : "/home/" + identity.name;
    return identity;
}

std::optional<UserIdentity> UserIdentity::resolveLoginUser()
{
    std::vector<std::string> candidates;

    if (const char* login = getlogin()) {
        candidates.emplace_back(login);
    }
    if (const char* sudoUser = std::getenv("SUDO_USER")) {
        candidates.emplace_back(sudoUser);
    }
    if (const char* pkexecUid = std::getenv("PKEXEC_UID")) {
        char* end = nullptr;
        unsigned long uid = std::strtoul(pkexecUid, &end, 10);
        if (end != pkexecUid && *end == '\0') {
            if (struct passwd* pw = getpwuid(static_cast<uid_t>(uid))) {
                candidates.emplace_back(pw->pw_name);
            }
        }
    }

    return pickOperator(candidates);
}

std::optional<UserIdentity> UserIdentity::pickOperator(const std::vector<std::string>& candidates)
{
    for (const auto& name : candidates) {
        auto identity = lookup(name);
        if (identity && identity->uid != 0) {
            return identity;
        }
    }
    return std::nullopt;
}

} // namespace Postinstall
