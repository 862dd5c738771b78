#include "papercache/util/users.hh"
#include "papercache/util/environment-variables.hh"
#include "papercache/util/logging.hh"

#include <cerrno>
#include <vector>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace papercache {

Path getHomeOf(uid_t userId)
{
    std::vector<char> buf(16384);
    struct passwd pwbuf;
    struct passwd * pw = nullptr;
    int err = getpwuid_r(userId, &pwbuf, buf.data(), buf.size(), &pw);
    if (err != 0)
        throw SysError(err, "looking up user %d", userId);
    if (!pw || !pw->pw_dir || !*pw->pw_dir)
        throw Error("user %d has no home directory", userId);
    return pw->pw_dir;
}

static Path findHome()
{
    auto home = getEnvNonEmpty("HOME");
    if (!home)
        return getHomeOf(geteuid());

    struct stat st;
    if (stat(home->c_str(), &st) == -1) {
        /* A home that does not exist yet is still ours to create. */
        if (errno == ENOENT)
            return *home;
        warn("cannot check $HOME ('%s'): %s; using the password database", *home, strerror(errno));
        return getHomeOf(geteuid());
    }

    if (st.st_uid != geteuid()) {
        auto fallback = getHomeOf(geteuid());
        if (fallback != *home)
            warn("$HOME ('%s') is not owned by you; using '%s' instead", *home, fallback);
        return fallback;
    }

    return *home;
}

Path getHome()
{
    static const Path home = findHome();
    return home;
}

} // namespace papercache
