#include "judgebox/common/system.hpp"
#include <errno.h>
#include <grp.h>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace judgebox {

int get_userid(const char *name)
{
    struct passwd *pwd;

    errno = 0;
    pwd = getpwnam(name);

    if (!pwd || errno) return -1;
    return (int) pwd->pw_uid;
}

int get_groupid(const char *name)
{
    struct group *g;

    errno = 0;
    g = getgrnam(name);

    if (!g || errno) return -1;
    return (int) g->gr_gid;
}

std::string get_username(uid_t uid)
{
    struct passwd *pwd;

    errno = 0;
    pwd = getpwuid(uid);

    if (!pwd || errno) return "";
    return pwd->pw_name;
}

int get_primary_groupid(uid_t uid)
{
    struct passwd *pwd;

    errno = 0;
    pwd = getpwuid(uid);

    if (!pwd || errno) return -1;
    return (int) pwd->pw_gid;
}

identity default_identity()
{
    if (geteuid() != 0) return {getuid(), getgid()};

    int uid = get_userid("nobody");
    if (uid < 0) uid = 65534;
    int gid = get_groupid("nogroup");
    if (gid < 0) gid = get_primary_groupid(uid);
    if (gid < 0) gid = 65534;
    return {(uid_t) uid, (gid_t) gid};
}

}  // namespace judgebox
