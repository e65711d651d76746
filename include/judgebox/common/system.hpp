#pragma once

#include <sys/types.h>
#include <string>

namespace judgebox {

/**
 * @brief 根据用户名查找用户 id
 * @return 用户 id，找不到时返回 -1
 */
int get_userid(const char *name);

/**
 * @brief 根据组名查找组 id
 * @return 组 id，找不到时返回 -1
 */
int get_groupid(const char *name);

/**
 * @brief 根据用户 id 查找用户名
 * @return 用户名，找不到时返回空字符串
 */
std::string get_username(uid_t uid);

/**
 * @brief 查找用户的主组 id
 * @return 组 id，找不到时返回 -1
 */
int get_primary_groupid(uid_t uid);

struct identity {
    uid_t uid;
    gid_t gid;
};

/**
 * @brief 运行用户程序的默认身份
 * 以 root 运行时降权到 nobody/nogroup（没有 nogroup 时使用 nobody 的主组），
 * 否则保持当前用户身份。
 */
identity default_identity();

}  // namespace judgebox
