#pragma once

#include <string>

namespace judgebox {

/**
 * @brief 判断字符串是否全部由数字组成
 * 用于区分用户名与用户 id 等场景
 */
bool is_number(const std::string &s);

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

}  // namespace judgebox
