#pragma once

#include <filesystem>
#include <string>

namespace judgebox {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 判断 subpath 在词法上不会跳出所在的根目录
 * 这里用于确保计算挂载目标时不会出现目录遍历，由于沙箱
 * 搭建阶段拥有 root 权限，如果挂载目标包含 "../" 并越过了
 * chroot 根目录，那么宿主机的目录有可能被覆盖。
 * @param subpath 被检查的路径，绝对路径视为相对于根目录
 */
bool is_contained_path(const std::filesystem::path &subpath);

}  // namespace judgebox
