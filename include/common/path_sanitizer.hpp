#pragma once

#include <filesystem>
#include <string>

namespace runner {

/**
 * @brief 将用户提供的文件名或标识符中 [A-Za-z0-9_.-] 以外的字符替换为 '_'
 * @param name 用户提供的名字
 * @return 清洗后的名字，输入为空时返回空串
 */
std::string sanitize_name(const std::string &name);

/**
 * @brief 判断 path 是否严格位于 root 之内（不等于 root 本身）
 * 两个路径都会先经过 weakly_canonical 规范化，因此 root/a/../.. 这样的路径会被识别出来
 */
bool is_contained_in(const std::filesystem::path &root, const std::filesystem::path &path);

/**
 * @brief 将用户提供的名字解析为 root 下的一个路径
 * 由于运行引擎可能以特权运行，如果拿到的文件名包含 "../"，那么
 * 最后有可能导致系统重要文件被覆盖导致安全问题。
 * 1. 拒绝空名字、含有 NUL 字节、以 '/' 或 '\' 开头、含有 ".." 路径段的名字
 * 2. 通过 sanitize_name 清洗
 * 3. 检查拼接出的路径仍然严格位于 root 之内
 * 该函数不会访问文件系统（root 的规范化除外）
 * @throw invalid_path 任何一步检查失败
 */
std::filesystem::path resolve_in(const std::filesystem::path &root, const std::string &raw_name);

}  // namespace runner
