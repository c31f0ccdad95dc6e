#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace runner {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 文件无法打开
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
 * @brief 覆盖写入文本文件
 * @throw std::system_error 文件无法打开或写入失败
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 列出文件夹内的普通文件（不递归），按文件名排序
 * 排序保证了同样的输入总是得到同样的入口文件
 */
std::vector<std::string> list_regular_files(const std::filesystem::path &dir);

/**
 * @brief 统计文件夹内有多少个子文件夹（不递归统计）
 * @return 文件夹内的子文件夹数量，文件夹不存在时返回 -1
 */
int count_directories_in_directory(const std::filesystem::path &dir);

}  // namespace runner
