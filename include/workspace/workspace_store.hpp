#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace runner {

/**
 * @brief 工作区的持久化文件存储，只提供增删改查
 * 运行引擎只会通过 list、read 复制工作区中的文件，永远不会修改工作区。
 * 所有穿过这个接口的文件名都必须已经经过 sanitize_name 清洗。
 * 实现必须允许多个线程同时读取同一个工作区。
 */
struct workspace_store {
    virtual ~workspace_store();

    /**
     * @brief 新建一个工作区
     * @return 新工作区的 id
     */
    virtual std::string create() = 0;

    /**
     * @brief 列出工作区中的文件名
     * @throw workspace_error 工作区不存在
     */
    virtual std::vector<std::string> list(const std::string &workspace_id) = 0;

    /**
     * @throw workspace_error 工作区或文件不存在
     */
    virtual std::string read(const std::string &workspace_id, const std::string &filename) = 0;

    virtual void write(const std::string &workspace_id, const std::string &filename, const std::string &content) = 0;

    virtual void remove(const std::string &workspace_id, const std::string &filename) = 0;
};

/**
 * @brief 基于本地文件系统的工作区存储
 * WORKSPACE_DIR
 * ├── 0b7e... // 工作区 id（随机 uuid）
 * │   ├── main.py
 * │   ├── Main.java
 * │   └── main.cpp
 * └── ...
 */
struct local_workspace_store : public workspace_store {
    explicit local_workspace_store(const std::filesystem::path &root);

    /**
     * @brief 新建工作区，并写入三种语言的 Hello World 示例文件
     */
    std::string create() override;

    std::vector<std::string> list(const std::string &workspace_id) override;

    std::string read(const std::string &workspace_id, const std::string &filename) override;

    void write(const std::string &workspace_id, const std::string &filename, const std::string &content) override;

    /**
     * @brief 删除工作区中的文件，文件不存在时什么也不做
     */
    void remove(const std::string &workspace_id, const std::string &filename) override;

private:
    std::filesystem::path workspace_path(const std::string &workspace_id) const;

    std::filesystem::path root;
};

}  // namespace runner
