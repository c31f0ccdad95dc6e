#pragma once

#include <filesystem>
#include <string>
#include "monitor/monitor.hpp"
#include "run/run_request.hpp"
#include "workspace/workspace_store.hpp"

namespace runner {

/**
 * @brief 一次运行独占的临时目录
 * 目录在运行结束时无条件删除，且只删除一次：调用方可以在拿到结果后主动调用 remove，
 * 否则析构时删除。删除失败只记录日志并上报监控，不会抛出异常，
 * 以免覆盖已经得到的运行结果。
 */
struct run_directory {
    run_directory(const std::filesystem::path &dir, monitor &mon);
    run_directory(run_directory &&other);
    run_directory(const run_directory &) = delete;
    run_directory &operator=(const run_directory &) = delete;
    ~run_directory();

    const std::filesystem::path &path() const;

    /**
     * @brief 运行 id，即目录名
     */
    std::string id() const;

    /**
     * @brief 删除目录，重复调用不会再次删除
     * @return true 若目录已经不存在
     */
    bool remove();

    bool released() const;

private:
    std::filesystem::path dir;
    monitor *mon;
    bool done;
};

/**
 * @brief 为每个运行请求构建全新的运行目录
 * 1. 在执行根目录下创建 run_<uuid> 目录，名字只来自随机 uuid
 * 2. 如果请求指定了工作区，把工作区中的文件复制进来，单个文件失败时跳过
 * 3. 写入请求附带的文件，覆盖同名文件
 * 4. 写入 input.txt 作为标准输入，即使为空
 * 构建完成后，目录就是这次运行的全部输入，之后不再读取任何外部数据。
 */
struct run_directory_builder {
    /**
     * @param root 执行根目录，所有运行目录都是它的直接子目录
     * @param store 工作区存储
     * @param mon 接收工作区复制失败、目录删除失败的事件
     */
    run_directory_builder(const std::filesystem::path &root, workspace_store &store, monitor &mon);

    /**
     * @throw invalid_path 工作区 id 或附带文件名非法，此时不会创建任何目录
     * @throw std::system_error 无法创建目录或写入文件，已经创建的目录会被删除
     */
    run_directory build(const run_request &request);

private:
    void copy_workspace(const std::string &workspace_id, const std::filesystem::path &dir);

    std::filesystem::path root;
    workspace_store &store;
    monitor &mon;
};

}  // namespace runner
