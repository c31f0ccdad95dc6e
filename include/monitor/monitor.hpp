#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include "run/execution_outcome.hpp"

namespace runner {

/**
 * @brief 执行监控行为
 * 尽力而为的失败（工作区文件复制失败、运行目录删除失败）不会中断运行，
 * 但会通过这里上报，以便运维发现工作区存储或磁盘的系统性问题。
 * 所有的回调都可能被多个运行并发调用。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报一次运行已经开始
     * @param run_id 运行目录的名字
     * @param language 请求的语言
     */
    virtual void start_run(const std::string &run_id, const std::string &language);

    /**
     * @brief 监控上报一次运行已经得到结果
     */
    virtual void end_run(const std::string &run_id, const execution_outcome &outcome);

    /**
     * @brief 监控上报一次运行因为引擎错误而失败（非法路径、不支持的语言、宿主机错误）
     * @param kind 错误类型名
     */
    virtual void run_failed(const std::string &kind, const std::string &message);

    /**
     * @brief 监控上报工作区中的某个文件没能复制到运行目录中
     */
    virtual void workspace_copy_failed(const std::string &workspace_id, const std::string &filename, const std::string &reason);

    /**
     * @brief 监控上报运行目录删除失败
     */
    virtual void cleanup_failed(const std::filesystem::path &dir, const std::string &reason);
};

/**
 * @brief 统计各类事件次数的监控器
 */
struct counting_monitor : public monitor {
    std::atomic<size_t> runs_started{0};
    std::atomic<size_t> runs_finished{0};
    std::atomic<size_t> runs_failed{0};
    std::atomic<size_t> build_failures{0};
    std::atomic<size_t> timeouts{0};
    std::atomic<size_t> host_errors{0};
    std::atomic<size_t> workspace_copy_failures{0};
    std::atomic<size_t> cleanup_failures{0};

    void start_run(const std::string &run_id, const std::string &language) override;
    void end_run(const std::string &run_id, const execution_outcome &outcome) override;
    void run_failed(const std::string &kind, const std::string &message) override;
    void workspace_copy_failed(const std::string &workspace_id, const std::string &filename, const std::string &reason) override;
    void cleanup_failed(const std::filesystem::path &dir, const std::string &reason) override;
};

/**
 * @brief 将事件转发给另一个监控器，监控器抛出的异常只记录日志，不会影响运行
 */
struct guarded_monitor : public monitor {
    /**
     * @param target 被转发的监控器，为空时丢弃所有事件
     */
    explicit guarded_monitor(monitor *target);

    void start_run(const std::string &run_id, const std::string &language) override;
    void end_run(const std::string &run_id, const execution_outcome &outcome) override;
    void run_failed(const std::string &kind, const std::string &message) override;
    void workspace_copy_failed(const std::string &workspace_id, const std::string &filename, const std::string &reason) override;
    void cleanup_failed(const std::filesystem::path &dir, const std::string &reason) override;

private:
    template <typename F>
    void call(const char *event, F &&callback);

    monitor *target;
};

}  // namespace runner
