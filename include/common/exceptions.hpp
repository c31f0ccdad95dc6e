#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace runner {

struct runner_exception : std::exception {
    explicit runner_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const runner_exception &ex);

    /**
     * @brief 错误类型的名字，用于向调用方区分引擎错误的种类
     */
    virtual const char *kind() const noexcept;

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 用户提供的文件名或工作区 id 在清洗后仍然逃出了期望的根目录
 * 抛出该异常时不会有任何文件系统操作发生
 */
struct invalid_path : public runner_exception {
    explicit invalid_path(const std::string &message);
    const char *kind() const noexcept override;
};

/**
 * @brief 请求的语言不在支持的语言集合中
 * 在创建运行目录之前抛出
 */
struct unsupported_language : public runner_exception {
    explicit unsupported_language(const std::string &language);
    const char *kind() const noexcept override;

    std::string language;
};

/**
 * @brief 表示宿主机无法启动沙箱进程（比如 fork 失败、管道创建失败）
 * 与用户程序自身的失败不同，这是宿主机本身的问题
 */
struct host_execution_error : public runner_exception {
    explicit host_execution_error(const std::string &message);
    const char *kind() const noexcept override;
};

/**
 * @brief 工作区存储的错误，比如工作区不存在
 */
struct workspace_error : public runner_exception {
    explicit workspace_error(const std::string &message);
    const char *kind() const noexcept override;
};

}  // namespace runner
