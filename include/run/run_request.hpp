#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace runner {

/**
 * @brief 运行请求中附带的文件
 * 名字为空时，构建运行目录时会生成一个随机的文件名
 */
struct supplied_file {
    std::optional<std::string> name;
    std::string content;
};

/**
 * @brief 沙箱的资源限制，构造之后总是已经被限制在安全范围内
 */
struct resource_limits {
    static constexpr double MIN_TIME_LIMIT = 1, MAX_TIME_LIMIT = 30, DEFAULT_TIME_LIMIT = 5;
    static constexpr double MIN_MEMORY = 64, MAX_MEMORY = 2048, DEFAULT_MEMORY = 512;
    static constexpr double MIN_CPUS = 0.1, MAX_CPUS = 4, DEFAULT_CPUS = 0.5;

    /**
     * @brief 时钟时间限制，单位为秒
     */
    double time_limit = DEFAULT_TIME_LIMIT;

    /**
     * @brief 内存上限，单位为 MB
     */
    double memory = DEFAULT_MEMORY;

    /**
     * @brief 可以使用的 CPU 核心数
     */
    double cpus = DEFAULT_CPUS;

    /**
     * @brief 根据用户给出的值构造资源限制，每一项都被限制在安全范围内
     */
    static resource_limits clamped(double time_limit, double memory, double cpus);
};

/**
 * @brief 将 value 限制在 [min, max] 中，value 为 NaN 时返回 def
 */
double clamp_number(double value, double min, double max, double def);

/**
 * @brief 一次运行请求
 * 请求在构造后不再修改，只在一次运行期间存在
 */
struct run_request {
    /**
     * @brief 要复制到运行目录中的工作区，使用前会被清洗
     */
    std::optional<std::string> workspace_id;

    /**
     * @brief 附带的文件，在工作区文件之后写入，后面的同名文件覆盖前面的
     */
    std::vector<supplied_file> files;

    /**
     * @brief 语言标识，必须是支持的语言之一，否则运行立即失败
     */
    std::string language;

    std::string stdin_text;

    resource_limits limits;
};

/**
 * @brief 从 JSON 解析运行请求
 * 数字、数字字符串会被限制在安全范围内；不存在、null 或无法解析的资源参数使用默认值。
 * language 缺失时为空串，运行时会被当作不支持的语言拒绝。
 */
void from_json(const nlohmann::json &j, run_request &request);

}  // namespace runner
