#include "run/run_request.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cmath>

namespace runner {
using namespace std;
using namespace nlohmann;

double clamp_number(double value, double min, double max, double def) {
    if (std::isnan(value)) return def;
    return std::max(min, std::min(max, value));
}

resource_limits resource_limits::clamped(double time_limit, double memory, double cpus) {
    resource_limits limits;
    limits.time_limit = clamp_number(time_limit, MIN_TIME_LIMIT, MAX_TIME_LIMIT, DEFAULT_TIME_LIMIT);
    limits.memory = clamp_number(memory, MIN_MEMORY, MAX_MEMORY, DEFAULT_MEMORY);
    limits.cpus = clamp_number(cpus, MIN_CPUS, MAX_CPUS, DEFAULT_CPUS);
    return limits;
}

/**
 * @brief 读取一个资源参数，不是数字的值返回 NaN，由 clamp_number 替换成默认值
 */
static double number_field(const json &j, const char *key) {
    if (!j.count(key)) return NAN;
    auto &value = j.at(key);
    if (value.is_number()) return value.get<double>();
    if (value.is_boolean()) return value.get<bool>() ? 1 : 0;
    if (value.is_string()) {
        string text = boost::algorithm::trim_copy(value.get<string>());
        try {
            return boost::lexical_cast<double>(text);
        } catch (boost::bad_lexical_cast &) {
            return NAN;
        }
    }
    return NAN;
}

static string string_field(const json &j, const char *key) {
    if (j.count(key) && j.at(key).is_string()) return j.at(key).get<string>();
    return "";
}

void from_json(const json &j, run_request &request) {
    if (j.count("workspaceId") && j.at("workspaceId").is_string() && !j.at("workspaceId").get<string>().empty())
        request.workspace_id = j.at("workspaceId").get<string>();
    else
        request.workspace_id.reset();

    request.files.clear();
    if (j.count("files") && j.at("files").is_array()) {
        for (auto &item : j.at("files")) {
            if (!item.is_object()) continue;
            supplied_file file;
            string name = string_field(item, "name");
            if (!name.empty()) file.name = name;
            file.content = string_field(item, "content");
            request.files.push_back(move(file));
        }
    }

    request.language = string_field(j, "language");
    request.stdin_text = string_field(j, "stdin");
    request.limits = resource_limits::clamped(number_field(j, "timeLimit"),
                                              number_field(j, "memory"),
                                              number_field(j, "cpus"));
}

}  // namespace runner
