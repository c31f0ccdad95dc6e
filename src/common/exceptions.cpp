#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace runner {
using namespace std;

runner_exception::runner_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *runner_exception::kind() const noexcept {
    return "engine_error";
}

const char *runner_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const runner_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

invalid_path::invalid_path(const string &message)
    : runner_exception(message) {}

const char *invalid_path::kind() const noexcept {
    return "invalid_path";
}

unsupported_language::unsupported_language(const string &language)
    : runner_exception("unsupported language '" + language + "'"), language(language) {}

const char *unsupported_language::kind() const noexcept {
    return "unsupported_language";
}

host_execution_error::host_execution_error(const string &message)
    : runner_exception(message) {}

const char *host_execution_error::kind() const noexcept {
    return "host_execution_error";
}

workspace_error::workspace_error(const string &message)
    : runner_exception(message) {}

const char *workspace_error::kind() const noexcept {
    return "workspace_error";
}

}  // namespace runner
