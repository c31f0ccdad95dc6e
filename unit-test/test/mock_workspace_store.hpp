#pragma once

#include "gmock/gmock.h"
#include "workspace/workspace_store.hpp"

namespace runner::test {

struct mock_workspace_store : public workspace_store {
    MOCK_METHOD(std::string, create, (), (override));
    MOCK_METHOD(std::vector<std::string>, list, (const std::string &workspace_id), (override));
    MOCK_METHOD(std::string, read, (const std::string &workspace_id, const std::string &filename), (override));
    MOCK_METHOD(void, write, (const std::string &workspace_id, const std::string &filename, const std::string &content), (override));
    MOCK_METHOD(void, remove, (const std::string &workspace_id, const std::string &filename), (override));
};

}  // namespace runner::test
