#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "test/temp_dir.hpp"
#include "workspace/workspace_store.hpp"

using namespace std;
using namespace runner;

class WorkspaceStoreTest : public ::testing::Test {
protected:
    test::temp_dir root;
    local_workspace_store store{root.path()};
};

TEST_F(WorkspaceStoreTest, CreateSeedsHelloWorld) {
    string id = store.create();
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(store.list(id), (vector<string>{"Main.java", "main.cpp", "main.py"}));
    EXPECT_NE(store.read(id, "main.py").find("Hello"), string::npos);
    EXPECT_NE(store.create(), id);
}

TEST_F(WorkspaceStoreTest, WriteReadRemove) {
    string id = store.create();
    store.write(id, "notes.txt", "todo");
    EXPECT_EQ(store.read(id, "notes.txt"), "todo");

    store.write(id, "notes.txt", "done");
    EXPECT_EQ(store.read(id, "notes.txt"), "done");

    store.remove(id, "notes.txt");
    EXPECT_THROW(store.read(id, "notes.txt"), workspace_error);
    store.remove(id, "notes.txt");
}

TEST_F(WorkspaceStoreTest, UnknownWorkspace) {
    EXPECT_THROW(store.list("missing"), workspace_error);
    EXPECT_THROW(store.read("missing", "main.py"), workspace_error);
}

TEST_F(WorkspaceStoreTest, RejectsTraversal) {
    string id = store.create();
    EXPECT_THROW(store.read(id, "../../etc/passwd"), invalid_path);
    EXPECT_THROW(store.write(id, "/etc/evil", "x"), invalid_path);
    EXPECT_THROW(store.list(".."), invalid_path);
}
