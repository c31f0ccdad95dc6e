#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "monitor/monitor.hpp"
#include "run/run_directory.hpp"
#include "test/mock_workspace_store.hpp"
#include "test/temp_dir.hpp"

using namespace std;
using namespace runner;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class RunDirectoryTest : public ::testing::Test {
protected:
    test::temp_dir root;
    test::mock_workspace_store store;
    counting_monitor mon;

    run_directory_builder builder() {
        return run_directory_builder(root.path(), store, mon);
    }
};

TEST_F(RunDirectoryTest, BuildsFreshDirectoryWithStdin) {
    run_request request;
    request.language = "python";
    request.stdin_text = "42\n";
    request.files.push_back({"main.py", "print(input())"});

    auto b = builder();
    run_directory dir = b.build(request);

    EXPECT_EQ(dir.path().parent_path().string(), root.path().string());
    EXPECT_EQ(dir.id().rfind("run_", 0), 0u);
    EXPECT_EQ(read_file_content(dir.path() / "main.py"), "print(input())");
    EXPECT_EQ(read_file_content(dir.path() / "input.txt"), "42\n");
}

TEST_F(RunDirectoryTest, WritesEmptyStdin) {
    auto b = builder();
    run_directory dir = b.build(run_request());
    EXPECT_TRUE(filesystem::is_regular_file(dir.path() / "input.txt"));
    EXPECT_EQ(read_file_content(dir.path() / "input.txt"), "");
}

TEST_F(RunDirectoryTest, DistinctDirectoriesPerBuild) {
    auto b = builder();
    run_directory first = b.build(run_request());
    run_directory second = b.build(run_request());
    EXPECT_NE(first.path().string(), second.path().string());
    EXPECT_EQ(count_directories_in_directory(root.path()), 2);
}

TEST_F(RunDirectoryTest, CopiesWorkspaceThenOverridesWithSuppliedFiles) {
    EXPECT_CALL(store, list("ws1")).WillOnce(Return(vector<string>{"Main.java", "main.py"}));
    EXPECT_CALL(store, read("ws1", "Main.java")).WillOnce(Return("class Main {}"));
    EXPECT_CALL(store, read("ws1", "main.py")).WillOnce(Return("print('workspace')"));

    run_request request;
    request.workspace_id = "ws1";
    request.files.push_back({"main.py", "print('first')"});
    request.files.push_back({"main.py", "print('second')"});

    auto b = builder();
    run_directory dir = b.build(request);
    EXPECT_EQ(read_file_content(dir.path() / "Main.java"), "class Main {}");
    EXPECT_EQ(read_file_content(dir.path() / "main.py"), "print('second')");
}

TEST_F(RunDirectoryTest, SkipsWorkspaceFileThatFailsToCopy) {
    EXPECT_CALL(store, list("ws1")).WillOnce(Return(vector<string>{"broken.py", "main.py"}));
    EXPECT_CALL(store, read("ws1", "broken.py")).WillOnce(Throw(workspace_error("disk error")));
    EXPECT_CALL(store, read("ws1", "main.py")).WillOnce(Return("print(1)"));

    run_request request;
    request.workspace_id = "ws1";

    auto b = builder();
    run_directory dir = b.build(request);
    EXPECT_FALSE(filesystem::exists(dir.path() / "broken.py"));
    EXPECT_EQ(read_file_content(dir.path() / "main.py"), "print(1)");
    EXPECT_EQ(mon.workspace_copy_failures.load(), 1u);
}

TEST_F(RunDirectoryTest, MissingWorkspaceIsNotFatal) {
    EXPECT_CALL(store, list("gone")).WillOnce(Throw(workspace_error("workspace gone does not exist")));
    EXPECT_CALL(store, read(_, _)).Times(0);

    run_request request;
    request.workspace_id = "gone";
    request.files.push_back({"main.py", "print(1)"});

    auto b = builder();
    run_directory dir = b.build(request);
    EXPECT_EQ(read_file_content(dir.path() / "main.py"), "print(1)");
    EXPECT_EQ(mon.workspace_copy_failures.load(), 1u);
}

TEST_F(RunDirectoryTest, SanitizesWorkspaceId) {
    EXPECT_CALL(store, list("my_workspace")).WillOnce(Return(vector<string>{}));

    run_request request;
    request.workspace_id = "my workspace";
    auto b = builder();
    run_directory dir = b.build(request);
}

TEST_F(RunDirectoryTest, SynthesizesNameForAnonymousFile) {
    run_request request;
    request.files.push_back({nullopt, "data"});

    auto b = builder();
    run_directory dir = b.build(request);
    vector<string> files = list_regular_files(dir.path());
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].rfind("file_", 0), 0u);
    EXPECT_EQ(read_file_content(dir.path() / files[0]), "data");
    EXPECT_EQ(files[1], "input.txt");
}

TEST_F(RunDirectoryTest, InvalidFileNameWritesNothing) {
    EXPECT_CALL(store, list(_)).Times(0);

    run_request request;
    request.workspace_id = "ws1";
    request.files.push_back({"main.py", "print(1)"});
    request.files.push_back({"../evil.py", "print(2)"});

    auto b = builder();
    EXPECT_THROW(b.build(request), invalid_path);
    EXPECT_TRUE(filesystem::is_empty(root.path()));
    EXPECT_FALSE(filesystem::exists(root.path().parent_path() / "evil.py"));
}

TEST_F(RunDirectoryTest, InvalidWorkspaceIdWritesNothing) {
    EXPECT_CALL(store, list(_)).Times(0);

    run_request request;
    request.workspace_id = "../../etc";

    auto b = builder();
    EXPECT_THROW(b.build(request), invalid_path);
    EXPECT_TRUE(filesystem::is_empty(root.path()));
}

TEST_F(RunDirectoryTest, RemovedExactlyOnce) {
    auto b = builder();
    run_directory dir = b.build(run_request());
    filesystem::path path = dir.path();

    EXPECT_TRUE(dir.remove());
    EXPECT_FALSE(filesystem::exists(path));
    EXPECT_TRUE(dir.released());

    // 同名目录再次出现时不会被第二次删除
    filesystem::create_directory(path);
    EXPECT_FALSE(dir.remove());
    EXPECT_TRUE(filesystem::exists(path));
}

TEST_F(RunDirectoryTest, RepeatedRemoveDoesNotThrowWhenRootIsUnreadable) {
    auto b = builder();
    run_directory dir = b.build(run_request());
    EXPECT_TRUE(dir.remove());

    filesystem::permissions(root.path(), filesystem::perms::none);
    EXPECT_NO_THROW(dir.remove());
    filesystem::permissions(root.path(), filesystem::perms::owner_all);
}

TEST_F(RunDirectoryTest, RemovedOnDestruction) {
    filesystem::path path;
    {
        auto b = builder();
        run_directory dir = b.build(run_request());
        path = dir.path();
        EXPECT_TRUE(filesystem::exists(path));
    }
    EXPECT_FALSE(filesystem::exists(path));
    EXPECT_EQ(mon.cleanup_failures.load(), 0u);
}

TEST_F(RunDirectoryTest, MovedHandleOwnsDirectory) {
    auto b = builder();
    run_directory dir = b.build(run_request());
    filesystem::path path = dir.path();
    {
        run_directory moved(move(dir));
        EXPECT_TRUE(dir.released());
        EXPECT_TRUE(filesystem::exists(path));
    }
    EXPECT_FALSE(filesystem::exists(path));
}
