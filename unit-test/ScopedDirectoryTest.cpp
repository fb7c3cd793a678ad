#include <filesystem>
#include <set>
#include <stdexcept>

#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/scoped_directory.hpp"

using namespace std;
using namespace std::filesystem;
using namespace passk;

class ScopedDirectoryTest : public ::testing::Test {
protected:
    scoped_directory root;
};

TEST_F(ScopedDirectoryTest, CreatesPrivateDirectory) {
    scoped_directory dir(root.path(), "attempt_");
    ASSERT_TRUE(is_directory(dir.path()));
    EXPECT_EQ(dir.path().parent_path().string(), root.path().string());
    EXPECT_EQ(dir.path().filename().string().rfind("attempt_", 0), 0u);
    EXPECT_EQ(status(dir.path()).permissions() & perms::all, perms::owner_all);
}

TEST_F(ScopedDirectoryTest, RemovedOnDestruction) {
    path created;
    {
        scoped_directory dir(root.path());
        created = dir.path();
        write_file_content(created / "main.cpp", "int main() {}");
        create_directories(created / "nested" / "deeper");
        write_file_content(created / "nested" / "deeper" / "file", "x");
    }
    EXPECT_FALSE(exists(created));
    EXPECT_TRUE(filesystem::is_empty(root.path()));
}

TEST_F(ScopedDirectoryTest, RemovedWhenExceptionThrown) {
    path created;
    try {
        scoped_directory dir(root.path());
        created = dir.path();
        throw runtime_error("evaluation failed");
    } catch (runtime_error &) {
    }
    EXPECT_FALSE(created.empty());
    EXPECT_FALSE(exists(created));
}

TEST_F(ScopedDirectoryTest, UniqueNames) {
    set<path> names;
    vector<scoped_directory> dirs;
    for (int i = 0; i < 100; ++i) {
        dirs.emplace_back(root.path());
        names.insert(dirs.back().path());
    }
    EXPECT_EQ(names.size(), 100u);
}

TEST_F(ScopedDirectoryTest, MoveTransfersOwnership) {
    scoped_directory first(root.path());
    path created = first.path();
    scoped_directory second(move(first));
    EXPECT_TRUE(first.path().empty());
    EXPECT_EQ(second.path().string(), created.string());
    EXPECT_TRUE(exists(created));

    second.remove();
    EXPECT_FALSE(exists(created));
    EXPECT_TRUE(second.path().empty());
}

TEST_F(ScopedDirectoryTest, UnusableRoot) {
    write_file_content(root.path() / "file", "not a directory");
    EXPECT_THROW({ scoped_directory dir(root.path() / "file"); }, sandbox_unavailable);
}

TEST_F(ScopedDirectoryTest, RelativeRootBecomesAbsolute) {
    path relative_root = relative(root.path(), current_path());
    ASSERT_TRUE(relative_root.is_relative());

    scoped_directory dir(relative_root);
    EXPECT_TRUE(dir.path().is_absolute());
    EXPECT_EQ(canonical(dir.path().parent_path()).string(), canonical(root.path()).string());
}
