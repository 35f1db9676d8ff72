#include <gtest/gtest.h>

#include "../src/TaskCatalog.hh"
#include "../src/TaskExecutor.hh"
#include "test_helpers.hh"

TEST(TaskCatalogTest, KeepsExistingEntriesInCatalogOrder)
{
    TempDir dir;
    dir.writeScript("c.sh", "exit 0");
    dir.writeScript("a.sh", "exit 0");
    dir.writeScript("b.sh", "exit 0");

    auto tasks = resolveCatalog(dir.path(), {"b.sh", "a.sh", "c.sh"});

    ASSERT_EQ(tasks.size(), 3u);
    EXPECT_EQ(tasks[0].name, "b");
    EXPECT_EQ(tasks[1].name, "a");
    EXPECT_EQ(tasks[2].name, "c");
    EXPECT_EQ(tasks[0].entry, "b.sh");
    EXPECT_EQ(tasks[0].path, dir.path() / "b.sh");
}

TEST(TaskCatalogTest, MissingEntryIsSkippedWithWarning)
{
    TempDir dir;
    dir.writeScript("a.py", "exit 0");
    dir.writeScript("b.py", "exit 0");

    testing::internal::CaptureStdout();
    auto tasks = resolveCatalog(dir.path(), {"a.py", "missing.py", "b.py"});
    string console = testing::internal::GetCapturedStdout();

    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].name, "a");
    EXPECT_EQ(tasks[1].name, "b");
    EXPECT_NE(console.find("Skipping missing.py (file not found)"), string::npos);
}

TEST(TaskCatalogTest, UnreadableEntryIsKeptAndFailsAtLaunch)
{
    TempDir dir;
    // A link pointing at itself: stat fails with ELOOP, not "no such file"
    fs::create_symlink("loop.sh", dir.path() / "loop.sh");

    testing::internal::CaptureStdout();
    auto tasks = resolveCatalog(dir.path(), {"loop.sh"});
    string console = testing::internal::GetCapturedStdout();

    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].name, "loop");
    EXPECT_EQ(console.find("Skipping"), string::npos);

    ExecutorOptions options;
    options.interpreter = "/bin/sh";
    options.announce = false;

    TaskOutcome outcome = TaskExecutor::execute(tasks[0], options);
    EXPECT_FALSE(outcome.success);
    EXPECT_TRUE(outcome.error.has_value());
}

TEST(TaskCatalogTest, MissingFileInsideMissingDirectoryIsSkipped)
{
    TempDir dir;

    testing::internal::CaptureStdout();
    auto tasks = resolveCatalog(dir.path() / "nowhere", {"a.py"});
    string console = testing::internal::GetCapturedStdout();

    EXPECT_TRUE(tasks.empty());
    EXPECT_NE(console.find("Skipping a.py (file not found)"), string::npos);
}

TEST(TaskCatalogTest, EmptyCatalogResolvesToNothing)
{
    TempDir dir;
    EXPECT_TRUE(resolveCatalog(dir.path(), {}).empty());
}

TEST(TaskCatalogTest, NothingExists)
{
    TempDir dir;

    testing::internal::CaptureStdout();
    auto tasks = resolveCatalog(dir.path() / "nowhere", {"a.py", "b.py"});
    testing::internal::GetCapturedStdout();

    EXPECT_TRUE(tasks.empty());
}

TEST(TaskCatalogTest, DisplayNameStripsExtension)
{
    EXPECT_EQ(displayNameOf("binance.py"), "binance");
    EXPECT_EQ(displayNameOf("collector"), "collector");
    EXPECT_EQ(displayNameOf("archive.tar.gz"), "archive.tar");
    EXPECT_EQ(displayNameOf("jobs/okx.py"), "okx");
}

TEST(TaskCatalogTest, DefaultCatalogListsCollectors)
{
    const auto &catalog = defaultCatalog();

    ASSERT_EQ(catalog.size(), 26u);
    EXPECT_EQ(catalog.front(), "biconomy.py");
    EXPECT_EQ(catalog.back(), "whitebit.py");
}
