#include <gtest/gtest.h>
#include "shell_profile.hpp"
#include "config.hpp"
#include "localization.hpp"
#include "test_support.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace {
    const std::string USER_LINE = "export PATH=$HOME/.local/go/bin:$PATH";
    const std::string BLOCK = "\n# Golang PATH\n" + USER_LINE + "\n";
}

class ShellProfileTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;
    fs::path home;
    InstallPlan plan;

    void SetUp() override {
        init_localization();
        suite_work_dir = fs::absolute("tmp_shell_profile_test");
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
        home = suite_work_dir / "home";
        fs::create_directories(home);

        plan.mode = InstallMode::User;
        plan.install_root = home / ".local";
        plan.target_dir = home / ".local" / "go";
        plan.path_line = USER_LINE;
    }

    void TearDown() override {
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
    }
};

TEST_F(ShellProfileTest, AppendsBlockAndBacksUp) {
    write_file(home / ".bashrc", "alias ll='ls -l'\n");
    write_file(home / ".zshrc", "");

    ShellProfileUpdater updater(home);
    ProfileUpdateResult result = updater.update_all(plan);

    EXPECT_EQ(result.updated_count, 2);
    ASSERT_EQ(result.updated_files.size(), 2u);
    // Fixed order: .zshrc, .bashrc, .bash_profile
    EXPECT_EQ(result.updated_files[0], home / ".zshrc");
    EXPECT_EQ(result.updated_files[1], home / ".bashrc");

    EXPECT_EQ(read_file(home / ".bashrc"), "alias ll='ls -l'\n" + BLOCK);
    EXPECT_EQ(read_file(home / ".bashrc.bak"), "alias ll='ls -l'\n");
    EXPECT_EQ(read_file(home / ".zshrc"), BLOCK);
    EXPECT_FALSE(fs::exists(home / ".bash_profile"));
}

TEST_F(ShellProfileTest, SecondRunChangesNothing) {
    write_file(home / ".bash_profile", "umask 022\n");

    ShellProfileUpdater updater(home);
    EXPECT_EQ(updater.update_all(plan).updated_count, 1);
    const std::string after_first = read_file(home / ".bash_profile");
    const std::string backup_first = read_file(home / ".bash_profile.bak");

    EXPECT_EQ(updater.update_all(plan).updated_count, 0);
    EXPECT_EQ(read_file(home / ".bash_profile"), after_first);
    EXPECT_EQ(read_file(home / ".bash_profile.bak"), backup_first);
}

TEST_F(ShellProfileTest, ExistingIndentedLineIsRecognized) {
    const std::string content = "if true; then\n    " + USER_LINE + "  \nfi\n";
    write_file(home / ".bashrc", content);

    ShellProfileUpdater updater(home);
    EXPECT_EQ(updater.update_all(plan).updated_count, 0);
    EXPECT_EQ(read_file(home / ".bashrc"), content);
    EXPECT_FALSE(fs::exists(home / ".bashrc.bak"));
}

TEST_F(ShellProfileTest, SubstringIsNotAMatch) {
    write_file(home / ".bashrc", "# " + USER_LINE + "\n");

    ShellProfileUpdater updater(home);
    EXPECT_EQ(updater.update_all(plan).updated_count, 1);
}

TEST_F(ShellProfileTest, BackupFailureSkipsOnlyThatFile) {
    write_file(home / ".zshrc", "zsh\n");
    write_file(home / ".bashrc", "bash\n");
    // A directory where the backup file should go makes the copy fail.
    fs::create_directories(home / ".zshrc.bak" / "occupied");

    ShellProfileUpdater updater(home);
    ProfileUpdateResult result = updater.update_all(plan);

    EXPECT_EQ(result.updated_count, 1);
    EXPECT_EQ(read_file(home / ".zshrc"), "zsh\n");
    EXPECT_EQ(read_file(home / ".bashrc"), "bash\n" + BLOCK);
}

TEST_F(ShellProfileTest, NoProfiles) {
    ShellProfileUpdater updater(home);
    ProfileUpdateResult result = updater.update_all(plan);
    EXPECT_EQ(result.updated_count, 0);
    EXPECT_TRUE(result.updated_files.empty());
    EXPECT_TRUE(fs::is_empty(home));
}

TEST_F(ShellProfileTest, SystemLine) {
    plan.mode = InstallMode::System;
    plan.path_line = "export PATH=/usr/local/go/bin:$PATH";
    write_file(home / ".bashrc", "");

    ShellProfileUpdater updater(home);
    updater.update_all(plan);
    EXPECT_EQ(read_file(home / ".bashrc"), "\n# Golang PATH\nexport PATH=/usr/local/go/bin:$PATH\n");
    EXPECT_TRUE(ShellProfileUpdater::contains_path_line(home / ".bashrc", plan.path_line));
}
