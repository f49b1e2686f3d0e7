#include <gtest/gtest.h>

#include "core/cli.hpp"

#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

// ── Argument parsing tests ──────────────────────────────────

TEST(CLIParse, DefaultsToStart) {
    char* argv[] = { (char*)"botctl" };
    CLI::Options opts;
    ASSERT_TRUE(CLI::parse_args(1, argv, opts));
    EXPECT_EQ(opts.command, "start");
    EXPECT_TRUE(opts.config_path.empty());
    EXPECT_FALSE(opts.json);
}

TEST(CLIParse, ConfigAndJson) {
    char* argv[] = { (char*)"botctl", (char*)"--config", (char*)"/tmp/b.yaml",
                     (char*)"status", (char*)"--json" };
    CLI::Options opts;
    ASSERT_TRUE(CLI::parse_args(5, argv, opts));
    EXPECT_EQ(opts.command, "status");
    EXPECT_EQ(opts.config_path, "/tmp/b.yaml");
    EXPECT_TRUE(opts.json);
}

TEST(CLIParse, ConfigEqualsForm) {
    char* argv[] = { (char*)"botctl", (char*)"--config=/etc/b.yaml", (char*)"stop" };
    CLI::Options opts;
    ASSERT_TRUE(CLI::parse_args(3, argv, opts));
    EXPECT_EQ(opts.config_path, "/etc/b.yaml");
    EXPECT_EQ(opts.command, "stop");
}

TEST(CLIParse, ShortConfigFlag) {
    char* argv[] = { (char*)"botctl", (char*)"-c", (char*)"b.yaml" };
    CLI::Options opts;
    ASSERT_TRUE(CLI::parse_args(3, argv, opts));
    EXPECT_EQ(opts.config_path, "b.yaml");
    EXPECT_EQ(opts.command, "start");
}

TEST(CLIParse, MissingConfigValue) {
    char* argv[] = { (char*)"botctl", (char*)"--config" };
    CLI::Options opts;
    EXPECT_FALSE(CLI::parse_args(2, argv, opts));
}

// ── Color selection tests ───────────────────────────────────

class CLIColorTest : public ::testing::Test {
protected:
    std::string saved_no_color;
    bool had_no_color = false;

    void SetUp() override {
        const char* env = std::getenv("NO_COLOR");
        if (env) {
            had_no_color = true;
            saved_no_color = env;
        }
        unsetenv("NO_COLOR");
    }

    void TearDown() override {
        if (had_no_color) {
            setenv("NO_COLOR", saved_no_color.c_str(), 1);
        } else {
            unsetenv("NO_COLOR");
        }
    }
};

TEST_F(CLIColorTest, DecidedPerDescriptor) {
    int master = posix_openpt(O_RDWR | O_NOCTTY);
    if (master < 0) GTEST_SKIP() << "no pseudo-terminal available";
    ASSERT_EQ(grantpt(master), 0);
    ASSERT_EQ(unlockpt(master), 0);
    int tty = open(ptsname(master), O_RDWR | O_NOCTTY);
    ASSERT_GE(tty, 0);

    int fds[2];
    ASSERT_EQ(pipe(fds), 0);

    // A terminal on one stream says nothing about the other
    EXPECT_TRUE(CLI::use_color(tty));
    EXPECT_FALSE(CLI::use_color(fds[1]));

    setenv("NO_COLOR", "1", 1);
    EXPECT_FALSE(CLI::use_color(tty));

    close(fds[0]);
    close(fds[1]);
    close(tty);
    close(master);
}

// ── Subcommand dispatch tests ───────────────────────────────

TEST(CLIDispatch, Help_ReturnsZero) {
    char* argv[] = { (char*)"botctl", (char*)"help" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, HelpFlag_ReturnsZero) {
    char* argv[] = { (char*)"botctl", (char*)"--help" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, HelpShort_ReturnsZero) {
    char* argv[] = { (char*)"botctl", (char*)"-h" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, Version_ReturnsZero) {
    char* argv[] = { (char*)"botctl", (char*)"version" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, VersionFlag_ReturnsZero) {
    char* argv[] = { (char*)"botctl", (char*)"--version" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, UnknownCommand_ReturnsError) {
    char* argv[] = { (char*)"botctl", (char*)"foobar" };
    EXPECT_EQ(CLI::run(2, argv), 1);
}

TEST(CLIDispatch, MissingConfigValue_ReturnsError) {
    char* argv[] = { (char*)"botctl", (char*)"status", (char*)"--config" };
    EXPECT_EQ(CLI::run(3, argv), 1);
}

// ── Lifecycle commands against a scratch project ────────────

class CLIProjectTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string config_path;

    void SetUp() override {
        test_dir = (fs::temp_directory_path() /
                    ("botctl-test-cli-" + std::to_string(getpid()))).string();
        fs::create_directories(test_dir);
        config_path = test_dir + "/botctl.yaml";
        std::ofstream out(config_path);
        out << "bot:\n"
               "  script: missing_bot.py\n"
               "supervisor:\n"
               "  log_file: botctl.log\n";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    int run(const char* command, const char* extra = nullptr) {
        std::string cfg = "--config=" + config_path;
        char* argv[] = { (char*)"botctl", (char*)cfg.c_str(), (char*)command, (char*)extra };
        return CLI::run(extra ? 4 : 3, argv);
    }
};

TEST_F(CLIProjectTest, StatusWhenStopped) {
    EXPECT_EQ(run("status"), 0);
}

TEST_F(CLIProjectTest, StatusJson) {
    EXPECT_EQ(run("status", "--json"), 0);
}

TEST_F(CLIProjectTest, StatusWithStaleLock) {
    std::ofstream(test_dir + "/.bot.lock") << "not-a-pid\n";
    EXPECT_EQ(run("status"), 0);
    // status never cleans up
    EXPECT_TRUE(fs::exists(test_dir + "/.bot.lock"));
}

TEST_F(CLIProjectTest, StopWhenNothingRunning) {
    EXPECT_EQ(run("stop"), 0);
}

TEST_F(CLIProjectTest, StartWithMissingScriptFails) {
    EXPECT_EQ(run("start"), 1);
    EXPECT_FALSE(fs::exists(test_dir + "/.bot.lock"));
}

TEST_F(CLIProjectTest, UpdateWithoutEnvironmentFails) {
    EXPECT_EQ(run("update"), 1);
}

TEST_F(CLIProjectTest, WritesSupervisorLog) {
    run("status");
    EXPECT_TRUE(fs::exists(test_dir + "/botctl.log"));
}
