#include <gtest/gtest.h>
#include <cli/arguments.hpp>
#include <cli/nexcli_cli.hpp>
#include <core/errors.hpp>
#include "fake_repository.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// ── Arguments ───────────────────────────────────────────────

static const std::vector<FlagSpec> FLAGS = {
    {"glob", 'g', true},
    {"force", 0, false},
    {"dry-run", 'n', false},
    {"parallel", 0, true},
};

TEST(Arguments, LongShortAndInlineForms) {
    Arguments args({"src", "-g", "*.go", "--force", "dst", "--parallel=3", "-n"}, FLAGS);
    EXPECT_EQ(args.value("glob"), "*.go");
    EXPECT_TRUE(args.has("force"));
    EXPECT_TRUE(args.has("dry-run"));
    EXPECT_EQ(args.int_value("parallel", 8), 3);
    EXPECT_EQ(args.positionals(), (std::vector<std::string>{"src", "dst"}));
}

TEST(Arguments, DoubleDashEndsFlags) {
    Arguments args({"--force", "--", "--not-a-flag"}, FLAGS);
    EXPECT_TRUE(args.has("force"));
    EXPECT_EQ(args.positionals(), (std::vector<std::string>{"--not-a-flag"}));
}

TEST(Arguments, StopsAtFirstPositional) {
    Arguments args({"--force", "upload", "-g", "x"}, FLAGS, true);
    EXPECT_TRUE(args.has("force"));
    EXPECT_FALSE(args.has("glob"));
    EXPECT_EQ(args.remaining(), (std::vector<std::string>{"upload", "-g", "x"}));
}

TEST(Arguments, Rejections) {
    EXPECT_THROW(Arguments({"--nope"}, FLAGS), ConfigurationError);
    EXPECT_THROW(Arguments({"-x"}, FLAGS), ConfigurationError);
    EXPECT_THROW(Arguments({"--glob"}, FLAGS), ConfigurationError);
    EXPECT_THROW(Arguments({"--force=yes"}, FLAGS), ConfigurationError);

    Arguments zero({"--parallel", "0"}, FLAGS);
    EXPECT_THROW(zero.int_value("parallel", 8), ConfigurationError);
    Arguments word({"--parallel", "many"}, FLAGS);
    EXPECT_THROW(word.int_value("parallel", 8), ConfigurationError);
    EXPECT_EQ(Arguments({}, FLAGS).int_value("parallel", 8), 8);
}

// ── Command dispatch ────────────────────────────────────────

class CliTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::shared_ptr<FakeClientFactory> factory = std::make_shared<FakeClientFactory>();
    NexcliCLI cli;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "nexcli_cli_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        cli.set_client_factory(factory);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(CliTest, UploadThenDownload) {
    fs::create_directories(test_dir / "src" / "sub");
    std::ofstream(test_dir / "src" / "a.txt") << "a";
    std::ofstream(test_dir / "src" / "sub" / "b.txt") << "b";

    int rc = cli.run({"-q", "upload", (test_dir / "src").string(), "libs/drop"});
    EXPECT_EQ(rc, 0);
    EXPECT_TRUE(factory->fake()->has("libs", "drop/a.txt"));
    EXPECT_TRUE(factory->fake()->has("libs", "drop/sub/b.txt"));

    rc = cli.run({"download", "libs/drop", (test_dir / "out").string(), "--quiet"});
    EXPECT_EQ(rc, 0);
    EXPECT_TRUE(fs::exists(test_dir / "out" / "drop" / "a.txt"));
    EXPECT_TRUE(fs::exists(test_dir / "out" / "drop" / "sub" / "b.txt"));

    rc = cli.run({"download", "libs/drop", (test_dir / "flat").string(), "--quiet", "--flatten"});
    EXPECT_EQ(rc, 0);
    EXPECT_TRUE(fs::exists(test_dir / "flat" / "sub" / "b.txt"));
    EXPECT_FALSE(fs::exists(test_dir / "flat" / "drop"));
}

TEST_F(CliTest, EmptyFolderExitsWith66) {
    int rc = cli.run({"-q", "download", "libs/nothing-here", (test_dir / "out").string()});
    EXPECT_EQ(rc, 66);
}

TEST_F(CliTest, UsageErrorsExitWithOne) {
    EXPECT_EQ(cli.run({"upload", "only-one-arg"}), 1);
    EXPECT_EQ(cli.run({"download", "libs/x", "out", "--bogus"}), 1);
    EXPECT_EQ(cli.run({"download", "libs/x", "out", "--force", "--skip-checksum"}), 1);
    EXPECT_EQ(cli.run({"frobnicate"}), 1);
    EXPECT_EQ(cli.run({}), 1);
}
