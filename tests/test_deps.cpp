#include <gtest/gtest.h>
#include <deps/deps_manager.hpp>
#include <deps/resolver.hpp>
#include <cli/console.hpp>
#include <core/errors.hpp>
#include "fake_repository.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// ── Resolver ────────────────────────────────────────────────

static Dependency single_dep(const std::string& extra = "") {
    Manifest m = parse_manifest(
        "[defaults]\nrepository = libs\nchecksum = sha256\n"
        "[example_txt]\npath = docs/example-${version}.txt\nversion = 1.0.0\n" + extra);
    return m.dependencies.at("example_txt");
}

TEST(Resolver, LocksPublishedDigest) {
    FakeClientFactory clients;
    RemoteAsset& asset = clients.fake()->add("libs", "docs/example-1.0.0.txt", "example");
    asset.checksums.sha256 = "f6a4e3c9b12";

    Resolver resolver(clients);
    LockedFiles files = resolver.resolve(single_dep());

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files.at("docs/example-1.0.0.txt"), "sha256:f6a4e3c9b12");

    LockFile lock;
    lock.dependencies["example_txt"] = files;
    std::string text = emit_lock_file(lock);
    EXPECT_NE(text.find("\"docs/example-1.0.0.txt\": \"sha256:f6a4e3c9b12\""), std::string::npos);
}

TEST(Resolver, MissingDigestIsIntegrityError) {
    FakeClientFactory clients;
    clients.fake()->add("libs", "docs/example-1.0.0.txt", "example").checksums.md5.clear();

    Resolver resolver(clients);
    EXPECT_THROW(resolver.resolve(single_dep("checksum = md5\n")), IntegrityError);
}

TEST(Resolver, MissingAssetNamesDependency) {
    FakeClientFactory clients;
    Resolver resolver(clients);
    try {
        resolver.resolve(single_dep());
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.status(), 404);
        EXPECT_NE(std::string(e.what()).find("example_txt"), std::string::npos);
    }
}

TEST(Resolver, RecursiveLocksEveryFile) {
    FakeClientFactory clients;
    clients.fake()->add("libs", "docs/2025/a.txt", "a");
    clients.fake()->add("libs", "docs/2025/sub/b.txt", "b");
    clients.fake()->add("libs", "other/c.txt", "c");

    Manifest m = parse_manifest(
        "[folder]\nrepository = libs\npath = docs/${version}/\nversion = 2025\nrecursive = true\n");
    Resolver resolver(clients);
    LockedFiles files = resolver.resolve(m.dependencies.at("folder"));

    ASSERT_EQ(files.size(), 2u);
    EXPECT_TRUE(files.count("docs/2025/a.txt"));
    EXPECT_TRUE(files.count("docs/2025/sub/b.txt"));
}

TEST(Resolver, RecursiveWithNoAssetsFails) {
    FakeClientFactory clients;
    Manifest m = parse_manifest(
        "[folder]\nrepository = libs\npath = empty/\nrecursive = true\n");
    Resolver resolver(clients);
    EXPECT_THROW(resolver.resolve(m.dependencies.at("folder")), NexcliError);
}

TEST(Resolver, DependencyUrlSelectsClient) {
    FakeClientFactory clients;
    clients.fake("http://mirror:8081")->add("libs", "docs/example-1.0.0.txt", "mirrored");

    Resolver resolver(clients);
    LockedFiles files = resolver.resolve(single_dep("url = http://mirror:8081\n"));

    EXPECT_EQ(files.size(), 1u);
    ASSERT_EQ(clients.requested.size(), 1u);
    EXPECT_EQ(clients.requested[0], "http://mirror:8081");
}

// ── DepsManager ─────────────────────────────────────────────

class DepsManagerTest : public ::testing::Test {
protected:
    fs::path project;
    FakeClientFactory clients;
    std::ostringstream out;
    std::ostringstream err;
    Console console{Verbosity::Normal, out, err, false};

    void SetUp() override {
        project = fs::temp_directory_path() / "nexcli_deps_test";
        fs::remove_all(project);
        fs::create_directories(project);

        auto repo = clients.fake();
        repo->add("libs", "docs/example-1.0.0.txt", "example text");
        repo->add("libs", "docs/2025/a.txt", "alpha");
        repo->add("libs", "docs/2025/sub/b.txt", "beta");
    }

    void TearDown() override {
        fs::remove_all(project);
    }

    void write_manifest(const std::string& text) {
        std::ofstream(project / "deps.ini") << text;
    }

    static std::string read_file(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static constexpr const char* MANIFEST =
        "[defaults]\n"
        "repository = libs\n"
        "checksum = sha256\n"
        "\n"
        "[example_txt]\n"
        "path = docs/example-${version}.txt\n"
        "version = 1.0.0\n"
        "\n"
        "[docs_folder]\n"
        "path = docs/${version}/\n"
        "version = 2025\n"
        "recursive = true\n";
};

TEST_F(DepsManagerTest, InitWritesTemplateOnce) {
    DepsManager manager(console, project);
    manager.init();
    EXPECT_TRUE(fs::exists(project / "deps.ini"));
    EXPECT_NO_THROW(load_manifest(project / "deps.ini"));
    EXPECT_THROW(manager.init(), ConfigurationError);
}

TEST_F(DepsManagerTest, LockSyncEnv) {
    write_manifest(MANIFEST);
    DepsManager manager(console, project);

    LockFile lock = manager.lock(clients);
    EXPECT_TRUE(fs::exists(project / "deps-lock.yaml"));
    EXPECT_EQ(lock.files_for("example_txt").size(), 1u);
    EXPECT_EQ(lock.files_for("docs_folder").size(), 2u);

    // Untracked leftovers under the output directory
    fs::create_directories(project / "local" / "old");
    std::ofstream(project / "local" / "old" / "stale.txt") << "stale";

    int verified = manager.sync(clients, true, 2);
    EXPECT_EQ(verified, 3);
    EXPECT_EQ(read_file(project / "local/docs/example-1.0.0.txt"), "example text");
    EXPECT_EQ(read_file(project / "local/docs/2025/a.txt"), "alpha");
    EXPECT_EQ(read_file(project / "local/docs/2025/sub/b.txt"), "beta");
    EXPECT_FALSE(fs::exists(project / "local/old/stale.txt"));

    manager.env();
    std::string env = read_file(project / "deps.env");
    EXPECT_NE(env.find("DEPS_EXAMPLE_TXT_PATH=\"local/docs/example-1.0.0.txt\""), std::string::npos);
    EXPECT_NE(env.find("DEPS_DOCS_FOLDER_VERSION=\"2025\""), std::string::npos);
}

TEST_F(DepsManagerTest, SyncWithoutCleanupKeepsExtras) {
    write_manifest(MANIFEST);
    DepsManager manager(console, project);
    manager.lock(clients);

    fs::create_directories(project / "local");
    std::ofstream(project / "local" / "mine.txt") << "keep me";

    manager.sync(clients, false, 1);
    EXPECT_TRUE(fs::exists(project / "local/mine.txt"));
}

TEST_F(DepsManagerTest, SecondSyncSkipsMatchingFiles) {
    write_manifest(MANIFEST);
    DepsManager manager(console, project);
    manager.lock(clients);
    manager.sync(clients, true, 2);
    int first = clients.fake()->download_calls();

    manager.sync(clients, true, 2);
    EXPECT_EQ(clients.fake()->download_calls(), first);
}

TEST_F(DepsManagerTest, UnlockedDependencyStopsSync) {
    write_manifest(MANIFEST);
    DepsManager manager(console, project);
    manager.lock(clients);

    write_manifest(std::string(MANIFEST) + "\n[late]\npath = docs/example-1.0.0.txt\n");
    try {
        manager.sync(clients, true, 1);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("late"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("out of sync"), std::string::npos);
    }
    EXPECT_EQ(clients.fake()->download_calls(), 0);
}

TEST_F(DepsManagerTest, TamperedLockFailsVerification) {
    write_manifest(
        "[example_txt]\nrepository = libs\npath = docs/example-${version}.txt\nversion = 1.0.0\n");
    LockFile lock;
    lock.dependencies["example_txt"]["docs/example-1.0.0.txt"] = "sha256:0000";
    write_lock_file(project / "deps-lock.yaml", lock);

    DepsManager manager(console, project);
    EXPECT_THROW(manager.sync(clients, true, 1), IntegrityError);
}

TEST_F(DepsManagerTest, LockedPathEscapingOutputDirStopsSync) {
    clients.fake()->add("libs", "docs/2025/../../../evil.txt", "pwned");
    write_manifest(MANIFEST);
    DepsManager manager(console, project);
    manager.lock(clients);

    EXPECT_THROW(manager.sync(clients, true, 2), PathTraversalError);
    EXPECT_FALSE(fs::exists(project / "evil.txt"));
    EXPECT_FALSE(fs::exists(project.parent_path() / "evil.txt"));
}

TEST_F(DepsManagerTest, SyncRequiresLockFile) {
    write_manifest(MANIFEST);
    DepsManager manager(console, project);
    EXPECT_THROW(manager.sync(clients, true, 1), ConfigurationError);
}
