#include <gtest/gtest.h>
#include <deps/manifest.hpp>
#include <deps/env_file.hpp>
#include <core/errors.hpp>
#include <string>

static std::string error_of(const std::string& ini) {
    try {
        parse_manifest(ini);
    } catch (const ConfigurationError& e) {
        return e.what();
    }
    return "";
}

TEST(Manifest, InheritsDefaultsAndExpandsVersion) {
    Manifest m = parse_manifest(
        "[defaults]\n"
        "repository = libs\n"
        "checksum = sha256\n"
        "\n"
        "[example_txt]\n"
        "path = docs/example-${version}.txt\n"
        "version = 1.0.0\n");

    ASSERT_EQ(m.dependencies.size(), 1u);
    const Dependency& dep = m.dependencies.at("example_txt");
    EXPECT_EQ(dep.repository, "libs");
    EXPECT_EQ(dep.checksum_algorithm, ChecksumAlgorithm::SHA256);
    EXPECT_EQ(dep.output_dir, "./local");
    EXPECT_EQ(dep.expanded_path(), "docs/example-1.0.0.txt");
    EXPECT_EQ(dep.local_path().generic_string(), "local/docs/example-1.0.0.txt");
    EXPECT_FALSE(dep.recursive);
}

TEST(Manifest, DefaultsSectionMayComeLast) {
    Manifest m = parse_manifest(
        "[lib]\n"
        "path = a.tar.gz\n"
        "[defaults]\n"
        "repository = late\n"
        "output_dir = vendor\n"
        "url = http://mirror:8081\n");

    const Dependency& dep = m.dependencies.at("lib");
    EXPECT_EQ(dep.repository, "late");
    EXPECT_EQ(dep.output_dir, "vendor");
    EXPECT_EQ(dep.source_url, "http://mirror:8081");
}

TEST(Manifest, DependencyOverridesDefaults) {
    Manifest m = parse_manifest(
        "; comment\n"
        "# another\n"
        "[defaults]\n"
        "repository = libs\n"
        "[tool]\n"
        "repository = tools\n"
        "path = bin/tool-${version}\n"
        "version = 2\n"
        "checksum = SHA512\n"
        "dest = third_party/tool\n"
        "recursive = TRUE\n");

    const Dependency& dep = m.dependencies.at("tool");
    EXPECT_EQ(dep.repository, "tools");
    EXPECT_EQ(dep.checksum_algorithm, ChecksumAlgorithm::SHA512);
    EXPECT_TRUE(dep.recursive);
    EXPECT_EQ(dep.local_path().generic_string(), "third_party/tool");
}

TEST(Manifest, MisspelledKeyNamesKeyAndSection) {
    std::string msg = error_of(
        "[example_txt]\n"
        "repositry = libs\n"
        "path = x\n");
    EXPECT_NE(msg.find("repositry"), std::string::npos);
    EXPECT_NE(msg.find("[example_txt]"), std::string::npos);
}

TEST(Manifest, DefaultsRejectDependencyKeys) {
    EXPECT_NE(error_of("[defaults]\npath = x\n").find("path"), std::string::npos);
}

TEST(Manifest, StructuralErrors) {
    EXPECT_NE(error_of("repository = libs\n").find("outside any section"), std::string::npos);
    EXPECT_NE(error_of("[a]\npath = x\njust words\n").find(":3:"), std::string::npos);
    EXPECT_NE(error_of("[a]\npath = x\n[a]\npath = y\n").find("duplicate"), std::string::npos);
    EXPECT_NE(error_of("[a\npath = x\n").find("malformed"), std::string::npos);
}

TEST(Manifest, ValueErrors) {
    EXPECT_NE(error_of("[a]\nrepository = r\n").find("'path'"), std::string::npos);
    EXPECT_NE(error_of("[a]\npath = x\n").find("'repository'"), std::string::npos);
    EXPECT_NE(error_of("[a]\nrepository = r\npath = x\nchecksum = crc\n").find("crc"), std::string::npos);
    EXPECT_NE(error_of("[a]\nrepository = r\npath = x\nrecursive = yes\n").find("recursive"),
              std::string::npos);
}

TEST(Manifest, UnsafeOutputDirs) {
    EXPECT_FALSE(error_of("[defaults]\noutput_dir = /\n").empty());
    EXPECT_FALSE(error_of("[defaults]\noutput_dir = .\n").empty());
    EXPECT_FALSE(error_of("[defaults]\noutput_dir = ./\n").empty());
    EXPECT_FALSE(error_of("[a]\nrepository = r\npath = x\noutput_dir =\n").empty());
    EXPECT_FALSE(error_of("[a]\nrepository = r\npath = x\noutput_dir = sub/..\n").empty());
}

TEST(Manifest, TemplateParses) {
    Manifest m = parse_manifest(manifest_template());
    EXPECT_EQ(m.dependencies.size(), 3u);
    EXPECT_TRUE(m.dependencies.at("docs_folder").recursive);
    EXPECT_EQ(m.dependencies.at("libfoo_tar").checksum_algorithm, ChecksumAlgorithm::SHA512);
}

TEST(Manifest, LockedFilesStayInsideTheirDirectory) {
    Manifest m = parse_manifest(
        "[tree]\n"
        "repository = libs\n"
        "path = docs/${version}/\n"
        "version = 2025\n"
        "recursive = true\n"
        "\n"
        "[placed]\n"
        "repository = libs\n"
        "path = docs/${version}/\n"
        "version = 2025\n"
        "recursive = true\n"
        "dest = vendor/docs\n");

    const Dependency& tree = m.dependencies.at("tree");
    EXPECT_EQ(tree.local_path_for("docs/2025/sub/a.txt").generic_string(), "local/docs/2025/sub/a.txt");
    EXPECT_THROW(tree.local_path_for("docs/2025/../../../evil.txt"), PathTraversalError);

    const Dependency& placed = m.dependencies.at("placed");
    EXPECT_EQ(placed.local_path_for("docs/2025/sub/a.txt").generic_string(), "vendor/docs/sub/a.txt");
    EXPECT_THROW(placed.local_path_for("docs/2025/../../x.txt"), PathTraversalError);
}

TEST(EnvFile, SortedUpperCasedNames) {
    Manifest m = parse_manifest(
        "[defaults]\nrepository = libs\n"
        "[zlib]\npath = z-${version}.tgz\nversion = 1.3\n"
        "[my-lib]\npath = m.tgz\nversion = 0.1\n");

    EXPECT_EQ(env_var_stem("my-lib"), "MY_LIB");
    EXPECT_EQ(render_env_file(m),
              "DEPS_MY_LIB_NAME=\"my-lib\"\n"
              "DEPS_MY_LIB_VERSION=\"0.1\"\n"
              "DEPS_MY_LIB_PATH=\"local/m.tgz\"\n"
              "\n"
              "DEPS_ZLIB_NAME=\"zlib\"\n"
              "DEPS_ZLIB_VERSION=\"1.3\"\n"
              "DEPS_ZLIB_PATH=\"local/z-1.3.tgz\"\n"
              "\n");
}
