#include <gtest/gtest.h>
#include "../src/diff.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Counts added or removed lines, ignoring the ---/+++ file header
size_t count_marked_lines(const std::string& diff, char marker) {
    std::istringstream ss(diff);
    std::string line;
    size_t count = 0;
    while (std::getline(ss, line)) {
        if (line.starts_with("+++") || line.starts_with("---")) continue;
        if (!line.empty() && line[0] == marker) ++count;
    }
    return count;
}

} // namespace

class DiffTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_root = fs::temp_directory_path() / ("dotsync_diff_test_" + std::to_string(getpid()));
        fs::remove_all(test_root);
        fs::create_directories(test_root);
    }

    void TearDown() override {
        fs::remove_all(test_root);
    }

    void write_file(const std::string& name, const std::string& content) {
        std::ofstream f(test_root / name);
        f << content;
    }

    fs::path test_root;
};

TEST_F(DiffTest, IdenticalFilesProduceNothing) {
    write_file("repo", "a\nb\n");
    write_file("system", "a\nb\n");
    EXPECT_EQ(diff_files(test_root / "repo", test_root / "system"), "");
}

TEST_F(DiffTest, TwoMissingFilesProduceNothing) {
    EXPECT_EQ(diff_files(test_root / "missing1", test_root / "missing2"), "");
}

TEST_F(DiffTest, SingleAddedLine) {
    write_file("repo", "a\nb\n");
    write_file("system", "a\nb\nc\n");

    const std::string diff = diff_files(test_root / "repo", test_root / "system");

    EXPECT_EQ(count_marked_lines(diff, '+'), 1u);
    EXPECT_EQ(count_marked_lines(diff, '-'), 0u);
    EXPECT_NE(diff.find("+c\n"), std::string::npos);
}

TEST_F(DiffTest, ZeroContextLines) {
    write_file("repo", "1\n2\n3\n4\n5\n");
    write_file("system", "1\n2\nthree\n4\n5\n");

    const std::string diff = diff_files(test_root / "repo", test_root / "system");

    EXPECT_NE(diff.find("-3\n+three\n"), std::string::npos);
    EXPECT_EQ(diff.find(" 2\n"), std::string::npos);
}

TEST_F(DiffTest, MissingSideReadsAsEmpty) {
    write_file("repo", "x\ny\n");

    const std::string removed = diff_files(test_root / "repo", test_root / "missing");
    EXPECT_EQ(count_marked_lines(removed, '-'), 2u);
    EXPECT_EQ(count_marked_lines(removed, '+'), 0u);

    const std::string added = diff_files(test_root / "missing", test_root / "repo");
    EXPECT_EQ(count_marked_lines(added, '+'), 2u);
}

TEST_F(DiffTest, HeaderNamesBothPaths) {
    write_file("repo", "old\n");
    write_file("system", "new\n");

    const std::string diff = diff_files(test_root / "repo", test_root / "system");

    EXPECT_TRUE(diff.starts_with("--- " + (test_root / "repo").string() + "\n"));
    EXPECT_NE(diff.find("+++ " + (test_root / "system").string() + "\n"), std::string::npos);
}
