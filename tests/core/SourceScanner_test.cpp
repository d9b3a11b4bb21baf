#include <gtest/gtest.h>
#include "core/SourceScanner.hpp"
#include "schema/Errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace mcpify;
namespace fs = std::filesystem;

class SourceScannerTest : public ::testing::Test {
protected:
    fs::path test_dir_;

    void SetUp() override {
        // Create temporary project layout
        test_dir_ = fs::temp_directory_path() / "mcpify_source_scanner_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        test_dir_ = fs::canonical(test_dir_);

        create_file(test_dir_ / "app.py", "def main(): pass\n");
        create_file(test_dir_ / "setup.py", "from setuptools import setup\n");
        create_file(test_dir_ / "test_app.py", "def test_main(): pass\n");
        create_file(test_dir_ / "notes.txt", "not python");

        fs::create_directories(test_dir_ / "pkg" / "sub");
        create_file(test_dir_ / "pkg" / "__init__.py", "");
        create_file(test_dir_ / "pkg" / "sub" / "tools.py", "def run(): pass\n");

        fs::create_directories(test_dir_ / ".venv" / "lib");
        create_file(test_dir_ / ".venv" / "lib" / "vendored.py", "x = 1\n");
        fs::create_directories(test_dir_ / "__pycache__");
        create_file(test_dir_ / "__pycache__" / "cached.py", "x = 1\n");
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    void create_file(const fs::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
        file.close();
    }
};

TEST_F(SourceScannerTest, FindsPythonSourcesSorted) {
    SourceScanner scanner;
    auto results = scanner.scan(test_dir_);

    std::vector<fs::path> expected = {
        test_dir_ / "app.py",
        test_dir_ / "pkg" / "__init__.py",
        test_dir_ / "pkg" / "sub" / "tools.py",
    };
    EXPECT_EQ(results, expected);
}

TEST_F(SourceScannerTest, CustomIgnorePatterns) {
    ScanOptions options;
    options.ignore_patterns.push_back("pkg");
    SourceScanner scanner(options);

    auto results = scanner.scan(test_dir_);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0], test_dir_ / "app.py");
}

TEST_F(SourceScannerTest, EmptyIgnoreListIncludesEverything) {
    ScanOptions options;
    options.ignore_patterns.clear();
    SourceScanner scanner(options);

    auto results = scanner.scan(test_dir_);
    EXPECT_EQ(results.size(), 7u);
}

TEST_F(SourceScannerTest, SizeLimit) {
    create_file(test_dir_ / "big.py", std::string(2048, '#'));

    ScanOptions options;
    options.max_file_size = 1024;
    SourceScanner scanner(options);

    auto results = scanner.scan(test_dir_);
    EXPECT_EQ(std::count(results.begin(), results.end(), test_dir_ / "big.py"), 0);
    EXPECT_EQ(std::count(results.begin(), results.end(), test_dir_ / "app.py"), 1);
}

TEST_F(SourceScannerTest, MissingRootThrows) {
    SourceScanner scanner;
    EXPECT_THROW(scanner.scan(test_dir_ / "nope"), DetectionError);
    EXPECT_THROW(scanner.scan(test_dir_ / "app.py"), DetectionError);
}

TEST(SourceScannerPatternTest, GlobMatching) {
    EXPECT_TRUE(SourceScanner::matches_pattern("test_app.py", "test_*.py"));
    EXPECT_TRUE(SourceScanner::matches_pattern("app_test.py", "*_test.py"));
    EXPECT_TRUE(SourceScanner::matches_pattern("mylib.egg-info", "*.egg-info"));
    EXPECT_TRUE(SourceScanner::matches_pattern("a.py", "?.py"));
    EXPECT_FALSE(SourceScanner::matches_pattern("testing.py", "test_*.py"));
    EXPECT_FALSE(SourceScanner::matches_pattern("appXpy", "app.py"));
}
