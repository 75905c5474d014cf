#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "runner.hpp"

namespace fs = std::filesystem;

class FileExecutionTest : public ::testing::Test {
   protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "lux_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path test_dir;

    fs::path createTestFile(const std::string& filename, const std::string& content) {
        fs::path filepath = test_dir / filename;
        std::ofstream file(filepath);
        file << content;
        file.close();
        return filepath;
    }

    RunResult runFile(const fs::path& filepath, std::ostream& out) {
        std::ifstream file(filepath);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return run_source(buffer.str(), filepath.string(), out);
    }
};

TEST_F(FileExecutionTest, ExecutesSimpleScript) {
    auto path = createTestFile("ok.lux", "var x = 5;\nvar y = x + 3;\nprint y;\n");
    std::ostringstream out;
    RunResult result = runFile(path, out);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.exit_code(), 0);
    EXPECT_EQ(out.str(), "8\n");
}

TEST_F(FileExecutionTest, StaticErrorExitsWith65) {
    auto path = createTestFile("syntax.lux", "print 1;\nvar = 2;\n");
    std::ostringstream out;
    RunResult result = runFile(path, out);
    EXPECT_EQ(result.exit_code(), 65);
    EXPECT_EQ(out.str(), "");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].location().filename, path.string());
    EXPECT_EQ(result.errors[0].line(), 2);
    EXPECT_TRUE(result.errors[0].is_static());
}

TEST_F(FileExecutionTest, RuntimeErrorExitsWith70) {
    auto path = createTestFile("runtime.lux", "print \"before\";\nprint 1 - \"x\";\nprint \"after\";\n");
    std::ostringstream out;
    RunResult result = runFile(path, out);
    EXPECT_EQ(result.exit_code(), 70);
    EXPECT_EQ(out.str(), "before\n");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_FALSE(result.errors[0].is_static());
}

TEST_F(FileExecutionTest, ReportErrorsWritesEveryError) {
    auto path = createTestFile("many.lux", "var = 1;\nprint ;\n");
    std::ostringstream out;
    RunResult result = runFile(path, out);
    ASSERT_EQ(result.errors.size(), 2u);

    std::ostringstream err;
    report_errors(result, err);
    std::string text = err.str();
    EXPECT_NE(text.find("Expect variable name."), std::string::npos);
    EXPECT_NE(text.find("Expect expression."), std::string::npos);
    // not a terminal, so no color codes
    EXPECT_EQ(text.find("\033["), std::string::npos);
}

TEST_F(FileExecutionTest, HandlesFileNotFound) {
    fs::path nonexistent = test_dir / "nonexistent.lux";
    std::ifstream file(nonexistent);
    EXPECT_FALSE(file.is_open());
}
