#include <gtest/gtest.h>
#include "ckg/utils/file_utils.hpp"
#include "ckg/utils/json_utils.hpp"
#include <filesystem>
#include <fstream>

using namespace ckg;
namespace fs = std::filesystem;

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "ckg_file_utils_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    void create_test_file(const std::string& filename, const std::string& content) const {
        std::ofstream file(temp_dir / filename, std::ios::binary);
        file << content;
        file.close();
    }

    fs::path temp_dir;
};

TEST_F(FileUtilsTest, ReadFile) {
    create_test_file("a.txt", "line1\nline2");

    auto content = file_utils::read_file(temp_dir / "a.txt");
    ASSERT_TRUE(content.is_ok());
    EXPECT_EQ(content.value(), "line1\nline2");
}

TEST_F(FileUtilsTest, ReadMissingFile) {
    auto content = file_utils::read_file(temp_dir / "missing.txt");

    ASSERT_TRUE(content.is_err());
    EXPECT_EQ(content.error().code(), ErrorCode::NotFound);
}

TEST_F(FileUtilsTest, CountLines) {
    EXPECT_EQ(file_utils::count_lines(""), 1u);
    EXPECT_EQ(file_utils::count_lines("a"), 1u);
    EXPECT_EQ(file_utils::count_lines("a\nb"), 2u);
    EXPECT_EQ(file_utils::count_lines("a\nb\n"), 3u);
}

TEST_F(FileUtilsTest, LineAt) {
    const std::string text = "one\ntwo\nthree";
    EXPECT_EQ(file_utils::line_at(text, 0), 1u);
    EXPECT_EQ(file_utils::line_at(text, 4), 2u);
    EXPECT_EQ(file_utils::line_at(text, text.find("three")), 3u);
    EXPECT_EQ(file_utils::line_at(text, 1000), 3u);
}

TEST_F(FileUtilsTest, FileSize) {
    create_test_file("sized.txt", "12345");

    auto size = file_utils::file_size(temp_dir / "sized.txt");
    ASSERT_TRUE(size.is_ok());
    EXPECT_EQ(size.value(), 5u);
    EXPECT_TRUE(file_utils::file_size(temp_dir / "missing.txt").is_err());
}

TEST_F(FileUtilsTest, ExtensionIsLowerCased) {
    EXPECT_EQ(file_utils::extension_of("src/App.TSX"), ".tsx");
    EXPECT_EQ(file_utils::extension_of("Makefile"), "");
}

TEST_F(FileUtilsTest, JsonWriteCreatesParentDirectories) {
    const fs::path target = temp_dir / "nested" / "out.json";
    const json_utils::json data = {{"name", "ckg"}, {"nodes", 3}};

    ASSERT_TRUE(json_utils::write_file(target, data).is_ok());

    auto content = file_utils::read_file(target);
    ASSERT_TRUE(content.is_ok());

    auto parsed = json_utils::parse(content.value());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value()["nodes"], 3);
}

TEST_F(FileUtilsTest, JsonParseError) {
    auto parsed = json_utils::parse("{\"a\": ");

    ASSERT_TRUE(parsed.is_err());
    EXPECT_EQ(parsed.error().code(), ErrorCode::ParseError);
}
