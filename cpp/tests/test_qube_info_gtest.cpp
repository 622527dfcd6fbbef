// ==============================================================================
// test_qube_info_gtest.cpp - Тесты загрузки метаданных qube (GoogleTest)
// ==============================================================================

#include "qrpolicy/qube_info.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace qrpolicy::test {

namespace fs = std::filesystem;

TEST(QubeInfoTest, ParseFullRecord) {
    // Arrange
    const std::string yaml = "qubes:\n"
                             "  work:\n"
                             "    type: AppVM\n"
                             "    tags: [work, created-by-dom0]\n"
                             "  disp1234:\n"
                             "    type: DispVM\n"
                             "    template: fedora-dvm\n";

    // Act
    auto result = parse_qube_info(yaml);

    // Assert
    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.info.size(), 2u);
    EXPECT_EQ(result.info.type_of("work").value_or(""), "AppVM");
    EXPECT_TRUE(result.info.has_tag("work", "created-by-dom0"));
    EXPECT_FALSE(result.info.has_tag("work", "personal"));
    EXPECT_EQ(result.info.dispvm_template_of("disp1234").value_or(""), "fedora-dvm");
    EXPECT_FALSE(result.info.dispvm_template_of("work").has_value());
}

TEST(QubeInfoTest, UnknownQubeHasNoMetadata) {
    auto result = parse_qube_info("qubes:\n  work:\n    type: AppVM\n");

    ASSERT_TRUE(result);
    EXPECT_FALSE(result.info.type_of("vault").has_value());
    EXPECT_FALSE(result.info.has_tag("vault", "work"));
}

TEST(QubeInfoTest, EmptyRecordAllowed) {
    auto result = parse_qube_info("qubes:\n  vault:\n");

    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.info.size(), 1u);
    EXPECT_FALSE(result.info.type_of("vault").has_value());
}

TEST(QubeInfoTest, EmptyDocument) {
    auto result = parse_qube_info("");

    ASSERT_TRUE(result);
    EXPECT_EQ(result.info.size(), 0u);
}

TEST(QubeInfoTest, Errors) {
    EXPECT_FALSE(parse_qube_info("qubes: [work, vault]\n"));
    EXPECT_FALSE(parse_qube_info("qubes:\n  work: AppVM\n"));
    EXPECT_FALSE(parse_qube_info("qubes:\n  work:\n    tags: work\n"));
    EXPECT_FALSE(parse_qube_info("qubes:\n  '1bad':\n    type: AppVM\n"));
    EXPECT_FALSE(parse_qube_info("qubes:\n  work: {type: [\n"));
}

TEST(QubeInfoTest, ErrorMessageNamesQube) {
    auto result = parse_qube_info("qubes:\n  work:\n    tags: work\n");

    ASSERT_FALSE(result);
    EXPECT_NE(result.error.find("work"), std::string::npos);
}

class QubeInfoFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string("qrpolicy_qubes_") + info->name();
#ifndef _WIN32
        name += "_" + std::to_string(::getpid());
#endif
        temp_dir_ = fs::temp_directory_path() / name;
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    fs::path temp_dir_;
};

TEST_F(QubeInfoFileTest, LoadFromFile) {
    const auto path = temp_dir_ / "qubes.yaml";
    {
        std::ofstream out(path);
        out << "qubes:\n  work:\n    tags: [work]\n";
    }

    auto result = load_qube_info(path);

    ASSERT_TRUE(result) << result.error;
    EXPECT_TRUE(result.info.has_tag("work", "work"));
}

TEST_F(QubeInfoFileTest, MissingFile) {
    auto result = load_qube_info(temp_dir_ / "missing.yaml");

    ASSERT_FALSE(result);
    EXPECT_NE(result.error.find("missing.yaml"), std::string::npos);
}

TEST_F(QubeInfoFileTest, InvalidFileErrorHasPath) {
    const auto path = temp_dir_ / "bad.yaml";
    {
        std::ofstream out(path);
        out << "qubes: [1, 2]\n";
    }

    auto result = load_qube_info(path);

    ASSERT_FALSE(result);
    EXPECT_NE(result.error.find("bad.yaml"), std::string::npos);
}

}  // namespace qrpolicy::test
