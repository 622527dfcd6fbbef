// ==============================================================================
// test_store_gtest.cpp - Тесты каталога политик и загрузки набора (GoogleTest)
// ==============================================================================

#include "qrpolicy/policy_set.hpp"
#include "qrpolicy/store.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace qrpolicy::test {

namespace fs = std::filesystem;

// ==============================================================================
// Имена и токены
// ==============================================================================

TEST(StoreNamesTest, PolicyNames) {
    EXPECT_TRUE(is_valid_policy_name("50-config-filecopy"));
    EXPECT_TRUE(is_valid_policy_name("include/admin-local-rwx"));
    EXPECT_TRUE(is_valid_policy_name("30_user"));

    EXPECT_FALSE(is_valid_policy_name(""));
    EXPECT_FALSE(is_valid_policy_name("include/"));
    EXPECT_FALSE(is_valid_policy_name("../etc/passwd"));
    EXPECT_FALSE(is_valid_policy_name("a.policy"));
    EXPECT_FALSE(is_valid_policy_name("include/a/b"));
    EXPECT_FALSE(is_valid_policy_name("with space"));
}

TEST(StoreNamesTest, IncludeNames) {
    EXPECT_TRUE(is_include_name("include/admin-ro"));
    EXPECT_FALSE(is_include_name("include/"));
    EXPECT_FALSE(is_include_name("50-config"));
}

TEST(StoreNamesTest, ContentToken) {
    EXPECT_EQ(content_token("abc"), content_token("abc"));
    EXPECT_NE(content_token("abc"), content_token("abd"));
    EXPECT_EQ(content_token("").size(), 16u);
    // FNV-1a 64, пустая строка = offset basis
    EXPECT_EQ(content_token(""), "cbf29ce484222325");
}

// ==============================================================================
// DirectoryStore
// ==============================================================================

class DirectoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string("qrpolicy_store_") + info->name();
#ifndef _WIN32
        name += "_" + std::to_string(::getpid());
#endif
        root_ = fs::temp_directory_path() / name;
        fs::create_directories(root_ / "include");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write(const fs::path& relative, const std::string& content) {
        std::ofstream out(root_ / relative, std::ios::binary);
        out << content;
    }

    std::string read(const fs::path& relative) {
        std::ifstream in(root_ / relative, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    fs::path root_;
};

TEST_F(DirectoryStoreTest, List_MainFilesThenIncludes) {
    // Arrange
    write("90-default.policy", "");
    write("30-user.policy", "");
    write("50-config.policy", "");
    write("README", "");
    write("bad name.policy", "");
    write("include/admin-ro", "");
    write("include/admin-local-rwx", "");
    DirectoryStore store(root_);

    // Act
    auto names = store.list();

    // Assert
    EXPECT_EQ(names, (std::vector<std::string>{"30-user", "50-config", "90-default",
                                               "include/admin-local-rwx", "include/admin-ro"}));
}

TEST_F(DirectoryStoreTest, List_MissingRoot) {
    DirectoryStore store(root_ / "missing");

    EXPECT_TRUE(store.list().empty());
}

TEST_F(DirectoryStoreTest, PathOf) {
    DirectoryStore store(root_);

    EXPECT_EQ(store.path_of("30-user"), root_ / "30-user.policy");
    EXPECT_EQ(store.path_of("include/admin-ro"), root_ / "include" / "admin-ro");
}

TEST_F(DirectoryStoreTest, Get_ContentAndToken) {
    write("30-user.policy", "qubes.Foo * work vault allow\n");
    DirectoryStore store(root_);

    auto fetched = store.get("30-user");

    ASSERT_TRUE(fetched) << fetched.error.format();
    EXPECT_EQ(fetched.content, "qubes.Foo * work vault allow\n");
    EXPECT_EQ(fetched.token, content_token(fetched.content));
    EXPECT_TRUE(store.exists("30-user"));
}

TEST_F(DirectoryStoreTest, Get_Errors) {
    DirectoryStore store(root_);

    auto missing = store.get("40-missing");
    auto invalid = store.get("../secret");

    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error.kind, StoreErrorKind::NotFound);
    EXPECT_EQ(missing.error.name, "40-missing");
    ASSERT_FALSE(invalid);
    EXPECT_EQ(invalid.error.kind, StoreErrorKind::InvalidName);
    EXPECT_FALSE(store.exists("../secret"));
}

TEST_F(DirectoryStoreTest, Replace_WithCurrentToken) {
    write("30-user.policy", "# old\n");
    DirectoryStore store(root_);
    auto fetched = store.get("30-user");
    ASSERT_TRUE(fetched);

    auto stored = store.replace("30-user", "# new\n", fetched.token);

    ASSERT_TRUE(stored) << stored.error.format();
    EXPECT_EQ(read("30-user.policy"), "# new\n");
}

TEST_F(DirectoryStoreTest, Replace_StaleTokenIsConflict) {
    write("30-user.policy", "# old\n");
    DirectoryStore store(root_);
    auto fetched = store.get("30-user");
    write("30-user.policy", "# changed by someone else\n");

    auto stored = store.replace("30-user", "# new\n", fetched.token);

    ASSERT_FALSE(stored);
    EXPECT_EQ(stored.error.kind, StoreErrorKind::Conflict);
    EXPECT_EQ(read("30-user.policy"), "# changed by someone else\n");
}

TEST_F(DirectoryStoreTest, Replace_NewToken) {
    write("30-user.policy", "# old\n");
    DirectoryStore store(root_);

    auto created = store.replace("40-new", "# created\n", NEW_TOKEN);
    auto clash = store.replace("30-user", "# created\n", NEW_TOKEN);

    ASSERT_TRUE(created) << created.error.format();
    EXPECT_EQ(read("40-new.policy"), "# created\n");
    ASSERT_FALSE(clash);
    EXPECT_EQ(clash.error.kind, StoreErrorKind::Exists);
    EXPECT_EQ(read("30-user.policy"), "# old\n");
}

TEST_F(DirectoryStoreTest, Replace_AnyTokenAndIncludeDir) {
    fs::remove_all(root_ / "include");
    DirectoryStore store(root_);

    auto stored = store.replace("include/admin-ro", "admin.vm.List * @anyvm @adminvm allow\n",
                                ANY_TOKEN);

    ASSERT_TRUE(stored) << stored.error.format();
    EXPECT_EQ(read("include/admin-ro"), "admin.vm.List * @anyvm @adminvm allow\n");
}

TEST_F(DirectoryStoreTest, Replace_RemovedFileIsConflict) {
    DirectoryStore store(root_);

    auto stored = store.replace("30-user", "# new\n", content_token("# old\n"));

    ASSERT_FALSE(stored);
    EXPECT_EQ(stored.error.kind, StoreErrorKind::Conflict);
}

TEST_F(DirectoryStoreTest, StoreErrorFormat) {
    StoreError error{StoreErrorKind::Conflict, "30-user", "policy file was modified"};

    EXPECT_EQ(error.format(), "policy store error [30-user]: policy file was modified");
    EXPECT_EQ(to_string(StoreErrorKind::Exists), "already exists");
}

// ==============================================================================
// PolicySet
// ==============================================================================

TEST_F(DirectoryStoreTest, LoadPolicySet) {
    write("90-default.policy", "qubes.Foo * @anyvm @anyvm deny\n");
    write("30-user.policy", "!include include/admin-ro\n");
    write("include/admin-ro", "qubes.Foo * work vault allow\n!include include/other\n");
    DirectoryStore store(root_);

    auto set = load_policy_set(store);

    ASSERT_TRUE(set.errors.empty());
    ASSERT_EQ(set.files.size(), 2u);
    EXPECT_EQ(set.files[0].name(), "30-user");
    EXPECT_EQ(set.files[1].name(), "90-default");
    ASSERT_EQ(set.includes.size(), 1u);
    EXPECT_FALSE(set.includes[0].includes_allowed());
    EXPECT_FALSE(set.includes[0].can_save());
}

TEST_F(DirectoryStoreTest, PolicySetContext_Evaluates) {
    write("90-default.policy", "qubes.Foo * @anyvm @anyvm deny\n");
    write("30-user.policy", "!include include/admin-ro\n");
    write("include/admin-ro", "qubes.Foo * work vault allow\n");
    DirectoryStore store(root_);
    auto set = load_policy_set(store);

    Request request;
    request.service = "qubes.Foo";
    request.source = "work";
    request.destination = "vault";
    auto match = evaluate_match(set.files, request, set.context());

    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->action.kind, ActionKind::Allow);
    EXPECT_EQ(match->file, "include/admin-ro");
}

TEST_F(DirectoryStoreTest, LoadPolicyFile_ReportsErrors) {
    DirectoryStore store(root_);
    PolicyFile file("30-user");

    auto fetched = load_policy_file(store, "30-user", file);

    ASSERT_FALSE(fetched);
    EXPECT_EQ(fetched.error.kind, StoreErrorKind::NotFound);
    EXPECT_TRUE(file.empty());
}

}  // namespace qrpolicy::test
