#include <gtest/gtest.h>
#include "form_codec.hpp"
#include <string>

using namespace co::form;

class CoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 每个测试前的设置
    }
    
    void TearDown() override {
        // 每个测试后的清理
    }
};

// =============================================================================
// 路径测试
// =============================================================================

TEST_F(CoreTest, PathToString) {
    EXPECT_EQ(to_string(path{}), "<root>");
    EXPECT_EQ(to_string(path{"user"}), "user");
    EXPECT_EQ(to_string(path{"user", "profile", "name"}), "user.profile.name");
    EXPECT_EQ(to_string(path{"items", std::size_t{2}, "sku"}), "items[2].sku");
}

TEST_F(CoreTest, PathAppendedDoesNotMutate) {
    path base{"order"};
    auto child = base.appended(std::size_t{0});
    
    EXPECT_EQ(base.size(), 1);
    EXPECT_EQ(child.size(), 2);
    EXPECT_EQ(child, (path{"order", std::size_t{0}}));
    
    base.push("lines");
    base.pop();
    EXPECT_EQ(base, path{"order"});
}

// =============================================================================
// 错误类型测试
// =============================================================================

TEST_F(CoreTest, ErrorCodeToString) {
    EXPECT_EQ(to_string(error_code::invalid_format), "Invalid format");
    EXPECT_EQ(to_string(error_code::missing_field), "Missing field");
    EXPECT_EQ(to_string(error_code::type_mismatch), "Type mismatch");
    EXPECT_EQ(to_string(error_code::malformed_boundary), "Malformed boundary");
}

TEST_F(CoreTest, ErrorCategories) {
    EXPECT_TRUE(is_decoding_error(error_code::invalid_format));
    EXPECT_TRUE(is_decoding_error(error_code::missing_field));
    EXPECT_TRUE(is_decoding_error(error_code::type_mismatch));
    EXPECT_FALSE(is_decoding_error(error_code::empty_data));
    
    EXPECT_TRUE(is_multipart_error(error_code::file_too_large));
    EXPECT_TRUE(is_multipart_error(error_code::content_mismatch));
    EXPECT_TRUE(is_multipart_error(error_code::encoding_error));
    EXPECT_FALSE(is_multipart_error(error_code::missing_field));
}

TEST_F(CoreTest, DescribeFileTooLarge) {
    auto e = file_too_large(2048, 1024);
    EXPECT_EQ(e.code, error_code::file_too_large);
    EXPECT_EQ(describe(e),
        "File too large: file size 2048 exceeds maximum allowed size of 1024 bytes");
}

TEST_F(CoreTest, DescribeContentMismatch) {
    EXPECT_EQ(describe(content_mismatch("image/png", "image/jpeg")),
        "Content mismatch: expected image/png, detected image/jpeg");
    EXPECT_EQ(describe(content_mismatch("application/pdf")),
        "Content mismatch: expected application/pdf, detected unknown");
}

TEST_F(CoreTest, DescribeDecodingErrorsCarryPath) {
    auto missing = missing_field(path{"user", "age"});
    EXPECT_EQ(describe(missing), "Missing field at user.age");
    
    auto mismatch = type_mismatch(path{"age"}, "integer", "not an integer in range");
    EXPECT_EQ(describe(mismatch),
        "Type mismatch at age (expected integer): not an integer in range");
}

TEST_F(CoreTest, ErrorFactoriesFillFields) {
    auto ct = invalid_content_type("text/html");
    EXPECT_EQ(ct.code, error_code::invalid_content_type);
    EXPECT_EQ(ct.detected, "text/html");
    
    auto boundary = malformed_boundary("no opening delimiter");
    EXPECT_EQ(boundary.code, error_code::malformed_boundary);
    EXPECT_EQ(boundary.message, "no opening delimiter");
    
    EXPECT_EQ(empty_data().code, error_code::empty_data);
}

// =============================================================================
// 值树测试
// =============================================================================

TEST_F(CoreTest, DefaultNodeIsEmptyScalar) {
    node n;
    EXPECT_TRUE(n.is_scalar());
    EXPECT_TRUE(n.is_empty_scalar());
    EXPECT_EQ(n.size(), 0);
    
    auto s = node::make_scalar("x");
    EXPECT_FALSE(s.is_empty_scalar());
    EXPECT_EQ(s.scalar(), "x");
}

TEST_F(CoreTest, MappingKeepsInsertionOrder) {
    auto m = node::make_mapping();
    m.set("zeta", node::make_scalar("1"));
    m.set("alpha", node::make_scalar("2"));
    
    ASSERT_EQ(m.size(), 2);
    EXPECT_EQ(m.entries()[0].first, "zeta");
    EXPECT_EQ(m.entries()[1].first, "alpha");
}

TEST_F(CoreTest, MappingSetOverwritesInPlace) {
    auto m = node::make_mapping();
    m.set("a", node::make_scalar("1"));
    m.set("b", node::make_scalar("2"));
    m.set("a", node::make_scalar("3"));
    
    ASSERT_EQ(m.size(), 2);
    EXPECT_EQ(m.entries()[0].first, "a");
    EXPECT_EQ(m.find("a")->scalar(), "3");
}

TEST_F(CoreTest, FindOnNonMappingReturnsNull) {
    auto s = node::make_scalar("v");
    EXPECT_EQ(s.find("v"), nullptr);
    
    auto m = node::make_mapping();
    EXPECT_EQ(m.find("missing"), nullptr);
}

TEST_F(CoreTest, SequenceAndEquality) {
    auto a = node::make_sequence();
    a.push_back(node::make_scalar("x"));
    a.push_back(node::make_scalar("y"));
    
    auto b = node::make_sequence({node::make_scalar("x"), node::make_scalar("y")});
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.kind(), node_kind::sequence);
    EXPECT_EQ(to_string(a.kind()), "sequence");
    
    b.push_back(node::make_scalar("z"));
    EXPECT_FALSE(a == b);
}

TEST_F(CoreTest, NestedTreeEquality) {
    auto build = [] {
        auto user = node::make_mapping();
        user.set("name", node::make_scalar("John"));
        auto root = node::make_mapping();
        root.set("user", std::move(user));
        return root;
    };
    
    EXPECT_EQ(build(), build());
    EXPECT_EQ(build().find("user")->find("name")->scalar(), "John");
}
