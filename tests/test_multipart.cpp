#include <gtest/gtest.h>
#include "form_codec.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

using namespace co::form;

class MultipartTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 每个测试前的设置
    }
    
    void TearDown() override {
        // 每个测试后的清理
    }

    static constexpr std::string_view boundary = "Boundary-test123";

    static std::string part_text(std::string_view headers, std::string_view payload) {
        std::string out = "--";
        out += boundary;
        out += "\r\n";
        out += headers;
        out += "\r\n\r\n";
        out += payload;
        out += "\r\n";
        return out;
    }

    static std::string close_delimiter() {
        return "--" + std::string(boundary) + "--\r\n";
    }
};

// =============================================================================
// 分隔符测试
// =============================================================================

TEST_F(MultipartTest, GeneratedBoundaryShape) {
    auto b = multipart::generate_boundary();
    EXPECT_TRUE(b.starts_with("Boundary-"));
    EXPECT_EQ(b.size(), multipart::boundary_prefix.size() + multipart::boundary_random_length);
    EXPECT_TRUE(std::all_of(b.begin() + 9, b.end(),
        [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }));
    
    // 两次生成的分隔符不同
    EXPECT_NE(b, multipart::generate_boundary());
}

TEST_F(MultipartTest, CheckBoundaryLimits) {
    EXPECT_TRUE(multipart::check_boundary(std::string(70, 'a')).has_value());
    
    auto too_long = multipart::check_boundary(std::string(71, 'a'));
    ASSERT_FALSE(too_long.has_value());
    EXPECT_EQ(too_long.error().code, error_code::malformed_boundary);
    
    EXPECT_FALSE(multipart::check_boundary("").has_value());
    EXPECT_FALSE(multipart::check_boundary("ab\r\ncd").has_value());
}

// =============================================================================
// 头部解析测试
// =============================================================================

TEST_F(MultipartTest, BoundaryFromContentType) {
    auto plain = multipart::boundary_from_content_type("multipart/form-data; boundary=abc123");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(*plain, "abc123");
    
    auto quoted = multipart::boundary_from_content_type("Multipart/Form-Data; charset=utf-8; BOUNDARY=\"a'b c\"");
    ASSERT_TRUE(quoted.has_value());
    EXPECT_EQ(*quoted, "a'b c");
}

TEST_F(MultipartTest, BoundaryFromContentTypeErrors) {
    auto wrong = multipart::boundary_from_content_type("application/json");
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().code, error_code::invalid_content_type);
    EXPECT_EQ(wrong.error().detected, "application/json");
    
    auto missing = multipart::boundary_from_content_type("multipart/form-data");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::malformed_boundary);
}

TEST_F(MultipartTest, ContentDispositionParameters) {
    auto cd = multipart::parse_content_disposition(
        "form-data; name=\"say \\\"hi\\\"\"; filename=\"a.txt\"; filename*=UTF-8''na%C3%AFve.txt");
    EXPECT_EQ(cd.type, "form-data");
    ASSERT_TRUE(cd.name.has_value());
    EXPECT_EQ(*cd.name, "say \"hi\"");
    ASSERT_TRUE(cd.filename.has_value());
    EXPECT_EQ(*cd.filename, "a.txt");
    
    // filename* 优先
    auto effective = cd.effective_filename();
    ASSERT_TRUE(effective.has_value());
    EXPECT_EQ(*effective, "na\xC3\xAFve.txt");
}

TEST_F(MultipartTest, PartHeadersWithContinuation) {
    auto headers = multipart::parse_part_headers(
        "Content-Disposition: form-data;\r\n name=\"a\"\r\ncontent-type:  text/plain ");
    ASSERT_TRUE(headers.has_value());
    ASSERT_EQ(headers->size(), 2);
    EXPECT_EQ((*headers)[0].second, "form-data; name=\"a\"");
    
    const std::string* ct = multipart::find_header(*headers, "Content-Type");
    ASSERT_NE(ct, nullptr);
    EXPECT_EQ(*ct, "text/plain");
}

TEST_F(MultipartTest, PartHeadersRejectMalformedLines) {
    EXPECT_FALSE(multipart::parse_part_headers(" folded first").has_value());
    EXPECT_FALSE(multipart::parse_part_headers("no colon here").has_value());
    EXPECT_FALSE(multipart::parse_part_headers(": empty name").has_value());
}

// =============================================================================
// 封装测试
// =============================================================================

TEST_F(MultipartTest, FrameTextField) {
    std::vector<multipart::part> parts{multipart::part::field("name", "John")};
    
    auto body = multipart::frame(parts, boundary);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body,
        "--Boundary-test123\r\n"
        "Content-Disposition: form-data; name=\"name\"\r\n"
        "\r\n"
        "John\r\n"
        "--Boundary-test123--\r\n");
}

TEST_F(MultipartTest, FrameFilePart) {
    std::vector<multipart::part> parts{
        multipart::part::file("doc", "notes.txt", "text/plain", "hello")
    };
    
    auto body = multipart::frame(parts, boundary);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body,
        "--Boundary-test123\r\n"
        "Content-Disposition: form-data; name=\"doc\"; filename=\"notes.txt\"\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "hello\r\n"
        "--Boundary-test123--\r\n");
}

TEST_F(MultipartTest, FrameStripsHeaderInjection) {
    std::vector<multipart::part> parts{
        multipart::part::file("up\r\nContent-Type: evil", "a\"b\r\n.txt", "text/plain\r\nX-Evil: 1", "x")
    };
    
    auto body = multipart::frame(parts, boundary);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(body->find("\r\nContent-Type: evil"), std::string::npos);
    EXPECT_EQ(body->find("\r\nX-Evil"), std::string::npos);
    EXPECT_NE(body->find("name=\"upContent-Type: evil\""), std::string::npos);
    EXPECT_NE(body->find("filename=\"a\\\"b.txt\""), std::string::npos);
    
    // 解析后仍是一个部分
    auto parsed = multipart::parse(*body, boundary);
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->size(), 1);
    EXPECT_EQ((*parsed)[0].name, "upContent-Type: evil");
    EXPECT_EQ((*parsed)[0].filename, std::optional<std::string>{"a\"b.txt"});
}

TEST_F(MultipartTest, FrameRejectsEmptyName) {
    std::vector<multipart::part> parts{multipart::part::field("\r\n", "x")};
    auto body = multipart::frame(parts, boundary);
    ASSERT_FALSE(body.has_value());
    EXPECT_EQ(body.error().code, error_code::encoding_error);
}

TEST_F(MultipartTest, FrameRejectsNonUtf8TextValue) {
    std::vector<multipart::part> text{multipart::part::field("bin", std::string("\xFF\xFE", 2))};
    auto rejected = multipart::frame(text, boundary);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, error_code::encoding_error);
    EXPECT_EQ(rejected.error().where, path{"bin"});
    
    // 文件部分可以携带任意字节
    std::vector<multipart::part> file{
        multipart::part::file("bin", "b.dat", "application/octet-stream", std::string("\xFF\x00\xFE", 3))
    };
    auto accepted = multipart::frame(file, boundary);
    ASSERT_TRUE(accepted.has_value());
    EXPECT_NE(accepted->find(std::string("\xFF\x00\xFE", 3)), std::string::npos);
}

TEST_F(MultipartTest, FrameRejectsBadBoundary) {
    std::vector<multipart::part> parts{multipart::part::field("a", "1")};
    auto body = multipart::frame(parts, "");
    ASSERT_FALSE(body.has_value());
    EXPECT_EQ(body.error().code, error_code::malformed_boundary);
}

TEST_F(MultipartTest, FrameNoPartsIsCloseDelimiterOnly) {
    auto body = multipart::frame({}, boundary);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body, close_delimiter());
    
    auto parsed = multipart::parse(*body, boundary);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->empty());
}

TEST_F(MultipartTest, FieldsFromTree) {
    auto tree = node::make_mapping();
    tree.set("name", node::make_scalar("A B"));
    tree.set("tags", node::make_sequence({node::make_scalar("x"), node::make_scalar("y&z")}));
    
    auto parts = multipart::fields_from_tree(tree);
    ASSERT_TRUE(parts.has_value());
    ASSERT_EQ(parts->size(), 3);
    EXPECT_EQ((*parts)[0].name, "name");
    EXPECT_EQ((*parts)[0].payload, "A B");
    EXPECT_EQ((*parts)[2].name, "tags");
    EXPECT_EQ((*parts)[2].payload, "y&z");
    EXPECT_EQ((*parts)[0].content_type, std::optional<std::string>{"text/plain"});
}

TEST_F(MultipartTest, FieldsFromTreeUsesBracketKeys) {
    auto user = node::make_mapping();
    user.set("name", node::make_scalar("John"));
    auto tree = node::make_mapping();
    tree.set("user", std::move(user));
    
    auto parts = multipart::fields_from_tree(tree, codec_config{}.with_nesting(nesting_strategy::brackets));
    ASSERT_TRUE(parts.has_value());
    ASSERT_EQ(parts->size(), 1);
    EXPECT_EQ((*parts)[0].name, "user[name]");
    
    auto scalar_root = multipart::fields_from_tree(node::make_scalar("x"));
    ASSERT_FALSE(scalar_root.has_value());
    EXPECT_EQ(scalar_root.error().code, error_code::encoding_error);
}

// =============================================================================
// 解析测试
// =============================================================================

TEST_F(MultipartTest, ParseRoundTripKeepsOrderAndBytes) {
    std::string binary("\x89PNG\r\n\x1A\n\x00\x01", 10);
    std::vector<multipart::part> parts{
        multipart::part::field("first", "1"),
        multipart::part::file("img", "a.png", "image/png", binary),
        multipart::part::field("first", "2")
    };
    
    auto body = multipart::frame(parts, boundary);
    ASSERT_TRUE(body.has_value());
    
    auto parsed = multipart::parse(*body, boundary);
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->size(), 3);
    EXPECT_EQ((*parsed)[0].payload, "1");
    EXPECT_FALSE((*parsed)[0].is_file());
    EXPECT_TRUE((*parsed)[1].is_file());
    EXPECT_EQ((*parsed)[1].payload, binary);
    EXPECT_EQ((*parsed)[1].content_type, std::optional<std::string>{"image/png"});
    EXPECT_EQ((*parsed)[2].payload, "2");
}

TEST_F(MultipartTest, ParseDiscardsPreambleAndEpilogue) {
    std::string body = "This is the preamble.\r\n" +
        part_text("Content-Disposition: form-data; name=\"a\"", "alpha") +
        close_delimiter() + "epilogue text";
    
    auto parsed = multipart::parse(body, boundary);
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->size(), 1);
    EXPECT_EQ((*parsed)[0].name, "a");
    EXPECT_EQ((*parsed)[0].payload, "alpha");
}

TEST_F(MultipartTest, ParseToleratesTransportPadding) {
    std::string body = "--" + std::string(boundary) + " \t\r\n"
        "Content-Disposition: form-data; name=\"a\"\r\n\r\nv\r\n" + close_delimiter();
    
    auto parsed = multipart::parse(body, boundary);
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->size(), 1);
    EXPECT_EQ((*parsed)[0].payload, "v");
}

TEST_F(MultipartTest, ParsePayloadContainingBoundaryText) {
    std::string payload = "line one\r\n-- not a " + std::string(boundary) + " delimiter";
    std::string body = part_text("Content-Disposition: form-data; name=\"a\"", payload) + close_delimiter();
    
    auto parsed = multipart::parse(body, boundary);
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->size(), 1);
    EXPECT_EQ((*parsed)[0].payload, payload);
}

TEST_F(MultipartTest, ParseReadsPastBoundaryTextWithSuffix) {
    // 边界文本后跟其他字符时不是分隔符
    std::string payload = "head\r\n--" + std::string(boundary) + "XYZ tail\r\n--" +
                          std::string(boundary) + ".more";
    std::string body = "preamble --" + std::string(boundary) + "abc\r\n" +
        part_text("Content-Disposition: form-data; name=\"a\"", payload) +
        part_text("Content-Disposition: form-data; name=\"b\"", "beta") +
        close_delimiter();

    auto parsed = multipart::parse(body, boundary);
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->size(), 2);
    EXPECT_EQ((*parsed)[0].name, "a");
    EXPECT_EQ((*parsed)[0].payload, payload);
    EXPECT_EQ((*parsed)[1].payload, "beta");
}

TEST_F(MultipartTest, ParseMissingOpeningDelimiter) {
    auto parsed = multipart::parse("no delimiters here", boundary);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::malformed_boundary);
}

TEST_F(MultipartTest, ParseMissingClosingDelimiter) {
    std::string body = "--" + std::string(boundary) + "\r\n"
        "Content-Disposition: form-data; name=\"a\"\r\n\r\ntruncated";
    
    auto parsed = multipart::parse(body, boundary);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::malformed_boundary);
}

TEST_F(MultipartTest, ParseRejectsPartWithoutDisposition) {
    std::string body = part_text("Content-Type: text/plain", "x") + close_delimiter();
    
    auto parsed = multipart::parse(body, boundary);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::invalid_format);
    EXPECT_EQ(parsed.error().where, path{std::size_t{0}});
}

TEST_F(MultipartTest, ParseRejectsNonFormDataDisposition) {
    std::string body = part_text("Content-Disposition: form-data; name=\"ok\"", "1") +
        part_text("Content-Disposition: attachment; name=\"a\"", "2") + close_delimiter();
    
    auto parsed = multipart::parse(body, boundary);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::invalid_format);
    EXPECT_EQ(parsed.error().where, path{std::size_t{1}});
}

TEST_F(MultipartTest, ParseRejectsDispositionWithoutName) {
    std::string body = part_text("Content-Disposition: form-data; filename=\"a.txt\"", "x") + close_delimiter();
    
    auto parsed = multipart::parse(body, boundary);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::invalid_format);
}

TEST_F(MultipartTest, ParseKeepsExtraHeaders) {
    std::string body = part_text(
        "Content-Disposition: form-data; name=\"a\"\r\nContent-Transfer-Encoding: base64", "aGk=") +
        close_delimiter();
    
    auto parsed = multipart::parse(body, boundary);
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->size(), 1);
    
    // 传输编码不做解码
    EXPECT_EQ((*parsed)[0].payload, "aGk=");
    const std::string* cte = multipart::find_header((*parsed)[0].headers, "content-transfer-encoding");
    ASSERT_NE(cte, nullptr);
    EXPECT_EQ(*cte, "base64");
}
