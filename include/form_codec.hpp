#pragma once

// =============================================================================
// Form Codec Library - High-Level API
// 表单编解码库 - 高级API
//
// A C++23 header-only codec between typed values and HTML form bodies
// 一个C++23头文件库，在类型化数据与HTML表单正文之间编解码
//
// Features / 特性:
// - application/x-www-form-urlencoded with accumulate, brackets and indexed
//   brackets nesting / 支持累积、方括号、索引方括号三种嵌套方式的URL编码表单
// - multipart/form-data framing and parsing / multipart/form-data 封装与解析
// - File signature validation for uploads / 上传文件的签名校验
// - Modern C++23 with std::expected error handling
//   现代C++23设计，使用std::expected错误处理
// =============================================================================

#include "form_codec/buffer.hpp"
#include "form_codec/builder.hpp"
#include "form_codec/config.hpp"
#include "form_codec/content_types.hpp"
#include "form_codec/conversion.hpp"
#include "form_codec/core.hpp"
#include "form_codec/file_type.hpp"
#include "form_codec/log.hpp"
#include "form_codec/multipart/boundary.hpp"
#include "form_codec/multipart/framer.hpp"
#include "form_codec/multipart/headers.hpp"
#include "form_codec/multipart/parser.hpp"
#include "form_codec/node.hpp"
#include "form_codec/structure/decoder.hpp"
#include "form_codec/structure/encoder.hpp"
#include "form_codec/structure/record.hpp"
#include "form_codec/urlencoded/parser.hpp"
#include "form_codec/urlencoded/serializer.hpp"

namespace co::form {

// =============================================================================
// URL-encoded Interface / URL编码接口
// =============================================================================

namespace urlencoded {

/**
 * @brief Serialize a tree to application/x-www-form-urlencoded text
 * @brief 将值树序列化为URL编码表单文本
 *
 * @param tree The tree to serialize / 要序列化的值树
 * @param config Nesting strategy and key ordering / 嵌套策略与键排序
 * @return result<std::string> Wire text or encoding_error / 线路文本或编码错误
 *
 * @example
 * node tree = node::make_mapping();
 * tree.set("q", node::make_scalar("a b"));
 * auto wire = urlencoded::serialize(tree);   // "q=a%20b"
 */
inline result<std::string> serialize(const node& tree, const codec_config& config = {}) {
    return serializer(config.nesting, config.ordering).serialize(tree);
}

/**
 * @brief Parse application/x-www-form-urlencoded text into a tree
 * @brief 将URL编码表单文本解析为值树
 *
 * @param wire The wire text / 线路文本
 * @param config Nesting strategy / 嵌套策略
 * @return result<node> Parsed tree or invalid_format / 解析的值树或格式错误
 *
 * @details '+' becomes a space and %XX is decoded in the same pass, so
 * "%2B" yields a literal '+'.
 * @details '+' 转换为空格与 %XX 解码在同一遍完成，因此 "%2B" 得到字面 '+'。
 */
inline result<node> parse(std::string_view wire, const codec_config& config = {}) {
    return parser(config.nesting).parse(wire);
}

} // namespace urlencoded

// =============================================================================
// Multipart Interface / Multipart接口
// =============================================================================

namespace multipart {

/**
 * @brief Encode a typed value as a multipart/form-data body
 * @brief 将类型化数据编码为multipart/form-data正文
 *
 * @param value The value to encode / 要编码的值
 * @param boundary Boundary token / 分隔符
 * @param config Strategies / 编码策略
 * @return result<std::string> Framed body or error / 封装后的正文或错误
 */
template<typename T>
result<std::string> encode(const T& value, std::string_view boundary, const codec_config& config = {}) {
    auto tree = to_node(value, config);
    if (!tree) {
        return std::unexpected(std::move(tree.error()));
    }
    auto parts = fields_from_tree(*tree, config);
    if (!parts) {
        return std::unexpected(std::move(parts.error()));
    }
    return frame(*parts, boundary);
}

/**
 * @brief Decode a multipart/form-data body into a typed value
 * @brief 将multipart/form-data正文解码为类型化数据
 *
 * @param body The body / 正文
 * @param content_type_header Content-Type header carrying the boundary
 *        / 携带分隔符的Content-Type头部
 * @param config Strategies / 解码策略
 */
template<typename T>
result<T> decode(std::string_view body, std::string_view content_type_header, const codec_config& config = {}) {
    auto boundary = boundary_from_content_type(content_type_header);
    if (!boundary) {
        return std::unexpected(std::move(boundary.error()));
    }
    return multipart_conversion<T>(config, std::move(*boundary)).apply(body);
}

} // namespace multipart

} // namespace co::form
