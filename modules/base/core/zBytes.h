// 防止头文件重复包含。
#pragma once

// 引入 size_t 定义。
#include <cstddef>
// 引入固定宽度整数类型。
#include <cstdint>
// 引入字符串类型。
#include <string>
// 引入字节数组容器。
#include <vector>

// 基础层定长字段与字节区间工具命名空间。
namespace rbl::base::bytes {

// 判断字符串是否为严格合法的 UTF-8 序列。
// 拒绝：过长编码、代理区码点、超过 U+10FFFF 的码点、截断的多字节序列。
bool isValidUtf8(const std::string& value);

// 在不拆分码点的前提下，返回 value 不超过 maxBytes 的最长前缀字节数。
// 语义：value 必须已是合法 UTF-8。
size_t utf8PrefixLength(const std::string& value, size_t maxBytes);

// 把字符串写成宽度为 width 的定长字段并追加到 out 末尾：
// - 超长时按码点边界静默截断；
// - 不足时右侧补 0；
// - 非法 UTF-8 或含内嵌 NUL 时失败，out 不被修改。
bool appendFixedField(std::vector<uint8_t>* out,
                      const std::string& value,
                      size_t width,
                      const char* name,
                      std::string* error);

// 读取 bytes[offset, offset+width) 定长字段，遇到第一个 0 字节截止。
// 越界时返回 false。
bool readFixedField(const std::vector<uint8_t>& bytes,
                    size_t offset,
                    size_t width,
                    std::string* out);

// 结束命名空间。
}  // namespace rbl::base::bytes
