// 防止头文件重复包含。
#pragma once

// 引入 size_t 定义。
#include <cstddef>
// 引入固定宽度整数类型。
#include <cstdint>
// 引入字节数组容器。
#include <vector>

// 基础层 little-endian 编解码工具命名空间。
namespace rbl::base::codec {

// 末尾追加一个小端 u16。
void appendU16Le(std::vector<uint8_t>* out, uint16_t value);
// 末尾追加一个小端 u32。
void appendU32Le(std::vector<uint8_t>* out, uint32_t value);
// 从字节数组按小端读取 u16。
bool readU16Le(const std::vector<uint8_t>& bytes, size_t offset, uint16_t* out);
// 从字节数组按小端读取 u32。
bool readU32Le(const std::vector<uint8_t>& bytes, size_t offset, uint32_t* out);
// 向字节数组按小端覆盖写入 u32（区间必须已存在）。
bool writeU32Le(std::vector<uint8_t>* bytes, size_t offset, uint32_t value);

// 结束命名空间。
}  // namespace rbl::base::codec
