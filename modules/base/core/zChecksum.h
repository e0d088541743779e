// 防止头文件重复包含。
#pragma once

// 引入 size_t 定义。
#include <cstddef>
// 引入固定宽度整数定义。
#include <cstdint>
// 引入字节数组容器。
#include <vector>

// 基础层校验和工具命名空间。
namespace rbl::base::checksum {

// CRC32-IEEE（反射多项式 0xEDB88320，init/xorout 均为 0xFFFFFFFF）。
// 与 zlib crc32 结果一致；空输入结果为 0。

// 返回 CRC32 初始累计状态。
uint32_t crc32IeeeInit();
// 用一段数据推进累计状态；data 为空或 size 为 0 时状态不变。
uint32_t crc32IeeeUpdate(uint32_t state, const uint8_t* data, size_t size);
// 把累计状态转换为最终 CRC 值。
uint32_t crc32IeeeFinal(uint32_t state);

// 一次性计算一段内存的 CRC32。
uint32_t crc32Ieee(const uint8_t* data, size_t size);
// 一次性计算字节数组的 CRC32。
uint32_t crc32Ieee(const std::vector<uint8_t>& data);

// 结束命名空间。
}  // namespace rbl::base::checksum
