// 防止头文件重复包含。
#pragma once

// 引入固定宽度整数。
#include <cstdint>
// 引入字符串类型。
#include <string>

// qboot 算法标识空间：
// - algo 低字节：加密算法；
// - algo 高字节：压缩/包体格式算法；
// - algo2：校验算法。
// 打包器只写入这些标识，不实现对应算法。
namespace rbl::package::algo {

// algo 低字节掩码（加密）。
constexpr uint16_t kCryptMask = 0x00FFu;
// algo 高字节掩码（压缩）。
constexpr uint16_t kCompressMask = 0xFF00u;

// 不加密。
constexpr uint16_t kCryptNone = 0;
// XOR 加密。
constexpr uint16_t kCryptXor = 1;
// AES 加密。
constexpr uint16_t kCryptAes = 2;

// 不压缩。
constexpr uint16_t kCompressNone = (0u << 8);
// gzip。
constexpr uint16_t kCompressGzip = (1u << 8);
// QuickLZ。
constexpr uint16_t kCompressQuicklz = (2u << 8);
// FastLZ。
constexpr uint16_t kCompressFastlz = (3u << 8);
// HPatchLite 差分补丁（包体是补丁而非完整固件）。
constexpr uint16_t kCompressHpatchlite = (4u << 8);

// algo2：无额外校验。
constexpr uint16_t kVerifyNone = 0;
// algo2：CRC 校验。
constexpr uint16_t kVerifyCrc = 1;

// 渲染 algo 字段，例如 "hpatchlite+none"；未知值以十六进制显示。
std::string describeAlgo(uint16_t algo);
// 渲染 algo2 字段，例如 "crc"。
std::string describeAlgo2(uint16_t algo2);

}  // namespace rbl::package::algo
