// RBL 包头协议定义：
// - 打包器（本工具）与 bootloader 必须共用同一份布局；
// - 所有多字节整数均为小端；
// - 包头之后紧跟补丁包体原始字节，无额外封装。
#pragma once

// 引入 offsetof / size_t。
#include <cstddef>
// 固定宽度整数类型。
#include <cstdint>
// 引入错误信息字符串。
#include <string>
// 引入字节数组容器。
#include <vector>

namespace rbl::package {

// 包类型魔数（"RBL\0"）。
constexpr uint8_t kRblMagic[4] = {'R', 'B', 'L', '\0'};

#pragma pack(push, 1)
// RBL 包头二进制布局（仅用于推导偏移与大小，序列化走逐字段小端编码）。
struct RblHeaderLayout {
    // 包类型魔数。
    uint8_t type[4];
    // 压缩/加密算法标识。
    uint16_t algo;
    // 校验算法标识。
    uint16_t algo2;
    // 打包时间戳（秒）。
    uint32_t timeStamp;
    // 目标分区名。
    uint8_t partName[16];
    // 固件版本。
    uint8_t fwVersion[24];
    // 产品编码。
    uint8_t productCode[24];
    // 包体（补丁）CRC32。
    uint32_t packageCrc;
    // 新固件 CRC32。
    uint32_t rawCrc;
    // 新固件字节数。
    uint32_t rawSize;
    // 包体字节数。
    uint32_t packageSize;
    // 前面全部字段的 CRC32。
    uint32_t headerCrc;
};
#pragma pack(pop)

// 协议结构大小固定保护。
static_assert(sizeof(RblHeaderLayout) == 96, "RblHeaderLayout layout mismatch");

// 包头总大小。
constexpr size_t kRblHeaderSize = sizeof(RblHeaderLayout);
// header_crc 字段偏移，也是 header_crc 覆盖范围的长度。
constexpr size_t kRblHeaderCrcOffset = offsetof(RblHeaderLayout, headerCrc);
// 各字符串字段宽度。
constexpr size_t kPartNameSize = sizeof(RblHeaderLayout::partName);
constexpr size_t kFwVersionSize = sizeof(RblHeaderLayout::fwVersion);
constexpr size_t kProductCodeSize = sizeof(RblHeaderLayout::productCode);

// 构建包头所需的元信息（与两段输入字节无关的部分）。
struct RblHeaderMeta {
    // 压缩/加密算法标识（不做取值校验）。
    uint16_t algo = 0;
    // 校验算法标识（不做取值校验）。
    uint16_t algo2 = 0;
    // 时间戳，由调用方提供。
    uint32_t timestamp = 0;
    // 分区名，超出 16 字节按码点边界截断。
    std::string partName;
    // 固件版本，超出 24 字节按码点边界截断。
    std::string fwVersion;
    // 产品编码，超出 24 字节按码点边界截断。
    std::string productCode;
};

// 包头解码结果。
struct RblHeaderInfo {
    uint16_t algo = 0;
    uint16_t algo2 = 0;
    uint32_t timestamp = 0;
    // 字符串字段（取到第一个 0 字节为止）。
    std::string partName;
    std::string fwVersion;
    std::string productCode;
    uint32_t packageCrc = 0;
    uint32_t rawCrc = 0;
    uint32_t rawSize = 0;
    uint32_t packageSize = 0;
    uint32_t headerCrc = 0;
};

// 构建 RBL 包头。
// 入参：
// - newFirmware: 新版本完整固件（决定 raw_size / raw_crc）。
// - patchBody: 补丁包体（决定 package_size / package_crc）。
// - meta: 算法标识、时间戳与三个字符串字段。
// 出参：
// - outHeader: 成功时为恰好 kRblHeaderSize 字节的包头。
// 返回：
// - true: 构建成功。
// - false: 字符串字段编码非法（"encoding error: ..."）或输入长度超出 32 位（"size overflow: ..."），
//   此时 outHeader 不被修改。
bool buildRblHeader(const std::vector<uint8_t>& newFirmware,
                    const std::vector<uint8_t>& patchBody,
                    const RblHeaderMeta& meta,
                    std::vector<uint8_t>* outHeader,
                    std::string* error);

// 解码 bytes 开头的 RBL 包头并校验 magic 与 header_crc。
// bytes 可以是完整包（包头后带包体），只解析前 kRblHeaderSize 字节。
bool parseRblHeader(const std::vector<uint8_t>& bytes,
                    RblHeaderInfo* outInfo,
                    std::string* error);

}  // namespace rbl::package
