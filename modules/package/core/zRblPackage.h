// 防止头文件重复包含。
#pragma once

// 引入固定宽度整数。
#include <cstdint>
// 引入字符串类型。
#include <string>
// 引入字节数组容器。
#include <vector>

// 引入包头协议定义。
#include "zRblHeader.h"

namespace rbl::package {

// 组装完整 RBL 包：包头 + 补丁包体原始字节。
// 失败时 outPackage 不被修改，error 与 buildRblHeader 一致。
bool assembleRblPackage(const std::vector<uint8_t>& newFirmware,
                        const std::vector<uint8_t>& patchBody,
                        const RblHeaderMeta& meta,
                        std::vector<uint8_t>* outPackage,
                        std::string* error);

// 打包端自检：解码包头，并确认 package_size / package_crc 与包头之后的字节一致。
// 成功时回填 outInfo（可为空）。
bool checkRblPackage(const std::vector<uint8_t>& packageBytes,
                     RblHeaderInfo* outInfo,
                     std::string* error);

}  // namespace rbl::package
