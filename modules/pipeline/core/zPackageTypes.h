// 防止头文件重复包含。
#pragma once

// 引入固定宽度整数。
#include <cstdint>
// 引入字符串类型。
#include <string>
// 引入动态数组容器。
#include <vector>

// 引入算法标识常量。
#include "zRblAlgo.h"

// 进入 pipeline 顶层命名空间。
namespace rbl {

// 进程退出码。
enum ExitCode : int {
    // 打包成功。
    kExitOk = 0,
    // 参数个数/选项错误（打印 usage，不做文件 IO）。
    kExitUsage = 1,
    // 输入缺失、编码失败、自检失败或写出失败。
    kExitFailure = 2,
};

// 默认元信息（与历史打包脚本的写死值一致）。
extern const char* const kDefaultPartName;
extern const char* const kDefaultFwVersion;
extern const char* const kDefaultProductCode;
// 默认输出扩展名。
extern const char* const kPackageExtension;

// rblpack 主流程配置。
// 该结构体由“默认值 + CLI 覆盖”共同构成最终运行参数。
struct RblPackConfig {
    // 补丁文件（包体）路径。
    std::string patchFile;
    // 新版本固件路径（仅用于 raw_size / raw_crc）。
    std::string newFile;
    // 输出包路径；为空时由 patchFile 推导。
    std::string outputFile;
    // 目标分区名。
    std::string partName = kDefaultPartName;
    // 固件版本。
    std::string fwVersion = kDefaultFwVersion;
    // 产品编码。
    std::string productCode = kDefaultProductCode;
    // algo 字段（默认 HPatchLite 差分 + 不加密）。
    uint16_t algo = static_cast<uint16_t>(package::algo::kCompressHpatchlite | package::algo::kCryptNone);
    // algo2 字段（默认无校验算法）。
    uint16_t algo2 = package::algo::kVerifyNone;
    // 是否显式指定时间戳；否则取补丁文件 mtime。
    bool timestampSet = false;
    // 显式时间戳（已截断到 32 位）。
    uint32_t timestamp = 0;
};

// CLI 覆盖项集合。
// Set 字段用于区分“未传入”和“传入空串/0”。
struct CliOverrides {
    // 是否显示帮助信息。
    bool showHelp = false;
    // 位置参数：<patch_file> <new_file> [output_file]。
    std::vector<std::string> positionals;
    // 覆盖 partName。
    bool partNameSet = false;
    std::string partName;
    // 覆盖 fwVersion。
    bool fwVersionSet = false;
    std::string fwVersion;
    // 覆盖 productCode。
    bool productCodeSet = false;
    std::string productCode;
    // 覆盖 algo。
    bool algoSet = false;
    uint16_t algo = 0;
    // 覆盖 algo2。
    bool algo2Set = false;
    uint16_t algo2 = 0;
    // 覆盖时间戳（原始 64 位值，合并时截断）。
    bool timestampSet = false;
    uint64_t timestamp = 0;
};

// 结束命名空间。
}  // namespace rbl
