// 引入运行编排公共接口。
#include "zPackageRun.h"

// 引入路径规范化。
#include <filesystem>
// 引入 numeric_limits。
#include <limits>
// 引入动态数组容器。
#include <vector>

// 引入 CRC32（raw_crc 自检）。
#include "zChecksum.h"
// 引入文件工具（exists/read/write/mtime）。
#include "zFile.h"
// 引入日志工具。
#include "zLog.h"
// 引入默认输出路径推导。
#include "zPackageCli.h"
// 引入算法名渲染。
#include "zRblAlgo.h"
// 引入包组装与自检。
#include "zRblPackage.h"

// 文件系统命名空间别名。
namespace fs = std::filesystem;

// 进入 pipeline 命名空间。
namespace rbl {

namespace {

// 判断两个路径是否指向同一文件（目标不存在时按规范化路径比较）。
bool isSamePath(const std::string& lhs, const std::string& rhs) {
    std::error_code ec;
    if (fs::exists(lhs, ec) && fs::exists(rhs, ec)) {
        const bool same = fs::equivalent(lhs, rhs, ec);
        return !ec && same;
    }
    const fs::path left = fs::weakly_canonical(lhs, ec);
    if (ec) {
        return false;
    }
    const fs::path right = fs::weakly_canonical(rhs, ec);
    return !ec && left == right;
}

// 把 64 位秒数截断为包头的 u32 时间戳，超范围时告警。
uint32_t truncateTimestamp(const int64_t seconds, const char* source) {
    if (seconds < 0 || seconds > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        LOGW("%s timestamp %lld does not fit in 32 bits, truncated",
             source, static_cast<long long>(seconds));
    }
    return static_cast<uint32_t>(seconds);
}

// 字符串字段被截断时给出告警。
void warnIfTruncated(const char* field, const std::string& requested, const std::string& stored) {
    if (requested != stored) {
        LOGW("%s truncated from %zu to %zu bytes: '%s'",
             field, requested.size(), stored.size(), stored.c_str());
    }
}

}  // namespace

// 把 CLI 覆盖项合并到最终配置。
void applyCliOverrides(const CliOverrides& cli, RblPackConfig& config) {
    // 位置参数：<patch_file> <new_file> [output_file]。
    if (cli.positionals.size() > 0) {
        config.patchFile = cli.positionals[0];
    }
    if (cli.positionals.size() > 1) {
        config.newFile = cli.positionals[1];
    }
    if (cli.positionals.size() > 2) {
        config.outputFile = cli.positionals[2];
    }
    // 未指定输出时由补丁文件名推导。
    if (config.outputFile.empty() && !config.patchFile.empty()) {
        config.outputFile = defaultOutputPath(config.patchFile);
    }
    // 元信息覆盖。
    if (cli.partNameSet) {
        config.partName = cli.partName;
    }
    if (cli.fwVersionSet) {
        config.fwVersion = cli.fwVersion;
    }
    if (cli.productCodeSet) {
        config.productCode = cli.productCode;
    }
    if (cli.algoSet) {
        config.algo = cli.algo;
    }
    if (cli.algo2Set) {
        config.algo2 = cli.algo2;
    }
    // 显式时间戳在此截断到 32 位。
    if (cli.timestampSet) {
        if (cli.timestamp > std::numeric_limits<uint32_t>::max()) {
            LOGW("--timestamp %llu does not fit in 32 bits, truncated",
                 static_cast<unsigned long long>(cli.timestamp));
        }
        config.timestampSet = true;
        config.timestamp = static_cast<uint32_t>(cli.timestamp);
    }
}

// 校验配置合法性。
bool validateConfig(const RblPackConfig& config) {
    // 补丁文件必须存在。
    if (!base::file::fileExists(config.patchFile)) {
        LOGE("patch file not found at '%s'", config.patchFile.c_str());
        return false;
    }
    // 新版本文件必须存在。
    if (!base::file::fileExists(config.newFile)) {
        LOGE("new file not found at '%s'", config.newFile.c_str());
        return false;
    }
    if (config.outputFile.empty()) {
        LOGE("output file path is empty");
        return false;
    }
    // 输出不能覆盖任一输入。
    if (isSamePath(config.outputFile, config.patchFile) ||
        isSamePath(config.outputFile, config.newFile)) {
        LOGE("output file '%s' would overwrite an input file", config.outputFile.c_str());
        return false;
    }
    return true;
}

// 组装包头元信息。
package::RblHeaderMeta buildHeaderMeta(const RblPackConfig& config, const uint32_t timestamp) {
    package::RblHeaderMeta meta;
    meta.algo = config.algo;
    meta.algo2 = config.algo2;
    meta.timestamp = timestamp;
    meta.partName = config.partName;
    meta.fwVersion = config.fwVersion;
    meta.productCode = config.productCode;
    return meta;
}

// 打包主流程。
int runPackageFlow(const RblPackConfig& config) {
    LOGI("--- Packaging patch file: '%s' ---", config.patchFile.c_str());

    // 1. 读取新版本文件，用于 raw_size / raw_crc。
    std::vector<uint8_t> newFirmware;
    if (!base::file::readFileBytes(config.newFile, &newFirmware)) {
        LOGE("failed to read new file '%s'", config.newFile.c_str());
        return kExitFailure;
    }
    LOGI("read new file '%s' for header info, size: %zu", config.newFile.c_str(), newFirmware.size());

    // 2. 读取补丁文件，作为包体。
    std::vector<uint8_t> patchBody;
    if (!base::file::readFileBytes(config.patchFile, &patchBody)) {
        LOGE("failed to read patch file '%s'", config.patchFile.c_str());
        return kExitFailure;
    }
    LOGI("read patch file (package body) '%s', size: %zu", config.patchFile.c_str(), patchBody.size());

    // 3. 时间戳：显式值优先，否则取补丁文件 mtime。
    uint32_t timestamp = config.timestamp;
    if (!config.timestampSet) {
        int64_t mtime = 0;
        if (!base::file::fileModifiedTime(config.patchFile, &mtime)) {
            LOGE("failed to stat patch file '%s'", config.patchFile.c_str());
            return kExitFailure;
        }
        timestamp = truncateTimestamp(mtime, "patch file mtime");
    }

    // 4. 构建包头并拼接包体。
    const package::RblHeaderMeta meta = buildHeaderMeta(config, timestamp);
    std::vector<uint8_t> packageBytes;
    std::string error;
    if (!package::assembleRblPackage(newFirmware, patchBody, meta, &packageBytes, &error)) {
        LOGE("failed to build RBL header: %s", error.c_str());
        return kExitFailure;
    }
    LOGI("generated header size: %zu", package::kRblHeaderSize);

    // 5. 写出前回读自检：包头 CRC、包体长度/CRC、新固件长度/CRC。
    package::RblHeaderInfo info;
    if (!package::checkRblPackage(packageBytes, &info, &error)) {
        LOGE("package self-check failed: %s", error.c_str());
        return kExitFailure;
    }
    if (info.rawSize != newFirmware.size() || info.rawCrc != base::checksum::crc32Ieee(newFirmware)) {
        LOGE("package self-check failed: raw_size/raw_crc do not describe '%s'", config.newFile.c_str());
        return kExitFailure;
    }
    warnIfTruncated("part_name", meta.partName, info.partName);
    warnIfTruncated("fw_version", meta.fwVersion, info.fwVersion);
    warnIfTruncated("product_code", meta.productCode, info.productCode);
    LOGD("header: algo=0x%04x(%s) algo2=0x%04x(%s) time=%u part='%s' ver='%s' prod='%s'",
         info.algo, package::algo::describeAlgo(info.algo).c_str(),
         info.algo2, package::algo::describeAlgo2(info.algo2).c_str(),
         info.timestamp, info.partName.c_str(), info.fwVersion.c_str(), info.productCode.c_str());
    LOGD("header: pkg_crc=0x%08x raw_crc=0x%08x raw_size=%u pkg_size=%u hdr_crc=0x%08x",
         info.packageCrc, info.rawCrc, info.rawSize, info.packageSize, info.headerCrc);

    // 6. 所有前置步骤成功后才打开输出文件。
    if (!base::file::writeFileBytes(config.outputFile, packageBytes)) {
        LOGE("failed to write package '%s'", config.outputFile.c_str());
        return kExitFailure;
    }
    LOGI("successfully created RBL patch package: '%s' (%zu bytes)",
         config.outputFile.c_str(), packageBytes.size());
    return kExitOk;
}

// 结束命名空间。
}  // namespace rbl
