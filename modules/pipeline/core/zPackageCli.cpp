// 引入 CLI 相关接口声明。
#include "zPackageCli.h"

// 引入 errno。
#include <cerrno>
// 引入 isspace。
#include <cctype>
// 引入 strtoull。
#include <cstdlib>
// 引入路径扩展名替换。
#include <filesystem>
// 引入控制台输出。
#include <iostream>
// 引入 numeric_limits。
#include <limits>

// 文件系统命名空间别名。
namespace fs = std::filesystem;

// 进入 pipeline 命名空间。
namespace rbl {

namespace {

// 读取“选项 + 值”形式参数的值；缺值时回填错误。
bool takeOptionValue(int argc, char* argv[], int* argIndex, const std::string& option,
                     std::string* value, std::string& error) {
    if (*argIndex + 1 >= argc || argv[*argIndex + 1] == nullptr) {
        error = "missing value for " + option;
        return false;
    }
    *value = argv[++(*argIndex)];
    return true;
}

// 解析 u16 选项值。
bool takeU16Option(int argc, char* argv[], int* argIndex, const std::string& option,
                   uint16_t* out, std::string& error) {
    std::string text;
    if (!takeOptionValue(argc, argv, argIndex, option, &text, error)) {
        return false;
    }
    uint64_t value = 0;
    if (!parseUnsignedValue(text, std::numeric_limits<uint16_t>::max(), &value)) {
        error = "invalid " + option + " value: " + text + " (expected 0..65535)";
        return false;
    }
    *out = static_cast<uint16_t>(value);
    return true;
}

}  // namespace

// 解析无符号整数文本。
bool parseUnsignedValue(const std::string& text, const uint64_t maxValue, uint64_t* out) {
    // 空串、负号、前导空白都不接受（strtoull 会静默处理它们）。
    if (out == nullptr || text.empty() || text[0] == '-' || text[0] == '+' ||
        std::isspace(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    // 仅 0x/0X 前缀走十六进制，其余按十进制（不把前导 0 当八进制）。
    const bool hex = text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
    errno = 0;
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text.c_str(), &end, hex ? 16 : 10);
    // 必须完整消费且无溢出。
    if (errno == ERANGE || end == nullptr || *end != '\0') {
        return false;
    }
    if (value > maxValue) {
        return false;
    }
    *out = static_cast<uint64_t>(value);
    return true;
}

// 解析命令行参数并填充覆盖项。
bool parseCommandLine(int argc, char* argv[], CliOverrides& cli, std::string& error) {
    // 从 argv[1] 开始遍历（跳过程序名）。
    for (int argIndex = 1; argIndex < argc; ++argIndex) {
        const std::string arg = argv[argIndex] ? argv[argIndex] : "";
        // 帮助参数：标记后直接返回，忽略其余参数。
        if (arg == "-h" || arg == "--help") {
            cli.showHelp = true;
            return true;
        }
        if (arg == "--part-name") {
            if (!takeOptionValue(argc, argv, &argIndex, arg, &cli.partName, error)) {
                return false;
            }
            cli.partNameSet = true;
            continue;
        }
        if (arg == "--fw-version") {
            if (!takeOptionValue(argc, argv, &argIndex, arg, &cli.fwVersion, error)) {
                return false;
            }
            cli.fwVersionSet = true;
            continue;
        }
        if (arg == "--product-code") {
            if (!takeOptionValue(argc, argv, &argIndex, arg, &cli.productCode, error)) {
                return false;
            }
            cli.productCodeSet = true;
            continue;
        }
        if (arg == "--algo") {
            if (!takeU16Option(argc, argv, &argIndex, arg, &cli.algo, error)) {
                return false;
            }
            cli.algoSet = true;
            continue;
        }
        if (arg == "--algo2") {
            if (!takeU16Option(argc, argv, &argIndex, arg, &cli.algo2, error)) {
                return false;
            }
            cli.algo2Set = true;
            continue;
        }
        // 时间戳允许超过 32 位，合并配置时截断。
        if (arg == "--timestamp") {
            std::string text;
            if (!takeOptionValue(argc, argv, &argIndex, arg, &text, error)) {
                return false;
            }
            if (!parseUnsignedValue(text, std::numeric_limits<uint64_t>::max(), &cli.timestamp)) {
                error = "invalid --timestamp value: " + text;
                return false;
            }
            cli.timestampSet = true;
            continue;
        }
        // 任何未知选项都立即报错。
        if (arg.size() > 1 && arg[0] == '-') {
            error = "unknown option: " + arg;
            return false;
        }
        // 其余都是位置参数（空串也算，交给后续存在性检查报错）。
        cli.positionals.push_back(arg);
    }

    // <patch_file> <new_file> 必填，[output_file] 可选。
    if (cli.positionals.size() < 2 || cli.positionals.size() > 3) {
        error = "expected 2 or 3 positional arguments, got " + std::to_string(cli.positionals.size());
        return false;
    }
    return true;
}

// 打印命令行帮助文本。
void printUsage(const char* exeName) {
    const char* name = (exeName != nullptr && exeName[0] != '\0') ? exeName : "rblpack";
    std::cout
        << "Usage:\n"
        << "  " << name << " <patch_file> <new_file> [output_file] [options]\n\n"
        << "  <patch_file>  The binary patch data (e.g., from hdiffi), stored as package body.\n"
        << "  <new_file>    The new version file, used for header metadata (raw_size, raw_crc).\n"
        << "  [output_file] Output package path (default: <patch_file> with .rbl extension).\n\n"
        << "Options:\n"
        << "  --part-name <name>       Partition name, up to 16 bytes (default: " << kDefaultPartName << ")\n"
        << "  --fw-version <ver>       Firmware version, up to 24 bytes (default: " << kDefaultFwVersion << ")\n"
        << "  --product-code <code>    Product code, up to 24 bytes (default: " << kDefaultProductCode << ")\n"
        << "  --algo <n>               algo field, u16 decimal or 0x-hex (default: 0x0400, hpatchlite)\n"
        << "  --algo2 <n>              algo2 field, u16 decimal or 0x-hex (default: 0)\n"
        << "  --timestamp <n>          Header timestamp in seconds (default: patch file mtime)\n"
        << "  -h, --help               Show this help\n";
}

// 默认输出路径：light_patch.bin -> light_patch.rbl。
std::string defaultOutputPath(const std::string& patchFile) {
    fs::path p(patchFile);
    // replace_extension 在无扩展名时直接追加。
    p.replace_extension(kPackageExtension);
    return p.string();
}

// 结束命名空间。
}  // namespace rbl
