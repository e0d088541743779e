// 防止头文件重复包含。
#pragma once

// 引入固定宽度整数。
#include <cstdint>
// 引入字符串类型。
#include <string>

// 引入 pipeline 类型定义。
#include "zPackageTypes.h"

// 进入 pipeline 命名空间。
namespace rbl {

// 解析无符号整数参数（十进制或 0x 前缀十六进制），要求不超过 maxValue。
bool parseUnsignedValue(const std::string& text, uint64_t maxValue, uint64_t* out);
// 解析命令行参数并输出覆盖项；位置参数个数不在 2..3 之间时失败。
bool parseCommandLine(int argc, char* argv[], CliOverrides& cli, std::string& error);
// 打印命令行帮助。
void printUsage(const char* exeName);
// 由补丁文件路径推导默认输出路径：替换扩展名为 .rbl。
std::string defaultOutputPath(const std::string& patchFile);

// 结束命名空间。
}  // namespace rbl
