/*
 * [RBL_FLOW_NOTE] 文件级流程注释
 * - rblpack CLI 主入口：解析参数、合并配置、校验输入、执行打包。
 * - 打包链路位置：差分补丁生成（hdiffi）之后、下发 bootloader 之前。
 * - 输入：补丁文件 + 新版本固件 + 可选输出路径/元信息选项。
 * - 输出：RBL 包（96 字节包头 + 补丁原始字节）。
 */

// std::string。
#include <string>

// 日志。
#include "zLog.h"
// CLI 解析与 usage。
#include "zPackageCli.h"
// 配置合并/校验与打包流程。
#include "zPackageRun.h"
// 配置结构与退出码。
#include "zPackageTypes.h"

int main(int argc, char* argv[]) {
    const char* exeName = (argc > 0 && argv != nullptr) ? argv[0] : nullptr;

    // 解析命令行；参数个数或选项错误时只打印 usage，不做任何文件 IO。
    rbl::CliOverrides cli;
    std::string cliError;
    if (!rbl::parseCommandLine(argc, argv, cli, cliError)) {
        LOGE("%s", cliError.c_str());
        rbl::printUsage(exeName);
        return rbl::kExitUsage;
    }
    if (cli.showHelp) {
        rbl::printUsage(exeName);
        return rbl::kExitOk;
    }

    // 默认值 + CLI 覆盖。
    rbl::RblPackConfig config;
    rbl::applyCliOverrides(cli, config);
    if (!rbl::validateConfig(config)) {
        return rbl::kExitFailure;
    }
    return rbl::runPackageFlow(config);
}
