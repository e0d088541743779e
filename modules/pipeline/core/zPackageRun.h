// 防止头文件重复包含。
#pragma once

// 引入字符串类型。
#include <string>

// 引入包头元信息结构。
#include "zRblHeader.h"
// 引入 pipeline 配置结构。
#include "zPackageTypes.h"

// 进入 pipeline 命名空间。
namespace rbl {

// 将 CLI 覆盖项应用到配置对象（位置参数 + 元信息选项）。
void applyCliOverrides(const CliOverrides& cli, RblPackConfig& config);
// 校验最终配置：输入文件必须存在，输出不能覆盖输入。
bool validateConfig(const RblPackConfig& config);
// 由配置和时间戳组装包头元信息。
package::RblHeaderMeta buildHeaderMeta(const RblPackConfig& config, uint32_t timestamp);
// 执行打包：读输入 -> 构建包头 -> 自检 -> 写出。返回 ExitCode。
int runPackageFlow(const RblPackConfig& config);

// 结束命名空间。
}  // namespace rbl
