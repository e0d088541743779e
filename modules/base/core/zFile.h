// 防止头文件重复包含。
#pragma once

// 引入固定宽度整数定义。
#include <cstdint>
// 引入字符串类型。
#include <string>
// 引入字节数组容器。
#include <vector>

// 基础层文件 IO 工具命名空间。
namespace rbl::base::file {

// 判断路径是否存在且为普通文件。
bool fileExists(const std::string& path);
// 读取文件为字节数组。
bool readFileBytes(const std::string& path, std::vector<uint8_t>* out);
// 把字节数组写入文件（覆盖写，父目录不存在时创建）。
bool writeFileBytes(const std::string& path, const std::vector<uint8_t>& data);
// 读取文件最后修改时间（距 epoch 的秒数）。
bool fileModifiedTime(const std::string& path, int64_t* outSeconds);

// 结束命名空间。
}  // namespace rbl::base::file
