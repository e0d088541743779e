// 引入 pipeline 类型定义。
#include "zPackageTypes.h"

// 进入命名空间。
namespace rbl {

// 默认分区名。
const char* const kDefaultPartName = "app";
// 默认固件版本。
const char* const kDefaultFwVersion = "v1.00";
// 默认产品编码（20 位数字串）。
const char* const kDefaultProductCode = "00010203040506070809";
// 默认输出扩展名（light_patch.bin -> light_patch.rbl）。
const char* const kPackageExtension = ".rbl";

// 结束命名空间。
}  // namespace rbl
