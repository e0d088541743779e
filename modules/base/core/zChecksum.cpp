// 引入 CRC 接口声明。
#include "zChecksum.h"

// 引入 std::array。
#include <array>

// 进入基础校验和命名空间。
namespace rbl::base::checksum {

namespace {

// 反射形式的 IEEE 802.3 多项式。
constexpr uint32_t kCrc32Poly = 0xEDB88320u;

// 生成 256 项 CRC32 查找表。
std::array<uint32_t, 256> makeCrc32Table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t byteValue = 0; byteValue < 256; ++byteValue) {
        // 对单个字节值做 8 轮移位异或。
        uint32_t entry = byteValue;
        for (int bit = 0; bit < 8; ++bit) {
            entry = (entry & 1u) ? (kCrc32Poly ^ (entry >> 1u)) : (entry >> 1u);
        }
        table[byteValue] = entry;
    }
    return table;
}

// 返回只读查找表（函数内静态对象，首次调用时线程安全地构建）。
const std::array<uint32_t, 256>& crc32Table() {
    static const std::array<uint32_t, 256> table = makeCrc32Table();
    return table;
}

}  // namespace

uint32_t crc32IeeeInit() {
    return 0xFFFFFFFFu;
}

uint32_t crc32IeeeUpdate(uint32_t state, const uint8_t* data, const size_t size) {
    // 空区间不改变状态。
    if (data == nullptr || size == 0) {
        return state;
    }
    const std::array<uint32_t, 256>& table = crc32Table();
    // 逐字节查表推进。
    for (size_t index = 0; index < size; ++index) {
        state = table[(state ^ data[index]) & 0xFFu] ^ (state >> 8u);
    }
    return state;
}

uint32_t crc32IeeeFinal(uint32_t state) {
    return state ^ 0xFFFFFFFFu;
}

// 组合流程：init -> update -> final。
uint32_t crc32Ieee(const uint8_t* data, const size_t size) {
    return crc32IeeeFinal(crc32IeeeUpdate(crc32IeeeInit(), data, size));
}

uint32_t crc32Ieee(const std::vector<uint8_t>& data) {
    // 空数组的 data() 可能为空指针，update 会按空区间处理。
    return crc32Ieee(data.data(), data.size());
}

// 结束命名空间。
}  // namespace rbl::base::checksum
