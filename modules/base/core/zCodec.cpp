// 引入小端编解码接口声明。
#include "zCodec.h"

// 进入基础编解码命名空间。
namespace rbl::base::codec {

// 在数组末尾追加一个小端 u16。
void appendU16Le(std::vector<uint8_t>* out, const uint16_t value) {
    // 输出数组不能为空。
    if (out == nullptr) {
        return;
    }
    // 低位在前。
    out->push_back(static_cast<uint8_t>(value & 0xff));
    out->push_back(static_cast<uint8_t>((value >> 8) & 0xff));
}

// 在数组末尾追加一个小端 u32。
void appendU32Le(std::vector<uint8_t>* out, const uint32_t value) {
    // 输出数组不能为空。
    if (out == nullptr) {
        return;
    }
    // 依次追加 4 个字节（低位在前）。
    out->push_back(static_cast<uint8_t>(value & 0xff));
    out->push_back(static_cast<uint8_t>((value >> 8) & 0xff));
    out->push_back(static_cast<uint8_t>((value >> 16) & 0xff));
    out->push_back(static_cast<uint8_t>((value >> 24) & 0xff));
}

// 从 bytes[offset, offset+2) 读取小端 u16。
bool readU16Le(const std::vector<uint8_t>& bytes, const size_t offset, uint16_t* out) {
    // 输出指针不能为空，且读取区间不能越界。
    if (out == nullptr || offset > bytes.size() || bytes.size() - offset < 2) {
        return false;
    }
    *out = static_cast<uint16_t>(static_cast<uint16_t>(bytes[offset]) |
                                 (static_cast<uint16_t>(bytes[offset + 1]) << 8));
    return true;
}

// 从 bytes[offset, offset+4) 读取小端 u32。
bool readU32Le(const std::vector<uint8_t>& bytes, const size_t offset, uint32_t* out) {
    // 输出指针不能为空，且读取区间不能越界。
    if (out == nullptr || offset > bytes.size() || bytes.size() - offset < 4) {
        return false;
    }
    // 按 little-endian 组合 4 个字节。
    *out = static_cast<uint32_t>(bytes[offset]) |
           (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
           (static_cast<uint32_t>(bytes[offset + 3]) << 24);
    return true;
}

// 向 bytes[offset, offset+4) 写入小端 u32。
bool writeU32Le(std::vector<uint8_t>* bytes, const size_t offset, const uint32_t value) {
    // 目标指针不能为空，且写入区间不能越界。
    if (bytes == nullptr || offset > bytes->size() || bytes->size() - offset < 4) {
        return false;
    }
    (*bytes)[offset] = static_cast<uint8_t>(value & 0xff);
    (*bytes)[offset + 1] = static_cast<uint8_t>((value >> 8) & 0xff);
    (*bytes)[offset + 2] = static_cast<uint8_t>((value >> 16) & 0xff);
    (*bytes)[offset + 3] = static_cast<uint8_t>((value >> 24) & 0xff);
    return true;
}

// 结束命名空间。
}  // namespace rbl::base::codec
