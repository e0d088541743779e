// 引入定长字段工具接口声明。
#include "zBytes.h"

// 进入基础字节工具命名空间。
namespace rbl::base::bytes {

// 内部辅助命名空间，仅当前编译单元可见。
namespace {

// 统一构造字段错误消息。
bool setFieldError(const char* name, const std::string& message, std::string* error) {
    // 调用方提供 error 输出时回填具体内容。
    if (error) {
        // 错误格式统一为 "<field> <message>"。
        *error = std::string(name ? name : "field") + " " + message;
    }
    // 便于直接 return 的失败返回值。
    return false;
}

// 判断是否为 UTF-8 续字节（10xxxxxx）。
bool isContinuationByte(const uint8_t value) {
    return (value & 0xC0u) == 0x80u;
}

}  // namespace

bool isValidUtf8(const std::string& value) {
    const size_t size = value.size();
    size_t index = 0;
    while (index < size) {
        const uint8_t lead = static_cast<uint8_t>(value[index]);
        // ASCII 单字节。
        if (lead < 0x80u) {
            ++index;
            continue;
        }

        // 根据首字节确定序列长度与第二字节的合法范围。
        size_t length = 0;
        uint8_t secondMin = 0x80u;
        uint8_t secondMax = 0xBFu;
        if (lead >= 0xC2u && lead <= 0xDFu) {
            length = 2;
        } else if (lead == 0xE0u) {
            // 排除过长编码。
            length = 3;
            secondMin = 0xA0u;
        } else if (lead == 0xEDu) {
            // 排除 U+D800..U+DFFF 代理区。
            length = 3;
            secondMax = 0x9Fu;
        } else if (lead >= 0xE1u && lead <= 0xEFu) {
            length = 3;
        } else if (lead == 0xF0u) {
            length = 4;
            secondMin = 0x90u;
        } else if (lead >= 0xF1u && lead <= 0xF3u) {
            length = 4;
        } else if (lead == 0xF4u) {
            // 上限 U+10FFFF。
            length = 4;
            secondMax = 0x8Fu;
        } else {
            // 0x80..0xC1 与 0xF5..0xFF 不能作为首字节。
            return false;
        }

        // 多字节序列被截断。
        if (size - index < length) {
            return false;
        }
        const uint8_t second = static_cast<uint8_t>(value[index + 1]);
        if (second < secondMin || second > secondMax) {
            return false;
        }
        for (size_t tail = 2; tail < length; ++tail) {
            if (!isContinuationByte(static_cast<uint8_t>(value[index + tail]))) {
                return false;
            }
        }
        index += length;
    }
    return true;
}

size_t utf8PrefixLength(const std::string& value, const size_t maxBytes) {
    // 整体放得下时不截断。
    if (value.size() <= maxBytes) {
        return value.size();
    }
    // 截断点若落在续字节上，说明切在码点中间，向前回退到码点起始。
    size_t cut = maxBytes;
    while (cut > 0 && isContinuationByte(static_cast<uint8_t>(value[cut]))) {
        --cut;
    }
    return cut;
}

bool appendFixedField(std::vector<uint8_t>* out,
                      const std::string& value,
                      const size_t width,
                      const char* name,
                      std::string* error) {
    // 目标缓冲区不能为空。
    if (out == nullptr) {
        return setFieldError(name, "target bytes is null", error);
    }
    // 先校验整串编码，再截断。
    if (!isValidUtf8(value)) {
        return setFieldError(name, "is not valid UTF-8", error);
    }
    // 定长字段以 0 填充，内嵌 NUL 无法与填充区分。
    if (value.find('\0') != std::string::npos) {
        return setFieldError(name, "contains an embedded NUL byte", error);
    }

    // 按码点边界截断后写入有效部分。
    const size_t used = utf8PrefixLength(value, width);
    out->insert(out->end(), value.begin(), value.begin() + static_cast<std::ptrdiff_t>(used));
    // 剩余区域补零，保证字段宽度恒定。
    out->insert(out->end(), width - used, 0);
    return true;
}

bool readFixedField(const std::vector<uint8_t>& bytes,
                    const size_t offset,
                    const size_t width,
                    std::string* out) {
    // 输出指针不能为空，且区间不能越界。
    if (out == nullptr || offset > bytes.size() || bytes.size() - offset < width) {
        return false;
    }
    out->clear();
    for (size_t index = 0; index < width; ++index) {
        const uint8_t value = bytes[offset + index];
        // 第一个 0 字节之后都视为填充。
        if (value == 0) {
            break;
        }
        out->push_back(static_cast<char>(value));
    }
    return true;
}

// 结束命名空间。
}  // namespace rbl::base::bytes
