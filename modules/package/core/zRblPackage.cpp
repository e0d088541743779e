#include "zRblPackage.h"

// 引入 CRC32 算法实现。
#include "zChecksum.h"

namespace rbl::package {

bool assembleRblPackage(const std::vector<uint8_t>& newFirmware,
                        const std::vector<uint8_t>& patchBody,
                        const RblHeaderMeta& meta,
                        std::vector<uint8_t>* outPackage,
                        std::string* error) {
    if (outPackage == nullptr) {
        if (error != nullptr) {
            *error = "package output pointer is null";
        }
        return false;
    }

    // 先生成包头；包头大小与输入长度无关。
    std::vector<uint8_t> packageBytes;
    if (!buildRblHeader(newFirmware, patchBody, meta, &packageBytes, error)) {
        return false;
    }
    // 包头之后直接拼接补丁包体，不加任何额外长度前缀。
    packageBytes.reserve(kRblHeaderSize + patchBody.size());
    packageBytes.insert(packageBytes.end(), patchBody.begin(), patchBody.end());

    outPackage->swap(packageBytes);
    return true;
}

bool checkRblPackage(const std::vector<uint8_t>& packageBytes,
                     RblHeaderInfo* outInfo,
                     std::string* error) {
    // 先校验包头自身（magic + hdr_crc）。
    RblHeaderInfo info;
    if (!parseRblHeader(packageBytes, &info, error)) {
        return false;
    }

    // package_size 必须等于包头之后的字节数。
    const size_t bodySize = packageBytes.size() - kRblHeaderSize;
    if (static_cast<size_t>(info.packageSize) != bodySize) {
        if (error != nullptr) {
            *error = "package_size " + std::to_string(info.packageSize) +
                     " does not match body size " + std::to_string(bodySize);
        }
        return false;
    }

    // package_crc 必须与包体一致。
    const uint32_t bodyCrc = base::checksum::crc32Ieee(packageBytes.data() + kRblHeaderSize, bodySize);
    if (bodyCrc != info.packageCrc) {
        if (error != nullptr) {
            *error = "package_crc mismatch";
        }
        return false;
    }

    if (outInfo != nullptr) {
        *outInfo = info;
    }
    return true;
}

}  // namespace rbl::package
