#include "zRblHeader.h"

// 引入定长字段工具。
#include "zBytes.h"
// 引入 CRC32 算法实现。
#include "zChecksum.h"
// 引入小端编解码。
#include "zCodec.h"

// 引入 memcmp。
#include <cstring>
// 引入 numeric_limits。
#include <limits>
// 引入 std::move。
#include <utility>

namespace rbl::package {

namespace {

// 输入长度必须能放进 u32 字段。
bool checkSize32(const std::vector<uint8_t>& bytes, const char* name, std::string* error) {
    if (bytes.size() > std::numeric_limits<uint32_t>::max()) {
        if (error != nullptr) {
            *error = std::string("size overflow: ") + name + " exceeds 4 GiB";
        }
        return false;
    }
    return true;
}

}  // namespace

bool buildRblHeader(const std::vector<uint8_t>& newFirmware,
                    const std::vector<uint8_t>& patchBody,
                    const RblHeaderMeta& meta,
                    std::vector<uint8_t>* outHeader,
                    std::string* error) {
    if (outHeader == nullptr) {
        if (error != nullptr) {
            *error = "header output pointer is null";
        }
        return false;
    }
    if (!checkSize32(newFirmware, "new firmware", error) ||
        !checkSize32(patchBody, "patch body", error)) {
        return false;
    }

    // 在局部缓冲中按字段顺序拼装，失败时不触碰 outHeader。
    std::vector<uint8_t> body;
    body.reserve(kRblHeaderSize);

    // type[4]。
    body.insert(body.end(), kRblMagic, kRblMagic + sizeof(kRblMagic));
    // algo / algo2。
    base::codec::appendU16Le(&body, meta.algo);
    base::codec::appendU16Le(&body, meta.algo2);
    // time_stamp。
    base::codec::appendU32Le(&body, meta.timestamp);

    // 三个定长字符串字段。
    std::string fieldError;
    if (!base::bytes::appendFixedField(&body, meta.partName, kPartNameSize, "part_name", &fieldError) ||
        !base::bytes::appendFixedField(&body, meta.fwVersion, kFwVersionSize, "fw_version", &fieldError) ||
        !base::bytes::appendFixedField(&body, meta.productCode, kProductCodeSize, "product_code", &fieldError)) {
        if (error != nullptr) {
            *error = "encoding error: " + fieldError;
        }
        return false;
    }

    // pkg_crc 取自补丁包体，raw_crc 取自新固件。
    base::codec::appendU32Le(&body, base::checksum::crc32Ieee(patchBody));
    base::codec::appendU32Le(&body, base::checksum::crc32Ieee(newFirmware));
    // raw_size / pkg_size。
    base::codec::appendU32Le(&body, static_cast<uint32_t>(newFirmware.size()));
    base::codec::appendU32Le(&body, static_cast<uint32_t>(patchBody.size()));

    if (body.size() != kRblHeaderCrcOffset) {
        if (error != nullptr) {
            *error = "internal error: header body size " + std::to_string(body.size());
        }
        return false;
    }

    // hdr_crc 覆盖 [0, kRblHeaderCrcOffset)，独立于上面两次 CRC 计算。
    const uint32_t headerCrc = base::checksum::crc32Ieee(body);
    base::codec::appendU32Le(&body, headerCrc);

    outHeader->swap(body);
    return true;
}

bool parseRblHeader(const std::vector<uint8_t>& bytes,
                    RblHeaderInfo* outInfo,
                    std::string* error) {
    if (outInfo == nullptr) {
        if (error != nullptr) {
            *error = "header parse output is null";
        }
        return false;
    }
    if (bytes.size() < kRblHeaderSize) {
        if (error != nullptr) {
            *error = "input too small for RBL header: " + std::to_string(bytes.size());
        }
        return false;
    }
    if (std::memcmp(bytes.data(), kRblMagic, sizeof(kRblMagic)) != 0) {
        if (error != nullptr) {
            *error = "RBL header magic mismatch";
        }
        return false;
    }

    RblHeaderInfo info;
    const bool fieldsOk =
        base::codec::readU16Le(bytes, offsetof(RblHeaderLayout, algo), &info.algo) &&
        base::codec::readU16Le(bytes, offsetof(RblHeaderLayout, algo2), &info.algo2) &&
        base::codec::readU32Le(bytes, offsetof(RblHeaderLayout, timeStamp), &info.timestamp) &&
        base::bytes::readFixedField(bytes, offsetof(RblHeaderLayout, partName), kPartNameSize, &info.partName) &&
        base::bytes::readFixedField(bytes, offsetof(RblHeaderLayout, fwVersion), kFwVersionSize, &info.fwVersion) &&
        base::bytes::readFixedField(bytes, offsetof(RblHeaderLayout, productCode), kProductCodeSize, &info.productCode) &&
        base::codec::readU32Le(bytes, offsetof(RblHeaderLayout, packageCrc), &info.packageCrc) &&
        base::codec::readU32Le(bytes, offsetof(RblHeaderLayout, rawCrc), &info.rawCrc) &&
        base::codec::readU32Le(bytes, offsetof(RblHeaderLayout, rawSize), &info.rawSize) &&
        base::codec::readU32Le(bytes, offsetof(RblHeaderLayout, packageSize), &info.packageSize) &&
        base::codec::readU32Le(bytes, kRblHeaderCrcOffset, &info.headerCrc);
    if (!fieldsOk) {
        if (error != nullptr) {
            *error = "RBL header field out of range";
        }
        return false;
    }

    // 重新计算 hdr_crc。
    const uint32_t actualCrc = base::checksum::crc32Ieee(bytes.data(), kRblHeaderCrcOffset);
    if (actualCrc != info.headerCrc) {
        if (error != nullptr) {
            *error = "RBL header crc mismatch";
        }
        return false;
    }

    *outInfo = std::move(info);
    return true;
}

}  // namespace rbl::package
