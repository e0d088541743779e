#include "zRblAlgo.h"

// 引入 snprintf。
#include <cstdio>

namespace rbl::package::algo {

namespace {

// 未知取值统一显示为 0x 前缀十六进制。
std::string hexValue(const uint32_t value) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "0x%04x", static_cast<unsigned>(value));
    return buffer;
}

}  // namespace

std::string describeAlgo(const uint16_t algo) {
    std::string compress;
    switch (algo & kCompressMask) {
        case kCompressNone:
            compress = "none";
            break;
        case kCompressGzip:
            compress = "gzip";
            break;
        case kCompressQuicklz:
            compress = "quicklz";
            break;
        case kCompressFastlz:
            compress = "fastlz";
            break;
        case kCompressHpatchlite:
            compress = "hpatchlite";
            break;
        default:
            compress = hexValue(algo & kCompressMask);
            break;
    }

    std::string crypt;
    switch (algo & kCryptMask) {
        case kCryptNone:
            crypt = "none";
            break;
        case kCryptXor:
            crypt = "xor";
            break;
        case kCryptAes:
            crypt = "aes";
            break;
        default:
            crypt = hexValue(algo & kCryptMask);
            break;
    }
    return compress + "+" + crypt;
}

std::string describeAlgo2(const uint16_t algo2) {
    if (algo2 == kVerifyNone) {
        return "none";
    }
    if (algo2 == kVerifyCrc) {
        return "crc";
    }
    return hexValue(algo2);
}

}  // namespace rbl::package::algo
