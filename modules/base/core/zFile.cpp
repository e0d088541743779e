// 引入基础文件 IO 接口声明。
#include "zFile.h"

// 引入 stat。
#include <sys/stat.h>

// 引入文件系统 API。
#include <filesystem>
// 引入文件流。
#include <fstream>

// 文件系统命名空间别名，缩短代码书写。
namespace fs = std::filesystem;

// 进入基础 IO 命名空间。
namespace rbl::base::file {

// 判断 path 是否存在且是普通文件。
bool fileExists(const std::string& path) {
    // 使用 error_code 版本，不抛异常。
    std::error_code ec;
    // 路径非空 + 存在 + 类型为 regular file。
    return !path.empty() && fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

// 读取文件到字节数组。
bool readFileBytes(const std::string& path, std::vector<uint8_t>* out) {
    // 输出容器不能为空。
    if (out == nullptr) {
        return false;
    }
    // 每次读取前先清空旧数据。
    out->clear();
    // 路径为空时失败。
    if (path.empty()) {
        return false;
    }

    // 以二进制模式打开输入流。
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    // 光标移到文件末尾，计算总长度。
    in.seekg(0, std::ios::end);
    const std::streamoff size = in.tellg();
    if (size < 0) {
        return false;
    }
    in.seekg(0, std::ios::beg);

    // 预分配后一次读入。
    out->resize(static_cast<size_t>(size));
    if (!out->empty()) {
        in.read(reinterpret_cast<char*>(out->data()),
                static_cast<std::streamsize>(out->size()));
    }
    // 读取状态必须为真。
    return static_cast<bool>(in);
}

// 把字节数组写入目标文件（覆盖模式）。
bool writeFileBytes(const std::string& path, const std::vector<uint8_t>& data) {
    // 空路径直接失败。
    if (path.empty()) {
        return false;
    }

    // 若存在父目录则确保它存在。
    std::error_code ec;
    const fs::path outPath(path);
    if (outPath.has_parent_path()) {
        fs::create_directories(outPath.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    // 以二进制 + 截断模式打开输出流。
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    if (!data.empty()) {
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    }
    // flush 后再检查状态，确保写入错误不被析构吞掉。
    out.flush();
    return static_cast<bool>(out);
}

// 读取文件 mtime（秒）。
bool fileModifiedTime(const std::string& path, int64_t* outSeconds) {
    if (outSeconds == nullptr || path.empty()) {
        return false;
    }
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    *outSeconds = static_cast<int64_t>(st.st_mtime);
    return true;
}

// 结束命名空间。
}  // namespace rbl::base::file
