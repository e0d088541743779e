#include "zLog.h"
#include <cstdio>

// 单条日志格式化缓冲上限。
#define MAX_LOG_BUF_LEN 3000

// 统一日志输出实现：级别过滤、格式化并打印。
void zLogPrint(int level, const char* tag, const char* file_name, const char* function_name, int line_num, const char* format, ...) {
    // 低于阈值的日志直接丢弃。
    if (level < CURRENT_LOG_LEVEL) return;

    va_list args;
    va_start(args, format);
    // 使用栈缓冲完成格式化，超长部分被截断。
    char buffer[MAX_LOG_BUF_LEN];
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    // 等级转可读字符串。
    const char* level_str = "INFO";
    if (level == LOG_LEVEL_ERROR) level_str = "ERROR";
    else if (level == LOG_LEVEL_WARN) level_str = "WARN";
    else if (level == LOG_LEVEL_DEBUG) level_str = "DEBUG";
    else if (level == LOG_LEVEL_VERBOSE) level_str = "VERBOSE";

    // 告警与错误进 stderr，便于脚本区分输出。
    FILE* stream = (level >= LOG_LEVEL_WARN) ? stderr : stdout;
    // INFO 只打印标签和消息；其余级别附带函数名与文件行号。
    if (level == LOG_LEVEL_INFO) {
        fprintf(stream, "[%s][%s] %s\n", level_str, tag ? tag : "", buffer);
    } else {
        fprintf(stream, "[%s][%s][%s][%s:%d] %s\n",
                level_str, tag ? tag : "", function_name, file_name, line_num, buffer);
    }
    fflush(stream);
}
