/*
 * [RBL_FLOW_NOTE] 文件级流程注释
 * - 日志宏与接口声明。
 * - 打包链路位置：全局基础设施。
 * - 输入：模块日志请求。
 * - 输出：统一日志格式（ERROR/WARN 走 stderr，其余走 stdout）。
 */
#ifndef RBLPACK_ZLOG_H
#define RBLPACK_ZLOG_H

#include <cstdarg>  // `va_list` / 可变参数接口需要。

// 日志总开关：
// 1 = 启用日志宏；
// 0 = 关闭日志宏（`LOGV/LOGD/LOGI/LOGW/LOGE` 预处理为空语句）。
#ifndef ZLOG_ENABLE_LOGGING
#define ZLOG_ENABLE_LOGGING 1
#endif

// 日志级别定义（数值越大表示等级越高、越重要）。
#define LOG_LEVEL_VERBOSE 2
#define LOG_LEVEL_DEBUG   3
#define LOG_LEVEL_INFO    4
#define LOG_LEVEL_WARN    5
#define LOG_LEVEL_ERROR   6

// 当前日志级别阈值：`level < CURRENT_LOG_LEVEL` 的日志会被丢弃。
// 允许通过编译参数覆盖（例如 -DCURRENT_LOG_LEVEL=LOG_LEVEL_DEBUG）。
#ifndef CURRENT_LOG_LEVEL
#define CURRENT_LOG_LEVEL LOG_LEVEL_INFO
#endif

// 默认日志标签（模块可在 include 前重新定义 `LOG_TAG`）。
#ifndef LOG_TAG
#define LOG_TAG "rblpack"
#endif

// 兼容没有 __FILE_NAME__ 的编译环境。
#ifndef __FILE_NAME__
#define __FILE_NAME__ __FILE__
#endif

// 日志宏封装：统一把文件名、函数名和行号传入 `zLogPrint`。
#if ZLOG_ENABLE_LOGGING
    #define LOGV(...) zLogPrint(LOG_LEVEL_VERBOSE, LOG_TAG, __FILE_NAME__, __FUNCTION__, __LINE__, ##__VA_ARGS__)
    #define LOGD(...) zLogPrint(LOG_LEVEL_DEBUG, LOG_TAG, __FILE_NAME__, __FUNCTION__, __LINE__, ##__VA_ARGS__)
    #define LOGI(...) zLogPrint(LOG_LEVEL_INFO, LOG_TAG, __FILE_NAME__, __FUNCTION__, __LINE__, ##__VA_ARGS__)
    #define LOGW(...) zLogPrint(LOG_LEVEL_WARN, LOG_TAG, __FILE_NAME__, __FUNCTION__, __LINE__, ##__VA_ARGS__)
    #define LOGE(...) zLogPrint(LOG_LEVEL_ERROR, LOG_TAG, __FILE_NAME__, __FUNCTION__, __LINE__, ##__VA_ARGS__)
#else
    #define LOGV(...)
    #define LOGD(...)
    #define LOGI(...)
    #define LOGW(...)
    #define LOGE(...)
#endif

/**
 * @brief 统一日志输出函数。
 * @param level 日志级别。
 * @param tag 日志标签。
 * @param file_name 源文件名。
 * @param function_name 函数名。
 * @param line_num 行号。
 * @param format printf 风格格式化字符串。
 */
void zLogPrint(int level, const char* tag, const char* file_name, const char* function_name, int line_num, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 6, 7)))
#endif
    ;

#endif // RBLPACK_ZLOG_H
