#pragma once

#include <string>

namespace bridge {

/**
 * @brief 截断字符串到最多 max_size 字节，不会截断 UTF-8 多字节字符
 * 评测机返回的反馈信息不可信，转发前需要截断以限制内存和日志的占用
 */
std::string truncate_utf8(const std::string &str, std::size_t max_size);

/**
 * @brief 以固定时间比较两个字符串，避免通过比较耗时猜测密钥
 */
bool constant_time_equals(const std::string &a, const std::string &b);

}  // namespace bridge

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;
