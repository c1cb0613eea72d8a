#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <string>
#include <stdexcept>

namespace bridge {

struct bridge_exception : std::exception {
    bridge_exception();
    explicit bridge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const bridge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示 bridge 自身的内部错误
 */
struct internal_error : public bridge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常是评测机连接已经断开或者数据包格式无法解析
 */
struct network_error : public bridge_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 无法从提交数据存储中获取提交的评测参数
 * 可能是提交不存在，也可能是存储服务超时
 */
struct submission_data_unavailable : public bridge_exception {
    submission_data_unavailable();
    explicit submission_data_unavailable(const std::string &message);
};

/**
 * @brief 评测机正在评测其他提交，不能再分配新的提交
 */
struct session_busy : public bridge_exception {
    session_busy();
    explicit session_busy(const std::string &message);
};

}  // namespace bridge
