#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace bridge {

/**
 * @brief 审计日志中一条记录所属的评测机连接
 */
struct judge_context {
    /**
     * @brief 评测机名称，握手前为空
     */
    std::optional<std::string> judge;

    std::string address;

    /**
     * @brief 评测机当前正在评测的提交
     */
    std::optional<std::string> submission;
};

/**
 * @brief 执行监控行为
 * 所有回调都在评测机会话的线程上执行，实现需要自行保证线程安全。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报有新的评测机连接，此时评测机还没有完成握手
     */
    virtual void judge_connected(const judge_context &ctx);

    /**
     * @brief 监控上报评测机已经通过认证
     */
    virtual void judge_authenticated(const judge_context &ctx);

    /**
     * @brief 监控上报评测机连接已经断开
     */
    virtual void judge_disconnected(const judge_context &ctx);

    /**
     * @brief 监控上报评测机发来了不合法的数据包
     * @param info 错误原因，如 malformed json packet
     */
    virtual void packet_error(const judge_context &ctx, const std::string &info);

    /**
     * @brief 监控上报评测机断开时有提交没有评测完成
     */
    virtual void submission_lost(const judge_context &ctx, const std::string &submission_id);
};

/**
 * @brief 注册监控，必须在开始接受评测机连接之前调用
 */
void register_monitor(std::unique_ptr<monitor> &&monitor);

/**
 * @brief 移除所有已注册的监控
 */
void clear_monitors();

/**
 * @brief 依次调用所有监控，监控抛出的异常只记录日志
 */
void call_monitor(const std::function<void(monitor &)> &callback);

}  // namespace bridge
