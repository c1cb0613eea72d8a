#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include "common/messages.hpp"
#include "common/utils.hpp"
#include "judge/ack_deadline.hpp"
#include "judge/health_monitor.hpp"
#include "judge/submission_lifecycle.hpp"
#include "judge/update_rate_limiter.hpp"
#include "monitor/monitor.hpp"
#include "server/packet_handler.hpp"

namespace bridge {
namespace server {
struct submission_store;
struct result_sink;
struct scheduler;
}  // namespace server

struct authenticator;
struct session_registry;

/**
 * @brief 评测机会话依赖的外部服务
 * 所有服务都由 bridge_server 持有，生命周期长于任何会话
 */
struct judge_services {
    authenticator &auth;
    server::submission_store &store;
    server::result_sink &sink;
    server::scheduler &scheduler;
    session_registry &registry;
};

/**
 * @brief 一个评测机连接的会话
 *
 * 连接建立后评测机必须先发送 handshake 完成认证，之后 bridge 可以通过 submit 向评测机分配提交，
 * 评测机通过 grading-begin、test-case-status、grading-end 等消息报告评测进度，
 * 这些消息经过校验后转发给 result_sink。
 *
 * 线程模型：
 * 1. 消息循环线程：运行 handle，处理评测机发来的所有消息；
 * 2. 心跳线程：由 health_monitor 持有；
 * 3. 确认超时线程：由 ack_deadline 持有；
 * 4. 调度器线程：调用 submit、abort、disconnect 和各类查询函数。
 *
 * 评测机是不可信的，任何违反协议的消息只会被记录，不会影响 bridge 的状态。
 * 会话必须由 std::shared_ptr 持有。
 */
struct judge_handler : public server::packet_handler, public std::enable_shared_from_this<judge_handler> {
    judge_handler(std::unique_ptr<server::connection> &&conn, judge_services services);
    ~judge_handler() override;

    /**
     * @brief 向评测机分配一个提交
     * @throw session_busy 评测机正在评测其他提交，此时不会发送任何数据
     * @throw submission_data_unavailable 无法获取提交的评测参数，评测机仍然空闲
     * @throw network_error 评测机连接已经断开，提交没有被分配
     */
    void submit(const std::string &submission_id, const std::string &problem_id,
                const std::string &language, const std::string &source);

    /**
     * @brief 要求评测机终止当前的提交
     * 状态在收到评测机的 submission-terminated 后才会被清空
     */
    void abort();

    /**
     * @brief 断开与评测机的连接
     * @param force 为真时直接关闭连接，否则发送 disconnect 并等待评测机关闭连接
     */
    void disconnect(bool force);

    /**
     * @brief 评测机能否评测该提交
     * @param problem_id 题目编号
     * @param executor 提交使用的语言
     * @param judge_id 提交指定的评测机，为空表示任意评测机
     */
    bool can_judge(const std::string &problem_id, const std::string &executor,
                   const std::optional<std::string> &judge_id) const;

    /**
     * @brief 评测机是否正在评测提交
     */
    bool working() const;

    /**
     * @brief 评测机正在评测的提交
     */
    std::optional<std::string> current_submission() const;

    /**
     * @brief 评测机名称，握手前为空字符串
     */
    std::string name() const;

    /**
     * @brief 评测机是否已经通过认证
     */
    bool authenticated() const;

    double load() const;

    std::optional<double> latency() const;

    std::optional<double> time_delta() const;

    /**
     * @brief 设置评测机是否接受未指定评测机的提交
     * 设置为 false 时评测机进入排空模式，只接收指定由其评测的提交
     */
    void set_accepting(bool accepting);

    std::set<std::string> problems() const;

    std::map<std::string, nlohmann::json> executors() const;

protected:
    void on_connect() override;
    void on_packet(const std::string &data) override;
    void on_timeout() override;
    void on_disconnect() override;

private:
    void on_handshake(const message::handshake &packet);
    void on_submission_acknowledged(const message::submission_acknowledged &packet);
    void on_grading_begin(const message::grading_begin &packet);
    void on_grading_end(const message::grading_end &packet);
    void on_compile_error(const message::compile_error &packet);
    void on_compile_message(const message::compile_message &packet);
    void on_batch_begin(const message::batch_begin &packet);
    void on_batch_end(const message::batch_end &packet);
    void on_test_case(const message::test_case_status &packet);
    void on_internal_error(const message::internal_error &packet);
    void on_submission_terminated(const message::submission_terminated &packet);
    void on_ping(const message::ping &packet);
    void on_ping_response(const message::ping_response &packet);
    void on_supported_problems(const message::supported_problems &packet);
    void on_malformed(const message::unrecognized &packet);

    /**
     * @brief 将事件交给状态机，不合法的事件会被记录为协议错误
     * 除测试点事件以外，处理前先转发频率限制器中被合并的测试点结果
     * @return 事件是否合法
     */
    bool apply(lifecycle_event event, const std::string &submission_id);

    /**
     * @brief 转发非结束事件
     */
    void forward(const std::string &submission_id, nlohmann::json event);

    /**
     * @brief 转发结束事件，并通知调度器评测机已经空闲
     */
    void finish(const std::string &submission_id, nlohmann::json event);

    void violation(const std::string &info);

    judge_context context() const;

    judge_services services;

    submission_lifecycle lifecycle;
    health_monitor health;
    update_rate_limiter limiter;
    std::mutex limiter_mut;
    ack_deadline ack;

    std::atomic<bool> is_authenticated{false};
    std::atomic<bool> accepting{true};
    std::atomic<bool> disconnected{false};

    /**
     * @brief 保护 judge_name、judge_problems 和 judge_executors
     * 这些字段在握手和 supported-problems 时被消息循环修改，被调度器读取
     */
    mutable std::mutex info_mut;
    std::string judge_name;
    std::set<std::string> judge_problems;
    std::map<std::string, nlohmann::json> judge_executors;

    elapsed_time connected_time;
};

}  // namespace bridge
