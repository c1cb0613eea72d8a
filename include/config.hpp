#pragma once

#include <chrono>
#include <cstddef>

namespace bridge {

/**
 * @brief 评测机连接后必须在这个时间内完成握手，否则断开连接
 */
extern std::chrono::milliseconds HANDSHAKE_TIMEOUT;

/**
 * @brief 评测机握手成功后的无响应超时时间
 * 评测机需要定期回复心跳包，超过这个时间没有收到任何消息则认为评测机已经死亡
 */
extern std::chrono::milliseconds SESSION_TIMEOUT;

/**
 * @brief 发送提交后等待评测机确认收到的时间，超时将强制断开评测机
 */
extern std::chrono::milliseconds ACK_TIMEOUT;

/**
 * @brief 心跳包的发送间隔
 */
extern std::chrono::milliseconds PING_INTERVAL;

/**
 * @brief 计算延迟和时钟偏差平均值的采样数
 * 默认 6 个采样，配合 10 秒的心跳间隔即为最近一分钟的平均值
 */
extern std::size_t HEALTH_WINDOW;

/**
 * @brief 每个 UPDATE_RATE_TIME 时间窗口内最多转发多少个测试点结果
 */
extern std::size_t UPDATE_RATE_LIMIT;

extern std::chrono::milliseconds UPDATE_RATE_TIME;

/**
 * @brief 测试点反馈信息（feedback）的最大长度
 */
extern std::size_t MAX_FEEDBACK;

/**
 * @brief 测试点输出、扩展反馈信息的最大长度
 * 如果长度超限，将被截断后再转发
 */
extern std::size_t MAX_REPORT_SIZE;

/**
 * @brief 单个数据包解压前后的最大长度
 */
extern std::size_t MAX_PACKET_SIZE;

/**
 * @brief 评测机声明支持的题目数量上限
 */
extern std::size_t MAX_PROBLEMS;

/**
 * @brief 评测机名称、题目编号、语言名称的最大长度
 */
extern std::size_t MAX_IDENTIFIER_LENGTH;

/**
 * @brief 访问提交数据存储等外部服务的最长等待时间
 * 外部服务过慢时不能阻塞评测机消息循环，否则会错过心跳
 */
extern std::chrono::milliseconds DEPENDENCY_TIMEOUT;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，将在日志中输出所有收发的数据包内容。
 */
extern bool DEBUG;

}  // namespace bridge
