#pragma once

#include <filesystem>
#include <map>
#include <string>
#include "common/json_utils.hpp"

namespace bridge::server {

/**
 * @brief 描述一个 AMQP 消息队列的配置数据结构
 */
struct amqp {
    /**
     * @brief AMQP 消息队列的主机地址
     */
    std::string hostname;

    /**
     * @brief AMQP 消息队列的主机端口
     */
    int port = 5672;

    /**
     * @brief 通过该结构体发送的消息的 Exchange 名
     */
    std::string exchange;

    /**
     * @brief Exchange 类型，可选 direct, topic, fanout
     */
    std::string exchange_type;

    /**
     * @brief AMQP 消息队列的队列名
     */
    std::string queue;

    /**
     * @brief AMQP 消息队列的 Routing Key
     */
    std::string routing_key;
};

void from_json(const nlohmann::json &j, amqp &mq);

/**
 * redis 的登录情况
 */
struct redis {
    /**
     * @brief redis 服务器地址
     */
    std::string host;

    /**
     * @brief redis 服务器端口
     */
    int port = 6379;

    /**
     * @brief 重试时间间隔，单位毫秒
     */
    unsigned retry_interval = 1000;

    /**
     * @brief 密码，若不为空，则使用该密码登录
     */
    std::string password;
};

void from_json(const nlohmann::json &j, redis &redis_config);

/**
 * @brief 评测机连接的监听地址
 */
struct listen_address {
    std::string host = "0.0.0.0";
    int port = 9999;
};

void from_json(const nlohmann::json &j, listen_address &listen);

/**
 * @brief bridge 的配置文件
 */
struct bridge_config {
    listen_address listen;

    /**
     * @brief 允许连接的评测机，键为评测机名称，值为密钥
     */
    std::map<std::string, std::string> judges;

    /**
     * @brief 存储提交评测参数的 Redis 服务器
     */
    redis redis_config;

    /**
     * @brief 接收新提交和取消请求的消息队列
     */
    amqp submission_queue;

    /**
     * @brief 发送评测结果的消息队列
     */
    amqp result_queue;
};

void from_json(const nlohmann::json &j, bridge_config &config);

/**
 * @brief 读取并解析配置文件
 * @throw std::invalid_argument 文件不存在
 * @throw nlohmann::json::exception 文件格式不正确或者缺少必需字段
 */
bridge_config load_bridge_config(const std::filesystem::path &path);

}  // namespace bridge::server
