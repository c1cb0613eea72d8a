#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <variant>

/**
 * bridge 与评测机之间的通信协议
 * 每个数据包都是一个 JSON 对象，通过 name 字段区分消息类型。
 * 评测机发来的数据包在传输层边界被解析为 message::inbound，
 * 之后的处理逻辑只和强类型的消息打交道。
 */
namespace bridge::message {

/**
 * @brief 提交的评测参数
 * 在分配提交时从提交数据存储中获取，发送给评测机后不再修改
 */
struct submission_data {
    /**
     * @brief 时间限制（单位为秒）
     */
    double time_limit = 0;

    /**
     * @brief 内存限制（单位为 KB）
     */
    std::int64_t memory_limit = 0;

    /**
     * @brief 是否在第一个错误的测试点后停止评测
     */
    bool short_circuit = false;

    /**
     * @brief 是否只评测预测试数据
     */
    bool pretests_only = false;

    /**
     * @brief 提交所属的比赛编号，不在比赛中则为空
     */
    std::optional<std::int64_t> contest_no;

    /**
     * @brief 比赛中的第几次提交
     */
    std::optional<std::int64_t> attempt_no;

    /**
     * @brief 提交者的用户编号
     */
    std::int64_t user_id = 0;
};

// ---------------------------------------------------------------------------
// 评测机发往 bridge 的消息

/**
 * @brief 评测机连接后发送的第一个消息，用于认证和声明评测能力
 * id 和 key 缺失时仍然解析为 handshake，由会话决定断开连接。
 */
struct handshake {
    std::optional<std::string> id;
    std::optional<std::string> key;

    /**
     * @brief 评测机支持的题目编号
     */
    std::set<std::string> problems;

    /**
     * @brief 评测机支持的语言，键为语言名，值为版本信息
     */
    std::map<std::string, nlohmann::json> executors;

    /**
     * @brief problems 或 executors 字段的格式不合法
     */
    bool malformed = false;
};

struct submission_acknowledged {
    std::string submission_id;
};

struct grading_begin {
    std::string submission_id;
    bool pretested = false;
};

struct grading_end {
    std::string submission_id;
};

struct compile_error {
    std::string submission_id;
    std::string log;
};

struct compile_message {
    std::string submission_id;
    std::string log;
};

struct batch_begin {
    std::string submission_id;
};

struct batch_end {
    std::string submission_id;
};

/**
 * @brief 测试点评测结果
 * cases 为测试点结果对象数组，字段由评测机决定，bridge 只截断其中的长文本
 */
struct test_case_status {
    std::string submission_id;
    nlohmann::json cases;
};

struct internal_error {
    std::string submission_id;
    std::string message;
};

struct submission_terminated {
    std::string submission_id;
};

/**
 * @brief 心跳包，双向使用
 */
struct ping {
    double when = 0;
};

/**
 * @brief 心跳包的回复，双向使用
 * 评测机的回复必须携带 load；bridge 的回复不携带 load
 */
struct ping_response {
    double when = 0;
    double time = 0;
    std::optional<double> load;
};

/**
 * @brief 评测机更新支持的题目列表
 */
struct supported_problems {
    std::set<std::string> problems;
    bool malformed = false;
};

/**
 * @brief 无法识别的数据包
 * 包括无法解析的 JSON、不是对象、缺少 name 字段、未知的 name、缺少必需字段的情况
 */
struct unrecognized {
    std::string raw;
    std::string reason;
};

using inbound = std::variant<
    handshake,
    submission_acknowledged,
    grading_begin,
    grading_end,
    compile_error,
    compile_message,
    batch_begin,
    batch_end,
    test_case_status,
    internal_error,
    submission_terminated,
    ping,
    ping_response,
    supported_problems,
    unrecognized>;

/**
 * @brief 将评测机发来的文本解析为消息
 * 该函数不会抛出异常，任何格式错误都会得到 unrecognized
 */
inbound decode(const std::string &raw);

/**
 * @brief 消息的名称，用于日志
 */
std::string name_of(const inbound &msg);

// ---------------------------------------------------------------------------
// bridge 发往评测机的消息

struct handshake_success {};

struct submission_request {
    std::string submission_id;
    std::string problem_id;
    std::string language;
    std::string source;
    submission_data data;
};

struct terminate_submission {};

struct disconnect {};

void to_json(nlohmann::json &j, const handshake_success &);
void to_json(nlohmann::json &j, const submission_request &request);
void to_json(nlohmann::json &j, const terminate_submission &);
void to_json(nlohmann::json &j, const ping &request);
void to_json(nlohmann::json &j, const ping_response &response);
void to_json(nlohmann::json &j, const disconnect &);

/**
 * @brief 序列化为紧凑的 JSON 文本
 */
std::string encode(const nlohmann::json &j);

}  // namespace bridge::message
