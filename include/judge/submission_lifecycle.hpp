#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace bridge {

/**
 * @brief 评测机当前提交的状态
 */
enum class lifecycle_state {
    /**
     * @brief 评测机空闲，没有提交
     */
    IDLE,

    /**
     * @brief 已经发送提交，等待评测机确认
     */
    REQUESTED,

    /**
     * @brief 评测机已经确认收到提交
     */
    ACKNOWLEDGED,

    /**
     * @brief 评测机正在评测
     */
    GRADING
};

/**
 * @brief 评测机发来的会改变提交状态的事件
 */
enum class lifecycle_event {
    ACKNOWLEDGED,
    GRADING_BEGIN,
    BATCH_BEGIN,
    BATCH_END,
    TEST_CASE,
    COMPILE_MESSAGE,
    COMPILE_ERROR,
    GRADING_END,
    INTERNAL_ERROR,
    TERMINATED
};

/**
 * @brief 事件的处理结果
 */
enum class transition {
    /**
     * @brief 事件合法，提交仍在进行中
     */
    APPLIED,

    /**
     * @brief 事件合法，提交已经结束，评测机回到空闲状态
     */
    FINISHED,

    /**
     * @brief 评测机当前没有提交
     */
    NO_SUBMISSION,

    /**
     * @brief 事件的提交编号和当前提交不一致
     */
    ID_MISMATCH,

    /**
     * @brief 当前状态下不允许该事件
     */
    INVALID_STATE
};

const char *state_name(lifecycle_state state);

const char *event_name(lifecycle_event event);

const char *transition_name(transition result);

/**
 * @brief 评测机上当前提交的状态机
 * IDLE → REQUESTED → ACKNOWLEDGED → GRADING → IDLE
 *
 * 任何不合法的事件（空闲时收到事件、提交编号不一致、状态不允许）都不会改变状态，
 * 由调用方记录协议错误。
 * begin 由调度器线程调用，其他事件由会话的消息循环调用，因此所有操作都加锁。
 */
struct submission_lifecycle {
    /**
     * @brief 开始一个新的提交
     * @return 评测机是否空闲，不空闲时状态不变
     */
    bool begin(const std::string &submission_id);

    /**
     * @brief 处理评测机发来的事件
     * @param event 事件类型
     * @param submission_id 事件所属的提交编号
     */
    transition apply(lifecycle_event event, const std::string &submission_id);

    /**
     * @brief 清空当前提交，用于评测机断开连接
     * @return 被清空的提交编号，空闲时为空
     */
    std::optional<std::string> reset();

    lifecycle_state state() const;

    std::optional<std::string> current() const;

    /**
     * @brief 当前测试点组的编号，不在测试点组中时为空
     */
    std::optional<int> batch() const;

private:
    void finish();

    mutable std::mutex mut;
    lifecycle_state current_state = lifecycle_state::IDLE;
    std::optional<std::string> submission_id;
    int batch_id = 0;
    bool in_batch = false;
};

}  // namespace bridge
