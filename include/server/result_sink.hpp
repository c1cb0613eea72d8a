#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace bridge::server {

/**
 * @brief 接收评测结果事件的下游
 * 事件按照评测机发来的顺序转发，每个提交恰好有一个带 done 字段的结束事件。
 */
struct result_sink {
    virtual ~result_sink();

    /**
     * @brief 转发一个评测结果事件
     * 在评测机会话的线程上调用，不应当阻塞
     * @param judge 评测机名称
     * @param submission_id 提交编号
     * @param event 事件，type 字段为事件类型
     */
    virtual void notify_result(const std::string &judge, const std::string &submission_id, const nlohmann::json &event) = 0;
};

}  // namespace bridge::server
