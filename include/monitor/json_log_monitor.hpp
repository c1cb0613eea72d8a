#pragma once

#include "monitor/monitor.hpp"

namespace bridge {

/**
 * @brief 通过 glog 输出审计日志，每个事件一行紧凑的 JSON
 * 格式：{"judge": ..., "address": ..., "submission": ..., "action": ...}
 * 错误事件用 info 字段代替 action 字段。
 */
struct json_log_monitor : public monitor {
    void judge_connected(const judge_context &ctx) override;
    void judge_authenticated(const judge_context &ctx) override;
    void judge_disconnected(const judge_context &ctx) override;
    void packet_error(const judge_context &ctx, const std::string &info) override;
    void submission_lost(const judge_context &ctx, const std::string &submission_id) override;
};

}  // namespace bridge
