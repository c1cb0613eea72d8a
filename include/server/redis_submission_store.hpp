#pragma once

#include <map>
#include <string>
#include "server/redis.hpp"
#include "server/submission_store.hpp"

namespace bridge::server {

/**
 * @brief 从 Redis 获取提交的评测参数
 * 每个提交存储为一个 hash，键为 submission:<提交编号>，字段为
 * time、memory、short-circuit、pretests-only、contest-no、attempt-no、user
 */
struct redis_submission_store : public submission_store {
    explicit redis_submission_store(const redis &redis_config);

    message::submission_data fetch(const std::string &submission_id) override;

private:
    redis_conn conn;
};

/**
 * @brief 将 HGETALL 的结果解析为评测参数
 * @param fields 字段名到字段值的映射
 * @throw submission_data_unavailable 缺少必需字段或者字段格式不正确
 */
message::submission_data parse_submission_data(const std::string &submission_id, const std::map<std::string, std::string> &fields);

}  // namespace bridge::server
