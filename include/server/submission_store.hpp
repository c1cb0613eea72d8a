#pragma once

#include <string>
#include "common/messages.hpp"

namespace bridge::server {

/**
 * @brief 提交评测参数的存储
 * 分配提交时由会话调用，调用线程是调度器线程或者评测机会话的线程，
 * 因此实现必须限制等待时间不超过 DEPENDENCY_TIMEOUT。
 */
struct submission_store {
    virtual ~submission_store();

    /**
     * @brief 获取提交的评测参数
     * @param submission_id 提交编号
     * @throw submission_data_unavailable 提交不存在，或者存储服务超时
     */
    virtual message::submission_data fetch(const std::string &submission_id) = 0;
};

}  // namespace bridge::server
