#pragma once

#include <chrono>
#include <functional>
#include <string>

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 当前的 UNIX 时间戳，单位为秒
 * 心跳包中的时间戳使用这个格式，和评测机约定一致
 */
double unix_time();

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

/**
 * @brief 在截止时间前重复调用 attempt，直到成功或者用完 attempts 次
 * 两次调用之间等待 interval，剩余时间不够等待时直接放弃
 * @return attempt 最终是否成功
 */
bool retry_until(std::chrono::steady_clock::time_point deadline, std::chrono::milliseconds interval, int attempts,
                 const std::function<bool()> &attempt);
