#include "server/redis.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace bridge::server {
using namespace std;

static chrono::milliseconds remaining_until(chrono::steady_clock::time_point deadline) {
    return chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
}

static bool connect_to_server(cpp_redis::client &redis_client, const redis &redis_config, chrono::steady_clock::time_point deadline) {
    LOG(INFO) << "Redis: Setup connection with server " << redis_config.host << ":" << redis_config.port;
    auto remaining = remaining_until(deadline);
    if (remaining <= chrono::milliseconds::zero()) return false;
    try {
        redis_client.connect(redis_config.host, redis_config.port,
                             [](const std::string &host, std::size_t port, cpp_redis::connect_state status) {
                                 if (status == cpp_redis::connect_state::dropped) {
                                     LOG(INFO) << "Redis: client disconnected from " << host << ":" << port;
                                 }
                             },
                             remaining.count());
    } catch (cpp_redis::redis_error &e) {
        LOG(ERROR) << "Redis: Unable to connect to redis server " << redis_config.host << ":" << redis_config.port << ": " << e.what();
        return false;
    }
    if (!redis_config.password.empty()) {
        LOG(INFO) << "Redis: Trying to Auth";
        remaining = remaining_until(deadline);
        if (remaining <= chrono::milliseconds::zero()) return false;
        auto future = redis_client.auth(redis_config.password);
        redis_client.sync_commit(remaining);
        if (future.wait_for(remaining_until(deadline)) != future_status::ready) {
            LOG(ERROR) << "Redis: Auth timed out";
            return false;
        }
        LOG(INFO) << "Redis: Auth Reply: " << future.get();
    }
    if (redis_client.is_connected()) {
        LOG(INFO) << "Redis: Connecting to redis server succeeded " << redis_config.host << ":" << redis_config.port;
        return true;
    } else {
        LOG(ERROR) << "Redis: Unable to connect to redis server " << redis_config.host << ":" << redis_config.port;
        return false;
    }
}

void redis_conn::reconnect(chrono::steady_clock::time_point deadline, bool force) {
    if (force && redis_client.is_connected()) redis_client.disconnect();
    if (redis_client.is_connected()) return;
    bool connected = retry_until(deadline, chrono::milliseconds(redis_config.retry_interval), 5, [&] {
        LOG(INFO) << "Redis: Lost connection, trying to reconnect";
        return connect_to_server(redis_client, redis_config, deadline);
    });
    if (!connected) {
        BOOST_THROW_EXCEPTION(network_error("unable to connect to redis server"));
    }
}

void redis_conn::init(const redis &redis_config) noexcept {
    this->redis_config = redis_config;
}

vector<cpp_redis::reply> redis_conn::execute(function<void(cpp_redis::client &, vector<future<cpp_redis::reply>> &)> callback) {
    scoped_lock guard(mut);
    auto deadline = chrono::steady_clock::now() + DEPENDENCY_TIMEOUT;

    // cpp_redis 的 is_connected 似乎有问题，最后执行操作时的 reply 仍然是 network error
    // 因此这里也做个强制重连。
    reconnect(deadline);  // 先弱重连一次
    string message;
    for (int fail = 0; fail < 5; ++fail) {  // 错误尝试至多额外 4 次
        auto remaining = remaining_until(deadline);
        if (remaining <= chrono::milliseconds::zero()) break;

        bool reconn = false;
        vector<future<cpp_redis::reply>> futures;
        vector<cpp_redis::reply> replies;
        callback(redis_client, futures);
        DLOG(INFO) << "Syncing operations to server";
        redis_client.sync_commit(remaining);
        DLOG(INFO) << "Synced operations to server";
        for (auto &future : futures) {  // 阻塞到所有操作完成为止
            if (future.wait_for(remaining_until(deadline)) != future_status::ready) {
                BOOST_THROW_EXCEPTION(network_error("Redis: operation timed out"));
            }
            cpp_redis::reply r = future.get();
            // 如果有操作失败，则标记重试并保存错误信息
            if (!r.ok()) reconn = true, message = r.error();
            replies.push_back(move(r));
        }
        if (!reconn) return replies;
        reconnect(deadline, true);  // 操作失败，强制重连
    }
    // 失败次数过多，取消操作
    BOOST_THROW_EXCEPTION(network_error("Redis: unable to finish execution: " + message));
}

}  // namespace bridge::server
