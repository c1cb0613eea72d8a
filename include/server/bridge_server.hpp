#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include "judge/judge_handler.hpp"
#include "server/config.hpp"

namespace bridge::server {

/**
 * @brief 接受评测机连接的服务器
 * 监听线程运行 io_context 接受连接，每个评测机连接由一个独立的线程运行消息循环。
 * 收到 SIGINT 或 SIGTERM 后停止接受连接，通知所有评测机断开，超时后强制关闭连接。
 */
struct bridge_server {
    bridge_server(const listen_address &listen, judge_services services);
    ~bridge_server();

    /**
     * @brief 运行服务器，阻塞到服务器停止并且所有评测机连接都已经关闭为止
     */
    void run();

    /**
     * @brief 停止服务器，可以在任意线程调用
     */
    void stop();

    /**
     * @brief 实际监听的端口，配置的端口为 0 时由系统分配
     */
    unsigned short port() const;

private:
    struct session {
        std::shared_ptr<judge_handler> handler;
        std::thread thread;
    };

    void accept();

    /**
     * @brief 回收已经结束的会话线程
     */
    void reap();

    void shutdown();

    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor;
    boost::asio::signal_set signals;
    judge_services services;

    std::mutex sessions_mut;
    std::list<session> sessions;
};

}  // namespace bridge::server
