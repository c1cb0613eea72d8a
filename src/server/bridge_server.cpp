#include "server/bridge_server.hpp"
#include <glog/logging.h>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <csignal>
#include "server/zlib_connection.hpp"

namespace bridge::server {
using namespace std;
namespace asio = boost::asio;
using asio::ip::tcp;

// 关闭服务器时等待评测机主动断开的时间
static const chrono::seconds SHUTDOWN_GRACE(5);

bridge_server::bridge_server(const listen_address &listen, judge_services services)
    : acceptor(io, tcp::endpoint(asio::ip::make_address(listen.host), listen.port)),
      signals(io, SIGINT, SIGTERM),
      services(services) {
    LOG(INFO) << "Listening for judges on " << acceptor.local_endpoint();
}

bridge_server::~bridge_server() {
    stop();
    shutdown();
}

void bridge_server::run() {
    signals.async_wait([this](const boost::system::error_code &ec, int signum) {
        if (ec) return;
        LOG(WARNING) << "Received signal " << signum << ", stopping server";
        stop();
    });
    accept();
    io.run();
    shutdown();
}

void bridge_server::stop() {
    asio::post(io, [this] {
        boost::system::error_code ec;
        acceptor.close(ec);
        signals.cancel(ec);
        io.stop();
    });
}

unsigned short bridge_server::port() const {
    return acceptor.local_endpoint().port();
}

void bridge_server::accept() {
    acceptor.async_accept([this](const boost::system::error_code &ec, tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted)
                LOG(ERROR) << "Unable to accept judge connection: " << ec.message();
            return;
        }

        reap();
        auto handler = make_shared<judge_handler>(make_unique<zlib_connection>(move(socket)), services);
        {
            scoped_lock guard(sessions_mut);
            sessions.push_back({handler, thread([handler] { handler->handle(); })});
        }
        accept();
    });
}

void bridge_server::reap() {
    scoped_lock guard(sessions_mut);
    for (auto it = sessions.begin(); it != sessions.end();) {
        if (it->handler->finished()) {
            it->thread.join();
            it = sessions.erase(it);
        } else {
            ++it;
        }
    }
}

void bridge_server::shutdown() {
    scoped_lock guard(sessions_mut);
    if (sessions.empty()) return;

    LOG(INFO) << "Disconnecting " << sessions.size() << " judge(s)";
    for (auto &s : sessions) s.handler->disconnect(false);

    auto deadline = chrono::steady_clock::now() + SHUTDOWN_GRACE;
    for (auto &s : sessions) {
        while (!s.handler->finished() && chrono::steady_clock::now() < deadline)
            this_thread::sleep_for(chrono::milliseconds(100));
        if (!s.handler->finished()) {
            LOG(WARNING) << "Judge " << s.handler->name() << " did not disconnect in time, closing connection";
            s.handler->disconnect(true);
        }
        s.thread.join();
    }
    sessions.clear();
}

}  // namespace bridge::server
