#include "server/packet_handler.hpp"
#include <glog/logging.h>
#include "common/messages.hpp"
#include "config.hpp"

namespace bridge::server {
using namespace std;

packet_handler::packet_handler(unique_ptr<connection> &&conn)
    : conn(move(conn)) {}

packet_handler::~packet_handler() {}

void packet_handler::handle() {
    on_connect();

    string packet;
    while (true) {
        read_result result = conn->read_packet(packet);
        if (result == read_result::TIMEOUT) {
            on_timeout();
            break;
        } else if (result == read_result::CLOSED) {
            break;
        }

        if (DEBUG) LOG(INFO) << "Received from " << conn->remote_address() << ": " << packet;
        on_packet(packet);
    }

    conn->close();
    on_disconnect();
    done = true;
}

bool packet_handler::finished() const {
    return done;
}

string packet_handler::address() const {
    return conn->remote_address();
}

void packet_handler::on_connect() {}

void packet_handler::on_timeout() {}

void packet_handler::on_disconnect() {}

void packet_handler::send(const nlohmann::json &packet) {
    string data = message::encode(packet);
    if (DEBUG) LOG(INFO) << "Sending to " << conn->remote_address() << ": " << data;
    conn->send_packet(data);
}

void packet_handler::close() {
    conn->close();
}

void packet_handler::set_timeout(chrono::milliseconds timeout) {
    conn->set_timeout(timeout);
}

}  // namespace bridge::server
