#include "monitor/monitor.hpp"
#include <glog/logging.h>
#include <vector>

namespace bridge {
using namespace std;

static vector<unique_ptr<monitor>> monitors;

monitor::~monitor() {}

void monitor::judge_connected(const judge_context &) {}

void monitor::judge_authenticated(const judge_context &) {}

void monitor::judge_disconnected(const judge_context &) {}

void monitor::packet_error(const judge_context &, const string &) {}

void monitor::submission_lost(const judge_context &, const string &) {}

void register_monitor(unique_ptr<monitor> &&monitor) {
    monitors.push_back(move(monitor));
}

void clear_monitors() {
    monitors.clear();
}

void call_monitor(const function<void(monitor &)> &callback) {
    for (auto &monitor : monitors) {
        try {
            callback(*monitor);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Monitor failed when reporting audit information, " << ex.what();
        }
    }
}

}  // namespace bridge
