#include "monitor/json_log_monitor.hpp"
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include "common/messages.hpp"

namespace bridge {
using namespace std;
using namespace nlohmann;

static json record(const judge_context &ctx) {
    json j;
    j["judge"] = ctx.judge ? json(*ctx.judge) : json(nullptr);
    j["address"] = ctx.address;
    j["submission"] = ctx.submission ? json(*ctx.submission) : json(nullptr);
    return j;
}

static void log_action(const judge_context &ctx, const string &action) {
    json j = record(ctx);
    j["action"] = action;
    LOG(INFO) << message::encode(j);
}

void json_log_monitor::judge_connected(const judge_context &ctx) {
    log_action(ctx, "connect");
}

void json_log_monitor::judge_authenticated(const judge_context &ctx) {
    log_action(ctx, "authenticate");
}

void json_log_monitor::judge_disconnected(const judge_context &ctx) {
    log_action(ctx, "disconnect");
}

void json_log_monitor::packet_error(const judge_context &ctx, const string &info) {
    json j = record(ctx);
    j["info"] = info;
    LOG(WARNING) << message::encode(j);
}

void json_log_monitor::submission_lost(const judge_context &ctx, const string &submission_id) {
    json j = record(ctx);
    j["submission"] = submission_id;
    j["info"] = "submission lost";
    LOG(ERROR) << message::encode(j);
}

}  // namespace bridge
