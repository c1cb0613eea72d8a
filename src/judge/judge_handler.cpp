#include "judge/judge_handler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/throw_exception.hpp>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"
#include "config.hpp"
#include "judge/authenticator.hpp"
#include "judge/session_registry.hpp"
#include "server/result_sink.hpp"
#include "server/scheduler.hpp"
#include "server/submission_store.hpp"

namespace bridge {
using namespace std;
using namespace nlohmann;

judge_handler::judge_handler(unique_ptr<server::connection> &&conn, judge_services services)
    : server::packet_handler(move(conn)),
      services(services),
      health(HEALTH_WINDOW),
      limiter(UPDATE_RATE_LIMIT, UPDATE_RATE_TIME) {}

judge_handler::~judge_handler() {
    health.stop();
    ack.stop();
}

void judge_handler::submit(const string &submission_id, const string &problem_id,
                           const string &language, const string &source) {
    if (!is_authenticated || disconnected)
        BOOST_THROW_EXCEPTION(network_error(fmt::format("judge {} is not connected", name())));

    if (auto current = lifecycle.current())
        BOOST_THROW_EXCEPTION(session_busy(fmt::format("judge {} is busy with submission {}", name(), *current)));

    // 获取评测参数失败时直接抛出 submission_data_unavailable，评测机保持空闲
    message::submission_data data = services.store.fetch(submission_id);

    if (!lifecycle.begin(submission_id))
        BOOST_THROW_EXCEPTION(session_busy(fmt::format("judge {} is busy", name())));

    {
        scoped_lock guard(limiter_mut);
        limiter.reset();
    }

    // 连接在 begin 前后断开时，只有成功清空状态的一方负责报告提交丢失
    if (disconnected) {
        if (lifecycle.reset())
            BOOST_THROW_EXCEPTION(network_error(fmt::format("judge {} disconnected", name())));
        return;
    }

    ack.arm(ACK_TIMEOUT, [this, submission_id] {
        LOG(ERROR) << "Judge " << name() << " failed to acknowledge submission " << submission_id;
        close();
    });

    try {
        send(message::submission_request{submission_id, problem_id, language, source, data});
    } catch (network_error &) {
        ack.disarm();
        if (lifecycle.reset()) throw;
        return;
    }
    LOG(INFO) << "Dispatched submission " << submission_id << " to judge " << name();
}

void judge_handler::abort() {
    if (!working()) return;
    send(message::terminate_submission{});
}

void judge_handler::disconnect(bool force) {
    if (force) {
        close();
        return;
    }
    try {
        send(message::disconnect{});
    } catch (network_error &e) {
        LOG(WARNING) << "Unable to send disconnect to judge " << name() << ": " << e.what();
        close();
    }
}

bool judge_handler::can_judge(const string &problem_id, const string &executor,
                              const optional<string> &judge_id) const {
    if (!is_authenticated || disconnected) return false;

    scoped_lock guard(info_mut);
    return judge_problems.count(problem_id) && judge_executors.count(executor) &&
           ((!judge_id && accepting) || judge_id == judge_name);
}

bool judge_handler::working() const {
    return lifecycle.current().has_value();
}

optional<string> judge_handler::current_submission() const {
    return lifecycle.current();
}

string judge_handler::name() const {
    scoped_lock guard(info_mut);
    return judge_name;
}

bool judge_handler::authenticated() const {
    return is_authenticated;
}

double judge_handler::load() const {
    return health.load();
}

optional<double> judge_handler::latency() const {
    return health.latency();
}

optional<double> judge_handler::time_delta() const {
    return health.time_delta();
}

void judge_handler::set_accepting(bool accepting) {
    this->accepting = accepting;
}

set<string> judge_handler::problems() const {
    scoped_lock guard(info_mut);
    return judge_problems;
}

map<string, json> judge_handler::executors() const {
    scoped_lock guard(info_mut);
    return judge_executors;
}

void judge_handler::on_connect() {
    set_timeout(HANDSHAKE_TIMEOUT);
    LOG(INFO) << "Judge connected from: " << address();
    judge_context ctx = context();
    call_monitor([&](monitor &m) { m.judge_connected(ctx); });
}

void judge_handler::on_packet(const string &data) {
    try {
        message::inbound packet = message::decode(data);
        if (!is_authenticated && !holds_alternative<message::handshake>(packet)) {
            LOG(WARNING) << "Judge " << address() << " sent " << message::name_of(packet) << " before handshake";
            violation("packet before handshake");
            return;
        }

        visit(overloaded{
                  [this](const message::handshake &p) { on_handshake(p); },
                  [this](const message::submission_acknowledged &p) { on_submission_acknowledged(p); },
                  [this](const message::grading_begin &p) { on_grading_begin(p); },
                  [this](const message::grading_end &p) { on_grading_end(p); },
                  [this](const message::compile_error &p) { on_compile_error(p); },
                  [this](const message::compile_message &p) { on_compile_message(p); },
                  [this](const message::batch_begin &p) { on_batch_begin(p); },
                  [this](const message::batch_end &p) { on_batch_end(p); },
                  [this](const message::test_case_status &p) { on_test_case(p); },
                  [this](const message::internal_error &p) { on_internal_error(p); },
                  [this](const message::submission_terminated &p) { on_submission_terminated(p); },
                  [this](const message::ping &p) { on_ping(p); },
                  [this](const message::ping_response &p) { on_ping_response(p); },
                  [this](const message::supported_problems &p) { on_supported_problems(p); },
                  [this](const message::unrecognized &p) { on_malformed(p); }},
              packet);
    } catch (std::exception &e) {
        LOG(ERROR) << "Error in packet handling (" << name() << ": " << current_submission().value_or("none") << "): "
                   << boost::diagnostic_information(e);
        judge_context ctx = context();
        call_monitor([&](monitor &m) { m.packet_error(ctx, "packet processing exception"); });
    }
}

void judge_handler::on_timeout() {
    LOG(WARNING) << "Judge seems dead: " << name() << ": " << current_submission().value_or("none");
}

void judge_handler::on_disconnect() {
    if (disconnected.exchange(true)) return;

    health.stop();
    ack.stop();

    if (is_authenticated) services.registry.unregister_session(*this);

    judge_context ctx = context();
    if (auto lost = lifecycle.reset()) {
        LOG(ERROR) << "Judge " << name() << " disconnected while handling submission " << *lost;
        ctx.submission = lost;
        call_monitor([&](monitor &m) { m.submission_lost(ctx, *lost); });
        services.scheduler.submission_lost(*lost);
    }

    LOG(INFO) << "Judge disconnected from: " << address() << " with name " << name()
              << " after " << connected_time.duration<chrono::seconds>().count() << "s";
    call_monitor([&](monitor &m) { m.judge_disconnected(ctx); });
}

void judge_handler::on_handshake(const message::handshake &packet) {
    if (is_authenticated) {
        LOG(WARNING) << "Judge " << name() << " sent a second handshake";
        violation("duplicate handshake");
        return;
    }

    if (!packet.id || !packet.key || packet.malformed) {
        LOG(WARNING) << "Malformed handshake: " << address();
        close();
        return;
    }

    if (!services.auth.authenticate(*packet.id, *packet.key)) {
        LOG(WARNING) << "Authentication failure: " << address() << " (" << *packet.id << ")";
        close();
        return;
    }

    {
        scoped_lock guard(info_mut);
        judge_name = *packet.id;
        judge_problems = packet.problems;
        judge_executors = packet.executors;
    }

    set_timeout(SESSION_TIMEOUT);
    send(message::handshake_success{});
    is_authenticated = true;
    LOG(INFO) << "Judge authenticated: " << address() << " (" << *packet.id << ")";

    judge_context ctx = context();
    call_monitor([&](monitor &m) { m.judge_authenticated(ctx); });

    health.start([this](double when) { send(message::ping{when}); },
                 [this] { close(); });
    services.registry.register_session(shared_from_this());
}

void judge_handler::on_submission_acknowledged(const message::submission_acknowledged &packet) {
    if (!apply(lifecycle_event::ACKNOWLEDGED, packet.submission_id)) return;

    if (!ack.disarm())
        LOG(WARNING) << "Submission " << packet.submission_id << " acknowledged by judge " << name() << " after deadline";
    else
        LOG(INFO) << "Submission acknowledged: " << packet.submission_id;
}

void judge_handler::on_grading_begin(const message::grading_begin &packet) {
    if (!apply(lifecycle_event::GRADING_BEGIN, packet.submission_id)) return;

    LOG(INFO) << name() << ": Grading has begun on: " << packet.submission_id;
    forward(packet.submission_id, {{"type", "grading-begin"}, {"pretested", packet.pretested}});
}

void judge_handler::on_grading_end(const message::grading_end &packet) {
    if (!apply(lifecycle_event::GRADING_END, packet.submission_id)) return;

    LOG(INFO) << name() << ": Grading has ended on: " << packet.submission_id;
    finish(packet.submission_id, {{"type", "grading-end"}});
}

void judge_handler::on_compile_error(const message::compile_error &packet) {
    if (!apply(lifecycle_event::COMPILE_ERROR, packet.submission_id)) return;

    LOG(INFO) << name() << ": Submission failed to compile: " << packet.submission_id;
    finish(packet.submission_id, {{"type", "compile-error"}, {"log", truncate_utf8(packet.log, MAX_REPORT_SIZE)}});
}

void judge_handler::on_compile_message(const message::compile_message &packet) {
    if (!apply(lifecycle_event::COMPILE_MESSAGE, packet.submission_id)) return;

    LOG(INFO) << name() << ": Submission generated compiler messages: " << packet.submission_id;
    forward(packet.submission_id, {{"type", "compile-message"}, {"log", truncate_utf8(packet.log, MAX_REPORT_SIZE)}});
}

void judge_handler::on_batch_begin(const message::batch_begin &packet) {
    if (!apply(lifecycle_event::BATCH_BEGIN, packet.submission_id)) return;

    optional<int> batch = lifecycle.batch();
    LOG(INFO) << name() << ": Batch " << batch.value_or(0) << " began on: " << packet.submission_id;
    forward(packet.submission_id, {{"type", "batch-begin"}, {"batch", batch.value_or(0)}});
}

void judge_handler::on_batch_end(const message::batch_end &packet) {
    optional<int> batch = lifecycle.batch();
    if (!apply(lifecycle_event::BATCH_END, packet.submission_id)) return;

    LOG(INFO) << name() << ": Batch " << batch.value_or(0) << " ended on: " << packet.submission_id;
    forward(packet.submission_id, {{"type", "batch-end"}, {"batch", batch.value_or(0)}});
}

void judge_handler::on_test_case(const message::test_case_status &packet) {
    if (!apply(lifecycle_event::TEST_CASE, packet.submission_id)) return;

    json cases = packet.cases;
    for (auto &c : cases) {
        if (c.contains("feedback") && c["feedback"].is_string())
            c["feedback"] = truncate_utf8(c["feedback"].get<string>(), MAX_FEEDBACK);
        for (const char *key : {"output", "extended-feedback"})
            if (c.contains(key) && c[key].is_string())
                c[key] = truncate_utf8(c[key].get<string>(), MAX_REPORT_SIZE);
    }

    optional<int> batch = lifecycle.batch();
    json event = {{"type", "test-case"}, {"batch", batch ? json(*batch) : json(nullptr)}, {"cases", move(cases)}};

    vector<json> ready;
    {
        scoped_lock guard(limiter_mut);
        ready = limiter.offer(move(event), update_rate_limiter::clock::now());
    }
    DLOG(INFO) << name() << ": " << packet.cases.size() << " test case(s) on " << packet.submission_id
               << ", forwarding " << ready.size() << " update(s)";

    string judge = name();
    for (auto &update : ready)
        services.sink.notify_result(judge, packet.submission_id, update);
}

void judge_handler::on_internal_error(const message::internal_error &packet) {
    if (!apply(lifecycle_event::INTERNAL_ERROR, packet.submission_id)) return;

    LOG(ERROR) << name() << ": Submission failed with internal error: " << packet.submission_id << ": " << packet.message;
    services.scheduler.submission_failed(packet.submission_id, packet.message);
    finish(packet.submission_id, {{"type", "internal-error"}, {"message", truncate_utf8(packet.message, MAX_REPORT_SIZE)}});
}

void judge_handler::on_submission_terminated(const message::submission_terminated &packet) {
    if (!apply(lifecycle_event::TERMINATED, packet.submission_id)) return;

    LOG(INFO) << name() << ": Submission aborted: " << packet.submission_id;
    finish(packet.submission_id, {{"type", "aborted"}});
}

void judge_handler::on_ping(const message::ping &packet) {
    send(message::ping_response{packet.when, unix_time(), nullopt});
}

void judge_handler::on_ping_response(const message::ping_response &packet) {
    if (!packet.load || !health.record(packet.when, unix_time(), packet.time, *packet.load)) {
        LOG(WARNING) << name() << ": Invalid ping response";
        violation("invalid ping response");
        return;
    }
    DLOG(INFO) << name() << ": latency " << health.latency().value_or(0) << "s, time delta "
               << health.time_delta().value_or(0) << "s, load " << health.load();
}

void judge_handler::on_supported_problems(const message::supported_problems &packet) {
    if (packet.malformed) {
        LOG(WARNING) << name() << ": Malformed supported problems";
        violation("malformed supported problems");
        return;
    }

    LOG(INFO) << name() << ": Updated problem list (" << packet.problems.size() << " problems)";
    scoped_lock guard(info_mut);
    judge_problems = packet.problems;
}

void judge_handler::on_malformed(const message::unrecognized &packet) {
    LOG(ERROR) << name() << ": Malformed packet (" << packet.reason << "): " << truncate_utf8(packet.raw, MAX_FEEDBACK);
    judge_context ctx = context();
    call_monitor([&](monitor &m) { m.packet_error(ctx, "malformed json packet"); });
}

bool judge_handler::apply(lifecycle_event event, const string &submission_id) {
    // 转发事件之前先发出被合并的测试点结果，之后状态机可能回到空闲，新的提交会清空频率限制器
    optional<json> pending;
    if (event != lifecycle_event::TEST_CASE) {
        scoped_lock guard(limiter_mut);
        pending = limiter.flush();
    }
    if (pending) {
        if (auto current = lifecycle.current())
            services.sink.notify_result(name(), *current, *pending);
    }

    transition result = lifecycle.apply(event, submission_id);
    if (result == transition::APPLIED || result == transition::FINISHED)
        return true;

    LOG(WARNING) << name() << ": Received " << event_name(event) << " for submission " << submission_id
                 << " in state " << state_name(lifecycle.state()) << ": " << transition_name(result);
    violation(fmt::format("unexpected {}: {}", event_name(event), transition_name(result)));
    return false;
}

void judge_handler::forward(const string &submission_id, json event) {
    services.sink.notify_result(name(), submission_id, event);
}

void judge_handler::finish(const string &submission_id, json event) {
    ack.disarm();
    event["done"] = true;
    services.sink.notify_result(name(), submission_id, event);
    services.scheduler.session_idle(shared_from_this());
}

void judge_handler::violation(const string &info) {
    judge_context ctx = context();
    call_monitor([&](monitor &m) { m.packet_error(ctx, info); });
}

judge_context judge_handler::context() const {
    judge_context ctx;
    if (is_authenticated) ctx.judge = name();
    ctx.address = address();
    ctx.submission = current_submission();
    return ctx;
}

}  // namespace bridge
