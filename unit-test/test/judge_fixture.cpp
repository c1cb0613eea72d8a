#include "test/judge_fixture.hpp"
#include "config.hpp"

namespace bridge::test {
using namespace std;
using namespace nlohmann;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

void judge_fixture::SetUp() {
    ACK_TIMEOUT = chrono::milliseconds(300);

    clear_monitors();
    auto m = make_unique<NiceMock<mock_monitor>>();
    audit = m.get();
    register_monitor(move(m));

    ON_CALL(store, fetch(_)).WillByDefault(Return(default_data()));
    registry.set_scheduler(&scheduler());
}

void judge_fixture::TearDown() {
    for (auto &session : sessions) shutdown(session);
    sessions.clear();
    clear_monitors();
    ACK_TIMEOUT = chrono::seconds(20);
}

server::scheduler &judge_fixture::scheduler() {
    return mock_sched;
}

judge_session &judge_fixture::connect() {
    auto conn = make_unique<fake_connection>();
    judge_session &session = sessions.emplace_back();
    session.conn = conn.get();
    session.handler = make_shared<judge_handler>(move(conn), judge_services{auth, store, sink, scheduler(), registry});
    session.loop = thread([handler = session.handler] { handler->handle(); });
    return session;
}

judge_session &judge_fixture::connect_judge(const string &name, const string &key,
                                            const json &problems, const json &executors) {
    judge_session &session = connect();
    session.conn->receive(handshake_packet(name, key, problems, executors));
    EXPECT_TRUE(session.conn->wait_packet("handshake-success"));
    EXPECT_TRUE(eventually([&] { return registry.find(name) == session.handler; }));
    return session;
}

void judge_fixture::shutdown(judge_session &session) {
    session.conn->close();
    if (session.loop.joinable()) session.loop.join();
}

json judge_fixture::handshake_packet(const string &name, const string &key,
                                     const json &problems, const json &executors) {
    return {{"name", "handshake"}, {"id", name}, {"key", key}, {"problems", problems}, {"executors", executors}};
}

message::submission_data judge_fixture::default_data() {
    message::submission_data data;
    data.time_limit = 1;
    data.memory_limit = 262144;
    data.user_id = 1001;
    return data;
}

}  // namespace bridge::test
