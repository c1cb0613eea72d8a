#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/authenticator.hpp"
#include "judge/session_registry.hpp"
#include "monitor/json_log_monitor.hpp"
#include "server/bridge_server.hpp"
#include "server/judge_queue.hpp"
#include "server/rabbitmq_result_sink.hpp"
#include "server/redis_submission_store.hpp"
#include "server/submission_source.hpp"
using namespace std;

static chrono::milliseconds seconds_to_duration(double seconds) {
    return chrono::milliseconds(static_cast<chrono::milliseconds::rep>(seconds * 1000));
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("judge-bridge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the configuration file path. You can either pass it from environ BRIDGE_CONFIG")
        ("host", po::value<string>(), "set the address to listen for judges, overriding the configuration file. You can either pass it from environ BRIDGE_HOST")
        ("port", po::value<int>(), "set the port to listen for judges, overriding the configuration file. You can either pass it from environ BRIDGE_PORT")
        ("ack-timeout", po::value<double>(), "set the seconds to wait for judges to acknowledge a submission, default to 20. You can either pass it from environ BRIDGE_ACK_TIMEOUT")
        ("ping-interval", po::value<double>(), "set the seconds between two pings, default to 10. You can either pass it from environ BRIDGE_PING_INTERVAL")
        ("debug", "turn on the debug mode to log all packets sent and received.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "JudgeBridge: Accept judge connections, dispatch submissions to them and forward results" << endl
             << "Usage: " << argv[0] << " --config <file> [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "judge-bridge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        bridge::DEBUG = true;
    } else if (getenv("DEBUG")) {
        bridge::DEBUG = true;
    }

    string config_path;
    if (vm.count("config")) {
        config_path = vm.at("config").as<string>();
    } else {
        config_path = get_env("BRIDGE_CONFIG", "");
    }
    if (config_path.empty()) {
        cerr << "Configuration file should be specified by --config or environ BRIDGE_CONFIG" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }
    CHECK(filesystem::is_regular_file(config_path))
        << "Configuration file " << config_path << " does not exist";

    bridge::server::bridge_config config;
    try {
        config = bridge::server::load_bridge_config(config_path);
    } catch (std::exception& e) {
        LOG(FATAL) << "Configuration file " << config_path << " is malformed: " << e.what();
    }

    if (vm.count("host")) {
        config.listen.host = vm.at("host").as<string>();
    } else if (getenv("BRIDGE_HOST")) {
        config.listen.host = getenv("BRIDGE_HOST");
    }

    if (vm.count("port")) {
        config.listen.port = vm.at("port").as<int>();
    } else if (getenv("BRIDGE_PORT")) {
        config.listen.port = boost::lexical_cast<int>(getenv("BRIDGE_PORT"));
    }

    if (vm.count("ack-timeout")) {
        bridge::ACK_TIMEOUT = seconds_to_duration(vm.at("ack-timeout").as<double>());
    } else if (getenv("BRIDGE_ACK_TIMEOUT")) {
        bridge::ACK_TIMEOUT = seconds_to_duration(boost::lexical_cast<double>(getenv("BRIDGE_ACK_TIMEOUT")));
    }
    CHECK(bridge::ACK_TIMEOUT.count() > 0) << "Acknowledgement timeout should be positive";

    if (vm.count("ping-interval")) {
        bridge::PING_INTERVAL = seconds_to_duration(vm.at("ping-interval").as<double>());
    } else if (getenv("BRIDGE_PING_INTERVAL")) {
        bridge::PING_INTERVAL = seconds_to_duration(boost::lexical_cast<double>(getenv("BRIDGE_PING_INTERVAL")));
    }
    CHECK(bridge::PING_INTERVAL.count() > 0) << "Ping interval should be positive";
    CHECK(bridge::PING_INTERVAL < bridge::SESSION_TIMEOUT)
        << "Ping interval should be shorter than the session timeout";

    bridge::register_monitor(make_unique<bridge::json_log_monitor>());

    try {
        bridge::key_authenticator auth(config.judges);
        bridge::server::redis_submission_store store(config.redis_config);
        bridge::server::rabbitmq_result_sink sink(config.result_queue);
        bridge::session_registry registry;
        bridge::server::judge_queue queue(registry);
        registry.set_scheduler(&queue);

        bridge::server::bridge_server server(config.listen, {auth, store, sink, queue, registry});
        bridge::server::submission_source source(config.submission_queue, queue);
        source.start();

        server.run();

        source.stop();
        sink.stop();
    } catch (bridge::bridge_exception& e) {
        LOG(FATAL) << "Judge bridge crashed: " << e;
    } catch (std::exception& e) {
        LOG(FATAL) << "Judge bridge crashed: " << boost::diagnostic_information(e);
    }

    return 0;
}
