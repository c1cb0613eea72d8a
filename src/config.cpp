#include "config.hpp"

namespace bridge {
using namespace std;
using namespace std::chrono_literals;

chrono::milliseconds HANDSHAKE_TIMEOUT = 15s;
chrono::milliseconds SESSION_TIMEOUT = 60s;
chrono::milliseconds ACK_TIMEOUT = 20s;
chrono::milliseconds PING_INTERVAL = 10s;
size_t HEALTH_WINDOW = 6;
size_t UPDATE_RATE_LIMIT = 5;
chrono::milliseconds UPDATE_RATE_TIME = 500ms;
size_t MAX_FEEDBACK = 100;
size_t MAX_REPORT_SIZE = 1 << 16;    // 64K
size_t MAX_PACKET_SIZE = 8 << 20;    // 8M
size_t MAX_PROBLEMS = 100000;
size_t MAX_IDENTIFIER_LENGTH = 128;
chrono::milliseconds DEPENDENCY_TIMEOUT = 5s;
bool DEBUG = false;

}  // namespace bridge
