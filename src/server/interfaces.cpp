#include "server/result_sink.hpp"
#include "server/scheduler.hpp"
#include "server/submission_store.hpp"

namespace bridge::server {

submission_store::~submission_store() {}

result_sink::~result_sink() {}

scheduler::~scheduler() {}

}  // namespace bridge::server
