#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace bridge {
using namespace std;

bridge_exception::bridge_exception()
    : bridge_exception("") {}

bridge_exception::bridge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *bridge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const bridge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : bridge_exception() {}

internal_error::internal_error(const string &message)
    : bridge_exception(message) {}

network_error::network_error()
    : bridge_exception() {}

network_error::network_error(const string &message)
    : bridge_exception(message) {}

submission_data_unavailable::submission_data_unavailable()
    : bridge_exception() {}

submission_data_unavailable::submission_data_unavailable(const string &message)
    : bridge_exception(message) {}

session_busy::session_busy()
    : bridge_exception() {}

session_busy::session_busy(const string &message)
    : bridge_exception(message) {}

}  // namespace bridge
