#include "common/defer.hpp"

namespace bridge {

scope_exit::scope_exit() : f() {}
scope_exit::scope_exit(std::function<void()> f) : f(std::move(f)) {}
scope_exit::scope_exit(scope_exit &&other) noexcept : f(std::move(other.f)) {
    other.f = nullptr;
}
scope_exit::~scope_exit() {
    if (f) f();
}

scope_exit scope_exit::operator+(std::function<void()> f) const {
    return scope_exit(std::move(f));
}

}  // namespace bridge
