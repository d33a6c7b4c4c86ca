#include "exception_marshal.hpp"
#include "util.hpp"
#include <typeinfo>

#ifdef USE_STACKTRACE
#include <stacktrace>
#endif

namespace wsgate::fwd {

void marshall(exception_element& target, const std::exception& e) {
    target.type = util::demangle(typeid(e));
    target.message = e.what();
    target.stack_trace.clear();

#ifdef USE_STACKTRACE
    for (const auto& frame : std::stacktrace::current(1)) {
        target.stack_trace.push_back(std::to_string(frame));
    }
#endif
}

} // namespace wsgate::fwd
