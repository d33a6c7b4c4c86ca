#ifndef WSGATE_EXCEPTION_MARSHAL_HPP
#define WSGATE_EXCEPTION_MARSHAL_HPP

#include "forward_msg.hpp"
#include <exception>

namespace wsgate::fwd {

/**
 * @brief Fills an exception element from a caught exception.
 *
 * The type is the demangled dynamic type of @p e, the message is what().
 * The stack trace is only captured when built with USE_STACKTRACE and is
 * the trace of the marshalling call site, not of the throw site.
 */
void marshall(exception_element& target, const std::exception& e);

} // namespace wsgate::fwd

#endif // WSGATE_EXCEPTION_MARSHAL_HPP
