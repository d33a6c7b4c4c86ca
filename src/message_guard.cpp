#include "message_guard.hpp"
#include "exception_marshal.hpp"
#include "logger.hpp"
#include <format>
#include <stdexcept>
#include <utility>

namespace wsgate::fwd {

forward_msg to_exception_msg(forward_msg&& msg, const std::exception& e) {
    forward_msg replacement{std::move(msg)};
    const uint32_t delta_id = replacement.delta.id;
    replacement.clear();
    replacement.delta.id = delta_id;

    exception_element ex;
    marshall(ex, e);
    replacement.delta.new_element = std::move(ex);
    return replacement;
}

std::string serialize_forward_msg(const forward_msg& msg, size_t limit) {
    std::string msg_str = serialize(msg);
    if (msg_str.size() <= limit) {
        return msg_str;
    }

    const log::context_scope context(std::format("delta {}", msg.delta.id));
    log::warn("ForwardMsg for delta {} is {} bytes, over the {} byte limit. Sending an exception instead.",
              msg.delta.id, msg_str.size(), limit);

    // Only the id is carried over.
    forward_msg shell;
    shell.delta.id = msg.delta.id;
    const forward_msg replacement = to_exception_msg(std::move(shell), std::runtime_error(std::string(data_too_large_message)));

    std::string replacement_str = serialize(replacement);
    if (replacement_str.size() >= msg_str.size()) {
        // The exception message must never be bigger than what it replaces.
        log::error("Exception message for delta {} ({} bytes) is not smaller than the original ({} bytes), sending the original.",
                   msg.delta.id, replacement_str.size(), msg_str.size());
        return msg_str;
    }
    if (replacement_str.size() > limit) {
        log::error("Exception message for delta {} is still {} bytes, over the {} byte limit.",
                   msg.delta.id, replacement_str.size(), limit);
    }
    return replacement_str;
}

} // namespace wsgate::fwd
