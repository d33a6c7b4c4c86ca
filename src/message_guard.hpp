#ifndef WSGATE_MESSAGE_GUARD_HPP
#define WSGATE_MESSAGE_GUARD_HPP

#include "forward_msg.hpp"
#include <string>
#include <string_view>
#include <exception>
#include <cstddef>

namespace wsgate::fwd {

// Largest message that can be sent over the WebSocket connection (50 MB).
inline constexpr size_t message_size_limit = 50'000'000;

inline constexpr std::string_view data_too_large_message = "Data too large";

/**
 * @brief Replaces a message with an exception message describing @p e.
 *
 * Only delta.id survives, every other field of @p msg is dropped.
 */
[[nodiscard]] forward_msg to_exception_msg(forward_msg&& msg, const std::exception& e);

/**
 * @brief Serializes a ForwardMsg to send to a client.
 *
 * If the serialized message is larger than @p limit bytes, the bytes of an
 * exception message ("Data too large") carrying the same delta id are
 * returned instead. The result is never larger than the serialized @p msg:
 * when the exception message would not be smaller, the original bytes are
 * returned even though they exceed @p limit. @p msg is never modified, but
 * must not be written by another thread during the call.
 *
 * @throws json::output_error only if json-c itself fails.
 */
[[nodiscard]] std::string serialize_forward_msg(const forward_msg& msg, size_t limit = message_size_limit);

} // namespace wsgate::fwd

#endif // WSGATE_MESSAGE_GUARD_HPP
