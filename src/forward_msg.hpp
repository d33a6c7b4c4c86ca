#ifndef WSGATE_FORWARD_MSG_HPP
#define WSGATE_FORWARD_MSG_HPP

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <cstdint>

/**
 * @file forward_msg.hpp
 * @brief The server-to-browser message carried over the WebSocket connection.
 *
 * On the wire a ForwardMsg is a JSON document:
 *   {"delta":{"id":3,"newElement":{"text":{"body":"hi"}}}}
 *   {"delta":{"id":3,"newElement":{"exception":{"type":"...","message":"...","stackTrace":["..."]}}}}
 */

namespace wsgate::fwd {

struct text_element {
    std::string body;

    bool operator==(const text_element&) const = default;
};

struct exception_element {
    std::string type;
    std::string message;
    std::vector<std::string> stack_trace;

    bool operator==(const exception_element&) const = default;
};

using element = std::variant<std::monostate, text_element, exception_element>;

struct delta {
    uint32_t id{0};
    element new_element;

    bool operator==(const delta&) const = default;
};

struct forward_msg {
    fwd::delta delta;

    // Resets every field to its default value.
    void clear() noexcept {
        delta = fwd::delta{};
    }

    bool operator==(const forward_msg&) const = default;
};

/**
 * @brief Serializes a message into the bytes sent to the browser.
 * @throws json::output_error if json-c fails to build the document.
 */
[[nodiscard]] std::string serialize(const forward_msg& msg);

/**
 * @brief Parses bytes produced by serialize().
 * @throws json::parsing_error on malformed input or an unknown element kind.
 */
[[nodiscard]] forward_msg parse(std::string_view data);

} // namespace wsgate::fwd

#endif // WSGATE_FORWARD_MSG_HPP
