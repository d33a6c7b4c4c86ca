#ifndef WSGATE_NET_UTIL_HPP
#define WSGATE_NET_UTIL_HPP

#include <string>
#include <string_view>
#include <optional>

namespace wsgate::net {

// Service that answers a plain GET with the caller's public address.
inline constexpr std::string_view external_ip_service_url = "http://checkip.amazonaws.com";

/**
 * @brief Returns the lower-cased hostname of a URL, with or without scheme.
 *
 * "localhost:8501", "http://user@Example.com:80/x?y#z" and "https://[::1]/"
 * yield "localhost", "example.com" and "::1".
 *
 * @return std::nullopt if the URL has no host or is malformed.
 */
[[nodiscard]] std::optional<std::string> get_hostname(std::string_view url) noexcept;

/**
 * @brief Checks whether a string is a literal IPv4 or IPv6 address.
 */
[[nodiscard]] bool looks_like_ip(std::string_view candidate) noexcept;

/**
 * @brief Gets the address of the interface this machine uses for outbound traffic.
 *
 * No packet is sent: a UDP socket is connected and its local address read.
 * A successful lookup is cached for the lifetime of the process.
 *
 * @return The address, or std::nullopt on failure.
 */
[[nodiscard]] std::optional<std::string> get_internal_ip() noexcept;

/**
 * @brief Asks external_ip_service_url for this machine's public address.
 *
 * Blocks for up to 5 seconds. A successful lookup is cached for the lifetime
 * of the process; failures are logged and retried on the next call.
 *
 * @return The address, or std::nullopt on failure.
 */
[[nodiscard]] std::optional<std::string> get_external_ip() noexcept;

} // namespace wsgate::net

#endif // WSGATE_NET_UTIL_HPP
