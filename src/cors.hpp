#ifndef WSGATE_CORS_HPP
#define WSGATE_CORS_HPP

#include "config.hpp"
#include "net_util.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <functional>

namespace wsgate::cors {

/**
 * @brief A deferred candidate host. Returns std::nullopt when the candidate
 * does not apply (option not set, lookup failed...).
 */
using origin_supplier = std::function<std::optional<std::string>()>;

/**
 * @brief The network lookups used to discover this machine's own addresses.
 */
struct host_probes {
    origin_supplier internal_ip{&net::get_internal_ip};
    origin_supplier external_ip{&net::get_external_ip};
};

/**
 * @brief Wraps a fixed hostname as a supplier that resolves immediately.
 */
[[nodiscard]] origin_supplier literal(std::string host);

/**
 * @brief Builds the ordered list of allowed hosts.
 *
 * Cheap candidates come first so that the network lookups at the end are
 * only reached when nothing else matched:
 * localhost, 0.0.0.0, 127.0.0.1, browser.serverAddress (if manually set),
 * s3.url host (if manually set), internal IP, external IP, s3.bucket.
 *
 * The suppliers refer to @p cfg and must not outlive it.
 */
[[nodiscard]] std::vector<origin_supplier> allowed_origin_candidates(const config::store& cfg, const host_probes& probes);

/**
 * @brief Checks whether a URL comes from an allowed origin.
 *
 * Every origin is allowed when server.enableCORS is false. Otherwise the
 * URL's hostname must equal one of allowed_origin_candidates(); each
 * candidate is evaluated at most once and only until the first match.
 *
 * @param url The URL to check, typically the value of the 'Origin' header.
 * @return `true` if the origin is permitted, `false` otherwise.
 * @throws config::error if server.enableCORS does not hold a boolean.
 */
[[nodiscard]] bool is_url_from_allowed_origins(std::string_view url, const config::store& cfg, const host_probes& probes = {});

// Same as above, with config::global() and the real network lookups.
[[nodiscard]] bool is_url_from_allowed_origins(std::string_view url);

} // namespace wsgate::cors

#endif // WSGATE_CORS_HPP
