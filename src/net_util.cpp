#include "net_util.hpp"
#include "http_client.hpp"
#include "logger.hpp"
#include "util.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <mutex>
#include <new>
#include <cerrno>
#include <cstdint>

// Includes for POSIX/networking functions
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace wsgate::net {

namespace {

    constexpr std::string_view internal_ip_probe_address = "8.8.8.8";
    constexpr uint16_t internal_ip_probe_port = 80;
    constexpr std::chrono::seconds external_ip_timeout{5};

    // Closes a socket descriptor when leaving scope.
    class socket_guard {
    public:
        explicit socket_guard(int fd) noexcept : m_fd(fd) {}
        ~socket_guard() {
            if (m_fd != -1) {
                close(m_fd);
            }
        }
        socket_guard(const socket_guard&) = delete;
        socket_guard& operator=(const socket_guard&) = delete;

        [[nodiscard]] int get() const noexcept { return m_fd; }

    private:
        int m_fd;
    };

    struct ip_cache {
        std::mutex mutex;
        std::optional<std::string> value;
    };

    ip_cache& internal_ip_cache() {
        static ip_cache g_cache;
        return g_cache;
    }

    ip_cache& external_ip_cache() {
        static ip_cache g_cache;
        return g_cache;
    }

    std::optional<std::string> query_internal_ip() {
        const socket_guard sock(socket(AF_INET, SOCK_DGRAM, 0));
        if (sock.get() == -1) {
            log::warn("Internal IP lookup failed, socket(): {}", util::str_error_cpp(errno));
            return std::nullopt;
        }

        sockaddr_in remote{};
        remote.sin_family = AF_INET;
        remote.sin_port = htons(internal_ip_probe_port);
        if (inet_pton(AF_INET, internal_ip_probe_address.data(), &remote.sin_addr) != 1) {
            return std::nullopt;
        }

        // Standard idiom of the C sockets API: sockaddr_in passed as sockaddr.
        if (connect(sock.get(), (sockaddr*)&remote, sizeof(remote)) == -1) {
            log::warn("Internal IP lookup failed, connect(): {}", util::str_error_cpp(errno));
            return std::nullopt;
        }

        sockaddr_in local{};
        socklen_t local_len = sizeof(local);
        if (getsockname(sock.get(), (sockaddr*)&local, &local_len) == -1) {
            log::warn("Internal IP lookup failed, getsockname(): {}", util::str_error_cpp(errno));
            return std::nullopt;
        }

        std::array<char, INET_ADDRSTRLEN> buffer{};
        if (!inet_ntop(AF_INET, &local.sin_addr, buffer.data(), buffer.size())) {
            return std::nullopt;
        }
        return std::string{buffer.data()};
    }

    std::optional<std::string> query_external_ip() {
        // One client per thread so the connection can be kept alive.
        static thread_local http_client client{};

        const http_response response = client.get(std::string(external_ip_service_url), {}, external_ip_timeout);
        if (response.status_code != 200) {
            log::warn("Did not auto detect external IP: {} returned status {}", external_ip_service_url, response.status_code);
            return std::nullopt;
        }

        const std::string_view address = util::trim(response.body);
        if (!looks_like_ip(address)) {
            log::warn("Did not auto detect external IP: unexpected answer from {}", external_ip_service_url);
            return std::nullopt;
        }
        return std::string{address};
    }

    // RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
    bool is_scheme(std::string_view text) noexcept {
        if (text.empty() || !std::isalpha(static_cast<unsigned char>(text.front()))) {
            return false;
        }
        return std::ranges::all_of(text, [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
        });
    }

    template <typename Query>
    std::optional<std::string> cached_lookup(ip_cache& cache, Query query) {
        std::scoped_lock lock(cache.mutex);
        if (!cache.value) {
            cache.value = query();
        }
        return cache.value;
    }

} // namespace

std::optional<std::string> get_hostname(std::string_view url) noexcept {
    try {
        std::string_view rest = util::trim(url);

        // A "://" after the first '/', '?' or '#' belongs to the path, query or fragment.
        const auto scheme_end = rest.find("://");
        if (scheme_end != std::string_view::npos && scheme_end < rest.find_first_of("/?#")) {
            if (!is_scheme(rest.substr(0, scheme_end))) {
                log::debug("Rejecting URL with invalid scheme: {}", url);
                return std::nullopt;
            }
            rest.remove_prefix(scheme_end + 3);
        }

        std::string_view authority = rest.substr(0, rest.find_first_of("/?#"));
        if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
            authority.remove_prefix(at + 1);
        }

        std::string_view host;
        if (authority.starts_with('[')) {
            const auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                log::debug("Rejecting URL with unterminated IPv6 literal: {}", url);
                return std::nullopt;
            }
            host = authority.substr(1, bracket_end - 1);
        } else {
            host = authority.substr(0, authority.find(':'));
        }

        if (host.empty()) {
            return std::nullopt;
        }
        return util::to_lower(host);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool looks_like_ip(std::string_view candidate) noexcept {
    if (candidate.empty() || candidate.size() >= INET6_ADDRSTRLEN) {
        return false;
    }
    // inet_pton needs a null-terminated string.
    std::array<char, INET6_ADDRSTRLEN> text{};
    candidate.copy(text.data(), candidate.size());

    std::array<unsigned char, sizeof(in6_addr)> binary{};
    return inet_pton(AF_INET, text.data(), binary.data()) == 1 ||
           inet_pton(AF_INET6, text.data(), binary.data()) == 1;
}

std::optional<std::string> get_internal_ip() noexcept {
    try {
        return cached_lookup(internal_ip_cache(), &query_internal_ip);
    } catch (const std::exception& e) {
        log::warn("Internal IP lookup failed: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::string> get_external_ip() noexcept {
    try {
        return cached_lookup(external_ip_cache(), &query_external_ip);
    } catch (const curl_exception& e) {
        log::warn("Did not auto detect external IP: {}", e.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        log::warn("External IP lookup failed: {}", e.what());
        return std::nullopt;
    }
}

} // namespace wsgate::net
