#ifndef WSGATE_HTTP_CLIENT_HPP
#define WSGATE_HTTP_CLIENT_HPP

#include <string>
#include <map>
#include <memory>
#include <chrono>
#include <stdexcept>
#include <functional> // For std::less

namespace wsgate {

/**
 * @brief Thrown when libcurl fails at the transport level (DNS, connect, timeout...).
 *
 * HTTP error statuses are not exceptions, they are reported in http_response::status_code.
 */
class curl_exception : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct http_response {
    long status_code{0};
    std::string body;
};

using header_list = std::map<std::string, std::string, std::less<>>;

/**
 * @class http_client
 * @brief A blocking HTTP client over a reusable libcurl easy handle.
 *
 * Not thread-safe; keep one instance per thread (e.g. `thread_local`) so the
 * connection can be reused.
 */
class http_client {
public:
    http_client();
    ~http_client() noexcept;

    http_client(const http_client&) = delete;
    http_client& operator=(const http_client&) = delete;
    http_client(http_client&&) noexcept;
    http_client& operator=(http_client&&) noexcept;

    [[nodiscard]] http_response get(const std::string& url,
                                    const header_list& headers = {},
                                    std::chrono::milliseconds timeout = default_timeout);

    /**
     * @brief Sends @p body with POST. Content-Type defaults to application/json
     *        unless @p headers sets one.
     */
    [[nodiscard]] http_response post(const std::string& url,
                                     const std::string& body,
                                     const header_list& headers = {},
                                     std::chrono::milliseconds timeout = default_timeout);

    static inline constexpr std::chrono::milliseconds default_timeout{10'000};

private:
    struct impl;
    [[nodiscard]] http_response perform(const std::string& url, const header_list& headers, std::chrono::milliseconds timeout);

    std::unique_ptr<impl> m_impl;
};

} // namespace wsgate

#endif // WSGATE_HTTP_CLIENT_HPP
