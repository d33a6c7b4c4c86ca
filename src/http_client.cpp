#include "http_client.hpp"
#include "logger.hpp"
#include <curl/curl.h>
#include <format>
#include <mutex>

namespace wsgate {

namespace {

    // curl_global_init is not thread-safe on older libcurl, run it exactly once.
    void ensure_curl_initialized() {
        static std::once_flag g_curl_init;
        std::call_once(g_curl_init, [] {
            if (const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK) {
                throw curl_exception(std::format("curl_global_init failed: {}", curl_easy_strerror(rc)));
            }
        });
    }

    size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* body = static_cast<std::string*>(userdata);
        body->append(ptr, size * nmemb);
        return size * nmemb;
    }

    struct slist_deleter {
        void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
    };
    using unique_slist = std::unique_ptr<curl_slist, slist_deleter>;

} // namespace

struct http_client::impl {
    struct easy_deleter {
        void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
    };
    std::unique_ptr<CURL, easy_deleter> handle;
};

http_client::http_client() : m_impl(std::make_unique<impl>()) {
    ensure_curl_initialized();
    m_impl->handle.reset(curl_easy_init());
    if (!m_impl->handle) {
        throw curl_exception("curl_easy_init failed");
    }
}

http_client::~http_client() noexcept = default;
http_client::http_client(http_client&&) noexcept = default;
http_client& http_client::operator=(http_client&&) noexcept = default;

http_response http_client::get(const std::string& url, const header_list& headers, std::chrono::milliseconds timeout) {
    CURL* curl = m_impl->handle.get();
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    return perform(url, headers, timeout);
}

http_response http_client::post(const std::string& url, const std::string& body, const header_list& headers, std::chrono::milliseconds timeout) {
    CURL* curl = m_impl->handle.get();
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));

    if (headers.contains("Content-Type")) {
        return perform(url, headers, timeout);
    }
    header_list with_type = headers;
    with_type.emplace("Content-Type", "application/json");
    return perform(url, with_type, timeout);
}

http_response http_client::perform(const std::string& url, const header_list& headers, std::chrono::milliseconds timeout) {
    CURL* curl = m_impl->handle.get();

    unique_slist header_slist;
    for (const auto& [name, value] : headers) {
        const std::string line = std::format("{}: {}", name, value);
        curl_slist* appended = curl_slist_append(header_slist.get(), line.c_str());
        if (!appended) {
            throw curl_exception("curl_slist_append failed");
        }
        static_cast<void>(header_slist.release());
        header_slist.reset(appended);
    }

    http_response response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_slist.get());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    const CURLcode rc = curl_easy_perform(curl);
    // Drop the handle's pointer to the list before it is freed.
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, static_cast<curl_slist*>(nullptr));
    if (rc != CURLE_OK) {
        throw curl_exception(std::format("request to {} failed: {}", url, curl_easy_strerror(rc)));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    log::debug("HTTP request to {} returned status {} with {} bytes", url, response.status_code, response.body.size());
    return response;
}

} // namespace wsgate
