#include "cors.hpp"
#include "logger.hpp"
#include <utility>

namespace wsgate::cors {

namespace {

    // Hostname of a URL-valued option, only if the user set it explicitly.
    origin_supplier manually_set_host(const config::store& cfg, std::string key) {
        return [&cfg, key = std::move(key)]() -> std::optional<std::string> {
            if (!cfg.is_manually_set(key)) {
                return std::nullopt;
            }
            const auto value = cfg.find_option(key);
            if (!value) {
                return std::nullopt;
            }
            return net::get_hostname(*value);
        };
    }

    std::optional<std::string> evaluate(const origin_supplier& supplier) {
        if (!supplier) {
            return std::nullopt;
        }
        try {
            return supplier();
        } catch (const std::exception& e) {
            log::warn("Skipping allowed origin candidate that failed: {}", e.what());
            return std::nullopt;
        }
    }

} // namespace

origin_supplier literal(std::string host) {
    return [host = std::move(host)]() -> std::optional<std::string> { return host; };
}

std::vector<origin_supplier> allowed_origin_candidates(const config::store& cfg, const host_probes& probes) {
    return {
        // Check localhost first.
        literal("localhost"),
        literal("0.0.0.0"),
        literal("127.0.0.1"),
        // Avoid network round trips if the user told us where the server lives.
        manually_set_host(cfg, "browser.serverAddress"),
        manually_set_host(cfg, "s3.url"),
        // Then the options that open sockets or make HTTP requests.
        probes.internal_ip,
        probes.external_ip,
        [&cfg]() { return cfg.find_option("s3.bucket"); }
    };
}

bool is_url_from_allowed_origins(std::string_view url, const config::store& cfg, const host_probes& probes) {
    if (!cfg.get_option<bool>("server.enableCORS")) {
        // Allow everything when CORS is disabled.
        return true;
    }

    const auto hostname = net::get_hostname(url);
    if (!hostname) {
        log::debug("No hostname in origin '{}', rejecting.", url);
        return false;
    }

    for (const auto& candidate : allowed_origin_candidates(cfg, probes)) {
        const auto allowed = evaluate(candidate);
        if (!allowed || allowed->empty()) {
            continue;
        }
        if (*hostname == *allowed) {
            log::debug("Origin '{}' allowed, matches '{}'.", url, *allowed);
            return true;
        }
    }

    log::debug("Origin '{}' is not in the allowed origins.", url);
    return false;
}

bool is_url_from_allowed_origins(std::string_view url) {
    return is_url_from_allowed_origins(url, config::global(), host_probes{});
}

} // namespace wsgate::cors
