#include "config.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <cctype>
#include <algorithm>
#include <memory>

namespace wsgate::config {

std::string_view to_string(source s) noexcept {
    switch (s) {
        case source::default_value: return "default";
        case source::environment: return "environment";
        case source::programmatic: return "programmatic";
    }
    return "unknown";
}

const std::vector<option_spec>& default_options() {
    static const std::vector<option_spec> g_options = {
        {"server.enableCORS",
         "Enables support for Cross-Origin Request Sharing. When false every origin is accepted.",
         "true"},
        {"server.maxMessageSize",
         "Largest serialized ForwardMsg, in bytes, sent over the WebSocket connection.",
         "50000000"},
        {"browser.serverAddress",
         "Internet address where users should point their browsers to reach the app.",
         "localhost"},
        {"s3.url",
         "URL root for external view of S3 objects.",
         std::nullopt},
        {"s3.bucket",
         "Name of the S3 bucket used to share apps.",
         std::nullopt},
        {"logger.level",
         "Level of logging: 'debug', 'info', 'warning', 'error' or 'critical'.",
         "info"}
    };
    return g_options;
}

store::store() : store(default_options()) {}

store::store(const std::vector<option_spec>& specs) {
    for (const auto& spec : specs) {
        register_option(spec);
    }
}

void store::register_option(option_spec spec) {
    if (spec.key.empty() || !spec.key.contains('.')) {
        throw error("option key must have the form 'section.name': " + spec.key);
    }
    option opt;
    opt.env_var = env_var_name(spec.key);
    opt.value = spec.default_value;
    opt.spec = std::move(spec);
    const std::string key = opt.spec.key;
    m_options.insert_or_assign(key, std::move(opt));
}

void store::load_environment() {
    for (auto& [key, opt] : m_options) {
        if (const char* raw = std::getenv(opt.env_var.c_str())) {
            opt.value = raw;
            opt.origin = source::environment;
            log::debug("Option '{}' set from environment variable {}", key, opt.env_var);
        }
    }
}

void store::set_option(std::string_view key, std::string value) {
    auto& opt = lookup(key);
    opt.value = std::move(value);
    opt.origin = source::programmatic;
}

std::optional<std::string> store::find_option(std::string_view key) const {
    return lookup(key).value;
}

bool store::is_manually_set(std::string_view key) const {
    return lookup(key).origin != source::default_value;
}

source store::where_defined(std::string_view key) const {
    return lookup(key).origin;
}

std::vector<std::string> store::keys() const {
    std::vector<std::string> result;
    result.reserve(m_options.size());
    for (const auto& [key, opt] : m_options) {
        result.push_back(key);
    }
    std::ranges::sort(result);
    return result;
}

std::string store::env_var_name(std::string_view key) {
    std::string name{"WSGATE_"};
    name.reserve(name.size() + key.size() + 4);
    char prev = '\0';
    for (const char c : key) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '.') {
            name += '_';
        } else if (std::isupper(uc) && (std::islower(static_cast<unsigned char>(prev)) || std::isdigit(static_cast<unsigned char>(prev)))) {
            name += '_';
            name += c;
        } else {
            name += static_cast<char>(std::toupper(uc));
        }
        prev = c;
    }
    return name;
}

const store::option& store::lookup(std::string_view key) const {
    // Transparent lookup, no temporary std::string on the hot path.
    if (auto it = m_options.find(key); it != m_options.end()) {
        return it->second;
    }
    throw error("unknown option: " + std::string(key));
}

store::option& store::lookup(std::string_view key) {
    if (auto it = m_options.find(key); it != m_options.end()) {
        return it->second;
    }
    throw error("unknown option: " + std::string(key));
}

store& global() {
    static std::unique_ptr<store> g_store = []{
        auto s = std::make_unique<store>();
        s->load_environment();
        return s;
    }();
    return *g_store;
}

} // namespace wsgate::config
