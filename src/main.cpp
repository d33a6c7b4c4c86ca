#include "cors.hpp"
#include "config.hpp"
#include "message_guard.hpp"
#include "json_parser.hpp"
#include "logger.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <span>

using namespace wsgate;

namespace {

constexpr std::string_view usage =
    "usage: wsgate-check [--json] <origin-url>...\n"
    "       wsgate-check --message <forward-msg.json>\n"
    "\n"
    "Options are read from WSGATE_* environment variables, e.g.\n"
    "WSGATE_SERVER_ENABLE_CORS, WSGATE_BROWSER_SERVER_ADDRESS, WSGATE_S3_BUCKET.\n";

class usage_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void apply_log_level(const config::store& cfg) {
    const auto level_name = cfg.get_option<std::string>("logger.level");
    if (const auto level = log::parse_level(level_name)) {
        log::set_level(*level);
    } else {
        log::warn("Unknown logger.level '{}', keeping '{}'.", level_name, log::to_string(log::get_level()));
    }
}

// Runs a message file through the size guard and writes the bytes that would be sent.
int check_message(const std::string& path, const config::store& cfg) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw usage_error("cannot open message file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    const log::context_scope context(path);
    const fwd::forward_msg msg = fwd::parse(buffer.str());
    const auto limit = cfg.get_option<size_t>("server.maxMessageSize");
    const std::string bytes = fwd::serialize_forward_msg(msg, limit);

    log::info("Message for delta {} serialized to {} bytes (limit {}).", msg.delta.id, bytes.size(), limit);
    std::cout << bytes << '\n';
    return 0;
}

int check_origins(std::span<const std::string> urls, bool as_json, const config::store& cfg) {
    bool all_allowed = true;
    std::map<std::string, std::string, std::less<>> results;

    for (const auto& url : urls) {
        const log::context_scope context(url);
        const bool allowed = cors::is_url_from_allowed_origins(url, cfg);
        all_allowed = all_allowed && allowed;
        if (as_json) {
            results.insert_or_assign(url, allowed ? "allowed" : "denied");
        } else {
            std::cout << (allowed ? "allowed " : "denied  ") << url << '\n';
        }
    }

    if (as_json) {
        std::cout << json::json_parser::build(results) << '\n';
    }
    return all_allowed ? 0 : 2;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        const std::vector<std::string> args(argv + 1, argv + argc);
        if (args.empty() || args.front() == "--help" || args.front() == "-h") {
            std::cout << usage;
            return args.empty() ? 1 : 0;
        }

        config::store& cfg = config::global();
        apply_log_level(cfg);

        if (args.front() == "--message") {
            if (args.size() != 2) {
                throw usage_error("--message takes exactly one file");
            }
            return check_message(args[1], cfg);
        }

        const bool as_json = args.front() == "--json";
        const std::span<const std::string> urls = as_json ? std::span(args).subspan(1) : std::span(args);
        if (urls.empty()) {
            throw usage_error("no origin URL given");
        }

        log::debug("CORS is {} ({}).",
                   cfg.get_option<bool>("server.enableCORS") ? "enabled" : "disabled",
                   config::to_string(cfg.where_defined("server.enableCORS")));
        return check_origins(urls, as_json, cfg);

    } catch (const usage_error& e) {
        log::error("{}", e.what());
        std::cerr << usage;
        return 1;
    } catch (const config::error& e) {
        log::critical("Invalid configuration: {}", e.what());
        return 1;
    } catch (const json::parsing_error& e) {
        log::critical("Invalid message file: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        log::critical("An unexpected error occurred: {}", e.what());
        return 1;
    }
}
