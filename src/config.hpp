#ifndef WSGATE_CONFIG_HPP
#define WSGATE_CONFIG_HPP

#include "util.hpp"
#include <string>
#include <stdexcept>
#include <concepts>
#include <string_view>
#include <unordered_map>
#include <optional>
#include <vector>
#include <charconv>

/**
 * @file config.hpp
 * @brief Key/value option store backed by defaults and environment variables.
 *
 * Every option has a dotted key (e.g. "server.enableCORS") and is read from
 * the environment variable WSGATE_<SECTION>_<NAME> (e.g.
 * WSGATE_SERVER_ENABLE_CORS). Values given through the environment or
 * set_option() count as "manually set"; defaults do not.
 */

namespace wsgate::config {

    /**
     * @brief Exception thrown when an option cannot be resolved or converted.
     */
    class error : public std::runtime_error {
    public:
        explicit error(const std::string& message)
            : std::runtime_error("config: " + message) {}
    };

    /**
     * @brief Concept for types supported by store::get_option.
     */
    template <typename T>
    concept Supported = std::same_as<T, std::string> ||
                        std::same_as<T, int> ||
                        std::same_as<T, long> ||
                        std::same_as<T, size_t> ||
                        std::same_as<T, bool>;

    enum class source {
        default_value,
        environment,
        programmatic
    };

    [[nodiscard]] std::string_view to_string(source s) noexcept;

    struct option_spec {
        std::string key;
        std::string description;
        std::optional<std::string> default_value;
    };

    namespace detail {

        template <Supported T>
        T convert(std::string_view value, std::string_view key);

        template <>
        inline std::string convert<std::string>(std::string_view value, std::string_view) {
            return std::string(value);
        }

        template <typename N>
        N convert_number(std::string_view value, std::string_view key, std::string_view type_name) {
            N result{};
            // std::from_chars is strict and does not skip whitespace.
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
            if (ec != std::errc() || ptr != value.data() + value.size()) {
                throw error("invalid " + std::string(type_name) + " for option '" + std::string(key) + "': " + std::string(value));
            }
            return result;
        }

        template <>
        inline int convert<int>(std::string_view value, std::string_view key) {
            return convert_number<int>(value, key, "int");
        }

        template <>
        inline long convert<long>(std::string_view value, std::string_view key) {
            return convert_number<long>(value, key, "long");
        }

        template <>
        inline size_t convert<size_t>(std::string_view value, std::string_view key) {
            return convert_number<size_t>(value, key, "size_t");
        }

        template <>
        inline bool convert<bool>(std::string_view value, std::string_view key) {
            const std::string lowered = util::to_lower(value);
            if (lowered == "1" || lowered == "true") return true;
            if (lowered == "0" || lowered == "false") return false;
            throw error("invalid bool for option '" + std::string(key) + "' (expected true/false or 1/0): " + std::string(value));
        }

    } // namespace detail

    class store {
    public:
        // Registers default_options(); the environment is not read.
        store();
        explicit store(const std::vector<option_spec>& specs);

        void register_option(option_spec spec);

        /**
         * @brief Reads the environment variable of every registered option.
         *
         * Options whose variable is present become manually set.
         */
        void load_environment();

        void set_option(std::string_view key, std::string value);

        /**
         * @brief Returns the raw value of an option.
         * @return std::nullopt when the option has neither a default nor a set value.
         * @throws config::error if the key is not registered.
         */
        [[nodiscard]] std::optional<std::string> find_option(std::string_view key) const;

        /**
         * @brief Gets an option with type conversion.
         * @throws config::error if the key is unknown, has no value, or does not convert.
         */
        template <Supported T>
        [[nodiscard]] T get_option(std::string_view key) const {
            const auto value = find_option(key);
            if (!value) {
                throw error("option has no value: " + std::string(key));
            }
            return detail::convert<T>(*value, key);
        }

        /**
         * @brief Gets an option with fallback.
         */
        template <Supported T>
        [[nodiscard]] T get_option(std::string_view key, const T& fallback) const {
            try {
                return get_option<T>(key);
            } catch (const config::error&) {
                return fallback;
            }
        }

        [[nodiscard]] bool is_manually_set(std::string_view key) const;
        [[nodiscard]] source where_defined(std::string_view key) const;
        [[nodiscard]] std::vector<std::string> keys() const;

        // "server.enableCORS" -> "WSGATE_SERVER_ENABLE_CORS"
        [[nodiscard]] static std::string env_var_name(std::string_view key);

    private:
        struct option {
            option_spec spec;
            std::string env_var;
            std::optional<std::string> value;
            source origin{source::default_value};
        };

        [[nodiscard]] const option& lookup(std::string_view key) const;
        [[nodiscard]] option& lookup(std::string_view key);

        std::unordered_map<std::string, option, util::string_hash, util::string_equal> m_options;
    };

    [[nodiscard]] const std::vector<option_spec>& default_options();

    /**
     * @brief The process-wide store, loaded from the environment on first use.
     */
    [[nodiscard]] store& global();
}

#endif // WSGATE_CONFIG_HPP
