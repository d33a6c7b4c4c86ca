#ifndef WSGATE_UTIL_HPP
#define WSGATE_UTIL_HPP

#include <string>
#include <string_view>
#include <system_error>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <typeinfo>

#include <cxxabi.h> // For abi::__cxa_demangle

namespace wsgate::util {

struct string_hash {
    using is_transparent = void;
    [[nodiscard]] size_t operator()(const char* txt) const {
        return std::hash<std::string_view>{}(txt);
    }
    [[nodiscard]] size_t operator()(std::string_view txt) const {
        return std::hash<std::string_view>{}(txt);
    }
    [[nodiscard]] size_t operator()(const std::string& txt) const {
        return std::hash<std::string>{}(txt);
    }
};

struct string_equal {
    using is_transparent = void;
    [[nodiscard]] constexpr bool operator()(std::string_view lhs, std::string_view rhs) const {
        return lhs == rhs;
    }
};

/**
 * @brief Converts a standard C errno number to a C++ string message.
 * @param err_num The error number (e.g., from errno).
 * @return The error message as a string.
 */
[[nodiscard]] inline std::string str_error_cpp(int err_num) noexcept {
    try {
        std::error_code ec(err_num, std::system_category());
        return ec.message();
    } catch (const std::exception&) {
        return "error_message_lookup_failed";
    }
}

[[nodiscard]] inline std::string to_lower(std::string_view value) {
    std::string result(value);
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

[[nodiscard]] constexpr std::string_view trim(std::string_view value) noexcept {
    constexpr std::string_view whitespace{" \t\r\n"};
    const auto first = value.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

/**
 * @brief Returns the human readable name of a type, e.g. "std::runtime_error".
 *
 * Falls back to the mangled name if the ABI demangler fails.
 */
[[nodiscard]] inline std::string demangle(const std::type_info& type) noexcept {
    try {
        int status = 0;
        std::unique_ptr<char, decltype(&std::free)> name(
            abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), &std::free);
        if (status == 0 && name) {
            return std::string{name.get()};
        }
        return std::string{type.name()};
    } catch (const std::bad_alloc&) {
        return "unknown_type";
    }
}

} // namespace wsgate::util

#endif // WSGATE_UTIL_HPP
