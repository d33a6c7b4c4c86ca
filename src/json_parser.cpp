#include "json_parser.hpp"
#include <format>
#include <memory>
#include <utility>

namespace wsgate::json {

parsing_error::parsing_error(const std::string& msg)
    : std::runtime_error(msg) {}

output_error::output_error(const std::string& msg)
    : std::runtime_error(msg) {}

json_parser::json_parser(std::string_view json_str) {
    auto* tok = json_tokener_new();
    if (!tok) {
        throw std::bad_alloc{};
    }

    // json-c wants a null-terminated buffer even when a length is provided.
    const std::string temp_json_for_c_api(json_str);

    m_obj = json_tokener_parse_ex(
        tok,
        temp_json_for_c_api.c_str(),
        static_cast<int>(temp_json_for_c_api.size())
    );

    if (json_tokener_get_error(tok) != json_tokener_success || m_obj == nullptr) {
        std::string err = json_tokener_error_desc(json_tokener_get_error(tok));
        json_tokener_free(tok);
        if (m_obj) {
            json_object_put(m_obj);
            m_obj = nullptr;
        }
        // Payloads can be huge, only the head goes into the message.
        throw parsing_error(std::format("JSON parsing error: {} payload: {}", err, json_str.substr(0, 256)));
    }

    json_tokener_free(tok);
}

json_parser::~json_parser() noexcept {
    if (m_obj) {
        json_object_put(m_obj);
    }
}

json_parser::json_parser(const json_parser& other)
    : m_obj(json_object_get(other.m_obj)) {}

json_parser& json_parser::operator=(const json_parser& other) {
    if (this != &other) {
        json_object_put(m_obj);
        m_obj = json_object_get(other.m_obj);
    }
    return *this;
}

json_parser::json_parser(json_parser&& other) noexcept
    : m_obj(other.m_obj) {
    other.m_obj = nullptr;
}

json_parser& json_parser::operator=(json_parser&& other) noexcept {
    if (this != &other) {
        json_object_put(m_obj);
        m_obj = other.m_obj;
        other.m_obj = nullptr;
    }
    return *this;
}

bool json_parser::has_key(std::string_view key) const noexcept {
    if (!is_object()) {
        return false;
    }
    return json_object_object_get_ex(m_obj, std::string(key).c_str(), nullptr);
}

json_parser json_parser::at(std::string_view key) const {
    if (!is_object()) {
        throw parsing_error("json value is not an object");
    }
    json_object* child = nullptr;
    if (!json_object_object_get_ex(m_obj, std::string(key).c_str(), &child) || !child) {
        throw std::out_of_range("json object missing key: " + std::string(key));
    }
    return json_parser{json_object_get(child)};
}

json_parser json_parser::at(size_t index) const {
    if (!is_array()) {
        throw parsing_error("json value is not an array");
    }
    auto* item = json_object_array_get_idx(m_obj, index);
    if (!item) {
        throw std::out_of_range("json array index out of range");
    }
    return json_parser{json_object_get(item)};
}

size_t json_parser::size() const noexcept {
    if (is_array()) {
        return json_object_array_length(m_obj);
    }
    return 0;
}

std::string json_parser::to_string() const {
    if (!m_obj) {
        return "";
    }
    return json_object_to_json_string_ext(m_obj, JSON_C_TO_STRING_PLAIN);
}

bool json_parser::is_object() const noexcept {
    return m_obj && json_object_is_type(m_obj, json_type_object);
}

bool json_parser::is_array() const noexcept {
    return m_obj && json_object_is_type(m_obj, json_type_array);
}

bool json_parser::is_string() const noexcept {
    return m_obj && json_object_is_type(m_obj, json_type_string);
}

std::vector<std::string> json_parser::keys() const {
    std::vector<std::string> result;
    if (!is_object()) {
        return result;
    }
    json_object_object_foreach(m_obj, key, val) {
        (void)val;
        result.emplace_back(key);
    }
    return result;
}

std::string json_parser::as_string() const {
    if (!is_string()) {
        throw parsing_error("json value is not a string");
    }
    return std::string(json_object_get_string(m_obj), static_cast<size_t>(json_object_get_string_len(m_obj)));
}

int64_t json_parser::as_int64() const {
    if (!m_obj || !json_object_is_type(m_obj, json_type_int)) {
        throw parsing_error("json value is not an integer");
    }
    return json_object_get_int64(m_obj);
}

json_parser::json_parser(struct json_object* obj) noexcept : m_obj(obj) {}

} // namespace wsgate::json
