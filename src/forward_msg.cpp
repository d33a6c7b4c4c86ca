#include "forward_msg.hpp"
#include "json_parser.hpp"
#include <json-c/json.h>
#include <memory>
#include <limits>
#include <format>
#include <new>

namespace wsgate::fwd {

namespace {

    using json_ptr = std::unique_ptr<json_object, decltype(&json_object_put)>;

    json_ptr make_object() {
        auto* obj = json_object_new_object();
        if (!obj) {
            throw std::bad_alloc{};
        }
        return json_ptr(obj, &json_object_put);
    }

    json_ptr make_string(std::string_view value) {
        auto* str = json_object_new_string_len(value.data(), static_cast<int>(value.size()));
        if (!str) {
            throw json::output_error("forward_msg: failed to create json string");
        }
        return json_ptr(str, &json_object_put);
    }

    // The parent owns the child only once json-c accepted it.
    void add(json_object* parent, const char* key, json_ptr child) {
        if (json_object_object_add(parent, key, child.get()) != 0) {
            throw json::output_error(std::format("forward_msg: failed to add key '{}'", key));
        }
        child.release();
    }

    void append(json_object* array, json_ptr child) {
        if (json_object_array_add(array, child.get()) != 0) {
            throw json::output_error("forward_msg: failed to append array item");
        }
        child.release();
    }

    json_ptr element_to_json(const element& e) {
        auto obj = make_object();
        if (const auto* text = std::get_if<text_element>(&e)) {
            auto text_obj = make_object();
            add(text_obj.get(), "body", make_string(text->body));
            add(obj.get(), "text", std::move(text_obj));
        } else if (const auto* ex = std::get_if<exception_element>(&e)) {
            auto ex_obj = make_object();
            add(ex_obj.get(), "type", make_string(ex->type));
            add(ex_obj.get(), "message", make_string(ex->message));

            auto* arr = json_object_new_array();
            if (!arr) {
                throw std::bad_alloc{};
            }
            json_ptr trace(arr, &json_object_put);
            for (const auto& frame : ex->stack_trace) {
                append(trace.get(), make_string(frame));
            }
            add(ex_obj.get(), "stackTrace", std::move(trace));
            add(obj.get(), "exception", std::move(ex_obj));
        }
        return obj;
    }

    element element_from_json(const json::json_parser& obj) {
        if (!obj.is_object()) {
            throw json::parsing_error("forward_msg: newElement is not an object");
        }
        if (obj.has_key("text")) {
            const auto text = obj.at("text");
            return text_element{text.at("body").as_string()};
        }
        if (obj.has_key("exception")) {
            const auto ex = obj.at("exception");
            exception_element result;
            result.type = ex.at("type").as_string();
            result.message = ex.at("message").as_string();
            if (ex.has_key("stackTrace")) {
                const auto trace = ex.at("stackTrace");
                if (!trace.is_array()) {
                    throw json::parsing_error("forward_msg: stackTrace is not an array");
                }
                result.stack_trace.reserve(trace.size());
                for (size_t i = 0; i < trace.size(); ++i) {
                    result.stack_trace.push_back(trace.at(i).as_string());
                }
            }
            return result;
        }
        if (const auto keys = obj.keys(); !keys.empty()) {
            throw json::parsing_error("forward_msg: unknown element kind: " + keys.front());
        }
        return std::monostate{};
    }

} // namespace

std::string serialize(const forward_msg& msg) {
    auto delta_obj = make_object();
    auto* id = json_object_new_int64(msg.delta.id);
    if (!id) {
        throw std::bad_alloc{};
    }
    add(delta_obj.get(), "id", json_ptr(id, &json_object_put));
    add(delta_obj.get(), "newElement", element_to_json(msg.delta.new_element));

    auto root = make_object();
    add(root.get(), "delta", std::move(delta_obj));

    size_t length = 0;
    const char* json_str = json_object_to_json_string_length(root.get(), JSON_C_TO_STRING_PLAIN, &length);
    if (!json_str) {
        throw json::output_error("forward_msg: failed to convert json object to string");
    }
    return std::string(json_str, length);
}

forward_msg parse(std::string_view data) {
    const json::json_parser root(data);
    forward_msg msg;
    if (!root.is_object()) {
        throw json::parsing_error("forward_msg: document is not an object");
    }
    if (!root.has_key("delta")) {
        return msg;
    }

    try {
        const auto delta_obj = root.at("delta");
        const int64_t id = delta_obj.at("id").as_int64();
        if (id < 0 || id > std::numeric_limits<uint32_t>::max()) {
            throw json::parsing_error(std::format("forward_msg: delta id out of range: {}", id));
        }
        msg.delta.id = static_cast<uint32_t>(id);
        if (delta_obj.has_key("newElement")) {
            msg.delta.new_element = element_from_json(delta_obj.at("newElement"));
        }
    } catch (const std::out_of_range& e) {
        throw json::parsing_error(std::format("forward_msg: {}", e.what()));
    }
    return msg;
}

} // namespace wsgate::fwd
