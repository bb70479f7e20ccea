#include "jsonschema_conformance/json_schema_bridge.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <regex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

std::vector<std::string> declared_types(const json& schema) {
    std::vector<std::string> types;
    const auto it = schema.find("type");
    if (it == schema.end()) {
        return types;
    }
    if (it->is_string()) {
        types.push_back(it->get<std::string>());
    } else if (it->is_array()) {
        for (const auto& t : *it) {
            if (t.is_string()) {
                types.push_back(t.get<std::string>());
            }
        }
    }
    return types;
}

bool declares(const std::vector<std::string>& types, const char* name) {
    for (const auto& t : types) {
        if (t == name) return true;
    }
    return false;
}

bool is_integral(const json& value) {
    if (value.is_number_integer()) return true;
    if (!value.is_number_float()) return false;
    const double d = value.get<double>();
    return std::isfinite(d) && std::floor(d) == d;
}

bool type_allowed(const json& instance, const std::vector<std::string>& types) {
    if (types.empty()) return true;
    for (const auto& t : types) {
        if (t == "null" && instance.is_null()) return true;
        if (t == "boolean" && instance.is_boolean()) return true;
        if (t == "string" && instance.is_string()) return true;
        if (t == "object" && instance.is_object()) return true;
        if (t == "array" && instance.is_array()) return true;
        if (t == "number" && instance.is_number()) return true;
        if (t == "integer" && is_integral(instance)) return true;
    }
    return false;
}

bool parse_integer(const std::string& text, json& out) {
    if (text.empty()) return false;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (*first == '-') {
        std::int64_t v = 0;
        const auto res = std::from_chars(first, last, v);
        if (res.ec != std::errc{} || res.ptr != last) return false;
        out = v;
        return true;
    }
    std::uint64_t v = 0;
    const auto res = std::from_chars(first, last, v);
    if (res.ec != std::errc{} || res.ptr != last) return false;
    out = v;
    return true;
}

bool parse_number(const std::string& text, json& out) {
    if (parse_integer(text, out)) return true;
    if (text.empty() || std::isspace(static_cast<unsigned char>(text.front()))) return false;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(v)) return false;
    out = v;
    return true;
}

json cast_scalar(const json& instance, const std::vector<std::string>& types) {
    if (instance.is_number_float() && declares(types, "integer") && !declares(types, "number")) {
        const double d = instance.get<double>();
        if (std::isfinite(d) && std::floor(d) == d &&
            d >= static_cast<double>(std::numeric_limits<std::int64_t>::min()) &&
            d < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return static_cast<std::int64_t>(d);
        }
    }

    if (type_allowed(instance, types)) {
        return instance;
    }

    if (instance.is_string()) {
        const auto& text = instance.get_ref<const std::string&>();
        json parsed;
        if (declares(types, "integer") && parse_integer(text, parsed)) return parsed;
        if (declares(types, "number") && parse_number(text, parsed)) return parsed;
        if (declares(types, "boolean")) {
            if (text == "true") return true;
            if (text == "false") return false;
        }
        return instance;
    }

    if (types.size() == 1 && types.front() == "string") {
        if (instance.is_number()) return instance.dump();
        if (instance.is_boolean()) return instance.get<bool>() ? "true" : "false";
    }
    return instance;
}

bool pattern_matches(const std::string& pattern, const std::string& key) {
    return std::regex_search(key, std::regex(pattern, std::regex::ECMAScript));
}

// Subschemas governing one object member, in properties / patternProperties / additionalProperties order.
std::vector<const json*> member_schemas(const json& schema, const std::string& key) {
    std::vector<const json*> out;
    if (const auto props = schema.find("properties"); props != schema.end() && props->is_object()) {
        if (const auto it = props->find(key); it != props->end()) {
            out.push_back(&*it);
        }
    }
    if (const auto pats = schema.find("patternProperties"); pats != schema.end() && pats->is_object()) {
        for (auto it = pats->begin(); it != pats->end(); ++it) {
            if (pattern_matches(it.key(), key)) {
                out.push_back(&it.value());
            }
        }
    }
    if (out.empty()) {
        if (const auto add = schema.find("additionalProperties"); add != schema.end() && add->is_object()) {
            out.push_back(&*add);
        }
    }
    return out;
}

const json* item_schema(const json& schema, std::size_t index) {
    const auto items = schema.find("items");
    if (items == schema.end()) return nullptr;
    if (items->is_object()) return &*items;
    if (items->is_array()) {
        if (index < items->size()) return &(*items)[index];
        const auto add = schema.find("additionalItems");
        if (add != schema.end() && add->is_object()) return &*add;
    }
    return nullptr;
}

json strip(const json& schema, json instance);
json cast(const json& schema, json instance);

template <typename Fn>
void descend(const json& schema, json& instance, Fn&& fn) {
    if (instance.is_object()) {
        for (auto it = instance.begin(); it != instance.end(); ++it) {
            for (const json* sub : member_schemas(schema, it.key())) {
                it.value() = fn(*sub, std::move(it.value()));
            }
        }
    } else if (instance.is_array()) {
        for (std::size_t i = 0; i < instance.size(); ++i) {
            if (const json* sub = item_schema(schema, i)) {
                instance[i] = fn(*sub, std::move(instance[i]));
            }
        }
    }
}

json strip(const json& schema, json instance) {
    if (!schema.is_object()) {
        return instance;
    }

    if (instance.is_object()) {
        const auto add = schema.find("additionalProperties");
        if (add != schema.end() && add->is_boolean() && !add->get<bool>()) {
            std::vector<std::string> extra;
            for (auto it = instance.begin(); it != instance.end(); ++it) {
                if (member_schemas(schema, it.key()).empty()) {
                    extra.push_back(it.key());
                }
            }
            for (const auto& key : extra) {
                instance.erase(key);
            }
        }
    } else if (instance.is_array()) {
        const auto items = schema.find("items");
        const auto add = schema.find("additionalItems");
        if (items != schema.end() && items->is_array() && add != schema.end() &&
            add->is_boolean() && !add->get<bool>() && instance.size() > items->size()) {
            json kept = json::array();
            for (std::size_t i = 0; i < items->size(); ++i) {
                kept.push_back(std::move(instance[i]));
            }
            instance = std::move(kept);
        }
    }

    descend(schema, instance, [](const json& sub, json value) { return strip(sub, std::move(value)); });
    return instance;
}

json cast(const json& schema, json instance) {
    if (!schema.is_object()) {
        return instance;
    }
    instance = cast_scalar(instance, declared_types(schema));
    descend(schema, instance, [](const json& sub, json value) { return cast(sub, std::move(value)); });
    return instance;
}

}  // namespace

namespace jsonschema::conformance::json_schema_bridge
{

nlohmann::json apply_modes(const nlohmann::json& schema, nlohmann::json instance, ModeFlag modes)
{
    if (has_flag(modes, ModeFlag::RemoveAdditionals)) {
        instance = strip(schema, std::move(instance));
    }
    if (has_flag(modes, ModeFlag::Cast)) {
        instance = cast(schema, std::move(instance));
    }
    return instance;
}

} // namespace jsonschema::conformance::json_schema_bridge
