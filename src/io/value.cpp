// ==============================================================================
// value.cpp - Реализация Value (динамическое значение)
// ==============================================================================

#include <warden/value.hpp>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace warden {

Value Value::make_string_array(const std::vector<std::string>& items) {
    Array arr;
    arr.reserve(items.size());
    for (const auto& s : items) {
        arr.emplace_back(s);
    }
    return Value(std::move(arr));
}

double Value::to_double() const {
    if (is_int()) {
        return static_cast<double>(as_int());
    }
    if (is_uint()) {
        return static_cast<double>(as_uint());
    }
    if (is_double()) {
        return as_double();
    }
    return 0.0;
}

bool Value::is_truthy() const {
    if (is_null()) {
        return false;
    }
    if (is_bool()) {
        return as_bool();
    }
    if (is_number()) {
        double d = to_double();
        return d != 0.0 && !std::isnan(d);
    }
    if (is_string()) {
        return !as_string().empty();
    }
    // Массивы и объекты всегда истинны
    return true;
}

// ----------------------------------------------------------------------------
// Value::operator==
// ----------------------------------------------------------------------------

bool Value::operator==(const Value& other) const {
    if (is_number() && other.is_number()) {
        // Целые сравниваем без потери точности
        if (is_int() && other.is_int()) {
            return as_int() == other.as_int();
        }
        if (is_uint() && other.is_uint()) {
            return as_uint() == other.as_uint();
        }
        if (is_int() && other.is_uint()) {
            return as_int() >= 0 && static_cast<std::uint64_t>(as_int()) == other.as_uint();
        }
        if (is_uint() && other.is_int()) {
            return other.as_int() >= 0 && static_cast<std::uint64_t>(other.as_int()) == as_uint();
        }
        return to_double() == other.to_double();
    }

    if (data_.index() != other.data_.index()) {
        return false;
    }

    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_array()) {
        const auto& a = as_array();
        const auto& b = other.as_array();
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (a[i] != b[i]) {
                return false;
            }
        }
        return true;
    }
    if (is_object()) {
        const auto& a = as_object();
        const auto& b = other.as_object();
        if (a.size() != b.size()) {
            return false;
        }
        for (const auto& [key, val] : a) {
            auto it = b.find(key);
            if (it == b.end() || it->second != val) {
                return false;
            }
        }
        return true;
    }
    return false;
}

// ----------------------------------------------------------------------------
// Value::from_rapidjson
// ----------------------------------------------------------------------------

Value Value::from_rapidjson(const rapidjson::Value& json) {
    if (json.IsNull()) {
        return Value();
    }

    if (json.IsBool()) {
        return Value(json.GetBool());
    }

    if (json.IsNumber()) {
        // Порядок приоритета UInt → Int → Double
        if (json.IsUint64()) {
            return Value(json.GetUint64());
        }
        if (json.IsInt64()) {
            return Value(json.GetInt64());
        }
        return Value(json.GetDouble());
    }

    if (json.IsString()) {
        return Value(std::string(json.GetString(), json.GetStringLength()));
    }

    if (json.IsArray()) {
        Array arr;
        arr.reserve(json.Size());
        for (rapidjson::SizeType i = 0; i < json.Size(); ++i) {
            arr.push_back(from_rapidjson(json[i]));
        }
        return Value(std::move(arr));
    }

    if (json.IsObject()) {
        Object obj;
        for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it) {
            std::string key(it->name.GetString(), it->name.GetStringLength());
            obj[key] = from_rapidjson(it->value);
        }
        return Value(std::move(obj));
    }

    return Value();
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    if (is_null()) {
        out.SetNull();
        return;
    }

    if (is_bool()) {
        out.SetBool(as_bool());
        return;
    }

    if (is_int()) {
        out.SetInt64(as_int());
        return;
    }

    if (is_uint()) {
        out.SetUint64(as_uint());
        return;
    }

    if (is_double()) {
        double d = as_double();
        if (!std::isfinite(d)) {
            throw std::runtime_error("could not convert float to JSON: non-finite value");
        }
        out.SetDouble(d);
        return;
    }

    if (is_string()) {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return;
    }

    if (is_array()) {
        out.SetArray();
        const auto& arr = as_array();
        out.Reserve(static_cast<rapidjson::SizeType>(arr.size()), alloc);
        for (const auto& elem : arr) {
            rapidjson::Value v;
            elem.to_rapidjson(v, alloc);
            out.PushBack(v, alloc);
        }
        return;
    }

    if (is_object()) {
        out.SetObject();
        const auto& obj = as_object();
        for (const auto& [key, val] : obj) {
            rapidjson::Value k;
            k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
            rapidjson::Value v;
            val.to_rapidjson(v, alloc);
            out.AddMember(k, v, alloc);
        }
        return;
    }

    out.SetNull();
}

rapidjson::Document Value::to_rapidjson_document() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    return doc;
}

// ----------------------------------------------------------------------------
// Каноническая сериализация
// ----------------------------------------------------------------------------

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_canonical(const Value& value, JsonWriter& w) {
    if (value.is_null()) {
        w.Null();
    } else if (value.is_bool()) {
        w.Bool(value.as_bool());
    } else if (value.is_int()) {
        w.Int64(value.as_int());
    } else if (value.is_uint()) {
        w.Uint64(value.as_uint());
    } else if (value.is_double()) {
        double d = value.as_double();
        if (!std::isfinite(d)) {
            throw std::runtime_error("could not convert float to JSON: non-finite value");
        }
        w.Double(d);
    } else if (value.is_string()) {
        const auto& s = value.as_string();
        w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
    } else if (value.is_array()) {
        w.StartArray();
        for (const auto& elem : value.as_array()) {
            write_canonical(elem, w);
        }
        w.EndArray();
    } else if (value.is_object()) {
        const auto& obj = value.as_object();
        std::vector<const std::string*> keys;
        keys.reserve(obj.size());
        for (const auto& kv : obj) {
            keys.push_back(&kv.first);
        }
        std::sort(keys.begin(), keys.end(),
                  [](const std::string* a, const std::string* b) { return *a < *b; });

        w.StartObject();
        for (const auto* key : keys) {
            w.Key(key->c_str(), static_cast<rapidjson::SizeType>(key->size()));
            write_canonical(obj.at(*key), w);
        }
        w.EndObject();
    }
}

}  // namespace

std::string to_canonical_json(const Value& value) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    write_canonical(value, writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string to_json(const Value& value) {
    rapidjson::Document doc = value.to_rapidjson_document();
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

Value parse_json(const std::string& text) {
    rapidjson::Document doc;
    doc.Parse(text.c_str(), text.size());
    if (doc.HasParseError()) {
        throw std::runtime_error(std::string("JSON parse error: ") +
                                 rapidjson::GetParseError_En(doc.GetParseError()) +
                                 " at offset " + std::to_string(doc.GetErrorOffset()));
    }
    return Value::from_rapidjson(doc);
}

// ----------------------------------------------------------------------------
// from_yaml
// ----------------------------------------------------------------------------

namespace {

Value yaml_scalar_to_value(const YAML::Node& node) {
    const std::string& text = node.Scalar();

    // Явно закавыченные скаляры имеют тег "!" - всегда строка
    if (node.Tag() == "!") {
        return Value(text);
    }

    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return Value();
    }
    if (text == "true" || text == "True" || text == "TRUE") {
        return Value(true);
    }
    if (text == "false" || text == "False" || text == "FALSE") {
        return Value(false);
    }

    // Целое число
    {
        const char* begin = text.c_str();
        char* end = nullptr;
        errno = 0;
        if (text[0] == '-') {
            long long v = std::strtoll(begin, &end, 10);
            if (errno == 0 && end != begin && *end == '\0') {
                return Value(static_cast<std::int64_t>(v));
            }
        } else if (text[0] >= '0' && text[0] <= '9') {
            unsigned long long v = std::strtoull(begin, &end, 10);
            if (errno == 0 && end != begin && *end == '\0') {
                return Value(static_cast<std::uint64_t>(v));
            }
        }
    }

    // Число с плавающей точкой
    {
        char c = text[0];
        if ((c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.') {
            const char* begin = text.c_str();
            char* end = nullptr;
            double d = std::strtod(begin, &end);
            if (end != begin && *end == '\0' && std::isfinite(d)) {
                return Value(d);
            }
        }
    }

    return Value(text);
}

}  // namespace

Value from_yaml(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) {
        return Value();
    }

    if (node.IsScalar()) {
        return yaml_scalar_to_value(node);
    }

    if (node.IsSequence()) {
        Value::Array arr;
        arr.reserve(node.size());
        for (const auto& item : node) {
            arr.push_back(from_yaml(item));
        }
        return Value(std::move(arr));
    }

    if (node.IsMap()) {
        Value::Object obj;
        for (const auto& kv : node) {
            obj[kv.first.as<std::string>()] = from_yaml(kv.second);
        }
        return Value(std::move(obj));
    }

    return Value();
}

}  // namespace warden
