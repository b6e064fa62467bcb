// ==============================================================================
// warden/value.hpp - Динамическое значение (Value)
// ==============================================================================
//
// Назначение:
// - Представление произвольных JSON/YAML данных (атрибуты запроса, details
//   аудита, переменные политик)
// - Конверсия из/в RapidJSON, конверсия из yaml-cpp
// - Каноническая JSON сериализация (сортировка ключей) для хеширования
// - Явная типизация чисел: UInt64 → Int64 → Double
//
// ==============================================================================

#ifndef WARDEN_VALUE_HPP
#define WARDEN_VALUE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

namespace YAML {
class Node;
}  // namespace YAML

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace warden {

class Value;

/// Тип для массива значений
using ValueArray = std::vector<Value>;

/// Тип для объекта (map string -> Value)
using ValueObject = std::unordered_map<std::string, Value>;

/// Динамическое значение (JSON-модель данных)
class Value {
public:
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using UInt64 = std::uint64_t;
    using Double = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

private:
    std::variant<Null, Bool, Int64, UInt64, Double, String, std::shared_ptr<Array>,
                 std::shared_ptr<Object>>
        data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    Value() : data_(Null{}) {}
    explicit Value(bool v) : data_(v) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(std::uint64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    // -------------------------------------------------------------------------
    // Фабричные методы
    // -------------------------------------------------------------------------

    static Value make_int(std::int64_t v) { return Value(v); }
    static Value make_uint(std::uint64_t v) { return Value(v); }
    static Value make_array() { return Value(Array{}); }
    static Value make_object() { return Value(Object{}); }

    /// Массив строк
    static Value make_string_array(const std::vector<std::string>& items);

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_uint() const { return std::holds_alternative<UInt64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }

    /// Проверка на числовой тип (int, uint или double)
    bool is_number() const { return is_int() || is_uint() || is_double(); }

    // -------------------------------------------------------------------------
    // Доступ к значению
    // -------------------------------------------------------------------------

    /// Получить bool значение (undefined behavior если не is_bool())
    Bool as_bool() const { return std::get<Bool>(data_); }

    /// Получить int64 значение (undefined behavior если не is_int())
    Int64 as_int() const { return std::get<Int64>(data_); }

    /// Получить uint64 значение (undefined behavior если не is_uint())
    UInt64 as_uint() const { return std::get<UInt64>(data_); }

    /// Получить double значение (undefined behavior если не is_double())
    Double as_double() const { return std::get<Double>(data_); }

    /// Получить string значение (undefined behavior если не is_string())
    const String& as_string() const { return std::get<String>(data_); }

    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }

    /// Числовое значение как double (0.0 если не число)
    double to_double() const;

    /// Истинность значения: null/false/0/"" - ложь, остальное - истина
    bool is_truthy() const;

    // -------------------------------------------------------------------------
    // Безопасный доступ (nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с массивом
    // -------------------------------------------------------------------------

    /// Добавить элемент в массив (только если is_array())
    void push_back(Value v) {
        if (auto* arr = get_array_mut()) {
            arr->push_back(std::move(v));
        }
    }

    std::size_t array_size() const {
        if (const auto* arr = get_array()) {
            return arr->size();
        }
        return 0;
    }

    // -------------------------------------------------------------------------
    // Операции с объектом
    // -------------------------------------------------------------------------

    /// Установить поле объекта (только если is_object())
    void set(const std::string& key, Value v) {
        if (auto* obj = get_object_mut()) {
            (*obj)[key] = std::move(v);
        }
    }

    /// Получить поле объекта по ключу (nullptr если не найдено или не объект)
    const Value* get(const std::string& key) const {
        if (const auto* obj = get_object()) {
            auto it = obj->find(key);
            if (it != obj->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    bool has(const std::string& key) const {
        if (const auto* obj = get_object()) {
            return obj->find(key) != obj->end();
        }
        return false;
    }

    // -------------------------------------------------------------------------
    // Сравнение
    // -------------------------------------------------------------------------

    /// Структурное равенство; числа сравниваются по значению (1 == 1u == 1.0)
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    // -------------------------------------------------------------------------
    // Конверсия RapidJSON
    // -------------------------------------------------------------------------

    /// Конвертировать из RapidJSON Value (порядок чисел: UInt → Int → Double)
    static Value from_rapidjson(const rapidjson::Value& json);

    /// Конвертировать в RapidJSON Value
    /// @throw std::runtime_error для нечисловых double (NaN, Inf)
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    /// Создать новый RapidJSON Document из этого Value
    rapidjson::Document to_rapidjson_document() const;

private:
    Array* get_array_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    Object* get_object_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }
};

// ----------------------------------------------------------------------------
// Сериализация
// ----------------------------------------------------------------------------

/// Каноническая JSON строка: ключи объектов отсортированы, без пробелов.
/// Одинаковые значения всегда дают одинаковые байты.
std::string to_canonical_json(const Value& value);

/// Компактная JSON строка (порядок ключей не гарантирован)
std::string to_json(const Value& value);

/// Разобрать JSON строку
/// @throw std::runtime_error при ошибке парсинга
Value parse_json(const std::string& text);

/// Конвертировать YAML узел в Value.
/// Скаляры без кавычек распознаются как null/bool/int/double, остальные - строки.
Value from_yaml(const YAML::Node& node);

}  // namespace warden

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // WARDEN_VALUE_HPP
