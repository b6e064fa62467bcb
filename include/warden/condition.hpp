// ==============================================================================
// warden/condition.hpp - Библиотека условий
// ==============================================================================
//
// Назначение:
// - Вычисление условий политики против EvaluationRequest (чистые функции)
// - Компиляция условий и групп в предикаты с заранее собранными regex
// - Glob паттерны для путей, репозиториев и веток
// - Пояснения по каждому условию для dry-run
//
// ==============================================================================

#ifndef WARDEN_CONDITION_HPP
#define WARDEN_CONDITION_HPP

#include <warden/policy.hpp>
#include <warden/request.hpp>
#include <warden/value.hpp>

#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace warden::policy {

// ----------------------------------------------------------------------------
// Glob
// ----------------------------------------------------------------------------

/// Преобразовать glob в якорное регулярное выражение:
/// "**" - любые символы, "*" - любые кроме '/', "?" - один символ,
/// прочие метасимволы regex экранируются
std::string glob_to_regex(std::string_view glob);

/// Полное совпадение строки с glob
bool glob_match(std::string_view glob, const std::string& text);

// ----------------------------------------------------------------------------
// Компиляция
// ----------------------------------------------------------------------------

/// Скомпилированный предикат условия
using Predicate = std::function<bool(const EvaluationRequest&)>;

/// Скомпилировать условие
/// @throw ValidationError при некорректном регулярном выражении
Predicate compile(const Condition& condition);

/// Скомпилировать группу (and/or/not, вложенные группы)
/// @throw ValidationError при некорректном регулярном выражении
Predicate compile(const ConditionGroup& group);

/// Скомпилировать условия правила: condition_logic, иначе неявный AND
/// списка conditions (пустой список - всегда true)
Predicate compile_rule(const PolicyRule& rule);

// ----------------------------------------------------------------------------
// Вычисление
// ----------------------------------------------------------------------------

/// Вычислить условие (компиляция на лету; некорректный regex - false)
bool evaluate(const Condition& condition, const EvaluationRequest& request);

/// Вычислить группу условий
bool evaluate(const ConditionGroup& group, const EvaluationRequest& request);

// ----------------------------------------------------------------------------
// Пояснения
// ----------------------------------------------------------------------------

/// Результат вычисления одного условия с пояснением
struct ConditionEvaluation {
    std::string kind;
    bool matched = false;
    Value actual;
    Value expected;
    std::string explanation;  // "Complexity 8 gte 7 -> MATCH"
};

/// Вычислить условие и объяснить результат
ConditionEvaluation explain(const Condition& condition, const EvaluationRequest& request);

/// Пояснения по всем листьям группы (без короткого замыкания)
/// и итоговый результат группы
bool explain(const ConditionGroup& group, const EvaluationRequest& request,
             std::vector<ConditionEvaluation>& out);

Value to_value(const ConditionEvaluation& evaluation);

/// Число без лишних нулей: 8 -> "8", 0.85 -> "0.85"
std::string format_number(double value);

}  // namespace warden::policy

#endif  // WARDEN_CONDITION_HPP
