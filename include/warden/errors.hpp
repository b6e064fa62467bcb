// ==============================================================================
// warden/errors.hpp - Таксономия ошибок
// ==============================================================================
//
// Назначение:
// - Иерархия исключений ядра (политики, аудит, доказательства)
// - Все ошибки наследуют warden::Error (std::runtime_error)
//
// ==============================================================================

#ifndef WARDEN_ERRORS_HPP
#define WARDEN_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace warden {

/// Базовая ошибка warden
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Некорректный документ политики или входные данные записи аудита.
/// Бросается до любого изменения состояния.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message, std::vector<std::string> issues = {})
        : Error(message), issues_(std::move(issues)) {}

    /// Список отдельных нарушений схемы ("path: message")
    const std::vector<std::string>& issues() const { return issues_; }

private:
    std::vector<std::string> issues_;
};

/// Дублирующийся идентификатор правила
class PolicyConflictError : public Error {
public:
    PolicyConflictError(const std::string& policy_id, const std::string& rule_id)
        : Error("duplicate rule id '" + rule_id + "' in policy '" + policy_id + "'"),
          policy_id_(policy_id),
          rule_id_(rule_id) {}

    const std::string& policy_id() const { return policy_id_; }
    const std::string& rule_id() const { return rule_id_; }

private:
    std::string policy_id_;
    std::string rule_id_;
};

/// Попытка записи в запечатанный журнал
class SealedLogError : public Error {
public:
    explicit SealedLogError(const std::string& tenant_id)
        : Error("audit log is sealed: " + tenant_id), tenant_id_(tenant_id) {}

    const std::string& tenant_id() const { return tenant_id_; }

private:
    std::string tenant_id_;
};

/// Нарушение целостности цепочки хешей
class ChainIntegrityError : public Error {
public:
    ChainIntegrityError(const std::string& message, std::uint64_t first_invalid_sequence)
        : Error(message + " (sequence " + std::to_string(first_invalid_sequence) + ")"),
          first_invalid_sequence_(first_invalid_sequence) {}

    std::uint64_t first_invalid_sequence() const { return first_invalid_sequence_; }

private:
    std::uint64_t first_invalid_sequence_;
};

/// Неизвестная политика, журнал или контроль
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message) : Error(message) {}
};

/// Исчерпаны повторы условной записи (конкурентные писатели)
class AppendConflictError : public Error {
public:
    AppendConflictError(const std::string& tenant_id, int attempts)
        : Error("audit append for tenant '" + tenant_id + "' conflicted after " +
                std::to_string(attempts) + " attempts") {}
};

}  // namespace warden

#endif  // WARDEN_ERRORS_HPP
