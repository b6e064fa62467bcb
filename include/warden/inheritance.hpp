// ==============================================================================
// warden/inheritance.hpp - Наследование политик
// ==============================================================================
//
// Назначение:
// - Хранилище политик (интерфейс и in-memory реализация)
// - Цепочка global -> org -> repo -> branch
// - Слияние цепочки по режимам replace / extend / override
//
// ==============================================================================

#ifndef WARDEN_INHERITANCE_HPP
#define WARDEN_INHERITANCE_HPP

#include <warden/policy.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace warden::policy {

// ----------------------------------------------------------------------------
// Иерархия областей
// ----------------------------------------------------------------------------

/// От общей к частной
constexpr PolicyScope SCOPE_HIERARCHY[] = {PolicyScope::Global, PolicyScope::Org,
                                           PolicyScope::Repo, PolicyScope::Branch};

/// Специфичность области: global = 0 .. branch = 3
int scope_priority(PolicyScope scope);

/// a строго специфичнее b
bool is_scope_more_specific(PolicyScope a, PolicyScope b);

/// Родительская область (nullopt для global)
std::optional<PolicyScope> parent_scope(PolicyScope scope);

struct InheritanceCheck {
    bool valid = true;
    std::string error;
};

/// Область дочерней политики должна быть специфичнее родительской
InheritanceCheck validate_inheritance_chain(const PolicyDocument& child,
                                            const PolicyDocument& parent);

// ----------------------------------------------------------------------------
// Хранилище
// ----------------------------------------------------------------------------

class PolicyStore {
public:
    virtual ~PolicyStore() = default;

    /// Политика по идентификатору "scope:target:name"
    virtual std::optional<PolicyDocument> find_policy(const std::string& policy_id) const = 0;

    /// Политики области для цели (target "default" для global)
    virtual std::vector<PolicyDocument> get_policies(PolicyScope scope,
                                                     const std::string& target) const = 0;

    /// Все политики (или только заданной области)
    virtual std::vector<PolicyDocument> list_policies(
        std::optional<PolicyScope> scope = std::nullopt) const = 0;

    /// Цепочка от общей к частной; пустые аргументы пропускают уровень
    virtual std::vector<PolicyDocument> get_policy_chain(const std::string& org,
                                                         const std::string& repo,
                                                         const std::string& branch) const;
};

/// Идентификатор политики в хранилище: "scope:target:name"
std::string store_key(const PolicyDocument& doc);

class InMemoryPolicyStore : public PolicyStore {
public:
    /// Добавить или заменить политику; возвращает её ключ
    std::string put(const PolicyDocument& doc);

    /// @return false если политики нет
    bool remove(const std::string& policy_id);

    void clear() { policies_.clear(); }
    std::size_t size() const { return policies_.size(); }

    std::optional<PolicyDocument> find_policy(const std::string& policy_id) const override;
    std::vector<PolicyDocument> get_policies(PolicyScope scope,
                                             const std::string& target) const override;
    std::vector<PolicyDocument> list_policies(
        std::optional<PolicyScope> scope = std::nullopt) const override;

private:
    // Порядок вставки сохраняется для детерминированных цепочек
    std::vector<std::pair<std::string, PolicyDocument>> policies_;
};

// ----------------------------------------------------------------------------
// Разрешение
// ----------------------------------------------------------------------------

struct ResolutionMetadata {
    std::size_t chain_depth = 0;
    std::size_t total_rules_before_merge = 0;
    std::size_t total_rules_after_merge = 0;
};

struct ResolvedPolicy {
    PolicyDocument document;
    std::vector<PolicyDocument> chain;           // от родителя к потомку
    std::map<std::string, std::string> rule_origins;  // rule id -> имя политики
    ResolutionMetadata metadata;
};

class InheritanceResolver {
public:
    explicit InheritanceResolver(const PolicyStore& store) : store_(store) {}

    /// Слить готовую цепочку (от родителя к потомку)
    ResolvedPolicy resolve(const std::vector<PolicyDocument>& chain) const;

    /// Слить цепочку хранилища для org/repo/branch
    ResolvedPolicy resolve_for(const std::string& org, const std::string& repo,
                               const std::string& branch) const;

    /// Слить политику с её предками по parentPolicyId
    /// @return nullopt если политика не найдена
    /// @throw ValidationError при циклической ссылке
    std::optional<ResolvedPolicy> resolve_policy(const std::string& policy_id) const;

private:
    const PolicyStore& store_;
};

}  // namespace warden::policy

#endif  // WARDEN_INHERITANCE_HPP
