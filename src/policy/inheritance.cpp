// ==============================================================================
// inheritance.cpp - Наследование политик
// ==============================================================================

#include "warden/inheritance.hpp"

#include "warden/errors.hpp"

#include <algorithm>
#include <set>

namespace warden::policy {

// ----------------------------------------------------------------------------
// Иерархия областей
// ----------------------------------------------------------------------------

int scope_priority(PolicyScope scope) {
    for (int i = 0; i < 4; ++i) {
        if (SCOPE_HIERARCHY[i] == scope) {
            return i;
        }
    }
    return -1;
}

bool is_scope_more_specific(PolicyScope a, PolicyScope b) {
    return scope_priority(a) > scope_priority(b);
}

std::optional<PolicyScope> parent_scope(PolicyScope scope) {
    int index = scope_priority(scope);
    if (index <= 0) {
        return std::nullopt;
    }
    return SCOPE_HIERARCHY[index - 1];
}

InheritanceCheck validate_inheritance_chain(const PolicyDocument& child,
                                            const PolicyDocument& parent) {
    if (!is_scope_more_specific(child.scope, parent.scope)) {
        return {false, "Child scope '" + to_string(child.scope) +
                           "' must be more specific than parent scope '" +
                           to_string(parent.scope) + "'"};
    }
    return {};
}

// ----------------------------------------------------------------------------
// Хранилище
// ----------------------------------------------------------------------------

std::vector<PolicyDocument> PolicyStore::get_policy_chain(const std::string& org,
                                                          const std::string& repo,
                                                          const std::string& branch) const {
    std::vector<PolicyDocument> chain = get_policies(PolicyScope::Global, "default");
    auto append = [&](PolicyScope scope, const std::string& target) {
        if (target.empty()) {
            return;
        }
        auto level = get_policies(scope, target);
        chain.insert(chain.end(), level.begin(), level.end());
    };
    append(PolicyScope::Org, org);
    append(PolicyScope::Repo, repo);
    append(PolicyScope::Branch, branch);
    return chain;
}

std::string store_key(const PolicyDocument& doc) {
    return to_string(doc.scope) + ":" + doc.scope_target.value_or("default") + ":" + doc.name;
}

std::string InMemoryPolicyStore::put(const PolicyDocument& doc) {
    std::string key = store_key(doc);
    for (auto& entry : policies_) {
        if (entry.first == key) {
            entry.second = doc;
            return key;
        }
    }
    policies_.emplace_back(key, doc);
    return key;
}

bool InMemoryPolicyStore::remove(const std::string& policy_id) {
    auto it = std::find_if(policies_.begin(), policies_.end(),
                           [&](const auto& entry) { return entry.first == policy_id; });
    if (it == policies_.end()) {
        return false;
    }
    policies_.erase(it);
    return true;
}

std::optional<PolicyDocument> InMemoryPolicyStore::find_policy(const std::string& policy_id) const {
    for (const auto& entry : policies_) {
        if (entry.first == policy_id) {
            return entry.second;
        }
    }
    return std::nullopt;
}

std::vector<PolicyDocument> InMemoryPolicyStore::get_policies(PolicyScope scope,
                                                              const std::string& target) const {
    std::vector<PolicyDocument> out;
    for (const auto& entry : policies_) {
        const auto& doc = entry.second;
        if (doc.scope == scope && doc.scope_target.value_or("default") == target) {
            out.push_back(doc);
        }
    }
    return out;
}

std::vector<PolicyDocument> InMemoryPolicyStore::list_policies(
    std::optional<PolicyScope> scope) const {
    std::vector<PolicyDocument> out;
    for (const auto& entry : policies_) {
        if (!scope || entry.second.scope == *scope) {
            out.push_back(entry.second);
        }
    }
    return out;
}

// ----------------------------------------------------------------------------
// Слияние
// ----------------------------------------------------------------------------

namespace {

void sort_by_priority(std::vector<PolicyRule>& rules) {
    std::stable_sort(rules.begin(), rules.end(), [](const PolicyRule& a, const PolicyRule& b) {
        return a.priority > b.priority;
    });
}

bool has_rule(const std::vector<PolicyRule>& rules, const std::string& id) {
    return std::any_of(rules.begin(), rules.end(),
                       [&](const PolicyRule& r) { return r.id == id; });
}

/// Слить потомка в накопленный результат; origins обновляются на месте
PolicyDocument merge_two(const PolicyDocument& parent, const PolicyDocument& child,
                         std::map<std::string, std::string>& origins) {
    PolicyDocument merged = child;

    switch (child.inheritance) {
    case InheritanceMode::Replace:
        origins.clear();
        for (const auto& r : child.rules) {
            origins[r.id] = child.name;
        }
        break;

    case InheritanceMode::Extend:
        // Правила родителя не переопределяются
        merged.rules = parent.rules;
        for (const auto& r : child.rules) {
            if (!has_rule(parent.rules, r.id)) {
                merged.rules.push_back(r);
                origins[r.id] = child.name;
            }
        }
        break;

    case InheritanceMode::Override:
        merged.rules = parent.rules;
        for (const auto& r : child.rules) {
            auto it = std::find_if(merged.rules.begin(), merged.rules.end(),
                                   [&](const PolicyRule& m) { return m.id == r.id; });
            if (it != merged.rules.end()) {
                *it = r;
            } else {
                merged.rules.push_back(r);
            }
            origins[r.id] = child.name;
        }
        break;
    }

    sort_by_priority(merged.rules);
    return merged;
}

}  // namespace

ResolvedPolicy InheritanceResolver::resolve(const std::vector<PolicyDocument>& chain) const {
    ResolvedPolicy resolved;
    resolved.chain = chain;
    resolved.metadata.chain_depth = chain.size();

    if (chain.empty()) {
        resolved.document.name = "empty";
        return resolved;
    }

    for (const auto& doc : chain) {
        resolved.metadata.total_rules_before_merge += doc.rules.size();
    }

    PolicyDocument merged = chain.front();
    for (const auto& r : merged.rules) {
        resolved.rule_origins[r.id] = merged.name;
    }
    sort_by_priority(merged.rules);

    for (std::size_t i = 1; i < chain.size(); ++i) {
        merged = merge_two(merged, chain[i], resolved.rule_origins);
    }

    resolved.metadata.total_rules_after_merge = merged.rules.size();
    resolved.document = std::move(merged);
    return resolved;
}

ResolvedPolicy InheritanceResolver::resolve_for(const std::string& org, const std::string& repo,
                                                const std::string& branch) const {
    return resolve(store_.get_policy_chain(org, repo, branch));
}

std::optional<ResolvedPolicy> InheritanceResolver::resolve_policy(
    const std::string& policy_id) const {
    auto policy = store_.find_policy(policy_id);
    if (!policy) {
        return std::nullopt;
    }

    std::vector<PolicyDocument> chain;
    std::set<std::string> visited;
    std::optional<PolicyDocument> current = std::move(policy);
    std::string current_id = policy_id;

    while (current) {
        if (!visited.insert(current_id).second) {
            throw ValidationError("circular parentPolicyId reference at '" + current_id + "'");
        }
        chain.insert(chain.begin(), *current);
        if (!current->parent_policy_id) {
            break;
        }
        current_id = *current->parent_policy_id;
        current = store_.find_policy(current_id);
    }

    return resolve(chain);
}

}  // namespace warden::policy
