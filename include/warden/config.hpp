// ==============================================================================
// warden/config.hpp - Конфигурация (YAML)
// ==============================================================================
//
// Назначение:
// - Файл конфигурации --config: секции engine, audit, evidence
// - Неизвестные ключи игнорируются, некорректные значения - ошибка загрузки
//
// Пример:
//   engine:   { stop_on_first_match: true, default_effect: deny }
//   audit:    { algorithm: sha256, max_append_retries: 100 }
//   evidence: { max_per_source: 100, verify_chain: true }
//
// ==============================================================================

#ifndef WARDEN_CONFIG_HPP
#define WARDEN_CONFIG_HPP

#include <warden/audit_log.hpp>
#include <warden/engine.hpp>
#include <warden/evidence.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace YAML {
class Node;
}  // namespace YAML

namespace warden::config {

struct Config {
    policy::EngineConfig engine;
    audit::AuditLogConfig audit;
    evidence::CollectorConfig evidence;
};

/// Разобрать конфигурацию из YAML узла (пустой узел - значения по умолчанию)
/// @throw ValidationError со списком некорректных значений
Config parse_config(const YAML::Node& root);

/// Разобрать конфигурацию из текста YAML
Config parse_config_string(const std::string& text);

struct Error {
    std::string message;
    std::string path;
    std::vector<std::string> issues;

    std::string format() const;
};

struct LoadResult {
    bool ok = false;
    Config config;
    Error error;

    explicit operator bool() const { return ok; }
};

LoadResult load(const std::filesystem::path& path);

}  // namespace warden::config

#endif  // WARDEN_CONFIG_HPP
