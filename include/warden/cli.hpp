// ==============================================================================
// warden/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef WARDEN_CLI_HPP
#define WARDEN_CLI_HPP

#include <warden/audit.hpp>
#include <warden/datetime.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace warden::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;                       // --no-banner
    int verbose = 0;                              // -v (repeatable)
    bool quiet = false;                           // -q
    std::optional<std::filesystem::path> config;  // -c, --config
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// lint - проверка документов политик
struct LintCommand {
    std::vector<std::filesystem::path> paths;  // файлы или директории
};

/// evaluate - оценка запроса
struct EvaluateCommand {
    std::vector<std::filesystem::path> policies;  // -p, --policy
    std::filesystem::path request;                // -r, --request
    bool json = false;                            // -j, --json
    bool inherit = false;                         // --inherit
    std::optional<std::filesystem::path> log;     // --log (запись решения в журнал)
    std::optional<std::string> tenant;            // -t, --tenant (вместе с --log)
};

/// dry-run - все правила с пояснениями
struct DryRunCommand {
    std::vector<std::filesystem::path> policies;  // -p, --policy
    std::filesystem::path request;                // -r, --request
    bool json = false;                            // -j, --json
};

/// audit append - дописать записи из файла
struct AuditAppendCommand {
    std::filesystem::path log;    // --log (JSONL)
    std::string tenant;           // --tenant
    std::filesystem::path entry;  // --entry (JSON / YAML / JSONL)
};

/// audit verify - проверить цепочку
struct AuditVerifyCommand {
    std::filesystem::path log;  // --log
    std::string tenant;         // --tenant
    bool json = false;          // -j, --json
    bool report = false;        // --report (все нарушения, не только первое)
};

/// audit query - поиск записей
struct AuditQueryCommand {
    std::filesystem::path log;                         // --log
    std::string tenant;                                // --tenant
    std::vector<audit::ActionCategory> categories;     // --category
    std::vector<std::string> action_types;             // --type
    std::optional<std::string> search;                 // --search
    bool high_risk_only = false;                       // --high-risk
    std::size_t limit = 100;                           // --limit
    bool verify = false;                               // --verify
    bool json = false;                                 // -j, --json
};

/// audit seal - запечатать журнал
struct AuditSealCommand {
    std::filesystem::path log;  // --log
    std::string tenant;         // --tenant
    std::string reason;         // --reason
};

/// evidence - сбор доказательств для контроля
struct EvidenceCommand {
    std::filesystem::path log;                    // --log
    std::string tenant;                           // --tenant
    std::string control;                          // --control
    std::optional<std::string> category;          // --category
    datetime::TimePoint from;                     // --from
    datetime::TimePoint to;                       // --to
    std::optional<std::filesystem::path> traces;  // --traces
    std::optional<double> min_relevance;          // --min-relevance
    bool json = false;                            // -j, --json
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // опциональная подкоманда для справки
};

/// version - показать версию
struct VersionCommand {};

// ----------------------------------------------------------------------------
// Command - вариант команды
// ----------------------------------------------------------------------------

using Command = std::variant<LintCommand, EvaluateCommand, DryRunCommand, AuditAppendCommand,
                             AuditVerifyCommand, AuditQueryCommand, AuditSealCommand,
                             EvidenceCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API парсинга
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Генерировать текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Генерировать текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Коды завершения
// ----------------------------------------------------------------------------

constexpr int EXIT_OK = 0;
constexpr int EXIT_RUNTIME_ERROR = 1;
constexpr int EXIT_USAGE_ERROR = 2;

/// evaluate: запрос отклонён или ждёт одобрения
constexpr int EXIT_NOT_ALLOWED = 3;

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Версия программы
constexpr const char* VERSION = "0.1.0";

/// Описание программы
constexpr const char* ABOUT = "Policy evaluation, tamper-evident audit logs and compliance evidence";

}  // namespace warden::cli

#endif  // WARDEN_CLI_HPP
