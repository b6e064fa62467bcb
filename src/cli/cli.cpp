// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================

#include "warden/cli.hpp"

#include "warden/platform.hpp"

#include <cstring>
#include <stdexcept>
#include <type_traits>

namespace warden::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

constexpr const char* MAIN_USAGE = "warden [OPTIONS] <COMMAND>";
constexpr const char* LINT_USAGE = "warden lint <PATH>...";
constexpr const char* EVALUATE_USAGE =
    "warden evaluate [OPTIONS] --policy <POLICY>... --request <REQUEST>";
constexpr const char* DRY_RUN_USAGE =
    "warden dry-run [OPTIONS] --policy <POLICY>... --request <REQUEST>";
constexpr const char* AUDIT_USAGE = "warden audit <COMMAND>";
constexpr const char* AUDIT_APPEND_USAGE =
    "warden audit append --log <LOG> --tenant <TENANT> --entry <ENTRY>";
constexpr const char* AUDIT_VERIFY_USAGE = "warden audit verify [OPTIONS] --log <LOG> --tenant <TENANT>";
constexpr const char* AUDIT_QUERY_USAGE = "warden audit query [OPTIONS] --log <LOG> --tenant <TENANT>";
constexpr const char* AUDIT_SEAL_USAGE =
    "warden audit seal --log <LOG> --tenant <TENANT> --reason <REASON>";
constexpr const char* EVIDENCE_USAGE =
    "warden evidence [OPTIONS] --log <LOG> --tenant <TENANT> --control <CONTROL> --from <FROM> "
    "--to <TO>";

/// Сообщение в стиле clap: error + Usage + подсказка
void fail(ParseResult& result, const std::string& error, const char* usage) {
    result.ok = false;
    result.diagnostic.exit_code = EXIT_USAGE_ERROR;
    result.diagnostic.stderr_message = "error: " + error +
                                       "\n\n"
                                       "Usage: " +
                                       usage +
                                       "\n\n"
                                       "For more information, try '--help'.\n";
}

void fail_missing(ParseResult& result, const std::vector<std::string>& missing, const char* usage) {
    std::string message = "the following required arguments were not provided:";
    for (const auto& m : missing) {
        message += "\n  " + m;
    }
    fail(result, message, usage);
}

void fail_unexpected(ParseResult& result, const char* arg, const char* usage) {
    fail(result, std::string("unexpected argument '") + arg + "' found", usage);
}

/// -v, -vv, ... -> уровень подробности
int verbosity_flag(const char* arg) {
    if (arg[0] != '-' || arg[1] != 'v') {
        return 0;
    }
    int level = 0;
    for (const char* p = arg + 1; *p != '\0'; ++p) {
        if (*p != 'v') {
            return 0;
        }
        ++level;
    }
    return level;
}

/// Глобальные флаги допустимы и после подкоманды
bool parse_global_flag(const char* arg, GlobalOptions& global) {
    if (str_eq(arg, "--no-banner")) {
        global.no_banner = true;
        return true;
    }
    if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
        global.quiet = true;
        return true;
    }
    if (int level = verbosity_flag(arg)) {
        global.verbose += level;
        return true;
    }
    return false;
}

/// Значение опции: "--flag value" или "--flag=value"
/// @return nullptr если значение не передано
const char* take_value(int argc, char** argv, int& i, const char* long_flag) {
    const char* arg = argv[i];
    std::size_t len = std::strlen(long_flag);
    if (std::strncmp(arg, long_flag, len) == 0 && arg[len] == '=') {
        return arg + len + 1;
    }
    if (i + 1 >= argc) {
        return nullptr;
    }
    return argv[++i];
}

/// Опция arg совпадает с короткой или длинной формой (в т.ч. "--long=value")
bool is_option(const char* arg, const char* short_flag, const char* long_flag) {
    if (short_flag != nullptr && str_eq(arg, short_flag)) {
        return true;
    }
    std::size_t len = std::strlen(long_flag);
    return std::strncmp(arg, long_flag, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

bool is_help(const char* arg) {
    return str_eq(arg, "-h") || str_eq(arg, "--help");
}

void fail_no_value(ParseResult& result, const char* display, const char* usage) {
    fail(result, std::string("a value is required for '") + display + "' but none was supplied",
         usage);
}

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

void parse_lint(int argc, char** argv, int start, ParseResult& result) {
    LintCommand cmd;
    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"lint"};
            return;
        } else if (parse_global_flag(arg, result.global)) {
            continue;
        } else if (arg[0] != '-') {
            cmd.paths.push_back(platform::path_from_utf8(arg));
        } else {
            return fail_unexpected(result, arg, LINT_USAGE);
        }
    }

    if (cmd.paths.empty()) {
        return fail_missing(result, {"<PATH>..."}, LINT_USAGE);
    }
    result.ok = true;
    result.command = std::move(cmd);
}

/// Опции журнала, общие для подкоманд audit, evidence и evaluate
struct LogTarget {
    std::filesystem::path log;
    std::string tenant;
    bool have_log = false;
    bool have_tenant = false;
};

/// @return true если аргумент разобран; при ошибке заполняет result
bool parse_log_target(int argc, char** argv, int& i, LogTarget& target, const char* usage,
                      ParseResult& result, bool& failed) {
    const char* arg = argv[i];
    if (is_option(arg, nullptr, "--log")) {
        const char* v = take_value(argc, argv, i, "--log");
        if (v == nullptr) {
            fail_no_value(result, "--log <LOG>", usage);
            failed = true;
            return true;
        }
        target.log = platform::path_from_utf8(v);
        target.have_log = true;
        return true;
    }
    if (is_option(arg, "-t", "--tenant")) {
        const char* v = take_value(argc, argv, i, "--tenant");
        if (v == nullptr) {
            fail_no_value(result, "--tenant <TENANT>", usage);
            failed = true;
            return true;
        }
        target.tenant = v;
        target.have_tenant = true;
        return true;
    }
    return false;
}

void missing_log_target(const LogTarget& target, std::vector<std::string>& missing) {
    if (!target.have_log) {
        missing.emplace_back("--log <LOG>");
    }
    if (!target.have_tenant) {
        missing.emplace_back("--tenant <TENANT>");
    }
}

/// Общий разбор evaluate / dry-run
template <typename Cmd>
void parse_evaluation(int argc, char** argv, int start, const char* name, const char* usage,
                      ParseResult& result) {
    Cmd cmd;
    LogTarget target;
    bool have_request = false;
    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{name};
            return;
        } else if (parse_global_flag(arg, result.global)) {
            continue;
        } else if (is_option(arg, "-p", "--policy")) {
            const char* v = take_value(argc, argv, i, "--policy");
            if (v == nullptr) {
                return fail_no_value(result, "--policy <POLICY>", usage);
            }
            cmd.policies.push_back(platform::path_from_utf8(v));
        } else if (is_option(arg, "-r", "--request")) {
            const char* v = take_value(argc, argv, i, "--request");
            if (v == nullptr) {
                return fail_no_value(result, "--request <REQUEST>", usage);
            }
            cmd.request = platform::path_from_utf8(v);
            have_request = true;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else {
            if constexpr (std::is_same_v<Cmd, EvaluateCommand>) {
                if (str_eq(arg, "--inherit")) {
                    cmd.inherit = true;
                    continue;
                }
                bool failed = false;
                if (parse_log_target(argc, argv, i, target, usage, result, failed)) {
                    if (failed) {
                        return;
                    }
                    continue;
                }
            }
            return fail_unexpected(result, arg, usage);
        }
    }

    std::vector<std::string> missing;
    if (cmd.policies.empty()) {
        missing.emplace_back("--policy <POLICY>...");
    }
    if (!have_request) {
        missing.emplace_back("--request <REQUEST>");
    }
    // Запись решения в журнал: --log и --tenant только вместе
    if (target.have_log || target.have_tenant) {
        missing_log_target(target, missing);
    }
    if (!missing.empty()) {
        return fail_missing(result, missing, usage);
    }
    if constexpr (std::is_same_v<Cmd, EvaluateCommand>) {
        if (target.have_log) {
            cmd.log = target.log;
            cmd.tenant = target.tenant;
        }
    }
    result.ok = true;
    result.command = std::move(cmd);
}

void parse_audit_append(int argc, char** argv, int start, ParseResult& result) {
    AuditAppendCommand cmd;
    LogTarget target;
    bool have_entry = false;
    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        bool failed = false;
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"audit"};
            return;
        } else if (parse_global_flag(arg, result.global)) {
            continue;
        } else if (parse_log_target(argc, argv, i, target, AUDIT_APPEND_USAGE, result, failed)) {
            if (failed) {
                return;
            }
        } else if (is_option(arg, "-e", "--entry")) {
            const char* v = take_value(argc, argv, i, "--entry");
            if (v == nullptr) {
                return fail_no_value(result, "--entry <ENTRY>", AUDIT_APPEND_USAGE);
            }
            cmd.entry = platform::path_from_utf8(v);
            have_entry = true;
        } else {
            return fail_unexpected(result, arg, AUDIT_APPEND_USAGE);
        }
    }

    std::vector<std::string> missing;
    missing_log_target(target, missing);
    if (!have_entry) {
        missing.emplace_back("--entry <ENTRY>");
    }
    if (!missing.empty()) {
        return fail_missing(result, missing, AUDIT_APPEND_USAGE);
    }
    cmd.log = target.log;
    cmd.tenant = target.tenant;
    result.ok = true;
    result.command = std::move(cmd);
}

void parse_audit_verify(int argc, char** argv, int start, ParseResult& result) {
    AuditVerifyCommand cmd;
    LogTarget target;
    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        bool failed = false;
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"audit"};
            return;
        } else if (parse_global_flag(arg, result.global)) {
            continue;
        } else if (parse_log_target(argc, argv, i, target, AUDIT_VERIFY_USAGE, result, failed)) {
            if (failed) {
                return;
            }
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (str_eq(arg, "--report")) {
            cmd.report = true;
        } else {
            return fail_unexpected(result, arg, AUDIT_VERIFY_USAGE);
        }
    }

    std::vector<std::string> missing;
    missing_log_target(target, missing);
    if (!missing.empty()) {
        return fail_missing(result, missing, AUDIT_VERIFY_USAGE);
    }
    cmd.log = target.log;
    cmd.tenant = target.tenant;
    result.ok = true;
    result.command = std::move(cmd);
}

void parse_audit_query(int argc, char** argv, int start, ParseResult& result) {
    AuditQueryCommand cmd;
    LogTarget target;
    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        bool failed = false;
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"audit"};
            return;
        } else if (parse_global_flag(arg, result.global)) {
            continue;
        } else if (parse_log_target(argc, argv, i, target, AUDIT_QUERY_USAGE, result, failed)) {
            if (failed) {
                return;
            }
        } else if (is_option(arg, nullptr, "--category")) {
            const char* v = take_value(argc, argv, i, "--category");
            if (v == nullptr) {
                return fail_no_value(result, "--category <CATEGORY>", AUDIT_QUERY_USAGE);
            }
            try {
                cmd.categories.push_back(audit::parse_action_category(v));
            } catch (const std::invalid_argument& e) {
                return fail(result,
                            std::string("invalid value '") + v +
                                "' for '--category <CATEGORY>': " + e.what(),
                            AUDIT_QUERY_USAGE);
            }
        } else if (is_option(arg, nullptr, "--type")) {
            const char* v = take_value(argc, argv, i, "--type");
            if (v == nullptr) {
                return fail_no_value(result, "--type <TYPE>", AUDIT_QUERY_USAGE);
            }
            cmd.action_types.emplace_back(v);
        } else if (is_option(arg, nullptr, "--search")) {
            const char* v = take_value(argc, argv, i, "--search");
            if (v == nullptr) {
                return fail_no_value(result, "--search <TEXT>", AUDIT_QUERY_USAGE);
            }
            cmd.search = v;
        } else if (is_option(arg, "-n", "--limit")) {
            const char* v = take_value(argc, argv, i, "--limit");
            if (v == nullptr) {
                return fail_no_value(result, "--limit <LIMIT>", AUDIT_QUERY_USAGE);
            }
            try {
                std::size_t pos = 0;
                unsigned long limit = std::stoul(v, &pos);
                if (pos != std::strlen(v) || v[0] == '-') {
                    throw std::invalid_argument("not a number");
                }
                cmd.limit = static_cast<std::size_t>(limit);
            } catch (const std::exception&) {
                return fail(result,
                            std::string("invalid value '") + v +
                                "' for '--limit <LIMIT>': invalid digit found in string",
                            AUDIT_QUERY_USAGE);
            }
        } else if (str_eq(arg, "--high-risk")) {
            cmd.high_risk_only = true;
        } else if (str_eq(arg, "--verify")) {
            cmd.verify = true;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else {
            return fail_unexpected(result, arg, AUDIT_QUERY_USAGE);
        }
    }

    std::vector<std::string> missing;
    missing_log_target(target, missing);
    if (!missing.empty()) {
        return fail_missing(result, missing, AUDIT_QUERY_USAGE);
    }
    cmd.log = target.log;
    cmd.tenant = target.tenant;
    result.ok = true;
    result.command = std::move(cmd);
}

void parse_audit_seal(int argc, char** argv, int start, ParseResult& result) {
    AuditSealCommand cmd;
    LogTarget target;
    bool have_reason = false;
    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        bool failed = false;
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"audit"};
            return;
        } else if (parse_global_flag(arg, result.global)) {
            continue;
        } else if (parse_log_target(argc, argv, i, target, AUDIT_SEAL_USAGE, result, failed)) {
            if (failed) {
                return;
            }
        } else if (is_option(arg, nullptr, "--reason")) {
            const char* v = take_value(argc, argv, i, "--reason");
            if (v == nullptr) {
                return fail_no_value(result, "--reason <REASON>", AUDIT_SEAL_USAGE);
            }
            cmd.reason = v;
            have_reason = true;
        } else {
            return fail_unexpected(result, arg, AUDIT_SEAL_USAGE);
        }
    }

    std::vector<std::string> missing;
    missing_log_target(target, missing);
    if (!have_reason) {
        missing.emplace_back("--reason <REASON>");
    }
    if (!missing.empty()) {
        return fail_missing(result, missing, AUDIT_SEAL_USAGE);
    }
    cmd.log = target.log;
    cmd.tenant = target.tenant;
    result.ok = true;
    result.command = std::move(cmd);
}

void parse_audit(int argc, char** argv, int start, ParseResult& result) {
    if (start >= argc) {
        result.ok = true;
        result.command = HelpCommand{"audit"};
        return;
    }

    const char* subcmd = argv[start];
    if (str_eq(subcmd, "append")) {
        parse_audit_append(argc, argv, start + 1, result);
    } else if (str_eq(subcmd, "verify")) {
        parse_audit_verify(argc, argv, start + 1, result);
    } else if (str_eq(subcmd, "query")) {
        parse_audit_query(argc, argv, start + 1, result);
    } else if (str_eq(subcmd, "seal")) {
        parse_audit_seal(argc, argv, start + 1, result);
    } else if (str_eq(subcmd, "help") || is_help(subcmd)) {
        result.ok = true;
        result.command = HelpCommand{"audit"};
    } else {
        fail(result, std::string("unrecognized subcommand '") + subcmd + "'", AUDIT_USAGE);
    }
}

/// Момент времени для --from / --to
bool parse_time_option(const char* value, const char* display, datetime::TimePoint& out,
                       ParseResult& result) {
    auto tp = datetime::parse_rfc3339(value);
    if (!tp) {
        fail(result,
             std::string("invalid value '") + value + "' for '" + display +
                 "': expected an RFC 3339 timestamp",
             EVIDENCE_USAGE);
        return false;
    }
    out = *tp;
    return true;
}

void parse_evidence(int argc, char** argv, int start, ParseResult& result) {
    EvidenceCommand cmd;
    LogTarget target;
    bool have_control = false;
    bool have_from = false;
    bool have_to = false;
    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        bool failed = false;
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"evidence"};
            return;
        } else if (parse_global_flag(arg, result.global)) {
            continue;
        } else if (parse_log_target(argc, argv, i, target, EVIDENCE_USAGE, result, failed)) {
            if (failed) {
                return;
            }
        } else if (is_option(arg, nullptr, "--control")) {
            const char* v = take_value(argc, argv, i, "--control");
            if (v == nullptr) {
                return fail_no_value(result, "--control <CONTROL>", EVIDENCE_USAGE);
            }
            cmd.control = v;
            have_control = true;
        } else if (is_option(arg, nullptr, "--category")) {
            const char* v = take_value(argc, argv, i, "--category");
            if (v == nullptr) {
                return fail_no_value(result, "--category <CATEGORY>", EVIDENCE_USAGE);
            }
            cmd.category = v;
        } else if (is_option(arg, nullptr, "--from")) {
            const char* v = take_value(argc, argv, i, "--from");
            if (v == nullptr) {
                return fail_no_value(result, "--from <FROM>", EVIDENCE_USAGE);
            }
            if (!parse_time_option(v, "--from <FROM>", cmd.from, result)) {
                return;
            }
            have_from = true;
        } else if (is_option(arg, nullptr, "--to")) {
            const char* v = take_value(argc, argv, i, "--to");
            if (v == nullptr) {
                return fail_no_value(result, "--to <TO>", EVIDENCE_USAGE);
            }
            if (!parse_time_option(v, "--to <TO>", cmd.to, result)) {
                return;
            }
            have_to = true;
        } else if (is_option(arg, nullptr, "--traces")) {
            const char* v = take_value(argc, argv, i, "--traces");
            if (v == nullptr) {
                return fail_no_value(result, "--traces <TRACES>", EVIDENCE_USAGE);
            }
            cmd.traces = platform::path_from_utf8(v);
        } else if (is_option(arg, nullptr, "--min-relevance")) {
            const char* v = take_value(argc, argv, i, "--min-relevance");
            if (v == nullptr) {
                return fail_no_value(result, "--min-relevance <SCORE>", EVIDENCE_USAGE);
            }
            try {
                std::size_t pos = 0;
                double score = std::stod(v, &pos);
                if (pos != std::strlen(v) || score < 0.0 || score > 1.0) {
                    throw std::out_of_range("score");
                }
                cmd.min_relevance = score;
            } catch (const std::exception&) {
                return fail(result,
                            std::string("invalid value '") + v +
                                "' for '--min-relevance <SCORE>': expected a number in 0..1",
                            EVIDENCE_USAGE);
            }
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else {
            return fail_unexpected(result, arg, EVIDENCE_USAGE);
        }
    }

    std::vector<std::string> missing;
    missing_log_target(target, missing);
    if (!have_control) {
        missing.emplace_back("--control <CONTROL>");
    }
    if (!have_from) {
        missing.emplace_back("--from <FROM>");
    }
    if (!have_to) {
        missing.emplace_back("--to <TO>");
    }
    if (!missing.empty()) {
        return fail_missing(result, missing, EVIDENCE_USAGE);
    }
    if (cmd.from > cmd.to) {
        return fail(result, "'--from' must not be later than '--to'", EVIDENCE_USAGE);
    }
    cmd.log = target.log;
    cmd.tenant = target.tenant;
    result.ok = true;
    result.command = std::move(cmd);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("warden ") + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: warden [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  lint      Lint policy documents to ensure that they load correctly\n"
               "  evaluate  Evaluate a request against policy documents\n"
               "  dry-run   Explain how every enabled rule treats a request\n"
               "  audit     Append to, verify, query or seal an audit log\n"
               "  evidence  Collect compliance evidence for a control\n"
               "  help      Print this message or the help of the given subcommand(s)\n"
               "  version   Print version\n"
               "\n"
               "Options:\n"
               "      --no-banner      Hide the banner\n"
               "  -c, --config <FILE>  Configuration file (YAML)\n"
               "  -v...                Print verbose output\n"
               "  -q                   Suppress informational output\n"
               "  -h, --help           Print help\n"
               "  -V, --version        Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Evaluate a request against a repository policy:\n"
               "        ./warden evaluate -p policies/repo.yml -r request.json\n"
               "\n"
               "    Append entries to an audit log and verify its chain:\n"
               "        ./warden audit append --log audit.jsonl --tenant acme --entry entry.json\n"
               "        ./warden audit verify --log audit.jsonl --tenant acme\n"
               "\n"
               "    Collect evidence for SOC2 CC6.1:\n"
               "        ./warden evidence --log audit.jsonl --tenant acme --control CC6.1 \\\n"
               "            --from 2024-01-01T00:00:00Z --to 2024-04-01T00:00:00Z\n";
    } else if (*command == "lint") {
        return "Lint policy documents to ensure that they load correctly\n"
               "\n"
               "Usage: warden lint <PATH>...\n"
               "\n"
               "Arguments:\n"
               "  <PATH>...  Policy files or directories (.yml, .yaml, .json)\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else if (*command == "evaluate") {
        return "Evaluate a request against policy documents\n"
               "\n"
               "Usage: warden evaluate [OPTIONS] --policy <POLICY>... --request <REQUEST>\n"
               "\n"
               "Options:\n"
               "  -p, --policy <POLICY>    Policy document to load (repeatable)\n"
               "  -r, --request <REQUEST>  Evaluation request (JSON or YAML)\n"
               "  -j, --json               Output as JSON\n"
               "      --inherit            Merge the policies along the request's scope chain\n"
               "      --log <LOG>          Record the decision in this audit log (JSONL)\n"
               "  -t, --tenant <TENANT>    Tenant that owns the log (with --log)\n"
               "  -h, --help               Print help\n"
               "\n"
               "Exit status is 0 when the request is allowed and 3 when it is denied or\n"
               "waiting for approval.\n";
    } else if (*command == "dry-run") {
        return "Explain how every enabled rule treats a request\n"
               "\n"
               "Usage: warden dry-run [OPTIONS] --policy <POLICY>... --request <REQUEST>\n"
               "\n"
               "Options:\n"
               "  -p, --policy <POLICY>    Policy document to load (repeatable)\n"
               "  -r, --request <REQUEST>  Evaluation request (JSON or YAML)\n"
               "  -j, --json               Output as JSON\n"
               "  -h, --help               Print help\n";
    } else if (*command == "audit") {
        return "Append to, verify, query or seal an audit log\n"
               "\n"
               "Usage: warden audit <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  append  Append entries from a JSON, YAML or JSONL file\n"
               "  verify  Verify the hash chain of the log\n"
               "  query   Search entries of the log\n"
               "  seal    Seal the log against further writes\n"
               "\n"
               "Options:\n"
               "      --log <LOG>          Audit log file (JSONL)\n"
               "  -t, --tenant <TENANT>    Tenant that owns the log\n"
               "  -e, --entry <ENTRY>      Entries to append (append)\n"
               "      --category <CAT>     Filter by action category (query, repeatable)\n"
               "      --type <TYPE>        Filter by action type (query, repeatable)\n"
               "      --search <TEXT>      Case-insensitive text search (query)\n"
               "      --high-risk          Only high-risk entries (query)\n"
               "  -n, --limit <LIMIT>      Maximum number of entries, 1..1000 (query)\n"
               "      --verify             Verify the chain around the results (query)\n"
               "      --report             Report every integrity issue found (verify)\n"
               "      --reason <REASON>    Reason for sealing (seal)\n"
               "  -j, --json               Output as JSON (verify, query)\n"
               "  -h, --help               Print help\n";
    } else if (*command == "evidence") {
        return "Collect compliance evidence for a control\n"
               "\n"
               "Usage: warden evidence [OPTIONS] --log <LOG> --tenant <TENANT> --control <CONTROL> "
               "--from <FROM> --to <TO>\n"
               "\n"
               "Options:\n"
               "      --log <LOG>              Audit log file (JSONL)\n"
               "  -t, --tenant <TENANT>        Tenant that owns the log\n"
               "      --control <CONTROL>      Control id (CC6.1, A.9.2, ...)\n"
               "      --category <CATEGORY>    Control category (access_control, ...)\n"
               "      --from <FROM>            Start of the period (RFC 3339)\n"
               "      --to <TO>                End of the period (RFC 3339)\n"
               "      --traces <TRACES>        Agent decision traces (JSON, YAML or JSONL)\n"
               "      --min-relevance <SCORE>  Drop evidence below this relevance\n"
               "  -j, --json                   Output as JSON\n"
               "  -h, --help                   Print help\n";
    } else {
        return "error: unrecognized subcommand '" + *command + "'\n";
    }
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = EXIT_USAGE_ERROR;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (parse_global_flag(arg, result.global)) {
            continue;
        } else if (is_option(arg, "-c", "--config")) {
            const char* v = take_value(argc, argv, i, "--config");
            if (v == nullptr) {
                fail_no_value(result, "--config <FILE>", MAIN_USAGE);
                return result;
            }
            result.global.config = platform::path_from_utf8(v);
        } else if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            fail_unexpected(result, arg, MAIN_USAGE);
            return result;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "lint")) {
        parse_lint(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "evaluate")) {
        parse_evaluation<EvaluateCommand>(argc, argv, cmd_idx + 1, "evaluate", EVALUATE_USAGE,
                                          result);
    } else if (str_eq(cmd, "dry-run")) {
        parse_evaluation<DryRunCommand>(argc, argv, cmd_idx + 1, "dry-run", DRY_RUN_USAGE, result);
    } else if (str_eq(cmd, "audit")) {
        parse_audit(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "evidence")) {
        parse_evidence(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "version")) {
        result.ok = true;
        result.command = VersionCommand{};
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{argv[cmd_idx + 1]};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        fail(result, std::string("unrecognized subcommand '") + cmd + "'", MAIN_USAGE);
    }

    return result;
}

}  // namespace warden::cli
