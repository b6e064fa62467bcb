// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================

#include "warden/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace warden::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// ==============================================================================
// Справка и версия
// ==============================================================================

TEST(CliTest, Parse_NoArgs_UsageError) {
    Args args{"warden"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, EXIT_USAGE_ERROR);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "Usage: warden [OPTIONS] <COMMAND>"));
}

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    Args args{"warden", "--help"};
    auto result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_FALSE(std::get<HelpCommand>(result.command).command.has_value());
}

TEST(CliTest, Parse_HelpSubcommand_CarriesName) {
    Args args{"warden", "help", "evidence"};
    auto result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::optional<std::string>("evidence"));
}

TEST(CliTest, Parse_Version_ShortAndSubcommand) {
    for (const char* flag : {"-V", "--version", "version"}) {
        Args args{"warden", flag};
        auto result = parse(args.argc(), args.argv());
        ASSERT_TRUE(result.ok) << flag;
        EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command)) << flag;
    }
    EXPECT_EQ(render_version(), std::string("warden ") + VERSION + "\n");
}

TEST(CliTest, RenderHelp_ListsCommands) {
    const std::string help = render_help();
    EXPECT_EQ(help.rfind(ABOUT, 0), 0u);
    for (const char* cmd : {"lint", "evaluate", "dry-run", "audit", "evidence"}) {
        EXPECT_TRUE(contains(help, std::string("  ") + cmd + " ")) << cmd;
    }
    EXPECT_TRUE(contains(render_help(std::string("evaluate")), "Exit status is 0"));
    EXPECT_EQ(render_help(std::string("bogus")), "error: unrecognized subcommand 'bogus'\n");
}

// ==============================================================================
// Глобальные опции
// ==============================================================================

TEST(CliTest, Parse_GlobalFlags_BeforeAndAfterCommand) {
    Args args{"warden", "--no-banner", "-c", "warden.yml", "lint", "policies", "-vv", "-q"};
    auto result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.global.no_banner);
    EXPECT_TRUE(result.global.quiet);
    EXPECT_EQ(result.global.verbose, 2);
    ASSERT_TRUE(result.global.config.has_value());
    EXPECT_EQ(result.global.config->string(), "warden.yml");
}

TEST(CliTest, Parse_ConfigEqualsForm) {
    Args args{"warden", "--config=conf/warden.yml", "version"};
    auto result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.config->string(), "conf/warden.yml");
}

TEST(CliTest, Parse_UnknownSubcommand_Error) {
    Args args{"warden", "hunt"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, EXIT_USAGE_ERROR);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind("error: unrecognized subcommand 'hunt'", 0),
              0u);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "For more information, try '--help'."));
}

TEST(CliTest, Parse_UnknownGlobalFlag_Error) {
    Args args{"warden", "--colour", "lint"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind("error: unexpected argument '--colour' found", 0),
              0u);
}

// ==============================================================================
// lint / evaluate / dry-run
// ==============================================================================

TEST(CliTest, Parse_Lint_Paths) {
    Args args{"warden", "lint", "a.yml", "policies/"};
    auto result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<LintCommand>(result.command);
    ASSERT_EQ(cmd.paths.size(), 2u);
    EXPECT_EQ(cmd.paths[0].string(), "a.yml");
}

TEST(CliTest, Parse_Lint_NoPaths_Missing) {
    Args args{"warden", "lint"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "the following required arguments were not provided:\n  <PATH>..."));
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "Usage: warden lint <PATH>..."));
}

TEST(CliTest, Parse_Evaluate_AllOptions) {
    Args args{"warden", "evaluate", "-p", "org.yml", "--policy=repo.yml",
              "-r",     "req.json", "--json", "--inherit"};
    auto result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<EvaluateCommand>(result.command);
    ASSERT_EQ(cmd.policies.size(), 2u);
    EXPECT_EQ(cmd.policies[1].string(), "repo.yml");
    EXPECT_EQ(cmd.request.string(), "req.json");
    EXPECT_TRUE(cmd.json);
    EXPECT_TRUE(cmd.inherit);
    EXPECT_FALSE(cmd.log.has_value());
    EXPECT_FALSE(cmd.tenant.has_value());
}

TEST(CliTest, Parse_Evaluate_RecordsToLog) {
    Args args{"warden", "evaluate", "-p", "repo.yml", "-r", "req.json",
              "--log=audit.jsonl", "-t", "acme"};
    auto result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<EvaluateCommand>(result.command);
    ASSERT_TRUE(cmd.log.has_value());
    EXPECT_EQ(cmd.log->string(), "audit.jsonl");
    EXPECT_EQ(cmd.tenant.value_or(""), "acme");
}

TEST(CliTest, Parse_Evaluate_LogWithoutTenant_Missing) {
    Args args{"warden", "evaluate", "-p", "repo.yml", "-r", "req.json", "--log", "audit.jsonl"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "not provided:\n  --tenant <TENANT>"));
}

TEST(CliTest, Parse_DryRun_RejectsLog) {
    Args args{"warden", "dry-run", "-p", "a.yml", "-r", "req.json", "--log", "audit.jsonl"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "unexpected argument '--log'"));
}

TEST(CliTest, Parse_Evaluate_MissingBoth) {
    Args args{"warden", "evaluate"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "not provided:\n  --policy <POLICY>...\n  --request <REQUEST>"));
}

TEST(CliTest, Parse_Evaluate_OptionWithoutValue) {
    Args args{"warden", "evaluate", "-r", "req.json", "-p"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind(
                  "error: a value is required for '--policy <POLICY>' but none was supplied", 0),
              0u);
}

TEST(CliTest, Parse_DryRun_RejectsInherit) {
    Args args{"warden", "dry-run", "-p", "a.yml", "-r", "req.json", "--inherit"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "unexpected argument '--inherit'"));
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "Usage: warden dry-run"));
}

TEST(CliTest, Parse_SubcommandHelp) {
    Args args{"warden", "dry-run", "--help"};
    auto result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::optional<std::string>("dry-run"));
}

// ==============================================================================
// audit
// ==============================================================================

TEST(CliTest, Parse_Audit_NoSubcommand_Help) {
    Args args{"warden", "audit"};
    auto result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::optional<std::string>("audit"));
}

TEST(CliTest, Parse_AuditAppend) {
    Args args{"warden", "audit", "append", "--log", "a.jsonl", "-t", "acme", "-e", "e.json"};
    auto result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<AuditAppendCommand>(result.command);
    EXPECT_EQ(cmd.log.string(), "a.jsonl");
    EXPECT_EQ(cmd.tenant, "acme");
    EXPECT_EQ(cmd.entry.string(), "e.json");
}

TEST(CliTest, Parse_AuditVerify_Report) {
    Args args{"warden", "audit", "verify", "--log", "a.jsonl", "-t", "acme", "--report", "-j"};
    auto result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<AuditVerifyCommand>(result.command);
    EXPECT_TRUE(cmd.report);
    EXPECT_TRUE(cmd.json);
}

TEST(CliTest, Parse_AuditVerify_MissingTenant) {
    Args args{"warden", "audit", "verify", "--log", "a.jsonl"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "not provided:\n  --tenant <TENANT>"));
}

TEST(CliTest, Parse_AuditQuery_Filters) {
    Args args{"warden", "audit",    "query",  "--log",     "a.jsonl", "--tenant", "acme",
              "--category", "git",  "--category=auth", "--type", "git.push.force",
              "--search", "main", "-n", "25", "--high-risk", "--verify", "-j"};
    auto result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<AuditQueryCommand>(result.command);
    EXPECT_EQ(cmd.categories,
              (std::vector<audit::ActionCategory>{audit::ActionCategory::Git,
                                                  audit::ActionCategory::Auth}));
    EXPECT_EQ(cmd.action_types, (std::vector<std::string>{"git.push.force"}));
    EXPECT_EQ(cmd.search, std::optional<std::string>("main"));
    EXPECT_EQ(cmd.limit, 25u);
    EXPECT_TRUE(cmd.high_risk_only);
    EXPECT_TRUE(cmd.verify);
    EXPECT_TRUE(cmd.json);
}

TEST(CliTest, Parse_AuditQuery_Defaults) {
    Args args{"warden", "audit", "query", "--log", "a.jsonl", "--tenant", "acme"};
    auto result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<AuditQueryCommand>(result.command);
    EXPECT_EQ(cmd.limit, 100u);
    EXPECT_TRUE(cmd.categories.empty());
    EXPECT_FALSE(cmd.verify);
}

TEST(CliTest, Parse_AuditQuery_InvalidValues) {
    {
        Args args{"warden", "audit", "query", "--log", "a", "--tenant", "t", "--category",
                  "quantum"};
        auto result = parse(args.argc(), args.argv());
        EXPECT_FALSE(result.ok);
        EXPECT_EQ(result.diagnostic.stderr_message.rfind(
                      "error: invalid value 'quantum' for '--category <CATEGORY>': ", 0),
                  0u);
    }
    {
        Args args{"warden", "audit", "query", "--log", "a", "--tenant", "t", "--limit", "-5"};
        auto result = parse(args.argc(), args.argv());
        EXPECT_FALSE(result.ok);
        EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                             "invalid value '-5' for '--limit <LIMIT>'"));
    }
}

TEST(CliTest, Parse_AuditSeal_RequiresReason) {
    Args args{"warden", "audit", "seal", "--log", "a.jsonl", "--tenant", "acme"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "not provided:\n  --reason <REASON>"));

    Args ok_args{"warden", "audit", "seal", "--log", "a.jsonl", "--tenant", "acme",
                 "--reason", "quarter closed"};
    auto ok = parse(ok_args.argc(), ok_args.argv());
    ASSERT_TRUE(ok.ok);
    EXPECT_EQ(std::get<AuditSealCommand>(ok.command).reason, "quarter closed");
}

TEST(CliTest, Parse_Audit_UnknownSubcommand) {
    Args args{"warden", "audit", "rewrite"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "unrecognized subcommand 'rewrite'"));
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "Usage: warden audit <COMMAND>"));
}

// ==============================================================================
// evidence
// ==============================================================================

TEST(CliTest, Parse_Evidence_AllOptions) {
    Args args{"warden",    "evidence", "--log",       "a.jsonl",
              "--tenant",  "acme",     "--control",   "CC6.1",
              "--category", "access_control",
              "--from",    "2024-01-01T00:00:00Z",
              "--to",      "2024-04-01T00:00:00Z",
              "--traces",  "traces.json", "--min-relevance", "0.75", "--json"};
    auto result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<EvidenceCommand>(result.command);
    EXPECT_EQ(cmd.control, "CC6.1");
    EXPECT_EQ(cmd.category, std::optional<std::string>("access_control"));
    EXPECT_EQ(datetime::format_rfc3339(cmd.from), "2024-01-01T00:00:00.000Z");
    EXPECT_EQ(datetime::format_rfc3339(cmd.to), "2024-04-01T00:00:00.000Z");
    ASSERT_TRUE(cmd.traces.has_value());
    EXPECT_EQ(cmd.traces->string(), "traces.json");
    EXPECT_EQ(cmd.min_relevance, std::optional<double>(0.75));
    EXPECT_TRUE(cmd.json);
}

TEST(CliTest, Parse_Evidence_MissingRequired) {
    Args args{"warden", "evidence", "--log", "a.jsonl", "--tenant", "acme"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "not provided:\n  --control <CONTROL>\n  --from <FROM>\n  --to <TO>"));
}

TEST(CliTest, Parse_Evidence_InvalidTimestamp) {
    Args args{"warden", "evidence", "--log", "a", "--tenant", "t", "--control", "CC6.1",
              "--from", "yesterday", "--to", "2024-04-01T00:00:00Z"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind(
                  "error: invalid value 'yesterday' for '--from <FROM>': expected an RFC 3339 "
                  "timestamp",
                  0),
              0u);
}

TEST(CliTest, Parse_Evidence_ReversedRange) {
    Args args{"warden", "evidence", "--log", "a", "--tenant", "t", "--control", "CC6.1",
              "--from", "2024-04-01T00:00:00Z", "--to", "2024-01-01T00:00:00Z"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "'--from' must not be later than '--to'"));
}

TEST(CliTest, Parse_Evidence_RelevanceOutOfRange) {
    Args args{"warden", "evidence", "--log", "a", "--tenant", "t", "--control", "CC6.1",
              "--from", "2024-01-01T00:00:00Z", "--to", "2024-04-01T00:00:00Z",
              "--min-relevance", "1.5"};
    auto result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "'--min-relevance <SCORE>': expected a number in 0..1"));
}

}  // namespace warden::cli::test
