// ==============================================================================
// test_condition_gtest.cpp - Тесты библиотеки условий (GoogleTest)
// ==============================================================================

#include "warden/condition.hpp"
#include "warden/datetime.hpp"
#include "warden/errors.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>

namespace warden::policy::test {

namespace {

/// Запрос: alice меняет два файла в acme/api на защищённой ветке main,
/// понедельник 2024-01-15 10:00 UTC
EvaluationRequest make_request() {
    EvaluationRequest req;
    req.actor.id = "alice";
    req.actor.roles = {"developer"};
    req.actor.teams = {"platform"};
    req.action.name = "merge";
    req.resource.type = "pull_request";
    req.resource.repo = RepoRef{"acme", "api"};
    req.resource.branch = "main";
    req.resource.branch_protected = true;
    req.resource.files = {"src/main.cpp", "docs/guide/setup.md"};
    req.resource.labels = {"backend", "urgent"};
    req.resource.complexity = 8;
    req.context.source = "api";
    req.context.timestamp = datetime::from_unix_millis(1705312800000);
    return req;
}

ConditionNode leaf(Condition c) {
    return ConditionNode(std::move(c));
}

ConditionNode group_node(LogicalOperator op, std::vector<ConditionNode> children) {
    auto g = std::make_shared<ConditionGroup>();
    g->op = op;
    g->conditions = std::move(children);
    return ConditionNode(g);
}

}  // namespace

// ==============================================================================
// Glob
// ==============================================================================

TEST(ConditionTest, Glob_SingleStarStopsAtSlash) {
    EXPECT_TRUE(glob_match("src/*.cpp", "src/main.cpp"));
    EXPECT_FALSE(glob_match("src/*.cpp", "src/policy/engine.cpp"));
}

TEST(ConditionTest, Glob_DoubleStarCrossesDirectories) {
    EXPECT_TRUE(glob_match("src/**", "src/policy/engine.cpp"));
    EXPECT_TRUE(glob_match("**/*.md", "docs/guide/setup.md"));
}

TEST(ConditionTest, Glob_QuestionMarkAndEscapedDot) {
    EXPECT_TRUE(glob_match("release-?", "release-1"));
    EXPECT_FALSE(glob_match("release-?", "release-10"));
    EXPECT_FALSE(glob_match("*.md", "READMEmd"));
}

// ==============================================================================
// Листовые условия
// ==============================================================================

TEST(ConditionTest, Complexity_ComparesThreshold) {
    auto req = make_request();
    EXPECT_TRUE(evaluate(Condition(ComplexityCondition{ComparisonOperator::Gte, 7}), req));
    EXPECT_FALSE(evaluate(Condition(ComplexityCondition{ComparisonOperator::Lt, 8}), req));
    EXPECT_TRUE(evaluate(Condition(ComplexityCondition{ComparisonOperator::Eq, 8}), req));
}

TEST(ConditionTest, Complexity_MissingValue_NoMatch) {
    auto req = make_request();
    req.resource.complexity.reset();
    EXPECT_FALSE(evaluate(Condition(ComplexityCondition{ComparisonOperator::Lte, 10}), req));
}

TEST(ConditionTest, FilePattern_IncludeAndExclude) {
    auto req = make_request();
    EXPECT_TRUE(evaluate(Condition(FilePatternCondition{{"docs/**"}, FileMatchType::Include}), req));
    EXPECT_FALSE(evaluate(Condition(FilePatternCondition{{"docs/**"}, FileMatchType::Exclude}), req));
    EXPECT_TRUE(evaluate(Condition(FilePatternCondition{{"*.py"}, FileMatchType::Exclude}), req));
}

TEST(ConditionTest, FilePattern_NoFiles_NoMatch) {
    auto req = make_request();
    req.resource.files.clear();
    EXPECT_FALSE(evaluate(Condition(FilePatternCondition{{"**"}, FileMatchType::Exclude}), req));
}

TEST(ConditionTest, Author_MatchesByIdRoleOrTeam) {
    auto req = make_request();
    EXPECT_TRUE(evaluate(Condition(AuthorCondition{{"alice"}, {}, {}}), req));
    EXPECT_TRUE(evaluate(Condition(AuthorCondition{{}, {"developer"}, {}}), req));
    EXPECT_TRUE(evaluate(Condition(AuthorCondition{{}, {}, {"platform"}}), req));
    EXPECT_FALSE(evaluate(Condition(AuthorCondition{{"bob"}, {"admin"}, {"security"}}), req));
}

TEST(ConditionTest, Author_EmptyCriteria_Matches) {
    EXPECT_TRUE(evaluate(Condition(AuthorCondition{}), make_request()));
}

TEST(ConditionTest, TimeWindow_DuringBusinessHours) {
    auto req = make_request();
    TimeWindowCondition c;
    c.windows.push_back(TimeWindow{{Weekday::Mon, Weekday::Tue}, 9, 17});
    EXPECT_TRUE(evaluate(Condition(c), req));

    c.match_type = WindowMatchType::Outside;
    EXPECT_FALSE(evaluate(Condition(c), req));
}

TEST(ConditionTest, TimeWindow_EndHourIsExclusive) {
    auto req = make_request();
    TimeWindowCondition c;
    c.windows.push_back(TimeWindow{{}, 8, 10});
    EXPECT_FALSE(evaluate(Condition(c), req));
}

TEST(ConditionTest, Repository_ExactNameAndPattern) {
    auto req = make_request();
    EXPECT_TRUE(evaluate(Condition(RepositoryCondition{{"acme/api"}, {}}), req));
    EXPECT_TRUE(evaluate(Condition(RepositoryCondition{{"api"}, {}}), req));
    EXPECT_TRUE(evaluate(Condition(RepositoryCondition{{}, {"acme/*"}}), req));
    EXPECT_FALSE(evaluate(Condition(RepositoryCondition{{"acme/web"}, {"other/*"}}), req));
}

TEST(ConditionTest, Repository_NoRepo_NoMatch) {
    auto req = make_request();
    req.resource.repo.reset();
    EXPECT_FALSE(evaluate(Condition(RepositoryCondition{}), req));
}

TEST(ConditionTest, Branch_ProtectedFlagMustAgree) {
    auto req = make_request();
    EXPECT_TRUE(evaluate(Condition(BranchCondition{{"main"}, {}, true}), req));
    EXPECT_FALSE(evaluate(Condition(BranchCondition{{"main"}, {}, false}), req));
    EXPECT_TRUE(evaluate(Condition(BranchCondition{{}, {"ma*"}, std::nullopt}), req));
}

TEST(ConditionTest, Label_AnyAllNone) {
    auto req = make_request();
    EXPECT_TRUE(evaluate(Condition(LabelCondition{{"urgent", "docs"}, LabelMatchType::Any}), req));
    EXPECT_FALSE(evaluate(Condition(LabelCondition{{"urgent", "docs"}, LabelMatchType::All}), req));
    EXPECT_TRUE(evaluate(Condition(LabelCondition{{"backend", "urgent"}, LabelMatchType::All}), req));
    EXPECT_TRUE(evaluate(Condition(LabelCondition{{"trusted"}, LabelMatchType::None}), req));
}

TEST(ConditionTest, Agent_TypeAndConfidence) {
    auto req = make_request();
    req.action.agent_type = "coder";
    req.action.confidence = 0.55;

    AgentCondition c;
    c.agents = {AgentType::Coder, AgentType::Resolver};
    EXPECT_TRUE(evaluate(Condition(c), req));

    c.confidence = ConfidenceThreshold{ComparisonOperator::Lt, 0.7};
    EXPECT_TRUE(evaluate(Condition(c), req));

    c.confidence = ConfidenceThreshold{ComparisonOperator::Gte, 0.9};
    EXPECT_FALSE(evaluate(Condition(c), req));
}

TEST(ConditionTest, Agent_HumanRequest_NoMatch) {
    AgentCondition c;
    c.agents = {AgentType::Triage};
    EXPECT_FALSE(evaluate(Condition(c), make_request()));
}

TEST(ConditionTest, Custom_Operators) {
    auto req = make_request();
    req.attributes["forcePush"] = Value(true);
    req.attributes["linesChanged"] = Value::make_int(420);
    req.attributes["ticket"] = Value("OPS-1234");

    EXPECT_TRUE(evaluate(Condition(CustomCondition{"forcePush", CustomOperator::Eq, Value(true)}), req));
    EXPECT_TRUE(evaluate(
        Condition(CustomCondition{"linesChanged", CustomOperator::Gt, Value::make_int(100)}), req));
    EXPECT_FALSE(evaluate(
        Condition(CustomCondition{"linesChanged", CustomOperator::Lt, Value::make_int(100)}), req));
    EXPECT_TRUE(evaluate(
        Condition(CustomCondition{"ticket", CustomOperator::Contains, Value("OPS")}), req));
    EXPECT_TRUE(evaluate(
        Condition(CustomCondition{"ticket", CustomOperator::Matches, Value("^[A-Z]+-[0-9]+$")}),
        req));

    Value allowed = Value::make_string_array({"OPS-1234", "OPS-9"});
    EXPECT_TRUE(evaluate(Condition(CustomCondition{"ticket", CustomOperator::In, allowed}), req));
    EXPECT_FALSE(evaluate(Condition(CustomCondition{"ticket", CustomOperator::Nin, allowed}), req));
}

TEST(ConditionTest, Custom_Exists) {
    auto req = make_request();
    req.attributes["hotfix"] = Value(false);
    EXPECT_TRUE(evaluate(Condition(CustomCondition{"hotfix", CustomOperator::Exists, Value(true)}), req));
    EXPECT_TRUE(evaluate(Condition(CustomCondition{"missing", CustomOperator::Exists, Value(false)}), req));
    EXPECT_FALSE(evaluate(Condition(CustomCondition{"missing", CustomOperator::Eq, Value()}), req));
}

TEST(ConditionTest, Custom_DottedPath_WalksNestedObjects) {
    auto req = make_request();
    Value team = Value::make_object();
    team.set("name", Value("sre"));
    Value ticket = Value::make_object();
    ticket.set("priority", Value("P1"));
    ticket.set("team", std::move(team));
    req.attributes["ticket"] = std::move(ticket);
    req.attributes["build.id"] = Value("b-17");

    EXPECT_TRUE(evaluate(
        Condition(CustomCondition{"ticket.priority", CustomOperator::Eq, Value("P1")}), req));
    EXPECT_TRUE(evaluate(
        Condition(CustomCondition{"ticket.team.name", CustomOperator::Eq, Value("sre")}), req));
    EXPECT_TRUE(evaluate(
        Condition(CustomCondition{"ticket.owner", CustomOperator::Exists, Value(false)}), req));
    EXPECT_FALSE(evaluate(
        Condition(CustomCondition{"ticket.priority.level", CustomOperator::Exists, Value(true)}),
        req));
    // Ключ с точкой целиком важнее пути
    EXPECT_TRUE(evaluate(
        Condition(CustomCondition{"build.id", CustomOperator::Eq, Value("b-17")}), req));
}

TEST(ConditionTest, Custom_InvalidRegex_EvaluatesFalse) {
    auto req = make_request();
    req.attributes["ticket"] = Value("OPS-1");
    Condition c = CustomCondition{"ticket", CustomOperator::Matches, Value("([unclosed")};
    EXPECT_FALSE(evaluate(c, req));
    EXPECT_THROW(compile(c), ValidationError);
}

TEST(ConditionTest, Unknown_AlwaysFalse) {
    EXPECT_FALSE(evaluate(Condition(UnknownCondition{"quantum_state", Value()}), make_request()));
}

// ==============================================================================
// Группы
// ==============================================================================

TEST(ConditionTest, Group_AndOrNested) {
    auto req = make_request();
    ConditionGroup g;
    g.op = LogicalOperator::And;
    g.conditions.push_back(leaf(ComplexityCondition{ComparisonOperator::Gte, 5}));
    g.conditions.push_back(group_node(
        LogicalOperator::Or, {leaf(BranchCondition{{"release"}, {}, std::nullopt}),
                              leaf(LabelCondition{{"urgent"}, LabelMatchType::Any})}));
    EXPECT_TRUE(evaluate(g, req));

    req.resource.labels.clear();
    EXPECT_FALSE(evaluate(g, req));
}

TEST(ConditionTest, Group_NotNegatesFirstChild) {
    auto req = make_request();
    ConditionGroup g;
    g.op = LogicalOperator::Not;
    g.conditions.push_back(leaf(LabelCondition{{"trusted"}, LabelMatchType::Any}));
    EXPECT_TRUE(evaluate(g, req));

    req.resource.labels.push_back("trusted");
    EXPECT_FALSE(evaluate(g, req));
}

TEST(ConditionTest, Group_EmptyNot_Matches) {
    ConditionGroup g;
    g.op = LogicalOperator::Not;
    EXPECT_TRUE(evaluate(g, make_request()));
}

TEST(ConditionTest, CompileRule_EmptyConditions_AlwaysMatches) {
    PolicyRule rule;
    rule.id = "catch-all";
    EXPECT_TRUE(compile_rule(rule)(make_request()));
}

TEST(ConditionTest, CompileRule_ConditionLogicReplacesList) {
    PolicyRule rule;
    rule.id = "logic";
    rule.conditions.push_back(ComplexityCondition{ComparisonOperator::Gt, 100});
    ConditionGroup g;
    g.op = LogicalOperator::Or;
    g.conditions.push_back(leaf(ComplexityCondition{ComparisonOperator::Gt, 1}));
    rule.condition_logic = g;
    EXPECT_TRUE(compile_rule(rule)(make_request()));
}

// ==============================================================================
// Пояснения
// ==============================================================================

TEST(ConditionTest, Explain_ComplexityText) {
    auto ev = explain(Condition(ComplexityCondition{ComparisonOperator::Gte, 7}), make_request());
    EXPECT_TRUE(ev.matched);
    EXPECT_EQ(ev.kind, "complexity");
    EXPECT_EQ(ev.explanation, "Complexity 8 gte 7 -> MATCH");
}

TEST(ConditionTest, Explain_GroupVisitsEveryLeaf) {
    ConditionGroup g;
    g.op = LogicalOperator::And;
    g.conditions.push_back(leaf(ComplexityCondition{ComparisonOperator::Gt, 20}));
    g.conditions.push_back(leaf(BranchCondition{{"main"}, {}, std::nullopt}));

    std::vector<ConditionEvaluation> out;
    EXPECT_FALSE(explain(g, make_request(), out));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_NE(out[0].explanation.find("-> NO MATCH"), std::string::npos);
    EXPECT_NE(out[1].explanation.find("-> MATCH"), std::string::npos);
}

TEST(ConditionTest, FormatNumber_TrimsTrailingZeros) {
    EXPECT_EQ(format_number(8), "8");
    EXPECT_EQ(format_number(0.85), "0.85");
}

}  // namespace warden::policy::test
