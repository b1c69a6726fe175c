#include <gtest/gtest.h>
#include "TestRepo.h"
#include "analysis/ParserRegistry.h"
#include "refactor/SignatureMigrator.h"

namespace {

std::vector<ParamSpec> specs(const std::string& text) {
    return SignatureMigrator::parseParamSpecs(text);
}

} // namespace

TEST(ParamSpecTest, SplitsOnTopLevelCommasOnly) {
    auto parsed = specs("name, loud=False, opts={'a': 1, 'b': 2}, *args, tag='x,y'");
    ASSERT_EQ(parsed.size(), 5u);
    EXPECT_EQ(parsed[0].name, "name");
    EXPECT_FALSE(parsed[0].defaultExpr.has_value());
    EXPECT_EQ(parsed[1].name, "loud");
    EXPECT_EQ(parsed[1].defaultExpr.value_or(""), "False");
    EXPECT_EQ(parsed[2].name, "opts");
    EXPECT_EQ(parsed[2].defaultExpr.value_or(""), "{'a': 1, 'b': 2}");
    EXPECT_EQ(parsed[3].name, "args");
    EXPECT_EQ(parsed[4].name, "tag");
    EXPECT_EQ(parsed[4].defaultExpr.value_or(""), "'x,y'");
}

TEST(ParamSpecTest, EmptyTextGivesNoParams) {
    EXPECT_TRUE(specs("").empty());
    EXPECT_TRUE(specs(" , ").empty());
}

TEST(RenderArgumentsTest, AddsDefaultForNewParameter) {
    EXPECT_EQ(SignatureMigrator::renderArguments({"name"}, specs("name, loud=False"), {"\"x\""}, {}),
              "(\"x\", False)");
}

TEST(RenderArgumentsTest, ReordersCarriedArguments) {
    EXPECT_EQ(SignatureMigrator::renderArguments({"a", "b"}, specs("b, a"), {"1", "2"}, {}), "(2, 1)");
}

TEST(RenderArgumentsTest, DropsRemovedParameters) {
    EXPECT_EQ(SignatureMigrator::renderArguments({"a", "b"}, specs("a"), {"1", "2"}, {}), "(1)");
}

TEST(RenderArgumentsTest, MissingRequiredValueBecomesNone) {
    EXPECT_EQ(SignatureMigrator::renderArguments({"a", "b"}, specs("a, b, c"), {"1", "2"}, {}), "(1, 2, None)");
    EXPECT_EQ(SignatureMigrator::renderArguments({"a", "b"}, specs("a, c, b"), {"1", "2"}, {}), "(1, None, 2)");
}

TEST(RenderArgumentsTest, KeywordArgumentsAreKeptVerbatim) {
    EXPECT_EQ(SignatureMigrator::renderArguments({"a", "b"}, specs("a, c=0, b"), {"1"}, {{"b", "b=2"}}),
              "(1, 0, b=2)");
    EXPECT_EQ(SignatureMigrator::renderArguments({"name"}, specs("name, loud=False"), {"\"x\""}, {{"loud", "loud=True"}}),
              "(\"x\", loud=True)");
}

TEST(RenderArgumentsTest, ParametersAfterKeywordUseKeywordForm) {
    // b 已按关键字传入，其后的新参数不能再按位置传
    EXPECT_EQ(SignatureMigrator::renderArguments({"a", "d"}, specs("a, b, d, e"), {"1", "4"}, {{"b", "b=2"}}),
              "(1, d=4, e=None, b=2)");
    EXPECT_EQ(SignatureMigrator::renderArguments({"a"}, specs("a, b, f=3"), {"1"}, {{"b", "b=2"}}),
              "(1, b=2)");
}

class SignatureMigratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo.write("a.py", "def greet(name):\n    return name\n");
        repo.write("b.py", "from a import greet\n\ngreet(\"x\")\n");
    }

    TestRepo repo;
    Config cfg;
    ParserRegistry parsers = ParserRegistry::createDefault();
};

TEST_F(SignatureMigratorTest, DryRunAddsDefaultArgument) {
    SourceTree tree(repo.root(), cfg);
    SignatureMigrator migrator(tree, parsers);
    MigrationResult result = migrator.migrate("greet", specs("name, loud=False"));

    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.oldParams, std::vector<std::string>{"name"});
    ASSERT_EQ(result.edits.size(), 1u);
    const Edit& e = result.edits[0];
    EXPECT_EQ(e.file, "b.py");
    EXPECT_EQ(e.line, 3);
    EXPECT_EQ(e.colStart, 5);
    EXPECT_EQ(e.colEnd, 10);
    EXPECT_EQ(e.oldText, "(\"x\")");
    EXPECT_EQ(e.newText, "(\"x\", False)");
    EXPECT_EQ(e.context, "greet(\"x\")");
    EXPECT_FALSE(result.applied);
    EXPECT_EQ(repo.read("b.py"), "from a import greet\n\ngreet(\"x\")\n");
}

TEST_F(SignatureMigratorTest, ApplyRewritesOnlyArgumentLists) {
    SourceTree tree(repo.root(), cfg);
    SignatureMigrator migrator(tree, parsers);
    MigrationResult result = migrator.migrate("greet", specs("name, loud=False"), false);
    EXPECT_TRUE(result.applied);
    EXPECT_EQ(repo.read("b.py"), "from a import greet\n\ngreet(\"x\", False)\n");
    // 定义本身不改
    EXPECT_EQ(repo.read("a.py"), "def greet(name):\n    return name\n");
}

TEST_F(SignatureMigratorTest, UnchangedCallsProduceNoEdits) {
    repo.write("b.py", "greet(\"x\", loud=True)\n");
    SourceTree tree(repo.root(), cfg);
    SignatureMigrator migrator(tree, parsers);
    MigrationResult result = migrator.migrate("greet", specs("name, loud=False"));
    EXPECT_TRUE(result.edits.empty());
    EXPECT_TRUE(result.flagged.empty());
}

TEST_F(SignatureMigratorTest, NestedCallsAreRewrittenInOneEdit) {
    repo.write("b.py", "greet(greet(\"x\"))\n");
    SourceTree tree(repo.root(), cfg);
    SignatureMigrator migrator(tree, parsers);
    MigrationResult result = migrator.migrate("greet", specs("name, loud=False"), false);
    ASSERT_EQ(result.edits.size(), 1u);
    EXPECT_EQ(result.edits[0].newText, "(greet(\"x\", False), False)");
    EXPECT_EQ(repo.read("b.py"), "greet(greet(\"x\", False), False)\n");
}

TEST_F(SignatureMigratorTest, MultilineCallIsRewritten) {
    repo.write("b.py", "greet(\n    \"x\",\n)\n");
    SourceTree tree(repo.root(), cfg);
    SignatureMigrator migrator(tree, parsers);
    MigrationResult result = migrator.migrate("greet", specs("name, loud=False"), false);
    EXPECT_TRUE(result.applied);
    EXPECT_EQ(repo.read("b.py"), "greet(\"x\", False)\n");
}

TEST_F(SignatureMigratorTest, MethodSelfIsNotAPositionalParameter) {
    repo.write("a.py",
               "class Greeter:\n"
               "    def greet(self, name):\n"
               "        return name\n");
    repo.write("b.py", "g = Greeter()\ng.greet(\"x\")\n");
    SourceTree tree(repo.root(), cfg);
    SignatureMigrator migrator(tree, parsers);
    MigrationResult result = migrator.migrate("greet", specs("name, loud=False"), false);
    EXPECT_EQ(result.oldParams, std::vector<std::string>{"name"});
    EXPECT_EQ(repo.read("b.py"), "g = Greeter()\ng.greet(\"x\", False)\n");
}

TEST_F(SignatureMigratorTest, StarParametersEndPositionalList) {
    repo.write("a.py", "def greet(name, *rest, loud=False):\n    return name\n");
    SourceTree tree(repo.root(), cfg);
    SignatureMigrator migrator(tree, parsers);
    MigrationResult result = migrator.migrate("greet", specs("name, loud=False"));
    EXPECT_EQ(result.oldParams, std::vector<std::string>{"name"});
}

TEST_F(SignatureMigratorTest, UnpackedArgumentsAreFlagged) {
    repo.write("b.py", "names = []\ngreet(*names)\n");
    SourceTree tree(repo.root(), cfg);
    SignatureMigrator migrator(tree, parsers);
    MigrationResult result = migrator.migrate("greet", specs("name, loud=False"), false);
    EXPECT_TRUE(result.edits.empty());
    ASSERT_EQ(result.flagged.size(), 1u);
    EXPECT_EQ(result.flagged[0].file, "b.py");
    EXPECT_EQ(result.flagged[0].line, 2);
    EXPECT_EQ(result.flagged[0].reason, "unpacked arguments");
    EXPECT_EQ(repo.read("b.py"), "names = []\ngreet(*names)\n");
}

TEST_F(SignatureMigratorTest, TooManyPositionalArgumentsAreFlagged) {
    repo.write("b.py", "greet(\"x\", \"y\")\n");
    SourceTree tree(repo.root(), cfg);
    SignatureMigrator migrator(tree, parsers);
    MigrationResult result = migrator.migrate("greet", specs("name, loud=False"));
    EXPECT_TRUE(result.edits.empty());
    ASSERT_EQ(result.flagged.size(), 1u);
    EXPECT_EQ(result.flagged[0].reason, "more positional arguments than parameters");
}

TEST_F(SignatureMigratorTest, HeuristicCallSitesAreFlaggedNotRewritten) {
    repo.write("web/app.js", "greet('web');\n");
    SourceTree tree(repo.root(), cfg);
    SignatureMigrator migrator(tree, parsers);
    MigrationResult result = migrator.migrate("greet", specs("name, loud=False"), false);

    ASSERT_EQ(result.edits.size(), 1u);
    EXPECT_EQ(result.edits[0].file, "b.py");
    ASSERT_EQ(result.flagged.size(), 1u);
    EXPECT_EQ(result.flagged[0].file, "web/app.js");
    EXPECT_EQ(result.flagged[0].reason, "heuristic parser; call site not rewritten");
    EXPECT_EQ(repo.read("web/app.js"), "greet('web');\n");
}

TEST_F(SignatureMigratorTest, MissingDefinitionIsAnError) {
    SourceTree tree(repo.root(), cfg);
    SignatureMigrator migrator(tree, parsers);
    MigrationResult result = migrator.migrate("farewell", specs("name"));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "Could not find definition of 'farewell'");
    EXPECT_TRUE(result.edits.empty());
    EXPECT_FALSE(result.applied);
}

TEST_F(SignatureMigratorTest, FirstDefinitionInPathOrderWins) {
    repo.write("z.py", "def greet(first, second):\n    pass\n");
    SourceTree tree(repo.root(), cfg);
    SignatureMigrator migrator(tree, parsers);
    MigrationResult result = migrator.migrate("greet", specs("name"));
    EXPECT_EQ(result.oldParams, std::vector<std::string>{"name"});
}
