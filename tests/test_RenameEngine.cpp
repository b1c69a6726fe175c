#include <gtest/gtest.h>
#include <csignal>
#include <sys/resource.h>
#include "TestRepo.h"
#include "analysis/ParserRegistry.h"
#include "refactor/EditApplier.h"
#include "refactor/RenameEngine.h"
#include "utils/Logger.h"

namespace {

Edit makeEdit(int line, int colStart, const std::string& oldText, const std::string& newText) {
    Edit e;
    e.file = "f.py";
    e.line = line;
    e.colStart = colStart;
    e.colEnd = colStart + static_cast<int>(oldText.size());
    e.oldText = oldText;
    e.newText = newText;
    return e;
}

} // namespace

TEST(EditApplierTest, AppliesEditsRightToLeft) {
    std::string content = "foo(foo)\nbar = foo\n";
    std::vector<Edit> edits = {
        makeEdit(1, 0, "foo", "longer_name"),
        makeEdit(1, 4, "foo", "x"),
        makeEdit(2, 6, "foo", "y"),
    };
    std::string error;
    ASSERT_TRUE(EditApplier::applyToContent(content, edits, &error)) << error;
    EXPECT_EQ(content, "longer_name(x)\nbar = y\n");
}

TEST(EditApplierTest, RejectsStaleOldText) {
    std::string content = "foo = 1\n";
    std::string error;
    EXPECT_FALSE(EditApplier::applyToContent(content, {makeEdit(1, 0, "bar", "baz")}, &error));
    EXPECT_EQ(error, "source changed at line 1, expected 'bar'");
    EXPECT_EQ(content, "foo = 1\n");
}

TEST(EditApplierTest, RejectsOverlappingEdits) {
    std::string content = "abcdef\n";
    std::string error;
    EXPECT_FALSE(EditApplier::applyToContent(content, {makeEdit(1, 0, "abcd", "x"), makeEdit(1, 2, "cd", "y")}, &error));
    EXPECT_EQ(error.rfind("overlapping edits", 0), 0u);
    EXPECT_EQ(content, "abcdef\n");
}

TEST(EditApplierTest, RejectsOutOfRangeLine) {
    std::string content = "one\n";
    std::string error;
    EXPECT_FALSE(EditApplier::applyToContent(content, {makeEdit(7, 0, "one", "two")}, &error));
    EXPECT_EQ(error, "edit location out of range at line 7");
}

TEST(EditApplierTest, ContextLineIsTrimmedAndTruncated) {
    std::string longLine(200, 'a');
    std::string content = "  keep leading   \n" + longLine + "\n";
    EXPECT_EQ(EditApplier::contextLine(content, 1), "  keep leading");
    EXPECT_EQ(EditApplier::contextLine(content, 2).size(), 120u);
}

TEST(EditApplierTest, BatchWritesEachFileAndReportsStaleOnes) {
    TestRepo repo;
    repo.write("f.py", "foo = 1\n");
    repo.write("g.py", "foo = 2\n");
    Config cfg;
    SourceTree tree(repo.root(), cfg);

    Edit first = makeEdit(1, 0, "foo", "baz");
    Edit stale = makeEdit(1, 0, "bar", "baz");
    stale.file = "g.py";
    std::vector<std::string> errors = EditApplier::applyBatch(tree, {stale, first});

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "g.py: source changed at line 1, expected 'bar'");
    EXPECT_EQ(repo.read("f.py"), "baz = 1\n");
    EXPECT_EQ(repo.read("g.py"), "foo = 2\n");
}

TEST(EditApplierTest, BatchInsertsWholeLine) {
    TestRepo repo;
    repo.write("f.py", "def f():\n    pass\n");
    Config cfg;
    SourceTree tree(repo.root(), cfg);

    Edit insert = makeEdit(1, 0, "", "# note\n");
    EXPECT_TRUE(EditApplier::applyBatch(tree, {insert}).empty());
    EXPECT_EQ(repo.read("f.py"), "# note\ndef f():\n    pass\n");
}

class RenameEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo.write("a.py", "def greet(name):\n    return name\n");
        repo.write("b.py", "from a import greet\n\ngreet(\"x\")\n");
    }

    TestRepo repo;
    Config cfg;
    ParserRegistry parsers = ParserRegistry::createDefault();
};

TEST_F(RenameEngineTest, DryRunReportsEditsWithoutWriting) {
    SourceTree tree(repo.root(), cfg);
    RenameEngine engine(tree, parsers);
    RenameResult result = engine.rename("greet", "hello");

    EXPECT_TRUE(result.errors.empty());
    EXPECT_FALSE(result.applied);
    ASSERT_EQ(result.edits.size(), 3u);

    EXPECT_EQ(result.edits[0].file, "a.py");
    EXPECT_EQ(result.edits[0].line, 1);
    EXPECT_EQ(result.edits[0].colStart, 4);
    EXPECT_EQ(result.edits[0].colEnd, 9);
    EXPECT_EQ(result.edits[0].context, "def greet(name):");

    EXPECT_EQ(result.edits[1].file, "b.py");
    EXPECT_EQ(result.edits[1].line, 1);
    EXPECT_EQ(result.edits[2].line, 3);
    EXPECT_EQ(result.edits[2].newText, "hello");

    EXPECT_EQ(repo.read("a.py"), "def greet(name):\n    return name\n");
}

TEST_F(RenameEngineTest, ApplyRewritesEveryFile) {
    SourceTree tree(repo.root(), cfg);
    RenameEngine engine(tree, parsers);
    RenameResult result = engine.rename("greet", "hello", false);

    EXPECT_TRUE(result.applied);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(repo.read("a.py"), "def hello(name):\n    return name\n");
    EXPECT_EQ(repo.read("b.py"), "from a import hello\n\nhello(\"x\")\n");
}

TEST_F(RenameEngineTest, RoundTripRestoresOriginalBytes) {
    std::string a = repo.read("a.py");
    std::string b = repo.read("b.py");
    SourceTree tree(repo.root(), cfg);
    RenameEngine engine(tree, parsers);
    ASSERT_TRUE(engine.rename("greet", "hello", false).applied);
    ASSERT_TRUE(engine.rename("hello", "greet", false).applied);
    EXPECT_EQ(repo.read("a.py"), a);
    EXPECT_EQ(repo.read("b.py"), b);
}

TEST_F(RenameEngineTest, StringsAndCommentsAreUntouchedInPython) {
    repo.write("c.py", "# greet everyone\nmsg = \"greet\"\ngreet(msg)\n");
    SourceTree tree(repo.root(), cfg);
    RenameEngine engine(tree, parsers);
    ASSERT_TRUE(engine.rename("greet", "hello", false).applied);
    EXPECT_EQ(repo.read("c.py"), "# greet everyone\nmsg = \"greet\"\nhello(msg)\n");
}

TEST_F(RenameEngineTest, SubstringMatchesAreNotRenamed) {
    repo.write("c.py", "greeting = 1\ngreet_all = 2\n");
    SourceTree tree(repo.root(), cfg);
    RenameEngine engine(tree, parsers);
    RenameResult result = engine.rename("greet", "hello");
    for (const auto& e : result.edits) {
        EXPECT_NE(e.file, "c.py");
    }
}

TEST_F(RenameEngineTest, JavaScriptFilesUseWordBoundaries) {
    repo.write("web/app.js", "function greet() {}\ngreet();\nconst greeting = 1;\n");
    SourceTree tree(repo.root(), cfg);
    RenameEngine engine(tree, parsers);
    ASSERT_TRUE(engine.rename("greet", "hello", false).applied);
    EXPECT_EQ(repo.read("web/app.js"), "function hello() {}\nhello();\nconst greeting = 1;\n");
}

TEST_F(RenameEngineTest, InvalidIdentifierIsRejected) {
    SourceTree tree(repo.root(), cfg);
    RenameEngine engine(tree, parsers);
    RenameResult result = engine.rename("greet", "9lives", false);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "Invalid identifier: '9lives'");
    EXPECT_TRUE(result.edits.empty());
    EXPECT_FALSE(result.applied);
    EXPECT_EQ(repo.read("a.py"), "def greet(name):\n    return name\n");

    EXPECT_EQ(engine.rename("greet", "a-b").errors, std::vector<std::string>{"Invalid identifier: 'a-b'"});
    EXPECT_EQ(engine.rename("greet", "").errors, std::vector<std::string>{"Invalid identifier: ''"});
}

TEST_F(RenameEngineTest, DollarNameIsRejectedForPythonFiles) {
    SourceTree tree(repo.root(), cfg);
    RenameEngine engine(tree, parsers);
    RenameResult result = engine.rename("greet", "gr$et", false);

    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0], "a.py: 'gr$et' is not a valid identifier in this language");
    EXPECT_EQ(result.errors[1], "b.py: 'gr$et' is not a valid identifier in this language");
    EXPECT_FALSE(result.applied);
    EXPECT_EQ(repo.read("a.py"), "def greet(name):\n    return name\n");
    EXPECT_EQ(repo.read("b.py"), "from a import greet\n\ngreet(\"x\")\n");
}

TEST(RenameEngineJsTest, DollarNameIsAcceptedForJavaScriptFiles) {
    TestRepo web;
    web.write("app.js", "function greet() {}\ngreet();\n");
    Config cfg;
    ParserRegistry parsers = ParserRegistry::createDefault();
    SourceTree tree(web.root(), cfg);
    RenameEngine engine(tree, parsers);
    RenameResult result = engine.rename("greet", "$greet", false);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.applied);
    EXPECT_EQ(web.read("app.js"), "function $greet() {}\n$greet();\n");
}

TEST_F(RenameEngineTest, NonAsciiNameIsApplied) {
    SourceTree tree(repo.root(), cfg);
    RenameEngine engine(tree, parsers);
    RenameResult result = engine.rename("greet", "grüße", false);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.applied);
    EXPECT_EQ(repo.read("a.py"), "def grüße(name):\n    return name\n");
    EXPECT_EQ(repo.read("b.py"), "from a import grüße\n\ngrüße(\"x\")\n");
}

// 文件大小上限让 aa_big.py 的写入失败；root 下权限位拦不住写入，rlimit 可以
TEST_F(RenameEngineTest, WriteFailureNamesFileAndOtherFilesAreStillRewritten) {
    repo.write("aa_big.py", "from a import greet\n#" + std::string(200, '=') + "\ngreet(1)\n");
    SourceTree tree(repo.root(), cfg);
    RenameEngine engine(tree, parsers);

    Logger& logger = Logger::getInstance();
    logger.setConsoleEnabled(false);
    auto previousHandler = std::signal(SIGXFSZ, SIG_IGN);
    rlimit saved{};
    ASSERT_EQ(getrlimit(RLIMIT_FSIZE, &saved), 0);
    rlimit limited = saved;
    limited.rlim_cur = 128;
    ASSERT_EQ(setrlimit(RLIMIT_FSIZE, &limited), 0);

    RenameResult result = engine.rename("greet", "hello", false);

    setrlimit(RLIMIT_FSIZE, &saved);
    std::signal(SIGXFSZ, previousHandler);
    logger.setConsoleEnabled(true);

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].rfind("aa_big.py: ", 0), 0u) << result.errors[0];
    EXPECT_FALSE(result.applied);
    EXPECT_EQ(repo.read("a.py"), "def hello(name):\n    return name\n");
    EXPECT_EQ(repo.read("b.py"), "from a import hello\n\nhello(\"x\")\n");
}

TEST_F(RenameEngineTest, SameNameIsNoOp) {
    SourceTree tree(repo.root(), cfg);
    RenameEngine engine(tree, parsers);
    RenameResult result = engine.rename("greet", "greet", false);
    EXPECT_TRUE(result.edits.empty());
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(RenameEngineTest, UnknownSymbolProducesNoEdits) {
    SourceTree tree(repo.root(), cfg);
    RenameEngine engine(tree, parsers);
    RenameResult result = engine.rename("nothing_here", "other", false);
    EXPECT_TRUE(result.edits.empty());
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(RenameEngineTest, ResultSerializesToJson) {
    SourceTree tree(repo.root(), cfg);
    RenameEngine engine(tree, parsers);
    nlohmann::json j = engine.rename("greet", "hello");
    EXPECT_EQ(j["old_name"], "greet");
    EXPECT_EQ(j["new_name"], "hello");
    EXPECT_EQ(j["applied"], false);
    ASSERT_EQ(j["edits"].size(), 3u);
    EXPECT_EQ(j["edits"][0]["col_start"], 4);
    EXPECT_EQ(j["edits"][0]["old_text"], "greet");
}
