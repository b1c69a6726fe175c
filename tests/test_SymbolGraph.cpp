#include <gtest/gtest.h>
#include "TestRepo.h"
#include "analysis/GraphQuery.h"
#include "analysis/ParserRegistry.h"
#include "analysis/SymbolGraph.h"
#include "core/SourceTree.h"

class GraphBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo.write("a.py", "def greet(name):\n    return name\n");
        repo.write("b.py", "from a import greet\n\ngreet(\"x\")\n");
        repo.write("web/app.js", "function boot() {\n  greet('web');\n}\n");
    }

    TestRepo repo;
    Config cfg;
    ParserRegistry parsers = ParserRegistry::createDefault();
};

TEST_F(GraphBuilderTest, CollectsDefinitionsAndCallsAcrossFiles) {
    SourceTree tree(repo.root(), cfg);
    GraphBuilder builder(tree, parsers);
    CrossRefGraph graph = builder.build(false);

    EXPECT_EQ(graph.fileTable.size(), 3u);
    EXPECT_EQ(graph.fileHash.size(), 3u);

    GraphQuery query(graph);
    auto occ = query.query("greet");
    ASSERT_EQ(occ.size(), 3u);
    EXPECT_EQ(occ[0].file, "a.py");
    EXPECT_EQ(occ[0].line, 1);
    EXPECT_EQ(occ[0].kind, OccurrenceKind::Definition);
    EXPECT_EQ(occ[1].file, "b.py");
    EXPECT_EQ(occ[1].line, 3);
    EXPECT_EQ(occ[1].kind, OccurrenceKind::Call);
    EXPECT_EQ(occ[2].file, "web/app.js");
    EXPECT_EQ(occ[2].line, 2);
    EXPECT_EQ(occ[2].kind, OccurrenceKind::Call);

    EXPECT_EQ(graph.fileTable.at("a.py").confidence, "exact");
    EXPECT_EQ(graph.fileTable.at("web/app.js").confidence, "heuristic");
}

TEST_F(GraphBuilderTest, ShortNamesAreExcluded) {
    repo.write("c.py", "x = 1\nlonger = x\n");
    SourceTree tree(repo.root(), cfg);
    GraphBuilder builder(tree, parsers, 2);
    CrossRefGraph graph = builder.build(false);
    EXPECT_EQ(graph.crossRefs.count("x"), 0u);
    EXPECT_EQ(graph.crossRefs.count("longer"), 1u);
}

TEST_F(GraphBuilderTest, PersistsAndReloadsIdenticalGraph) {
    SourceTree tree(repo.root(), cfg);
    GraphBuilder builder(tree, parsers);
    CrossRefGraph graph = builder.build(false);

    ASSERT_TRUE(fs::exists(builder.graphPath()));
    EXPECT_EQ(builder.graphPath(), repo.path() / ".codemap" / "xref_graph.json");

    auto loaded = builder.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(graphToJson(*loaded), graphToJson(graph));
}

TEST_F(GraphBuilderTest, RebuildOfUnchangedTreeIsByteIdentical) {
    SourceTree tree(repo.root(), cfg);
    GraphBuilder builder(tree, parsers);
    builder.build(false);
    std::string first = repo.read(".codemap/xref_graph.json");
    builder.build(true);
    std::string second = repo.read(".codemap/xref_graph.json");
    EXPECT_FALSE(first.empty());
    EXPECT_EQ(first, second);
}

TEST_F(GraphBuilderTest, IncrementalBuildReusesUnchangedFiles) {
    SourceTree tree(repo.root(), cfg);
    GraphBuilder builder(tree, parsers);
    builder.build(true);
    EXPECT_EQ(builder.lastStats().reindexed, 3u);

    builder.build(true);
    EXPECT_EQ(builder.lastStats().reused, 3u);
    EXPECT_EQ(builder.lastStats().reindexed, 0u);

    repo.write("b.py", "from a import greet\n\ngreet(\"y\")\ngreet(\"z\")\n");
    CrossRefGraph graph = builder.build(true);
    EXPECT_EQ(builder.lastStats().reused, 2u);
    EXPECT_EQ(builder.lastStats().reindexed, 1u);

    // 出现列表每次重新扫描，反映最新内容
    GraphQuery query(graph);
    EXPECT_EQ(query.usages("greet").size(), 3u);
}

TEST_F(GraphBuilderTest, RemovedCallDisappearsAfterIncrementalBuild) {
    SourceTree tree(repo.root(), cfg);
    GraphBuilder builder(tree, parsers);
    builder.build(true);

    repo.write("b.py", "from a import greet\n");
    CrossRefGraph graph = builder.build(true);
    EXPECT_EQ(builder.lastStats().reindexed, 1u);

    auto occ = GraphQuery(graph).query("greet");
    ASSERT_EQ(occ.size(), 2u);
    for (const auto& o : occ) {
        EXPECT_FALSE(o.file == "b.py" && o.kind == OccurrenceKind::Call) << "stale call at line " << o.line;
    }
    EXPECT_EQ(occ[0].file, "a.py");
    EXPECT_EQ(occ[1].file, "web/app.js");
}

TEST_F(GraphBuilderTest, FullBuildIgnoresCache) {
    SourceTree tree(repo.root(), cfg);
    GraphBuilder builder(tree, parsers);
    builder.build(true);
    builder.build(false);
    EXPECT_EQ(builder.lastStats().reused, 0u);
    EXPECT_EQ(builder.lastStats().reindexed, 3u);
}

TEST_F(GraphBuilderTest, DeletedFilesDisappearFromGraph) {
    SourceTree tree(repo.root(), cfg);
    GraphBuilder builder(tree, parsers);
    builder.build(true);
    fs::remove(repo.path() / "b.py");
    CrossRefGraph graph = builder.build(true);

    EXPECT_EQ(graph.fileTable.count("b.py"), 0u);
    for (const auto& occ : GraphQuery(graph).query("greet")) {
        EXPECT_NE(occ.file, "b.py");
    }
}

TEST_F(GraphBuilderTest, SchemaMismatchOrCorruptGraphIsDiscarded) {
    SourceTree tree(repo.root(), cfg);
    GraphBuilder builder(tree, parsers);

    EXPECT_FALSE(builder.load().has_value());

    repo.write(".codemap/xref_graph.json", R"({"schema_version": 999, "file_hash": {}, "file_table": {}, "cross_refs": {}})");
    EXPECT_FALSE(builder.load().has_value());

    repo.write(".codemap/xref_graph.json", "{ truncated");
    EXPECT_FALSE(builder.load().has_value());

    // 损坏的缓存不影响构建
    CrossRefGraph graph = builder.build(true);
    EXPECT_EQ(graph.fileTable.size(), 3u);
    EXPECT_EQ(builder.lastStats().reused, 0u);
}

TEST_F(GraphBuilderTest, PersistenceFailureStillReturnsGraph) {
    // 数据目录位置被普通文件占用，无法写入
    repo.write(".codemap", "not a directory");
    SourceTree tree(repo.root(), cfg);
    GraphBuilder builder(tree, parsers);
    CrossRefGraph graph = builder.build(true);
    EXPECT_EQ(graph.fileTable.size(), 3u);
    EXPECT_FALSE(GraphQuery(graph).definitions("greet").empty());

    std::string error;
    EXPECT_FALSE(builder.save(graph, &error));
    EXPECT_FALSE(error.empty());
}

TEST_F(GraphBuilderTest, UnsupportedExtensionsAreNotIndexed) {
    cfg.codeExtensions.push_back(".rb");
    repo.write("tool.rb", "def greet\nend\n");
    SourceTree tree(repo.root(), cfg);
    GraphBuilder builder(tree, parsers);
    CrossRefGraph graph = builder.build(false);
    EXPECT_EQ(graph.fileTable.count("tool.rb"), 0u);
}

TEST(ParserRegistryTest, SelectsParserByExtension) {
    ParserRegistry registry = ParserRegistry::createDefault();
    EXPECT_EQ(registry.size(), 2u);
    ASSERT_NE(registry.parserFor("pkg/mod.py"), nullptr);
    EXPECT_EQ(registry.parserFor("pkg/mod.py")->confidence(), "exact");
    ASSERT_NE(registry.parserFor("MOD.PY"), nullptr);
    EXPECT_EQ(registry.parserFor("MOD.PY")->confidence(), "exact");
    ASSERT_NE(registry.parserFor("web/app.tsx"), nullptr);
    EXPECT_EQ(registry.parserFor("web/app.tsx")->confidence(), "heuristic");
    EXPECT_EQ(registry.parserFor("README.md"), nullptr);
    EXPECT_EQ(registry.parserFor("Makefile"), nullptr);
}
