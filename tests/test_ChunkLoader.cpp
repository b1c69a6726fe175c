#include <gtest/gtest.h>
#include "TestRepo.h"
#include "analysis/ParserRegistry.h"
#include "analysis/SymbolGraph.h"
#include "context/ChunkLoader.h"

namespace {

const char* kClientModule =
    "MAX_RETRIES = 5\n"                              // 1
    "\n"                                             // 2
    "def compute_backoff(attempt):\n"                // 3
    "    \"\"\"Exponential backoff delay.\"\"\"\n"   // 4
    "    return 2 ** attempt\n"                      // 5
    "\n"                                             // 6
    "class Client:\n"                                // 7
    "    def send(self, payload):\n"                 // 8
    "        return payload\n";                      // 9

Chunk makeChunk(const std::string& symbol, double score, size_t size) {
    Chunk c;
    c.symbol = symbol;
    c.score = score;
    c.source = std::string(size, 'x');
    return c;
}

} // namespace

TEST(ChunkScoringTest, TokenizeLowercasesAndDropsShortWords) {
    std::vector<std::string> expected = {"retry", "backoff", "for", "http_client"};
    EXPECT_EQ(ChunkLoader::tokenize("Retry backoff for a HTTP_Client!"), expected);
    EXPECT_TRUE(ChunkLoader::tokenize("a b c").empty());
}

TEST(ChunkScoringTest, ExactSymbolNameGetsBonus) {
    Chunk chunk;
    chunk.symbol = "Client.send";
    chunk.source = "def send(self, payload):\n    return payload\n";
    double withName = ChunkLoader::scoreChunk(chunk, {"send"});
    EXPECT_DOUBLE_EQ(withName, 1.0 + ChunkLoader::kExactBonus);

    double partial = ChunkLoader::scoreChunk(chunk, {"payload", "timeout"});
    EXPECT_DOUBLE_EQ(partial, 0.5);

    EXPECT_DOUBLE_EQ(ChunkLoader::scoreChunk(chunk, {"unrelated"}), 0.0);
}

TEST(ChunkScoringTest, SelectionRespectsBudgetAndOrder) {
    std::vector<Chunk> chunks = {
        makeChunk("low", 0.5, 100),
        makeChunk("zero", 0.0, 10),
        makeChunk("high", 2.0, 100),
        makeChunk("mid", 1.0, 100),
    };
    auto selected = ChunkLoader::selectWithinBudget(chunks, 250);
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_EQ(selected[0].symbol, "high");
    EXPECT_EQ(selected[1].symbol, "mid");
}

TEST(ChunkScoringTest, FirstChunkIsKeptEvenWhenOverBudget) {
    auto selected = ChunkLoader::selectWithinBudget({makeChunk("big", 1.0, 500), makeChunk("small", 0.5, 10)}, 100);
    ASSERT_EQ(selected.size(), 1u);
    EXPECT_EQ(selected[0].symbol, "big");
}

TEST(ChunkScoringTest, EqualScoresKeepOriginalOrder) {
    auto selected = ChunkLoader::selectWithinBudget(
        {makeChunk("first", 1.0, 10), makeChunk("second", 1.0, 10), makeChunk("third", 1.0, 10)}, 1000);
    ASSERT_EQ(selected.size(), 3u);
    EXPECT_EQ(selected[0].symbol, "first");
    EXPECT_EQ(selected[1].symbol, "second");
    EXPECT_EQ(selected[2].symbol, "third");
}

class ChunkLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo.write("a.py", kClientModule);
        repo.write("b.py", "def unrelated_helper():\n    return 0\n");
    }

    TestRepo repo;
    Config cfg;
    ParserRegistry parsers = ParserRegistry::createDefault();
};

TEST_F(ChunkLoaderTest, BestMatchingChunkComesFirst) {
    SourceTree tree(repo.root(), cfg);
    ChunkLoader loader(tree, parsers);
    auto chunks = loader.relevantChunks("send", nullptr, 3000);
    ASSERT_FALSE(chunks.empty());
    EXPECT_EQ(chunks[0].symbol, "Client.send");
    EXPECT_EQ(chunks[0].file, "a.py");
    EXPECT_EQ(chunks[0].kind, "method");
    EXPECT_EQ(chunks[0].startLine, 8);
}

TEST_F(ChunkLoaderTest, ContextBlockHasHeadersAndMarkers) {
    SourceTree tree(repo.root(), cfg);
    ChunkLoader loader(tree, parsers);
    std::string context = loader.loadContextForQuery("exponential backoff", nullptr, 3000);
    EXPECT_EQ(context.rfind("[RELEVANT CODE CHUNKS]", 0), 0u);
    EXPECT_NE(context.find("# a.py::compute_backoff (L3-5)\n"), std::string::npos);
    EXPECT_NE(context.find("\"\"\"Exponential backoff delay.\"\"\""), std::string::npos);
    const std::string tail = "\n[/RELEVANT CODE CHUNKS]";
    ASSERT_GE(context.size(), tail.size());
    EXPECT_EQ(context.substr(context.size() - tail.size()), tail);
}

TEST_F(ChunkLoaderTest, NoMatchesGiveEmptyContext) {
    SourceTree tree(repo.root(), cfg);
    ChunkLoader loader(tree, parsers);
    EXPECT_EQ(loader.loadContextForQuery("zebra quantum", nullptr, 3000), "");
    EXPECT_EQ(loader.loadContextForQuery("?!", nullptr, 3000), "");
}

TEST_F(ChunkLoaderTest, GraphNarrowsCandidateFiles) {
    SourceTree tree(repo.root(), cfg);
    GraphBuilder builder(tree, parsers);
    CrossRefGraph graph = builder.build(false);

    ChunkLoader loader(tree, parsers);
    auto files = loader.candidateFiles(ChunkLoader::tokenize("compute_backoff"), &graph);
    EXPECT_EQ(files, std::vector<std::string>{"a.py"});

    // 图中没有任何命中时退回全部文件
    auto all = loader.candidateFiles(ChunkLoader::tokenize("zebra"), &graph);
    EXPECT_EQ(all, (std::vector<std::string>{"a.py", "b.py"}));
}

TEST_F(ChunkLoaderTest, FileLimitCapsCandidates) {
    SourceTree tree(repo.root(), cfg);
    ChunkLoader loader(tree, parsers, 1);
    EXPECT_EQ(loader.candidateFiles({"zebra"}, nullptr).size(), 1u);
}

TEST_F(ChunkLoaderTest, SymbolChunkReturnsDefinitionOnly) {
    SourceTree tree(repo.root(), cfg);
    ChunkLoader loader(tree, parsers);
    auto chunk = loader.loadSymbolChunk("a.py", "compute_backoff");
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(*chunk,
              "def compute_backoff(attempt):\n"
              "    \"\"\"Exponential backoff delay.\"\"\"\n"
              "    return 2 ** attempt\n");
}

TEST_F(ChunkLoaderTest, SymbolChunkFallsBackToLineWindow) {
    SourceTree tree(repo.root(), cfg);
    ChunkLoader loader(tree, parsers);
    auto chunk = loader.loadSymbolChunk("a.py", "MAX_RETRIES");
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(*chunk, kClientModule);

    EXPECT_FALSE(loader.loadSymbolChunk("a.py", "not_there").has_value());
    EXPECT_FALSE(loader.loadSymbolChunk("missing.py", "send").has_value());
}

TEST(ChunkScoringTest, FormatChunksWrapsHeadersAndSource) {
    EXPECT_EQ(ChunkLoader::formatChunks({}), "");

    Chunk chunk;
    chunk.file = "a.py";
    chunk.symbol = "f";
    chunk.startLine = 1;
    chunk.endLine = 2;
    chunk.source = "def f():\n    pass\n";
    EXPECT_EQ(ChunkLoader::formatChunks({chunk}),
              "[RELEVANT CODE CHUNKS]\n\n# a.py::f (L1-2)\ndef f():\n    pass\n\n[/RELEVANT CODE CHUNKS]");
}

TEST_F(ChunkLoaderTest, MultiFileContextWithSymbols) {
    SourceTree tree(repo.root(), cfg);
    ChunkLoader loader(tree, parsers);
    EXPECT_EQ(loader.loadMultiFileContext({"a.py"}, {"compute_backoff"}, 4000),
              "### a.py\n```\n# compute_backoff\n"
              "def compute_backoff(attempt):\n"
              "    \"\"\"Exponential backoff delay.\"\"\"\n"
              "    return 2 ** attempt\n"
              "```\n");
}

TEST_F(ChunkLoaderTest, MultiFileContextOutlinesTopLevelDeclarations) {
    repo.write("notes.txt", "plain text\n");
    SourceTree tree(repo.root(), cfg);
    ChunkLoader loader(tree, parsers);
    EXPECT_EQ(loader.loadMultiFileContext({"a.py", "missing.py", "notes.txt"}, {}, 4000),
              "### a.py\n```\n"
              "def compute_backoff(attempt): ...\n"
              "class Client: ...\n"
              "```\n"
              "### notes.txt\nplain text\n\n");
}

TEST_F(ChunkLoaderTest, MultiFileContextStopsAtBudget) {
    SourceTree tree(repo.root(), cfg);
    ChunkLoader loader(tree, parsers);
    std::string text = loader.loadMultiFileContext({"a.py", "b.py"}, {}, 10);
    EXPECT_EQ(text.rfind("### a.py\n", 0), 0u);
    EXPECT_EQ(text.find("### b.py"), std::string::npos);
    const std::string tail = "[budget exceeded]\n";
    ASSERT_GE(text.size(), tail.size());
    EXPECT_EQ(text.substr(text.size() - tail.size()), tail);
}
