//
// Knowledge Vault
//
// Copyright (c) 2025 Adrian Sutherland
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//

#include <gtest/gtest.h>

#include <QTemporaryDir>

#include "core/ContextRetriever.h"
#include "core/DocumentStore.h"
#include "core/TextChunker.h"
#include "test_fakes.h"

namespace {

const QString kDockRules = QStringLiteral("Trucks over 40 feet must use Dock 7 or Dock 8 between 6AM and 10AM.");
const QString kDockQuestion = QStringLiteral("Which dock should a 40 foot truck use at 7AM?");

ContextChunk contextChunk(const QString& source, int index, int tokens, double score = 0.9)
{
    ContextChunk c;
    c.content = QStringLiteral("%1#%2").arg(source).arg(index);
    c.sourceDocument = source;
    c.chunkIndex = index;
    c.tokenCount = tokens;
    c.relevanceScore = score;
    return c;
}

} // namespace

class ContextRetrieverTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_store = openTestStore(m_dir.filePath(QStringLiteral("vault.db")));
    }

    QString addDocument(const QString& id, const QString& source, const QString& content,
                        const MetadataMap& metadata = MetadataMap())
    {
        Document doc;
        doc.id = id;
        doc.source = source;
        doc.content = content;
        doc.metadata = metadata;

        Chunk chunk;
        chunk.content = content;
        chunk.embedding = m_embedder.embed(content);
        return m_store->addDocument(doc, {chunk});
    }

    void addWarehouseCorpus()
    {
        addDocument(QStringLiteral("handbook"), QStringLiteral("handbook.md"), kDockRules,
                    {{QStringLiteral("tags"), QStringLiteral("ops,docks")}});
        addDocument(QStringLiteral("weather"), QStringLiteral("weather.md"),
                    QStringLiteral("The forecast calls for rain and snow this weekend."));
        addDocument(QStringLiteral("finance"), QStringLiteral("finance.md"),
                    QStringLiteral("Invoice payment is due before the budget review."));
        addDocument(QStringLiteral("cats"), QStringLiteral("cats.md"),
                    QStringLiteral("The office cat had kittens."));
    }

    QTemporaryDir m_dir;
    std::unique_ptr<DocumentStore> m_store;
    KeywordEmbeddingBackend m_embedder;
};

TEST_F(ContextRetrieverTest, FindsTheDockRule)
{
    addWarehouseCorpus();
    ContextRetriever retriever(*m_store, m_embedder);

    RetrievalConfig config;
    config.topK = 3;
    config.minRelevanceScore = 0.5;
    const RetrievedContext ctx = retriever.retrieveContext(kDockQuestion, config);

    ASSERT_EQ(ctx.chunks.size(), 1u);
    EXPECT_EQ(ctx.query, kDockQuestion);
    EXPECT_EQ(ctx.totalRetrieved, 1);
    EXPECT_EQ(ctx.chunks[0].sourceDocument, QStringLiteral("handbook.md"));
    EXPECT_EQ(ctx.chunks[0].documentId, QStringLiteral("handbook"));
    EXPECT_TRUE(ctx.chunks[0].content.contains(QStringLiteral("Dock 7")));
    EXPECT_GE(ctx.chunks[0].relevanceScore, 0.9);
    EXPECT_LE(ctx.chunks[0].relevanceScore, 1.0);
    EXPECT_EQ(ctx.chunks[0].metadata.value(QStringLiteral("tags")), QStringLiteral("ops,docks"));
    EXPECT_GE(ctx.retrievalTimeMs, 0);
    EXPECT_EQ(ctx.totalTokens(), ctx.chunks[0].tokenCount);
}

TEST_F(ContextRetrieverTest, MetadataCanBeLeftOut)
{
    addWarehouseCorpus();
    ContextRetriever retriever(*m_store, m_embedder);

    RetrievalConfig config;
    config.minRelevanceScore = 0.5;
    config.includeMetadata = false;
    const RetrievedContext ctx = retriever.retrieveContext(kDockQuestion, config);

    ASSERT_EQ(ctx.chunks.size(), 1u);
    EXPECT_TRUE(ctx.chunks[0].metadata.isEmpty());
}

TEST_F(ContextRetrieverTest, BudgetCountsRedactedText)
{
    // Four short addresses grow into four placeholders once redacted
    const QString raw = QStringLiteral("Staff mail a@b.co c@d.io e@f.uk g@h.us");
    Document doc;
    doc.id = QStringLiteral("contacts");
    doc.source = QStringLiteral("contacts.txt");
    doc.content = raw;
    Chunk chunk;
    chunk.content = raw;
    chunk.tokenCount = TextChunker::estimateTokenCount(raw);
    chunk.embedding = m_embedder.embed(raw);
    m_store->addDocument(doc, {chunk});

    const std::vector<Chunk> stored = m_store->getChunks(QStringLiteral("contacts"));
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_TRUE(stored[0].content.contains(QStringLiteral("[EMAIL_REDACTED]")));
    const int storedTokens = TextChunker::estimateTokenCount(stored[0].content);
    EXPECT_EQ(stored[0].tokenCount, storedTokens);
    ASSERT_GT(storedTokens, chunk.tokenCount);

    ContextRetriever retriever(*m_store, m_embedder);
    RetrievalConfig config;
    config.minRelevanceScore = 0.5;
    config.maxContextTokens = chunk.tokenCount + 1;

    const RetrievedContext tight = retriever.retrieveContext(QStringLiteral("Which staff mail?"), config);
    EXPECT_EQ(tight.totalRetrieved, 1);
    EXPECT_TRUE(tight.chunks.empty());
    EXPECT_LE(tight.totalTokens(), config.maxContextTokens);

    config.maxContextTokens = storedTokens;
    const RetrievedContext roomy = retriever.retrieveContext(QStringLiteral("Which staff mail?"), config);
    ASSERT_EQ(roomy.chunks.size(), 1u);
    EXPECT_EQ(roomy.chunks[0].tokenCount, storedTokens);
    EXPECT_LE(roomy.totalTokens(), config.maxContextTokens);
}

TEST_F(ContextRetrieverTest, EmptyVaultGivesEmptyContext)
{
    ContextRetriever retriever(*m_store, m_embedder);

    const RetrievedContext ctx = retriever.retrieveContext(kDockQuestion);
    EXPECT_TRUE(ctx.isEmpty());
    EXPECT_EQ(ctx.totalRetrieved, 0);
    EXPECT_TRUE(ContextRetriever::formatContextForPrompt(ctx).isEmpty());
}

TEST_F(ContextRetrieverTest, DuplicateUploadsAreCollapsed)
{
    addDocument(QStringLiteral("first"), QStringLiteral("handbook.md"), kDockRules);
    addDocument(QStringLiteral("second"), QStringLiteral("handbook.md"), kDockRules);
    ContextRetriever retriever(*m_store, m_embedder);

    RetrievalConfig config;
    config.minRelevanceScore = 0.5;
    const RetrievedContext deduped = retriever.retrieveContext(kDockQuestion, config);
    EXPECT_EQ(deduped.totalRetrieved, 2);
    ASSERT_EQ(deduped.chunks.size(), 1u);
    EXPECT_EQ(deduped.chunks[0].documentId, QStringLiteral("first"));

    config.deduplicate = false;
    EXPECT_EQ(retriever.retrieveContext(kDockQuestion, config).chunks.size(), 2u);
}

TEST_F(ContextRetrieverTest, SessionRestrictsCandidates)
{
    addDocument(QStringLiteral("first"), QStringLiteral("north.md"), kDockRules);
    addDocument(QStringLiteral("second"), QStringLiteral("south.md"), kDockRules);
    const Session session = m_store->createSession(QStringLiteral("South site"));
    m_store->addDocumentToSession(session.id, QStringLiteral("second"));
    ContextRetriever retriever(*m_store, m_embedder);

    RetrievalConfig config;
    config.minRelevanceScore = 0.5;
    config.sessionId = session.id;
    const RetrievedContext ctx = retriever.retrieveContext(kDockQuestion, config);

    ASSERT_EQ(ctx.chunks.size(), 1u);
    EXPECT_EQ(ctx.chunks[0].sourceDocument, QStringLiteral("south.md"));
}

TEST_F(ContextRetrieverTest, EmbeddingFailureYieldsEmptyContext)
{
    addWarehouseCorpus();
    FixedEmbeddingBackend broken(9, true);
    ContextRetriever retriever(*m_store, broken);

    const RetrievedContext ctx = retriever.retrieveContext(kDockQuestion);
    EXPECT_TRUE(ctx.isEmpty());
    EXPECT_EQ(ctx.totalRetrieved, 0);
}

TEST_F(ContextRetrieverTest, QueryWidthMismatchYieldsEmptyContext)
{
    addWarehouseCorpus();
    FixedEmbeddingBackend narrow(2);
    ContextRetriever retriever(*m_store, narrow);

    EXPECT_TRUE(retriever.retrieveContext(kDockQuestion).isEmpty());
}

TEST_F(ContextRetrieverTest, StreamReportsSameChunksInOrder)
{
    addWarehouseCorpus();
    addDocument(QStringLiteral("closed"), QStringLiteral("closures.md"), QStringLiteral("Dock 9 is closed."));
    addDocument(QStringLiteral("parking"), QStringLiteral("parking.md"),
                QStringLiteral("Truck drivers park in the north lot."));
    ContextRetriever retriever(*m_store, m_embedder);

    RetrievalConfig config;
    config.minRelevanceScore = 0.1;
    const RetrievedContext direct = retriever.retrieveContext(kDockQuestion, config);
    ASSERT_EQ(direct.chunks.size(), 3u);

    QFuture<ContextChunk> stream = retriever.retrieveContextStream(kDockQuestion, config);
    stream.waitForFinished();
    const QList<ContextChunk> streamed = stream.results();

    ASSERT_EQ(streamed.size(), 3);
    for (int i = 0; i < streamed.size(); ++i) {
        EXPECT_EQ(streamed[i].documentId, direct.chunks[static_cast<size_t>(i)].documentId);
        EXPECT_DOUBLE_EQ(streamed[i].relevanceScore, direct.chunks[static_cast<size_t>(i)].relevanceScore);
    }
    EXPECT_EQ(streamed[0].sourceDocument, QStringLiteral("handbook.md"));
}

TEST_F(ContextRetrieverTest, WindowStatsReflectStore)
{
    addWarehouseCorpus();
    ContextRetriever retriever(*m_store, m_embedder);

    const ContextWindowStats stats = retriever.contextWindowStats(4096);
    EXPECT_EQ(stats.availableTokens, 4096);
    EXPECT_EQ(stats.documentCount, 4);
    EXPECT_EQ(stats.chunkCount, 4);
    EXPECT_GT(stats.usedTokens, 0);
    EXPECT_GE(stats.oldestDocumentAgeMs, stats.newestDocumentAgeMs);
}

TEST(ContextRetrieverStaticTest, DeduplicateKeepsFirstPerSourceAndOrdinal)
{
    const auto out = ContextRetriever::deduplicate({contextChunk("a.md", 0, 5, 0.9),
                                                    contextChunk("a.md", 1, 5, 0.8),
                                                    contextChunk("a.md", 0, 5, 0.7),
                                                    contextChunk("b.md", 0, 5, 0.6)});
    ASSERT_EQ(out.size(), 3u);
    EXPECT_DOUBLE_EQ(out[0].relevanceScore, 0.9);
    EXPECT_EQ(out[1].chunkIndex, 1);
    EXPECT_EQ(out[2].sourceDocument, QStringLiteral("b.md"));
}

TEST(ContextRetrieverStaticTest, BudgetStopsAtFirstOverflow)
{
    const std::vector<ContextChunk> ranked{contextChunk("a.md", 0, 5), contextChunk("a.md", 1, 10),
                                           contextChunk("a.md", 2, 3)};

    EXPECT_EQ(ContextRetriever::limitToBudget(ranked, 15).size(), 2u);
    EXPECT_EQ(ContextRetriever::limitToBudget(ranked, 14).size(), 1u);
    EXPECT_EQ(ContextRetriever::limitToBudget(ranked, 18).size(), 3u);
    EXPECT_TRUE(ContextRetriever::limitToBudget(ranked, 0).empty());
}

TEST(ContextRetrieverStaticTest, PromptTemplate)
{
    RetrievedContext ctx;
    ctx.query = QStringLiteral("Which dock?");
    ContextChunk chunk = contextChunk("handbook.md", 0, 2, 0.876);
    chunk.content = QStringLiteral("Use Dock 7.");
    chunk.metadata.insert(QStringLiteral("tags"), QStringLiteral("ops,docks"));
    ctx.chunks.push_back(chunk);

    const QString expected = QStringLiteral(
        "=== RELEVANT CONTEXT ===\n\n"
        "Retrieved 1 relevant document excerpts:\n\n"
        "--- Context 1 ---\n"
        "Source: handbook.md\n"
        "Relevance: 87%\n"
        "Tags: ops,docks\n"
        "\n"
        "Use Dock 7.\n\n"
        "=== END CONTEXT ===\n\n"
        "Use the above context to answer the user's question. Cite specific sources when possible.\n\n"
        "User Question: Which dock?\n");

    EXPECT_EQ(ContextRetriever::formatContextForPrompt(ctx), expected);
}

TEST(ContextRetrieverStaticTest, ConfigNormalization)
{
    RetrievalConfig config;
    config.topK = 0;
    config.minRelevanceScore = 1.5;
    config.maxContextTokens = -1;
    RetrievalConfig n = config.normalized();
    EXPECT_EQ(n.topK, 1);
    EXPECT_DOUBLE_EQ(n.minRelevanceScore, 1.0);
    EXPECT_EQ(n.maxContextTokens, 0);

    config.topK = 500;
    EXPECT_EQ(config.normalized().topK, 50);
}
