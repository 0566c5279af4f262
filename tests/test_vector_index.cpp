#include <gtest/gtest.h>

#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QStringList>

#include <limits>

#include "core/RagUtils.h"
#include "core/VectorIndex.h"
#include "VaultErrors.h"

namespace {

IndexEntry entry(const QString& chunkId, const QString& documentId, qint64 seq, std::vector<float> v)
{
    IndexEntry e;
    e.chunkId = chunkId;
    e.documentId = documentId;
    e.seq = seq;
    e.vector = std::move(v);
    return e;
}

} // namespace

TEST(RagUtilsTest, CosineSimilarityBasics)
{
    EXPECT_NEAR(RagUtils::cosineSimilarity({1.0f, 0.0f}, {1.0f, 0.0f}), 1.0, 1e-9);
    EXPECT_NEAR(RagUtils::cosineSimilarity({1.0f, 0.0f}, {0.0f, 1.0f}), 0.0, 1e-9);
    EXPECT_NEAR(RagUtils::cosineSimilarity({1.0f, 0.0f}, {-1.0f, 0.0f}), -1.0, 1e-9);

    // Degenerate input never produces NaN
    EXPECT_EQ(RagUtils::cosineSimilarity({0.0f, 0.0f}, {1.0f, 1.0f}), 0.0);
    EXPECT_EQ(RagUtils::cosineSimilarity({}, {}), 0.0);
    EXPECT_EQ(RagUtils::cosineSimilarity({1.0f}, {1.0f, 2.0f}), 0.0);
}

TEST(RagUtilsTest, RelevanceScoreIsClamped)
{
    EXPECT_EQ(RagUtils::relevanceScore({1.0f, 0.0f}, {-1.0f, 0.0f}), 0.0);
    EXPECT_NEAR(RagUtils::relevanceScore({3.0f, 4.0f}, {3.0f, 4.0f}), 1.0, 1e-9);
}

TEST(RagUtilsTest, VectorBlobRoundTripsAndRejectsOddSizes)
{
    const std::vector<float> v{0.25f, -1.5f, 3.0f};
    const QByteArray blob = RagUtils::vectorToBlob(v);
    EXPECT_EQ(blob.size(), 12);
    EXPECT_EQ(RagUtils::blobToVector(blob), v);

    EXPECT_TRUE(RagUtils::blobToVector(QByteArray("abcde")).empty());
}

/**
 * @brief The vault schema applies cleanly to a fresh database, statement by statement.
 */
TEST(RagUtilsTest, SchemaCreatesAllTables)
{
    {
        QSqlDatabase db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), QStringLiteral("test_vault_schema"));
        db.setDatabaseName(QStringLiteral(":memory:"));
        ASSERT_TRUE(db.open()) << db.lastError().text().toStdString();

        QSqlQuery q(db);
        for (const char* statement : {kVaultSchemaPragma, kVaultSchemaMeta, kVaultSchemaDocuments,
                                      kVaultSchemaChunks, kVaultSchemaChunksIndex, kVaultSchemaVecIndex,
                                      kVaultSchemaSessions, kVaultSchemaSessionDocuments}) {
            ASSERT_TRUE(q.exec(QString::fromUtf8(statement))) << q.lastError().text().toStdString();
        }

        ASSERT_TRUE(q.exec(QStringLiteral("SELECT name FROM sqlite_master WHERE type='table' ORDER BY name")));
        QStringList tables;
        while (q.next()) {
            tables << q.value(0).toString();
        }
        EXPECT_EQ(tables, QStringList({QStringLiteral("chunks"), QStringLiteral("documents"),
                                       QStringLiteral("session_documents"), QStringLiteral("sessions"),
                                       QStringLiteral("vault_meta"), QStringLiteral("vec_index")}));
        db.close();
    }
    QSqlDatabase::removeDatabase(QStringLiteral("test_vault_schema"));
}

TEST(FlatVectorIndexTest, RanksByScoreThenInsertionOrder)
{
    FlatVectorIndex index;
    ASSERT_TRUE(index.attach(2));

    index.insert(entry("c-late", "d1", 5, {1.0f, 0.0f}));
    index.insert(entry("c-early", "d2", 1, {2.0f, 0.0f}));
    index.insert(entry("c-mid", "d1", 3, {1.0f, 1.0f}));
    index.insert(entry("c-off", "d3", 4, {0.0f, 1.0f}));

    const auto matches = index.search({1.0f, 0.0f}, 10, 0.0);

    ASSERT_EQ(matches.size(), 4u);
    EXPECT_EQ(matches[0].chunkId, QStringLiteral("c-early")); // tie at 1.0 broken by seq
    EXPECT_EQ(matches[1].chunkId, QStringLiteral("c-late"));
    EXPECT_EQ(matches[2].chunkId, QStringLiteral("c-mid"));
    EXPECT_EQ(matches[3].chunkId, QStringLiteral("c-off"));
    EXPECT_NEAR(matches[2].score, 0.7071, 1e-3);
    EXPECT_EQ(matches[3].score, 0.0);
}

TEST(FlatVectorIndexTest, LimitMinScoreAndDocumentFilter)
{
    FlatVectorIndex index;
    ASSERT_TRUE(index.attach(0));
    index.insert(entry("a", "d1", 1, {1.0f, 0.0f}));
    index.insert(entry("b", "d2", 2, {1.0f, 0.1f}));
    index.insert(entry("c", "d2", 3, {0.0f, 1.0f}));

    EXPECT_EQ(index.search({1.0f, 0.0f}, 1, 0.0).size(), 1u);
    EXPECT_EQ(index.search({1.0f, 0.0f}, 10, 0.5).size(), 2u);
    EXPECT_TRUE(index.search({1.0f, 0.0f}, 0, 0.0).empty());

    const auto filtered = index.search({1.0f, 0.0f}, 10, 0.0, QSet<QString>{QStringLiteral("d2")});
    ASSERT_EQ(filtered.size(), 2u);
    EXPECT_EQ(filtered[0].chunkId, QStringLiteral("b"));

    EXPECT_TRUE(index.search({1.0f, 0.0f}, 10, 0.0, QSet<QString>{}).empty());
}

TEST(FlatVectorIndexTest, AdoptsFirstWidthAndRejectsOthers)
{
    FlatVectorIndex index;
    ASSERT_TRUE(index.attach(0));
    index.insert(entry("a", "d1", 1, {1.0f, 2.0f, 3.0f}));

    try {
        index.insert(entry("b", "d1", 2, {1.0f, 2.0f}));
        FAIL() << "expected DimensionMismatchError";
    } catch (const DimensionMismatchError& e) {
        EXPECT_EQ(e.expected(), 3);
        EXPECT_EQ(e.actual(), 2);
    }
    EXPECT_EQ(index.size(), 1);
    EXPECT_FALSE(index.attach(5));
}

TEST(FlatVectorIndexTest, ReinsertReplacesAndRemoveDropsDocument)
{
    FlatVectorIndex index;
    ASSERT_TRUE(index.attach(2));
    index.insert(entry("a", "d1", 1, {1.0f, 0.0f}));
    index.insert(entry("a", "d1", 2, {0.0f, 1.0f}));
    index.insert(entry("b", "d2", 3, {0.0f, 1.0f}));
    EXPECT_EQ(index.size(), 2);

    const auto matches = index.search({0.0f, 1.0f}, 10, 0.9);
    EXPECT_EQ(matches.size(), 2u);

    index.removeDocument(QStringLiteral("d1"));
    EXPECT_EQ(index.size(), 1);
    index.clear();
    EXPECT_EQ(index.size(), 0);
}

TEST(FlatVectorIndexTest, UnattachedIndexReturnsNothing)
{
    FlatVectorIndex index;
    EXPECT_FALSE(index.isAttached());
    index.insert(entry("a", "d1", 1, {1.0f}));
    EXPECT_TRUE(index.search({1.0f}, 5, 0.0).empty());
}

TEST(FlatVectorIndexTest, NonFiniteScoresAreSkipped)
{
    FlatVectorIndex index;
    ASSERT_TRUE(index.attach(2));

    index.insert(entry("ok", "d1", 1, {1.0f, 0.0f}));
    index.insert(entry("nan", "d2", 2, {std::numeric_limits<float>::quiet_NaN(), 1.0f}));
    index.insert(entry("inf", "d3", 3, {std::numeric_limits<float>::infinity(), 0.0f}));
    index.insert(entry("ok2", "d1", 4, {1.0f, 1.0f}));

    const auto matches = index.search({1.0f, 0.0f}, 10, 0.0);

    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].chunkId, QStringLiteral("ok"));
    EXPECT_EQ(matches[1].chunkId, QStringLiteral("ok2"));
}
