//
// Knowledge Vault
//
// Copyright (c) 2025 Adrian Sutherland
//

#include <gtest/gtest.h>

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "core/VaultConfig.h"
#include "VaultErrors.h"

namespace {

// Removes KNOWLEDGE_VAULT_API_KEY for the lifetime of a test and restores it afterwards
class ApiKeyEnvGuard {
public:
    ApiKeyEnvGuard() : m_saved(qgetenv("KNOWLEDGE_VAULT_API_KEY")) { qunsetenv("KNOWLEDGE_VAULT_API_KEY"); }
    ~ApiKeyEnvGuard()
    {
        if (m_saved.isEmpty()) {
            qunsetenv("KNOWLEDGE_VAULT_API_KEY");
        } else {
            qputenv("KNOWLEDGE_VAULT_API_KEY", m_saved);
        }
    }

private:
    QByteArray m_saved;
};

} // namespace

TEST(VaultConfigTest, DefaultsWhenEmpty)
{
    ApiKeyEnvGuard guard;
    const VaultConfig cfg = VaultConfig::fromJson(QJsonObject());

    EXPECT_EQ(cfg.chunking.maxChunkTokens, 512);
    EXPECT_EQ(cfg.chunking.overlapWords, 50);
    EXPECT_EQ(cfg.chunking.minChunkTokens, 10);
    EXPECT_TRUE(cfg.chunking.preserveParagraphs);
    EXPECT_EQ(cfg.retrieval.topK, 5);
    EXPECT_DOUBLE_EQ(cfg.retrieval.minRelevanceScore, 0.7);
    EXPECT_EQ(cfg.retrieval.maxContextTokens, 2048);
    EXPECT_EQ(cfg.store.kdfIterations, 200000);
    EXPECT_TRUE(cfg.store.requireIndex);
    EXPECT_EQ(cfg.backend.baseUrl, QStringLiteral("http://127.0.0.1:8080/v1"));
    EXPECT_TRUE(cfg.backend.apiKey.isEmpty());
    EXPECT_NO_THROW(cfg.validate());
}

TEST(VaultConfigTest, ParsesSectionsAndClampsValues)
{
    ApiKeyEnvGuard guard;
    const QJsonObject root = QJsonDocument::fromJson(R"({
        "store": {"path": "/tmp/vault.db", "embedding_dimension": 384, "kdf_iterations": 5, "require_index": false},
        "chunking": {"max_chunk_tokens": 256, "overlap_words": -4, "min_chunk_tokens": 999},
        "retrieval": {"top_k": 500, "min_relevance_score": 0.42, "deduplicate": false},
        "generation": {"max_tokens": 64, "temperature": 9.0, "stop": ["</s>", "", 7]},
        "backend": {"embedding_model": " \"nomic-embed-text\" ", "api_key": "from-file", "unknown": true}
    })").object();

    const VaultConfig cfg = VaultConfig::fromJson(root);

    EXPECT_EQ(cfg.store.path, QStringLiteral("/tmp/vault.db"));
    EXPECT_EQ(cfg.resolvedStorePath(), QStringLiteral("/tmp/vault.db"));
    EXPECT_EQ(cfg.store.embeddingDimension, 384);
    EXPECT_EQ(cfg.store.kdfIterations, 1000);
    EXPECT_FALSE(cfg.store.requireIndex);

    EXPECT_EQ(cfg.chunking.maxChunkTokens, 256);
    EXPECT_EQ(cfg.chunking.overlapWords, 0);
    EXPECT_EQ(cfg.chunking.minChunkTokens, 256);

    EXPECT_EQ(cfg.retrieval.topK, 50);
    EXPECT_DOUBLE_EQ(cfg.retrieval.minRelevanceScore, 0.42);
    EXPECT_FALSE(cfg.retrieval.deduplicate);

    EXPECT_EQ(cfg.generation.maxTokens, 64);
    EXPECT_DOUBLE_EQ(cfg.generation.temperature, 2.0);
    EXPECT_EQ(cfg.generation.stopSequences, QStringList({QStringLiteral("</s>")}));

    EXPECT_EQ(cfg.backend.embeddingModel, QStringLiteral("nomic-embed-text"));
    EXPECT_EQ(cfg.backend.apiKey, QStringLiteral("from-file"));
}

TEST(VaultConfigTest, EnvironmentApiKeyWins)
{
    ApiKeyEnvGuard guard;
    qputenv("KNOWLEDGE_VAULT_API_KEY", QByteArray("from-env"));

    QJsonObject backend;
    backend.insert(QStringLiteral("api_key"), QStringLiteral("from-file"));
    QJsonObject root;
    root.insert(QStringLiteral("backend"), backend);

    EXPECT_EQ(VaultConfig::fromJson(root).backend.apiKey, QStringLiteral("from-env"));
}

TEST(VaultConfigTest, RemoteBackendRequiresOptIn)
{
    VaultConfig cfg;
    cfg.backend.baseUrl = QStringLiteral("https://api.example.com/v1");
    EXPECT_THROW(cfg.validate(), VaultError);

    cfg.backend.allowRemote = true;
    EXPECT_NO_THROW(cfg.validate());

    cfg.backend.baseUrl = QStringLiteral("not a url");
    EXPECT_THROW(cfg.validate(), VaultError);
}

TEST(VaultConfigTest, LoopbackDetection)
{
    EXPECT_TRUE(VaultConfig::isLoopbackUrl(QStringLiteral("http://localhost:11434")));
    EXPECT_TRUE(VaultConfig::isLoopbackUrl(QStringLiteral("http://models.localhost/v1")));
    EXPECT_TRUE(VaultConfig::isLoopbackUrl(QStringLiteral("http://127.0.0.1:8080/v1")));
    EXPECT_TRUE(VaultConfig::isLoopbackUrl(QStringLiteral("http://127.1.2.3")));
    EXPECT_TRUE(VaultConfig::isLoopbackUrl(QStringLiteral("http://[::1]:8080")));

    EXPECT_FALSE(VaultConfig::isLoopbackUrl(QStringLiteral("http://10.0.0.5:8080")));
    EXPECT_FALSE(VaultConfig::isLoopbackUrl(QStringLiteral("http://127.0.0.1.example.com")));
    EXPECT_FALSE(VaultConfig::isLoopbackUrl(QStringLiteral("http://localhost.example.com")));
    EXPECT_FALSE(VaultConfig::isLoopbackUrl(QString()));
}

TEST(VaultConfigTest, SaveAndLoadRoundTrip)
{
    ApiKeyEnvGuard guard;
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/config.json"));

    VaultConfig cfg;
    cfg.retrieval.topK = 7;
    cfg.chunking.overlapWords = 12;
    cfg.backend.generationModel = QStringLiteral("llama-3.2-3b");
    cfg.generation.stopSequences = QStringList{QStringLiteral("###")};
    ASSERT_TRUE(cfg.saveToFile(path));

    const VaultConfig loaded = VaultConfig::loadFromFile(path);
    EXPECT_EQ(loaded.retrieval.topK, 7);
    EXPECT_EQ(loaded.chunking.overlapWords, 12);
    EXPECT_EQ(loaded.backend.generationModel, QStringLiteral("llama-3.2-3b"));
    EXPECT_EQ(loaded.generation.stopSequences, cfg.generation.stopSequences);

#ifdef Q_OS_UNIX
    const QFileDevice::Permissions perms = QFile::permissions(path);
    EXPECT_FALSE(perms.testFlag(QFileDevice::ReadGroup));
    EXPECT_FALSE(perms.testFlag(QFileDevice::ReadOther));
#endif
}

TEST(VaultConfigTest, MissingFileGivesDefaultsAndBrokenFileThrows)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    EXPECT_EQ(VaultConfig::loadFromFile(dir.filePath(QStringLiteral("absent.json"))).retrieval.topK, 5);

    const QString broken = dir.filePath(QStringLiteral("broken.json"));
    QFile file(broken);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();
    EXPECT_THROW(VaultConfig::loadFromFile(broken), VaultError);
}

TEST(VaultConfigTest, DefaultPathsLiveUnderApplicationFolder)
{
    EXPECT_TRUE(VaultConfig::defaultConfigPath().endsWith(QStringLiteral("KnowledgeVault/config.json")));
    EXPECT_TRUE(VaultConfig::defaultVaultPath().endsWith(QStringLiteral("KnowledgeVault/vault.db")));
}
