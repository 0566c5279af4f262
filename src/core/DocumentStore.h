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

#pragma once

#include "VaultTypes.h"
#include "PrivacyRedactor.h"
#include "VectorIndex.h"

#include <QHash>
#include <QMutex>
#include <QString>

#include <atomic>
#include <memory>
#include <optional>
#include <vector>

class VaultCipher;
class QSqlDatabase;
class QSqlQuery;

/**
 * @brief Encrypted, redacting persistence for documents, chunks and sessions.
 *
 * Lifecycle: construct, open(passphrase), initialize(requireIndex), then use.
 * Every other operation throws VaultNotOpenError until both gates passed.
 *
 * Each public call uses its own short-lived SQLite connection, so the store
 * can be shared between threads. Writes to the same document id are
 * serialized through a per-document lock table; unrelated documents proceed
 * concurrently and SQLite's busy timeout covers file level contention.
 *
 * Invariants:
 * - no content reaches disk before it went through the redactor
 * - every stored vector has the store-wide embedding dimension
 * - a document, its chunks and their index rows are written in one transaction
 */
class DocumentStore
{
public:
    struct Options {
        int embeddingDimension = 0;   ///< 0 = adopt from existing rows or the first insert
        int kdfIterations = 200000;   ///< only used when a new vault file is created
        std::shared_ptr<IVectorIndex> index = std::make_shared<FlatVectorIndex>();
    };

    DocumentStore(const QString& dbPath, std::shared_ptr<IPrivacyRedactor> redactor);
    DocumentStore(const QString& dbPath, std::shared_ptr<IPrivacyRedactor> redactor, Options options);
    ~DocumentStore();

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    /**
     * @brief Establish the passphrase. Must be the first call.
     *
     * Creates the key material for a new vault, or verifies the key-check blob
     * of an existing one. A wrong passphrase throws VaultAccessError and leaves
     * the store closed.
     */
    void open(const QString& passphrase);

    /**
     * @brief Create tables, reconcile the embedding dimension and load the index.
     *
     * Runs orphan recovery: chunks without index rows get them rebuilt and
     * index rows without chunks are dropped.
     *
     * @param requireIndexCapability throw IndexUnavailableError instead of
     *        entering degraded mode when the index cannot be attached
     */
    void initialize(bool requireIndexCapability);

    bool isOpen() const;
    bool isDegraded() const;
    int embeddingDimension() const;
    QString databasePath() const { return m_dbPath; }

    /**
     * @brief Store a document and its chunks as one unit.
     *
     * All chunks are validated first (vector width, owning document id); on
     * any failure nothing is written. Content is redacted before it is
     * encrypted. An existing document with the same id is replaced; its
     * session memberships are kept.
     *
     * @return The id of the stored document (generated when empty)
     */
    QString addDocument(const Document& document, const std::vector<Chunk>& chunks);

    /// @return true if a document was deleted
    bool removeDocument(const QString& id);

    std::optional<Document> getDocument(const QString& id) const;
    std::vector<Chunk> getChunks(const QString& documentId) const;
    std::vector<Document> listDocuments() const;
    int documentCount() const;

    /**
     * @brief Rank stored chunks by cosine similarity to @p query.
     *
     * Empty store, degraded mode and "nothing above minScore" all return an
     * empty list. A query whose width disagrees with the store dimension
     * throws DimensionMismatchError.
     *
     * @param sessionId when not empty, only chunks of the session's documents are ranked
     */
    std::vector<SearchHit> searchSimilar(const std::vector<float>& query,
                                         int limit,
                                         double minScore,
                                         const QString& sessionId = QString()) const;

    StoreStats statistics() const;

    // Sessions
    Session createSession(const QString& name, const QString& description = QString());
    std::optional<Session> getSession(const QString& id) const;
    std::vector<Session> listSessions() const;
    bool deleteSession(const QString& id);
    void addDocumentToSession(const QString& sessionId, const QString& documentId);
    bool removeDocumentFromSession(const QString& sessionId, const QString& documentId);
    std::vector<Document> getSessionDocuments(const QString& sessionId) const;

    // Exposed for tests: number of per-document write locks currently held or awaited
    int activeDocumentLockCount() const;

private:
    class Connection;
    class DocumentLock;

    void requireOpen() const;
    void requireReady() const;

    void recoverIndex(QSqlDatabase& db);
    void loadIndex(QSqlDatabase& db);
    QSet<QString> sessionDocumentIds(QSqlDatabase& db, const QString& sessionId) const;

    Document readDocumentRow(const QSqlQuery& query) const;
    Chunk readChunkRow(const QSqlQuery& query) const;
    Session readSessionRow(const QSqlQuery& query) const;

    QString m_dbPath;
    std::shared_ptr<IPrivacyRedactor> m_redactor;
    Options m_options;

    std::unique_ptr<VaultCipher> m_cipher;
    std::atomic<bool> m_initialized{false};
    std::atomic<bool> m_degraded{false};
    std::atomic<int> m_dimension{0};

    mutable QMutex m_lockTableMutex;
    QHash<QString, std::shared_ptr<QMutex>> m_documentLocks;
};
