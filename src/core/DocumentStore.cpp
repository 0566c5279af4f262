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

#include "DocumentStore.h"

#include "RagUtils.h"
#include "TextChunker.h"
#include "VaultCipher.h"
#include "VaultErrors.h"
#include "logging_categories.h"

#include <QtSql/QSqlDatabase>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QSet>
#include <QUuid>
#include <QVariant>

#include <algorithm>
#include <cmath>

namespace {

constexpr int kBusyTimeoutMs = 5000;
constexpr const char* kSchemaVersion = "1";

// Column labels bound as additional authenticated data
const QByteArray kDocContent = QByteArrayLiteral("documents.content");
const QByteArray kDocSource = QByteArrayLiteral("documents.source");
const QByteArray kDocMetadata = QByteArrayLiteral("documents.metadata");
const QByteArray kChunkContent = QByteArrayLiteral("chunks.content");
const QByteArray kChunkEmbedding = QByteArrayLiteral("chunks.embedding");
const QByteArray kIndexEmbedding = QByteArrayLiteral("vec_index.embedding");
const QByteArray kSessionName = QByteArrayLiteral("sessions.name");
const QByteArray kSessionDescription = QByteArrayLiteral("sessions.description");

const QString kDocumentColumns = QStringLiteral(
    "d.id, d.content, d.source, d.metadata, d.chunk_count, d.created_at, d.updated_at");
const QString kChunkColumns = QStringLiteral(
    "c.id, c.document_id, c.chunk_index, c.content, c.token_count, c.embedding, c.created_at");
const QString kSessionColumns = QStringLiteral(
    "s.id, s.name, s.description, s.created_at, s.last_accessed_at");

// Strictly increasing wall clock so that "last touched" ordering is total
qint64 monotonicNowMs()
{
    static std::atomic<qint64> last{0};
    qint64 now = QDateTime::currentMSecsSinceEpoch();
    qint64 prev = last.load();
    while (true) {
        const qint64 next = std::max(now, prev + 1);
        if (last.compare_exchange_weak(prev, next)) {
            return next;
        }
    }
}

[[noreturn]] void throwStorage(const QString& what, const QSqlError& error)
{
    throw StorageError(QStringLiteral("DocumentStore: %1 failed: %2")
                           .arg(what, error.text())
                           .toStdString());
}

void execOrThrow(QSqlQuery& query, const QString& what)
{
    if (!query.exec()) {
        throwStorage(what, query.lastError());
    }
}

void execOrThrow(QSqlQuery& query, const char* sql, const QString& what)
{
    if (!query.exec(QString::fromUtf8(sql))) {
        throwStorage(what, query.lastError());
    }
}

std::optional<QByteArray> readMeta(QSqlDatabase& db, const QString& key)
{
    QSqlQuery query(db);
    query.prepare(QStringLiteral("SELECT value FROM vault_meta WHERE key = :key"));
    query.bindValue(QStringLiteral(":key"), key);
    execOrThrow(query, QStringLiteral("read vault_meta '%1'").arg(key));
    if (!query.next()) {
        return std::nullopt;
    }
    return query.value(0).toByteArray();
}

void writeMeta(QSqlDatabase& db, const QString& key, const QByteArray& value)
{
    QSqlQuery query(db);
    query.prepare(QStringLiteral("INSERT OR REPLACE INTO vault_meta (key, value) VALUES (:key, :value)"));
    query.bindValue(QStringLiteral(":key"), key);
    query.bindValue(QStringLiteral(":value"), value);
    execOrThrow(query, QStringLiteral("write vault_meta '%1'").arg(key));
}

int storedDimension(QSqlDatabase& db)
{
    const auto value = readMeta(db, QStringLiteral("embedding_dimension"));
    return value ? value->toInt() : 0;
}

QByteArray metadataToJson(const MetadataMap& metadata)
{
    QJsonObject obj;
    for (auto it = metadata.cbegin(); it != metadata.cend(); ++it) {
        obj.insert(it.key(), it.value());
    }
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

// Values the vault writes itself (sizes, timestamps, counts); everything else is free text
bool isStructuralMetadataKey(const QString& key)
{
    static const QSet<QString> keys = {
        QStringLiteral("file_type"),
        QStringLiteral("file_size"),
        QStringLiteral("uploaded_at"),
        QStringLiteral("page_count"),
    };
    return keys.contains(key);
}

MetadataMap metadataFromJson(const QByteArray& json)
{
    MetadataMap metadata;
    const QJsonObject obj = QJsonDocument::fromJson(json).object();
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        metadata.insert(it.key(), it.value().toString());
    }
    return metadata;
}

/**
 * @brief BEGIN IMMEDIATE transaction that rolls back unless committed.
 *
 * IMMEDIATE takes the write lock up front so two writers never deadlock on a
 * read-to-write upgrade; the busy timeout then queues them.
 */
class WriteTransaction
{
public:
    explicit WriteTransaction(QSqlDatabase& db)
        : m_db(db)
    {
        QSqlQuery begin(m_db);
        execOrThrow(begin, "BEGIN IMMEDIATE", QStringLiteral("begin transaction"));
        m_active = true;
    }

    ~WriteTransaction()
    {
        if (m_active) {
            QSqlQuery rollback(m_db);
            if (!rollback.exec(QStringLiteral("ROLLBACK"))) {
                qCWarning(kv_store) << "DocumentStore: rollback failed:" << rollback.lastError().text();
            }
        }
    }

    void commit()
    {
        QSqlQuery commit(m_db);
        execOrThrow(commit, "COMMIT", QStringLiteral("commit"));
        m_active = false;
    }

private:
    QSqlDatabase& m_db;
    bool m_active = false;
};

} // namespace

/**
 * @brief One short-lived QSQLITE connection with a unique name.
 *
 * QSqlDatabase handles may only be used on the thread that created them, so
 * every public call opens its own. The connection is removed only after all
 * queries using it have gone out of scope (they are declared after it).
 */
class DocumentStore::Connection
{
public:
    Connection(const QString& path, const char* purpose)
        : m_name(QStringLiteral("kv_%1_%2")
                     .arg(QLatin1String(purpose), QUuid::createUuid().toString(QUuid::Id128)))
    {
        m_db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_name);
        m_db.setDatabaseName(path);
        m_db.setConnectOptions(QStringLiteral("QSQLITE_BUSY_TIMEOUT=%1").arg(kBusyTimeoutMs));
        if (!m_db.open()) {
            const QSqlError error = m_db.lastError();
            release();
            throwStorage(QStringLiteral("open '%1'").arg(path), error);
        }

        QSqlError pragmaError;
        {
            QSqlQuery pragma(m_db);
            if (!pragma.exec(QString::fromUtf8(kVaultSchemaPragma))) {
                pragmaError = pragma.lastError();
            }
        }
        if (pragmaError.isValid()) {
            release();
            throwStorage(QStringLiteral("enable foreign keys"), pragmaError);
        }
    }

    ~Connection() { release(); }

    QSqlDatabase& db() { return m_db; }

private:
    void release()
    {
        if (m_db.isValid()) {
            m_db.close();
            m_db = QSqlDatabase();
            QSqlDatabase::removeDatabase(m_name);
        }
    }

    QString m_name;
    QSqlDatabase m_db;
};

DocumentStore::DocumentStore(const QString& dbPath, std::shared_ptr<IPrivacyRedactor> redactor)
    : DocumentStore(dbPath, std::move(redactor), Options())
{
}

DocumentStore::DocumentStore(const QString& dbPath, std::shared_ptr<IPrivacyRedactor> redactor, Options options)
    : m_dbPath(dbPath)
    , m_redactor(std::move(redactor))
    , m_options(std::move(options))
{
    if (!m_redactor) {
        m_redactor = std::make_shared<RegexPrivacyRedactor>();
    }
    m_options.embeddingDimension = std::max(0, m_options.embeddingDimension);
    m_options.kdfIterations = std::max(1, m_options.kdfIterations);
}

DocumentStore::~DocumentStore() = default;

bool DocumentStore::isOpen() const
{
    return m_cipher != nullptr;
}

bool DocumentStore::isDegraded() const
{
    return m_degraded.load();
}

int DocumentStore::embeddingDimension() const
{
    return m_dimension.load();
}

void DocumentStore::requireOpen() const
{
    if (!m_cipher) {
        throw VaultNotOpenError("Vault is locked: call open(passphrase) before any other operation");
    }
}

void DocumentStore::requireReady() const
{
    requireOpen();
    if (!m_initialized.load()) {
        throw VaultNotOpenError("Vault is not initialized: call initialize() after open()");
    }
}

/**
 * @brief Serializes writers of one document id.
 *
 * The table entry lives only while some writer holds or waits for it; the
 * last one out erases it. Copies of the mutex pointer are only taken under
 * the table mutex, so the use count checked there is exact.
 */
class DocumentStore::DocumentLock
{
public:
    DocumentLock(DocumentStore& store, const QString& documentId)
        : m_store(store)
        , m_documentId(documentId)
    {
        {
            QMutexLocker locker(&m_store.m_lockTableMutex);
            auto it = m_store.m_documentLocks.find(m_documentId);
            if (it == m_store.m_documentLocks.end()) {
                it = m_store.m_documentLocks.insert(m_documentId, std::make_shared<QMutex>());
            }
            m_mutex = it.value();
        }
        m_mutex->lock();
    }

    ~DocumentLock()
    {
        m_mutex->unlock();
        QMutexLocker locker(&m_store.m_lockTableMutex);
        auto it = m_store.m_documentLocks.find(m_documentId);
        if (it != m_store.m_documentLocks.end() && it.value() == m_mutex && m_mutex.use_count() == 2) {
            m_store.m_documentLocks.erase(it);
        }
        m_mutex.reset();
    }

    DocumentLock(const DocumentLock&) = delete;
    DocumentLock& operator=(const DocumentLock&) = delete;

private:
    DocumentStore& m_store;
    QString m_documentId;
    std::shared_ptr<QMutex> m_mutex;
};

int DocumentStore::activeDocumentLockCount() const
{
    QMutexLocker locker(&m_lockTableMutex);
    return static_cast<int>(m_documentLocks.size());
}

void DocumentStore::open(const QString& passphrase)
{
    if (m_cipher) {
        throw VaultError("Vault is already open");
    }
    if (passphrase.isEmpty()) {
        throw VaultAccessError("Vault passphrase must not be empty");
    }

    Connection conn(m_dbPath, "open");
    QSqlDatabase& db = conn.db();

    {
        QSqlQuery query(db);
        execOrThrow(query, kVaultSchemaMeta, QStringLiteral("create vault_meta"));
        if (!query.exec(QStringLiteral("PRAGMA journal_mode = WAL"))) {
            qCWarning(kv_store) << "DocumentStore: WAL mode unavailable:" << query.lastError().text();
        }
    }

    const auto salt = readMeta(db, QStringLiteral("kdf_salt"));
    if (!salt) {
        const QByteArray newSalt = VaultCipher::generateSalt();
        auto cipher = std::make_unique<VaultCipher>(passphrase, newSalt, m_options.kdfIterations);

        WriteTransaction tx(db);
        writeMeta(db, QStringLiteral("kdf_salt"), newSalt);
        writeMeta(db, QStringLiteral("kdf_iterations"), QByteArray::number(m_options.kdfIterations));
        writeMeta(db, QStringLiteral("key_check"), cipher->makeKeyCheck());
        writeMeta(db, QStringLiteral("schema_version"), QByteArray(kSchemaVersion));
        tx.commit();

        m_cipher = std::move(cipher);
        qCInfo(kv_store) << "DocumentStore: created new vault at" << m_dbPath;
        return;
    }

    const auto iterations = readMeta(db, QStringLiteral("kdf_iterations"));
    const auto keyCheck = readMeta(db, QStringLiteral("key_check"));
    if (!iterations || !keyCheck || iterations->toInt() <= 0) {
        throw VaultAccessError("Vault key check is missing: the file is corrupted or not a vault");
    }

    auto cipher = std::make_unique<VaultCipher>(passphrase, *salt, iterations->toInt());
    if (!cipher->verifyKeyCheck(*keyCheck)) {
        qCWarning(kv_store) << "DocumentStore: passphrase rejected for" << m_dbPath;
        throw VaultAccessError("Wrong passphrase for vault '" + m_dbPath.toStdString() + "'");
    }

    m_cipher = std::move(cipher);
    qCInfo(kv_store) << "DocumentStore: unlocked vault at" << m_dbPath;
}

void DocumentStore::initialize(bool requireIndexCapability)
{
    requireOpen();

    Connection conn(m_dbPath, "init");
    QSqlDatabase& db = conn.db();

    int dimension = 0;
    {
        WriteTransaction tx(db);
        {
            QSqlQuery query(db);
            execOrThrow(query, kVaultSchemaDocuments, QStringLiteral("create documents"));
            execOrThrow(query, kVaultSchemaChunks, QStringLiteral("create chunks"));
            execOrThrow(query, kVaultSchemaChunksIndex, QStringLiteral("create chunk index"));
            execOrThrow(query, kVaultSchemaVecIndex, QStringLiteral("create vec_index"));
            execOrThrow(query, kVaultSchemaSessions, QStringLiteral("create sessions"));
            execOrThrow(query, kVaultSchemaSessionDocuments, QStringLiteral("create session_documents"));
        }

        dimension = storedDimension(db);
        const int configured = m_options.embeddingDimension;
        if (dimension > 0 && configured > 0 && dimension != configured) {
            throw DimensionMismatchError(dimension, configured, "configured embedding dimension");
        }
        if (dimension == 0 && configured > 0) {
            writeMeta(db, QStringLiteral("embedding_dimension"), QByteArray::number(configured));
            dimension = configured;
        }
        tx.commit();
    }
    m_dimension = dimension;

    const bool attached = m_options.index && m_options.index->attach(dimension);
    if (!attached) {
        if (requireIndexCapability) {
            throw IndexUnavailableError("Similarity index could not be attached to the vault");
        }
        qCWarning(kv_store) << "DocumentStore: similarity index unavailable, running degraded"
                            << "(searchSimilar returns no results)";
    }
    m_degraded = !attached;

    recoverIndex(db);
    if (attached) {
        m_options.index->clear();
        loadIndex(db);
    }

    m_initialized = true;
    qCInfo(kv_store) << "DocumentStore: initialized, dimension" << m_dimension.load()
                     << "degraded" << m_degraded.load();
}

void DocumentStore::recoverIndex(QSqlDatabase& db)
{
    struct Missing {
        QString chunkId;
        QString documentId;
        QByteArray embedding;
    };

    WriteTransaction tx(db);

    int dangling = 0;
    {
        QSqlQuery query(db);
        execOrThrow(query, "DELETE FROM vec_index WHERE chunk_id NOT IN (SELECT id FROM chunks)",
                    QStringLiteral("drop dangling index rows"));
        dangling = query.numRowsAffected();
    }

    std::vector<Missing> missing;
    qint64 seq = 0;
    {
        QSqlQuery query(db);
        execOrThrow(query,
                    "SELECT c.id, c.document_id, c.embedding FROM chunks c "
                    "LEFT JOIN vec_index v ON v.chunk_id = c.id "
                    "WHERE v.chunk_id IS NULL ORDER BY c.created_at, c.rowid",
                    QStringLiteral("find unindexed chunks"));
        while (query.next()) {
            missing.push_back({query.value(0).toString(), query.value(1).toString(),
                               query.value(2).toByteArray()});
        }

        execOrThrow(query, "SELECT COALESCE(MAX(seq), 0) FROM vec_index", QStringLiteral("read index seq"));
        if (query.next()) {
            seq = query.value(0).toLongLong();
        }
    }

    if (!missing.empty()) {
        QSqlQuery insert(db);
        insert.prepare(QStringLiteral(
            "INSERT INTO vec_index (chunk_id, seq, document_id, embedding) "
            "VALUES (:chunk_id, :seq, :document_id, :embedding)"));
        for (const Missing& row : missing) {
            const auto plain = m_cipher->decrypt(row.embedding, kChunkEmbedding);
            if (!plain) {
                throw VaultAccessError("Chunk embedding failed authentication during index recovery");
            }
            insert.bindValue(QStringLiteral(":chunk_id"), row.chunkId);
            insert.bindValue(QStringLiteral(":seq"), ++seq);
            insert.bindValue(QStringLiteral(":document_id"), row.documentId);
            insert.bindValue(QStringLiteral(":embedding"), m_cipher->encrypt(*plain, kIndexEmbedding));
            execOrThrow(insert, QStringLiteral("rebuild index row"));
        }
    }

    tx.commit();

    if (dangling > 0 || !missing.empty()) {
        qCWarning(kv_store) << "DocumentStore: index recovery rebuilt" << missing.size()
                            << "rows and dropped" << dangling << "dangling rows";
    }
}

void DocumentStore::loadIndex(QSqlDatabase& db)
{
    QSqlQuery query(db);
    execOrThrow(query, "SELECT chunk_id, seq, document_id, embedding FROM vec_index ORDER BY seq",
                QStringLiteral("load index"));

    int loaded = 0;
    while (query.next()) {
        const auto plain = m_cipher->decrypt(query.value(3).toByteArray(), kIndexEmbedding);
        if (!plain) {
            throw VaultAccessError("Index embedding failed authentication");
        }

        IndexEntry entry;
        entry.chunkId = query.value(0).toString();
        entry.seq = query.value(1).toLongLong();
        entry.documentId = query.value(2).toString();
        entry.vector = RagUtils::blobToVector(*plain);

        const int width = static_cast<int>(entry.vector.size());
        if (m_dimension.load() == 0) {
            m_dimension = width;
        } else if (width != m_dimension.load()) {
            throw DimensionMismatchError(m_dimension.load(), width, "stored index row");
        }

        m_options.index->insert(entry);
        ++loaded;
    }
    qCDebug(kv_store) << "DocumentStore: loaded" << loaded << "index entries";
}

Document DocumentStore::readDocumentRow(const QSqlQuery& query) const
{
    Document doc;
    doc.id = query.value(0).toString();
    doc.content = m_cipher->decryptText(query.value(1).toByteArray(), kDocContent);
    doc.source = m_cipher->decryptText(query.value(2).toByteArray(), kDocSource);
    doc.metadata = metadataFromJson(m_cipher->decryptText(query.value(3).toByteArray(), kDocMetadata).toUtf8());
    doc.chunkCount = query.value(4).toInt();
    doc.createdAt = QDateTime::fromMSecsSinceEpoch(query.value(5).toLongLong());
    doc.updatedAt = QDateTime::fromMSecsSinceEpoch(query.value(6).toLongLong());
    return doc;
}

Chunk DocumentStore::readChunkRow(const QSqlQuery& query) const
{
    Chunk chunk;
    chunk.id = query.value(0).toString();
    chunk.documentId = query.value(1).toString();
    chunk.chunkIndex = query.value(2).toInt();
    chunk.content = m_cipher->decryptText(query.value(3).toByteArray(), kChunkContent);
    chunk.tokenCount = query.value(4).toInt();

    const auto embedding = m_cipher->decrypt(query.value(5).toByteArray(), kChunkEmbedding);
    if (!embedding) {
        throw VaultAccessError("Chunk embedding failed authentication");
    }
    chunk.embedding = RagUtils::blobToVector(*embedding);
    chunk.createdAt = QDateTime::fromMSecsSinceEpoch(query.value(6).toLongLong());
    return chunk;
}

Session DocumentStore::readSessionRow(const QSqlQuery& query) const
{
    Session session;
    session.id = query.value(0).toString();
    session.name = m_cipher->decryptText(query.value(1).toByteArray(), kSessionName);
    session.description = m_cipher->decryptText(query.value(2).toByteArray(), kSessionDescription);
    session.createdAt = QDateTime::fromMSecsSinceEpoch(query.value(3).toLongLong());
    session.lastAccessedAt = QDateTime::fromMSecsSinceEpoch(query.value(4).toLongLong());
    return session;
}

QString DocumentStore::addDocument(const Document& document, const std::vector<Chunk>& chunks)
{
    requireReady();

    const QString docId = document.id.isEmpty()
        ? QUuid::createUuid().toString(QUuid::WithoutBraces)
        : document.id;

    // Validate everything before touching storage
    const int storeWidth = m_dimension.load();
    int batchWidth = storeWidth;
    for (size_t i = 0; i < chunks.size(); ++i) {
        const Chunk& chunk = chunks[i];
        const int width = static_cast<int>(chunk.embedding.size());
        const std::string where = QStringLiteral("chunk %1 of document '%2'").arg(i).arg(docId).toStdString();
        if (width == 0 || (batchWidth > 0 && width != batchWidth)) {
            throw DimensionMismatchError(batchWidth, width, where);
        }
        batchWidth = width;
        for (float component : chunk.embedding) {
            if (!std::isfinite(component)) {
                throw VaultError(where + " has a non-finite embedding component");
            }
        }
        if (!chunk.documentId.isEmpty() && chunk.documentId != docId) {
            throw VaultError("Chunk " + std::to_string(i) + " belongs to document '"
                             + chunk.documentId.toStdString() + "', not '" + docId.toStdString() + "'");
        }
    }

    // Redact before anything is encrypted or written
    QStringList redactedCategories;
    auto redactText = [&](const QString& text) {
        RedactionReport report = m_redactor->redactWithReport(text);
        for (const QString& category : report.categories) {
            if (!redactedCategories.contains(category)) {
                redactedCategories.append(category);
            }
        }
        return std::move(report.text);
    };

    const QString content = redactText(document.content);
    const QString source = redactText(document.source);
    MetadataMap metadata;
    for (auto it = document.metadata.cbegin(); it != document.metadata.cend(); ++it) {
        metadata.insert(it.key(), isStructuralMetadataKey(it.key()) ? it.value() : redactText(it.value()));
    }
    std::vector<QString> chunkTexts;
    chunkTexts.reserve(chunks.size());
    for (const Chunk& chunk : chunks) {
        chunkTexts.push_back(redactText(chunk.content));
    }

    std::vector<IndexEntry> entries;
    entries.reserve(chunks.size());

    DocumentLock docLock(*this, docId);

    Connection conn(m_dbPath, "add");
    QSqlDatabase& db = conn.db();
    {
        WriteTransaction tx(db);

        if (batchWidth > 0) {
            const int stored = storedDimension(db);
            if (stored == 0) {
                writeMeta(db, QStringLiteral("embedding_dimension"), QByteArray::number(batchWidth));
            } else if (stored != batchWidth) {
                throw DimensionMismatchError(stored, batchWidth, "document '" + docId.toStdString() + "'");
            }
        }

        const qint64 now = monotonicNowMs();
        qint64 createdAt = now;
        std::vector<std::pair<QString, qint64>> memberships;
        {
            QSqlQuery query(db);
            query.prepare(QStringLiteral("SELECT created_at FROM documents WHERE id = :id"));
            query.bindValue(QStringLiteral(":id"), docId);
            execOrThrow(query, QStringLiteral("look up existing document"));
            const bool replacing = query.next();
            if (replacing) {
                createdAt = query.value(0).toLongLong();
            }
            query.finish();

            if (replacing) {
                query.prepare(QStringLiteral(
                    "SELECT session_id, added_at FROM session_documents WHERE document_id = :id"));
                query.bindValue(QStringLiteral(":id"), docId);
                execOrThrow(query, QStringLiteral("read memberships"));
                while (query.next()) {
                    memberships.emplace_back(query.value(0).toString(), query.value(1).toLongLong());
                }
                query.finish();

                // Cascades to chunks, index rows and memberships
                query.prepare(QStringLiteral("DELETE FROM documents WHERE id = :id"));
                query.bindValue(QStringLiteral(":id"), docId);
                execOrThrow(query, QStringLiteral("replace document"));
                qCDebug(kv_store) << "DocumentStore: replacing document" << docId;
            }
        }

        {
            QSqlQuery insert(db);
            insert.prepare(QStringLiteral(
                "INSERT INTO documents (id, content, source, metadata, chunk_count, created_at, updated_at) "
                "VALUES (:id, :content, :source, :metadata, :chunk_count, :created_at, :updated_at)"));
            insert.bindValue(QStringLiteral(":id"), docId);
            insert.bindValue(QStringLiteral(":content"), m_cipher->encryptText(content, kDocContent));
            insert.bindValue(QStringLiteral(":source"), m_cipher->encryptText(source, kDocSource));
            insert.bindValue(QStringLiteral(":metadata"),
                             m_cipher->encrypt(metadataToJson(metadata), kDocMetadata));
            insert.bindValue(QStringLiteral(":chunk_count"), static_cast<int>(chunks.size()));
            insert.bindValue(QStringLiteral(":created_at"), createdAt);
            insert.bindValue(QStringLiteral(":updated_at"), now);
            execOrThrow(insert, QStringLiteral("insert document"));
        }

        qint64 seq = 0;
        {
            QSqlQuery query(db);
            execOrThrow(query, "SELECT COALESCE(MAX(seq), 0) FROM vec_index", QStringLiteral("read index seq"));
            if (query.next()) {
                seq = query.value(0).toLongLong();
            }
        }

        {
            QSqlQuery chunkInsert(db);
            chunkInsert.prepare(QStringLiteral(
                "INSERT INTO chunks (id, document_id, chunk_index, content, token_count, embedding, created_at) "
                "VALUES (:id, :document_id, :chunk_index, :content, :token_count, :embedding, :created_at)"));
            QSqlQuery indexInsert(db);
            indexInsert.prepare(QStringLiteral(
                "INSERT INTO vec_index (chunk_id, seq, document_id, embedding) "
                "VALUES (:chunk_id, :seq, :document_id, :embedding)"));

            for (size_t i = 0; i < chunks.size(); ++i) {
                const Chunk& chunk = chunks[i];
                const QString chunkId = chunk.id.isEmpty()
                    ? QUuid::createUuid().toString(QUuid::WithoutBraces)
                    : chunk.id;
                // Counted on the stored (redacted) text; placeholders can be longer than the original
                const int tokens = TextChunker::estimateTokenCount(chunkTexts[i]);
                const QByteArray vectorBlob = RagUtils::vectorToBlob(chunk.embedding);

                chunkInsert.bindValue(QStringLiteral(":id"), chunkId);
                chunkInsert.bindValue(QStringLiteral(":document_id"), docId);
                chunkInsert.bindValue(QStringLiteral(":chunk_index"), chunk.chunkIndex);
                chunkInsert.bindValue(QStringLiteral(":content"), m_cipher->encryptText(chunkTexts[i], kChunkContent));
                chunkInsert.bindValue(QStringLiteral(":token_count"), tokens);
                chunkInsert.bindValue(QStringLiteral(":embedding"), m_cipher->encrypt(vectorBlob, kChunkEmbedding));
                chunkInsert.bindValue(QStringLiteral(":created_at"), now);
                execOrThrow(chunkInsert, QStringLiteral("insert chunk %1").arg(i));

                ++seq;
                indexInsert.bindValue(QStringLiteral(":chunk_id"), chunkId);
                indexInsert.bindValue(QStringLiteral(":seq"), seq);
                indexInsert.bindValue(QStringLiteral(":document_id"), docId);
                indexInsert.bindValue(QStringLiteral(":embedding"), m_cipher->encrypt(vectorBlob, kIndexEmbedding));
                execOrThrow(indexInsert, QStringLiteral("insert index row %1").arg(i));

                entries.push_back(IndexEntry{chunkId, docId, seq, chunk.embedding});
            }
        }

        if (!memberships.empty()) {
            QSqlQuery restore(db);
            restore.prepare(QStringLiteral(
                "INSERT OR IGNORE INTO session_documents (session_id, document_id, added_at) "
                "VALUES (:session_id, :document_id, :added_at)"));
            for (const auto& membership : memberships) {
                restore.bindValue(QStringLiteral(":session_id"), membership.first);
                restore.bindValue(QStringLiteral(":document_id"), docId);
                restore.bindValue(QStringLiteral(":added_at"), membership.second);
                execOrThrow(restore, QStringLiteral("restore membership"));
            }
        }

        tx.commit();
    }

    if (storeWidth == 0 && batchWidth > 0) {
        m_dimension = batchWidth;
        if (m_options.index) {
            m_options.index->attach(batchWidth);
        }
    }

    if (!m_degraded.load() && m_options.index) {
        m_options.index->removeDocument(docId);
        for (const IndexEntry& entry : entries) {
            m_options.index->insert(entry);
        }
    }

    if (!redactedCategories.isEmpty()) {
        qCInfo(kv_redaction) << "DocumentStore: redacted document" << docId
                             << "categories:" << redactedCategories.join(QStringLiteral(","));
    }
    qCDebug(kv_store) << "DocumentStore: stored document" << docId << "with" << chunks.size() << "chunks";
    return docId;
}

bool DocumentStore::removeDocument(const QString& id)
{
    requireReady();

    DocumentLock docLock(*this, id);

    int removed = 0;
    {
        Connection conn(m_dbPath, "remove");
        QSqlDatabase& db = conn.db();
        WriteTransaction tx(db);
        {
            QSqlQuery query(db);
            query.prepare(QStringLiteral("DELETE FROM documents WHERE id = :id"));
            query.bindValue(QStringLiteral(":id"), id);
            execOrThrow(query, QStringLiteral("delete document"));
            removed = query.numRowsAffected();
        }
        tx.commit();
    }

    if (m_options.index) {
        m_options.index->removeDocument(id);
    }
    if (removed > 0) {
        qCDebug(kv_store) << "DocumentStore: removed document" << id;
    }
    return removed > 0;
}

std::optional<Document> DocumentStore::getDocument(const QString& id) const
{
    requireReady();

    Connection conn(m_dbPath, "get");
    QSqlQuery query(conn.db());
    query.prepare(QStringLiteral("SELECT %1 FROM documents d WHERE d.id = :id").arg(kDocumentColumns));
    query.bindValue(QStringLiteral(":id"), id);
    execOrThrow(query, QStringLiteral("get document"));
    if (!query.next()) {
        return std::nullopt;
    }
    return readDocumentRow(query);
}

std::vector<Chunk> DocumentStore::getChunks(const QString& documentId) const
{
    requireReady();

    std::vector<Chunk> chunks;
    Connection conn(m_dbPath, "chunks");
    QSqlQuery query(conn.db());
    query.prepare(QStringLiteral("SELECT %1 FROM chunks c WHERE c.document_id = :id ORDER BY c.chunk_index, c.rowid")
                      .arg(kChunkColumns));
    query.bindValue(QStringLiteral(":id"), documentId);
    execOrThrow(query, QStringLiteral("get chunks"));
    while (query.next()) {
        chunks.push_back(readChunkRow(query));
    }
    return chunks;
}

std::vector<Document> DocumentStore::listDocuments() const
{
    requireReady();

    std::vector<Document> docs;
    Connection conn(m_dbPath, "list");
    QSqlQuery query(conn.db());
    query.prepare(QStringLiteral("SELECT %1 FROM documents d ORDER BY d.created_at, d.id").arg(kDocumentColumns));
    execOrThrow(query, QStringLiteral("list documents"));
    while (query.next()) {
        docs.push_back(readDocumentRow(query));
    }
    return docs;
}

int DocumentStore::documentCount() const
{
    requireReady();

    Connection conn(m_dbPath, "count");
    QSqlQuery query(conn.db());
    execOrThrow(query, "SELECT COUNT(*) FROM documents", QStringLiteral("count documents"));
    return query.next() ? query.value(0).toInt() : 0;
}

QSet<QString> DocumentStore::sessionDocumentIds(QSqlDatabase& db, const QString& sessionId) const
{
    QSet<QString> ids;
    QSqlQuery query(db);
    query.prepare(QStringLiteral("SELECT document_id FROM session_documents WHERE session_id = :id"));
    query.bindValue(QStringLiteral(":id"), sessionId);
    execOrThrow(query, QStringLiteral("read session members"));
    while (query.next()) {
        ids.insert(query.value(0).toString());
    }
    return ids;
}

std::vector<SearchHit> DocumentStore::searchSimilar(const std::vector<float>& query,
                                                    int limit,
                                                    double minScore,
                                                    const QString& sessionId) const
{
    requireReady();

    std::vector<SearchHit> hits;
    if (m_degraded.load() || !m_options.index || limit <= 0 || query.empty()) {
        return hits;
    }

    const int dimension = m_dimension.load();
    if (dimension == 0) {
        return hits; // nothing stored yet
    }
    if (static_cast<int>(query.size()) != dimension) {
        throw DimensionMismatchError(dimension, static_cast<int>(query.size()), "query vector");
    }

    Connection conn(m_dbPath, "search");
    QSqlDatabase& db = conn.db();

    std::optional<QSet<QString>> allowed;
    if (!sessionId.isEmpty()) {
        allowed = sessionDocumentIds(db, sessionId);
        if (allowed->isEmpty()) {
            return hits;
        }
    }

    const std::vector<IndexMatch> matches = m_options.index->search(query, limit, minScore, allowed);
    if (matches.empty()) {
        return hits;
    }

    QHash<QString, Document> documents;
    QSqlQuery chunkQuery(db);
    chunkQuery.prepare(QStringLiteral("SELECT %1 FROM chunks c WHERE c.id = :id").arg(kChunkColumns));
    QSqlQuery docQuery(db);
    docQuery.prepare(QStringLiteral("SELECT %1 FROM documents d WHERE d.id = :id").arg(kDocumentColumns));

    for (const IndexMatch& match : matches) {
        chunkQuery.bindValue(QStringLiteral(":id"), match.chunkId);
        execOrThrow(chunkQuery, QStringLiteral("load matched chunk"));
        if (!chunkQuery.next()) {
            continue; // removed after the index was searched
        }

        SearchHit hit;
        hit.chunk = readChunkRow(chunkQuery);
        hit.similarity = match.score;
        chunkQuery.finish();

        auto it = documents.find(hit.chunk.documentId);
        if (it == documents.end()) {
            docQuery.bindValue(QStringLiteral(":id"), hit.chunk.documentId);
            execOrThrow(docQuery, QStringLiteral("load matched document"));
            if (!docQuery.next()) {
                continue;
            }
            it = documents.insert(hit.chunk.documentId, readDocumentRow(docQuery));
            docQuery.finish();
        }
        hit.document = it.value();
        hits.push_back(std::move(hit));
    }

    qCDebug(kv_retrieval) << "DocumentStore: searchSimilar returned" << hits.size() << "hits";
    return hits;
}

StoreStats DocumentStore::statistics() const
{
    requireReady();

    StoreStats stats;
    Connection conn(m_dbPath, "stats");
    QSqlQuery query(conn.db());

    execOrThrow(query, "SELECT COUNT(*), MIN(created_at), MAX(created_at) FROM documents",
                QStringLiteral("document statistics"));
    if (query.next()) {
        stats.documentCount = query.value(0).toInt();
        if (stats.documentCount > 0) {
            stats.oldestCreatedAt = QDateTime::fromMSecsSinceEpoch(query.value(1).toLongLong());
            stats.newestCreatedAt = QDateTime::fromMSecsSinceEpoch(query.value(2).toLongLong());
        }
    }

    execOrThrow(query, "SELECT COUNT(*), COALESCE(SUM(token_count), 0) FROM chunks",
                QStringLiteral("chunk statistics"));
    if (query.next()) {
        stats.chunkCount = query.value(0).toInt();
        stats.totalTokens = query.value(1).toLongLong();
    }

    execOrThrow(query, "SELECT COUNT(*) FROM vec_index", QStringLiteral("index statistics"));
    if (query.next()) {
        stats.indexedChunkCount = query.value(0).toInt();
    }
    return stats;
}

Session DocumentStore::createSession(const QString& name, const QString& description)
{
    requireReady();
    if (name.trimmed().isEmpty()) {
        throw VaultError("Session name must not be empty");
    }

    Session session;
    session.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    session.name = name.trimmed();
    session.description = description;
    const qint64 now = monotonicNowMs();
    session.createdAt = QDateTime::fromMSecsSinceEpoch(now);
    session.lastAccessedAt = session.createdAt;

    Connection conn(m_dbPath, "session_create");
    QSqlQuery query(conn.db());
    query.prepare(QStringLiteral(
        "INSERT INTO sessions (id, name, description, created_at, last_accessed_at) "
        "VALUES (:id, :name, :description, :created_at, :last_accessed_at)"));
    query.bindValue(QStringLiteral(":id"), session.id);
    query.bindValue(QStringLiteral(":name"), m_cipher->encryptText(session.name, kSessionName));
    query.bindValue(QStringLiteral(":description"), m_cipher->encryptText(session.description, kSessionDescription));
    query.bindValue(QStringLiteral(":created_at"), now);
    query.bindValue(QStringLiteral(":last_accessed_at"), now);
    execOrThrow(query, QStringLiteral("create session"));
    return session;
}

std::optional<Session> DocumentStore::getSession(const QString& id) const
{
    requireReady();

    Connection conn(m_dbPath, "session_get");
    QSqlQuery query(conn.db());
    query.prepare(QStringLiteral("SELECT %1 FROM sessions s WHERE s.id = :id").arg(kSessionColumns));
    query.bindValue(QStringLiteral(":id"), id);
    execOrThrow(query, QStringLiteral("get session"));
    if (!query.next()) {
        return std::nullopt;
    }
    return readSessionRow(query);
}

std::vector<Session> DocumentStore::listSessions() const
{
    requireReady();

    std::vector<Session> sessions;
    Connection conn(m_dbPath, "session_list");
    QSqlQuery query(conn.db());
    query.prepare(QStringLiteral(
        "SELECT %1 FROM sessions s ORDER BY s.last_accessed_at DESC, s.created_at DESC").arg(kSessionColumns));
    execOrThrow(query, QStringLiteral("list sessions"));
    while (query.next()) {
        sessions.push_back(readSessionRow(query));
    }
    return sessions;
}

bool DocumentStore::deleteSession(const QString& id)
{
    requireReady();

    Connection conn(m_dbPath, "session_delete");
    QSqlQuery query(conn.db());
    query.prepare(QStringLiteral("DELETE FROM sessions WHERE id = :id"));
    query.bindValue(QStringLiteral(":id"), id);
    execOrThrow(query, QStringLiteral("delete session"));
    return query.numRowsAffected() > 0;
}

void DocumentStore::addDocumentToSession(const QString& sessionId, const QString& documentId)
{
    requireReady();

    Connection conn(m_dbPath, "session_add");
    QSqlDatabase& db = conn.db();
    WriteTransaction tx(db);
    {
        QSqlQuery query(db);
        query.prepare(QStringLiteral("SELECT "
                                     "(SELECT COUNT(*) FROM sessions WHERE id = :session_id), "
                                     "(SELECT COUNT(*) FROM documents WHERE id = :document_id)"));
        query.bindValue(QStringLiteral(":session_id"), sessionId);
        query.bindValue(QStringLiteral(":document_id"), documentId);
        execOrThrow(query, QStringLiteral("check membership ids"));
        if (!query.next() || query.value(0).toInt() == 0) {
            throw StorageError("Unknown session '" + sessionId.toStdString() + "'");
        }
        if (query.value(1).toInt() == 0) {
            throw StorageError("Unknown document '" + documentId.toStdString() + "'");
        }
        query.finish();

        const qint64 now = monotonicNowMs();
        query.prepare(QStringLiteral(
            "INSERT OR IGNORE INTO session_documents (session_id, document_id, added_at) "
            "VALUES (:session_id, :document_id, :added_at)"));
        query.bindValue(QStringLiteral(":session_id"), sessionId);
        query.bindValue(QStringLiteral(":document_id"), documentId);
        query.bindValue(QStringLiteral(":added_at"), now);
        execOrThrow(query, QStringLiteral("add membership"));

        query.prepare(QStringLiteral("UPDATE sessions SET last_accessed_at = :now WHERE id = :id"));
        query.bindValue(QStringLiteral(":now"), now);
        query.bindValue(QStringLiteral(":id"), sessionId);
        execOrThrow(query, QStringLiteral("touch session"));
    }
    tx.commit();
}

bool DocumentStore::removeDocumentFromSession(const QString& sessionId, const QString& documentId)
{
    requireReady();

    Connection conn(m_dbPath, "session_remove");
    QSqlQuery query(conn.db());
    query.prepare(QStringLiteral(
        "DELETE FROM session_documents WHERE session_id = :session_id AND document_id = :document_id"));
    query.bindValue(QStringLiteral(":session_id"), sessionId);
    query.bindValue(QStringLiteral(":document_id"), documentId);
    execOrThrow(query, QStringLiteral("remove membership"));
    return query.numRowsAffected() > 0;
}

std::vector<Document> DocumentStore::getSessionDocuments(const QString& sessionId) const
{
    requireReady();

    std::vector<Document> docs;
    Connection conn(m_dbPath, "session_docs");
    QSqlQuery query(conn.db());
    query.prepare(QStringLiteral(
        "SELECT %1 FROM documents d JOIN session_documents sd ON sd.document_id = d.id "
        "WHERE sd.session_id = :id ORDER BY sd.added_at, d.id").arg(kDocumentColumns));
    query.bindValue(QStringLiteral(":id"), sessionId);
    execOrThrow(query, QStringLiteral("list session documents"));
    while (query.next()) {
        docs.push_back(readDocumentRow(query));
    }
    return docs;
}
