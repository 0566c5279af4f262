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

#include <QByteArray>
#include <vector>

/**
 * @brief Vector helpers shared by the store, the index and the retriever.
 */
class RagUtils
{
public:
    /**
     * @brief Compute cosine similarity between two float vectors.
     *
     * Returns dot(a,b) / (||a|| * ||b||).
     * If either vector is empty, the sizes differ, or the magnitude is zero,
     * the function returns 0.0.
     */
    static double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

    /**
     * @brief Cosine similarity clamped into [0,1].
     *
     * Opposed vectors are as irrelevant as orthogonal ones, so negative
     * similarities collapse to 0.
     */
    static double relevanceScore(const std::vector<float>& a, const std::vector<float>& b);

    /// Serialize as a little-endian IEEE-754 float32 array.
    static QByteArray vectorToBlob(const std::vector<float>& vec);

    /// Inverse of vectorToBlob. A blob whose size is not a multiple of 4 yields an empty vector.
    static std::vector<float> blobToVector(const QByteArray& blob);
};

/**
 * @brief SQL schema of the vault file.
 *
 * Tables:
 *
 * 1. `vault_meta` - key/value pairs: KDF salt and iteration count, key-check
 *    blob, schema version and the store-wide embedding dimension. Never holds
 *    key material.
 *
 * 2. `documents` - one row per document. content, source and metadata are
 *    AES-GCM blobs; id, chunk count and timestamps are plaintext.
 *
 * 3. `chunks` - text segments with their embeddings (both encrypted), owned
 *    by a document and removed with it.
 *
 * 4. `vec_index` - persisted mirror of the similarity index keyed by chunk id.
 *    `seq` records insertion order for stable tie-breaking.
 *
 * 5. `sessions` / `session_documents` - named groupings and the membership
 *    join table. Removing either side only removes the membership rows.
 *
 * Since QSqlQuery::exec() cannot execute multiple statements at once, each
 * statement is a separate constant. Timestamps are milliseconds since epoch.
 */
constexpr const char* kVaultSchemaPragma = "PRAGMA foreign_keys = ON";

constexpr const char* kVaultSchemaMeta = R"(
CREATE TABLE IF NOT EXISTS vault_meta (
    key TEXT PRIMARY KEY,
    value BLOB NOT NULL
)
)";

constexpr const char* kVaultSchemaDocuments = R"(
CREATE TABLE IF NOT EXISTS documents (
    id TEXT PRIMARY KEY,
    content BLOB NOT NULL,
    source BLOB NOT NULL,
    metadata BLOB NOT NULL,
    chunk_count INTEGER NOT NULL,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
)
)";

constexpr const char* kVaultSchemaChunks = R"(
CREATE TABLE IF NOT EXISTS chunks (
    id TEXT PRIMARY KEY,
    document_id TEXT NOT NULL,
    chunk_index INTEGER NOT NULL,
    content BLOB NOT NULL,
    token_count INTEGER NOT NULL,
    embedding BLOB NOT NULL,
    created_at INTEGER NOT NULL,
    FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
)
)";

constexpr const char* kVaultSchemaChunksIndex =
    "CREATE INDEX IF NOT EXISTS idx_chunks_document ON chunks(document_id, chunk_index)";

constexpr const char* kVaultSchemaVecIndex = R"(
CREATE TABLE IF NOT EXISTS vec_index (
    chunk_id TEXT PRIMARY KEY,
    seq INTEGER NOT NULL,
    document_id TEXT NOT NULL,
    embedding BLOB NOT NULL,
    FOREIGN KEY (chunk_id) REFERENCES chunks(id) ON DELETE CASCADE
)
)";

constexpr const char* kVaultSchemaSessions = R"(
CREATE TABLE IF NOT EXISTS sessions (
    id TEXT PRIMARY KEY,
    name BLOB NOT NULL,
    description BLOB NOT NULL,
    created_at INTEGER NOT NULL,
    last_accessed_at INTEGER NOT NULL
)
)";

constexpr const char* kVaultSchemaSessionDocuments = R"(
CREATE TABLE IF NOT EXISTS session_documents (
    session_id TEXT NOT NULL,
    document_id TEXT NOT NULL,
    added_at INTEGER NOT NULL,
    PRIMARY KEY (session_id, document_id),
    FOREIGN KEY (session_id) REFERENCES sessions(id) ON DELETE CASCADE,
    FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
)
)";
