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

#include <QReadWriteLock>
#include <QSet>
#include <QString>

#include <optional>
#include <vector>

struct IndexEntry {
    QString chunkId;
    QString documentId;
    qint64 seq = 0;           ///< insertion order, used to break score ties
    std::vector<float> vector;
};

struct IndexMatch {
    QString chunkId;
    QString documentId;
    qint64 seq = 0;
    double score = 0.0;       ///< cosine similarity clamped to [0,1]
};

/**
 * @brief Similarity index attached to a DocumentStore.
 *
 * The store keeps the persisted mirror (vec_index table) and feeds the index
 * on startup and after every committed write. An index that refuses to attach
 * puts the store into degraded mode.
 */
class IVectorIndex {
public:
    virtual ~IVectorIndex() = default;

    /**
     * @brief Bind the index to a vector width.
     * @param dimension Store-wide width, or 0 when no vector has been stored yet
     * @return false when the index cannot serve this store
     */
    virtual bool attach(int dimension) = 0;
    virtual bool isAttached() const = 0;

    virtual void insert(const IndexEntry& entry) = 0;
    virtual void removeDocument(const QString& documentId) = 0;

    /**
     * @brief Rank entries by similarity to @p query.
     *
     * Results are ordered by descending score, then ascending seq. Entries
     * scoring below @p minScore are skipped. When @p allowedDocuments is set,
     * only entries owned by those documents are considered.
     */
    virtual std::vector<IndexMatch> search(const std::vector<float>& query,
                                           int limit,
                                           double minScore,
                                           const std::optional<QSet<QString>>& allowedDocuments = std::nullopt) const = 0;

    virtual int size() const = 0;
    virtual void clear() = 0;
};

/**
 * @brief Exact brute-force cosine index held in memory.
 *
 * Reads run concurrently; inserts and removals take the write lock.
 */
class FlatVectorIndex : public IVectorIndex {
public:
    bool attach(int dimension) override;
    bool isAttached() const override;

    /// Throws DimensionMismatchError when the entry width disagrees with the index.
    void insert(const IndexEntry& entry) override;
    void removeDocument(const QString& documentId) override;

    std::vector<IndexMatch> search(const std::vector<float>& query,
                                   int limit,
                                   double minScore,
                                   const std::optional<QSet<QString>>& allowedDocuments = std::nullopt) const override;

    int size() const override;
    void clear() override;

private:
    mutable QReadWriteLock m_lock;
    std::vector<IndexEntry> m_entries;
    int m_dimension = 0;
    bool m_attached = false;
};
