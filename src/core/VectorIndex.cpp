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

#include "VectorIndex.h"

#include "RagUtils.h"
#include "VaultErrors.h"

#include <QReadLocker>
#include <QWriteLocker>

#include <algorithm>
#include <cmath>

bool FlatVectorIndex::attach(int dimension)
{
    QWriteLocker locker(&m_lock);
    if (dimension < 0) {
        return false;
    }
    if (m_dimension > 0 && dimension > 0 && dimension != m_dimension && !m_entries.empty()) {
        return false;
    }
    if (dimension > 0) {
        m_dimension = dimension;
    }
    m_attached = true;
    return true;
}

bool FlatVectorIndex::isAttached() const
{
    QReadLocker locker(&m_lock);
    return m_attached;
}

void FlatVectorIndex::insert(const IndexEntry& entry)
{
    QWriteLocker locker(&m_lock);
    const int width = static_cast<int>(entry.vector.size());
    if (m_dimension == 0) {
        m_dimension = width;
    } else if (width != m_dimension) {
        throw DimensionMismatchError(m_dimension, width, "vector index insert");
    }

    // Re-inserting a chunk id replaces the old entry
    m_entries.erase(std::remove_if(m_entries.begin(), m_entries.end(),
                                   [&](const IndexEntry& e) { return e.chunkId == entry.chunkId; }),
                    m_entries.end());
    m_entries.push_back(entry);
}

void FlatVectorIndex::removeDocument(const QString& documentId)
{
    QWriteLocker locker(&m_lock);
    m_entries.erase(std::remove_if(m_entries.begin(), m_entries.end(),
                                   [&](const IndexEntry& e) { return e.documentId == documentId; }),
                    m_entries.end());
}

std::vector<IndexMatch> FlatVectorIndex::search(const std::vector<float>& query,
                                                int limit,
                                                double minScore,
                                                const std::optional<QSet<QString>>& allowedDocuments) const
{
    std::vector<IndexMatch> results;
    if (limit <= 0 || query.empty()) {
        return results;
    }

    QReadLocker locker(&m_lock);
    if (!m_attached) {
        return results;
    }

    for (const IndexEntry& entry : m_entries) {
        if (allowedDocuments && !allowedDocuments->contains(entry.documentId)) {
            continue;
        }
        if (entry.vector.size() != query.size()) {
            continue;
        }
        const double score = RagUtils::relevanceScore(query, entry.vector);
        if (!std::isfinite(score) || score < minScore) {
            continue;
        }
        results.push_back(IndexMatch{entry.chunkId, entry.documentId, entry.seq, score});
    }

    std::sort(results.begin(), results.end(), [](const IndexMatch& lhs, const IndexMatch& rhs) {
        if (lhs.score == rhs.score) {
            return lhs.seq < rhs.seq; // stable deterministic ordering
        }
        return lhs.score > rhs.score;
    });

    if (static_cast<int>(results.size()) > limit) {
        results.resize(limit);
    }
    return results;
}

int FlatVectorIndex::size() const
{
    QReadLocker locker(&m_lock);
    return static_cast<int>(m_entries.size());
}

void FlatVectorIndex::clear()
{
    QWriteLocker locker(&m_lock);
    m_entries.clear();
}
