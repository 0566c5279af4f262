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

#include <QDateTime>
#include <QFuture>
#include <QString>

#include <vector>

class DocumentStore;
class IEmbeddingBackend;

struct RetrievalConfig {
    int topK = 5;
    double minRelevanceScore = 0.7;
    bool deduplicate = true;
    bool includeMetadata = true;
    int maxContextTokens = 2048;
    QString sessionId;               ///< restrict candidates to one session when set

    /// topK clamped to [1,50], score to [0,1], budget to >= 0.
    RetrievalConfig normalized() const;
};

struct ContextChunk {
    QString content;
    QString sourceDocument;
    QString documentId;
    int chunkIndex = 0;
    double relevanceScore = 0.0;
    int tokenCount = 0;
    MetadataMap metadata;
};

/**
 * @brief Ranked, budget-limited context bundle for one query. Never persisted.
 */
struct RetrievedContext {
    QString query;
    std::vector<ContextChunk> chunks;
    int totalRetrieved = 0;          ///< candidates returned by the store before filtering
    qint64 retrievalTimeMs = 0;

    bool isEmpty() const { return chunks.empty(); }
    int totalTokens() const;
};

struct ContextWindowStats {
    int availableTokens = 0;
    qint64 usedTokens = 0;           ///< estimated tokens stored across all chunks
    int documentCount = 0;
    int chunkCount = 0;
    qint64 oldestDocumentAgeMs = 0;
    qint64 newestDocumentAgeMs = 0;
};

/**
 * @brief Turns a question into a ranked context bundle.
 *
 * Pipeline: embed the query, over-fetch 2 x topK candidates from the store,
 * deduplicate on (source, chunk ordinal), keep topK, then fill the token
 * budget greedily in rank order and stop at the first chunk that does not fit.
 *
 * Retrieval never throws: any embedding or search failure yields an empty
 * context with totalRetrieved = 0, so the caller can still answer ungrounded.
 */
class ContextRetriever
{
public:
    ContextRetriever(DocumentStore& store, IEmbeddingBackend& embedder);

    RetrievedContext retrieveContext(const QString& query, const RetrievalConfig& config = RetrievalConfig()) const;

    /**
     * @brief Incremental variant: each selected chunk is reported as a future
     *        result, in exactly the order retrieveContext() returns them.
     *
     * Cancelling the future stops reporting further chunks.
     */
    QFuture<ContextChunk> retrieveContextStream(const QString& query,
                                                const RetrievalConfig& config = RetrievalConfig()) const;

    /**
     * @brief Render the context as a prompt prefix followed by the question.
     * @return Empty string for an empty context
     */
    static QString formatContextForPrompt(const RetrievedContext& context);

    ContextWindowStats contextWindowStats(int availableTokens) const;

    static std::vector<ContextChunk> deduplicate(const std::vector<ContextChunk>& chunks);
    static std::vector<ContextChunk> limitToBudget(const std::vector<ContextChunk>& chunks, int maxTokens);

private:
    DocumentStore& m_store;
    IEmbeddingBackend& m_embedder;
};
