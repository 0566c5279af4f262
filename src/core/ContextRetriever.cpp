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

#include "ContextRetriever.h"

#include "DocumentStore.h"
#include "TextChunker.h"
#include "backends/ILLMBackend.h"
#include "logging_categories.h"

#include <QElapsedTimer>
#include <QPromise>
#include <QSet>
#include <QtConcurrent>

#include <algorithm>
#include <exception>

RetrievalConfig RetrievalConfig::normalized() const
{
    RetrievalConfig out = *this;
    out.topK = std::clamp(out.topK, 1, 50);
    out.minRelevanceScore = std::clamp(out.minRelevanceScore, 0.0, 1.0);
    out.maxContextTokens = std::max(0, out.maxContextTokens);
    return out;
}

int RetrievedContext::totalTokens() const
{
    int sum = 0;
    for (const auto& c : chunks) {
        sum += c.tokenCount;
    }
    return sum;
}

ContextRetriever::ContextRetriever(DocumentStore& store, IEmbeddingBackend& embedder)
    : m_store(store)
    , m_embedder(embedder)
{
}

std::vector<ContextChunk> ContextRetriever::deduplicate(const std::vector<ContextChunk>& chunks)
{
    std::vector<ContextChunk> out;
    out.reserve(chunks.size());
    QSet<QString> seen;
    for (const auto& c : chunks) {
        const QString key = c.sourceDocument + QChar(0x1F) + QString::number(c.chunkIndex);
        if (seen.contains(key)) {
            continue;
        }
        seen.insert(key);
        out.push_back(c);
    }
    return out;
}

std::vector<ContextChunk> ContextRetriever::limitToBudget(const std::vector<ContextChunk>& chunks, int maxTokens)
{
    std::vector<ContextChunk> out;
    int used = 0;
    for (const auto& c : chunks) {
        if (used + c.tokenCount > maxTokens) {
            break;
        }
        used += c.tokenCount;
        out.push_back(c);
    }
    return out;
}

RetrievedContext ContextRetriever::retrieveContext(const QString& query, const RetrievalConfig& config) const
{
    const RetrievalConfig cfg = config.normalized();

    RetrievedContext result;
    result.query = query;

    QElapsedTimer timer;
    timer.start();

    try {
        const std::vector<float> queryVector = m_embedder.embed(query);
        const std::vector<SearchHit> hits =
            m_store.searchSimilar(queryVector, cfg.topK * 2, cfg.minRelevanceScore, cfg.sessionId);
        result.totalRetrieved = static_cast<int>(hits.size());

        std::vector<ContextChunk> candidates;
        candidates.reserve(hits.size());
        for (const auto& hit : hits) {
            ContextChunk c;
            c.content = hit.chunk.content;
            c.sourceDocument = hit.document.source.isEmpty() ? hit.document.id : hit.document.source;
            c.documentId = hit.document.id;
            c.chunkIndex = hit.chunk.chunkIndex;
            c.relevanceScore = hit.similarity;
            c.tokenCount = TextChunker::estimateTokenCount(hit.chunk.content);
            if (cfg.includeMetadata) {
                c.metadata = hit.document.metadata;
            }
            candidates.push_back(std::move(c));
        }

        if (cfg.deduplicate) {
            candidates = deduplicate(candidates);
        }
        if (candidates.size() > static_cast<size_t>(cfg.topK)) {
            candidates.resize(static_cast<size_t>(cfg.topK));
        }
        result.chunks = limitToBudget(candidates, cfg.maxContextTokens);
    } catch (const std::exception& e) {
        qCWarning(kv_retrieval) << "ContextRetriever: retrieval failed, continuing without context:" << e.what();
        result.chunks.clear();
        result.totalRetrieved = 0;
    }

    result.retrievalTimeMs = timer.elapsed();
    qCDebug(kv_retrieval) << "ContextRetriever: selected" << result.chunks.size()
                          << "of" << result.totalRetrieved << "candidates in" << result.retrievalTimeMs << "ms";
    return result;
}

QFuture<ContextChunk> ContextRetriever::retrieveContextStream(const QString& query, const RetrievalConfig& config) const
{
    return QtConcurrent::run([this, query, config](QPromise<ContextChunk>& promise) {
        const RetrievedContext ctx = retrieveContext(query, config);
        for (const auto& chunk : ctx.chunks) {
            if (promise.isCanceled()) {
                return;
            }
            promise.addResult(chunk);
        }
    });
}

QString ContextRetriever::formatContextForPrompt(const RetrievedContext& context)
{
    if (context.isEmpty()) {
        return QString();
    }

    QString out;
    out += QStringLiteral("=== RELEVANT CONTEXT ===\n\n");
    out += QStringLiteral("Retrieved %1 relevant document excerpts:\n\n").arg(static_cast<int>(context.chunks.size()));

    int i = 1;
    for (const auto& chunk : context.chunks) {
        out += QStringLiteral("--- Context %1 ---\n").arg(i++);
        out += QStringLiteral("Source: %1\n").arg(chunk.sourceDocument);
        out += QStringLiteral("Relevance: %1%\n").arg(static_cast<int>(chunk.relevanceScore * 100.0));
        const QString tags = chunk.metadata.value(QStringLiteral("tags"));
        if (!tags.isEmpty()) {
            out += QStringLiteral("Tags: %1\n").arg(tags);
        }
        out += QLatin1Char('\n');
        out += chunk.content;
        out += QStringLiteral("\n\n");
    }

    out += QStringLiteral("=== END CONTEXT ===\n\n");
    out += QStringLiteral("Use the above context to answer the user's question. Cite specific sources when possible.\n\n");
    out += QStringLiteral("User Question: %1\n").arg(context.query);
    return out;
}

ContextWindowStats ContextRetriever::contextWindowStats(int availableTokens) const
{
    const StoreStats stats = m_store.statistics();
    const QDateTime now = QDateTime::currentDateTimeUtc();

    ContextWindowStats out;
    out.availableTokens = availableTokens;
    out.usedTokens = stats.totalTokens;
    out.documentCount = stats.documentCount;
    out.chunkCount = stats.chunkCount;
    if (stats.oldestCreatedAt.isValid()) {
        out.oldestDocumentAgeMs = std::max<qint64>(0, stats.oldestCreatedAt.msecsTo(now));
    }
    if (stats.newestCreatedAt.isValid()) {
        out.newestDocumentAgeMs = std::max<qint64>(0, stats.newestCreatedAt.msecsTo(now));
    }
    return out;
}
