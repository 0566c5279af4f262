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

#include "ProgressEvents.h"
#include "TextChunker.h"
#include "VaultTypes.h"
#include "ContextRetriever.h"
#include "backends/ILLMBackend.h"

#include <QByteArray>
#include <QDateTime>
#include <QFuture>
#include <QMap>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>

class DocumentStore;
class IPdfExtractor;

/**
 * @brief Descriptive data attached to an ingested document.
 *
 * Flattened into the document's key/value metadata by toMetadataMap().
 */
struct DocumentMetadata {
    QString fileName;
    QString fileType;
    qint64 fileSize = 0;
    QDateTime uploadedAt;
    QString author;
    QString title;
    std::optional<int> pageCount;
    QStringList tags;
    QMap<QString, QString> customFields;

    /// Keys: file_name, file_type, file_size, uploaded_at, author, title,
    /// page_count, tags (comma joined), then custom fields. Empty optionals are skipped.
    MetadataMap toMetadataMap() const;
};

struct IngestionStats {
    int totalDocuments = 0;
    int totalChunks = 0;
    qint64 totalSizeBytes = 0;
    int averageChunkTokens = 0;
    QDateTime lastIngestionTime;
};

/**
 * @brief Sequences the ingestion and query pipelines and reports progress.
 *
 * Every pipeline runs on the global thread pool and reports its stages as
 * results of the returned QFuture, in order. The orchestrator holds
 * references only: the store, backends, retriever and extractor must outlive
 * every future it hands out.
 */
class RagOrchestrator
{
public:
    RagOrchestrator(DocumentStore& store,
                    IEmbeddingBackend& embedder,
                    IGenerationBackend& generator,
                    ContextRetriever& retriever,
                    IPdfExtractor* pdfExtractor = nullptr);

    /**
     * @brief Chunk, embed and store one text document.
     *
     * A chunk that fails to embed is skipped with a warning. ModelNotLoadedError
     * aborts the whole document. The last event is always Complete or Error.
     */
    QFuture<IngestionProgress> ingestText(const QString& content,
                                          const DocumentMetadata& metadata,
                                          const ChunkingConfig& config = ChunkingConfig());

    QFuture<IngestionProgress> ingestPdf(const QByteArray& pdfBytes,
                                         const DocumentMetadata& metadata,
                                         const ChunkingConfig& config = ChunkingConfig());

    /**
     * @brief Ingest a list of files as one logical source.
     *
     * Each file is tagged "folder:<folderName>". .txt and .md files are read
     * as UTF-8 text, .pdf files go through the extractor. A failing file
     * reports Error and the remaining files still run.
     */
    QFuture<IngestionProgress> ingestFolder(const QStringList& filePaths,
                                            const QString& folderName,
                                            const ChunkingConfig& config = ChunkingConfig());

    /**
     * @brief Retrieve context, build the prompt and stream the answer.
     *
     * Without context a NoContext event is reported and the bare question is
     * sent. Cancelling the future cancels the token stream; queries never
     * write to the store.
     */
    QFuture<QueryProgress> ask(const QString& question,
                               const RetrievalConfig& retrievalConfig = RetrievalConfig(),
                               const GenerationParams& params = GenerationParams());

    /// Ingest @p content, then ask @p question against it. Stops after a failed ingestion.
    QFuture<ChatProgress> uploadAndChat(const QString& content,
                                        const DocumentMetadata& metadata,
                                        const QString& question,
                                        const RetrievalConfig& retrievalConfig = RetrievalConfig(),
                                        const GenerationParams& params = GenerationParams());

    IngestionStats ingestionStats() const;

private:
    using IngestReporter = std::function<void(const IngestionProgress&)>;
    using QueryReporter = std::function<void(const QueryProgress&)>;
    using CancelCheck = std::function<bool()>;

    // Synchronous pipeline bodies shared by the future-returning entry points.
    // Return true when the pipeline reached Complete.
    bool runIngestText(const QString& content, const DocumentMetadata& metadata, const ChunkingConfig& config,
                       const IngestReporter& report, const CancelCheck& isCanceled);
    bool runIngestPdf(const QByteArray& pdfBytes, const DocumentMetadata& metadata, const ChunkingConfig& config,
                      const IngestReporter& report, const CancelCheck& isCanceled);
    void runIngestFolder(const QStringList& filePaths, const QString& folderName, const ChunkingConfig& config,
                         const IngestReporter& report, const CancelCheck& isCanceled);
    void runAsk(const QString& question, const RetrievalConfig& retrievalConfig, const GenerationParams& params,
                const QueryReporter& report, const CancelCheck& isCanceled);

    DocumentStore& m_store;
    IEmbeddingBackend& m_embedder;
    IGenerationBackend& m_generator;
    ContextRetriever& m_retriever;
    IPdfExtractor* m_pdfExtractor;
};
