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

#include "RagOrchestrator.h"

#include "DocumentLoader.h"
#include "DocumentStore.h"
#include "VaultErrors.h"
#include "backends/IPdfExtractor.h"
#include "logging_categories.h"

#include <QElapsedTimer>
#include <QFileInfo>
#include <QPromise>
#include <QUuid>
#include <QtConcurrent>

#include <exception>

MetadataMap DocumentMetadata::toMetadataMap() const
{
    MetadataMap map;
    map.insert(QStringLiteral("file_name"), fileName);
    map.insert(QStringLiteral("file_type"), fileType);
    map.insert(QStringLiteral("file_size"), QString::number(fileSize));
    const QDateTime uploaded = uploadedAt.isValid() ? uploadedAt : QDateTime::currentDateTimeUtc();
    map.insert(QStringLiteral("uploaded_at"), QString::number(uploaded.toMSecsSinceEpoch()));
    if (!author.isEmpty()) {
        map.insert(QStringLiteral("author"), author);
    }
    if (!title.isEmpty()) {
        map.insert(QStringLiteral("title"), title);
    }
    if (pageCount) {
        map.insert(QStringLiteral("page_count"), QString::number(*pageCount));
    }
    if (!tags.isEmpty()) {
        map.insert(QStringLiteral("tags"), tags.join(QLatin1Char(',')));
    }
    for (auto it = customFields.constBegin(); it != customFields.constEnd(); ++it) {
        map.insert(it.key(), it.value());
    }
    return map;
}

RagOrchestrator::RagOrchestrator(DocumentStore& store,
                                 IEmbeddingBackend& embedder,
                                 IGenerationBackend& generator,
                                 ContextRetriever& retriever,
                                 IPdfExtractor* pdfExtractor)
    : m_store(store)
    , m_embedder(embedder)
    , m_generator(generator)
    , m_retriever(retriever)
    , m_pdfExtractor(pdfExtractor)
{
}

QFuture<IngestionProgress> RagOrchestrator::ingestText(const QString& content,
                                                       const DocumentMetadata& metadata,
                                                       const ChunkingConfig& config)
{
    return QtConcurrent::run([this, content, metadata, config](QPromise<IngestionProgress>& promise) {
        runIngestText(content, metadata, config,
                      [&promise](const IngestionProgress& event) { promise.addResult(event); },
                      [&promise]() { return promise.isCanceled(); });
    });
}

QFuture<IngestionProgress> RagOrchestrator::ingestPdf(const QByteArray& pdfBytes,
                                                      const DocumentMetadata& metadata,
                                                      const ChunkingConfig& config)
{
    return QtConcurrent::run([this, pdfBytes, metadata, config](QPromise<IngestionProgress>& promise) {
        runIngestPdf(pdfBytes, metadata, config,
                     [&promise](const IngestionProgress& event) { promise.addResult(event); },
                     [&promise]() { return promise.isCanceled(); });
    });
}

QFuture<IngestionProgress> RagOrchestrator::ingestFolder(const QStringList& filePaths,
                                                         const QString& folderName,
                                                         const ChunkingConfig& config)
{
    return QtConcurrent::run([this, filePaths, folderName, config](QPromise<IngestionProgress>& promise) {
        runIngestFolder(filePaths, folderName, config,
                        [&promise](const IngestionProgress& event) { promise.addResult(event); },
                        [&promise]() { return promise.isCanceled(); });
    });
}

QFuture<QueryProgress> RagOrchestrator::ask(const QString& question,
                                            const RetrievalConfig& retrievalConfig,
                                            const GenerationParams& params)
{
    return QtConcurrent::run([this, question, retrievalConfig, params](QPromise<QueryProgress>& promise) {
        runAsk(question, retrievalConfig, params,
               [&promise](const QueryProgress& event) { promise.addResult(event); },
               [&promise]() { return promise.isCanceled(); });
    });
}

QFuture<ChatProgress> RagOrchestrator::uploadAndChat(const QString& content,
                                                     const DocumentMetadata& metadata,
                                                     const QString& question,
                                                     const RetrievalConfig& retrievalConfig,
                                                     const GenerationParams& params)
{
    return QtConcurrent::run([this, content, metadata, question, retrievalConfig, params](QPromise<ChatProgress>& promise) {
        auto isCanceled = [&promise]() { return promise.isCanceled(); };

        const bool ingested = runIngestText(
            content, metadata, ChunkingConfig(),
            [&promise](const IngestionProgress& event) { promise.addResult(ChatProgress(event)); },
            isCanceled);
        if (!ingested || promise.isCanceled()) {
            return;
        }

        runAsk(question, retrievalConfig, params,
               [&promise](const QueryProgress& event) { promise.addResult(ChatProgress(event)); },
               isCanceled);
    });
}

bool RagOrchestrator::runIngestText(const QString& content,
                                    const DocumentMetadata& metadata,
                                    const ChunkingConfig& config,
                                    const IngestReporter& report,
                                    const CancelCheck& isCanceled)
{
    QElapsedTimer timer;
    timer.start();

    const QString name = metadata.fileName.isEmpty() ? QStringLiteral("untitled") : metadata.fileName;

    try {
        report(ingest::Reading{name});

        report(ingest::Chunking{QStringLiteral("%1 (%2 characters)").arg(name).arg(content.size())});
        const QStringList pieces = TextChunker::chunk(content, config);
        if (pieces.isEmpty()) {
            report(ingest::Error{QStringLiteral("%1: No valid chunks generated from document").arg(name)});
            return false;
        }

        const QString documentId = QUuid::createUuid().toString(QUuid::WithoutBraces);
        const int total = static_cast<int>(pieces.size());

        std::vector<Chunk> chunks;
        chunks.reserve(pieces.size());
        for (int i = 0; i < total; ++i) {
            if (isCanceled()) {
                qCInfo(kv_ingest) << "RagOrchestrator: ingestion of" << name << "cancelled";
                report(ingest::Error{QStringLiteral("%1: Ingestion cancelled").arg(name)});
                return false;
            }

            report(ingest::Embedding{i + 1, total});

            Chunk chunk;
            chunk.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
            chunk.documentId = documentId;
            chunk.content = pieces.at(i);
            chunk.chunkIndex = i;
            chunk.tokenCount = TextChunker::estimateTokenCount(chunk.content);
            try {
                chunk.embedding = m_embedder.embed(chunk.content);
            } catch (const ModelNotLoadedError& e) {
                report(ingest::Error{QStringLiteral("%1: Embedding model not loaded: %2")
                                         .arg(name, QString::fromUtf8(e.what()))});
                return false;
            } catch (const std::exception& e) {
                qCWarning(kv_ingest) << "RagOrchestrator: Failed to embed chunk" << i << "of" << name << ":" << e.what();
                continue;
            }
            chunks.push_back(std::move(chunk));
        }

        if (chunks.empty()) {
            report(ingest::Error{QStringLiteral("%1: Failed to generate embeddings for any chunks").arg(name)});
            return false;
        }

        report(ingest::Storing{name});

        Document document;
        document.id = documentId;
        document.content = content;
        document.source = name;
        document.metadata = metadata.toMetadataMap();
        document.chunkCount = static_cast<int>(chunks.size());

        const QString storedId = m_store.addDocument(document, chunks);
        const qint64 duration = timer.elapsed();

        report(ingest::Complete{storedId, static_cast<int>(chunks.size()), duration});
        qCInfo(kv_ingest) << "RagOrchestrator: Ingested" << name << ":" << chunks.size()
                          << "chunks in" << duration << "ms";
        return true;
    } catch (const std::exception& e) {
        qCWarning(kv_ingest) << "RagOrchestrator: Error ingesting" << name << ":" << e.what();
        report(ingest::Error{QStringLiteral("%1: Ingestion failed: %2").arg(name, QString::fromUtf8(e.what()))});
        return false;
    }
}

bool RagOrchestrator::runIngestPdf(const QByteArray& pdfBytes,
                                   const DocumentMetadata& metadata,
                                   const ChunkingConfig& config,
                                   const IngestReporter& report,
                                   const CancelCheck& isCanceled)
{
    const QString name = metadata.fileName.isEmpty() ? QStringLiteral("untitled.pdf") : metadata.fileName;

    if (!m_pdfExtractor) {
        report(ingest::Error{QStringLiteral("%1: PDF extraction not available, no extractor configured").arg(name)});
        return false;
    }

    PdfExtractionResult extraction;
    try {
        extraction = m_pdfExtractor->extract(pdfBytes);
    } catch (const std::exception& e) {
        extraction.hasError = true;
        extraction.errorMsg = QString::fromUtf8(e.what());
    }
    if (extraction.hasError) {
        report(ingest::Error{QStringLiteral("%1: PDF extraction failed: %2").arg(name, extraction.errorMsg)});
        return false;
    }

    DocumentMetadata enriched = metadata;
    enriched.fileName = name;
    if (enriched.fileType.isEmpty()) {
        enriched.fileType = QStringLiteral("pdf");
    }
    enriched.pageCount = extraction.pageCount;
    for (auto it = extraction.metadata.constBegin(); it != extraction.metadata.constEnd(); ++it) {
        enriched.customFields.insert(it.key(), it.value());
    }

    return runIngestText(extraction.text, enriched, config, report, isCanceled);
}

void RagOrchestrator::runIngestFolder(const QStringList& filePaths,
                                      const QString& folderName,
                                      const ChunkingConfig& config,
                                      const IngestReporter& report,
                                      const CancelCheck& isCanceled)
{
    qCInfo(kv_ingest) << "RagOrchestrator: Ingesting folder" << folderName << "with" << filePaths.size() << "files";

    int successCount = 0;
    int failCount = 0;

    for (const QString& filePath : filePaths) {
        if (isCanceled()) {
            break;
        }

        const QFileInfo info(filePath);
        if (!info.exists()) {
            report(ingest::Error{QStringLiteral("File not found: %1").arg(filePath)});
            ++failCount;
            continue;
        }
        if (!info.isFile()) {
            report(ingest::Error{QStringLiteral("Path is not a file: %1").arg(filePath)});
            ++failCount;
            continue;
        }

        DocumentMetadata metadata;
        metadata.fileName = info.fileName();
        metadata.fileType = DocumentLoader::fileTypeLabel(filePath);
        metadata.fileSize = info.size();
        metadata.uploadedAt = QDateTime::currentDateTimeUtc();
        metadata.tags = QStringList{QStringLiteral("folder:%1").arg(folderName)};

        bool ok = false;
        switch (DocumentLoader::fileTypeFromExtension(filePath)) {
        case VaultFileType::PlainText:
        case VaultFileType::Markdown: {
            const std::optional<QString> content = DocumentLoader::readTextFile(filePath);
            if (!content) {
                report(ingest::Error{QStringLiteral("%1: Failed to read text file").arg(metadata.fileName)});
                break;
            }
            ok = runIngestText(*content, metadata, config, report, isCanceled);
            break;
        }
        case VaultFileType::Pdf: {
            if (!m_pdfExtractor) {
                report(ingest::Error{QStringLiteral("%1: PDF extraction not available, no extractor configured")
                                         .arg(metadata.fileName)});
                break;
            }
            const std::optional<QByteArray> bytes = DocumentLoader::readBinaryFile(filePath);
            if (!bytes) {
                report(ingest::Error{QStringLiteral("%1: Failed to read PDF file").arg(metadata.fileName)});
                break;
            }
            ok = runIngestPdf(*bytes, metadata, config, report, isCanceled);
            break;
        }
        case VaultFileType::Unsupported:
            report(ingest::Error{QStringLiteral("%1: Unsupported file type: %2 (supported: txt, md, pdf)")
                                     .arg(metadata.fileName, metadata.fileType)});
            break;
        }

        if (ok) {
            ++successCount;
        } else {
            ++failCount;
        }
    }

    qCInfo(kv_ingest) << "RagOrchestrator: Folder ingestion complete:" << successCount << "succeeded,"
                      << failCount << "failed";
}

void RagOrchestrator::runAsk(const QString& question,
                             const RetrievalConfig& retrievalConfig,
                             const GenerationParams& params,
                             const QueryReporter& report,
                             const CancelCheck& isCanceled)
{
    try {
        report(ask::Retrieving{QStringLiteral("Searching the vault")});
        const RetrievedContext context = m_retriever.retrieveContext(question, retrievalConfig);

        QString prompt;
        if (context.isEmpty()) {
            report(ask::NoContext{QStringLiteral("No relevant documents found, answering without context")});
            prompt = question;
        } else {
            report(ask::ContextRetrieved{static_cast<int>(context.chunks.size())});
            prompt = ContextRetriever::formatContextForPrompt(context);
        }

        if (isCanceled()) {
            return;
        }

        report(ask::Generating{QStringLiteral("Generating answer")});
        std::unique_ptr<ITokenStream> stream = m_generator.generate(prompt, params);

        while (true) {
            if (isCanceled()) {
                stream->cancel();
                qCDebug(kv_retrieval) << "RagOrchestrator: generation cancelled";
                return;
            }
            const std::optional<QString> token = stream->next();
            if (!token) {
                break;
            }
            if (isCanceled()) {
                stream->cancel();
                return;
            }
            report(ask::Token{*token});
        }

        if (!isCanceled()) {
            report(ask::Complete{});
        }
    } catch (const std::exception& e) {
        qCWarning(kv_retrieval) << "RagOrchestrator: query failed:" << e.what();
        report(ask::Error{QString::fromUtf8(e.what())});
    }
}

IngestionStats RagOrchestrator::ingestionStats() const
{
    const StoreStats store = m_store.statistics();

    IngestionStats stats;
    stats.totalDocuments = store.documentCount;
    stats.totalChunks = store.chunkCount;
    stats.averageChunkTokens = store.chunkCount > 0
        ? static_cast<int>(store.totalTokens / store.chunkCount)
        : 0;
    stats.lastIngestionTime = store.newestCreatedAt;

    for (const Document& doc : m_store.listDocuments()) {
        bool ok = false;
        const qint64 size = doc.metadata.value(QStringLiteral("file_size")).toLongLong(&ok);
        stats.totalSizeBytes += (ok && size > 0) ? size : doc.content.toUtf8().size();
    }
    return stats;
}
