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

#include <QDateTime>
#include <QMap>
#include <QString>

#include <vector>

using MetadataMap = QMap<QString, QString>;
using Embedding = std::vector<float>;

/**
 * @brief A stored document. Content is always the redacted text.
 *
 * Documents are never mutated in place: adding a document with an existing id
 * replaces it (delete and reinsert).
 */
struct Document {
    QString id;
    QString content;
    QString source;
    MetadataMap metadata;
    int chunkCount = 0;
    QDateTime createdAt;
    QDateTime updatedAt;
};

/**
 * @brief A bounded text segment of a document with its embedding vector.
 */
struct Chunk {
    QString id;
    QString documentId;
    QString content;
    int chunkIndex = 0;
    int tokenCount = 0; ///< set by the store from the stored (redacted) content
    Embedding embedding;
    QDateTime createdAt;
};

// Named grouping of documents. Membership lives in a join table.
struct Session {
    QString id;
    QString name;
    QString description;
    QDateTime createdAt;
    QDateTime lastAccessedAt;
};

struct SearchHit {
    Chunk chunk;
    Document document;
    double similarity = 0.0;
};

struct StoreStats {
    int documentCount = 0;
    int chunkCount = 0;
    int indexedChunkCount = 0;
    qint64 totalTokens = 0;
    QDateTime oldestCreatedAt;
    QDateTime newestCreatedAt;
};
