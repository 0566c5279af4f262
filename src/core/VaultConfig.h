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

#include "ContextRetriever.h"
#include "TextChunker.h"
#include "backends/ILLMBackend.h"

#include <QJsonObject>
#include <QString>

/**
 * @brief Runtime settings for the vault, loaded from a JSON file.
 *
 * Sections: "store", "chunking", "retrieval", "generation", "backend".
 * Unknown keys are ignored and every missing or out-of-range value falls back
 * to its default or is clamped. The passphrase is never part of the config.
 */
struct VaultConfig {
    struct StoreSettings {
        QString path;                  ///< empty = defaultVaultPath()
        int embeddingDimension = 0;    ///< 0 = adopt from the first insert
        int kdfIterations = 200000;
        bool requireIndex = true;      ///< false allows degraded mode
    };

    struct BackendSettings {
        QString baseUrl = QStringLiteral("http://127.0.0.1:8080/v1");
        QString embeddingModel;
        QString generationModel;
        QString apiKey;
        bool allowRemote = false;
        int connectTimeoutMs = 10000;
        int requestTimeoutMs = 120000;
    };

    StoreSettings store;
    ChunkingConfig chunking;
    RetrievalConfig retrieval;
    GenerationParams generation;
    BackendSettings backend;

    static VaultConfig fromJson(const QJsonObject& root);
    QJsonObject toJson() const;

    /**
     * @brief Load a config file.
     *
     * A missing file yields the defaults. A file that exists but cannot be
     * read or is not a JSON object throws VaultError.
     */
    static VaultConfig loadFromFile(const QString& filePath);

    /// Atomic write (QSaveFile), owner read/write only on Unix.
    bool saveToFile(const QString& filePath) const;

    /// Throws VaultError when the backend URL leaves the machine and allowRemote is off.
    void validate() const;

    QString resolvedStorePath() const;

    static QString defaultConfigPath();
    static QString defaultVaultPath();

    /// True for localhost, 127.0.0.0/8 and ::1.
    static bool isLoopbackUrl(const QString& url);

    /// KNOWLEDGE_VAULT_PASSPHRASE, or an empty string when unset.
    static QString passphraseFromEnvironment();
};
