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

#include "ILLMBackend.h"

#include <QString>
#include <QThreadPool>

#include <atomic>

/**
 * @brief Embedding and generation against a local OpenAI-compatible server
 *        (llama.cpp server, Ollama, LM Studio).
 *
 * Uses POST {baseUrl}/embeddings for vectors and a streaming
 * POST {baseUrl}/completions (server-sent events) for tokens. A refused
 * connection or a "model not loaded" response maps to ModelNotLoadedError.
 */
class LocalModelBackend : public IEmbeddingBackend, public IGenerationBackend {
public:
    struct Settings {
        QString baseUrl = QStringLiteral("http://127.0.0.1:8080/v1");
        QString embeddingModel;
        QString generationModel;
        QString apiKey;              ///< optional; most local servers ignore it
        int connectTimeoutMs = 10000;
        int requestTimeoutMs = 120000;
    };

    explicit LocalModelBackend(Settings settings);
    ~LocalModelBackend() override = default;

    std::vector<float> embed(const QString& text) override;
    int dimension() const override;

    std::unique_ptr<ITokenStream> generate(const QString& prompt, const GenerationParams& params) override;

    /// Probes GET {baseUrl}/models.
    bool isModelLoaded() const override;

    const Settings& settings() const { return m_settings; }

    // Exposed for tests: builds the JSON body of a streaming completion request
    static QByteArray buildCompletionRequest(const QString& model, const QString& prompt, const GenerationParams& params);

    // Exposed for tests: extracts the token text from one SSE "data:" payload.
    // Returns std::nullopt for "[DONE]".
    static std::optional<QString> parseStreamPayload(const QByteArray& payload);

protected:
    // Test seam: raw embedding call without exceptions
    virtual EmbeddingResult requestEmbedding(const QString& text);

private:
    Settings m_settings;
    std::atomic<int> m_dimension{0};
    QThreadPool m_transferPool; // streaming transfers, kept off the global pool the pipelines run on
};
