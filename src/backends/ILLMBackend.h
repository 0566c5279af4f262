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

#include <QString>
#include <QStringList>

#include <memory>
#include <optional>
#include <vector>

/**
 * @brief Result structure returned by raw embedding calls.
 *
 * Adapters fill this internally and convert errors into exceptions at the
 * IEmbeddingBackend boundary.
 */
struct EmbeddingResult {
    std::vector<float> vector;  ///< The embedding vector
    bool hasError = false;      ///< Whether an error occurred
    QString errorMsg;           ///< Error message if hasError is true
    bool modelNotLoaded = false; ///< Server unreachable or reports no loaded model
};

/**
 * @brief Sampling parameters for a generation request.
 */
struct GenerationParams {
    int maxTokens = 512;
    double temperature = 0.7;
    double topP = 0.9;
    int topK = 40;
    double repeatPenalty = 1.1;
    QStringList stopSequences;
};

/**
 * @brief Lazy, cancellable, ordered sequence of generated tokens.
 *
 * The consumer pulls with next() until it returns std::nullopt. cancel() may
 * be called from any thread; afterwards next() returns std::nullopt promptly.
 * No more than one token is buffered ahead of the consumer.
 */
class ITokenStream {
public:
    virtual ~ITokenStream() = default;

    /// Blocks until the next token is available. Throws BackendError on transport failure.
    virtual std::optional<QString> next() = 0;
    virtual void cancel() = 0;
};

/**
 * @brief Converts text to fixed-width vectors.
 *
 * Synchronous; call from a worker thread (QtConcurrent::run).
 */
class IEmbeddingBackend {
public:
    virtual ~IEmbeddingBackend() = default;

    /**
     * @brief Embed a piece of text.
     * @throws ModelNotLoadedError when no model is loaded
     * @throws BackendError for any other failure
     */
    virtual std::vector<float> embed(const QString& text) = 0;

    virtual bool isModelLoaded() const = 0;

    /// Vector width, or 0 when unknown until the first call.
    virtual int dimension() const = 0;
};

/**
 * @brief Produces a token stream for a prompt.
 */
class IGenerationBackend {
public:
    virtual ~IGenerationBackend() = default;

    /**
     * @throws ModelNotLoadedError when no model is loaded
     */
    virtual std::unique_ptr<ITokenStream> generate(const QString& prompt, const GenerationParams& params) = 0;

    virtual bool isModelLoaded() const = 0;
};
