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

#include "LocalModelBackend.h"

#include "VaultErrors.h"
#include "logging_categories.h"

#include <cpr/cpr.h>

#include <QFuture>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutex>
#include <QMutexLocker>
#include <QWaitCondition>
#include <QtConcurrent>

namespace {

cpr::Header jsonHeaders(const QString& apiKey)
{
    cpr::Header headers{{"Content-Type", "application/json"}};
    if (!apiKey.isEmpty()) {
        headers.insert({"Authorization", std::string("Bearer ") + apiKey.toStdString()});
    }
    return headers;
}

bool looksLikeModelNotLoaded(long statusCode, const QString& message)
{
    if (statusCode == 503) {
        return true;
    }
    const QString lower = message.toLower();
    return lower.contains(QStringLiteral("not loaded"))
        || lower.contains(QStringLiteral("no model"))
        || lower.contains(QStringLiteral("model not found"));
}

QString errorMessageFromBody(const std::string& body, long statusCode)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(body), &parseError);
    if (parseError.error == QJsonParseError::NoError && doc.isObject()) {
        const QJsonValue error = doc.object().value(QStringLiteral("error"));
        if (error.isObject()) {
            return error.toObject().value(QStringLiteral("message"))
                .toString(QStringLiteral("HTTP %1").arg(statusCode));
        }
        if (error.isString()) {
            return error.toString();
        }
    }
    return QStringLiteral("HTTP %1").arg(statusCode);
}

/**
 * @brief State shared between the SSE transfer thread and the consumer.
 *
 * One-slot hand-off: the producer waits until the consumer took the previous
 * token, so at most one token is buffered ahead.
 */
struct StreamState {
    QMutex mutex;
    QWaitCondition changed;
    std::optional<QString> slot;
    bool finished = false;
    bool cancelled = false;
    bool modelNotLoaded = false;
    QString error;
    QByteArray pending; // partial SSE line

    // Producer side. Returns false when the consumer cancelled.
    bool push(const QString& token)
    {
        QMutexLocker locker(&mutex);
        while (slot && !cancelled) {
            changed.wait(&mutex);
        }
        if (cancelled) {
            return false;
        }
        slot = token;
        changed.wakeAll();
        return true;
    }

    void finish(const QString& errorMessage = QString(), bool notLoaded = false)
    {
        QMutexLocker locker(&mutex);
        if (!finished) {
            finished = true;
            error = errorMessage;
            modelNotLoaded = notLoaded;
        }
        changed.wakeAll();
    }
};

class SseTokenStream : public ITokenStream {
public:
    SseTokenStream(std::shared_ptr<StreamState> state, QFuture<void> transfer)
        : m_state(std::move(state))
        , m_transfer(std::move(transfer))
    {
    }

    ~SseTokenStream() override
    {
        cancel();
        m_transfer.waitForFinished();
    }

    std::optional<QString> next() override
    {
        QMutexLocker locker(&m_state->mutex);
        while (!m_state->slot && !m_state->finished && !m_state->cancelled) {
            m_state->changed.wait(&m_state->mutex);
        }
        if (m_state->cancelled) {
            return std::nullopt;
        }
        if (m_state->slot) {
            std::optional<QString> token = std::move(m_state->slot);
            m_state->slot.reset();
            m_state->changed.wakeAll();
            return token;
        }
        if (!m_state->error.isEmpty()) {
            const std::string message = m_state->error.toStdString();
            if (m_state->modelNotLoaded) {
                throw ModelNotLoadedError(message);
            }
            throw BackendError(message);
        }
        return std::nullopt;
    }

    void cancel() override
    {
        QMutexLocker locker(&m_state->mutex);
        m_state->cancelled = true;
        m_state->changed.wakeAll();
    }

private:
    std::shared_ptr<StreamState> m_state;
    QFuture<void> m_transfer;
};

} // namespace

LocalModelBackend::LocalModelBackend(Settings settings)
    : m_settings(std::move(settings))
{
    while (m_settings.baseUrl.endsWith(QLatin1Char('/'))) {
        m_settings.baseUrl.chop(1);
    }
    m_transferPool.setMaxThreadCount(4);
}

int LocalModelBackend::dimension() const
{
    return m_dimension.load();
}

bool LocalModelBackend::isModelLoaded() const
{
    const std::string url = (m_settings.baseUrl + QStringLiteral("/models")).toStdString();
    auto response = cpr::Get(
        cpr::Url{url},
        jsonHeaders(m_settings.apiKey),
        cpr::ConnectTimeout{2000},
        cpr::Timeout{5000}
    );
    if (response.error || response.status_code != 200) {
        qCDebug(kv_backend) << "LocalModelBackend: model probe failed, status" << response.status_code;
        return false;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(response.text));
    const QJsonArray models = doc.object().value(QStringLiteral("data")).toArray();
    return !models.isEmpty();
}

EmbeddingResult LocalModelBackend::requestEmbedding(const QString& text)
{
    EmbeddingResult result;

    QJsonObject root;
    root.insert(QStringLiteral("input"), text);
    if (!m_settings.embeddingModel.isEmpty()) {
        root.insert(QStringLiteral("model"), m_settings.embeddingModel);
    }
    const QByteArray jsonBytes = QJsonDocument(root).toJson(QJsonDocument::Compact);

    auto response = cpr::Post(
        cpr::Url{(m_settings.baseUrl + QStringLiteral("/embeddings")).toStdString()},
        jsonHeaders(m_settings.apiKey),
        cpr::Body{jsonBytes.toStdString()},
        cpr::ConnectTimeout{m_settings.connectTimeoutMs},
        cpr::Timeout{m_settings.requestTimeoutMs}
    );

    if (response.error) {
        result.hasError = true;
        const QString msg = QString::fromStdString(response.error.message);
        if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            result.errorMsg = QStringLiteral("Local model server timeout");
        } else {
            result.errorMsg = QStringLiteral("Local model server unreachable: %1").arg(msg);
            result.modelNotLoaded = true;
        }
        qCWarning(kv_backend) << "LocalModelBackend::embed network error:" << msg;
        return result;
    }

    if (response.status_code != 200) {
        result.hasError = true;
        result.errorMsg = errorMessageFromBody(response.text, response.status_code);
        result.modelNotLoaded = looksLikeModelNotLoaded(response.status_code, result.errorMsg);
        qCWarning(kv_backend) << "LocalModelBackend::embed HTTP error" << response.status_code
                              << result.errorMsg;
        return result;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(response.text), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        result.hasError = true;
        result.errorMsg = QStringLiteral("JSON parse error: %1").arg(parseError.errorString());
        return result;
    }

    const QJsonArray data = doc.object().value(QStringLiteral("data")).toArray();
    const QJsonArray embedding = data.isEmpty()
        ? QJsonArray()
        : data.first().toObject().value(QStringLiteral("embedding")).toArray();
    if (embedding.isEmpty()) {
        result.hasError = true;
        result.errorMsg = QStringLiteral("Response contains no embedding");
        return result;
    }

    result.vector.reserve(embedding.size());
    for (const QJsonValue& v : embedding) {
        result.vector.push_back(static_cast<float>(v.toDouble()));
    }
    return result;
}

std::vector<float> LocalModelBackend::embed(const QString& text)
{
    EmbeddingResult result = requestEmbedding(text);
    if (result.hasError) {
        if (result.modelNotLoaded) {
            throw ModelNotLoadedError(result.errorMsg.toStdString());
        }
        throw BackendError(result.errorMsg.toStdString());
    }

    int expected = 0;
    const int width = static_cast<int>(result.vector.size());
    if (!m_dimension.compare_exchange_strong(expected, width) && expected != width) {
        throw DimensionMismatchError(expected, width, "embedding backend response");
    }
    return std::move(result.vector);
}

QByteArray LocalModelBackend::buildCompletionRequest(const QString& model, const QString& prompt,
                                                     const GenerationParams& params)
{
    QJsonObject root;
    if (!model.isEmpty()) {
        root.insert(QStringLiteral("model"), model);
    }
    root.insert(QStringLiteral("prompt"), prompt);
    root.insert(QStringLiteral("stream"), true);
    root.insert(QStringLiteral("max_tokens"), params.maxTokens);
    root.insert(QStringLiteral("temperature"), params.temperature);
    root.insert(QStringLiteral("top_p"), params.topP);
    root.insert(QStringLiteral("top_k"), params.topK);
    root.insert(QStringLiteral("repeat_penalty"), params.repeatPenalty);
    if (!params.stopSequences.isEmpty()) {
        root.insert(QStringLiteral("stop"), QJsonArray::fromStringList(params.stopSequences));
    }
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

std::optional<QString> LocalModelBackend::parseStreamPayload(const QByteArray& payload)
{
    const QByteArray trimmed = payload.trimmed();
    if (trimmed == "[DONE]") {
        return std::nullopt;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(trimmed);
    const QJsonArray choices = doc.object().value(QStringLiteral("choices")).toArray();
    if (choices.isEmpty()) {
        // llama.cpp native /completion emits {"content": "..."}
        return doc.object().value(QStringLiteral("content")).toString();
    }
    const QJsonObject choice = choices.first().toObject();
    if (choice.contains(QStringLiteral("text"))) {
        return choice.value(QStringLiteral("text")).toString();
    }
    return choice.value(QStringLiteral("delta")).toObject().value(QStringLiteral("content")).toString();
}

std::unique_ptr<ITokenStream> LocalModelBackend::generate(const QString& prompt, const GenerationParams& params)
{
    auto state = std::make_shared<StreamState>();
    const std::string url = (m_settings.baseUrl + QStringLiteral("/completions")).toStdString();
    const std::string body = buildCompletionRequest(m_settings.generationModel, prompt, params).toStdString();
    const cpr::Header headers = jsonHeaders(m_settings.apiKey);
    const int connectTimeout = m_settings.connectTimeoutMs;
    const int requestTimeout = m_settings.requestTimeoutMs;

    QFuture<void> transfer = QtConcurrent::run(&m_transferPool, [state, url, body, headers, connectTimeout, requestTimeout]() {
        bool done = false;

        auto onData = [state, &done](const auto& data, intptr_t) -> bool {
            {
                QMutexLocker locker(&state->mutex);
                if (state->cancelled) {
                    return false;
                }
                state->pending.append(data.data(), static_cast<qsizetype>(data.size()));
            }

            while (true) {
                QByteArray line;
                {
                    QMutexLocker locker(&state->mutex);
                    const qsizetype newline = state->pending.indexOf('\n');
                    if (newline < 0) {
                        break;
                    }
                    line = state->pending.left(newline).trimmed();
                    state->pending.remove(0, newline + 1);
                }
                if (!line.startsWith("data:")) {
                    continue; // comments, event names, blank separators
                }
                const auto token = parseStreamPayload(line.mid(5));
                if (!token) {
                    done = true;
                    return true;
                }
                if (!token->isEmpty() && !state->push(*token)) {
                    return false;
                }
            }
            return true;
        };

        auto onProgress = [state](auto, auto, auto, auto, intptr_t) -> bool {
            QMutexLocker locker(&state->mutex);
            return !state->cancelled;
        };

        auto response = cpr::Post(
            cpr::Url{url},
            headers,
            cpr::Body{body},
            cpr::ConnectTimeout{connectTimeout},
            cpr::Timeout{requestTimeout},
            cpr::WriteCallback{onData},
            cpr::ProgressCallback{onProgress}
        );

        {
            QMutexLocker locker(&state->mutex);
            if (state->cancelled) {
                locker.unlock();
                state->finish();
                return;
            }
        }

        if (response.error && !done) {
            const QString msg = QString::fromStdString(response.error.message);
            qCWarning(kv_backend) << "LocalModelBackend::generate network error:" << msg;
            state->finish(QStringLiteral("Local model server error: %1").arg(msg),
                          response.error.code != cpr::ErrorCode::OPERATION_TIMEDOUT);
            return;
        }
        if (response.status_code != 200) {
            const QString msg = QStringLiteral("HTTP %1").arg(response.status_code);
            qCWarning(kv_backend) << "LocalModelBackend::generate" << msg;
            state->finish(msg, looksLikeModelNotLoaded(response.status_code, msg));
            return;
        }
        state->finish();
    });

    return std::make_unique<SseTokenStream>(std::move(state), std::move(transfer));
}
