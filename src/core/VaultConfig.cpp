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

#include "VaultConfig.h"

#include "VaultErrors.h"
#include "string_utils.h"
#include "logging_categories.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QStandardPaths>
#include <QUrl>

#include <algorithm>

namespace {

int readInt(const QJsonObject& obj, const char* key, int fallback, int lo, int hi)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (!v.isDouble()) {
        return fallback;
    }
    return std::clamp(v.toInt(fallback), lo, hi);
}

double readDouble(const QJsonObject& obj, const char* key, double fallback, double lo, double hi)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (!v.isDouble()) {
        return fallback;
    }
    return std::clamp(v.toDouble(fallback), lo, hi);
}

bool readBool(const QJsonObject& obj, const char* key, bool fallback)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    return v.isBool() ? v.toBool() : fallback;
}

QString readString(const QJsonObject& obj, const char* key, const QString& fallback)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    return v.isString() ? v.toString() : fallback;
}

QString configBaseDir()
{
#if defined(Q_OS_MAC)
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
#else
    return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
#endif
}

} // namespace

VaultConfig VaultConfig::fromJson(const QJsonObject& root)
{
    VaultConfig cfg;

    const QJsonObject store = root.value(QStringLiteral("store")).toObject();
    cfg.store.path = readString(store, "path", cfg.store.path);
    cfg.store.embeddingDimension = readInt(store, "embedding_dimension", cfg.store.embeddingDimension, 0, 65536);
    cfg.store.kdfIterations = readInt(store, "kdf_iterations", cfg.store.kdfIterations, 1000, 10000000);
    cfg.store.requireIndex = readBool(store, "require_index", cfg.store.requireIndex);

    const QJsonObject chunking = root.value(QStringLiteral("chunking")).toObject();
    cfg.chunking.maxChunkTokens = readInt(chunking, "max_chunk_tokens", cfg.chunking.maxChunkTokens, 1, 8192);
    cfg.chunking.overlapWords = readInt(chunking, "overlap_words", cfg.chunking.overlapWords, 0, 1000);
    cfg.chunking.minChunkTokens = readInt(chunking, "min_chunk_tokens", cfg.chunking.minChunkTokens, 0, 8192);
    cfg.chunking.preserveParagraphs = readBool(chunking, "preserve_paragraphs", cfg.chunking.preserveParagraphs);
    cfg.chunking = cfg.chunking.normalized();

    const QJsonObject retrieval = root.value(QStringLiteral("retrieval")).toObject();
    cfg.retrieval.topK = readInt(retrieval, "top_k", cfg.retrieval.topK, 1, 50);
    cfg.retrieval.minRelevanceScore = readDouble(retrieval, "min_relevance_score", cfg.retrieval.minRelevanceScore, 0.0, 1.0);
    cfg.retrieval.deduplicate = readBool(retrieval, "deduplicate", cfg.retrieval.deduplicate);
    cfg.retrieval.includeMetadata = readBool(retrieval, "include_metadata", cfg.retrieval.includeMetadata);
    cfg.retrieval.maxContextTokens = readInt(retrieval, "max_context_tokens", cfg.retrieval.maxContextTokens, 0, 1000000);

    const QJsonObject generation = root.value(QStringLiteral("generation")).toObject();
    cfg.generation.maxTokens = readInt(generation, "max_tokens", cfg.generation.maxTokens, 1, 32768);
    cfg.generation.temperature = readDouble(generation, "temperature", cfg.generation.temperature, 0.0, 2.0);
    cfg.generation.topP = readDouble(generation, "top_p", cfg.generation.topP, 0.0, 1.0);
    cfg.generation.topK = readInt(generation, "top_k", cfg.generation.topK, 0, 1000);
    cfg.generation.repeatPenalty = readDouble(generation, "repeat_penalty", cfg.generation.repeatPenalty, 0.0, 10.0);
    const QJsonArray stops = generation.value(QStringLiteral("stop")).toArray();
    for (const QJsonValue& v : stops) {
        if (v.isString() && !v.toString().isEmpty()) {
            cfg.generation.stopSequences.append(v.toString());
        }
    }

    const QJsonObject backend = root.value(QStringLiteral("backend")).toObject();
    cfg.backend.baseUrl = readString(backend, "base_url", cfg.backend.baseUrl);
    cfg.backend.embeddingModel = kv::strings::canonicalize_model_id(
        readString(backend, "embedding_model", cfg.backend.embeddingModel));
    cfg.backend.generationModel = kv::strings::canonicalize_model_id(
        readString(backend, "generation_model", cfg.backend.generationModel));
    cfg.backend.apiKey = readString(backend, "api_key", cfg.backend.apiKey);
    cfg.backend.allowRemote = readBool(backend, "allow_remote", cfg.backend.allowRemote);
    cfg.backend.connectTimeoutMs = readInt(backend, "connect_timeout_ms", cfg.backend.connectTimeoutMs, 100, 600000);
    cfg.backend.requestTimeoutMs = readInt(backend, "request_timeout_ms", cfg.backend.requestTimeoutMs, 100, 3600000);

    // Environment overrides the file, as for provider keys
    const QByteArray envKey = qgetenv("KNOWLEDGE_VAULT_API_KEY");
    if (!envKey.isEmpty()) {
        cfg.backend.apiKey = QString::fromUtf8(envKey);
    }

    return cfg;
}

QJsonObject VaultConfig::toJson() const
{
    QJsonObject storeObj;
    storeObj.insert(QStringLiteral("path"), store.path);
    storeObj.insert(QStringLiteral("embedding_dimension"), store.embeddingDimension);
    storeObj.insert(QStringLiteral("kdf_iterations"), store.kdfIterations);
    storeObj.insert(QStringLiteral("require_index"), store.requireIndex);

    QJsonObject chunkingObj;
    chunkingObj.insert(QStringLiteral("max_chunk_tokens"), chunking.maxChunkTokens);
    chunkingObj.insert(QStringLiteral("overlap_words"), chunking.overlapWords);
    chunkingObj.insert(QStringLiteral("min_chunk_tokens"), chunking.minChunkTokens);
    chunkingObj.insert(QStringLiteral("preserve_paragraphs"), chunking.preserveParagraphs);

    QJsonObject retrievalObj;
    retrievalObj.insert(QStringLiteral("top_k"), retrieval.topK);
    retrievalObj.insert(QStringLiteral("min_relevance_score"), retrieval.minRelevanceScore);
    retrievalObj.insert(QStringLiteral("deduplicate"), retrieval.deduplicate);
    retrievalObj.insert(QStringLiteral("include_metadata"), retrieval.includeMetadata);
    retrievalObj.insert(QStringLiteral("max_context_tokens"), retrieval.maxContextTokens);

    QJsonObject generationObj;
    generationObj.insert(QStringLiteral("max_tokens"), generation.maxTokens);
    generationObj.insert(QStringLiteral("temperature"), generation.temperature);
    generationObj.insert(QStringLiteral("top_p"), generation.topP);
    generationObj.insert(QStringLiteral("top_k"), generation.topK);
    generationObj.insert(QStringLiteral("repeat_penalty"), generation.repeatPenalty);
    generationObj.insert(QStringLiteral("stop"), QJsonArray::fromStringList(generation.stopSequences));

    QJsonObject backendObj;
    backendObj.insert(QStringLiteral("base_url"), backend.baseUrl);
    backendObj.insert(QStringLiteral("embedding_model"), backend.embeddingModel);
    backendObj.insert(QStringLiteral("generation_model"), backend.generationModel);
    if (!backend.apiKey.isEmpty()) {
        backendObj.insert(QStringLiteral("api_key"), backend.apiKey);
    }
    backendObj.insert(QStringLiteral("allow_remote"), backend.allowRemote);
    backendObj.insert(QStringLiteral("connect_timeout_ms"), backend.connectTimeoutMs);
    backendObj.insert(QStringLiteral("request_timeout_ms"), backend.requestTimeoutMs);

    QJsonObject root;
    root.insert(QStringLiteral("store"), storeObj);
    root.insert(QStringLiteral("chunking"), chunkingObj);
    root.insert(QStringLiteral("retrieval"), retrievalObj);
    root.insert(QStringLiteral("generation"), generationObj);
    root.insert(QStringLiteral("backend"), backendObj);
    return root;
}

VaultConfig VaultConfig::loadFromFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        qCDebug(kv_config) << "VaultConfig: no config at" << filePath << "- using defaults";
        return fromJson(QJsonObject());
    }

    if (!file.open(QIODevice::ReadOnly)) {
        throw VaultError("Cannot read config file " + filePath.toStdString() + ": "
                         + file.errorString().toStdString());
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        throw VaultError("Invalid JSON in config file " + filePath.toStdString() + ": "
                         + parseError.errorString().toStdString());
    }

    qCDebug(kv_config) << "VaultConfig: loaded" << filePath;
    return fromJson(doc.object());
}

bool VaultConfig::saveToFile(const QString& filePath) const
{
    const QFileInfo fi(filePath);
    if (!QDir().mkpath(fi.dir().absolutePath())) {
        qCWarning(kv_config) << "VaultConfig::saveToFile: Could not create directory for" << filePath;
        return false;
    }

    QSaveFile sf(filePath);
    if (!sf.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(kv_config) << "VaultConfig::saveToFile: Could not open for writing:" << filePath;
        return false;
    }

    sf.write(QJsonDocument(toJson()).toJson());
    if (!sf.commit()) {
        qCWarning(kv_config) << "VaultConfig::saveToFile: Failed to finalize save:" << filePath;
        return false;
    }

#ifdef Q_OS_UNIX
    QFile::setPermissions(filePath, QFileDevice::ReadOwner | QFileDevice::WriteOwner);
#endif
    return true;
}

void VaultConfig::validate() const
{
    const QUrl url(backend.baseUrl);
    if (!url.isValid() || url.host().isEmpty()) {
        throw VaultError("Invalid backend.base_url: " + backend.baseUrl.toStdString());
    }
    if (!backend.allowRemote && !isLoopbackUrl(backend.baseUrl)) {
        throw VaultError("backend.base_url " + backend.baseUrl.toStdString()
                         + " is not a loopback address; set backend.allow_remote to send data off this machine");
    }
}

QString VaultConfig::resolvedStorePath() const
{
    return store.path.isEmpty() ? defaultVaultPath() : store.path;
}

QString VaultConfig::defaultConfigPath()
{
    const QString baseDir = configBaseDir();
    if (baseDir.isEmpty()) {
        qCWarning(kv_config) << "VaultConfig: Base directory unavailable (QStandardPaths returned empty).";
        return QDir::current().filePath(QStringLiteral("config.json"));
    }
    return QDir(baseDir).filePath(QStringLiteral("KnowledgeVault/config.json"));
}

QString VaultConfig::defaultVaultPath()
{
    const QString baseDir = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    if (baseDir.isEmpty()) {
        return QDir::current().filePath(QStringLiteral("vault.db"));
    }
    return QDir(baseDir).filePath(QStringLiteral("KnowledgeVault/vault.db"));
}

bool VaultConfig::isLoopbackUrl(const QString& url)
{
    const QString host = QUrl(url).host().toLower();
    if (host.isEmpty()) {
        return false;
    }
    if (host == QStringLiteral("localhost") || host.endsWith(QStringLiteral(".localhost"))) {
        return true;
    }
    if (host == QStringLiteral("::1") || host == QStringLiteral("0:0:0:0:0:0:0:1")) {
        return true;
    }

    // 127.0.0.0/8
    const QStringList octets = host.split(QLatin1Char('.'));
    if (octets.size() != 4) {
        return false;
    }
    for (const QString& octet : octets) {
        bool ok = false;
        const int value = octet.toInt(&ok);
        if (!ok || value < 0 || value > 255) {
            return false;
        }
    }
    return octets.first() == QStringLiteral("127");
}

QString VaultConfig::passphraseFromEnvironment()
{
    return QString::fromUtf8(qgetenv("KNOWLEDGE_VAULT_PASSPHRASE"));
}
