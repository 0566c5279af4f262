#include "DocumentLoader.h"
#include "logging_categories.h"

#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

#include <algorithm>

QStringList DocumentLoader::scanDirectory(const QString& rootPath)
{
    QStringList result;

    QDirIterator it(rootPath, QDir::Files, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString filePath = it.next();
        const QFileInfo fileInfo(filePath);

        if (!fileInfo.isFile()) {
            continue;
        }
        if (hasSupportedExtension(fileInfo.fileName())) {
            result.append(fileInfo.absoluteFilePath());
        }
    }

    // QDirIterator order is file-system dependent
    std::sort(result.begin(), result.end());
    return result;
}

std::optional<QString> DocumentLoader::readTextFile(const QString& filePath)
{
    QFile file(filePath);

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(kv_ingest) << "DocumentLoader: Failed to open file:" << filePath
                             << "Error:" << file.errorString();
        return std::nullopt;
    }

    QTextStream stream(&file);
    stream.setEncoding(QStringConverter::Utf8);
    QString content = stream.readAll();

    file.close();
    return content;
}

std::optional<QByteArray> DocumentLoader::readBinaryFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(kv_ingest) << "DocumentLoader: Failed to open file:" << filePath
                             << "Error:" << file.errorString();
        return std::nullopt;
    }
    return file.readAll();
}

bool DocumentLoader::hasSupportedExtension(const QString& fileName)
{
    return fileTypeFromExtension(fileName) != VaultFileType::Unsupported;
}

VaultFileType DocumentLoader::fileTypeFromExtension(const QString& filePath)
{
    const QString lowerPath = filePath.toLower();

    if (lowerPath.endsWith(QStringLiteral(".txt"))) {
        return VaultFileType::PlainText;
    }
    if (lowerPath.endsWith(QStringLiteral(".md")) || lowerPath.endsWith(QStringLiteral(".markdown"))) {
        return VaultFileType::Markdown;
    }
    if (lowerPath.endsWith(QStringLiteral(".pdf"))) {
        return VaultFileType::Pdf;
    }
    return VaultFileType::Unsupported;
}

QString DocumentLoader::fileTypeLabel(const QString& filePath)
{
    const QString suffix = QFileInfo(filePath).suffix().toLower();
    return suffix.isEmpty() ? QStringLiteral("txt") : suffix;
}
