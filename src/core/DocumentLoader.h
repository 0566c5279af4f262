#ifndef DOCUMENTLOADER_H
#define DOCUMENTLOADER_H

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <optional>

/**
 * @brief Kind of source file the vault knows how to ingest.
 */
enum class VaultFileType {
    PlainText,
    Markdown,
    Pdf,
    Unsupported
};

/**
 * @brief Utility class for scanning directories and reading source files.
 *
 * DocumentLoader provides static methods to recursively scan a folder for
 * ingestible files and read their content. It is the file-system side of the
 * ingestion pipeline; nothing here touches the vault.
 */
class DocumentLoader
{
public:
    /**
     * @brief Recursively scans a directory for ingestible files.
     *
     * @param rootPath The root directory to start scanning from
     * @return Sorted absolute paths of .txt, .md, .markdown and .pdf files
     */
    static QStringList scanDirectory(const QString& rootPath);

    /**
     * @brief Reads a file as UTF-8 text.
     *
     * @return The content, or std::nullopt when the file cannot be opened.
     *         A warning naming the path is logged on failure.
     */
    static std::optional<QString> readTextFile(const QString& filePath);

    /// Raw bytes, for PDF input. std::nullopt when the file cannot be opened.
    static std::optional<QByteArray> readBinaryFile(const QString& filePath);

    /**
     * @brief Maps a file path or name to its VaultFileType.
     *
     * Extension mappings (case-insensitive):
     * - .txt -> PlainText
     * - .md, .markdown -> Markdown
     * - .pdf -> Pdf
     * - All others -> Unsupported
     */
    static VaultFileType fileTypeFromExtension(const QString& filePath);

    /// Lower-case extension used as the document's file_type ("txt" when there is none).
    static QString fileTypeLabel(const QString& filePath);

private:
    static bool hasSupportedExtension(const QString& fileName);
};

#endif // DOCUMENTLOADER_H
