#include <gtest/gtest.h>
#include <QTemporaryDir>
#include <QFile>
#include <QDir>
#include <QTextStream>
#include <QSet>
#include "core/DocumentLoader.h"

/**
 * Test suite for DocumentLoader class
 */
class DocumentLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(tempDir.isValid()) << "Failed to create temporary directory";
    }

    QTemporaryDir tempDir;

    // Helper method to create a file with given content
    bool createFile(const QString& relativePath, const QString& content) {
        QString fullPath = tempDir.path() + "/" + relativePath;

        QFileInfo fileInfo(fullPath);
        QDir dir;
        if (!dir.mkpath(fileInfo.absolutePath())) {
            return false;
        }

        QFile file(fullPath);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
            return false;
        }

        QTextStream stream(&file);
        stream.setEncoding(QStringConverter::Utf8);
        stream << content;
        file.close();

        return true;
    }
};

/**
 * Test 1: Directory Traversal
 * Creates a nested directory structure with ingestible and other files
 * and verifies that scanDirectory returns only the ingestible ones, sorted.
 */
TEST_F(DocumentLoaderTest, ScanDirectory_ReturnsOnlyIngestibleFiles) {
    // Ingestible
    ASSERT_TRUE(createFile("notes.txt", "Some notes"));
    ASSERT_TRUE(createFile("readme.md", "# README"));
    ASSERT_TRUE(createFile("guide.markdown", "# Guide"));
    ASSERT_TRUE(createFile("report.pdf", "%PDF-1.4"));
    ASSERT_TRUE(createFile("subdir/nested.txt", "nested"));
    ASSERT_TRUE(createFile("subdir/deep/very_deep.md", "# very deep"));

    // Not ingestible
    ASSERT_TRUE(createFile("main.cpp", "int main() {}"));
    ASSERT_TRUE(createFile("config.json", "{}"));
    ASSERT_TRUE(createFile("image.png", "fake png data"));
    ASSERT_TRUE(createFile("subdir/table.csv", "a,b"));

    QStringList result = DocumentLoader::scanDirectory(tempDir.path());

    QSet<QString> expectedFileNames = {
        "notes.txt", "readme.md", "guide.markdown", "report.pdf", "nested.txt", "very_deep.md"
    };

    EXPECT_EQ(result.size(), 6) << "Should find exactly 6 ingestible files";

    QSet<QString> foundFileNames;
    for (const QString& path : result) {
        QFileInfo info(path);
        EXPECT_TRUE(info.isAbsolute()) << "Paths should be absolute: " << path.toStdString();
        foundFileNames.insert(info.fileName());
    }
    EXPECT_EQ(foundFileNames, expectedFileNames);

    QStringList sorted = result;
    sorted.sort();
    EXPECT_EQ(result, sorted) << "Result should be sorted";

    bool foundVeryDeep = false;
    for (const QString& path : result) {
        if (path.contains("very_deep.md")) {
            foundVeryDeep = true;
            EXPECT_TRUE(path.contains("subdir/deep") || path.contains("subdir\\deep"));
        }
    }
    EXPECT_TRUE(foundVeryDeep) << "Should find very_deep.md in deeply nested directory";
}

/**
 * Test 2: Reading Text Files
 * UTF-8 content including special characters must come back unchanged.
 */
TEST_F(DocumentLoaderTest, ReadTextFile_ReturnsExactContent) {
    QString expectedContent = QStringLiteral(
        "Dock rules 🚚\n"
        "Special chars: café, naïve, résumé\n"
        "Math symbols: α, β, ∑\n"
        "Chinese: 你好世界\n"
        "Line with tab:\there\n"
        "Final line without newline"
    );

    ASSERT_TRUE(createFile("utf8_test.txt", expectedContent));

    const std::optional<QString> actual = DocumentLoader::readTextFile(tempDir.path() + "/utf8_test.txt");

    ASSERT_TRUE(actual.has_value());
    EXPECT_EQ(*actual, expectedContent) << "Content should match exactly, including UTF-8 characters";
    EXPECT_TRUE(actual->contains(QStringLiteral("café")));
    EXPECT_TRUE(actual->contains(QStringLiteral("你好世界")));
}

/**
 * Test 3: Reading Non-existent File
 * A missing file is reported as no value, not as an empty document.
 */
TEST_F(DocumentLoaderTest, ReadTextFile_NonExistentFile_ReturnsNullopt) {
    QString nonExistentPath = tempDir.path() + "/does_not_exist.txt";

    EXPECT_FALSE(DocumentLoader::readTextFile(nonExistentPath).has_value());
    EXPECT_FALSE(DocumentLoader::readBinaryFile(nonExistentPath).has_value());
}

TEST_F(DocumentLoaderTest, ReadTextFile_EmptyFileIsEmptyString) {
    ASSERT_TRUE(createFile("empty.txt", QString()));

    const auto content = DocumentLoader::readTextFile(tempDir.path() + "/empty.txt");
    ASSERT_TRUE(content.has_value());
    EXPECT_TRUE(content->isEmpty());
}

TEST_F(DocumentLoaderTest, ReadBinaryFile_ReturnsRawBytes) {
    const QByteArray bytes("%PDF-1.4\n\x00\x01\x02", 12);
    QFile file(tempDir.path() + "/raw.pdf");
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write(bytes);
    file.close();

    const auto read = DocumentLoader::readBinaryFile(tempDir.path() + "/raw.pdf");
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, bytes);
}

/**
 * Test 4: Case-insensitive Extension Matching
 */
TEST_F(DocumentLoaderTest, ScanDirectory_CaseInsensitiveExtensions) {
    ASSERT_TRUE(createFile("File1.TXT", "upper"));
    ASSERT_TRUE(createFile("File2.Md", "mixed"));
    ASSERT_TRUE(createFile("File3.PDF", "upper"));
    ASSERT_TRUE(createFile("File4.Json", "ignored"));

    QStringList result = DocumentLoader::scanDirectory(tempDir.path());

    EXPECT_EQ(result.size(), 3) << "Should match extensions case-insensitively";

    QSet<QString> foundNames;
    for (const QString& path : result) {
        foundNames.insert(QFileInfo(path).fileName());
    }
    EXPECT_TRUE(foundNames.contains("File1.TXT"));
    EXPECT_TRUE(foundNames.contains("File2.Md"));
    EXPECT_TRUE(foundNames.contains("File3.PDF"));
}

/**
 * Test 5: Empty Directory
 */
TEST_F(DocumentLoaderTest, ScanDirectory_EmptyDirectory_ReturnsEmptyList) {
    QStringList result = DocumentLoader::scanDirectory(tempDir.path());

    EXPECT_TRUE(result.isEmpty()) << "Should return empty list for empty directory";
}

TEST(DocumentLoaderFileTypeTest, MapsExtensions) {
    EXPECT_EQ(DocumentLoader::fileTypeFromExtension("notes.txt"), VaultFileType::PlainText);
    EXPECT_EQ(DocumentLoader::fileTypeFromExtension("/a/b/README.MD"), VaultFileType::Markdown);
    EXPECT_EQ(DocumentLoader::fileTypeFromExtension("guide.markdown"), VaultFileType::Markdown);
    EXPECT_EQ(DocumentLoader::fileTypeFromExtension("scan.Pdf"), VaultFileType::Pdf);
    EXPECT_EQ(DocumentLoader::fileTypeFromExtension("table.csv"), VaultFileType::Unsupported);
    EXPECT_EQ(DocumentLoader::fileTypeFromExtension("Makefile"), VaultFileType::Unsupported);

    EXPECT_EQ(DocumentLoader::fileTypeLabel("scan.PDF"), QStringLiteral("pdf"));
    EXPECT_EQ(DocumentLoader::fileTypeLabel("table.csv"), QStringLiteral("csv"));
    EXPECT_EQ(DocumentLoader::fileTypeLabel("Makefile"), QStringLiteral("txt"));
}
