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

#include "QtPdfExtractor.h"

#include "logging_categories.h"

#include <QBuffer>
#include <QPdfDocument>
#include <QPdfSelection>
#include <QStringList>

PdfExtractionResult QtPdfExtractor::extract(const QByteArray& pdfBytes)
{
    PdfExtractionResult result;

    if (pdfBytes.isEmpty()) {
        result.hasError = true;
        result.errorMsg = QStringLiteral("PDF data is empty");
        return result;
    }

    // Unredacted bytes stay in memory
    QBuffer buffer;
    buffer.setData(pdfBytes);
    if (!buffer.open(QIODevice::ReadOnly)) {
        result.hasError = true;
        result.errorMsg = QStringLiteral("Failed to open PDF buffer");
        return result;
    }

    QPdfDocument pdfDoc;
    pdfDoc.load(&buffer);

    if (pdfDoc.status() != QPdfDocument::Status::Ready) {
        result.hasError = true;
        result.errorMsg = QStringLiteral("Failed to load PDF (error %1)").arg(static_cast<int>(pdfDoc.error()));
        qCWarning(kv_backend) << "QtPdfExtractor:" << result.errorMsg;
        return result;
    }

    result.pageCount = pdfDoc.pageCount();

    QStringList pages;
    for (int i = 0; i < result.pageCount; ++i) {
        const QString pageText = pdfDoc.getAllText(i).text().trimmed();
        if (!pageText.isEmpty()) {
            pages.append(pageText);
        }
    }
    result.text = pages.join(QStringLiteral("\n\n"));

    const QString title = pdfDoc.metaData(QPdfDocument::MetaDataField::Title).toString();
    const QString author = pdfDoc.metaData(QPdfDocument::MetaDataField::Author).toString();
    const QString subject = pdfDoc.metaData(QPdfDocument::MetaDataField::Subject).toString();
    if (!title.isEmpty()) {
        result.metadata.insert(QStringLiteral("title"), title);
    }
    if (!author.isEmpty()) {
        result.metadata.insert(QStringLiteral("author"), author);
    }
    if (!subject.isEmpty()) {
        result.metadata.insert(QStringLiteral("subject"), subject);
    }

    pdfDoc.close();
    return result;
}
