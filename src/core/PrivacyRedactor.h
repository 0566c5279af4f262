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

#include <QRegularExpression>
#include <QString>
#include <QStringList>

#include <vector>

/**
 * @brief Outcome of a redaction pass, used only for audit logging.
 */
struct RedactionReport {
    QString text;
    bool changed = false;
    QStringList categories; // category ids that matched, in precedence order
};

/**
 * @brief Masks personally identifiable data before text is persisted.
 *
 * Implementations are total functions: they never throw, and a text without
 * any match is returned unchanged. Redaction must be idempotent.
 */
class IPrivacyRedactor {
public:
    virtual ~IPrivacyRedactor() = default;

    virtual QString redact(const QString& text) const = 0;

    /// Human readable names of the detected pattern families.
    virtual QStringList patternsHandled() const = 0;

    virtual RedactionReport redactWithReport(const QString& text) const = 0;
};

/**
 * @brief Regex based redactor with a fixed category precedence:
 *        card, government id, phone, email, IP address, date of birth.
 *
 * Longer numeric patterns run first so that a phone pattern never claims the
 * middle of a card number. Each match becomes a category placeholder such as
 * [CARD_REDACTED]; placeholders contain no digits, '@', '.' or ':', so a second
 * pass finds nothing to replace.
 */
class RegexPrivacyRedactor : public IPrivacyRedactor {
public:
    RegexPrivacyRedactor();

    QString redact(const QString& text) const override;
    QStringList patternsHandled() const override;
    RedactionReport redactWithReport(const QString& text) const override;

    bool containsSensitiveData(const QString& text) const;

    static const QString kCardPlaceholder;
    static const QString kSsnPlaceholder;
    static const QString kPhonePlaceholder;
    static const QString kEmailPlaceholder;
    static const QString kIpPlaceholder;
    static const QString kDobPlaceholder;

private:
    struct Category {
        QString id;
        QString displayName;
        QString placeholder;
        std::vector<QRegularExpression> patterns;
    };

    std::vector<Category> m_categories;
};

/**
 * @brief Identity redactor for tests and benchmarks that need raw content.
 */
class NoOpRedactor : public IPrivacyRedactor {
public:
    QString redact(const QString& text) const override { return text; }
    QStringList patternsHandled() const override { return {}; }
    RedactionReport redactWithReport(const QString& text) const override
    {
        RedactionReport report;
        report.text = text;
        return report;
    }
};
