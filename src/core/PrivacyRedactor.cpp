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

#include "PrivacyRedactor.h"

const QString RegexPrivacyRedactor::kCardPlaceholder = QStringLiteral("[CARD_REDACTED]");
const QString RegexPrivacyRedactor::kSsnPlaceholder = QStringLiteral("[SSN_REDACTED]");
const QString RegexPrivacyRedactor::kPhonePlaceholder = QStringLiteral("[PHONE_REDACTED]");
const QString RegexPrivacyRedactor::kEmailPlaceholder = QStringLiteral("[EMAIL_REDACTED]");
const QString RegexPrivacyRedactor::kIpPlaceholder = QStringLiteral("[IP_REDACTED]");
const QString RegexPrivacyRedactor::kDobPlaceholder = QStringLiteral("[DOB_REDACTED]");

namespace {

QRegularExpression rx(const char* pattern)
{
    QRegularExpression re(QString::fromLatin1(pattern));
    re.optimize();
    return re;
}

// Every pass that changes the text removes at least one digit or '@', so a
// bounded number of passes always reaches a fixed point.
constexpr int kMaxPasses = 16;

} // namespace

RegexPrivacyRedactor::RegexPrivacyRedactor()
{
    m_categories = {
        {QStringLiteral("card"), QStringLiteral("Credit Card Numbers"), kCardPlaceholder, {
            // 4-4-4-4 grouped with spaces or dashes
            rx(R"(\b[0-9]{4}[\s-][0-9]{4}[\s-][0-9]{4}[\s-][0-9]{4}\b)"),
            // Amex 4-6-5 grouped
            rx(R"(\b[0-9]{4}[\s-][0-9]{6}[\s-][0-9]{5}\b)"),
            // Visa, MasterCard, Discover, JCB as 16 continuous digits
            rx(R"(\b(?:4[0-9]{3}|5[1-5][0-9]{2}|6011|35\d{2})[0-9]{12}\b)"),
            rx(R"(\b3[47][0-9]{13}\b)"),
        }},
        {QStringLiteral("ssn"), QStringLiteral("Social Security Numbers (SSN)"), kSsnPlaceholder, {
            rx(R"(\b[0-9]{3}-[0-9]{2}-[0-9]{4}\b)"),
            rx(R"(\b[0-9]{9}\b)"),
        }},
        {QStringLiteral("phone"), QStringLiteral("Phone Numbers (US & International)"), kPhonePlaceholder, {
            rx(R"((?:\+?1[-.\s]?)?\(?([0-9]{3})\)?[-.\s]?([0-9]{3})[-.\s]?([0-9]{4}))"),
            rx(R"(\+[0-9]{1,3}[-.\s]?\(?[0-9]{1,4}\)?[-.\s]?[0-9]{1,4}[-.\s]?[0-9]{1,9})"),
        }},
        {QStringLiteral("email"), QStringLiteral("Email Addresses"), kEmailPlaceholder, {
            rx(R"([a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+(\.[a-zA-Z]{2,})?)"),
        }},
        {QStringLiteral("ip"), QStringLiteral("IP Addresses (IPv4 & IPv6)"), kIpPlaceholder, {
            rx(R"(\b(?:[0-9]{1,3}\.){3}[0-9]{1,3}\b)"),
            rx(R"(\b(?:[0-9a-fA-F]{1,4}:){7}[0-9a-fA-F]{1,4}\b)"),
        }},
        {QStringLiteral("dob"), QStringLiteral("Dates of Birth"), kDobPlaceholder, {
            rx(R"(\b[0-9]{1,2}/[0-9]{1,2}/[0-9]{4}\b)"),
            rx(R"(\b[0-9]{4}-[0-9]{2}-[0-9]{2}\b)"),
            rx(R"(\b(January|February|March|April|May|June|July|August|September|October|November|December)\s+[0-9]{1,2},?\s+[0-9]{4}\b)"),
        }},
    };
}

QString RegexPrivacyRedactor::redact(const QString& text) const
{
    return redactWithReport(text).text;
}

QStringList RegexPrivacyRedactor::patternsHandled() const
{
    QStringList names;
    for (const auto& category : m_categories) {
        names.append(category.displayName);
    }
    return names;
}

RedactionReport RegexPrivacyRedactor::redactWithReport(const QString& text) const
{
    RedactionReport report;
    report.text = text;

    for (int pass = 0; pass < kMaxPasses; ++pass) {
        bool passChanged = false;
        for (const auto& category : m_categories) {
            for (const auto& pattern : category.patterns) {
                if (!pattern.match(report.text).hasMatch()) {
                    continue;
                }
                report.text.replace(pattern, category.placeholder);
                passChanged = true;
                if (!report.categories.contains(category.id)) {
                    report.categories.append(category.id);
                }
            }
        }
        if (!passChanged) {
            break;
        }
        report.changed = true;
    }

    // Keep the audit list in precedence order even when a later pass added one
    QStringList ordered;
    for (const auto& category : m_categories) {
        if (report.categories.contains(category.id)) {
            ordered.append(category.id);
        }
    }
    report.categories = ordered;
    return report;
}

bool RegexPrivacyRedactor::containsSensitiveData(const QString& text) const
{
    for (const auto& category : m_categories) {
        for (const auto& pattern : category.patterns) {
            if (pattern.match(text).hasMatch()) {
                return true;
            }
        }
    }
    return false;
}
