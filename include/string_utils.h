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

namespace kv::strings {

// Canonicalize a model name from config or the command line: trim and strip
// exactly one matching pair of outer quotes (ASCII or typographic).
inline QString canonicalize_model_id(QString s)
{
    QString t = s.trimmed();
    if (t.size() < 2) return t;

    auto strip_pair = [&t](QChar l, QChar r) -> bool {
        if (t.front() == l && t.back() == r) {
            t = t.mid(1, t.size() - 2).trimmed();
            return true;
        }
        return false;
    };

    if (strip_pair(QChar('"'), QChar('"'))) return t;
    if (strip_pair(QChar('\''), QChar('\''))) return t;
    if (strip_pair(QChar(0x201C), QChar(0x201D))) return t;
    if (strip_pair(QChar(0x2018), QChar(0x2019))) return t;

    return t;
}

// "a, b,,a" -> ["a", "b"]; order of first appearance is kept.
inline QStringList split_tags(const QString& s)
{
    QStringList out;
    const QStringList parts = s.split(QLatin1Char(','), Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        const QString tag = part.trimmed();
        if (!tag.isEmpty() && !out.contains(tag)) {
            out.append(tag);
        }
    }
    return out;
}

// Single-line preview for listings: whitespace collapsed, cut at maxChars with "...".
inline QString preview(const QString& s, int maxChars)
{
    const QString flat = s.simplified();
    if (maxChars <= 3 || flat.size() <= maxChars) return flat.left(qMax(0, maxChars));
    return flat.left(maxChars - 3) + QStringLiteral("...");
}

} // namespace kv::strings
