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

#include "TextChunker.h"

#include <QRegularExpression>

#include <algorithm>

ChunkingConfig ChunkingConfig::normalized() const
{
    ChunkingConfig c = *this;
    c.maxChunkTokens = std::max(1, c.maxChunkTokens);
    c.minChunkTokens = std::clamp(c.minChunkTokens, 0, c.maxChunkTokens);
    c.overlapWords = std::max(0, c.overlapWords);
    return c;
}

int TextChunker::estimateTokenCount(const QString& text)
{
    return static_cast<int>(text.length() / 4);
}

QStringList TextChunker::splitParagraphs(const QString& text)
{
    static const QRegularExpression blankLine(QStringLiteral("\\n[ \\t]*\\n"));

    QString unified = text;
    unified.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    unified.replace(QLatin1Char('\r'), QLatin1Char('\n'));

    QStringList paragraphs;
    const QStringList raw = unified.split(blankLine, Qt::SkipEmptyParts);
    for (const QString& p : raw) {
        const QString normalized = p.simplified();
        if (!normalized.isEmpty()) {
            paragraphs.append(normalized);
        }
    }
    return paragraphs;
}

QStringList TextChunker::splitSentences(const QString& text)
{
    // Break after terminal punctuation that is followed by whitespace.
    static const QRegularExpression boundary(QStringLiteral("(?<=[.!?])\\s+"));
    return text.split(boundary, Qt::SkipEmptyParts);
}

QStringList TextChunker::splitWordWindows(const QString& sentence, int maxTokens)
{
    const int maxChars = maxTokens * 4;
    QStringList windows;
    QString window;

    const QStringList words = sentence.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    for (const QString& word : words) {
        if (estimateTokenCount(word) > maxTokens) {
            // A single word larger than a whole segment: hard split on characters
            if (!window.isEmpty()) {
                windows.append(window);
                window.clear();
            }
            for (int pos = 0; pos < word.length(); pos += maxChars) {
                windows.append(word.mid(pos, maxChars));
            }
            continue;
        }

        const QString candidate = window.isEmpty() ? word : window + QLatin1Char(' ') + word;
        if (estimateTokenCount(candidate) > maxTokens) {
            windows.append(window);
            window = word;
        } else {
            window = candidate;
        }
    }

    if (!window.isEmpty()) {
        windows.append(window);
    }
    return windows;
}

QStringList TextChunker::buildUnits(const QString& text, const ChunkingConfig& config)
{
    QStringList blocks;
    if (config.preserveParagraphs) {
        blocks = splitParagraphs(text);
    } else {
        const QString flat = text.simplified();
        if (!flat.isEmpty()) {
            blocks.append(flat);
        }
    }

    QStringList units;
    for (const QString& block : blocks) {
        if (config.preserveParagraphs && estimateTokenCount(block) <= config.maxChunkTokens) {
            units.append(block);
            continue;
        }
        for (const QString& sentence : splitSentences(block)) {
            if (estimateTokenCount(sentence) <= config.maxChunkTokens) {
                units.append(sentence);
            } else {
                units.append(splitWordWindows(sentence, config.maxChunkTokens));
            }
        }
    }
    return units;
}

QString TextChunker::overlapSeed(const QString& segment, int overlapWords, int maxSeedTokens)
{
    if (overlapWords <= 0) {
        return QString();
    }

    QStringList words = segment.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (words.size() > overlapWords) {
        words = words.mid(words.size() - overlapWords);
    }

    // The seed may never crowd out new content
    QString seed = words.join(QLatin1Char(' '));
    while (!words.isEmpty() && estimateTokenCount(seed) > maxSeedTokens) {
        words.removeFirst();
        seed = words.join(QLatin1Char(' '));
    }
    return seed;
}

QStringList TextChunker::chunk(const QString& text, const ChunkingConfig& rawConfig)
{
    QStringList segments;
    if (text.trimmed().isEmpty()) {
        return segments;
    }

    const ChunkingConfig config = rawConfig.normalized();
    const QStringList units = buildUnits(text, config);

    QString buffer;
    bool hasNewContent = false;

    auto tryAppend = [&](const QString& piece) -> bool {
        const QString candidate = buffer.isEmpty() ? piece : buffer + QLatin1Char(' ') + piece;
        if (estimateTokenCount(candidate) > config.maxChunkTokens) {
            return false;
        }
        buffer = candidate;
        hasNewContent = true;
        return true;
    };

    auto closeSegment = [&]() {
        segments.append(buffer);
        buffer = overlapSeed(buffer, config.overlapWords, config.maxChunkTokens / 2);
        hasNewContent = false;
    };

    for (const QString& unit : units) {
        if (tryAppend(unit)) {
            continue;
        }

        if (hasNewContent && estimateTokenCount(buffer) >= config.minChunkTokens) {
            closeSegment();
            if (tryAppend(unit)) {
                continue;
            }
        }

        // The unit does not fit as a whole: pour it in word by word
        const QStringList words = unit.split(QLatin1Char(' '), Qt::SkipEmptyParts);
        for (const QString& word : words) {
            if (tryAppend(word)) {
                continue;
            }
            if (hasNewContent && estimateTokenCount(buffer) >= config.minChunkTokens) {
                closeSegment();
                if (tryAppend(word)) {
                    continue;
                }
            }
            // The buffer cannot take this word: drop the seed or an undersized fragment
            buffer.clear();
            hasNewContent = false;
            tryAppend(word);
        }
    }

    if (hasNewContent && estimateTokenCount(buffer) >= config.minChunkTokens) {
        segments.append(buffer);
    }

    return segments;
}
