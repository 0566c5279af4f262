#ifndef TEXTCHUNKER_H
#define TEXTCHUNKER_H

#include <QString>
#include <QStringList>

/**
 * @brief Size and overlap settings for TextChunker.
 *
 * All sizes are estimated tokens (see TextChunker::estimateTokenCount) except
 * the overlap, which is counted in whole words.
 */
struct ChunkingConfig {
    int maxChunkTokens = 512;
    int overlapWords = 50;
    int minChunkTokens = 10;
    bool preserveParagraphs = true;

    /// Returns a copy with max >= 1, 0 <= min <= max and overlap >= 0.
    ChunkingConfig normalized() const;
};

/**
 * @brief TextChunker splits prose into overlapping, size-bounded segments
 *        suitable for embedding.
 *
 * Paragraph and sentence boundaries are respected wherever a unit fits the
 * maximum size. Each closed segment seeds the next one with its trailing
 * words so that adjacent segments share context.
 */
class TextChunker
{
public:
    /**
     * @brief Split text into overlapping segments.
     *
     * @param text The input text
     * @param config Size limits, overlap and paragraph handling
     * @return Ordered segments. Empty input yields an empty list.
     *
     * Algorithm:
     * 1. Detect paragraphs on blank lines, then normalize whitespace
     * 2. Break paragraphs that do not fit into sentences, and oversized
     *    sentences into word windows
     * 3. Accumulate units into a buffer until the next one would overflow
     * 4. Close the buffer (if it meets the minimum) and seed the next buffer
     *    with the last overlapWords words
     * 5. Drop a trailing buffer that is below the minimum or holds only the seed
     */
    static QStringList chunk(const QString& text, const ChunkingConfig& config = ChunkingConfig());

    /**
     * @brief Cheap deterministic token estimate: one token per four characters.
     *
     * This is not a tokenizer and does not match any model's real token count.
     */
    static int estimateTokenCount(const QString& text);

private:
    static QStringList splitParagraphs(const QString& text);
    static QStringList splitSentences(const QString& text);
    static QStringList splitWordWindows(const QString& sentence, int maxTokens);
    static QStringList buildUnits(const QString& text, const ChunkingConfig& config);
    static QString overlapSeed(const QString& segment, int overlapWords, int maxSeedTokens);
};

#endif // TEXTCHUNKER_H
