#pragma once

#include <QString>
#include <QStringList>

#include <vector>

namespace ul {

// Configuration for the TextSplitter.
struct SplitterConfig {
    int chunkSize = 1000;
    int chunkOverlap = 200;
    QStringList separators = {
        QStringLiteral("\n\nArt."),
        QStringLiteral("\n\nArticolo"),
        QStringLiteral("\n\n"),
        QStringLiteral("\n"),
        QStringLiteral(". "),
        QStringLiteral(" "),
        QString(),
    };
};

// TextSplitter -- recursive separator splitter for text without usable
// article structure.
//
// The first separator present in the text is used; separators stay attached
// to the start of the following piece. Pieces still longer than chunkSize
// are split again with the remaining separators, down to single characters.
// Small pieces are then merged greedily up to chunkSize, carrying up to
// chunkOverlap characters of trailing context into the next chunk.
//
// Every returned chunk is trimmed, non-empty and at most chunkSize long.
class TextSplitter {
public:
    using Config = SplitterConfig;

    explicit TextSplitter(const Config& config = {});

    std::vector<QString> split(const QString& text) const;

    const Config& config() const { return m_config; }

private:
    std::vector<QString> splitRecursive(const QString& text, const QStringList& separators) const;
    std::vector<QString> merge(const std::vector<QString>& pieces) const;

    static std::vector<QString> splitKeepingSeparator(const QString& text,
                                                      const QString& separator);

    Config m_config;
};

} // namespace ul
