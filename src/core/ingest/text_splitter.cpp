#include "core/ingest/text_splitter.h"
#include "core/shared/logging.h"

#include <deque>

namespace ul {

// ── Construction ────────────────────────────────────────────

TextSplitter::TextSplitter(const Config& config)
    : m_config(config)
{
    if (m_config.chunkSize < 1) {
        m_config.chunkSize = 1;
    }
    if (m_config.chunkOverlap < 0) {
        m_config.chunkOverlap = 0;
    }
    if (m_config.chunkOverlap >= m_config.chunkSize) {
        LOG_WARN(ulIngest, "Chunk overlap %d not smaller than chunk size %d, clamping",
                 m_config.chunkOverlap, m_config.chunkSize);
        m_config.chunkOverlap = m_config.chunkSize - 1;
    }
    if (m_config.separators.isEmpty() || !m_config.separators.last().isEmpty()) {
        m_config.separators.append(QString());
    }
}

// ── Public API ──────────────────────────────────────────────

std::vector<QString> TextSplitter::split(const QString& text) const
{
    std::vector<QString> chunks;
    if (text.trimmed().isEmpty()) {
        return chunks;
    }

    chunks = splitRecursive(text, m_config.separators);

    LOG_DEBUG(ulIngest, "Split %d chars into %d chunks",
              static_cast<int>(text.size()), static_cast<int>(chunks.size()));
    return chunks;
}

// ── Private helpers ─────────────────────────────────────────

std::vector<QString> TextSplitter::splitKeepingSeparator(const QString& text,
                                                         const QString& separator)
{
    std::vector<QString> pieces;

    if (separator.isEmpty()) {
        pieces.reserve(static_cast<size_t>(text.size()));
        for (const QChar ch : text) {
            pieces.emplace_back(ch);
        }
        return pieces;
    }

    qsizetype start = 0;
    qsizetype next = text.indexOf(separator, 1);
    while (next > 0) {
        if (next > start) {
            pieces.push_back(text.mid(start, next - start));
        }
        start = next;
        next = text.indexOf(separator, start + separator.size());
    }
    if (start < text.size()) {
        pieces.push_back(text.mid(start));
    }
    return pieces;
}

std::vector<QString> TextSplitter::splitRecursive(const QString& text,
                                                  const QStringList& separators) const
{
    std::vector<QString> finalChunks;

    // Pick the first separator present in the text
    QString separator = separators.last();
    QStringList remaining;
    for (int i = 0; i < separators.size(); ++i) {
        const QString& candidate = separators.at(i);
        if (candidate.isEmpty()) {
            separator = candidate;
            break;
        }
        if (text.contains(candidate)) {
            separator = candidate;
            remaining = separators.mid(i + 1);
            break;
        }
    }

    const std::vector<QString> pieces = splitKeepingSeparator(text, separator);

    std::vector<QString> pending;
    for (const QString& piece : pieces) {
        if (piece.size() < m_config.chunkSize) {
            pending.push_back(piece);
            continue;
        }

        if (!pending.empty()) {
            const std::vector<QString> merged = merge(pending);
            finalChunks.insert(finalChunks.end(), merged.begin(), merged.end());
            pending.clear();
        }

        if (remaining.isEmpty()) {
            const QString trimmed = piece.trimmed();
            if (!trimmed.isEmpty()) {
                finalChunks.push_back(trimmed);
            }
        } else {
            const std::vector<QString> sub = splitRecursive(piece, remaining);
            finalChunks.insert(finalChunks.end(), sub.begin(), sub.end());
        }
    }

    if (!pending.empty()) {
        const std::vector<QString> merged = merge(pending);
        finalChunks.insert(finalChunks.end(), merged.begin(), merged.end());
    }

    return finalChunks;
}

std::vector<QString> TextSplitter::merge(const std::vector<QString>& pieces) const
{
    std::vector<QString> docs;
    std::deque<QString> current;
    qsizetype total = 0;

    const auto flushCurrent = [&docs, &current]() {
        QString joined;
        for (const QString& part : current) {
            joined += part;
        }
        joined = joined.trimmed();
        if (!joined.isEmpty()) {
            docs.push_back(joined);
        }
    };

    for (const QString& piece : pieces) {
        const qsizetype len = piece.size();
        if (total + len > m_config.chunkSize && !current.empty()) {
            flushCurrent();
            // Keep at most chunkOverlap characters of context, and always
            // leave room for the incoming piece.
            while (!current.empty()
                   && (total > m_config.chunkOverlap || total + len > m_config.chunkSize)) {
                total -= current.front().size();
                current.pop_front();
            }
        }
        current.push_back(piece);
        total += len;
    }

    if (!current.empty()) {
        flushCurrent();
    }
    return docs;
}

} // namespace ul
