#include "core/ingest/text_normalizer.h"

#include <QRegularExpression>

namespace ul {

QString TextNormalizer::normalize(const QString& raw)
{
    if (raw.isEmpty()) {
        return raw;
    }

    // Pass 1: collapse whitespace runs
    QString collapsed;
    collapsed.reserve(raw.size());

    int i = 0;
    while (i < raw.size()) {
        const QChar ch = raw[i];
        if (ch.isSpace()) {
            while (i < raw.size() && raw[i].isSpace()) {
                ++i;
            }
            collapsed.append(QLatin1Char(' '));
        } else {
            collapsed.append(ch);
            ++i;
        }
    }

    // Pass 2: abbreviations used by drafters
    static const QRegularExpression articleAbbrev(
        QStringLiteral("\\bart\\.\\s*"), QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression commaRef(
        QStringLiteral("comma\\s+"), QRegularExpression::CaseInsensitiveOption);

    collapsed.replace(articleAbbrev, QStringLiteral("Articolo "));
    collapsed.replace(commaRef, QStringLiteral("comma "));

    // Pass 3: NUL bytes survive some PDF exports
    collapsed.remove(QChar(u'\0'));

    return collapsed.trimmed();
}

} // namespace ul
