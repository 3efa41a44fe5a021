#include "core/extraction/html_extractor.h"
#include "core/extraction/text_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QRegularExpression>

namespace ul {

namespace {

QString decodeEntities(QString text)
{
    static const QRegularExpression numeric(QStringLiteral("&#(x?)([0-9A-Fa-f]+);"));

    QString decoded;
    decoded.reserve(text.size());
    int last = 0;
    auto it = numeric.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        decoded += text.mid(last, m.capturedStart() - last);
        bool ok = false;
        const uint code = m.captured(2).toUInt(&ok, m.captured(1).isEmpty() ? 10 : 16);
        if (ok && code > 0 && code <= 0x10FFFF) {
            const char32_t cp = code;
            decoded += QString::fromUcs4(&cp, 1);
        } else {
            decoded += m.captured(0);
        }
        last = m.capturedEnd();
    }
    decoded += text.mid(last);

    static const struct {
        const char* entity;
        const char16_t* replacement;
    } kNamed[] = {
        {"&nbsp;", u" "},   {"&lt;", u"<"},     {"&gt;", u">"},
        {"&quot;", u"\""},  {"&#39;", u"'"},    {"&apos;", u"'"},
        {"&agrave;", u"à"}, {"&egrave;", u"è"}, {"&eacute;", u"é"},
        {"&igrave;", u"ì"}, {"&ograve;", u"ò"}, {"&ugrave;", u"ù"},
        {"&Agrave;", u"À"}, {"&Egrave;", u"È"}, {"&deg;", u"°"},
        {"&sect;", u"§"},   {"&laquo;", u"«"},  {"&raquo;", u"»"},
    };
    for (const auto& entry : kNamed) {
        decoded.replace(QLatin1String(entry.entity), QString::fromUtf16(entry.replacement));
    }
    // Last so "&amp;lt;" stays "&lt;"
    decoded.replace(QLatin1String("&amp;"), QStringLiteral("&"));
    return decoded;
}

} // namespace

bool HtmlExtractor::supports(const QString& extension) const
{
    return extension.compare(QLatin1String("html"), Qt::CaseInsensitive) == 0
        || extension.compare(QLatin1String("htm"), Qt::CaseInsensitive) == 0;
}

QString HtmlExtractor::htmlToText(const QString& html)
{
    static const QRegularExpression hiddenBlocks(
        QStringLiteral("<(script|style)\\b[^>]*>.*?</\\1\\s*>|<!--.*?-->"),
        QRegularExpression::CaseInsensitiveOption
            | QRegularExpression::DotMatchesEverythingOption);
    static const QRegularExpression blockTags(
        QStringLiteral("<\\s*(br|/p|/div|/li|/tr|/h[1-6]|/table|/section|/article)\\b[^>]*>"),
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression anyTag(QStringLiteral("<[^>]*>"));
    static const QRegularExpression blankLines(QStringLiteral("\\n[ \\t]*(\\n[ \\t]*)+"));

    QString text = html;
    text.remove(hiddenBlocks);
    text.replace(blockTags, QStringLiteral("\n"));
    text.remove(anyTag);
    text = decodeEntities(text);
    text.replace(blankLines, QStringLiteral("\n\n"));
    return text.trimmed();
}

ExtractionResult HtmlExtractor::extract(const QString& filePath)
{
    QElapsedTimer timer;
    timer.start();

    QByteArray rawBytes;
    if (auto failure = TextExtractor::readRaw(filePath, rawBytes)) {
        failure->durationMs = static_cast<int>(timer.elapsed());
        return *failure;
    }

    ExtractionResult result;
    result.status = ExtractionResult::Status::Success;
    result.content = htmlToText(TextExtractor::decode(rawBytes, filePath));
    result.durationMs = static_cast<int>(timer.elapsed());

    LOG_DEBUG(ulExtraction, "Extracted %lld chars of visible text from %s in %d ms",
              static_cast<long long>(result.content->size()),
              qUtf8Printable(filePath),
              result.durationMs);
    return result;
}

} // namespace ul
