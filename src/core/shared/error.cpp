#include "core/shared/error.h"

#include <QStringList>

namespace ul {

QString errorKindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:              return QStringLiteral("ok");
    case ErrorKind::Format:            return QStringLiteral("FormatError");
    case ErrorKind::Load:              return QStringLiteral("LoadError");
    case ErrorKind::Validation:        return QStringLiteral("ValidationError");
    case ErrorKind::Backend:           return QStringLiteral("BackendError");
    case ErrorKind::RerankUnavailable: return QStringLiteral("RerankUnavailable");
    }
    return QStringLiteral("unknown");
}

QString ErrorInfo::toString() const
{
    if (ok()) {
        return errorKindToString(kind);
    }

    QStringList context;
    if (!operation.isEmpty()) {
        context.append(QStringLiteral("operation=%1").arg(operation));
    }
    if (!tier.isEmpty()) {
        context.append(QStringLiteral("tier=%1").arg(tier));
    }
    if (!documentId.isEmpty()) {
        context.append(QStringLiteral("document=%1").arg(documentId));
    }

    QString rendered = errorKindToString(kind);
    if (!context.isEmpty()) {
        rendered += QStringLiteral(" [%1]").arg(context.join(QLatin1Char(' ')));
    }
    if (!message.isEmpty()) {
        rendered += QStringLiteral(": ") + message;
    }
    return rendered;
}

ErrorInfo ErrorInfo::make(ErrorKind kind, const QString& message,
                          const QString& operation, const QString& tier,
                          const QString& documentId)
{
    ErrorInfo info;
    info.kind = kind;
    info.message = message;
    info.operation = operation;
    info.tier = tier;
    info.documentId = documentId;
    return info;
}

} // namespace ul
