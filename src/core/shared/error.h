#pragma once

#include <QString>

namespace ul {

// Error taxonomy shared by ingestion, indexing and retrieval.
enum class ErrorKind {
    None,
    Format,             // unsupported source file type
    Load,               // I/O or parse failure reading a source document
    Validation,         // unknown tier, malformed filter, empty input
    Backend,            // index or embedding backend failed
    RerankUnavailable,  // non-fatal, the caller falls back
};

QString errorKindToString(ErrorKind kind);

// Carried by value in every result struct. Context fields are optional and
// filled in by the layer that knows them.
struct ErrorInfo {
    ErrorKind kind = ErrorKind::None;
    QString message;
    QString operation;
    QString tier;
    QString documentId;

    bool ok() const { return kind == ErrorKind::None; }
    QString toString() const;

    static ErrorInfo make(ErrorKind kind, const QString& message,
                          const QString& operation = QString(),
                          const QString& tier = QString(),
                          const QString& documentId = QString());
};

} // namespace ul
