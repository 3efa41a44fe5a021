#pragma once

#include "core/shared/error.h"

#include <QString>

#include <optional>

namespace ul {

enum class TaskType {
    NormativeAnalysis,
    ComplianceCheck,
    ReportGeneration,
    Rerank,
    GeneralQuery,
};

QString taskTypeToString(TaskType type);

struct CompletionResult {
    std::optional<QString> text;
    ErrorInfo error;

    bool ok() const { return error.ok() && text.has_value(); }
};

// CompletionProvider -- one remote or local language model.
//
// Vendor clients live outside this library; they implement complete() and
// report failures in the result (or by throwing std::exception, which the
// router absorbs).
class CompletionProvider {
public:
    virtual ~CompletionProvider() = default;

    virtual QString name() const = 0;
    virtual CompletionResult complete(const QString& prompt) = 0;
};

} // namespace ul
