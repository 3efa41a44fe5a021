#include "core/llm/completion_router.h"
#include "core/shared/logging.h"

#include <exception>

namespace ul {

QString taskTypeToString(TaskType type)
{
    switch (type) {
    case TaskType::NormativeAnalysis: return QStringLiteral("normative_analysis");
    case TaskType::ComplianceCheck:   return QStringLiteral("compliance_check");
    case TaskType::ReportGeneration:  return QStringLiteral("report_generation");
    case TaskType::Rerank:            return QStringLiteral("rerank");
    case TaskType::GeneralQuery:      return QStringLiteral("general_query");
    }
    return QStringLiteral("general_query");
}

CompletionRouter::CompletionRouter() = default;

void CompletionRouter::registerProvider(std::shared_ptr<CompletionProvider> provider)
{
    if (!provider) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& existing : m_providers) {
        if (existing->name() == provider->name()) {
            existing = std::move(provider);
            return;
        }
    }
    m_providers.push_back(std::move(provider));
}

void CompletionRouter::setRoute(TaskType task, const QString& providerName)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_routes[task] = providerName;
}

QStringList CompletionRouter::providerNames() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    QStringList names;
    for (const auto& provider : m_providers) {
        names.append(provider->name());
    }
    return names;
}

bool CompletionRouter::hasProviders() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_providers.empty();
}

std::shared_ptr<CompletionProvider> CompletionRouter::findProvider(const QString& name) const
{
    for (const auto& provider : m_providers) {
        if (provider->name() == name) {
            return provider;
        }
    }
    return nullptr;
}

std::shared_ptr<CompletionProvider> CompletionRouter::select(TaskType task) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_providers.empty()) {
        return nullptr;
    }

    auto route = m_routes.find(task);
    if (route != m_routes.end()) {
        if (auto provider = findProvider(route->second)) {
            return provider;
        }
        LOG_WARN(ulLlm, "Route %s -> %s names no registered provider",
                 qUtf8Printable(taskTypeToString(task)), qUtf8Printable(route->second));
    }
    return m_providers.front();
}

CompletionResult CompletionRouter::invokeWithFallback(TaskType task, const QString& prompt)
{
    const std::shared_ptr<CompletionProvider> primary = select(task);
    if (!primary) {
        CompletionResult result;
        result.error = ErrorInfo::make(ErrorKind::Backend,
                                       QStringLiteral("No completion provider registered"),
                                       taskTypeToString(task));
        return result;
    }

    std::vector<std::shared_ptr<CompletionProvider>> order;
    order.push_back(primary);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& provider : m_providers) {
            if (provider != primary) {
                order.push_back(provider);
            }
        }
    }

    ErrorInfo lastError;
    for (size_t i = 0; i < order.size(); ++i) {
        const std::shared_ptr<CompletionProvider>& provider = order[i];
        CompletionResult result;
        try {
            result = provider->complete(prompt);
        } catch (const std::exception& e) {
            result.error = ErrorInfo::make(ErrorKind::Backend, QString::fromUtf8(e.what()));
        }

        if (result.ok()) {
            if (i > 0) {
                LOG_INFO(ulLlm, "Task %s answered by fallback provider %s",
                         qUtf8Printable(taskTypeToString(task)), qUtf8Printable(provider->name()));
            }
            return result;
        }

        lastError = result.error.ok()
            ? ErrorInfo::make(ErrorKind::Backend, QStringLiteral("Empty completion"))
            : result.error;
        LOG_WARN(ulLlm, "Provider %s failed for %s: %s", qUtf8Printable(provider->name()),
                 qUtf8Printable(taskTypeToString(task)), qUtf8Printable(lastError.message));
    }

    LOG_ERROR(ulLlm, "All %d providers failed for %s", static_cast<int>(order.size()),
              qUtf8Printable(taskTypeToString(task)));
    CompletionResult failed;
    failed.error = ErrorInfo::make(
        ErrorKind::Backend,
        QStringLiteral("All completion providers failed, last error: %1").arg(lastError.message),
        taskTypeToString(task));
    return failed;
}

} // namespace ul
