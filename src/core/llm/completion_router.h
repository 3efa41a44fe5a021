#pragma once

#include "core/llm/completion_provider.h"

#include <QStringList>

#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace ul {

// CompletionRouter -- picks a provider per task type and falls back.
//
// The strategy table maps TaskType to a provider name. A task without a
// route, or routed to an unregistered name, starts with the first
// registered provider. invokeWithFallback() then tries every other
// provider in registration order until one answers.
class CompletionRouter {
public:
    CompletionRouter();

    // Replaces a provider with the same name, keeping its position.
    void registerProvider(std::shared_ptr<CompletionProvider> provider);
    void setRoute(TaskType task, const QString& providerName);

    QStringList providerNames() const;
    bool hasProviders() const;

    std::shared_ptr<CompletionProvider> select(TaskType task) const;
    CompletionResult invokeWithFallback(TaskType task, const QString& prompt);

private:
    std::shared_ptr<CompletionProvider> findProvider(const QString& name) const;

    std::vector<std::shared_ptr<CompletionProvider>> m_providers;
    std::map<TaskType, QString> m_routes;
    mutable std::mutex m_mutex;
};

} // namespace ul
