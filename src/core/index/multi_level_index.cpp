#include "core/index/multi_level_index.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>

namespace ul {

namespace {

constexpr int kWaitSliceMs = 20;

const QString& nationalScope()
{
    static const QString scope = QStringLiteral("Italia");
    return scope;
}

void stamp(std::vector<Chunk>& chunks, HierarchyLevel level, const QString& scope)
{
    for (Chunk& chunk : chunks) {
        chunk.metadata.hierarchyLevel = level;
        chunk.metadata.contextScope = scope;
    }
}

QString scopeFromFilter(HierarchyLevel level, const MetadataFilter& filter)
{
    switch (level) {
    case HierarchyLevel::Comunale:
        return filter.value(QLatin1String(metakey::kMunicipality));
    case HierarchyLevel::Provinciale:
        return filter.value(QLatin1String(metakey::kProvince));
    case HierarchyLevel::Regionale:
        return filter.value(QLatin1String(metakey::kRegion),
                            filter.value(QLatin1String(metakey::kProvince)));
    case HierarchyLevel::Nazionale:
        break;
    }
    return nationalScope();
}

struct TierTask {
    HierarchyLevel level = HierarchyLevel::Nazionale;
    MetadataFilter filter;
    QString scope;
    std::future<SearchOutcome> result;
};

} // namespace

MultiLevelIndex::MultiLevelIndex(std::shared_ptr<IndexBackend> backend,
                                 std::shared_ptr<EmbeddingService> embeddings,
                                 const Config& config)
    : m_backend(std::move(backend))
    , m_embeddings(std::move(embeddings))
    , m_config(config)
{
    if (m_config.tierTimeoutMs < 1) {
        m_config.tierTimeoutMs = 1;
    }
    for (const NormativeLevel level :
         {NormativeLevel::Nazionale, NormativeLevel::Regionale, NormativeLevel::Comunale}) {
        m_managers.emplace(level, std::make_unique<LevelIndexManager>(
                                      level, m_backend.get(), m_embeddings.get(),
                                      m_config.levelConfig));
    }
}

MultiLevelIndex::~MultiLevelIndex()
{
    std::lock_guard<std::mutex> lock(m_workersMutex);
    for (TierWorker& worker : m_workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
    m_workers.clear();
}

LevelIndexManager& MultiLevelIndex::manager(NormativeLevel level)
{
    return *m_managers.at(level);
}

UpsertResult MultiLevelIndex::addDocuments(const std::vector<Chunk>& chunks,
                                           const QString& tierName)
{
    const std::optional<HierarchyLevel> level = hierarchyLevelFromTierName(tierName);
    if (!level.has_value()) {
        UpsertResult result;
        result.error = ErrorInfo::make(
            ErrorKind::Validation,
            QStringLiteral("Unknown tier '%1' (expected nazionale, regionale, provinciale "
                           "or comunale)").arg(tierName),
            QStringLiteral("addDocuments"), tierName);
        return result;
    }
    return manager(storageLevelFor(*level)).upsert(chunks);
}

ReplaceResult MultiLevelIndex::replaceDocuments(const std::vector<Chunk>& chunks,
                                                const QString& tierName,
                                                const QStringList& sources)
{
    const std::optional<HierarchyLevel> level = hierarchyLevelFromTierName(tierName);
    if (!level.has_value()) {
        ReplaceResult result;
        result.error = ErrorInfo::make(ErrorKind::Validation,
                                       QStringLiteral("Unknown tier '%1'").arg(tierName),
                                       QStringLiteral("replaceDocuments"), tierName);
        return result;
    }
    return manager(storageLevelFor(*level)).replace(chunks, sources);
}

SearchOutcome MultiLevelIndex::searchTier(HierarchyLevel level, const QString& query, int k,
                                          const MetadataFilter& filter,
                                          const std::atomic<bool>* cancel)
{
    SearchOutcome outcome = manager(storageLevelFor(level)).search(query, k, filter, cancel);
    if (outcome.ok()) {
        stamp(outcome.chunks, level, scopeFromFilter(level, filter));
    } else {
        outcome.error.tier = hierarchyLevelToString(level);
    }
    return outcome;
}

HierarchicalSearchOutcome MultiLevelIndex::searchHierarchical(
    const QString& query,
    const std::optional<QString>& municipality,
    const std::optional<QString>& province,
    const std::optional<QString>& region,
    int kPerTier,
    const std::atomic<bool>* cancel)
{
    HierarchicalSearchOutcome outcome;
    reapFinishedWorkers();

    // Launch order is irrelevant; results are assembled in precedence order.
    std::vector<TierTask> tasks;
    auto addTask = [&tasks](HierarchyLevel level, const char* key,
                            const std::optional<QString>& value) {
        TierTask task;
        task.level = level;
        if (key) {
            task.filter.insert(QLatin1String(key), *value);
            task.scope = *value;
        } else {
            task.scope = nationalScope();
        }
        tasks.push_back(std::move(task));
    };

    addTask(HierarchyLevel::Nazionale, nullptr, std::nullopt);
    if (municipality.has_value()) {
        addTask(HierarchyLevel::Comunale, metakey::kMunicipality, municipality);
    }
    if (province.has_value()) {
        addTask(HierarchyLevel::Provinciale, metakey::kProvince, province);
    }
    if (region.has_value()) {
        addTask(HierarchyLevel::Regionale, metakey::kRegion, region);
    }

    // Workers may outlive this call, so they watch a flag they co-own rather
    // than the caller's. Raised on cancellation and once waiting is over.
    auto stop = std::make_shared<std::atomic<bool>>(cancel != nullptr && cancel->load());

    for (TierTask& task : tasks) {
        auto promise = std::make_shared<std::promise<SearchOutcome>>();
        task.result = promise->get_future();
        auto done = std::make_shared<std::atomic<bool>>(false);

        LevelIndexManager* target = &manager(storageLevelFor(task.level));
        std::thread thread([target, query, kPerTier, filter = task.filter, promise, done,
                            stop]() {
            try {
                promise->set_value(target->search(query, kPerTier, filter, stop.get()));
            } catch (const std::exception&) {
                promise->set_exception(std::current_exception());
            }
            done->store(true);
        });

        std::lock_guard<std::mutex> lock(m_workersMutex);
        m_workers.push_back(TierWorker{std::move(thread), std::move(done)});
    }

    QElapsedTimer timer;
    timer.start();

    std::map<HierarchyLevel, std::vector<Chunk>> byLevel;
    for (TierTask& task : tasks) {
        bool ready = false;
        while (true) {
            if (cancel && cancel->load()) {
                outcome.cancelled = true;
                stop->store(true);
            }
            if (outcome.cancelled) {
                break;
            }
            const qint64 remaining = m_config.tierTimeoutMs - timer.elapsed();
            if (remaining <= 0) {
                ready = task.result.wait_for(std::chrono::milliseconds(0))
                        == std::future_status::ready;
                break;
            }
            const auto slice = std::chrono::milliseconds(
                std::min<qint64>(remaining, kWaitSliceMs));
            if (task.result.wait_for(slice) == std::future_status::ready) {
                ready = true;
                break;
            }
        }

        if (!ready) {
            TierFailure failure;
            failure.level = task.level;
            failure.timedOut = !outcome.cancelled;
            failure.error = ErrorInfo::make(
                ErrorKind::Backend,
                outcome.cancelled ? QStringLiteral("Cancelled")
                                  : QStringLiteral("Timed out after %1 ms")
                                        .arg(m_config.tierTimeoutMs),
                QStringLiteral("searchHierarchical"), hierarchyLevelToString(task.level));
            LOG_WARN(ulIndex, "%s", qUtf8Printable(failure.error.toString()));
            outcome.tierFailures.push_back(failure);
            continue;
        }

        SearchOutcome tierOutcome;
        try {
            tierOutcome = task.result.get();
        } catch (const std::exception& e) {
            tierOutcome.error = ErrorInfo::make(ErrorKind::Backend, QString::fromUtf8(e.what()));
        }

        if (tierOutcome.cancelled) {
            outcome.cancelled = true;
            TierFailure failure;
            failure.level = task.level;
            failure.error = ErrorInfo::make(ErrorKind::Backend, QStringLiteral("Cancelled"),
                                            QStringLiteral("searchHierarchical"),
                                            hierarchyLevelToString(task.level));
            LOG_WARN(ulIndex, "%s", qUtf8Printable(failure.error.toString()));
            outcome.tierFailures.push_back(failure);
            continue;
        }

        if (!tierOutcome.ok()) {
            TierFailure failure;
            failure.level = task.level;
            failure.error = tierOutcome.error;
            failure.error.operation = QStringLiteral("searchHierarchical");
            failure.error.tier = hierarchyLevelToString(task.level);
            LOG_WARN(ulIndex, "%s", qUtf8Printable(failure.error.toString()));
            outcome.tierFailures.push_back(failure);
            continue;
        }

        stamp(tierOutcome.chunks, task.level, task.scope);
        byLevel[task.level] = std::move(tierOutcome.chunks);
    }

    // Timed-out and cancelled workers skip any backend query not yet started.
    stop->store(true);

    for (const HierarchyLevel level : {HierarchyLevel::Comunale, HierarchyLevel::Provinciale,
                                       HierarchyLevel::Regionale, HierarchyLevel::Nazionale}) {
        auto it = byLevel.find(level);
        if (it == byLevel.end()) {
            continue;
        }
        for (Chunk& chunk : it->second) {
            outcome.chunks.push_back(std::move(chunk));
        }
    }

    reapFinishedWorkers();

    LOG_DEBUG(ulIndex, "Hierarchical search: %d tiers, %d chunks, %d failures in %lld ms",
              static_cast<int>(tasks.size()), static_cast<int>(outcome.chunks.size()),
              static_cast<int>(outcome.tierFailures.size()),
              static_cast<long long>(timer.elapsed()));
    return outcome;
}

std::map<NormativeLevel, std::vector<Chunk>> MultiLevelIndex::searchAllLevels(const QString& query,
                                                                               int kPerLevel)
{
    std::map<NormativeLevel, std::vector<Chunk>> results;
    for (auto& entry : m_managers) {
        SearchOutcome outcome = entry.second->search(query, kPerLevel);
        if (!outcome.ok()) {
            LOG_ERROR(ulIndex, "%s", qUtf8Printable(outcome.error.toString()));
            results[entry.first] = {};
            continue;
        }
        results[entry.first] = std::move(outcome.chunks);
    }
    return results;
}

IndexStatsReport MultiLevelIndex::stats()
{
    IndexStatsReport report;
    for (auto& entry : m_managers) {
        CollectionStats levelStats = entry.second->stats();
        if (!levelStats.error.ok() && report.error.ok()) {
            report.error = levelStats.error;
        }
        report.total += levelStats.count;
        report.levels.emplace(entry.first, std::move(levelStats));
    }
    return report;
}

void MultiLevelIndex::reapFinishedWorkers()
{
    std::lock_guard<std::mutex> lock(m_workersMutex);
    auto it = m_workers.begin();
    while (it != m_workers.end()) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = m_workers.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace ul
