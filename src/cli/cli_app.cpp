#include "cli_app.h"

#include "core/embedding/embedding_service.h"
#include "core/index/multi_level_index.h"
#include "core/ingest/document_processor.h"
#include "core/retrieval/retriever.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/vector/local_index_backend.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <cstdio>

namespace ul {

namespace {

const QString kConfigOption = QStringLiteral("config");
const QString kIndexOption = QStringLiteral("index");
const QString kLevelOption = QStringLiteral("level");
const QString kRegionOption = QStringLiteral("region");
const QString kProvinceOption = QStringLiteral("province");
const QString kMunicipalityOption = QStringLiteral("municipality");
const QString kNoRecursiveOption = QStringLiteral("no-recursive");
const QString kTopKOption = QStringLiteral("k");
const QString kNoRerankOption = QStringLiteral("no-rerank");
const QString kJsonOption = QStringLiteral("json");
const QString kWhereOption = QStringLiteral("where");

std::optional<QString> optionalValue(const QCommandLineParser& parser, const QString& name)
{
    if (!parser.isSet(name)) {
        return std::nullopt;
    }
    const QString value = parser.value(name).trimmed();
    if (value.isEmpty()) {
        return std::nullopt;
    }
    return value;
}

QJsonObject chunkToJson(const Chunk& chunk)
{
    QJsonObject metadata;
    const MetadataMap flat = toMetadataMap(chunk.metadata);
    for (auto it = flat.constBegin(); it != flat.constEnd(); ++it) {
        metadata[it.key()] = it.value();
    }
    if (chunk.metadata.hierarchyLevel.has_value()) {
        metadata[QStringLiteral("hierarchy_level")] =
            hierarchyLevelToString(*chunk.metadata.hierarchyLevel);
        metadata[QStringLiteral("context_scope")] = chunk.metadata.contextScope;
    }

    QJsonObject json;
    json[QStringLiteral("text")] = chunk.text;
    json[QStringLiteral("metadata")] = metadata;
    return json;
}

} // namespace

CliApp::CliApp()
    : m_out(stdout)
    , m_err(stderr)
{
    addOptions();
}

CliApp::~CliApp() = default;

void CliApp::addOptions()
{
    m_parser.setApplicationDescription(
        QStringLiteral("Index and search building and zoning regulations across the "
                       "national, regional and municipal tiers."));
    m_parser.addHelpOption();
    m_parser.addVersionOption();

    m_parser.addOption({kConfigOption, QStringLiteral("Settings file (JSON)."),
                        QStringLiteral("file")});
    m_parser.addOption({kIndexOption, QStringLiteral("Index directory, overrides settings."),
                        QStringLiteral("dir")});
    m_parser.addOption({kLevelOption,
                        QStringLiteral("Tier: nazionale, regionale, provinciale or comunale."),
                        QStringLiteral("level")});
    m_parser.addOption({kRegionOption, QStringLiteral("Region name."), QStringLiteral("region")});
    m_parser.addOption({kProvinceOption, QStringLiteral("Province name."),
                        QStringLiteral("province")});
    m_parser.addOption({kMunicipalityOption, QStringLiteral("Municipality name."),
                        QStringLiteral("municipality")});
    m_parser.addOption({kNoRecursiveOption, QStringLiteral("Do not descend into subdirectories.")});
    m_parser.addOption({kTopKOption, QStringLiteral("Number of results."), QStringLiteral("n")});
    m_parser.addOption({kNoRerankOption, QStringLiteral("Skip LLM re-ranking.")});
    m_parser.addOption({kJsonOption, QStringLiteral("Print results as JSON.")});
    m_parser.addOption({kWhereOption, QStringLiteral("Metadata filter, repeatable."),
                        QStringLiteral("key=value")});

    m_parser.addPositionalArgument(QStringLiteral("command"),
                                   QStringLiteral("index | search | stats | delete"));
}

int CliApp::run(const QStringList& arguments)
{
    if (!m_parser.parse(arguments)) {
        return usageError(m_parser.errorText());
    }
    if (m_parser.isSet(QStringLiteral("help"))) {
        m_out << m_parser.helpText();
        return ExitOk;
    }
    if (m_parser.isSet(QStringLiteral("version"))) {
        m_out << QCoreApplication::applicationName() << ' '
              << QCoreApplication::applicationVersion() << '\n';
        return ExitOk;
    }

    QStringList positional = m_parser.positionalArguments();
    if (positional.isEmpty()) {
        return usageError(QStringLiteral("Missing command"));
    }
    const QString command = positional.takeFirst();

    if (!loadSettings() || !openIndex()) {
        return ExitFailure;
    }

    if (command == QLatin1String("index")) {
        return runIndex(positional);
    }
    if (command == QLatin1String("search")) {
        return runSearch(positional);
    }
    if (command == QLatin1String("stats")) {
        return runStats();
    }
    if (command == QLatin1String("delete")) {
        return runDelete();
    }
    return usageError(QStringLiteral("Unknown command '%1'").arg(command));
}

int CliApp::usageError(const QString& message)
{
    m_err << "urbanlex: " << message << '\n'
          << "Try 'urbanlex --help' for usage.\n";
    m_err.flush();
    return ExitUsage;
}

bool CliApp::loadSettings()
{
    const QString path = m_parser.isSet(kConfigOption) ? m_parser.value(kConfigOption)
                                                      : SettingsManager::defaultSettingsPath();
    if (QFileInfo::exists(path)) {
        const std::optional<Settings> loaded = SettingsManager::load(path);
        if (!loaded.has_value()) {
            m_err << "urbanlex: cannot read settings from " << path << '\n';
            return false;
        }
        m_settings = *loaded;
    } else if (m_parser.isSet(kConfigOption)) {
        m_err << "urbanlex: settings file not found: " << path << '\n';
        return false;
    } else {
        m_settings = SettingsManager::defaults();
    }

    if (m_parser.isSet(kIndexOption)) {
        m_settings.indexPath = m_parser.value(kIndexOption);
    }
    return true;
}

bool CliApp::openIndex()
{
    // Embedding models are served by an external process; without one the
    // service degrades to the pseudo embedding.
    m_embeddings = std::make_shared<EmbeddingService>(nullptr, m_settings.embeddingDimensions,
                                                      m_settings.embeddingModelId);
    m_backend = std::make_shared<LocalIndexBackend>(m_settings.indexPath,
                                                    m_settings.embeddingDimensions,
                                                    m_settings.embeddingModelId);
    const ErrorInfo opened = m_backend->open();
    if (!opened.ok()) {
        m_err << "urbanlex: " << opened.toString() << '\n';
        return false;
    }

    RouterConfig config;
    config.tierTimeoutMs = m_settings.tierTimeoutMs;
    config.levelConfig.upsertBatchSize = m_settings.upsertBatchSize;
    m_index = std::make_unique<MultiLevelIndex>(m_backend, m_embeddings, config);
    return true;
}

int CliApp::runIndex(const QStringList& positional)
{
    if (positional.size() != 1) {
        return usageError(QStringLiteral("index expects exactly one directory"));
    }
    const std::optional<QString> level = optionalValue(m_parser, kLevelOption);
    if (!level.has_value()) {
        return usageError(QStringLiteral("index requires --level"));
    }
    const std::optional<HierarchyLevel> hierarchy = hierarchyLevelFromTierName(*level);
    if (!hierarchy.has_value()) {
        return usageError(QStringLiteral("Unknown level '%1'").arg(*level));
    }

    // Provincial law is processed as regional text tagged with its province.
    const QString processorTier = normativeLevelToString(storageLevelFor(*hierarchy));

    ProcessorConfig processorConfig;
    processorConfig.chunkSize = m_settings.chunkSize;
    processorConfig.chunkOverlap = m_settings.chunkOverlap;
    processorConfig.articleOverflowFactor = m_settings.articleOverflowFactor;
    DocumentProcessor processor(processorConfig);

    const DirectoryIngestReport report = processor.processDirectory(
        positional.first(), processorTier, optionalValue(m_parser, kRegionOption),
        optionalValue(m_parser, kProvinceOption), optionalValue(m_parser, kMunicipalityOption),
        !m_parser.isSet(kNoRecursiveOption));
    if (!report.error.ok()) {
        m_err << "urbanlex: " << report.error.toString() << '\n';
        return ExitFailure;
    }
    for (const IngestFailure& failure : report.failures) {
        m_err << "skipped " << failure.path << ": " << failure.error.message << '\n';
    }

    // Re-indexing a file supersedes its previous chunks.
    const LevelIndexManager& target = m_index->manager(storageLevelFor(*hierarchy));
    const ReplaceResult replaced =
        m_index->replaceDocuments(report.chunks, *level, report.processedFiles);
    if (!replaced.ok()) {
        m_err << "urbanlex: " << replaced.error.toString() << '\n';
        if (!replaced.ids.isEmpty()) {
            m_err << replaced.ids.size() << " new chunks are stored alongside the previous ones\n";
        }
        return ExitFailure;
    }

    m_out << "Indexed " << replaced.ids.size() << " chunks from "
          << report.processedFiles.size() << " files into "
          << target.collectionName() << '\n';
    if (replaced.superseded > 0) {
        m_out << "Replaced " << replaced.superseded << " previous chunks\n";
    }
    if (!report.failures.empty()) {
        m_out << report.failures.size() << " files skipped\n";
    }
    return ExitOk;
}

int CliApp::runSearch(const QStringList& positional)
{
    if (positional.isEmpty()) {
        return usageError(QStringLiteral("search expects a query"));
    }

    RetrievalQuery request;
    request.query = positional.join(QLatin1Char(' '));
    request.municipality = optionalValue(m_parser, kMunicipalityOption);
    request.province = optionalValue(m_parser, kProvinceOption);
    request.region = optionalValue(m_parser, kRegionOption);
    request.tier = optionalValue(m_parser, kLevelOption);
    if (m_parser.isSet(kTopKOption)) {
        bool ok = false;
        const int k = m_parser.value(kTopKOption).toInt(&ok);
        if (!ok || k < 1) {
            return usageError(QStringLiteral("-k expects a positive integer"));
        }
        request.k = k;
    }

    const RetrieverConfig config = RetrieverConfig::fromSettings(m_settings);
    request.rerank = config.rerank && !m_parser.isSet(kNoRerankOption);

    // No completion provider is wired into the command line; a requested
    // re-rank falls back to the hybrid order.
    Retriever retriever(m_index.get(), nullptr, config);

    const RetrievalOutcome outcome = retriever.retrieve(request);
    if (!outcome.ok()) {
        m_err << "urbanlex: " << outcome.error.toString() << '\n';
        return outcome.error.kind == ErrorKind::Validation ? ExitUsage : ExitFailure;
    }
    if (outcome.rerankFellBack) {
        m_err << "re-rank unavailable, results in hybrid order\n";
    }
    for (const TierFailure& failure : outcome.tierFailures) {
        m_err << "tier " << hierarchyLevelToString(failure.level)
              << (failure.timedOut ? " timed out" : " failed") << ": "
              << failure.error.message << '\n';
    }

    const std::vector<Citation> citations = Retriever::getCitations(outcome.chunks);
    if (m_parser.isSet(kJsonOption)) {
        QJsonArray results;
        for (const Chunk& chunk : outcome.chunks) {
            results.append(chunkToJson(chunk));
        }
        QJsonArray citationArray;
        for (const Citation& citation : citations) {
            citationArray.append(citation.toJson());
        }
        QJsonObject json;
        json[QStringLiteral("query")] = request.query;
        json[QStringLiteral("results")] = results;
        json[QStringLiteral("citations")] = citationArray;
        json[QStringLiteral("context")] = Retriever::formatContext(outcome.chunks);
        m_out << QJsonDocument(json).toJson(QJsonDocument::Indented);
        return ExitOk;
    }

    if (outcome.chunks.empty()) {
        m_out << "No results\n";
        return ExitOk;
    }
    m_out << Retriever::formatContext(outcome.chunks) << '\n';
    m_out << "\nCitations:\n";
    for (size_t i = 0; i < citations.size(); ++i) {
        m_out << "  " << (i + 1) << ". " << citations[i].displayText() << '\n';
    }
    return ExitOk;
}

int CliApp::runStats()
{
    const IndexStatsReport report = m_index->stats();
    if (!report.error.ok()) {
        m_err << "urbanlex: " << report.error.toString() << '\n';
        return ExitFailure;
    }

    m_out << "Index: " << m_settings.indexPath << '\n';
    for (const auto& entry : report.levels) {
        const CollectionStats& stats = entry.second;
        m_out << "  " << qSetFieldWidth(12) << Qt::left << normativeLevelToString(entry.first)
              << qSetFieldWidth(0) << stats.count << " chunks (" << stats.collectionName
              << ")\n";
    }
    m_out << "Total: " << report.total << " chunks\n";
    m_out << "Embedding model: " << m_settings.embeddingModelId
          << (m_embeddings->hasProvider() ? "" : " (unavailable, pseudo embedding)") << '\n';
    return ExitOk;
}

int CliApp::runDelete()
{
    const std::optional<QString> level = optionalValue(m_parser, kLevelOption);
    if (!level.has_value()) {
        return usageError(QStringLiteral("delete requires --level"));
    }
    const std::optional<HierarchyLevel> hierarchy = hierarchyLevelFromTierName(*level);
    if (!hierarchy.has_value()) {
        return usageError(QStringLiteral("Unknown level '%1'").arg(*level));
    }

    MetadataFilter filter;
    for (const QString& clause : m_parser.values(kWhereOption)) {
        const int eq = clause.indexOf(QLatin1Char('='));
        if (eq <= 0) {
            return usageError(QStringLiteral("Malformed --where '%1', expected key=value")
                                  .arg(clause));
        }
        filter.insert(clause.left(eq).trimmed(), clause.mid(eq + 1));
    }
    if (filter.isEmpty()) {
        return usageError(QStringLiteral("delete requires at least one --where"));
    }
    if (*hierarchy == HierarchyLevel::Provinciale
        && !filter.contains(QLatin1String(metakey::kProvince))) {
        return usageError(QStringLiteral("provinciale deletes need --where province=..."));
    }

    const DeleteOutcome outcome = m_index->manager(storageLevelFor(*hierarchy))
                                      .deleteByMetadata(filter);
    if (!outcome.ok()) {
        m_err << "urbanlex: " << outcome.error.toString() << '\n';
        return outcome.error.kind == ErrorKind::Validation ? ExitUsage : ExitFailure;
    }
    m_out << "Deleted " << outcome.count << " chunks\n";
    return ExitOk;
}

} // namespace ul
