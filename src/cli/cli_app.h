#pragma once

#include "core/shared/settings.h"

#include <QCommandLineParser>
#include <QString>
#include <QStringList>
#include <QTextStream>

#include <memory>

namespace ul {

class EmbeddingService;
class LocalIndexBackend;
class MultiLevelIndex;

// CliApp -- the urbanlex command line.
//
//   urbanlex [--config file] [--index dir] <command> ...
//     index <dir> --level L [--region R] [--province P] [--municipality M] [--no-recursive]
//     search <query> [--municipality M] [--province P] [--region R] [--level L]
//                    [-k N] [--no-rerank] [--json]
//     stats
//     delete --level L --where key=value [--where key=value ...]
//
// Exit codes: 0 success, 1 operation failed, 2 usage error.
class CliApp {
public:
    CliApp();
    ~CliApp();

    int run(const QStringList& arguments);

private:
    enum ExitCode {
        ExitOk = 0,
        ExitFailure = 1,
        ExitUsage = 2,
    };

    void addOptions();
    bool loadSettings();
    bool openIndex();
    int usageError(const QString& message);

    int runIndex(const QStringList& positional);
    int runSearch(const QStringList& positional);
    int runStats();
    int runDelete();

    QCommandLineParser m_parser;
    QTextStream m_out;
    QTextStream m_err;

    Settings m_settings;
    std::shared_ptr<EmbeddingService> m_embeddings;
    std::shared_ptr<LocalIndexBackend> m_backend;
    std::unique_ptr<MultiLevelIndex> m_index;
};

} // namespace ul
