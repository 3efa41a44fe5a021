#include "cli_app.h"

#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("urbanlex"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    ul::CliApp cli;
    return cli.run(app.arguments());
}
