#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QLoggingCategory>
#include <QTextStream>

#include "app/logging.hpp"
#include "app/merge_command.hpp"
#include "core/hashing.hpp"

namespace {

int report(const quire::Result<QString>& result) {
    if (result.is_err()) {
        QTextStream(stderr) << QString::fromStdString(result.unwrap_err().message) << QLatin1Char('\n');
        return 1;
    }
    QTextStream(stdout) << result.unwrap();
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("quire");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("quire");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Merge note collections"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Target collection (defaults to QUIRE_DB_PATH)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption sourceOption(
        QStringList{QStringLiteral("source")},
        QStringLiteral("Collection to merge from, for 'merge'."),
        QStringLiteral("path"));
    parser.addOption(sourceOption);

    const QCommandLineOption mediaOption(
        QStringList{QStringLiteral("media")},
        QStringLiteral("JSON object mapping referenced media names to target names."),
        QStringLiteral("file"));
    parser.addOption(mediaOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output the full merge log as JSON."));
    parser.addOption(jsonOption);

    const QCommandLineOption verboseOption(
        QStringList{QStringLiteral("verbose")},
        QStringLiteral("Log per-note decisions."));
    parser.addOption(verboseOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run ('merge' or 'stats')."));
    parser.process(app);

    quire::app::install_file_logging();
    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("quire.*.debug=true\n"));
    }
    qInfo() << "quire: logging to" << quire::app::log_file_path();

    auto hashing = quire::init_hashing();
    if (hashing.is_err()) {
        qCritical() << "Failed to initialize hashing:" << hashing.unwrap_err().message.c_str();
        return 1;
    }

    const auto dbPath = parser.isSet(dbPathOption)
        ? parser.value(dbPathOption)
        : qEnvironmentVariable("QUIRE_DB_PATH");

    const auto positional = parser.positionalArguments();
    const auto command = positional.isEmpty() ? QString{} : positional.first();

    if (command == QStringLiteral("merge")) {
        const auto options = quire::app::MergeOptions{
            .targetPath = dbPath,
            .sourcePath = parser.value(sourceOption),
            .mediaMapPath = parser.value(mediaOption),
            .json = parser.isSet(jsonOption)
        };
        return report(quire::app::run_merge(options));
    }

    if (command == QStringLiteral("stats")) {
        return report(quire::app::run_stats(dbPath));
    }

    QTextStream(stderr) << parser.helpText();
    return 2;
}
