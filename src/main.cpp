#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QDebug>

#include "core/logger.h"
#include "core/settings.h"
#include "nightscout/nightscoutrecords.h"
#include "report/daywindow.h"
#include "report/reportassembler.h"

static bool readFile(const QString& path, QByteArray& out, QString& error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        error = QString("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }
    out = file.readAll();
    return true;
}

static bool writeOutput(const QString& path, const QByteArray& data)
{
    if (path.isEmpty() || path == "-") {
        QFile out;
        if (!out.open(stdout, QIODevice::WriteOnly)) {
            return false;
        }
        out.write(data);
        out.write("\n");
        return true;
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCritical() << "main: Cannot write" << path << "-" << file.errorString();
        return false;
    }
    file.write(data);
    file.write("\n");
    return true;
}

// Report-level failure: no partial report, just the error object
static int fail(const QString& outputPath, const QString& message)
{
    qCritical() << "main:" << message;
    QJsonObject error{{"error", message}};
    writeOutput(outputPath, QJsonDocument(error).toJson(QJsonDocument::Compact));
    Logger::shutdown();
    return 1;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("GlucoDaily");
    app.setApplicationName("glucodaily");
    app.setApplicationVersion(GLUCODAILY_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Builds a daily glucose/treatment report from Nightscout JSON exports.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption entriesOption({"e", "entries"}, "Entries JSON array (/api/v1/entries.json).", "file");
    QCommandLineOption treatmentsOption({"t", "treatments"}, "Treatments JSON array (/api/v1/treatments.json).", "file");
    QCommandLineOption configOption({"c", "config"}, "INI settings file.", "file");
    QCommandLineOption dateOption({"d", "date"}, "Only keep records from this local day.", "YYYY-MM-DD");
    QCommandLineOption outputOption({"o", "output"}, "Write the report here instead of stdout.", "file");
    QCommandLineOption logFileOption("log-file", "Append log messages to this file.", "file");
    QCommandLineOption verboseOption({"v", "verbose"}, "Include debug messages in the log.");
    parser.addOptions({entriesOption, treatmentsOption, configOption, dateOption,
                       outputOption, logFileOption, verboseOption});
    parser.process(app);

    ReportSettings settings(parser.value(configOption));

    const bool verbose = parser.isSet(verboseOption) || settings.verbose();
    const QString logFile = parser.isSet(logFileOption) ? parser.value(logFileOption) : settings.logFile();
    if (!verbose) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }
    if (!logFile.isEmpty() && !Logger::init(logFile, verbose ? QtDebugMsg : QtInfoMsg)) {
        qWarning() << "main: Could not open log file" << logFile;
    }

    const QString outputPath = parser.value(outputOption);

    if (!parser.isSet(entriesOption) || !parser.isSet(treatmentsOption)) {
        return fail(outputPath, "Both --entries and --treatments are required");
    }

    QByteArray entriesJson;
    QByteArray treatmentsJson;
    QString error;
    if (!readFile(parser.value(entriesOption), entriesJson, error) ||
        !readFile(parser.value(treatmentsOption), treatmentsJson, error)) {
        return fail(outputPath, error);
    }

    NightscoutRecords::EntriesResult entries = NightscoutRecords::parseEntries(entriesJson);
    if (!entries.success) {
        return fail(outputPath, "Entries: " + entries.errorMessage);
    }
    NightscoutRecords::TreatmentsResult treatments = NightscoutRecords::parseTreatments(treatmentsJson);
    if (!treatments.success) {
        return fail(outputPath, "Treatments: " + treatments.errorMessage);
    }

    QList<GlucoseReading> readings = entries.readings;
    QList<TreatmentEvent> events = treatments.treatments;

    if (parser.isSet(dateOption)) {
        QDate date = QDate::fromString(parser.value(dateOption), Qt::ISODate);
        DayWindow window = DayWindow::forDate(date, settings.utcOffsetSeconds());
        if (!window.isValid()) {
            return fail(outputPath, "Invalid --date: " + parser.value(dateOption));
        }
        readings = window.filter(readings);
        events = window.filter(events);
        qInfo() << "main: Report for" << date.toString(Qt::ISODate)
                << "(" << window.start.toString(Qt::ISODate) << "to" << window.end.toString(Qt::ISODate) << ")";
    }

    qInfo() << "main: Processing" << readings.size() << "entries and" << events.size() << "treatments";

    ReportAssembler assembler(settings.utcOffsetSeconds(), settings.toleranceSeconds());
    DailyReport report = assembler.assemble(readings, events);

    bool written = writeOutput(outputPath, report.toJsonBytes());
    Logger::shutdown();
    return written ? 0 : 1;
}
