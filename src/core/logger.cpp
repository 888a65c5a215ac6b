#include "logger.h"
#include <QDateTime>
#include <QTextStream>
#include <QDir>
#include <QFileInfo>

std::unique_ptr<QFile> Logger::s_file;
QMutex Logger::s_mutex;
QString Logger::s_filePath;
QtMsgType Logger::s_minLevel = QtInfoMsg;
QtMessageHandler Logger::s_originalHandler = nullptr;

bool Logger::init(const QString& filePath, QtMsgType minLevel)
{
    QMutexLocker lock(&s_mutex);

    if (s_file) {
        return true;
    }

    QFileInfo fi(filePath);
    if (!QDir().mkpath(fi.absolutePath())) {
        return false;
    }

    auto file = std::make_unique<QFile>(filePath);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return false;
    }

    s_file = std::move(file);
    s_filePath = filePath;
    s_minLevel = minLevel;

    QTextStream stream(s_file.get());
    stream << "\n--- glucodaily " << QDateTime::currentDateTime().toString(Qt::ISODate)
           << " (min level " << levelName(minLevel) << ") ---\n";
    stream.flush();

    s_originalHandler = qInstallMessageHandler(messageHandler);
    return true;
}

void Logger::shutdown()
{
    QMutexLocker lock(&s_mutex);

    if (s_originalHandler) {
        qInstallMessageHandler(s_originalHandler);
        s_originalHandler = nullptr;
    }

    s_file.reset();
}

QString Logger::logFilePath()
{
    return s_filePath;
}

QString Logger::levelName(QtMsgType type)
{
    switch (type) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "UNKNOWN";
}

// QtMsgType isn't ordered by severity (QtInfoMsg == 4)
static int severity(QtMsgType type)
{
    switch (type) {
        case QtDebugMsg:    return 0;
        case QtInfoMsg:     return 1;
        case QtWarningMsg:  return 2;
        case QtCriticalMsg: return 3;
        case QtFatalMsg:    return 4;
    }
    return 0;
}

bool Logger::isBelow(QtMsgType type, QtMsgType minLevel)
{
    return severity(type) < severity(minLevel);
}

QString Logger::formatLine(const QString& timestamp, QtMsgType type, const QString& msg)
{
    // Format: [HH:mm:ss.zzz] LEVEL: message
    return QString("[%1] %2: %3").arg(timestamp, levelName(type), msg);
}

void Logger::writeLine(const QString& line)
{
    QMutexLocker lock(&s_mutex);
    if (!s_file) {
        return;
    }
    QTextStream stream(s_file.get());
    stream << line << "\n";
    stream.flush();
}

void Logger::messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    if (isBelow(type, s_minLevel)) {
        return;
    }

    QString line = formatLine(QDateTime::currentDateTime().toString("hh:mm:ss.zzz"), type, msg);

    writeLine(line);

    if (s_originalHandler) {
        s_originalHandler(type, context, msg);
    }
}
