#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QFile>
#include <QMutex>
#include <memory>

// Routes qDebug()/qWarning()/... to a log file in addition to stderr.
// Messages below the minimum level are dropped from both outputs.
class Logger
{
public:
    static bool init(const QString& filePath, QtMsgType minLevel = QtInfoMsg);
    static void shutdown();
    static QString logFilePath();

    static QString levelName(QtMsgType type);
    static bool isBelow(QtMsgType type, QtMsgType minLevel);
    static QString formatLine(const QString& timestamp, QtMsgType type, const QString& msg);

private:
    static void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

    static void writeLine(const QString& line);

    static std::unique_ptr<QFile> s_file;
    static QMutex s_mutex;
    static QString s_filePath;
    static QtMsgType s_minLevel;
    static QtMessageHandler s_originalHandler;
};

#endif // LOGGER_H
