/* Beacon logging
*
* This file is part of the Beacon project.
*
* Copyright (C) The Beacon Project 2026
*
* This program is free software; you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation; either version 2 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program; if not, write to the Free Software
* Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301,
* USA.
*/

// Std
#include <stdio.h>

// Qt
#include <QFile>
#include <QMutex>
#include <QQueue>
#include <QRegExp>
#include <QThread>
#include <QDateTime>
#include <QStringList>
#include <QWaitCondition>

// Beacon
#include "beaconexitcodes.h"
#include "beaconlogging.h"

LogLevel gLogLevel    = LOG_INFO;
quint32  gVerboseMask = VB_GENERAL;

typedef struct
{
    quint32     mask;
    const char *name;
    bool        additive;
    const char *help;
} VerboseDef;

static const VerboseDef gVerboseDefs[] =
{
    { VB_ALL,      "all",      false, "ALL available debug output"                       },
    { VB_NONE,     "none",     false, "NO debug output"                                  },
    { VB_GENERAL,  "general",  true,  "Startup, shutdown and discovery summaries"        },
    { VB_NETWORK,  "network",  true,  "Network interface and availability changes"      },
    { VB_SSDP,     "ssdp",     true,  "SSDP packet tracing and discovery cache changes"  },
    { VB_SOCKET,   "socket",   true,  "Multicast and unicast UDP socket state"           },
    { VB_DATABASE, "database", true,  "Settings database access"                         },
    { 0,           NULL,       false, NULL                                               }
};

typedef struct
{
    LogLevel    level;
    const char *name;
    char        shortname;
} LevelDef;

static const LevelDef gLevelDefs[] =
{
    { LOG_EMERG,   "emerg",   '!' },
    { LOG_ALERT,   "alert",   'A' },
    { LOG_CRIT,    "crit",    'C' },
    { LOG_ERR,     "err",     'E' },
    { LOG_WARNING, "warning", 'W' },
    { LOG_NOTICE,  "notice",  'N' },
    { LOG_INFO,    "info",    'I' },
    { LOG_DEBUG,   "debug",   'D' },
    { LOG_UNKNOWN, NULL,      '-' }
};

static char ShortLevelName(LogLevel Level)
{
    for (int i = 0; gLevelDefs[i].name; ++i)
        if (gLevelDefs[i].level == Level)
            return gLevelDefs[i].shortname;
    return '-';
}

/*! \class BeaconLogger
 *  \brief Writes formatted log lines to the console and an optional log file.
 *
 * Lines are formatted by the thread that logs them and queued. The logger thread drains
 * the queue so that a slow terminal or disk never stalls the SSDP engine's socket threads.
*/
class BeaconLogger : public QThread
{
  public:
    BeaconLogger(bool Console)
      : QThread(),
        m_console(Console),
        m_file(NULL),
        m_aborted(false)
    {
        setObjectName("Logger");
    }

    ~BeaconLogger()
    {
        Stop();
        wait();

        if (m_file)
        {
            m_file->flush();
            m_file->close();
        }
        delete m_file;
    }

    bool OpenFile(const QString &Filename)
    {
        if (QFile::exists(Filename))
        {
            QString old = Filename + ".old";
            QFile::remove(old);
            QFile::rename(Filename, old);
        }

        m_file = new QFile(Filename);
        if (m_file->open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text))
            return true;

        delete m_file;
        m_file = NULL;
        return false;
    }

    void Enqueue(const QString &Line)
    {
        QMutexLocker locker(&m_lock);
        m_queue.enqueue(Line);
        m_waitNotEmpty.wakeAll();
    }

    void Stop(void)
    {
        QMutexLocker locker(&m_lock);
        m_aborted = true;
        m_waitNotEmpty.wakeAll();
    }

  protected:
    void run(void)
    {
        QMutexLocker locker(&m_lock);

        while (!m_aborted || !m_queue.isEmpty())
        {
            if (m_queue.isEmpty())
            {
                m_waitNotEmpty.wait(&m_lock, 100);
                continue;
            }

            QStringList lines;
            while (!m_queue.isEmpty())
                lines.append(m_queue.dequeue());
            locker.unlock();

            foreach (const QString &line, lines)
                Write(line);
            if (m_file)
                m_file->flush();

            locker.relock();
        }
    }

  private:
    void Write(const QString &Line)
    {
        QByteArray line = Line.toLocal8Bit();

        if (m_console)
            fprintf(stderr, "%s\n", line.constData());

        if (m_file && m_file->write(line.append('\n')) < 0)
        {
            fprintf(stderr, "Closing log file '%s' after write error\n",
                    m_file->fileName().toLocal8Bit().constData());
            m_file->close();
            delete m_file;
            m_file = NULL;
        }
    }

  private:
    bool            m_console;
    QFile          *m_file;
    bool            m_aborted;
    QMutex          m_lock;
    QWaitCondition  m_waitNotEmpty;
    QQueue<QString> m_queue;
};

static QMutex        gLoggerLock;
static BeaconLogger *gLogger = NULL;

void PrintLogLine(quint32 Mask, LogLevel Level, const char *File, int Line,
                  const char *Function, const QString &Message)
{
    (void)Mask;

    QString thread = QThread::currentThread()->objectName();
    if (thread.isEmpty())
        thread = QString("0x%1").arg((quintptr)QThread::currentThreadId(), 0, 16);

    QString file(File);
    int slash = file.lastIndexOf('/');
    if (slash > -1)
        file = file.mid(slash + 1);

    QString line = QString("%1 %2 %3 %4 - %5")
                       .arg(QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz"))
                       .arg(ShortLevelName(Level))
                       .arg(thread, -11)
                       .arg(QString("%1 (%2:%3)").arg(Function).arg(file).arg(Line), -50)
                       .arg(Message);

    QMutexLocker locker(&gLoggerLock);
    if (gLogger)
        gLogger->Enqueue(line);
    else
        fprintf(stderr, "%s\n", line.toLocal8Bit().constData());
}

/*! \brief Start the logging thread.
 *
 * Console output is suppressed when Console is false. If Logfile is not empty, any existing
 * file is moved to Logfile.old and log lines are also appended to Logfile. Returns false
 * if the log file could not be opened, in which case logging continues without it.
*/
bool StartLogging(const QString &Logfile, bool Console, LogLevel Level)
{
    bool result = true;

    {
        QMutexLocker locker(&gLoggerLock);
        if (gLogger)
            return true;

        gLogLevel = Level;
        gLogger   = new BeaconLogger(Console);
        if (!Logfile.isEmpty())
            result = gLogger->OpenFile(Logfile);
        gLogger->start();
    }

    LOG(VB_GENERAL, LOG_NOTICE, QString("Setting level to LOG_%1").arg(GetLogLevelName(gLogLevel).toUpper()));
    if (!Logfile.isEmpty())
    {
        if (result)
            LOG(VB_GENERAL, LOG_INFO, QString("Logging to '%1'").arg(Logfile));
        else
            LOG(VB_GENERAL, LOG_ERR, QString("Failed to open '%1' for logging").arg(Logfile));
    }

    return result;
}

/// Drain any queued lines and stop the logging thread.
void StopLogging(void)
{
    BeaconLogger *logger = NULL;
    {
        QMutexLocker locker(&gLoggerLock);
        logger  = gLogger;
        gLogger = NULL;
    }

    delete logger;
}

LogLevel GetLogLevel(const QString &Level)
{
    QString level = Level.toLower();
    if (level.startsWith("log_"))
        level = level.mid(4);

    for (int i = 0; gLevelDefs[i].name; ++i)
        if (level == gLevelDefs[i].name)
            return gLevelDefs[i].level;

    return LOG_UNKNOWN;
}

QString GetLogLevelName(LogLevel Level)
{
    for (int i = 0; gLevelDefs[i].name; ++i)
        if (gLevelDefs[i].level == Level)
            return QString(gLevelDefs[i].name);

    return QString("unknown");
}

static void VerboseHelp(void)
{
    fprintf(stderr, "Verbose debug levels.\n"
                    "Accepts any combination (separated by comma) of:\n\n");

    for (int i = 0; gVerboseDefs[i].name; ++i)
    {
        fprintf(stderr, "  %-15s - %s\n", gVerboseDefs[i].name, gVerboseDefs[i].help);
    }

    fprintf(stderr, "\nThe default is '-l general'.\n\n"
                    "Most options are additive except for 'none' and 'all'.\n"
                    "Additive options may be subtracted by prefixing them with 'no',\n"
                    "so '-l all,nosocket' shows everything except socket messages.\n\n");
}

/*! \brief Update the global verbose mask from a comma separated list of category names.
 *
 * Exit is set when 'help' was requested, in which case the category help has been printed.
 * Returns GENERIC_EXIT_INVALID_CMDLINE for an unknown category and leaves the mask untouched.
*/
int ParseVerboseArgument(const QString &Argument, bool &Exit)
{
    Exit = false;
    quint32 mask = VB_GENERAL;

    QStringList options = Argument.split(QRegExp("\\W+"), QString::SkipEmptyParts);
    foreach (QString option, options)
    {
        option = option.toLower();

        if (option == "help")
        {
            VerboseHelp();
            Exit = true;
            return GENERIC_EXIT_OK;
        }

        if (option == "default")
        {
            mask = VB_GENERAL;
            continue;
        }

        bool reverse = false;
        if (option != "none" && option.startsWith("no"))
        {
            reverse = true;
            option  = option.mid(2);
        }

        int index = -1;
        for (int i = 0; gVerboseDefs[i].name; ++i)
        {
            if (option == gVerboseDefs[i].name)
            {
                index = i;
                break;
            }
        }

        if (index < 0 || (reverse && !gVerboseDefs[index].additive))
        {
            fprintf(stderr, "Unknown argument for -l/--log: %s\n", option.toLocal8Bit().constData());
            return GENERIC_EXIT_INVALID_CMDLINE;
        }

        if (reverse)
            mask &= ~gVerboseDefs[index].mask;
        else if (gVerboseDefs[index].additive)
            mask |= gVerboseDefs[index].mask;
        else
            mask = gVerboseDefs[index].mask;
    }

    gVerboseMask = mask;
    return GENERIC_EXIT_OK;
}

/// A comma separated list of the categories enabled in the current verbose mask.
QString GetVerboseString(void)
{
    if (gVerboseMask == VB_NONE)
        return QString("none");
    if ((gVerboseMask & VB_ALL) == VB_ALL)
        return QString("all");

    QStringList names;
    for (int i = 0; gVerboseDefs[i].name; ++i)
        if (gVerboseDefs[i].additive && (gVerboseMask & gVerboseDefs[i].mask))
            names.append(gVerboseDefs[i].name);
    return names.join(",");
}
