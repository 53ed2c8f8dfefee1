/* Class BeaconLocalContext
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
#include <signal.h>

// Qt
#include <QCoreApplication>
#include <QDir>

// Beacon
#include "beaconversion.h"
#include "beaconlogging.h"
#include "beaconexitcodes.h"
#include "beaconsettingsdb.h"
#include "beaconnetwork.h"
#include "beaconlocalcontext.h"

BeaconLocalContext *gLocalContext = NULL;

static void ExitHandler(int Sig)
{
    signal(SIGINT, SIG_DFL);
    LOG(VB_GENERAL, LOG_INFO, QString("Received %1").arg(Sig == SIGINT ? "SIGINT" : "SIGTERM"));

    BeaconLocalContext::NotifyEvent(Beacon::Exit);
}

/// \brief Return the path to the application configuration directory (~/.beacon).
QString GetBeaconConfigDir(void)
{
    return QDir::homePath() + "/.beacon";
}

/*! \brief Create the global local context.
 *
 * Starts logging (as configured by CommandLine), opens the settings database and starts
 * network monitoring. Returns GENERIC_EXIT_NO_CONTEXT if the database cannot be opened.
*/
int BeaconLocalContext::Create(BeaconCommandLine* CommandLine)
{
    if (gLocalContext)
        return GENERIC_EXIT_OK;

    gLocalContext = new BeaconLocalContext(CommandLine);
    if (gLocalContext->Init())
        return GENERIC_EXIT_OK;

    TearDown();
    return GENERIC_EXIT_NO_CONTEXT;
}

void BeaconLocalContext::TearDown(void)
{
    delete gLocalContext;
    gLocalContext = NULL;
}

/// Send Event (one of Beacon::Actions) to every registered observer.
void BeaconLocalContext::NotifyEvent(int Event)
{
    BeaconEvent event(Event);
    if (gLocalContext)
        gLocalContext->Notify(event);
}

/*! \class BeaconLocalContext
 *  \brief BeaconLocalContext is the core Beacon object.
 *
 * It starts logging, owns the settings persisted in the SQLite settings database, starts
 * network monitoring and distributes application wide events (Beacon::Actions) to
 * registered observers.
 *
 * Settings are cached in memory and may be read and written from any thread. Writes
 * are applied to the cache immediately and stored in the database from the context's
 * own thread, since a QSql connection may only be used by the thread that opened it.
*/
BeaconLocalContext::BeaconLocalContext(BeaconCommandLine* CommandLine)
  : QObject(),
    m_dbName(),
    m_db(NULL),
    m_settingsLock(QReadWriteLock::Recursive)
{
    setObjectName("LocalContext");

    signal(SIGINT,  ExitHandler);
    signal(SIGTERM, ExitHandler);

    QString logfile;
    LogLevel level = LOG_INFO;
    if (CommandLine)
    {
        logfile  = CommandLine->GetValue("logfile").toString();
        m_dbName = CommandLine->GetValue("db").toString();
        LogLevel requested = GetLogLevel(CommandLine->GetValue("v").toString());
        if (requested != LOG_UNKNOWN)
            level = requested;
    }

    StartLogging(logfile, true, level);

    LOG(VB_GENERAL, LOG_INFO, QString("Dir: Using '%1'").arg(GetBeaconConfigDir()));
    LOG(VB_GENERAL, LOG_CRIT, QString("%1 version: %2 [%3]")
        .arg(QCoreApplication::applicationName()).arg(BEACON_SOURCE_PATH).arg(BEACON_SOURCE_VERSION));
    LOG(VB_GENERAL, LOG_NOTICE, QString("Enabled verbose msgs: %1").arg(GetVerboseString()));
}

BeaconLocalContext::~BeaconLocalContext()
{
    BeaconNetwork::Setup(false);

    delete m_db;
    m_db = NULL;

    StopLogging();
}

bool BeaconLocalContext::Init(void)
{
    if (m_dbName.isEmpty())
    {
        QString configdir = GetBeaconConfigDir();
        QDir dir(configdir);
        if (!dir.exists() && !dir.mkpath(configdir))
        {
            LOG(VB_GENERAL, LOG_ERR, QString("Failed to create config directory ('%1')").arg(configdir));
            return false;
        }

        m_dbName = configdir + "/" + QCoreApplication::applicationName() + "-settings.sqlite";
    }

    m_db = new BeaconSettingsDB(m_dbName);
    if (!m_db->Open())
        return false;

    {
        QWriteLocker locker(&m_settingsLock);
        m_settings = m_db->Load();
    }

    LOG(VB_GENERAL, LOG_INFO, QString("Qt runtime version '%1' (compiled with '%2')")
        .arg(qVersion()).arg(QT_VERSION_STR));

    BeaconNetwork::Setup(true);
    return true;
}

QString BeaconLocalContext::GetDatabaseName(void) const
{
    return m_dbName;
}

/// Return every cached setting whose name starts with Prefix.
QMap<QString,QString> BeaconLocalContext::GetSettings(const QString &Prefix)
{
    QMap<QString,QString> result;

    QReadLocker locker(&m_settingsLock);
    QMap<QString,QString>::const_iterator it = m_settings.lowerBound(Prefix);
    for ( ; it != m_settings.constEnd() && it.key().startsWith(Prefix); ++it)
        result.insert(it.key(), it.value());
    return result;
}

/// Update the cache and queue the settings for storage in the database.
void BeaconLocalContext::SetSettings(const QMap<QString,QString> &Settings)
{
    if (Settings.isEmpty())
        return;

    QVariantMap store;
    {
        QWriteLocker locker(&m_settingsLock);
        QMap<QString,QString>::const_iterator it = Settings.constBegin();
        for ( ; it != Settings.constEnd(); ++it)
        {
            m_settings.insert(it.key(), it.value());
            store.insert(it.key(), it.value());
        }
    }

    QMetaObject::invokeMethod(this, "StoreSettings", Qt::AutoConnection, Q_ARG(QVariantMap, store));
}

void BeaconLocalContext::StoreSettings(const QVariantMap &Settings)
{
    if (!m_db)
        return;

    QMap<QString,QString> settings;
    QVariantMap::const_iterator it = Settings.constBegin();
    for ( ; it != Settings.constEnd(); ++it)
        settings.insert(it.key(), it.value().toString());

    if (!m_db->Store(settings))
        LOG(VB_GENERAL, LOG_ERR, QString("Failed to store %1 settings in '%2'").arg(settings.size()).arg(m_dbName));
}
