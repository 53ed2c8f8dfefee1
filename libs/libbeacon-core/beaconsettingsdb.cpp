/* Class BeaconSettingsDB
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

// Qt
#include <QtSql>

// Beacon
#include "beaconlogging.h"
#include "beaconlocaldefs.h"
#include "beaconsettingsdb.h"

/*! \class BeaconSettingsDB
 *  \brief SQLite storage for name/value settings.
 *
 * The database holds a single table, settings, keyed on the setting name. A row named
 * DB_DateCreated records when the table was first created.
 *
 * QSql connections may only be used from the thread that created them, so each instance
 * owns one named connection and must only be used from the thread that called Open.
 *
 * \sa BeaconLocalContext
*/
BeaconSettingsDB::BeaconSettingsDB(const QString &DatabaseName)
  : m_databaseName(DatabaseName),
    m_connectionName(QString("beacon-settings-%1").arg((quintptr)this)),
    m_open(false)
{
}

BeaconSettingsDB::~BeaconSettingsDB()
{
    if (QSqlDatabase::contains(m_connectionName))
    {
        {
            QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
            db.close();
        }
        QSqlDatabase::removeDatabase(m_connectionName);
        LOG(VB_DATABASE, LOG_INFO, QString("Removed connection '%1'").arg(m_connectionName));
    }
}

QString BeaconSettingsDB::GetName(void) const
{
    return m_databaseName;
}

bool BeaconSettingsDB::IsOpen(void) const
{
    return m_open;
}

/// Log database errors following a failed query. Returns true if an error was present.
bool BeaconSettingsDB::DebugError(const QSqlQuery &Query)
{
    QSqlError error = Query.lastError();
    if (error.type() == QSqlError::NoError)
        return false;

    if (!error.databaseText().isEmpty())
        LOG(VB_GENERAL, LOG_ERR, QString("Database Error: %1").arg(error.databaseText()));
    else if (!error.driverText().isEmpty())
        LOG(VB_GENERAL, LOG_ERR, QString("Driver Error: %1").arg(error.driverText()));
    return true;
}

bool BeaconSettingsDB::DebugError(const QSqlDatabase &Database)
{
    QSqlError error = Database.lastError();
    if (error.type() == QSqlError::NoError)
        return false;

    if (!error.databaseText().isEmpty())
        LOG(VB_GENERAL, LOG_ERR, QString("Database Error: %1").arg(error.databaseText()));
    else if (!error.driverText().isEmpty())
        LOG(VB_GENERAL, LOG_ERR, QString("Driver Error: %1").arg(error.driverText()));
    return true;
}

/*! \brief Open (creating if necessary) the database and the settings table.
 *
 * The database is opened in exclusive locking mode so that a second instance using the
 * same file fails here rather than silently losing writes.
*/
bool BeaconSettingsDB::Open(void)
{
    if (m_open)
        return true;

    LOG(VB_GENERAL, LOG_INFO, QString("Attempting to open '%1'").arg(m_databaseName));

    if (!QSqlDatabase::isDriverAvailable("QSQLITE"))
    {
        LOG(VB_GENERAL, LOG_ERR, "QSQLITE driver is not available");
        return false;
    }

    QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", m_connectionName);
    db.setConnectOptions("QSQLITE_BUSY_TIMEOUT=1");
    db.setDatabaseName(m_databaseName);

    if (!db.open())
    {
        DebugError(db);
        LOG(VB_GENERAL, LOG_ERR, QString("Failed to open database '%1'").arg(m_databaseName));
        return false;
    }

    QSqlQuery query(db);

    if (!query.exec("PRAGMA locking_mode = EXCLUSIVE"))
    {
        DebugError(query);
        return false;
    }

    if (!query.exec("CREATE TABLE IF NOT EXISTS settings "
                    "( name VARCHAR(128) PRIMARY KEY NOT NULL,"
                    "  value VARCHAR(16000) NOT NULL );"))
    {
        DebugError(query);
        return false;
    }

    query.prepare("SELECT value FROM settings WHERE name=:NAME;");
    query.bindValue(":NAME", BEACON_DB + "DateCreated");
    if (!query.exec())
    {
        DebugError(query);
        return false;
    }

    if (query.first())
    {
        LOG(VB_DATABASE, LOG_INFO, QString("Settings table was created on %1").arg(query.value(0).toString()));
    }
    else
    {
        LOG(VB_GENERAL, LOG_INFO, "Initialising settings table");
        query.prepare("INSERT INTO settings (name, value) VALUES (:NAME, :VALUE);");
        query.bindValue(":NAME",  BEACON_DB + "DateCreated");
        query.bindValue(":VALUE", QDateTime::currentDateTime().toUTC().toString(Qt::ISODate));
        if (!query.exec())
        {
            DebugError(query);
            return false;
        }
    }

    query.exec("PRAGMA temp_store = MEMORY");
    DebugError(query);

    m_open = true;
    return true;
}

/// Retrieve all stored settings.
QMap<QString,QString> BeaconSettingsDB::Load(void)
{
    QMap<QString,QString> result;
    if (!m_open)
        return result;

    QSqlDatabase db = QSqlDatabase::database(m_connectionName);
    QSqlQuery query(db);
    if (!query.exec("SELECT name, value FROM settings;"))
    {
        DebugError(query);
        return result;
    }

    while (query.next())
    {
        LOG(VB_DATABASE, LOG_DEBUG, QString("'%1' : '%2'").arg(query.value(0).toString()).arg(query.value(1).toString()));
        result.insert(query.value(0).toString(), query.value(1).toString());
    }

    return result;
}

/*! \brief Insert or replace the given settings in a single transaction.
 *
 * Either every setting is stored or none is. Empty names are rejected.
*/
bool BeaconSettingsDB::Store(const QMap<QString,QString> &Settings)
{
    if (!m_open)
    {
        LOG(VB_GENERAL, LOG_ERR, "Settings database is not open");
        return false;
    }

    if (Settings.isEmpty())
        return true;

    QSqlDatabase db = QSqlDatabase::database(m_connectionName);
    if (!db.transaction())
    {
        DebugError(db);
        return false;
    }

    QSqlQuery query(db);
    query.prepare("INSERT OR REPLACE INTO settings (name, value) VALUES (:NAME, :VALUE);");

    QMap<QString,QString>::const_iterator it = Settings.constBegin();
    for ( ; it != Settings.constEnd(); ++it)
    {
        bool ok = !it.key().isEmpty();
        if (ok)
        {
            query.bindValue(":NAME",  it.key());
            query.bindValue(":VALUE", it.value());
            ok = query.exec();
        }

        if (!ok)
        {
            if (it.key().isEmpty())
                LOG(VB_GENERAL, LOG_ERR, "Refusing to store a setting with no name");
            else
                DebugError(query);
            if (!db.rollback())
                DebugError(db);
            return false;
        }

        LOG(VB_DATABASE, LOG_DEBUG, QString("Stored '%1' : '%2'").arg(it.key()).arg(it.value()));
    }

    if (!db.commit())
    {
        DebugError(db);
        return false;
    }

    return true;
}
