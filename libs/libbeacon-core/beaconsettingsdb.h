#ifndef BEACONSETTINGSDB_H
#define BEACONSETTINGSDB_H

// Qt
#include <QMap>
#include <QString>

// Beacon
#include "beaconcoreexport.h"

class QSqlQuery;
class QSqlDatabase;

class BEACON_CORE_PUBLIC BeaconSettingsDB
{
  public:
    explicit BeaconSettingsDB(const QString &DatabaseName);
    ~BeaconSettingsDB();

    bool                  Open      (void);
    bool                  IsOpen    (void) const;
    QString               GetName   (void) const;
    QMap<QString,QString> Load      (void);
    bool                  Store     (const QMap<QString,QString> &Settings);

  private:
    static bool           DebugError(const QSqlQuery &Query);
    static bool           DebugError(const QSqlDatabase &Database);

  private:
    QString m_databaseName;
    QString m_connectionName;
    bool    m_open;
};

#endif // BEACONSETTINGSDB_H
