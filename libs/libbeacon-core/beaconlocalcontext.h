#ifndef BEACONLOCALCONTEXT_H
#define BEACONLOCALCONTEXT_H

// Qt
#include <QMap>
#include <QObject>
#include <QString>
#include <QVariant>
#include <QReadWriteLock>

// Beacon
#include "beaconlocaldefs.h"
#include "beaconcoreexport.h"
#include "beaconevent.h"
#include "beaconcommandline.h"

class BeaconSettingsDB;

class BEACON_CORE_PUBLIC Beacon
{
  public:
    enum Actions
    {
        None = 0,
        Exit,
        // network
        NetworkAvailable = 6000,
        NetworkUnavailable,
        NetworkChanged,
        // service discovery
        ServiceDiscovered = 10000,
        ServiceWentAway
    };
};

class BEACON_CORE_PUBLIC BeaconLocalContext : public QObject, public BeaconObservable
{
    Q_OBJECT

  public:
    static int    Create      (BeaconCommandLine* CommandLine);
    static void   TearDown    (void);
    static void   NotifyEvent (int Event);

    QMap<QString,QString> GetSettings (const QString &Prefix);
    void                  SetSettings (const QMap<QString,QString> &Settings);
    QString               GetDatabaseName (void) const;

  private slots:
    void          StoreSettings (const QVariantMap &Settings);

  private:
    explicit BeaconLocalContext(BeaconCommandLine* CommandLine);
   ~BeaconLocalContext();

    bool          Init(void);

  private:
    QString                m_dbName;
    BeaconSettingsDB      *m_db;
    QMap<QString,QString>  m_settings;
    QReadWriteLock         m_settingsLock;
};

BEACON_CORE_PUBLIC QString GetBeaconConfigDir (void);

extern BEACON_CORE_PUBLIC BeaconLocalContext *gLocalContext;

#endif // BEACONLOCALCONTEXT_H
