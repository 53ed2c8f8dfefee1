#ifndef BEACONNETWORK_H
#define BEACONNETWORK_H

// Qt
#include <QObject>
#include <QReadWriteLock>
#include <QNetworkConfigurationManager>

// Beacon
#include "beaconcoreexport.h"
#include "beaconnetaddress.h"

class QMutex;

class BEACON_CORE_PUBLIC BeaconNetworkInfo
{
  public:
    enum IPClassType
    {
        IPv4AndIPv6,
        IPv4Only,
        IPv6Only
    };

  public:
    virtual ~BeaconNetworkInfo() {}

    virtual bool                    IsInLocalNetwork (const QHostAddress &Address) = 0;
    virtual IPClassType             GetIPClassType   (void) = 0;
    virtual QList<BeaconNetAddress> GetInterfaces    (void) = 0;
};

class BEACON_CORE_PUBLIC BeaconNetwork : public QObject, public BeaconNetworkInfo
{
    Q_OBJECT

  public:
    // Public API
    static void                    Setup           (bool Create);
    static bool                    IsAvailable     (void);
    static BeaconNetworkInfo*      GetNetworkInfo  (void);
    static QList<BeaconNetAddress> LocalInterfaces (void);

  public:
    BeaconNetwork();
    virtual ~BeaconNetwork();

    // BeaconNetworkInfo
    bool                    IsInLocalNetwork        (const QHostAddress &Address);
    IPClassType             GetIPClassType          (void);
    QList<BeaconNetAddress> GetInterfaces           (void);

  protected slots:
    // QNetworkConfigurationManager
    void    ConfigurationAdded      (const QNetworkConfiguration &Config);
    void    ConfigurationChanged    (const QNetworkConfiguration &Config);
    void    ConfigurationRemoved    (const QNetworkConfiguration &Config);
    void    OnlineStateChanged      (bool  Online);
    void    UpdateCompleted         (void);

  protected:
    bool    IsOnline                (void);
    void    UpdateConfiguration     (bool Creating = false);

  private:
    bool                          m_online;
    QNetworkConfigurationManager *m_manager;
    QReadWriteLock                m_interfacesLock;
    QList<BeaconNetAddress>       m_interfaces;
};

extern BEACON_CORE_PUBLIC BeaconNetwork *gNetwork;
extern BEACON_CORE_PUBLIC QMutex        *gNetworkLock;

#endif // BEACONNETWORK_H
