#ifndef BEACONSSDPLOCATOR_H
#define BEACONSSDPLOCATOR_H

// Qt
#include <QList>
#include <QMutex>
#include <QObject>

// Beacon
#include "beaconcoreexport.h"
#include "beaconssdphandler.h"
#include "beaconssdpdiscovereddevice.h"

#define SSDP_SEARCH_ACTION   QString("M-SEARCH * HTTP/1.1")
#define SSDP_RESPONSE_ACTION QString("HTTP/1.1 200 OK")
#define SSDP_NOTIFY_ACTION   QString("NOTIFY")
#define SSDP_DISABLED        (-1)

class QTimer;
class BeaconSSDP;

class BEACON_CORE_PUBLIC BeaconSSDPLocator : public QObject, public BeaconSSDPHandler
{
    Q_OBJECT

  public:
    static int  SearchWaitToMX (int Seconds);

  public:
    explicit BeaconSSDPLocator(BeaconSSDP *Engine = NULL, QObject *Parent = NULL);
    virtual ~BeaconSSDPLocator();

    void        Start              (void);
    void        SlowDown           (void);
    void        Dispose            (void);
    bool        IsStarted          (void);
    int         GetInitialInterval (void);
    void        SetInitialInterval (int Seconds);
    int         GetInterval        (void);
    void        SetInterval        (int Seconds);
    void        SetGracePeriod     (int Milliseconds);
    QList<BeaconSSDPDiscoveredDevice> GetDevices (void);

    // BeaconSSDPHandler
    void        SSDPMessage        (const BeaconSSDPEventArgs &Args);

  signals:
    void        DeviceDiscovered   (const BeaconSSDPDiscoveredDevice &Device);
    void        DeviceLeft         (const BeaconSSDPDiscoveredDevice &Device);

  protected slots:
    void        ArmTimer           (int Milliseconds);
    void        StopTimer          (void);
    void        BroadcastTimeout   (void);

  private:
    int         CurrentPeriod      (void);
    void        BroadcastSearch    (void);
    void        RemoveExpiredDevices (void);
    void        AddOrUpdateDevice  (const BeaconSSDPDiscoveredDevice &Device);
    bool        DeviceDied         (const QString &Usn);
    int         FindExistingDevice (const BeaconSSDPDiscoveredDevice &Device);
    void        IncomingResponse   (const BeaconSSDPEventArgs &Args);
    void        IncomingNotification (const BeaconSSDPEventArgs &Args);

  private:
    BeaconSSDP                       *m_engine;
    QTimer                           *m_timer;

    QMutex                            m_timerLock;
    bool                              m_started;
    bool                              m_disposed;
    bool                              m_initial;
    int                               m_initialInterval;
    int                               m_interval;
    int                               m_gracePeriod;

    QMutex                            m_deviceLock;
    QList<BeaconSSDPDiscoveredDevice> m_devices;
};

#endif // BEACONSSDPLOCATOR_H
