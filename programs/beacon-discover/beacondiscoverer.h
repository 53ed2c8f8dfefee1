#ifndef BEACONDISCOVERER_H
#define BEACONDISCOVERER_H

// Qt
#include <QObject>

// Beacon
#include "upnp/beaconssdpdiscovereddevice.h"

class BeaconSSDPLocator;

class BeaconDiscoverer : public QObject
{
    Q_OBJECT

  public:
    BeaconDiscoverer(int InitialInterval, int Interval, int SlowDown);
    ~BeaconDiscoverer();

    void    Start            (void);

  protected slots:
    void    DeviceDiscovered (const BeaconSSDPDiscoveredDevice &Device);
    void    DeviceLeft       (const BeaconSSDPDiscoveredDevice &Device);
    void    SlowDown         (void);

  protected:
    bool    event            (QEvent *Event);

  private:
    BeaconSSDPLocator *m_locator;
    int                m_slowDown;
};

#endif // BEACONDISCOVERER_H
