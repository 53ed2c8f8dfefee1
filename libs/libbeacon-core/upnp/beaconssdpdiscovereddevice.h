#ifndef BEACONSSDPDISCOVEREDDEVICE_H
#define BEACONSSDPDISCOVEREDDEVICE_H

// Qt
#include <QString>
#include <QMetaType>
#include <QHostAddress>

// Beacon
#include "beaconcoreexport.h"
#include "beaconssdpmessage.h"

class BEACON_CORE_PUBLIC BeaconSSDPDiscoveredDevice
{
  public:
    static qint64     ParseCacheLifetime (const QString &CacheControl);

  public:
    BeaconSSDPDiscoveredDevice();
    BeaconSSDPDiscoveredDevice(qint64 ReceivedAt, const QString &NTHeader, const BeaconSSDPHeaders &Headers,
                               const QHostAddress &Address, quint16 Port);

    bool              IsValid          (void) const;
    QString           NotificationType (void) const;
    QString           Usn              (void) const;
    QString           RawUsn           (void) const;
    QString           Location         (void) const;
    QHostAddress      Address          (void) const;
    quint16           Port             (void) const;
    BeaconSSDPHeaders Headers          (void) const;
    qint64            CacheLifetime    (void) const;
    qint64            ReceivedAt       (void) const;
    bool              IsExpired        (qint64 Now) const;
    bool              IsExpired        (void) const;
    QString           ToString         (void) const;

  private:
    bool              m_valid;
    QString           m_notificationType;
    QString           m_usn;
    QString           m_rawUsn;
    QString           m_location;
    QHostAddress      m_address;
    quint16           m_port;
    BeaconSSDPHeaders m_headers;
    qint64            m_cacheLifetime;
    qint64            m_receivedAt;
};

Q_DECLARE_METATYPE(BeaconSSDPDiscoveredDevice)

#endif // BEACONSSDPDISCOVEREDDEVICE_H
