#ifndef BEACONSSDPHANDLER_H
#define BEACONSSDPHANDLER_H

// Qt
#include <QString>
#include <QHostAddress>

// Beacon
#include "beaconcoreexport.h"
#include "beaconssdpmessage.h"

class BEACON_CORE_PUBLIC BeaconSSDPEventArgs
{
  public:
    BeaconSSDPEventArgs();
    BeaconSSDPEventArgs(const QString &Action, const BeaconSSDPHeaders &Headers, const QHostAddress &Address,
                        quint16 Port, const QHostAddress &LocalAddress);

    QString            Action       (void) const;
    BeaconSSDPHeaders  Headers      (void) const;
    QHostAddress       Address      (void) const;
    quint16            Port         (void) const;
    void               SetPort      (quint16 Port);
    QHostAddress       LocalAddress (void) const;

  private:
    QString            m_action;
    BeaconSSDPHeaders  m_headers;
    QHostAddress       m_address;
    quint16            m_port;
    QHostAddress       m_localAddress;
};

class BEACON_CORE_PUBLIC BeaconSSDPHandler
{
  public:
    virtual ~BeaconSSDPHandler() {}

    virtual void SSDPMessage (const BeaconSSDPEventArgs &Args) = 0;
};

#endif // BEACONSSDPHANDLER_H
