#ifndef BEACONSSDPSOCKET_H
#define BEACONSSDPSOCKET_H

// Qt
#include <QObject>
#include <QThread>
#include <QAtomicInt>
#include <QByteArray>
#include <QHostAddress>
#include <QAbstractSocket>

// Beacon
#include "beaconcoreexport.h"
#include "beaconnetaddress.h"

class QUdpSocket;

class BEACON_CORE_PUBLIC BeaconSSDPSocket : public QObject
{
    Q_OBJECT

  public:
    explicit BeaconSSDPSocket(QObject *Parent = NULL);
    virtual ~BeaconSSDPSocket();

    virtual QHostAddress LocalAddress (void) const = 0;
    virtual quint16      LocalPort    (void) const = 0;
    virtual bool         IsMulticast  (void) const = 0;
    virtual void         Send         (const QByteArray &Data, const QHostAddress &Address, quint16 Port, int Count) = 0;
    virtual void         Close        (void) = 0;
    virtual bool         Wait         (unsigned long Milliseconds);

  signals:
    void                 Received     (BeaconSSDPSocket *Socket, const QByteArray &Data, const QHostAddress &Address, quint16 Port);
    void                 Failed       (BeaconSSDPSocket *Socket, const QString &Error);
};

class BEACON_CORE_PUBLIC BeaconSSDPSocketFactory
{
  public:
    virtual ~BeaconSSDPSocketFactory() {}

    virtual BeaconSSDPSocket* Create (const BeaconNetAddress &Interface, quint16 Port,
                                      bool Multicast, bool ShareAddress) = 0;
};

class BeaconUdpSocketThread : public QThread
{
    Q_OBJECT

  public:
    explicit BeaconUdpSocketThread(const QString &Name);

  protected:
    void run    (void);
};

class BEACON_CORE_PUBLIC BeaconUdpSocket : public BeaconSSDPSocket
{
    Q_OBJECT

  public:
    BeaconUdpSocket(QUdpSocket *Socket, bool Multicast);
    virtual ~BeaconUdpSocket();

    QHostAddress         LocalAddress (void) const;
    quint16              LocalPort    (void) const;
    bool                 IsMulticast  (void) const;
    void                 Send         (const QByteArray &Data, const QHostAddress &Address, quint16 Port, int Count);
    void                 Close        (void);
    bool                 Wait         (unsigned long Milliseconds);

  protected slots:
    void                 SendPriv     (const QByteArray &Data, const QHostAddress &Address, quint16 Port, int Count);
    void                 ClosePriv    (void);
    void                 Read         (void);
    void                 Error        (QAbstractSocket::SocketError SocketError);

  private:
    QUdpSocket            *m_socket;
    bool                   m_multicast;
    QHostAddress           m_localAddress;
    quint16                m_localPort;
    BeaconUdpSocketThread *m_thread;
    QAtomicInt             m_closed;
};

class BEACON_CORE_PUBLIC BeaconUdpSocketFactory : public BeaconSSDPSocketFactory
{
  public:
    BeaconUdpSocketFactory();

    BeaconSSDPSocket*    Create       (const BeaconNetAddress &Interface, quint16 Port,
                                       bool Multicast, bool ShareAddress);
};

#endif // BEACONSSDPSOCKET_H
