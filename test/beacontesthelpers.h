#ifndef BEACONTESTHELPERS_H
#define BEACONTESTHELPERS_H

// Std
#include <stdexcept>

// Qt
#include <QSet>
#include <QList>
#include <QMutex>
#include <QTimer>
#include <QThread>
#include <QAtomicInt>
#include <QObject>
#include <QEventLoop>
#include <QCoreApplication>

// Beacon
#include "beaconnetwork.h"
#include "beaconnetaddress.h"
#include "upnp/beaconssdp.h"
#include "upnp/beaconssdpsocket.h"
#include "upnp/beaconssdphandler.h"
#include "upnp/beaconssdpdiscovereddevice.h"

class FakeSocketFactory;

class SentDatagram
{
  public:
    QByteArray   m_data;
    QHostAddress m_from;
    quint16      m_fromPort;
    QHostAddress m_to;
    quint16      m_toPort;
    int          m_count;
};

class FakeSocket : public BeaconSSDPSocket
{
    Q_OBJECT

  public:
    FakeSocket(FakeSocketFactory *Factory, const QHostAddress &Address, quint16 Port, bool Multicast);

    QHostAddress LocalAddress (void) const { return m_address;   }
    quint16      LocalPort    (void) const { return m_port;      }
    bool         IsMulticast  (void) const { return m_multicast; }
    void         Send         (const QByteArray &Data, const QHostAddress &Address, quint16 Port, int Count);
    void         Close        (void);
    bool         Wait         (unsigned long Milliseconds)
    {
        (void)Milliseconds;
        QMutexLocker locker(&m_injectLock);
        return true;
    }

    // may be called from any thread until the socket is deleted
    void         Inject       (const QByteArray &Data, const QHostAddress &Address, quint16 Port)
    {
        QMutexLocker locker(&m_injectLock);
        if (!m_closed.load())
            emit Received(this, Data, Address, Port);
    }

    void         Fail         (const QString &Error)
    {
        emit Failed(this, Error);
    }

  private:
    FakeSocketFactory *m_factory;
    QHostAddress       m_address;
    quint16            m_port;
    bool               m_multicast;
    QMutex             m_injectLock;
    QAtomicInt         m_closed;
};

class FakeSocketFactory : public BeaconSSDPSocketFactory
{
  public:
    FakeSocketFactory() : m_created(0) { }

    BeaconSSDPSocket* Create(const BeaconNetAddress &Interface, quint16 Port, bool Multicast, bool ShareAddress)
    {
        (void)ShareAddress;
        if (m_failing.contains(Interface.Address().toString()))
            return NULL;

        QHostAddress local = Interface.Address();
        if (Multicast)
            local = QHostAddress(Interface.IsIPv6() ? QHostAddress::AnyIPv6 : QHostAddress::AnyIPv4);

        FakeSocket *socket = new FakeSocket(this, local, Port, Multicast);
        m_open.append(socket);
        m_created++;
        return socket;
    }

    FakeSocket* Listener(void)
    {
        foreach (FakeSocket *socket, m_open)
            if (socket->IsMulticast())
                return socket;
        return NULL;
    }

    FakeSocket* Sender(const QHostAddress &Address)
    {
        foreach (FakeSocket *socket, m_open)
            if (!socket->IsMulticast() && socket->LocalAddress() == Address)
                return socket;
        return NULL;
    }

    int SentContaining(const QByteArray &Text)
    {
        int result = 0;
        foreach (const SentDatagram &datagram, m_sent)
            if (datagram.m_data.contains(Text))
                result++;
        return result;
    }

    QList<FakeSocket*>  m_open;
    QList<SentDatagram> m_sent;
    QSet<QString>       m_failing;
    int                 m_created;
};

inline FakeSocket::FakeSocket(FakeSocketFactory *Factory, const QHostAddress &Address, quint16 Port, bool Multicast)
  : BeaconSSDPSocket(),
    m_factory(Factory),
    m_address(Address),
    m_port(Port),
    m_multicast(Multicast),
    m_injectLock(QMutex::Recursive),
    m_closed(0)
{
}

inline void FakeSocket::Send(const QByteArray &Data, const QHostAddress &Address, quint16 Port, int Count)
{
    SentDatagram datagram;
    datagram.m_data     = Data;
    datagram.m_from     = m_address;
    datagram.m_fromPort = m_port;
    datagram.m_to       = Address;
    datagram.m_toPort   = Port;
    datagram.m_count    = Count;
    m_factory->m_sent.append(datagram);
}

inline void FakeSocket::Close(void)
{
    m_closed.store(1);
    m_factory->m_open.removeAll(this);
    deleteLater();
}

class FakeNetworkInfo : public BeaconNetworkInfo
{
  public:
    explicit FakeNetworkInfo(const QList<BeaconNetAddress> &Interfaces)
      : m_interfaces(Interfaces),
        m_class(IPv4AndIPv6)
    {
    }

    bool IsInLocalNetwork(const QHostAddress &Address)
    {
        if (Address.isLoopback())
            return true;
        foreach (const BeaconNetAddress &interface, m_interfaces)
            if (interface.Contains(Address))
                return true;
        return false;
    }

    IPClassType             GetIPClassType (void) { return m_class;      }
    QList<BeaconNetAddress> GetInterfaces  (void) { return m_interfaces; }

    QList<BeaconNetAddress> m_interfaces;
    IPClassType             m_class;
};

class RecordingHandler : public BeaconSSDPHandler
{
  public:
    void SSDPMessage(const BeaconSSDPEventArgs &Args)
    {
        m_received.append(Args);
    }

    QList<BeaconSSDPEventArgs> m_received;
};

class ThrowingHandler : public BeaconSSDPHandler
{
  public:
    void SSDPMessage(const BeaconSSDPEventArgs &Args)
    {
        throw std::runtime_error(Args.Action().toStdString());
    }
};

/// \brief Counts calls and notes any that finish after m_removed is set.
class SlowHandler : public BeaconSSDPHandler
{
  public:
    SlowHandler() : m_removed(0), m_calls(0), m_callsAfterRemoval(0) { }

    void SSDPMessage(const BeaconSSDPEventArgs &Args)
    {
        (void)Args;
        m_calls.ref();
        QThread::msleep(2);
        if (m_removed.load())
            m_callsAfterRemoval.ref();
    }

    QAtomicInt m_removed;
    QAtomicInt m_calls;
    QAtomicInt m_callsAfterRemoval;
};

/// \brief Injects the same datagram into a socket until stopped.
class InjectingThread : public QThread
{
  public:
    InjectingThread(FakeSocket *Socket, const QByteArray &Data, const QHostAddress &Address, quint16 Port)
      : QThread(),
        m_injected(0),
        m_socket(Socket),
        m_data(Data),
        m_address(Address),
        m_port(Port),
        m_stop(0)
    {
    }

   ~InjectingThread()
    {
        Stop();
    }

    void Stop(void)
    {
        m_stop.store(1);
        wait();
    }

    QAtomicInt m_injected;

  protected:
    void run(void)
    {
        while (!m_stop.load())
        {
            m_socket->Inject(m_data, m_address, m_port);
            m_injected.ref();
        }
    }

  private:
    FakeSocket   *m_socket;
    QByteArray    m_data;
    QHostAddress  m_address;
    quint16       m_port;
    QAtomicInt    m_stop;
};

/// \brief Sleep until Counter reaches Target, for at most Milliseconds.
inline bool WaitForCount(const QAtomicInt &Counter, int Target, int Milliseconds = 5000)
{
    for (int i = 0; i < Milliseconds && Counter.load() < Target; ++i)
        QThread::msleep(1);
    return Counter.load() >= Target;
}

class SignalRecorder : public QObject
{
    Q_OBJECT

  public:
    SignalRecorder() : QObject(), m_started(0), m_stopped(0) { }

    QList<BeaconSSDPDiscoveredDevice> m_discovered;
    QList<BeaconSSDPDiscoveredDevice> m_left;
    int                               m_started;
    int                               m_stopped;

  public slots:
    void DeviceDiscovered (const BeaconSSDPDiscoveredDevice &Device) { m_discovered.append(Device); }
    void DeviceLeft       (const BeaconSSDPDiscoveredDevice &Device) { m_left.append(Device);       }
    void Started          (void)                                     { m_started++;                 }
    void Stopped          (void)                                     { m_stopped++;                 }
};

/// \brief Run the event loop for Milliseconds.
inline void WaitFor(int Milliseconds)
{
    QEventLoop loop;
    QTimer::singleShot(Milliseconds, &loop, SLOT(quit()));
    loop.exec();
}

inline void DeletePendingObjects(void)
{
    QCoreApplication::sendPostedEvents(NULL, QEvent::DeferredDelete);
}

#endif // BEACONTESTHELPERS_H
