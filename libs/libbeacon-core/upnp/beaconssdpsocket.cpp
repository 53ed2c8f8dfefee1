/* Class BeaconSSDPSocket
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
#include <QThread>
#include <QUdpSocket>
#include <QNetworkInterface>
#include <QCoreApplication>

// Beacon
#include "beaconlogging.h"
#include "beaconupnp.h"
#include "beaconssdpsocket.h"

/*! \class BeaconSSDPSocket
 *  \brief An abstract UDP endpoint used by the SSDP engine.
 *
 * Received datagrams are signalled with the sending address and port. A socket that can no longer
 * be used signals Failed. Once Close has been called the socket is responsible for its own deletion.
*/
BeaconSSDPSocket::BeaconSSDPSocket(QObject *Parent)
  : QObject(Parent)
{
}

BeaconSSDPSocket::~BeaconSSDPSocket()
{
}

/*! \brief Block until a closed socket can no longer signal Received.
 *
 * Must be called after Close and before control returns to the event loop.
*/
bool BeaconSSDPSocket::Wait(unsigned long Milliseconds)
{
    (void)Milliseconds;
    return true;
}

/*! \class BeaconUdpSocketThread
 *  \brief The named event loop thread owning a single BeaconUdpSocket.
 *
 * The thread name identifies the socket in log output.
*/
BeaconUdpSocketThread::BeaconUdpSocketThread(const QString &Name)
  : QThread()
{
    setObjectName(Name);
}

void BeaconUdpSocketThread::run(void)
{
    LOG(VB_SOCKET, LOG_DEBUG, "Socket thread starting");
    exec();
    LOG(VB_SOCKET, LOG_DEBUG, "Socket thread stopping");
}

/*! \class BeaconUdpSocket
 *  \brief A BeaconSSDPSocket wrapping a bound QUdpSocket.
 *
 * Each socket runs in its own thread, named after the local address and port. Datagrams are read
 * (and Received emitted) in that thread. Send and Close are queued to it and return immediately.
*/
BeaconUdpSocket::BeaconUdpSocket(QUdpSocket *Socket, bool Multicast)
  : BeaconSSDPSocket(),
    m_socket(Socket),
    m_multicast(Multicast),
    m_localAddress(Socket->localAddress()),
    m_localPort(Socket->localPort()),
    m_thread(NULL),
    m_closed(0)
{
    m_socket->setParent(this);

    connect(m_socket, SIGNAL(readyRead()), this, SLOT(Read()));
    connect(m_socket, SIGNAL(error(QAbstractSocket::SocketError)), this, SLOT(Error(QAbstractSocket::SocketError)));

    m_thread = new BeaconUdpSocketThread(QString("SSDP%1:%2").arg(m_localAddress.toString()).arg(m_localPort));
    connect(m_thread, SIGNAL(finished()), m_thread, SLOT(deleteLater()));
    moveToThread(m_thread);
    m_thread->start();
}

BeaconUdpSocket::~BeaconUdpSocket()
{
}

QHostAddress BeaconUdpSocket::LocalAddress(void) const
{
    return m_localAddress;
}

quint16 BeaconUdpSocket::LocalPort(void) const
{
    return m_localPort;
}

bool BeaconUdpSocket::IsMulticast(void) const
{
    return m_multicast;
}

void BeaconUdpSocket::Send(const QByteArray &Data, const QHostAddress &Address, quint16 Port, int Count)
{
    if (m_closed.load())
        return;

    QMetaObject::invokeMethod(this, "SendPriv", Qt::QueuedConnection, Q_ARG(QByteArray, Data),
                              Q_ARG(QHostAddress, Address), Q_ARG(quint16, Port), Q_ARG(int, Count));
}

void BeaconUdpSocket::Close(void)
{
    if (!m_closed.testAndSetOrdered(0, 1))
        return;

    QMetaObject::invokeMethod(this, "ClosePriv", Qt::QueuedConnection);
}

bool BeaconUdpSocket::Wait(unsigned long Milliseconds)
{
    if (QThread::currentThread() == m_thread)
        return false;
    return m_thread->wait(Milliseconds);
}

void BeaconUdpSocket::SendPriv(const QByteArray &Data, const QHostAddress &Address, quint16 Port, int Count)
{
    for (int i = 0; i < Count; ++i)
    {
        qint64 sent = m_socket->writeDatagram(Data, Address, Port);
        if (sent != Data.size())
        {
            LOG(VB_GENERAL, LOG_ERR, QString("Failed to send to %1:%2 from %3:%4 (%5)")
                .arg(Address.toString()).arg(Port).arg(m_localAddress.toString()).arg(m_localPort)
                .arg(m_socket->errorString()));
            return;
        }
    }
}

void BeaconUdpSocket::ClosePriv(void)
{
    LOG(VB_SOCKET, LOG_DEBUG, QString("Closing %1:%2").arg(m_localAddress.toString()).arg(m_localPort));
    m_socket->close();

    // hand ourselves back to the main thread for deletion before the socket thread exits
    if (QCoreApplication::instance())
        moveToThread(QCoreApplication::instance()->thread());
    deleteLater();
    m_thread->quit();
}

void BeaconUdpSocket::Read(void)
{
    while (m_socket->hasPendingDatagrams())
    {
        QByteArray datagram;
        QHostAddress address;
        quint16 port = 0;
        datagram.resize(m_socket->pendingDatagramSize());
        qint64 read = m_socket->readDatagram(datagram.data(), datagram.size(), &address, &port);
        if (read < 0)
            break;
        datagram.resize(read);

        if (!m_closed.load())
            emit Received(this, datagram, address, port);
    }
}

void BeaconUdpSocket::Error(QAbstractSocket::SocketError SocketError)
{
    // ICMP errors from previous sends are reported but do not invalidate the socket
    if (m_socket->state() == QAbstractSocket::BoundState)
    {
        LOG(VB_SOCKET, LOG_WARNING, QString("Socket %1:%2 error %3 (%4)").arg(m_localAddress.toString())
            .arg(m_localPort).arg(SocketError).arg(m_socket->errorString()));
        return;
    }

    emit Failed(this, m_socket->errorString());
}

static QNetworkInterface InterfaceForAddress(const QHostAddress &Address)
{
    QHostAddress address(Address);
    address.setScopeId(QString());

    QList<QNetworkInterface> interfaces = QNetworkInterface::allInterfaces();
    foreach (const QNetworkInterface &interface, interfaces)
    {
        QList<QNetworkAddressEntry> entries = interface.addressEntries();
        foreach (const QNetworkAddressEntry &entry, entries)
        {
            QHostAddress ip = entry.ip();
            ip.setScopeId(QString());
            if (ip == address)
                return interface;
        }
    }

    return QNetworkInterface();
}

/*! \class BeaconUdpSocketFactory
 *  \brief Creates bound QUdpSocket based SSDP sockets.
 *
 * A multicast socket binds the wildcard address of the interface's family on the given port and
 * joins the SSDP group on that interface. A unicast socket binds the interface address itself.
*/
BeaconUdpSocketFactory::BeaconUdpSocketFactory()
{
    qRegisterMetaType<QHostAddress>("QHostAddress");
}

BeaconSSDPSocket* BeaconUdpSocketFactory::Create(const BeaconNetAddress &Interface, quint16 Port,
                                                 bool Multicast, bool ShareAddress)
{
    QHostAddress address   = Interface.Address();
    bool ipv6              = Interface.IsIPv6();
    QNetworkInterface nic  = InterfaceForAddress(address);
    QHostAddress bindto    = Multicast ? QHostAddress(ipv6 ? QHostAddress::AnyIPv6 : QHostAddress::AnyIPv4) : address;
    QAbstractSocket::BindMode mode = ShareAddress ? (QAbstractSocket::ShareAddress | QAbstractSocket::ReuseAddressHint)
                                                  : QAbstractSocket::BindMode(QAbstractSocket::DefaultForPlatform);

    QUdpSocket *socket = new QUdpSocket();
    if (!socket->bind(bindto, Port, mode))
    {
        LOG(VB_GENERAL, LOG_ERR, QString("Failed to bind %1 SSDP %2 socket on %3:%4 (%5)")
            .arg(ipv6 ? "IPv6" : "IPv4").arg(Multicast ? "multicast" : "unicast")
            .arg(bindto.toString()).arg(Port).arg(socket->errorString()));
        delete socket;
        return NULL;
    }

    if (Multicast)
    {
        QHostAddress group(ipv6 ? (Interface.IsLinkLocal() ? SSDP_IPV6_LINKLOCAL : SSDP_IPV6_SITELOCAL) : SSDP_IPV4_MULTICAST);
        bool joined = nic.isValid() ? socket->joinMulticastGroup(group, nic) : socket->joinMulticastGroup(group);
        if (!joined)
        {
            LOG(VB_GENERAL, LOG_ERR, QString("Failed to join multicast group %1 on %2 (%3)")
                .arg(group.toString()).arg(address.toString()).arg(socket->errorString()));
            delete socket;
            return NULL;
        }
    }
    else
    {
        socket->setSocketOption(QAbstractSocket::MulticastTtlOption, 4);
        socket->setSocketOption(QAbstractSocket::MulticastLoopbackOption, 1);
        if (nic.isValid())
            socket->setMulticastInterface(nic);
    }

    LOG(VB_SOCKET, LOG_INFO, QString("SSDP %1 socket %2:%3 (%4)").arg(Multicast ? "multicast" : "unicast")
        .arg(socket->localAddress().toString()).arg(socket->localPort()).arg(address.toString()));
    return new BeaconUdpSocket(socket, Multicast);
}
