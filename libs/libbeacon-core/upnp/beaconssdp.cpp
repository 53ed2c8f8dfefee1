/* Class BeaconSSDP
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

// Std
#include <stdexcept>

// Qt
#include <QTimer>
#include <QThread>

// Beacon
#include "beaconlocalcontext.h"
#include "beaconlogging.h"
#include "beaconupnp.h"
#include "beaconssdp.h"

#define SSDP_CLOSE_TIMEOUT 5000

BeaconSSDP* gSSDP = NULL;
QMutex*     gSSDPLock = new QMutex(QMutex::Recursive);

static bool SameHost(const QHostAddress &First, const QHostAddress &Second)
{
    QHostAddress first  = BeaconNetAddress::Normalise(First);
    QHostAddress second = BeaconNetAddress::Normalise(Second);
    first.setScopeId(QString());
    second.setScopeId(QString());
    return first == second;
}

/*! \class BeaconSSDP
 *  \brief The Simple Service Discovery Protocol engine.
 *
 * BeaconSSDP owns a multicast listener (bound to port 1900) and a unicast sender (bound to a port chosen
 * from the configured range) for every network interface it is asked to use. Inbound messages are parsed
 * and passed to the BeaconSSDPHandler objects registered for the message's action (e.g. 'NOTIFY' or
 * 'HTTP/1.1 200 OK').
 *
 * The engine starts when the first handler is added and stops when the last is removed. Network changes
 * are coalesced and restart the engine once, incrementing the CONFIGID.UPNP.ORG value.
 *
 * Inbound messages are processed in the thread of the socket that received them, so handlers must be
 * thread safe and should return quickly. Once RemoveHandler returns (when called from outside a handler)
 * the handler is not called again and no call to it is in progress, so it may be deleted.
 *
 * \note There is a single instance per process. Use GetOrCreateInstance to create it (or update the
 *       interfaces of the existing instance) and GetInstance thereafter.
*/

/*! \brief Return the engine, creating it if necessary.
 *
 * An empty Interfaces list uses every multicast capable interface reported by NetworkInfo, and follows
 * changes to those interfaces. NetworkInfo defaults to the host network monitor and Factory to
 * a BeaconUdpSocketFactory. Calling this for an existing instance only updates its interfaces.
*/
BeaconSSDP* BeaconSSDP::GetOrCreateInstance(const QList<BeaconNetAddress> &Interfaces,
                                            BeaconNetworkInfo *NetworkInfo, BeaconSSDPSocketFactory *Factory)
{
    QMutexLocker locker(gSSDPLock);

    if (!gSSDP)
    {
        gSSDP = new BeaconSSDP(Interfaces, NetworkInfo ? NetworkInfo : BeaconNetwork::GetNetworkInfo(), Factory);
        return gSSDP;
    }

    gSSDP->UpdateInterfaces(Interfaces);
    return gSSDP;
}

/// \throws std::logic_error if the engine has not been created.
BeaconSSDP* BeaconSSDP::GetInstance(void)
{
    QMutexLocker locker(gSSDPLock);

    if (!gSSDP)
        throw std::logic_error("SSDP engine has not been created");
    return gSSDP;
}

/*! \brief Destroy the engine.
 *
 * Sockets are closed and their threads waited for, and any message still being dispatched is allowed
 * to finish, before the engine is deleted.
*/
void BeaconSSDP::TearDown(void)
{
    BeaconSSDP *ssdp = NULL;

    {
        QMutexLocker locker(gSSDPLock);
        ssdp  = gSSDP;
        gSSDP = NULL;
    }

    delete ssdp;
}

BeaconSSDP::BeaconSSDP(const QList<BeaconNetAddress> &Interfaces, BeaconNetworkInfo *NetworkInfo,
                       BeaconSSDPSocketFactory *Factory)
  : QObject(),
    m_networkInfo(NetworkInfo),
    m_factory(Factory),
    m_ownsFactory(false),
    m_handlerLock(),
    m_dispatchSequence(0),
    m_lock(),
    m_running(false),
    m_interfaces(Interfaces),
    m_configuration(BeaconSSDPConfiguration::Load()),
    m_bootId(1),
    m_nextBootId(2),
    m_configId(1),
    m_networkChangePending(false),
    m_networkChangeTimer(new QTimer(this))
{
    qRegisterMetaType<BeaconSSDPSocket*>("BeaconSSDPSocket*");

    if (!m_factory)
    {
        m_factory = new BeaconUdpSocketFactory();
        m_ownsFactory = true;
    }

    m_networkChangeTimer->setSingleShot(true);
    m_networkChangeTimer->setInterval(2000);
    connect(m_networkChangeTimer, SIGNAL(timeout()), this, SLOT(NetworkChangeTimeout()));

    {
        QWriteLocker locker(&m_lock);
        ValidateConfiguration();
    }

    if (gLocalContext)
        gLocalContext->AddObserver(this);
}

BeaconSSDP::~BeaconSSDP()
{
    if (gLocalContext)
        gLocalContext->RemoveObserver(this);

    {
        QMutexLocker locker(&m_handlerLock);
        m_handlers.clear();
        WaitForDispatchPriv();
    }

    Stop();

    {
        QMutexLocker locker(&m_handlerLock);
        WaitForDispatchPriv();
    }

    if (m_ownsFactory)
        delete m_factory;
    m_factory = NULL;
}

/*! \brief Register Handler for messages with the given Action.
 *
 * Adding the same handler twice for an action has no effect. The engine is started if necessary.
*/
void BeaconSSDP::AddHandler(const QString &Action, BeaconSSDPHandler *Handler)
{
    if (!Handler)
        return;

    {
        QMutexLocker locker(&m_handlerLock);
        QList<BeaconSSDPHandler*> &handlers = m_handlers[Action];
        if (!handlers.contains(Handler))
            handlers.append(Handler);
    }

    Start();
}

/*! \brief Deregister Handler for Action. The engine is stopped when no handlers remain.
 *
 * Blocks until messages already being dispatched on other threads have been handled. When called from
 * within a handler it returns without waiting.
*/
void BeaconSSDP::RemoveHandler(const QString &Action, BeaconSSDPHandler *Handler)
{
    bool empty = false;

    {
        QMutexLocker locker(&m_handlerLock);
        if (m_handlers.contains(Action))
        {
            m_handlers[Action].removeAll(Handler);
            if (m_handlers[Action].isEmpty())
                m_handlers.remove(Action);
        }
        empty = m_handlers.isEmpty();
        WaitForDispatchPriv();
    }

    if (empty)
        Stop();
}

/*! \brief Multicast a message from every bound interface.
 *
 * The HOST header, if present, is set to the multicast group for each interface's address family. IPv6
 * interfaces without a scope id are skipped. Each message is sent SendCount times (or the configured
 * UdpSendCount if SendCount is not positive), at most 5 times.
 *
 * \returns The number of interfaces the message was sent from.
*/
int BeaconSSDP::SendMulticast(const BeaconSSDPHeaders &Headers, const QString &Action,
                              QAbstractSocket::NetworkLayerProtocol Family, int SendCount)
{
    QList<QPair<BeaconNetAddress,BeaconSSDPSocket*> > senders;
    BeaconSSDPConfiguration::DlnaVersion version;
    int count = SendCount;

    {
        QReadLocker locker(&m_lock);
        senders = m_senders;
        version = m_configuration.GetDlnaVersion();
        if (count < 1)
            count = m_configuration.GetUdpSendCount();
    }

    count = qBound(1, count, 5);

    int sent = 0;
    bool addhost = Headers.Contains("HOST");

    QList<QPair<BeaconNetAddress,BeaconSSDPSocket*> >::const_iterator it = senders.constBegin();
    for ( ; it != senders.constEnd(); ++it)
    {
        const BeaconNetAddress &interface = (*it).first;
        BeaconSSDPSocket *socket = (*it).second;

        if (Family != QAbstractSocket::UnknownNetworkLayerProtocol && Family != interface.Address().protocol())
            continue;
        if (interface.IsIPv6() && !interface.HasScopeId())
            continue;

        QHostAddress group;
        QString host;
        if (interface.IsIPv4())
        {
            group = QHostAddress(SSDP_IPV4_MULTICAST);
            host  = QString("%1:%2").arg(SSDP_IPV4_MULTICAST).arg(SSDP_PORT);
        }
        else
        {
            QString base = interface.IsLinkLocal() ? SSDP_IPV6_LINKLOCAL : SSDP_IPV6_SITELOCAL;
            group = QHostAddress(base);
            group.setScopeId(interface.Address().scopeId());
            host  = QString("[%1]:%2").arg(base).arg(SSDP_PORT);
        }

        BeaconSSDPHeaders headers(Headers);
        if (addhost)
            headers.Insert("HOST", host);
        if (version > BeaconSSDPConfiguration::DLNA_1_0 && socket->LocalPort() != SSDP_PORT)
            headers.Insert("SEARCHPORT.UPNP.ORG", QString::number(socket->LocalPort()));

        if (IsTracing(interface.Address()))
            LOG(VB_SSDP, LOG_DEBUG, QString("%1 -> %2 from %3:%4").arg(Action).arg(host)
                .arg(interface.Address().toString()).arg(socket->LocalPort()));

        socket->Send(BeaconSSDPMessage::Encode(Action, headers), group, SSDP_PORT, count);
        sent++;
    }

    return sent;
}

/*! \brief Send a message to a single peer from the sender bound to LocalAddress.
 *
 * Nothing is sent to a peer outside the local network.
*/
bool BeaconSSDP::SendUnicast(const BeaconSSDPHeaders &Headers, const QString &Action,
                             const QHostAddress &LocalAddress, const QHostAddress &Address, quint16 Port)
{
    if (m_networkInfo && !m_networkInfo->IsInLocalNetwork(Address))
    {
        LOG(VB_SSDP, LOG_DEBUG, QString("Not sending to non-LAN address %1").arg(Address.toString()));
        return false;
    }

    BeaconSSDPSocket *socket = NULL;

    {
        QReadLocker locker(&m_lock);
        QList<QPair<BeaconNetAddress,BeaconSSDPSocket*> >::const_iterator it = m_senders.constBegin();
        for ( ; it != m_senders.constEnd(); ++it)
        {
            if (SameHost((*it).first.Address(), LocalAddress))
            {
                socket = (*it).second;
                break;
            }
        }

        if (!socket)
        {
            LOG(VB_GENERAL, LOG_ERR, QString("Unable to find SSDP socket for %1").arg(LocalAddress.toString()));
            return false;
        }

        socket->Send(BeaconSSDPMessage::Encode(Action, Headers), Address, Port, 1);
    }

    if (IsTracing(Address, LocalAddress))
        LOG(VB_SSDP, LOG_DEBUG, QString("%1 -> %2:%3").arg(Action).arg(Address.toString()).arg(Port));
    return true;
}

/*! \brief Returns true if packet tracing is enabled for Address (or Address2).
 *
 * Tracing must be enabled and either no tracing filter is set or the filter matches one of the addresses.
*/
bool BeaconSSDP::IsTracing(const QHostAddress &Address, const QHostAddress &Address2)
{
    QReadLocker locker(&m_lock);

    if (!m_configuration.GetEnableSsdpTracing())
        return false;

    if (m_tracingFilter.isNull())
        return true;

    return SameHost(m_tracingFilter, Address) || (!Address2.isNull() && SameHost(m_tracingFilter, Address2));
}

/// \brief Return the port of the sender bound to Address, or the SSDP port if there is none.
quint16 BeaconSSDP::GetPortFor(const QHostAddress &Address)
{
    QReadLocker locker(&m_lock);

    QList<QPair<BeaconNetAddress,BeaconSSDPSocket*> >::const_iterator it = m_senders.constBegin();
    for ( ; it != m_senders.constEnd(); ++it)
        if (SameHost((*it).first.Address(), Address))
            return (*it).second->LocalPort();

    return SSDP_PORT;
}

/*! \brief Use a new set of interfaces.
 *
 * A running engine is restarted if the set differs from the current one. Otherwise the set is
 * used when the engine next starts.
*/
void BeaconSSDP::UpdateInterfaces(const QList<BeaconNetAddress> &Interfaces)
{
    bool stopped = false;
    bool started = false;

    {
        QWriteLocker locker(&m_lock);

        if (m_running && Interfaces != m_interfaces)
        {
            LOG(VB_GENERAL, LOG_INFO, "SSDP interfaces changed - restarting");
            stopped = StopPriv();
            m_interfaces = Interfaces;
            started = StartPriv();
        }
        else
        {
            m_interfaces = Interfaces;
        }
    }

    WaitForClosedSockets();

    if (stopped)
        emit Stopped();
    if (started)
        emit Started();
}

/// \brief The interfaces in use (or that will be used when the engine starts).
QList<BeaconNetAddress> BeaconSSDP::GetInterfaces(void)
{
    QReadLocker locker(&m_lock);
    return m_running ? m_boundInterfaces : m_interfaces;
}

void BeaconSSDP::IncreaseBootId(void)
{
    QWriteLocker locker(&m_lock);
    m_bootId = m_nextBootId;
    m_nextBootId++;
}

/// \brief The BOOTID.UPNP.ORG value.
int BeaconSSDP::BootId(void)
{
    QReadLocker locker(&m_lock);
    return m_bootId;
}

/// \brief The NEXTBOOTID.UPNP.ORG value.
int BeaconSSDP::NextBootId(void)
{
    QReadLocker locker(&m_lock);
    return m_nextBootId;
}

/// \brief The CONFIGID.UPNP.ORG value.
int BeaconSSDP::ConfigId(void)
{
    QReadLocker locker(&m_lock);
    return m_configId;
}

QString BeaconSSDP::GetUserAgent(void)
{
    QReadLocker locker(&m_lock);
    return m_configuration.GetUserAgent();
}

BeaconSSDPConfiguration::DlnaVersion BeaconSSDP::GetDlnaVersion(void)
{
    QReadLocker locker(&m_lock);
    return m_configuration.GetDlnaVersion();
}

int BeaconSSDP::UdpSendCount(void)
{
    QReadLocker locker(&m_lock);
    return m_configuration.GetUdpSendCount();
}

BeaconSSDPConfiguration BeaconSSDP::GetConfiguration(void)
{
    QReadLocker locker(&m_lock);
    return m_configuration;
}

void BeaconSSDP::SetConfiguration(const BeaconSSDPConfiguration &Configuration)
{
    {
        QWriteLocker locker(&m_lock);
        m_configuration = Configuration;
    }

    UpdateConfiguration();
}

/// \brief Validate and save the current configuration.
void BeaconSSDP::UpdateConfiguration(void)
{
    BeaconSSDPConfiguration configuration;

    {
        QWriteLocker locker(&m_lock);
        ValidateConfiguration();
        configuration = m_configuration;
    }

    configuration.Save();
}

bool BeaconSSDP::IsRunning(void)
{
    QReadLocker locker(&m_lock);
    return m_running;
}

/// \brief Set the delay used to coalesce network change notifications.
void BeaconSSDP::SetDebounceInterval(int Milliseconds)
{
    m_networkChangeTimer->setInterval(qMax(0, Milliseconds));
}

/*! \brief Schedule a restart following a change to the host network.
 *
 * Notifications received while a restart is pending are ignored.
*/
void BeaconSSDP::NetworkChanged(void)
{
    if (QThread::currentThread() != thread())
    {
        QMetaObject::invokeMethod(this, "NetworkChanged", Qt::QueuedConnection);
        return;
    }

    if (m_networkChangePending)
        return;

    LOG(VB_NETWORK, LOG_DEBUG, "Network change detected");
    m_networkChangePending = true;
    m_networkChangeTimer->start();
}

void BeaconSSDP::NetworkChangeTimeout(void)
{
    bool stopped = false;
    bool started = false;

    {
        QWriteLocker locker(&m_lock);

        if (m_running)
        {
            stopped = StopPriv();

            m_configId++;
            if (m_configId > 99)
                m_configId = 1;

            started = StartPriv();
        }
    }

    m_networkChangePending = false;

    WaitForClosedSockets();

    if (stopped)
        emit Stopped();
    if (started)
        emit Started();
}

/*! \brief Filter, parse and dispatch a datagram received by Socket.
 *
 * This runs in the socket's thread.
*/
void BeaconSSDP::ProcessMessage(BeaconSSDPSocket *Socket, const QByteArray &Data,
                                const QHostAddress &Address, quint16 Port)
{
    quint64 dispatch = BeginDispatch();

    try
    {
        ProcessMessagePriv(Socket, Data, Address, Port);
    }
    catch (...)
    {
        EndDispatch(dispatch);
        throw;
    }

    EndDispatch(dispatch);
}

quint64 BeaconSSDP::BeginDispatch(void)
{
    QMutexLocker locker(&m_handlerLock);
    m_dispatches.insert(++m_dispatchSequence, QThread::currentThread());
    return m_dispatchSequence;
}

void BeaconSSDP::EndDispatch(quint64 Dispatch)
{
    QMutexLocker locker(&m_handlerLock);
    m_dispatches.remove(Dispatch);
    m_dispatchDone.wakeAll();
}

/*! \brief Wait for dispatches that started before this call and are running on other threads.
 *
 * Returns immediately if the calling thread is itself dispatching. The caller must hold the handler lock.
*/
void BeaconSSDP::WaitForDispatchPriv(void)
{
    QThread *current = QThread::currentThread();
    quint64 mark     = m_dispatchSequence;

    if (m_dispatches.values().contains(current))
        return;

    forever
    {
        bool busy = false;
        QMap<quint64,QThread*>::const_iterator it = m_dispatches.constBegin();
        for ( ; it != m_dispatches.constEnd() && it.key() <= mark; ++it)
            busy |= it.value() != current;

        if (!busy)
            return;

        m_dispatchDone.wait(&m_handlerLock);
    }
}

void BeaconSSDP::ProcessMessagePriv(BeaconSSDPSocket *Socket, const QByteArray &Data,
                                    const QHostAddress &Address, quint16 Port)
{
    QHostAddress address = BeaconNetAddress::Normalise(Address);
    QList<BeaconNetAddress> interfaces;
    QList<BeaconNetAddress> permitted;
    QList<BeaconNetAddress> denied;
    BeaconSSDPConfiguration::DlnaVersion version;
    bool self = false;

    {
        QReadLocker locker(&m_lock);
        interfaces = m_boundInterfaces;
        permitted  = m_permittedDevices;
        denied     = m_deniedDevices;
        version    = m_configuration.GetDlnaVersion();

        QList<QPair<BeaconNetAddress,BeaconSSDPSocket*> >::const_iterator it = m_senders.constBegin();
        for ( ; it != m_senders.constEnd() && !self; ++it)
            self = ((*it).second->LocalPort() == Port) && SameHost((*it).second->LocalAddress(), address);
    }

    if (!permitted.isEmpty() || !denied.isEmpty())
    {
        foreach (const BeaconNetAddress &device, denied)
        {
            if (device.Contains(address))
            {
                if (IsTracing(address))
                    LOG(VB_SSDP, LOG_DEBUG, QString("Ignoring denied device %1").arg(address.toString()));
                return;
            }
        }

        if (!permitted.isEmpty())
        {
            bool allowed = false;
            foreach (const BeaconNetAddress &device, permitted)
                allowed |= device.Contains(address);

            if (!allowed)
            {
                if (IsTracing(address))
                    LOG(VB_SSDP, LOG_DEBUG, QString("Ignoring device %1 (not permitted)").arg(address.toString()));
                return;
            }
        }
    }
    else if (m_networkInfo && !m_networkInfo->IsInLocalNetwork(address))
    {
        return;
    }

    QString action;
    BeaconSSDPHeaders headers;
    if (!BeaconSSDPMessage::Decode(Data, action, headers))
        return;

    QHostAddress local = Socket->LocalAddress();
    if (BeaconNetAddress(local).IsAny() && !interfaces.isEmpty())
    {
        local = interfaces.first().Address();
        foreach (const BeaconNetAddress &interface, interfaces)
        {
            if (interface.Contains(address))
            {
                local = interface.Address();
                break;
            }
        }
    }

    // never process our own transmissions
    if (self)
        return;

    // handlers may register for the whole start line or just the request method
    QList<BeaconSSDPHandler*> handlers;
    {
        QMutexLocker locker(&m_handlerLock);
        handlers = m_handlers.value(action);

        QString method = BeaconSSDPMessage::Method(action);
        if (method != action)
            foreach (BeaconSSDPHandler *handler, m_handlers.value(method))
                if (!handlers.contains(handler))
                    handlers.append(handler);
    }

    if (handlers.isEmpty())
        return;

    if (IsTracing(address, local))
        LOG(VB_SSDP, LOG_DEBUG, QString("%1 <- %2:%3 on %4").arg(action).arg(address.toString()).arg(Port).arg(local.toString()));

    BeaconSSDPEventArgs args(action, headers, address, Port, local);
    if (version > BeaconSSDPConfiguration::DLNA_1_0 && headers.Contains("SEARCHPORT.UPNP.ORG"))
    {
        bool ok = false;
        int port = headers.Value("SEARCHPORT.UPNP.ORG").toInt(&ok);
        if (ok && port > 0 && port < 65536)
            args.SetPort((quint16)port);
    }

    foreach (BeaconSSDPHandler *handler, handlers)
    {
        try
        {
            handler->SSDPMessage(args);
        }
        catch (const std::exception &Exception)
        {
            LOG(VB_GENERAL, LOG_ERR, QString("Error firing event: %1 (%2)").arg(action).arg(Exception.what()));
        }
    }
}

/// \brief Drop a socket that can no longer be used. It is not replaced until the engine restarts.
void BeaconSSDP::SocketFailed(BeaconSSDPSocket *Socket, const QString &Error)
{
    {
        QWriteLocker locker(&m_lock);
        if (!SocketFailedPriv(Socket, Error))
            return;
    }

    WaitForClosedSockets();
}

bool BeaconSSDP::SocketFailedPriv(BeaconSSDPSocket *Socket, const QString &Error)
{
    bool found = m_listeners.removeAll(Socket) > 0;
    for (int i = m_senders.size() - 1; i >= 0; --i)
    {
        if (m_senders.at(i).second == Socket)
        {
            m_senders.removeAt(i);
            found = true;
        }
    }

    // already closed
    if (!found)
        return false;

    LOG(VB_GENERAL, LOG_ERR, QString("SSDP socket %1:%2 failed (%3)").arg(Socket->LocalAddress().toString())
        .arg(Socket->LocalPort()).arg(Error));
    Socket->disconnect(this);
    Socket->Close();
    m_closing.append(Socket);
    return true;
}

bool BeaconSSDP::event(QEvent *Event)
{
    if (Event->type() == BeaconEvent::BeaconEventType)
    {
        BeaconEvent* event = dynamic_cast<BeaconEvent*>(Event);
        if (event)
        {
            int action = event->GetEvent();
            if (action == Beacon::NetworkChanged || action == Beacon::NetworkAvailable ||
                action == Beacon::NetworkUnavailable)
            {
                NetworkChanged();
            }
        }

        return true;
    }

    return QObject::event(Event);
}

void BeaconSSDP::Start(void)
{
    bool started = false;

    {
        QWriteLocker locker(&m_lock);
        started = StartPriv();
    }

    if (started)
        emit Started();
}

void BeaconSSDP::Stop(void)
{
    bool stopped = false;

    {
        QWriteLocker locker(&m_lock);
        stopped = StopPriv();
    }

    WaitForClosedSockets();

    if (stopped)
        emit Stopped();
}

/*! \brief Wait for the threads of closed sockets to finish.
 *
 * Once this returns no closed socket can deliver another message. Only the engine's own thread waits,
 * as the closed sockets are deleted in that thread's event loop.
*/
void BeaconSSDP::WaitForClosedSockets(void)
{
    QList<BeaconSSDPSocket*> closing;

    {
        QWriteLocker locker(&m_lock);
        closing = m_closing;
        m_closing.clear();
    }

    if (QThread::currentThread() != thread())
        return;

    foreach (BeaconSSDPSocket *socket, closing)
        if (!socket->Wait(SSDP_CLOSE_TIMEOUT))
            LOG(VB_SOCKET, LOG_WARNING, QString("Timed out waiting for %1:%2 to close")
                .arg(socket->LocalAddress().toString()).arg(socket->LocalPort()));
}

QList<BeaconNetAddress> BeaconSSDP::ResolveInterfaces(void)
{
    if (!m_interfaces.isEmpty())
        return m_interfaces;
    if (m_networkInfo)
        return m_networkInfo->GetInterfaces();
    return QList<BeaconNetAddress>();
}

/*! \brief Open a listener and a sender for each interface.
 *
 * A failure on one interface is logged and that interface is skipped. The caller must hold the write lock.
*/
bool BeaconSSDP::StartPriv(void)
{
    if (m_running)
        return false;

    m_running = true;
    m_boundInterfaces = ResolveInterfaces();

    BeaconNetworkInfo::IPClassType ipclass = m_networkInfo ? m_networkInfo->GetIPClassType() : BeaconNetworkInfo::IPv4AndIPv6;

    LOG(VB_GENERAL, LOG_INFO, QString("Starting SSDP on %1 interface(s)").arg(m_boundInterfaces.size()));
    LOG(VB_GENERAL, LOG_DEBUG, QString("EnableMultiSocketBinding: %1")
        .arg(m_configuration.GetEnableMultiSocketBinding() ? "true" : "false"));

    foreach (const BeaconNetAddress &interface, m_boundInterfaces)
    {
        if ((ipclass == BeaconNetworkInfo::IPv6Only && interface.IsIPv4()) ||
            (ipclass == BeaconNetworkInfo::IPv4Only && interface.IsIPv6()))
        {
            continue;
        }

        BeaconSSDPSocket *listener = m_factory->Create(interface, SSDP_PORT, true, true);
        if (listener)
        {
            connect(listener, SIGNAL(Received(BeaconSSDPSocket*,QByteArray,QHostAddress,quint16)),
                    this,     SLOT(ProcessMessage(BeaconSSDPSocket*,QByteArray,QHostAddress,quint16)), Qt::DirectConnection);
            connect(listener, SIGNAL(Failed(BeaconSSDPSocket*,QString)), this, SLOT(SocketFailed(BeaconSSDPSocket*,QString)));
            m_listeners.append(listener);
            LOG(VB_NETWORK, LOG_DEBUG, QString("Created SSDP multicast listener for %1").arg(interface.ToString()));
        }
        else
        {
            LOG(VB_GENERAL, LOG_ERR, QString("Failed to create SSDP multicast listener for %1").arg(interface.ToString()));
        }

        quint16 port = BeaconSSDPConfiguration::PickPort(m_configuration.GetUdpPortRange());
        BeaconSSDPSocket *sender = m_factory->Create(interface, port, false, m_configuration.GetEnableMultiSocketBinding());
        if (!sender)
        {
            LOG(VB_GENERAL, LOG_ERR, QString("Failed to create SSDP sender on %1:%2").arg(interface.Address().toString()).arg(port));
            continue;
        }

        connect(sender, SIGNAL(Received(BeaconSSDPSocket*,QByteArray,QHostAddress,quint16)),
                this,   SLOT(ProcessMessage(BeaconSSDPSocket*,QByteArray,QHostAddress,quint16)), Qt::DirectConnection);
        connect(sender, SIGNAL(Failed(BeaconSSDPSocket*,QString)), this, SLOT(SocketFailed(BeaconSSDPSocket*,QString)));
        m_senders.append(qMakePair(interface, sender));
        LOG(VB_NETWORK, LOG_DEBUG, QString("Created SSDP sender on %1:%2").arg(interface.Address().toString()).arg(sender->LocalPort()));
    }

    return true;
}

/*! \brief Close all sockets. The caller must hold the write lock.
 *
 * The closed sockets are queued for WaitForClosedSockets, which must be called once the lock is released.
*/
bool BeaconSSDP::StopPriv(void)
{
    if (!m_running)
        return false;

    LOG(VB_GENERAL, LOG_INFO, "Stopping SSDP");
    m_running = false;

    foreach (BeaconSSDPSocket *listener, m_listeners)
    {
        listener->disconnect(this);
        listener->Close();
        m_closing.append(listener);
    }
    m_listeners.clear();

    QList<QPair<BeaconNetAddress,BeaconSSDPSocket*> >::const_iterator it = m_senders.constBegin();
    for ( ; it != m_senders.constEnd(); ++it)
    {
        (*it).second->disconnect(this);
        (*it).second->Close();
        m_closing.append((*it).second);
    }
    m_senders.clear();
    m_boundInterfaces.clear();

    return true;
}

/// \brief Clamp settings and parse the device lists and tracing filter. The caller must hold the write lock.
void BeaconSSDP::ValidateConfiguration(void)
{
    m_configuration.Validate();
    m_permittedDevices = BeaconNetAddress::ParseList(m_configuration.GetPermittedDevices());
    m_deniedDevices    = BeaconNetAddress::ParseList(m_configuration.GetDeniedDevices());
    m_tracingFilter    = QHostAddress();

    QString filter = m_configuration.GetSsdpTracingFilter();
    if (!filter.isEmpty())
    {
        QHostAddress address;
        if (address.setAddress(filter))
        {
            m_tracingFilter = BeaconNetAddress::Normalise(address);
            LOG(VB_GENERAL, LOG_INFO, QString("SSDP tracing filtering on %1").arg(filter));
        }
        else
        {
            LOG(VB_GENERAL, LOG_ERR, QString("SSDP tracing filter '%1' is invalid - ignoring").arg(filter));
        }
    }
}
