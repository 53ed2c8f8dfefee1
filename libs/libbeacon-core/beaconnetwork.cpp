/* Class BeaconNetwork
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
#include <QMutex>
#include <QStringList>
#include <QNetworkInterface>

// Beacon
#include "beaconlocalcontext.h"
#include "beaconlogging.h"
#include "beaconnetwork.h"

BeaconNetwork* gNetwork = NULL;
QMutex*        gNetworkLock = new QMutex(QMutex::Recursive);

/*! \class BeaconNetworkInfo
 *  \brief Host network knowledge needed by the SSDP engine.
 *
 * Implemented by BeaconNetwork for the running host and by test doubles.
*/

/*! \class BeaconNetwork
 *  \brief Tracks host network availability and the usable local interfaces.
 *
 * BeaconNetwork listens to QNetworkConfigurationManager and, whenever the set of
 * interface addresses changes, notifies Beacon::NetworkChanged (plus Beacon::NetworkAvailable
 * or Beacon::NetworkUnavailable on online state transitions) through the local context.
 *
 * All access to the global instance is via the static API, guarded by gNetworkLock.
*/
void BeaconNetwork::Setup(bool Create)
{
    QMutexLocker locker(gNetworkLock);

    if (Create)
    {
        if (!gNetwork)
            gNetwork = new BeaconNetwork();
        return;
    }

    delete gNetwork;
    gNetwork = NULL;
}

bool BeaconNetwork::IsAvailable(void)
{
    QMutexLocker locker(gNetworkLock);

    return gNetwork ? gNetwork->IsOnline() : false;
}

BeaconNetworkInfo* BeaconNetwork::GetNetworkInfo(void)
{
    QMutexLocker locker(gNetworkLock);

    return gNetwork;
}

/*! \brief Return the addresses of all interfaces usable for SSDP.
 *
 * Interfaces must be up, running and multicast capable. Loopback interfaces are ignored.
*/
QList<BeaconNetAddress> BeaconNetwork::LocalInterfaces(void)
{
    QList<BeaconNetAddress> result;

    QList<QNetworkInterface> interfaces = QNetworkInterface::allInterfaces();
    foreach (const QNetworkInterface &interface, interfaces)
    {
        QNetworkInterface::InterfaceFlags flags = interface.flags();
        if (!(flags & QNetworkInterface::IsUp) || !(flags & QNetworkInterface::IsRunning) ||
            !(flags & QNetworkInterface::CanMulticast) || (flags & QNetworkInterface::IsLoopBack))
        {
            continue;
        }

        QList<QNetworkAddressEntry> entries = interface.addressEntries();
        foreach (const QNetworkAddressEntry &entry, entries)
        {
            QHostAddress address = entry.ip();
            if (address.isNull())
                continue;

            // link local IPv6 addresses need the interface to be routable
            if (address.protocol() == QAbstractSocket::IPv6Protocol && address.scopeId().isEmpty())
                address.setScopeId(interface.name());

            result.append(BeaconNetAddress(address, entry.prefixLength()));
        }
    }

    return result;
}

BeaconNetwork::BeaconNetwork()
  : QObject(),
    m_online(false),
    m_manager(new QNetworkConfigurationManager(this))
{
    LOG(VB_GENERAL, LOG_INFO, "Opening network monitor");

    connect(m_manager, SIGNAL(configurationAdded(const QNetworkConfiguration&)),
            this,      SLOT(ConfigurationAdded(const QNetworkConfiguration&)));
    connect(m_manager, SIGNAL(configurationChanged(const QNetworkConfiguration&)),
            this,      SLOT(ConfigurationChanged(const QNetworkConfiguration&)));
    connect(m_manager, SIGNAL(configurationRemoved(const QNetworkConfiguration&)),
            this,      SLOT(ConfigurationRemoved(const QNetworkConfiguration&)));
    connect(m_manager, SIGNAL(onlineStateChanged(bool)),
            this,      SLOT(OnlineStateChanged(bool)));
    connect(m_manager, SIGNAL(updateCompleted()),
            this,      SLOT(UpdateCompleted()));

    UpdateConfiguration(true);
}

BeaconNetwork::~BeaconNetwork()
{
    if (m_manager)
        m_manager->deleteLater();
    m_manager = NULL;

    LOG(VB_GENERAL, LOG_INFO, "Closing network monitor");
}

/*! \brief Returns true if Address is on a subnet attached to this host.
 *
 * Loopback addresses are always local.
*/
bool BeaconNetwork::IsInLocalNetwork(const QHostAddress &Address)
{
    QHostAddress address = BeaconNetAddress::Normalise(Address);
    if (address.isLoopback())
        return true;

    QReadLocker locker(&m_interfacesLock);
    foreach (const BeaconNetAddress &interface, m_interfaces)
        if (interface.Contains(address))
            return true;

    return false;
}

BeaconNetworkInfo::IPClassType BeaconNetwork::GetIPClassType(void)
{
    QReadLocker locker(&m_interfacesLock);

    bool ipv4 = false;
    bool ipv6 = false;
    foreach (const BeaconNetAddress &interface, m_interfaces)
    {
        ipv4 |= interface.IsIPv4();
        ipv6 |= interface.IsIPv6();
    }

    if (ipv4 && !ipv6)
        return IPv4Only;
    if (ipv6 && !ipv4)
        return IPv6Only;
    return IPv4AndIPv6;
}

QList<BeaconNetAddress> BeaconNetwork::GetInterfaces(void)
{
    QReadLocker locker(&m_interfacesLock);
    return m_interfaces;
}

bool BeaconNetwork::IsOnline(void)
{
    return m_online;
}

void BeaconNetwork::ConfigurationAdded(const QNetworkConfiguration&)
{
    UpdateConfiguration();
}

void BeaconNetwork::ConfigurationChanged(const QNetworkConfiguration&)
{
    UpdateConfiguration();
}

void BeaconNetwork::ConfigurationRemoved(const QNetworkConfiguration&)
{
    UpdateConfiguration();
}

void BeaconNetwork::OnlineStateChanged(bool)
{
    UpdateConfiguration();
}

void BeaconNetwork::UpdateCompleted(void)
{
    UpdateConfiguration();
}

void BeaconNetwork::UpdateConfiguration(bool Creating)
{
    QList<BeaconNetAddress> interfaces = LocalInterfaces();
    bool wasonline = m_online;
    bool changed   = false;

    {
        QWriteLocker locker(&m_interfacesLock);
        if (interfaces != m_interfaces)
        {
            m_interfaces = interfaces;
            changed = true;
        }
    }

    m_online = !interfaces.isEmpty();

    if (changed || Creating)
    {
        QStringList addresses;
        foreach (const BeaconNetAddress &address, interfaces)
            addresses << address.ToString();
        LOG(VB_NETWORK, LOG_INFO, QString("Network interfaces: %1").arg(addresses.isEmpty() ? QString("none") : addresses.join(", ")));
    }

    if (m_online && !wasonline)
    {
        LOG(VB_GENERAL, LOG_INFO, "Network available");
        BeaconLocalContext::NotifyEvent(Beacon::NetworkAvailable);
    }
    else if (!m_online && wasonline)
    {
        LOG(VB_GENERAL, LOG_INFO, "Network unavailable");
        BeaconLocalContext::NotifyEvent(Beacon::NetworkUnavailable);
    }

    if (changed && !Creating)
        BeaconLocalContext::NotifyEvent(Beacon::NetworkChanged);
}
