/* Class BeaconSSDPLocator
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
#include <QDateTime>
#include <QStringList>

// Beacon
#include "beaconlogging.h"
#include "beaconupnp.h"
#include "beaconssdp.h"
#include "beaconssdplocator.h"

#define DEFAULT_SEARCH_WAIT     4
#define DEFAULT_SWEEP_INTERVAL  30

/*! \class BeaconSSDPLocator
 *  \brief Discovers media renderers and maintains a cache of the devices found.
 *
 * Once started, the locator listens for search responses and NOTIFY messages and periodically multicasts an
 * M-SEARCH for media renderers. The first search is delayed by a grace period. Searches are then repeated every
 * InitialInterval seconds until SlowDown is called, and every Interval seconds thereafter. An InitialInterval
 * of SSDP_DISABLED suppresses searching, though cached devices are still expired.
 *
 * DeviceDiscovered is emitted once for each new device and DeviceLeft once for each device that says goodbye
 * or whose advertisement expires. Signals may be emitted from socket threads and are never emitted while
 * the device cache is locked.
*/

/// \brief Return the MX value for a search, one second less than Seconds with a minimum of 1.
int BeaconSSDPLocator::SearchWaitToMX(int Seconds)
{
    if (Seconds < 2)
        return 1;
    return Seconds - 1;
}

/// \throws std::logic_error if Engine is NULL and the SSDP engine has not been created.
BeaconSSDPLocator::BeaconSSDPLocator(BeaconSSDP *Engine, QObject *Parent)
  : QObject(Parent),
    m_engine(Engine ? Engine : BeaconSSDP::GetInstance()),
    m_timer(new QTimer(this)),
    m_timerLock(),
    m_started(false),
    m_disposed(false),
    m_initial(true),
    m_initialInterval(10),
    m_interval(60),
    m_gracePeriod(5000),
    m_deviceLock()
{
    qRegisterMetaType<BeaconSSDPDiscoveredDevice>("BeaconSSDPDiscoveredDevice");

    m_timer->setSingleShot(true);
    connect(m_timer, SIGNAL(timeout()), this, SLOT(BroadcastTimeout()));
}

BeaconSSDPLocator::~BeaconSSDPLocator()
{
    Dispose();
}

/// \brief Register for inbound messages and schedule the first search.
void BeaconSSDPLocator::Start(void)
{
    int grace = 0;

    {
        QMutexLocker locker(&m_timerLock);
        if (m_disposed)
        {
            LOG(VB_GENERAL, LOG_WARNING, "Cannot start a disposed SSDP locator");
            return;
        }

        if (m_started)
            return;

        m_started = true;
        grace = m_gracePeriod;
    }

    m_engine->AddHandler(SSDP_RESPONSE_ACTION, this);
    m_engine->AddHandler(SSDP_NOTIFY_ACTION, this);

    LOG(VB_SSDP, LOG_INFO, QString("SSDP locator started (first search in %1ms)").arg(grace));
    QMetaObject::invokeMethod(this, "ArmTimer", Qt::AutoConnection, Q_ARG(int, grace));
}

/// \brief Switch to the steady state search interval from the next search.
void BeaconSSDPLocator::SlowDown(void)
{
    QMutexLocker locker(&m_timerLock);
    m_initial = false;
}

/// \brief Stop searching and deregister from the engine. Safe to call more than once.
void BeaconSSDPLocator::Dispose(void)
{
    {
        QMutexLocker locker(&m_timerLock);
        if (m_disposed)
            return;

        m_disposed = true;
        m_started  = false;
    }

    m_engine->RemoveHandler(SSDP_RESPONSE_ACTION, this);
    m_engine->RemoveHandler(SSDP_NOTIFY_ACTION, this);

    if (QThread::currentThread() == thread())
        StopTimer();
    else
        QMetaObject::invokeMethod(this, "StopTimer", Qt::QueuedConnection);

    LOG(VB_SSDP, LOG_DEBUG, "SSDP locator disposed");
}

bool BeaconSSDPLocator::IsStarted(void)
{
    QMutexLocker locker(&m_timerLock);
    return m_started;
}

int BeaconSSDPLocator::GetInitialInterval(void)
{
    QMutexLocker locker(&m_timerLock);
    return m_initialInterval;
}

/*! \brief Set the search interval used until SlowDown is called.
 *
 * Changing the value returns the locator to the initial search rate and, if started, reschedules the next search.
*/
void BeaconSSDPLocator::SetInitialInterval(int Seconds)
{
    int period = 0;

    {
        QMutexLocker locker(&m_timerLock);
        if (m_initialInterval == Seconds)
            return;

        m_initialInterval = Seconds;
        m_initial = true;
        if (!m_started)
            return;
    }

    period = CurrentPeriod();
    QMetaObject::invokeMethod(this, "ArmTimer", Qt::AutoConnection, Q_ARG(int, period * 1000));
}

int BeaconSSDPLocator::GetInterval(void)
{
    QMutexLocker locker(&m_timerLock);
    return m_interval;
}

void BeaconSSDPLocator::SetInterval(int Seconds)
{
    QMutexLocker locker(&m_timerLock);
    m_interval = Seconds;
}

/// \brief Set the delay before the first search after Start.
void BeaconSSDPLocator::SetGracePeriod(int Milliseconds)
{
    QMutexLocker locker(&m_timerLock);
    m_gracePeriod = qMax(0, Milliseconds);
}

/// \brief Return a snapshot of the cached devices.
QList<BeaconSSDPDiscoveredDevice> BeaconSSDPLocator::GetDevices(void)
{
    QMutexLocker locker(&m_deviceLock);
    return m_devices;
}

void BeaconSSDPLocator::SSDPMessage(const BeaconSSDPEventArgs &Args)
{
    {
        QMutexLocker locker(&m_timerLock);
        if (m_disposed)
            return;
    }

    QString method = BeaconSSDPMessage::Method(Args.Action());
    if (method == SSDP_RESPONSE_ACTION)
        IncomingResponse(Args);
    else if (method == SSDP_NOTIFY_ACTION)
        IncomingNotification(Args);
}

void BeaconSSDPLocator::ArmTimer(int Milliseconds)
{
    {
        QMutexLocker locker(&m_timerLock);
        if (!m_started)
            return;
    }

    m_timer->start(qMax(0, Milliseconds));
}

void BeaconSSDPLocator::StopTimer(void)
{
    m_timer->stop();
}

void BeaconSSDPLocator::BroadcastTimeout(void)
{
    RemoveExpiredDevices();

    bool search = false;

    {
        QMutexLocker locker(&m_timerLock);
        if (!m_started)
            return;
        search = m_initialInterval != SSDP_DISABLED;
    }

    if (search)
        BroadcastSearch();

    m_timer->start(CurrentPeriod() * 1000);
}

int BeaconSSDPLocator::CurrentPeriod(void)
{
    QMutexLocker locker(&m_timerLock);

    int period = m_interval;
    if (m_initialInterval != SSDP_DISABLED && m_initial)
        period = m_initialInterval;

    return period > 0 ? period : DEFAULT_SWEEP_INTERVAL;
}

void BeaconSSDPLocator::BroadcastSearch(void)
{
    BeaconSSDPHeaders headers;
    headers.Insert("MAN",        "\"ssdp:discover\"");
    headers.Insert("MX",         QString::number(SearchWaitToMX(DEFAULT_SEARCH_WAIT)));
    headers.Insert("ST",         UPNP_MEDIARENDERER_DEVICE);
    headers.Insert("USER-AGENT", m_engine->GetUserAgent());
    headers.Insert("HOST",       QString());

    if (m_engine->GetDlnaVersion() == BeaconSSDPConfiguration::DLNA_2_0)
        headers.Insert("CPFN.UPNP.ORG", "Beacon");

    int sent = m_engine->SendMulticast(headers, SSDP_SEARCH_ACTION);
    LOG(VB_SSDP, LOG_DEBUG, QString("Sent discovery message on %1 interface(s)").arg(sent));
}

/*! \brief Remove expired devices from the cache.
 *
 * DeviceLeft is emitted once for each distinct USN removed.
*/
void BeaconSSDPLocator::RemoveExpiredDevices(void)
{
    QList<BeaconSSDPDiscoveredDevice> expired;
    qint64 now = QDateTime::currentMSecsSinceEpoch();

    {
        QMutexLocker locker(&m_deviceLock);
        QMutableListIterator<BeaconSSDPDiscoveredDevice> it(m_devices);
        while (it.hasNext())
        {
            if (it.next().IsExpired(now))
            {
                expired.append(it.value());
                it.remove();
            }
        }
    }

    if (expired.isEmpty())
        return;

    LOG(VB_SSDP, LOG_DEBUG, QString("Removed %1 expired device(s)").arg(expired.size()));

    QStringList usns;
    foreach (const BeaconSSDPDiscoveredDevice &device, expired)
    {
        if (usns.contains(device.Usn()))
            continue;
        usns.append(device.Usn());
        emit DeviceLeft(device);
    }
}

void BeaconSSDPLocator::AddOrUpdateDevice(const BeaconSSDPDiscoveredDevice &Device)
{
    bool isnew = false;

    {
        QMutexLocker locker(&m_deviceLock);
        int index = FindExistingDevice(Device);
        if (index < 0)
        {
            m_devices.append(Device);
            isnew = true;
            LOG(VB_SSDP, LOG_DEBUG, QString("Found device: %1").arg(Device.Location()));
        }
        else
        {
            // a placeholder (no USN) being replaced is still a new device
            BeaconSSDPDiscoveredDevice existing = m_devices.takeAt(index);
            m_devices.append(Device);
            isnew = existing.Usn().isEmpty();
        }
    }

    if (isnew)
        emit DeviceDiscovered(Device);
}

/// \brief Remove every cached entry for Usn, emitting DeviceLeft for each. Returns false if none were cached.
bool BeaconSSDPLocator::DeviceDied(const QString &Usn)
{
    QList<BeaconSSDPDiscoveredDevice> removed;

    {
        QMutexLocker locker(&m_deviceLock);
        QMutableListIterator<BeaconSSDPDiscoveredDevice> it(m_devices);
        while (it.hasNext())
        {
            if (it.next().Usn() == Usn)
            {
                removed.append(it.value());
                it.remove();
            }
        }
    }

    foreach (const BeaconSSDPDiscoveredDevice &device, removed)
        emit DeviceLeft(device);

    return !removed.isEmpty();
}

/// \brief The caller must hold the device lock.
int BeaconSSDPLocator::FindExistingDevice(const BeaconSSDPDiscoveredDevice &Device)
{
    if (!Device.Location().isEmpty())
        for (int i = 0; i < m_devices.size(); ++i)
            if (m_devices.at(i).Location() == Device.Location())
                return i;

    for (int i = 0; i < m_devices.size(); ++i)
    {
        const BeaconSSDPDiscoveredDevice &device = m_devices.at(i);
        if (device.Usn().isEmpty() && device.Port() == Device.Port() &&
            BeaconNetAddress::Normalise(device.Address()) == BeaconNetAddress::Normalise(Device.Address()))
        {
            return i;
        }
    }

    for (int i = 0; i < m_devices.size(); ++i)
        if (m_devices.at(i).NotificationType() == Device.NotificationType() && m_devices.at(i).Usn() == Device.Usn())
            return i;

    return -1;
}

void BeaconSSDPLocator::IncomingResponse(const BeaconSSDPEventArgs &Args)
{
    try
    {
        BeaconSSDPDiscoveredDevice device(QDateTime::currentMSecsSinceEpoch(), "ST", Args.Headers(), Args.Address(), Args.Port());
        AddOrUpdateDevice(device);
    }
    catch (const std::runtime_error &Exception)
    {
        LOG(VB_SSDP, LOG_DEBUG, QString("Ignoring corrupt search response from %1 (%2)")
            .arg(Args.Address().toString()).arg(Exception.what()));
    }
}

void BeaconSSDPLocator::IncomingNotification(const BeaconSSDPEventArgs &Args)
{
    BeaconSSDPDiscoveredDevice device;

    try
    {
        device = BeaconSSDPDiscoveredDevice(QDateTime::currentMSecsSinceEpoch(), "NT", Args.Headers(), Args.Address(), Args.Port());
    }
    catch (const std::runtime_error &Exception)
    {
        LOG(VB_SSDP, LOG_DEBUG, QString("Ignoring corrupt notification from %1 (%2)")
            .arg(Args.Address().toString()).arg(Exception.what()));
        return;
    }

    QString nts = Args.Headers().Value("NTS");

    if (nts == "ssdp:alive")
    {
        if (m_engine->IsTracing(Args.LocalAddress()))
            LOG(VB_SSDP, LOG_DEBUG, QString("Alive <- %1").arg(device.Location()));
        AddOrUpdateDevice(device);
        return;
    }

    if (nts != "ssdp:byebye" || device.NotificationType().isEmpty())
        return;

    if (DeviceDied(device.Usn()) && m_engine->IsTracing(device.Address()))
        LOG(VB_SSDP, LOG_DEBUG, QString("Byebye <- %1").arg(device.ToString()));
}
