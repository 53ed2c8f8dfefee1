/* Class BeaconSSDPDiscoveredDevice
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
#include <limits.h>
#include <stdexcept>

// Qt
#include <QDateTime>

// Beacon
#include "beaconupnp.h"
#include "beaconssdpdiscovereddevice.h"

/*! \class BeaconSSDPDiscoveredDevice
 *  \brief A snapshot of a remote device, as described by a single SSDP message.
 *
 * Records are never modified. A newer message for the same device replaces the record.
 * A device that advertised no cache lifetime is always expired.
*/

/*! \brief Return the max-age value (in seconds) from a CACHE-CONTROL header, or 0.
 *
 * Values are capped at INT_MAX seconds.
*/
qint64 BeaconSSDPDiscoveredDevice::ParseCacheLifetime(const QString &CacheControl)
{
    int index = CacheControl.indexOf("max-age", 0, Qt::CaseInsensitive);
    if (index < 0)
        return 0;

    int equals = CacheControl.indexOf('=', index);
    if (equals < 0)
        return 0;

    QString value = CacheControl.mid(equals + 1).trimmed();
    int end = 0;
    while (end < value.size() && value.at(end).isDigit())
        end++;

    QString digits = value.left(end);
    while (digits.startsWith('0'))
        digits = digits.mid(1);

    if (digits.isEmpty())
        return 0;

    // more digits than INT_MAX
    if (digits.size() > 10)
        return INT_MAX;

    bool ok = false;
    qint64 seconds = digits.toLongLong(&ok);
    if (!ok || seconds < 1)
        return 0;
    return qMin(seconds, (qint64)INT_MAX);
}

BeaconSSDPDiscoveredDevice::BeaconSSDPDiscoveredDevice()
  : m_valid(false),
    m_port(0),
    m_cacheLifetime(0),
    m_receivedAt(0)
{
}

/*! \brief Build a record from the Headers of a message received at ReceivedAt (ms since epoch).
 *
 * NTHeader names the header carrying the notification type ('NT' for NOTIFY, 'ST' for search responses).
 *
 * \throws std::runtime_error if the message has no notification type or USN header.
*/
BeaconSSDPDiscoveredDevice::BeaconSSDPDiscoveredDevice(qint64 ReceivedAt, const QString &NTHeader,
                                                       const BeaconSSDPHeaders &Headers,
                                                       const QHostAddress &Address, quint16 Port)
  : m_valid(true),
    m_address(Address),
    m_port(Port),
    m_headers(Headers),
    m_cacheLifetime(0),
    m_receivedAt(ReceivedAt)
{
    if (!Headers.Contains(NTHeader))
        throw std::runtime_error(QString("SSDP message has no %1 header").arg(NTHeader).toStdString());

    if (!Headers.Contains("USN"))
        throw std::runtime_error("SSDP message has no USN header");

    m_notificationType = Headers.Value(NTHeader);
    m_rawUsn           = Headers.Value("USN");
    m_usn              = BeaconUPNP::UUIDFromUSN(m_rawUsn);
    m_location         = Headers.Value("LOCATION");
    m_cacheLifetime    = ParseCacheLifetime(Headers.Value("CACHE-CONTROL"));
}

bool BeaconSSDPDiscoveredDevice::IsValid(void) const
{
    return m_valid;
}

QString BeaconSSDPDiscoveredDevice::NotificationType(void) const
{
    return m_notificationType;
}

/// \brief The device identifier derived from the USN header (empty if the message had an empty USN).
QString BeaconSSDPDiscoveredDevice::Usn(void) const
{
    return m_usn;
}

QString BeaconSSDPDiscoveredDevice::RawUsn(void) const
{
    return m_rawUsn;
}

QString BeaconSSDPDiscoveredDevice::Location(void) const
{
    return m_location;
}

QHostAddress BeaconSSDPDiscoveredDevice::Address(void) const
{
    return m_address;
}

quint16 BeaconSSDPDiscoveredDevice::Port(void) const
{
    return m_port;
}

BeaconSSDPHeaders BeaconSSDPDiscoveredDevice::Headers(void) const
{
    return m_headers;
}

qint64 BeaconSSDPDiscoveredDevice::CacheLifetime(void) const
{
    return m_cacheLifetime;
}

qint64 BeaconSSDPDiscoveredDevice::ReceivedAt(void) const
{
    return m_receivedAt;
}

bool BeaconSSDPDiscoveredDevice::IsExpired(qint64 Now) const
{
    return m_cacheLifetime == 0 || (m_receivedAt + m_cacheLifetime * 1000) <= Now;
}

bool BeaconSSDPDiscoveredDevice::IsExpired(void) const
{
    return IsExpired(QDateTime::currentMSecsSinceEpoch());
}

QString BeaconSSDPDiscoveredDevice::ToString(void) const
{
    return QString("%1 (%2) at %3 from %4:%5").arg(m_usn).arg(m_notificationType)
            .arg(m_location.isEmpty() ? QString("<no location>") : m_location)
            .arg(m_address.toString()).arg(m_port);
}
