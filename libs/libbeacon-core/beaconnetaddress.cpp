/* Class BeaconNetAddress
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
#include <QStringList>

// Beacon
#include "beaconlogging.h"
#include "beaconnetaddress.h"

/*! \class BeaconNetAddress
 *  \brief An IP address together with a subnet prefix length.
 *
 * Used both for the addresses of local interfaces (where the prefix describes the attached subnet)
 * and for address filters (where a bare address matches that host only).
*/

/*! \brief Parse an address literal with an optional prefix ("192.168.1.0/24", "fe80::1%eth0/64", "10.0.0.5").
 *
 * Returns an invalid BeaconNetAddress if the literal cannot be parsed.
*/
BeaconNetAddress BeaconNetAddress::Parse(const QString &Literal, bool *Ok /*= NULL*/)
{
    if (Ok)
        *Ok = false;

    QString literal = Literal.trimmed();
    int prefix = -1;

    int slash = literal.lastIndexOf('/');
    if (slash > -1)
    {
        bool valid = false;
        prefix = literal.mid(slash + 1).toInt(&valid);
        if (!valid || prefix < 0)
            return BeaconNetAddress();
        literal = literal.left(slash);
    }

    // allow bracketed IPv6 literals
    if (literal.startsWith('[') && literal.endsWith(']'))
        literal = literal.mid(1, literal.size() - 2);

    QHostAddress address;
    if (!address.setAddress(literal))
        return BeaconNetAddress();

    int maximum = address.protocol() == QAbstractSocket::IPv6Protocol ? 128 : 32;
    if (prefix > maximum)
        return BeaconNetAddress();

    if (Ok)
        *Ok = true;
    return BeaconNetAddress(address, prefix);
}

/// \brief Parse a comma separated list of address literals. Invalid entries are logged and skipped.
QList<BeaconNetAddress> BeaconNetAddress::ParseList(const QString &List)
{
    QList<BeaconNetAddress> result;

    QStringList entries = List.split(',', QString::SkipEmptyParts);
    foreach (const QString &entry, entries)
    {
        if (entry.trimmed().isEmpty())
            continue;

        bool ok = false;
        BeaconNetAddress address = Parse(entry, &ok);
        if (ok)
            result.append(address);
        else
            LOG(VB_GENERAL, LOG_ERR, QString("Ignoring invalid address '%1'").arg(entry.trimmed()));
    }

    return result;
}

/// \brief Convert IPv4 mapped IPv6 addresses (::ffff:a.b.c.d) to plain IPv4.
QHostAddress BeaconNetAddress::Normalise(const QHostAddress &Address)
{
    if (Address.protocol() == QAbstractSocket::IPv6Protocol)
    {
        bool ok = false;
        quint32 ipv4 = Address.toIPv4Address(&ok);
        if (ok)
            return QHostAddress(ipv4);
    }

    return Address;
}

BeaconNetAddress::BeaconNetAddress()
  : m_address(),
    m_prefixLength(-1)
{
}

BeaconNetAddress::BeaconNetAddress(const QHostAddress &Address, int PrefixLength /*= -1*/)
  : m_address(Normalise(Address)),
    m_prefixLength(PrefixLength)
{
    int maximum = IsIPv6() ? 128 : 32;
    if (m_prefixLength < 0 || m_prefixLength > maximum)
        m_prefixLength = maximum;
}

bool BeaconNetAddress::IsValid(void) const
{
    return !m_address.isNull();
}

QHostAddress BeaconNetAddress::Address(void) const
{
    return m_address;
}

int BeaconNetAddress::PrefixLength(void) const
{
    return m_prefixLength;
}

bool BeaconNetAddress::IsIPv4(void) const
{
    return m_address.protocol() == QAbstractSocket::IPv4Protocol;
}

bool BeaconNetAddress::IsIPv6(void) const
{
    return m_address.protocol() == QAbstractSocket::IPv6Protocol;
}

/// \brief True for IPv6 addresses in fe80::/10.
bool BeaconNetAddress::IsLinkLocal(void) const
{
    if (!IsIPv6())
        return false;

    Q_IPV6ADDR ip = m_address.toIPv6Address();
    return ip[0] == 0xfe && (ip[1] & 0xc0) == 0x80;
}

bool BeaconNetAddress::HasScopeId(void) const
{
    return IsIPv6() && !m_address.scopeId().isEmpty();
}

bool BeaconNetAddress::IsAny(void) const
{
    return m_address == QHostAddress(QHostAddress::AnyIPv4) ||
           m_address == QHostAddress(QHostAddress::AnyIPv6) ||
           m_address == QHostAddress(QHostAddress::Any);
}

/// \brief Returns true if Address is inside this subnet.
bool BeaconNetAddress::Contains(const QHostAddress &Address) const
{
    if (!IsValid())
        return false;

    QHostAddress address = Normalise(Address);
    if (address.protocol() != m_address.protocol())
        return false;

    // compare without the scope id, which isInSubnet does not expect
    QHostAddress subnet(m_address);
    subnet.setScopeId(QString());
    address.setScopeId(QString());
    return address.isInSubnet(subnet, m_prefixLength);
}

QString BeaconNetAddress::ToString(void) const
{
    return QString("%1/%2").arg(m_address.toString()).arg(m_prefixLength);
}

bool BeaconNetAddress::operator == (const BeaconNetAddress &Other) const
{
    return m_address == Other.m_address && m_prefixLength == Other.m_prefixLength;
}

bool BeaconNetAddress::operator != (const BeaconNetAddress &Other) const
{
    return !(*this == Other);
}
