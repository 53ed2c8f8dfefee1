/* Class BeaconSSDPMessage
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

// Beacon
#include "beaconlogging.h"
#include "beaconssdpmessage.h"

/*! \class BeaconSSDPHeaders
 *  \brief An insertion ordered set of SSDP/HTTP headers with case insensitive keys.
*/
BeaconSSDPHeaders::BeaconSSDPHeaders()
{
}

QString BeaconSSDPHeaders::Value(const QString &Key, const QString &Default) const
{
    int index = IndexOf(Key);
    return index < 0 ? Default : m_headers.at(index).second;
}

bool BeaconSSDPHeaders::Contains(const QString &Key) const
{
    return IndexOf(Key) > -1;
}

/// \brief Replace the value for an existing Key (keeping its position) or append a new header.
void BeaconSSDPHeaders::Insert(const QString &Key, const QString &Value)
{
    int index = IndexOf(Key);
    if (index < 0)
        m_headers.append(qMakePair(Key, Value));
    else
        m_headers[index].second = Value;
}

bool BeaconSSDPHeaders::Remove(const QString &Key)
{
    int index = IndexOf(Key);
    if (index < 0)
        return false;

    m_headers.removeAt(index);
    return true;
}

QStringList BeaconSSDPHeaders::Keys(void) const
{
    QStringList result;
    for (int i = 0; i < m_headers.size(); ++i)
        result << m_headers.at(i).first;
    return result;
}

int BeaconSSDPHeaders::Count(void) const
{
    return m_headers.size();
}

bool BeaconSSDPHeaders::IsEmpty(void) const
{
    return m_headers.isEmpty();
}

QList<QPair<QString,QString> > BeaconSSDPHeaders::Items(void) const
{
    return m_headers;
}

/// \brief Headers are equal when they hold the same keys (ignoring case and order) with identical values.
bool BeaconSSDPHeaders::operator == (const BeaconSSDPHeaders &Other) const
{
    if (m_headers.size() != Other.m_headers.size())
        return false;

    for (int i = 0; i < m_headers.size(); ++i)
    {
        int index = Other.IndexOf(m_headers.at(i).first);
        if (index < 0 || Other.m_headers.at(index).second != m_headers.at(i).second)
            return false;
    }

    return true;
}

bool BeaconSSDPHeaders::operator != (const BeaconSSDPHeaders &Other) const
{
    return !(*this == Other);
}

int BeaconSSDPHeaders::IndexOf(const QString &Key) const
{
    for (int i = 0; i < m_headers.size(); ++i)
        if (m_headers.at(i).first.compare(Key, Qt::CaseInsensitive) == 0)
            return i;
    return -1;
}

/*! \class BeaconSSDPMessage
 *  \brief Conversion between SSDP datagrams and an action plus headers.
 *
 * A datagram is a start line, followed by 'Key: Value' header lines and terminated by an empty line,
 * with every line terminated by CRLF.
*/

/*! \brief Render Action and Headers as an SSDP datagram.
*/
QByteArray BeaconSSDPMessage::Encode(const QString &Action, const BeaconSSDPHeaders &Headers)
{
    QString result = Action + "\r\n";

    QList<QPair<QString,QString> > headers = Headers.Items();
    QList<QPair<QString,QString> >::const_iterator it = headers.constBegin();
    for ( ; it != headers.constEnd(); ++it)
        result += (*it).first + ": " + (*it).second + "\r\n";

    result += "\r\n";
    return result.toUtf8();
}

/*! \brief Parse Raw into an Action and a set of Headers.
 *
 * Header keys are trimmed and upper cased. The start line (e.g. 'M-SEARCH * HTTP/1.1' or
 * 'HTTP/1.1 200 OK') is used whole, so Action is exactly what was passed to Encode. Action is empty when
 * no start line is present. Duplicate headers are logged and the first value is kept.
 *
 * \returns false if Raw contains no lines at all.
*/
bool BeaconSSDPMessage::Decode(const QByteArray &Raw, QString &Action, BeaconSSDPHeaders &Headers)
{
    Action = QString();
    Headers = BeaconSSDPHeaders();

    QStringList lines = QString::fromUtf8(Raw).split("\r\n", QString::SkipEmptyParts);
    if (lines.isEmpty())
        return false;

    foreach (const QString &line, lines)
    {
        int index = line.indexOf(':');
        if (index > -1)
        {
            QString key   = line.left(index).trimmed().toUpper();
            QString value = line.mid(index + 1).trimmed();

            if (Headers.Contains(key))
            {
                LOG(VB_SSDP, LOG_DEBUG, QString("Duplicate SSDP header '%1' ignored").arg(key));
                continue;
            }

            Headers.Insert(key, value);
            continue;
        }

        if (!Action.isEmpty())
            continue;

        Action = line.trimmed();
    }

    return true;
}

/*! \brief Return the method of a request line ('M-SEARCH * HTTP/1.1' yields 'M-SEARCH').
 *
 * Status lines and bare methods are returned unchanged.
*/
QString BeaconSSDPMessage::Method(const QString &Action)
{
    int star = Action.indexOf(" *");
    if (star < 1)
        return Action;
    return Action.left(star).trimmed();
}
