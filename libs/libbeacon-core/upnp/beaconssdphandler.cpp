/* Class BeaconSSDPEventArgs
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
#include "beaconssdphandler.h"

/*! \class BeaconSSDPEventArgs
 *  \brief The details of an inbound SSDP message passed to each BeaconSSDPHandler.
 *
 * Port is the port replies should be sent to, which is the sending port unless the sender
 * asked for replies on another port.
*/
BeaconSSDPEventArgs::BeaconSSDPEventArgs()
  : m_port(0)
{
}

BeaconSSDPEventArgs::BeaconSSDPEventArgs(const QString &Action, const BeaconSSDPHeaders &Headers, const QHostAddress &Address,
                                         quint16 Port, const QHostAddress &LocalAddress)
  : m_action(Action),
    m_headers(Headers),
    m_address(Address),
    m_port(Port),
    m_localAddress(LocalAddress)
{
}

QString BeaconSSDPEventArgs::Action(void) const
{
    return m_action;
}

BeaconSSDPHeaders BeaconSSDPEventArgs::Headers(void) const
{
    return m_headers;
}

QHostAddress BeaconSSDPEventArgs::Address(void) const
{
    return m_address;
}

quint16 BeaconSSDPEventArgs::Port(void) const
{
    return m_port;
}

void BeaconSSDPEventArgs::SetPort(quint16 Port)
{
    m_port = Port;
}

QHostAddress BeaconSSDPEventArgs::LocalAddress(void) const
{
    return m_localAddress;
}
