/* Class BeaconSSDPConfiguration
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
#include <QRandomGenerator>

// Beacon
#include "beaconversion.h"
#include "beaconlogging.h"
#include "beaconlocaldefs.h"
#include "beaconlocalcontext.h"
#include "beaconupnp.h"
#include "beaconssdpconfiguration.h"

#define SSDP_KEY_UDP_SEND_COUNT     QString("UdpSendCount")
#define SSDP_KEY_UDP_PORT_RANGE     QString("UdpPortRange")
#define SSDP_KEY_TRACING            QString("EnableSsdpTracing")
#define SSDP_KEY_TRACING_FILTER     QString("SsdpTracingFilter")
#define SSDP_KEY_DLNA_VERSION       QString("DlnaVersion")
#define SSDP_KEY_MULTI_SOCKET       QString("EnableMultiSocketBinding")
#define SSDP_KEY_PERMITTED_DEVICES  QString("PermittedDevices")
#define SSDP_KEY_DENIED_DEVICES     QString("DeniedDevices")
#define SSDP_KEY_USER_AGENT         QString("UserAgent")

static QString BoolToSetting(bool Value)
{
    return Value ? QString("1") : QString("0");
}

static bool SettingToBool(const QString &Name, const QString &Value, bool Default)
{
    QString value = Value.trimmed().toLower();
    if (value == "1" || value == "true")
        return true;
    if (value == "0" || value == "false")
        return false;

    LOG(VB_GENERAL, LOG_WARNING, QString("Invalid value '%1' for %2 - using default").arg(Value).arg(Name));
    return Default;
}

static int SettingToInt(const QString &Name, const QString &Value, int Default)
{
    bool ok = false;
    int result = Value.trimmed().toInt(&ok);
    if (ok)
        return result;

    LOG(VB_GENERAL, LOG_WARNING, QString("Invalid value '%1' for %2 - using default").arg(Value).arg(Name));
    return Default;
}

/*! \class BeaconSSDPConfiguration
 *  \brief The persisted settings that control SSDP behaviour.
 *
 * Settings are stored in the local context's settings database as name/value strings
 * under the SSDP_ prefix:
 *
 * SSDP_UdpSendCount             - copies of each multicast packet (1-5, default 2)
 * SSDP_UdpPortRange             - 'low-high' range for unicast search sockets
 * SSDP_EnableSsdpTracing        - log every packet sent and received (0/1)
 * SSDP_SsdpTracingFilter        - only trace packets containing this text
 * SSDP_DlnaVersion              - 0 (1.0), 1 (1.1) or 2 (2.0)
 * SSDP_EnableMultiSocketBinding - one multicast socket per interface address (0/1)
 * SSDP_PermittedDevices         - comma separated addresses to accept (empty for all)
 * SSDP_DeniedDevices            - comma separated addresses to ignore
 * SSDP_UserAgent                - USER-AGENT template ({DlnaVersion}, {AppVersion})
 *
 * Without a local context (e.g. in tests) Load returns the defaults and Save does nothing.
*/
BeaconSSDPConfiguration::BeaconSSDPConfiguration()
  : m_udpSendCount(2),
    m_udpPortRange(SSDP_DEFAULT_PORT_RANGE),
    m_enableSsdpTracing(false),
    m_ssdpTracingFilter(),
    m_dlnaVersion(DLNA_1_0),
    m_enableMultiSocketBinding(false),
    m_permittedDevices(),
    m_deniedDevices(),
    m_userAgent(SSDP_DEFAULT_USER_AGENT)
{
}

/// The complete SSDP_ schema with default values.
QMap<QString,QString> BeaconSSDPConfiguration::Defaults(void)
{
    return BeaconSSDPConfiguration().ToSettings();
}

/*! \brief Build a validated configuration from SSDP_ settings.
 *
 * Missing settings take their default, malformed numbers and booleans are logged and take
 * their default and unknown SSDP_ names are logged and ignored.
*/
BeaconSSDPConfiguration BeaconSSDPConfiguration::FromSettings(const QMap<QString,QString> &Settings)
{
    BeaconSSDPConfiguration result;
    QMap<QString,QString> defaults = Defaults();

    QMap<QString,QString>::const_iterator it = Settings.constBegin();
    for ( ; it != Settings.constEnd(); ++it)
    {
        if (!it.key().startsWith(BEACON_SSDP))
            continue;

        if (!defaults.contains(it.key()))
        {
            LOG(VB_GENERAL, LOG_WARNING, QString("Ignoring unknown setting '%1'").arg(it.key()));
            continue;
        }

        QString key   = it.key().mid(BEACON_SSDP.size());
        QString value = it.value();

        if (key == SSDP_KEY_UDP_SEND_COUNT)
            result.m_udpSendCount = SettingToInt(it.key(), value, result.m_udpSendCount);
        else if (key == SSDP_KEY_UDP_PORT_RANGE)
            result.m_udpPortRange = value;
        else if (key == SSDP_KEY_TRACING)
            result.m_enableSsdpTracing = SettingToBool(it.key(), value, result.m_enableSsdpTracing);
        else if (key == SSDP_KEY_TRACING_FILTER)
            result.m_ssdpTracingFilter = value;
        else if (key == SSDP_KEY_DLNA_VERSION)
            result.m_dlnaVersion = SettingToInt(it.key(), value, result.m_dlnaVersion);
        else if (key == SSDP_KEY_MULTI_SOCKET)
            result.m_enableMultiSocketBinding = SettingToBool(it.key(), value, result.m_enableMultiSocketBinding);
        else if (key == SSDP_KEY_PERMITTED_DEVICES)
            result.m_permittedDevices = value;
        else if (key == SSDP_KEY_DENIED_DEVICES)
            result.m_deniedDevices = value;
        else if (key == SSDP_KEY_USER_AGENT)
            result.m_userAgent = value;
    }

    result.Validate();
    return result;
}

/// The configuration as SSDP_ prefixed name/value settings.
QMap<QString,QString> BeaconSSDPConfiguration::ToSettings(void) const
{
    QMap<QString,QString> result;
    result.insert(BEACON_SSDP + SSDP_KEY_UDP_SEND_COUNT,    QString::number(m_udpSendCount));
    result.insert(BEACON_SSDP + SSDP_KEY_UDP_PORT_RANGE,    m_udpPortRange);
    result.insert(BEACON_SSDP + SSDP_KEY_TRACING,           BoolToSetting(m_enableSsdpTracing));
    result.insert(BEACON_SSDP + SSDP_KEY_TRACING_FILTER,    m_ssdpTracingFilter);
    result.insert(BEACON_SSDP + SSDP_KEY_DLNA_VERSION,      QString::number(m_dlnaVersion));
    result.insert(BEACON_SSDP + SSDP_KEY_MULTI_SOCKET,      BoolToSetting(m_enableMultiSocketBinding));
    result.insert(BEACON_SSDP + SSDP_KEY_PERMITTED_DEVICES, m_permittedDevices);
    result.insert(BEACON_SSDP + SSDP_KEY_DENIED_DEVICES,    m_deniedDevices);
    result.insert(BEACON_SSDP + SSDP_KEY_USER_AGENT,        m_userAgent);
    return result;
}

/// Load from the local context, storing defaults for any setting not yet present.
BeaconSSDPConfiguration BeaconSSDPConfiguration::Load(void)
{
    if (!gLocalContext)
        return BeaconSSDPConfiguration();

    QMap<QString,QString> stored  = gLocalContext->GetSettings(BEACON_SSDP);
    QMap<QString,QString> missing = Defaults();
    foreach (const QString &key, stored.keys())
        missing.remove(key);
    if (!missing.isEmpty())
        gLocalContext->SetSettings(missing);

    return FromSettings(stored);
}

/*! \brief Pick a random port from Range ('low-high' or a single port).
 *
 * Ports are drawn from QRandomGenerator::global(), which is securely seeded, so each
 * process and thread picks an independent sequence. An invalid range falls back to the
 * default. The SSDP port itself is never returned.
*/
quint16 BeaconSSDPConfiguration::PickPort(const QString &Range)
{
    QStringList parts = Range.trimmed().split('-');
    int low  = 0;
    int high = 0;
    bool ok  = false;

    if (parts.size() == 1)
    {
        low = high = parts[0].trimmed().toInt(&ok);
    }
    else if (parts.size() == 2)
    {
        bool ok2 = false;
        low  = parts[0].trimmed().toInt(&ok);
        high = parts[1].trimmed().toInt(&ok2);
        ok   = ok && ok2;
    }

    if (!ok || low < 1 || high > 65535 || low > high)
    {
        if (Range != SSDP_DEFAULT_PORT_RANGE)
        {
            LOG(VB_GENERAL, LOG_WARNING, QString("Invalid UDP port range '%1' - using default").arg(Range));
            return PickPort(SSDP_DEFAULT_PORT_RANGE);
        }
        return SSDP_PORT + 1;
    }

    int port = (int)QRandomGenerator::global()->bounded((quint32)low, (quint32)high + 1);
    if (port == SSDP_PORT)
        port = SSDP_PORT + 1;
    return (quint16)port;
}

QString BeaconSSDPConfiguration::DlnaVersionName(DlnaVersion Version)
{
    switch (Version)
    {
        case DLNA_1_0: return "1.0";
        case DLNA_1_1: return "1.1";
        case DLNA_2_0: return "2.0";
    }

    return "1.0";
}

/// \brief Clamp numeric values and replace empty strings with their defaults.
void BeaconSSDPConfiguration::Validate(void)
{
    m_udpSendCount = qBound(1, m_udpSendCount, 5);
    m_dlnaVersion  = qBound((int)DLNA_1_0, m_dlnaVersion, (int)DLNA_2_0);

    if (m_udpPortRange.trimmed().isEmpty())
        m_udpPortRange = SSDP_DEFAULT_PORT_RANGE;
    if (m_userAgent.trimmed().isEmpty())
        m_userAgent = SSDP_DEFAULT_USER_AGENT;

    m_ssdpTracingFilter = m_ssdpTracingFilter.trimmed();
    m_permittedDevices  = m_permittedDevices.trimmed();
    m_deniedDevices     = m_deniedDevices.trimmed();
}

void BeaconSSDPConfiguration::Save(void) const
{
    if (gLocalContext)
        gLocalContext->SetSettings(ToSettings());
}

/// \brief The USER-AGENT/SERVER header value, with {DlnaVersion} and {AppVersion} expanded.
QString BeaconSSDPConfiguration::GetUserAgent(void) const
{
    QString result = m_userAgent;
    result.replace("{DlnaVersion}", DlnaVersionName(GetDlnaVersion()), Qt::CaseInsensitive);
    result.replace("{AppVersion}", BEACON_SOURCE_VERSION, Qt::CaseInsensitive);
    return result;
}

int BeaconSSDPConfiguration::GetUdpSendCount(void) const
{
    return m_udpSendCount;
}

void BeaconSSDPConfiguration::SetUdpSendCount(int Count)
{
    m_udpSendCount = Count;
}

QString BeaconSSDPConfiguration::GetUdpPortRange(void) const
{
    return m_udpPortRange;
}

void BeaconSSDPConfiguration::SetUdpPortRange(const QString &Range)
{
    m_udpPortRange = Range;
}

bool BeaconSSDPConfiguration::GetEnableSsdpTracing(void) const
{
    return m_enableSsdpTracing;
}

void BeaconSSDPConfiguration::SetEnableSsdpTracing(bool Enable)
{
    m_enableSsdpTracing = Enable;
}

QString BeaconSSDPConfiguration::GetSsdpTracingFilter(void) const
{
    return m_ssdpTracingFilter;
}

void BeaconSSDPConfiguration::SetSsdpTracingFilter(const QString &Filter)
{
    m_ssdpTracingFilter = Filter;
}

BeaconSSDPConfiguration::DlnaVersion BeaconSSDPConfiguration::GetDlnaVersion(void) const
{
    return (DlnaVersion)qBound((int)DLNA_1_0, m_dlnaVersion, (int)DLNA_2_0);
}

void BeaconSSDPConfiguration::SetDlnaVersion(int Version)
{
    m_dlnaVersion = Version;
}

bool BeaconSSDPConfiguration::GetEnableMultiSocketBinding(void) const
{
    return m_enableMultiSocketBinding;
}

void BeaconSSDPConfiguration::SetEnableMultiSocketBinding(bool Enable)
{
    m_enableMultiSocketBinding = Enable;
}

QString BeaconSSDPConfiguration::GetPermittedDevices(void) const
{
    return m_permittedDevices;
}

void BeaconSSDPConfiguration::SetPermittedDevices(const QString &Devices)
{
    m_permittedDevices = Devices;
}

QString BeaconSSDPConfiguration::GetDeniedDevices(void) const
{
    return m_deniedDevices;
}

void BeaconSSDPConfiguration::SetDeniedDevices(const QString &Devices)
{
    m_deniedDevices = Devices;
}

QString BeaconSSDPConfiguration::GetUserAgentTemplate(void) const
{
    return m_userAgent;
}

void BeaconSSDPConfiguration::SetUserAgentTemplate(const QString &Template)
{
    m_userAgent = Template;
}
