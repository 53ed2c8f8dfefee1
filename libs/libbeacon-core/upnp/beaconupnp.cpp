/* Class BeaconUPNP
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
#include <QCryptographicHash>

// Beacon
#include "beaconupnp.h"

/*! \brief Extract the device UUID from a Unique Service Name.
 *
 * 'uuid:4d696e69-444c-164e-9d41-001c42fc0db6::urn:schemas-upnp-org:device:MediaServer:1'
 * yields '4d696e69-444c-164e-9d41-001c42fc0db6'. A USN with no usable uuid token
 * yields a stable hash of the complete USN instead, so every USN maps to some identifier.
*/
QString BeaconUPNP::UUIDFromUSN(const QString &USN)
{
    QString usn = USN.trimmed();
    if (usn.isEmpty())
        return QString();

    int index = usn.indexOf("uuid:", 0, Qt::CaseInsensitive);
    if (index > -1)
    {
        QString result = usn.mid(index + 5);
        int end = result.indexOf("::");
        if (end > -1)
            result = result.left(end);

        result = result.trimmed();
        if (result.startsWith('{'))
            result = result.mid(1);
        if (result.endsWith('}'))
            result.chop(1);

        if (!result.isEmpty())
            return result;
    }

    return HashUSN(usn);
}

/// \brief Return the MD5 hash of USN as lower case hex.
QString BeaconUPNP::HashUSN(const QString &USN)
{
    return QString(QCryptographicHash::hash(USN.toUtf8(), QCryptographicHash::Md5).toHex());
}

/*! \class BeaconUPNPDevice
 *  \brief A UPnP device or embedded service, as a node in a tree owned by a root device.
 *
 * The root node carries the tree wide metadata (cache lifetime, description location and the
 * local network address the tree is advertised on). Embedded nodes hold a weak reference to
 * their root, which is only ever changed by Reparent.
*/
BeaconUPNPDevicePtr BeaconUPNPDevice::CreateRoot(const Fields &Common, const RootFields &Root)
{
    return BeaconUPNPDevicePtr(new BeaconUPNPDevice(BeaconUPNPDevice::Root, Common, Root));
}

BeaconUPNPDevicePtr BeaconUPNPDevice::CreateEmbedded(const Fields &Common)
{
    return BeaconUPNPDevicePtr(new BeaconUPNPDevice(BeaconUPNPDevice::Embedded, Common, RootFields()));
}

/*! \brief Bind every embedded node in Subtree to NewRoot.
 *
 * NewRoot may be null to detach the subtree. The subtree is walked once.
 *
 * \throws std::invalid_argument if NewRoot is not a root device.
*/
void BeaconUPNPDevice::Reparent(const BeaconUPNPDevicePtr &Subtree, const BeaconUPNPDevicePtr &NewRoot)
{
    if (!Subtree)
        return;

    if (NewRoot && !NewRoot->IsRoot())
        throw std::invalid_argument("Devices can only be bound to a root device");

    QList<BeaconUPNPDevicePtr> pending;
    pending.append(Subtree);
    while (!pending.isEmpty())
    {
        BeaconUPNPDevicePtr device = pending.takeFirst();
        if (!device->IsRoot())
            device->m_root = NewRoot.toWeakRef();
        pending.append(device->m_services);
    }
}

BeaconUPNPDevice::BeaconUPNPDevice(Kind DeviceKind, const Fields &Common, const RootFields &Root)
  : m_kind(DeviceKind),
    m_fields(Common),
    m_rootFields(Root)
{
}

BeaconUPNPDevice::~BeaconUPNPDevice()
{
}

BeaconUPNPDevice::Kind BeaconUPNPDevice::GetKind(void) const
{
    return m_kind;
}

bool BeaconUPNPDevice::IsRoot(void) const
{
    return m_kind == Root;
}

QString BeaconUPNPDevice::DeviceType(void) const
{
    return m_fields.m_deviceType;
}

QString BeaconUPNPDevice::DeviceClass(void) const
{
    return m_fields.m_deviceClass;
}

QString BeaconUPNPDevice::DeviceTypeNamespace(void) const
{
    return m_fields.m_deviceTypeNamespace;
}

/// \brief The full URN (e.g. urn:schemas-upnp-org:device:MediaRenderer:1)
QString BeaconUPNPDevice::FullDeviceType(void) const
{
    return QString("urn:%1:%2:%3:1").arg(m_fields.m_deviceTypeNamespace)
                                    .arg(m_fields.m_deviceClass)
                                    .arg(m_fields.m_deviceType);
}

QString BeaconUPNPDevice::Uuid(void) const
{
    return m_fields.m_uuid;
}

QString BeaconUPNPDevice::Udn(void) const
{
    return "uuid:" + m_fields.m_uuid;
}

qint64 BeaconUPNPDevice::CacheLifetime(void) const
{
    if (IsRoot())
        return m_rootFields.m_cacheLifetime;
    BeaconUPNPDevicePtr root = GetRootDevice();
    return root ? root->CacheLifetime() : 0;
}

QString BeaconUPNPDevice::Location(void) const
{
    if (IsRoot())
        return m_rootFields.m_location;
    BeaconUPNPDevicePtr root = GetRootDevice();
    return root ? root->Location() : QString();
}

BeaconNetAddress BeaconUPNPDevice::NetAddress(void) const
{
    if (IsRoot())
        return m_rootFields.m_netAddress;
    BeaconUPNPDevicePtr root = GetRootDevice();
    return root ? root->NetAddress() : BeaconNetAddress();
}

/// \brief Return the root of the tree this device belongs to (or null if it is detached).
BeaconUPNPDevicePtr BeaconUPNPDevice::GetRootDevice(void) const
{
    switch (m_kind)
    {
        case Root:     return const_cast<BeaconUPNPDevice*>(this)->sharedFromThis();
        case Embedded: return m_root.toStrongRef();
    }

    return BeaconUPNPDevicePtr();
}

QList<BeaconUPNPDevicePtr> BeaconUPNPDevice::GetServices(void) const
{
    return m_services;
}

/*! \brief Attach Service (and its subtree) to this device.
 *
 * Adding a service that is already attached to this device is a no-op.
 *
 * \throws std::invalid_argument if Service is null, a root device, this device or one of its ancestors.
 * \throws std::logic_error if Service is already bound to a different root device.
*/
void BeaconUPNPDevice::AddService(const BeaconUPNPDevicePtr &Service)
{
    if (!Service)
        throw std::invalid_argument("Cannot add a null service");

    if (Service.data() == this)
        throw std::invalid_argument("Cannot add a device to itself");

    if (Service->IsRoot())
        throw std::invalid_argument("Root devices cannot be embedded");

    if (Service->Contains(this))
        throw std::invalid_argument("Cannot add an ancestor as a child");

    if (m_services.contains(Service))
        return;

    BeaconUPNPDevicePtr root = GetRootDevice();
    BeaconUPNPDevicePtr current = Service->GetRootDevice();
    if (current && current != root)
        throw std::logic_error("Device is already attached to a different root device");

    m_services.append(Service);
    Reparent(Service, root);
}

/// \brief Detach Service (and its subtree) from this device.
bool BeaconUPNPDevice::RemoveService(const BeaconUPNPDevicePtr &Service)
{
    if (!Service || !m_services.removeOne(Service))
        return false;

    Reparent(Service, BeaconUPNPDevicePtr());
    return true;
}

/// \brief Returns true if Device is this device or one of its descendants.
bool BeaconUPNPDevice::Contains(const BeaconUPNPDevice *Device) const
{
    if (Device == this)
        return true;

    foreach (const BeaconUPNPDevicePtr &service, m_services)
        if (service->Contains(Device))
            return true;

    return false;
}

QString BeaconUPNPDevice::ToString(void) const
{
    return QString("%1 - %2").arg(m_fields.m_deviceType).arg(m_fields.m_uuid);
}

/*! \brief Root devices are equal when both their description and bound address match.
*/
bool BeaconUPNPDevice::operator == (const BeaconUPNPDevice &Other) const
{
    if (m_kind != Other.m_kind || ToString() != Other.ToString())
        return false;

    if (IsRoot())
        return m_rootFields.m_netAddress == Other.m_rootFields.m_netAddress;

    return true;
}
