#ifndef BEACONUPNP_H
#define BEACONUPNP_H

// Qt
#include <QList>
#include <QString>
#include <QSharedPointer>
#include <QWeakPointer>
#include <QEnableSharedFromThis>

// Beacon
#include "beaconcoreexport.h"
#include "beaconnetaddress.h"

#define SSDP_PORT                   1900
#define SSDP_IPV4_MULTICAST         QString("239.255.255.250")
#define SSDP_IPV6_LINKLOCAL         QString("FF02::C")
#define SSDP_IPV6_SITELOCAL         QString("FF05::C")
#define UPNP_DEVICE_NAMESPACE       QString("schemas-upnp-org")
#define UPNP_MEDIARENDERER_DEVICE   QString("urn:schemas-upnp-org:device:MediaRenderer:1")

class BEACON_CORE_PUBLIC BeaconUPNP
{
  public:
    static  QString     UUIDFromUSN (const QString &USN);
    static  QString     HashUSN     (const QString &USN);
};

class BeaconUPNPDevice;
typedef QSharedPointer<BeaconUPNPDevice> BeaconUPNPDevicePtr;

class BEACON_CORE_PUBLIC BeaconUPNPDevice : public QEnableSharedFromThis<BeaconUPNPDevice>
{
  public:
    enum Kind
    {
        Root,
        Embedded
    };

    struct Fields
    {
        QString m_deviceType;
        QString m_deviceClass;
        QString m_deviceTypeNamespace;
        QString m_uuid;
    };

    struct RootFields
    {
        RootFields() : m_cacheLifetime(0) { }

        qint64           m_cacheLifetime;
        QString          m_location;
        BeaconNetAddress m_netAddress;
    };

  public:
    static BeaconUPNPDevicePtr CreateRoot     (const Fields &Common, const RootFields &Root);
    static BeaconUPNPDevicePtr CreateEmbedded (const Fields &Common);
    static void                Reparent       (const BeaconUPNPDevicePtr &Subtree, const BeaconUPNPDevicePtr &NewRoot);

  public:
    ~BeaconUPNPDevice();

    Kind                       GetKind             (void) const;
    bool                       IsRoot              (void) const;
    QString                    DeviceType          (void) const;
    QString                    DeviceClass         (void) const;
    QString                    DeviceTypeNamespace (void) const;
    QString                    FullDeviceType      (void) const;
    QString                    Uuid                (void) const;
    QString                    Udn                 (void) const;
    qint64                     CacheLifetime       (void) const;
    QString                    Location            (void) const;
    BeaconNetAddress           NetAddress          (void) const;
    BeaconUPNPDevicePtr        GetRootDevice       (void) const;
    QList<BeaconUPNPDevicePtr> GetServices         (void) const;
    void                       AddService          (const BeaconUPNPDevicePtr &Service);
    bool                       RemoveService       (const BeaconUPNPDevicePtr &Service);
    bool                       Contains            (const BeaconUPNPDevice *Device) const;
    QString                    ToString            (void) const;
    bool                       operator ==         (const BeaconUPNPDevice &Other) const;

  private:
    BeaconUPNPDevice(Kind DeviceKind, const Fields &Common, const RootFields &Root);
    Q_DISABLE_COPY(BeaconUPNPDevice)

  private:
    Kind                       m_kind;
    Fields                     m_fields;
    RootFields                 m_rootFields;
    QWeakPointer<BeaconUPNPDevice> m_root;
    QList<BeaconUPNPDevicePtr> m_services;
};

#endif // BEACONUPNP_H
