#ifndef BEACONSSDPCONFIGURATION_H
#define BEACONSSDPCONFIGURATION_H

// Qt
#include <QMap>
#include <QString>

// Beacon
#include "beaconcoreexport.h"

#define SSDP_DEFAULT_PORT_RANGE QString("49152-65535")
#define SSDP_DEFAULT_USER_AGENT QString("DLNADOC/1.50 UPnP/{DlnaVersion} Beacon/{AppVersion}")

class BEACON_CORE_PUBLIC BeaconSSDPConfiguration
{
  public:
    enum DlnaVersion
    {
        DLNA_1_0 = 0,
        DLNA_1_1 = 1,
        DLNA_2_0 = 2
    };

    static BeaconSSDPConfiguration Load           (void);
    static BeaconSSDPConfiguration FromSettings   (const QMap<QString,QString> &Settings);
    static QMap<QString,QString>   Defaults       (void);
    static quint16                 PickPort       (const QString &Range);
    static QString                 DlnaVersionName(DlnaVersion Version);

  public:
    BeaconSSDPConfiguration();

    void        Validate                    (void);
    void        Save                        (void) const;
    QMap<QString,QString> ToSettings        (void) const;
    QString     GetUserAgent                (void) const;

    int         GetUdpSendCount             (void) const;
    void        SetUdpSendCount             (int Count);
    QString     GetUdpPortRange             (void) const;
    void        SetUdpPortRange             (const QString &Range);
    bool        GetEnableSsdpTracing        (void) const;
    void        SetEnableSsdpTracing        (bool Enable);
    QString     GetSsdpTracingFilter        (void) const;
    void        SetSsdpTracingFilter        (const QString &Filter);
    DlnaVersion GetDlnaVersion              (void) const;
    void        SetDlnaVersion              (int Version);
    bool        GetEnableMultiSocketBinding (void) const;
    void        SetEnableMultiSocketBinding (bool Enable);
    QString     GetPermittedDevices         (void) const;
    void        SetPermittedDevices         (const QString &Devices);
    QString     GetDeniedDevices            (void) const;
    void        SetDeniedDevices            (const QString &Devices);
    QString     GetUserAgentTemplate        (void) const;
    void        SetUserAgentTemplate        (const QString &Template);

  private:
    int         m_udpSendCount;
    QString     m_udpPortRange;
    bool        m_enableSsdpTracing;
    QString     m_ssdpTracingFilter;
    int         m_dlnaVersion;
    bool        m_enableMultiSocketBinding;
    QString     m_permittedDevices;
    QString     m_deniedDevices;
    QString     m_userAgent;
};

#endif // BEACONSSDPCONFIGURATION_H
