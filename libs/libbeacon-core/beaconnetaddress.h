#ifndef BEACONNETADDRESS_H
#define BEACONNETADDRESS_H

// Qt
#include <QList>
#include <QMetaType>
#include <QHostAddress>

// Beacon
#include "beaconcoreexport.h"

class BEACON_CORE_PUBLIC BeaconNetAddress
{
  public:
    static BeaconNetAddress        Parse        (const QString &Literal, bool *Ok = NULL);
    static QList<BeaconNetAddress> ParseList    (const QString &List);
    static QHostAddress            Normalise    (const QHostAddress &Address);

  public:
    BeaconNetAddress();
    explicit BeaconNetAddress(const QHostAddress &Address, int PrefixLength = -1);

    bool                           IsValid      (void) const;
    QHostAddress                   Address      (void) const;
    int                            PrefixLength (void) const;
    bool                           IsIPv4       (void) const;
    bool                           IsIPv6       (void) const;
    bool                           IsLinkLocal  (void) const;
    bool                           HasScopeId   (void) const;
    bool                           IsAny        (void) const;
    bool                           Contains     (const QHostAddress &Address) const;
    QString                        ToString     (void) const;
    bool                           operator ==  (const BeaconNetAddress &Other) const;
    bool                           operator !=  (const BeaconNetAddress &Other) const;

  private:
    QHostAddress m_address;
    int          m_prefixLength;
};

Q_DECLARE_METATYPE(BeaconNetAddress)

#endif // BEACONNETADDRESS_H
