#ifndef BEACONSSDPMESSAGE_H
#define BEACONSSDPMESSAGE_H

// Qt
#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QByteArray>
#include <QMetaType>

// Beacon
#include "beaconcoreexport.h"

class BEACON_CORE_PUBLIC BeaconSSDPHeaders
{
  public:
    BeaconSSDPHeaders();

    QString         Value       (const QString &Key, const QString &Default = QString()) const;
    bool            Contains    (const QString &Key) const;
    void            Insert      (const QString &Key, const QString &Value);
    bool            Remove      (const QString &Key);
    QStringList     Keys        (void) const;
    int             Count       (void) const;
    bool            IsEmpty     (void) const;
    QList<QPair<QString,QString> > Items (void) const;
    bool            operator == (const BeaconSSDPHeaders &Other) const;
    bool            operator != (const BeaconSSDPHeaders &Other) const;

  private:
    int             IndexOf     (const QString &Key) const;

  private:
    QList<QPair<QString,QString> > m_headers;
};

Q_DECLARE_METATYPE(BeaconSSDPHeaders)

class BEACON_CORE_PUBLIC BeaconSSDPMessage
{
  public:
    static QByteArray Encode (const QString &Action, const BeaconSSDPHeaders &Headers);
    static bool       Decode (const QByteArray &Raw, QString &Action, BeaconSSDPHeaders &Headers);
    static QString    Method (const QString &Action);
};

#endif // BEACONSSDPMESSAGE_H
