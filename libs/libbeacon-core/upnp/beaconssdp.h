#ifndef BEACONSSDP_H
#define BEACONSSDP_H

// Qt
#include <QMap>
#include <QPair>
#include <QMutex>
#include <QObject>
#include <QWaitCondition>
#include <QReadWriteLock>
#include <QAbstractSocket>

// Beacon
#include "beaconcoreexport.h"
#include "beaconnetwork.h"
#include "beaconnetaddress.h"
#include "beaconssdpsocket.h"
#include "beaconssdpmessage.h"
#include "beaconssdphandler.h"
#include "beaconssdpconfiguration.h"

class QTimer;
class QThread;

class BEACON_CORE_PUBLIC BeaconSSDP : public QObject
{
    Q_OBJECT

  public:
    static BeaconSSDP*  GetOrCreateInstance  (const QList<BeaconNetAddress> &Interfaces,
                                              BeaconNetworkInfo *NetworkInfo = NULL,
                                              BeaconSSDPSocketFactory *Factory = NULL);
    static BeaconSSDP*  GetInstance          (void);
    static void         TearDown             (void);

  public:
    void                AddHandler           (const QString &Action, BeaconSSDPHandler *Handler);
    void                RemoveHandler        (const QString &Action, BeaconSSDPHandler *Handler);
    int                 SendMulticast        (const BeaconSSDPHeaders &Headers, const QString &Action,
                                              QAbstractSocket::NetworkLayerProtocol Family = QAbstractSocket::UnknownNetworkLayerProtocol,
                                              int SendCount = -1);
    bool                SendUnicast          (const BeaconSSDPHeaders &Headers, const QString &Action,
                                              const QHostAddress &LocalAddress, const QHostAddress &Address, quint16 Port);
    bool                IsTracing            (const QHostAddress &Address, const QHostAddress &Address2 = QHostAddress());
    quint16             GetPortFor           (const QHostAddress &Address);
    void                UpdateInterfaces     (const QList<BeaconNetAddress> &Interfaces);
    QList<BeaconNetAddress> GetInterfaces    (void);
    void                IncreaseBootId       (void);
    int                 BootId               (void);
    int                 NextBootId           (void);
    int                 ConfigId             (void);
    QString             GetUserAgent         (void);
    BeaconSSDPConfiguration::DlnaVersion GetDlnaVersion (void);
    int                 UdpSendCount         (void);
    BeaconSSDPConfiguration GetConfiguration (void);
    void                SetConfiguration     (const BeaconSSDPConfiguration &Configuration);
    void                UpdateConfiguration  (void);
    bool                IsRunning            (void);
    void                SetDebounceInterval  (int Milliseconds);

  public slots:
    void                NetworkChanged       (void);

  signals:
    void                Started              (void);
    void                Stopped              (void);

  protected slots:
    void                ProcessMessage       (BeaconSSDPSocket *Socket, const QByteArray &Data,
                                              const QHostAddress &Address, quint16 Port);
    void                SocketFailed         (BeaconSSDPSocket *Socket, const QString &Error);
    void                NetworkChangeTimeout (void);

  protected:
    bool                event                (QEvent *Event);

  private:
    BeaconSSDP(const QList<BeaconNetAddress> &Interfaces, BeaconNetworkInfo *NetworkInfo,
               BeaconSSDPSocketFactory *Factory);
    ~BeaconSSDP();

    void                Start                (void);
    void                Stop                 (void);
    bool                StartPriv            (void);
    bool                StopPriv             (void);
    void                WaitForClosedSockets (void);
    bool                SocketFailedPriv     (BeaconSSDPSocket *Socket, const QString &Error);
    void                ProcessMessagePriv   (BeaconSSDPSocket *Socket, const QByteArray &Data,
                                              const QHostAddress &Address, quint16 Port);
    quint64             BeginDispatch        (void);
    void                EndDispatch          (quint64 Dispatch);
    void                WaitForDispatchPriv  (void);
    QList<BeaconNetAddress> ResolveInterfaces(void);
    void                ValidateConfiguration(void);

  private:
    BeaconNetworkInfo                           *m_networkInfo;
    BeaconSSDPSocketFactory                     *m_factory;
    bool                                         m_ownsFactory;

    QMutex                                       m_handlerLock;
    QMap<QString,QList<BeaconSSDPHandler*> >     m_handlers;
    QWaitCondition                               m_dispatchDone;
    quint64                                      m_dispatchSequence;
    QMap<quint64,QThread*>                       m_dispatches;

    QReadWriteLock                               m_lock;
    bool                                         m_running;
    QList<BeaconNetAddress>                      m_interfaces;
    QList<BeaconNetAddress>                      m_boundInterfaces;
    QList<BeaconSSDPSocket*>                     m_listeners;
    QList<QPair<BeaconNetAddress,BeaconSSDPSocket*> > m_senders;
    QList<BeaconSSDPSocket*>                     m_closing;
    BeaconSSDPConfiguration                      m_configuration;
    QList<BeaconNetAddress>                      m_permittedDevices;
    QList<BeaconNetAddress>                      m_deniedDevices;
    QHostAddress                                 m_tracingFilter;
    int                                          m_bootId;
    int                                          m_nextBootId;
    int                                          m_configId;

    bool                                         m_networkChangePending;
    QTimer                                      *m_networkChangeTimer;
};

#endif // BEACONSSDP_H
