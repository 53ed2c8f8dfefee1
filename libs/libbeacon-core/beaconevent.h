#ifndef BEACONEVENT_H
#define BEACONEVENT_H

// Qt
#include <QList>
#include <QMutex>
#include <QEvent>
#include <QVariant>

// Beacon
#include "beaconcoreexport.h"

class QObject;

class BEACON_CORE_PUBLIC BeaconEvent : public QEvent
{
  public:
    BeaconEvent(int Event, const QVariantMap &Data = QVariantMap());
    virtual ~BeaconEvent();

    int                GetEvent (void) const;
    const QVariantMap& Data     (void) const;

    static Type        BeaconEventType;

  private:
    int         m_event;
    QVariantMap m_data;
};

class BEACON_CORE_PUBLIC BeaconObservable
{
  public:
    BeaconObservable();
    virtual ~BeaconObservable();

    void            AddObserver    (QObject* Observer);
    void            RemoveObserver (QObject* Observer);
    void            Notify         (const BeaconEvent &Event);

  private:
    QMutex          m_observerLock;
    QList<QObject*> m_observers;
};

#endif // BEACONEVENT_H
