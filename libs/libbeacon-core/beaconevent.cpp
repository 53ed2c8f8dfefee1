/* Class BeaconEvent/BeaconObservable
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
#include <QCoreApplication>

// Beacon
#include "beaconevent.h"

/*! \class BeaconEvent
 *  \brief An application wide notification (one of Beacon::Actions) with optional data.
 *
 * To listen for Beacon events, a QObject subclass reimplements QObject::event, calls
 * gLocalContext->AddObserver(this) and must call gLocalContext->RemoveObserver(this)
 * before it is destroyed.
 *
 * \sa BeaconLocalContext::NotifyEvent
 * \sa BeaconObservable
 */

QEvent::Type BeaconEvent::BeaconEventType = (QEvent::Type) QEvent::registerEventType();

BeaconEvent::BeaconEvent(int Event, const QVariantMap &Data/* = QVariantMap()*/)
  : QEvent(BeaconEventType),
    m_event(Event),
    m_data(Data)
{
}

BeaconEvent::~BeaconEvent()
{
}

/// \brief Return the Beacon action associated with this event.
int BeaconEvent::GetEvent(void) const
{
    return m_event;
}

const QVariantMap& BeaconEvent::Data(void) const
{
    return m_data;
}

/*! \class BeaconObservable
 *  \brief Sends event notifications to registered observers.
 *
 * Events are posted, so each observer handles them in its own thread. Observers may
 * add or remove themselves (or others) from within their event handler.
*/
BeaconObservable::BeaconObservable()
  : m_observerLock(QMutex::Recursive)
{
}

BeaconObservable::~BeaconObservable()
{
}

void BeaconObservable::AddObserver(QObject *Observer)
{
    QMutexLocker locker(&m_observerLock);
    if (!Observer || m_observers.contains(Observer))
        return;
    m_observers.append(Observer);
}

void BeaconObservable::RemoveObserver(QObject *Observer)
{
    QMutexLocker locker(&m_observerLock);
    m_observers.removeAll(Observer);
}

/// QCoreApplication::postEvent takes ownership, hence each observer receives its own copy.
void BeaconObservable::Notify(const BeaconEvent &Event)
{
    QMutexLocker locker(&m_observerLock);

    foreach (QObject* observer, m_observers)
        QCoreApplication::postEvent(observer, new BeaconEvent(Event.GetEvent(), Event.Data()));
}
