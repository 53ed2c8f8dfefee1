// Qt
#include <QTimer>
#include <QCoreApplication>

// Beacon
#include "beaconlocalcontext.h"
#include "beaconlogging.h"
#include "beaconevent.h"
#include "upnp/beaconssdp.h"
#include "upnp/beaconssdplocator.h"
#include "beacondiscoverer.h"

/*! \class BeaconDiscoverer
 *  \brief Runs an SSDP locator on every local interface and reports what it finds.
 *
 * Discovered and departed devices are logged and re-published to local context observers as
 * Beacon::ServiceDiscovered and Beacon::ServiceWentAway. A Beacon::Exit event stops discovery
 * and quits the application.
*/
BeaconDiscoverer::BeaconDiscoverer(int InitialInterval, int Interval, int SlowDown)
  : QObject(),
    m_locator(NULL),
    m_slowDown(SlowDown)
{
    BeaconSSDP *engine = BeaconSSDP::GetOrCreateInstance(QList<BeaconNetAddress>());

    m_locator = new BeaconSSDPLocator(engine, this);
    m_locator->SetInterval(Interval);
    m_locator->SetInitialInterval(InitialInterval);

    connect(m_locator, SIGNAL(DeviceDiscovered(BeaconSSDPDiscoveredDevice)), this, SLOT(DeviceDiscovered(BeaconSSDPDiscoveredDevice)));
    connect(m_locator, SIGNAL(DeviceLeft(BeaconSSDPDiscoveredDevice)),       this, SLOT(DeviceLeft(BeaconSSDPDiscoveredDevice)));

    gLocalContext->AddObserver(this);
}

BeaconDiscoverer::~BeaconDiscoverer()
{
    gLocalContext->RemoveObserver(this);
    m_locator->Dispose();
}

void BeaconDiscoverer::Start(void)
{
    LOG(VB_GENERAL, LOG_INFO, QString("Searching for media renderers (user agent '%1')").arg(BeaconSSDP::GetInstance()->GetUserAgent()));
    m_locator->Start();

    if (m_slowDown > 0)
        QTimer::singleShot(m_slowDown * 1000, this, SLOT(SlowDown()));
}

void BeaconDiscoverer::DeviceDiscovered(const BeaconSSDPDiscoveredDevice &Device)
{
    LOG(VB_GENERAL, LOG_INFO, QString("Discovered: %1").arg(Device.ToString()));

    QVariantMap data;
    data.insert("usn",      Device.Usn());
    data.insert("type",     Device.NotificationType());
    data.insert("location", Device.Location());
    gLocalContext->Notify(BeaconEvent(Beacon::ServiceDiscovered, data));
}

void BeaconDiscoverer::DeviceLeft(const BeaconSSDPDiscoveredDevice &Device)
{
    LOG(VB_GENERAL, LOG_INFO, QString("Went away: %1").arg(Device.ToString()));

    QVariantMap data;
    data.insert("usn", Device.Usn());
    gLocalContext->Notify(BeaconEvent(Beacon::ServiceWentAway, data));
}

void BeaconDiscoverer::SlowDown(void)
{
    LOG(VB_GENERAL, LOG_INFO, QString("Slowing search to every %1 seconds").arg(m_locator->GetInterval()));
    m_locator->SlowDown();
}

bool BeaconDiscoverer::event(QEvent *Event)
{
    if (Event->type() == BeaconEvent::BeaconEventType)
    {
        BeaconEvent* event = dynamic_cast<BeaconEvent*>(Event);
        if (event && event->GetEvent() == Beacon::Exit)
        {
            LOG(VB_GENERAL, LOG_INFO, QString("Exiting with %1 cached device(s)").arg(m_locator->GetDevices().size()));
            m_locator->Dispose();
            QCoreApplication::quit();
        }

        return true;
    }

    return QObject::event(Event);
}
