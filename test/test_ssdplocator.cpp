#include <gtest/gtest.h>

#include "beacontesthelpers.h"
#include "upnp/beaconupnp.h"
#include "upnp/beaconssdplocator.h"

static QByteArray MakeAlive(const QString &NT, const QString &USN, const QString &Location, const QString &CacheControl = "max-age=1800")
{
    BeaconSSDPHeaders headers;
    headers.Insert("HOST", "239.255.255.250:1900");
    if (!CacheControl.isEmpty())
        headers.Insert("CACHE-CONTROL", CacheControl);
    if (!Location.isEmpty())
        headers.Insert("LOCATION", Location);
    headers.Insert("NT", NT);
    headers.Insert("NTS", "ssdp:alive");
    headers.Insert("USN", USN);
    return BeaconSSDPMessage::Encode("NOTIFY * HTTP/1.1", headers);
}

static QByteArray MakeByebye(const QString &NT, const QString &USN)
{
    BeaconSSDPHeaders headers;
    headers.Insert("HOST", "239.255.255.250:1900");
    headers.Insert("NT", NT);
    headers.Insert("NTS", "ssdp:byebye");
    headers.Insert("USN", USN);
    return BeaconSSDPMessage::Encode("NOTIFY * HTTP/1.1", headers);
}

static QByteArray MakeResponse(const QString &USN, const QString &Location)
{
    BeaconSSDPHeaders headers;
    headers.Insert("CACHE-CONTROL", "max-age=1800");
    if (!Location.isEmpty())
        headers.Insert("LOCATION", Location);
    headers.Insert("ST", UPNP_MEDIARENDERER_DEVICE);
    headers.Insert("USN", USN);
    return BeaconSSDPMessage::Encode(SSDP_RESPONSE_ACTION, headers);
}

class BeaconSSDPLocatorTest : public ::testing::Test
{
  protected:
    BeaconSSDPLocatorTest()
      : m_factory(NULL),
        m_network(NULL),
        m_ssdp(NULL),
        m_locator(NULL)
    {
    }

    virtual void SetUp()
    {
        QList<BeaconNetAddress> interfaces = BeaconNetAddress::ParseList("192.168.1.10/24");
        m_factory = new FakeSocketFactory();
        m_network = new FakeNetworkInfo(interfaces);
        m_ssdp    = BeaconSSDP::GetOrCreateInstance(interfaces, m_network, m_factory);
        m_locator = new BeaconSSDPLocator(m_ssdp);
        m_locator->SetGracePeriod(200);

        QObject::connect(m_locator, SIGNAL(DeviceDiscovered(BeaconSSDPDiscoveredDevice)), &m_signals, SLOT(DeviceDiscovered(BeaconSSDPDiscoveredDevice)));
        QObject::connect(m_locator, SIGNAL(DeviceLeft(BeaconSSDPDiscoveredDevice)),       &m_signals, SLOT(DeviceLeft(BeaconSSDPDiscoveredDevice)));
    }

    virtual void TearDown()
    {
        delete m_locator;
        BeaconSSDP::TearDown();
        DeletePendingObjects();
        delete m_network;
        delete m_factory;
    }

    void Inject(const QByteArray &Data, const QString &Address = "192.168.1.20", quint16 Port = SSDP_PORT)
    {
        FakeSocket *listener = m_factory->Listener();
        ASSERT_TRUE(listener != NULL);
        listener->Inject(Data, QHostAddress(Address), Port);
    }

    FakeSocketFactory *m_factory;
    FakeNetworkInfo   *m_network;
    BeaconSSDP        *m_ssdp;
    BeaconSSDPLocator *m_locator;
    SignalRecorder     m_signals;
};

TEST(BeaconSSDPLocator, SearchWaitToMX)
{
    ASSERT_EQ(1, BeaconSSDPLocator::SearchWaitToMX(0));
    ASSERT_EQ(1, BeaconSSDPLocator::SearchWaitToMX(1));
    ASSERT_EQ(1, BeaconSSDPLocator::SearchWaitToMX(2));
    ASSERT_EQ(3, BeaconSSDPLocator::SearchWaitToMX(4));
}

TEST_F(BeaconSSDPLocatorTest, Defaults)
{
    ASSERT_FALSE(m_locator->IsStarted());
    ASSERT_EQ(10, m_locator->GetInitialInterval());
    ASSERT_EQ(60, m_locator->GetInterval());
    ASSERT_FALSE(m_ssdp->IsRunning());
}

TEST_F(BeaconSSDPLocatorTest, SearchesAfterGracePeriod)
{
    m_locator->SetInitialInterval(1);
    m_locator->Start();
    ASSERT_TRUE(m_locator->IsStarted());
    ASSERT_TRUE(m_ssdp->IsRunning());
    ASSERT_TRUE(m_factory->m_sent.isEmpty());

    WaitFor(700);

    ASSERT_EQ(1, m_factory->SentContaining("M-SEARCH * HTTP/1.1\r\n"));
    const QByteArray &search = m_factory->m_sent.first().m_data;
    ASSERT_TRUE(search.contains("MAN: \"ssdp:discover\"\r\n"));
    ASSERT_TRUE(search.contains("MX: 3\r\n"));
    ASSERT_TRUE(search.contains(QString("ST: %1\r\n").arg(UPNP_MEDIARENDERER_DEVICE).toLatin1()));
    ASSERT_TRUE(search.contains("HOST: 239.255.255.250:1900\r\n"));
    ASSERT_FALSE(search.contains("CPFN.UPNP.ORG"));
}

TEST_F(BeaconSSDPLocatorTest, FriendlyNameAtDlna2)
{
    BeaconSSDPConfiguration configuration = m_ssdp->GetConfiguration();
    configuration.SetDlnaVersion(BeaconSSDPConfiguration::DLNA_2_0);
    m_ssdp->SetConfiguration(configuration);

    m_locator->SetGracePeriod(0);
    m_locator->Start();
    WaitFor(200);

    ASSERT_EQ(1, m_factory->SentContaining("CPFN.UPNP.ORG: Beacon\r\n"));
}

TEST_F(BeaconSSDPLocatorTest, SameLocationIsOneDevice)
{
    m_locator->Start();

    Inject(MakeResponse("uuid:1234::" + UPNP_MEDIARENDERER_DEVICE, "http://192.168.1.20:8080/desc.xml"));
    Inject(MakeAlive(UPNP_MEDIARENDERER_DEVICE, "uuid:1234::" + UPNP_MEDIARENDERER_DEVICE, "http://192.168.1.20:8080/desc.xml"));

    ASSERT_EQ(1, m_signals.m_discovered.size());
    ASSERT_EQ(QString("1234"), m_signals.m_discovered.first().Usn());
    ASSERT_EQ(1, m_locator->GetDevices().size());
    ASSERT_EQ(QString("ssdp:alive"), m_locator->GetDevices().first().Headers().Value("NTS"));
}

TEST_F(BeaconSSDPLocatorTest, PlaceholderIsReplaced)
{
    m_locator->Start();

    Inject(MakeResponse("", ""));
    ASSERT_EQ(1, m_signals.m_discovered.size());
    ASSERT_TRUE(m_signals.m_discovered.first().Usn().isEmpty());

    QByteArray alive = MakeAlive(UPNP_MEDIARENDERER_DEVICE, "uuid:1234::" + UPNP_MEDIARENDERER_DEVICE, "http://192.168.1.20:8080/desc.xml");
    Inject(alive);
    ASSERT_EQ(2, m_signals.m_discovered.size());
    ASSERT_EQ(QString("1234"), m_signals.m_discovered.last().Usn());

    Inject(alive);
    ASSERT_EQ(2, m_signals.m_discovered.size());
    ASSERT_EQ(1, m_locator->GetDevices().size());
}

TEST_F(BeaconSSDPLocatorTest, ByebyeRemovesEveryEntry)
{
    m_locator->Start();

    Inject(MakeAlive("upnp:rootdevice", "uuid:1234::upnp:rootdevice", "http://192.168.1.20:8080/root.xml"));
    Inject(MakeAlive(UPNP_MEDIARENDERER_DEVICE, "uuid:1234::" + UPNP_MEDIARENDERER_DEVICE, "http://192.168.1.20:8080/renderer.xml"));
    Inject(MakeAlive(UPNP_MEDIARENDERER_DEVICE, "uuid:5678::" + UPNP_MEDIARENDERER_DEVICE, "http://192.168.1.21:8080/renderer.xml"), "192.168.1.21");
    ASSERT_EQ(3, m_signals.m_discovered.size());

    Inject(MakeByebye(UPNP_MEDIARENDERER_DEVICE, "uuid:1234::" + UPNP_MEDIARENDERER_DEVICE));
    ASSERT_EQ(2, m_signals.m_left.size());
    ASSERT_EQ(QString("1234"), m_signals.m_left.first().Usn());
    ASSERT_EQ(1, m_locator->GetDevices().size());
    ASSERT_EQ(QString("5678"), m_locator->GetDevices().first().Usn());

    // unknown devices are ignored
    Inject(MakeByebye(UPNP_MEDIARENDERER_DEVICE, "uuid:9999::" + UPNP_MEDIARENDERER_DEVICE));
    ASSERT_EQ(2, m_signals.m_left.size());
}

TEST_F(BeaconSSDPLocatorTest, ExpiredDevicesAreSwept)
{
    m_locator->SetInitialInterval(SSDP_DISABLED);
    m_locator->SetInterval(1);
    m_locator->Start();

    Inject(MakeAlive(UPNP_MEDIARENDERER_DEVICE, "uuid:1234::" + UPNP_MEDIARENDERER_DEVICE, "http://192.168.1.20:8080/a.xml", ""));
    Inject(MakeAlive("upnp:rootdevice", "uuid:1234::upnp:rootdevice", "http://192.168.1.20:8080/b.xml", ""));
    Inject(MakeAlive(UPNP_MEDIARENDERER_DEVICE, "uuid:5678::" + UPNP_MEDIARENDERER_DEVICE, "http://192.168.1.21:8080/a.xml"), "192.168.1.21");
    ASSERT_EQ(3, m_signals.m_discovered.size());

    WaitFor(500);

    ASSERT_EQ(1, m_signals.m_left.size());
    ASSERT_EQ(QString("1234"), m_signals.m_left.first().Usn());
    ASSERT_EQ(1, m_locator->GetDevices().size());
    ASSERT_EQ(0, m_factory->SentContaining("M-SEARCH"));
}

TEST_F(BeaconSSDPLocatorTest, CorruptMessagesAreIgnored)
{
    m_locator->Start();

    Inject("NOTIFY * HTTP/1.1\r\nNTS: ssdp:alive\r\nUSN: uuid:1234\r\n\r\n");
    Inject("HTTP/1.1 200 OK\r\nST: ssdp:all\r\n\r\n");
    Inject("NOTIFY * HTTP/1.1\r\nNT: upnp:rootdevice\r\nNTS: ssdp:update\r\nUSN: uuid:1234\r\n\r\n");

    ASSERT_TRUE(m_signals.m_discovered.isEmpty());
    ASSERT_TRUE(m_locator->GetDevices().isEmpty());
}

TEST_F(BeaconSSDPLocatorTest, DisposeIsIdempotent)
{
    m_locator->Start();
    m_locator->Dispose();
    m_locator->Dispose();

    ASSERT_FALSE(m_locator->IsStarted());
    ASSERT_FALSE(m_ssdp->IsRunning());

    m_locator->Start();
    ASSERT_FALSE(m_locator->IsStarted());

    WaitFor(300);
    ASSERT_TRUE(m_factory->m_sent.isEmpty());
}

TEST_F(BeaconSSDPLocatorTest, SlowDownUsesInterval)
{
    m_locator->SetGracePeriod(0);
    m_locator->SetInitialInterval(1);
    m_locator->SetInterval(60);
    m_locator->Start();
    m_locator->SlowDown();

    WaitFor(1500);

    ASSERT_EQ(1, m_factory->SentContaining("M-SEARCH * HTTP/1.1\r\n"));
}
