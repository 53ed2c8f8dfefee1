#include <limits.h>
#include <stdexcept>
#include <gtest/gtest.h>

#include "upnp/beaconupnp.h"
#include "upnp/beaconssdpdiscovereddevice.h"

static BeaconSSDPHeaders MakeHeaders(const QString &CacheControl)
{
    BeaconSSDPHeaders headers;
    headers.Insert("CACHE-CONTROL", CacheControl);
    headers.Insert("LOCATION", "http://192.168.1.20:8080/description.xml");
    headers.Insert("NT", "urn:schemas-upnp-org:device:MediaRenderer:1");
    headers.Insert("USN", "uuid:ABCDEFAB-1234-0000-0000-000000000000::urn:schemas-upnp-org:device:MediaRenderer:1");
    return headers;
}

TEST(BeaconSSDPDiscoveredDevice, Fields)
{
    BeaconSSDPDiscoveredDevice device(1000, "NT", MakeHeaders("max-age=1800"), QHostAddress("192.168.1.20"), 1900);

    ASSERT_TRUE(device.IsValid());
    ASSERT_EQ(QString("urn:schemas-upnp-org:device:MediaRenderer:1"), device.NotificationType());
    ASSERT_EQ(QString("ABCDEFAB-1234-0000-0000-000000000000"), device.Usn());
    ASSERT_EQ(QString("http://192.168.1.20:8080/description.xml"), device.Location());
    ASSERT_EQ(QHostAddress("192.168.1.20"), device.Address());
    ASSERT_EQ(1900, device.Port());
    ASSERT_EQ(1800, device.CacheLifetime());
    ASSERT_EQ(1000, device.ReceivedAt());
}

TEST(BeaconSSDPDiscoveredDevice, ZeroLifetimeIsAlwaysExpired)
{
    BeaconSSDPHeaders headers = MakeHeaders("no-cache");
    BeaconSSDPDiscoveredDevice device(5000, "NT", headers, QHostAddress("192.168.1.20"), 1900);

    ASSERT_EQ(0, device.CacheLifetime());
    ASSERT_TRUE(device.IsExpired(5000));
    ASSERT_TRUE(device.IsExpired(0));
}

TEST(BeaconSSDPDiscoveredDevice, ExpiresAtLifetime)
{
    BeaconSSDPDiscoveredDevice device(10000, "NT", MakeHeaders("max-age=30"), QHostAddress("192.168.1.20"), 1900);

    ASSERT_FALSE(device.IsExpired(10000));
    ASSERT_FALSE(device.IsExpired(39999));
    ASSERT_TRUE(device.IsExpired(40000));
    ASSERT_TRUE(device.IsExpired(50000));
}

TEST(BeaconSSDPDiscoveredDevice, CacheControlParsing)
{
    ASSERT_EQ(1800, BeaconSSDPDiscoveredDevice::ParseCacheLifetime("max-age=1800"));
    ASSERT_EQ(60,   BeaconSSDPDiscoveredDevice::ParseCacheLifetime("MAX-AGE = 60"));
    ASSERT_EQ(120,  BeaconSSDPDiscoveredDevice::ParseCacheLifetime("no-cache=\"Ext\", max-age=120"));
    ASSERT_EQ(0,    BeaconSSDPDiscoveredDevice::ParseCacheLifetime("max-age=soon"));
    ASSERT_EQ(0,    BeaconSSDPDiscoveredDevice::ParseCacheLifetime(""));
}

TEST(BeaconSSDPDiscoveredDevice, HugeLifetimeIsCapped)
{
    qint64 now = 1700000000000LL;
    BeaconSSDPDiscoveredDevice device(now, "NT", MakeHeaders("max-age=9300000000000000"), QHostAddress("192.168.1.20"), 1900);

    ASSERT_EQ((qint64)INT_MAX, device.CacheLifetime());
    ASSERT_FALSE(device.IsExpired(now));
    ASSERT_FALSE(device.IsExpired(now + 86400000LL));
    ASSERT_TRUE(device.IsExpired(now + (qint64)INT_MAX * 1000));

    ASSERT_EQ((qint64)INT_MAX, BeaconSSDPDiscoveredDevice::ParseCacheLifetime("max-age=2147483648"));
    ASSERT_EQ((qint64)INT_MAX, BeaconSSDPDiscoveredDevice::ParseCacheLifetime("max-age=99999999999999999999999"));
    ASSERT_EQ(30, BeaconSSDPDiscoveredDevice::ParseCacheLifetime("max-age=000000000000030"));
}

TEST(BeaconSSDPDiscoveredDevice, MissingHeadersThrow)
{
    BeaconSSDPHeaders headers = MakeHeaders("max-age=1800");
    headers.Remove("USN");
    ASSERT_THROW(BeaconSSDPDiscoveredDevice(0, "NT", headers, QHostAddress("192.168.1.20"), 1900), std::runtime_error);

    ASSERT_THROW(BeaconSSDPDiscoveredDevice(0, "ST", MakeHeaders("max-age=1800"), QHostAddress("192.168.1.20"), 1900),
                 std::runtime_error);
}

TEST(BeaconSSDPDiscoveredDevice, EmptyUsnIsPlaceholder)
{
    BeaconSSDPHeaders headers = MakeHeaders("max-age=1800");
    headers.Insert("USN", "");
    BeaconSSDPDiscoveredDevice device(0, "NT", headers, QHostAddress("192.168.1.20"), 1900);
    ASSERT_TRUE(device.Usn().isEmpty());
}

TEST(BeaconUPNP, UUIDFromUSN)
{
    ASSERT_EQ(QString("ABCDEFAB-1234-0000-0000-000000000000"),
              BeaconUPNP::UUIDFromUSN("uuid:ABCDEFAB-1234-0000-0000-000000000000::upnp:rootdevice"));
    ASSERT_EQ(QString("4d696e69-444c-164e-9d41-001c42fc0db6"),
              BeaconUPNP::UUIDFromUSN("UUID:4d696e69-444c-164e-9d41-001c42fc0db6"));
    ASSERT_EQ(QString("1234"), BeaconUPNP::UUIDFromUSN("uuid:{1234}::urn:foo"));
}

TEST(BeaconUPNP, UUIDFromUSNHashFallback)
{
    QString usn("urn:schemas-upnp-org:device:MediaRenderer:1");
    QString hash = BeaconUPNP::UUIDFromUSN(usn);

    ASSERT_EQ(32, hash.size());
    ASSERT_EQ(hash, BeaconUPNP::UUIDFromUSN(usn));
    ASSERT_EQ(BeaconUPNP::HashUSN(usn), hash);
    ASSERT_NE(hash, BeaconUPNP::UUIDFromUSN("urn:schemas-upnp-org:device:MediaServer:1"));
    ASSERT_TRUE(BeaconUPNP::UUIDFromUSN("").isEmpty());
}
