#include <gtest/gtest.h>

#include "upnp/beaconssdpmessage.h"

TEST(BeaconSSDPHeaders, CaseInsensitiveKeys)
{
    BeaconSSDPHeaders headers;
    headers.Insert("Cache-Control", "max-age=1800");

    ASSERT_TRUE(headers.Contains("CACHE-CONTROL"));
    ASSERT_EQ(QString("max-age=1800"), headers.Value("cache-control"));
    ASSERT_EQ(QString("fallback"), headers.Value("LOCATION", "fallback"));
}

TEST(BeaconSSDPHeaders, InsertReplacesInPlace)
{
    BeaconSSDPHeaders headers;
    headers.Insert("HOST", "");
    headers.Insert("MAN", "\"ssdp:discover\"");
    headers.Insert("host", "239.255.255.250:1900");

    ASSERT_EQ(2, headers.Count());
    ASSERT_EQ(QString("HOST"), headers.Keys().first());
    ASSERT_EQ(QString("239.255.255.250:1900"), headers.Value("HOST"));

    ASSERT_TRUE(headers.Remove("Man"));
    ASSERT_FALSE(headers.Remove("MAN"));
    ASSERT_EQ(1, headers.Count());
}

TEST(BeaconSSDPHeaders, EqualityIgnoresKeyCaseAndOrder)
{
    BeaconSSDPHeaders first;
    first.Insert("ST", "upnp:rootdevice");
    first.Insert("USN", "uuid:1234");

    BeaconSSDPHeaders second;
    second.Insert("usn", "uuid:1234");
    second.Insert("st", "upnp:rootdevice");

    ASSERT_TRUE(first == second);

    second.Insert("ST", "ssdp:all");
    ASSERT_TRUE(first != second);
}

TEST(BeaconSSDPMessage, EncodeFraming)
{
    BeaconSSDPHeaders headers;
    headers.Insert("HOST", "239.255.255.250:1900");
    headers.Insert("MAN", "\"ssdp:discover\"");
    headers.Insert("MX", "3");

    QByteArray encoded = BeaconSSDPMessage::Encode("M-SEARCH * HTTP/1.1", headers);
    ASSERT_EQ(QByteArray("M-SEARCH * HTTP/1.1\r\n"
                         "HOST: 239.255.255.250:1900\r\n"
                         "MAN: \"ssdp:discover\"\r\n"
                         "MX: 3\r\n"
                         "\r\n"), encoded);
}

TEST(BeaconSSDPMessage, DecodeSearchRequest)
{
    QByteArray raw("M-SEARCH * HTTP/1.1\r\n"
                   "Host: 239.255.255.250:1900\r\n"
                   "Man: \"ssdp:discover\"\r\n"
                   "ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n"
                   "\r\n");

    QString action;
    BeaconSSDPHeaders headers;
    ASSERT_TRUE(BeaconSSDPMessage::Decode(raw, action, headers));
    ASSERT_EQ(QString("M-SEARCH * HTTP/1.1"), action);
    ASSERT_EQ(QString("M-SEARCH"), BeaconSSDPMessage::Method(action));
    ASSERT_EQ(3, headers.Count());
    ASSERT_EQ(QString("HOST"), headers.Keys().first());
    ASSERT_EQ(QString("239.255.255.250:1900"), headers.Value("HOST"));
    ASSERT_EQ(QString("urn:schemas-upnp-org:device:MediaRenderer:1"), headers.Value("st"));
}

TEST(BeaconSSDPMessage, DecodeNotifyRequestLine)
{
    QString action;
    BeaconSSDPHeaders headers;
    ASSERT_TRUE(BeaconSSDPMessage::Decode("NOTIFY * HTTP/1.1\r\nNTS: ssdp:alive\r\n\r\n", action, headers));
    ASSERT_EQ(QString("NOTIFY * HTTP/1.1"), action);
    ASSERT_EQ(QString("NOTIFY"), BeaconSSDPMessage::Method(action));
    ASSERT_EQ(QString("ssdp:alive"), headers.Value("NTS"));
}

TEST(BeaconSSDPMessage, RoundTripKnownActions)
{
    BeaconSSDPHeaders headers;
    headers.Insert("CACHE-CONTROL", "max-age=1800");
    headers.Insert("LOCATION", "http://192.168.1.20:8080/description.xml");
    headers.Insert("ST", "urn:schemas-upnp-org:device:MediaRenderer:1");
    headers.Insert("USN", "uuid:ABCDEFAB-1234-0000-0000-000000000000::upnp:rootdevice");

    QStringList actions;
    actions << "M-SEARCH * HTTP/1.1" << "NOTIFY * HTTP/1.1" << "HTTP/1.1 200 OK" << "NOTIFY";

    foreach (const QString &action, actions)
    {
        QString decodedaction;
        BeaconSSDPHeaders decoded;
        ASSERT_TRUE(BeaconSSDPMessage::Decode(BeaconSSDPMessage::Encode(action, headers), decodedaction, decoded));
        ASSERT_EQ(action, decodedaction);
        ASSERT_TRUE(headers == decoded);
    }
}

TEST(BeaconSSDPMessage, MethodOfStartLines)
{
    ASSERT_EQ(QString("M-SEARCH"),        BeaconSSDPMessage::Method("M-SEARCH * HTTP/1.1"));
    ASSERT_EQ(QString("NOTIFY"),          BeaconSSDPMessage::Method("NOTIFY * HTTP/1.1"));
    ASSERT_EQ(QString("NOTIFY"),          BeaconSSDPMessage::Method("NOTIFY"));
    ASSERT_EQ(QString("HTTP/1.1 200 OK"), BeaconSSDPMessage::Method("HTTP/1.1 200 OK"));
    ASSERT_EQ(QString(),                  BeaconSSDPMessage::Method(QString()));
}

TEST(BeaconSSDPMessage, DuplicateHeaderKeepsFirst)
{
    QString action;
    BeaconSSDPHeaders headers;
    ASSERT_TRUE(BeaconSSDPMessage::Decode("HTTP/1.1 200 OK\r\nUSN: uuid:first\r\nusn: uuid:second\r\n\r\n", action, headers));
    ASSERT_EQ(1, headers.Count());
    ASSERT_EQ(QString("uuid:first"), headers.Value("USN"));
}

TEST(BeaconSSDPMessage, ValueKeepsColons)
{
    QString action;
    BeaconSSDPHeaders headers;
    ASSERT_TRUE(BeaconSSDPMessage::Decode("NOTIFY\r\nLOCATION:  http://10.0.0.1:49152/desc.xml \r\n", action, headers));
    ASSERT_EQ(QString("NOTIFY"), action);
    ASSERT_EQ(QString("http://10.0.0.1:49152/desc.xml"), headers.Value("LOCATION"));
}

TEST(BeaconSSDPMessage, MissingStartLine)
{
    QString action("unchanged");
    BeaconSSDPHeaders headers;
    ASSERT_TRUE(BeaconSSDPMessage::Decode("USN: uuid:1234\r\n\r\n", action, headers));
    ASSERT_TRUE(action.isEmpty());
    ASSERT_EQ(QString("uuid:1234"), headers.Value("USN"));

    ASSERT_FALSE(BeaconSSDPMessage::Decode("\r\n\r\n", action, headers));
    ASSERT_TRUE(headers.IsEmpty());
}
