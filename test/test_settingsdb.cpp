#include <gtest/gtest.h>

#include <QTemporaryDir>

#include "beaconlocaldefs.h"
#include "beaconsettingsdb.h"

class BeaconSettingsDBTest : public ::testing::Test
{
  protected:
    void SetUp(void)
    {
        ASSERT_TRUE(m_dir.isValid());
        m_name = m_dir.path() + "/settings.sqlite";
    }

    QTemporaryDir m_dir;
    QString       m_name;
};

TEST_F(BeaconSettingsDBTest, CreateAndReload)
{
    QMap<QString,QString> settings;
    settings.insert("SSDP_UdpSendCount", "3");
    settings.insert("SSDP_UserAgent", "Test/{AppVersion}");

    {
        BeaconSettingsDB db(m_name);
        ASSERT_FALSE(db.IsOpen());
        ASSERT_TRUE(db.Load().isEmpty());
        ASSERT_FALSE(db.Store(settings));

        ASSERT_TRUE(db.Open());
        ASSERT_TRUE(db.IsOpen());

        QMap<QString,QString> loaded = db.Load();
        ASSERT_EQ(1, loaded.size());
        ASSERT_TRUE(loaded.contains(BEACON_DB + "DateCreated"));

        ASSERT_TRUE(db.Store(settings));
    }

    BeaconSettingsDB db(m_name);
    ASSERT_TRUE(db.Open());
    QMap<QString,QString> loaded = db.Load();
    ASSERT_EQ(3, loaded.size());
    ASSERT_EQ(QString("3"), loaded.value("SSDP_UdpSendCount"));
    ASSERT_EQ(QString("Test/{AppVersion}"), loaded.value("SSDP_UserAgent"));
}

TEST_F(BeaconSettingsDBTest, StoreReplacesValues)
{
    BeaconSettingsDB db(m_name);
    ASSERT_TRUE(db.Open());

    QMap<QString,QString> settings;
    settings.insert("SSDP_DeniedDevices", "10.0.0.5");
    ASSERT_TRUE(db.Store(settings));

    settings["SSDP_DeniedDevices"] = "10.0.0.6, 10.0.0.7";
    ASSERT_TRUE(db.Store(settings));

    QMap<QString,QString> loaded = db.Load();
    ASSERT_EQ(QString("10.0.0.6, 10.0.0.7"), loaded.value("SSDP_DeniedDevices"));
    ASSERT_EQ(2, loaded.size());
}

TEST_F(BeaconSettingsDBTest, FailedStoreIsRolledBack)
{
    BeaconSettingsDB db(m_name);
    ASSERT_TRUE(db.Open());

    QMap<QString,QString> settings;
    settings.insert("SSDP_UdpSendCount", "4");
    settings.insert("", "nameless");
    ASSERT_FALSE(db.Store(settings));

    QMap<QString,QString> loaded = db.Load();
    ASSERT_FALSE(loaded.contains("SSDP_UdpSendCount"));
    ASSERT_FALSE(loaded.contains(""));
}

TEST_F(BeaconSettingsDBTest, UnwritableLocationFails)
{
    BeaconSettingsDB db(m_dir.path() + "/missing/directory/settings.sqlite");
    ASSERT_FALSE(db.Open());
    ASSERT_FALSE(db.IsOpen());
}
