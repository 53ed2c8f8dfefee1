#include <gtest/gtest.h>

#include "beaconexitcodes.h"
#include "beaconlogging.h"
#include "beaconcommandline.h"

class BeaconCommandLineTest : public ::testing::Test
{
  protected:
    void SetUp(void)
    {
        m_mask = gVerboseMask;
        m_cmdline = new BeaconCommandLine(BeaconCommandLine::Database | BeaconCommandLine::LogFile);
        m_cmdline->Add("initial-interval", (int)10, "Seconds between searches at startup.");
        m_cmdline->Add("s,search-interval", (int)60, "Seconds between searches once slowed down.");
    }

    void TearDown(void)
    {
        delete m_cmdline;
        gVerboseMask = m_mask;
    }

    int Evaluate(const QStringList &Arguments, bool &Exit)
    {
        return m_cmdline->Evaluate(QStringList("beacon-discover") + Arguments, Exit);
    }

    quint32            m_mask;
    BeaconCommandLine *m_cmdline;
};

TEST_F(BeaconCommandLineTest, Defaults)
{
    bool exit = true;
    ASSERT_EQ(GENERIC_EXIT_OK, Evaluate(QStringList(), exit));
    ASSERT_FALSE(exit);

    ASSERT_EQ(10, m_cmdline->GetValue("initial-interval").toInt());
    ASSERT_EQ(60, m_cmdline->GetValue("search-interval").toInt());
    ASSERT_EQ(QString("info"), m_cmdline->GetValue("verbose").toString());
    ASSERT_TRUE(m_cmdline->GetValue("db").toString().isEmpty());
    ASSERT_FALSE(m_cmdline->GetValue("help").toBool());
}

TEST_F(BeaconCommandLineTest, ValuesAndAliases)
{
    QStringList arguments;
    arguments << "--initial-interval=-1" << "-s" << "30" << "-db" << "/tmp/settings.sqlite"
              << "-l" << "ssdp" << "--verbose" << "debug";

    bool exit = true;
    ASSERT_EQ(GENERIC_EXIT_OK, Evaluate(arguments, exit));
    ASSERT_FALSE(exit);

    ASSERT_EQ(-1, m_cmdline->GetValue("initial-interval").toInt());
    ASSERT_EQ(30, m_cmdline->GetValue("search-interval").toInt());
    ASSERT_EQ(30, m_cmdline->GetValue("s").toInt());
    ASSERT_EQ(QString("/tmp/settings.sqlite"), m_cmdline->GetValue("database").toString());
    ASSERT_EQ(QString("debug"), m_cmdline->GetValue("v").toString());
    ASSERT_EQ((quint32)(VB_GENERAL | VB_SSDP), gVerboseMask);
}

TEST_F(BeaconCommandLineTest, HelpExitsCleanly)
{
    bool exit = false;
    ASSERT_EQ(GENERIC_EXIT_OK, Evaluate(QStringList("--help"), exit));
    ASSERT_TRUE(exit);

    exit = false;
    ASSERT_EQ(GENERIC_EXIT_OK, Evaluate(QStringList("-version"), exit));
    ASSERT_TRUE(exit);
}

TEST_F(BeaconCommandLineTest, Errors)
{
    bool exit = false;
    ASSERT_EQ(GENERIC_EXIT_INVALID_CMDLINE, Evaluate(QStringList("--bogus"), exit));
    ASSERT_TRUE(exit);

    exit = false;
    ASSERT_EQ(GENERIC_EXIT_INVALID_CMDLINE, Evaluate(QStringList("--initial-interval=soon"), exit));
    ASSERT_TRUE(exit);

    exit = false;
    ASSERT_EQ(GENERIC_EXIT_INVALID_CMDLINE, Evaluate(QStringList("--slowdown"), exit));
    ASSERT_TRUE(exit);

    exit = false;
    ASSERT_EQ(GENERIC_EXIT_INVALID_CMDLINE, Evaluate(QStringList() << "-v" << "loud", exit));
    ASSERT_TRUE(exit);

    exit = false;
    ASSERT_EQ(GENERIC_EXIT_INVALID_CMDLINE, Evaluate(QStringList() << "-l" << "ssdp,bogus", exit));
    ASSERT_TRUE(exit);

    exit = false;
    ASSERT_EQ(GENERIC_EXIT_INVALID_CMDLINE, Evaluate(QStringList("stray"), exit));
    ASSERT_TRUE(exit);
}

TEST_F(BeaconCommandLineTest, MissingValue)
{
    bool exit = false;
    ASSERT_EQ(GENERIC_EXIT_INVALID_CMDLINE, Evaluate(QStringList("--logfile"), exit));
    ASSERT_TRUE(exit);
}
