// Qt
#include <QCoreApplication>
#include <QThread>

// GTest
#include <gtest/gtest.h>

// Beacon
#include "beaconlocaldefs.h"
#include "beaconlogging.h"

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("beacon-core-tests");
    QThread::currentThread()->setObjectName(BEACON_MAIN_THREAD);

    StartLogging(QString(), false, LOG_ERR);

    testing::InitGoogleTest(&argc, argv);
    int ret = RUN_ALL_TESTS();

    StopLogging();
    return ret;
}
