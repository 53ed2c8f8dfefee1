// Qt
#include <QCoreApplication>
#include <QThread>

// Beacon
#include "beaconlocalcontext.h"
#include "beaconexitcodes.h"
#include "beaconcommandline.h"
#include "upnp/beaconssdp.h"
#include "beacondiscoverer.h"

int main(int argc, char **argv)
{
    new QCoreApplication(argc, argv);
    // the 'beacon-' prefix is used for identification purposes elsewhere, don't change it
    QCoreApplication::setApplicationName("beacon-discover");
    QThread::currentThread()->setObjectName(BEACON_MAIN_THREAD);

    int ret = GENERIC_EXIT_OK;
    int initialinterval = 10;
    int interval = 60;
    int slowdown = 60;

    {
        QScopedPointer<BeaconCommandLine> cmdline(new BeaconCommandLine(BeaconCommandLine::Database | BeaconCommandLine::LogFile));
        if (!cmdline.data())
            return GENERIC_EXIT_NOT_OK;

        cmdline->Add("initial-interval", (int)initialinterval, "Seconds between searches at startup (-1 to only listen for announcements).");
        cmdline->Add("search-interval",  (int)interval, "Seconds between searches once slowed down.");
        cmdline->Add("slowdown",         (int)slowdown, "Seconds before switching to the slower search interval (0 to never slow down).");

        bool justexit = false;
        ret = cmdline->Evaluate(QCoreApplication::arguments(), justexit);

        if (ret != GENERIC_EXIT_OK || justexit)
            return ret;

        if (int error = BeaconLocalContext::Create(cmdline.data()))
            return error;

        initialinterval = cmdline->GetValue("initial-interval").toInt();
        interval        = cmdline->GetValue("search-interval").toInt();
        slowdown        = cmdline->GetValue("slowdown").toInt();
    }

    {
        BeaconDiscoverer discoverer(initialinterval, interval, slowdown);
        discoverer.Start();
        ret = qApp->exec();
    }

    BeaconSSDP::TearDown();
    BeaconLocalContext::TearDown();

    return ret;
}
