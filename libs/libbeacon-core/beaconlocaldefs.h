#ifndef BEACONLOCALDEFS_H
#define BEACONLOCALDEFS_H

#define BEACON_MAIN_THREAD QString("MainLoop")

// setting name prefixes
#define BEACON_SSDP        QString("SSDP_")
#define BEACON_DB          QString("DB_")

#endif // BEACONLOCALDEFS_H
