#ifndef BEACONEXITCODES_H
#define BEACONEXITCODES_H

#define GENERIC_EXIT_OK                  0
#define GENERIC_EXIT_NOT_OK              1
#define GENERIC_EXIT_INVALID_CMDLINE   128
#define GENERIC_EXIT_NO_CONTEXT        129

#endif // BEACONEXITCODES_H
