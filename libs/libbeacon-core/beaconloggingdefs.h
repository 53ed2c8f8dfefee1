#ifndef BEACONLOGGINGDEFS_H_
#define BEACONLOGGINGDEFS_H_

// Output categories selectable with -l/--log
enum VerboseMask
{
    VB_NONE     = 0x00000000,
    VB_GENERAL  = 0x00000001,
    VB_NETWORK  = 0x00000002,
    VB_SSDP     = 0x00000004,
    VB_SOCKET   = 0x00000008,
    VB_DATABASE = 0x00000010,
    VB_ALL      = 0x000000ff
};

// Syslog style severities selectable with -v/--verbose
enum LogLevel
{
    LOG_ANY     = -1,
    LOG_EMERG   = 0,
    LOG_ALERT   = 1,
    LOG_CRIT    = 2,
    LOG_ERR     = 3,
    LOG_WARNING = 4,
    LOG_NOTICE  = 5,
    LOG_INFO    = 6,
    LOG_DEBUG   = 7,
    LOG_UNKNOWN = 8
};

#endif
