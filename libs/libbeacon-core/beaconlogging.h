#ifndef BEACONLOGGING_H_
#define BEACONLOGGING_H_

// Qt
#include <QString>

// Beacon
#include "beaconcoreexport.h"
#include "beaconloggingdefs.h"

#define VERBOSE_LEVEL_CHECK(_MASK_, _LEVEL_) \
    (((gVerboseMask & (_MASK_)) == (quint32)(_MASK_)) && gLogLevel >= (_LEVEL_))

#define LOG(_MASK_, _LEVEL_, _STRING_)                                  \
    do {                                                                \
        if (VERBOSE_LEVEL_CHECK((_MASK_), (_LEVEL_)) && ((_LEVEL_)>=0)) \
        {                                                               \
            PrintLogLine(_MASK_, (LogLevel)_LEVEL_,                     \
                         __FILE__, __LINE__, __FUNCTION__,              \
                         QString(_STRING_));                            \
        }                                                               \
    } while (false)

extern BEACON_CORE_PUBLIC LogLevel gLogLevel;
extern BEACON_CORE_PUBLIC quint32  gVerboseMask;

BEACON_CORE_PUBLIC void     PrintLogLine        (quint32 Mask, LogLevel Level,
                                                 const char *File, int Line,
                                                 const char *Function, const QString &Message);
BEACON_CORE_PUBLIC bool     StartLogging        (const QString &Logfile, bool Console = true,
                                                 LogLevel Level = LOG_INFO);
BEACON_CORE_PUBLIC void     StopLogging         (void);
BEACON_CORE_PUBLIC LogLevel GetLogLevel         (const QString &Level);
BEACON_CORE_PUBLIC QString  GetLogLevelName     (LogLevel Level);
BEACON_CORE_PUBLIC int      ParseVerboseArgument(const QString &Argument, bool &Exit);
BEACON_CORE_PUBLIC QString  GetVerboseString    (void);

#endif
