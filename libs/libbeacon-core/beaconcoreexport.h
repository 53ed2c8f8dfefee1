#ifndef BEACON_CORE_EXP_H_
#define BEACON_CORE_EXP_H_

#include <QtCore/qglobal.h>

#ifdef BEACON_CORE_API
# define BEACON_CORE_PUBLIC Q_DECL_EXPORT
#else
# define BEACON_CORE_PUBLIC Q_DECL_IMPORT
#endif

#endif // BEACON_CORE_EXP_H_
