#ifndef BEACONCOMMANDLINE_H
#define BEACONCOMMANDLINE_H

// Qt
#include <QMap>
#include <QVariant>
#include <QStringList>
#include <QCommandLineParser>

// Beacon
#include "beaconcoreexport.h"

class BEACON_CORE_PUBLIC BeaconCommandLine
{
  public:
    enum Option
    {
        None     = (0 << 0),
        Database = (1 << 0),
        LogFile  = (1 << 1)
    };

    Q_DECLARE_FLAGS(Options, Option)

  public:
    explicit BeaconCommandLine(BeaconCommandLine::Options Flags);
    ~BeaconCommandLine();

    int       Evaluate  (const QStringList &Arguments, bool &Exit);
    void      Add       (const QString &Keys, const QVariant &Default, const QString &HelpText);
    QVariant  GetValue  (const QString &Key) const;

  private:
    QCommandLineParser      m_parser;
    QMap<QString,QVariant>  m_defaults;
    QMap<QString,QString>   m_aliases;
    QMap<QString,QVariant>  m_values;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(BeaconCommandLine::Options)

#endif // BEACONCOMMANDLINE_H
