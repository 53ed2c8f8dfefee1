/* Class BeaconCommandLine
*
* This file is part of the Beacon project.
*
* Copyright (C) The Beacon Project 2026
*
* This program is free software; you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation; either version 2 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program; if not, write to the Free Software
* Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301,
* USA.
*/

// Std
#include <stdio.h>

// Qt
#include <QCoreApplication>

// Beacon
#include "beaconversion.h"
#include "beaconexitcodes.h"
#include "beaconlogging.h"
#include "beaconcommandline.h"

/*! \class BeaconCommandLine
 *  \brief Beacon command line handler.
 *
 * BeaconCommandLine always adds handling for help, version, log (-l, the verbose mask) and
 * verbose (-v, the log level). Database and LogFile add --db and --logfile respectively.
 * Custom options are added with Add and their values retrieved with GetValue.
 *
 * Options may be given with one or two leading dashes, and values as '--key value' or
 * '--key=value'.
*/
BeaconCommandLine::BeaconCommandLine(Options Flags)
{
    m_parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsLongOptions);
    m_parser.setApplicationDescription(QString("Beacon Version : %1").arg(BEACON_SOURCE_VERSION));

    Add("h,help",    QVariant(), "Display full usage information.");
    Add("version",   QVariant(), "Display version information.");
    Add("l,log",     QString("general"), "Set the logging mask (e.g. general,ssdp). Use 'help' for a list.");
    Add("v,verbose", QString("info"), "Set the logging level (e.g. info, debug).");

    if (Flags.testFlag(BeaconCommandLine::Database))
        Add("db,database", QString(""), "Use a custom settings database.");
    if (Flags.testFlag(BeaconCommandLine::LogFile))
        Add("logfile", QString(""), "Also log to the given file.");
}

BeaconCommandLine::~BeaconCommandLine()
{
}

/*! \brief Add a custom command line option.
 *
 * \param Keys     A comma separated list of synonymous option names (e.g. "h,help").
 * \param Default  The default value AND type for the option (e.g. QString("info") or (int)5).
 *                 An invalid QVariant adds a flag that takes no value.
 * \param HelpText Brief help text for the option.
*/
void BeaconCommandLine::Add(const QString &Keys, const QVariant &Default, const QString &HelpText)
{
    QStringList keys = Keys.split(",", QString::SkipEmptyParts);
    if (keys.isEmpty())
        return;

    QString master = keys.first();
    if (m_defaults.contains(master) || m_aliases.contains(master))
    {
        fprintf(stderr, "Command line option '%s' already in use - ignoring\n", master.toLocal8Bit().constData());
        return;
    }

    QCommandLineOption option(keys, HelpText);
    if (Default.isValid())
    {
        option.setValueName(Default.type() == QVariant::Int ? QString("number") : QString("value"));
        option.setDefaultValue(Default.toString());
    }

    if (!m_parser.addOption(option))
    {
        fprintf(stderr, "Failed to add command line option '%s'\n", Keys.toLocal8Bit().constData());
        return;
    }

    m_defaults.insert(master, Default);
    foreach (const QString &key, keys)
        m_aliases.insert(key, master);
}

QVariant BeaconCommandLine::GetValue(const QString &Key) const
{
    QString master = m_aliases.value(Key, Key);
    if (m_values.contains(master))
        return m_values.value(master);
    return m_defaults.value(master);
}

/*! \brief Evaluate the command line arguments (including the program name).
 *
 * Exit is set when the application should exit immediately (help, version or an error).
 * Returns GENERIC_EXIT_INVALID_CMDLINE for unknown options, missing or malformed values
 * and invalid logging arguments.
*/
int BeaconCommandLine::Evaluate(const QStringList &Arguments, bool &Exit)
{
    Exit = false;
    m_values.clear();

    QString error;
    if (!m_parser.parse(Arguments))
        error = m_parser.errorText();

    if (error.isEmpty())
    {
        QMap<QString,QVariant>::const_iterator it = m_defaults.constBegin();
        for ( ; it != m_defaults.constEnd(); ++it)
        {
            if (!it.value().isValid())
            {
                m_values.insert(it.key(), m_parser.isSet(it.key()));
                continue;
            }

            QString value = m_parser.value(it.key()).trimmed();
            if (it.value().type() == QVariant::Int)
            {
                bool ok = false;
                int number = value.toInt(&ok);
                if (!ok)
                {
                    error = QString("Option '%1' expects a number ('%2')").arg(it.key()).arg(value);
                    break;
                }
                m_values.insert(it.key(), number);
            }
            else
            {
                m_values.insert(it.key(), value);
            }
        }
    }

    if (error.isEmpty() && !m_parser.positionalArguments().isEmpty())
        error = QString("Unexpected argument '%1'").arg(m_parser.positionalArguments().first());

    if (error.isEmpty())
    {
        if (GetValue("help").toBool())
        {
            fprintf(stdout, "%s", m_parser.helpText().toLocal8Bit().constData());
            Exit = true;
            return GENERIC_EXIT_OK;
        }

        if (GetValue("version").toBool())
        {
            fprintf(stdout, "Beacon Version : %s\nQT Version : %s\n", BEACON_SOURCE_VERSION, QT_VERSION_STR);
            Exit = true;
            return GENERIC_EXIT_OK;
        }

        if (GetLogLevel(GetValue("v").toString()) == LOG_UNKNOWN)
            error = QString("Unknown log level '%1'").arg(GetValue("v").toString());
    }

    if (error.isEmpty())
    {
        int result = ParseVerboseArgument(GetValue("l").toString(), Exit);
        if (result != GENERIC_EXIT_OK)
            Exit = true;
        return result;
    }

    Exit = true;
    fprintf(stderr, "%s\n\n%s", error.toLocal8Bit().constData(), m_parser.helpText().toLocal8Bit().constData());
    return GENERIC_EXIT_INVALID_CMDLINE;
}
