/*
* If not stated otherwise in this file or this component's LICENSE file the
* following copyright and licenses apply:
*
* Copyright 2017-2020 Sky UK
*
* Licensed under the Apache License, Version 2.0 (the "License");
* you may not use this file except in compliance with the License.
* You may obtain a copy of the License at
*
* http://www.apache.org/licenses/LICENSE-2.0
*
* Unless required by applicable law or agreed to in writing, software
* distributed under the License is distributed on an "AS IS" BASIS,
* WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
* See the License for the specific language governing permissions and
* limitations under the License.
*/


//
//  cmdlineoptions.cpp
//  BtPeer
//

#include "cmdlineoptions.h"

#include <QFileInfo>

#include <stdio.h>
#include <stdlib.h>


// -----------------------------------------------------------------------------
/*!
	\class CmdLineOptions
	\brief Parses the btpeerctl command line.

	Parsing has no side effects, the logging options are returned by
	logLevels() and logTargets() for the caller to apply.

 */
CmdLineOptions::CmdLineOptions()
	: m_helpOption({ "h", "help" }, "Displays this help.")
	, m_versionOption({ "V", "version" }, "Displays version information.")
	, m_verboseOption({ "v", "verbose" }, "Enables verbose output, repeat for debug output <false>.")
	, m_quietOption({ "q", "quiet" }, "Only log errors <false>.")
	, m_noConsoleOption({ "k", "noconsole" }, "Disable log output on stderr <false>.")
	, m_sysLogOption({ "l", "syslog" }, "Enables logging to syslog along with standard logging <false>.")
	, m_configOption({ "c", "config" }, "Path to a json config file <built in defaults>.", "file")
	, m_adapterOption({ "d", "adapter" }, "The bluetooth adapter to use <hci0>.", "name")
	, m_capabilityOption({ "C", "capability" }, "The IO capability of the pairing agent <KeyboardDisplay>.", "cap")
	, m_systemBusOption("system-bus", "Talk to bluez on the system dbus <default>.")
	, m_sessionBusOption("session-bus", "Talk to bluez on the session dbus.")
	, m_busAddressOption({ "a", "bus-address" }, "The address of the dbus bluez is on.", "address")
	, m_busType(SystemBus)
	, m_verbosity(0)
	, m_quiet(false)
	, m_sysLog(false)
	, m_noConsole(false)
{
	m_parser.setApplicationDescription("Bluetooth peer device console");

	m_parser.addOptions({ m_helpOption, m_versionOption,
	                      m_verboseOption, m_quietOption,
	                      m_noConsoleOption, m_sysLogOption,
	                      m_configOption, m_adapterOption, m_capabilityOption,
	                      m_systemBusOption, m_sessionBusOption, m_busAddressOption });
}

CmdLineOptions::~CmdLineOptions()
{
}

// -----------------------------------------------------------------------------
/*!
	Parses the command line of \a app.  Prints the help or version text and
	exits if asked to, and exits with an error message if the command line is
	invalid.

 */
void CmdLineOptions::process(const QCoreApplication &app)
{
	if (!parse(app.arguments())) {
		fprintf(stderr, "%s\n", qPrintable(m_errorText));
		fputs(qPrintable(m_parser.helpText()), stderr);
		exit(EXIT_FAILURE);
	}

	if (m_parser.isSet(m_helpOption))
		m_parser.showHelp(EXIT_SUCCESS);

	if (m_parser.isSet(m_versionOption))
		m_parser.showVersion();
}

// -----------------------------------------------------------------------------
/*!
	Parses \a arguments, the first of which is the program name.  Returns
	\c false if an option is unknown or has a bad value, errorText() then
	describes the problem.

 */
bool CmdLineOptions::parse(const QStringList &arguments)
{
	if (!m_parser.parse(arguments)) {
		m_errorText = m_parser.errorText();
		return false;
	}

	return readOptions();
}

QString CmdLineOptions::errorText() const
{
	return m_errorText;
}

bool CmdLineOptions::readOptions()
{
	// optionNames() has an entry per occurrence, so -vv counts twice and a
	// later -q overrides an earlier -v (and vice versa)
	const QStringList names = m_parser.optionNames();
	for (const QString &name : names) {
		if (m_verboseOption.names().contains(name)) {
			m_verbosity++;
			m_quiet = false;
		} else if (m_quietOption.names().contains(name)) {
			m_verbosity = 0;
			m_quiet = true;
		} else if (m_systemBusOption.names().contains(name)) {
			m_busType = SystemBus;
		} else if (m_sessionBusOption.names().contains(name)) {
			m_busType = SessionBus;
		} else if (m_busAddressOption.names().contains(name)) {
			m_busType = CustomBus;
		}
	}

	m_busAddress = m_parser.value(m_busAddressOption);
	m_sysLog = m_parser.isSet(m_sysLogOption);
	m_noConsole = m_parser.isSet(m_noConsoleOption);
	m_adapterName = m_parser.value(m_adapterOption);
	m_agentCapability = m_parser.value(m_capabilityOption);

	if (m_parser.isSet(m_configOption)) {
		const QString filePath = m_parser.value(m_configOption);
		if (!QFileInfo(filePath).isFile()) {
			m_errorText = QStringLiteral("config file '%1' doesn't exist").arg(filePath);
			return false;
		}

		m_configFile = filePath;
	}

	if ((m_busType == CustomBus) && m_busAddress.isEmpty()) {
		m_errorText = QStringLiteral("empty dbus address");
		return false;
	}

	if (!m_parser.positionalArguments().isEmpty()) {
		m_errorText = QStringLiteral("unexpected argument '%1'")
		                  .arg(m_parser.positionalArguments().first());
		return false;
	}

	return true;
}

// -----------------------------------------------------------------------------
/*!
	Returns the type of dbus bluez should be accessed on.  The default is
	CmdLineOptions::SystemBus.

 */
CmdLineOptions::DBusType CmdLineOptions::dbusType() const
{
	return m_busType;
}

// -----------------------------------------------------------------------------
/*!
	Returns the dbus address string, only valid if dbusType() returns
	CmdLineOptions::CustomBus.

 */
QString CmdLineOptions::dbusAddress() const
{
	return m_busAddress;
}

// -----------------------------------------------------------------------------
/*!
	Returns the path to the json config file given on the command line, or an
	empty string if the built in defaults should be used.

 */
QString CmdLineOptions::configFile() const
{
	return m_configFile;
}

QString CmdLineOptions::adapterName() const
{
	return m_adapterName;
}

QString CmdLineOptions::agentCapability() const
{
	return m_agentCapability;
}

// -----------------------------------------------------------------------------
/*!
	Returns the log levels to use.  \c -v enables info messages and a second
	\c -v debug messages as well, \c -q restricts logging to errors.  With
	neither \a defaults is returned.

 */
LoggingLevels CmdLineOptions::logLevels(LoggingLevels defaults) const
{
	if (m_quiet)
		return logLevelsUpTo(LoggingLevel::Error);
	else if (m_verbosity > 1)
		return logLevelsUpTo(LoggingLevel::Debug);
	else if (m_verbosity == 1)
		return logLevelsUpTo(LoggingLevel::Info);
	else
		return defaults;
}

LoggingTargets CmdLineOptions::logTargets(LoggingTargets defaults) const
{
	LoggingTargets targets = defaults;

	if (m_sysLog)
		targets |= LoggingTarget::SysLog;
	if (m_noConsole)
		targets &= ~LoggingTargets(LoggingTarget::Console);

	return targets;
}
