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
//  cmdlineoptions.h
//  BtPeer
//

#ifndef CMDLINEOPTIONS_H
#define CMDLINEOPTIONS_H

#include "utils/logging.h"

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QStringList>
#include <QString>


class CmdLineOptions
{
public:
	CmdLineOptions();
	~CmdLineOptions();

	void process(const QCoreApplication &app);
	bool parse(const QStringList &arguments);

	QString errorText() const;

public:
	enum DBusType {
		SessionBus,
		SystemBus,
		CustomBus
	};

	DBusType dbusType() const;
	QString dbusAddress() const;

	QString configFile() const;
	QString adapterName() const;
	QString agentCapability() const;

	LoggingLevels logLevels(LoggingLevels defaults) const;
	LoggingTargets logTargets(LoggingTargets defaults) const;

private:
	bool readOptions();

private:
	QCommandLineParser m_parser;

	const QCommandLineOption m_helpOption;
	const QCommandLineOption m_versionOption;
	const QCommandLineOption m_verboseOption;
	const QCommandLineOption m_quietOption;
	const QCommandLineOption m_noConsoleOption;
	const QCommandLineOption m_sysLogOption;
	const QCommandLineOption m_configOption;
	const QCommandLineOption m_adapterOption;
	const QCommandLineOption m_capabilityOption;
	const QCommandLineOption m_systemBusOption;
	const QCommandLineOption m_sessionBusOption;
	const QCommandLineOption m_busAddressOption;

	QString m_errorText;

	DBusType m_busType;
	QString m_busAddress;

	QString m_configFile;
	QString m_adapterName;
	QString m_agentCapability;

	int m_verbosity;
	bool m_quiet;
	bool m_sysLog;
	bool m_noConsole;
};

#endif // !defined(CMDLINEOPTIONS_H)
