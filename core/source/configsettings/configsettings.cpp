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
//  configsettings.cpp
//  BtPeer
//

#include "configsettings.h"

#include <QFile>
#include <QBuffer>
#include <QJsonObject>


// -----------------------------------------------------------------------------
/*!
	\internal

	Reads the optional string fields of the \a section object of \a json into
	the storage given in \a fields.  Any field that is missing keeps the
	value it already has, any field that is present but not a string is
	ignored with a warning.

 */
struct StringField {
	const char *name;
	QString *storage;
};

static void parseStringFields(const QJsonObject &json, const char *section,
                              StringField *fields, unsigned int nFields)
{
	const QJsonValue sectionValue = json[section];
	if (sectionValue.isUndefined())
		return;

	if (!sectionValue.isObject()) {
		qWarning("invalid '%s' field, reverting to defaults", section);
		return;
	}

	const QJsonObject sectionObj = sectionValue.toObject();

	for (unsigned int i = 0; i < nFields; i++) {

		const QJsonValue value = sectionObj[fields[i].name];
		if (value.isUndefined())
			continue;

		if (!value.isString() || value.toString().isEmpty())
			qWarning("invalid '%s.%s' field, reverting to default", section, fields[i].name);
		else
			*(fields[i].storage) = value.toString();
	}
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Parses the \a json object to extract the timeout values (in milliseconds).
	The object must be formatted like the following

	\code{.json}
		{
			"pair": 60000,
			"connect": 30000,
			"busCall": 10000,
			"unpairSettle": 1000,
			"transfer": 300000,
			"receivePoll": 100
		}
	\endcode

	\see fromJsonFile()
 */
ConfigSettings::TimeOuts ConfigSettings::parseTimeouts(const QJsonObject &json)
{
	TimeOuts timeouts = { 60000, 30000, 10000, 1000, 300000, 100 };

	// only the unpair settle delay may be zero
	struct {
		const char *name;
		int *storage;
		int minimum;
	} fields[6] = {
		{ "pair",           &timeouts.pairMSecs,           1 },
		{ "connect",        &timeouts.connectMSecs,        1 },
		{ "busCall",        &timeouts.busCallMSecs,        1 },
		{ "unpairSettle",   &timeouts.unpairSettleMSecs,   0 },
		{ "transfer",       &timeouts.transferMSecs,       1 },
		{ "receivePoll",    &timeouts.receivePollMSecs,    1 },
	};

	// process the fields
	for (unsigned int i = 0; i < (sizeof(fields) / sizeof(fields[0])); i++) {

		const QJsonValue value = json[fields[i].name];
		if (!value.isUndefined()) {
			if (!value.isDouble() || (value.toInt(-1) < fields[i].minimum))
				qWarning("invalid '%s' field, reverting to default", fields[i].name);
			else
				*(fields[i].storage) = value.toInt(*(fields[i].storage));
		}
	}

	return timeouts;
}

// -----------------------------------------------------------------------------
/*!
	Returns the default config settings.

	These settings are read from the defaultconfig.json file that is stored
	in the resources of the library.

	\see fromJsonFile()
 */
QSharedPointer<ConfigSettings> ConfigSettings::defaults()
{
	// the resources are in a static library so need explicit init
	Q_INIT_RESOURCE(btpeer);

	return fromJsonFile(QStringLiteral(":defaultconfig.json"));
}

// -----------------------------------------------------------------------------
/*!
	Parses a json config file and returns a \l{QSharedPointer} to a
	\l{ConfigSettings} object.  If the json is not valid or one or more of
	mandatory fields is missing or malformed then a null shared pointer is
	returned.

	\see defaults()
 */
QSharedPointer<ConfigSettings> ConfigSettings::fromJsonFile(const QString &filePath)
{
	// try and open the config file
	QFile file(filePath);
	if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
		qWarning() << "failed to open config file" << filePath;
		return QSharedPointer<ConfigSettings>();
	}

	// process the file
	return fromJsonFile(&file);
}

QSharedPointer<ConfigSettings> ConfigSettings::fromJsonFile(QIODevice *file)
{
	return fromJson(file->readAll());
}

// -----------------------------------------------------------------------------
/*!
	Parses the \a json document and returns a \l{QSharedPointer} to a
	\l{ConfigSettings} object.

	The only mandatory field is the \c timeouts object, all other sections
	are optional and any field missing from them takes the built in default.
	The document looks like the following:

	\code{.json}
		{
			"timeouts": { ... },
			"bluez": {
				"service": "org.bluez",
				"root": "/org/bluez",
				"adapter": "hci0"
			},
			"agent": {
				"path": "/com/btpeer/agent",
				"capability": "KeyboardDisplay"
			},
			"obex": {
				"service": "org.bluez.obex",
				"profile": "opp"
			},
			"processes": {
				"pushServer": { "program": "obexpushd", "arguments": [ ... ] },
				...
			}
		}
	\endcode

	\see parseTimeouts()
 */
QSharedPointer<ConfigSettings> ConfigSettings::fromJson(const QByteArray &json)
{
	// parse the json
	QJsonParseError error;
	QJsonDocument jsonDoc = QJsonDocument::fromJson(json, &error);
	if (jsonDoc.isNull()) {
		qWarning() << "failed to parse config file" << error.errorString();
		return QSharedPointer<ConfigSettings>();
	}

	// the json must be an object
	if (!jsonDoc.isObject()) {
		qWarning("json config file is not an object");
		return QSharedPointer<ConfigSettings>();
	}

	const QJsonObject jsonObj = jsonDoc.object();


	// find the timeout params
	QJsonValue timeoutsParam = jsonObj["timeouts"];
	if (!timeoutsParam.isObject()) {
		qWarning("missing or invalid 'timeouts' field in config");
		return QSharedPointer<ConfigSettings>();
	}

	TimeOuts timeouts = parseTimeouts(timeoutsParam.toObject());


	// the bus details
	BluezDetails bluez = { QStringLiteral("org.bluez"),
	                       QStringLiteral("/org/bluez"),
	                       QStringLiteral("hci0") };
	StringField bluezFields[3] = {
		{ "service",    &bluez.service  },
		{ "root",       &bluez.root     },
		{ "adapter",    &bluez.adapter  },
	};
	parseStringFields(jsonObj, "bluez", bluezFields, 3);

	AgentDetails agent = { QStringLiteral("/com/btpeer/agent"),
	                       QStringLiteral("KeyboardDisplay") };
	StringField agentFields[2] = {
		{ "path",       &agent.path         },
		{ "capability", &agent.capability   },
	};
	parseStringFields(jsonObj, "agent", agentFields, 2);

	ObexDetails obex = { QStringLiteral("org.bluez.obex"),
	                     QStringLiteral("opp") };
	StringField obexFields[2] = {
		{ "service",    &obex.service   },
		{ "profile",    &obex.profile   },
	};
	parseStringFields(jsonObj, "obex", obexFields, 2);


	// the external commands
	QList<ConfigProcessSettings> processes;

	const QJsonValue jsonProcesses = jsonObj["processes"];
	if (jsonProcesses.isObject()) {

		const QJsonObject processesObj = jsonProcesses.toObject();
		for (auto it = processesObj.begin(); it != processesObj.end(); ++it) {

			if (!it.value().isObject()) {
				qWarning("invalid process '%s' in config", qPrintable(it.key()));
				continue;
			}

			ConfigProcessSettings settings(it.key(), it.value().toObject());
			if (!settings.isValid())
				continue;

			processes.append(settings);
		}

	} else if (!jsonProcesses.isUndefined()) {
		qWarning("invalid 'processes' field in config");
	}

	// finally return the config
	return QSharedPointer<ConfigSettings>::create(timeouts, bluez, agent, obex,
	                                              std::move(processes));
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Internal constructor used when config is read from a json document.

	\see fromJson()
 */
ConfigSettings::ConfigSettings(const TimeOuts &timeouts,
                               const BluezDetails &bluez,
                               const AgentDetails &agent,
                               const ObexDetails &obex,
                               QList<ConfigProcessSettings> &&processes)
	: m_timeOuts(timeouts)
	, m_bluez(bluez)
	, m_agent(agent)
	, m_obex(obex)
	, m_processes(std::move(processes))
{
}

ConfigSettings::~ConfigSettings()
{
}

// -----------------------------------------------------------------------------
/*!
	Returns the time in milliseconds to wait for bluez to reply to a pair
	request.  This includes the time the operator takes to answer any agent
	prompts.

	The default value is 60000ms.
 */
int ConfigSettings::pairTimeout() const
{
	return m_timeOuts.pairMSecs;
}

// -----------------------------------------------------------------------------
/*!
	Returns the time in milliseconds to wait for a connect or disconnect
	request to complete.

	The default value is 30000ms.
 */
int ConfigSettings::connectTimeout() const
{
	return m_timeOuts.connectMSecs;
}

// -----------------------------------------------------------------------------
/*!
	Returns the timeout in milliseconds for all other bus calls.

	The default value is 10000ms.
 */
int ConfigSettings::busCallTimeout() const
{
	return m_timeOuts.busCallMSecs;
}

// -----------------------------------------------------------------------------
/*!
	Returns the time in milliseconds to wait after asking bluez to remove a
	device before checking that it has gone.

	The default value is 1000ms.
 */
int ConfigSettings::unpairSettleTime() const
{
	return m_timeOuts.unpairSettleMSecs;
}

// -----------------------------------------------------------------------------
/*!
	Returns the maximum time in milliseconds an outgoing file transfer may
	take before it is cancelled.

	The default value is 300000ms.
 */
int ConfigSettings::transferTimeout() const
{
	return m_timeOuts.transferMSecs;
}

// -----------------------------------------------------------------------------
/*!
	Returns the interval in milliseconds on which the receive directory is
	polled for new files.

	The default value is 100ms.
 */
int ConfigSettings::receivePollInterval() const
{
	return m_timeOuts.receivePollMSecs;
}

QString ConfigSettings::bluezService() const
{
	return m_bluez.service;
}

QString ConfigSettings::bluezRoot() const
{
	return m_bluez.root;
}

QString ConfigSettings::adapterName() const
{
	return m_bluez.adapter;
}

QString ConfigSettings::agentPath() const
{
	return m_agent.path;
}

QString ConfigSettings::agentCapability() const
{
	return m_agent.capability;
}

QString ConfigSettings::obexService() const
{
	return m_obex.service;
}

QString ConfigSettings::obexProfile() const
{
	return m_obex.profile;
}

// -----------------------------------------------------------------------------
/*!
	Returns the settings for the external command with the given \a name.
	If no matching command is found then an invalid ConfigProcessSettings is
	returned.

 */
ConfigProcessSettings ConfigSettings::processSettings(const QString &name) const
{
	for (const ConfigProcessSettings &settings : m_processes) {
		if (settings.name() == name)
			return settings;
	}

	return ConfigProcessSettings();
}

QList<ConfigProcessSettings> ConfigSettings::processSettings() const
{
	return m_processes;
}

// -----------------------------------------------------------------------------
/*!
	Debugging function to dump out the settings.

 */
QDebug operator<<(QDebug dbg, const ConfigSettings &settings)
{
	QDebugStateSaver saver(dbg);

	dbg.nospace() << "ConfigSettings("
	              << "pairTimeout="         << settings.pairTimeout() << "ms, "
	              << "connectTimeout="      << settings.connectTimeout() << "ms, "
	              << "busCallTimeout="      << settings.busCallTimeout() << "ms, "
	              << "unpairSettleTime="    << settings.unpairSettleTime() << "ms, "
	              << "transferTimeout="     << settings.transferTimeout() << "ms, "
	              << "adapter="             << settings.adapterName() << ", "
	              << "agentPath="           << settings.agentPath() << ", "
	              << "processes="           << settings.processSettings().length()
	              << ")";

	return dbg;
}
