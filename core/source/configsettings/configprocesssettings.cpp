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
//  configprocesssettings.cpp
//  BtPeer
//

#include "configprocesssettings.h"
#include "configprocesssettings_p.h"

#include <QJsonArray>
#include <QJsonValue>



ConfigProcessSettingsData::ConfigProcessSettingsData()
	: m_valid(false)
{
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Constructs the settings for an external command from the supplied json
	object, if the json object has errors then an invalid object is created.

	The object should be formatted like the following:

	\code
		"pushServer": {
			"program": "obexpushd",
			"arguments": [ "-B", "-n", "-o", "{dir}" ]
		}
	\endcode

	The \c arguments field is optional.
 */
ConfigProcessSettingsData::ConfigProcessSettingsData(const QString &name,
                                                     const QJsonObject &json)
	: m_valid(false)
	, m_name(name)
{
	// program field
	const QJsonValue program = json["program"];
	if (!program.isString() || program.toString().isEmpty()) {
		qWarning("invalid or missing 'program' field for process '%s'",
		         qPrintable(name));
		return;
	}

	m_program = program.toString();

	// arguments field
	const QJsonValue arguments = json["arguments"];
	if (!arguments.isUndefined()) {

		if (!arguments.isArray()) {
			qWarning("invalid 'arguments' field for process '%s'", qPrintable(name));
			return;
		}

		const QJsonArray argsArray = arguments.toArray();
		for (const QJsonValue arg : argsArray) {
			if (!arg.isString()) {
				qWarning("non-string argument for process '%s'", qPrintable(name));
				return;
			}

			m_arguments.append(arg.toString());
		}
	}

	m_valid = true;
}


ConfigProcessSettings::ConfigProcessSettings()
	: d(QSharedPointer<ConfigProcessSettingsData>::create())
{
}

ConfigProcessSettings::ConfigProcessSettings(const QString &name,
                                             const QJsonObject &json)
	: d(QSharedPointer<ConfigProcessSettingsData>::create(name, json))
{
}

ConfigProcessSettings::ConfigProcessSettings(const ConfigProcessSettings &other)
	: d(other.d)
{
}

ConfigProcessSettings::~ConfigProcessSettings()
{
}

ConfigProcessSettings &ConfigProcessSettings::operator=(const ConfigProcessSettings &other)
{
	d = other.d;
	return *this;
}

bool ConfigProcessSettings::isValid() const
{
	return d->m_valid;
}

QString ConfigProcessSettings::name() const
{
	return d->m_name;
}

QString ConfigProcessSettings::program() const
{
	return d->m_program;
}

QStringList ConfigProcessSettings::arguments() const
{
	return d->m_arguments;
}

// -----------------------------------------------------------------------------
/*!
	Returns the arguments with any \c {key} placeholders replaced by the
	matching value in \a placeholders, i.e. \c {dir} with the directory to
	store received files in.

 */
QStringList ConfigProcessSettings::expandedArguments(const QMap<QString, QString> &placeholders) const
{
	QStringList result;
	result.reserve(d->m_arguments.size());

	for (QString arg : d->m_arguments) {

		QMap<QString, QString>::const_iterator it = placeholders.begin();
		for (; it != placeholders.end(); ++it)
			arg.replace(QLatin1Char('{') + it.key() + QLatin1Char('}'), it.value());

		result.append(arg);
	}

	return result;
}

QDebug operator<<(QDebug dbg, const ConfigProcessSettings &settings)
{
	QDebugStateSaver saver(dbg);

	dbg.nospace() << "ConfigProcessSettings("
	              << settings.name() << ": "
	              << settings.program() << ' '
	              << settings.arguments().join(' ')
	              << ")";

	return dbg;
}
