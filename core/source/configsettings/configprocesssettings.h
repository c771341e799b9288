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
//  configprocesssettings.h
//  BtPeer
//

#ifndef CONFIGPROCESSSETTINGS_H
#define CONFIGPROCESSSETTINGS_H

#include <QMap>
#include <QDebug>
#include <QString>
#include <QStringList>
#include <QSharedPointer>
#include <QJsonObject>


class ConfigProcessSettingsData;


class ConfigProcessSettings
{
public:
	ConfigProcessSettings();
	ConfigProcessSettings(const ConfigProcessSettings &other);
	~ConfigProcessSettings();

	ConfigProcessSettings &operator=(const ConfigProcessSettings &other);

private:
	friend class ConfigSettings;
	ConfigProcessSettings(const QString &name, const QJsonObject &json);

public:
	bool isValid() const;

	QString name() const;
	QString program() const;
	QStringList arguments() const;

	QStringList expandedArguments(const QMap<QString, QString> &placeholders) const;

private:
	QSharedPointer<ConfigProcessSettingsData> d;
};

QDebug operator<<(QDebug dbg, const ConfigProcessSettings &settings);


#endif // !defined(CONFIGPROCESSSETTINGS_H)
