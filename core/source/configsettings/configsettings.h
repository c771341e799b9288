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
//  configsettings.h
//  BtPeer
//

#ifndef CONFIGSETTINGS_H
#define CONFIGSETTINGS_H

#include "configprocesssettings.h"

#include <QDebug>
#include <QString>
#include <QList>
#include <QByteArray>
#include <QSharedPointer>

#include <QJsonDocument>
#include <QJsonObject>


class QIODevice;


class ConfigSettings
{
public:
	~ConfigSettings();

	static QSharedPointer<ConfigSettings> defaults();
	static QSharedPointer<ConfigSettings> fromJsonFile(const QString &filePath);
	static QSharedPointer<ConfigSettings> fromJsonFile(QIODevice *file);
	static QSharedPointer<ConfigSettings> fromJson(const QByteArray &json);

private:
	struct TimeOuts {
		int pairMSecs;
		int connectMSecs;
		int busCallMSecs;
		int unpairSettleMSecs;
		int transferMSecs;
		int receivePollMSecs;
	};

	struct BluezDetails {
		QString service;
		QString root;
		QString adapter;
	};

	struct AgentDetails {
		QString path;
		QString capability;
	};

	struct ObexDetails {
		QString service;
		QString profile;
	};

private:
	friend class QSharedPointer<ConfigSettings>;
	ConfigSettings(const TimeOuts &timeouts,
	               const BluezDetails &bluez,
	               const AgentDetails &agent,
	               const ObexDetails &obex,
	               QList<ConfigProcessSettings> &&processes);

public:
	int pairTimeout() const;
	int connectTimeout() const;
	int busCallTimeout() const;
	int unpairSettleTime() const;
	int transferTimeout() const;
	int receivePollInterval() const;

	QString bluezService() const;
	QString bluezRoot() const;
	QString adapterName() const;

	QString agentPath() const;
	QString agentCapability() const;

	QString obexService() const;
	QString obexProfile() const;

	ConfigProcessSettings processSettings(const QString &name) const;
	QList<ConfigProcessSettings> processSettings() const;

private:
	static TimeOuts parseTimeouts(const QJsonObject &json);

private:
	const TimeOuts m_timeOuts;
	const BluezDetails m_bluez;
	const AgentDetails m_agent;
	const ObexDetails m_obex;
	const QList<ConfigProcessSettings> m_processes;
};

QDebug operator<<(QDebug dbg, const ConfigSettings &settings);


#endif // !defined(CONFIGSETTINGS_H)
