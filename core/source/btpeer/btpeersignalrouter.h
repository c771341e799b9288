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
//  btpeersignalrouter.h
//  BtPeer
//

#ifndef BTPEERSIGNALROUTER_H
#define BTPEERSIGNALROUTER_H

#include "utils/btaddress.h"

#include <QObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QDBusConnection>
#include <QDBusMessage>
#include <QDBusObjectPath>

#include <functional>


struct BtPeerSignalEvent
{
	QString interface;
	QString member;
	QDBusObjectPath path;
	QString arg0;
	QVariantMap changed;
	QStringList invalidated;

	static BtPeerSignalEvent propertiesChanged(const QDBusObjectPath &path,
	                                           const QString &interface,
	                                           const QVariantMap &changed,
	                                           const QStringList &invalidated = QStringList());
	static BtPeerSignalEvent fromMessage(const QDBusMessage &message);
};


class BtPeerSignalRouter : public QObject
{
	Q_OBJECT

public:
	typedef std::function<void(const QDBusObjectPath &path,
	                           const QVariantMap &changed)> Handler;
	typedef std::function<void(const BtAddress &address,
	                           bool paired)> PairingStatusHandler;

	static const QString propertiesInterface;
	static const QString propertiesChangedSignal;

public:
	explicit BtPeerSignalRouter(QObject *parent = nullptr);
	BtPeerSignalRouter(const QDBusConnection &connection,
	                   const QString &service,
	                   QObject *parent = nullptr);
	~BtPeerSignalRouter() final;

public:
	qint64 subscribe(const QString &interfaceName, const QString &signalName,
	                 const QString &pathFilter, const Handler &handler,
	                 const QString &arg0Filter = QString());
	qint64 subscribePropertyChanges(const QString &interfaceName,
	                                const QString &pathFilter,
	                                const Handler &handler);
	bool unsubscribe(qint64 id);

	int subscriptionCount() const;

	qint64 watchPairingStatus(const QDBusObjectPath &adapterPath,
	                          const PairingStatusHandler &handler);

public:
	void dispatch(const BtPeerSignalEvent &event);

private slots:
	void onBusSignal(const QDBusMessage &message);

private:
	struct Subscription {
		QString interface;
		QString member;
		QString arg0;
		QString path;
		Handler handler;
	};

	static bool pathMatches(const QString &filter, const QString &path);
	static QString busMatchKey(const Subscription &subscription);

	void addBusMatch(const Subscription &subscription);
	void removeBusMatch(const Subscription &subscription);

private:
	const bool m_attached;
	QDBusConnection m_connection;
	const QString m_service;

	qint64 m_lastId;
	QMap<qint64, Subscription> m_subscriptions;
	QMap<QString, int> m_busMatches;
};


#endif // !defined(BTPEERSIGNALROUTER_H)
