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
//  dbusproxy.h
//  BtPeer
//

#ifndef DBUSPROXY_H
#define DBUSPROXY_H

#include "btpeer/btpeererror.h"

#include <QList>
#include <QString>
#include <QVariant>
#include <QDBusConnection>
#include <QDBusObjectPath>
#include <QDBusPendingCall>
#include <QDBusAbstractInterface>


class DBusProxy : public QDBusAbstractInterface
{
public:
	DBusProxy(const QDBusConnection &connection, const QString &service,
	          const QDBusObjectPath &path, const char *interface,
	          int timeout);
	~DBusProxy() final;

public:
	// queues a call to \a method, each of the arguments is wrapped in a
	// QVariant in the order given
	template <typename... Args>
	QDBusPendingCall invoke(const QString &method, const Args &... args)
	{
		const QList<QVariant> argumentList = { QVariant::fromValue(args)... };
		return asyncCallWithArgumentList(method, argumentList);
	}

	// calls \a method and blocks until it replies or the proxy timeout
	// expires, the reply value (if any) is discarded
	template <typename... Args>
	BtPeerError call(const QString &method, const Args &... args)
	{
		return wait(invoke(method, args...));
	}

	BtPeerError wait(const QDBusPendingCall &call) const;
};


#endif // !defined(DBUSPROXY_H)
