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
//  btpeerobjectpushservice.cpp
//  BtPeer
//

#include "btpeerobjectpushservice_p.h"

#include "dbus/dbusproxy.h"
#include "utils/logging.h"

#include <QDBusVariant>
#include <QDBusPendingReply>


static const char kClient1Interface[] = "org.bluez.obex.Client1";
static const char kObjectPush1Interface[] = "org.bluez.obex.ObjectPush1";
static const char kTransfer1Interface[] = "org.bluez.obex.Transfer1";
static const char kPropertiesInterface[] = "org.freedesktop.DBus.Properties";

// the object obexd exposes the Client1 interface on
static const QDBusObjectPath obexClientPath(QStringLiteral("/org/bluez/obex"));


// -----------------------------------------------------------------------------
/*!
	\class BtPeerObjectPushServiceObex
	\brief Talks to the obexd client over dbus (normally on the session bus).

 */
BtPeerObjectPushServiceObex::BtPeerObjectPushServiceObex(const QDBusConnection &obexDBusConn,
                                                         const QString &obexService,
                                                         int callTimeout)
	: m_obexDBusConn(obexDBusConn)
	, m_obexService(obexService)
	, m_callTimeout(callTimeout)
{
}

BtPeerObjectPushServiceObex::~BtPeerObjectPushServiceObex()
{
}

// -----------------------------------------------------------------------------
/*!
	Creates a new obex session to the device at \a destination using the
	given \a target profile (i.e. "opp").  The path of the new session is
	returned in \a session.

 */
BtPeerError BtPeerObjectPushServiceObex::createSession(const BtAddress &destination,
                                                       const QString &target,
                                                       QDBusObjectPath *session)
{
	DBusProxy client(m_obexDBusConn, m_obexService, obexClientPath,
	                 kClient1Interface, m_callTimeout);

	QVariantMap args;
	args[QStringLiteral("Target")] = target;

	QDBusPendingReply<QDBusObjectPath> reply =
		client.invoke(QStringLiteral("CreateSession"), destination.toString(), args);

	const BtPeerError error = client.wait(reply);
	if (error)
		return error;

	*session = reply.value();
	return BtPeerError();
}

BtPeerError BtPeerObjectPushServiceObex::removeSession(const QDBusObjectPath &session)
{
	DBusProxy client(m_obexDBusConn, m_obexService, obexClientPath,
	                 kClient1Interface, m_callTimeout);
	return client.call(QStringLiteral("RemoveSession"), session);
}

// -----------------------------------------------------------------------------
/*!
	Queues \a filePath for sending on the \a session.  On success the path of
	the new transfer object is stored in \a transfer and its initial
	properties in \a properties.

 */
BtPeerError BtPeerObjectPushServiceObex::sendFile(const QDBusObjectPath &session,
                                                  const QString &filePath,
                                                  QDBusObjectPath *transfer,
                                                  QVariantMap *properties)
{
	DBusProxy push(m_obexDBusConn, m_obexService, session,
	               kObjectPush1Interface, m_callTimeout);

	QDBusPendingReply<QDBusObjectPath, QVariantMap> reply =
		push.invoke(QStringLiteral("SendFile"), filePath);

	const BtPeerError error = push.wait(reply);
	if (error)
		return error;

	*transfer = reply.argumentAt<0>();
	*properties = reply.argumentAt<1>();
	return BtPeerError();
}

BtPeerError BtPeerObjectPushServiceObex::transferStatus(const QDBusObjectPath &transfer,
                                                        QString *status) const
{
	DBusProxy properties(m_obexDBusConn, m_obexService, transfer,
	                     kPropertiesInterface, m_callTimeout);

	QDBusPendingReply<QDBusVariant> reply =
		properties.invoke(QStringLiteral("Get"), QString::fromLatin1(kTransfer1Interface),
		                  QStringLiteral("Status"));

	const BtPeerError error = properties.wait(reply);
	if (error)
		return error;

	*status = reply.value().variant().toString();
	return BtPeerError();
}

BtPeerError BtPeerObjectPushServiceObex::cancelTransfer(const QDBusObjectPath &transfer)
{
	DBusProxy proxy(m_obexDBusConn, m_obexService, transfer,
	                kTransfer1Interface, m_callTimeout);
	return proxy.call(QStringLiteral("Cancel"));
}
