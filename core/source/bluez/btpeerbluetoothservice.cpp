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
//  btpeerbluetoothservice.cpp
//  BtPeer
//

#include "btpeerbluetoothservice_p.h"
#include "bluezagent1adaptor.h"

#include "btpeer/btpeeragent.h"
#include "dbus/dbusproxy.h"
#include "utils/logging.h"

#include <QDBusVariant>
#include <QDBusPendingReply>
#include <QDBusReply>
#include <QDBusConnectionInterface>


static const char kObjectManagerInterface[] = "org.freedesktop.DBus.ObjectManager";
static const char kPropertiesInterface[] = "org.freedesktop.DBus.Properties";
static const char kAdapter1Interface[] = "org.bluez.Adapter1";
static const char kDevice1Interface[] = "org.bluez.Device1";
static const char kAgentManager1Interface[] = "org.bluez.AgentManager1";
static const char kMediaPlayer1Interface[] = "org.bluez.MediaPlayer1";


// -----------------------------------------------------------------------------
/*!
	\class BtPeerBluetoothServiceBluez
	\brief Talks to the bluez daemon over dbus.

	Each call creates a short lived proxy for the object it targets and
	waits for the reply, bus errors are converted to \l{BtPeerError}s.  The
	long running device calls (Pair, Connect and Disconnect) are given the
	caller supplied timeout, everything else uses \a callTimeout.

 */
BtPeerBluetoothServiceBluez::BtPeerBluetoothServiceBluez(const QDBusConnection &bluezDBusConn,
                                                         const QString &bluezService,
                                                         const QString &bluezRoot,
                                                         int callTimeout)
	: m_bluezDBusConn(bluezDBusConn)
	, m_bluezService(bluezService)
	, m_bluezRoot(bluezRoot)
	, m_callTimeout(callTimeout)
{
	registerDBusTypes();
}

BtPeerBluetoothServiceBluez::~BtPeerBluetoothServiceBluez()
{
}

// -----------------------------------------------------------------------------
/*!
	Returns \c true if the bluez service is currently registered on the bus.

 */
bool BtPeerBluetoothServiceBluez::isAvailable() const
{
	QDBusConnectionInterface *iface = m_bluezDBusConn.interface();
	if (!iface)
		return false;

	const QDBusReply<bool> reply = iface->isServiceRegistered(m_bluezService);
	if (!reply.isValid()) {
		qWarning() << "failed to query bluez service" << reply.error();
		return false;
	}

	return reply.value();
}

BtPeerError BtPeerBluetoothServiceBluez::getManagedObjects(DBusManagedObjectList *objects) const
{
	DBusProxy objectManager(m_bluezDBusConn, m_bluezService, QDBusObjectPath("/"),
	                        kObjectManagerInterface, m_callTimeout);

	QDBusPendingReply<DBusManagedObjectList> reply =
		objectManager.invoke(QStringLiteral("GetManagedObjects"));

	const BtPeerError error = objectManager.wait(reply);
	if (error) {
		qError() << "failed to get managed objects due to" << error;
		return error;
	}

	*objects = reply.value();
	return BtPeerError();
}

BtPeerError BtPeerBluetoothServiceBluez::getProperty(const QDBusObjectPath &path,
                                                     const QString &interface,
                                                     const QString &name,
                                                     QVariant *value) const
{
	DBusProxy properties(m_bluezDBusConn, m_bluezService, path,
	                     kPropertiesInterface, m_callTimeout);

	QDBusPendingReply<QDBusVariant> reply =
		properties.invoke(QStringLiteral("Get"), interface, name);

	const BtPeerError error = properties.wait(reply);
	if (error)
		return error;

	*value = reply.value().variant();
	return BtPeerError();
}

BtPeerError BtPeerBluetoothServiceBluez::startDiscovery(const QDBusObjectPath &adapter)
{
	DBusProxy proxy(m_bluezDBusConn, m_bluezService, adapter,
	                kAdapter1Interface, m_callTimeout);
	return proxy.call(QStringLiteral("StartDiscovery"));
}

BtPeerError BtPeerBluetoothServiceBluez::stopDiscovery(const QDBusObjectPath &adapter)
{
	DBusProxy proxy(m_bluezDBusConn, m_bluezService, adapter,
	                kAdapter1Interface, m_callTimeout);
	return proxy.call(QStringLiteral("StopDiscovery"));
}

// -----------------------------------------------------------------------------
/*!
	Asks bluez to remove \a device.  Bluez replies once the request has been
	accepted, the device object may still exist for a short while afterwards.

 */
BtPeerError BtPeerBluetoothServiceBluez::removeDevice(const QDBusObjectPath &adapter,
                                                      const QDBusObjectPath &device)
{
	DBusProxy proxy(m_bluezDBusConn, m_bluezService, adapter,
	                kAdapter1Interface, m_callTimeout);
	return proxy.call(QStringLiteral("RemoveDevice"), device);
}

BtPeerError BtPeerBluetoothServiceBluez::pairDevice(const QDBusObjectPath &device,
                                                    int timeout)
{
	DBusProxy proxy(m_bluezDBusConn, m_bluezService, device,
	                kDevice1Interface, timeout);

	const BtPeerError error = proxy.call(QStringLiteral("Pair"));

	// if we gave up waiting then tell bluez to stop the pairing attempt
	if (error.type() == BtPeerError::TimedOut) {
		proxy.setTimeout(m_callTimeout);

		const BtPeerError cancelError = proxy.call(QStringLiteral("CancelPairing"));
		if (cancelError)
			qWarning() << "failed to cancel pairing due to" << cancelError;
	}

	return error;
}

BtPeerError BtPeerBluetoothServiceBluez::connectDevice(const QDBusObjectPath &device,
                                                       int timeout)
{
	DBusProxy proxy(m_bluezDBusConn, m_bluezService, device,
	                kDevice1Interface, timeout);
	return proxy.call(QStringLiteral("Connect"));
}

BtPeerError BtPeerBluetoothServiceBluez::disconnectDevice(const QDBusObjectPath &device,
                                                          int timeout)
{
	DBusProxy proxy(m_bluezDBusConn, m_bluezService, device,
	                kDevice1Interface, timeout);
	return proxy.call(QStringLiteral("Disconnect"));
}

// -----------------------------------------------------------------------------
/*!
	Attaches the org.bluez.Agent1 adaptor to the \a agent (if not already
	attached) and registers it on the bus under the agent's path.

 */
BtPeerError BtPeerBluetoothServiceBluez::exportAgent(BtPeerAgent *agent)
{
	if (!agent->findChild<BluezAgent1Adaptor*>())
		new BluezAgent1Adaptor(agent, m_bluezDBusConn);

	const QString path = agent->path().path();
	if (m_bluezDBusConn.objectRegisteredAt(path) == agent)
		return BtPeerError();

	if (!m_bluezDBusConn.registerObject(path, agent, QDBusConnection::ExportAdaptors)) {
		qError() << "failed to register agent object at" << path
		         << m_bluezDBusConn.lastError();
		return BtPeerError(BtPeerError::General, "Failed to export agent at %s",
		                   qPrintable(path));
	}

	return BtPeerError();
}

void BtPeerBluetoothServiceBluez::unexportAgent(BtPeerAgent *agent)
{
	const QString path = agent->path().path();
	if (m_bluezDBusConn.objectRegisteredAt(path) == agent)
		m_bluezDBusConn.unregisterObject(path);
}

BtPeerError BtPeerBluetoothServiceBluez::registerAgent(const QDBusObjectPath &agent,
                                                       const QString &capability)
{
	DBusProxy proxy(m_bluezDBusConn, m_bluezService, QDBusObjectPath(m_bluezRoot),
	                kAgentManager1Interface, m_callTimeout);
	return proxy.call(QStringLiteral("RegisterAgent"), agent, capability);
}

BtPeerError BtPeerBluetoothServiceBluez::requestDefaultAgent(const QDBusObjectPath &agent)
{
	DBusProxy proxy(m_bluezDBusConn, m_bluezService, QDBusObjectPath(m_bluezRoot),
	                kAgentManager1Interface, m_callTimeout);
	return proxy.call(QStringLiteral("RequestDefaultAgent"), agent);
}

BtPeerError BtPeerBluetoothServiceBluez::unregisterAgent(const QDBusObjectPath &agent)
{
	DBusProxy proxy(m_bluezDBusConn, m_bluezService, QDBusObjectPath(m_bluezRoot),
	                kAgentManager1Interface, m_callTimeout);
	return proxy.call(QStringLiteral("UnregisterAgent"), agent);
}

// -----------------------------------------------------------------------------
/*!
	Calls one of the no-argument control methods (Play, Pause, Next, ...) on
	the MediaPlayer1 object at \a player.

 */
BtPeerError BtPeerBluetoothServiceBluez::mediaPlayerControl(const QDBusObjectPath &player,
                                                            const QString &method)
{
	DBusProxy proxy(m_bluezDBusConn, m_bluezService, player,
	                kMediaPlayer1Interface, m_callTimeout);
	return proxy.call(method);
}
