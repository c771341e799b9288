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
//  fakebluetoothservice.h
//  BtPeer
//

#ifndef FAKEBLUETOOTHSERVICE_H
#define FAKEBLUETOOTHSERVICE_H

#include "btpeer/btpeerbluetoothservice.h"
#include "btpeer/btpeeragent.h"
#include "utils/btaddress.h"

#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>


// -----------------------------------------------------------------------------
/*!
	\class FakeBluetoothService
	\brief In memory stand-in for bluez.

	Holds a managed object list that the tests populate, device commands
	update the \c Paired / \c Connected properties of the device object so
	the read-back checks in the device manager see the result.  Every call
	is counted.

 */
class FakeBluetoothService : public BtPeerBluetoothService
{
public:
	FakeBluetoothService()
		: pairSetsPaired(true)
		, connectSetsConnected(true)
		, removeIsNoop(false)
		, pairCalls(0)
		, connectCalls(0)
		, disconnectCalls(0)
		, removeCalls(0)
		, startDiscoveryCalls(0)
		, stopDiscoveryCalls(0)
		, exportCalls(0)
		, unexportCalls(0)
		, registerCalls(0)
		, defaultCalls(0)
		, unregisterCalls(0)
	{ }

	~FakeBluetoothService() override = default;

public:
	void addAdapter(const QString &path, bool discovering = false)
	{
		QVariantMap properties;
		properties[QStringLiteral("Discovering")] = discovering;
		objects[QDBusObjectPath(path)][QStringLiteral("org.bluez.Adapter1")] = properties;
	}

	QDBusObjectPath addDevice(const QString &adapterPath, const BtAddress &address,
	                          const QString &alias, bool paired = false,
	                          bool connected = false)
	{
		const QDBusObjectPath path = address.devicePath(QDBusObjectPath(adapterPath));

		QVariantMap properties;
		properties[QStringLiteral("Address")] = address.toString();
		properties[QStringLiteral("Alias")] = alias;
		properties[QStringLiteral("Adapter")] = QVariant::fromValue(QDBusObjectPath(adapterPath));
		properties[QStringLiteral("Paired")] = paired;
		properties[QStringLiteral("Connected")] = connected;

		objects[path][QStringLiteral("org.bluez.Device1")] = properties;
		return path;
	}

	void setDeviceProperty(const QDBusObjectPath &path, const QString &name,
	                       const QVariant &value)
	{
		if (objects.contains(path))
			objects[path][QStringLiteral("org.bluez.Device1")][name] = value;
	}

public:
	BtPeerError getManagedObjects(DBusManagedObjectList *list) const override
	{
		*list = objects;
		return BtPeerError();
	}

	BtPeerError getProperty(const QDBusObjectPath &path, const QString &interface,
	                        const QString &name, QVariant *value) const override
	{
		const auto object = objects.find(path);
		if (object == objects.end())
			return BtPeerError(BtPeerError::DoesNotExist, "no object");

		const auto iface = object.value().find(interface);
		if (iface == object.value().end())
			return BtPeerError(BtPeerError::DoesNotExist, "no interface");

		const auto property = iface.value().find(name);
		if (property == iface.value().end())
			return BtPeerError(BtPeerError::InvalidArg, "no property");

		*value = property.value();
		return BtPeerError();
	}

	BtPeerError startDiscovery(const QDBusObjectPath &adapter) override
	{
		startDiscoveryCalls++;
		objects[adapter][QStringLiteral("org.bluez.Adapter1")][QStringLiteral("Discovering")] = true;
		return BtPeerError();
	}

	BtPeerError stopDiscovery(const QDBusObjectPath &adapter) override
	{
		stopDiscoveryCalls++;
		objects[adapter][QStringLiteral("org.bluez.Adapter1")][QStringLiteral("Discovering")] = false;
		return BtPeerError();
	}

	BtPeerError removeDevice(const QDBusObjectPath &adapter,
	                         const QDBusObjectPath &device) override
	{
		Q_UNUSED(adapter);

		removeCalls++;
		if (!removeIsNoop)
			objects.remove(device);
		return BtPeerError();
	}

	BtPeerError pairDevice(const QDBusObjectPath &device, int timeout) override
	{
		Q_UNUSED(timeout);

		pairCalls++;
		if (pairError)
			return pairError;
		if (pairSetsPaired)
			setDeviceProperty(device, QStringLiteral("Paired"), true);
		return BtPeerError();
	}

	BtPeerError connectDevice(const QDBusObjectPath &device, int timeout) override
	{
		Q_UNUSED(timeout);

		connectCalls++;
		if (connectSetsConnected)
			setDeviceProperty(device, QStringLiteral("Connected"), true);
		return BtPeerError();
	}

	BtPeerError disconnectDevice(const QDBusObjectPath &device, int timeout) override
	{
		Q_UNUSED(timeout);

		disconnectCalls++;
		setDeviceProperty(device, QStringLiteral("Connected"), false);
		return BtPeerError();
	}

	BtPeerError exportAgent(BtPeerAgent *agent) override
	{
		Q_UNUSED(agent);
		exportCalls++;
		return BtPeerError();
	}

	void unexportAgent(BtPeerAgent *agent) override
	{
		Q_UNUSED(agent);
		unexportCalls++;
	}

	BtPeerError registerAgent(const QDBusObjectPath &agent,
	                          const QString &capability) override
	{
		Q_UNUSED(agent);
		registerCalls++;
		lastCapability = capability;
		return BtPeerError();
	}

	BtPeerError requestDefaultAgent(const QDBusObjectPath &agent) override
	{
		Q_UNUSED(agent);
		defaultCalls++;
		return defaultError;
	}

	BtPeerError unregisterAgent(const QDBusObjectPath &agent) override
	{
		Q_UNUSED(agent);
		unregisterCalls++;
		return BtPeerError();
	}

	BtPeerError mediaPlayerControl(const QDBusObjectPath &player,
	                               const QString &method) override
	{
		mediaCalls.append(qMakePair(player, method));
		return BtPeerError();
	}

public:
	DBusManagedObjectList objects;

	bool pairSetsPaired;
	bool connectSetsConnected;
	bool removeIsNoop;
	BtPeerError pairError;
	BtPeerError defaultError;

	int pairCalls;
	int connectCalls;
	int disconnectCalls;
	int removeCalls;
	int startDiscoveryCalls;
	int stopDiscoveryCalls;
	int exportCalls;
	int unexportCalls;
	int registerCalls;
	int defaultCalls;
	int unregisterCalls;

	QString lastCapability;
	QList< QPair<QDBusObjectPath, QString> > mediaCalls;
};

#endif // !defined(FAKEBLUETOOTHSERVICE_H)
