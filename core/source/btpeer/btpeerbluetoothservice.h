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
//  btpeerbluetoothservice.h
//  BtPeer
//

#ifndef BTPEERBLUETOOTHSERVICE_H
#define BTPEERBLUETOOTHSERVICE_H

#include "btpeererror.h"
#include "dbus/dbustypes.h"

#include <QString>
#include <QVariant>
#include <QDBusObjectPath>


class BtPeerAgent;


class BtPeerBluetoothService
{
protected:
	BtPeerBluetoothService() = default;

public:
	virtual ~BtPeerBluetoothService() = default;

public:
	virtual BtPeerError getManagedObjects(DBusManagedObjectList *objects) const = 0;
	virtual BtPeerError getProperty(const QDBusObjectPath &path,
	                                const QString &interface,
	                                const QString &name,
	                                QVariant *value) const = 0;

	virtual BtPeerError startDiscovery(const QDBusObjectPath &adapter) = 0;
	virtual BtPeerError stopDiscovery(const QDBusObjectPath &adapter) = 0;
	virtual BtPeerError removeDevice(const QDBusObjectPath &adapter,
	                                 const QDBusObjectPath &device) = 0;

	virtual BtPeerError pairDevice(const QDBusObjectPath &device, int timeout) = 0;
	virtual BtPeerError connectDevice(const QDBusObjectPath &device, int timeout) = 0;
	virtual BtPeerError disconnectDevice(const QDBusObjectPath &device, int timeout) = 0;

	virtual BtPeerError exportAgent(BtPeerAgent *agent) = 0;
	virtual void unexportAgent(BtPeerAgent *agent) = 0;

	virtual BtPeerError registerAgent(const QDBusObjectPath &agent,
	                                  const QString &capability) = 0;
	virtual BtPeerError requestDefaultAgent(const QDBusObjectPath &agent) = 0;
	virtual BtPeerError unregisterAgent(const QDBusObjectPath &agent) = 0;

	virtual BtPeerError mediaPlayerControl(const QDBusObjectPath &player,
	                                       const QString &method) = 0;
};


#endif // !defined(BTPEERBLUETOOTHSERVICE_H)
