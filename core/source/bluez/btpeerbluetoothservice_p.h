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
//  btpeerbluetoothservice_p.h
//  BtPeer
//

#ifndef BTPEERBLUETOOTHSERVICE_P_H
#define BTPEERBLUETOOTHSERVICE_P_H

#include "btpeer/btpeerbluetoothservice.h"

#include <QString>
#include <QDBusConnection>


class BtPeerBluetoothServiceBluez : public BtPeerBluetoothService
{
public:
	BtPeerBluetoothServiceBluez(const QDBusConnection &bluezDBusConn,
	                            const QString &bluezService,
	                            const QString &bluezRoot,
	                            int callTimeout);
	~BtPeerBluetoothServiceBluez() final;

public:
	bool isAvailable() const;

	BtPeerError getManagedObjects(DBusManagedObjectList *objects) const override;
	BtPeerError getProperty(const QDBusObjectPath &path,
	                        const QString &interface,
	                        const QString &name,
	                        QVariant *value) const override;

	BtPeerError startDiscovery(const QDBusObjectPath &adapter) override;
	BtPeerError stopDiscovery(const QDBusObjectPath &adapter) override;
	BtPeerError removeDevice(const QDBusObjectPath &adapter,
	                         const QDBusObjectPath &device) override;

	BtPeerError pairDevice(const QDBusObjectPath &device, int timeout) override;
	BtPeerError connectDevice(const QDBusObjectPath &device, int timeout) override;
	BtPeerError disconnectDevice(const QDBusObjectPath &device, int timeout) override;

	BtPeerError exportAgent(BtPeerAgent *agent) override;
	void unexportAgent(BtPeerAgent *agent) override;

	BtPeerError registerAgent(const QDBusObjectPath &agent,
	                          const QString &capability) override;
	BtPeerError requestDefaultAgent(const QDBusObjectPath &agent) override;
	BtPeerError unregisterAgent(const QDBusObjectPath &agent) override;

	BtPeerError mediaPlayerControl(const QDBusObjectPath &player,
	                               const QString &method) override;

private:
	QDBusConnection m_bluezDBusConn;
	const QString m_bluezService;
	const QString m_bluezRoot;
	const int m_callTimeout;
};


#endif // !defined(BTPEERBLUETOOTHSERVICE_P_H)
