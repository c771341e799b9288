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
//  btpeerdevicemanager.h
//  BtPeer
//

#ifndef BTPEERDEVICEMANAGER_H
#define BTPEERDEVICEMANAGER_H

#include "btpeeragent.h"
#include "btpeererror.h"
#include "utils/btaddress.h"
#include "dbus/dbustypes.h"

#include <QObject>
#include <QMap>
#include <QList>
#include <QMutex>
#include <QString>
#include <QSharedPointer>
#include <QDBusObjectPath>


class ConfigSettings;
class BtPeerSignalRouter;
class BtPeerBluetoothService;


struct BtPeerDeviceInfo
{
	QDBusObjectPath path;
	BtAddress address;
	QString alias;
};


class BtPeerDeviceManager : public QObject
{
	Q_OBJECT

public:
	BtPeerDeviceManager(const QSharedPointer<const ConfigSettings> &config,
	                    const QSharedPointer<BtPeerBluetoothService> &service,
	                    const QSharedPointer<BtPeerSignalRouter> &router,
	                    const QString &adapterName = QString(),
	                    QObject *parent = nullptr);
	~BtPeerDeviceManager() final;

public:
	QString adapterName() const;
	QDBusObjectPath adapterPath() const;
	QDBusObjectPath devicePath(const BtAddress &address) const;

	QMap<BtAddress, QString> listPaired() const;
	QList<BtPeerDeviceInfo> listDiscovered() const;

	bool startDiscovery();
	bool stopDiscovery();

	bool registerAgent(const QString &capability = QString(),
	                   const BtPeerAgent::AskFunction &ask = BtPeerAgent::AskFunction());
	bool unregisterAgent();
	bool isAgentRegistered() const;

	bool pair(const BtAddress &address);
	bool connectDevice(const BtAddress &address);
	bool disconnectDevice(const BtAddress &address);
	bool unpair(const BtAddress &address);

	bool isPaired(const BtAddress &address) const;
	bool isConnected(const BtAddress &address) const;

	bool mediaCommand(const QString &command, const BtAddress &address);

	static bool isValidCapability(const QString &capability);

signals:
	void devicePairingChanged(const BtAddress &address, bool paired);

private slots:
	void onAgentReleased();

private:
	bool managedObjects(DBusManagedObjectList *objects) const;
	bool isOnAdapter(const QDBusObjectPath &path,
	                 const QVariantMap &deviceProperties) const;
	bool readDeviceFlag(const BtAddress &address, const char *name,
	                    bool *value) const;
	bool setDiscovering(bool enable);
	bool requestDefaultAgent();

	QDBusObjectPath findDevice(const BtAddress &address) const;
	QDBusObjectPath findMediaPlayer(const BtAddress &address) const;

	static void settle(int msecs);

private:
	const QSharedPointer<const ConfigSettings> m_config;
	const QSharedPointer<BtPeerBluetoothService> m_service;
	const QSharedPointer<BtPeerSignalRouter> m_router;

	const QString m_adapterName;
	const QDBusObjectPath m_adapterPath;

	qint64 m_pairingWatchId;

	mutable QMutex m_agentLock;
	QSharedPointer<BtPeerAgent> m_agent;
	bool m_agentRegistered;
	bool m_agentIsDefault;
};


#endif // !defined(BTPEERDEVICEMANAGER_H)
