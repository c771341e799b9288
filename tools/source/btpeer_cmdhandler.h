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
//  btpeer_cmdhandler.h
//  BtPeer
//

#ifndef BTPEER_CMDHANDLER_H
#define BTPEER_CMDHANDLER_H

#include "base_cmdhandler.h"
#include "btpeer/btpeeragent.h"
#include "btpeer/btpeertransfercoordinator.h"
#include "utils/btaddress.h"

#include <QObject>
#include <QString>
#include <QMap>
#include <QVariant>
#include <QSharedPointer>
#include <QDBusConnection>
#include <QDBusObjectPath>


class ConfigSettings;
class BtPeerBluetoothServiceBluez;
class BtPeerObjectPushService;
class BtPeerSignalRouter;
class BtPeerDeviceManager;
class BtPeerProcess;


class BtPeerCmdHandler : public BaseCmdHandler
{
	Q_OBJECT

public:
	BtPeerCmdHandler(const QSharedPointer<const ConfigSettings> &config,
	                 const QDBusConnection &bluezBus,
	                 const QDBusConnection &obexBus,
	                 const QString &adapterName,
	                 const QString &agentCapability,
	                 QObject *parent = nullptr);
	~BtPeerCmdHandler() final;

public:
	bool isValid() override;

	QString prompt() override;

public slots:
	void listDevices() override;
	void listPaired() override;

	void setScanning(bool on) override;

	void registerAgent(const QString &capability) override;

	void pairDevice(const BtAddress &device) override;
	void connectDevice(const BtAddress &device) override;
	void disconnectDevice(const BtAddress &device) override;
	void unpairDevice(const BtAddress &device) override;

	void deviceStatus(const BtAddress &device) override;
	void mediaControl(const BtAddress &device, const QString &command) override;

	void sendFile(const BtAddress &device, const QString &filePath) override;
	void cancelSend() override;
	void receiveFile(const QString &directory, int timeoutSecs) override;
	void stopReceive() override;

	void playAudio(const QString &filePath) override;
	void stopAudio() override;

	void setDiscoverable(bool on) override;

	void getLogLevel() const override;
	void setLogLevel(const QString &level) override;

	void shutdown() override;

private:
	QVariant onAgentRequest(BtPeerAgent::Request request,
	                        const QDBusObjectPath &device,
	                        const QVariantMap &args);
	bool askYesNo(const QString &question);
	bool ensureAgent();

	bool runHelper(const QString &name, const QMap<QString, QString> &placeholders,
	               BtPeerProcess *process);

private slots:
	void onDevicePairingChanged(const BtAddress &address, bool paired);
	void onTransferProgress(qint64 transferred, qint64 size);
	void onTransferStatusChanged(BtPeerTransferCoordinator::Status status);

private:
	const QSharedPointer<const ConfigSettings> m_config;

	QSharedPointer<BtPeerBluetoothServiceBluez> m_bluetoothService;
	QSharedPointer<BtPeerSignalRouter> m_bluezRouter;
	QSharedPointer<BtPeerObjectPushService> m_pushService;
	QSharedPointer<BtPeerSignalRouter> m_obexRouter;

	BtPeerDeviceManager *m_deviceManager;
	BtPeerTransferCoordinator *m_transfers;
	BtPeerProcess *m_audioPlayer;

	QString m_agentCapability;
	bool m_shutdown;
};

#endif // !defined(BTPEER_CMDHANDLER_H)
