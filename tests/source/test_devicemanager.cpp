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
//  test_devicemanager.cpp
//  BtPeer
//

#include "fakes/fakebluetoothservice.h"

#include "btpeer/btpeerdevicemanager.h"
#include "btpeer/btpeersignalrouter.h"
#include "configsettings/configsettings.h"

#include <QList>
#include <QPair>

#include <gtest/gtest.h>


static const QString kAdapterPath = QStringLiteral("/org/bluez/hci0");

static const BtAddress kPhone("00:11:22:33:44:55");
static const BtAddress kHeadset("66:77:88:99:AA:BB");


class DeviceManagerTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		m_config = ConfigSettings::fromJson(R"({
			"timeouts": {
				"pair": 1000,
				"connect": 1000,
				"busCall": 1000,
				"unpairSettle": 0,
				"transfer": 1000,
				"receivePoll": 10
			},
			"agent": { "capability": "DisplayYesNo" }
		})");
		ASSERT_FALSE(m_config.isNull());

		m_service = QSharedPointer<FakeBluetoothService>::create();
		m_service->addAdapter(kAdapterPath);

		m_router = QSharedPointer<BtPeerSignalRouter>::create();

		m_manager.reset(new BtPeerDeviceManager(m_config, m_service, m_router));
	}

	void TearDown() override
	{
		m_manager.reset();
	}

protected:
	QSharedPointer<const ConfigSettings> m_config;
	QSharedPointer<FakeBluetoothService> m_service;
	QSharedPointer<BtPeerSignalRouter> m_router;
	QScopedPointer<BtPeerDeviceManager> m_manager;
};


TEST_F(DeviceManagerTest, UsesAdapterFromConfig)
{
	EXPECT_EQ(m_manager->adapterName(), QStringLiteral("hci0"));
	EXPECT_EQ(m_manager->adapterPath().path(), kAdapterPath);
	EXPECT_EQ(m_manager->devicePath(kPhone).path(),
	          QStringLiteral("/org/bluez/hci0/dev_00_11_22_33_44_55"));
}

TEST_F(DeviceManagerTest, ListPairedFiltersByAdapterAndState)
{
	m_service->addAdapter(QStringLiteral("/org/bluez/hci1"));

	const QDBusObjectPath phone = m_service->addDevice(kAdapterPath, kPhone, QStringLiteral("phone alias"), true);
	m_service->setDeviceProperty(phone, QStringLiteral("Name"), QStringLiteral("Phone"));
	m_service->addDevice(kAdapterPath, kHeadset, QStringLiteral("Headset"), false);
	m_service->addDevice(QStringLiteral("/org/bluez/hci1"), BtAddress("AA:AA:AA:AA:AA:AA"),
	                     QStringLiteral("Other"), true);

	const QMap<BtAddress, QString> paired = m_manager->listPaired();

	ASSERT_EQ(paired.size(), 1);
	EXPECT_EQ(paired.firstKey(), kPhone);
	EXPECT_EQ(paired.first(), QStringLiteral("Phone"));
}

TEST_F(DeviceManagerTest, ListPairedFallsBackToAliasAndPathAddress)
{
	const QDBusObjectPath headset = m_service->addDevice(kAdapterPath, kHeadset,
	                                                     QStringLiteral("Headset"), true);
	m_service->setDeviceProperty(headset, QStringLiteral("Address"), QString());

	const QMap<BtAddress, QString> paired = m_manager->listPaired();

	ASSERT_EQ(paired.size(), 1);
	EXPECT_EQ(paired.firstKey(), kHeadset);
	EXPECT_EQ(paired.first(), QStringLiteral("Headset"));
}

TEST_F(DeviceManagerTest, ListDiscoveredReturnsAllDevicesOnAdapter)
{
	m_service->addDevice(kAdapterPath, kPhone, QStringLiteral("Phone"), true);
	m_service->addDevice(kAdapterPath, kHeadset, QStringLiteral("Headset"), false);

	const QList<BtPeerDeviceInfo> devices = m_manager->listDiscovered();

	ASSERT_EQ(devices.size(), 2);
	EXPECT_EQ(devices[0].address, kPhone);
	EXPECT_EQ(devices[0].alias, QStringLiteral("Phone"));
	EXPECT_EQ(devices[1].address, kHeadset);
}

TEST_F(DeviceManagerTest, DiscoveryOnlySentWhenStateDiffers)
{
	EXPECT_TRUE(m_manager->startDiscovery());
	EXPECT_TRUE(m_manager->startDiscovery());
	EXPECT_EQ(m_service->startDiscoveryCalls, 1);

	EXPECT_TRUE(m_manager->stopDiscovery());
	EXPECT_TRUE(m_manager->stopDiscovery());
	EXPECT_EQ(m_service->stopDiscoveryCalls, 1);
}

TEST_F(DeviceManagerTest, PairAlreadyPairedSendsNothing)
{
	m_service->addDevice(kAdapterPath, kPhone, QStringLiteral("Phone"), true);

	EXPECT_TRUE(m_manager->pair(kPhone));
	EXPECT_EQ(m_service->pairCalls, 0);
}

TEST_F(DeviceManagerTest, PairRegistersAgentAndVerifies)
{
	m_service->addDevice(kAdapterPath, kPhone, QStringLiteral("Phone"));

	EXPECT_TRUE(m_manager->pair(kPhone));
	EXPECT_EQ(m_service->pairCalls, 1);
	EXPECT_EQ(m_service->registerCalls, 1);
	EXPECT_EQ(m_service->lastCapability, QStringLiteral("DisplayYesNo"));
	EXPECT_TRUE(m_manager->isAgentRegistered());
	EXPECT_TRUE(m_manager->isPaired(kPhone));
}

TEST_F(DeviceManagerTest, PairFailsWhenNotPairedAfterwards)
{
	m_service->addDevice(kAdapterPath, kPhone, QStringLiteral("Phone"));
	m_service->pairSetsPaired = false;

	EXPECT_FALSE(m_manager->pair(kPhone));
	EXPECT_EQ(m_service->pairCalls, 1);
}

TEST_F(DeviceManagerTest, PairFailsOnBusError)
{
	m_service->addDevice(kAdapterPath, kPhone, QStringLiteral("Phone"));
	m_service->pairError = BtPeerError(BtPeerError::Rejected, "Authentication Rejected");

	EXPECT_FALSE(m_manager->pair(kPhone));
	EXPECT_FALSE(m_manager->isPaired(kPhone));
}

TEST_F(DeviceManagerTest, InvalidAddressRejected)
{
	EXPECT_FALSE(m_manager->pair(BtAddress()));
	EXPECT_FALSE(m_manager->connectDevice(BtAddress()));
	EXPECT_FALSE(m_manager->disconnectDevice(BtAddress()));
	EXPECT_FALSE(m_manager->unpair(BtAddress()));
	EXPECT_EQ(m_service->pairCalls + m_service->connectCalls +
	          m_service->disconnectCalls + m_service->removeCalls, 0);
}

TEST_F(DeviceManagerTest, ConnectAndDisconnect)
{
	m_service->addDevice(kAdapterPath, kHeadset, QStringLiteral("Headset"), true);

	EXPECT_TRUE(m_manager->connectDevice(kHeadset));
	EXPECT_TRUE(m_manager->isConnected(kHeadset));
	EXPECT_TRUE(m_manager->connectDevice(kHeadset));
	EXPECT_EQ(m_service->connectCalls, 1);

	EXPECT_TRUE(m_manager->disconnectDevice(kHeadset));
	EXPECT_FALSE(m_manager->isConnected(kHeadset));
	EXPECT_EQ(m_service->disconnectCalls, 1);
}

TEST_F(DeviceManagerTest, DisconnectWhenNotConnectedSendsNothing)
{
	m_service->addDevice(kAdapterPath, kHeadset, QStringLiteral("Headset"), true, false);

	EXPECT_TRUE(m_manager->disconnectDevice(kHeadset));
	EXPECT_TRUE(m_manager->disconnectDevice(kHeadset));
	EXPECT_EQ(m_service->disconnectCalls, 0);
}

TEST_F(DeviceManagerTest, ConnectFailsWhenNotConnectedAfterwards)
{
	m_service->addDevice(kAdapterPath, kHeadset, QStringLiteral("Headset"), true);
	m_service->connectSetsConnected = false;

	EXPECT_FALSE(m_manager->connectDevice(kHeadset));
}

TEST_F(DeviceManagerTest, UnknownDeviceIsNotPairedOrConnected)
{
	EXPECT_FALSE(m_manager->isPaired(kPhone));
	EXPECT_FALSE(m_manager->isConnected(kPhone));
}

TEST_F(DeviceManagerTest, UnpairRemovesDevice)
{
	m_service->addDevice(kAdapterPath, kPhone, QStringLiteral("Phone"), true);

	EXPECT_TRUE(m_manager->unpair(kPhone));
	EXPECT_EQ(m_service->removeCalls, 1);
	EXPECT_TRUE(m_manager->listDiscovered().isEmpty());
}

TEST_F(DeviceManagerTest, UnpairUnknownDeviceSucceedsWithoutRemove)
{
	EXPECT_TRUE(m_manager->unpair(kPhone));
	EXPECT_EQ(m_service->removeCalls, 0);
}

TEST_F(DeviceManagerTest, UnpairFailsIfDeviceRemains)
{
	m_service->addDevice(kAdapterPath, kPhone, QStringLiteral("Phone"), true);
	m_service->removeIsNoop = true;

	EXPECT_FALSE(m_manager->unpair(kPhone));
	EXPECT_EQ(m_service->removeCalls, 1);
}

TEST_F(DeviceManagerTest, AgentRegistration)
{
	EXPECT_FALSE(m_manager->registerAgent(QStringLiteral("Telepathy")));
	EXPECT_EQ(m_service->registerCalls, 0);

	EXPECT_TRUE(m_manager->registerAgent(QStringLiteral("NoInputNoOutput")));
	EXPECT_TRUE(m_manager->registerAgent(QStringLiteral("NoInputNoOutput")));
	EXPECT_EQ(m_service->exportCalls, 1);
	EXPECT_EQ(m_service->registerCalls, 1);
	EXPECT_EQ(m_service->defaultCalls, 1);
	EXPECT_EQ(m_service->lastCapability, QStringLiteral("NoInputNoOutput"));

	EXPECT_TRUE(m_manager->unregisterAgent());
	EXPECT_TRUE(m_manager->unregisterAgent());
	EXPECT_EQ(m_service->unregisterCalls, 1);
	EXPECT_EQ(m_service->unexportCalls, 1);
	EXPECT_FALSE(m_manager->isAgentRegistered());
}

TEST_F(DeviceManagerTest, DefaultAgentRequestIsRetried)
{
	m_service->defaultError = BtPeerError(BtPeerError::NotReady, "not now");

	EXPECT_FALSE(m_manager->registerAgent(QStringLiteral("KeyboardDisplay")));
	EXPECT_TRUE(m_manager->isAgentRegistered());
	EXPECT_EQ(m_service->registerCalls, 1);
	EXPECT_EQ(m_service->defaultCalls, 1);

	m_service->defaultError = BtPeerError();

	EXPECT_TRUE(m_manager->registerAgent(QStringLiteral("KeyboardDisplay")));
	EXPECT_EQ(m_service->exportCalls, 1);
	EXPECT_EQ(m_service->registerCalls, 1);
	EXPECT_EQ(m_service->defaultCalls, 2);

	EXPECT_TRUE(m_manager->registerAgent(QStringLiteral("KeyboardDisplay")));
	EXPECT_EQ(m_service->defaultCalls, 2);
}

TEST_F(DeviceManagerTest, ValidCapabilities)
{
	EXPECT_TRUE(BtPeerDeviceManager::isValidCapability(QStringLiteral("DisplayOnly")));
	EXPECT_TRUE(BtPeerDeviceManager::isValidCapability(QStringLiteral("DisplayYesNo")));
	EXPECT_TRUE(BtPeerDeviceManager::isValidCapability(QStringLiteral("KeyboardOnly")));
	EXPECT_TRUE(BtPeerDeviceManager::isValidCapability(QStringLiteral("NoInputNoOutput")));
	EXPECT_TRUE(BtPeerDeviceManager::isValidCapability(QStringLiteral("KeyboardDisplay")));
	EXPECT_FALSE(BtPeerDeviceManager::isValidCapability(QStringLiteral("keyboarddisplay")));
	EXPECT_FALSE(BtPeerDeviceManager::isValidCapability(QString()));
}

TEST_F(DeviceManagerTest, PairingChangesAreSignalled)
{
	QList< QPair<BtAddress, bool> > changes;
	QObject::connect(m_manager.data(), &BtPeerDeviceManager::devicePairingChanged,
	                 [&](const BtAddress &address, bool paired) {
	                     changes << qMakePair(address, paired);
	                 });

	m_router->dispatch(BtPeerSignalEvent::propertiesChanged(
		kPhone.devicePath(QDBusObjectPath(kAdapterPath)),
		QStringLiteral("org.bluez.Device1"),
		{ { QStringLiteral("Paired"), false } }));

	// changes on another adapter are not ours
	m_router->dispatch(BtPeerSignalEvent::propertiesChanged(
		kPhone.devicePath(QDBusObjectPath(QStringLiteral("/org/bluez/hci1"))),
		QStringLiteral("org.bluez.Device1"),
		{ { QStringLiteral("Paired"), true } }));

	ASSERT_EQ(changes.size(), 1);
	EXPECT_EQ(changes[0].first, kPhone);
	EXPECT_FALSE(changes[0].second);
}

TEST_F(DeviceManagerTest, PairingWatchRemovedOnDestruction)
{
	EXPECT_EQ(m_router->subscriptionCount(), 1);
	m_manager.reset();
	EXPECT_EQ(m_router->subscriptionCount(), 0);
}

TEST_F(DeviceManagerTest, MediaCommandsGoToDevicePlayer)
{
	const QDBusObjectPath headset = m_service->addDevice(kAdapterPath, kHeadset,
	                                                     QStringLiteral("Headset"), true, true);
	const QDBusObjectPath player(headset.path() + QStringLiteral("/player0"));
	m_service->objects[player][QStringLiteral("org.bluez.MediaPlayer1")] = QVariantMap();

	EXPECT_TRUE(m_manager->mediaCommand(QStringLiteral("play"), kHeadset));
	EXPECT_TRUE(m_manager->mediaCommand(QStringLiteral("NEXT"), kHeadset));
	EXPECT_FALSE(m_manager->mediaCommand(QStringLiteral("eject"), kHeadset));
	EXPECT_FALSE(m_manager->mediaCommand(QStringLiteral("play"), kPhone));

	ASSERT_EQ(m_service->mediaCalls.size(), 2);
	EXPECT_EQ(m_service->mediaCalls[0].first, player);
	EXPECT_EQ(m_service->mediaCalls[0].second, QStringLiteral("Play"));
	EXPECT_EQ(m_service->mediaCalls[1].second, QStringLiteral("Next"));
}
