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
//  test_signalrouter.cpp
//  BtPeer
//

#include "btpeer/btpeersignalrouter.h"

#include <QList>
#include <QPair>

#include <gtest/gtest.h>


static const QString kDevice1 = QStringLiteral("org.bluez.Device1");
static const QString kTransfer1 = QStringLiteral("org.bluez.obex.Transfer1");


TEST(SignalRouterTest, DeliversOnlyMatchingInterface)
{
	BtPeerSignalRouter router;

	int deviceCalls = 0;
	int transferCalls = 0;

	router.subscribePropertyChanges(kDevice1, QString(),
		[&](const QDBusObjectPath &, const QVariantMap &) { deviceCalls++; });
	router.subscribePropertyChanges(kTransfer1, QString(),
		[&](const QDBusObjectPath &, const QVariantMap &) { transferCalls++; });

	router.dispatch(BtPeerSignalEvent::propertiesChanged(
		QDBusObjectPath(QStringLiteral("/org/bluez/hci0/dev_00_11_22_33_44_55")),
		kDevice1, { { QStringLiteral("Connected"), true } }));

	EXPECT_EQ(deviceCalls, 1);
	EXPECT_EQ(transferCalls, 0);
}

TEST(SignalRouterTest, PathFilterMatchesObjectAndChildrenOnly)
{
	BtPeerSignalRouter router;

	QStringList seen;
	router.subscribePropertyChanges(kDevice1, QStringLiteral("/org/bluez/hci0"),
		[&](const QDBusObjectPath &path, const QVariantMap &) { seen << path.path(); });

	const QVariantMap changed = { { QStringLiteral("Paired"), true } };

	router.dispatch(BtPeerSignalEvent::propertiesChanged(
		QDBusObjectPath(QStringLiteral("/org/bluez/hci0/dev_00_11_22_33_44_55")), kDevice1, changed));
	router.dispatch(BtPeerSignalEvent::propertiesChanged(
		QDBusObjectPath(QStringLiteral("/org/bluez/hci1/dev_00_11_22_33_44_55")), kDevice1, changed));
	router.dispatch(BtPeerSignalEvent::propertiesChanged(
		QDBusObjectPath(QStringLiteral("/org/bluez/hci01/dev_00_11_22_33_44_55")), kDevice1, changed));

	ASSERT_EQ(seen.size(), 1);
	EXPECT_EQ(seen.first(), QStringLiteral("/org/bluez/hci0/dev_00_11_22_33_44_55"));
}

TEST(SignalRouterTest, HandlersCalledInSubscriptionOrder)
{
	BtPeerSignalRouter router;

	QList<int> order;
	router.subscribePropertyChanges(kTransfer1, QString(),
		[&](const QDBusObjectPath &, const QVariantMap &) { order << 1; });
	router.subscribePropertyChanges(kTransfer1, QString(),
		[&](const QDBusObjectPath &, const QVariantMap &) { order << 2; });

	router.dispatch(BtPeerSignalEvent::propertiesChanged(
		QDBusObjectPath(QStringLiteral("/t")), kTransfer1, QVariantMap()));

	EXPECT_EQ(order, (QList<int>() << 1 << 2));
}

TEST(SignalRouterTest, UnsubscribeStopsDelivery)
{
	BtPeerSignalRouter router;

	int calls = 0;
	const qint64 id = router.subscribePropertyChanges(kTransfer1, QString(),
		[&](const QDBusObjectPath &, const QVariantMap &) { calls++; });
	ASSERT_GE(id, 0);
	EXPECT_EQ(router.subscriptionCount(), 1);

	EXPECT_TRUE(router.unsubscribe(id));
	EXPECT_FALSE(router.unsubscribe(id));
	EXPECT_EQ(router.subscriptionCount(), 0);

	router.dispatch(BtPeerSignalEvent::propertiesChanged(
		QDBusObjectPath(QStringLiteral("/t")), kTransfer1, QVariantMap()));
	EXPECT_EQ(calls, 0);
}

TEST(SignalRouterTest, HandlerMayUnsubscribeItselfAndOthers)
{
	BtPeerSignalRouter router;

	int firstCalls = 0;
	int secondCalls = 0;
	qint64 firstId = -1;
	qint64 secondId = -1;

	firstId = router.subscribePropertyChanges(kTransfer1, QString(),
		[&](const QDBusObjectPath &, const QVariantMap &) {
			firstCalls++;
			router.unsubscribe(firstId);
			router.unsubscribe(secondId);
		});
	secondId = router.subscribePropertyChanges(kTransfer1, QString(),
		[&](const QDBusObjectPath &, const QVariantMap &) { secondCalls++; });

	const BtPeerSignalEvent event = BtPeerSignalEvent::propertiesChanged(
		QDBusObjectPath(QStringLiteral("/t")), kTransfer1, QVariantMap());

	router.dispatch(event);
	router.dispatch(event);

	EXPECT_EQ(firstCalls, 1);
	EXPECT_EQ(secondCalls, 0);
}

TEST(SignalRouterTest, RejectsInvalidSubscriptions)
{
	BtPeerSignalRouter router;

	EXPECT_LT(router.subscribePropertyChanges(kDevice1, QString(),
	                                          BtPeerSignalRouter::Handler()), 0);
	EXPECT_LT(router.subscribe(QString(), QStringLiteral("PropertiesChanged"), QString(),
	                           [](const QDBusObjectPath &, const QVariantMap &) { }), 0);
	EXPECT_EQ(router.subscriptionCount(), 0);
}

TEST(SignalRouterTest, WatchPairingStatusReportsAddress)
{
	BtPeerSignalRouter router;

	QList< QPair<BtAddress, bool> > changes;
	router.watchPairingStatus(QDBusObjectPath(QStringLiteral("/org/bluez/hci0")),
		[&](const BtAddress &address, bool paired) { changes << qMakePair(address, paired); });

	// a paired change on a device
	router.dispatch(BtPeerSignalEvent::propertiesChanged(
		QDBusObjectPath(QStringLiteral("/org/bluez/hci0/dev_00_11_22_33_44_55")),
		kDevice1, { { QStringLiteral("Paired"), true } }));

	// a change without the Paired property
	router.dispatch(BtPeerSignalEvent::propertiesChanged(
		QDBusObjectPath(QStringLiteral("/org/bluez/hci0/dev_00_11_22_33_44_55")),
		kDevice1, { { QStringLiteral("RSSI"), -40 } }));

	// a paired change on the adapter itself
	router.dispatch(BtPeerSignalEvent::propertiesChanged(
		QDBusObjectPath(QStringLiteral("/org/bluez/hci0")),
		kDevice1, { { QStringLiteral("Paired"), false } }));

	ASSERT_EQ(changes.size(), 1);
	EXPECT_EQ(changes[0].first, BtAddress("00:11:22:33:44:55"));
	EXPECT_TRUE(changes[0].second);
}
