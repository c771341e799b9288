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
//  test_transfercoordinator.cpp
//  BtPeer
//

#include "fakes/fakeobjectpushservice.h"

#include "btpeer/btpeertransfercoordinator.h"
#include "btpeer/btpeersignalrouter.h"
#include "configsettings/configsettings.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTimer>
#include <QTemporaryDir>
#include <QTemporaryFile>
#include <QList>
#include <QPair>

#include <limits>

#include <gtest/gtest.h>


static const BtAddress kTarget("00:11:22:33:44:55");
static const QString kTransfer1 = QStringLiteral("org.bluez.obex.Transfer1");


// -----------------------------------------------------------------------------
/*!
	\internal

	Builds a config with short timeouts, \a pushServer is the json object
	used for the push server process.

 */
static QSharedPointer<const ConfigSettings> testConfig(int transferTimeout,
                                                       const QByteArray &pushServer)
{
	const QByteArray json =
		"{ \"timeouts\": { \"busCall\": 1000, \"transfer\": " +
		QByteArray::number(transferTimeout) + ", \"receivePoll\": 10 },"
		"  \"processes\": { \"pushServer\": " + pushServer + " } }";

	return ConfigSettings::fromJson(json);
}


class TransferCoordinatorTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		createCoordinator(2000, "{ \"program\": \"/bin/sleep\", \"arguments\": [ \"30\" ] }");

		ASSERT_TRUE(m_file.open());
		m_file.write(QByteArray(1024, 'x'));
		m_file.flush();
	}

	void TearDown() override
	{
		m_coordinator.reset();
	}

	void createCoordinator(int transferTimeout, const QByteArray &pushServer)
	{
		m_coordinator.reset();

		m_config = testConfig(transferTimeout, pushServer);
		ASSERT_FALSE(m_config.isNull());

		m_service = QSharedPointer<FakeObjectPushService>::create();
		m_router = QSharedPointer<BtPeerSignalRouter>::create();

		m_coordinator.reset(new BtPeerTransferCoordinator(m_config, m_service, m_router));
	}

	void deliverStatus(int delay, const QString &status, qint64 transferred = -1)
	{
		QSharedPointer<BtPeerSignalRouter> router = m_router;
		QTimer::singleShot(delay, [router, status, transferred]() {
			QVariantMap changed;
			changed[QStringLiteral("Status")] = status;
			if (transferred >= 0)
				changed[QStringLiteral("Transferred")] = transferred;

			router->dispatch(BtPeerSignalEvent::propertiesChanged(
				FakeObjectPushService::transferPath(), kTransfer1, changed));
		});
	}

protected:
	QTemporaryFile m_file;

	QSharedPointer<const ConfigSettings> m_config;
	QSharedPointer<FakeObjectPushService> m_service;
	QSharedPointer<BtPeerSignalRouter> m_router;
	QScopedPointer<BtPeerTransferCoordinator> m_coordinator;
};


TEST_F(TransferCoordinatorTest, StatusStrings)
{
	EXPECT_EQ(BtPeerTransferCoordinator::statusFromString(QStringLiteral("queued")),
	          BtPeerTransferCoordinator::Queued);
	EXPECT_EQ(BtPeerTransferCoordinator::statusFromString(QStringLiteral("suspended")),
	          BtPeerTransferCoordinator::Active);
	EXPECT_EQ(BtPeerTransferCoordinator::statusFromString(QStringLiteral("bogus")),
	          BtPeerTransferCoordinator::Unknown);
	EXPECT_EQ(BtPeerTransferCoordinator::statusToString(BtPeerTransferCoordinator::TimedOut),
	          QStringLiteral("timed-out"));

	EXPECT_TRUE(BtPeerTransferCoordinator::isTerminal(BtPeerTransferCoordinator::Complete));
	EXPECT_TRUE(BtPeerTransferCoordinator::isTerminal(BtPeerTransferCoordinator::Cancelled));
	EXPECT_FALSE(BtPeerTransferCoordinator::isTerminal(BtPeerTransferCoordinator::Active));
}

TEST_F(TransferCoordinatorTest, SendCompletes)
{
	QList< QPair<qint64, qint64> > progress;
	QObject::connect(m_coordinator.data(), &BtPeerTransferCoordinator::transferProgress,
	                 [&](qint64 transferred, qint64 size) {
	                     progress << qMakePair(transferred, size);
	                 });

	deliverStatus(20, QStringLiteral("active"), 512);
	deliverStatus(40, QStringLiteral("complete"), 1024);

	const BtPeerTransferCoordinator::Status status =
		m_coordinator->send(kTarget, m_file.fileName());

	EXPECT_EQ(status, BtPeerTransferCoordinator::Complete);
	EXPECT_EQ(m_service->createCalls, 1);
	EXPECT_EQ(m_service->lastDestination, kTarget);
	EXPECT_EQ(m_service->lastTarget, QStringLiteral("opp"));
	EXPECT_EQ(m_service->lastFile, QFileInfo(m_file.fileName()).absoluteFilePath());
	EXPECT_EQ(m_service->removeCalls, 1);
	EXPECT_EQ(m_service->cancelCalls, 0);

	ASSERT_EQ(progress.size(), 2);
	EXPECT_EQ(progress[0], qMakePair(qint64(512), qint64(1024)));
	EXPECT_EQ(progress[1], qMakePair(qint64(1024), qint64(1024)));

	EXPECT_FALSE(m_coordinator->isSending());
	EXPECT_EQ(m_coordinator->state(), BtPeerTransferCoordinator::Finished);
	EXPECT_EQ(m_router->subscriptionCount(), 0);
}

TEST_F(TransferCoordinatorTest, SendReportsError)
{
	deliverStatus(20, QStringLiteral("active"));
	deliverStatus(40, QStringLiteral("error"));

	EXPECT_EQ(m_coordinator->send(kTarget, m_file.fileName()),
	          BtPeerTransferCoordinator::Error);
	EXPECT_EQ(m_service->removeCalls, 1);
	EXPECT_EQ(m_service->cancelCalls, 0);
}

TEST_F(TransferCoordinatorTest, TerminalStatusIsNotOverwritten)
{
	deliverStatus(20, QStringLiteral("complete"));
	deliverStatus(20, QStringLiteral("error"));

	EXPECT_EQ(m_coordinator->send(kTarget, m_file.fileName()),
	          BtPeerTransferCoordinator::Complete);
}

TEST_F(TransferCoordinatorTest, AlreadyCompleteReturnsImmediately)
{
	m_service->status = QStringLiteral("complete");

	EXPECT_EQ(m_coordinator->send(kTarget, m_file.fileName()),
	          BtPeerTransferCoordinator::Complete);
	EXPECT_EQ(m_service->removeCalls, 1);
}

TEST_F(TransferCoordinatorTest, MissingFileFailsWithoutSession)
{
	EXPECT_EQ(m_coordinator->send(kTarget, QStringLiteral("/nonexistent/file.txt")),
	          BtPeerTransferCoordinator::Error);
	EXPECT_EQ(m_service->createCalls, 0);
	EXPECT_EQ(m_service->removeCalls, 0);
}

TEST_F(TransferCoordinatorTest, SessionCreateFailure)
{
	m_service->createError = BtPeerError(BtPeerError::Unavailable, "no adapter");

	EXPECT_EQ(m_coordinator->send(kTarget, m_file.fileName()),
	          BtPeerTransferCoordinator::Error);
	EXPECT_EQ(m_service->sendCalls, 0);
	EXPECT_EQ(m_service->removeCalls, 0);
}

TEST_F(TransferCoordinatorTest, SendFailureStillRemovesSession)
{
	m_service->sendError = BtPeerError(BtPeerError::InvalidArg, "bad file");

	EXPECT_EQ(m_coordinator->send(kTarget, m_file.fileName()),
	          BtPeerTransferCoordinator::Error);
	EXPECT_EQ(m_service->removeCalls, 1);
}

TEST_F(TransferCoordinatorTest, SendExceptionStillRemovesSession)
{
	m_service->throwOnSend = true;

	EXPECT_EQ(m_coordinator->send(kTarget, m_file.fileName()),
	          BtPeerTransferCoordinator::Error);
	EXPECT_EQ(m_service->removeCalls, 1);
	EXPECT_FALSE(m_coordinator->isSending());
}

TEST_F(TransferCoordinatorTest, NonStandardSendExceptionReleasesCoordinator)
{
	m_service->throwValueOnSend = true;

	EXPECT_EQ(m_coordinator->send(kTarget, m_file.fileName()),
	          BtPeerTransferCoordinator::Error);
	EXPECT_EQ(m_service->removeCalls, 1);
	EXPECT_FALSE(m_coordinator->isSending());

	// a later send is not blocked by the failed one
	m_service->throwValueOnSend = false;
	m_service->status = QStringLiteral("complete");

	EXPECT_EQ(m_coordinator->send(kTarget, m_file.fileName()),
	          BtPeerTransferCoordinator::Complete);
	EXPECT_EQ(m_service->removeCalls, 2);
}

TEST_F(TransferCoordinatorTest, SessionCreateExceptionReleasesCoordinator)
{
	m_service->throwValueOnCreate = true;

	EXPECT_EQ(m_coordinator->send(kTarget, m_file.fileName()),
	          BtPeerTransferCoordinator::Error);
	EXPECT_EQ(m_service->sendCalls, 0);
	EXPECT_EQ(m_service->removeCalls, 0);
	EXPECT_FALSE(m_coordinator->isSending());

	m_service->throwValueOnCreate = false;
	m_service->status = QStringLiteral("complete");

	EXPECT_EQ(m_coordinator->send(kTarget, m_file.fileName()),
	          BtPeerTransferCoordinator::Complete);
}

TEST(TransferTimeoutTest, ReceiveTimeoutIsClamped)
{
	EXPECT_EQ(BtPeerTransferCoordinator::receiveTimeoutMSecs(-5), 0);
	EXPECT_EQ(BtPeerTransferCoordinator::receiveTimeoutMSecs(30), 30000);
	EXPECT_EQ(BtPeerTransferCoordinator::receiveTimeoutMSecs(2147483), 2147483000);
	EXPECT_EQ(BtPeerTransferCoordinator::receiveTimeoutMSecs(3000000),
	          std::numeric_limits<int>::max());
	EXPECT_EQ(BtPeerTransferCoordinator::receiveTimeoutMSecs(std::numeric_limits<int>::max()),
	          std::numeric_limits<int>::max());
}

TEST_F(TransferCoordinatorTest, SuppliedSessionIsUsedAndRemoved)
{
	const QDBusObjectPath session(QStringLiteral("/org/bluez/obex/client/session7"));
	m_service->status = QStringLiteral("complete");

	EXPECT_EQ(m_coordinator->send(kTarget, m_file.fileName(), QString(), session),
	          BtPeerTransferCoordinator::Complete);
	EXPECT_EQ(m_service->createCalls, 0);
	EXPECT_EQ(m_service->removedSessions, QStringList() << session.path());
}

TEST_F(TransferCoordinatorTest, TimesOutAndCancelsTransfer)
{
	createCoordinator(100, "{ \"program\": \"/bin/sleep\" }");

	EXPECT_EQ(m_coordinator->send(kTarget, m_file.fileName()),
	          BtPeerTransferCoordinator::TimedOut);
	EXPECT_EQ(m_service->cancelCalls, 1);
	EXPECT_EQ(m_service->removeCalls, 1);
}

TEST_F(TransferCoordinatorTest, CancelAbortsTransfer)
{
	BtPeerTransferCoordinator *coordinator = m_coordinator.data();
	QTimer::singleShot(20, coordinator, &BtPeerTransferCoordinator::cancel);

	EXPECT_EQ(m_coordinator->send(kTarget, m_file.fileName()),
	          BtPeerTransferCoordinator::Cancelled);
	EXPECT_EQ(m_service->cancelCalls, 1);
	EXPECT_EQ(m_service->removeCalls, 1);
}

TEST_F(TransferCoordinatorTest, CancelWithoutTransferDoesNothing)
{
	m_coordinator->cancel();
	EXPECT_EQ(m_service->cancelCalls, 0);
}

TEST_F(TransferCoordinatorTest, OnlyOneSendAtATime)
{
	BtPeerTransferCoordinator *coordinator = m_coordinator.data();
	const QString filePath = m_file.fileName();

	BtPeerTransferCoordinator::Status nested = BtPeerTransferCoordinator::Unknown;
	QTimer::singleShot(20, [&nested, coordinator, filePath]() {
		nested = coordinator->send(kTarget, filePath);
		coordinator->cancel();
	});

	EXPECT_EQ(m_coordinator->send(kTarget, filePath),
	          BtPeerTransferCoordinator::Cancelled);
	EXPECT_EQ(nested, BtPeerTransferCoordinator::Error);
	EXPECT_EQ(m_service->createCalls, 1);
}


class ReceiveTest : public TransferCoordinatorTest
{
protected:
	void SetUp() override
	{
		TransferCoordinatorTest::SetUp();
		ASSERT_TRUE(m_dir.isValid());
	}

	// the push server command writes files with the given shell command and
	// then waits to be stopped
	void usePushServerScript(const QByteArray &script)
	{
		createCoordinator(2000, "{ \"program\": \"/bin/sh\", \"arguments\": "
		                        "[ \"-c\", \"" + script + "; exec sleep 30\" ] }");
	}

	QString savePath(const QString &name) const
	{
		return QDir(m_dir.path()).absoluteFilePath(name);
	}

protected:
	QTemporaryDir m_dir;
};


TEST_F(ReceiveTest, TimesOutWithoutFile)
{
	const QString received = m_coordinator->receive(m_dir.path(), 1);

	EXPECT_TRUE(received.isNull());
	EXPECT_FALSE(m_coordinator->isReceiverRunning());
}

TEST_F(ReceiveTest, PushServerExitingEarlyReturnsNothing)
{
	createCoordinator(2000, "{ \"program\": \"/bin/true\" }");

	EXPECT_TRUE(m_coordinator->receive(m_dir.path(), 10).isNull());
	EXPECT_FALSE(m_coordinator->isReceiverRunning());
}

TEST_F(ReceiveTest, ReturnsNewFileWhenAccepted)
{
	usePushServerScript("touch {dir}/photo.jpg");

	QString confirmed;
	const QString received = m_coordinator->receive(m_dir.path(), 10,
		[&](const QString &path) {
			confirmed = path;
			return true;
		});

	EXPECT_EQ(received, savePath(QStringLiteral("photo.jpg")));
	EXPECT_EQ(confirmed, received);
	EXPECT_TRUE(QFile::exists(received));
	EXPECT_FALSE(m_coordinator->isReceiverRunning());
}

TEST_F(ReceiveTest, RejectedFileIsDeleted)
{
	usePushServerScript("touch {dir}/photo.jpg");

	const QString received = m_coordinator->receive(m_dir.path(), 10,
		[](const QString &) { return false; });

	EXPECT_TRUE(received.isNull());
	EXPECT_FALSE(QFile::exists(savePath(QStringLiteral("photo.jpg"))));
}

TEST_F(ReceiveTest, ThrowingConfirmRejectsFile)
{
	usePushServerScript("touch {dir}/photo.jpg");

	const QString received = m_coordinator->receive(m_dir.path(), 10,
		[](const QString &) -> bool { throw 42; });

	EXPECT_TRUE(received.isNull());
	EXPECT_FALSE(QFile::exists(savePath(QStringLiteral("photo.jpg"))));
	EXPECT_FALSE(m_coordinator->isReceiverRunning());
}

TEST_F(ReceiveTest, ExistingFilesAreIgnored)
{
	QFile existing(savePath(QStringLiteral("aaa.txt")));
	ASSERT_TRUE(existing.open(QIODevice::WriteOnly));
	existing.close();

	usePushServerScript("touch {dir}/zzz.txt");

	EXPECT_EQ(m_coordinator->receive(m_dir.path(), 10),
	          savePath(QStringLiteral("zzz.txt")));
	EXPECT_TRUE(existing.exists());
}

TEST_F(ReceiveTest, EarliestOfSeveralFilesWins)
{
	usePushServerScript("touch -d @1000 {dir}/b.txt; touch -d @2000 {dir}/a.txt");

	EXPECT_EQ(m_coordinator->receive(m_dir.path(), 10),
	          savePath(QStringLiteral("b.txt")));

	// the other file is left where it is
	EXPECT_TRUE(QFile::exists(savePath(QStringLiteral("a.txt"))));
}

TEST_F(ReceiveTest, CreatesSaveDirectory)
{
	const QString nested = savePath(QStringLiteral("inbox/today"));

	EXPECT_TRUE(m_coordinator->receive(nested, 1).isNull());
	EXPECT_TRUE(QFileInfo(nested).isDir());
}
