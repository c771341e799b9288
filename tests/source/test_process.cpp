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
//  test_process.cpp
//  BtPeer
//

#include "btpeer/btpeerprocess.h"

#include <QEventLoop>
#include <QTimer>

#include <gtest/gtest.h>


// -----------------------------------------------------------------------------
/*!
	\internal

	Runs the event loop until \a process emits finished or \a timeout
	milliseconds pass.  Returns \c true if the process finished.

 */
static bool waitForFinished(BtPeerProcess *process, int timeout)
{
	bool finished = false;

	QEventLoop loop;
	QObject::connect(process, &BtPeerProcess::finished, &loop,
		[&](int, QProcess::ExitStatus) {
			finished = true;
			loop.quit();
		});
	QTimer::singleShot(timeout, &loop, &QEventLoop::quit);

	loop.exec();
	return finished;
}


TEST(ProcessTest, RunsToCompletion)
{
	BtPeerProcess process(QStringLiteral("test"));
	EXPECT_EQ(process.name(), QStringLiteral("test"));

	ASSERT_TRUE(process.start(QStringLiteral("/bin/sh"),
	                          QStringList() << QStringLiteral("-c")
	                                        << QStringLiteral("exit 3")));

	ASSERT_TRUE(waitForFinished(&process, 5000));
	EXPECT_FALSE(process.isRunning());
	EXPECT_EQ(process.exitCode(), 3);
	EXPECT_EQ(process.exitStatus(), QProcess::NormalExit);
}

TEST(ProcessTest, StopTerminatesProcess)
{
	BtPeerProcess process(QStringLiteral("sleeper"));

	ASSERT_TRUE(process.start(QStringLiteral("/bin/sleep"),
	                          QStringList() << QStringLiteral("30")));
	EXPECT_TRUE(process.isRunning());

	process.stop();
	EXPECT_FALSE(process.isRunning());

	// a second stop is harmless
	process.stop();
	EXPECT_FALSE(process.isRunning());
}

TEST(ProcessTest, OnlyOneProcessAtATime)
{
	BtPeerProcess process(QStringLiteral("sleeper"));

	ASSERT_TRUE(process.start(QStringLiteral("/bin/sleep"),
	                          QStringList() << QStringLiteral("30")));
	EXPECT_FALSE(process.start(QStringLiteral("/bin/sleep"),
	                           QStringList() << QStringLiteral("30")));

	process.stop();

	// can be restarted once stopped
	ASSERT_TRUE(process.start(QStringLiteral("/bin/true"), QStringList()));
	EXPECT_TRUE(waitForFinished(&process, 5000));
	EXPECT_EQ(process.exitCode(), 0);
}

TEST(ProcessTest, MissingProgramFailsToStart)
{
	BtPeerProcess process(QStringLiteral("missing"));

	EXPECT_FALSE(process.start(QStringLiteral("/nonexistent/program"), QStringList()));
	EXPECT_FALSE(process.isRunning());

	process.stop();
}

TEST(ProcessTest, StopWithoutStartDoesNothing)
{
	BtPeerProcess process(QStringLiteral("idle"));

	process.stop();
	EXPECT_FALSE(process.isRunning());
	EXPECT_EQ(process.exitCode(), -1);
}
