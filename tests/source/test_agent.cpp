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
//  test_agent.cpp
//  BtPeer
//

#include "btpeer/btpeeragent.h"

#include <stdexcept>

#include <gtest/gtest.h>


static const QDBusObjectPath kAgentPath(QStringLiteral("/com/btpeer/agent"));
static const QDBusObjectPath kDevicePath(QStringLiteral("/org/bluez/hci0/dev_00_11_22_33_44_55"));


// -----------------------------------------------------------------------------
/*!
	\internal

	Ask function that records the last request and returns a fixed answer.

 */
struct RecordingOperator
{
	explicit RecordingOperator(const QVariant &reply)
		: answer(reply)
		, calls(0)
		, lastRequest(BtPeerAgent::CancelRequest)
	{ }

	BtPeerAgent::AskFunction function()
	{
		return [this](BtPeerAgent::Request request, const QDBusObjectPath &device,
		              const QVariantMap &extra) {
			calls++;
			lastRequest = request;
			lastDevice = device;
			lastExtra = extra;
			return answer;
		};
	}

	QVariant answer;
	int calls;
	BtPeerAgent::Request lastRequest;
	QDBusObjectPath lastDevice;
	QVariantMap lastExtra;
};


TEST(AgentTest, PinCodeReturnsOperatorAnswer)
{
	RecordingOperator op(QStringLiteral("1234"));
	BtPeerAgent agent(kAgentPath, op.function());

	QString pin;
	const BtPeerError error = agent.requestPinCode(kDevicePath, &pin);

	EXPECT_FALSE(error);
	EXPECT_EQ(pin, QStringLiteral("1234"));
	EXPECT_EQ(op.lastRequest, BtPeerAgent::PinCodeRequest);
	EXPECT_EQ(op.lastDevice, kDevicePath);
}

TEST(AgentTest, PinCodeRejectedOnEmptyOrTooLongAnswer)
{
	RecordingOperator op{ QVariant() };
	BtPeerAgent agent(kAgentPath, op.function());

	QString pin;
	EXPECT_EQ(agent.requestPinCode(kDevicePath, &pin).type(), BtPeerError::Rejected);

	op.answer = QString();
	EXPECT_EQ(agent.requestPinCode(kDevicePath, &pin).type(), BtPeerError::Rejected);

	op.answer = QStringLiteral("12345678901234567");
	EXPECT_EQ(agent.requestPinCode(kDevicePath, &pin).type(), BtPeerError::Rejected);
	EXPECT_TRUE(pin.isEmpty());
}

TEST(AgentTest, PinCodeRejectsNonTextAnswers)
{
	RecordingOperator op{ QVariant(true) };
	BtPeerAgent agent(kAgentPath, op.function());

	QString pin;
	EXPECT_EQ(agent.requestPinCode(kDevicePath, &pin).type(), BtPeerError::Rejected);
	EXPECT_TRUE(pin.isEmpty());

	op.answer = QVariant(12.5);
	EXPECT_EQ(agent.requestPinCode(kDevicePath, &pin).type(), BtPeerError::Rejected);
	EXPECT_TRUE(pin.isEmpty());

	op.answer = QStringList{ QStringLiteral("1234") };
	EXPECT_EQ(agent.requestPinCode(kDevicePath, &pin).type(), BtPeerError::Rejected);
	EXPECT_TRUE(pin.isEmpty());

	op.answer = 4321;
	EXPECT_FALSE(agent.requestPinCode(kDevicePath, &pin));
	EXPECT_EQ(pin, QStringLiteral("4321"));
}

TEST(AgentTest, PasskeyAcceptsNumericString)
{
	RecordingOperator op(QStringLiteral(" 012345 "));
	BtPeerAgent agent(kAgentPath, op.function());

	quint32 passkey = 0;
	EXPECT_FALSE(agent.requestPasskey(kDevicePath, &passkey));
	EXPECT_EQ(passkey, 12345U);

	op.answer = 0;
	passkey = 99;
	EXPECT_FALSE(agent.requestPasskey(kDevicePath, &passkey));
	EXPECT_EQ(passkey, 0U);
}

TEST(AgentTest, PasskeyRejectsOutOfRangeOrGarbage)
{
	RecordingOperator op(QStringLiteral("1000000"));
	BtPeerAgent agent(kAgentPath, op.function());

	quint32 passkey = 7;
	EXPECT_EQ(agent.requestPasskey(kDevicePath, &passkey).type(), BtPeerError::Rejected);

	op.answer = QStringLiteral("abc");
	EXPECT_EQ(agent.requestPasskey(kDevicePath, &passkey).type(), BtPeerError::Rejected);

	op.answer = QVariant();
	EXPECT_EQ(agent.requestPasskey(kDevicePath, &passkey).type(), BtPeerError::Rejected);

	EXPECT_EQ(passkey, 7U);
}

TEST(AgentTest, ConfirmationPassesPasskeyAndHonoursAnswer)
{
	RecordingOperator op(true);
	BtPeerAgent agent(kAgentPath, op.function());

	EXPECT_FALSE(agent.requestConfirmation(kDevicePath, 654321));
	EXPECT_EQ(op.lastRequest, BtPeerAgent::ConfirmationRequest);
	EXPECT_EQ(op.lastExtra.value(QStringLiteral("passkey")).toUInt(), 654321U);

	op.answer = false;
	EXPECT_EQ(agent.requestConfirmation(kDevicePath, 654321).type(), BtPeerError::Rejected);
}

TEST(AgentTest, AuthorizationRequests)
{
	RecordingOperator op(true);
	BtPeerAgent agent(kAgentPath, op.function());

	EXPECT_FALSE(agent.requestAuthorization(kDevicePath));
	EXPECT_EQ(op.lastRequest, BtPeerAgent::AuthorizationRequest);

	const QString uuid = QStringLiteral("00001105-0000-1000-8000-00805f9b34fb");
	EXPECT_FALSE(agent.authorizeService(kDevicePath, uuid));
	EXPECT_EQ(op.lastRequest, BtPeerAgent::ServiceAuthorizationRequest);
	EXPECT_EQ(op.lastExtra.value(QStringLiteral("uuid")).toString(), uuid);

	op.answer = 0;
	EXPECT_EQ(agent.requestAuthorization(kDevicePath).type(), BtPeerError::Rejected);
	EXPECT_EQ(agent.authorizeService(kDevicePath, uuid).type(), BtPeerError::Rejected);
}

TEST(AgentTest, DisplayRequestsForwardValues)
{
	RecordingOperator op(true);
	BtPeerAgent agent(kAgentPath, op.function());

	EXPECT_FALSE(agent.displayPasskey(kDevicePath, 1234, 2));
	EXPECT_EQ(op.lastRequest, BtPeerAgent::DisplayPasskeyRequest);
	EXPECT_EQ(op.lastExtra.value(QStringLiteral("passkey")).toUInt(), 1234U);
	EXPECT_EQ(op.lastExtra.value(QStringLiteral("entered")).toUInt(), 2U);

	EXPECT_FALSE(agent.displayPinCode(kDevicePath, QStringLiteral("0000")));
	EXPECT_EQ(op.lastRequest, BtPeerAgent::DisplayPinCodeRequest);
	EXPECT_EQ(op.lastExtra.value(QStringLiteral("pincode")).toString(), QStringLiteral("0000"));
}

TEST(AgentTest, NoOperatorRejectsEverything)
{
	BtPeerAgent agent(kAgentPath);
	EXPECT_FALSE(agent.hasAskFunction());

	QString pin;
	quint32 passkey = 0;
	EXPECT_EQ(agent.requestPinCode(kDevicePath, &pin).type(), BtPeerError::Rejected);
	EXPECT_EQ(agent.requestPasskey(kDevicePath, &passkey).type(), BtPeerError::Rejected);
	EXPECT_EQ(agent.requestConfirmation(kDevicePath, 1).type(), BtPeerError::Rejected);
	EXPECT_EQ(agent.requestAuthorization(kDevicePath).type(), BtPeerError::Rejected);
	EXPECT_FALSE(agent.cancel());
}

TEST(AgentTest, ThrowingOperatorIsRejection)
{
	BtPeerAgent agent(kAgentPath,
		[](BtPeerAgent::Request, const QDBusObjectPath &, const QVariantMap &) -> QVariant {
			throw std::runtime_error("operator went away");
		});

	QString pin;
	EXPECT_EQ(agent.requestPinCode(kDevicePath, &pin).type(), BtPeerError::Rejected);
	EXPECT_EQ(agent.requestConfirmation(kDevicePath, 1).type(), BtPeerError::Rejected);
	EXPECT_EQ(agent.authorizeService(kDevicePath, QStringLiteral("uuid")).type(),
	          BtPeerError::Rejected);
}

TEST(AgentTest, CancelUsesLastDevice)
{
	RecordingOperator op(true);
	BtPeerAgent agent(kAgentPath, op.function());

	EXPECT_FALSE(agent.requestAuthorization(kDevicePath));

	op.lastDevice = QDBusObjectPath();
	EXPECT_TRUE(agent.cancel());
	EXPECT_EQ(op.lastRequest, BtPeerAgent::CancelRequest);
	EXPECT_EQ(op.lastDevice, kDevicePath);
}

TEST(AgentTest, ReleaseEmitsSignal)
{
	BtPeerAgent agent(kAgentPath);

	int released = 0;
	QObject::connect(&agent, &BtPeerAgent::released, [&]() { released++; });

	agent.release();
	EXPECT_EQ(released, 1);
}
