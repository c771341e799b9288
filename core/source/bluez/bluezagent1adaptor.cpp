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
//  bluezagent1adaptor.cpp
//  BtPeer
//

#include "bluezagent1adaptor.h"
#include "btpeer/btpeeragent.h"
#include "utils/logging.h"



// -----------------------------------------------------------------------------
/*!
	\class BluezAgent1Adaptor
	\brief Exports a BtPeerAgent as an org.bluez.Agent1 object.

	Every method that can fail is answered with a delayed reply so that a
	BtPeerError can be returned to bluez as a dbus error.  The agent may run
	a local event loop while asking the operator, other bus traffic is still
	processed in the meantime.

 */
BluezAgent1Adaptor::BluezAgent1Adaptor(BtPeerAgent *parent,
                                       const QDBusConnection &connection)
	: QDBusAbstractAdaptor(parent)
	, m_agent(parent)
	, m_connection(connection)
{
	// the agent interface has no signals
	setAutoRelaySignals(false);
}

BluezAgent1Adaptor::~BluezAgent1Adaptor()
{
}

void BluezAgent1Adaptor::finishReply(const QDBusMessage &request,
                                     const BtPeerError &error,
                                     const QVariant &result) const
{
	QDBusMessage reply;
	if (error) {
		reply = request.createErrorReply(error.name(), error.message());
	} else {
		reply = request.createReply();
		if (result.isValid())
			reply << result;
	}

	if (!m_connection.send(reply))
		qWarning() << "failed to send" << request.member() << "reply to bluez";
}

// -----------------------------------------------------------------------------
/*!
	DBus method called by bluez when the agent is unregistered.

 */
void BluezAgent1Adaptor::Release()
{
	m_agent->release();
}

QString BluezAgent1Adaptor::RequestPinCode(const QDBusObjectPath &device,
                                           const QDBusMessage &message)
{
	message.setDelayedReply(true);

	QString pinCode;
	const BtPeerError error = m_agent->requestPinCode(device, &pinCode);

	finishReply(message, error, QVariant::fromValue(pinCode));

	return pinCode;
}

void BluezAgent1Adaptor::DisplayPinCode(const QDBusObjectPath &device,
                                        const QString &pincode,
                                        const QDBusMessage &message)
{
	message.setDelayedReply(true);

	const BtPeerError error = m_agent->displayPinCode(device, pincode);

	finishReply(message, error);
}

quint32 BluezAgent1Adaptor::RequestPasskey(const QDBusObjectPath &device,
                                           const QDBusMessage &message)
{
	message.setDelayedReply(true);

	quint32 passkey = 0;
	const BtPeerError error = m_agent->requestPasskey(device, &passkey);

	finishReply(message, error, QVariant::fromValue(passkey));

	return passkey;
}

void BluezAgent1Adaptor::DisplayPasskey(const QDBusObjectPath &device,
                                        quint32 passkey, quint16 entered,
                                        const QDBusMessage &message)
{
	message.setDelayedReply(true);

	const BtPeerError error = m_agent->displayPasskey(device, passkey, entered);

	finishReply(message, error);
}

void BluezAgent1Adaptor::RequestConfirmation(const QDBusObjectPath &device,
                                             quint32 passkey,
                                             const QDBusMessage &message)
{
	message.setDelayedReply(true);

	const BtPeerError error = m_agent->requestConfirmation(device, passkey);

	finishReply(message, error);
}

void BluezAgent1Adaptor::RequestAuthorization(const QDBusObjectPath &device,
                                              const QDBusMessage &message)
{
	message.setDelayedReply(true);

	const BtPeerError error = m_agent->requestAuthorization(device);

	finishReply(message, error);
}

void BluezAgent1Adaptor::AuthorizeService(const QDBusObjectPath &device,
                                          const QString &uuid,
                                          const QDBusMessage &message)
{
	message.setDelayedReply(true);

	const BtPeerError error = m_agent->authorizeService(device, uuid);

	finishReply(message, error);
}

// -----------------------------------------------------------------------------
/*!
	DBus method called by bluez when a pairing request is aborted, the reply
	is empty regardless of what the operator callback returns.

 */
void BluezAgent1Adaptor::Cancel()
{
	m_agent->cancel();
}
