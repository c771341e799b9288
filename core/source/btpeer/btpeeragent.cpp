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
//  btpeeragent.cpp
//  BtPeer
//

#include "btpeeragent.h"
#include "utils/logging.h"

#include <exception>


// -----------------------------------------------------------------------------
/*!
	\class BtPeerAgent
	\brief Answers the pairing requests bluez sends to a registered agent.

	Every request is forwarded to a single operator supplied ask function,
	along with the path of the device the request is for and a map of any
	extra values (the passkey to display, the service uuid, etc).  The
	answer returned by the ask function is then checked and converted to the
	value bluez expects, a null, empty, zero or \c false answer is always
	treated as the operator rejecting the request.

	Exceptions thrown by the ask function are caught here and turned into a
	rejection, they never reach the dbus dispatch code.

	The agent holds no per-pairing state, the device path is the only thing
	identifying the pairing attempt.  It is not re-entrant; if a second
	request arrives while the ask function is still running (i.e. it is
	spinning a nested event loop waiting for the operator) then the second
	request is rejected.  The only exception is Cancel, which is expected to
	arrive while a question is outstanding.

	This class holds the logic, the dbus method signatures are implemented
	by the BluezAgent1Adaptor attached to it.

 */



BtPeerAgent::BtPeerAgent(const QDBusObjectPath &path,
                         const AskFunction &ask,
                         QObject *parent)
	: QObject(parent)
	, m_path(path)
	, m_ask(ask)
	, m_asking(false)
{
}

BtPeerAgent::~BtPeerAgent()
{
}

QDBusObjectPath BtPeerAgent::path() const
{
	return m_path;
}

// -----------------------------------------------------------------------------
/*!
	Replaces the operator ask function.  If \a ask is empty then all
	interactive requests are rejected.

 */
void BtPeerAgent::setAskFunction(const AskFunction &ask)
{
	m_ask = ask;
}

bool BtPeerAgent::hasAskFunction() const
{
	return bool(m_ask);
}

// -----------------------------------------------------------------------------
/*!
	Returns the short name of the \a request kind, as shown to the operator.

 */
QString BtPeerAgent::requestName(Request request)
{
	switch (request) {
		case PinCodeRequest:                return QStringLiteral("pin");
		case PasskeyRequest:                return QStringLiteral("passkey");
		case ConfirmationRequest:           return QStringLiteral("confirm");
		case AuthorizationRequest:          return QStringLiteral("authorize");
		case ServiceAuthorizationRequest:   return QStringLiteral("authorize");
		case DisplayPasskeyRequest:         return QStringLiteral("display_passkey");
		case DisplayPinCodeRequest:         return QStringLiteral("display_pin");
		case CancelRequest:                 return QStringLiteral("cancel");
		default:                            return QStringLiteral("unknown");
	}
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Returns \c true if the \a answer should be treated as an acceptance.
	Invalid / null variants, \c false, empty strings and zero numbers are all
	treated as a rejection.

 */
bool BtPeerAgent::isAccepted(const QVariant &answer)
{
	if (!answer.isValid() || answer.isNull())
		return false;

	switch (answer.userType()) {
		case QMetaType::Bool:
			return answer.toBool();
		case QMetaType::QString:
			return !answer.toString().isEmpty();
		case QMetaType::QByteArray:
			return !answer.toByteArray().isEmpty();
		case QMetaType::Int:
		case QMetaType::UInt:
		case QMetaType::Short:
		case QMetaType::UShort:
		case QMetaType::Long:
		case QMetaType::ULong:
		case QMetaType::LongLong:
		case QMetaType::ULongLong:
			return (answer.toLongLong() != 0);
		case QMetaType::Double:
		case QMetaType::Float:
			return (answer.toDouble() != 0.0);
		default:
			return true;
	}
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Calls the operator ask function with the given arguments, storing the
	reply in \a answer.  If there is no ask function, or it throws, then an
	error is returned and \a answer is left invalid.

 */
BtPeerError BtPeerAgent::ask(Request request, const QDBusObjectPath &device,
                             const QVariantMap &extra, QVariant *answer)
{
	*answer = QVariant();

	if (request != CancelRequest) {
		if (Q_UNLIKELY(m_asking)) {
			qWarning() << "rejecting" << requestName(request) << "request for"
			           << device.path() << "as another request is outstanding";
			return BtPeerError(BtPeerError::Busy, "Another request is outstanding");
		}

		m_lastDevice = device;
	}

	if (!m_ask) {
		qWarning() << "no operator attached to answer" << requestName(request)
		           << "request for" << device.path();
		return BtPeerError(BtPeerError::Rejected, "No operator available");
	}

	const bool wasAsking = m_asking;
	m_asking = true;

	BtPeerError error;

	try {
		*answer = m_ask(request, device, extra);

	} catch (const std::exception &e) {
		qError() << "operator callback threw for" << requestName(request)
		         << "request -" << e.what();
		error = BtPeerError(BtPeerError::Rejected, "Operator callback failed");

	} catch (...) {
		qError() << "operator callback threw unknown exception for"
		         << requestName(request) << "request";
		error = BtPeerError(BtPeerError::Rejected, "Operator callback failed");
	}

	m_asking = wasAsking;

	return error;
}

// -----------------------------------------------------------------------------
/*!
	Asks the operator for the PIN code to use to pair with \a device.  The
	PIN must be a 1 to 16 character string, an integer answer is accepted
	and converted to its decimal string.

 */
BtPeerError BtPeerAgent::requestPinCode(const QDBusObjectPath &device,
                                        QString *pinCode)
{
	QVariant answer;
	BtPeerError error = ask(PinCodeRequest, device, QVariantMap(), &answer);
	if (error)
		return error;

	if (!isAccepted(answer)) {
		qInfo() << "operator rejected or did not provide PIN for" << device.path();
		return BtPeerError(BtPeerError::Rejected, "PIN request rejected");
	}

	switch (answer.userType()) {
		case QMetaType::QString:
		case QMetaType::QByteArray:
		case QMetaType::Int:
		case QMetaType::UInt:
		case QMetaType::LongLong:
		case QMetaType::ULongLong:
			break;
		default:
			qWarning() << "PIN answer of type" << answer.typeName()
			           << "supplied for" << device.path();
			return BtPeerError(BtPeerError::Rejected, "Invalid PIN code");
	}

	const QString pin = answer.toString();
	if (pin.isEmpty() || (pin.length() > 16)) {
		qWarning() << "invalid PIN" << pin << "supplied for" << device.path();
		return BtPeerError(BtPeerError::Rejected, "Invalid PIN code");
	}

	qInfo() << "RequestPinCode reply =" << pin;

	*pinCode = pin;
	return BtPeerError();
}

// -----------------------------------------------------------------------------
/*!
	Asks the operator for the numeric passkey to use to pair with \a device.

	Unlike the other requests a passkey of zero is a valid answer, only a
	null answer is a rejection.  The answer must convert to an unsigned
	value between 0 and 999999.

 */
BtPeerError BtPeerAgent::requestPasskey(const QDBusObjectPath &device,
                                        quint32 *passkey)
{
	QVariant answer;
	BtPeerError error = ask(PasskeyRequest, device, QVariantMap(), &answer);
	if (error)
		return error;

	if (!answer.isValid() || answer.isNull()) {
		qInfo() << "operator rejected or did not provide passkey for" << device.path();
		return BtPeerError(BtPeerError::Rejected, "Passkey request rejected");
	}

	bool ok = false;
	const uint value = answer.toString().trimmed().toUInt(&ok);
	if (!ok || (value > 999999)) {
		qWarning() << "invalid passkey" << answer << "supplied for" << device.path();
		return BtPeerError(BtPeerError::Rejected, "Invalid passkey");
	}

	qInfo("RequestPasskey reply = %06u", value);

	*passkey = value;
	return BtPeerError();
}

// -----------------------------------------------------------------------------
/*!
	Asks the operator to confirm that \a passkey is the one shown on the
	remote \a device.

 */
BtPeerError BtPeerAgent::requestConfirmation(const QDBusObjectPath &device,
                                             quint32 passkey)
{
	QVariantMap extra;
	extra[QStringLiteral("passkey")] = passkey;

	QVariant answer;
	BtPeerError error = ask(ConfirmationRequest, device, extra, &answer);
	if (error)
		return error;

	qInfo() << "RequestConfirmation response =" << answer;

	if (!isAccepted(answer)) {
		qInfo() << "operator rejected pairing with" << device.path();
		return BtPeerError(BtPeerError::Rejected, "Confirmation rejected");
	}

	qInfo() << "operator confirmed pairing with" << device.path();
	return BtPeerError();
}

// -----------------------------------------------------------------------------
/*!
	Asks the operator to authorise an incoming pairing request from
	\a device.  This is the 'just works' case where there is nothing to
	display or enter, so it shares the authorize prompt without a uuid.

 */
BtPeerError BtPeerAgent::requestAuthorization(const QDBusObjectPath &device)
{
	QVariant answer;
	BtPeerError error = ask(AuthorizationRequest, device, QVariantMap(), &answer);
	if (error)
		return error;

	if (!isAccepted(answer)) {
		qInfo() << "operator denied pairing authorization for" << device.path();
		return BtPeerError(BtPeerError::Rejected, "Authorization rejected");
	}

	qInfo() << "operator authorized pairing for" << device.path();
	return BtPeerError();
}

// -----------------------------------------------------------------------------
/*!
	Asks the operator to authorise \a device to use the service \a uuid.

 */
BtPeerError BtPeerAgent::authorizeService(const QDBusObjectPath &device,
                                          const QString &uuid)
{
	QVariantMap extra;
	extra[QStringLiteral("uuid")] = uuid;

	QVariant answer;
	BtPeerError error = ask(ServiceAuthorizationRequest, device, extra, &answer);
	if (error)
		return error;

	if (!isAccepted(answer)) {
		qInfo() << "operator denied service" << uuid << "for device" << device.path();
		return BtPeerError(BtPeerError::Rejected, "Service authorization rejected");
	}

	qInfo() << "operator authorized service" << uuid << "for device" << device.path();
	return BtPeerError();
}

// -----------------------------------------------------------------------------
/*!
	Shows the operator the \a passkey being typed on \a device, \a entered
	is the number of digits typed so far.

 */
BtPeerError BtPeerAgent::displayPasskey(const QDBusObjectPath &device,
                                        quint32 passkey, quint16 entered)
{
	QVariantMap extra;
	extra[QStringLiteral("passkey")] = passkey;
	extra[QStringLiteral("entered")] = entered;

	QVariant answer;
	BtPeerError error = ask(DisplayPasskeyRequest, device, extra, &answer);
	if (error)
		return error;

	if (!isAccepted(answer)) {
		qInfo() << "operator rejected passkey display for" << device.path();
		return BtPeerError(BtPeerError::Rejected, "Passkey display rejected");
	}

	qInfo() << "displayed passkey for" << device.path();
	return BtPeerError();
}

// -----------------------------------------------------------------------------
/*!
	Shows the operator the \a pinCode to be entered on \a device.

 */
BtPeerError BtPeerAgent::displayPinCode(const QDBusObjectPath &device,
                                        const QString &pinCode)
{
	QVariantMap extra;
	extra[QStringLiteral("pincode")] = pinCode;

	QVariant answer;
	BtPeerError error = ask(DisplayPinCodeRequest, device, extra, &answer);
	if (error)
		return error;

	if (!isAccepted(answer)) {
		qInfo() << "operator rejected PIN display for" << device.path();
		return BtPeerError(BtPeerError::Rejected, "PIN display rejected");
	}

	qInfo() << "PIN displayed to operator for" << device.path();
	return BtPeerError();
}

// -----------------------------------------------------------------------------
/*!
	Called by bluez when it aborts the pairing handshake, typically because
	the remote device timed out or cancelled.  The bus method carries no
	device, so the operator is given the device of the last request handled.

	Returns \c true if the operator acknowledged the cancel.  Anything else
	means the operator callback itself failed, which is logged as a warning.

 */
bool BtPeerAgent::cancel()
{
	QVariant answer;
	BtPeerError error = ask(CancelRequest, m_lastDevice, QVariantMap(), &answer);
	if (error || !isAccepted(answer)) {
		qWarning() << "operator callback for cancel failed or returned nothing for"
		           << m_lastDevice.path();
		return false;
	}

	qInfo() << "pairing cancelled for" << m_lastDevice.path();
	return true;
}

// -----------------------------------------------------------------------------
/*!
	Called by bluez when the agent has been unregistered, after this the
	agent will receive no more requests until it's registered again.

 */
void BtPeerAgent::release()
{
	qMilestone() << "agent" << m_path.path() << "released by bluez";

	m_lastDevice = QDBusObjectPath();
	emit released();
}
