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
//  btpeeragent.h
//  BtPeer
//

#ifndef BTPEERAGENT_H
#define BTPEERAGENT_H

#include "btpeererror.h"

#include <QObject>
#include <QString>
#include <QVariant>
#include <QVariantMap>
#include <QDBusObjectPath>

#include <functional>


class BtPeerAgent : public QObject
{
	Q_OBJECT

public:
	enum Request {
		PinCodeRequest,
		PasskeyRequest,
		ConfirmationRequest,
		AuthorizationRequest,
		ServiceAuthorizationRequest,
		DisplayPasskeyRequest,
		DisplayPinCodeRequest,
		CancelRequest,
	};
	Q_ENUM(Request)

	typedef std::function<QVariant(Request request,
	                               const QDBusObjectPath &device,
	                               const QVariantMap &extra)> AskFunction;

public:
	explicit BtPeerAgent(const QDBusObjectPath &path,
	                     const AskFunction &ask = AskFunction(),
	                     QObject *parent = nullptr);
	~BtPeerAgent() final;

public:
	QDBusObjectPath path() const;

	void setAskFunction(const AskFunction &ask);
	bool hasAskFunction() const;

	static QString requestName(Request request);

public:
	BtPeerError requestPinCode(const QDBusObjectPath &device, QString *pinCode);
	BtPeerError requestPasskey(const QDBusObjectPath &device, quint32 *passkey);
	BtPeerError requestConfirmation(const QDBusObjectPath &device, quint32 passkey);
	BtPeerError requestAuthorization(const QDBusObjectPath &device);
	BtPeerError authorizeService(const QDBusObjectPath &device, const QString &uuid);
	BtPeerError displayPasskey(const QDBusObjectPath &device, quint32 passkey,
	                           quint16 entered);
	BtPeerError displayPinCode(const QDBusObjectPath &device, const QString &pinCode);
	bool cancel();
	void release();

signals:
	void released();

private:
	BtPeerError ask(Request request, const QDBusObjectPath &device,
	                const QVariantMap &extra, QVariant *answer);

	static bool isAccepted(const QVariant &answer);

private:
	const QDBusObjectPath m_path;
	AskFunction m_ask;

	QDBusObjectPath m_lastDevice;
	bool m_asking;
};


#endif // !defined(BTPEERAGENT_H)
