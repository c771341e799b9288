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
//  btpeerobjectpushservice_p.h
//  BtPeer
//

#ifndef BTPEEROBJECTPUSHSERVICE_P_H
#define BTPEEROBJECTPUSHSERVICE_P_H

#include "btpeer/btpeerobjectpushservice.h"

#include <QString>
#include <QDBusConnection>


class BtPeerObjectPushServiceObex : public BtPeerObjectPushService
{
public:
	BtPeerObjectPushServiceObex(const QDBusConnection &obexDBusConn,
	                            const QString &obexService,
	                            int callTimeout);
	~BtPeerObjectPushServiceObex() final;

public:
	BtPeerError createSession(const BtAddress &destination,
	                          const QString &target,
	                          QDBusObjectPath *session) override;
	BtPeerError removeSession(const QDBusObjectPath &session) override;

	BtPeerError sendFile(const QDBusObjectPath &session,
	                     const QString &filePath,
	                     QDBusObjectPath *transfer,
	                     QVariantMap *properties) override;

	BtPeerError transferStatus(const QDBusObjectPath &transfer,
	                           QString *status) const override;
	BtPeerError cancelTransfer(const QDBusObjectPath &transfer) override;

private:
	QDBusConnection m_obexDBusConn;
	const QString m_obexService;
	const int m_callTimeout;
};


#endif // !defined(BTPEEROBJECTPUSHSERVICE_P_H)
