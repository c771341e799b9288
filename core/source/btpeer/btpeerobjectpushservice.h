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
//  btpeerobjectpushservice.h
//  BtPeer
//

#ifndef BTPEEROBJECTPUSHSERVICE_H
#define BTPEEROBJECTPUSHSERVICE_H

#include "btpeererror.h"
#include "utils/btaddress.h"

#include <QString>
#include <QVariantMap>
#include <QDBusObjectPath>


class BtPeerObjectPushService
{
protected:
	BtPeerObjectPushService() = default;

public:
	virtual ~BtPeerObjectPushService() = default;

public:
	virtual BtPeerError createSession(const BtAddress &destination,
	                                  const QString &target,
	                                  QDBusObjectPath *session) = 0;
	virtual BtPeerError removeSession(const QDBusObjectPath &session) = 0;

	virtual BtPeerError sendFile(const QDBusObjectPath &session,
	                             const QString &filePath,
	                             QDBusObjectPath *transfer,
	                             QVariantMap *properties) = 0;

	virtual BtPeerError transferStatus(const QDBusObjectPath &transfer,
	                                   QString *status) const = 0;
	virtual BtPeerError cancelTransfer(const QDBusObjectPath &transfer) = 0;
};


#endif // !defined(BTPEEROBJECTPUSHSERVICE_H)
