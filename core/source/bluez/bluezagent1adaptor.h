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
//  bluezagent1adaptor.h
//  BtPeer
//

#ifndef BLUEZAGENT1ADAPTOR_H
#define BLUEZAGENT1ADAPTOR_H

#include "btpeer/btpeererror.h"

#include <QObject>
#include <QString>
#include <QVariant>
#include <QDBusMessage>
#include <QDBusConnection>
#include <QDBusAbstractAdaptor>
#include <QDBusObjectPath>


class BtPeerAgent;


class BluezAgent1Adaptor : public QDBusAbstractAdaptor
{
	Q_OBJECT
	Q_CLASSINFO("D-Bus Interface", "org.bluez.Agent1")
	Q_CLASSINFO("D-Bus Introspection", ""
	            "  <interface name=\"org.bluez.Agent1\">\n"
	            "    <method name=\"Release\"/>\n"
	            "    <method name=\"RequestPinCode\">\n"
	            "      <arg direction=\"in\" type=\"o\" name=\"device\"/>\n"
	            "      <arg direction=\"out\" type=\"s\" name=\"pincode\"/>\n"
	            "    </method>\n"
	            "    <method name=\"DisplayPinCode\">\n"
	            "      <arg direction=\"in\" type=\"o\" name=\"device\"/>\n"
	            "      <arg direction=\"in\" type=\"s\" name=\"pincode\"/>\n"
	            "    </method>\n"
	            "    <method name=\"RequestPasskey\">\n"
	            "      <arg direction=\"in\" type=\"o\" name=\"device\"/>\n"
	            "      <arg direction=\"out\" type=\"u\" name=\"passkey\"/>\n"
	            "    </method>\n"
	            "    <method name=\"DisplayPasskey\">\n"
	            "      <arg direction=\"in\" type=\"o\" name=\"device\"/>\n"
	            "      <arg direction=\"in\" type=\"u\" name=\"passkey\"/>\n"
	            "      <arg direction=\"in\" type=\"q\" name=\"entered\"/>\n"
	            "    </method>\n"
	            "    <method name=\"RequestConfirmation\">\n"
	            "      <arg direction=\"in\" type=\"o\" name=\"device\"/>\n"
	            "      <arg direction=\"in\" type=\"u\" name=\"passkey\"/>\n"
	            "    </method>\n"
	            "    <method name=\"RequestAuthorization\">\n"
	            "      <arg direction=\"in\" type=\"o\" name=\"device\"/>\n"
	            "    </method>\n"
	            "    <method name=\"AuthorizeService\">\n"
	            "      <arg direction=\"in\" type=\"o\" name=\"device\"/>\n"
	            "      <arg direction=\"in\" type=\"s\" name=\"uuid\"/>\n"
	            "    </method>\n"
	            "    <method name=\"Cancel\"/>\n"
	            "  </interface>\n"
	            "")

public:
	BluezAgent1Adaptor(BtPeerAgent *parent, const QDBusConnection &connection);
	~BluezAgent1Adaptor() final;

public slots:
	void Release();
	QString RequestPinCode(const QDBusObjectPath &device, const QDBusMessage &message);
	void DisplayPinCode(const QDBusObjectPath &device, const QString &pincode,
	                    const QDBusMessage &message);
	quint32 RequestPasskey(const QDBusObjectPath &device, const QDBusMessage &message);
	void DisplayPasskey(const QDBusObjectPath &device, quint32 passkey,
	                    quint16 entered, const QDBusMessage &message);
	void RequestConfirmation(const QDBusObjectPath &device, quint32 passkey,
	                         const QDBusMessage &message);
	void RequestAuthorization(const QDBusObjectPath &device, const QDBusMessage &message);
	void AuthorizeService(const QDBusObjectPath &device, const QString &uuid,
	                      const QDBusMessage &message);
	void Cancel();

private:
	void finishReply(const QDBusMessage &request, const BtPeerError &error,
	                 const QVariant &result = QVariant()) const;

private:
	BtPeerAgent *m_agent;
	const QDBusConnection m_connection;
};


#endif // !defined(BLUEZAGENT1ADAPTOR_H)
