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
//  btaddress.h
//  BtPeer
//

#ifndef BTADDRESS_H
#define BTADDRESS_H

#include <QString>
#include <QLatin1String>
#include <QMetaType>
#include <QHash>
#include <QDebug>
#include <QDBusObjectPath>


class BtAddress
{
public:
	BtAddress();
	BtAddress(quint64 address);
	explicit BtAddress(const char *address);
	explicit BtAddress(const QString &address);
	explicit BtAddress(QLatin1String address);
	BtAddress(const BtAddress &other) = default;
	~BtAddress() = default;

	BtAddress &operator=(const BtAddress &rhs) = default;

public:
	static void registerType();

	static BtAddress fromPathSegment(const QString &segment);
	static BtAddress fromDevicePath(const QDBusObjectPath &path);

public:
	void clear();
	bool isNull() const;

	QString toString() const;
	quint64 toUInt64() const;

	QString toPathSegment() const;
	QDBusObjectPath devicePath(const QDBusObjectPath &adapterPath) const;

private:
	friend QDebug operator<<(QDebug dbg, const BtAddress &address);

	friend bool operator<(const BtAddress &bdaddr1, const BtAddress &bdaddr2);
	friend bool operator==(const BtAddress &bdaddr1, const BtAddress &bdaddr2);
	friend bool operator!=(const BtAddress &bdaddr1, const BtAddress &bdaddr2);
	friend uint qHash(const BtAddress &key, uint seed);

	const char* _toString(char buf[32], char separator) const;
	static quint64 _fromString(const char *address, int length, char separator);

private:
	quint64 m_address;
};

Q_DECLARE_METATYPE(BtAddress)

QDebug operator<<(QDebug dbg, const BtAddress &address);


inline bool operator<(const BtAddress &bdaddr1, const BtAddress &bdaddr2)
{
	return bdaddr1.m_address < bdaddr2.m_address;
}

inline bool operator==(const BtAddress &bdaddr1, const BtAddress &bdaddr2)
{
	return bdaddr1.m_address == bdaddr2.m_address;
}

inline bool operator!=(const BtAddress &bdaddr1, const BtAddress &bdaddr2)
{
	return bdaddr1.m_address != bdaddr2.m_address;
}

inline uint qHash(const BtAddress &key, uint seed = 0)
{
	return qHash(key.m_address, seed);
}

#endif // !defined(BTADDRESS_H)
