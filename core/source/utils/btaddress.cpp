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
//  btaddress.cpp
//  BtPeer
//

#include "btaddress.h"

#include <QAtomicInt>

#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>

// -----------------------------------------------------------------------------
/*!
	\class BtAddress
	\brief Stores a bluetooth MAC address (BDADDR).

	\ingroup utils

	The object can be used as a key in a QMap or QSet, and provides the
	conversions to and from the two textual forms used on the bus; the
	colon separated form (\c "AA:BB:CC:DD:EE:FF") that bluez reports in the
	\c Address property, and the path-safe form (\c "dev_AA_BB_CC_DD_EE_FF")
	used as the last element of a device object path.

	A default constructed BtAddress object will be invalid and return \c true
	if isNull() is called.  If constructed with a string users should check
	that the string was successfully parsed by running a isNull() check after
	construction.

 */



#define INVALID_ADDRESS  0xffffffffffffffffULL

static const QLatin1String devicePrefix("dev_");


void BtAddress::registerType()
{
	static QAtomicInt initDone = 0;
	if (Q_UNLIKELY(initDone.testAndSetRelaxed(0, 1)))
		qRegisterMetaType<BtAddress>();
}


BtAddress::BtAddress()
	: m_address(INVALID_ADDRESS)
{
}

BtAddress::BtAddress(quint64 address)
	: m_address(address)
{
	if ((m_address >> 48) != 0)
		m_address = INVALID_ADDRESS;
	else if (m_address == 0)
		m_address = INVALID_ADDRESS;
	else if (m_address == 0xffffffffffffULL)
		m_address = INVALID_ADDRESS;
}

BtAddress::BtAddress(const QString &address)
	: m_address(INVALID_ADDRESS)
{
	const QByteArray latin1 = address.toLatin1();
	m_address = _fromString(latin1.constData(), latin1.length(), ':');
}

BtAddress::BtAddress(const char *address)
	: m_address(_fromString(address, qstrlen(address), ':'))
{
}

BtAddress::BtAddress(QLatin1String address)
	: m_address(_fromString(address.data(), address.size(), ':'))
{
}

// -----------------------------------------------------------------------------
/*!
	Parses the path-safe form of an address, as used for the last element of
	a bluez device object path, i.e. \c "dev_AA_BB_CC_DD_EE_FF".  The
	\c "dev_" prefix is optional.

	Returns a null address if the \a segment is not a valid address.
 */
BtAddress BtAddress::fromPathSegment(const QString &segment)
{
	QString addr = segment;
	if (addr.startsWith(devicePrefix))
		addr.remove(0, devicePrefix.size());

	const QByteArray latin1 = addr.toLatin1();

	BtAddress result;
	result.m_address = _fromString(latin1.constData(), latin1.length(), '_');
	return result;
}

// -----------------------------------------------------------------------------
/*!
	Extracts the address from a bluez device object \a path.  The path is
	expected to have the \c "dev_XX_XX_XX_XX_XX_XX" element as its last
	element, any path that doesn't returns a null address.

	\code
		BtAddress::fromDevicePath(QDBusObjectPath("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF"));
		// -> AA:BB:CC:DD:EE:FF
	\endcode
 */
BtAddress BtAddress::fromDevicePath(const QDBusObjectPath &path)
{
	const QString str = path.path();

	const int index = str.lastIndexOf('/');
	if (index < 0)
		return BtAddress();

	const QString segment = str.mid(index + 1);
	if (!segment.startsWith(devicePrefix))
		return BtAddress();

	return fromPathSegment(segment);
}

void BtAddress::clear()
{
	m_address = INVALID_ADDRESS;
}

bool BtAddress::isNull() const
{
	return (m_address == INVALID_ADDRESS);
}

quint64 BtAddress::_fromString(const char *address, int length, char separator)
{
	if (!address || (length != 17))
		return INVALID_ADDRESS;

	for (int i = 0; i < length; ++i) {

		if (((i + 1) % 3) == 0) {
			// every 3rd char must be the separator
			if (address[i] != separator)
				return INVALID_ADDRESS;
		} else {
			// all other chars must be a hex digit
			if (!isxdigit(static_cast<unsigned char>(address[i])))
				return INVALID_ADDRESS;
		}
	}

	quint64 value = 0;
	for (int i = 0; i < length; i += 3) {
		const char digits[3] = { address[i], address[i + 1], '\0' };
		value = (value << 8) | quint64(strtoul(digits, nullptr, 16));
	}

	return value;
}

const char* BtAddress::_toString(char buf[32], char separator) const
{
	if (m_address == INVALID_ADDRESS)
		return nullptr;

	snprintf(buf, 32, "%02hhX%c%02hhX%c%02hhX%c%02hhX%c%02hhX%c%02hhX",
	         quint8((m_address >> 40) & 0xff), separator,
	         quint8((m_address >> 32) & 0xff), separator,
	         quint8((m_address >> 24) & 0xff), separator,
	         quint8((m_address >> 16) & 0xff), separator,
	         quint8((m_address >> 8)  & 0xff), separator,
	         quint8((m_address >> 0)  & 0xff));
	return buf;
}

// -----------------------------------------------------------------------------
/*!
	Returns the MAC address as an upper case colon separated string.

	If the address is not valid then an empty string is returned.
 */
QString BtAddress::toString() const
{
	if (m_address == INVALID_ADDRESS)
		return QString();

	char buf[32];
	return QString::fromLatin1(_toString(buf, ':'));
}

// -----------------------------------------------------------------------------
/*!
	Returns the MAC address in the lower 48-bits of the returned value.

	If the address is not valid then 0 is returned.
 */
quint64 BtAddress::toUInt64() const
{
	if (m_address == INVALID_ADDRESS)
		return 0;
	else
		return m_address;
}

// -----------------------------------------------------------------------------
/*!
	Returns the address in the form used as a bluez object path element, i.e.
	\c "dev_AA_BB_CC_DD_EE_FF".

	If the address is not valid then an empty string is returned.
 */
QString BtAddress::toPathSegment() const
{
	if (m_address == INVALID_ADDRESS)
		return QString();

	char buf[32];
	return QString(devicePrefix) + QLatin1String(_toString(buf, '_'));
}

// -----------------------------------------------------------------------------
/*!
	Returns the object path of the device with this address on the adapter
	at \a adapterPath.  If this address is null then an empty path is
	returned.

	\sa fromDevicePath()
 */
QDBusObjectPath BtAddress::devicePath(const QDBusObjectPath &adapterPath) const
{
	if (m_address == INVALID_ADDRESS)
		return QDBusObjectPath();

	return QDBusObjectPath(adapterPath.path() + QLatin1Char('/') + toPathSegment());
}

QDebug operator<<(QDebug dbg, const BtAddress &address)
{
	if (address.isNull()) {
		dbg << "00:00:00:00:00:00";
	} else {
		char buf[32];
		dbg << address._toString(buf, ':');
	}

	return dbg;
}
