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
//  btpeererror.h
//  BtPeer
//

#ifndef BTPEERERROR_H
#define BTPEERERROR_H

#include <QString>
#include <QDebug>
#include <QMetaType>


class QDBusError;


class BtPeerError
{
public:
	enum ErrorType {
		NoError = 0,
		General,
		Rejected,
		Canceled,
		Busy,
		InvalidArg,
		DoesNotExist,
		AlreadyExists,
		NotReady,
		Unavailable,
		FileNotFound,
		TimedOut,
	};

	BtPeerError();
	BtPeerError(ErrorType error);
	BtPeerError(ErrorType error, const QString &message);
	BtPeerError(ErrorType error, const char *message, ...)
		__attribute__ ((format (printf, 3, 4)));
	BtPeerError(const BtPeerError &other) = default;
	BtPeerError(BtPeerError &&other) = default;

	BtPeerError &operator=(const BtPeerError &other) = default;
	BtPeerError &operator=(BtPeerError &&other) = default;

	explicit operator bool() const Q_DECL_NOTHROW { return (m_code != NoError); }
	bool operator !() const Q_DECL_NOTHROW        { return (m_code == NoError); }

	static BtPeerError fromDBusError(const QDBusError &error);

public:
	ErrorType type() const;
	QString name() const;
	QString message() const;

	static QString errorString(ErrorType error);

private:
	ErrorType m_code;
	QString m_message;
};

QDebug operator<<(QDebug, const BtPeerError &);

Q_DECLARE_METATYPE(BtPeerError)

#endif // !defined(BTPEERERROR_H)
