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
//  btpeererror.cpp
//  BtPeer
//

#include "btpeererror.h"

#include <QDBusError>

#include <stdarg.h>


BtPeerError::BtPeerError()
	: m_code(NoError)
{
}

BtPeerError::BtPeerError(ErrorType error)
	: m_code(error)
{
}

BtPeerError::BtPeerError(ErrorType error, const QString &message)
	: m_code(error)
	, m_message(message)
{
}

BtPeerError::BtPeerError(ErrorType error, const char *message, ...)
	: m_code(error)
{
	va_list vl;
	va_start(vl, message);
	m_message = QString::vasprintf(message, vl);
	va_end(vl);
}

// -----------------------------------------------------------------------------
/*!
	Converts a D-Bus error into one of our error types.  The bluez and obexd
	error names are matched first, then the generic freedesktop ones.  Any
	name not recognised is reported as a \l{BtPeerError::General} error with
	the original name folded into the message.

 */
BtPeerError BtPeerError::fromDBusError(const QDBusError &error)
{
	if (!error.isValid())
		return BtPeerError();

	static const struct {
		const char *name;
		ErrorType type;
	} mapping[] = {
		{ "org.bluez.Error.Rejected",                       Rejected        },
		{ "org.bluez.Error.AuthenticationRejected",         Rejected        },
		{ "org.bluez.Error.AuthenticationFailed",           Rejected        },
		{ "org.bluez.Error.Canceled",                       Canceled        },
		{ "org.bluez.Error.AuthenticationCanceled",         Canceled        },
		{ "org.bluez.Error.InProgress",                     Busy            },
		{ "org.bluez.Error.InvalidArguments",               InvalidArg      },
		{ "org.bluez.Error.DoesNotExist",                   DoesNotExist    },
		{ "org.bluez.Error.AlreadyExists",                  AlreadyExists   },
		{ "org.bluez.Error.AlreadyConnected",               AlreadyExists   },
		{ "org.bluez.Error.NotReady",                       NotReady        },
		{ "org.bluez.Error.NotAvailable",                   Unavailable     },
		{ "org.bluez.Error.AuthenticationTimeout",          TimedOut        },
		{ "org.bluez.obex.Error.InvalidArguments",          InvalidArg      },
		{ "org.freedesktop.DBus.Error.UnknownObject",       DoesNotExist    },
		{ "org.freedesktop.DBus.Error.UnknownInterface",    DoesNotExist    },
		{ "org.freedesktop.DBus.Error.UnknownProperty",     DoesNotExist    },
		{ "org.freedesktop.DBus.Error.UnknownMethod",       DoesNotExist    },
		{ "org.freedesktop.DBus.Error.InvalidArgs",         InvalidArg      },
		{ "org.freedesktop.DBus.Error.NoReply",             TimedOut        },
		{ "org.freedesktop.DBus.Error.Timeout",             TimedOut        },
		{ "org.freedesktop.DBus.Error.TimedOut",            TimedOut        },
		{ "org.freedesktop.DBus.Error.ServiceUnknown",      Unavailable     },
		{ "org.freedesktop.DBus.Error.NoServer",            Unavailable     },
		{ "org.freedesktop.DBus.Error.Disconnected",        Unavailable     },
		{ "org.freedesktop.DBus.Error.AccessDenied",        Rejected        },
	};

	const QString name = error.name();
	for (unsigned i = 0; i < (sizeof(mapping) / sizeof(mapping[0])); i++) {
		if (name == QLatin1String(mapping[i].name))
			return BtPeerError(mapping[i].type, error.message());
	}

	return BtPeerError(General, QStringLiteral("%1: %2").arg(name, error.message()));
}

BtPeerError::ErrorType BtPeerError::type() const
{
	return m_code;
}

QString BtPeerError::name() const
{
	return errorString(m_code);
}

QString BtPeerError::message() const
{
	return m_message;
}

// -----------------------------------------------------------------------------
/*!
	Returns the D-Bus style error name for the given \a error type.  These are
	the names sent back over the bus when one of our exported objects fails a
	method call.

 */
QString BtPeerError::errorString(ErrorType error)
{
	switch (error) {
		case NoError:
			return QStringLiteral("org.bluez.Error.None");
		case General:
			return QStringLiteral("org.bluez.Error.Failed");
		case Rejected:
			return QStringLiteral("org.bluez.Error.Rejected");
		case Canceled:
			return QStringLiteral("org.bluez.Error.Canceled");
		case Busy:
			return QStringLiteral("org.bluez.Error.InProgress");
		case InvalidArg:
			return QStringLiteral("org.bluez.Error.InvalidArguments");
		case DoesNotExist:
			return QStringLiteral("org.bluez.Error.DoesNotExist");
		case AlreadyExists:
			return QStringLiteral("org.bluez.Error.AlreadyExists");
		case NotReady:
			return QStringLiteral("org.bluez.Error.NotReady");
		case Unavailable:
			return QStringLiteral("org.bluez.Error.NotAvailable");
		case FileNotFound:
			return QStringLiteral("org.bluez.Error.FileNotFound");
		case TimedOut:
			return QStringLiteral("org.bluez.Error.TimedOut");
		default:
			return QStringLiteral("org.bluez.Error.Unknown");
	}
}

QDebug operator<<(QDebug dbg, const BtPeerError &err)
{
	QDebugStateSaver saver(dbg);
	dbg.nospace() << "BtPeerError(" << err.name() << ", " << err.message() << ')';
	return dbg;
}
