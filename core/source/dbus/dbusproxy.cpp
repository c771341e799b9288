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
//  dbusproxy.cpp
//  BtPeer
//

#include "dbusproxy.h"
#include "utils/logging.h"

#include <QTimer>
#include <QEventLoop>
#include <QDBusPendingCallWatcher>


// -----------------------------------------------------------------------------
/*!
	\class DBusProxy
	\brief Short lived proxy for one interface on one remote object.

	The bluez and obexd services create one of these per call rather than
	holding a typed proxy class per interface; the method name and arguments
	are supplied to invoke() or call() and the reply is read from the
	returned QDBusPendingCall.

	\code
		DBusProxy proxy(bus, "org.bluez", devicePath, "org.bluez.Device1", 30000);
		BtPeerError error = proxy.call(QStringLiteral("Connect"));
	\endcode

 */
DBusProxy::DBusProxy(const QDBusConnection &connection, const QString &service,
                     const QDBusObjectPath &path, const char *interface,
                     int timeout)
	: QDBusAbstractInterface(service, path.path(), interface, connection, nullptr)
{
	setTimeout(timeout);
}

DBusProxy::~DBusProxy()
{
}

// -----------------------------------------------------------------------------
/*!
	Waits for the pending \a call to complete or for the proxy's timeout to
	expire.

	Unlike QDBusPendingCall::waitForFinished() this runs a local event loop
	whilst waiting, so incoming method calls on our own exported objects are
	still dispatched.  This is required for org.bluez.Device1.Pair as bluez
	calls back into our agent before replying.

	Returns an error if the call failed or didn't complete in time.
 */
BtPeerError DBusProxy::wait(const QDBusPendingCall &call) const
{
	const int timeoutMSecs = timeout();

	if (!call.isFinished()) {

		QEventLoop loop;

		QDBusPendingCallWatcher watcher(call);
		QObject::connect(&watcher, &QDBusPendingCallWatcher::finished,
		                 &loop, &QEventLoop::quit);

		QTimer timer;
		timer.setSingleShot(true);
		QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
		timer.start(timeoutMSecs);

		loop.exec();

		if (!watcher.isFinished()) {
			qWarning("timed-out after %dms waiting for %s reply from %s",
			         timeoutMSecs, qPrintable(interface()), qPrintable(path()));
			return BtPeerError(BtPeerError::TimedOut, "No reply within %dms",
			                   timeoutMSecs);
		}
	}

	if (call.isError())
		return BtPeerError::fromDBusError(call.error());

	return BtPeerError();
}
