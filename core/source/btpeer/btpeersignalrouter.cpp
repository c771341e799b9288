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
//  btpeersignalrouter.cpp
//  BtPeer
//

#include "btpeersignalrouter.h"
#include "utils/logging.h"

#include <QDBusArgument>
#include <QDBusMetaType>


const QString BtPeerSignalRouter::propertiesInterface =
	QStringLiteral("org.freedesktop.DBus.Properties");

const QString BtPeerSignalRouter::propertiesChangedSignal =
	QStringLiteral("PropertiesChanged");


// -----------------------------------------------------------------------------
/*!
	Convenience builder for a PropertiesChanged event on the object at \a path,
	\a interface is the interface the changed properties belong to.

 */
BtPeerSignalEvent BtPeerSignalEvent::propertiesChanged(const QDBusObjectPath &path,
                                                       const QString &interface,
                                                       const QVariantMap &changed,
                                                       const QStringList &invalidated)
{
	BtPeerSignalEvent event;
	event.interface = BtPeerSignalRouter::propertiesInterface;
	event.member = BtPeerSignalRouter::propertiesChangedSignal;
	event.path = path;
	event.arg0 = interface;
	event.changed = changed;
	event.invalidated = invalidated;
	return event;
}

// -----------------------------------------------------------------------------
/*!
	Converts a received dbus signal \a message into an event.  The leading
	string argument (if any) is stored in \c arg0 and, for property change
	signals, the changed and invalidated property arguments are demarshalled.

 */
BtPeerSignalEvent BtPeerSignalEvent::fromMessage(const QDBusMessage &message)
{
	BtPeerSignalEvent event;
	event.interface = message.interface();
	event.member = message.member();
	event.path = QDBusObjectPath(message.path());

	const QList<QVariant> args = message.arguments();
	if (!args.isEmpty() && (args[0].userType() == QMetaType::QString))
		event.arg0 = args[0].toString();

	if (args.size() > 1) {
		if (args[1].userType() == qMetaTypeId<QDBusArgument>())
			event.changed = qdbus_cast<QVariantMap>(args[1]);
		else if (args[1].userType() == QMetaType::QVariantMap)
			event.changed = args[1].toMap();
	}

	if (args.size() > 2) {
		if (args[2].userType() == qMetaTypeId<QDBusArgument>())
			event.invalidated = qdbus_cast<QStringList>(args[2]);
		else
			event.invalidated = args[2].toStringList();
	}

	return event;
}



// -----------------------------------------------------------------------------
/*!
	\class BtPeerSignalRouter
	\brief Routes bus signals to handlers by interface, signal and path.

	Each subscription names the dbus interface and signal it's interested in,
	an optional object path filter and an optional filter on the leading
	string argument.  The latter is used with PropertiesChanged to pick out
	the changes for a single sub-interface, e.g. org.bluez.Device1.

	The path filter may be empty (match any object), or an object path in
	which case it matches that object and any object below it.  This allows
	an adapter wide subscription and a per-transfer subscription to the same
	interface to exist together.

	When constructed with a bus connection the router adds one match rule
	per unique (interface, signal, arg0) tuple, reference counted across
	subscriptions.  Without a connection the router only dispatches events
	given to dispatch(), which is what the unit tests use.

	Handlers are called in the order the bus delivered the signals, and for
	a single signal in the order the subscriptions were made.  Signals with
	no matching subscription are dropped.  The object is not thread safe, it
	must be used from the thread that owns it.

 */

BtPeerSignalRouter::BtPeerSignalRouter(QObject *parent)
	: QObject(parent)
	, m_attached(false)
	, m_connection(QString())
	, m_lastId(0)
{
}

BtPeerSignalRouter::BtPeerSignalRouter(const QDBusConnection &connection,
                                       const QString &service,
                                       QObject *parent)
	: QObject(parent)
	, m_attached(true)
	, m_connection(connection)
	, m_service(service)
	, m_lastId(0)
{
}

BtPeerSignalRouter::~BtPeerSignalRouter()
{
	const QList<Subscription> subscriptions = m_subscriptions.values();
	m_subscriptions.clear();

	for (const Subscription &subscription : subscriptions)
		removeBusMatch(subscription);
}

// -----------------------------------------------------------------------------
/*!
	Registers \a handler to be called for every \a signalName signal from
	\a interfaceName emitted by an object matching \a pathFilter.  If
	\a arg0Filter is not empty the first argument of the signal must also
	equal it.

	Returns an id that can be passed to unsubscribe(), or a negative value
	if the arguments are invalid.
 */
qint64 BtPeerSignalRouter::subscribe(const QString &interfaceName,
                                     const QString &signalName,
                                     const QString &pathFilter,
                                     const Handler &handler,
                                     const QString &arg0Filter)
{
	if (Q_UNLIKELY(interfaceName.isEmpty() || signalName.isEmpty())) {
		qWarning("interface and signal names are required to subscribe");
		return -1;
	}
	if (Q_UNLIKELY(!handler)) {
		qWarning("missing handler for subscription");
		return -1;
	}

	Subscription subscription;
	subscription.interface = interfaceName;
	subscription.member = signalName;
	subscription.arg0 = arg0Filter;
	subscription.path = pathFilter;
	subscription.handler = handler;

	const qint64 id = ++m_lastId;
	m_subscriptions.insert(id, subscription);

	addBusMatch(subscription);

	qDebug() << "subscribed" << id << interfaceName << signalName
	         << "path" << pathFilter << "arg0" << arg0Filter;

	return id;
}

// -----------------------------------------------------------------------------
/*!
	Convenience wrapper to subscribe to the PropertiesChanged signals for
	properties of \a interfaceName on objects matching \a pathFilter.

 */
qint64 BtPeerSignalRouter::subscribePropertyChanges(const QString &interfaceName,
                                                    const QString &pathFilter,
                                                    const Handler &handler)
{
	return subscribe(propertiesInterface, propertiesChangedSignal,
	                 pathFilter, handler, interfaceName);
}

// -----------------------------------------------------------------------------
/*!
	Removes the subscription with the given \a id.  It is safe to call this
	from within a handler, including the handler being removed.

	Returns \c false if no subscription with \a id exists.
 */
bool BtPeerSignalRouter::unsubscribe(qint64 id)
{
	auto it = m_subscriptions.find(id);
	if (it == m_subscriptions.end())
		return false;

	const Subscription subscription = it.value();
	m_subscriptions.erase(it);

	removeBusMatch(subscription);

	qDebug() << "unsubscribed" << id;
	return true;
}

int BtPeerSignalRouter::subscriptionCount() const
{
	return m_subscriptions.size();
}

// -----------------------------------------------------------------------------
/*!
	Watches for changes to the \c Paired property of any device under the
	adapter at \a adapterPath.  The device address is recovered from the
	last element of the object path and passed to \a handler along with the
	new paired state.

	Changes that don't include the \c Paired property, or come from objects
	whose path doesn't end in a device element, are ignored.

 */
qint64 BtPeerSignalRouter::watchPairingStatus(const QDBusObjectPath &adapterPath,
                                              const PairingStatusHandler &handler)
{
	if (Q_UNLIKELY(!handler)) {
		qWarning("missing pairing status handler");
		return -1;
	}

	const Handler propertyHandler =
		[handler](const QDBusObjectPath &path, const QVariantMap &changed)
		{
			const QVariantMap::const_iterator it = changed.find(QStringLiteral("Paired"));
			if (it == changed.end())
				return;

			const BtAddress address = BtAddress::fromDevicePath(path);
			if (address.isNull()) {
				qDebug() << "ignoring paired change on non-device object" << path.path();
				return;
			}

			handler(address, it.value().toBool());
		};

	return subscribePropertyChanges(QStringLiteral("org.bluez.Device1"),
	                                adapterPath.path(), propertyHandler);
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Returns \c true if \a path matches the subscription \a filter.  An empty
	filter matches everything, otherwise the path must be the filter path
	itself or one of its children.

 */
bool BtPeerSignalRouter::pathMatches(const QString &filter, const QString &path)
{
	if (filter.isEmpty() || (filter == QLatin1String("/")))
		return true;

	if (!path.startsWith(filter))
		return false;

	return (path.length() == filter.length()) ||
	       (path.at(filter.length()) == QLatin1Char('/'));
}

// -----------------------------------------------------------------------------
/*!
	Delivers \a event to every subscription that matches it.

	Handlers may subscribe or unsubscribe while being called; subscriptions
	added during the dispatch don't see the current event and subscriptions
	removed during the dispatch are not called.

 */
void BtPeerSignalRouter::dispatch(const BtPeerSignalEvent &event)
{
	const QList<qint64> ids = m_subscriptions.keys();
	for (const qint64 id : ids) {

		auto it = m_subscriptions.constFind(id);
		if (it == m_subscriptions.constEnd())
			continue;

		const Subscription &subscription = it.value();
		if (subscription.interface != event.interface)
			continue;
		if (subscription.member != event.member)
			continue;
		if (!subscription.arg0.isEmpty() && (subscription.arg0 != event.arg0))
			continue;
		if (!pathMatches(subscription.path, event.path.path()))
			continue;

		// take a copy as the handler may unsubscribe itself
		const Handler handler = subscription.handler;
		handler(event.path, event.changed);
	}
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Slot called by QtDBus for every signal that matched one of our rules.

 */
void BtPeerSignalRouter::onBusSignal(const QDBusMessage &message)
{
	dispatch(BtPeerSignalEvent::fromMessage(message));
}

QString BtPeerSignalRouter::busMatchKey(const Subscription &subscription)
{
	return subscription.interface + QLatin1Char('|') +
	       subscription.member + QLatin1Char('|') +
	       subscription.arg0;
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Adds a bus match rule for the \a subscription if there isn't already one
	covering it.  Path filtering is done in dispatch() so the rule matches
	any path.

 */
void BtPeerSignalRouter::addBusMatch(const Subscription &subscription)
{
	if (!m_attached)
		return;

	const QString key = busMatchKey(subscription);

	int &refs = m_busMatches[key];
	if (refs++ > 0)
		return;

	QStringList argumentMatch;
	if (!subscription.arg0.isEmpty())
		argumentMatch << subscription.arg0;

	if (!m_connection.connect(m_service, QString(),
	                          subscription.interface, subscription.member,
	                          argumentMatch, QString(),
	                          this, SLOT(onBusSignal(QDBusMessage)))) {
		qError() << "failed to add bus match for" << subscription.interface
		         << subscription.member << m_connection.lastError();
	}
}

void BtPeerSignalRouter::removeBusMatch(const Subscription &subscription)
{
	if (!m_attached)
		return;

	const QString key = busMatchKey(subscription);

	auto it = m_busMatches.find(key);
	if (it == m_busMatches.end())
		return;

	if (--it.value() > 0)
		return;

	m_busMatches.erase(it);

	QStringList argumentMatch;
	if (!subscription.arg0.isEmpty())
		argumentMatch << subscription.arg0;

	if (!m_connection.disconnect(m_service, QString(),
	                             subscription.interface, subscription.member,
	                             argumentMatch, QString(),
	                             this, SLOT(onBusSignal(QDBusMessage)))) {
		qWarning() << "failed to remove bus match for" << subscription.interface
		           << subscription.member;
	}
}
