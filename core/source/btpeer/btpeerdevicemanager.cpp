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
//  btpeerdevicemanager.cpp
//  BtPeer
//

#include "btpeerdevicemanager.h"
#include "btpeerbluetoothservice.h"
#include "btpeersignalrouter.h"

#include "configsettings/configsettings.h"
#include "utils/logging.h"

#include <QTimer>
#include <QEventLoop>
#include <QMutexLocker>


// -----------------------------------------------------------------------------
/*!
	\class BtPeerDeviceManager
	\brief Tracks and drives the peer devices of a single bluetooth adapter.

	The manager never caches the device list, every query is a fresh read of
	the managed objects published by bluez, filtered to the adapter this
	object was constructed for.

	All the commands (pair, connect, disconnect and unpair) are verified by
	reading back the device state once the command has completed, the reply
	from bluez alone is not treated as success.  None of the public methods
	throw; faults are logged and reported as a \c false return value.

	The pairing agent is created the first time it is needed and then lives
	for as long as the manager.
 */


static const QString kDevice1Interface = QStringLiteral("org.bluez.Device1");
static const QString kAdapter1Interface = QStringLiteral("org.bluez.Adapter1");
static const QString kMediaPlayer1Interface = QStringLiteral("org.bluez.MediaPlayer1");


BtPeerDeviceManager::BtPeerDeviceManager(const QSharedPointer<const ConfigSettings> &config,
                                         const QSharedPointer<BtPeerBluetoothService> &service,
                                         const QSharedPointer<BtPeerSignalRouter> &router,
                                         const QString &adapterName,
                                         QObject *parent)
	: QObject(parent)
	, m_config(config)
	, m_service(service)
	, m_router(router)
	, m_adapterName(adapterName.isEmpty() ? config->adapterName() : adapterName)
	, m_adapterPath(config->bluezRoot() + QLatin1Char('/') + m_adapterName)
	, m_pairingWatchId(-1)
	, m_agentLock(QMutex::Recursive)
	, m_agentRegistered(false)
	, m_agentIsDefault(false)
{
	BtAddress::registerType();

	// the router calls us back on any Paired property change of a device
	// under our adapter, re-emit it as a signal
	if (m_router) {
		m_pairingWatchId = m_router->watchPairingStatus(m_adapterPath,
			[this](const BtAddress &address, bool paired)
			{
				qMilestone() << "device" << address
				             << (paired ? "paired" : "unpaired");
				emit devicePairingChanged(address, paired);
			});
	}
}

BtPeerDeviceManager::~BtPeerDeviceManager()
{
	if (m_router && (m_pairingWatchId >= 0))
		m_router->unsubscribe(m_pairingWatchId);

	if (m_agentRegistered)
		unregisterAgent();
}

QString BtPeerDeviceManager::adapterName() const
{
	return m_adapterName;
}

QDBusObjectPath BtPeerDeviceManager::adapterPath() const
{
	return m_adapterPath;
}

// -----------------------------------------------------------------------------
/*!
	Returns the bluez object path of the device with the given \a address on
	this adapter.  The path is derived from the address, it doesn't mean the
	device object actually exists.

 */
QDBusObjectPath BtPeerDeviceManager::devicePath(const BtAddress &address) const
{
	return address.devicePath(m_adapterPath);
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Reads the current managed objects from bluez.  Returns \c false and logs
	an error if the read fails.

 */
bool BtPeerDeviceManager::managedObjects(DBusManagedObjectList *objects) const
{
	const BtPeerError error = m_service->getManagedObjects(objects);
	if (error) {
		qError() << "failed to get managed objects due to" << error;
		return false;
	}

	return true;
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Returns \c true if the device object at \a path belongs to our adapter.
	The \c Adapter property is used if present, otherwise the object path
	must sit directly under the adapter path.

 */
bool BtPeerDeviceManager::isOnAdapter(const QDBusObjectPath &path,
                                      const QVariantMap &deviceProperties) const
{
	const QVariant adapter = deviceProperties.value(QStringLiteral("Adapter"));
	if (adapter.userType() == qMetaTypeId<QDBusObjectPath>())
		return (adapter.value<QDBusObjectPath>() == m_adapterPath);

	return path.path().startsWith(m_adapterPath.path() + QLatin1Char('/'));
}

// -----------------------------------------------------------------------------
/*!
	Returns a map of all the devices on the adapter that bluez reports as
	paired, the value being the device name.  Devices that don't have a
	valid address are logged and skipped.

 */
QMap<BtAddress, QString> BtPeerDeviceManager::listPaired() const
{
	QMap<BtAddress, QString> paired;

	DBusManagedObjectList objects;
	if (!managedObjects(&objects))
		return paired;

	DBusManagedObjectList::const_iterator object = objects.begin();
	for (; object != objects.end(); ++object) {

		const DBusInterfaceList &interfaces = object.value();
		DBusInterfaceList::const_iterator device = interfaces.find(kDevice1Interface);
		if (device == interfaces.end())
			continue;

		const QVariantMap &properties = device.value();
		if (!isOnAdapter(object.key(), properties))
			continue;

		if (!properties.value(QStringLiteral("Paired")).toBool())
			continue;

		BtAddress address(properties.value(QStringLiteral("Address")).toString());
		if (address.isNull())
			address = BtAddress::fromDevicePath(object.key());
		if (address.isNull()) {
			qWarning() << "paired device" << object.key().path()
			           << "has no valid address, skipping";
			continue;
		}

		QString name = properties.value(QStringLiteral("Name")).toString();
		if (name.isEmpty())
			name = properties.value(QStringLiteral("Alias")).toString();

		paired.insert(address, name);
	}

	return paired;
}

// -----------------------------------------------------------------------------
/*!
	Returns a list of all the devices bluez currently knows about on the
	adapter, paired or not.

 */
QList<BtPeerDeviceInfo> BtPeerDeviceManager::listDiscovered() const
{
	QList<BtPeerDeviceInfo> discovered;

	DBusManagedObjectList objects;
	if (!managedObjects(&objects))
		return discovered;

	DBusManagedObjectList::const_iterator object = objects.begin();
	for (; object != objects.end(); ++object) {

		const DBusInterfaceList &interfaces = object.value();
		DBusInterfaceList::const_iterator device = interfaces.find(kDevice1Interface);
		if (device == interfaces.end())
			continue;

		const QVariantMap &properties = device.value();
		if (!isOnAdapter(object.key(), properties))
			continue;

		BtPeerDeviceInfo info;
		info.path = object.key();
		info.address = BtAddress(properties.value(QStringLiteral("Address")).toString());
		if (info.address.isNull())
			info.address = BtAddress::fromDevicePath(object.key());
		if (info.address.isNull()) {
			qWarning() << "device" << object.key().path()
			           << "has no valid address, skipping";
			continue;
		}

		info.alias = properties.value(QStringLiteral("Alias")).toString();

		discovered.append(info);
	}

	return discovered;
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Puts the adapter into (or out of) discovery mode.  The current state is
	read first, if the adapter is already in the requested state no command
	is sent.

 */
bool BtPeerDeviceManager::setDiscovering(bool enable)
{
	QVariant discovering;
	BtPeerError error = m_service->getProperty(m_adapterPath, kAdapter1Interface,
	                                           QStringLiteral("Discovering"),
	                                           &discovering);
	if (error) {
		qError() << "failed to read discovering state of" << m_adapterName
		         << "due to" << error;
		return false;
	}

	if (discovering.toBool() == enable) {
		qInfo() << "adapter" << m_adapterName << "already"
		        << (enable ? "discovering" : "not discovering");
		return true;
	}

	if (enable)
		error = m_service->startDiscovery(m_adapterPath);
	else
		error = m_service->stopDiscovery(m_adapterPath);

	if (error) {
		qError() << "failed to" << (enable ? "start" : "stop")
		         << "discovery due to" << error;
		return false;
	}

	qMilestone() << "discovery" << (enable ? "started" : "stopped")
	             << "on" << m_adapterName;
	return true;
}

bool BtPeerDeviceManager::startDiscovery()
{
	return setDiscovering(true);
}

bool BtPeerDeviceManager::stopDiscovery()
{
	return setDiscovering(false);
}

// -----------------------------------------------------------------------------
/*!
	Returns \c true if \a capability is one of the IO capability strings
	bluez accepts for an agent.

 */
bool BtPeerDeviceManager::isValidCapability(const QString &capability)
{
	static const char *capabilities[] = {
		"DisplayOnly",
		"DisplayYesNo",
		"KeyboardOnly",
		"NoInputNoOutput",
		"KeyboardDisplay",
	};

	for (unsigned i = 0; i < (sizeof(capabilities) / sizeof(capabilities[0])); i++) {
		if (capability == QLatin1String(capabilities[i]))
			return true;
	}

	return false;
}

// -----------------------------------------------------------------------------
/*!
	Registers the pairing agent with bluez and asks for it to be the default
	agent.  If \a capability is empty the value from the config is used.

	The agent object is created on the first call and reused on subsequent
	calls; if \a ask is set it replaces the agent's current ask function.
	Calling this while the agent is already registered just updates the ask
	function and returns \c true.

 */
bool BtPeerDeviceManager::registerAgent(const QString &capability,
                                        const BtPeerAgent::AskFunction &ask)
{
	QMutexLocker locker(&m_agentLock);

	const QString agentCapability =
		capability.isEmpty() ? m_config->agentCapability() : capability;
	if (!isValidCapability(agentCapability)) {
		qWarning() << "invalid agent capability" << agentCapability;
		return false;
	}

	if (!m_agent) {
		m_agent = QSharedPointer<BtPeerAgent>::create(QDBusObjectPath(m_config->agentPath()),
		                                              ask);
		QObject::connect(m_agent.data(), &BtPeerAgent::released,
		                 this, &BtPeerDeviceManager::onAgentReleased);

	} else if (ask) {
		m_agent->setAskFunction(ask);
	}

	if (m_agentRegistered) {
		qDebug() << "agent already registered at" << m_agent->path().path();
		return m_agentIsDefault || requestDefaultAgent();
	}

	BtPeerError error = m_service->exportAgent(m_agent.data());
	if (error) {
		qError() << "failed to export agent object due to" << error;
		return false;
	}

	error = m_service->registerAgent(m_agent->path(), agentCapability);
	if (error && (error.type() != BtPeerError::AlreadyExists)) {
		qError() << "failed to register agent due to" << error;
		m_service->unexportAgent(m_agent.data());
		return false;
	}

	m_agentRegistered = true;
	qMilestone() << "registered agent" << m_agent->path().path()
	             << "with capability" << agentCapability;

	return requestDefaultAgent();
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Asks bluez to make our registered agent the default one.  If this fails
	the agent stays registered and the request is retried on the next call
	to registerAgent().

	Must be called with the agent lock held.
 */
bool BtPeerDeviceManager::requestDefaultAgent()
{
	const BtPeerError error = m_service->requestDefaultAgent(m_agent->path());
	if (error) {
		qError() << "failed to make agent the default due to" << error;
		return false;
	}

	m_agentIsDefault = true;
	return true;
}

// -----------------------------------------------------------------------------
/*!
	Unregisters the agent from bluez and removes it from the bus.  Does
	nothing if the agent isn't registered.

 */
bool BtPeerDeviceManager::unregisterAgent()
{
	QMutexLocker locker(&m_agentLock);

	if (!m_agent || !m_agentRegistered)
		return true;

	const BtPeerError error = m_service->unregisterAgent(m_agent->path());
	if (error && (error.type() != BtPeerError::DoesNotExist))
		qWarning() << "failed to unregister agent due to" << error;

	m_service->unexportAgent(m_agent.data());
	m_agentRegistered = false;
	m_agentIsDefault = false;

	qMilestone() << "unregistered agent" << m_agent->path().path();

	return !error || (error.type() == BtPeerError::DoesNotExist);
}

bool BtPeerDeviceManager::isAgentRegistered() const
{
	QMutexLocker locker(&m_agentLock);
	return m_agentRegistered;
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Called when bluez tells the agent it has been released, typically because
	bluetoothd has restarted.  The agent object stays exported but we no
	longer consider it registered.

 */
void BtPeerDeviceManager::onAgentReleased()
{
	QMutexLocker locker(&m_agentLock);

	if (m_agent)
		m_service->unexportAgent(m_agent.data());

	m_agentRegistered = false;
	m_agentIsDefault = false;
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Reads one of the boolean properties of the \c org.bluez.Device1 interface
	of the device.  Unknown object / property errors are expected while the
	adapter is being re-bound so are only logged at debug level.

 */
bool BtPeerDeviceManager::readDeviceFlag(const BtAddress &address,
                                         const char *name, bool *value) const
{
	QVariant result;
	const BtPeerError error = m_service->getProperty(devicePath(address),
	                                                 kDevice1Interface,
	                                                 QLatin1String(name),
	                                                 &result);
	if (error) {
		if ((error.type() == BtPeerError::DoesNotExist) ||
		    (error.type() == BtPeerError::InvalidArg))
			qDebug() << "no" << name << "property for" << address << error;
		else
			qWarning() << "failed to read" << name << "property of" << address
			           << "due to" << error;
		return false;
	}

	*value = result.toBool();
	return true;
}

// -----------------------------------------------------------------------------
/*!
	Returns \c true if the device reports it is paired.  Any failure to read
	the property is treated as not paired.

 */
bool BtPeerDeviceManager::isPaired(const BtAddress &address) const
{
	bool paired = false;
	if (!readDeviceFlag(address, "Paired", &paired))
		return false;

	return paired;
}

bool BtPeerDeviceManager::isConnected(const BtAddress &address) const
{
	bool connected = false;
	if (!readDeviceFlag(address, "Connected", &connected))
		return false;

	return connected;
}

// -----------------------------------------------------------------------------
/*!
	Pairs with the device.  If the device is already paired this returns
	\c true without sending a pair request.

	An agent is registered first if there isn't one, without an ask function
	it will reject any prompt so only 'just works' pairing will succeed.

	The pair request blocks (while still processing events, so that agent
	calls are serviced) for up to the configured pair timeout.  Success is
	decided by reading back the \c Paired property afterwards.
 */
bool BtPeerDeviceManager::pair(const BtAddress &address)
{
	if (Q_UNLIKELY(address.isNull())) {
		qWarning("invalid address");
		return false;
	}

	if (isPaired(address)) {
		qInfo() << "device" << address << "already paired";
		return true;
	}

	if (!isAgentRegistered()) {
		qWarning("no agent registered, registering one without prompts");
		if (!registerAgent())
			qWarning("failed to register agent, trying to pair anyway");
	}

	qMilestone() << "pairing with" << address;

	const BtPeerError error = m_service->pairDevice(devicePath(address),
	                                                m_config->pairTimeout());
	if (error && (error.type() != BtPeerError::AlreadyExists)) {
		qError() << "failed to pair with" << address << "due to" << error;
		return false;
	}

	if (!isPaired(address)) {
		qWarning() << "pair request completed but" << address << "is not paired";
		return false;
	}

	qMilestone() << "paired with" << address;
	return true;
}

// -----------------------------------------------------------------------------
/*!
	Connects to the device and checks the \c Connected property afterwards.
	Returns \c true immediately if already connected.

 */
bool BtPeerDeviceManager::connectDevice(const BtAddress &address)
{
	if (Q_UNLIKELY(address.isNull())) {
		qWarning("invalid address");
		return false;
	}

	if (isConnected(address)) {
		qInfo() << "device" << address << "already connected";
		return true;
	}

	qMilestone() << "connecting to" << address;

	const BtPeerError error = m_service->connectDevice(devicePath(address),
	                                                   m_config->connectTimeout());
	if (error && (error.type() != BtPeerError::AlreadyExists)) {
		qError() << "failed to connect to" << address << "due to" << error;
		return false;
	}

	if (!isConnected(address)) {
		qWarning() << "connect request completed but" << address << "is not connected";
		return false;
	}

	qMilestone() << "connected to" << address;
	return true;
}

// -----------------------------------------------------------------------------
/*!
	Disconnects the device.  If the device isn't connected then no request
	is sent and \c true is returned.

 */
bool BtPeerDeviceManager::disconnectDevice(const BtAddress &address)
{
	if (Q_UNLIKELY(address.isNull())) {
		qWarning("invalid address");
		return false;
	}

	if (!isConnected(address)) {
		qInfo() << "device" << address << "not connected";
		return true;
	}

	const BtPeerError error = m_service->disconnectDevice(devicePath(address),
	                                                      m_config->connectTimeout());
	if (error) {
		qError() << "failed to disconnect" << address << "due to" << error;
		return false;
	}

	if (isConnected(address)) {
		qWarning() << "disconnect request completed but" << address
		           << "is still connected";
		return false;
	}

	qMilestone() << "disconnected" << address;
	return true;
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Looks for the device object of \a address in the managed objects of our
	adapter.  Returns an empty path if not found.

 */
QDBusObjectPath BtPeerDeviceManager::findDevice(const BtAddress &address) const
{
	DBusManagedObjectList objects;
	if (!managedObjects(&objects))
		return QDBusObjectPath();

	DBusManagedObjectList::const_iterator object = objects.begin();
	for (; object != objects.end(); ++object) {

		const DBusInterfaceList &interfaces = object.value();
		DBusInterfaceList::const_iterator device = interfaces.find(kDevice1Interface);
		if (device == interfaces.end())
			continue;

		const QVariantMap &properties = device.value();
		if (!isOnAdapter(object.key(), properties))
			continue;

		BtAddress deviceAddress(properties.value(QStringLiteral("Address")).toString());
		if (deviceAddress.isNull())
			deviceAddress = BtAddress::fromDevicePath(object.key());

		if (deviceAddress == address)
			return object.key();
	}

	return QDBusObjectPath();
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Waits for \a msecs while still processing events.

 */
void BtPeerDeviceManager::settle(int msecs)
{
	if (msecs <= 0)
		return;

	QEventLoop loop;
	QTimer::singleShot(msecs, &loop, &QEventLoop::quit);
	loop.exec();
}

// -----------------------------------------------------------------------------
/*!
	Removes the device from bluez, which drops the pairing.  If the device
	isn't known this is treated as already unpaired and returns \c true.

	The bluez remove request returns before the object has been removed, so
	after it returns we wait for the configured settle time and then check
	the device has gone.  If it is still there \c false is returned.
 */
bool BtPeerDeviceManager::unpair(const BtAddress &address)
{
	if (Q_UNLIKELY(address.isNull())) {
		qWarning("invalid address");
		return false;
	}

	const QDBusObjectPath path = findDevice(address);
	if (path.path().isEmpty()) {
		qInfo() << "device" << address << "not found, treating as unpaired";
		return true;
	}

	const BtPeerError error = m_service->removeDevice(m_adapterPath, path);
	if (error) {
		qError() << "failed to remove device" << address << "due to" << error;
		return false;
	}

	settle(m_config->unpairSettleTime());

	if (!findDevice(address).path().isEmpty()) {
		qWarning() << "device" << address << "still present after removal";
		return false;
	}

	qMilestone() << "unpaired" << address;
	return true;
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Finds the \c org.bluez.MediaPlayer1 object for the device, bluez puts it
	under the device path, i.e. \c /org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF/player0

 */
QDBusObjectPath BtPeerDeviceManager::findMediaPlayer(const BtAddress &address) const
{
	DBusManagedObjectList objects;
	if (!managedObjects(&objects))
		return QDBusObjectPath();

	const QString devicePrefix = devicePath(address).path() + QLatin1Char('/');

	DBusManagedObjectList::const_iterator object = objects.begin();
	for (; object != objects.end(); ++object) {

		if (!object.value().contains(kMediaPlayer1Interface))
			continue;

		if (object.key().path().startsWith(devicePrefix))
			return object.key();
	}

	return QDBusObjectPath();
}

// -----------------------------------------------------------------------------
/*!
	Sends one of the media control commands to the device's media player.
	The \a command must be one of \c play, \c pause, \c next, \c previous or
	\c rewind.  Returns \c false (and logs) if the command is unknown, the
	device has no media player or the call fails.

 */
bool BtPeerDeviceManager::mediaCommand(const QString &command,
                                       const BtAddress &address)
{
	static const struct {
		const char *command;
		const char *method;
	} commands[] = {
		{ "play",       "Play"      },
		{ "pause",      "Pause"     },
		{ "next",       "Next"      },
		{ "previous",   "Previous"  },
		{ "rewind",     "Rewind"    },
	};

	const QString lowerCommand = command.toLower();

	QString method;
	for (unsigned i = 0; i < (sizeof(commands) / sizeof(commands[0])); i++) {
		if (lowerCommand == QLatin1String(commands[i].command)) {
			method = QLatin1String(commands[i].method);
			break;
		}
	}

	if (method.isEmpty()) {
		qWarning() << "unknown media command" << command;
		return false;
	}

	const QDBusObjectPath player = findMediaPlayer(address);
	if (player.path().isEmpty()) {
		qWarning() << "no media player found for" << address;
		return false;
	}

	const BtPeerError error = m_service->mediaPlayerControl(player, method);
	if (error) {
		qError() << "media command" << method << "failed on" << player.path()
		         << "due to" << error;
		return false;
	}

	qInfo() << "sent" << method << "to" << player.path();
	return true;
}
