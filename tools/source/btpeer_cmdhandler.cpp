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
//  btpeer_cmdhandler.cpp
//  BtPeer
//

#include "btpeer_cmdhandler.h"

#include "btpeer/btpeerdevicemanager.h"
#include "btpeer/btpeersignalrouter.h"
#include "btpeer/btpeerprocess.h"
#include "bluez/btpeerbluetoothservice_p.h"
#include "obex/btpeerobjectpushservice_p.h"
#include "configsettings/configsettings.h"
#include "utils/logging.h"

#include <QDebug>
#include <QFileInfo>
#include <QDir>
#include <QTimer>
#include <QEventLoop>


// the time to wait for the operator to answer an agent question
static const int promptTimeout = (30 * 1000);



BtPeerCmdHandler::BtPeerCmdHandler(const QSharedPointer<const ConfigSettings> &config,
                                   const QDBusConnection &bluezBus,
                                   const QDBusConnection &obexBus,
                                   const QString &adapterName,
                                   const QString &agentCapability,
                                   QObject *parent)
	: BaseCmdHandler(parent)
	, m_config(config)
	, m_deviceManager(nullptr)
	, m_transfers(nullptr)
	, m_audioPlayer(nullptr)
	, m_agentCapability(agentCapability)
	, m_shutdown(false)
{
	if (m_agentCapability.isEmpty())
		m_agentCapability = m_config->agentCapability();

	// the bluez side, used for device management and pairing
	m_bluetoothService =
		QSharedPointer<BtPeerBluetoothServiceBluez>::create(bluezBus,
		                                                    m_config->bluezService(),
		                                                    m_config->bluezRoot(),
		                                                    m_config->busCallTimeout());
	m_bluezRouter =
		QSharedPointer<BtPeerSignalRouter>::create(bluezBus, m_config->bluezService());

	m_deviceManager = new BtPeerDeviceManager(m_config, m_bluetoothService,
	                                          m_bluezRouter, adapterName, this);

	QObject::connect(m_deviceManager, &BtPeerDeviceManager::devicePairingChanged,
	                 this, &BtPeerCmdHandler::onDevicePairingChanged);


	// and the obex side, used for file transfers
	m_pushService =
		QSharedPointer<BtPeerObjectPushServiceObex>::create(obexBus,
		                                                    m_config->obexService(),
		                                                    m_config->busCallTimeout());
	m_obexRouter =
		QSharedPointer<BtPeerSignalRouter>::create(obexBus, m_config->obexService());

	m_transfers = new BtPeerTransferCoordinator(m_config, m_pushService,
	                                            m_obexRouter, this);

	QObject::connect(m_transfers, &BtPeerTransferCoordinator::transferProgress,
	                 this, &BtPeerCmdHandler::onTransferProgress);
	QObject::connect(m_transfers, &BtPeerTransferCoordinator::statusChanged,
	                 this, &BtPeerCmdHandler::onTransferStatusChanged);


	m_audioPlayer = new BtPeerProcess(QStringLiteral("audioPlayer"), this);
}

BtPeerCmdHandler::~BtPeerCmdHandler()
{
	shutdown();
}

// -----------------------------------------------------------------------------
/*!
	Returns \c true if bluez could be found on the bus.

 */
bool BtPeerCmdHandler::isValid()
{
	return m_bluetoothService && m_bluetoothService->isAvailable();
}

QString BtPeerCmdHandler::prompt()
{
	return QStringLiteral("[btpeer %1]# ").arg(m_deviceManager->adapterName());
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Agent ask function, translates the agent's requests into questions for
	the operator.  PIN and passkey questions return whatever was typed,
	confirmations are converted to a boolean so that typing 'no' rejects
	the request.

 */
QVariant BtPeerCmdHandler::onAgentRequest(BtPeerAgent::Request request,
                                          const QDBusObjectPath &device,
                                          const QVariantMap &args)
{
	const BtAddress address = BtAddress::fromDevicePath(device);
	const QString name = address.isNull() ? device.path() : address.toString();

	switch (request) {
		case BtPeerAgent::PinCodeRequest:
			if (!m_askUser)
				return QVariant();
			return m_askUser(QStringLiteral("Enter PIN code for %1: ").arg(name),
			                 promptTimeout);

		case BtPeerAgent::PasskeyRequest:
			if (!m_askUser)
				return QVariant();
			return m_askUser(QStringLiteral("Enter passkey for %1 (0-999999): ").arg(name),
			                 promptTimeout);

		case BtPeerAgent::ConfirmationRequest:
			return askYesNo(QStringLiteral("Confirm passkey %1 for %2 (yes/no): ")
			                    .arg(args.value(QStringLiteral("passkey")).toUInt(), 6, 10, QChar('0'))
			                    .arg(name));

		case BtPeerAgent::AuthorizationRequest:
			return askYesNo(QStringLiteral("Authorize pairing with %1 (yes/no): ").arg(name));

		case BtPeerAgent::ServiceAuthorizationRequest:
			return askYesNo(QStringLiteral("Authorize service %1 for %2 (yes/no): ")
			                    .arg(args.value(QStringLiteral("uuid")).toString())
			                    .arg(name));

		case BtPeerAgent::DisplayPasskeyRequest:
			qProdLog("Passkey for %s: %06u (entered %u)", qPrintable(name),
			         args.value(QStringLiteral("passkey")).toUInt(),
			         args.value(QStringLiteral("entered")).toUInt());
			return true;

		case BtPeerAgent::DisplayPinCodeRequest:
			qProdLog("PIN code for %s: %s", qPrintable(name),
			         qPrintable(args.value(QStringLiteral("pincode")).toString()));
			return true;

		case BtPeerAgent::CancelRequest:
			qProdLog("Pairing request for %s cancelled by the remote device", qPrintable(name));
			if (m_abortAsk)
				m_abortAsk();
			return true;
	}

	return QVariant();
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Asks the operator a yes / no question, anything other than 'y' or 'yes'
	(including a timeout) is treated as no.

 */
bool BtPeerCmdHandler::askYesNo(const QString &question)
{
	if (!m_askUser)
		return false;

	const QString answer = m_askUser(question, promptTimeout).trimmed().toLower();
	return (answer == QLatin1String("y")) || (answer == QLatin1String("yes"));
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Registers the agent with the capability given on the command line if
	not already registered.

 */
bool BtPeerCmdHandler::ensureAgent()
{
	if (m_deviceManager->isAgentRegistered())
		return true;

	return m_deviceManager->registerAgent(m_agentCapability,
	                                      std::bind(&BtPeerCmdHandler::onAgentRequest, this,
	                                                std::placeholders::_1,
	                                                std::placeholders::_2,
	                                                std::placeholders::_3));
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Looks up the helper process with the given \a name in the config and
	starts it with the \a placeholders expanded.  If \a process is \c nullptr
	then a temporary process is used and waited on until it exits.

 */
bool BtPeerCmdHandler::runHelper(const QString &name,
                                 const QMap<QString, QString> &placeholders,
                                 BtPeerProcess *process)
{
	const ConfigProcessSettings settings = m_config->processSettings(name);
	if (!settings.isValid()) {
		qWarning() << "no" << name << "helper process configured";
		return false;
	}

	if (process)
		return process->start(settings.program(),
		                      settings.expandedArguments(placeholders));

	BtPeerProcess oneShot(name);
	if (!oneShot.start(settings.program(), settings.expandedArguments(placeholders)))
		return false;

	QEventLoop loop;
	QObject::connect(&oneShot, &BtPeerProcess::finished, &loop, &QEventLoop::quit);
	QTimer::singleShot(m_config->busCallTimeout(), &loop, &QEventLoop::quit);
	if (oneShot.isRunning())
		loop.exec();

	if (oneShot.isRunning()) {
		qWarning() << name << "helper did not exit in time";
		oneShot.stop();
		return false;
	}

	return (oneShot.exitStatus() == QProcess::NormalExit) && (oneShot.exitCode() == 0);
}

// -----------------------------------------------------------------------------
/*!
	Lists all the devices bluez knows about on the adapter.

 */
void BtPeerCmdHandler::listDevices()
{
	const QList<BtPeerDeviceInfo> devices = m_deviceManager->listDiscovered();
	if (devices.isEmpty()) {
		qProdLog("No devices found");
		return;
	}

	for (const BtPeerDeviceInfo &device : devices)
		qProdLog().nospace() << "Device " << device.address << " " << device.alias;
}

void BtPeerCmdHandler::listPaired()
{
	const QMap<BtAddress, QString> paired = m_deviceManager->listPaired();
	if (paired.isEmpty()) {
		qProdLog("No paired devices");
		return;
	}

	QMap<BtAddress, QString>::const_iterator it = paired.begin();
	for (; it != paired.end(); ++it)
		qProdLog().nospace() << "Paired " << it.key() << " " << it.value();
}

void BtPeerCmdHandler::setScanning(bool on)
{
	const bool ok = on ? m_deviceManager->startDiscovery()
	                   : m_deviceManager->stopDiscovery();

	qProdLog("Discovery %s %s", on ? "start" : "stop", ok ? "succeeded" : "failed");
}

// -----------------------------------------------------------------------------
/*!
	Registers the pairing agent with the given IO \a capability, if an agent
	is already registered it is first unregistered.

 */
void BtPeerCmdHandler::registerAgent(const QString &capability)
{
	if (!BtPeerDeviceManager::isValidCapability(capability)) {
		qWarning("Invalid capability '%s', expected one of DisplayOnly, "
		         "DisplayYesNo, KeyboardOnly, NoInputNoOutput or KeyboardDisplay",
		         qPrintable(capability));
		return;
	}

	if (m_deviceManager->isAgentRegistered())
		m_deviceManager->unregisterAgent();

	m_agentCapability = capability;

	if (ensureAgent())
		qProdLog("Agent registered with capability %s", qPrintable(capability));
	else
		qProdLog("Failed to register agent with capability %s", qPrintable(capability));
}

void BtPeerCmdHandler::pairDevice(const BtAddress &device)
{
	if (!ensureAgent())
		qWarning("No agent registered, pairing may fail");

	qProdLog().nospace() << "Pairing with " << device << " ...";

	if (m_deviceManager->pair(device))
		qProdLog().nospace() << "Paired with " << device;
	else
		qProdLog().nospace() << "Failed to pair with " << device;
}

void BtPeerCmdHandler::connectDevice(const BtAddress &device)
{
	if (m_deviceManager->connectDevice(device))
		qProdLog().nospace() << "Connected to " << device;
	else
		qProdLog().nospace() << "Failed to connect to " << device;
}

void BtPeerCmdHandler::disconnectDevice(const BtAddress &device)
{
	if (m_deviceManager->disconnectDevice(device))
		qProdLog().nospace() << "Disconnected from " << device;
	else
		qProdLog().nospace() << "Failed to disconnect from " << device;
}

void BtPeerCmdHandler::unpairDevice(const BtAddress &device)
{
	if (m_deviceManager->unpair(device))
		qProdLog().nospace() << "Unpaired " << device;
	else
		qProdLog().nospace() << "Failed to unpair " << device;
}

// -----------------------------------------------------------------------------
/*!
	Prints the pairing and connection state of the \a device.

 */
void BtPeerCmdHandler::deviceStatus(const BtAddress &device)
{
	QString alias;
	bool known = false;

	const QList<BtPeerDeviceInfo> devices = m_deviceManager->listDiscovered();
	for (const BtPeerDeviceInfo &info : devices) {
		if (info.address == device) {
			alias = info.alias;
			known = true;
			break;
		}
	}

	if (!known) {
		qProdLog().nospace() << "Device " << device << " not found";
		return;
	}

	qProdLog().nospace() << "Device " << device << " " << alias;
	qProdLog("\tpaired    : %s", m_deviceManager->isPaired(device) ? "yes" : "no");
	qProdLog("\tconnected : %s", m_deviceManager->isConnected(device) ? "yes" : "no");
}

void BtPeerCmdHandler::mediaControl(const BtAddress &device, const QString &command)
{
	if (m_deviceManager->mediaCommand(command, device))
		qProdLog("Media command '%s' sent", qPrintable(command));
	else
		qProdLog("Media command '%s' failed", qPrintable(command));
}

// -----------------------------------------------------------------------------
/*!
	Sends the file at \a filePath to the \a device over OPP, this blocks the
	console until the transfer finishes.  The transfer can be cancelled with
	the 'cancel-send' command.

 */
void BtPeerCmdHandler::sendFile(const BtAddress &device, const QString &filePath)
{
	if (m_transfers->isSending()) {
		qWarning("A transfer is already in progress");
		return;
	}

	qProdLog().nospace() << "Sending " << filePath << " to " << device << " ...";

	const BtPeerTransferCoordinator::Status status =
		m_transfers->send(device, QFileInfo(filePath).absoluteFilePath());

	qProdLog("Transfer finished with status '%s'",
	         qPrintable(BtPeerTransferCoordinator::statusToString(status)));
}

void BtPeerCmdHandler::cancelSend()
{
	if (!m_transfers->isSending()) {
		qWarning("No transfer in progress");
		return;
	}

	m_transfers->cancel();
}

// -----------------------------------------------------------------------------
/*!
	Runs the OPP push server and waits for a single file to arrive in
	\a directory.  Once the file has arrived the operator is asked whether
	to keep it.

 */
void BtPeerCmdHandler::receiveFile(const QString &directory, int timeoutSecs)
{
	if (m_transfers->isReceiverRunning()) {
		qWarning("The receiver is already running");
		return;
	}

	const QString saveDir = QDir(directory).absolutePath();
	qProdLog("Waiting up to %d seconds for a file in '%s' ...",
	         timeoutSecs, qPrintable(saveDir));

	const QString filePath =
		m_transfers->receive(saveDir, timeoutSecs,
		                     [this](const QString &path) {
		                         return askYesNo(QStringLiteral("Keep received file '%1' (yes/no): ")
		                                             .arg(QFileInfo(path).fileName()));
		                     });

	if (filePath.isNull())
		qProdLog("No file received");
	else
		qProdLog("Received file '%s'", qPrintable(filePath));
}

void BtPeerCmdHandler::stopReceive()
{
	if (!m_transfers->isReceiverRunning()) {
		qWarning("The receiver is not running");
		return;
	}

	m_transfers->stopReceiver();
}

// -----------------------------------------------------------------------------
/*!
	Starts the configured audio player on \a filePath, any existing playback
	is stopped first.

 */
void BtPeerCmdHandler::playAudio(const QString &filePath)
{
	if (!QFileInfo(filePath).isFile()) {
		qWarning("Audio file '%s' doesn't exist", qPrintable(filePath));
		return;
	}

	m_audioPlayer->stop();

	const QMap<QString, QString> placeholders = {
		{ QStringLiteral("file"), QFileInfo(filePath).absoluteFilePath() }
	};

	if (runHelper(QStringLiteral("audioPlayer"), placeholders, m_audioPlayer))
		qProdLog("Playing '%s'", qPrintable(filePath));
	else
		qProdLog("Failed to start audio player");
}

void BtPeerCmdHandler::stopAudio()
{
	if (!m_audioPlayer->isRunning()) {
		qWarning("Audio player not running");
		return;
	}

	m_audioPlayer->stop();
}

void BtPeerCmdHandler::setDiscoverable(bool on)
{
	const QString helper = on ? QStringLiteral("discoverableOn")
	                          : QStringLiteral("discoverableOff");

	QMap<QString, QString> placeholders = {
		{ QStringLiteral("adapter"), m_deviceManager->adapterName() }
	};

	if (runHelper(helper, placeholders, nullptr))
		qProdLog("Discoverable %s", on ? "on" : "off");
	else
		qProdLog("Failed to set discoverable %s", on ? "on" : "off");
}

// -----------------------------------------------------------------------------
/*!
	Prints the log levels currently enabled.

 */
void BtPeerCmdHandler::getLogLevel() const
{
	qProdLog("Log levels enabled: %s", qPrintable(logLevelsToString(getLogLevels())));
}

// -----------------------------------------------------------------------------
/*!
	Sets the log level, a single level name enables that level and all the
	levels more severe than it.  A comma separated list enables just the
	listed levels.

 */
void BtPeerCmdHandler::setLogLevel(const QString &level)
{
	LoggingLevel threshold;
	if (logLevelFromString(level, &threshold)) {
		setLogLevels(logLevelsUpTo(threshold));
		return;
	}

	LoggingLevels levels;
	if (!logLevelsFromString(level, &levels)) {
		qWarning("unknown log level '%s'", qPrintable(level));
		return;
	}

	setLogLevels(levels);
}

// -----------------------------------------------------------------------------
/*!
	Stops everything that may be running in the background; the push
	server, the audio player and the pairing agent.  Safe to call more than
	once.

 */
void BtPeerCmdHandler::shutdown()
{
	if (m_shutdown)
		return;

	m_shutdown = true;

	if (m_abortAsk)
		m_abortAsk();

	if (m_transfers) {
		if (m_transfers->isSending())
			m_transfers->cancel();
		m_transfers->stopReceiver();
	}

	if (m_audioPlayer)
		m_audioPlayer->stop();

	if (m_deviceManager)
		m_deviceManager->unregisterAgent();

	qMilestone("console shut down");
}

void BtPeerCmdHandler::onDevicePairingChanged(const BtAddress &address, bool paired)
{
	qProdLog().nospace() << "Device " << address << (paired ? " paired" : " unpaired");
}

void BtPeerCmdHandler::onTransferProgress(qint64 transferred, qint64 size)
{
	if (size > 0)
		qProdLog("Transferred %lld of %lld bytes (%lld%%)", transferred, size,
		         (transferred * 100) / size);
	else
		qProdLog("Transferred %lld bytes", transferred);
}

void BtPeerCmdHandler::onTransferStatusChanged(BtPeerTransferCoordinator::Status status)
{
	qInfo() << "transfer status changed to" << BtPeerTransferCoordinator::statusToString(status);
}
