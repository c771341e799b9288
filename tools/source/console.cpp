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
//  console.cpp
//  BtPeer
//

#include "console.h"

#include <QDebug>


// the default time to wait for an incoming file
static const int defaultReceiveTimeout = 60;


BtPeerConsole::BtPeerConsole(const QSharedPointer<BaseCmdHandler> &cmdHandler,
                             QObject *parent)
	: QObject(parent)
	, m_cmdHandler(cmdHandler)
{
	// initialise the inactive console
	initReadLine();

	// agent questions and receive confirmations are asked on the console
	m_cmdHandler->setAskUserFunctions(
		[this](const QString &question, int timeout) {
			return m_readLine.ask(question, timeout);
		},
		[this]() {
			m_readLine.abortAsk();
		});
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Initialises the readline interface.


 */
void BtPeerConsole::initReadLine()
{
	m_readLine.setPrompt(m_cmdHandler->prompt());

	m_readLine.addCommand("devices", { }, "List devices known on the adapter",
	                      this, &BtPeerConsole::onListDevicesCommand);
	m_readLine.addCommand("paired", { }, "List paired devices",
	                      this, &BtPeerConsole::onListPairedCommand);

	m_readLine.addCommand("scan", { "<on/off>" }, "Start / stop device discovery",
	                      this, &BtPeerConsole::onScanCommand);

	m_readLine.addCommand("agent", { "<capability>" }, "(Re)register the pairing agent with the given IO capability",
	                      this, &BtPeerConsole::onAgentCommand);

	m_readLine.addCommand("pair", { "<dev>" }, "Pair with a device",
	                      this, &BtPeerConsole::onPairCommand);
	m_readLine.addCommand("connect", { "<dev>" }, "Connect to a device",
	                      this, &BtPeerConsole::onConnectCommand);
	m_readLine.addCommand("disconnect", { "<dev>" }, "Disconnect from a device",
	                      this, &BtPeerConsole::onDisconnectCommand);
	m_readLine.addCommand("unpair", { "<dev>" }, "Remove the pairing with a device",
	                      this, &BtPeerConsole::onUnpairCommand);
	m_readLine.addCommand("status", { "<dev>" }, "Show the pairing / connection state of a device",
	                      this, &BtPeerConsole::onStatusCommand);

	m_readLine.addCommand("media", { "<dev>", "<play/pause/next/previous/rewind>" }, "Sends a media control command to a device",
	                      this, &BtPeerConsole::onMediaCommand);

	m_readLine.addCommand("send", { "<dev>", "<filepath>" }, "Sends a file to a device",
	                      this, &BtPeerConsole::onSendCommand);
	m_readLine.addCommand("cancel-send", { }, "Cancels the file transfer in progress",
	                      this, &BtPeerConsole::onCancelSendCommand);
	m_readLine.addCommand("receive", { "<directory>", "[timeout secs]" }, "Waits for a file pushed by a device",
	                      this, &BtPeerConsole::onReceiveCommand);
	m_readLine.addCommand("stop-receive", { }, "Stops waiting for a pushed file",
	                      this, &BtPeerConsole::onStopReceiveCommand);

	m_readLine.addCommand("play", { "<filepath>" }, "Plays an audio file",
	                      this, &BtPeerConsole::onPlayCommand);
	m_readLine.addCommand("stop-play", { }, "Stops audio playback",
	                      this, &BtPeerConsole::onStopPlayCommand);

	m_readLine.addCommand("discoverable", { "<on/off>" }, "Makes the adapter discoverable or not",
	                      this, &BtPeerConsole::onDiscoverableCommand);

	m_readLine.addCommand("log-level", { "[fatal/error/warning/milestone/info/debug]" }, "Gets / sets the log level",
	                      this, &BtPeerConsole::onLogLevelCommand);
}

// -----------------------------------------------------------------------------
/*!
	Starts the readline interactive console.

 */
void BtPeerConsole::start()
{
	m_readLine.start();
}

void BtPeerConsole::stop()
{
	m_readLine.stop();
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Parses the supplied \a str to determine if it is an 'on' or 'off' string.
	If the supplied string is neither \c false is returned.
 */
bool BtPeerConsole::parseOnOffString(const QString &str, bool *on) const
{
	if (str.compare("on", Qt::CaseInsensitive) == 0) {
		*on = true;
		return true;
	}

	if (str.compare("off", Qt::CaseInsensitive) == 0) {
		*on = false;
		return true;
	}

	return false;
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Parses the first argument as a device address, printing a warning and
	returning \c false if missing or invalid.
 */
bool BtPeerConsole::parseAddress(const QStringList &args, BtAddress *address) const
{
	if (args.length() < 1) {
		qWarning("Missing device address argument");
		return false;
	}

	*address = BtAddress(args.first());
	if (address->isNull()) {
		qWarning("Device address string is not a valid BDADDR");
		return false;
	}

	return true;
}

void BtPeerConsole::onListDevicesCommand(const QStringList &args)
{
	Q_UNUSED(args);
	m_cmdHandler->listDevices();
}

void BtPeerConsole::onListPairedCommand(const QStringList &args)
{
	Q_UNUSED(args);
	m_cmdHandler->listPaired();
}

// -----------------------------------------------------------------------------
/*!
	Slot called when the user types 'scan <on/off>'.

 */
void BtPeerConsole::onScanCommand(const QStringList &args)
{
	if (args.length() < 1) {
		qWarning("Missing <on/off> argument");
		return;
	}

	bool on;
	if (!parseOnOffString(args[0], &on)) {
		qWarning("Argument must either be 'on' or 'off'");
		return;
	}

	m_cmdHandler->setScanning(on);
}

void BtPeerConsole::onAgentCommand(const QStringList &args)
{
	if (args.length() < 1) {
		qWarning("Missing <capability> argument");
		return;
	}

	m_cmdHandler->registerAgent(args[0]);
}

// -----------------------------------------------------------------------------
/*!
	Slot called when the user types 'pair <dev>'.

	This blocks until pairing completes, any agent questions are asked on the
	console while waiting.

 */
void BtPeerConsole::onPairCommand(const QStringList &args)
{
	BtAddress address;
	if (parseAddress(args, &address))
		m_cmdHandler->pairDevice(address);
}

void BtPeerConsole::onConnectCommand(const QStringList &args)
{
	BtAddress address;
	if (parseAddress(args, &address))
		m_cmdHandler->connectDevice(address);
}

void BtPeerConsole::onDisconnectCommand(const QStringList &args)
{
	BtAddress address;
	if (parseAddress(args, &address))
		m_cmdHandler->disconnectDevice(address);
}

void BtPeerConsole::onUnpairCommand(const QStringList &args)
{
	BtAddress address;
	if (parseAddress(args, &address))
		m_cmdHandler->unpairDevice(address);
}

void BtPeerConsole::onStatusCommand(const QStringList &args)
{
	BtAddress address;
	if (parseAddress(args, &address))
		m_cmdHandler->deviceStatus(address);
}

// -----------------------------------------------------------------------------
/*!
	Slot called when the user types 'media <dev> <command>'.

 */
void BtPeerConsole::onMediaCommand(const QStringList &args)
{
	if (args.length() < 2) {
		qWarning("Requires two arguments; <dev> <play/pause/next/previous/rewind>");
		return;
	}

	BtAddress address;
	if (!parseAddress(args, &address))
		return;

	m_cmdHandler->mediaControl(address, args[1].toLower());
}

// -----------------------------------------------------------------------------
/*!
	Slot called when the user types 'send <dev> <filepath>'.

 */
void BtPeerConsole::onSendCommand(const QStringList &args)
{
	if (args.length() < 2) {
		qWarning("Requires two arguments; <dev> <filepath>");
		return;
	}

	BtAddress address;
	if (!parseAddress(args, &address))
		return;

	m_cmdHandler->sendFile(address, args[1]);
}

void BtPeerConsole::onCancelSendCommand(const QStringList &args)
{
	Q_UNUSED(args);
	m_cmdHandler->cancelSend();
}

// -----------------------------------------------------------------------------
/*!
	Slot called when the user types 'receive <directory> [timeout]'.

 */
void BtPeerConsole::onReceiveCommand(const QStringList &args)
{
	if (args.length() < 1) {
		qWarning("Missing <directory> argument");
		return;
	}

	int timeout = defaultReceiveTimeout;
	if (args.length() > 1) {
		bool parsedOk = false;
		timeout = args[1].toInt(&parsedOk);
		if (!parsedOk || (timeout <= 0)) {
			qWarning("Invalid timeout argument");
			return;
		}
	}

	m_cmdHandler->receiveFile(args[0], timeout);
}

void BtPeerConsole::onStopReceiveCommand(const QStringList &args)
{
	Q_UNUSED(args);
	m_cmdHandler->stopReceive();
}

void BtPeerConsole::onPlayCommand(const QStringList &args)
{
	if (args.length() < 1) {
		qWarning("Missing <filepath> argument");
		return;
	}

	m_cmdHandler->playAudio(args[0]);
}

void BtPeerConsole::onStopPlayCommand(const QStringList &args)
{
	Q_UNUSED(args);
	m_cmdHandler->stopAudio();
}

void BtPeerConsole::onDiscoverableCommand(const QStringList &args)
{
	if (args.length() < 1) {
		qWarning("Missing <on/off> argument");
		return;
	}

	bool on;
	if (!parseOnOffString(args[0], &on)) {
		qWarning("Argument must either be 'on' or 'off'");
		return;
	}

	m_cmdHandler->setDiscoverable(on);
}

// -----------------------------------------------------------------------------
/*!
	Slot called when the user types 'log-level [level]', with no argument the
	current levels are printed.

 */
void BtPeerConsole::onLogLevelCommand(const QStringList &args)
{
	if (args.isEmpty())
		m_cmdHandler->getLogLevel();
	else
		m_cmdHandler->setLogLevel(args[0]);
}
