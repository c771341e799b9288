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
//  main.cpp
//  BtPeer
//

#include "console.h"
#include "cmdlineoptions.h"
#include "btpeer_cmdhandler.h"
#include "utils/unixsignalnotifier.h"

#include "configsettings/configsettings.h"
#include "utils/btaddress.h"
#include "utils/logging.h"

#include <QCoreApplication>
#include <QDebug>
#include <QSharedPointer>
#include <QDBusConnection>
#include <QDBusError>

#include <signal.h>
#include <unistd.h>



// -----------------------------------------------------------------------------
/*!
	\internal

	Attempts to connect to the dbus with the given params.

 */
static QSharedPointer<QDBusConnection> setupDBus(CmdLineOptions::DBusType dbusType,
                                                 const QString &dbusAddress)
{
	QSharedPointer<QDBusConnection> dbusConn;

	if (dbusType == CmdLineOptions::SystemBus)
		dbusConn = QSharedPointer<QDBusConnection>::create(QDBusConnection::systemBus());
	else if (dbusType == CmdLineOptions::SessionBus)
		dbusConn = QSharedPointer<QDBusConnection>::create(QDBusConnection::sessionBus());
	else if (dbusType == CmdLineOptions::CustomBus)
		dbusConn = QSharedPointer<QDBusConnection>::create(
			QDBusConnection::connectToBus(dbusAddress,
			                              QStringLiteral("btpeerctl.pid%1").arg(getpid())));
	else
		return QSharedPointer<QDBusConnection>();

	// check we managed to connect
	if (!dbusConn->isConnected()) {
		qError() << "failed to connect to dbus due to" << dbusConn->lastError();
		return QSharedPointer<QDBusConnection>();
	}

	return dbusConn;
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Loads the config from the file given on the command line, or the built in
	defaults if no file was given.

 */
static QSharedPointer<const ConfigSettings> setupConfig(const QString &configFile)
{
	if (configFile.isEmpty())
		return ConfigSettings::defaults();

	QSharedPointer<const ConfigSettings> config = ConfigSettings::fromJsonFile(configFile);
	if (!config)
		qError("failed to parse config file '%s'", qPrintable(configFile));

	return config;
}

int main(int argc, char *argv[])
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName("btpeerctl");
	QCoreApplication::setApplicationVersion(BTPEER_VERSION);

	// disable SIGPIPE early
	signal(SIGPIPE, SIG_IGN);


	// install the log handler with the build defaults before parsing so
	// that parse errors are reported the usual way
	setupLogging(LoggingTarget::Default, getLogLevels());

	QSharedPointer<CmdLineOptions> options = QSharedPointer<CmdLineOptions>::create();
	options->process(app);

	setLogLevels(options->logLevels(getLogLevels()));
	setLogTargets(options->logTargets(getLogTargets()));


	// load the config
	QSharedPointer<const ConfigSettings> config = setupConfig(options->configFile());
	if (!config)
		return EXIT_FAILURE;

	BtAddress::registerType();


	// bluez may be on any bus, obexd is always on the session bus
	QSharedPointer<QDBusConnection> bluezBus = setupDBus(options->dbusType(),
	                                                     options->dbusAddress());
	if (!bluezBus)
		return EXIT_FAILURE;

	QSharedPointer<QDBusConnection> obexBus = setupDBus(CmdLineOptions::SessionBus,
	                                                    QString());
	if (!obexBus) {
		qWarning("no session bus, file transfers will not be available");
		obexBus = QSharedPointer<QDBusConnection>::create(QStringLiteral("btpeerctl.noobex"));
	}


	// create the command handler, this talks to bluez and obexd
	QSharedPointer<BtPeerCmdHandler> cmdHandler =
		QSharedPointer<BtPeerCmdHandler>::create(config, *bluezBus, *obexBus,
		                                         options->adapterName(),
		                                         options->agentCapability());
	if (!cmdHandler->isValid())
		qWarning() << "bluez service" << config->bluezService() << "not found on the bus";


	// create the console
	BtPeerConsole *console = new BtPeerConsole(cmdHandler, &app);


	// create a unix signal handler to capture ctrl-c and SIGTERM and do an
	// ordered clean up (needed for readline / console tidy up)
	UnixSignalNotifier unixSignalNotifier({ SIGINT, SIGTERM }, &app);
	QObject::connect(&unixSignalNotifier, &UnixSignalNotifier::activated,
	                 [&](int unixSignal) {
	                     qMilestone("signal %d received, shutting down", unixSignal);
	                     cmdHandler->shutdown();
	                     console->stop();
	                     QCoreApplication::quit();
	                 });


	// start the console and run the event loop
	console->start();

	const int result = app.exec();

	cmdHandler->shutdown();

	return result;
}
