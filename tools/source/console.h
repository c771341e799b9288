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
//  console.h
//  BtPeer
//

#ifndef CONSOLE_H
#define CONSOLE_H

#include "readline/readline.h"
#include "base_cmdhandler.h"

#include <QObject>
#include <QString>
#include <QStringList>
#include <QSharedPointer>


class BtPeerConsole : public QObject
{
	Q_OBJECT

public:
	explicit BtPeerConsole(const QSharedPointer<BaseCmdHandler> &cmdHandler,
	                       QObject *parent = nullptr);
	~BtPeerConsole() final = default;

public:
	void start();
	void stop();

private:
	void initReadLine();

	bool parseOnOffString(const QString &str, bool *on) const;
	bool parseAddress(const QStringList &args, BtAddress *address) const;

private slots:
	void onListDevicesCommand(const QStringList &args);
	void onListPairedCommand(const QStringList &args);
	void onScanCommand(const QStringList &args);
	void onAgentCommand(const QStringList &args);
	void onPairCommand(const QStringList &args);
	void onConnectCommand(const QStringList &args);
	void onDisconnectCommand(const QStringList &args);
	void onUnpairCommand(const QStringList &args);
	void onStatusCommand(const QStringList &args);
	void onMediaCommand(const QStringList &args);

	void onSendCommand(const QStringList &args);
	void onCancelSendCommand(const QStringList &args);
	void onReceiveCommand(const QStringList &args);
	void onStopReceiveCommand(const QStringList &args);

	void onPlayCommand(const QStringList &args);
	void onStopPlayCommand(const QStringList &args);

	void onDiscoverableCommand(const QStringList &args);

	void onLogLevelCommand(const QStringList &args);

private:
	const QSharedPointer<BaseCmdHandler> m_cmdHandler;

private:
	ReadLine m_readLine;
};

#endif // !defined(CONSOLE_H)
