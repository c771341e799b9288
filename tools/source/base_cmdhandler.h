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
//  base_cmdhandler.h
//  BtPeer
//

#ifndef BASE_CMDHANDLER_H
#define BASE_CMDHANDLER_H

#include "utils/btaddress.h"

#include <QObject>
#include <QString>

#include <functional>


class BaseCmdHandler : public QObject
{
	Q_OBJECT

public:
	explicit BaseCmdHandler(QObject *parent = nullptr)
		: QObject(parent)
	{ }
	~BaseCmdHandler() override = default;

public:
	typedef std::function<QString(const QString &question, int timeoutMSecs)> AskUserFunction;
	typedef std::function<void()> AbortAskFunction;

	void setAskUserFunctions(const AskUserFunction &ask, const AbortAskFunction &abort)
	{
		m_askUser = ask;
		m_abortAsk = abort;
	}

public:
	virtual bool isValid() = 0;

	virtual QString prompt() = 0;

public slots:
	virtual void listDevices() = 0;
	virtual void listPaired() = 0;

	virtual void setScanning(bool on) = 0;

	virtual void registerAgent(const QString &capability) = 0;

	virtual void pairDevice(const BtAddress &device) = 0;
	virtual void connectDevice(const BtAddress &device) = 0;
	virtual void disconnectDevice(const BtAddress &device) = 0;
	virtual void unpairDevice(const BtAddress &device) = 0;

	virtual void deviceStatus(const BtAddress &device) = 0;
	virtual void mediaControl(const BtAddress &device, const QString &command) = 0;

	virtual void sendFile(const BtAddress &device, const QString &filePath) = 0;
	virtual void cancelSend() = 0;
	virtual void receiveFile(const QString &directory, int timeoutSecs) = 0;
	virtual void stopReceive() = 0;

	virtual void playAudio(const QString &filePath) = 0;
	virtual void stopAudio() = 0;

	virtual void setDiscoverable(bool on) = 0;

	virtual void getLogLevel() const = 0;
	virtual void setLogLevel(const QString &level) = 0;

	virtual void shutdown() = 0;

protected:
	AskUserFunction m_askUser;
	AbortAskFunction m_abortAsk;
};

#endif // !defined(BASE_CMDHANDLER_H)
