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
//  btpeertransfercoordinator.h
//  BtPeer
//

#ifndef BTPEERTRANSFERCOORDINATOR_H
#define BTPEERTRANSFERCOORDINATOR_H

#include "utils/btaddress.h"

#include <QObject>
#include <QSet>
#include <QMutex>
#include <QString>
#include <QVariantMap>
#include <QSharedPointer>
#include <QDBusObjectPath>

#include <functional>


class QEventLoop;

class ConfigSettings;
class BtPeerProcess;
class BtPeerSignalRouter;
class BtPeerObjectPushService;


class BtPeerTransferCoordinator : public QObject
{
	Q_OBJECT

public:
	enum Status {
		Unknown,
		Queued,
		Active,
		Complete,
		Error,
		Cancelled,
		TimedOut,
	};
	Q_ENUM(Status)

	enum State {
		Idle,
		SessionCreated,
		TransferStarted,
		Finished,
	};
	Q_ENUM(State)

	typedef std::function<bool(const QString &filePath)> ConfirmFunction;

public:
	BtPeerTransferCoordinator(const QSharedPointer<const ConfigSettings> &config,
	                          const QSharedPointer<BtPeerObjectPushService> &service,
	                          const QSharedPointer<BtPeerSignalRouter> &router,
	                          QObject *parent = nullptr);
	~BtPeerTransferCoordinator() final;

public:
	static QString statusToString(Status status);
	static Status statusFromString(const QString &status);
	static bool isTerminal(Status status);
	static int receiveTimeoutMSecs(int timeoutSecs);

	Status send(const BtAddress &address, const QString &filePath,
	            const QString &profile = QString(),
	            const QDBusObjectPath &session = QDBusObjectPath());

	QString receive(const QString &saveDirectory, int timeoutSecs,
	                const ConfirmFunction &confirm = ConfirmFunction());
	void stopReceiver();

	State state() const;
	bool isSending() const;
	bool isReceiverRunning() const;

public slots:
	void cancel();

signals:
	void statusChanged(BtPeerTransferCoordinator::Status status);
	void transferProgress(qint64 transferred, qint64 size);

private:
	struct Session {
		QDBusObjectPath path;
		QDBusObjectPath transfer;
		BtAddress target;
		QString profile;
		qint64 size;
		Status status;
	};

	Status runTransfer(const BtAddress &address, const QString &filePath,
	                   const QString &profile, const QDBusObjectPath &session);
	Status waitForTransfer();
	void closeSession();

	void onTransferPropertiesChanged(const QVariantMap &changed);
	void updateStatus(Status status);

	QString findNewFile(const QString &directory,
	                    const QSet<QString> &existing) const;

private:
	const QSharedPointer<const ConfigSettings> m_config;
	const QSharedPointer<BtPeerObjectPushService> m_service;
	const QSharedPointer<BtPeerSignalRouter> m_router;

	QMutex m_sendLock;
	State m_state;
	QSharedPointer<Session> m_session;

	QEventLoop *m_waitLoop;
	bool m_cancelRequested;

	BtPeerProcess *m_receiver;
};


#endif // !defined(BTPEERTRANSFERCOORDINATOR_H)
