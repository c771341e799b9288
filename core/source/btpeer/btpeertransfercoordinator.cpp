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
//  btpeertransfercoordinator.cpp
//  BtPeer
//

#include "btpeertransfercoordinator.h"
#include "btpeerobjectpushservice.h"
#include "btpeersignalrouter.h"
#include "btpeerprocess.h"

#include "configsettings/configsettings.h"
#include "utils/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDateTime>
#include <QTimer>
#include <QEventLoop>

#include <exception>
#include <limits>
#include <mutex>


// -----------------------------------------------------------------------------
/*!
	\internal

	Runs \a call on the obex service and returns its result.  Anything thrown
	by the service is returned as a \l{BtPeerError::General} error so the
	caller always gets to close the session.

 */
template <typename Func>
static BtPeerError guardedCall(const char *operation, Func &&call)
{
	try {
		return call();
	} catch (const std::exception &e) {
		return BtPeerError(BtPeerError::General, "exception in %s: %s",
		                   operation, e.what());
	} catch (...) {
		return BtPeerError(BtPeerError::General, "unknown exception in %s",
		                   operation);
	}
}

// -----------------------------------------------------------------------------
/*!
	\class BtPeerTransferCoordinator
	\brief Sends and receives files using the object push profile.

	Outgoing transfers go through obexd; a session is created to the target
	device, the file is queued on it and then the coordinator waits, while
	processing events, for the transfer object's \c Status property to reach
	a terminal value.  The wait is bounded by the configured transfer timeout
	and may be aborted by calling cancel().

	Only one outgoing transfer may be in progress at a time, and the session
	created for it is always removed before send() returns.

	Incoming files are received by running an external push server (by
	default \c obexpushd) that writes into a directory, which is then polled
	for new files.
 */


static const QString kTransfer1Interface = QStringLiteral("org.bluez.obex.Transfer1");


BtPeerTransferCoordinator::BtPeerTransferCoordinator(const QSharedPointer<const ConfigSettings> &config,
                                                     const QSharedPointer<BtPeerObjectPushService> &service,
                                                     const QSharedPointer<BtPeerSignalRouter> &router,
                                                     QObject *parent)
	: QObject(parent)
	, m_config(config)
	, m_service(service)
	, m_router(router)
	, m_state(Idle)
	, m_waitLoop(nullptr)
	, m_cancelRequested(false)
	, m_receiver(new BtPeerProcess(QStringLiteral("pushServer"), this))
{
}

BtPeerTransferCoordinator::~BtPeerTransferCoordinator()
{
	stopReceiver();
}

// -----------------------------------------------------------------------------
/*!
	Returns the lower case string used for the given \a status, these match
	the values obexd uses for the \c Status property with the addition of
	\c "unknown" and \c "timed-out".

 */
QString BtPeerTransferCoordinator::statusToString(Status status)
{
	switch (status) {
		case Unknown:       return QStringLiteral("unknown");
		case Queued:        return QStringLiteral("queued");
		case Active:        return QStringLiteral("active");
		case Complete:      return QStringLiteral("complete");
		case Error:         return QStringLiteral("error");
		case Cancelled:     return QStringLiteral("cancelled");
		case TimedOut:      return QStringLiteral("timed-out");
		default:            return QStringLiteral("unknown");
	}
}

BtPeerTransferCoordinator::Status BtPeerTransferCoordinator::statusFromString(const QString &status)
{
	static const struct {
		const char *name;
		Status status;
	} names[] = {
		{ "queued",     Queued      },
		{ "active",     Active      },
		{ "suspended",  Active      },
		{ "complete",   Complete    },
		{ "error",      Error       },
		{ "cancelled",  Cancelled   },
		{ "timed-out",  TimedOut    },
	};

	for (unsigned i = 0; i < (sizeof(names) / sizeof(names[0])); i++) {
		if (status == QLatin1String(names[i].name))
			return names[i].status;
	}

	return Unknown;
}

bool BtPeerTransferCoordinator::isTerminal(Status status)
{
	return (status == Complete) || (status == Error) ||
	       (status == Cancelled) || (status == TimedOut);
}

BtPeerTransferCoordinator::State BtPeerTransferCoordinator::state() const
{
	return m_state;
}

bool BtPeerTransferCoordinator::isSending() const
{
	return !m_session.isNull();
}

// -----------------------------------------------------------------------------
/*!
	Sends the file at \a filePath to the device with the given \a address and
	blocks until the transfer finishes, processing events while it waits.
	Returns the terminal status of the transfer.

	If \a profile is empty the profile from the config is used (normally
	\c "opp").  If \a session is not empty it is used instead of creating a
	new session, in which case it is still removed once the transfer is done.

	\c Error is returned without doing anything if the file doesn't exist or
	another transfer is already in progress.
 */
BtPeerTransferCoordinator::Status BtPeerTransferCoordinator::send(const BtAddress &address,
                                                                   const QString &filePath,
                                                                   const QString &profile,
                                                                   const QDBusObjectPath &session)
{
	const QFileInfo fileInfo(filePath);
	if (!fileInfo.exists() || !fileInfo.isFile()) {
		qWarning() << "file" << filePath << "does not exist";
		return Error;
	}

	if (Q_UNLIKELY(address.isNull() && session.path().isEmpty())) {
		qWarning("invalid target address");
		return Error;
	}

	// only one transfer at a time, this also catches a send being started
	// from inside the wait loop of another
	std::unique_lock<QMutex> locker(m_sendLock, std::try_to_lock);
	if (!locker.owns_lock()) {
		qWarning("transfer already in progress");
		return Error;
	}

	return runTransfer(address, fileInfo.absoluteFilePath(), profile, session);
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Performs the steps of a send; create the session, start the transfer and
	then wait for it to finish.  The session is closed on every return path.

 */
BtPeerTransferCoordinator::Status BtPeerTransferCoordinator::runTransfer(const BtAddress &address,
                                                                          const QString &filePath,
                                                                          const QString &profile,
                                                                          const QDBusObjectPath &sessionPath)
{
	m_state = Idle;
	m_cancelRequested = false;

	QSharedPointer<Session> session = QSharedPointer<Session>::create();
	session->target = address;
	session->profile = profile.isEmpty() ? m_config->obexProfile() : profile;
	session->size = -1;
	session->status = Unknown;

	if (!sessionPath.path().isEmpty()) {
		session->path = sessionPath;

	} else {
		const BtPeerError error = guardedCall("CreateSession",
			[&]() { return m_service->createSession(address, session->profile,
			                                        &session->path); });
		if (error) {
			qError() << "failed to create" << session->profile << "session to"
			         << address << "due to" << error;
			m_state = Finished;
			updateStatus(Error);
			return Error;
		}
	}

	m_session = session;
	m_state = SessionCreated;

	qMilestone() << "created session" << session->path.path() << "to" << address;


	// queue the file on the session
	QVariantMap properties;
	BtPeerError error = guardedCall("SendFile",
		[&]() { return m_service->sendFile(session->path, filePath,
		                                   &session->transfer, &properties); });

	if (error) {
		qError() << "failed to send" << filePath << "due to" << error;
		closeSession();
		m_state = Finished;
		updateStatus(Error);
		return Error;
	}

	m_state = TransferStarted;
	session->size = properties.value(QStringLiteral("Size"), -1).toLongLong();

	qMilestone() << "transfer" << session->transfer.path() << "of" << filePath
	             << "started";


	// watch for changes to the transfer status
	const qint64 subscription =
		m_router->subscribePropertyChanges(kTransfer1Interface,
		                                   session->transfer.path(),
			[this](const QDBusObjectPath &path, const QVariantMap &changed)
			{
				Q_UNUSED(path);
				onTransferPropertiesChanged(changed);
			});

	// the status may have moved on before we subscribed, so get the initial
	// value from the reply and then read it once
	Status initial = statusFromString(properties.value(QStringLiteral("Status")).toString());

	QString currentStatus;
	error = guardedCall("transfer status",
		[&]() { return m_service->transferStatus(session->transfer, &currentStatus); });
	if (error)
		qDebug() << "failed to read initial transfer status due to" << error;
	else
		initial = statusFromString(currentStatus);

	if (initial != Unknown)
		updateStatus(initial);


	// block here until we get a terminal status, time out or are cancelled
	const Status status = waitForTransfer();

	if (subscription >= 0)
		m_router->unsubscribe(subscription);

	// try and stop obexd if we gave up on the transfer ourselves
	if ((status == TimedOut) || ((status == Cancelled) && m_cancelRequested)) {
		error = guardedCall("Cancel",
			[&]() { return m_service->cancelTransfer(session->transfer); });
		if (error)
			qWarning() << "failed to cancel transfer due to" << error;
	}

	closeSession();
	m_state = Finished;

	if (status == Complete)
		qMilestone() << "transfer of" << filePath << "complete";
	else
		qWarning() << "transfer of" << filePath << "finished with status"
		           << statusToString(status);

	return status;
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Runs a local event loop until the current session reaches a terminal
	status, the transfer timeout expires or cancel() is called.

 */
BtPeerTransferCoordinator::Status BtPeerTransferCoordinator::waitForTransfer()
{
	if (isTerminal(m_session->status))
		return m_session->status;

	QEventLoop loop;

	QTimer deadline;
	deadline.setSingleShot(true);
	QObject::connect(&deadline, &QTimer::timeout, &loop,
		[this, &loop]()
		{
			qWarning() << "transfer timed out after"
			           << m_config->transferTimeout() << "ms";
			updateStatus(TimedOut);
			loop.quit();
		});
	deadline.start(m_config->transferTimeout());

	m_waitLoop = &loop;
	loop.exec();
	m_waitLoop = nullptr;

	return m_session->status;
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Removes the current session from obexd, if there is one.  The session
	pointer is cleared so this is safe to call more than once.

 */
void BtPeerTransferCoordinator::closeSession()
{
	if (!m_session)
		return;

	const QSharedPointer<Session> session = m_session;
	m_session.reset();

	const BtPeerError error = guardedCall("RemoveSession",
		[&]() { return m_service->removeSession(session->path); });
	if (error)
		qWarning() << "failed to remove session" << session->path.path()
		           << "due to" << error;
	else
		qInfo() << "removed session" << session->path.path();
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Called by the router when one or more properties of the transfer object
	change.

 */
void BtPeerTransferCoordinator::onTransferPropertiesChanged(const QVariantMap &changed)
{
	if (!m_session)
		return;

	QVariantMap::const_iterator it = changed.find(QStringLiteral("Size"));
	if (it != changed.end())
		m_session->size = it.value().toLongLong();

	it = changed.find(QStringLiteral("Transferred"));
	if (it != changed.end())
		emit transferProgress(it.value().toLongLong(), m_session->size);

	it = changed.find(QStringLiteral("Status"));
	if (it != changed.end()) {

		const QString statusStr = it.value().toString();
		const Status status = statusFromString(statusStr);
		if (status == Unknown) {
			qWarning() << "unknown transfer status" << statusStr;
			return;
		}

		updateStatus(status);
	}
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Stores the new status of the current transfer, emits statusChanged() and
	if the status is terminal wakes the wait loop.  Once a terminal status is
	set it is not changed.

 */
void BtPeerTransferCoordinator::updateStatus(Status status)
{
	if (m_session) {

		if (isTerminal(m_session->status) || (m_session->status == status))
			return;

		qInfo() << "transfer status" << statusToString(m_session->status)
		        << "->" << statusToString(status);

		m_session->status = status;
	}

	emit statusChanged(status);

	if (isTerminal(status) && m_waitLoop)
		m_waitLoop->quit();
}

// -----------------------------------------------------------------------------
/*!
	Aborts the transfer currently in progress, send() will return
	\c Cancelled.  Does nothing if no transfer is in progress.

 */
void BtPeerTransferCoordinator::cancel()
{
	if (!m_session || !m_waitLoop) {
		qInfo("no transfer in progress to cancel");
		return;
	}

	qMilestone() << "cancelling transfer" << m_session->transfer.path();

	m_cancelRequested = true;
	updateStatus(Cancelled);
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Returns the path of the file in \a directory that is not in the
	\a existing set.  If more than one new file is present the one with the
	earliest modification time is returned, with the file name used to break
	ties.  Returns an empty string if there are no new files.

 */
QString BtPeerTransferCoordinator::findNewFile(const QString &directory,
                                               const QSet<QString> &existing) const
{
	const QDir dir(directory);
	const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::NoDotAndDotDot,
	                                                QDir::Name);

	QFileInfo chosen;
	QStringList others;

	for (const QFileInfo &entry : entries) {

		if (existing.contains(entry.fileName()))
			continue;

		if (!chosen.exists()) {
			chosen = entry;
			continue;
		}

		// the list is sorted by name, so only a strictly earlier time wins
		if (entry.lastModified() < chosen.lastModified()) {
			others.append(chosen.fileName());
			chosen = entry;
		} else {
			others.append(entry.fileName());
		}
	}

	if (!chosen.exists())
		return QString();

	if (!others.isEmpty())
		qWarning() << "more than one new file received, using" << chosen.fileName()
		           << "and leaving" << others;

	return chosen.absoluteFilePath();
}

// -----------------------------------------------------------------------------
/*!
	Converts the receive timeout \a timeoutSecs to the milliseconds interval
	of the deadline timer.  Negative values are treated as zero and values too
	large for a timer interval are clamped to the longest interval possible.

 */
int BtPeerTransferCoordinator::receiveTimeoutMSecs(int timeoutSecs)
{
	const qint64 msecs = qint64(qMax(0, timeoutSecs)) * 1000;
	return int(qMin<qint64>(msecs, std::numeric_limits<int>::max()));
}

// -----------------------------------------------------------------------------
/*!
	Starts the push server configured as the \c pushServer process, saving
	into \a saveDirectory, and waits up to \a timeoutSecs for a new file to
	appear there.

	When a file arrives the push server is stopped and \a confirm (if set) is
	called with the path of the file; if it returns \c false the file is
	deleted and a null string is returned, otherwise the path is returned.

	A null string is also returned if no file arrives in time, or if the push
	server exits before a file arrives.  The push server is always stopped
	before this function returns.
 */
QString BtPeerTransferCoordinator::receive(const QString &saveDirectory,
                                           int timeoutSecs,
                                           const ConfirmFunction &confirm)
{
	if (m_receiver->isRunning()) {
		qWarning("receiver already running");
		return QString();
	}

	QDir dir(saveDirectory);
	if (!dir.mkpath(QStringLiteral("."))) {
		qError() << "failed to create directory" << saveDirectory;
		return QString();
	}

	const ConfigProcessSettings pushServer = m_config->processSettings(QStringLiteral("pushServer"));
	if (!pushServer.isValid()) {
		qError("no push server command configured");
		return QString();
	}

	// snapshot the files already in the directory
	QSet<QString> existing;
	const QStringList entries = dir.entryList(QDir::Files | QDir::NoDotAndDotDot);
	for (const QString &entry : entries)
		existing.insert(entry);

	const QString directory = dir.absolutePath();

	QMap<QString, QString> placeholders;
	placeholders.insert(QStringLiteral("dir"), directory);

	if (!m_receiver->start(pushServer.program(),
	                       pushServer.expandedArguments(placeholders)))
		return QString();

	qMilestone() << "waiting up to" << timeoutSecs << "seconds for a file in"
	             << directory;


	// poll the directory until a file appears, we time out or the push
	// server exits
	QString received;

	QEventLoop loop;

	QTimer poll;
	QObject::connect(&poll, &QTimer::timeout, &loop,
		[&]()
		{
			received = findNewFile(directory, existing);
			if (!received.isEmpty())
				loop.quit();
		});
	poll.start(m_config->receivePollInterval());

	QTimer deadline;
	deadline.setSingleShot(true);
	QObject::connect(&deadline, &QTimer::timeout, &loop, &QEventLoop::quit);
	deadline.start(receiveTimeoutMSecs(timeoutSecs));

	const QMetaObject::Connection exitConn =
		QObject::connect(m_receiver, &BtPeerProcess::finished, &loop,
		[&loop](int exitCode, QProcess::ExitStatus exitStatus)
		{
			qWarning() << "push server exited early, code" << exitCode
			           << "status" << exitStatus;
			loop.quit();
		});

	loop.exec();

	poll.stop();
	deadline.stop();
	QObject::disconnect(exitConn);

	// the push server may have finished writing a file just as we stopped
	// waiting
	if (received.isEmpty())
		received = findNewFile(directory, existing);

	stopReceiver();

	if (received.isEmpty()) {
		qInfo() << "no file received within" << timeoutSecs << "seconds";
		return QString();
	}

	qMilestone() << "received file" << received;

	if (confirm) {

		bool accepted = false;
		try {
			accepted = confirm(received);
		} catch (const std::exception &e) {
			qError() << "confirm callback threw" << e.what();
			accepted = false;
		} catch (...) {
			qError("confirm callback threw an unknown exception");
			accepted = false;
		}

		if (!accepted) {
			qInfo() << "received file" << received << "rejected, deleting it";
			if (!QFile::remove(received))
				qWarning() << "failed to delete" << received;
			return QString();
		}
	}

	return received;
}

// -----------------------------------------------------------------------------
/*!
	Stops the push server if it is running, otherwise does nothing.

 */
void BtPeerTransferCoordinator::stopReceiver()
{
	if (!m_receiver->isRunning())
		return;

	m_receiver->stop();
}

bool BtPeerTransferCoordinator::isReceiverRunning() const
{
	return m_receiver->isRunning();
}
