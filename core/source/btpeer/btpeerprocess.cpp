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
//  btpeerprocess.cpp
//  BtPeer
//

#include "btpeerprocess.h"
#include "utils/logging.h"


// -----------------------------------------------------------------------------
/*!
	\class BtPeerProcess
	\brief Starts and stops one of the external helper commands.

	Used for the object-push server, the audio player and the discoverable
	toggle.  The object owns at most one child process at a time; calling
	start() while a process is still running fails.

	stop() is safe to call at any time, if no process is running it does
	nothing.
 */

// the time to wait for the process to exit after sending SIGTERM
#define STOP_GRACE_MSECS   2000


BtPeerProcess::BtPeerProcess(const QString &name, QObject *parent)
	: QObject(parent)
	, m_name(name)
	, m_process(nullptr)
	, m_exitCode(-1)
	, m_exitStatus(QProcess::NormalExit)
{
}

BtPeerProcess::~BtPeerProcess()
{
	stop();
}

QString BtPeerProcess::name() const
{
	return m_name;
}

// -----------------------------------------------------------------------------
/*!
	Starts the \a program with the given \a arguments and waits for it to be
	running.  Returns \c false if a process is already running or if the
	program could not be launched.

 */
bool BtPeerProcess::start(const QString &program, const QStringList &arguments)
{
	if (Q_UNLIKELY(isRunning())) {
		qWarning() << m_name << "process already running";
		return false;
	}

	if (m_process) {
		m_process->deleteLater();
		m_process = nullptr;
	}

	m_exitCode = -1;
	m_exitStatus = QProcess::NormalExit;

	m_process = new QProcess(this);
	m_process->setProcessChannelMode(QProcess::ForwardedErrorChannel);
	m_process->setStandardOutputFile(QProcess::nullDevice());

	QObject::connect(m_process,
	                 static_cast<void (QProcess::*)(int, QProcess::ExitStatus)>(&QProcess::finished),
	                 this, &BtPeerProcess::onProcessFinished);
	QObject::connect(m_process, &QProcess::errorOccurred,
	                 this, &BtPeerProcess::onProcessError);

	m_process->start(program, arguments, QIODevice::ReadOnly);
	if (!m_process->waitForStarted()) {
		qError() << "failed to start" << m_name << "process" << program
		         << "due to" << m_process->errorString();

		m_process->deleteLater();
		m_process = nullptr;
		return false;
	}

	qInfo() << "started" << m_name << "process" << program << arguments
	        << "with pid" << m_process->processId();
	return true;
}

// -----------------------------------------------------------------------------
/*!
	Terminates the running process, first with SIGTERM and then, if it hasn't
	exited within a couple of seconds, with SIGKILL.  Does nothing if no
	process is running.

 */
void BtPeerProcess::stop()
{
	if (!m_process)
		return;

	if (m_process->state() != QProcess::NotRunning) {

		qInfo() << "stopping" << m_name << "process";

		m_process->terminate();
		if (!m_process->waitForFinished(STOP_GRACE_MSECS)) {
			qWarning() << m_name << "process didn't exit on SIGTERM, killing it";
			m_process->kill();
			if (!m_process->waitForFinished(STOP_GRACE_MSECS))
				qError() << "failed to kill" << m_name << "process";
		}
	}

	m_process->disconnect(this);
	m_process->deleteLater();
	m_process = nullptr;
}

bool BtPeerProcess::isRunning() const
{
	return m_process && (m_process->state() != QProcess::NotRunning);
}

int BtPeerProcess::exitCode() const
{
	return m_exitCode;
}

QProcess::ExitStatus BtPeerProcess::exitStatus() const
{
	return m_exitStatus;
}

void BtPeerProcess::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
	m_exitCode = exitCode;
	m_exitStatus = exitStatus;

	if (exitStatus == QProcess::CrashExit)
		qWarning() << m_name << "process crashed";
	else
		qInfo() << m_name << "process exited with code" << exitCode;

	emit finished(exitCode, exitStatus);
}

void BtPeerProcess::onProcessError(QProcess::ProcessError error)
{
	if (error == QProcess::FailedToStart)
		return;

	qWarning() << m_name << "process error" << error;
}
