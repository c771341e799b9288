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
//  unixsignalnotifier.cpp
//  BtPeer
//

#include "unixsignalnotifier.h"

#include <QDebug>
#include <QSocketNotifier>

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <string.h>


// -----------------------------------------------------------------------------
/*!
	\class UnixSignalNotifier
	\brief Turns unix signals into a Qt signal.

	On construction a handler is installed for each of the given unix
	signals.  The handler writes the signal number into a pipe, the read end
	of which is watched by a QSocketNotifier, so the activated() signal is
	emitted from the event loop rather than from the signal handler.

	Only one notifier can exist at a time.  The handlers that were in place
	before construction are put back when it is destroyed.
 */


static int g_signalPipeWriteFd = -1;


void UnixSignalNotifier::signalHandler(int unixSignal)
{
	const int savedErrno = errno;

	if (g_signalPipeWriteFd >= 0) {
		if (::write(g_signalPipeWriteFd, &unixSignal, sizeof(int)) != sizeof(int)) {
			// nothing safe to do from inside a signal handler
		}
	}

	errno = savedErrno;
}

UnixSignalNotifier::UnixSignalNotifier(const QList<int> &unixSignals,
                                       QObject *parent)
	: QObject(parent)
	, m_unixSignals(unixSignals)
	, m_pipeReadFd(-1)
	, m_pipeNotifier(nullptr)
{
	if (Q_UNLIKELY(g_signalPipeWriteFd >= 0)) {
		qWarning("unix signal notifier already exists");
		return;
	}

	int fds[2] = { -1, -1 };
	if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0) {
		qErrnoWarning(errno, "failed to create signal pipe");
		return;
	}

	m_pipeReadFd = fds[0];
	g_signalPipeWriteFd = fds[1];

	m_pipeNotifier = new QSocketNotifier(m_pipeReadFd, QSocketNotifier::Read, this);
	QObject::connect(m_pipeNotifier, &QSocketNotifier::activated,
	                 this, &UnixSignalNotifier::onPipeActivated);

	installHandlers();
}

UnixSignalNotifier::~UnixSignalNotifier()
{
	if (m_pipeReadFd < 0)
		return;

	restoreHandlers();

	delete m_pipeNotifier;
	m_pipeNotifier = nullptr;

	if (::close(m_pipeReadFd) != 0)
		qErrnoWarning(errno, "failed to close signal pipe");

	const int pipeWriteFd = g_signalPipeWriteFd;
	g_signalPipeWriteFd = -1;

	if ((pipeWriteFd >= 0) && (::close(pipeWriteFd) != 0))
		qErrnoWarning(errno, "failed to close signal pipe");
}

void UnixSignalNotifier::installHandlers()
{
	struct sigaction action;
	memset(&action, 0, sizeof(action));
	action.sa_handler = &UnixSignalNotifier::signalHandler;
	action.sa_flags = SA_RESTART;
	sigemptyset(&action.sa_mask);

	m_previousActions.resize(m_unixSignals.size());

	for (int i = 0; i < m_unixSignals.size(); i++) {
		struct sigaction &previous = m_previousActions[i];
		memset(&previous, 0, sizeof(previous));
		previous.sa_handler = SIG_DFL;

		if (sigaction(m_unixSignals[i], &action, &previous) != 0)
			qErrnoWarning(errno, "failed to install handler for signal %d",
			              m_unixSignals[i]);
	}
}

void UnixSignalNotifier::restoreHandlers()
{
	for (int i = 0; i < m_previousActions.size(); i++) {
		if (sigaction(m_unixSignals[i], &m_previousActions[i], nullptr) != 0)
			qErrnoWarning(errno, "failed to restore handler for signal %d",
			              m_unixSignals[i]);
	}

	m_previousActions.clear();
}

bool UnixSignalNotifier::isValid() const
{
	return (m_pipeNotifier != nullptr);
}

QList<int> UnixSignalNotifier::unixSignals() const
{
	return m_unixSignals;
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Reads the signal numbers out of the pipe and emits activated() for each.

 */
void UnixSignalNotifier::onPipeActivated(int fd)
{
	int unixSignal = 0;

	ssize_t rd;
	while ((rd = TEMP_FAILURE_RETRY(::read(fd, &unixSignal, sizeof(int)))) == sizeof(int)) {
		qDebug("received signal %d", unixSignal);
		emit activated(unixSignal);
	}

	if ((rd < 0) && (errno != EAGAIN))
		qErrnoWarning(errno, "failed to read signal number from pipe");
}
