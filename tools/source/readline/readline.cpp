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
//  readline.cpp
//  BtPeer
//

#include "readline.h"

#include <QCoreApplication>
#include <QEventLoop>
#include <QTimer>
#include <QDebug>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>


// readline's callback interface has no user data pointer, so only one
// console can be reading stdin at a time
ReadLine *ReadLine::s_running = nullptr;
QtMessageHandler ReadLine::s_previousHandler = nullptr;


// -----------------------------------------------------------------------------
/*!
	\class ReadLine
	\brief Interactive command prompt on stdin.

	Characters arriving on stdin are fed to libreadline from the Qt event
	loop, completed lines are split into words and the first word is looked
	up in the command table.  The \c help, \c quit and \c exit commands are
	always available.

	While the prompt is running all Qt log output goes through our message
	handler so the prompt can be redrawn below each log line.

 */
ReadLine::ReadLine(QObject *parent)
	: QObject(parent)
	, m_stdinNotifier(STDIN_FILENO, QSocketNotifier::Read)
	, m_prompt(QStringLiteral("> "))
	, m_askLoop(nullptr)
{
	m_stdinNotifier.setEnabled(false);
	QObject::connect(&m_stdinNotifier, &QSocketNotifier::activated,
	                 this, &ReadLine::onStdinActivated);

	addCommand(QStringLiteral("quit"), { }, QStringLiteral("Quit program"),
	           this, &ReadLine::onQuitCommand);
	addCommand(QStringLiteral("exit"), { }, QStringLiteral("Quit program (same as quit)"),
	           this, &ReadLine::onQuitCommand);
	addCommand(QStringLiteral("help"), { }, QStringLiteral("Display this text"),
	           this, &ReadLine::onHelpCommand);
}

ReadLine::~ReadLine()
{
	stop();
}

bool ReadLine::isValid() const
{
	return m_library.isLoaded();
}

void ReadLine::setPrompt(const QString &prompt)
{
	m_prompt = prompt;
}

QString ReadLine::prompt() const
{
	return m_prompt;
}

// -----------------------------------------------------------------------------
/*!
	Starts reading commands from stdin.  Fails with a warning if libreadline
	couldn't be loaded or another console is already running.

 */
void ReadLine::start()
{
	if (!m_library.isLoaded()) {
		qWarning("libreadline not available, can't start console");
		return;
	}

	if (s_running) {
		if (s_running != this)
			qWarning("another console is already running");
		return;
	}

	s_running = this;

	m_library.setCompletionCallback(&ReadLine::completionCallback);
	m_library.installHandler(m_prompt, &ReadLine::lineCallback);

	s_previousHandler = qInstallMessageHandler(&ReadLine::messageHandler);

	m_stdinNotifier.setEnabled(true);
}

void ReadLine::stop()
{
	if (s_running != this)
		return;

	abortAsk();

	m_stdinNotifier.setEnabled(false);

	qInstallMessageHandler(s_previousHandler);
	s_previousHandler = nullptr;

	m_library.removeHandler();
	m_library.setCompletionCallback(nullptr);

	s_running = nullptr;
}

// -----------------------------------------------------------------------------
/*!
	Replaces the prompt with \a question and blocks (running a local event
	loop) until the user enters a line, which is returned.  Commands are not
	run whilst a question is outstanding.

	A null string is returned if nothing is entered within \a timeoutMSecs,
	if abortAsk() is called or if the console isn't running.  Only one
	question can be asked at a time.

 */
QString ReadLine::ask(const QString &question, int timeoutMSecs)
{
	if (s_running != this) {
		qWarning("console not running, can't ask '%s'", qPrintable(question));
		return QString();
	}

	if (m_askLoop) {
		qWarning("already waiting on an answer");
		return QString();
	}

	m_askAnswer.clear();

	m_library.removeHandler();
	m_library.installHandler(question, &ReadLine::lineCallback);

	QEventLoop loop;
	m_askLoop = &loop;

	QTimer timer;
	timer.setSingleShot(true);
	QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
	timer.start(timeoutMSecs);

	loop.exec();

	m_askLoop = nullptr;

	if (!timer.isActive() && m_askAnswer.isNull())
		qWarning("no answer given in time");

	if (s_running == this) {
		m_library.removeHandler();
		m_library.installHandler(m_prompt, &ReadLine::lineCallback);
	}

	return m_askAnswer;
}

bool ReadLine::isAsking() const
{
	return (m_askLoop != nullptr);
}

void ReadLine::abortAsk()
{
	if (!m_askLoop)
		return;

	m_askAnswer = QString();
	m_askLoop->quit();
}

// -----------------------------------------------------------------------------
/*!
	Runs \a command with \a arguments as though it had been typed in.  Unique
	abbreviations of a command name are accepted.

 */
void ReadLine::runCommand(const QString &command, const QStringList &arguments)
{
	CommandTable::Handler handler;
	QStringList candidates;

	switch (m_commands.lookup(command, &handler, &candidates)) {
		case CommandTable::Found:
			handler(arguments);
			break;
		case CommandTable::NotFound:
			qWarning("%s: No such command.", qPrintable(command));
			break;
		case CommandTable::Ambiguous:
			qWarning() << "Ambiguous command" << command
			           << "possible commands:" << candidates;
			break;
	}
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Called for each line read.  The line is either the answer to a question
	or a command to run.  Commands are queued on the event loop as they may
	block in a local event loop, and libreadline doesn't allow
	rl_callback_read_char() to be re-entered.

 */
void ReadLine::onLineEntered(const QString &line)
{
	if (m_askLoop) {
		m_askAnswer = line;
		m_askLoop->quit();
		return;
	}

	QStringList words = CommandTable::splitLine(line);
	if (words.isEmpty())
		return;

	m_library.addHistory(line);

	const QString command = words.takeFirst();
	QTimer::singleShot(0, this,
		[this, command, words]()
		{
			runCommand(command, words);
		});
}

void ReadLine::onStdinActivated()
{
	m_library.readChar();
}

void ReadLine::onQuitCommand(const QStringList &args)
{
	Q_UNUSED(args);

	QCoreApplication::quit();
}

void ReadLine::onHelpCommand(const QStringList &args)
{
	Q_UNUSED(args);

	qWarning().noquote() << m_commands.helpText();
}

// -----------------------------------------------------------------------------
/*!
	\internal

	libreadline line callback, \a line is null on EOF (ctrl-D) which either
	aborts the current question or quits the application.  The string is
	malloc'ed by libreadline and must be freed.

 */
void ReadLine::lineCallback(char *line)
{
	ReadLine *self = s_running;
	if (Q_UNLIKELY(!self)) {
		free(line);
		return;
	}

	if (line == nullptr) {
		if (self->isAsking())
			self->abortAsk();
		else
			QCoreApplication::quit();
		return;
	}

	const QString str = QString::fromLocal8Bit(line);
	free(line);

	self->onLineEntered(str);
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Tab completion, only the first word of a command line is completed and
	nothing is completed when answering a question.

 */
char **ReadLine::completionCallback(const char *text, int start, int end)
{
	Q_UNUSED(end);

	ReadLine *self = s_running;
	if (!self || (start != 0) || self->isAsking())
		return nullptr;

	return self->m_library.completionMatches(text, &ReadLine::completionGenerator);
}

char *ReadLine::completionGenerator(const char *text, int state)
{
	ReadLine *self = s_running;
	if (!self)
		return nullptr;

	if (state == 0)
		self->m_pendingCompletions = self->m_commands.completions(QString::fromLocal8Bit(text));

	if (self->m_pendingCompletions.isEmpty())
		return nullptr;

	// libreadline frees the returned string
	return strdup(self->m_pendingCompletions.takeFirst().toLocal8Bit().constData());
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Qt message handler installed whilst the prompt is running.  Passes the
	message on to the previous handler then has libreadline redraw the
	prompt.

 */
void ReadLine::messageHandler(QtMsgType type, const QMessageLogContext &context,
                              const QString &message)
{
	if (s_previousHandler) {
		s_previousHandler(type, context, message);
	} else {
		fputs(message.toLocal8Bit().constData(), stderr);
		fputc('\n', stderr);
	}

	if (s_running)
		s_running->m_library.refreshLine();
}
