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
//  readline.h
//  BtPeer
//

#ifndef READLINE_H
#define READLINE_H

#include "commandtable.h"
#include "readlinelibrary.h"

#include <QObject>
#include <QString>
#include <QStringList>
#include <QPointer>
#include <QSocketNotifier>


class QEventLoop;


class ReadLine : public QObject
{
	Q_OBJECT

public:
	explicit ReadLine(QObject *parent = nullptr);
	~ReadLine() final;

public:
	bool isValid() const;

	void setPrompt(const QString &prompt);
	QString prompt() const;

	QString ask(const QString &question, int timeoutMSecs);
	bool isAsking() const;

	// registers a command handled by a slot on a QObject, the command is
	// ignored once the receiver has been destroyed
	template <typename T>
	bool addCommand(const QString &name, const QStringList &args,
	                const QString &description, T *receiver,
	                void (T::*slot)(const QStringList &))
	{
		const QPointer<T> guard(receiver);
		return m_commands.add(name, args, description,
			[guard, slot](const QStringList &arguments)
			{
				if (guard)
					(guard.data()->*slot)(arguments);
			});
	}

public slots:
	void start();
	void stop();

	void abortAsk();

	void runCommand(const QString &command, const QStringList &arguments);

private slots:
	void onStdinActivated();

	void onQuitCommand(const QStringList &args);
	void onHelpCommand(const QStringList &args);

private:
	void onLineEntered(const QString &line);

	static void lineCallback(char *line);
	static char **completionCallback(const char *text, int start, int end);
	static char *completionGenerator(const char *text, int state);

	static void messageHandler(QtMsgType type, const QMessageLogContext &context,
	                           const QString &message);

private:
	static ReadLine *s_running;
	static QtMessageHandler s_previousHandler;

	ReadLineLibrary m_library;
	CommandTable m_commands;
	QSocketNotifier m_stdinNotifier;

	QString m_prompt;

	QEventLoop *m_askLoop;
	QString m_askAnswer;

	QStringList m_pendingCompletions;
};


#endif // !defined(READLINE_H)
