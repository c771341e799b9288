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
//  unixsignalnotifier.h
//  BtPeer
//

#ifndef UNIXSIGNALNOTIFIER_H
#define UNIXSIGNALNOTIFIER_H

#include <QObject>
#include <QList>
#include <QVector>

#include <signal.h>


class QSocketNotifier;


class UnixSignalNotifier : public QObject
{
	Q_OBJECT

public:
	explicit UnixSignalNotifier(const QList<int> &unixSignals,
	                            QObject *parent = nullptr);
	~UnixSignalNotifier() final;

	bool isValid() const;
	QList<int> unixSignals() const;

signals:
	void activated(int unixSignal);

private slots:
	void onPipeActivated(int fd);

private:
	static void signalHandler(int unixSignal);

	void installHandlers();
	void restoreHandlers();

private:
	const QList<int> m_unixSignals;
	QVector<struct sigaction> m_previousActions;

	int m_pipeReadFd;
	QSocketNotifier *m_pipeNotifier;

private:
	Q_DISABLE_COPY(UnixSignalNotifier)
};

#endif // !defined(UNIXSIGNALNOTIFIER_H)
