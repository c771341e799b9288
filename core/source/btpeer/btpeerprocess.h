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
//  btpeerprocess.h
//  BtPeer
//

#ifndef BTPEERPROCESS_H
#define BTPEERPROCESS_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QProcess>


class BtPeerProcess : public QObject
{
	Q_OBJECT

public:
	explicit BtPeerProcess(const QString &name, QObject *parent = nullptr);
	~BtPeerProcess() final;

public:
	QString name() const;

	bool start(const QString &program, const QStringList &arguments);
	void stop();

	bool isRunning() const;

	int exitCode() const;
	QProcess::ExitStatus exitStatus() const;

signals:
	void finished(int exitCode, QProcess::ExitStatus exitStatus);

private slots:
	void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
	void onProcessError(QProcess::ProcessError error);

private:
	const QString m_name;
	QProcess *m_process;

	int m_exitCode;
	QProcess::ExitStatus m_exitStatus;
};


#endif // !defined(BTPEERPROCESS_H)
