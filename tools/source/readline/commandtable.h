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
//  commandtable.h
//  BtPeer
//

#ifndef COMMANDTABLE_H
#define COMMANDTABLE_H

#include <QMap>
#include <QString>
#include <QStringList>

#include <functional>


class CommandTable
{
public:
	typedef std::function<void(const QStringList &arguments)> Handler;

	enum LookupResult {
		Found,
		NotFound,
		Ambiguous
	};

	CommandTable();
	~CommandTable() = default;

public:
	bool add(const QString &name, const QStringList &arguments,
	         const QString &description, const Handler &handler);

	LookupResult lookup(const QString &command, Handler *handler,
	                    QStringList *candidates = nullptr) const;

	QStringList completions(const QString &prefix) const;

	QString helpText() const;

	static QStringList splitLine(const QString &line);

private:
	struct Entry {
		QStringList arguments;
		QString description;
		Handler handler;
	};

	QMap<QString, Entry> m_entries;
	int m_usageWidth;
};


#endif // !defined(COMMANDTABLE_H)
