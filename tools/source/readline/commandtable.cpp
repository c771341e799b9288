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
//  commandtable.cpp
//  BtPeer
//

#include "commandtable.h"

#include <QDebug>


// the usage column of the help text is padded to at least this many chars
static const int minUsageWidth = 30;
static const int maxUsageWidth = 50;


// -----------------------------------------------------------------------------
/*!
	\class CommandTable
	\brief The set of commands understood by the console.

	Commands are stored sorted by name.  A command can be run by typing any
	prefix of its name as long as the prefix is not shared with another
	command, an exact name always wins.

 */
CommandTable::CommandTable()
	: m_usageWidth(minUsageWidth)
{
}

// -----------------------------------------------------------------------------
/*!
	Adds the command \a name.  \a arguments and \a description are only used
	for the help text.  Returns \c false if a command with the same name has
	already been added.

 */
bool CommandTable::add(const QString &name, const QStringList &arguments,
                       const QString &description, const Handler &handler)
{
	if (Q_UNLIKELY(name.isEmpty() || !handler)) {
		qWarning("invalid command");
		return false;
	}

	if (m_entries.contains(name)) {
		qWarning() << "already have command" << name;
		return false;
	}

	const int usageLength = name.length() + arguments.join(QLatin1Char(' ')).length() + 1;
	m_usageWidth = qBound(m_usageWidth, usageLength, maxUsageWidth);

	m_entries.insert(name, Entry{ arguments, description, handler });
	return true;
}

// -----------------------------------------------------------------------------
/*!
	Finds the handler for \a command, which may be an abbreviation.  If more
	than one command starts with \a command then \c Ambiguous is returned and
	\a candidates (if not null) is filled with the matching names.

 */
CommandTable::LookupResult CommandTable::lookup(const QString &command,
                                                Handler *handler,
                                                QStringList *candidates) const
{
	QMap<QString, Entry>::const_iterator it = m_entries.find(command);
	if (it != m_entries.end()) {
		if (handler)
			*handler = it->handler;
		return Found;
	}

	const QStringList matches = completions(command);
	if (matches.isEmpty())
		return NotFound;

	if (matches.size() > 1) {
		if (candidates)
			*candidates = matches;
		return Ambiguous;
	}

	if (handler)
		*handler = m_entries.value(matches.first()).handler;
	return Found;
}

QStringList CommandTable::completions(const QString &prefix) const
{
	QStringList names;

	for (QMap<QString, Entry>::const_iterator it = m_entries.begin();
	     it != m_entries.end(); ++it) {
		if (it.key().startsWith(prefix))
			names.append(it.key());
	}

	return names;
}

QString CommandTable::helpText() const
{
	QString text = QStringLiteral("Available commands:\n");

	for (QMap<QString, Entry>::const_iterator it = m_entries.begin();
	     it != m_entries.end(); ++it) {

		QStringList usage(it.key());
		usage.append(it->arguments);

		text += QStringLiteral("  %1 %2\n")
		            .arg(usage.join(QLatin1Char(' ')), -m_usageWidth)
		            .arg(it->description);
	}

	return text;
}

// -----------------------------------------------------------------------------
/*!
	Breaks \a line into words.  Words are separated by whitespace, text inside
	single or double quotes is taken literally (quotes removed) so paths with
	spaces can be given as one argument.  An unterminated quote runs to the
	end of the line.

	\code
		splitLine("send AA:BB:CC:DD:EE:FF \"/tmp/my file.txt\"");
		// -> ("send", "AA:BB:CC:DD:EE:FF", "/tmp/my file.txt")
	\endcode
 */
QStringList CommandTable::splitLine(const QString &line)
{
	QStringList words;

	QString word;
	bool inWord = false;
	QChar quote;

	for (const QChar ch : line) {

		if (!quote.isNull()) {
			if (ch == quote)
				quote = QChar();
			else
				word += ch;

		} else if ((ch == QLatin1Char('"')) || (ch == QLatin1Char('\''))) {
			quote = ch;
			inWord = true;

		} else if (ch.isSpace()) {
			if (inWord) {
				words.append(word);
				word.clear();
				inWord = false;
			}

		} else {
			word += ch;
			inWord = true;
		}
	}

	if (inWord)
		words.append(word);

	return words;
}
