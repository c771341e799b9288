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
//  logging.cpp
//  BtPeer
//

#include "logging.h"

#include <QStringList>
#include <QByteArray>
#include <QAtomicInteger>

#include <time.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <syslog.h>

#include <sys/uio.h>


Q_LOGGING_CATEGORY(milestone, "btpeer.milestone", QtInfoMsg)
Q_LOGGING_CATEGORY(prodlogs, "btpeer.prodlogs", QtInfoMsg)


namespace {

struct LevelDetails
{
	LoggingLevel level;
	const char *name;
	const char *tag;
	int sysLogPriority;
};

// in severity order, the tag is always 5 chars
const LevelDetails levelDetails[] = {
	{ LoggingLevel::Fatal,      "fatal",      "FTL: ",  LOG_ALERT   },
	{ LoggingLevel::Error,      "error",      "ERR: ",  LOG_CRIT    },
	{ LoggingLevel::Warning,    "warning",    "WRN: ",  LOG_WARNING },
	{ LoggingLevel::Milestone,  "milestone",  "MIL: ",  LOG_NOTICE  },
	{ LoggingLevel::Info,       "info",       "NFO: ",  LOG_INFO    },
	{ LoggingLevel::Debug,      "debug",      "DBG: ",  LOG_DEBUG   },
};

const LevelDetails &detailsFor(LoggingLevel level)
{
	for (const LevelDetails &details : levelDetails) {
		if (details.level == level)
			return details;
	}

	return levelDetails[5];
}

#if (BTPEER_BUILD_TYPE == BTPEER_DEBUG)
const LoggingLevels::Int defaultLevels = LoggingLevel::Fatal | LoggingLevel::Error |
                                         LoggingLevel::Warning | LoggingLevel::Milestone;
const bool includeContext = true;
#elif (BTPEER_BUILD_TYPE == BTPEER_RELEASE)
const LoggingLevels::Int defaultLevels = LoggingLevel::Fatal | LoggingLevel::Error;
const bool includeContext = false;
#else
#	error "Unknown BTPEER_BUILD_TYPE, expected BTPEER_DEBUG or BTPEER_RELEASE"
#endif

QAtomicInteger<LoggingTargets::Int> g_logTargets(LoggingTarget::Default);
QAtomicInteger<LoggingLevels::Int> g_logLevels(defaultLevels);


// where a message came from, only filled in on debug builds
struct Origin
{
	const char *file;
	const char *function;
	int line;

	bool isValid() const { return file || function; }
};

Origin originOf(const QMessageLogContext &context)
{
	if (!includeContext)
		return Origin{ nullptr, nullptr, 0 };

	const char *file = context.file;
	if (file) {
		const char *slash = strrchr(file, '/');
		if (slash)
			file = slash + 1;
	}

	return Origin{ file, context.function, context.line };
}

// -----------------------------------------------------------------------------
/*!
	\internal

	Writes one line to stderr made up of a monotonic timestamp, the severity
	tag, the (optional) origin and the message.  A single writev is used so
	lines from different threads aren't interleaved.

 */
void writeToConsole(const LevelDetails &details, const Origin &origin,
                    const QByteArray &message)
{
	struct timespec now;
	clock_gettime(CLOCK_MONOTONIC, &now);

	char timestamp[32];
	const int timestampLen = snprintf(timestamp, sizeof(timestamp), "%.010lu.%.06lu ",
	                                  static_cast<unsigned long>(now.tv_sec),
	                                  static_cast<unsigned long>(now.tv_nsec / 1000));

	char location[160];
	int locationLen = 0;
	if (origin.isValid()) {
		locationLen = snprintf(location, sizeof(location), "< M:%.*s F:%.*s L:%d > ",
		                       64, origin.file ? origin.file : "?",
		                       64, origin.function ? origin.function : "?",
		                       origin.line);
	}

	struct iovec parts[5] = {
		{ timestamp, qBound<size_t>(0, timestampLen, sizeof(timestamp) - 1) },
		{ const_cast<char*>(details.tag), 5 },
		{ location, qBound<size_t>(0, locationLen, sizeof(location) - 1) },
		{ const_cast<char*>(message.constData()), size_t(message.size()) },
		{ const_cast<char*>("\n"), 1 },
	};

	if (writev(STDERR_FILENO, parts, 5) < 0)
		return;
}

void writeToSysLog(const LevelDetails &details, const Origin &origin,
                   const QByteArray &message)
{
	if (origin.isValid()) {
		syslog(details.sysLogPriority, "< M:%.*s F:%.*s L:%d > %s",
		       64, origin.file ? origin.file : "?",
		       64, origin.function ? origin.function : "?",
		       origin.line, message.constData());
	} else {
		syslog(details.sysLogPriority, "%s", message.constData());
	}
}

LoggingLevel levelOf(QtMsgType type, const QMessageLogContext &context)
{
	// category names are compared by pointer, both come from the same
	// QLoggingCategory object
	if (context.category == milestone().categoryName())
		return LoggingLevel::Milestone;

	switch (type) {
		case QtFatalMsg:    return LoggingLevel::Fatal;
		case QtCriticalMsg: return LoggingLevel::Error;
		case QtWarningMsg:  return LoggingLevel::Warning;
		case QtInfoMsg:     return LoggingLevel::Info;
		case QtDebugMsg:
		default:            return LoggingLevel::Debug;
	}
}

// -----------------------------------------------------------------------------
/*!
	\internal

	The Qt message handler installed by setupLogging().  Messages in the
	\c prodlogs category bypass the level filter and are written at the
	milestone level.

 */
void messageOutput(QtMsgType type, const QMessageLogContext &context,
                   const QString &msg)
{
	const LoggingTargets targets(QFlag(g_logTargets.load()));
	if (Q_UNLIKELY(!targets))
		return;

	LoggingLevel level = LoggingLevel::Milestone;
	if (Q_LIKELY(context.category != prodlogs().categoryName())) {
		level = levelOf(type, context);
		if (!(g_logLevels.load() & level))
			return;
	}

	const LevelDetails &details = detailsFor(level);
	const Origin origin = originOf(context);
	const QByteArray message = msg.toLocal8Bit();

	if (targets & LoggingTarget::Console)
		writeToConsole(details, origin, message);
	if (targets & LoggingTarget::SysLog)
		writeToSysLog(details, origin, message);
}

} // namespace


// -----------------------------------------------------------------------------
/*!
	Installs the logging message handler, after which all Qt log output is
	filtered by \a levels and written to \a targets.

 */
void setupLogging(LoggingTargets targets, LoggingLevels levels)
{
	g_logTargets.store(targets);
	g_logLevels.store(levels);

	if (targets & LoggingTarget::SysLog)
		openlog("btpeer", LOG_CONS | LOG_NDELAY, LOG_DAEMON);

	qInstallMessageHandler(messageOutput);
}

void setLogLevels(LoggingLevels levels)
{
	g_logLevels.store(levels);
}

LoggingLevels getLogLevels()
{
	return LoggingLevels(QFlag(g_logLevels.load()));
}

void setLogTargets(LoggingTargets targets)
{
	if ((targets & LoggingTarget::SysLog) && !(getLogTargets() & LoggingTarget::SysLog))
		openlog("btpeer", LOG_CONS | LOG_NDELAY, LOG_DAEMON);

	g_logTargets.store(targets);
}

LoggingTargets getLogTargets()
{
	return LoggingTargets(QFlag(g_logTargets.load()));
}

// -----------------------------------------------------------------------------
/*!
	Returns \a level plus all the levels more severe than it, i.e. passing
	\l{LoggingLevel::Warning} returns fatal, error and warning.

 */
LoggingLevels logLevelsUpTo(LoggingLevel level)
{
	return LoggingLevels(QFlag((int(level) << 1) - 1));
}

bool logLevelFromString(const QString &name, LoggingLevel *level)
{
	const QString trimmed = name.trimmed();

	for (const LevelDetails &details : levelDetails) {
		if (trimmed.compare(QLatin1String(details.name), Qt::CaseInsensitive) == 0) {
			*level = details.level;
			return true;
		}
	}

	return false;
}

// -----------------------------------------------------------------------------
/*!
	Parses a comma separated list of level names, i.e. "error,warning,info".
	"all" enables every level and "none" clears them.

	Returns \c false if any of the names are not recognised, in which case
	\a levels is not modified.
 */
bool logLevelsFromString(const QString &str, LoggingLevels *levels)
{
	LoggingLevels result;

	const QStringList names = str.split(QLatin1Char(','), QString::SkipEmptyParts);
	for (const QString &name : names) {

		LoggingLevel level;
		if (logLevelFromString(name, &level))
			result |= level;
		else if (name.trimmed().compare(QLatin1String("all"), Qt::CaseInsensitive) == 0)
			result = logLevelsUpTo(LoggingLevel::Debug);
		else if (name.trimmed().compare(QLatin1String("none"), Qt::CaseInsensitive) == 0)
			result = LoggingLevels();
		else
			return false;
	}

	*levels = result;
	return true;
}

QString logLevelsToString(LoggingLevels levels)
{
	QStringList names;

	for (const LevelDetails &details : levelDetails) {
		if (levels & details.level)
			names.append(QLatin1String(details.name));
	}

	return names.isEmpty() ? QStringLiteral("none") : names.join(QLatin1Char(','));
}
