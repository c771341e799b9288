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
//  logging.h
//  BtPeer
//

#ifndef LOGGING_H
#define LOGGING_H

#include <QFlags>
#include <QString>
#include <QLoggingCategory>


Q_DECLARE_LOGGING_CATEGORY(milestone)
Q_DECLARE_LOGGING_CATEGORY(prodlogs)

#define BTPEER_LOGGER(category) \
	QMessageLogger(QT_MESSAGELOG_FILE, QT_MESSAGELOG_LINE, QT_MESSAGELOG_FUNC, category)

// significant events in the life of a device or transfer
#define qMilestone  BTPEER_LOGGER(milestone().categoryName()).info

// output that is always written whatever the log levels, i.e. console replies
#define qProdLog    BTPEER_LOGGER(prodlogs().categoryName()).info

#define qError      BTPEER_LOGGER(nullptr).critical


// ordered from most to least severe
enum LoggingLevel {
	Fatal       = 0x01,
	Error       = 0x02,
	Warning     = 0x04,
	Milestone   = 0x08,
	Info        = 0x10,
	Debug       = 0x20,
};

Q_DECLARE_FLAGS(LoggingLevels, LoggingLevel)
Q_DECLARE_OPERATORS_FOR_FLAGS(LoggingLevels)

enum LoggingTarget {
	Console     = 0x1,
	SysLog      = 0x2,
	Default     = Console,
};

Q_DECLARE_FLAGS(LoggingTargets, LoggingTarget)
Q_DECLARE_OPERATORS_FOR_FLAGS(LoggingTargets)


void setupLogging(LoggingTargets targets, LoggingLevels levels);

void setLogLevels(LoggingLevels levels);
LoggingLevels getLogLevels();

void setLogTargets(LoggingTargets targets);
LoggingTargets getLogTargets();

LoggingLevels logLevelsUpTo(LoggingLevel level);

bool logLevelFromString(const QString &name, LoggingLevel *level);
bool logLevelsFromString(const QString &str, LoggingLevels *levels);
QString logLevelsToString(LoggingLevels levels);


#endif // !defined(LOGGING_H)
