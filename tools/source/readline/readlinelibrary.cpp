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
//  readlinelibrary.cpp
//  BtPeer
//

#include "readlinelibrary.h"

#include <QDebug>

#include <dlfcn.h>


ReadLineLibrary::ReadLineLibrary()
	: m_handle(nullptr)
	, m_onNewLine(nullptr)
	, m_completionMatches(nullptr)
	, m_handlerInstall(nullptr)
	, m_readChar(nullptr)
	, m_handlerRemove(nullptr)
	, m_addHistory(nullptr)
	, m_attemptedCompletion(nullptr)
{
	// the unversioned name only exists if the dev package is installed
	static const char *names[] = {
		"libreadline.so.8",
		"libreadline.so.7",
		"libreadline.so",
	};

	for (const char *name : names) {
		m_handle = dlopen(name, RTLD_NOW);
		if (m_handle)
			break;
	}

	if (!m_handle) {
		qWarning("failed to open libreadline (%s)", dlerror());
		return;
	}

	if (!resolveSymbols()) {
		dlclose(m_handle);
		m_handle = nullptr;
	}
}

ReadLineLibrary::~ReadLineLibrary()
{
	if (m_handle) {
		removeHandler();
		dlclose(m_handle);
	}
}

bool ReadLineLibrary::resolveSymbols()
{
	struct Symbol {
		const char *name;
		void **address;
	};

	const Symbol symbols[] = {
		{ "rl_on_new_line",                   reinterpret_cast<void**>(&m_onNewLine)           },
		{ "rl_completion_matches",            reinterpret_cast<void**>(&m_completionMatches)   },
		{ "rl_callback_handler_install",      reinterpret_cast<void**>(&m_handlerInstall)      },
		{ "rl_callback_read_char",            reinterpret_cast<void**>(&m_readChar)            },
		{ "rl_callback_handler_remove",       reinterpret_cast<void**>(&m_handlerRemove)       },
		{ "add_history",                      reinterpret_cast<void**>(&m_addHistory)          },
		{ "rl_attempted_completion_function", reinterpret_cast<void**>(&m_attemptedCompletion) },
	};

	for (const Symbol &symbol : symbols) {
		*symbol.address = dlsym(m_handle, symbol.name);
		if (!*symbol.address) {
			qWarning("failed to get symbol '%s' (%s)", symbol.name, dlerror());
			return false;
		}
	}

	return true;
}

bool ReadLineLibrary::isLoaded() const
{
	return (m_handle != nullptr);
}

void ReadLineLibrary::installHandler(const QString &prompt, LineCallback callback)
{
	if (m_handlerInstall)
		m_handlerInstall(prompt.toLocal8Bit().constData(), callback);
}

void ReadLineLibrary::removeHandler()
{
	if (m_handlerRemove)
		m_handlerRemove();
}

void ReadLineLibrary::readChar()
{
	if (m_readChar)
		m_readChar();
}

// -----------------------------------------------------------------------------
/*!
	Tells readline the cursor is now on an empty line, used after something
	else has written to the terminal so the prompt is redrawn below it.

 */
void ReadLineLibrary::refreshLine()
{
	if (m_onNewLine)
		m_onNewLine();
}

void ReadLineLibrary::addHistory(const QString &line)
{
	if (m_addHistory)
		m_addHistory(line.toLocal8Bit().constData());
}

void ReadLineLibrary::setCompletionCallback(CompletionCallback callback)
{
	if (m_attemptedCompletion)
		*m_attemptedCompletion = callback;
}

char **ReadLineLibrary::completionMatches(const char *text,
                                          CompletionGenerator generator)
{
	if (!m_completionMatches)
		return nullptr;

	return m_completionMatches(text, generator);
}
