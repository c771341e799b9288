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
//  readlinelibrary.h
//  BtPeer
//

#ifndef READLINELIBRARY_H
#define READLINELIBRARY_H

#include <QString>


// -----------------------------------------------------------------------------
/*!
	\class ReadLineLibrary
	\brief GNU readline loaded at runtime.

	libreadline is GPL so it's dlopen'ed rather than linked, if it can't be
	found isLoaded() returns \c false and the console is unavailable.

 */
class ReadLineLibrary
{
public:
	typedef void (*LineCallback)(char *line);
	typedef char *(*CompletionGenerator)(const char *text, int state);
	typedef char **(*CompletionCallback)(const char *text, int start, int end);

	ReadLineLibrary();
	~ReadLineLibrary();

	ReadLineLibrary(const ReadLineLibrary &) = delete;
	ReadLineLibrary &operator=(const ReadLineLibrary &) = delete;

public:
	bool isLoaded() const;

	void installHandler(const QString &prompt, LineCallback callback);
	void removeHandler();
	void readChar();
	void refreshLine();

	void addHistory(const QString &line);

	void setCompletionCallback(CompletionCallback callback);
	char **completionMatches(const char *text, CompletionGenerator generator);

private:
	bool resolveSymbols();

private:
	void *m_handle;

	int (*m_onNewLine)(void);
	char **(*m_completionMatches)(const char *, CompletionGenerator);
	void (*m_handlerInstall)(const char *, LineCallback);
	void (*m_readChar)(void);
	void (*m_handlerRemove)(void);
	void (*m_addHistory)(const char *);

	CompletionCallback *m_attemptedCompletion;
};


#endif // !defined(READLINELIBRARY_H)
