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
//  dbustypes.cpp
//  BtPeer
//

#include "dbustypes.h"

#include <QAtomicInteger>
#include <QDBusMetaType>


// -----------------------------------------------------------------------------
/*!
	Registers the managed object list types with the QtDBus marshaller.  Safe
	to call from any number of places, the registration is only done once.

 */
void registerDBusTypes()
{
	static QAtomicInteger<int> registered(0);
	if (!registered.testAndSetOrdered(0, 1))
		return;

	qDBusRegisterMetaType<DBusInterfaceList>();
	qDBusRegisterMetaType<DBusManagedObjectList>();
}
