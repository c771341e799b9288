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
//  dbustypes.h
//  BtPeer
//

#ifndef DBUSTYPES_H
#define DBUSTYPES_H

#include <QMap>
#include <QString>
#include <QVariantMap>
#include <QMetaType>
#include <QDBusObjectPath>


// the reply of org.freedesktop.DBus.ObjectManager.GetManagedObjects, keyed
// by object path then by interface name
typedef QMap<QString, QVariantMap> DBusInterfaceList;
typedef QMap<QDBusObjectPath, DBusInterfaceList> DBusManagedObjectList;

Q_DECLARE_METATYPE(DBusInterfaceList)
Q_DECLARE_METATYPE(DBusManagedObjectList)


void registerDBusTypes();


#endif // !defined(DBUSTYPES_H)
