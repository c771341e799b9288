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
//  test_commandtable.cpp
//  BtPeer
//

#include "readline/commandtable.h"

#include <gtest/gtest.h>


class CommandTableTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		for (const char *name : { "connect", "cancel-send", "disconnect", "discoverable", "pair" }) {
			const QString command = QString::fromLatin1(name);
			m_table.add(command, { QStringLiteral("<dev>") }, QStringLiteral("does ") + command,
			            [this, command](const QStringList &args)
			            {
			                m_lastCommand = command;
			                m_lastArgs = args;
			            });
		}
	}

	bool run(const QString &command, const QStringList &args = QStringList())
	{
		CommandTable::Handler handler;
		if (m_table.lookup(command, &handler) != CommandTable::Found)
			return false;

		handler(args);
		return true;
	}

	CommandTable m_table;
	QString m_lastCommand;
	QStringList m_lastArgs;
};

TEST_F(CommandTableTest, ExactNameRunsCommand)
{
	ASSERT_TRUE(run(QStringLiteral("pair"), { QStringLiteral("AA:BB:CC:DD:EE:FF") }));
	EXPECT_EQ(m_lastCommand, QStringLiteral("pair"));
	EXPECT_EQ(m_lastArgs, QStringList{ QStringLiteral("AA:BB:CC:DD:EE:FF") });
}

TEST_F(CommandTableTest, UniquePrefixRunsCommand)
{
	ASSERT_TRUE(run(QStringLiteral("disco")));
	EXPECT_EQ(m_lastCommand, QStringLiteral("disconnect"));

	ASSERT_TRUE(run(QStringLiteral("co")));
	EXPECT_EQ(m_lastCommand, QStringLiteral("connect"));
}

TEST_F(CommandTableTest, SharedPrefixIsAmbiguous)
{
	QStringList candidates;
	EXPECT_EQ(m_table.lookup(QStringLiteral("disc"), nullptr, &candidates),
	          CommandTable::Ambiguous);
	EXPECT_EQ(candidates, (QStringList{ QStringLiteral("disconnect"),
	                                    QStringLiteral("discoverable") }));
	EXPECT_TRUE(m_lastCommand.isEmpty());
}

TEST_F(CommandTableTest, UnknownCommandIsNotFound)
{
	EXPECT_EQ(m_table.lookup(QStringLiteral("scan"), nullptr), CommandTable::NotFound);
	EXPECT_FALSE(run(QStringLiteral("pairs")));
}

TEST_F(CommandTableTest, DuplicateNameIsRejected)
{
	EXPECT_FALSE(m_table.add(QStringLiteral("pair"), { }, QStringLiteral("again"),
	                         [](const QStringList &) { }));
	EXPECT_FALSE(m_table.add(QStringLiteral("empty"), { }, QStringLiteral("no handler"),
	                         CommandTable::Handler()));
}

TEST_F(CommandTableTest, CompletionsAreSorted)
{
	EXPECT_EQ(m_table.completions(QStringLiteral("c")),
	          (QStringList{ QStringLiteral("cancel-send"), QStringLiteral("connect") }));
	EXPECT_EQ(m_table.completions(QString()).size(), 5);
	EXPECT_TRUE(m_table.completions(QStringLiteral("x")).isEmpty());
}

TEST_F(CommandTableTest, HelpListsUsage)
{
	const QString help = m_table.helpText();
	EXPECT_TRUE(help.startsWith(QStringLiteral("Available commands:\n")));
	EXPECT_TRUE(help.contains(QStringLiteral("  pair <dev>")));
	EXPECT_TRUE(help.contains(QStringLiteral("does discoverable\n")));
}

TEST(CommandTableSplitTest, SplitsOnWhitespace)
{
	EXPECT_EQ(CommandTable::splitLine(QStringLiteral("  send  AA:BB:CC:DD:EE:FF\t/tmp/x ")),
	          (QStringList{ QStringLiteral("send"), QStringLiteral("AA:BB:CC:DD:EE:FF"),
	                        QStringLiteral("/tmp/x") }));
	EXPECT_TRUE(CommandTable::splitLine(QStringLiteral("   ")).isEmpty());
}

TEST(CommandTableSplitTest, QuotedTextIsOneWord)
{
	EXPECT_EQ(CommandTable::splitLine(QStringLiteral("play \"/tmp/my song.wav\"")),
	          (QStringList{ QStringLiteral("play"), QStringLiteral("/tmp/my song.wav") }));
	EXPECT_EQ(CommandTable::splitLine(QStringLiteral("receive '/tmp/in box' 30")),
	          (QStringList{ QStringLiteral("receive"), QStringLiteral("/tmp/in box"),
	                        QStringLiteral("30") }));
	EXPECT_EQ(CommandTable::splitLine(QStringLiteral("a \"\" b")),
	          (QStringList{ QStringLiteral("a"), QString(), QStringLiteral("b") }));
}

TEST(CommandTableSplitTest, UnterminatedQuoteRunsToEnd)
{
	EXPECT_EQ(CommandTable::splitLine(QStringLiteral("send 'a b")),
	          (QStringList{ QStringLiteral("send"), QStringLiteral("a b") }));
}
