// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FakeNetnsProvider.hxx"
#include "netns/Switcher.hxx"
#include "netns/Error.hxx"

#include <gtest/gtest.h>

TEST(NetnsSwitcher, Home)
{
	FakeNetnsProvider provider;

	{
		NetnsSwitcher switcher{provider};
		EXPECT_FALSE(switcher.IsClosed());
		EXPECT_EQ(provider.CountOpenHandles(), 1U);

		const auto current = provider.GetCurrent();
		EXPECT_TRUE(provider.Equals(switcher.GetHome(), current.Get()));
	}

	EXPECT_EQ(provider.CountOpenHandles(), 0U);
}

TEST(NetnsSwitcher, Close)
{
	FakeNetnsProvider provider;
	NetnsSwitcher switcher{provider};

	EXPECT_TRUE(switcher.Close());
	EXPECT_TRUE(switcher.IsClosed());
	EXPECT_EQ(provider.CountOpenHandles(), 0U);
}

TEST(NetnsSwitcher, SwitchToCurrent)
{
	FakeNetnsProvider provider;
	NetnsSwitcher switcher{provider};

	switcher.SwitchHome();
	switcher.SwitchTo(switcher.GetHome());

	/* no SetCurrent() call if already there */
	EXPECT_EQ(provider.GetSwitches(), 0U);
}

TEST(NetnsSwitcher, SwitchToPeer)
{
	FakeNetnsProvider provider;
	const unsigned peer_ns = provider.AddNamespace("peer");

	NetnsSwitcher switcher{provider};
	const auto peer = provider.Open("peer");

	switcher.SwitchTo(peer.Get());
	EXPECT_EQ(provider.GetThreadNamespace(), peer_ns);

	switcher.SwitchTo(peer.Get());
	EXPECT_EQ(provider.GetSwitches(), 1U);

	switcher.SwitchHome();
	EXPECT_EQ(provider.GetThreadNamespace(), FakeNetnsProvider::HOME);
	EXPECT_EQ(provider.GetSwitches(), 2U);
}

TEST(NetnsSwitcher, AcquisitionError)
{
	FakeNetnsProvider provider;
	provider.fail_get_current = true;

	EXPECT_THROW(NetnsSwitcher{provider}, AcquisitionError);
	EXPECT_EQ(provider.CountOpenHandles(), 0U);
}

TEST(NetnsSwitcher, SwitchError)
{
	FakeNetnsProvider provider;
	const unsigned peer_ns = provider.AddNamespace("peer");
	provider.fail_switch_into = peer_ns;

	NetnsSwitcher switcher{provider};
	const auto peer = provider.Open("peer");

	EXPECT_THROW(switcher.SwitchTo(peer.Get()), SwitchError);
	EXPECT_EQ(provider.GetThreadNamespace(), FakeNetnsProvider::HOME);
}

TEST(NetnsSwitcher, SwitchErrorGetCurrent)
{
	FakeNetnsProvider provider;
	provider.AddNamespace("peer");

	NetnsSwitcher switcher{provider};
	const auto peer = provider.Open("peer");

	provider.fail_get_current = true;
	EXPECT_THROW(switcher.SwitchTo(peer.Get()), SwitchError);
}

TEST(NetnsSwitcher, BorrowedHome)
{
	FakeNetnsProvider provider;
	const unsigned peer_ns = provider.AddNamespace("peer");

	const auto home = provider.GetCurrent();
	const auto peer = provider.Open("peer");

	{
		NetnsSwitcher switcher{provider, home.Get()};
		EXPECT_TRUE(provider.Equals(switcher.GetHome(), home.Get()));

		switcher.SwitchTo(peer.Get());
		EXPECT_EQ(provider.GetThreadNamespace(), peer_ns);

		switcher.SwitchHome();
		EXPECT_EQ(provider.GetThreadNamespace(), FakeNetnsProvider::HOME);

		/* the borrowed handle is not released */
		EXPECT_TRUE(switcher.Close());
		EXPECT_TRUE(switcher.IsClosed());
	}

	EXPECT_TRUE(home.IsDefined());
	EXPECT_EQ(provider.CountOpenHandles(), 2U);
}
