// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FakeNetnsProvider.hxx"
#include "netns/Relocate.hxx"
#include "netns/Switcher.hxx"
#include "netns/Error.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

namespace {

struct RelocateFixture {
	FakeNetnsProvider provider;
	const unsigned peer_ns = provider.AddNamespace("peer");

	NetnsSwitcher switcher{provider};
	UniqueNetnsHandle peer = provider.Open("peer");

	NetnsHandle GetHome() const noexcept {
		return switcher.GetHome();
	}
};

} // anonymous namespace

TEST(Relocate, IntoPeer)
{
	RelocateFixture f;
	f.provider.AddInterface("veth0", FakeNetnsProvider::HOME, 5);

	MoveInterface(f.switcher, "veth0", f.GetHome(), f.peer.Get());

	EXPECT_EQ(f.provider.GetInterfaceNamespace("veth0"), f.peer_ns);
	EXPECT_EQ(f.provider.GetThreadNamespace(), FakeNetnsProvider::HOME);

	/* the interface was in the home namespace already */
	EXPECT_EQ(f.provider.GetSwitches(), 0U);
}

TEST(Relocate, BackHome)
{
	RelocateFixture f;
	f.provider.AddInterface("veth0", f.peer_ns, 5);

	MoveInterface(f.switcher, "veth0", f.peer.Get(), f.GetHome());

	EXPECT_EQ(f.provider.GetInterfaceNamespace("veth0"),
		  FakeNetnsProvider::HOME);
	EXPECT_EQ(f.provider.GetThreadNamespace(), FakeNetnsProvider::HOME);
	EXPECT_EQ(f.provider.GetSwitches(), 2U);
}

TEST(Relocate, LookupError)
{
	RelocateFixture f;
	f.provider.AddInterface("veth0", FakeNetnsProvider::HOME, 5);

	try {
		MoveInterface(f.switcher, "veth0", f.peer.Get(), f.GetHome());
		FAIL();
	} catch (const LookupError &e) {
		EXPECT_NE(GetFullMessage(e).find("veth0"), std::string::npos);
	}

	EXPECT_EQ(f.provider.GetInterfaceNamespace("veth0"),
		  FakeNetnsProvider::HOME);
	EXPECT_EQ(f.provider.GetThreadNamespace(), FakeNetnsProvider::HOME);
}

TEST(Relocate, RelocationError)
{
	RelocateFixture f;
	f.provider.AddInterface("veth0", f.peer_ns, 5);
	f.provider.fail_move = true;

	EXPECT_THROW(MoveInterface(f.switcher, "veth0", f.peer.Get(), f.GetHome()),
		     RelocationError);

	EXPECT_EQ(f.provider.GetInterfaceNamespace("veth0"), f.peer_ns);
	EXPECT_EQ(f.provider.GetThreadNamespace(), FakeNetnsProvider::HOME);
}

TEST(Relocate, SwitchError)
{
	RelocateFixture f;
	f.provider.AddInterface("veth0", f.peer_ns, 5);
	f.provider.fail_switch_into = f.peer_ns;

	EXPECT_THROW(MoveInterface(f.switcher, "veth0", f.peer.Get(), f.GetHome()),
		     SwitchError);

	EXPECT_EQ(f.provider.GetInterfaceNamespace("veth0"), f.peer_ns);
	EXPECT_EQ(f.provider.GetThreadNamespace(), FakeNetnsProvider::HOME);
}

TEST(Relocate, Unrecoverable)
{
	RelocateFixture f;
	f.provider.AddInterface("veth0", f.peer_ns, 5);
	f.provider.fail_switch_into = FakeNetnsProvider::HOME;

	EXPECT_THROW(MoveInterface(f.switcher, "veth0", f.peer.Get(), f.GetHome()),
		     UnrecoverableStateError);

	/* the interface was moved, but the thread is stuck */
	EXPECT_EQ(f.provider.GetInterfaceNamespace("veth0"),
		  FakeNetnsProvider::HOME);
	EXPECT_EQ(f.provider.GetThreadNamespace(), f.peer_ns);
}

TEST(Relocate, UnrecoverableSupersedesLookupError)
{
	RelocateFixture f;
	f.provider.fail_switch_into = FakeNetnsProvider::HOME;

	try {
		MoveInterface(f.switcher, "veth0", f.peer.Get(), f.GetHome());
		FAIL();
	} catch (const UnrecoverableStateError &e) {
		/* the original error is mentioned */
		EXPECT_NE(GetFullMessage(e).find("Failed to find network interface 'veth0'"),
			  std::string::npos);
	}
}

TEST(Relocate, RelocationIsSwitchError)
{
	RelocateFixture f;
	f.provider.AddInterface("veth0", f.peer_ns, 5);
	f.provider.fail_move = true;

	/* context added on the way keeps the class */
	try {
		MoveInterface(f.switcher, "veth0", f.peer.Get(), f.GetHome());
		FAIL();
	} catch (const SwitchError &e) {
		EXPECT_NE(dynamic_cast<const RelocationError *>(&e), nullptr);

		try {
			e.ThrowNested("outer");
		} catch (const RelocationError &outer) {
			EXPECT_EQ(GetFullMessage(outer).rfind("outer; ", 0), 0U);
		}
	}
}
