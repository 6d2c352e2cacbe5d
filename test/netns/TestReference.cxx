// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "netns/Reference.hxx"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

TEST(NetnsReference, AbsolutePath)
{
	EXPECT_EQ(ResolveNetnsReference("/var/run/netns/client1", "/run/netns"),
		  "/var/run/netns/client1");
	EXPECT_EQ(ResolveNetnsReference("/proc/42/ns/net", "/run/netns"),
		  "/proc/42/ns/net");
}

TEST(NetnsReference, FileURL)
{
	EXPECT_EQ(ResolveNetnsReference("file:///var/run/netns/client1", "/run/netns"),
		  "/var/run/netns/client1");
}

TEST(NetnsReference, Name)
{
	EXPECT_EQ(ResolveNetnsReference("client1", "/run/netns"),
		  "/run/netns/client1");
	EXPECT_EQ(ResolveNetnsReference("client1", "/var/run/netns/"),
		  "/var/run/netns/client1");
}

TEST(NetnsReference, Malformed)
{
	EXPECT_THROW(ResolveNetnsReference("", "/run/netns"),
		     std::invalid_argument);
	EXPECT_THROW(ResolveNetnsReference("file://relative", "/run/netns"),
		     std::invalid_argument);
	EXPECT_THROW(ResolveNetnsReference("http://example.com/ns", "/run/netns"),
		     std::invalid_argument);
	EXPECT_THROW(ResolveNetnsReference("foo/bar", "/run/netns"),
		     std::invalid_argument);
	EXPECT_THROW(ResolveNetnsReference("..", "/run/netns"),
		     std::invalid_argument);
	EXPECT_THROW(ResolveNetnsReference(".", "/run/netns"),
		     std::invalid_argument);
}

TEST(NetnsReference, TooLong)
{
	const std::string path = "/" + std::string(8192, 'x');
	EXPECT_THROW(ResolveNetnsReference(path, "/run/netns"),
		     std::invalid_argument);
}
