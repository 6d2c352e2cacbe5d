// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "chain/Chain.hxx"
#include "chain/Connection.hxx"
#include "chain/Context.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

/**
 * Appends its name to a log and to the connection id.
 */
class NameElement final : public ChainElement {
	std::vector<std::string> &log;
	const std::string name;

public:
	NameElement(std::vector<std::string> &_log, std::string _name) noexcept
		:log(_log), name(std::move(_name)) {}

	Connection Request(Context &ctx, const Connection &connection) override {
		log.push_back("request " + name);

		auto c = connection;
		c.id += "/" + name;
		return GetNext().Request(ctx, c);
	}

	void Close(Context &ctx, const Connection &connection) override {
		log.push_back("close " + name);
		GetNext().Close(ctx, connection);
	}
};

} // anonymous namespace

static Connection
MakeConnection()
{
	return {"conn-1", {"client1", "veth0"}};
}

TEST(Chain, Empty)
{
	const auto chain = ChainBuilder{}.Build();
	EXPECT_EQ(chain->size(), 0U);

	auto connection = MakeConnection();
	connection.labels.emplace("app", "foo");

	Context ctx;
	const auto result = chain->Request(ctx, connection);
	EXPECT_EQ(result.id, "conn-1");
	EXPECT_EQ(result.mechanism.netns_url, "client1");
	EXPECT_EQ(result.mechanism.interface_name, "veth0");
	EXPECT_EQ(result.labels, connection.labels);

	chain->Close(ctx, MakeConnection());
}

TEST(Chain, Order)
{
	std::vector<std::string> log;

	ChainBuilder builder;
	builder.Emplace<NameElement>(log, "a");
	auto &b = builder.Emplace<NameElement>(log, "b");
	builder.Add(std::make_unique<NameElement>(log, "c"));

	const auto chain = builder.Build();
	EXPECT_EQ(chain->size(), 3U);

	Context ctx;
	const auto result = chain->Request(ctx, MakeConnection());
	EXPECT_EQ(result.id, "conn-1/a/b/c");

	chain->Close(ctx, MakeConnection());

	const std::vector<std::string> expected{
		"request a", "request b", "request c",
		"close a", "close b", "close c",
	};
	EXPECT_EQ(log, expected);

	/* the reference returned by the builder remains valid */
	log.clear();
	b.Close(ctx, MakeConnection());
	EXPECT_EQ(log, (std::vector<std::string>{"close b", "close c"}));
}

TEST(Chain, BuilderReuse)
{
	std::vector<std::string> log;

	ChainBuilder builder;
	builder.Emplace<NameElement>(log, "a");
	const auto first = builder.Build();

	builder.Emplace<NameElement>(log, "b");
	const auto second = builder.Build();

	EXPECT_EQ(first->size(), 1U);
	EXPECT_EQ(second->size(), 1U);

	Context ctx;
	EXPECT_EQ(second->Request(ctx, MakeConnection()).id, "conn-1/b");
}

TEST(Context, Cancel)
{
	std::stop_source stop_source;

	Context ctx;
	EXPECT_FALSE(ctx.IsCanceled());
	EXPECT_FALSE(ctx.IsClient());

	ctx.stop_token = stop_source.get_token();
	EXPECT_FALSE(ctx.IsCanceled());

	stop_source.request_stop();
	EXPECT_TRUE(ctx.IsCanceled());
}
