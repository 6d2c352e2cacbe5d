// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(ExceptionTest, RuntimeError)
{
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(std::runtime_error("Foo"))), "Foo");
}

TEST(ExceptionTest, DerivedError)
{
	class DerivedError : public std::runtime_error {
	public:
		explicit DerivedError(const char *_msg)
			:std::runtime_error(_msg) {}
	};

	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(DerivedError("Foo"))), "Foo");
}

static std::exception_ptr
MakeNested()
{
	try {
		try {
			throw std::runtime_error("Inner");
		} catch (...) {
			std::throw_with_nested(std::runtime_error("Outer"));
		}
	} catch (...) {
		return std::current_exception();
	}
}

TEST(ExceptionTest, Nested)
{
	ASSERT_EQ(GetFullMessage(MakeNested()), "Outer; Inner");
	ASSERT_EQ(GetFullMessage(MakeNested(), "Unknown", ": "), "Outer: Inner");
}

TEST(ExceptionTest, Unknown)
{
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(42)), "Unknown exception");
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(42), "Foo"), "Foo");
}
