// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

/**
 * Skips whitespace at the beginning of the string, and returns the
 * first non-whitespace character.  If the string has no
 * non-whitespace characters, then a pointer to the NULL terminator is
 * returned.
 */
[[gnu::returns_nonnull]] [[gnu::pure]] [[gnu::nonnull]]
const char *
StripLeft(const char *p) noexcept;

[[gnu::returns_nonnull]] [[gnu::pure]] [[gnu::nonnull]]
static inline char *
StripLeft(char *p) noexcept
{
	return const_cast<char *>(StripLeft((const char *)p));
}

/**
 * Skips whitespace at the end of the string, and truncates it by
 * writing a null terminator.
 */
[[gnu::nonnull]]
void
StripRight(char *p) noexcept;
