// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FileDescriptor.hxx"

#include <fcntl.h>
#include <unistd.h>

bool
FileDescriptor::Open(FileDescriptor dir, const char *pathname,
		     int flags, mode_t mode) noexcept
{
	fd = ::openat(dir.Get(), pathname, flags | O_NOCTTY | O_CLOEXEC, mode);
	return IsDefined();
}

bool
FileDescriptor::Open(const char *pathname, int flags, mode_t mode) noexcept
{
	return Open(FileDescriptor(AT_FDCWD), pathname, flags, mode);
}

bool
FileDescriptor::Close() noexcept
{
	return ::close(Steal()) == 0;
}

ssize_t
FileDescriptor::Read(void *buffer, std::size_t length) const noexcept
{
	return ::read(fd, buffer, length);
}
