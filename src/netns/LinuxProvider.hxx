// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Provider.hxx"
#include "UniqueHandle.hxx"

#include <string>

/**
 * The #NetnsProvider implementation for Linux: handles are file
 * descriptors of namespace files, switching is done with setns() and
 * interfaces are managed via rtnetlink (libnl).
 */
class LinuxNetnsProvider final : public NetnsProvider {
	/**
	 * Plain namespace names are looked up in this directory.
	 */
	const std::string netns_directory;

public:
	explicit LinuxNetnsProvider(std::string _netns_directory="/run/netns") noexcept
		:netns_directory(std::move(_netns_directory)) {}

	/* virtual methods from class NetnsProvider */
	UniqueNetnsHandle GetCurrent() override;
	UniqueNetnsHandle Open(const char *reference) override;
	bool Equals(NetnsHandle a, NetnsHandle b) const noexcept override;
	void SetCurrent(NetnsHandle handle) override;
	InterfaceRef FindInterface(const char *name) override;
	void MoveInterface(const InterfaceRef &interface,
			   NetnsHandle destination) override;
	bool Release(NetnsHandle handle) noexcept override;
};
