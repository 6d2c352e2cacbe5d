// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

/**
 * Base class for all errors of the interface relocation code.
 */
class InjectError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;

	/**
	 * Throw a new exception of the same class with the given
	 * message, with the exception currently being handled nested
	 * inside.  This adds context while keeping the error
	 * category.  Must be called from within a catch block.
	 */
	[[noreturn]]
	virtual void ThrowNested(std::string &&msg) const = 0;
};

template<typename T, typename Base=InjectError>
class BasicInjectError : public Base {
public:
	using Base::Base;

	[[noreturn]]
	void ThrowNested(std::string &&msg) const override {
		std::throw_with_nested(T{std::move(msg)});
	}
};

/**
 * A network namespace handle could not be obtained.  Nothing has been
 * changed yet.
 */
class AcquisitionError : public BasicInjectError<AcquisitionError> {
public:
	using BasicInjectError::BasicInjectError;
};

/**
 * Switching the calling thread to another network namespace failed.
 */
class SwitchError : public BasicInjectError<SwitchError> {
public:
	using BasicInjectError::BasicInjectError;
};

/**
 * The network interface does not exist in the namespace it was
 * expected in.
 */
class LookupError : public BasicInjectError<LookupError> {
public:
	using BasicInjectError::BasicInjectError;
};

/**
 * The kernel refused to move the network interface to another
 * namespace.  This is a kind of #SwitchError because the interface's
 * namespace membership could not be switched.
 */
class RelocationError : public BasicInjectError<RelocationError, SwitchError> {
public:
	using BasicInjectError::BasicInjectError;
};

/**
 * Switching back to the home namespace failed; the namespace of the
 * thread which attempted it is unknown.  This must never be
 * retried, and the thread must not be used any further.
 */
class UnrecoverableStateError : public BasicInjectError<UnrecoverableStateError> {
public:
	using BasicInjectError::BasicInjectError;
};

/**
 * The successor in the element chain has failed.  The original
 * exception is nested.
 */
class DelegationError : public BasicInjectError<DelegationError> {
public:
	using BasicInjectError::BasicInjectError;
};
