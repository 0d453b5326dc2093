/******************************************************************************\
 * RemoteSession.hpp - Mock remote sessions and session factory
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <memory>
#include <string>

#include "gmock/gmock.h"

#include "remote/RemoteSession.hpp"

class MockSession : public fleet::RemoteSession
{
public: // types
	using Nice = ::testing::NiceMock<MockSession>;

public: // mock constructor
	MockSession();
	virtual ~MockSession() = default;

public: // inherited interface
	MOCK_METHOD1(exec, std::string(std::string const&));
};

class MockSessionFactory : public fleet::SessionFactory
{
public: // types
	using Nice = ::testing::NiceMock<MockSessionFactory>;

public: // mock constructor
	MockSessionFactory() = default;
	virtual ~MockSessionFactory() = default;

public: // inherited interface
	MOCK_METHOD1(open, std::unique_ptr<fleet::RemoteSession>(std::string const&));
};
