/******************************************************************************\
 * fleet_useful_unit_test.hpp - Configuration, logging and helper tests
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>

#include "remote/RemoteConfig.hpp"
#include "transfer/CopyTarget.hpp"
#include "useful/fleet_log.h"
#include "useful/fleet_wrappers.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

// The fixture for unit testing the helpers; restores the environment it changes
class FleetUsefulUnitTest : public ::testing::Test
{
protected: // interface
    FleetUsefulUnitTest();
    ~FleetUsefulUnitTest();
};
