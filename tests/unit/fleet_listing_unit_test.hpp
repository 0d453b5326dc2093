/******************************************************************************\
 * fleet_listing_unit_test.hpp - Directory listing, comparison and size tests
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <memory>

#include "remote/HostRegistry.hpp"
#include "transfer/DirectoryListing.hpp"

#include "FakeFleet.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

// Shared setup for tests that run against scripted machines
class FleetFakeFleetTest : public ::testing::Test
{
protected: // variables
    std::shared_ptr<FakeFleet> fakeFleet;
    fleet::HostRegistry registry;

protected: // interface
    FleetFakeFleetTest();
    ~FleetFakeFleetTest();
};

// The fixture for unit testing listing parsing, comparison and sizes
class FleetListingUnitTest : public FleetFakeFleetTest
{
protected: // variables
    std::shared_ptr<fleet::Host> source;
    std::shared_ptr<fleet::Host> destination;

protected: // interface
    FleetListingUnitTest();
    ~FleetListingUnitTest();
};
