/******************************************************************************\
 * fleet_copy_unit_test.cpp - Copy chain orchestration tests
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "fleet_defs.h"

#include <algorithm>

#include <boost/algorithm/string/predicate.hpp>

#include "useful/fleet_error.hpp"

#include "fleet_copy_unit_test.hpp"

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

FleetCopyUnitTest::FleetCopyUnitTest()
    : source{registry.resolve("A")}
    , relay{registry.resolve("B")}
    , tail{registry.resolve("C")}
{
    fakeFleet->addFile("A", "/data/x", 100);
}

FleetCopyUnitTest::~FleetCopyUnitTest()
{}

// True if any command run on address contains text
static bool
ranCommandContaining(FakeFleet const& fakeFleet, std::string const& address, std::string const& text)
{
    auto const commands = fakeFleet.getCommands(address);
    return std::any_of(commands.begin(), commands.end(), [&text](std::string const& command) {
        return boost::algorithm::contains(command, text);
    });
}

/******************************************
*          CHAIN CONSTRUCTION TESTS       *
******************************************/

// Tail listens first, then the relay pipe and listener, then the source sends
TEST_F(FleetCopyUnitTest, ChainOrdering)
{
    source->copyChain("/data", {relay, tail});

    EXPECT_THAT(fakeFleet->getEvents(), ElementsAre(
        "C listening 7000",
        "B pipe /data/fifo7000",
        "B listening 7000",
        "A send 7000"));

    auto const expected = fleet::DirectoryListing{{"x", fleet::EntrySize::file(100)}};
    EXPECT_EQ(relay->listDirectory("/data"), expected);
    EXPECT_EQ(tail->listDirectory("/data"), expected);
}

TEST_F(FleetCopyUnitTest, ChainCommands)
{
    source->copyChain("/data", {relay, tail});

    EXPECT_TRUE(ranCommandContaining(*fakeFleet, "C", "cd /data/ && nc -l 7000 | pigz -d | tar xvf -"));
    EXPECT_TRUE(ranCommandContaining(*fakeFleet, "B", "cd /data/ && mkfifo fifo7000 && nc C 7000 <fifo7000 && rm fifo7000"));
    EXPECT_TRUE(ranCommandContaining(*fakeFleet, "B", "cd /data/ && nc -l 7000 | tee fifo7000 | pigz -d | tar xvf -"));
    EXPECT_TRUE(ranCommandContaining(*fakeFleet, "A", "cd /data/ && tar vc . | pigz | nc B 7000"));
    EXPECT_TRUE(ranCommandContaining(*fakeFleet, "B", "mkdir -p /data/"));
    EXPECT_TRUE(ranCommandContaining(*fakeFleet, "A", "which pigz"));
}

TEST_F(FleetCopyUnitTest, SingleDestination)
{
    source->copyChain("/data", {tail});

    EXPECT_THAT(fakeFleet->getEvents(), ElementsAre("C listening 7000", "A send 7000"));
    EXPECT_TRUE(fakeFleet->hasFile("C", "/data/x", 100));
    EXPECT_FALSE(ranCommandContaining(*fakeFleet, "C", "mkfifo"));
}

TEST_F(FleetCopyUnitTest, DestinationDirectoryOverride)
{
    source->copyChain("/data", {{relay, "/backup"}, tail});

    EXPECT_TRUE(fakeFleet->hasFile("B", "/backup/x", 100));
    EXPECT_TRUE(fakeFleet->hasFile("C", "/data/x", 100));
}

TEST_F(FleetCopyUnitTest, RequestedFilesOnly)
{
    fakeFleet->addFile("A", "/data/y", 3);
    fakeFleet->addFile("A", "/data/sub/z", 7);

    auto options = fleet::CopyOptions{};
    options.files = {"x", "sub"};
    source->copyChain("/data", {tail}, options);

    EXPECT_TRUE(fakeFleet->hasFile("C", "/data/x", 100));
    EXPECT_TRUE(fakeFleet->hasFile("C", "/data/sub/z", 7));
    EXPECT_FALSE(fakeFleet->hasFile("C", "/data/y", 3));
    EXPECT_TRUE(ranCommandContaining(*fakeFleet, "A", "tar vc x sub | pigz"));
}

TEST_F(FleetCopyUnitTest, PortOption)
{
    auto options = fleet::CopyOptions{};
    options.port = 7100;
    source->copyChain("/data", {relay, tail}, options);

    EXPECT_THAT(fakeFleet->getEvents(), ElementsAre(
        "C listening 7100",
        "B pipe /data/fifo7100",
        "B listening 7100",
        "A send 7100"));
}

/******************************************
*            PRE-FLIGHT TESTS             *
******************************************/

// Dangerous paths are refused before any remote command runs
TEST_F(FleetCopyUnitTest, SuspiciousPathsRejected)
{
    EXPECT_THROW(source->copyChain("/data", {relay, {tail, "/"}}), fleet::SafetyError);
    EXPECT_THROW(source->copyChain("/data", {{relay, "/data/../etc"}}), fleet::SafetyError);
    EXPECT_THROW(source->copyChain("/data", {{relay, "/data/./x"}}), fleet::SafetyError);
    EXPECT_THROW(source->copyChain("/", {relay}), fleet::SafetyError);
    EXPECT_THROW(source->copyChain("", {relay}), fleet::SafetyError);

    try {
        source->copyChain("/data", {{relay, "/srv/.."}});
        FAIL() << "expected SafetyError";
    } catch (fleet::SafetyError const& ex) {
        EXPECT_THAT(ex.what(), HasSubstr("B:/srv/../ looks suspicious"));
    }

    EXPECT_THAT(fakeFleet->getCommands("A"), IsEmpty());
    EXPECT_THAT(fakeFleet->getCommands("B"), IsEmpty());
    EXPECT_THAT(fakeFleet->getCommands("C"), IsEmpty());
}

TEST_F(FleetCopyUnitTest, NoTargetsRejected)
{
    EXPECT_THROW(source->copyChain("/data", {}), fleet::SafetyError);
    EXPECT_THAT(fakeFleet->getCommands("A"), IsEmpty());
}

// Only destination directories must be safe to write into
TEST_F(FleetCopyUnitTest, RootSourceWithDestinationOverride)
{
    fakeFleet->addFile("A", "/etc/my.cnf", 12);

    auto options = fleet::CopyOptions{};
    options.files = {"etc"};
    EXPECT_NO_THROW(source->copyChain("/", {{tail, "/backup"}}, options));

    EXPECT_TRUE(fakeFleet->hasFile("C", "/backup/etc/my.cnf", 12));
    EXPECT_FALSE(fakeFleet->hasFile("C", "/backup/data/x", 100));
}

// Requested names may contain dots but never climb out of the base directory
TEST_F(FleetCopyUnitTest, RequestedFileComponentsChecked)
{
    auto options = fleet::CopyOptions{};
    options.files = {"../etc"};
    EXPECT_THROW(source->copyChain("/data", {tail}, options), fleet::SafetyError);
    options.files = {"sub/../../etc"};
    EXPECT_THROW(source->copyChain("/data", {tail}, options), fleet::SafetyError);
    EXPECT_THAT(fakeFleet->getCommands("C"), IsEmpty());

    fakeFleet->addFile("A", "/data/binlog..old", 4);
    options.files = {"binlog..old"};
    EXPECT_NO_THROW(source->copyChain("/data", {tail}, options));
    EXPECT_TRUE(fakeFleet->hasFile("C", "/data/binlog..old", 4));
}

TEST_F(FleetCopyUnitTest, ExistingDataRefused)
{
    fakeFleet->addFile("C", "/data/x", 50);

    try {
        source->copyChain("/data", {relay, tail});
        FAIL() << "expected SafetyError";
    } catch (fleet::SafetyError const& ex) {
        EXPECT_THAT(ex.what(), HasSubstr("File x exists on C"));
    }

    EXPECT_THAT(fakeFleet->getEvents(), IsEmpty());
    EXPECT_FALSE(ranCommandContaining(*fakeFleet, "B", "nc -l"));
    EXPECT_TRUE(fakeFleet->hasFile("C", "/data/x", 50));
}

// Empty files and directories do not count as existing data
TEST_F(FleetCopyUnitTest, EmptyEntriesAllowed)
{
    fakeFleet->addFile("C", "/data/x", 0);
    fakeFleet->addDirectory("C", "/data/logs");

    EXPECT_NO_THROW(source->copyChain("/data", {tail}));
    EXPECT_TRUE(fakeFleet->hasFile("C", "/data/x", 100));
}

TEST_F(FleetCopyUnitTest, OverwriteAllowed)
{
    fakeFleet->addFile("C", "/data/x", 50);

    auto options = fleet::CopyOptions{};
    options.overwrite = true;
    EXPECT_NO_THROW(source->copyChain("/data", {relay, tail}, options));
    EXPECT_TRUE(fakeFleet->hasFile("C", "/data/x", 100));
}

TEST_F(FleetCopyUnitTest, MissingCompressorRefused)
{
    fakeFleet->removeTool("C", "pigz");

    try {
        source->copyChain("/data", {relay, tail});
        FAIL() << "expected SafetyError";
    } catch (fleet::SafetyError const& ex) {
        EXPECT_THAT(ex.what(), HasSubstr("pigz not installed on C"));
    }
    EXPECT_THAT(fakeFleet->getEvents(), IsEmpty());
}

/******************************************
*       READINESS AND VERIFICATION        *
******************************************/

// A listener that never comes up aborts before anything is sent
TEST_F(FleetCopyUnitTest, ListenerTimeoutAborts)
{
    fakeFleet->setReadyWait(std::chrono::milliseconds{50});
    fakeFleet->setNeverListens("C");

    EXPECT_THROW(source->copyChain("/data", {relay, tail}), fleet::ReadinessTimeout);

    EXPECT_THAT(fakeFleet->getEvents(), IsEmpty());
    EXPECT_FALSE(ranCommandContaining(*fakeFleet, "B", "mkfifo"));
    EXPECT_FALSE(ranCommandContaining(*fakeFleet, "A", "tar vc"));
}

// A destination that did not receive the data fails verification
TEST_F(FleetCopyUnitTest, VerificationFailure)
{
    fakeFleet->setDropReceivedFiles("C");

    try {
        source->copyChain("/data", {relay, tail});
        FAIL() << "expected VerificationError";
    } catch (fleet::VerificationError const& ex) {
        EXPECT_THAT(ex.what(), HasSubstr("A:/data/x"));
        EXPECT_THAT(ex.what(), HasSubstr("C:/data/x"));
        EXPECT_THAT(ex.what(), HasSubstr("(size: 100 vs MISSING)"));
    }

    EXPECT_TRUE(fakeFleet->hasFile("B", "/data/x", 100));
}
