/******************************************************************************\
 * doorman_session_unit_test.cpp - Play session launch unit tests
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "doorman_defs.h"

#include <fstream>

#include "doorman_error.hpp"
#include "lock/LockFile.hpp"
#include "useful/dm_wrappers.hpp"

#include "doorman_session_unit_test.hpp"

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::MatchesRegex;
using ::testing::Pair;
using ::testing::Throw;

using namespace doorman;

std::string const* findValue(KeyValueList const& list, std::string const& key)
{
    for (auto&& [listKey, value] : list) {
        if (listKey == key) {
            return &value;
        }
    }
    return nullptr;
}

DoormanSessionUnitTest::DoormanSessionUnitTest()
    : m_rundir{}
    , m_doorDir{}
    , m_engine{}
    , m_door
        { .name = "lord"
        , .options =
            { .door_path = m_doorDir.path()
            , .max_nodes = 2
            , .launch_commands = "CD \\LORD\nSTART.BAT {{node}}"
            , .configure_commands = std::nullopt
            , .nightly_commands = std::nullopt
            }
    }
    , m_player{ .uid = 1001, .username = "bob", .display_name = "Bob", .is_sysop = false }
    , m_options{ .raw = false, .term = "vt100" }
{
}

DoormanSessionUnitTest::~DoormanSessionUnitTest()
{
}

std::unique_ptr<DoorSession> DoormanSessionUnitTest::makeSession(User const& user)
{
    return std::make_unique<DoorSession>(m_engine, m_rundir.path(), "dosemu:test", m_door, user);
}

TEST_F(DoormanSessionUnitTest, CurrentTime)
{
    EXPECT_THAT(currentTime(), MatchesRegex("[0-2][0-9]:[0-5][0-9]"));
}

TEST_F(DoormanSessionUnitTest, WorkspacePaths)
{
    EXPECT_EQ(Workspace::forNode("/run/doorman", "lord", 2).getPath(), "/run/doorman/lord.2");
    EXPECT_EQ(Workspace::forSysop("/run/doorman", "lord").getPath(), "/run/doorman/lord.sysop");
}

TEST_F(DoormanSessionUnitTest, WorkspaceReset)
{
    auto const workspace = Workspace::forNode(m_rundir.path(), "lord", 1);
    workspace.reset();
    { auto stale = std::ofstream{workspace.getPath() + "/STALE.TXT"};
        stale << "left over";
    }

    workspace.reset();
    EXPECT_TRUE(pathExists(workspace.getPath().c_str()));
    EXPECT_FALSE(pathExists((workspace.getPath() + "/STALE.TXT").c_str()));

    EXPECT_THROW(Workspace{m_rundir.join("missing/lord.1")}.write(BATCH_FILE, {}), IOError);
}

TEST_F(DoormanSessionUnitTest, Launch)
{
    auto session = makeSession(m_player);
    auto const nodeLock = nodeLockPath(m_rundir.path(), "lord", 1);
    auto const workspace = m_rundir.join("lord.1");

    EXPECT_CALL(m_engine, attach("c0ffee", LAUNCH_SCRIPT))
        .WillOnce(Invoke([&](std::string const&, std::string const&) {
            EXPECT_EQ(session->getState(), DoorSession::State::Attached);

            // node lock is free for the container, door lock is still shared
            EXPECT_FALSE(session->holdsNodeLock());
            EXPECT_TRUE(session->holdsDoorLock());
            EXPECT_TRUE(LockFile::open(nodeLock).tryLockExclusive());
            EXPECT_FALSE(LockFile::open(doorLockPath(m_rundir.path(), "lord")).tryLockExclusive());

            EXPECT_TRUE(pathExists((workspace + "/DOOR.SYS").c_str()));
            EXPECT_TRUE(pathExists((workspace + "/DOORMAN.BAT").c_str()));
            return 0;
        }));

    EXPECT_EQ(session->run(m_options), 0);
    EXPECT_EQ(session->getState(), DoorSession::State::Done);
    EXPECT_EQ(session->getNode(), 1);
    EXPECT_EQ(session->getContainerId(), "c0ffee");

    ASSERT_EQ(m_engine.m_runSpecs.size(), 1);
    auto const& spec = m_engine.m_runSpecs[0];
    EXPECT_TRUE(spec.detach);
    EXPECT_EQ(spec.image, "dosemu:test");
    EXPECT_EQ(spec.entrypoint, WAIT_FOR_LAUNCH_SCRIPT);
    EXPECT_THAT(spec.env, ElementsAre(Pair("TERM", "vt100"), Pair("DOORMAN_RAW", "0")));
    EXPECT_THAT(spec.volumes, ElementsAre
        ( Pair(workspace, CONTAINER_WORKSPACE_MOUNT)
        , Pair(m_doorDir.path(), CONTAINER_DOOR_MOUNT)
        , Pair(doorLockPath(m_rundir.path(), "lord"), CONTAINER_DOOR_LOCK_MOUNT)
        , Pair(nodeLock, CONTAINER_NODE_LOCK_MOUNT)
    ));
    EXPECT_THAT(spec.labels, ElementsAre
        ( Pair(LABEL_DOOR, "lord")
        , Pair(LABEL_NODE, "1")
        , Pair(LABEL_USER, "bob")
        , Pair(LABEL_RUNDIR, workspace)
    ));

    auto const batch = TempDir::readFile(workspace + "/DOORMAN.BAT");
    EXPECT_EQ(batch, "@ECHO OFF\r\nCD \\LORD\r\nSTART.BAT 1\r\n");

    auto const doorSys = TempDir::readFile(workspace + "/DOOR.SYS");
    EXPECT_THAT(doorSys, HasSubstr("\r\n1\r\n"));
    EXPECT_THAT(doorSys, HasSubstr("\r\nBob\r\n"));
}

TEST_F(DoormanSessionUnitTest, LaunchRaw)
{
    m_options.raw = true;
    EXPECT_CALL(m_engine, attach(_, _))
        .WillOnce(::testing::Return(2));

    auto session = makeSession(m_player);
    EXPECT_EQ(session->run(m_options), 2);

    ASSERT_EQ(m_engine.m_runSpecs.size(), 1);
    auto const raw = findValue(m_engine.m_runSpecs[0].env, DOORMAN_RAW_ENV_VAR);
    ASSERT_NE(raw, nullptr);
    EXPECT_EQ(*raw, "1");
}

TEST_F(DoormanSessionUnitTest, StaleWorkspaceRemoved)
{
    auto const workspace = m_rundir.join("lord.1");
    Workspace{workspace}.reset();
    { auto stale = std::ofstream{workspace + "/EXITINFO.BBS"};
        stale << "previous caller";
    }

    auto session = makeSession(m_player);
    session->run(m_options);

    EXPECT_FALSE(pathExists((workspace + "/EXITINFO.BBS").c_str()));
    EXPECT_TRUE(pathExists((workspace + "/DOOR.SYS").c_str()));
}

TEST_F(DoormanSessionUnitTest, LaunchFailed)
{
    EXPECT_CALL(m_engine, startDetached(_))
        .WillOnce(Throw(LaunchFailed{"podman exited with status 125"}));
    EXPECT_CALL(m_engine, attach(_, _))
        .Times(0);

    auto session = makeSession(m_player);
    EXPECT_THROW(session->run(m_options), LaunchFailed);
    EXPECT_EQ(session->getState(), DoorSession::State::Failed);
    EXPECT_THAT(session->getFailure(), HasSubstr("Starting container for lord failed"));
    EXPECT_THAT(session->getFailure(), HasSubstr("status 125"));
}

TEST_F(DoormanSessionUnitTest, DoorBusy)
{
    auto maintenance = LockFile::open(doorLockPath(m_rundir.path(), "lord"));
    ASSERT_TRUE(maintenance.tryLockExclusive());

    EXPECT_CALL(m_engine, startDetached(_))
        .Times(0);

    auto session = makeSession(m_player);
    ASSERT_THROW({
        try {
            session->run(m_options);
        } catch (std::exception& ex) {
            ASSERT_STREQ("Sorry, lord is currently undergoing maintenance.", ex.what());
            throw;
        }
    }, DoorBusy);
    EXPECT_EQ(session->getState(), DoorSession::State::Failed);
    EXPECT_FALSE(session->holdsDoorLock());
}

TEST_F(DoormanSessionUnitTest, AllNodesBusy)
{
    auto node1 = LockFile::open(nodeLockPath(m_rundir.path(), "lord", 1));
    auto node2 = LockFile::open(nodeLockPath(m_rundir.path(), "lord", 2));
    ASSERT_TRUE(node1.tryLockExclusive());
    ASSERT_TRUE(node2.tryLockExclusive());

    EXPECT_CALL(m_engine, startDetached(_))
        .Times(0);

    auto session = makeSession(m_player);
    EXPECT_THROW(session->run(m_options), AllNodesBusy);
    EXPECT_EQ(session->getState(), DoorSession::State::Failed);
}

TEST_F(DoormanSessionUnitTest, PlayersFillNodes)
{
    // each running container keeps its mounted node lock
    auto containerLocks = std::vector<LockFile>{};
    ON_CALL(m_engine, attach(_, _))
        .WillByDefault(Invoke([&](std::string const&, std::string const&) {
            auto const node = static_cast<int>(containerLocks.size()) + 1;
            containerLocks.push_back(LockFile::open(nodeLockPath(m_rundir.path(), "lord", node)));
            EXPECT_TRUE(containerLocks.back().tryLockExclusive());
            return 0;
        }));

    auto alice = makeSession(User{ 1000, "alice", "Alice", false });
    EXPECT_EQ(alice->run(m_options), 0);
    EXPECT_EQ(alice->getNode(), 1);

    auto bob = makeSession(m_player);
    EXPECT_EQ(bob->run(m_options), 0);
    EXPECT_EQ(bob->getNode(), 2);

    auto carol = makeSession(User{ 1002, "carol", "Carol", false });
    EXPECT_THROW(carol->run(m_options), AllNodesBusy);

    // players hold the door shared, so maintenance can't start
    auto sysop = User{ 0, "root", "Sysop", true };
    m_door.options.nightly_commands = "MAINT.EXE";
    auto nightly = Maintenance{m_engine, m_rundir.path(), "dosemu:test", m_door, sysop, Maintenance::Command::Nightly};
    EXPECT_THROW(nightly.run(true), DoorBusy);

    // the first player leaves
    containerLocks[0].unlock();
    alice.reset();

    auto dave = makeSession(User{ 1003, "dave", "Dave", false });
    EXPECT_NO_THROW(dave->run(m_options));
    EXPECT_EQ(dave->getNode(), 1);
}

TEST_F(DoormanSessionUnitTest, NodeReusedWithoutContainerLock)
{
    // the node lock is released before attach; a container that does not
    // take its mounted node lock leaves the slot claimable
    auto first = makeSession(m_player);
    first->run(m_options);
    EXPECT_EQ(first->getNode(), 1);

    auto second = makeSession(User{ 1000, "alice", "Alice", false });
    second->run(m_options);
    EXPECT_EQ(second->getNode(), 1);
}
