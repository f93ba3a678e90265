/******************************************************************************\
 * doorman_engine_unit_test.cpp - Container engine unit tests
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "doorman_defs.h"

#include <sstream>

#include "config/Config.hpp"
#include "doorman_error.hpp"

#include "doorman_engine_unit_test.hpp"

using ::testing::ElementsAre;
using ::testing::ElementsAreArray;

using namespace doorman;

std::vector<std::string> argvStrings(ManagedArgv const& argv)
{
    return argv.strings();
}

DoormanEngineUnitTest::DoormanEngineUnitTest()
    : m_tempDir{}
    , m_runSpec
        { .detach = true
        , .env = { { "TERM", "vt100" }, { "DOORMAN_RAW", "0" } }
        , .volumes = { { "/run/doorman/lord.1", CONTAINER_WORKSPACE_MOUNT }, { "/srv/lord", CONTAINER_DOOR_MOUNT } }
        , .labels = { { LABEL_DOOR, "lord" }, { LABEL_NODE, "1" } }
        , .image = "dosemu:test"
        , .entrypoint = WAIT_FOR_LAUNCH_SCRIPT
    }
{
}

DoormanEngineUnitTest::~DoormanEngineUnitTest()
{
}

std::string DoormanEngineUnitTest::writeEngine(std::string const& name, std::string const& body)
{
    return m_tempDir.writeScript(name, body);
}

static Config makeConfig(std::string const& body)
{
    auto input = std::stringstream{body};
    return Config::parse(input, "engine.json");
}

/******************************************
*            ARGUMENT BUILDING            *
******************************************/

TEST_F(DoormanEngineUnitTest, PodmanRootfulRun)
{
    auto const engine = PodmanEngine{"/usr/bin/podman", 1000, 100, "/run/doorman", false};

    EXPECT_THAT(argvStrings(engine.buildRunArgs(m_runSpec)), ElementsAreArray(
        { "/usr/bin/podman", "run", "-d", "--user=1000:100"
        , "--tmpfs=/run/user", "--tmpfs=/tmp", "--tmpfs=/var/tmp"
        , "-v", "/run/doorman/lord.1:/mnt/doorman", "-v", "/srv/lord:/mnt/door"
        , "-e", "TERM=vt100", "-e", "DOORMAN_RAW=0"
        , "-l", "doorman.door=lord", "-l", "doorman.node=1"
        , "dosemu:test", "wait-for-launch.sh"
    }));
}

TEST_F(DoormanEngineUnitTest, PodmanRootlessRun)
{
    auto const engine = PodmanEngine{"/usr/bin/podman", 1000, 100, "/run/doorman", true};
    EXPECT_TRUE(engine.rootlessMode());

    m_runSpec.detach = false;
    m_runSpec.env.clear();
    m_runSpec.volumes.clear();
    m_runSpec.labels = { { LABEL_DOOR, "lord" } };
    m_runSpec.entrypoint = "nightly.sh";

    EXPECT_THAT(argvStrings(engine.buildRunArgs(m_runSpec)), ElementsAreArray(
        { "/usr/bin/podman"
        , "--root=/run/doorman/podman", "--runroot=/run/doorman/podman-run", "--cgroup-manager=cgroupfs"
        , "run", "-t", "-i", "--user=1000:100"
        , "--tmpfs=/run/user", "--tmpfs=/tmp", "--tmpfs=/var/tmp"
        , "-l", "doorman.door=lord"
        , "--userns=keep-id", "--passwd=false"
        , "dosemu:test", "nightly.sh"
    }));
}

TEST_F(DoormanEngineUnitTest, PodmanRootlessExecPs)
{
    auto const engine = PodmanEngine{"/usr/bin/podman", 1000, 100, "/run/doorman", true};

    EXPECT_THAT(argvStrings(engine.buildExecArgs("c0ffee", LAUNCH_SCRIPT)), ElementsAre(
        "/usr/bin/podman"
        , "--root=/run/doorman/podman", "--runroot=/run/doorman/podman-run", "--cgroup-manager=cgroupfs"
        , "exec", "-t", "-i", "c0ffee", "launch.sh"));

    EXPECT_THAT(argvStrings(engine.buildPsArgs(std::string{"lord"})), ElementsAre(
        "/usr/bin/podman"
        , "--root=/run/doorman/podman", "--runroot=/run/doorman/podman-run", "--cgroup-manager=cgroupfs"
        , "ps", "--format=json", "--filter=label=doorman.door=lord"));
}

TEST_F(DoormanEngineUnitTest, DockerArgs)
{
    auto const engine = DockerEngine{"/usr/bin/docker", 0, 0};
    EXPECT_EQ(engine.getEngineType(), EngineType::Docker);
    EXPECT_FALSE(engine.rootlessMode());

    auto const runArgs = argvStrings(engine.buildRunArgs(m_runSpec));
    ASSERT_EQ(runArgs.size(), 21);
    EXPECT_EQ(runArgs[1], "run");
    EXPECT_EQ(runArgs[3], "--user=0:0");
    EXPECT_EQ(runArgs[20], "wait-for-launch.sh");

    EXPECT_THAT(argvStrings(engine.buildExecArgs("c0ffee", LAUNCH_SCRIPT)), ElementsAre(
        "/usr/bin/docker", "exec", "-t", "-i", "c0ffee", "launch.sh"));

    EXPECT_THAT(argvStrings(engine.buildPsArgs(std::nullopt)), ElementsAre(
        "/usr/bin/docker", "ps", "--format=json", "--filter=label=doorman.door"));

    EXPECT_THAT(argvStrings(engine.buildCommand("info")), ElementsAre("/usr/bin/docker", "info"));
}

/******************************************
*                DETECTION                *
******************************************/

TEST_F(DoormanEngineUnitTest, ParseRootless)
{
    EXPECT_TRUE(PodmanEngine::parseRootless(R"({ "host": { "security": { "rootless": true } } })"));
    EXPECT_FALSE(PodmanEngine::parseRootless(R"({ "host": { "security": { "rootless": false } } })"));
    EXPECT_THROW(PodmanEngine::parseRootless(R"({ "host": {} })"), std::exception);
    EXPECT_THROW(PodmanEngine::parseRootless("Error: cannot connect"), std::exception);
}

TEST_F(DoormanEngineUnitTest, DetectRootless)
{
    EXPECT_FALSE(PodmanEngine::detectRootless(m_tempDir.join("missing")));

    auto const rootless = writeEngine("podman", R"(echo '{ "host": { "security": { "rootless": true } } }')");
    EXPECT_TRUE(PodmanEngine::detectRootless(rootless));

    auto const failing = writeEngine("podman-fail", R"(echo '{ "host": { "security": { "rootless": true } } }'; exit 125)");
    EXPECT_FALSE(PodmanEngine::detectRootless(failing));
}

TEST_F(DoormanEngineUnitTest, DetectEngineType)
{
    auto const podman = writeEngine("podman", "echo 'podman version 4.3.1'");
    EXPECT_EQ(detectEngineType(podman), EngineType::Podman);

    auto const docker = writeEngine("docker", "echo 'Docker version 20.10.21, build baeda1f'");
    EXPECT_EQ(detectEngineType(docker), EngineType::Docker);

    auto const nerdctl = writeEngine("nerdctl", "echo 'nerdctl version 1.0.0'");
    EXPECT_THROW(detectEngineType(nerdctl), UnknownEngine);

    EXPECT_THROW(detectEngineType(m_tempDir.join("missing")), UnknownEngine);
}

TEST_F(DoormanEngineUnitTest, MakeEngineConfigured)
{
    auto const podman = writeEngine("podman",
        "if [ \"$1\" = --version ]; then echo 'podman version 4.3.1'; exit 0; fi\n"
        "echo '{ \"host\": { \"security\": { \"rootless\": true } } }'");

    // detected from podman info
    { auto const engine = make_Engine(makeConfig(R"({ "doorman": { "rundir": "/run/doorman" },
            "container": { "engine_path": ")" + podman + R"(" } })"), 1000, 100);
        EXPECT_EQ(engine->getEngineType(), EngineType::Podman);
        EXPECT_EQ(engine->getEnginePath(), podman);
        EXPECT_TRUE(engine->rootlessMode());
    }

    // configured override wins
    { auto const engine = make_Engine(makeConfig(R"({ "doorman": { "rundir": "/run/doorman" },
            "container": { "engine_path": ")" + podman + R"(", "rootless_podman": false } })"), 1000, 100);
        EXPECT_FALSE(engine->rootlessMode());
    }

    auto const docker = writeEngine("docker", "echo 'Docker version 24.0.5, build ced0996'");
    { auto const engine = make_Engine(makeConfig(R"({ "container": { "engine_path": ")" + docker
            + R"(", "rootless_podman": true } })"), 1000, 100);
        EXPECT_EQ(engine->getEngineType(), EngineType::Docker);
        EXPECT_FALSE(engine->rootlessMode());
    }

    EXPECT_THROW(make_Engine(makeConfig(R"({ "container": { "engine_path": ")"
        + m_tempDir.join("missing") + R"(" } })"), 1000, 100), UnknownEngine);
}

/******************************************
*            PROCESS BOUNDARY             *
******************************************/

TEST_F(DoormanEngineUnitTest, StartDetached)
{
    auto const started = writeEngine("podman", "echo c0ffee");
    auto engine = PodmanEngine{started, 1000, 100, "/run/doorman", false};
    EXPECT_EQ(engine.startDetached(m_runSpec), "c0ffee");

    auto const failed = writeEngine("podman-fail", "exit 125");
    auto failedEngine = PodmanEngine{failed, 1000, 100, "/run/doorman", false};
    EXPECT_THROW(failedEngine.startDetached(m_runSpec), LaunchFailed);

    auto const silent = writeEngine("podman-silent", "exit 0");
    auto silentEngine = PodmanEngine{silent, 1000, 100, "/run/doorman", false};
    EXPECT_THROW(silentEngine.startDetached(m_runSpec), LaunchFailed);
}

TEST_F(DoormanEngineUnitTest, AttachAndSpawn)
{
    // exit status is the last argument: the attach command or the entrypoint
    auto const script = writeEngine("docker", "for last; do :; done; exit \"$last\"");
    auto engine = DockerEngine{script, 1000, 100};

    EXPECT_EQ(engine.attach("c0ffee", "7"), 7);

    m_runSpec.detach = false;
    m_runSpec.entrypoint = "3";
    auto child = engine.spawnAttached(m_runSpec);
    ASSERT_NE(child, nullptr);
    EXPECT_EQ(child->wait(), 3);
}

TEST_F(DoormanEngineUnitTest, ListContainers)
{
    auto const listing = writeEngine("podman", "echo '[]'");
    auto engine = PodmanEngine{listing, 1000, 100, "/run/doorman", false};
    EXPECT_EQ(engine.listContainers(std::nullopt), "[]\n");

    auto const failed = writeEngine("podman-fail", "exit 2");
    auto failedEngine = PodmanEngine{failed, 1000, 100, "/run/doorman", false};
    EXPECT_THROW(failedEngine.listContainers(std::string{"lord"}), IOError);
}
