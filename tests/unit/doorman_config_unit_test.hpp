/******************************************************************************\
 * doorman_config_unit_test.hpp - Configuration file unit tests
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <optional>
#include <string>

#include "config/Config.hpp"

#include "TempDir.hpp"

// include google testing files
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class DoormanConfigUnitTest : public ::testing::Test
{
protected:
    TempDir m_tempDir;

    // saved environment, restored on teardown
    std::optional<std::string> m_home;
    std::optional<std::string> m_runtimeDir;

protected:
    DoormanConfigUnitTest();
    ~DoormanConfigUnitTest();

    // Parse configuration text
    doorman::Config parseString(std::string const& text);
};
