/******************************************************************************\
 * doorman_templates_unit_test.hpp - DOS template rendering unit tests
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>

#include "dos/Templates.hpp"

#include "TempDir.hpp"

// include google testing files
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class DoormanTemplatesUnitTest : public ::testing::Test
{
protected:
    TempDir m_tempDir;
    doorman::TemplateVars m_vars;

protected:
    DoormanTemplatesUnitTest();
    ~DoormanTemplatesUnitTest();
};
