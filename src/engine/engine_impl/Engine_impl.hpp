/******************************************************************************\
 * Engine_impl.hpp - Common includes for derived container engine implementations.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include "Podman/Engine.hpp"
#include "Docker/Engine.hpp"
