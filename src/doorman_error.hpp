/******************************************************************************\
 * doorman_error.hpp - Exception types reported by the door session manager.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <stdexcept>
#include <string>

namespace doorman {

// Bad or missing configuration, unknown door, no usable container engine
struct ConfigurationError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Container engine binary did not identify itself as podman or docker
struct UnknownEngine : public ConfigurationError {
    using ConfigurationError::ConfigurationError;
};

// Maintenance operation has no command template for the door
struct NotConfigured : public ConfigurationError {
    using ConfigurationError::ConfigurationError;
};

// Caller is not a sysop
struct PermissionDenied : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Door lock is held in a conflicting mode (maintenance vs. play)
struct DoorBusy : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Every node slot of the door is locked
struct AllNodesBusy : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Container did not start, or its id could not be read
struct LaunchFailed : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Lock file, workspace or child process I/O failure
struct IOError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

} /* namespace doorman */
