// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// -----------------------------------------------------------------------------
// Build metadata. CMake injects the real values through compile definitions;
// the fallbacks keep IDE builds and standalone tooling working.
// -----------------------------------------------------------------------------

#ifndef CONFORMANCE_SERVICE_NAME
    #define CONFORMANCE_SERVICE_NAME "conformance-harness"
#endif

#ifndef CONFORMANCE_SERVICE_VERSION
    #define CONFORMANCE_SERVICE_VERSION "0.0.0"
#endif

#ifndef CONFORMANCE_GIT_COMMIT
    #define CONFORMANCE_GIT_COMMIT "unknown"
#endif

namespace conformance {

constexpr const char* SERVICE_NAME = CONFORMANCE_SERVICE_NAME;
constexpr const char* SERVICE_VERSION = CONFORMANCE_SERVICE_VERSION;
constexpr const char* GIT_COMMIT = CONFORMANCE_GIT_COMMIT;

} // namespace conformance
