// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// -----------------------------------------------------------------------------
// Environment variable names for runtime configuration overrides.
//
// These constants provide a single source of truth for environment variable
// names used to override configuration file values at runtime.
// -----------------------------------------------------------------------------

namespace conformance::env {

/// Path of the harness configuration file (read by the CLI)
constexpr const char* CONFIG = "CONFORMANCE_CONFIG";

/// Path of the JSON schema the configuration file is validated against (read by the CLI)
constexpr const char* CONFIG_SCHEMA = "CONFORMANCE_CONFIG_SCHEMA";

/// Environment variable for overriding log level (trace/debug/info/warn/error)
constexpr const char* LOG_LEVEL = "CONFORMANCE_LOG_LEVEL";

/// Environment variable for overriding the schema-spec fixture directory
constexpr const char* SPEC_DIR = "CONFORMANCE_SPEC_DIR";

/// Environment variable for overriding the data fixture directory
constexpr const char* DATA_DIR = "CONFORMANCE_DATA_DIR";

/// Environment variable for overriding the schema-definition meta-schema path
constexpr const char* META_SCHEMA = "CONFORMANCE_META_SCHEMA";

} // namespace conformance::env
