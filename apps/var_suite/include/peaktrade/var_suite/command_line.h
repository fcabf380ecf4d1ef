#pragma once

#include "peaktrade/core/config.h"
#include "peaktrade/var_suite/suite_config.h"

#include <kj/common.h>
#include <kj/string.h>

namespace peaktrade::var_suite {

/**
 * @brief Parse command-line arguments (program name excluded)
 *
 * Values from --config are applied first, so explicit flags win. Both
 * "--flag value" and "--flag=value" are accepted.
 *
 * @throws ValidationException on unknown flags, missing or malformed values
 * @throws ConfigException if the --config file cannot be loaded
 */
[[nodiscard]] SuiteConfig parse_command_line(kj::ArrayPtr<const kj::StringPtr> args);

/**
 * @brief Overlay recognised keys of a JSON configuration
 * @throws ConfigException on unknown keys or values of the wrong type
 */
void apply_config(SuiteConfig& config, const core::Config& source);

/**
 * @brief Cross-field checks that need the complete configuration
 * @throws ValidationException describing the first problem found
 */
void validate_config(const SuiteConfig& config);

[[nodiscard]] kj::StringPtr usage_text();

} // namespace peaktrade::var_suite
