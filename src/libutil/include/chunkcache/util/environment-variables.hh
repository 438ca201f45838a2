#pragma once
///@file

#include <optional>
#include <string>

namespace chunkcache {

std::optional<std::string> getEnv(const std::string & key);

/**
 * Like `getEnv`, but an empty value counts as unset.
 */
std::optional<std::string> getEnvNonEmpty(const std::string & key);

/**
 * `setenv(3)` with overwrite. Returns -1 and sets `errno` on failure.
 */
int setEnv(const char * name, const char * value);

} // namespace chunkcache
