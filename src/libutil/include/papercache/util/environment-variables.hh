#pragma once
///@file

#include "papercache/util/types.hh"

#include <optional>

namespace papercache {

std::optional<std::string> getEnv(const std::string & key);

/**
 * Like `getEnv()`, but a variable set to "" counts as unset.
 */
std::optional<std::string> getEnvNonEmpty(const std::string & key);

/**
 * Set (or replace) an environment variable.
 */
void setEnv(const char * name, const char * value);

} // namespace papercache
