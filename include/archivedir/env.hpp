#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace archivedir::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);
std::optional<std::uint64_t> GetUnsigned(std::string_view name);

}  // namespace archivedir::env
