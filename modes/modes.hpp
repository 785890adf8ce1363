#pragma once
#include <vector>
#include <string>

#include "../core/errors.hpp"

namespace kravgen::modes {

using Args = std::vector<std::string>;

Status vectors_cmd(const Args& args);
Status digest_cmd(const Args& args);

} // namespace kravgen::modes
