#pragma once

#include <string>

namespace callguard::utils {

// Random RFC 4122 version 4 identifier.
std::string make_uuid();

std::string make_id(const std::string& prefix);

}
