#pragma once

#include <string>

namespace envkeeper {
namespace common {

// Creates "<tmp>/<prefix>.XXXXXX" with mode 0700
bool create_private_temp_dir(const std::string &prefix, std::string &path, std::string &error);

// Recursive removal; a missing directory is not an error
bool remove_temp_dir(const std::string &path, std::string &error);

}  // namespace common
}  // namespace envkeeper
