#include "temp_dir.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

namespace envkeeper {
namespace common {

bool create_private_temp_dir(const std::string &prefix, std::string &path, std::string &error) {
    std::error_code ec;
    std::filesystem::path base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }

    std::string pattern = (base / (prefix + ".XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        error = "failed to create temporary directory " + pattern + ": " + strerror(errno);
        return false;
    }
    path = buffer.data();

    if (chmod(path.c_str(), S_IRWXU) < 0) {
        error = "failed to restrict permissions of " + path + ": " + strerror(errno);
        std::filesystem::remove_all(path, ec);
        return false;
    }
    return true;
}

bool remove_temp_dir(const std::string &path, std::string &error) {
    if (path.empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        error = "failed to remove " + path + ": " + ec.message();
        return false;
    }
    return true;
}

}  // namespace common
}  // namespace envkeeper
