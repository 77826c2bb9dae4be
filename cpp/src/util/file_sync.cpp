#include "dreamgroup/util/file_sync.hpp"

#include <cerrno>
#include <filesystem>

#include <fcntl.h>
#include <unistd.h>

namespace dreamgroup::util {

std::error_code sync_to_disk(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return std::error_code(errno, std::generic_category());

    std::error_code ec;
    if (::fsync(fd) != 0) ec = std::error_code(errno, std::generic_category());
    ::close(fd);
    return ec;
}

std::string parent_directory(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    return parent.empty() ? "." : parent.string();
}

} // namespace dreamgroup::util
