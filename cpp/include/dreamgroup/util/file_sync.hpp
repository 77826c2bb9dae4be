#pragma once

#include <string>
#include <system_error>

namespace dreamgroup::util {

// fsync a file or a directory; the returned code is set when it cannot be opened or synced
std::error_code sync_to_disk(const std::string& path);

// Directory holding `path`, "." when the path has no directory part
std::string parent_directory(const std::string& path);

} // namespace dreamgroup::util
