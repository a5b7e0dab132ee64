#pragma once

#include <cstdint>
#include <string>

namespace gexec::runtime {

struct TarEntry {
    std::string name;
    std::string contents;
    unsigned mode = 0644;
    std::int64_t mtime = 0;
};

// A single-file ustar archive, the body Docker expects for
// PUT /containers/{id}/archive. Throws std::invalid_argument for names that
// do not fit the header or contain a path separator.
std::string BuildSingleFileTar(const TarEntry& entry);

}  // namespace gexec::runtime
