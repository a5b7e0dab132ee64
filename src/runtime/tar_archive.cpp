#include "runtime/tar_archive.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace gexec::runtime {
namespace {

constexpr std::size_t kBlockSize = 512;
constexpr std::size_t kNameSize = 100;

void WriteOctal(char* field, std::size_t width, std::uint64_t value) {
    // width includes the trailing NUL
    std::snprintf(field, width, "%0*llo", static_cast<int>(width - 1),
                  static_cast<unsigned long long>(value));
}

void WriteString(char* field, std::size_t width, const std::string& value) {
    std::memcpy(field, value.data(), std::min(width, value.size()));
}

}  // namespace

std::string BuildSingleFileTar(const TarEntry& entry) {
    if (entry.name.empty() || entry.name.size() >= kNameSize) {
        throw std::invalid_argument("tar entry name must be 1-99 bytes: " + entry.name);
    }
    if (entry.name.find('/') != std::string::npos) {
        throw std::invalid_argument("tar entry name must not contain '/': " + entry.name);
    }

    std::array<char, kBlockSize> header{};
    WriteString(&header[0], kNameSize, entry.name);
    WriteOctal(&header[100], 8, entry.mode);
    WriteOctal(&header[108], 8, 0);
    WriteOctal(&header[116], 8, 0);
    WriteOctal(&header[124], 12, entry.contents.size());
    WriteOctal(&header[136], 12, static_cast<std::uint64_t>(entry.mtime));
    header[156] = '0';
    WriteString(&header[257], 6, std::string("ustar", 6));
    WriteString(&header[263], 2, "00");
    WriteString(&header[265], 32, "root");
    WriteString(&header[297], 32, "root");

    // Checksum is computed with its own field filled with spaces.
    std::memset(&header[148], ' ', 8);
    unsigned checksum = 0;
    for (const char c : header) {
        checksum += static_cast<unsigned char>(c);
    }
    std::snprintf(&header[148], 7, "%06o", checksum);
    header[154] = '\0';
    header[155] = ' ';

    std::string archive(header.data(), header.size());
    archive.append(entry.contents);
    const auto remainder = entry.contents.size() % kBlockSize;
    if (remainder != 0) {
        archive.append(kBlockSize - remainder, '\0');
    }
    archive.append(2 * kBlockSize, '\0');
    return archive;
}

}  // namespace gexec::runtime
