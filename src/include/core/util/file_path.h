#pragma once

#include <filesystem>
#include <string_view>

namespace lanbeam::core {

// A name received from a peer is safe when it stays inside the destination:
// relative, '/' separated, and free of "." / ".." / empty components.
bool IsSafeRelativeName(std::string_view name);

// `dir / name`, with " (n)" inserted before the extension while that path is
// taken. An existing " (n)" suffix is continued rather than nested.
std::filesystem::path UniqueDestination(const std::filesystem::path& dir, std::string_view name);

} // namespace lanbeam::core
