#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace dotres {

// Value of <Project><PropertyGroup><AssemblyName>, or "" when the project does not
// override it. When several property groups set it the last one wins. Only the
// fields needed here are read; unknown elements and attributes are skipped.
// Throws malformed_descriptor_error if `xml` is not a well-formed document.
std::string proj_file_parse_assembly_name(std::string_view xml);

// Reads and parses a .csproj/.vbproj/.fsproj file. Errors name the file.
std::string proj_file_assembly_name(std::filesystem::path const &path);

}  // namespace dotres
