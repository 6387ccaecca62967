#pragma once

#include <filesystem>
#include <string>
#include <string_view>

/**
 * Replaces content of the file with the given value.
 *
 * Throws std::system_error if the file cannot be created or written.
 */
void StringToFile(const std::filesystem::path& path, const std::string_view value);

/**
 * Reads whole content of the file.
 *
 * Throws std::system_error if the file cannot be opened or read. A missing
 * file is reported with std::errc::no_such_file_or_directory.
 */
std::string StringFromFile(const std::filesystem::path& path);
