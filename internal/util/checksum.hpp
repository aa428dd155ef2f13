#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace archstore::util {

/*
  Content hashing shared by version history, backups and the integrity checker.

  SHA-256, lowercase hex.
*/

std::string Sha256Hex(std::string_view data);

// Streams the file; throws StorageIOError if it cannot be read.
std::string Sha256HexOfFile(const std::filesystem::path& path);

bool VerifyChecksum(std::string_view data, std::string_view expected_hex);

} // namespace archstore::util
