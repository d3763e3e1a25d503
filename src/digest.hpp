#pragma once
#include <array>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

constexpr std::size_t kDigestSize = 32;

// SHA3-256 of a file's bytes.
using Digest = std::array<unsigned char, kDigestSize>;

// Streams the file in fixed-size blocks. Throws IoError when the path is not
// a regular file or cannot be opened or read to the end.
Digest digest_file(const std::filesystem::path& path);

Digest digest_bytes(const std::string& data);

std::string digest_to_hex(const Digest& digest);
std::optional<Digest> digest_from_hex(const std::string& hex);
