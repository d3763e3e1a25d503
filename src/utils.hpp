#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const unsigned char* data, std::size_t len);
std::string hex_from_bytes(const std::vector<unsigned char>&);
std::optional<std::vector<unsigned char>> bytes_from_hex(const std::string& hex);

// Absolute, symlink-free, dot-free form of `path`. Parts that do not exist
// (a tracked file that vanished) are normalized lexically.
std::filesystem::path canonical_path(const std::filesystem::path& path);

// $XDG_CONFIG_HOME/fimbl, else $HOME/.config/fimbl. Throws ConfigError.
std::filesystem::path config_home();

std::string format_timestamp_ns(std::int64_t ns_since_epoch);
std::string format_permissions(std::uint32_t bits);
