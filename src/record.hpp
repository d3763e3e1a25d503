#pragma once
#include <cstdint>
#include <string>

#include "digest.hpp"
#include "file_attributes.hpp"

// Tracked state of one file. `path` is the canonical key.
struct Record {
    std::string path;
    Digest digest{};
    FileAttributes attributes;
    std::int64_t recorded_at = 0; // seconds since epoch, when captured
};

// Attributes + digest of the canonical path `path`, stamped with the current
// time. Throws IoError.
Record capture_record(const std::string& path);
