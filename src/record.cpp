#include "record.hpp"

#include <chrono>

Record capture_record(const std::string& path){
    Record r;
    r.path = path;
    r.attributes = snapshot_attributes(path);
    r.digest = digest_file(path);
    r.recorded_at = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return r;
}
