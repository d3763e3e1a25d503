#include "utils.hpp"
#include "errors.hpp"

#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const unsigned char* data, std::size_t len){
    std::ostringstream oss;
    for(std::size_t i = 0; i < len; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    return oss.str();
}

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    return hex_from_bytes(b.data(), b.size());
}

std::optional<std::vector<unsigned char>> bytes_from_hex(const std::string& hex){
    if(hex.size() % 2 != 0) return std::nullopt;
    auto hexval = [](char c) -> int {
        if('0' <= c && c <= '9') return c - '0';
        if('a' <= c && c <= 'f') return c - 'a' + 10;
        if('A' <= c && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::vector<unsigned char> out(hex.size() / 2);
    for(std::size_t i = 0; i < out.size(); ++i){
        int hi = hexval(hex[2 * i]);
        int lo = hexval(hex[2 * i + 1]);
        if(hi < 0 || lo < 0) return std::nullopt;
        out[i] = static_cast<unsigned char>((hi << 4) | lo);
    }
    return out;
}

std::filesystem::path canonical_path(const std::filesystem::path& path){
    namespace fs = std::filesystem;
    if(path.empty()) throw IoError(path.string(), "empty path");
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    if(ec) throw IoError(path.string(), ec.message());
    auto resolved = fs::weakly_canonical(absolute, ec);
    if(ec) throw IoError(path.string(), ec.message());
    return resolved;
}

std::filesystem::path config_home(){
    if(const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg){
        return std::filesystem::path(xdg) / "fimbl";
    }
    if(const char* home = std::getenv("HOME"); home && *home){
        return std::filesystem::path(home) / ".config" / "fimbl";
    }
    throw ConfigError("No HOME directory (set HOME or XDG_CONFIG_HOME, or pass --database)");
}

std::string format_timestamp_ns(std::int64_t ns_since_epoch){
    std::time_t seconds = static_cast<std::time_t>(ns_since_epoch / 1000000000);
    long nanos = static_cast<long>(ns_since_epoch % 1000000000);
    if(nanos < 0){
        nanos += 1000000000;
        --seconds;
    }
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(9) << std::setfill('0') << nanos << " UTC";
    return oss.str();
}

std::string format_permissions(std::uint32_t bits){
    std::ostringstream oss;
    oss << std::oct << std::setw(4) << std::setfill('0') << (bits & 07777);
    return oss.str();
}
