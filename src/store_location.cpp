#include "store_location.hpp"
#include "errors.hpp"
#include "utils.hpp"

std::filesystem::path resolve_store_location(const std::string& override_path){
    if(!override_path.empty()){
        std::error_code ec;
        auto absolute = std::filesystem::absolute(override_path, ec);
        if(ec) throw ConfigError("Invalid database location '" + override_path + "': " + ec.message());
        return absolute.lexically_normal();
    }
    return config_home() / "ledger.db";
}
