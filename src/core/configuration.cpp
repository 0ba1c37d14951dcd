/************************************************************************
FlowAgg Configuration Implementation
**************************************************************************/

#include "flowagg/configuration.h"
#include "flowagg/logging.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace flowagg {

FLOWAGG_LOG_TAG(Configuration);

std::string Configuration::Get(const std::string& key,
                               const std::string& default_value) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return default_value;
    }
    return it->second;
}

bool Configuration::GetBool(const std::string& key, bool default_value) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return default_value;
    }

    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (value == "true") return true;
    if (value == "false") return false;
    return default_value;
}

int64_t Configuration::GetInt64(const std::string& key, int64_t default_value) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.empty()) {
        return default_value;
    }

    char* end = nullptr;
    long long parsed = std::strtoll(it->second.c_str(), &end, 10);
    if (end == nullptr || *end != '\0') {
        return default_value;
    }
    return static_cast<int64_t>(parsed);
}

Status Configuration::FromJson(const std::string& json, Configuration* config) {
    nlohmann::json root = nlohmann::json::parse(json, nullptr, false);
    if (root.is_discarded()) {
        return Status::InvalidArgument("Configuration is not valid JSON");
    }
    if (!root.is_object()) {
        return Status::InvalidArgument("Configuration JSON must be an object");
    }

    Configuration parsed;
    for (auto it = root.begin(); it != root.end(); ++it) {
        const auto& value = it.value();
        if (value.is_string()) {
            parsed.Set(it.key(), value.get<std::string>());
        } else if (value.is_number() || value.is_boolean()) {
            parsed.Set(it.key(), value.dump());
        } else {
            return Status::InvalidArgument("Configuration key " + it.key() +
                                           " must be a string, number or boolean");
        }
    }

    FLOWAGG_LOG_DEBUG(Configuration) << "Loaded " << parsed.size() << " settings";
    *config = std::move(parsed);
    return Status::OK();
}

Status Configuration::FromJsonFile(const std::string& path, Configuration* config) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return Status::IOError("Cannot open configuration file " + path);
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Status::IOError("Failed to read configuration file " + path);
    }
    return FromJson(buffer.str(), config);
}

} // namespace flowagg
