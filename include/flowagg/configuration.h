/************************************************************************
Copyright 2024 FlowAgg Contributors

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    https://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.

FlowAgg Configuration

Flat string key/value settings handed to observers when they attach to a
region. Values may be loaded from a JSON object.
**************************************************************************/

#pragma once

#include <flowagg/status.h>
#include <cstdint>
#include <map>
#include <string>

namespace flowagg {

class Configuration {
public:
    Configuration() = default;

    void Set(const std::string& key, const std::string& value) {
        values_[key] = value;
    }

    bool Contains(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    std::string Get(const std::string& key, const std::string& default_value = "") const;

    /**
     * @brief "true"/"false" (any case); anything else yields the default.
     */
    bool GetBool(const std::string& key, bool default_value) const;

    /**
     * @brief Integer value; unparsable values yield the default.
     */
    int64_t GetInt64(const std::string& key, int64_t default_value) const;

    size_t size() const { return values_.size(); }

    /**
     * @brief Load settings from a flat JSON object.
     *
     * Strings are stored verbatim, numbers and booleans in their JSON text
     * form. Nested objects and arrays are rejected.
     */
    static Status FromJson(const std::string& json, Configuration* config);

    static Status FromJsonFile(const std::string& path, Configuration* config);

private:
    std::map<std::string, std::string> values_;
};

} // namespace flowagg
