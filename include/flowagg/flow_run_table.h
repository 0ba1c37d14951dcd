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
**************************************************************************/

#pragma once

#include <flowagg/configuration.h>
#include <flowagg/region.h>
#include <string>

namespace flowagg {

// Configuration keys naming the flow run table
constexpr const char* kFlowRunTableNameKey = "flowagg.flowrun.table.name";
constexpr const char* kSchemaPrefixKey = "flowagg.schema.prefix";

constexpr const char* kDefaultFlowRunTableName = "timelineservice.flowrun";
constexpr const char* kDefaultSchemaPrefix = "prod.";

/**
 * @brief Schema prefix followed by the configured flow run table name.
 */
std::string EffectiveFlowRunTableName(const Configuration& config);

/**
 * @brief Whether the region belongs to the flow run table. Table names
 * compare without regard to ASCII case.
 */
bool IsFlowRunTable(const RegionInfo& region_info, const Configuration& config);

} // namespace flowagg
