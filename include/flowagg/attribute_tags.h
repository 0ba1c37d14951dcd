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

#include <flowagg/cell.h>
#include <flowagg/status.h>
#include <flowagg/write_batch.h>
#include <string>

namespace flowagg {

/**
 * @brief Convert one write attribute to the tag stored on its cells.
 *
 * Aggregation operation names (SUM, GLOBAL_MAX, ...) and compaction
 * dimension names (APPLICATION_ID) map to their own tag types; any other
 * name becomes a kAttributeTagType tag.
 *
 * @return IOError for an empty name or a value too long to persist
 */
Status TagFromAttribute(const std::string& name,
                        const std::string& value,
                        Tag* tag);

/**
 * @brief Convert every attribute, in order, into one shared tag set.
 *
 * Stops at the first attribute that fails to convert; *tags is only
 * assigned on success.
 */
Status TagsFromAttributes(const AttributeList& attributes, TagSet* tags);

} // namespace flowagg
