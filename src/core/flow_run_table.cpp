#include "flowagg/flow_run_table.h"
#include "flowagg/logging.h"
#include <algorithm>
#include <cctype>

namespace flowagg {

FLOWAGG_LOG_TAG(FlowRunTable);

namespace {

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](unsigned char x, unsigned char y) {
                          return std::tolower(x) == std::tolower(y);
                      });
}

}  // namespace

std::string EffectiveFlowRunTableName(const Configuration& config) {
    return config.Get(kSchemaPrefixKey, kDefaultSchemaPrefix) +
           config.Get(kFlowRunTableNameKey, kDefaultFlowRunTableName);
}

bool IsFlowRunTable(const RegionInfo& region_info, const Configuration& config) {
    std::string flow_run_table = EffectiveFlowRunTableName(config);
    FLOWAGG_LOG_DEBUG(FlowRunTable)
        << "regionTableName=" << region_info.table_name
        << " flowRunTableName=" << flow_run_table;
    return EqualsIgnoreCase(flow_run_table, region_info.table_name);
}

} // namespace flowagg
