#include "flowagg/attribute_tags.h"
#include "flowagg/aggregation.h"

namespace flowagg {

Status TagFromAttribute(const std::string& name,
                        const std::string& value,
                        Tag* tag) {
    if (name.empty()) {
        return Status::IOError("Cannot build tag from attribute with empty name");
    }
    if (value.size() > kMaxTagValueLength) {
        return Status::IOError("Attribute " + name + " value of " +
                               std::to_string(value.size()) +
                               " bytes exceeds tag limit of " +
                               std::to_string(kMaxTagValueLength));
    }

    // An attribute is either an aggregation operation or a compaction dimension
    if (auto op = AggregationOperationFromName(name)) {
        *tag = Tag(TagTypeOf(*op), name, value);
        return Status::OK();
    }
    if (auto dim = AggregationCompactionDimensionFromName(name)) {
        *tag = Tag(TagTypeOf(*dim), name, value);
        return Status::OK();
    }

    *tag = Tag(kAttributeTagType, name, value);
    return Status::OK();
}

Status TagsFromAttributes(const AttributeList& attributes, TagSet* tags) {
    std::vector<Tag> converted;
    converted.reserve(attributes.size());

    for (const auto& attribute : attributes) {
        Tag tag;
        Status s = TagFromAttribute(attribute.first, attribute.second, &tag);
        if (!s.ok()) {
            return s;
        }
        converted.push_back(std::move(tag));
    }

    *tags = MakeTagSet(std::move(converted));
    return Status::OK();
}

} // namespace flowagg
