#include "llmtools/schema/sanitizer.hpp"

#include <string>

namespace llmtools::schema
{

namespace
{

const char* const METADATA_KEYS[] = {"$schema", "$id", "title", "$defs", "definitions"};
const char* const UNION_KEYS[] = {"anyOf", "oneOf"};
const char* const BRANCH_LIST_KEYS[] = {"anyOf", "oneOf", "allOf", "prefixItems"};
const char* const SINGLE_SCHEMA_KEYS[] = {"items", "additionalProperties", "not"};

bool is_null_branch(const Json& branch)
{
    if (!branch.is_object())
        return false;
    auto it = branch.find("type");
    return it != branch.end() && it->is_string() && it->get<std::string>() == "null";
}

// Returns the single non-null branch of a [T, null] union, or nullptr.
const Json* optional_branch(const Json& branches)
{
    if (!branches.is_array() || branches.size() != 2)
        return nullptr;
    const Json* keep = nullptr;
    int nulls = 0;
    for (const auto& b : branches)
    {
        if (is_null_branch(b))
            ++nulls;
        else
            keep = &b;
    }
    if (nulls != 1 || keep == nullptr || !keep->is_object())
        return nullptr;
    return keep;
}

void collapse_nullable_type(Json& node)
{
    auto it = node.find("type");
    if (it == node.end() || !it->is_array() || it->size() != 2)
        return;
    Json kept;
    int nulls = 0;
    for (const auto& t : *it)
    {
        if (t.is_string() && t.get<std::string>() == "null")
            ++nulls;
        else
            kept = t;
    }
    if (nulls == 1 && kept.is_string())
        node["type"] = kept;
}

} // namespace

Json sanitize(const Json& schema)
{
    if (!schema.is_object())
        return schema;

    Json node = schema;
    for (const char* key : METADATA_KEYS)
        node.erase(key);

    for (const char* key : UNION_KEYS)
    {
        auto it = node.find(key);
        if (it == node.end())
            continue;
        if (const Json* branch = optional_branch(*it))
        {
            Json merged = *branch;
            if (node.contains("description"))
                merged["description"] = node["description"];
            return sanitize(merged);
        }
    }

    collapse_nullable_type(node);

    auto type_it = node.find("type");
    if (type_it != node.end() && type_it->is_string() && type_it->get<std::string>() == "object" &&
        !node.contains("additionalProperties"))
        node["additionalProperties"] = false;

    if (auto it = node.find("properties"); it != node.end() && it->is_object())
        for (auto prop = it->begin(); prop != it->end(); ++prop)
            *prop = sanitize(*prop);

    for (const char* key : BRANCH_LIST_KEYS)
    {
        auto it = node.find(key);
        if (it == node.end() || !it->is_array())
            continue;
        for (auto& branch : *it)
            branch = sanitize(branch);
    }

    for (const char* key : SINGLE_SCHEMA_KEYS)
    {
        auto it = node.find(key);
        if (it == node.end())
            continue;
        if (it->is_object())
            *it = sanitize(*it);
        else if (it->is_array())
            for (auto& item : *it)
                item = sanitize(item);
    }

    return node;
}

} // namespace llmtools::schema
