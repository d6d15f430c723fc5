#include "llmtools/schema/resolver.hpp"

#include "llmtools/logging.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace llmtools::schema
{

namespace
{

const char* const DEFINITION_TABLES[] = {"$defs", "definitions"};

bool is_local(const std::string& ref)
{
    return !ref.empty() && ref[0] == '#';
}

// Resolves "#", "#/$defs/Name" and any other local JSON pointer against root.
const Json* lookup_local(const Json& root, const std::string& ref)
{
    if (!is_local(ref))
        return nullptr;
    if (ref == "#")
        return &root;
    try
    {
        Json::json_pointer ptr(ref.substr(1));
        if (!root.contains(ptr))
            return nullptr;
        return &root.at(ptr);
    }
    catch (const Json::exception&)
    {
        return nullptr;
    }
}

// Every $ref string inside node, without following any of them.
std::vector<std::string> refs_below(const Json& node)
{
    std::vector<std::string> refs;
    std::vector<const Json*> pending{&node};
    while (!pending.empty())
    {
        const Json* current = pending.back();
        pending.pop_back();
        if (current->is_array())
        {
            for (const auto& item : *current)
                pending.push_back(&item);
            continue;
        }
        if (!current->is_object())
            continue;
        for (const auto& [key, value] : current->items())
        {
            if (key == "$ref" && value.is_string())
                refs.push_back(value.get<std::string>());
            else if (key != "$ref")
                pending.push_back(&value);
        }
    }
    return refs;
}

Json inline_node(const Json& node, const Json& root, int depth, int max_depth)
{
    if (node.is_array())
    {
        Json out = Json::array();
        for (const auto& item : node)
            out.push_back(inline_node(item, root, depth, max_depth));
        return out;
    }
    if (!node.is_object())
        return node;

    Json out = Json::object();
    for (const auto& [key, value] : node.items())
        if (key != "$ref")
            out[key] = inline_node(value, root, depth, max_depth);

    auto ref_it = node.find("$ref");
    if (ref_it == node.end() || !ref_it->is_string())
        return out;

    std::string ref = ref_it->get<std::string>();
    if (depth >= max_depth)
    {
        std::string msg = "Schema nesting exceeds the maximum depth of " +
                          std::to_string(max_depth) + " while resolving " + ref + ".";
        log::error(msg);
        throw SchemaDepthError(msg);
    }

    const Json* target = lookup_local(root, ref);
    if (target == nullptr)
    {
        std::string msg = "Unresolvable schema reference: " + ref +
                          ". Only local references into the schema are supported.";
        log::error(msg);
        throw ValidationError(msg);
    }

    Json resolved = inline_node(*target, root, depth + 1, max_depth);
    if (resolved.is_object())
    {
        // Fields on the referencing node win over the target's
        for (const auto& [key, value] : resolved.items())
            if (!out.contains(key))
                out[key] = value;
    }
    return out;
}

} // namespace

void assert_no_recursive_refs(const Json& schema)
{
    // Depth-first over the reference graph: an edge into a ref that is still
    // being expanded closes a cycle; finished refs are never expanded again.
    enum class Mark
    {
        Open,
        Closed
    };
    struct Frame
    {
        std::string ref;
        std::vector<std::string> next;
        size_t index{0};
    };

    std::unordered_map<std::string, Mark> marks;
    std::vector<Frame> stack;

    auto enter = [&](const std::string& ref)
    {
        marks[ref] = Mark::Open;
        const Json* target = lookup_local(schema, ref);
        stack.push_back({ref, target ? refs_below(*target) : std::vector<std::string>{}, 0});
    };

    for (const auto& start : refs_below(schema))
    {
        if (marks.count(start) != 0)
            continue;
        enter(start);
        while (!stack.empty())
        {
            Frame& top = stack.back();
            if (top.index == top.next.size())
            {
                marks[top.ref] = Mark::Closed;
                stack.pop_back();
                continue;
            }
            std::string ref = top.next[top.index++];
            auto it = marks.find(ref);
            if (it == marks.end())
            {
                enter(ref);
            }
            else if (it->second == Mark::Open)
            {
                std::string msg = "Recursive structure detected: " + ref +
                                  ". Recursive structures are not allowed in tool inputs. "
                                  "Use parent_id, lists, or a workflow loop instead.";
                log::error(msg);
                throw ValidationError(msg);
            }
        }
    }
}

Json inline_refs(const Json& schema, int max_depth)
{
    if (!schema.is_object())
        return schema;

    Json body = schema;
    for (const char* table : DEFINITION_TABLES)
        body.erase(table);

    return inline_node(body, schema, 0, max_depth);
}

Json resolve(const Json& schema, int max_depth)
{
    assert_no_recursive_refs(schema);
    return inline_refs(schema, max_depth);
}

} // namespace llmtools::schema
