#include "llmtools/schema/coerce.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmtools::schema
{

namespace
{

bool parse_number(const std::string& s, double& out)
{
    if (s.empty())
        return false;
    try
    {
        size_t idx = 0;
        out = std::stod(s, &idx);
        return idx == s.size();
    }
    catch (const std::invalid_argument&)
    {
        return false;
    }
    catch (const std::out_of_range&)
    {
        return false;
    }
}

const std::regex& cached_regex(const std::string& pattern)
{
    static std::mutex mutex;
    static std::unordered_map<std::string, std::regex> cache;
    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(pattern);
    if (it != cache.end())
        return it->second;
    try
    {
        return cache.emplace(pattern, std::regex(pattern)).first->second;
    }
    catch (const std::regex_error&)
    {
        throw ValidationError("Invalid pattern in schema: " + pattern);
    }
}

Json convert(const Json& schema, const Json& instance, const std::string& path);

Json convert_union(const Json& branches, const Json& instance, const std::string& path)
{
    std::string last_error;
    for (const auto& sub : branches)
    {
        try
        {
            return convert(sub, instance, path);
        }
        catch (const ValidationError& e)
        {
            last_error = e.what();
        }
    }
    throw ValidationError("No union branch matched at " + path +
                          (last_error.empty() ? "" : (": " + last_error)));
}

void enforce_enum_const(const Json& schema, const Json& value, const std::string& path)
{
    if (schema.contains("const") && schema["const"] != value)
        throw ValidationError("Const mismatch at " + path);
    if (schema.contains("enum") && schema["enum"].is_array())
    {
        const auto& options = schema["enum"];
        if (std::find(options.begin(), options.end(), value) == options.end())
            throw ValidationError("Value at " + path + " is not one of " + options.dump());
    }
}

Json handle_string(const Json& schema, const Json& instance, const std::string& path)
{
    if (!instance.is_string())
        throw ValidationError("Expected string at " + path);
    std::string value = instance.get<std::string>();

    if (schema.contains("format") && schema["format"].is_string())
    {
        auto fmt = schema["format"].get<std::string>();
        if (fmt == "email" &&
            !std::regex_match(value, cached_regex(R"(^[^@\s]+@[^@\s]+\.[^@\s]+$)")))
            throw ValidationError("Invalid email format at " + path);
        if (fmt == "uri" &&
            !std::regex_match(value, cached_regex(R"(^[a-zA-Z][a-zA-Z0-9+.-]*://.+)")))
            throw ValidationError("Invalid uri format at " + path);
        if (fmt == "date-time" &&
            !std::regex_match(value, cached_regex(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(?:\.\d+)?(?:Z|[+-]\d{2}:\d{2})$)")))
            throw ValidationError("Invalid date-time format at " + path);
        if (fmt == "date" && !std::regex_match(value, cached_regex(R"(^\d{4}-\d{2}-\d{2}$)")))
            throw ValidationError("Invalid date format at " + path);
    }
    if (schema.contains("minLength") && value.size() < schema["minLength"].get<size_t>())
        throw ValidationError("String shorter than minLength at " + path);
    if (schema.contains("maxLength") && value.size() > schema["maxLength"].get<size_t>())
        throw ValidationError("String longer than maxLength at " + path);
    if (schema.contains("pattern") && schema["pattern"].is_string())
    {
        if (!std::regex_search(value, cached_regex(schema["pattern"].get<std::string>())))
            throw ValidationError("String does not match pattern at " + path);
    }
    Json out = value;
    enforce_enum_const(schema, out, path);
    return out;
}

Json handle_number(const Json& schema, const Json& instance, const std::string& path,
                   bool integer)
{
    double num = 0.0;
    if (instance.is_number())
        num = instance.get<double>();
    else if (!instance.is_string() || !parse_number(instance.get<std::string>(), num))
        throw ValidationError(std::string("Expected ") + (integer ? "integer" : "number") +
                              " at " + path);

    if (integer && std::floor(num) != num)
        throw ValidationError("Expected integer at " + path + ", got " + instance.dump());
    // [-2^63, 2^63): the range a non-integer JSON number may be converted over
    if (integer && !instance.is_number_integer() &&
        !(num >= -9223372036854775808.0 && num < 9223372036854775808.0))
        throw ValidationError("Integer out of range at " + path + ", got " + instance.dump());

    if (schema.contains("minimum") && num < schema["minimum"].get<double>())
        throw ValidationError("Value below minimum at " + path);
    if (schema.contains("maximum") && num > schema["maximum"].get<double>())
        throw ValidationError("Value above maximum at " + path);
    if (schema.contains("exclusiveMinimum") && !(num > schema["exclusiveMinimum"].get<double>()))
        throw ValidationError("Value not greater than exclusiveMinimum at " + path);
    if (schema.contains("exclusiveMaximum") && !(num < schema["exclusiveMaximum"].get<double>()))
        throw ValidationError("Value not less than exclusiveMaximum at " + path);
    if (schema.contains("multipleOf"))
    {
        double step = schema["multipleOf"].get<double>();
        if (step != 0.0)
        {
            double div = num / step;
            if (std::fabs(div - std::round(div)) > 1e-9)
                throw ValidationError("Value not a multipleOf " + schema["multipleOf"].dump() +
                                      " at " + path);
        }
    }

    Json out;
    if (integer && instance.is_number_integer())
        out = instance;
    else if (integer)
        out = static_cast<int64_t>(num);
    else if (instance.is_number())
        out = instance;
    else
        out = num;
    enforce_enum_const(schema, out, path);
    return out;
}

Json handle_array(const Json& schema, const Json& instance, const std::string& path)
{
    if (!instance.is_array())
        throw ValidationError("Expected array at " + path);
    if (schema.contains("minItems") && instance.size() < schema["minItems"].get<size_t>())
        throw ValidationError("Too few items at " + path);
    if (schema.contains("maxItems") && instance.size() > schema["maxItems"].get<size_t>())
        throw ValidationError("Too many items at " + path);

    const Json empty = Json::object();
    const Json* tuple = nullptr;
    if (schema.contains("prefixItems") && schema["prefixItems"].is_array())
        tuple = &schema["prefixItems"];
    else if (schema.contains("items") && schema["items"].is_array())
        tuple = &schema["items"];
    const Json* items =
        (schema.contains("items") && schema["items"].is_object()) ? &schema["items"] : nullptr;

    Json out = Json::array();
    for (size_t i = 0; i < instance.size(); ++i)
    {
        auto item_path = path + "/" + std::to_string(i);
        const Json* item_schema = &empty;
        if (tuple != nullptr && i < tuple->size())
            item_schema = &(*tuple)[i];
        else if (items != nullptr)
            item_schema = items;
        else if (tuple != nullptr && schema.contains("additionalItems") &&
                 schema["additionalItems"].is_boolean() && !schema["additionalItems"].get<bool>())
            throw ValidationError("Too many items at " + path);
        out.push_back(convert(*item_schema, instance[i], item_path));
    }

    if (schema.contains("uniqueItems") && schema["uniqueItems"].is_boolean() &&
        schema["uniqueItems"].get<bool>())
    {
        for (size_t i = 0; i < out.size(); ++i)
            for (size_t j = i + 1; j < out.size(); ++j)
                if (out[i] == out[j])
                    throw ValidationError("Duplicate items at " + path);
    }
    return out;
}

Json handle_object(const Json& schema, const Json& instance, const std::string& path)
{
    if (!instance.is_object())
        throw ValidationError("Expected object at " + path);

    std::vector<std::string> required;
    if (schema.contains("required") && schema["required"].is_array())
        for (const auto& r : schema["required"])
            if (r.is_string())
                required.push_back(r.get<std::string>());

    const Json empty = Json::object();
    const Json& properties = (schema.contains("properties") && schema["properties"].is_object())
                                 ? schema["properties"]
                                 : empty;

    Json out = Json::object();
    for (const auto& [key, subschema] : properties.items())
    {
        auto sub_path = path + "/" + key;
        if (instance.contains(key))
            out[key] = convert(subschema, instance[key], sub_path);
        else if (subschema.is_object() && subschema.contains("default"))
            out[key] = subschema["default"];
        else if (std::find(required.begin(), required.end(), key) != required.end())
            throw ValidationError("Missing required property '" + key + "' at " + path);
    }

    bool allow_additional = true;
    const Json* additional_schema = nullptr;
    if (schema.contains("additionalProperties"))
    {
        const auto& ap = schema["additionalProperties"];
        if (ap.is_boolean())
            allow_additional = ap.get<bool>();
        else if (ap.is_object())
            additional_schema = &ap;
    }

    for (const auto& [key, value] : instance.items())
    {
        if (properties.contains(key))
            continue;
        if (!allow_additional)
            throw ValidationError("Unexpected property '" + key + "' at " + path);
        auto sub_path = path + "/" + key;
        out[key] = additional_schema ? convert(*additional_schema, value, sub_path) : value;
    }
    return out;
}

Json convert_typed(const Json& schema, const std::string& type, const Json& instance,
                   const std::string& path)
{
    if (type == "null")
    {
        if (!instance.is_null())
            throw ValidationError("Expected null at " + path);
        return nullptr;
    }
    if (type == "boolean")
    {
        if (instance.is_boolean())
            return instance;
        if (instance.is_string())
        {
            auto s = instance.get<std::string>();
            if (s == "true")
                return true;
            if (s == "false")
                return false;
        }
        throw ValidationError("Expected boolean at " + path);
    }
    if (type == "integer")
        return handle_number(schema, instance, path, true);
    if (type == "number")
        return handle_number(schema, instance, path, false);
    if (type == "string")
        return handle_string(schema, instance, path);
    if (type == "array")
        return handle_array(schema, instance, path);
    if (type == "object")
        return handle_object(schema, instance, path);
    // Unknown types are passed through
    return instance;
}

Json convert(const Json& schema, const Json& instance, const std::string& path)
{
    if (!schema.is_object())
        return instance;

    if (schema.contains("type") && schema["type"].is_array())
    {
        Json branches = Json::array();
        for (const auto& t : schema["type"])
        {
            Json branch = schema;
            branch["type"] = t;
            branches.push_back(std::move(branch));
        }
        return convert_union(branches, instance, path);
    }
    if (schema.contains("anyOf") && schema["anyOf"].is_array())
        return convert_union(schema["anyOf"], instance, path);
    if (schema.contains("oneOf") && schema["oneOf"].is_array())
        return convert_union(schema["oneOf"], instance, path);

    if (schema.contains("type") && schema["type"].is_string())
        return convert_typed(schema, schema["type"].get<std::string>(), instance, path);

    enforce_enum_const(schema, instance, path);
    // Untyped schema: accept as-is
    return instance;
}

} // namespace

Json coerce(const Json& schema, const Json& instance)
{
    return convert(schema, instance, "$");
}

Json coerce_arguments(const Json& schema, const Json& args)
{
    if (!args.is_object())
        throw ValidationError("Tool arguments must be a JSON object");
    if (!schema.is_object() || schema.empty())
        return args;
    return convert(schema, args, "$");
}

} // namespace llmtools::schema
