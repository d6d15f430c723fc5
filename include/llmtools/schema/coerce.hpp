#pragma once
#include "llmtools/exceptions.hpp"
#include "llmtools/types.hpp"

namespace llmtools::schema
{

/// Validates @p instance against @p schema and returns the coerced value:
/// numeric strings become numbers, "true"/"false" become booleans, missing
/// properties with a default are filled in. Supports type (incl. type arrays),
/// anyOf/oneOf, enum/const, string formats and length/pattern, numeric ranges
/// and multipleOf, array items/tuples/uniqueItems, and closed objects.
///
/// Throws ValidationError naming the JSON path of the first violation ("$/a/0").
Json coerce(const Json& schema, const Json& instance);

/// coerce() for a tool's argument object; @p args must be a JSON object.
Json coerce_arguments(const Json& schema, const Json& args);

} // namespace llmtools::schema
