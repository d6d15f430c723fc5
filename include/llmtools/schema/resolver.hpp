#pragma once
#include "llmtools/exceptions.hpp"
#include "llmtools/types.hpp"

namespace llmtools::schema
{

constexpr int DEFAULT_MAX_DEPTH = 20;

/// Walks the reference graph of @p schema and throws ValidationError when a
/// local $ref is reached again on its own expansion path. Each reference is
/// expanded once, on an explicit work stack, so shared and deeply nested
/// definitions cost time linear in the schema size.
void assert_no_recursive_refs(const Json& schema);

/// Replaces every local $ref ("#", "#/$defs/<n>", "#/definitions/<n>") with the
/// fields of its target, keeping fields already present on the referencing
/// node, then drops the definitions tables. Throws SchemaDepthError when
/// references nest deeper than @p max_depth and ValidationError for
/// references that cannot be resolved locally.
Json inline_refs(const Json& schema, int max_depth = DEFAULT_MAX_DEPTH);

/// assert_no_recursive_refs followed by inline_refs.
Json resolve(const Json& schema, int max_depth = DEFAULT_MAX_DEPTH);

} // namespace llmtools::schema
