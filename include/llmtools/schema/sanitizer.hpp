#pragma once
#include "llmtools/types.hpp"

namespace llmtools::schema
{

/// Rewrites a resolved schema into the shape providers accept:
/// - drops $schema, $id, title and leftover definitions tables at every level
/// - collapses anyOf/oneOf [T, null] (and "type": [T, "null"]) to T; a
///   description on the enclosing node replaces the branch's
/// - closes every object node ("additionalProperties": false) unless it says otherwise
///
/// Idempotent: sanitize(sanitize(x)) == sanitize(x).
Json sanitize(const Json& schema);

} // namespace llmtools::schema
