#pragma once
#include <stdexcept>
#include <string>

namespace llmtools
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Duplicate tool name or an incomplete registration call.
struct RegistrationError : public Error
{
    using Error::Error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

/// Missing descriptions, recursive schemas, or arguments rejected by a schema.
struct ValidationError : public Error
{
    using Error::Error;
};

/// Reference inlining went deeper than the configured bound.
struct SchemaDepthError : public ValidationError
{
    using ValidationError::ValidationError;
};

/// Raised by tools (or the loop itself) for failures reported back to the model.
struct ExecutionError : public Error
{
    using Error::Error;
};

struct ToolTimeoutError : public ExecutionError
{
    using ExecutionError::ExecutionError;
};

struct TransportError : public Error
{
    using Error::Error;
};

// Filesystem-flavoured failures a tool may raise; all recoverable.
struct FileNotFoundError : public Error
{
    using Error::Error;
};

struct FileExistsError : public Error
{
    using Error::Error;
};

struct PermissionError : public Error
{
    using Error::Error;
};

struct InvalidPathError : public Error
{
    using Error::Error;
};

} // namespace llmtools
