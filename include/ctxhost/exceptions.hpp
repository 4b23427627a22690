#pragma once
#include <stdexcept>
#include <string>

namespace ctxhost
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

/// Thrown by capability implementations when they cannot produce a result.
struct InvocationError : public Error
{
    using Error::Error;
};

struct ParseError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

} // namespace ctxhost
