#pragma once

#include <stdexcept>
#include <string>

namespace mdns_browser
{

class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Socket could not be opened or bound on an interface
class BindError : public Error
{
public:
    BindError(std::string interfaceName, const std::string& reason);

    [[nodiscard]] const std::string& InterfaceName() const noexcept { return m_interfaceName; }

private:
    std::string m_interfaceName;
};

class SendError : public Error
{
public:
    using Error::Error;
};

class MalformedPacketError : public Error
{
public:
    using Error::Error;
};

// Thrown synchronously by the query entry points, nothing is sent
class InvalidQueryError : public Error
{
public:
    InvalidQueryError(std::string query, const std::string& reason);

    [[nodiscard]] const std::string& Query() const noexcept { return m_query; }

private:
    std::string m_query;
};

enum class ResolveError
{
    Timeout,
    Cancelled
};
std::string ToString(ResolveError error);

}
