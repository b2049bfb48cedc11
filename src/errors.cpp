#include "mdns_browser/errors.hpp"

#include <fmt/core.h>

namespace mdns_browser
{

BindError::BindError(std::string interfaceName, const std::string& reason)
: Error(fmt::format("Failed to bind on {}: {}", interfaceName, reason))
, m_interfaceName(std::move(interfaceName))
{}

InvalidQueryError::InvalidQueryError(std::string query, const std::string& reason)
: Error(fmt::format("Invalid service query \"{}\": {}", query, reason))
, m_query(std::move(query))
{}

std::string ToString(ResolveError error)
{
    switch (error) {
        case ResolveError::Timeout: return "timeout";
        case ResolveError::Cancelled: return "cancelled";
    }
    return "";
}

}
