#pragma once

#include "mdns_browser/discovery_cache.hpp"
#include "mdns_browser/discovery_types.hpp"
#include "mdns_browser/errors.hpp"
#include "mdns_browser/log.hpp"
#include "mdns_browser/network_interfaces.hpp"
#include "mdns_browser/normalize.hpp"
#include "mdns_browser/scan_session.hpp"
#include "mdns_browser/types.hpp"
