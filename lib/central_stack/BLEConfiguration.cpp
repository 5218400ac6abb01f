/**
 * @file BLEConfiguration.cpp
 * @brief Configuration helpers
 */

#include "BLEConfiguration.h"

namespace CentralStack { namespace BLE {

ConnectionConfiguration ConnectionConfiguration::standardConfiguration(
    const Bytes& peripheral, const ConnectionRoutes& routes) {
    ConnectionConfiguration config;
    config.peripheral = peripheral;
    config.routes = routes;
    return config;
}

ConnectionConfiguration ReconnectConfiguration::toConnectionConfiguration() const {
    ConnectionConfiguration config;
    config.peripheral = peripheral;
    config.routes = routes;
    config.options = options;
    return config;
}

}} // namespace CentralStack::BLE
