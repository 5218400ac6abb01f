/**
 * @file BLEPathDiscoverer.cpp
 * @brief Path discovery implementation
 */

#include "BLEPathDiscoverer.h"
#include "Log.h"

namespace CentralStack { namespace BLE {

BLEPathDiscoverer::BLEPathDiscoverer(IRadioSession::Ptr session, const Bytes& peripheral)
    : _session(session), _peripheral(peripheral) {
}

void BLEPathDiscoverer::discoverPaths(const ConnectionRoutes& routes, OnComplete on_complete) {
    if (_started) {
        WARNING("BLEPathDiscoverer: Discovery already started for " + identifierToString(_peripheral));
        return;
    }
    _started = true;
    _routes = routes;
    _on_complete = on_complete;

    if (!_session) {
        ERROR("BLEPathDiscoverer: No radio session");
        complete(StackError::radio(RadioError::unknown()));
        return;
    }

    std::vector<std::string> filter;
    for (const auto& route : _routes) {
        filter.push_back(route.first);
    }

    DEBUG("BLEPathDiscoverer: Discovering " +
          (filter.empty() ? std::string("all services") : std::to_string(filter.size()) + " services") +
          " on " + identifierToString(_peripheral));
    _session->discoverServices(_peripheral, filter);
}

void BLEPathDiscoverer::onServicesDiscovered(const std::vector<std::string>& services,
                                             const RadioError* error) {
    if (_finished || !_started || _services_resolved) {
        TRACE("BLEPathDiscoverer: Ignoring late service result for " + identifierToString(_peripheral));
        return;
    }
    _services_resolved = true;

    if (error) {
        WARNING("BLEPathDiscoverer: Service discovery failed on " + identifierToString(_peripheral) +
                ": " + error->description);
        complete(StackError::radio(error));
        return;
    }

    // Fill the awaited set before issuing anything; answers may arrive inline.
    std::vector<std::string> targets;
    for (const std::string& service : services) {
        if (routeIncludes(service) && _awaited.insert(service).second) {
            targets.push_back(service);
        }
    }

    if (targets.empty()) {
        DEBUG("BLEPathDiscoverer: No matching services on " + identifierToString(_peripheral));
        complete(StackError());
        return;
    }

    for (const std::string& service : targets) {
        if (_finished) {
            break;
        }
        std::vector<std::string> filter;
        auto route = _routes.find(service);
        if (route != _routes.end()) {
            filter = route->second;
        }
        TRACE("BLEPathDiscoverer: Discovering characteristics of " + service);
        _session->discoverCharacteristics(_peripheral, service, filter);
    }
}

void BLEPathDiscoverer::onCharacteristicsDiscovered(const std::string& service,
                                                    const std::vector<CharacteristicInfo>& characteristics,
                                                    const RadioError* error) {
    if (_finished) {
        TRACE("BLEPathDiscoverer: Ignoring late characteristic result for " + service);
        return;
    }
    if (_awaited.erase(service) == 0) {
        TRACE("BLEPathDiscoverer: Unexpected characteristic result for " + service);
        return;
    }

    if (error) {
        WARNING("BLEPathDiscoverer: Characteristic discovery failed for " + service +
                ": " + error->description);
        complete(StackError::radio(error));
        return;
    }

    _resolved[service] = characteristics;

    if (_awaited.empty()) {
        complete(StackError());
    }
}

bool BLEPathDiscoverer::routeIncludes(const std::string& service) const {
    return _routes.empty() || _routes.count(service) > 0;
}

void BLEPathDiscoverer::complete(const StackError& error) {
    if (_finished) {
        return;
    }
    _finished = true;

    std::vector<KnownPath> paths;
    if (error.ok()) {
        for (const auto& entry : _resolved) {
            for (const CharacteristicInfo& characteristic : entry.second) {
                KnownPath path;
                path.peripheral = _peripheral;
                path.service = entry.first;
                path.characteristic = characteristic.uuid;
                path.handle = characteristic.handle;
                paths.push_back(path);
            }
        }
        DEBUG("BLEPathDiscoverer: Resolved " + std::to_string(paths.size()) + " paths on " +
              identifierToString(_peripheral));
    }
    _awaited.clear();
    _resolved.clear();

    OnComplete on_complete = _on_complete;
    _on_complete = nullptr;
    if (on_complete) {
        on_complete(error, paths);
    }
}

}} // namespace CentralStack::BLE
