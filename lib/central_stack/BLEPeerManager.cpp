/**
 * @file BLEPeerManager.cpp
 * @brief Peripheral bookkeeping implementation
 */

#include "BLEPeerManager.h"
#include "Log.h"

#include <algorithm>

namespace CentralStack { namespace BLE {

BLEPeerManager::BLEPeerManager(size_t max_discovered)
    : _max_discovered(max_discovered > 0 ? max_discovered : 1) {
}

//=============================================================================
// Discovery
//=============================================================================

bool BLEPeerManager::addDiscoveredPeer(const DiscoveredPeripheral& report) {
    DiscoveredPeripheral peer = report;
    peer.discovered_at = RNS::Utilities::OS::time();

    bool is_new = false;
    Bytes evicted;
    size_t limit = _max_discovered;

    _discovered.update([&](PeripheralList& list) {
        auto it = std::find(list.begin(), list.end(), peer);
        if (it != list.end()) {
            *it = peer;
            return true;
        }

        if (list.size() >= limit) {
            auto oldest = std::min_element(list.begin(), list.end(),
                [](const DiscoveredPeripheral& a, const DiscoveredPeripheral& b) {
                    return a.discovered_at < b.discovered_at;
                });
            evicted = oldest->identifier;
            list.erase(oldest);
        }

        list.push_back(peer);
        is_new = true;
        return true;
    });

    if (evicted.size() > 0) {
        DEBUG("BLEPeerManager: Discovery cache full, evicted " + identifierToString(evicted));
    }
    if (is_new) {
        DEBUG("BLEPeerManager: Discovered new peripheral " + identifierToString(peer.identifier) +
              " RSSI " + std::to_string(peer.rssi));
    }
    return is_new;
}

bool BLEPeerManager::getDiscoveredPeer(const Bytes& identifier, DiscoveredPeripheral& out) const {
    PeripheralList list = _discovered.value();
    for (const DiscoveredPeripheral& peer : list) {
        if (peer.identifier == identifier) {
            out = peer;
            return true;
        }
    }
    return false;
}

size_t BLEPeerManager::cleanupStalePeers(double max_age) {
    double now = RNS::Utilities::OS::time();
    size_t removed = 0;

    _discovered.update([&](PeripheralList& list) {
        auto stale = std::remove_if(list.begin(), list.end(),
            [now, max_age](const DiscoveredPeripheral& peer) {
                return (now - peer.discovered_at) > max_age;
            });
        removed = static_cast<size_t>(std::distance(stale, list.end()));
        list.erase(stale, list.end());
        return removed > 0;
    });

    if (removed > 0) {
        TRACE("BLEPeerManager: Removed " + std::to_string(removed) + " stale peripherals");
    }
    return removed;
}

void BLEPeerManager::clearDiscovered() {
    _discovered.set(PeripheralList());
}

//=============================================================================
// Connection Tracking
//=============================================================================

void BLEPeerManager::beginConnecting(const Bytes& identifier) {
    _connected.update([&identifier](IdentifierSet& ids) {
        return ids.erase(identifier) > 0;
    });
    _connecting.update([&identifier](IdentifierSet& ids) {
        ids.insert(identifier);
        return true;
    });
}

bool BLEPeerManager::promoteToConnected(const Bytes& identifier) {
    bool was_connecting = _connecting.update([&identifier](IdentifierSet& ids) {
        return ids.erase(identifier) > 0;
    });
    if (!was_connecting) {
        return false;
    }

    _connected.update([&identifier](IdentifierSet& ids) {
        ids.insert(identifier);
        return true;
    });
    return true;
}

bool BLEPeerManager::isConnecting(const Bytes& identifier) const {
    IdentifierSet ids = _connecting.value();
    return ids.count(identifier) > 0;
}

bool BLEPeerManager::isConnected(const Bytes& identifier) const {
    IdentifierSet ids = _connected.value();
    return ids.count(identifier) > 0;
}

BLEPeerManager::Released BLEPeerManager::release(const Bytes& identifier) {
    bool was_connecting = _connecting.update([&identifier](IdentifierSet& ids) {
        return ids.erase(identifier) > 0;
    });
    bool was_connected = _connected.update([&identifier](IdentifierSet& ids) {
        return ids.erase(identifier) > 0;
    });

    if (was_connected) {
        return Released::CONNECTED;
    }
    return was_connecting ? Released::CONNECTING : Released::NONE;
}

bool BLEPeerManager::abandonConnecting(const Bytes& identifier) {
    return _connecting.update([&identifier](IdentifierSet& ids) {
        return ids.erase(identifier) > 0;
    });
}

//=============================================================================
// Known Paths
//=============================================================================

void BLEPeerManager::addPaths(const std::vector<KnownPath>& paths) {
    _paths.update([&paths](PathList& known) {
        for (const KnownPath& path : paths) {
            auto it = std::find_if(known.begin(), known.end(), [&path](const KnownPath& existing) {
                return existing.matches(path.peripheral, path.service, path.characteristic);
            });
            if (it != known.end()) {
                *it = path;
            } else {
                known.push_back(path);
            }
        }
        return true;
    });
}

size_t BLEPeerManager::removePathsFor(const Bytes& identifier) {
    size_t removed = 0;
    _paths.update([&](PathList& known) {
        auto first = std::remove_if(known.begin(), known.end(), [&identifier](const KnownPath& path) {
            return path.peripheral == identifier;
        });
        removed = static_cast<size_t>(std::distance(first, known.end()));
        known.erase(first, known.end());
        return true;
    });

    if (removed > 0) {
        DEBUG("BLEPeerManager: Pruned " + std::to_string(removed) + " paths of " +
              identifierToString(identifier));
    }
    return removed;
}

bool BLEPeerManager::findPath(const Bytes& identifier, const std::string& service,
                              const std::string& characteristic, KnownPath& out) const {
    PathList known = _paths.value();
    for (const KnownPath& path : known) {
        if (path.matches(identifier, service, characteristic)) {
            out = path;
            return true;
        }
    }
    return false;
}

//=============================================================================
// Lifecycle
//=============================================================================

void BLEPeerManager::reset() {
    _discovered.set(PeripheralList());
    _connecting.set(IdentifierSet());
    _connected.set(IdentifierSet());
    _paths.set(PathList());
}

}} // namespace CentralStack::BLE
