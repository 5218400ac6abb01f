/**
 * @file BLEPeerManager.h
 * @brief Peripheral bookkeeping for the central session
 *
 * Tracks what the session knows about remote peripherals:
 * - Peripherals discovered by the current scan (update-or-insert by identifier)
 * - Identifiers with a connect attempt in flight
 * - Identifiers with an established, fully resolved connection
 * - Resolved communication paths of connected peripherals
 *
 * Each collection is held in a StateContainer so that every mutation is
 * published to the views built on top of it. The connecting and connected
 * sets are kept disjoint.
 */
#pragma once

#include "BLETypes.h"
#include "BLEStateContainer.h"
#include "Bytes.h"
#include "Utilities/OS.h"

#include <set>
#include <vector>
#include <cstdint>

namespace CentralStack { namespace BLE {

using PeripheralList = std::vector<DiscoveredPeripheral>;
using IdentifierSet = std::set<Bytes>;
using PathList = std::vector<KnownPath>;

class BLEPeerManager {
public:
    /**
     * @brief Which tracking set an identifier was released from
     */
    enum class Released : uint8_t {
        NONE,
        CONNECTING,
        CONNECTED
    };

    explicit BLEPeerManager(size_t max_discovered = Limits::MAX_DISCOVERED_PERIPHERALS);

    //=========================================================================
    // Discovery
    //=========================================================================

    /**
     * @brief Record a scan report
     *
     * A report for a known identifier replaces name, advertisement, RSSI and
     * timestamp in place. A new identifier is appended; when the list is full
     * the least recently seen peripheral is evicted first.
     *
     * @param report Peripheral as reported by the radio
     * @return true if the peripheral was new
     */
    bool addDiscoveredPeer(const DiscoveredPeripheral& report);

    /**
     * @brief Look up a discovered peripheral
     * @return false if the identifier was not discovered
     */
    bool getDiscoveredPeer(const Bytes& identifier, DiscoveredPeripheral& out) const;

    /**
     * @brief Remove discovered peripherals not seen for max_age seconds
     * @return Number of peripherals removed
     */
    size_t cleanupStalePeers(double max_age = Timing::PERIPHERAL_TIMEOUT);

    /**
     * @brief Forget every discovered peripheral
     */
    void clearDiscovered();

    size_t discoveredCount() const { return _discovered.value().size(); }

    //=========================================================================
    // Connection Tracking
    //=========================================================================

    /**
     * @brief Mark an identifier as connecting
     *
     * Removes it from the connected set if present.
     */
    void beginConnecting(const Bytes& identifier);

    /**
     * @brief Move an identifier from connecting to connected
     * @return false if it was not connecting (nothing changes)
     */
    bool promoteToConnected(const Bytes& identifier);

    bool isConnecting(const Bytes& identifier) const;
    bool isConnected(const Bytes& identifier) const;

    /**
     * @brief Drop an identifier from whichever tracking set holds it
     * @return The set it was removed from
     */
    Released release(const Bytes& identifier);

    /**
     * @brief Drop an identifier from the connecting set only
     * @return false if it was not connecting; the connected set is untouched
     */
    bool abandonConnecting(const Bytes& identifier);

    //=========================================================================
    // Known Paths
    //=========================================================================

    /**
     * @brief Record the resolved paths of a peripheral
     *
     * Paths already known for the same (peripheral, service, characteristic)
     * are replaced.
     */
    void addPaths(const std::vector<KnownPath>& paths);

    /**
     * @brief Forget every path of a peripheral
     * @return Number of paths removed
     */
    size_t removePathsFor(const Bytes& identifier);

    /**
     * @brief Find a resolved path
     * @return false if no path matches
     */
    bool findPath(const Bytes& identifier, const std::string& service,
                  const std::string& characteristic, KnownPath& out) const;

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Clear every collection
     */
    void reset();

    //=========================================================================
    // Observables
    //=========================================================================

    IObservable<PeripheralList>& discovered() { return _discovered; }
    IObservable<IdentifierSet>& connecting() { return _connecting; }
    IObservable<IdentifierSet>& connected() { return _connected; }
    IObservable<PathList>& paths() { return _paths; }

private:
    size_t _max_discovered;

    StateContainer<PeripheralList> _discovered;
    StateContainer<IdentifierSet> _connecting;
    StateContainer<IdentifierSet> _connected;
    StateContainer<PathList> _paths;
};

}} // namespace CentralStack::BLE
