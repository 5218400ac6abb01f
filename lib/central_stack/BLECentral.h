/**
 * @file BLECentral.h
 * @brief Central-role session facade
 *
 * BLECentral drives a Radio Session on behalf of an application. It turns
 * fire-and-forget radio commands and their asynchronous callbacks into a
 * session with explicit readiness, one pending operation per
 * (instruction, peripheral), and observable views of everything it tracks.
 *
 * Usage:
 *   RadioSessionFactory::setCreator([]() { return std::make_shared<MyRadio>(); });
 *
 *   BLECentral central;
 *   central.initializeSession();
 *   central.systemReady().subscribe([&](bool ready) {
 *       if (ready) central.startScanning(ScanConfiguration(), on_error);
 *   });
 *
 * Commands return true when accepted. A rejected command returns false and
 * reports the reason through its OnError before anything changes. Outcomes of
 * accepted commands arrive later through the same OnError, or through the
 * views.
 */
#pragma once

#include "BLETypes.h"
#include "BLEConfiguration.h"
#include "BLERadioSession.h"
#include "BLEStateContainer.h"
#include "BLEOperationRegistry.h"
#include "BLEPeerManager.h"
#include "BLEPathDiscoverer.h"
#include "BLEFormatting.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>

namespace CentralStack { namespace BLE {

class BLECentral {
public:
    /**
     * @brief Construct a central session facade
     * @param creator Radio Session creator; RadioSessionFactory is used if empty
     */
    explicit BLECentral(RadioSessionFactory::Creator creator = nullptr);

    virtual ~BLECentral();

    BLECentral(const BLECentral&) = delete;
    BLECentral& operator=(const BLECentral&) = delete;

    //=========================================================================
    // Session
    //=========================================================================

    /**
     * @brief Create and open a fresh Radio Session
     *
     * Any previous session is closed and its late events are dropped. All
     * bookkeeping is reset and the radio state becomes absent until the new
     * session reports one.
     *
     * @return false if no session could be created or opened
     */
    bool initializeSession(const SessionConfiguration& config = SessionConfiguration::standard());

    bool hasSession() const;

    //=========================================================================
    // Commands
    //=========================================================================

    /**
     * @brief Start scanning for peripherals
     *
     * Clears the discovered peripherals of any previous scan.
     * Errors: SYSTEM_NOT_READY, INVALID_INSTRUCTION (already scanning).
     */
    bool startScanning(const ScanConfiguration& config, Callbacks::OnError on_error);

    /**
     * @brief Stop an active scan
     *
     * Errors: INVALID_INSTRUCTION (not scanning).
     */
    bool stopScanning(Callbacks::OnError on_error);

    /**
     * @brief Connect to a peripheral and resolve its paths
     *
     * The peripheral reaches connectedPeripherals() only once every requested
     * path is resolved. There is no timeout; use cancelConnection().
     * Errors: SYSTEM_NOT_READY, INVALID_INSTRUCTION (connect or disconnect
     * pending, or already connected), then asynchronously RADIO_ERROR.
     */
    bool connectPeripheral(const ConnectionConfiguration& config, Callbacks::OnError on_error);

    /**
     * @brief Cancel a pending connect or disconnect an established link
     *
     * Errors: SYSTEM_NOT_READY, INVALID_INSTRUCTION (disconnect pending),
     * UNKNOWN_DEVICE (neither connecting nor connected), then
     * asynchronously RADIO_ERROR.
     */
    bool cancelConnection(const Bytes& peripheral, Callbacks::OnError on_error);

    /**
     * @brief Connect to a peripheral not seen in the current scan
     *
     * The identifier must be remembered by the platform or be connected to
     * the system with one of the configured services.
     * Errors: as connectPeripheral(), plus UNKNOWN_DEVICE.
     */
    bool reconnectToPeripheral(const ReconnectConfiguration& config, Callbacks::OnError on_error);

    /**
     * @brief Find a resolved path
     * @return NONE with out filled, or UNKNOWN_PATH
     */
    StackError lookupPath(const Bytes& peripheral, const std::string& service,
                          const std::string& characteristic, KnownPath& out) const;

    /**
     * @brief Forget discovered peripherals not seen for max_age seconds
     * @return Number of peripherals removed
     */
    size_t pruneStalePeripherals(double max_age = Timing::PERIPHERAL_TIMEOUT);

    //=========================================================================
    // Views
    //=========================================================================

    IObservable<bool>& systemReady() { return _system_ready_view; }
    IObservable<bool>& scanning() { return _scanning_view; }
    IObservable<PeripheralList>& availablePeripherals() { return _available_view; }
    IObservable<IdentifierSet>& connectingPeripherals() { return _peer_manager.connecting(); }
    IObservable<IdentifierSet>& connectedPeripherals() { return _peer_manager.connected(); }
    IObservable<PathList>& knownPaths() { return _peer_manager.paths(); }

    //=========================================================================
    // Diagnostics
    //=========================================================================

    /**
     * @brief Report why the system is or is not ready
     */
    SystemReadyTroubleshooting troubleshootSystemReady() const;

    /**
     * @brief Number of terminal radio events that matched no pending operation
     *
     * Also counts internal teardowns that ended with a radio error.
     */
    uint32_t anomalyCount() const;

    void setOnAnomaly(Callbacks::OnAnomaly callback);

    /**
     * @brief Number of pending operations (all instructions)
     */
    size_t pendingOperationCount() const { return _registry.size(); }

private:
    //=========================================================================
    // Radio Session event handlers
    //=========================================================================

    void onStateChanged(RadioState state);
    void onPeripheralDiscovered(const DiscoveredPeripheral& report);
    void onConnected(const Bytes& peripheral);
    void onConnectFailed(const Bytes& peripheral, const RadioError* error);
    void onDisconnected(const Bytes& peripheral, const RadioError* error);
    void onServicesDiscovered(const Bytes& peripheral, const std::vector<std::string>& services,
                              const RadioError* error);
    void onCharacteristicsDiscovered(const Bytes& peripheral, const std::string& service,
                                     const std::vector<CharacteristicInfo>& characteristics,
                                     const RadioError* error);
    void onPathsResolved(uint32_t generation, const Bytes& peripheral, const BLEPathDiscoverer* discoverer,
                         const StackError& error, const std::vector<KnownPath>& paths);

    //=========================================================================
    // Helpers
    //=========================================================================

    void setupCallbacks(const IRadioSession::Ptr& session, uint32_t generation);
    void detachCallbacks(const IRadioSession::Ptr& session);
    void closeSession();
    void resetBookkeeping();

    bool isReady() const;
    bool isCurrent(uint32_t generation) const { return generation == _generation; }
    bool reject(const Callbacks::OnError& on_error, ErrorKind kind, const std::string& command);
    void teardown(const Bytes& peripheral);
    void recordAnomaly(const Bytes& peripheral, const std::string& reason);
    BLEPathDiscoverer::Ptr discovererFor(const Bytes& peripheral) const;

    //=========================================================================
    // State
    //=========================================================================

    mutable std::recursive_mutex _mutex;

    RadioSessionFactory::Creator _creator;
    IRadioSession::Ptr _session;
    uint32_t _generation = 0;

    StateContainer<RadioStatus> _radio_status;
    BLEOperationRegistry _registry;
    BLEPeerManager _peer_manager;
    std::map<Bytes, BLEPathDiscoverer::Ptr> _discoverers;

    uint32_t _anomaly_count = 0;
    Callbacks::OnAnomaly _on_anomaly;

    // Views subscribe to the containers above and are destroyed before them
    DerivedView<RadioStatus, bool> _system_ready_view;
    DerivedView<RegistrySnapshot, bool> _scanning_view;
    DerivedView<PeripheralList, PeripheralList> _available_view;
};

}} // namespace CentralStack::BLE
