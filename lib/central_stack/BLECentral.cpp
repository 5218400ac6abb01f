/**
 * @file BLECentral.cpp
 * @brief Central-role session facade implementation
 */

#include "BLECentral.h"
#include "Log.h"

#include <algorithm>

namespace CentralStack { namespace BLE {

BLECentral::BLECentral(RadioSessionFactory::Creator creator)
    : _creator(creator),
      _system_ready_view(_radio_status, Formatting::systemReady),
      _scanning_view(_registry.snapshot(), Formatting::isScanning),
      _available_view(_peer_manager.discovered(), Formatting::sortedByStrength) {
}

BLECentral::~BLECentral() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    closeSession();
}

//=============================================================================
// Session
//=============================================================================

bool BLECentral::initializeSession(const SessionConfiguration& config) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (_session) {
        INFO("BLECentral: Replacing " + _session->getPlatformName() + " session");
        closeSession();
    }

    ++_generation;
    resetBookkeeping();

    IRadioSession::Ptr session = _creator ? _creator() : RadioSessionFactory::create();
    if (!session) {
        ERROR("BLECentral: Failed to create radio session");
        return false;
    }

    _session = session;
    setupCallbacks(session, _generation);

    if (!session->open(config)) {
        ERROR("BLECentral: Failed to open " + session->getPlatformName() + " session");
        detachCallbacks(session);
        _session.reset();
        return false;
    }

    INFO("BLECentral: Session " + std::to_string(_generation) + " opened on " +
         session->getPlatformName());
    return true;
}

bool BLECentral::hasSession() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return static_cast<bool>(_session);
}

//=============================================================================
// Commands
//=============================================================================

bool BLECentral::startScanning(const ScanConfiguration& config, Callbacks::OnError on_error) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (!isReady()) {
        return reject(on_error, ErrorKind::SYSTEM_NOT_READY, "startScanning");
    }
    if (_registry.contains(Instruction::SCANNING)) {
        return reject(on_error, ErrorKind::INVALID_INSTRUCTION, "startScanning");
    }

    _peer_manager.clearDiscovered();
    _registry.insert(PendingOperation::scanning());

    INFO("BLECentral: Scanning for " +
         (config.service_identifiers.empty() ? std::string("any service")
                                             : std::to_string(config.service_identifiers.size()) + " services"));
    _session->startScan(config);
    return true;
}

bool BLECentral::stopScanning(Callbacks::OnError on_error) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (!_registry.contains(Instruction::SCANNING)) {
        return reject(on_error, ErrorKind::INVALID_INSTRUCTION, "stopScanning");
    }

    if (_session) {
        _session->stopScan();
    }
    _registry.remove(PendingOperation::scanning());

    INFO("BLECentral: Scanning stopped");
    return true;
}

bool BLECentral::connectPeripheral(const ConnectionConfiguration& config, Callbacks::OnError on_error) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    const Bytes& peripheral = config.peripheral;

    if (!isReady()) {
        return reject(on_error, ErrorKind::SYSTEM_NOT_READY, "connectPeripheral");
    }
    if (_registry.contains(Instruction::CONNECTING, peripheral) || _peer_manager.isConnected(peripheral)) {
        return reject(on_error, ErrorKind::INVALID_INSTRUCTION, "connectPeripheral");
    }
    // The disconnected event that ends a pending teardown would consume a new CONNECTING entry
    if (_registry.contains(Instruction::DISCONNECTING, peripheral)) {
        return reject(on_error, ErrorKind::INVALID_INSTRUCTION, "connectPeripheral");
    }

    _peer_manager.beginConnecting(peripheral);
    if (!_registry.insert(PendingOperation::connecting(peripheral, config.routes, on_error))) {
        _peer_manager.release(peripheral);
        return reject(on_error, ErrorKind::INVALID_INSTRUCTION, "connectPeripheral");
    }

    INFO("BLECentral: Connecting to " + identifierToString(peripheral));
    _session->connect(peripheral, config.options);
    return true;
}

bool BLECentral::cancelConnection(const Bytes& peripheral, Callbacks::OnError on_error) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (!isReady()) {
        return reject(on_error, ErrorKind::SYSTEM_NOT_READY, "cancelConnection");
    }
    if (_registry.contains(Instruction::DISCONNECTING, peripheral)) {
        return reject(on_error, ErrorKind::INVALID_INSTRUCTION, "cancelConnection");
    }
    if (!_peer_manager.isConnecting(peripheral) && !_peer_manager.isConnected(peripheral)) {
        return reject(on_error, ErrorKind::UNKNOWN_DEVICE, "cancelConnection");
    }

    BLEPeerManager::Released released = _peer_manager.release(peripheral);
    _registry.insert(PendingOperation::disconnecting(peripheral, on_error));

    INFO("BLECentral: " +
         std::string(released == BLEPeerManager::Released::CONNECTED ? "Disconnecting " : "Cancelling connect to ") +
         identifierToString(peripheral));
    _session->cancelOrDisconnect(peripheral);
    return true;
}

bool BLECentral::reconnectToPeripheral(const ReconnectConfiguration& config, Callbacks::OnError on_error) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (!isReady()) {
        return reject(on_error, ErrorKind::SYSTEM_NOT_READY, "reconnectToPeripheral");
    }

    bool resolved = _session->lookupKnownIdentifier(config.peripheral);
    if (!resolved) {
        std::vector<Bytes> connected = _session->lookupConnectedMatchingServices(config.service_identifiers);
        resolved = std::find(connected.begin(), connected.end(), config.peripheral) != connected.end();
    }
    if (!resolved) {
        return reject(on_error, ErrorKind::UNKNOWN_DEVICE, "reconnectToPeripheral");
    }

    DEBUG("BLECentral: Resolved " + identifierToString(config.peripheral) + " for reconnect");
    return connectPeripheral(config.toConnectionConfiguration(), on_error);
}

StackError BLECentral::lookupPath(const Bytes& peripheral, const std::string& service,
                                  const std::string& characteristic, KnownPath& out) const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (!_peer_manager.findPath(peripheral, service, characteristic, out)) {
        return StackError(ErrorKind::UNKNOWN_PATH);
    }
    return StackError();
}

size_t BLECentral::pruneStalePeripherals(double max_age) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _peer_manager.cleanupStalePeers(max_age);
}

//=============================================================================
// Diagnostics
//=============================================================================

SystemReadyTroubleshooting BLECentral::troubleshootSystemReady() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    RadioStatus status = _radio_status.value();

    SystemReadyTroubleshooting report;
    report.has_radio_state = status.reported;
    report.radio_state = status.state;
    report.authorization = _session ? _session->authorization() : AuthorizationState::NOT_DETERMINED;
    return report;
}

uint32_t BLECentral::anomalyCount() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _anomaly_count;
}

void BLECentral::setOnAnomaly(Callbacks::OnAnomaly callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _on_anomaly = callback;
}

//=============================================================================
// Radio Session Callbacks
//=============================================================================

void BLECentral::setupCallbacks(const IRadioSession::Ptr& session, uint32_t generation) {
    session->setOnStateChanged([this, generation](RadioState state) {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (isCurrent(generation)) onStateChanged(state);
    });

    session->setOnPeripheralDiscovered([this, generation](const DiscoveredPeripheral& report) {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (isCurrent(generation)) onPeripheralDiscovered(report);
    });

    session->setOnConnected([this, generation](const Bytes& peripheral) {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (isCurrent(generation)) onConnected(peripheral);
    });

    session->setOnConnectFailed([this, generation](const Bytes& peripheral, const RadioError* error) {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (isCurrent(generation)) onConnectFailed(peripheral, error);
    });

    session->setOnDisconnected([this, generation](const Bytes& peripheral, const RadioError* error) {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (isCurrent(generation)) onDisconnected(peripheral, error);
    });

    session->setOnServicesDiscovered([this, generation](const Bytes& peripheral,
                                                        const std::vector<std::string>& services,
                                                        const RadioError* error) {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (isCurrent(generation)) onServicesDiscovered(peripheral, services, error);
    });

    session->setOnCharacteristicsDiscovered([this, generation](const Bytes& peripheral,
                                                               const std::string& service,
                                                               const std::vector<CharacteristicInfo>& characteristics,
                                                               const RadioError* error) {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (isCurrent(generation)) onCharacteristicsDiscovered(peripheral, service, characteristics, error);
    });
}

void BLECentral::detachCallbacks(const IRadioSession::Ptr& session) {
    session->setOnStateChanged(nullptr);
    session->setOnPeripheralDiscovered(nullptr);
    session->setOnConnected(nullptr);
    session->setOnConnectFailed(nullptr);
    session->setOnDisconnected(nullptr);
    session->setOnServicesDiscovered(nullptr);
    session->setOnCharacteristicsDiscovered(nullptr);
}

void BLECentral::onStateChanged(RadioState state) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    INFO("BLECentral: Radio state " + std::string(radioStateToString(state)));
    _radio_status.set(RadioStatus::of(state));
}

void BLECentral::onPeripheralDiscovered(const DiscoveredPeripheral& report) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    _peer_manager.addDiscoveredPeer(report);
}

void BLECentral::onConnected(const Bytes& peripheral) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    PendingOperation entry;
    if (!_registry.findAddressee(peripheral, Instruction::CONNECTING, entry)) {
        recordAnomaly(peripheral, "connected without a pending connect");
        return;
    }

    if (_discoverers.count(peripheral) > 0) {
        DEBUG("BLECentral: Restarting path discovery for " + identifierToString(peripheral));
    }

    BLEPathDiscoverer::Ptr discoverer = std::make_shared<BLEPathDiscoverer>(_session, peripheral);
    _discoverers[peripheral] = discoverer;

    DEBUG("BLECentral: Connected to " + identifierToString(peripheral) + ", resolving paths");

    uint32_t generation = _generation;
    const BLEPathDiscoverer* handle = discoverer.get();
    discoverer->discoverPaths(entry.addressee.routes,
        [this, generation, peripheral, handle](const StackError& error, const std::vector<KnownPath>& paths) {
            onPathsResolved(generation, peripheral, handle, error, paths);
        });
}

void BLECentral::onPathsResolved(uint32_t generation, const Bytes& peripheral,
                                 const BLEPathDiscoverer* discoverer,
                                 const StackError& error, const std::vector<KnownPath>& paths) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    auto it = _discoverers.find(peripheral);
    if (!isCurrent(generation) || it == _discoverers.end() || it->second.get() != discoverer) {
        TRACE("BLECentral: Ignoring paths from a discarded discoverer for " + identifierToString(peripheral));
        return;
    }
    _discoverers.erase(it);

    PendingOperation entry;
    bool had_entry = _registry.take(peripheral, Instruction::CONNECTING, entry);

    if (error.ok()) {
        if (!_peer_manager.isConnecting(peripheral)) {
            DEBUG("BLECentral: " + identifierToString(peripheral) +
                  " was cancelled while resolving paths, discarding " + std::to_string(paths.size()));
            return;
        }
        _peer_manager.addPaths(paths);
        _peer_manager.promoteToConnected(peripheral);
        INFO("BLECentral: Connected to " + identifierToString(peripheral) + " with " +
             std::to_string(paths.size()) + " paths");
        return;
    }

    WARNING("BLECentral: Path discovery failed for " + identifierToString(peripheral) + ": " + error.toString());
    teardown(peripheral);
    if (had_entry) {
        entry.fail(error);
    }
}

void BLECentral::onConnectFailed(const Bytes& peripheral, const RadioError* error) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    PendingOperation entry;
    if (!_registry.take(peripheral, Instruction::CONNECTING, entry)) {
        _peer_manager.abandonConnecting(peripheral);
        recordAnomaly(peripheral, "connect failed without a pending connect");
        return;
    }

    _peer_manager.abandonConnecting(peripheral);
    _discoverers.erase(peripheral);

    StackError failure = StackError::radio(error);
    WARNING("BLECentral: Connect to " + identifierToString(peripheral) + " failed: " + failure.toString());
    entry.fail(failure);
}

void BLECentral::onDisconnected(const Bytes& peripheral, const RadioError* error) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    PendingOperation connecting;
    PendingOperation disconnecting;
    bool had_connecting = _registry.take(peripheral, Instruction::CONNECTING, connecting);
    bool had_disconnecting = _registry.take(peripheral, Instruction::DISCONNECTING, disconnecting);

    _peer_manager.removePathsFor(peripheral);
    _peer_manager.release(peripheral);
    _discoverers.erase(peripheral);

    if (!error) {
        INFO("BLECentral: Disconnected from " + identifierToString(peripheral));
        return;
    }

    StackError failure = StackError::radio(error);
    WARNING("BLECentral: Disconnected from " + identifierToString(peripheral) + ": " + failure.toString());
    if (had_connecting) {
        connecting.fail(failure);
    }
    if (had_disconnecting) {
        disconnecting.fail(failure);
    }
}

void BLECentral::onServicesDiscovered(const Bytes& peripheral, const std::vector<std::string>& services,
                                      const RadioError* error) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    BLEPathDiscoverer::Ptr discoverer = discovererFor(peripheral);
    if (!discoverer) {
        TRACE("BLECentral: No path discovery for " + identifierToString(peripheral) + ", ignoring services");
        return;
    }
    discoverer->onServicesDiscovered(services, error);
}

void BLECentral::onCharacteristicsDiscovered(const Bytes& peripheral, const std::string& service,
                                             const std::vector<CharacteristicInfo>& characteristics,
                                             const RadioError* error) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    BLEPathDiscoverer::Ptr discoverer = discovererFor(peripheral);
    if (!discoverer) {
        TRACE("BLECentral: No path discovery for " + identifierToString(peripheral) +
              ", ignoring characteristics of " + service);
        return;
    }
    discoverer->onCharacteristicsDiscovered(service, characteristics, error);
}

//=============================================================================
// Helpers
//=============================================================================

void BLECentral::closeSession() {
    if (!_session) {
        return;
    }
    detachCallbacks(_session);
    _session->close();
    _session.reset();
}

void BLECentral::resetBookkeeping() {
    _discoverers.clear();
    size_t dropped = _registry.clear();
    _peer_manager.reset();
    _radio_status.set(RadioStatus());

    if (dropped > 0) {
        DEBUG("BLECentral: Dropped " + std::to_string(dropped) + " pending operations");
    }
}

bool BLECentral::isReady() const {
    return _session && Formatting::systemReady(_radio_status.value());
}

bool BLECentral::reject(const Callbacks::OnError& on_error, ErrorKind kind, const std::string& command) {
    DEBUG("BLECentral: " + command + " rejected: " + errorKindToString(kind));
    if (on_error) {
        on_error(StackError(kind));
    }
    return false;
}

void BLECentral::teardown(const Bytes& peripheral) {
    _peer_manager.release(peripheral);

    PendingOperation disconnect = PendingOperation::disconnecting(peripheral,
        [this, peripheral](const StackError& error) {
            recordAnomaly(peripheral, "teardown failed: " + error.toString());
        });
    if (!_registry.insert(disconnect)) {
        DEBUG("BLECentral: Disconnect of " + identifierToString(peripheral) + " already pending");
        return;
    }

    if (_session) {
        _session->cancelOrDisconnect(peripheral);
    }
}

void BLECentral::recordAnomaly(const Bytes& peripheral, const std::string& reason) {
    ++_anomaly_count;
    WARNING("BLECentral: Anomaly for " + identifierToString(peripheral) + ": " + reason);
    if (_on_anomaly) {
        _on_anomaly(peripheral, reason);
    }
}

BLEPathDiscoverer::Ptr BLECentral::discovererFor(const Bytes& peripheral) const {
    auto it = _discoverers.find(peripheral);
    if (it == _discoverers.end()) {
        return nullptr;
    }
    return it->second;
}

}} // namespace CentralStack::BLE
