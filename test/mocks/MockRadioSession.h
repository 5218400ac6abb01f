/**
 * @file MockRadioSession.h
 * @brief Scriptable Radio Session for native unit tests
 *
 * Records every command it receives and lets a test deliver radio events
 * through the callbacks the session under test registered. Hooks run inside
 * a command so a test can answer synchronously, before the command returns.
 */
#pragma once

#include "BLERadioSession.h"

#include <algorithm>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace CentralStack { namespace BLE { namespace Mock {

struct RecordedCommand {
    std::string name;
    Bytes peripheral;
    std::string service;
    std::vector<std::string> filter;
};

class MockRadioSession : public IRadioSession {
public:
    //=========================================================================
    // Scripting
    //=========================================================================

    bool open_result = true;
    AuthorizationState authorization_state = AuthorizationState::ALLOWED_ALWAYS;
    std::set<Bytes> known_identifiers;
    std::vector<Bytes> connected_matching;

    // Run inside the matching command
    std::function<void(const Bytes& peripheral)> on_connect;
    std::function<void(const Bytes& peripheral)> on_cancel;
    std::function<void(const Bytes& peripheral, const std::vector<std::string>& filter)> on_discover_services;
    std::function<void(const Bytes& peripheral, const std::string& service,
                       const std::vector<std::string>& filter)> on_discover_characteristics;

    bool opened = false;
    bool closed = false;
    SessionConfiguration last_session_config;
    ScanConfiguration last_scan_config;
    ConnectOptions last_connect_options;
    std::vector<RecordedCommand> commands;

    //=========================================================================
    // IRadioSession
    //=========================================================================

    bool open(const SessionConfiguration& config) override {
        record("open");
        last_session_config = config;
        opened = open_result;
        return open_result;
    }

    void close() override {
        record("close");
        closed = true;
    }

    AuthorizationState authorization() const override { return authorization_state; }

    void startScan(const ScanConfiguration& config) override {
        record("startScan");
        last_scan_config = config;
    }

    void stopScan() override { record("stopScan"); }

    void connect(const Bytes& peripheral, const ConnectOptions& options) override {
        record("connect", peripheral);
        last_connect_options = options;
        if (on_connect) on_connect(peripheral);
    }

    void cancelOrDisconnect(const Bytes& peripheral) override {
        record("cancelOrDisconnect", peripheral);
        if (on_cancel) on_cancel(peripheral);
    }

    bool lookupKnownIdentifier(const Bytes& peripheral) override {
        record("lookupKnownIdentifier", peripheral);
        return known_identifiers.count(peripheral) > 0;
    }

    std::vector<Bytes> lookupConnectedMatchingServices(const std::vector<std::string>& services) override {
        RecordedCommand command;
        command.name = "lookupConnectedMatchingServices";
        command.filter = services;
        commands.push_back(command);
        return connected_matching;
    }

    void discoverServices(const Bytes& peripheral, const std::vector<std::string>& filter) override {
        RecordedCommand command;
        command.name = "discoverServices";
        command.peripheral = peripheral;
        command.filter = filter;
        commands.push_back(command);
        if (on_discover_services) on_discover_services(peripheral, filter);
    }

    void discoverCharacteristics(const Bytes& peripheral, const std::string& service,
                                 const std::vector<std::string>& filter) override {
        RecordedCommand command;
        command.name = "discoverCharacteristics";
        command.peripheral = peripheral;
        command.service = service;
        command.filter = filter;
        commands.push_back(command);
        if (on_discover_characteristics) on_discover_characteristics(peripheral, service, filter);
    }

    void setOnStateChanged(Callbacks::OnStateChanged callback) override { _on_state_changed = callback; }
    void setOnPeripheralDiscovered(Callbacks::OnPeripheralDiscovered callback) override { _on_discovered = callback; }
    void setOnConnected(Callbacks::OnConnected callback) override { _on_connected = callback; }
    void setOnConnectFailed(Callbacks::OnConnectFailed callback) override { _on_connect_failed = callback; }
    void setOnDisconnected(Callbacks::OnDisconnected callback) override { _on_disconnected = callback; }
    void setOnServicesDiscovered(Callbacks::OnServicesDiscovered callback) override { _on_services = callback; }
    void setOnCharacteristicsDiscovered(Callbacks::OnCharacteristicsDiscovered callback) override {
        _on_characteristics = callback;
    }

    std::string getPlatformName() const override { return "Mock"; }

    //=========================================================================
    // Event delivery
    //=========================================================================

    void emitState(RadioState state) {
        if (_on_state_changed) _on_state_changed(state);
    }

    void emitDiscovered(const Bytes& peripheral, int16_t rssi, const std::string& name = "") {
        DiscoveredPeripheral report;
        report.identifier = peripheral;
        report.name = name;
        report.rssi = rssi;
        if (_on_discovered) _on_discovered(report);
    }

    void emitConnected(const Bytes& peripheral) {
        if (_on_connected) _on_connected(peripheral);
    }

    void emitConnectFailed(const Bytes& peripheral, const RadioError* error) {
        if (_on_connect_failed) _on_connect_failed(peripheral, error);
    }

    void emitDisconnected(const Bytes& peripheral, const RadioError* error = nullptr) {
        if (_on_disconnected) _on_disconnected(peripheral, error);
    }

    void emitServices(const Bytes& peripheral, const std::vector<std::string>& services,
                      const RadioError* error = nullptr) {
        if (_on_services) _on_services(peripheral, services, error);
    }

    void emitCharacteristics(const Bytes& peripheral, const std::string& service,
                             const std::vector<CharacteristicInfo>& characteristics,
                             const RadioError* error = nullptr) {
        if (_on_characteristics) _on_characteristics(peripheral, service, characteristics, error);
    }

    //=========================================================================
    // Inspection
    //=========================================================================

    size_t count(const std::string& name) const {
        return static_cast<size_t>(std::count_if(commands.begin(), commands.end(),
            [&name](const RecordedCommand& command) { return command.name == name; }));
    }

    const RecordedCommand* last(const std::string& name) const {
        for (auto it = commands.rbegin(); it != commands.rend(); ++it) {
            if (it->name == name) return &(*it);
        }
        return nullptr;
    }

    bool hasCallbacks() const {
        return _on_state_changed || _on_discovered || _on_connected || _on_connect_failed ||
               _on_disconnected || _on_services || _on_characteristics;
    }

private:
    void record(const std::string& name, const Bytes& peripheral = Bytes()) {
        RecordedCommand command;
        command.name = name;
        command.peripheral = peripheral;
        commands.push_back(command);
    }

    Callbacks::OnStateChanged _on_state_changed;
    Callbacks::OnPeripheralDiscovered _on_discovered;
    Callbacks::OnConnected _on_connected;
    Callbacks::OnConnectFailed _on_connect_failed;
    Callbacks::OnDisconnected _on_disconnected;
    Callbacks::OnServicesDiscovered _on_services;
    Callbacks::OnCharacteristicsDiscovered _on_characteristics;
};

}}} // namespace CentralStack::BLE::Mock
