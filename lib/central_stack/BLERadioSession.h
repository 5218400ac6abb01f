/**
 * @file BLERadioSession.h
 * @brief Radio Session abstraction consumed by the central stack
 *
 * The Radio Session is the platform layer that drives the actual radio:
 * scanning, connecting, disconnecting and structural discovery. Platform
 * implementations inherit from IRadioSession; BLECentral only issues
 * commands and consumes the callbacks registered here.
 *
 * All commands are fire-and-forget. Outcomes arrive later through the
 * registered callbacks, possibly on another thread and possibly before the
 * command returns.
 */
#pragma once

#include "BLETypes.h"
#include "BLEConfiguration.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace CentralStack { namespace BLE {

/**
 * @brief Abstract Radio Session interface
 */
class IRadioSession {
public:
    using Ptr = std::shared_ptr<IRadioSession>;

    virtual ~IRadioSession() = default;

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Open the session and begin delivering events
     *
     * The first state-changed event follows asynchronously.
     *
     * @param config Session configuration
     * @return true if the session was opened
     */
    virtual bool open(const SessionConfiguration& config) = 0;

    /**
     * @brief Close the session; no further events are delivered
     */
    virtual void close() = 0;

    /**
     * @brief Current authorization of the application to use the radio
     */
    virtual AuthorizationState authorization() const = 0;

    //=========================================================================
    // Scanning
    //=========================================================================

    virtual void startScan(const ScanConfiguration& config) = 0;

    virtual void stopScan() = 0;

    //=========================================================================
    // Connections
    //=========================================================================

    /**
     * @brief Start connecting to a peripheral
     *
     * There is no timeout: the attempt stays pending until a connected or
     * connect-failed event arrives, or cancelOrDisconnect() is issued.
     */
    virtual void connect(const Bytes& peripheral, const ConnectOptions& options) = 0;

    /**
     * @brief Cancel a pending connect or disconnect an established link
     *
     * The result is reported by a disconnected event.
     */
    virtual void cancelOrDisconnect(const Bytes& peripheral) = 0;

    /**
     * @brief Check whether the platform remembers a peripheral by identifier
     */
    virtual bool lookupKnownIdentifier(const Bytes& peripheral) = 0;

    /**
     * @brief Peripherals connected to the system (possibly by another
     * application) that expose any of the given services
     */
    virtual std::vector<Bytes> lookupConnectedMatchingServices(
        const std::vector<std::string>& service_identifiers) = 0;

    //=========================================================================
    // Structural Discovery
    //=========================================================================

    /**
     * @brief Discover services on a connected peripheral
     *
     * @param peripheral Connected peripheral
     * @param service_filter Services of interest (empty = all)
     */
    virtual void discoverServices(const Bytes& peripheral,
                                  const std::vector<std::string>& service_filter) = 0;

    /**
     * @brief Discover characteristics of one service
     *
     * @param peripheral Connected peripheral
     * @param service Service identifier
     * @param characteristic_filter Characteristics of interest (empty = all)
     */
    virtual void discoverCharacteristics(const Bytes& peripheral,
                                         const std::string& service,
                                         const std::vector<std::string>& characteristic_filter) = 0;

    //=========================================================================
    // Callback Registration
    //=========================================================================

    virtual void setOnStateChanged(Callbacks::OnStateChanged callback) = 0;
    virtual void setOnPeripheralDiscovered(Callbacks::OnPeripheralDiscovered callback) = 0;
    virtual void setOnConnected(Callbacks::OnConnected callback) = 0;
    virtual void setOnConnectFailed(Callbacks::OnConnectFailed callback) = 0;
    virtual void setOnDisconnected(Callbacks::OnDisconnected callback) = 0;
    virtual void setOnServicesDiscovered(Callbacks::OnServicesDiscovered callback) = 0;
    virtual void setOnCharacteristicsDiscovered(Callbacks::OnCharacteristicsDiscovered callback) = 0;

    //=========================================================================
    // Platform Info
    //=========================================================================

    /**
     * @brief Get human-readable platform name
     */
    virtual std::string getPlatformName() const = 0;
};

/**
 * @brief Factory for Radio Session implementations
 *
 * The platform layer registers a creator at startup; BLECentral asks the
 * factory for a fresh session on every initializeSession().
 */
class RadioSessionFactory {
public:
    using Creator = std::function<IRadioSession::Ptr()>;

    /**
     * @brief Register the creator used by create()
     */
    static void setCreator(Creator creator);

    /**
     * @brief Check whether a creator has been registered
     */
    static bool hasCreator();

    /**
     * @brief Create a session with the registered creator
     * @return Session, or nullptr if no creator is registered
     */
    static IRadioSession::Ptr create();

private:
    static Creator& creator();
};

}} // namespace CentralStack::BLE
