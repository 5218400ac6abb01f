/**
 * @file BLEConfiguration.h
 * @brief Session, scan, connect and reconnect configuration
 *
 * Plain value types with defaults. They are handed to the BLECentral
 * commands and passed through to the Radio Session.
 */
#pragma once

#include "BLETypes.h"

#include <string>
#include <vector>

namespace CentralStack { namespace BLE {

/**
 * @brief Configuration used when opening a Radio Session
 */
struct SessionConfiguration {
    // Ask the platform to alert the user when the radio is powered off
    bool show_power_alert = false;

    // Platform state-restoration key (empty = no restoration)
    std::string restore_identifier;

    static SessionConfiguration standard() { return SessionConfiguration(); }
};

/**
 * @brief Configuration for a scan
 *
 * Scanning for known service identifiers is preferred; an empty list reports
 * every advertising peripheral. Reporting duplicates delivers every
 * advertisement packet instead of one per peripheral, at a significant cost.
 */
struct ScanConfiguration {
    std::vector<std::string> service_identifiers;
    bool report_duplicates = false;
};

/**
 * @brief Options passed with a connect command
 */
struct ConnectOptions {
    bool notify_on_connection = false;      // Alert on background connect
    bool notify_on_disconnection = false;   // Alert on background disconnect
    bool notify_on_notification = false;    // Alert on notifications while suspended
    bool enable_transport_bridging = false; // Bridge classic profiles over an LE link
    bool requires_ancs = false;             // Require Apple Notification Center Service
    uint16_t start_delay_s = 0;             // Delay before the system connects

    bool operator==(const ConnectOptions& other) const {
        return notify_on_connection == other.notify_on_connection &&
               notify_on_disconnection == other.notify_on_disconnection &&
               notify_on_notification == other.notify_on_notification &&
               enable_transport_bridging == other.enable_transport_bridging &&
               requires_ancs == other.requires_ancs &&
               start_delay_s == other.start_delay_s;
    }
};

/**
 * @brief Configuration for a connect attempt
 */
struct ConnectionConfiguration {
    Bytes peripheral;           // Device to connect to
    ConnectionRoutes routes;    // Paths to resolve once connected
    ConnectOptions options;

    /**
     * @brief Default options for the given peripheral and routes
     */
    static ConnectionConfiguration standardConfiguration(const Bytes& peripheral,
                                                         const ConnectionRoutes& routes);
};

/**
 * @brief Configuration for reconnecting to a previously known peripheral
 */
struct ReconnectConfiguration {
    Bytes peripheral;                               // Identifier to resolve
    std::vector<std::string> service_identifiers;   // Services used for the connected lookup
    ConnectionRoutes routes;                        // Paths to resolve once connected
    ConnectOptions options;

    ConnectionConfiguration toConnectionConfiguration() const;
};

}} // namespace CentralStack::BLE
