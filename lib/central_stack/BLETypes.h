/**
 * @file BLETypes.h
 * @brief CentralStack types, constants, and common structures
 *
 * This file defines the core types used throughout the central session
 * implementation: radio and authorization states, the pending-operation
 * instructions, error kinds, discovered peripherals, resolved paths, and
 * the callback signatures shared by all components.
 */
#pragma once

#include "Bytes.h"
#include "Log.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace CentralStack { namespace BLE {

using Bytes = RNS::Bytes;

//=============================================================================
// Library Version
//=============================================================================

static constexpr uint8_t VERSION_MAJOR = 1;
static constexpr uint8_t VERSION_MINOR = 0;

//=============================================================================
// Limits & Timing
//=============================================================================

namespace Limits {
#ifdef ARDUINO
    static constexpr size_t MAX_DISCOVERED_PERIPHERALS = 16;  // Reduced discovery cache for MCU
#else
    static constexpr size_t MAX_DISCOVERED_PERIPHERALS = 100; // Discovery cache limit
#endif
}

namespace Timing {
    static constexpr double PERIPHERAL_TIMEOUT = 30.0;        // Seconds before a silent peripheral is stale
}

//=============================================================================
// Enumerations
//=============================================================================

/**
 * @brief Radio power/availability state reported by the Radio Session
 */
enum class RadioState : uint8_t {
    UNKNOWN,
    RESETTING,
    UNSUPPORTED,
    UNAUTHORIZED,
    POWERED_OFF,
    POWERED_ON
};

/**
 * @brief Application authorization to use the radio (pass-through)
 */
enum class AuthorizationState : uint8_t {
    NOT_DETERMINED,
    RESTRICTED,
    DENIED,
    ALLOWED_ALWAYS
};

/**
 * @brief Kind of in-flight operation tracked by the registry
 */
enum class Instruction : uint8_t {
    SCANNING,
    CONNECTING,
    DISCONNECTING
};

/**
 * @brief Error kinds reported to command callers
 */
enum class ErrorKind : uint8_t {
    NONE,
    SYSTEM_NOT_READY,       // Radio is not powered on
    INVALID_INSTRUCTION,    // Duplicate scan/connect/disconnect request
    UNKNOWN_DEVICE,         // Identifier not tracked or not resolvable
    UNKNOWN_PATH,           // No resolved path for the lookup
    RADIO_ERROR             // Failure reported by the Radio Session
};

//=============================================================================
// Data Structures
//=============================================================================

/**
 * @brief Failure cause reported by the Radio Session
 */
struct RadioError {
    static constexpr int UNKNOWN_CODE = -1;

    int code = UNKNOWN_CODE;
    std::string description;

    RadioError() = default;
    RadioError(int error_code, const std::string& error_description)
        : code(error_code), description(error_description) {}

    /**
     * @brief Cause used when the radio reports a failure without one
     */
    static RadioError unknown() {
        return RadioError(UNKNOWN_CODE, "unknown error");
    }

    bool isUnknown() const { return code == UNKNOWN_CODE; }

    bool operator==(const RadioError& other) const {
        return code == other.code && description == other.description;
    }
};

/**
 * @brief Error delivered to a command's error callback
 */
struct StackError {
    ErrorKind kind = ErrorKind::NONE;
    RadioError cause;       // Meaningful only for RADIO_ERROR

    StackError() = default;
    explicit StackError(ErrorKind error_kind) : kind(error_kind) {}

    static StackError radio(const RadioError& radio_error) {
        StackError error(ErrorKind::RADIO_ERROR);
        error.cause = radio_error;
        return error;
    }

    /**
     * @brief Wrap an optional radio cause, normalizing a missing one
     */
    static StackError radio(const RadioError* radio_error) {
        return radio(radio_error ? *radio_error : RadioError::unknown());
    }

    bool ok() const { return kind == ErrorKind::NONE; }

    std::string toString() const;
};

/**
 * @brief Service identifier → characteristic identifiers of interest
 *
 * An empty characteristic list asks for every characteristic of that service.
 * An empty map asks for every service.
 */
using ConnectionRoutes = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Advertisement payload (opaque key-value bag)
 */
using AdvertisementData = std::map<std::string, Bytes>;

/**
 * @brief A peripheral seen while scanning
 *
 * Identity is the identifier alone; two reports for the same device compare
 * equal regardless of payload or signal.
 */
struct DiscoveredPeripheral {
    Bytes identifier;
    std::string name;
    AdvertisementData advertisement;
    int16_t rssi = 0;                   // dBm
    double discovered_at = 0.0;         // Utilities::OS::time() of the latest report

    bool operator==(const DiscoveredPeripheral& other) const {
        return identifier == other.identifier;
    }

    bool operator!=(const DiscoveredPeripheral& other) const {
        return !(*this == other);
    }

    bool isStrongerThan(const DiscoveredPeripheral& other) const {
        return rssi > other.rssi;
    }
};

/**
 * @brief Characteristic reported by structural discovery
 */
struct CharacteristicInfo {
    std::string uuid;
    uint16_t handle = 0;
};

/**
 * @brief A resolved, directly addressable endpoint on a connected peripheral
 */
struct KnownPath {
    Bytes peripheral;
    std::string service;
    std::string characteristic;
    uint16_t handle = 0;

    bool matches(const Bytes& peripheral_id, const std::string& service_id,
                 const std::string& characteristic_id) const {
        return peripheral == peripheral_id &&
               service == service_id &&
               characteristic == characteristic_id;
    }

    bool operator==(const KnownPath& other) const {
        return matches(other.peripheral, other.service, other.characteristic) &&
               handle == other.handle;
    }
};

/**
 * @brief Latest radio state, absent until the session reports one
 */
struct RadioStatus {
    bool reported = false;
    RadioState state = RadioState::UNKNOWN;

    static RadioStatus of(RadioState radio_state) {
        RadioStatus status;
        status.reported = true;
        status.state = radio_state;
        return status;
    }
};

/**
 * @brief Result of troubleshootSystemReady()
 */
struct SystemReadyTroubleshooting {
    bool has_radio_state = false;       // false until the session reports a state
    RadioState radio_state = RadioState::UNKNOWN;
    AuthorizationState authorization = AuthorizationState::NOT_DETERMINED;
};

//=============================================================================
// Callback Type Definitions
//=============================================================================

namespace Callbacks {
    // Command outcome
    using OnError = std::function<void(const StackError& error)>;

    // Radio Session events
    using OnStateChanged = std::function<void(RadioState state)>;
    using OnPeripheralDiscovered = std::function<void(const DiscoveredPeripheral& report)>;
    using OnConnected = std::function<void(const Bytes& peripheral)>;
    using OnConnectFailed = std::function<void(const Bytes& peripheral, const RadioError* error)>;
    using OnDisconnected = std::function<void(const Bytes& peripheral, const RadioError* error)>;
    using OnServicesDiscovered = std::function<void(const Bytes& peripheral,
                                                    const std::vector<std::string>& services,
                                                    const RadioError* error)>;
    using OnCharacteristicsDiscovered = std::function<void(const Bytes& peripheral,
                                                           const std::string& service,
                                                           const std::vector<CharacteristicInfo>& characteristics,
                                                           const RadioError* error)>;

    // Diagnostics
    using OnAnomaly = std::function<void(const Bytes& peripheral, const std::string& reason)>;
}

//=============================================================================
// Utility Functions
//=============================================================================

/**
 * @brief Convert RadioState to string for logging
 */
inline const char* radioStateToString(RadioState state) {
    switch (state) {
        case RadioState::UNKNOWN:      return "UNKNOWN";
        case RadioState::RESETTING:    return "RESETTING";
        case RadioState::UNSUPPORTED:  return "UNSUPPORTED";
        case RadioState::UNAUTHORIZED: return "UNAUTHORIZED";
        case RadioState::POWERED_OFF:  return "POWERED_OFF";
        case RadioState::POWERED_ON:   return "POWERED_ON";
        default:                       return "INVALID";
    }
}

/**
 * @brief Convert AuthorizationState to string for logging
 */
inline const char* authorizationToString(AuthorizationState state) {
    switch (state) {
        case AuthorizationState::NOT_DETERMINED: return "NOT_DETERMINED";
        case AuthorizationState::RESTRICTED:     return "RESTRICTED";
        case AuthorizationState::DENIED:         return "DENIED";
        case AuthorizationState::ALLOWED_ALWAYS: return "ALLOWED_ALWAYS";
        default:                                 return "INVALID";
    }
}

/**
 * @brief Convert Instruction to string for logging
 */
inline const char* instructionToString(Instruction instruction) {
    switch (instruction) {
        case Instruction::SCANNING:      return "SCANNING";
        case Instruction::CONNECTING:    return "CONNECTING";
        case Instruction::DISCONNECTING: return "DISCONNECTING";
        default:                         return "INVALID";
    }
}

/**
 * @brief Convert ErrorKind to string for logging
 */
inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                return "NONE";
        case ErrorKind::SYSTEM_NOT_READY:    return "SYSTEM_NOT_READY";
        case ErrorKind::INVALID_INSTRUCTION: return "INVALID_INSTRUCTION";
        case ErrorKind::UNKNOWN_DEVICE:      return "UNKNOWN_DEVICE";
        case ErrorKind::UNKNOWN_PATH:        return "UNKNOWN_PATH";
        case ErrorKind::RADIO_ERROR:         return "RADIO_ERROR";
        default:                             return "INVALID";
    }
}

inline std::string StackError::toString() const {
    std::string text = errorKindToString(kind);
    if (kind == ErrorKind::RADIO_ERROR) {
        text += " (" + std::to_string(cause.code) + ": " + cause.description + ")";
    }
    return text;
}

/**
 * @brief Short printable form of a peripheral identifier
 */
inline std::string identifierToString(const Bytes& identifier) {
    std::string hex = identifier.toHex();
    return hex.size() > 12 ? hex.substr(0, 12) + "..." : hex;
}

}} // namespace CentralStack::BLE
