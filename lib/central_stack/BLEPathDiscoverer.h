/**
 * @file BLEPathDiscoverer.h
 * @brief Resolves the service/characteristic paths of a newly connected peripheral
 *
 * One discoverer runs per connect attempt. It asks the Radio Session for the
 * services named by the connection routes, then for the characteristics of
 * each matching service, and completes exactly once:
 * - with the flattened list of KnownPaths when every service has answered
 * - with the first radio error reported along the way
 *
 * The Radio Session may answer synchronously from inside a command, so every
 * piece of state a response depends on is in place before the command is
 * issued.
 */
#pragma once

#include "BLETypes.h"
#include "BLERadioSession.h"

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace CentralStack { namespace BLE {

class BLEPathDiscoverer {
public:
    using Ptr = std::shared_ptr<BLEPathDiscoverer>;

    /**
     * @brief Completion callback
     *
     * @param error NONE on success, otherwise RADIO_ERROR with the cause
     * @param paths Resolved paths (empty on failure)
     */
    using OnComplete = std::function<void(const StackError& error, const std::vector<KnownPath>& paths)>;

    BLEPathDiscoverer(IRadioSession::Ptr session, const Bytes& peripheral);

    /**
     * @brief Start resolving paths
     *
     * @param routes Services and characteristics of interest (empty = all)
     * @param on_complete Called exactly once
     */
    void discoverPaths(const ConnectionRoutes& routes, OnComplete on_complete);

    //=========================================================================
    // Radio Session results for this peripheral
    //=========================================================================

    void onServicesDiscovered(const std::vector<std::string>& services, const RadioError* error);

    void onCharacteristicsDiscovered(const std::string& service,
                                     const std::vector<CharacteristicInfo>& characteristics,
                                     const RadioError* error);

    bool isFinished() const { return _finished; }
    const Bytes& peripheral() const { return _peripheral; }

private:
    bool routeIncludes(const std::string& service) const;
    void complete(const StackError& error);

    IRadioSession::Ptr _session;
    Bytes _peripheral;
    ConnectionRoutes _routes;
    OnComplete _on_complete;

    bool _started = false;
    bool _services_resolved = false;
    bool _finished = false;

    std::set<std::string> _awaited;
    std::map<std::string, std::vector<CharacteristicInfo>> _resolved;
};

}} // namespace CentralStack::BLE
