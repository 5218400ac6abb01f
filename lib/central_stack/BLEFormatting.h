/**
 * @file BLEFormatting.h
 * @brief Derivation of the public views from internal state
 *
 * The session publishes raw state (radio status, registry snapshot,
 * discovered peripherals). Applications observe shaped views of it: a
 * readiness flag, a scanning flag, and the discovered peripherals ordered
 * strongest first. A DerivedView subscribes to its source and re-publishes
 * the formatted value on every source publication.
 */
#pragma once

#include "BLETypes.h"
#include "BLEStateContainer.h"
#include "BLEOperationRegistry.h"
#include "BLEPeerManager.h"

#include <functional>

namespace CentralStack { namespace BLE {

namespace Formatting {

/**
 * @brief Readiness: a reported radio state of POWERED_ON
 */
bool systemReady(const RadioStatus& status);

/**
 * @brief Whether the registry holds a SCANNING entry
 */
bool isScanning(const RegistrySnapshot& entries);

/**
 * @brief Peripherals ordered by RSSI, strongest first
 */
PeripheralList sortedByStrength(const PeripheralList& peripherals);

}

/**
 * @brief Observable that mirrors a source through a formatter
 *
 * The source must outlive the view.
 */
template <typename Source, typename Output>
class DerivedView : public IObservable<Output> {
public:
    using typename IObservable<Output>::Listener;
    using typename IObservable<Output>::Token;
    using Formatter = std::function<Output(const Source&)>;

    DerivedView(IObservable<Source>& source, Formatter formatter)
        : _source(source), _formatter(formatter) {
        _source_token = _source.subscribe([this](const Source& value) {
            _output.set(_formatter(value));
        });
    }

    ~DerivedView() override {
        _source.unsubscribe(_source_token);
    }

    DerivedView(const DerivedView&) = delete;
    DerivedView& operator=(const DerivedView&) = delete;

    Output value() const override { return _output.value(); }
    Token subscribe(Listener listener) override { return _output.subscribe(listener); }
    void unsubscribe(Token token) override { _output.unsubscribe(token); }

private:
    IObservable<Source>& _source;
    Formatter _formatter;
    StateContainer<Output> _output;
    Token _source_token = IObservable<Output>::INVALID_TOKEN;
};

}} // namespace CentralStack::BLE
