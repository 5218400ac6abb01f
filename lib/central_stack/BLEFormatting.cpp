/**
 * @file BLEFormatting.cpp
 * @brief View formatters
 */

#include "BLEFormatting.h"

#include <algorithm>

namespace CentralStack { namespace BLE { namespace Formatting {

bool systemReady(const RadioStatus& status) {
    return status.reported && status.state == RadioState::POWERED_ON;
}

bool isScanning(const RegistrySnapshot& entries) {
    return std::any_of(entries.begin(), entries.end(), [](const PendingOperation& entry) {
        return entry.instruction == Instruction::SCANNING;
    });
}

PeripheralList sortedByStrength(const PeripheralList& peripherals) {
    PeripheralList sorted = peripherals;
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const DiscoveredPeripheral& a, const DiscoveredPeripheral& b) {
            return a.isStrongerThan(b);
        });
    return sorted;
}

}}} // namespace CentralStack::BLE::Formatting
