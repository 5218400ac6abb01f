/**
 * @file test_main.cpp
 * @brief Unit tests for StateContainer, DerivedView and the view formatters
 */

#include <unity.h>

#include "BLEStateContainer.h"
#include "BLEFormatting.h"
#include "BLEOperationRegistry.h"
#include "Bytes.h"

#include <string>
#include <thread>
#include <vector>

using namespace CentralStack::BLE;

static DiscoveredPeripheral peripheral(const char* id, int16_t rssi) {
    DiscoveredPeripheral p;
    p.identifier = Bytes(id);
    p.rssi = rssi;
    return p;
}

//=============================================================================
// StateContainer
//=============================================================================

void testSubscribeDeliversCurrentValue() {
    StateContainer<int> container(7);
    std::vector<int> seen;

    container.subscribe([&seen](const int& value) { seen.push_back(value); });

    TEST_ASSERT_EQUAL_size_t(1, seen.size());
    TEST_ASSERT_EQUAL_INT(7, seen[0]);
}

void testSetPublishesToAllListenersInOrder() {
    StateContainer<int> container;
    std::vector<std::string> seen;

    container.subscribe([&seen](const int& value) { seen.push_back("first:" + std::to_string(value)); });
    container.subscribe([&seen](const int& value) { seen.push_back("second:" + std::to_string(value)); });
    seen.clear();

    container.set(3);

    TEST_ASSERT_EQUAL_size_t(2, seen.size());
    TEST_ASSERT_EQUAL_STRING("first:3", seen[0].c_str());
    TEST_ASSERT_EQUAL_STRING("second:3", seen[1].c_str());
    TEST_ASSERT_EQUAL_INT(3, container.value());
}

void testUpdateReturningFalseDoesNotPublish() {
    StateContainer<int> container(1);
    int publications = 0;
    container.subscribe([&publications](const int&) { publications++; });

    bool published = container.update([](int&) { return false; });
    TEST_ASSERT_FALSE(published);
    TEST_ASSERT_EQUAL_INT(1, publications);

    container.republish();
    TEST_ASSERT_EQUAL_INT(2, publications);
}

void testUnsubscribeStopsDelivery() {
    StateContainer<int> container;
    int publications = 0;
    IObservable<int>::Token token = container.subscribe([&publications](const int&) { publications++; });

    TEST_ASSERT_EQUAL_size_t(1, container.subscriberCount());
    container.unsubscribe(token);
    container.unsubscribe(token);
    container.set(5);

    TEST_ASSERT_EQUAL_INT(1, publications);
    TEST_ASSERT_EQUAL_size_t(0, container.subscriberCount());
}

void testEmptyListenerIsRejected() {
    StateContainer<int> container;
    TEST_ASSERT_EQUAL_UINT32(IObservable<int>::INVALID_TOKEN, container.subscribe(nullptr));
    TEST_ASSERT_EQUAL_size_t(0, container.subscriberCount());
}

void testListenerMaySetAnotherContainer() {
    StateContainer<int> source;
    StateContainer<int> doubled;
    source.subscribe([&doubled](const int& value) { doubled.set(value * 2); });

    source.set(21);

    TEST_ASSERT_EQUAL_INT(42, doubled.value());
}

void testListenerMaySubscribeToSameContainer() {
    StateContainer<int> container(4);
    std::vector<int> inner;
    bool nested = false;

    container.subscribe([&container, &inner, &nested](const int&) {
        if (nested) {
            return;
        }
        nested = true;
        container.subscribe([&inner](const int& value) { inner.push_back(value); });
    });
    container.set(9);

    TEST_ASSERT_EQUAL_size_t(2, inner.size());
    TEST_ASSERT_EQUAL_INT(4, inner[0]);
    TEST_ASSERT_EQUAL_INT(9, inner[1]);
}

void testConcurrentSubscribeSeesValuesInOrder() {
    const int writes = 2000;
    const size_t subscribers = 64;
    StateContainer<int> container(0);
    std::vector<std::vector<int>> seen(subscribers);

    std::thread writer([&container, writes]() {
        for (int i = 1; i <= writes; i++) {
            container.set(i);
        }
    });
    for (size_t i = 0; i < subscribers; i++) {
        std::vector<int>* log = &seen[i];
        container.subscribe([log](const int& value) { log->push_back(value); });
    }
    writer.join();

    for (const std::vector<int>& log : seen) {
        TEST_ASSERT_FALSE(log.empty());
        for (size_t i = 1; i < log.size(); i++) {
            TEST_ASSERT_EQUAL_INT(log[i - 1] + 1, log[i]);
        }
        TEST_ASSERT_EQUAL_INT(writes, log.back());
    }
}

//=============================================================================
// Formatters
//=============================================================================

void testSystemReadyRequiresReportedPowerOn() {
    TEST_ASSERT_FALSE(Formatting::systemReady(RadioStatus()));
    TEST_ASSERT_FALSE(Formatting::systemReady(RadioStatus::of(RadioState::POWERED_OFF)));
    TEST_ASSERT_FALSE(Formatting::systemReady(RadioStatus::of(RadioState::UNAUTHORIZED)));
    TEST_ASSERT_TRUE(Formatting::systemReady(RadioStatus::of(RadioState::POWERED_ON)));
}

void testIsScanningLooksForScanningEntry() {
    RegistrySnapshot entries;
    TEST_ASSERT_FALSE(Formatting::isScanning(entries));

    entries.push_back(PendingOperation::connecting(Bytes("a"), ConnectionRoutes(), nullptr));
    TEST_ASSERT_FALSE(Formatting::isScanning(entries));

    entries.push_back(PendingOperation::scanning());
    TEST_ASSERT_TRUE(Formatting::isScanning(entries));
}

void testSortedByStrengthPutsStrongestFirst() {
    PeripheralList list = {peripheral("a", -80), peripheral("b", -30), peripheral("c", -55)};

    PeripheralList sorted = Formatting::sortedByStrength(list);

    TEST_ASSERT_EQUAL_size_t(3, sorted.size());
    TEST_ASSERT_TRUE(sorted[0].identifier == Bytes("b"));
    TEST_ASSERT_TRUE(sorted[1].identifier == Bytes("c"));
    TEST_ASSERT_TRUE(sorted[2].identifier == Bytes("a"));
}

//=============================================================================
// DerivedView
//=============================================================================

void testDerivedViewFollowsSource() {
    StateContainer<RadioStatus> status;
    DerivedView<RadioStatus, bool> ready(status, Formatting::systemReady);
    std::vector<bool> seen;

    ready.subscribe([&seen](const bool& value) { seen.push_back(value); });
    status.set(RadioStatus::of(RadioState::POWERED_ON));
    status.set(RadioStatus::of(RadioState::POWERED_OFF));

    TEST_ASSERT_EQUAL_size_t(3, seen.size());
    TEST_ASSERT_FALSE(seen[0]);
    TEST_ASSERT_TRUE(seen[1]);
    TEST_ASSERT_FALSE(seen[2]);
    TEST_ASSERT_FALSE(ready.value());
}

void testDerivedViewUnsubscribesOnDestruction() {
    StateContainer<PeripheralList> source;
    {
        DerivedView<PeripheralList, PeripheralList> view(source, Formatting::sortedByStrength);
        TEST_ASSERT_EQUAL_size_t(1, source.subscriberCount());
    }
    TEST_ASSERT_EQUAL_size_t(0, source.subscriberCount());
    source.set(PeripheralList{peripheral("a", -1)});
}

//=============================================================================
// Test Runner
//=============================================================================

void setUp(void) {
}

void tearDown(void) {
}

int runUnityTests(void) {
    UNITY_BEGIN();

    RUN_TEST(testSubscribeDeliversCurrentValue);
    RUN_TEST(testSetPublishesToAllListenersInOrder);
    RUN_TEST(testUpdateReturningFalseDoesNotPublish);
    RUN_TEST(testUnsubscribeStopsDelivery);
    RUN_TEST(testEmptyListenerIsRejected);
    RUN_TEST(testListenerMaySetAnotherContainer);
    RUN_TEST(testListenerMaySubscribeToSameContainer);
    RUN_TEST(testConcurrentSubscribeSeesValuesInOrder);

    RUN_TEST(testSystemReadyRequiresReportedPowerOn);
    RUN_TEST(testIsScanningLooksForScanningEntry);
    RUN_TEST(testSortedByStrengthPutsStrongestFirst);

    RUN_TEST(testDerivedViewFollowsSource);
    RUN_TEST(testDerivedViewUnsubscribesOnDestruction);

    return UNITY_END();
}

int main(void) {
    return runUnityTests();
}
