/**
 * @file BLERadioSession.cpp
 * @brief Radio Session factory implementation
 */

#include "BLERadioSession.h"
#include "Log.h"

namespace CentralStack { namespace BLE {

RadioSessionFactory::Creator& RadioSessionFactory::creator() {
    static Creator registered;
    return registered;
}

void RadioSessionFactory::setCreator(Creator new_creator) {
    creator() = new_creator;
}

bool RadioSessionFactory::hasCreator() {
    return static_cast<bool>(creator());
}

IRadioSession::Ptr RadioSessionFactory::create() {
    if (!creator()) {
        ERROR("RadioSessionFactory: No radio session creator registered");
        return nullptr;
    }

    IRadioSession::Ptr session = creator()();
    if (!session) {
        ERROR("RadioSessionFactory: Creator returned no session");
        return nullptr;
    }

    INFO("RadioSessionFactory: Created " + session->getPlatformName() + " session");
    return session;
}

}} // namespace CentralStack::BLE
