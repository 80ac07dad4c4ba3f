#include <core/state_machine.hpp>
#include <gtest/gtest.h>

using namespace accessory;

static_assert(is_legal_transition(DeviceStatus::Discovered, DeviceStatus::Connected));
static_assert(is_legal_transition(DeviceStatus::Connected, DeviceStatus::Ranging));
static_assert(is_legal_transition(DeviceStatus::Connected, DeviceStatus::Discovered));
static_assert(is_legal_transition(DeviceStatus::Ranging, DeviceStatus::Discovered));

TEST(StateMachineTest, RefusesEverythingElse) {
    EXPECT_FALSE(is_legal_transition(DeviceStatus::Discovered, DeviceStatus::Ranging));
    EXPECT_FALSE(is_legal_transition(DeviceStatus::Discovered, DeviceStatus::Discovered));
    EXPECT_FALSE(is_legal_transition(DeviceStatus::Connected, DeviceStatus::Connected));
    EXPECT_FALSE(is_legal_transition(DeviceStatus::Ranging, DeviceStatus::Connected));
    EXPECT_FALSE(is_legal_transition(DeviceStatus::Ranging, DeviceStatus::Ranging));
}

TEST(StateMachineTest, StatusNamesRoundTrip) {
    for (auto status : {DeviceStatus::Discovered, DeviceStatus::Connected, DeviceStatus::Ranging}) {
        EXPECT_EQ(device_status_from_string(to_string(status)), status);
    }
    EXPECT_FALSE(device_status_from_string("paired").has_value());
}

TEST(StateMachineTest, ErrorNamesForBusReplies) {
    EXPECT_EQ(error_name(Error::UnknownDevice), "UnknownDevice");
    EXPECT_EQ(error_name(Error::TransportError), "TransportError");
    EXPECT_EQ(to_string(Error::RetryBudgetExhausted), "retry budget exhausted");
}
