#include <gtest/gtest.h>
#include <siri/single_instance.h>
#include <chrono>
#include <string>

namespace {

std::string unique_app_name() {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return "siri-billing-instance-test-" + std::to_string(stamp);
}

} // namespace

TEST(SingleInstanceTest, SecondAcquireFailsWhileHeld) {
    std::string name = unique_app_name();

    auto first = siri::SingleInstance::acquire(name);
    ASSERT_NE(first, nullptr);

    auto second = siri::SingleInstance::acquire(name);
    EXPECT_EQ(second, nullptr);
}

TEST(SingleInstanceTest, ReleasedLockCanBeReacquired) {
    std::string name = unique_app_name();

    auto first = siri::SingleInstance::acquire(name);
    ASSERT_NE(first, nullptr);
    first.reset();

    auto again = siri::SingleInstance::acquire(name);
    EXPECT_NE(again, nullptr);
}
