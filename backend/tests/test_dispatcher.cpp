#include <gtest/gtest.h>

#include <limits>

#include "message/dispatcher.h"

namespace {

std::int32_t sum_of(std::int32_t a, std::int32_t b) {
    const auto response = dispatch(ClientMessage{AddRequest{a, b}});
    if (!response || !std::holds_alternative<AddResponse>(*response)) {
        ADD_FAILURE() << "AddRequest{" << a << ", " << b << "} did not produce an AddResponse";
        return 0;
    }
    return std::get<AddResponse>(*response).result;
}

} // namespace

TEST(DispatcherTest, AddsTwoNumbers) {
    EXPECT_EQ(sum_of(2, 3), 5);
    EXPECT_EQ(sum_of(-1, 1), 0);
    EXPECT_EQ(sum_of(-20, -22), -42);
}

TEST(DispatcherTest, AddWrapsAroundOnOverflow) {
    constexpr auto max = std::numeric_limits<std::int32_t>::max();
    constexpr auto min = std::numeric_limits<std::int32_t>::min();

    EXPECT_EQ(sum_of(max, 1), min);
    EXPECT_EQ(sum_of(min, -1), max);
    EXPECT_EQ(sum_of(max, max), -2);
}

TEST(DispatcherTest, EchoesContentUnchanged) {
    const auto response = dispatch(ClientMessage{EchoMessage{"hello"}});
    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(std::holds_alternative<EchoMessage>(*response));
    EXPECT_EQ(std::get<EchoMessage>(*response).content, "hello");
}

TEST(DispatcherTest, UnknownVariantGetsNoResponse) {
    EXPECT_FALSE(dispatch(ClientMessage{}).has_value());
}
