#include <gtest/gtest.h>

#include "cli/client_command.h"

TEST(ClientCommandTest, ParsesAdd) {
    const auto command = parse_client_command({"127.0.0.1", "8080", "add", "-1", "2147483647"});
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->host, "127.0.0.1");
    EXPECT_EQ(command->port, 8080);
    ASSERT_TRUE(std::holds_alternative<AddRequest>(command->request));
    EXPECT_EQ(std::get<AddRequest>(command->request), (AddRequest{-1, 2147483647}));
}

TEST(ClientCommandTest, ParsesEcho) {
    const auto command = parse_client_command({"localhost", "9000", "echo", "hello there"});
    ASSERT_TRUE(command.has_value());
    ASSERT_TRUE(std::holds_alternative<EchoMessage>(command->request));
    EXPECT_EQ(std::get<EchoMessage>(command->request).content, "hello there");
}

TEST(ClientCommandTest, RejectsPortOutOfRange) {
    EXPECT_FALSE(parse_client_command({"h", "70000", "add", "1", "2"}).has_value());
    EXPECT_FALSE(parse_client_command({"h", "0", "add", "1", "2"}).has_value());
    EXPECT_FALSE(parse_client_command({"h", "-1", "add", "1", "2"}).has_value());
    EXPECT_TRUE(parse_client_command({"h", "65535", "add", "1", "2"}).has_value());
}

TEST(ClientCommandTest, RejectsOperandsOutsideInt32) {
    EXPECT_FALSE(parse_client_command({"h", "80", "add", "2147483648", "0"}).has_value());
    EXPECT_FALSE(parse_client_command({"h", "80", "add", "0", "-2147483649"}).has_value());
    EXPECT_FALSE(parse_client_command({"h", "80", "add", "99999999999999999999", "0"}).has_value());
}

TEST(ClientCommandTest, RejectsMalformedArguments) {
    EXPECT_FALSE(parse_client_command({}).has_value());
    EXPECT_FALSE(parse_client_command({"h", "80", "add", "1"}).has_value());
    EXPECT_FALSE(parse_client_command({"h", "80", "add", "1", "2x"}).has_value());
    EXPECT_FALSE(parse_client_command({"h", "port", "echo", "x"}).has_value());
    EXPECT_FALSE(parse_client_command({"h", "80", "multiply", "1", "2"}).has_value());
    EXPECT_FALSE(parse_client_command({"h", "80", "echo", "a", "b"}).has_value());
}
