#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using tvlink::protocols::Command;
using tvlink::protocols::Response;

TEST(command, power_frames_are_padded_to_fixed_width) {
  EXPECT_EQ(Command::powerQuery().toWire(), "POWR????\r");
  EXPECT_EQ(Command::power(true).toWire(), "POWR1   \r");
  EXPECT_EQ(Command::power(false).toWire(), "POWR0   \r");
}

TEST(command, input_frames) {
  EXPECT_EQ(Command::inputQuery().toWire(), "IAVD?   \r");
  EXPECT_EQ(Command::selectInput(1).toWire(), "IAVD0001   \r");
  EXPECT_EQ(Command::selectInput(8).toWire(), "IAVD0008   \r");
}

TEST(command, select_input_rejects_out_of_range) {
  EXPECT_THROW(Command::selectInput(0), std::out_of_range);
  EXPECT_THROW(Command::selectInput(9), std::out_of_range);
}

TEST(command, raw_appends_terminator_once) {
  EXPECT_EQ(Command::raw("VOLM10  "), "VOLM10  \r");
  EXPECT_EQ(Command::raw("VOLM10  \r"), "VOLM10  \r");
}

TEST(command, long_parameter_is_not_truncated) {
  Command c{ "ABCD", "123456" };
  EXPECT_EQ(c.toWire(), "ABCD123456\r");
}

TEST(response, classifies_acknowledgements) {
  auto ok = Response::fromWire("OK");
  ASSERT_TRUE(ok);
  EXPECT_EQ(ok->kind, Response::Kind::Ok);

  auto err = Response::fromWire(" ERR ");
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind, Response::Kind::Err);
  EXPECT_EQ(err->text, "ERR");
}

TEST(response, classifies_status_digit_and_input_id) {
  auto on = Response::fromWire("1");
  ASSERT_TRUE(on);
  EXPECT_EQ(on->kind, Response::Kind::Status);
  EXPECT_EQ(on->value, 1);

  auto input = Response::fromWire("0003");
  ASSERT_TRUE(input);
  EXPECT_EQ(input->kind, Response::Kind::InputId);
  EXPECT_EQ(input->value, 3);
}

TEST(response, rejects_unknown_shapes) {
  EXPECT_FALSE(Response::fromWire(""));
  EXPECT_FALSE(Response::fromWire("12"));
  EXPECT_FALSE(Response::fromWire("ok"));
  EXPECT_FALSE(Response::fromWire("00a1"));
  EXPECT_FALSE(Response::fromWire("WAIT"));
}
