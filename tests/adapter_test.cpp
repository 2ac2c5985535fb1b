// tvlink-Prod headers
#include "adapters/AccessoryInfo.hpp"
#include "adapters/InputAdapter.hpp"
#include "adapters/PowerAdapter.hpp"
#include "core/AdapterRegistry.hpp"
#include "core/CharacteristicStore.hpp"
#include "core/CommandSink.hpp"
#include "core/Logger.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <sstream>
#include <stdexcept>

namespace tvlink::test {

  using tvlink::adapters::AccessoryInfo;
  using tvlink::adapters::InputAdapter;
  using tvlink::adapters::PowerAdapter;
  using tvlink::adapters::Result;
  using tvlink::core::AdapterRegistry;
  using tvlink::core::Characteristic;
  using tvlink::core::CharacteristicStore;
  using tvlink::core::CommandSink;
  using tvlink::core::DeviceConfig;
  using tvlink::core::ErrorKind;
  using tvlink::core::InputDefinition;
  using tvlink::core::Logger;
  using tvlink::core::LogLevel;
  using tvlink::core::Reply;
  using testing::_;

  class MockCommandSink : public CommandSink {
  public:
    MOCK_METHOD(void, send, (std::string, ResponseHandler), (override));
  };

  /// Action: answer the command synchronously with \p reply.
  auto answer(Reply reply) {
    return [reply](const std::string&, const CommandSink::ResponseHandler& h) { h(reply); };
  }

  class AdapterTest : public ::testing::Test {
  protected:
    void SetUp() override {
      store = std::make_shared<CharacteristicStore>();
      logger = std::make_shared<Logger>(logSink, LogLevel::Debug);
    }

    Result capture(const std::function<void(adapters::CharacteristicAdapter::Callback)>& op) {
      Result out = Result::failure(ErrorKind::Shutdown, "callback never invoked");
      op([&](const Result& r) { out = r; });
      return out;
    }

    std::vector<InputDefinition> inputs() const {
      return { InputDefinition{ 1, "HDMI 1", 3 }, InputDefinition{ 3, "HDMI 3", 3 },
               InputDefinition{ 8, "TV", 2 } };
    }

    testing::StrictMock<MockCommandSink> sink;
    std::shared_ptr<CharacteristicStore> store;
    std::ostringstream logSink;
    std::shared_ptr<Logger> logger;
  };

  TEST_F(AdapterTest, powerGet_MapsStatusDigit) {
    EXPECT_CALL(sink, send("POWR????\r", _)).WillOnce(answer(Reply::success("1")));
    PowerAdapter power(sink, store, logger);

    auto r = capture([&](auto cb) { power.get(cb); });
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value, 1);
    EXPECT_EQ(store->get(Characteristic::Active), 1);
  }

  TEST_F(AdapterTest, powerGet_ErrIsProtocolError) {
    EXPECT_CALL(sink, send("POWR????\r", _)).WillOnce(answer(Reply::success("ERR")));
    PowerAdapter power(sink, store, logger);

    auto r = capture([&](auto cb) { power.get(cb); });
    EXPECT_EQ(r.kind, ErrorKind::Protocol);
    EXPECT_FALSE(store->get(Characteristic::Active).has_value());
  }

  TEST_F(AdapterTest, powerGet_AcceptsLineContainingOneStatusDigit) {
    EXPECT_CALL(sink, send("POWR????\r", _))
        .WillOnce(answer(Reply::success("POWR0")))
        .WillOnce(answer(Reply::success("10")));
    PowerAdapter power(sink, store, logger);

    auto off = capture([&](auto cb) { power.get(cb); });
    ASSERT_TRUE(off.ok());
    EXPECT_EQ(off.value, 0);

    auto ambiguous = capture([&](auto cb) { power.get(cb); });
    EXPECT_EQ(ambiguous.kind, ErrorKind::Protocol);
  }

  TEST_F(AdapterTest, powerGet_PassesCoreFailureThrough) {
    EXPECT_CALL(sink, send("POWR????\r", _))
        .WillOnce(answer(Reply::failure(ErrorKind::Stall, "no response")));
    PowerAdapter power(sink, store, logger);

    auto r = capture([&](auto cb) { power.get(cb); });
    EXPECT_EQ(r.kind, ErrorKind::Stall);
    EXPECT_EQ(r.detail, "no response");
  }

  TEST_F(AdapterTest, powerSet_SendsFrameAndRequiresOk) {
    EXPECT_CALL(sink, send("POWR1   \r", _)).WillOnce(answer(Reply::success("OK")));
    EXPECT_CALL(sink, send("POWR0   \r", _)).WillOnce(answer(Reply::success("ERR")));
    PowerAdapter power(sink, store, logger);

    auto on = capture([&](auto cb) { power.set(1, cb); });
    EXPECT_TRUE(on.ok());
    EXPECT_EQ(store->get(Characteristic::Active), 1);

    auto off = capture([&](auto cb) { power.set(0, cb); });
    EXPECT_EQ(off.kind, ErrorKind::Protocol);
    EXPECT_EQ(store->get(Characteristic::Active), 1); // unchanged on failure
  }

  TEST_F(AdapterTest, inputGet_TranslatesIdToIndex) {
    EXPECT_CALL(sink, send("IAVD?   \r", _)).WillOnce(answer(Reply::success("0003")));
    InputAdapter input(sink, inputs(), store, logger);

    auto r = capture([&](auto cb) { input.get(cb); });
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value, 1);
    EXPECT_EQ(store->get(Characteristic::ActiveIdentifier), 1);
  }

  TEST_F(AdapterTest, inputGet_UnconfiguredIdIsProtocolError) {
    EXPECT_CALL(sink, send("IAVD?   \r", _)).WillOnce(answer(Reply::success("0005")));
    InputAdapter input(sink, inputs(), store, logger);

    auto r = capture([&](auto cb) { input.get(cb); });
    EXPECT_EQ(r.kind, ErrorKind::Protocol);
  }

  TEST_F(AdapterTest, inputSet_TranslatesIndexToId) {
    EXPECT_CALL(sink, send("IAVD0008   \r", _)).WillOnce(answer(Reply::success("OK")));
    InputAdapter input(sink, inputs(), store, logger);

    auto r = capture([&](auto cb) { input.set(2, cb); });
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value, 2);
    EXPECT_EQ(store->get(Characteristic::ActiveIdentifier), 2);
  }

  TEST_F(AdapterTest, inputSet_OutOfRangeNeverSends) {
    EXPECT_CALL(sink, send(_, _)).Times(0);
    InputAdapter input(sink, inputs(), store, logger);

    EXPECT_EQ(capture([&](auto cb) { input.set(3, cb); }).kind, ErrorKind::Protocol);
    EXPECT_EQ(capture([&](auto cb) { input.set(-1, cb); }).kind, ErrorKind::Protocol);
  }

  TEST(adapter_registry, registers_and_looks_up_by_name) {
    testing::NiceMock<MockCommandSink> sink;
    auto store = std::make_shared<CharacteristicStore>();
    auto logger = std::make_shared<Logger>();

    AdapterRegistry registry;
    EXPECT_TRUE(registry.add(std::make_shared<PowerAdapter>(sink, store, logger)));
    EXPECT_TRUE(registry.add(std::make_shared<InputAdapter>(sink, std::vector<InputDefinition>{},
                                                            store, logger)));
    EXPECT_FALSE(registry.add(std::make_shared<PowerAdapter>(sink, store, logger)));

    EXPECT_EQ(registry.names(), (std::vector<std::string>{ "input", "power" }));
    EXPECT_STREQ(registry.at("power").name(), "power");
    EXPECT_THROW(registry.at("volume"), std::out_of_range);
  }

  TEST(accessory_info, empty_fields_fall_back_to_unknown) {
    DeviceConfig cfg;
    cfg.name = "Living Room";
    cfg.manufacturer = "Sharp";
    cfg.model = "";

    auto info = AccessoryInfo::fromConfig(cfg);
    EXPECT_EQ(info.name, "Living Room");
    EXPECT_EQ(info.manufacturer, "Sharp");
    EXPECT_EQ(info.model, "Unknown");
    EXPECT_EQ(info.serial, "Unknown");
    EXPECT_THAT(info.describe(), testing::HasSubstr("manufacturer: Sharp\n"));
  }

} // namespace tvlink::test
