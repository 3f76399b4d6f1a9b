/*
 * test_govee_integration.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tests for Govee discovery over loopback devices

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>

#include "common/asio_test_utils.hpp"
#include "common/fake_govee_device.hpp"
#include "discovery/discoverer.hpp"
#include "integrations/govee/govee_integration.hpp"
#include "integrations/govee/govee_light.hpp"
#include "logging/logger_registry.hpp"

using namespace prism;
using namespace prism::govee;
using namespace std::chrono_literals;

class GoveeIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);
        logging::LoggerRegistry::getInstance().addSinkToAll(sink_);

        device_ = std::make_unique<test::FakeGoveeDevice>(ioc_);

        config_.govee.enabled = true;
        config_.govee.addresses = {"127.0.0.1"};
        config_.govee.listenPort = 0;
        config_.govee.devicePort = device_->port();
        config_.govee.scanTimeoutMs = 300;
    }

    void TearDown() override {
        logging::LoggerRegistry::getInstance().removeSinkFromAll(sink_);
        device_.reset();
    }

    auto discover() -> Result<LightList> {
        return test::runSync(ioc_, integration_.discover(config_));
    }

    auto capturedLog() const -> std::string {
        std::string text;
        for (const auto& line : sink_->last_formatted()) {
            text += line;
        }
        return text;
    }

    boost::asio::io_context ioc_;
    std::unique_ptr<test::FakeGoveeDevice> device_;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
    config::LightsConfig config_;
    GoveeIntegration integration_;
};

// ============================================================================
// Preflight
// ============================================================================

TEST_F(GoveeIntegrationTest, NameIsVendor) {
    EXPECT_EQ(integration_.name(), "govee");
}

TEST_F(GoveeIntegrationTest, PreflightFollowsEnabledFlag) {
    EXPECT_TRUE(integration_.preflight(config_));

    config_.govee.enabled = false;
    EXPECT_FALSE(integration_.preflight(config_));
}

TEST_F(GoveeIntegrationTest, ClientOptionsFromConfig) {
    config_.govee.listenPort = 14002;
    config_.govee.devicePort = 14003;
    config_.govee.scanTimeoutMs = 1200;

    auto options = GoveeIntegration::clientOptions(config_.govee);

    EXPECT_EQ(options.listenPort, 14002);
    EXPECT_EQ(options.devicePort, 14003);
    EXPECT_EQ(options.replyTimeout, 1200ms);
}

// ============================================================================
// Discovery
// ============================================================================

TEST_F(GoveeIntegrationTest, DiscoversRespondingDevice) {
    device_->setRawReply(
        R"({"msg":{"cmd":"devStatus","data":{"onOff":1,"brightness":80,)"
        R"("color":{"r":10,"g":20,"b":30}}}})");

    auto lights = discover();

    ASSERT_TRUE(lights.has_value()) << lights.error().describe();
    ASSERT_EQ(lights->size(), 1u);
    const auto& light = lights->front();
    EXPECT_EQ(light->id(), "govee::127.0.0.1");
    EXPECT_TRUE(light->isOn());
    EXPECT_EQ(light->brightness(), 80);
    EXPECT_EQ(light->red(), 10);
    EXPECT_EQ(light->green(), 20);
    EXPECT_EQ(light->blue(), 30);
}

TEST_F(GoveeIntegrationTest, NoAddressesYieldsNoLights) {
    config_.govee.addresses.clear();

    auto lights = discover();

    ASSERT_TRUE(lights.has_value());
    EXPECT_TRUE(lights->empty());
}

TEST_F(GoveeIntegrationTest, SilentDeviceIsLoggedAndSkipped) {
    device_->setResponding(false);

    auto lights = discover();

    ASSERT_TRUE(lights.has_value());
    EXPECT_TRUE(lights->empty());
    EXPECT_THAT(capturedLog(),
                ::testing::HasSubstr(
                    "Failed to connect to Govee light at 127.0.0.1"));
}

TEST_F(GoveeIntegrationTest, InvalidAddressDoesNotAffectOthers) {
    config_.govee.addresses = {"kitchen", "127.0.0.1"};

    auto lights = discover();

    ASSERT_TRUE(lights.has_value());
    ASSERT_EQ(lights->size(), 1u);
    EXPECT_EQ(lights->front()->id(), "govee::127.0.0.1");
    EXPECT_THAT(capturedLog(), ::testing::HasSubstr("kitchen"));
}

TEST_F(GoveeIntegrationTest, RepliesAreNotMisattributed) {
    // The first device answers late; its reply must not be taken for the
    // second device's or the other way round.
    device_->setStatus({true, 80, {10, 20, 30}, 0});
    device_->setReplyDelay(150ms);
    test::FakeGoveeDevice second(ioc_, "127.0.0.2", device_->port());
    second.setStatus({false, 15, {200, 0, 0}, 0});

    config_.govee.addresses = {"127.0.0.1", "127.0.0.2"};
    auto lights = discover();

    ASSERT_TRUE(lights.has_value());
    ASSERT_EQ(lights->size(), 2u);

    EXPECT_EQ((*lights)[0]->id(), "govee::127.0.0.1");
    EXPECT_TRUE((*lights)[0]->isOn());
    EXPECT_EQ((*lights)[0]->brightness(), 80);

    EXPECT_EQ((*lights)[1]->id(), "govee::127.0.0.2");
    EXPECT_FALSE((*lights)[1]->isOn());
    EXPECT_EQ((*lights)[1]->brightness(), 15);
    EXPECT_EQ((*lights)[1]->red(), 200);
}

TEST_F(GoveeIntegrationTest, OccupiedListenPortIsDiscoveryError) {
    namespace net = boost::asio;
    net::ip::udp::socket blocker(ioc_, net::ip::udp::endpoint(
                                           net::ip::address_v4::any(), 0));
    config_.govee.listenPort = blocker.local_endpoint().port();

    auto lights = discover();

    ASSERT_FALSE(lights.has_value());
    EXPECT_EQ(lights.error().code, ErrorCode::DiscoveryError);
    EXPECT_THAT(lights.error().message,
                ::testing::HasSubstr("TransportError"));
}

TEST_F(GoveeIntegrationTest, DiscoveredLightIsControllable) {
    device_->setStatus({true, 50, {1, 2, 3}, 0});

    auto lights = discover();
    ASSERT_TRUE(lights.has_value());
    ASSERT_EQ(lights->size(), 1u);

    auto result = test::runSync(ioc_, lights->front()->setOn(false));
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(lights->front()->isOn());

    test::runSync(ioc_, test::sleepFor(50ms));
    EXPECT_FALSE(device_->status().on);
}

// ============================================================================
// Aggregate Entry Point
// ============================================================================

TEST_F(GoveeIntegrationTest, DiscoverLightsReturnsRespondingDevice) {
    device_->setRawReply(
        R"({"msg":{"cmd":"devStatus","data":{"onOff":1,"brightness":80,)"
        R"("color":{"r":10,"g":20,"b":30}}}})");

    auto lights = test::runSync(ioc_, prism::discoverLights(config_));

    ASSERT_EQ(lights.size(), 1u);
    EXPECT_EQ(lights[0]->id(), "govee::127.0.0.1");
    EXPECT_TRUE(lights[0]->isOn());
    EXPECT_EQ(lights[0]->brightness(), 80);
    EXPECT_EQ(lights[0]->red(), 10);
    EXPECT_EQ(lights[0]->green(), 20);
    EXPECT_EQ(lights[0]->blue(), 30);
}

TEST_F(GoveeIntegrationTest, DiscoverLightsSkipsSilentDevice) {
    device_->setResponding(false);

    LightList lights;
    EXPECT_NO_THROW(
        lights = test::runSync(ioc_, prism::discoverLights(config_)));

    EXPECT_TRUE(lights.empty());
    EXPECT_THAT(capturedLog(),
                ::testing::HasSubstr(
                    "Failed to connect to Govee light at 127.0.0.1"));
}

TEST_F(GoveeIntegrationTest, DiscoverLightsAbsorbsBindFailure) {
    namespace net = boost::asio;
    net::ip::udp::socket blocker(ioc_, net::ip::udp::endpoint(
                                           net::ip::address_v4::any(), 0));
    config_.govee.listenPort = blocker.local_endpoint().port();

    auto lights = test::runSync(ioc_, prism::discoverLights(config_));

    EXPECT_TRUE(lights.empty());
    EXPECT_THAT(capturedLog(),
                ::testing::HasSubstr("Failed to discover lights for govee"));
}
