#include <gtest/gtest.h>

#include "devices/query_engine.hpp"
#include "fake_hid.hpp"

using namespace hyperheadset;
using namespace hyperheadset::fake;

namespace {

class QueryEngineTest : public ::testing::Test
{
protected:
    FakeHidBackend backend;
    SleepRecorder sleeps;
    ClientConfig config;

    QueryEngineTest()
    {
        // Feature reports only, one report length: one read per attempt.
        config.report_lengths = {64};
    }
};

TEST_F(QueryEngineTest, NoMatchingDeviceFailsBeforeAnyIo)
{
    backend.state.devices.clear();
    QueryEngine engine(backend, config, sleeps.sleeper());

    auto r = engine.query(Command::BatteryStatus);

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), Error::DEVICE_NOT_FOUND);
    EXPECT_EQ(backend.state.created, 0);
    EXPECT_EQ(backend.state.opened, 0);
    EXPECT_NE(r.failure_info().message.find("0x9886"), std::string::npos);
}

TEST_F(QueryEngineTest, OtherVendorIsNotMatched)
{
    config.vendor_id = 0x1234;
    QueryEngine engine(backend, config, sleeps.sleeper());

    auto r = engine.query(Command::HeadsetStatus);

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), Error::DEVICE_NOT_FOUND);
}

TEST_F(QueryEngineTest, FirstMatchingDeviceIsUsed)
{
    HidDeviceInfo second = backend.state.devices.front();
    second.path = "/dev/hidraw9";
    backend.state.devices.push_back(second);
    backend.state.on_feature = always(ok_frame({0x01}));
    QueryEngine engine(backend, config, sleeps.sleeper());

    auto r = engine.query(Command::HeadsetStatus);

    ASSERT_TRUE(r.ok());
    ASSERT_FALSE(backend.state.opened_paths.empty());
    EXPECT_EQ(backend.state.opened_paths.front(), "/dev/hidraw3");
}

TEST_F(QueryEngineTest, SucceedsOnLastAttemptAndStops)
{
    backend.state.on_feature = scripted({
        Result<Bytes>::success({}),
        Result<Bytes>::success({}),
        Result<Bytes>::success({}),
        Result<Bytes>::success(ok_frame({0x55})),
        Result<Bytes>::success(ok_frame({0x66})),
    });
    QueryEngine engine(backend, config, sleeps.sleeper());

    auto r = engine.query(Command::BatteryStatus, {}, 4);

    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value(), (Bytes{0x55}));
    EXPECT_EQ(backend.state.feature_reads, 4);
    EXPECT_EQ(sleeps.count(std::chrono::milliseconds(Protocol::RETRY_BACKOFF_MS)), 3);
    EXPECT_EQ(sleeps.count(config.command_delay), 1);
}

TEST_F(QueryEngineTest, MalformedFramesAreRetried)
{
    backend.state.on_feature = scripted({
        Result<Bytes>::success({0x02, 0x01, 0x01, 0x55}),
        Result<Bytes>::success(ok_frame({0x21})),
    });
    QueryEngine engine(backend, config, sleeps.sleeper());

    auto r = engine.query(Command::Balance);

    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value(), (Bytes{0x21}));
    EXPECT_EQ(backend.state.feature_reads, 2);
}

TEST_F(QueryEngineTest, ExhaustedRetriesReportCommunicationError)
{
    QueryEngine engine(backend, config, sleeps.sleeper());

    auto r = engine.query(Command::MicEq, {0x00}, 3);

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), Error::COMMUNICATION_ERROR);
    EXPECT_FALSE(r.failure_info().cause.has_value());
    EXPECT_NE(r.failure_info().message.find("0x7B"), std::string::npos);
    EXPECT_EQ(backend.state.feature_reads, 3);
    EXPECT_EQ(sleeps.count(config.command_delay), 0);
}

TEST_F(QueryEngineTest, LastTransportErrorIsChained)
{
    backend.state.fail_open = true;
    QueryEngine engine(backend, config, sleeps.sleeper());

    auto r = engine.query(Command::HeadsetStatus);

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), Error::COMMUNICATION_ERROR);
    ASSERT_TRUE(r.failure_info().cause.has_value());
    EXPECT_EQ(*r.failure_info().cause, Error::PORT_ERROR);
    EXPECT_EQ(backend.state.created, config.retries);
}

TEST_F(QueryEngineTest, DeviceResolvedOncePerQuery)
{
    backend.state.on_feature = scripted({
        Result<Bytes>::success({}),
        Result<Bytes>::success(ok_frame({0x01})),
    });
    QueryEngine engine(backend, config, sleeps.sleeper());

    auto r = engine.query(Command::HeadsetStatus);

    ASSERT_TRUE(r.ok());
    EXPECT_EQ(backend.state.enumerations, 1);
}

TEST_F(QueryEngineTest, RequestCarriesCommandAndPayload)
{
    backend.state.on_feature = always(ok_frame({0x68, 0x05, 0x32, 0x28}));
    QueryEngine engine(backend, config, sleeps.sleeper());

    auto r = engine.query(Command::SliderValue, {0x05});

    ASSERT_TRUE(r.ok());
    ASSERT_EQ(backend.state.feature_requests.size(), 1u);
    const Bytes& request = backend.state.feature_requests[0];
    EXPECT_EQ(request[0], 0x02);
    EXPECT_EQ(request[1], 0x68);
    EXPECT_EQ(request[2], 0x01);
    EXPECT_EQ(request[3], 0x05);
}

} // namespace
