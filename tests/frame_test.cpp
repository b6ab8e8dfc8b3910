#include <gtest/gtest.h>

#include "transport/frame.hpp"

using namespace hyperheadset;

namespace {

using Bytes = std::vector<uint8_t>;

TEST(HeadsetFrame, BatteryRequestAt64BytesIsZeroPadded)
{
    Bytes frame = HeadsetFrame::build_request(0x7C, {}, 64);

    ASSERT_EQ(frame.size(), 64u);
    EXPECT_EQ(frame[0], 0x02);
    EXPECT_EQ(frame[1], 0x7C);
    EXPECT_EQ(frame[2], 0x00);
    for (size_t i = 3; i < frame.size(); ++i) {
        EXPECT_EQ(frame[i], 0x00) << "index " << i;
    }
}

TEST(HeadsetFrame, BatteryRequestAt65BytesCarriesReportId)
{
    Bytes frame = HeadsetFrame::build_request(0x7C, {}, 65);

    ASSERT_EQ(frame.size(), 65u);
    EXPECT_EQ(frame[0], 0x00);
    EXPECT_EQ(frame[1], 0x02);
    EXPECT_EQ(frame[2], 0x7C);
    EXPECT_EQ(frame[3], 0x00);
    for (size_t i = 4; i < frame.size(); ++i) {
        EXPECT_EQ(frame[i], 0x00) << "index " << i;
    }
}

TEST(HeadsetFrame, PayloadFollowsLengthByte)
{
    Bytes frame = HeadsetFrame::build_request(0x68, {0x05}, 64);

    ASSERT_EQ(frame.size(), 64u);
    EXPECT_EQ(frame[1], 0x68);
    EXPECT_EQ(frame[2], 0x01);
    EXPECT_EQ(frame[3], 0x05);
    EXPECT_EQ(frame[4], 0x00);
}

TEST(HeadsetFrame, OtherReportLengthsAreUsedAsBodyLength)
{
    EXPECT_EQ(HeadsetFrame::build_request(0x54, {}, 32).size(), 32u);
    EXPECT_EQ(HeadsetFrame::build_request(0x54, {}, 32)[0], 0x02);
}

TEST(HeadsetFrame, OversizedPayloadIsCutToReport)
{
    Bytes payload(80, 0xAA);
    Bytes frame = HeadsetFrame::build_request(0x54, payload, 64);

    ASSERT_EQ(frame.size(), 64u);
    EXPECT_EQ(frame[2], 80);
    EXPECT_EQ(frame.back(), 0xAA);
}

TEST(HeadsetFrame, NormalizeStripsLeadingReportId)
{
    EXPECT_EQ(HeadsetFrame::normalize({0x00, 0x02, 0x02, 0x01, 0x55}), (Bytes{0x02, 0x02, 0x01, 0x55}));
}

TEST(HeadsetFrame, NormalizeLeavesOtherFramesAlone)
{
    EXPECT_EQ(HeadsetFrame::normalize({0x02, 0x02, 0x01, 0x55}), (Bytes{0x02, 0x02, 0x01, 0x55}));
    EXPECT_EQ(HeadsetFrame::normalize({0x00, 0x03, 0x01}), (Bytes{0x00, 0x03, 0x01}));
    EXPECT_EQ(HeadsetFrame::normalize({0x00}), (Bytes{0x00}));
    EXPECT_TRUE(HeadsetFrame::normalize({}).empty());
}

TEST(HeadsetFrame, ExtractPayloadFromStatusOk)
{
    auto payload = HeadsetFrame::extract_payload({0x02, 0x02, 0x01, 0x55});
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(*payload, (Bytes{0x55}));
}

TEST(HeadsetFrame, ExtractPayloadRejectsBadStatus)
{
    EXPECT_FALSE(HeadsetFrame::extract_payload({0x02, 0x01, 0x01, 0x55}).has_value());
}

TEST(HeadsetFrame, ExtractPayloadRejectsBadMarkerAndShortFrames)
{
    EXPECT_FALSE(HeadsetFrame::extract_payload({0x03, 0x02, 0x01, 0x55}).has_value());
    EXPECT_FALSE(HeadsetFrame::extract_payload({0x02, 0x02}).has_value());
    EXPECT_FALSE(HeadsetFrame::extract_payload({}).has_value());
}

TEST(HeadsetFrame, ExtractPayloadClampsAdvertisedLength)
{
    auto payload = HeadsetFrame::extract_payload({0x02, 0x02, 0x10, 0x01, 0x02});
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(*payload, (Bytes{0x01, 0x02}));

    auto empty = HeadsetFrame::extract_payload({0x02, 0x02, 0x05});
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(HeadsetFrame, ExtractPayloadIgnoresPadding)
{
    Bytes frame{0x02, 0x02, 0x02, 0x68, 0x05};
    frame.resize(64, 0x00);

    auto payload = HeadsetFrame::extract_payload(frame);
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(*payload, (Bytes{0x68, 0x05}));
}

// Device echoing a request back with the status byte set to ok.
TEST(HeadsetFrame, EchoedRequestYieldsOriginalPayload)
{
    const Bytes payload{0x05, 0x01, 0xFE};

    for (int report_length : {64, 65}) {
        Bytes echo = HeadsetFrame::build_request(0x68, payload, report_length);
        size_t body = report_length == 65 ? 1 : 0;
        echo[body + 1] = 0x02;

        auto extracted = HeadsetFrame::extract_payload(HeadsetFrame::normalize(echo));
        ASSERT_TRUE(extracted.has_value()) << "report length " << report_length;
        EXPECT_EQ(*extracted, payload);
    }
}

} // namespace
