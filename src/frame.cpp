#include "transport/frame.hpp"
#include <algorithm>

namespace hyperheadset {

std::vector<uint8_t> HeadsetFrame::build_request(uint8_t command, const std::vector<uint8_t>& payload, int report_length)
{
    // A 65 byte report is a report id followed by a 64 byte body.
    bool with_id = report_length == Protocol::REPORT_LENGTH_WITH_ID;
    size_t body_len = with_id ? Protocol::REPORT_LENGTH : static_cast<size_t>(std::max(report_length, 0));

    std::vector<uint8_t> frame;
    frame.reserve(body_len + 1);
    if (with_id) {
        frame.push_back(Protocol::REPORT_ID);
    }

    size_t body_start = frame.size();
    frame.push_back(Protocol::FRAME_MARKER);
    frame.push_back(command);
    frame.push_back(static_cast<uint8_t>(payload.size() & 0xFF));
    frame.insert(frame.end(), payload.begin(), payload.end());

    frame.resize(body_start + body_len, 0x00);
    return frame;
}

std::vector<uint8_t> HeadsetFrame::normalize(const std::vector<uint8_t>& raw)
{
    if (raw.size() > 1 && raw[0] == Protocol::REPORT_ID && raw[1] == Protocol::FRAME_MARKER) {
        return std::vector<uint8_t>(raw.begin() + 1, raw.end());
    }
    return raw;
}

std::optional<std::vector<uint8_t>> HeadsetFrame::extract_payload(const std::vector<uint8_t>& frame)
{
    if (frame.size() < Protocol::HEADER_SIZE) {
        return std::nullopt;
    }

    if (frame[0] != Protocol::FRAME_MARKER || frame[1] != Protocol::STATUS_OK) {
        return std::nullopt;
    }

    // Truncated frames advertise more than they carry.
    size_t len = std::min<size_t>(frame[2], frame.size() - Protocol::HEADER_SIZE);
    auto first = frame.begin() + Protocol::HEADER_SIZE;
    return std::vector<uint8_t>(first, first + len);
}

} // namespace hyperheadset
