#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace hyperheadset {

struct BatteryStatus
{
    bool is_charging = false;
    int charge_percent = 0;

    bool operator==(const BatteryStatus&) const = default;
};

struct HeadsetStatus
{
    bool is_docked = false;
    bool is_on = false;

    bool operator==(const HeadsetStatus&) const = default;
};

struct SidetoneLevels
{
    int active_percent = 0;
    int saved_percent = 0;

    bool operator==(const SidetoneLevels&) const = default;
};

struct Snapshot
{
    std::optional<std::chrono::system_clock::time_point> timestamp;
    std::optional<BatteryStatus> battery;
    std::optional<HeadsetStatus> headset;
    std::optional<SidetoneLevels> sidetone;
};

struct SnapshotOptions
{
    bool battery = true;
    bool headset = true;
    bool sidetone = false;
    bool timestamp = true;
};

struct HidDeviceInfo
{
    uint16_t vendor_id = 0;
    uint16_t product_id = 0;
    std::string manufacturer;
    std::string product;
    std::string path;
    int interface_number = -1;
};

} // namespace hyperheadset
