#include "output/snapshot_format.hpp"
#include <ArduinoJson.h>
#include <iomanip>
#include <sstream>
#include <vector>

namespace hyperheadset::format {

namespace {

constexpr size_t JSON_CAPACITY = 512;

std::string py_bool(bool value)
{
    return value ? "True" : "False";
}

std::string epoch_seconds(std::chrono::system_clock::time_point tp)
{
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << static_cast<double>(us) / 1e6;
    return oss.str();
}

// Keys are inserted in sorted order; ArduinoJson keeps insertion order.
void fill(JsonObject root, const Snapshot& snapshot, bool with_timestamp)
{
    if (snapshot.battery) {
        JsonObject battery = root.createNestedObject("battery");
        battery["chargePercent"] = snapshot.battery->charge_percent;
        battery["isCharging"] = snapshot.battery->is_charging;
    }
    if (snapshot.headset) {
        JsonObject headset = root.createNestedObject("headset");
        headset["isDocked"] = snapshot.headset->is_docked;
        headset["isOn"] = snapshot.headset->is_on;
    }
    if (snapshot.sidetone) {
        JsonObject sidetone = root.createNestedObject("sidetone");
        sidetone["activePercent"] = snapshot.sidetone->active_percent;
        sidetone["savedPercent"] = snapshot.sidetone->saved_percent;
    }
    if (with_timestamp && snapshot.timestamp) {
        // Raw so large epoch values keep their fixed point form.
        root["timestamp"] = serialized(epoch_seconds(*snapshot.timestamp));
    }
}

std::string serialize(const Snapshot& snapshot, bool with_timestamp, bool pretty)
{
    DynamicJsonDocument doc(JSON_CAPACITY);
    JsonObject root = doc.to<JsonObject>();
    fill(root, snapshot, with_timestamp);

    std::string out;
    if (pretty) {
        serializeJsonPretty(doc, out);
    } else {
        serializeJson(doc, out);
    }
    return out;
}

} // anonymous namespace

std::string human(const Snapshot& snapshot)
{
    std::ostringstream oss;

    if (snapshot.battery) {
        oss << "Battery: " << snapshot.battery->charge_percent << "% charging="
            << py_bool(snapshot.battery->is_charging) << "\n";
    }
    if (snapshot.headset) {
        oss << "Headset: docked=" << py_bool(snapshot.headset->is_docked)
            << " on=" << py_bool(snapshot.headset->is_on) << "\n";
    }
    if (snapshot.sidetone) {
        oss << "Sidetone: active=" << snapshot.sidetone->active_percent << "% saved="
            << snapshot.sidetone->saved_percent << "%\n";
    }

    return oss.str();
}

std::string json(const Snapshot& snapshot, bool pretty)
{
    return serialize(snapshot, true, pretty);
}

std::string csv_header()
{
    return "timestamp,batteryChargePercent,batteryIsCharging,headsetIsDocked,headsetIsOn,"
           "sidetoneActivePercent,sidetoneSavedPercent";
}

std::string csv_row(const Snapshot& snapshot)
{
    std::vector<std::string> cells(7);

    if (snapshot.timestamp) {
        cells[0] = epoch_seconds(*snapshot.timestamp);
    }
    if (snapshot.battery) {
        cells[1] = std::to_string(snapshot.battery->charge_percent);
        cells[2] = py_bool(snapshot.battery->is_charging);
    }
    if (snapshot.headset) {
        cells[3] = py_bool(snapshot.headset->is_docked);
        cells[4] = py_bool(snapshot.headset->is_on);
    }
    if (snapshot.sidetone) {
        cells[5] = std::to_string(snapshot.sidetone->active_percent);
        cells[6] = std::to_string(snapshot.sidetone->saved_percent);
    }

    std::string row;
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) {
            row += ',';
        }
        row += cells[i];
    }
    return row;
}

std::string signature(const Snapshot& snapshot)
{
    return serialize(snapshot, false, false);
}

} // namespace hyperheadset::format
