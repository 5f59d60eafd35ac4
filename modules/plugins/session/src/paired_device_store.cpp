/**
 * paired_device_store.cpp
 * JSON file-based persistence of completed pairings.
 */

#include "paired_device_store.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>

using json = nlohmann::json;

// ============================================================================
// Impl class
// ============================================================================
struct JsonPairedDeviceStore::Impl {
    explicit Impl(std::string p) : m_path(std::move(p)) {}

    std::vector<PairedDevice> load();
    bool save_atomic(const std::vector<PairedDevice>& devices, std::string* error);

    std::string m_path;
    std::mutex m_mutex;
};

std::vector<PairedDevice> JsonPairedDeviceStore::Impl::load() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<PairedDevice> devices;

    std::ifstream ifs(m_path);
    if (!ifs.is_open()) {
        LOG_DEBUG("PairedDeviceStore: No existing file at " + m_path);
        return devices;
    }

    try {
        json j;
        ifs >> j;

        if (!j.is_object() || !j.contains("paired_devices") || !j["paired_devices"].is_array()) {
            LOG_WARN("PairedDeviceStore: Invalid JSON format in " + m_path);
            return devices;
        }

        for (const auto& d : j["paired_devices"]) {
            if (!d.is_object()) {
                continue;
            }
            PairedDevice device;
            device.id = d.value("id", "");
            device.name = d.value("name", "");
            device.paired_at = d.value("paired_at", 0.0);
            if (d.contains("last_connected") && d["last_connected"].is_number()) {
                device.last_connected = d["last_connected"].get<double>();
            }

            if (!device.id.empty()) {
                devices.push_back(std::move(device));
            }
        }

        LOG_DEBUG("PairedDeviceStore: Loaded " + std::to_string(devices.size()) + " paired devices");
    } catch (const std::exception& e) {
        LOG_WARN("PairedDeviceStore: Failed to parse JSON: " + std::string(e.what()));
        devices.clear();
    }
    return devices;
}

bool JsonPairedDeviceStore::Impl::save_atomic(const std::vector<PairedDevice>& devices, std::string* error) {
    std::lock_guard<std::mutex> lock(m_mutex);

    // Write to temp file then rename for atomicity
    std::string tmp_path = m_path + ".tmp";

    try {
        json j;
        j["version"] = 1;
        j["paired_devices"] = json::array();

        for (const auto& d : devices) {
            json device;
            device["id"] = d.id;
            device["name"] = d.name;
            device["paired_at"] = d.paired_at;
            if (d.last_connected) {
                device["last_connected"] = *d.last_connected;
            }
            j["paired_devices"].push_back(device);
        }

        std::ofstream ofs(tmp_path);
        if (!ofs.is_open()) {
            LOG_ERROR("PairedDeviceStore: Cannot write temp file " + tmp_path);
            if (error) *error = "cannot write " + tmp_path;
            return false;
        }

        ofs << j.dump(2);
        ofs.close();

        if (ofs.fail()) {
            LOG_ERROR("PairedDeviceStore: Failed to write temp file");
            std::remove(tmp_path.c_str());
            if (error) *error = "failed to write " + tmp_path;
            return false;
        }

        // Atomic rename
        if (std::rename(tmp_path.c_str(), m_path.c_str()) != 0) {
            LOG_ERROR("PairedDeviceStore: Failed to rename temp file to " + m_path);
            std::remove(tmp_path.c_str());
            if (error) *error = "failed to rename into " + m_path;
            return false;
        }

        LOG_DEBUG("PairedDeviceStore: Saved " + std::to_string(devices.size()) + " paired devices");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("PairedDeviceStore: Exception during save: " + std::string(e.what()));
        std::remove(tmp_path.c_str());
        if (error) *error = e.what();
        return false;
    }
}

// ============================================================================
// Public API
// ============================================================================

JsonPairedDeviceStore::JsonPairedDeviceStore(std::string path)
    : m(std::make_unique<Impl>(std::move(path))) {}

JsonPairedDeviceStore::~JsonPairedDeviceStore() = default;

std::vector<PairedDevice> JsonPairedDeviceStore::loadPairedDevices() {
    return m->load();
}

bool JsonPairedDeviceStore::savePairedDevices(const std::vector<PairedDevice>& devices, std::string* error) {
    return m->save_atomic(devices, error);
}

const std::string& JsonPairedDeviceStore::path() const {
    return m->m_path;
}

// ============================================================================
// MemoryPairedDeviceStore
// ============================================================================

std::vector<PairedDevice> MemoryPairedDeviceStore::loadPairedDevices() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_devices;
}

bool MemoryPairedDeviceStore::savePairedDevices(const std::vector<PairedDevice>& devices, std::string* error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_save_fails) {
        if (error) *error = "store unavailable";
        return false;
    }
    m_devices = devices;
    ++m_save_count;
    return true;
}

void MemoryPairedDeviceStore::setSaveFails(bool fails) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_save_fails = fails;
}

size_t MemoryPairedDeviceStore::saveCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_save_count;
}
