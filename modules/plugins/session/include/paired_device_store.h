#pragma once

#include "peer.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Persistence boundary for the paired-device list. Whole-list replace.
class IPairedDeviceStore {
public:
    virtual ~IPairedDeviceStore() = default;

    virtual std::vector<PairedDevice> loadPairedDevices() = 0;
    virtual bool savePairedDevices(const std::vector<PairedDevice>& devices, std::string* error = nullptr) = 0;
};

// JSON file store: {"version": 1, "paired_devices": [...]}, written to a
// temp file and renamed into place.
class JsonPairedDeviceStore : public IPairedDeviceStore {
public:
    explicit JsonPairedDeviceStore(std::string path);
    ~JsonPairedDeviceStore() override;

    JsonPairedDeviceStore(const JsonPairedDeviceStore&) = delete;
    JsonPairedDeviceStore& operator=(const JsonPairedDeviceStore&) = delete;

    std::vector<PairedDevice> loadPairedDevices() override;
    bool savePairedDevices(const std::vector<PairedDevice>& devices, std::string* error = nullptr) override;

    const std::string& path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> m;
};

// Keeps the list in memory only; used when persistence is disabled and in tests.
class MemoryPairedDeviceStore : public IPairedDeviceStore {
public:
    std::vector<PairedDevice> loadPairedDevices() override;
    bool savePairedDevices(const std::vector<PairedDevice>& devices, std::string* error = nullptr) override;

    void setSaveFails(bool fails);
    size_t saveCount() const;

private:
    mutable std::mutex m_mutex;
    std::vector<PairedDevice> m_devices;
    bool m_save_fails = false;
    size_t m_save_count = 0;
};
