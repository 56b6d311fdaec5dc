/*
 * Copyright (C) 2026 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <vector>

#include <libusb.h>

#include "usbxfer/descriptors.h"
#include "usbxfer/error.h"

namespace usbxfer {

class Context;
class DeviceHandle;

// A reference to a USB device attached to the system. Copies share the underlying
// libusb_device through libusb's reference count.
class Device {
  public:
    // Takes a new reference on |device|.
    Device(std::shared_ptr<Context> context, libusb_device* device);
    Device(const Device& other);
    Device(Device&& other) noexcept;
    Device& operator=(Device other);
    ~Device();

    uint8_t bus_number() const;
    uint8_t address() const;
    Speed speed() const;

    Result<DeviceDescriptor> GetDeviceDescriptor() const;
    Result<ConfigDescriptor> GetActiveConfigDescriptor() const;
    Result<ConfigDescriptor> GetConfigDescriptor(uint8_t config_index) const;

    Result<std::unique_ptr<DeviceHandle>> Open() const;

    libusb_device* native_handle() const { return device_; }

  private:
    std::shared_ptr<Context> context_;
    libusb_device* device_;
};

// A snapshot of the devices attached when it was taken.
class DeviceList {
  public:
    using const_iterator = std::vector<Device>::const_iterator;

    explicit DeviceList(std::vector<Device> devices) : devices_(std::move(devices)) {}

    size_t size() const { return devices_.size(); }
    bool empty() const { return devices_.empty(); }
    const Device& operator[](size_t i) const { return devices_[i]; }
    const_iterator begin() const { return devices_.begin(); }
    const_iterator end() const { return devices_.end(); }

  private:
    std::vector<Device> devices_;
};

}  // namespace usbxfer
