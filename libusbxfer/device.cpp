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

#include "usbxfer/device.h"

#include <utility>

#include <android-base/logging.h>

#include "usbxfer/context.h"
#include "usbxfer/device_handle.h"
#include "usbxfer/usbxfer_trace.h"

namespace usbxfer {

Device::Device(std::shared_ptr<Context> context, libusb_device* device)
    : context_(std::move(context)), device_(libusb_ref_device(device)) {}

Device::Device(const Device& other)
    : context_(other.context_), device_(libusb_ref_device(other.device_)) {}

Device::Device(Device&& other) noexcept
    : context_(std::move(other.context_)), device_(other.device_) {
    other.device_ = nullptr;
}

Device& Device::operator=(Device other) {
    std::swap(context_, other.context_);
    std::swap(device_, other.device_);
    return *this;
}

Device::~Device() {
    if (device_ != nullptr) {
        libusb_unref_device(device_);
    }
}

uint8_t Device::bus_number() const {
    return libusb_get_bus_number(device_);
}

uint8_t Device::address() const {
    return libusb_get_device_address(device_);
}

Speed Device::speed() const {
    return DecodeSpeed(libusb_get_device_speed(device_));
}

Result<DeviceDescriptor> Device::GetDeviceDescriptor() const {
    libusb_device_descriptor descriptor;
    int rc = libusb_get_device_descriptor(device_, &descriptor);
    if (rc != 0) {
        return UsbError(rc) << "failed to get device descriptor for device at "
                            << static_cast<unsigned>(bus_number()) << ":"
                            << static_cast<unsigned>(address());
    }
    return DeviceDescriptor(descriptor);
}

Result<ConfigDescriptor> Device::GetActiveConfigDescriptor() const {
    libusb_config_descriptor* config_raw = nullptr;
    int rc = libusb_get_active_config_descriptor(device_, &config_raw);
    if (rc != 0) {
        return UsbError(rc) << "failed to get active config descriptor ("
                            << libusb_error_name(rc) << ")";
    }
    return ConfigDescriptor(unique_config_descriptor(config_raw));
}

Result<ConfigDescriptor> Device::GetConfigDescriptor(uint8_t config_index) const {
    libusb_config_descriptor* config_raw = nullptr;
    int rc = libusb_get_config_descriptor(device_, config_index, &config_raw);
    if (rc != 0) {
        return UsbError(rc) << "failed to get config descriptor "
                            << static_cast<unsigned>(config_index) << " ("
                            << libusb_error_name(rc) << ")";
    }
    return ConfigDescriptor(unique_config_descriptor(config_raw));
}

Result<std::unique_ptr<DeviceHandle>> Device::Open() const {
    libusb_device_handle* handle = nullptr;
    int rc = libusb_open(device_, &handle);
    if (rc != 0) {
        LOG(WARNING) << "failed to open usb device at " << static_cast<unsigned>(bus_number())
                     << ":" << static_cast<unsigned>(address()) << ": " << libusb_error_name(rc);
        return UsbError(rc) << "failed to open device (" << libusb_error_name(rc) << ")";
    }
    VLOG(DEVICE) << "opened usb device at " << static_cast<unsigned>(bus_number()) << ":"
                 << static_cast<unsigned>(address());
    return std::make_unique<DeviceHandle>(context_, handle);
}

}  // namespace usbxfer
