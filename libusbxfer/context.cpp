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

#include "usbxfer/context.h"

#include <errno.h>

#include <utility>

#include <android-base/logging.h>

#include "usbxfer/device.h"
#include "usbxfer/device_handle.h"
#include "usbxfer/usbxfer_trace.h"

namespace usbxfer {

static int libusb_log_level(LogLevel level) {
    switch (level) {
        case LogLevel::kNone:
            return LIBUSB_LOG_LEVEL_NONE;
        case LogLevel::kError:
            return LIBUSB_LOG_LEVEL_ERROR;
        case LogLevel::kWarning:
            return LIBUSB_LOG_LEVEL_WARNING;
        case LogLevel::kInfo:
            return LIBUSB_LOG_LEVEL_INFO;
        case LogLevel::kDebug:
            return LIBUSB_LOG_LEVEL_DEBUG;
    }
    return LIBUSB_LOG_LEVEL_NONE;
}

LibraryVersion GetLibraryVersion() {
    const libusb_version* version = libusb_get_version();
    return LibraryVersion{version->major, version->minor, version->micro, version->nano,
                          version->rc != nullptr ? version->rc : ""};
}

std::ostream& operator<<(std::ostream& os, const LibraryVersion& version) {
    os << version.major << "." << version.minor << "." << version.micro << "." << version.nano;
    if (!version.rc.empty()) {
        os << version.rc;
    }
    return os;
}

Context::Context(unique_libusb_context context, const Options& options)
    : context_(std::move(context)),
      backend_(context_.get()),
      io_(&backend_, options.spin_interval) {}

Context::~Context() {
    LOG(DEBUG) << "closing libusb context";
}

Result<std::shared_ptr<Context>> Context::Create() {
    return Create(Options());
}

Result<std::shared_ptr<Context>> Context::Create(const Options& options) {
    LOG(DEBUG) << "initializing libusb " << GetLibraryVersion();
    libusb_context* context_raw = nullptr;
    int rc = libusb_init(&context_raw);
    if (rc != 0) {
        return UsbError(rc) << "failed to initialize libusb (" << libusb_error_name(rc) << ")";
    }
    unique_libusb_context context(context_raw);

    if (libusb_pollfds_handle_timeouts(context.get()) == 0) {
        return Error(ENOTSUP) << "this system requires time-based libusb event handling, which "
                                 "is not supported";
    }

    std::shared_ptr<Context> result(new Context(std::move(context), options));
    result->SetLogLevel(VLOG_IS_ON(LIBUSB) ? LogLevel::kDebug : options.log_level);
    return result;
}

void Context::SetLogLevel(LogLevel level) {
    int rc = libusb_set_option(context_.get(), LIBUSB_OPTION_LOG_LEVEL, libusb_log_level(level));
    if (rc != 0) {
        LOG(WARNING) << "failed to set libusb log level: " << libusb_error_name(rc);
    }
}

bool Context::HasCapability() const {
    return libusb_has_capability(LIBUSB_CAP_HAS_CAPABILITY) != 0;
}

bool Context::HasHotplug() const {
    return libusb_has_capability(LIBUSB_CAP_HAS_HOTPLUG) != 0;
}

bool Context::HasHidAccess() const {
    return libusb_has_capability(LIBUSB_CAP_HAS_HID_ACCESS) != 0;
}

bool Context::SupportsDetachKernelDriver() const {
    return libusb_has_capability(LIBUSB_CAP_SUPPORTS_DETACH_KERNEL_DRIVER) != 0;
}

Result<DeviceList> Context::GetDeviceList() {
    libusb_device** list = nullptr;
    ssize_t count = libusb_get_device_list(context_.get(), &list);
    if (count < 0) {
        int rc = static_cast<int>(count);
        return UsbError(rc) << "failed to get device list (" << libusb_error_name(rc) << ")";
    }

    std::shared_ptr<Context> self = shared_from_this();
    std::vector<Device> devices;
    devices.reserve(count);
    for (ssize_t i = 0; i < count; ++i) {
        devices.emplace_back(self, list[i]);
    }
    libusb_free_device_list(list, 1);

    VLOG(DEVICE) << "found " << devices.size() << " devices";
    return DeviceList(std::move(devices));
}

std::unique_ptr<DeviceHandle> Context::OpenDeviceWithVidPid(uint16_t vendor_id,
                                                           uint16_t product_id) {
    libusb_device_handle* handle =
            libusb_open_device_with_vid_pid(context_.get(), vendor_id, product_id);
    if (handle == nullptr) {
        return nullptr;
    }
    return std::make_unique<DeviceHandle>(shared_from_this(), handle);
}

}  // namespace usbxfer
