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

#include <stdint.h>

#include <chrono>
#include <memory>
#include <ostream>
#include <string>

#include <android-base/macros.h>
#include <libusb.h>

#include "usbxfer/async_io.h"
#include "usbxfer/error.h"
#include "usbxfer/event_loop.h"
#include "usbxfer/usb_backend.h"

namespace usbxfer {

class DeviceHandle;
class DeviceList;

// libusb logging levels.
enum class LogLevel {
    // No messages are printed by libusb (default).
    kNone,
    kError,
    kWarning,
    kInfo,
    kDebug,
};

struct LibraryVersion {
    uint16_t major;
    uint16_t minor;
    uint16_t micro;
    uint16_t nano;
    std::string rc;
};

// The version of the libusb library in use.
LibraryVersion GetLibraryVersion();
std::ostream& operator<<(std::ostream& os, const LibraryVersion& version);

struct ContextDeleter {
    void operator()(libusb_context* context) { libusb_exit(context); }
};

using unique_libusb_context = std::unique_ptr<libusb_context, ContextDeleter>;

// A libusb context together with its asynchronous I/O state. Devices, device handles and the
// transfer handles a DeviceHandle returns keep their context alive; libusb_exit runs when the
// last reference goes away.
class Context : public std::enable_shared_from_this<Context> {
  public:
    struct Options {
        // Overridden to kDebug when the libusb trace tag is enabled.
        LogLevel log_level = LogLevel::kNone;

        // Sleep between attempts to take libusb's events lock.
        std::chrono::milliseconds spin_interval = kDefaultSpinInterval;
    };

    static Result<std::shared_ptr<Context>> Create();
    static Result<std::shared_ptr<Context>> Create(const Options& options);
    ~Context();

    void SetLogLevel(LogLevel level);

    bool HasCapability() const;
    bool HasHotplug() const;
    bool HasHidAccess() const;
    bool SupportsDetachKernelDriver() const;

    Result<DeviceList> GetDeviceList();

    // Opens the first device matching |vendor_id| and |product_id|, or returns nullptr. Meant
    // for prototypes; production code should go through GetDeviceList().
    std::unique_ptr<DeviceHandle> OpenDeviceWithVidPid(uint16_t vendor_id, uint16_t product_id);

    // Event loop integration, see AsyncIo.
    Result<void> Register(EventLoop* loop, Token token) { return io_.Register(loop, token); }
    Result<void> Deregister(EventLoop* loop) { return io_.Deregister(loop); }
    Result<void> Pump(EventLoop* loop, CompletionList* out) { return io_.Pump(loop, out); }

    AsyncIo& io() { return io_; }
    libusb_context* native_handle() const { return context_.get(); }

  private:
    Context(unique_libusb_context context, const Options& options);

    // Declared first so that libusb_exit runs after the AsyncIo is gone.
    unique_libusb_context context_;
    LibusbBackend backend_;
    AsyncIo io_;

    DISALLOW_COPY_AND_ASSIGN(Context);
};

}  // namespace usbxfer
