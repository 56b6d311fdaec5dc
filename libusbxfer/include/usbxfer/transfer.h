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

#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "usbxfer/error.h"

namespace usbxfer {

class AsyncIo;
class Context;

// Identifies a running transfer. Identifiers are unique among running transfers only, and are
// reused once a transfer retires.
using TransferId = uint32_t;

// The status of a completed transfer, decoded from libusb_transfer_status.
enum class TransferStatus {
    // Completed without error
    kSuccess,
    // Failed (IO error)
    kError,
    kTimeout,
    kCancelled,
    // Endpoint stalled or control request not supported
    kStall,
    // Device was disconnected
    kNoDevice,
    // Device sent more data than requested
    kOverflow,
    kUnknown,
};

TransferStatus DecodeTransferStatus(int libusb_transfer_status);
const char* TransferStatusName(TransferStatus status);
std::ostream& operator<<(std::ostream& os, TransferStatus status);

struct IsoPacketResult {
    TransferStatus status;
    size_t actual_length;
    size_t length;
};

// Everything the native library reported about one completion. For control transfers the
// buffer starts with the setup packet.
struct CompletionData {
    std::vector<uint8_t> buffer;
    size_t actual_length = 0;
    TransferStatus status = TransferStatus::kUnknown;

    // One entry per packet for isochronous transfers, empty otherwise.
    std::vector<IsoPacketResult> iso_packets;
};

// What a completion callback wants done with its transfer.
class Directive {
  public:
    enum class Kind {
        // The callback processed the completion, the transfer retires.
        kHandled,
        // The completion surfaces in the completion list drained by Pump.
        kUnhandled,
        // Submit the transfer again with a new buffer, under the same id.
        kResubmit,
    };

    static Directive Handled() { return Directive(Kind::kHandled, {}); }
    static Directive Unhandled() { return Directive(Kind::kUnhandled, {}); }
    static Directive Resubmit(std::vector<uint8_t> buffer) {
        return Directive(Kind::kResubmit, std::move(buffer));
    }

    Kind kind() const { return kind_; }
    std::vector<uint8_t> TakeBuffer() { return std::move(buffer_); }

  private:
    Directive(Kind kind, std::vector<uint8_t> buffer) : kind_(kind), buffer_(std::move(buffer)) {}

    Kind kind_;
    std::vector<uint8_t> buffer_;
};

// Invoked on the thread handling libusb events, from within Pump, with both the registration
// lock and the transfer state lock held. Callbacks must not call back into the AsyncIo (or
// Context) that dispatched them: submitting, cancelling, querying running transfers, Register,
// Deregister, Pump and RegisteredDescriptors all deadlock. Return Directive::Resubmit to
// re-issue the transfer instead.
using TransferCallback = std::function<Directive(CompletionData& data)>;

// The terminal result of a transfer, as delivered by Pump.
struct TransferOutcome {
    enum class Kind {
        kHandled,
        kUnhandled,
        kResubmitFailed,
    };

    static TransferOutcome Handled(CompletionData data);
    static TransferOutcome Unhandled(CompletionData data);
    static TransferOutcome ResubmitFailed(int error_code, std::string error_message,
                                          std::vector<uint8_t> buffer);

    Kind kind = Kind::kHandled;

    // Set for kHandled and kUnhandled, as the callback left it. A callback that consumed the
    // buffer leaves it empty.
    std::optional<CompletionData> data;

    // Set for kResubmitFailed: the errno equivalent of the libusb error, its description, and
    // the buffer that could not be submitted.
    int error_code = 0;
    std::string error_message;
    std::vector<uint8_t> buffer;
};

using Completion = std::pair<TransferId, TransferOutcome>;
using CompletionList = std::vector<Completion>;

// Handle to a submitted transfer. Handles returned by a DeviceHandle hold a reference to their
// Context. A handle returned by an AsyncIo used directly holds none, and that AsyncIo must
// outlive it.
class TransferHandle {
  public:
    TransferHandle(AsyncIo* io, TransferId id) : io_(io), id_(id) {}
    TransferHandle(AsyncIo* io, TransferId id, std::shared_ptr<Context> context)
        : io_(io), id_(id), context_(std::move(context)) {}

    TransferId id() const { return id_; }

    // Requests cancellation. Fails if the transfer already retired; a successful request
    // completes the transfer later with TransferStatus::kCancelled.
    Result<void> Cancel() const;

    bool IsRunning() const;

  private:
    AsyncIo* io_;
    TransferId id_;
    std::shared_ptr<Context> context_;
};

}  // namespace usbxfer
