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

#include "usbxfer/transfer.h"

#include <libusb.h>

#include "usbxfer/async_io.h"

namespace usbxfer {

TransferStatus DecodeTransferStatus(int libusb_transfer_status) {
    switch (libusb_transfer_status) {
        case LIBUSB_TRANSFER_COMPLETED:
            return TransferStatus::kSuccess;
        case LIBUSB_TRANSFER_ERROR:
            return TransferStatus::kError;
        case LIBUSB_TRANSFER_TIMED_OUT:
            return TransferStatus::kTimeout;
        case LIBUSB_TRANSFER_CANCELLED:
            return TransferStatus::kCancelled;
        case LIBUSB_TRANSFER_STALL:
            return TransferStatus::kStall;
        case LIBUSB_TRANSFER_NO_DEVICE:
            return TransferStatus::kNoDevice;
        case LIBUSB_TRANSFER_OVERFLOW:
            return TransferStatus::kOverflow;
        default:
            return TransferStatus::kUnknown;
    }
}

const char* TransferStatusName(TransferStatus status) {
    switch (status) {
        case TransferStatus::kSuccess:
            return "success";
        case TransferStatus::kError:
            return "error";
        case TransferStatus::kTimeout:
            return "timeout";
        case TransferStatus::kCancelled:
            return "cancelled";
        case TransferStatus::kStall:
            return "stall";
        case TransferStatus::kNoDevice:
            return "no device";
        case TransferStatus::kOverflow:
            return "overflow";
        case TransferStatus::kUnknown:
            break;
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, TransferStatus status) {
    return os << TransferStatusName(status);
}

TransferOutcome TransferOutcome::Handled(CompletionData data) {
    TransferOutcome outcome;
    outcome.data = std::move(data);
    return outcome;
}

TransferOutcome TransferOutcome::Unhandled(CompletionData data) {
    TransferOutcome outcome;
    outcome.kind = Kind::kUnhandled;
    outcome.data = std::move(data);
    return outcome;
}

TransferOutcome TransferOutcome::ResubmitFailed(int error_code, std::string error_message,
                                                std::vector<uint8_t> buffer) {
    TransferOutcome outcome;
    outcome.kind = Kind::kResubmitFailed;
    outcome.error_code = error_code;
    outcome.error_message = std::move(error_message);
    outcome.buffer = std::move(buffer);
    return outcome;
}

Result<void> TransferHandle::Cancel() const {
    return io_->Cancel(id_);
}

bool TransferHandle::IsRunning() const {
    return io_->IsRunning(id_);
}

}  // namespace usbxfer
