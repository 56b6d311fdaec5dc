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

#include "usbxfer/async_io.h"

#include <errno.h>
#include <limits.h>
#include <sys/time.h>

#include <exception>
#include <string>
#include <utility>

#include <android-base/logging.h>

#include "usbxfer/usbxfer_trace.h"

namespace usbxfer {

static unsigned int timeout_millis(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        // libusb treats 0 as "no timeout".
        return 0;
    }
    if (timeout.count() > UINT_MAX) {
        return UINT_MAX;
    }
    return static_cast<unsigned int>(timeout.count());
}

AsyncIo::AsyncIo(UsbBackend* backend, std::chrono::milliseconds spin_interval)
    : backend_(backend), bridge_(backend, spin_interval) {}

AsyncIo::~AsyncIo() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!table_.empty()) {
        LOG(WARNING) << table_.size() << " transfers still running at teardown";
    }
    for (auto& record : table_.RemoveAll()) {
        if (record->transfer != nullptr) {
            backend_->FreeTransfer(record->transfer);
        }
    }
}

Result<TransferHandle> AsyncIo::Control(libusb_device_handle* device, uint8_t request_type,
                                        uint8_t request, uint16_t value, uint16_t index,
                                        uint16_t length, std::vector<uint8_t> buffer,
                                        std::chrono::milliseconds timeout,
                                        TransferCallback callback) {
    if (buffer.size() < LIBUSB_CONTROL_SETUP_SIZE + static_cast<size_t>(length)) {
        return Error(EINVAL) << "control transfer buffer of " << buffer.size()
                             << " bytes cannot hold the setup packet and " << length
                             << " bytes of data";
    }
    unsigned int timeout_ms = timeout_millis(timeout);
    return Submit("control", std::move(buffer), std::move(callback), 0,
                  [=](libusb_transfer* transfer, unsigned char* data, int, libusb_transfer_cb_fn cb,
                      void* user_data) {
                      libusb_fill_control_setup(data, request_type, request, value, index,
                                                length);
                      libusb_fill_control_transfer(transfer, device, data, cb, user_data,
                                                   timeout_ms);
                  });
}

Result<TransferHandle> AsyncIo::Bulk(libusb_device_handle* device, uint8_t endpoint,
                                     std::vector<uint8_t> buffer,
                                     std::chrono::milliseconds timeout,
                                     TransferCallback callback) {
    unsigned int timeout_ms = timeout_millis(timeout);
    return Submit("bulk", std::move(buffer), std::move(callback), 0,
                  [=](libusb_transfer* transfer, unsigned char* data, int length,
                      libusb_transfer_cb_fn cb, void* user_data) {
                      libusb_fill_bulk_transfer(transfer, device, endpoint, data, length, cb,
                                                user_data, timeout_ms);
                  });
}

Result<TransferHandle> AsyncIo::Interrupt(libusb_device_handle* device, uint8_t endpoint,
                                          std::vector<uint8_t> buffer,
                                          std::chrono::milliseconds timeout,
                                          TransferCallback callback) {
    unsigned int timeout_ms = timeout_millis(timeout);
    return Submit("interrupt", std::move(buffer), std::move(callback), 0,
                  [=](libusb_transfer* transfer, unsigned char* data, int length,
                      libusb_transfer_cb_fn cb, void* user_data) {
                      libusb_fill_interrupt_transfer(transfer, device, endpoint, data, length, cb,
                                                     user_data, timeout_ms);
                  });
}

Result<TransferHandle> AsyncIo::Isochronous(libusb_device_handle* device, uint8_t endpoint,
                                            int num_iso_packets, std::vector<uint8_t> buffer,
                                            std::chrono::milliseconds timeout,
                                            TransferCallback callback) {
    if (num_iso_packets <= 0) {
        return Error(EINVAL) << "isochronous transfer needs at least one packet, got "
                             << num_iso_packets;
    }
    unsigned int timeout_ms = timeout_millis(timeout);
    return Submit("isochronous", std::move(buffer), std::move(callback), num_iso_packets,
                  [=](libusb_transfer* transfer, unsigned char* data, int length,
                      libusb_transfer_cb_fn cb, void* user_data) {
                      libusb_fill_iso_transfer(transfer, device, endpoint, data, length,
                                               num_iso_packets, cb, user_data, timeout_ms);
                      libusb_set_iso_packet_lengths(transfer, length / num_iso_packets);
                  });
}

Result<TransferHandle> AsyncIo::BulkStream(libusb_device_handle* device, uint8_t endpoint,
                                           uint32_t stream_id, std::vector<uint8_t> buffer,
                                           std::chrono::milliseconds timeout,
                                           TransferCallback callback) {
    unsigned int timeout_ms = timeout_millis(timeout);
    return Submit("bulk stream", std::move(buffer), std::move(callback), 0,
                  [=](libusb_transfer* transfer, unsigned char* data, int length,
                      libusb_transfer_cb_fn cb, void* user_data) {
                      libusb_fill_bulk_stream_transfer(transfer, device, endpoint, stream_id,
                                                       data, length, cb, user_data, timeout_ms);
                  });
}

Result<TransferHandle> AsyncIo::Submit(const char* kind, std::vector<uint8_t> buffer,
                                       TransferCallback callback, int iso_packets,
                                       const FillFunction& fill) {
    if (buffer.size() > INT_MAX) {
        return Error(EINVAL) << kind << " transfer buffer of " << buffer.size()
                             << " bytes is too large";
    }

    TransferTable::Allocation allocation;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        allocation = table_.Allocate(this, std::move(callback), std::move(buffer));
    }

    libusb_transfer* transfer = backend_->AllocTransfer(iso_packets);
    if (transfer == nullptr) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        table_.Remove(allocation.id);
        return Error(ENOMEM) << "failed to allocate " << kind << " transfer";
    }

    fill(transfer, allocation.data, static_cast<int>(allocation.length), OnTransferComplete,
         allocation.record);

    std::lock_guard<std::mutex> lock(state_mutex_);
    auto marked = table_.MarkSubmitted(allocation.id, transfer);
    if (!marked) {
        backend_->FreeTransfer(transfer);
        return Error() << "failed to submit " << kind << " transfer: " << marked.error();
    }

    int rc = backend_->SubmitTransfer(transfer);
    if (rc != 0) {
        LOG(ERROR) << "failed to submit " << kind << " transfer " << allocation.id
                   << " to endpoint " << std::hex << std::showbase
                   << static_cast<unsigned>(transfer->endpoint) << std::dec << " with "
                   << transfer->length << " bytes: " << libusb_error_name(rc);
        table_.Remove(allocation.id);
        backend_->FreeTransfer(transfer);
        return UsbError(rc) << "failed to submit " << kind << " transfer ("
                            << libusb_error_name(rc) << ")";
    }

    VLOG(TRANSFER) << "submitted " << kind << " transfer " << allocation.id << " of "
                   << transfer->length << " bytes";
    return TransferHandle(this, allocation.id);
}

Result<void> AsyncIo::Cancel(TransferId id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return table_.Cancel(id, backend_);
}

bool AsyncIo::IsRunning(TransferId id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return table_.Contains(id);
}

size_t AsyncIo::RunningCount() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return table_.size();
}

void LIBUSB_CALL AsyncIo::OnTransferComplete(libusb_transfer* transfer) {
    CHECK(transfer != nullptr) << "libusb completed a null transfer";
    CHECK(transfer->user_data != nullptr) << "libusb completed a transfer without user data";

    TransferRecord* record = static_cast<TransferRecord*>(transfer->user_data);
    CHECK(record->io != nullptr) << "transfer record has no owning AsyncIo";

    // The record may be freed by Dispatch.
    const TransferId id = record->id;
    try {
        record->io->Dispatch(record, transfer);
    } catch (const std::exception& e) {
        LOG(FATAL) << "completion of transfer " << id << " threw: " << e.what();
    } catch (...) {
        LOG(FATAL) << "completion of transfer " << id << " threw an unknown exception";
    }
}

void AsyncIo::Dispatch(TransferRecord* record, libusb_transfer* transfer) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    const TransferId id = record->id;
    CHECK(table_.Find(id) == record) << "transfer " << id << " completed but is not running";
    CHECK(record->transfer == transfer) << "transfer " << id << " completed a foreign transfer";
    CHECK(record->buffer.has_value()) << "transfer " << id << " completed without a buffer";

    CompletionData data;
    data.buffer = std::move(*record->buffer);
    record->buffer.reset();
    data.actual_length = transfer->actual_length;
    data.status = DecodeTransferStatus(transfer->status);
    if (transfer->type == LIBUSB_TRANSFER_TYPE_ISOCHRONOUS) {
        for (int i = 0; i < transfer->num_iso_packets; ++i) {
            const libusb_iso_packet_descriptor& packet = transfer->iso_packet_desc[i];
            data.iso_packets.push_back({DecodeTransferStatus(packet.status),
                                        packet.actual_length, packet.length});
        }
    }
    VLOG(TRANSFER) << "transfer " << id << " completed with status " << data.status << ", "
                   << data.actual_length << " bytes";

    Directive directive = record->callback ? record->callback(data) : Directive::Unhandled();

    TransferOutcome outcome;
    switch (directive.kind()) {
        case Directive::Kind::kResubmit: {
            std::vector<uint8_t> buffer = directive.TakeBuffer();
            if (buffer.size() > INT_MAX) {
                LOG(WARNING) << "transfer " << id << " resubmitted with an oversized buffer";
                outcome = TransferOutcome::ResubmitFailed(
                        EINVAL, "resubmitted buffer is too large", std::move(buffer));
                break;
            }

            if (transfer->type == LIBUSB_TRANSFER_TYPE_CONTROL) {
                if (buffer.size() < LIBUSB_CONTROL_SETUP_SIZE) {
                    LOG(WARNING) << "transfer " << id << " resubmitted without a setup packet";
                    outcome = TransferOutcome::ResubmitFailed(
                            EINVAL, "resubmitted buffer is shorter than the setup packet",
                            std::move(buffer));
                    break;
                }
                auto setup = reinterpret_cast<const libusb_control_setup*>(buffer.data());
                size_t needed = LIBUSB_CONTROL_SETUP_SIZE + libusb_le16_to_cpu(setup->wLength);
                if (buffer.size() < needed) {
                    LOG(WARNING) << "transfer " << id << " resubmitted with a short data stage";
                    outcome = TransferOutcome::ResubmitFailed(
                            EINVAL, "resubmitted buffer is shorter than its setup packet requires",
                            std::move(buffer));
                    break;
                }
            }

            record->buffer = std::move(buffer);
            transfer->buffer = record->buffer->data();
            transfer->length = static_cast<int>(record->buffer->size());
            // Spread the new buffer over the packets again, as at submission.
            if (transfer->type == LIBUSB_TRANSFER_TYPE_ISOCHRONOUS &&
                transfer->num_iso_packets > 0) {
                libusb_set_iso_packet_lengths(transfer,
                                              transfer->length / transfer->num_iso_packets);
            }
            int rc = backend_->SubmitTransfer(transfer);
            if (rc == 0) {
                VLOG(TRANSFER) << "resubmitted transfer " << id << " with "
                               << transfer->length << " bytes";
                return;
            }

            LOG(WARNING) << "failed to resubmit transfer " << id << ": " << libusb_error_name(rc);
            outcome = TransferOutcome::ResubmitFailed(LibusbErrorToErrno(rc),
                                                      libusb_error_name(rc),
                                                      std::move(*record->buffer));
            record->buffer.reset();
            break;
        }
        case Directive::Kind::kHandled:
            outcome = TransferOutcome::Handled(std::move(data));
            break;
        case Directive::Kind::kUnhandled:
            outcome = TransferOutcome::Unhandled(std::move(data));
            break;
    }

    std::unique_ptr<TransferRecord> retired = table_.Remove(id);
    complete_.emplace_back(id, std::move(outcome));
    backend_->FreeTransfer(transfer);
    VLOG(TRANSFER) << "retired transfer " << id << ", " << table_.size() << " running";
}

Result<void> AsyncIo::Register(EventLoop* loop, Token token) {
    std::lock_guard<std::mutex> lock(registration_mutex_);
    return bridge_.Register(loop, token);
}

Result<void> AsyncIo::Deregister(EventLoop* loop) {
    std::lock_guard<std::mutex> lock(registration_mutex_);
    return bridge_.Deregister(loop);
}

Result<void> AsyncIo::Pump(EventLoop* loop, CompletionList* out) {
    std::lock_guard<std::mutex> lock(registration_mutex_);
    if (!bridge_.registered()) {
        return Error(EINVAL) << "register with an event loop before handling events";
    }

    // The event loop has already signalled readiness, so don't block.
    timeval tv = {0, 0};
    std::string handle_error;
    int rc = backend_->HandleEventsLocked(&tv);
    if (rc == 0) {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        complete_.swap(*out);
        complete_.clear();
    } else {
        handle_error = libusb_error_name(rc);
        LOG(WARNING) << "libusb_handle_events_locked failed: " << handle_error;
    }

    if (!backend_->EventHandlingOk()) {
        backend_->UnlockEvents();
        bridge_.SpinUntilLockedAndOkToHandleEvents();
    }

    auto reconciled = bridge_.Reconcile(loop);
    if (!handle_error.empty()) {
        if (!reconciled) {
            LOG(ERROR) << reconciled.error();
        }
        return UsbError(rc) << "failed to handle libusb events (" << handle_error << ")";
    }
    if (!reconciled) {
        return Error() << reconciled.error();
    }
    return {};
}

std::optional<std::vector<PollFd>> AsyncIo::RegisteredDescriptors() {
    std::lock_guard<std::mutex> lock(registration_mutex_);
    if (!bridge_.registered()) {
        return std::nullopt;
    }
    return bridge_.registration()->fds;
}

}  // namespace usbxfer
