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
#include <poll.h>

#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <stdexcept>
#include <vector>

#include "fake_event_loop.h"
#include "fake_usb_backend.h"

using namespace std::chrono_literals;
using namespace usbxfer;

static constexpr Token kToken = 0x1234;

class AsyncIoTest : public ::testing::Test {
  protected:
    AsyncIoTest() : io_(&backend_, 1ms) {
        backend_.SetPollFds({{5, POLLIN}, {6, POLLOUT}});
    }

    void TearDown() override {
        if (io_.RegisteredDescriptors()) {
            ASSERT_TRUE(io_.Deregister(&loop_).has_value());
        }
    }

    void RegisterLoop() {
        auto result = io_.Register(&loop_, kToken);
        ASSERT_TRUE(result.has_value()) << result.error();
        loop_.ClearCalls();
    }

    CompletionList PumpOnce() {
        CompletionList out;
        auto result = io_.Pump(&loop_, &out);
        EXPECT_TRUE(result.has_value()) << result.error();
        return out;
    }

    FakeUsbBackend backend_;
    FakeEventLoop loop_;
    AsyncIo io_;
};

using AsyncIoDeathTest = AsyncIoTest;

TEST_F(AsyncIoTest, bulk_without_callback_surfaces_unhandled) {
    RegisterLoop();
    auto handle = io_.Bulk(nullptr, 0x81, std::vector<uint8_t>(64), 1000ms);
    ASSERT_TRUE(handle.has_value()) << handle.error();
    ASSERT_TRUE(handle->IsRunning());
    ASSERT_EQ(1u, backend_.in_flight().size());
    ASSERT_EQ(64, backend_.last_in_flight()->length);
    ASSERT_EQ(0x81, backend_.last_in_flight()->endpoint);
    ASSERT_EQ(1000u, backend_.last_in_flight()->timeout);

    backend_.QueueCompletion(backend_.last_in_flight(), LIBUSB_TRANSFER_COMPLETED, 64);
    CompletionList out = PumpOnce();

    ASSERT_EQ(1u, out.size());
    ASSERT_EQ(handle->id(), out[0].first);
    const TransferOutcome& outcome = out[0].second;
    ASSERT_EQ(TransferOutcome::Kind::kUnhandled, outcome.kind);
    ASSERT_TRUE(outcome.data.has_value());
    ASSERT_EQ(64u, outcome.data->actual_length);
    ASSERT_EQ(64u, outcome.data->buffer.size());
    ASSERT_EQ(TransferStatus::kSuccess, outcome.data->status);
    ASSERT_TRUE(outcome.data->iso_packets.empty());

    ASSERT_FALSE(handle->IsRunning());
    ASSERT_EQ(0u, io_.RunningCount());
    ASSERT_EQ(0u, backend_.live_transfers());
}

TEST_F(AsyncIoTest, callback_sees_completion) {
    RegisterLoop();
    size_t seen_length = 0;
    TransferStatus seen_status = TransferStatus::kUnknown;
    auto handle = io_.Interrupt(nullptr, 0x83, std::vector<uint8_t>(8), 0ms,
                                [&](CompletionData& data) {
                                    seen_length = data.actual_length;
                                    seen_status = data.status;
                                    return Directive::Handled();
                                });
    ASSERT_TRUE(handle.has_value()) << handle.error();

    backend_.QueueCompletion(backend_.last_in_flight(), LIBUSB_TRANSFER_STALL, 3);
    CompletionList out = PumpOnce();

    ASSERT_EQ(3u, seen_length);
    ASSERT_EQ(TransferStatus::kStall, seen_status);
    ASSERT_EQ(1u, out.size());
    ASSERT_EQ(handle->id(), out[0].first);
    ASSERT_EQ(TransferOutcome::Kind::kHandled, out[0].second.kind);
    ASSERT_EQ(TransferStatus::kStall, out[0].second.data->status);
    ASSERT_FALSE(handle->IsRunning());
}

TEST_F(AsyncIoTest, handled_completion_returns_buffer) {
    RegisterLoop();
    std::vector<uint8_t> buffer = {1, 2, 3, 4, 5, 6, 7, 8};
    auto handle = io_.Bulk(nullptr, 0x81, buffer, 0ms,
                           [](CompletionData&) { return Directive::Handled(); });
    ASSERT_TRUE(handle.has_value()) << handle.error();

    // The device fills in the first half.
    libusb_transfer* transfer = backend_.last_in_flight();
    transfer->buffer[0] = 0xa0;
    transfer->buffer[1] = 0xa1;
    transfer->buffer[2] = 0xa2;
    transfer->buffer[3] = 0xa3;
    backend_.QueueCompletion(transfer, LIBUSB_TRANSFER_COMPLETED, 4);
    CompletionList out = PumpOnce();

    ASSERT_EQ(1u, out.size());
    ASSERT_EQ(TransferOutcome::Kind::kHandled, out[0].second.kind);
    const CompletionData& data = *out[0].second.data;
    ASSERT_EQ(TransferStatus::kSuccess, data.status);
    ASSERT_EQ(4u, data.actual_length);
    ASSERT_EQ(std::vector<uint8_t>({0xa0, 0xa1, 0xa2, 0xa3, 5, 6, 7, 8}), data.buffer);
}

TEST_F(AsyncIoTest, callback_can_consume_buffer) {
    RegisterLoop();
    std::vector<uint8_t> consumed;
    auto handle = io_.Bulk(nullptr, 0x81, std::vector<uint8_t>(16, 0x5a), 0ms,
                           [&consumed](CompletionData& data) {
                               consumed = std::move(data.buffer);
                               return Directive::Handled();
                           });
    ASSERT_TRUE(handle.has_value()) << handle.error();

    backend_.QueueCompletion(backend_.last_in_flight(), LIBUSB_TRANSFER_COMPLETED, 16);
    CompletionList out = PumpOnce();

    ASSERT_EQ(std::vector<uint8_t>(16, 0x5a), consumed);
    ASSERT_EQ(1u, out.size());
    ASSERT_TRUE(out[0].second.data->buffer.empty());
}

TEST_F(AsyncIoTest, resubmit_keeps_transfer_running) {
    RegisterLoop();
    int calls = 0;
    auto handle = io_.Bulk(nullptr, 0x81, std::vector<uint8_t>(64), 0ms,
                           [&calls](CompletionData&) {
                               if (++calls == 1) {
                                   return Directive::Resubmit(std::vector<uint8_t>(32));
                               }
                               return Directive::Handled();
                           });
    ASSERT_TRUE(handle.has_value()) << handle.error();
    libusb_transfer* transfer = backend_.last_in_flight();

    backend_.QueueCompletion(transfer, LIBUSB_TRANSFER_COMPLETED, 64);
    CompletionList out = PumpOnce();
    ASSERT_TRUE(out.empty());
    ASSERT_EQ(1, calls);
    ASSERT_TRUE(handle->IsRunning());
    ASSERT_EQ(1u, backend_.in_flight().size());
    ASSERT_EQ(transfer, backend_.last_in_flight());
    ASSERT_EQ(32, transfer->length);
    ASSERT_EQ(2, backend_.submit_calls());

    backend_.QueueCompletion(transfer, LIBUSB_TRANSFER_COMPLETED, 32);
    out = PumpOnce();
    ASSERT_EQ(2, calls);
    ASSERT_EQ(1u, out.size());
    ASSERT_EQ(handle->id(), out[0].first);
    ASSERT_EQ(TransferOutcome::Kind::kHandled, out[0].second.kind);
    ASSERT_FALSE(handle->IsRunning());
    ASSERT_EQ(0u, backend_.live_transfers());
}

TEST_F(AsyncIoTest, resubmit_failure_returns_buffer) {
    RegisterLoop();
    auto handle = io_.Bulk(nullptr, 0x81, std::vector<uint8_t>(64), 0ms, [](CompletionData&) {
        return Directive::Resubmit(std::vector<uint8_t>(16, 0xab));
    });
    ASSERT_TRUE(handle.has_value()) << handle.error();

    backend_.QueueCompletion(backend_.last_in_flight(), LIBUSB_TRANSFER_COMPLETED, 64);
    backend_.FailNextSubmit(LIBUSB_ERROR_NO_DEVICE);
    CompletionList out = PumpOnce();

    ASSERT_EQ(1u, out.size());
    const TransferOutcome& outcome = out[0].second;
    ASSERT_EQ(TransferOutcome::Kind::kResubmitFailed, outcome.kind);
    ASSERT_EQ(ENODEV, outcome.error_code);
    ASSERT_FALSE(outcome.error_message.empty());
    ASSERT_EQ(std::vector<uint8_t>(16, 0xab), outcome.buffer);
    ASSERT_FALSE(handle->IsRunning());
    ASSERT_EQ(0u, backend_.live_transfers());
}

TEST_F(AsyncIoTest, callback_runs_inside_pump_with_events_locked) {
    RegisterLoop();
    bool locked_in_callback = false;
    auto handle = io_.Bulk(nullptr, 0x81, std::vector<uint8_t>(8), 0ms,
                           [this, &locked_in_callback](CompletionData&) {
                               locked_in_callback = backend_.events_locked();
                               return Directive::Handled();
                           });
    ASSERT_TRUE(handle.has_value()) << handle.error();

    backend_.QueueCompletion(backend_.last_in_flight(), LIBUSB_TRANSFER_COMPLETED, 8);
    CompletionList out = PumpOnce();
    ASSERT_EQ(1u, out.size());
    ASSERT_TRUE(locked_in_callback);

    // The registration is untouched by dispatch.
    auto registered = io_.RegisteredDescriptors();
    ASSERT_TRUE(registered.has_value());
    ASSERT_EQ(2u, registered->size());
}

TEST_F(AsyncIoTest, completion_outside_pump_is_delivered_by_next_pump) {
    RegisterLoop();
    auto handle = io_.Bulk(nullptr, 0x02, std::vector<uint8_t>(4), 0ms);
    ASSERT_TRUE(handle.has_value()) << handle.error();

    backend_.CompleteNow(backend_.last_in_flight(), LIBUSB_TRANSFER_TIMED_OUT, 0);
    ASSERT_FALSE(handle->IsRunning());

    CompletionList out = PumpOnce();
    ASSERT_EQ(1u, out.size());
    ASSERT_EQ(TransferStatus::kTimeout, out[0].second.data->status);

    // Each completion is delivered once.
    out = PumpOnce();
    ASSERT_TRUE(out.empty());
}

TEST_F(AsyncIoTest, pump_discards_stale_entries) {
    RegisterLoop();
    CompletionList out;
    out.emplace_back(99, TransferOutcome::Handled(CompletionData()));
    ASSERT_TRUE(io_.Pump(&loop_, &out).has_value());
    ASSERT_TRUE(out.empty());
}

TEST_F(AsyncIoTest, running_transfers_have_distinct_ids) {
    std::set<TransferId> ids;
    for (int i = 0; i < 8; ++i) {
        auto handle = io_.Bulk(nullptr, 0x81, std::vector<uint8_t>(8), 0ms);
        ASSERT_TRUE(handle.has_value()) << handle.error();
        ASSERT_TRUE(ids.insert(handle->id()).second);
    }
    ASSERT_EQ(8u, io_.RunningCount());
}

TEST_F(AsyncIoTest, submit_failure_releases_transfer) {
    backend_.FailNextSubmit(LIBUSB_ERROR_NO_DEVICE);
    auto handle = io_.Bulk(nullptr, 0x81, std::vector<uint8_t>(8), 0ms);
    ASSERT_FALSE(handle.has_value());
    ASSERT_EQ(ENODEV, handle.error().code());
    ASSERT_EQ(0u, io_.RunningCount());
    ASSERT_EQ(0u, backend_.live_transfers());
}

TEST_F(AsyncIoTest, alloc_failure) {
    backend_.FailNextAlloc();
    auto handle = io_.Bulk(nullptr, 0x81, std::vector<uint8_t>(8), 0ms);
    ASSERT_FALSE(handle.has_value());
    ASSERT_EQ(ENOMEM, handle.error().code());
    ASSERT_EQ(0u, io_.RunningCount());
    ASSERT_EQ(0, backend_.submit_calls());
}

TEST_F(AsyncIoTest, cancel) {
    RegisterLoop();
    auto handle = io_.Bulk(nullptr, 0x81, std::vector<uint8_t>(8), 0ms);
    ASSERT_TRUE(handle.has_value()) << handle.error();

    ASSERT_TRUE(handle->Cancel().has_value());
    ASSERT_EQ(1, backend_.cancel_calls());
    ASSERT_TRUE(handle->IsRunning());

    CompletionList out = PumpOnce();
    ASSERT_EQ(1u, out.size());
    ASSERT_EQ(TransferOutcome::Kind::kUnhandled, out[0].second.kind);
    ASSERT_EQ(TransferStatus::kCancelled, out[0].second.data->status);

    auto result = handle->Cancel();
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(ENOENT, result.error().code());
    ASSERT_EQ(1, backend_.cancel_calls());
}

TEST_F(AsyncIoTest, control_fills_setup_packet) {
    RegisterLoop();
    std::vector<uint8_t> buffer(LIBUSB_CONTROL_SETUP_SIZE + 16);
    auto handle = io_.Control(nullptr, 0xc0, 0x33, 0x0102, 0x0304, 16, buffer, 0ms);
    ASSERT_TRUE(handle.has_value()) << handle.error();
    ASSERT_EQ(static_cast<int>(LIBUSB_CONTROL_SETUP_SIZE) + 16, backend_.last_in_flight()->length);
    ASSERT_EQ(LIBUSB_TRANSFER_TYPE_CONTROL, backend_.last_in_flight()->type);

    backend_.QueueCompletion(backend_.last_in_flight(), LIBUSB_TRANSFER_COMPLETED, 16);
    CompletionList out = PumpOnce();
    ASSERT_EQ(1u, out.size());
    const std::vector<uint8_t>& data = out[0].second.data->buffer;
    ASSERT_EQ(0xc0, data[0]);
    ASSERT_EQ(0x33, data[1]);
    ASSERT_EQ(0x02, data[2]);
    ASSERT_EQ(0x01, data[3]);
    ASSERT_EQ(0x04, data[4]);
    ASSERT_EQ(0x03, data[5]);
    ASSERT_EQ(16, data[6]);
    ASSERT_EQ(0, data[7]);
}

TEST_F(AsyncIoTest, control_buffer_too_small) {
    std::vector<uint8_t> buffer(LIBUSB_CONTROL_SETUP_SIZE + 15);
    auto handle = io_.Control(nullptr, 0xc0, 0x33, 0, 0, 16, buffer, 0ms);
    ASSERT_FALSE(handle.has_value());
    ASSERT_EQ(EINVAL, handle.error().code());
    ASSERT_EQ(0, backend_.submit_calls());
    ASSERT_EQ(0u, backend_.live_transfers());
}

TEST_F(AsyncIoTest, isochronous_reports_packets) {
    RegisterLoop();
    auto handle = io_.Isochronous(nullptr, 0x82, 4, std::vector<uint8_t>(64), 0ms);
    ASSERT_TRUE(handle.has_value()) << handle.error();
    libusb_transfer* transfer = backend_.last_in_flight();
    ASSERT_EQ(4, transfer->num_iso_packets);
    for (int i = 0; i < 4; ++i) {
        ASSERT_EQ(16u, transfer->iso_packet_desc[i].length);
    }

    backend_.QueueCompletion(transfer, LIBUSB_TRANSFER_COMPLETED, 64);
    CompletionList out = PumpOnce();
    ASSERT_EQ(1u, out.size());
    const CompletionData& data = *out[0].second.data;
    ASSERT_EQ(4u, data.iso_packets.size());
    for (const IsoPacketResult& packet : data.iso_packets) {
        ASSERT_EQ(TransferStatus::kSuccess, packet.status);
        ASSERT_EQ(16u, packet.actual_length);
        ASSERT_EQ(16u, packet.length);
    }
}

TEST_F(AsyncIoTest, isochronous_needs_packets) {
    auto handle = io_.Isochronous(nullptr, 0x82, 0, std::vector<uint8_t>(64), 0ms);
    ASSERT_FALSE(handle.has_value());
    ASSERT_EQ(EINVAL, handle.error().code());
    ASSERT_EQ(0u, backend_.live_transfers());
}

TEST_F(AsyncIoTest, isochronous_resubmit_recomputes_packet_lengths) {
    RegisterLoop();
    int calls = 0;
    auto handle = io_.Isochronous(nullptr, 0x82, 4, std::vector<uint8_t>(64), 0ms,
                                  [&calls](CompletionData&) {
                                      if (++calls == 1) {
                                          return Directive::Resubmit(std::vector<uint8_t>(32));
                                      }
                                      return Directive::Handled();
                                  });
    ASSERT_TRUE(handle.has_value()) << handle.error();
    libusb_transfer* transfer = backend_.last_in_flight();

    backend_.QueueCompletion(transfer, LIBUSB_TRANSFER_COMPLETED, 64);
    CompletionList out = PumpOnce();
    ASSERT_TRUE(out.empty());
    ASSERT_TRUE(handle->IsRunning());
    ASSERT_EQ(32, transfer->length);
    ASSERT_EQ(4, transfer->num_iso_packets);
    for (int i = 0; i < 4; ++i) {
        ASSERT_EQ(8u, transfer->iso_packet_desc[i].length);
    }

    backend_.QueueCompletion(transfer, LIBUSB_TRANSFER_COMPLETED, 32);
    out = PumpOnce();
    ASSERT_EQ(1u, out.size());
    ASSERT_EQ(32u, out[0].second.data->buffer.size());
    for (const IsoPacketResult& packet : out[0].second.data->iso_packets) {
        ASSERT_EQ(8u, packet.length);
        ASSERT_EQ(8u, packet.actual_length);
    }
}

TEST_F(AsyncIoTest, control_resubmit_without_setup_packet) {
    RegisterLoop();
    std::vector<uint8_t> buffer(LIBUSB_CONTROL_SETUP_SIZE + 16);
    auto handle = io_.Control(nullptr, 0xc0, 0x33, 0, 0, 16, buffer, 0ms, [](CompletionData&) {
        return Directive::Resubmit(std::vector<uint8_t>(4, 0xcd));
    });
    ASSERT_TRUE(handle.has_value()) << handle.error();

    backend_.QueueCompletion(backend_.last_in_flight(), LIBUSB_TRANSFER_COMPLETED, 16);
    CompletionList out = PumpOnce();

    ASSERT_EQ(1u, out.size());
    const TransferOutcome& outcome = out[0].second;
    ASSERT_EQ(TransferOutcome::Kind::kResubmitFailed, outcome.kind);
    ASSERT_EQ(EINVAL, outcome.error_code);
    ASSERT_EQ(std::vector<uint8_t>(4, 0xcd), outcome.buffer);
    ASSERT_EQ(1, backend_.submit_calls());
    ASSERT_FALSE(handle->IsRunning());
    ASSERT_EQ(0u, backend_.live_transfers());
}

TEST_F(AsyncIoTest, control_resubmit_with_short_data_stage) {
    RegisterLoop();
    std::vector<uint8_t> buffer(LIBUSB_CONTROL_SETUP_SIZE + 16);
    auto handle = io_.Control(nullptr, 0xc0, 0x33, 0, 0, 16, buffer, 0ms,
                              [](CompletionData& data) {
                                  // Keep the setup packet, which still asks for 16 bytes.
                                  data.buffer.resize(LIBUSB_CONTROL_SETUP_SIZE + 8);
                                  return Directive::Resubmit(std::move(data.buffer));
                              });
    ASSERT_TRUE(handle.has_value()) << handle.error();

    backend_.QueueCompletion(backend_.last_in_flight(), LIBUSB_TRANSFER_COMPLETED, 16);
    CompletionList out = PumpOnce();

    ASSERT_EQ(1u, out.size());
    ASSERT_EQ(TransferOutcome::Kind::kResubmitFailed, out[0].second.kind);
    ASSERT_EQ(EINVAL, out[0].second.error_code);
    ASSERT_EQ(LIBUSB_CONTROL_SETUP_SIZE + 8, out[0].second.buffer.size());
    ASSERT_EQ(1, backend_.submit_calls());
}

TEST_F(AsyncIoTest, control_resubmit_reuses_transfer) {
    RegisterLoop();
    int calls = 0;
    std::vector<uint8_t> buffer(LIBUSB_CONTROL_SETUP_SIZE + 16);
    auto handle = io_.Control(nullptr, 0xc0, 0x33, 0, 0, 16, buffer, 0ms,
                              [&calls](CompletionData& data) {
                                  if (++calls == 1) {
                                      return Directive::Resubmit(std::move(data.buffer));
                                  }
                                  return Directive::Handled();
                              });
    ASSERT_TRUE(handle.has_value()) << handle.error();
    libusb_transfer* transfer = backend_.last_in_flight();

    backend_.QueueCompletion(transfer, LIBUSB_TRANSFER_COMPLETED, 16);
    ASSERT_TRUE(PumpOnce().empty());
    ASSERT_TRUE(handle->IsRunning());
    ASSERT_EQ(static_cast<int>(LIBUSB_CONTROL_SETUP_SIZE) + 16, transfer->length);
    ASSERT_EQ(2, backend_.submit_calls());

    backend_.QueueCompletion(transfer, LIBUSB_TRANSFER_COMPLETED, 16);
    CompletionList out = PumpOnce();
    ASSERT_EQ(1u, out.size());
    ASSERT_EQ(TransferOutcome::Kind::kHandled, out[0].second.kind);
}

TEST_F(AsyncIoTest, bulk_stream) {
    auto handle = io_.BulkStream(nullptr, 0x81, 3, std::vector<uint8_t>(512), 0ms);
    ASSERT_TRUE(handle.has_value()) << handle.error();
    ASSERT_EQ(LIBUSB_TRANSFER_TYPE_BULK_STREAM, backend_.last_in_flight()->type);
    ASSERT_EQ(512, backend_.last_in_flight()->length);
}

TEST_F(AsyncIoTest, pump_before_register) {
    auto handle = io_.Bulk(nullptr, 0x81, std::vector<uint8_t>(8), 0ms);
    ASSERT_TRUE(handle.has_value()) << handle.error();
    backend_.QueueCompletion(backend_.last_in_flight(), LIBUSB_TRANSFER_COMPLETED, 8);

    CompletionList out;
    auto result = io_.Pump(&loop_, &out);
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(EINVAL, result.error().code());
    ASSERT_EQ(0, backend_.handle_events_calls());
    ASSERT_TRUE(out.empty());
    ASSERT_TRUE(handle->IsRunning());
}

TEST_F(AsyncIoTest, register_and_deregister) {
    ASSERT_FALSE(io_.RegisteredDescriptors().has_value());
    ASSERT_TRUE(io_.Register(&loop_, kToken).has_value());
    ASSERT_TRUE(backend_.events_locked());

    ASSERT_EQ(2u, loop_.registered().size());
    ASSERT_EQ(kToken, loop_.registered().at(5).token);
    ASSERT_EQ(static_cast<unsigned>(USBXFER_EVENT_READ), loop_.registered().at(5).events);
    ASSERT_EQ(kToken, loop_.registered().at(6).token);
    ASSERT_EQ(static_cast<unsigned>(USBXFER_EVENT_WRITE), loop_.registered().at(6).events);

    auto registered = io_.RegisteredDescriptors();
    ASSERT_TRUE(registered.has_value());
    std::vector<PollFd> expected = {{5, USBXFER_EVENT_READ}, {6, USBXFER_EVENT_WRITE}};
    ASSERT_EQ(expected, *registered);

    ASSERT_TRUE(io_.Deregister(&loop_).has_value());
    ASSERT_FALSE(backend_.events_locked());
    ASSERT_TRUE(loop_.registered().empty());
    ASSERT_FALSE(io_.RegisteredDescriptors().has_value());

    // Registering again after deregistering is fine.
    ASSERT_TRUE(io_.Register(&loop_, kToken + 1).has_value());
    ASSERT_EQ(kToken + 1, loop_.registered().at(5).token);
}

TEST_F(AsyncIoTest, register_rolls_back_on_failure) {
    loop_.FailRegister(6);
    auto result = io_.Register(&loop_, kToken);
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(EPERM, result.error().code());
    ASSERT_TRUE(loop_.registered().empty());
    ASSERT_FALSE(backend_.events_locked());
    ASSERT_FALSE(io_.RegisteredDescriptors().has_value());

    loop_.AllowRegister(6);
    ASSERT_TRUE(io_.Register(&loop_, kToken).has_value());
}

TEST_F(AsyncIoTest, register_waits_for_events_lock) {
    backend_.FailTryLockEvents(2);
    backend_.SetEventHandlingNotOk(1);
    ASSERT_TRUE(io_.Register(&loop_, kToken).has_value());
    ASSERT_EQ(4, backend_.try_lock_calls());
    ASSERT_EQ(1, backend_.unlock_calls());
    ASSERT_TRUE(backend_.events_locked());
}

TEST_F(AsyncIoTest, pump_registers_only_new_descriptor) {
    RegisterLoop();
    backend_.SetPollFds({{5, POLLIN}, {6, POLLOUT}, {7, POLLIN}});
    PumpOnce();

    ASSERT_EQ(std::vector<int>({7}), loop_.register_calls());
    ASSERT_TRUE(loop_.unregister_calls().empty());
    ASSERT_EQ(kToken, loop_.registered().at(7).token);
    ASSERT_EQ(3u, io_.RegisteredDescriptors()->size());
}

TEST_F(AsyncIoTest, pump_unregisters_removed_descriptor) {
    RegisterLoop();
    backend_.SetPollFds({{5, POLLIN}});
    PumpOnce();

    ASSERT_TRUE(loop_.register_calls().empty());
    ASSERT_EQ(std::vector<int>({6}), loop_.unregister_calls());
    ASSERT_FALSE(loop_.IsRegistered(6));
    ASSERT_TRUE(loop_.IsRegistered(5));
}

TEST_F(AsyncIoTest, pump_reregisters_changed_interest) {
    RegisterLoop();
    backend_.SetPollFds({{5, POLLIN | POLLOUT}, {6, POLLOUT}});
    PumpOnce();

    ASSERT_EQ(std::vector<int>({5}), loop_.unregister_calls());
    ASSERT_EQ(std::vector<int>({5}), loop_.register_calls());
    ASSERT_EQ(static_cast<unsigned>(USBXFER_EVENT_READ | USBXFER_EVENT_WRITE),
              loop_.registered().at(5).events);
}

TEST_F(AsyncIoTest, pump_retries_failed_reconcile) {
    RegisterLoop();
    backend_.SetPollFds({{5, POLLIN}, {6, POLLOUT}, {7, POLLIN}});
    loop_.FailRegister(7);

    CompletionList out;
    auto result = io_.Pump(&loop_, &out);
    ASSERT_FALSE(result.has_value());
    ASSERT_FALSE(loop_.IsRegistered(7));
    ASSERT_EQ(2u, io_.RegisteredDescriptors()->size());

    loop_.AllowRegister(7);
    loop_.ClearCalls();
    PumpOnce();
    ASSERT_EQ(std::vector<int>({7}), loop_.register_calls());
    ASSERT_TRUE(loop_.IsRegistered(7));
}

TEST_F(AsyncIoTest, pump_reconciles_after_handle_events_failure) {
    RegisterLoop();
    auto handle = io_.Bulk(nullptr, 0x81, std::vector<uint8_t>(8), 0ms);
    ASSERT_TRUE(handle.has_value()) << handle.error();
    backend_.QueueCompletion(backend_.last_in_flight(), LIBUSB_TRANSFER_COMPLETED, 8);
    backend_.SetPollFds({{5, POLLIN}, {6, POLLOUT}, {7, POLLIN}});
    backend_.FailNextHandleEvents(LIBUSB_ERROR_IO);

    CompletionList out;
    auto result = io_.Pump(&loop_, &out);
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(EIO, result.error().code());
    ASSERT_TRUE(out.empty());
    ASSERT_TRUE(loop_.IsRegistered(7));

    // The completion is still pending and is picked up by the next pump.
    out = PumpOnce();
    ASSERT_EQ(1u, out.size());
    ASSERT_EQ(handle->id(), out[0].first);
}

TEST_F(AsyncIoTest, pump_relocks_when_event_handling_not_ok) {
    RegisterLoop();
    backend_.SetEventHandlingNotOk(2);
    PumpOnce();
    ASSERT_TRUE(backend_.events_locked());
    ASSERT_EQ(2, backend_.unlock_calls());
}

TEST_F(AsyncIoTest, teardown_frees_running_transfers) {
    {
        AsyncIo io(&backend_, 1ms);
        ASSERT_TRUE(io.Bulk(nullptr, 0x81, std::vector<uint8_t>(8), 0ms).has_value());
        ASSERT_TRUE(io.Bulk(nullptr, 0x81, std::vector<uint8_t>(8), 0ms).has_value());
        ASSERT_EQ(2u, backend_.live_transfers());
    }
    ASSERT_EQ(0u, backend_.live_transfers());
}

TEST_F(AsyncIoDeathTest, register_twice) {
    RegisterLoop();
    ASSERT_DEATH((void)io_.Register(&loop_, kToken), "already registered");
}

TEST_F(AsyncIoDeathTest, deregister_without_register) {
    ASSERT_DEATH((void)io_.Deregister(&loop_), "not registered");
}

TEST_F(AsyncIoDeathTest, callback_exception_is_fatal) {
    RegisterLoop();
    auto handle = io_.Bulk(nullptr, 0x81, std::vector<uint8_t>(8), 0ms,
                           [](CompletionData&) -> Directive {
                               throw std::runtime_error("device went away");
                           });
    ASSERT_TRUE(handle.has_value()) << handle.error();
    backend_.QueueCompletion(backend_.last_in_flight(), LIBUSB_TRANSFER_COMPLETED, 8);
    ASSERT_DEATH(PumpOnce(), "threw: device went away");
}

TEST_F(AsyncIoDeathTest, completion_without_user_data) {
    auto handle = io_.Bulk(nullptr, 0x81, std::vector<uint8_t>(8), 0ms);
    ASSERT_TRUE(handle.has_value()) << handle.error();
    libusb_transfer* transfer = backend_.last_in_flight();
    ASSERT_DEATH(
            {
                transfer->user_data = nullptr;
                transfer->callback(transfer);
            },
            "without user data");
}

TEST_F(AsyncIoDeathTest, completion_of_null_transfer) {
    auto handle = io_.Bulk(nullptr, 0x81, std::vector<uint8_t>(8), 0ms);
    ASSERT_TRUE(handle.has_value()) << handle.error();
    libusb_transfer* transfer = backend_.last_in_flight();
    ASSERT_DEATH(transfer->callback(nullptr), "null transfer");
}
