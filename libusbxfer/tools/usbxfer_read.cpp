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

// Reads from an IN endpoint of a USB device, either with blocking transfers or with an
// asynchronous transfer driven by an epoll loop.

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/parseint.h>
#include <android-base/stringprintf.h>
#include <android-base/strings.h>

#include "usbxfer/context.h"
#include "usbxfer/device_handle.h"
#include "usbxfer/epoll_loop.h"
#include "usbxfer/usbxfer_trace.h"

using namespace std::chrono_literals;
using namespace usbxfer;

static constexpr Token kUsbToken = 1;

static const char* _sopts = "hai:n:s:t:";
static const struct option _lopts[] = {
        {"help", no_argument, 0, 'h'},
        {"async", no_argument, 0, 'a'},
        {"interface", required_argument, 0, 'i'},
        {"count", required_argument, 0, 'n'},
        {"size", required_argument, 0, 's'},
        {"timeout", required_argument, 0, 't'},
        {0, 0, 0, 0},
};

static const char* usage =
        "Usage: %s [options] VID:PID ENDPOINT\n"
        "\n"
        "Reads from an IN endpoint, given in hex, and prints what was read.\n"
        "\n"
        "options:\n"
        "  -h, --help            prints this message and exit\n"
        "  -a, --async           use an asynchronous transfer driven by an event loop\n"
        "  -i, --interface N     interface to claim (default 0)\n"
        "  -n, --count N         number of reads (default 1)\n"
        "  -s, --size N          bytes per read (default 64)\n"
        "  -t, --timeout MS      timeout per read in milliseconds, 0 for none (default 1000)\n"
        "\n"
        "Set USBXFER_TRACE to a list of transfer, pollfd, event, device, libusb or all for\n"
        "verbose logging.\n";

struct Options {
    bool async = false;
    uint8_t interface = 0;
    unsigned count = 1;
    size_t size = 64;
    std::chrono::milliseconds timeout = 1000ms;
    uint16_t vendor_id = 0;
    uint16_t product_id = 0;
    uint8_t endpoint = 0;
};

static void print_usage_and_exit(const char* prog, int code) {
    fprintf(stderr, usage, prog);
    exit(code);
}

static bool parse_hex_u16(const std::string& s, uint16_t* out) {
    return android::base::ParseUint(s.find("0x") == 0 ? s : "0x" + s, out);
}

static Options parse_options(int argc, char** argv) {
    Options options;
    int c;
    int oidx = 0;
    unsigned value;

    while (1) {
        c = getopt_long(argc, argv, _sopts, _lopts, &oidx);
        if (c == -1) {
            break; /* done */
        }

        switch (c) {
            case 'h':
                print_usage_and_exit(argv[0], EXIT_SUCCESS);
                break;

            case 'a':
                options.async = true;
                break;

            case 'i':
                if (!android::base::ParseUint(optarg, &value, 255u)) {
                    LOG(FATAL) << "invalid interface number '" << optarg << "'";
                }
                options.interface = static_cast<uint8_t>(value);
                break;

            case 'n':
                if (!android::base::ParseUint(optarg, &options.count) || options.count == 0) {
                    LOG(FATAL) << "invalid count '" << optarg << "'";
                }
                break;

            case 's':
                if (!android::base::ParseUint(optarg, &options.size) || options.size == 0) {
                    LOG(FATAL) << "invalid size '" << optarg << "'";
                }
                break;

            case 't':
                if (!android::base::ParseUint(optarg, &value)) {
                    LOG(FATAL) << "invalid timeout '" << optarg << "'";
                }
                options.timeout = std::chrono::milliseconds(value);
                break;

            default:
                print_usage_and_exit(argv[0], EXIT_FAILURE);
        }
    }

    if (argc - optind != 2) {
        print_usage_and_exit(argv[0], EXIT_FAILURE);
    }

    std::vector<std::string> ids = android::base::Split(argv[optind], ":");
    if (ids.size() != 2 || !parse_hex_u16(ids[0], &options.vendor_id) ||
        !parse_hex_u16(ids[1], &options.product_id)) {
        LOG(FATAL) << "invalid device '" << argv[optind] << "', expected VID:PID";
    }

    uint16_t endpoint;
    if (!parse_hex_u16(argv[optind + 1], &endpoint) || endpoint > 0xff ||
        (endpoint & LIBUSB_ENDPOINT_DIR_MASK) != LIBUSB_ENDPOINT_IN) {
        LOG(FATAL) << "invalid endpoint '" << argv[optind + 1] << "', expected an IN endpoint";
    }
    options.endpoint = static_cast<uint8_t>(endpoint);
    return options;
}

static void dump(unsigned index, const uint8_t* data, size_t length) {
    std::string line = android::base::StringPrintf("%4u:", index);
    for (size_t i = 0; i < length; ++i) {
        line += android::base::StringPrintf(" %02x", data[i]);
    }
    printf("%s\n", line.c_str());
}

static void describe(DeviceHandle* handle, const Options& options) {
    libusb_device* device = libusb_get_device(handle->native_handle());
    libusb_device_descriptor raw;
    if (libusb_get_device_descriptor(device, &raw) != 0) {
        return;
    }
    DeviceDescriptor descriptor(raw);

    auto languages = handle->ReadLanguages(options.timeout);
    if (!languages || languages->empty()) {
        LOG(INFO) << "device has no string descriptors";
        return;
    }
    Language language = languages->front();
    auto manufacturer = handle->ReadManufacturerString(language, descriptor, options.timeout);
    auto product = handle->ReadProductString(language, descriptor, options.timeout);
    printf("%04x:%04x %s %s (USB %s)\n", descriptor.vendor_id(), descriptor.product_id(),
           manufacturer ? manufacturer->c_str() : "?", product ? product->c_str() : "?",
           android::base::StringPrintf("%u.%u", descriptor.usb_version().major,
                                       descriptor.usb_version().minor)
                   .c_str());
}

static int read_sync(DeviceHandle* handle, const Options& options) {
    std::vector<uint8_t> buf(options.size);
    for (unsigned i = 0; i < options.count; ++i) {
        auto length = handle->ReadBulk(options.endpoint, buf.data(), buf.size(), options.timeout);
        if (!length) {
            LOG(ERROR) << "read " << i << " failed: " << length.error();
            return EXIT_FAILURE;
        }
        dump(i, buf.data(), *length);
    }
    return EXIT_SUCCESS;
}

static int read_async(Context* context, DeviceHandle* handle, const Options& options) {
    EpollLoop loop;
    auto registered = context->Register(&loop, kUsbToken);
    if (!registered) {
        LOG(ERROR) << "failed to register with the event loop: " << registered.error();
        return EXIT_FAILURE;
    }

    // The callback resubmits the transfer until every read is done, printing as it goes.
    unsigned reads = 0;
    auto transfer = handle->Bulk(
            options.endpoint, std::vector<uint8_t>(options.size), options.timeout,
            [&reads, &options](CompletionData& data) {
                if (data.status != TransferStatus::kSuccess) {
                    return Directive::Unhandled();
                }
                dump(reads, data.buffer.data(), data.actual_length);
                if (++reads == options.count) {
                    return Directive::Handled();
                }
                return Directive::Resubmit(std::move(data.buffer));
            });
    if (!transfer) {
        LOG(ERROR) << "failed to submit read: " << transfer.error();
        auto deregistered = context->Deregister(&loop);
        if (!deregistered) {
            LOG(ERROR) << deregistered.error();
        }
        return EXIT_FAILURE;
    }

    int rc = EXIT_SUCCESS;
    bool done = false;
    std::vector<EpollLoop::Event> events;
    CompletionList completions;
    while (!done) {
        auto polled = loop.Poll(&events);
        if (!polled) {
            LOG(ERROR) << polled.error();
            rc = EXIT_FAILURE;
            break;
        }
        if (events.empty()) {
            continue;
        }

        auto pumped = context->Pump(&loop, &completions);
        if (!pumped) {
            LOG(WARNING) << "failed to pump usb events: " << pumped.error();
        }
        for (const Completion& completion : completions) {
            const TransferOutcome& outcome = completion.second;
            done = true;
            switch (outcome.kind) {
                case TransferOutcome::Kind::kHandled:
                    break;
                case TransferOutcome::Kind::kUnhandled:
                    LOG(ERROR) << "read " << reads << " failed: " << outcome.data->status;
                    rc = EXIT_FAILURE;
                    break;
                case TransferOutcome::Kind::kResubmitFailed:
                    LOG(ERROR) << "failed to resubmit read " << reads << ": "
                               << outcome.error_message;
                    rc = EXIT_FAILURE;
                    break;
            }
        }
    }

    auto deregistered = context->Deregister(&loop);
    if (!deregistered) {
        LOG(ERROR) << deregistered.error();
        rc = EXIT_FAILURE;
    }
    return rc;
}

int main(int argc, char** argv) {
    trace_init(argv);
    Options options = parse_options(argc, argv);

    auto context = Context::Create();
    if (!context) {
        LOG(ERROR) << context.error();
        return EXIT_FAILURE;
    }
    LOG(DEBUG) << "using libusb " << GetLibraryVersion();

    std::unique_ptr<DeviceHandle> handle =
            (*context)->OpenDeviceWithVidPid(options.vendor_id, options.product_id);
    if (!handle) {
        LOG(ERROR) << android::base::StringPrintf("no device %04x:%04x", options.vendor_id,
                                                  options.product_id);
        return EXIT_FAILURE;
    }

    describe(handle.get(), options);

    auto claimed = handle->ClaimInterface(options.interface);
    if (!claimed) {
        LOG(ERROR) << claimed.error();
        return EXIT_FAILURE;
    }

    if (options.async) {
        return read_async(context->get(), handle.get(), options);
    }
    return read_sync(handle.get(), options);
}
