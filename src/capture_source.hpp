/*
 * capture_source.hpp - Live frame sources
 *
 * CaptureSource is the seam between the capture engine and whatever delivers
 * frames. A source is acquired once with open(), then start() delivers each
 * frame to the registered handler from the source's own thread until stop().
 * It also reports the cumulative kernel drop counter for its interface.
 *
 * PcapCaptureSource is the libpcap implementation: it runs pcap_dispatch() in
 * a background thread and reads kernel drops from /proc/net/dev.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <pcap.h>
#include <string>
#include <thread>
#include <vector>

// Called once per delivered frame on the source thread
using FrameHandler = std::function<void(uint32_t ts_sec, uint32_t ts_usec,
                                        const uint8_t* data, uint32_t caplen,
                                        uint32_t origlen)>;

class CaptureSource {
public:
    virtual ~CaptureSource() = default;

    virtual bool open() = 0;
    virtual bool start(FrameHandler handler) = 0;
    virtual void stop() = 0;
    virtual void close() = 0;

    virtual bool is_open() const = 0;
    // False once the delivery loop has ended, including after a device error
    virtual bool is_capturing() const = 0;
    virtual std::string get_error() const = 0;
    virtual std::string get_interface_name() const = 0;

    // Cumulative kernel drop count for the interface, nullopt if unreadable
    virtual std::optional<uint64_t> read_kernel_drops() const = 0;
};

struct NetworkInterface {
    std::string name;
    std::string description;
    std::vector<std::string> addresses;
    bool is_loopback = false;
    bool is_up = false;
};

struct CaptureOptions {
    std::string interface_name;
    std::string bpf_filter;
    uint32_t snaplen = 1518;
    bool promisc = true;
    int buffer_size = 2097152;
    int timeout_ms = 100;
};

class PcapCaptureSource : public CaptureSource {
public:
    explicit PcapCaptureSource(CaptureOptions options);
    ~PcapCaptureSource() override;

    // Non-copyable
    PcapCaptureSource(const PcapCaptureSource&) = delete;
    PcapCaptureSource& operator=(const PcapCaptureSource&) = delete;

    // Interface enumeration
    static std::vector<NetworkInterface> get_all_interfaces();

    bool open() override;
    bool start(FrameHandler handler) override;
    void stop() override;
    void close() override;

    bool is_open() const override { return handle_ != nullptr; }
    bool is_capturing() const override { return running_.load(); }
    std::string get_error() const override;
    std::string get_interface_name() const override { return options_.interface_name; }

    std::optional<uint64_t> read_kernel_drops() const override;

private:
    void capture_loop();
    void set_error(const std::string& error);
    static void packet_callback(u_char* user, const struct pcap_pkthdr* header,
                                const u_char* data);

    CaptureOptions options_;
    pcap_t* handle_ = nullptr;
    // Written by the capture thread when the loop fails
    mutable std::mutex error_mutex_;
    std::string error_;
    FrameHandler handler_;

    std::atomic<bool> running_{false};
    std::thread capture_thread_;
};

// rx drop column for `interface_name` in a /proc/net/dev style file
std::optional<uint64_t> read_interface_rx_drops(const std::string& interface_name,
                                                const std::string& path = "/proc/net/dev");
