/*
 * test_helpers.hpp - Shared fixtures for the unit tests
 *
 * Synthetic frame builders, a self-deleting temporary directory and a fake
 * capture source that delivers frames on the caller's thread.
 */

#pragma once

#include "../src/capture_source.hpp"
#include "../src/packet.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <stdlib.h>
#include <string>
#include <vector>

namespace testutil {

using Bytes = std::vector<uint8_t>;
using IPv4 = std::array<uint8_t, 4>;

inline void put_u16(Bytes& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xff));
}

inline void put_u32(Bytes& out, uint32_t v) {
    put_u16(out, static_cast<uint16_t>(v >> 16));
    put_u16(out, static_cast<uint16_t>(v & 0xffff));
}

inline void put_bytes(Bytes& out, const uint8_t* p, size_t n) {
    out.insert(out.end(), p, p + n);
}

// 14-byte Ethernet header, or 18 bytes with an 802.1Q tag
inline Bytes ethernet(uint16_t ether_type, std::optional<uint16_t> vlan_id = std::nullopt) {
    Bytes out = {
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff,     // dst
        0x00, 0x11, 0x22, 0x33, 0x44, 0x55,     // src
    };
    if (vlan_id) {
        put_u16(out, ETHERTYPE_VLAN);
        put_u16(out, *vlan_id);
    }
    put_u16(out, ether_type);
    return out;
}

inline Bytes ipv4_header(uint8_t protocol, const IPv4& src, const IPv4& dst,
                         uint16_t payload_len) {
    Bytes out;
    out.push_back(0x45);                        // version 4, IHL 5
    out.push_back(0x00);
    put_u16(out, static_cast<uint16_t>(20 + payload_len));
    put_u16(out, 0x1234);                       // identification
    put_u16(out, 0x4000);                       // DF, offset 0
    out.push_back(64);                          // TTL
    out.push_back(protocol);
    put_u16(out, 0xbeef);                       // checksum (not validated)
    put_bytes(out, src.data(), 4);
    put_bytes(out, dst.data(), 4);
    return out;
}

inline Bytes tcp_header(uint16_t sport, uint16_t dport, uint8_t flags, uint32_t seq = 1000) {
    Bytes out;
    put_u16(out, sport);
    put_u16(out, dport);
    put_u32(out, seq);
    put_u32(out, 0);                            // ack
    out.push_back(0x50);                        // data offset 5
    out.push_back(flags);
    put_u16(out, 65535);                        // window
    put_u16(out, 0);                            // checksum
    put_u16(out, 0);                            // urgent
    return out;
}

inline Bytes udp_header(uint16_t sport, uint16_t dport, uint16_t payload_len) {
    Bytes out;
    put_u16(out, sport);
    put_u16(out, dport);
    put_u16(out, static_cast<uint16_t>(8 + payload_len));
    put_u16(out, 0);
    return out;
}

inline Bytes tcp_frame(const IPv4& src, const IPv4& dst, uint16_t sport, uint16_t dport,
                       uint8_t flags, const Bytes& payload = {},
                       std::optional<uint16_t> vlan_id = std::nullopt) {
    Bytes tcp = tcp_header(sport, dport, flags);
    Bytes out = ethernet(ETHERTYPE_IPV4, vlan_id);
    Bytes ip = ipv4_header(PROTO_TCP, src, dst, static_cast<uint16_t>(tcp.size() + payload.size()));
    out.insert(out.end(), ip.begin(), ip.end());
    out.insert(out.end(), tcp.begin(), tcp.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

inline Bytes udp_frame(const IPv4& src, const IPv4& dst, uint16_t sport, uint16_t dport,
                       const Bytes& payload = {}) {
    Bytes out = ethernet(ETHERTYPE_IPV4);
    Bytes ip = ipv4_header(PROTO_UDP, src, dst, static_cast<uint16_t>(8 + payload.size()));
    Bytes udp = udp_header(sport, dport, static_cast<uint16_t>(payload.size()));
    out.insert(out.end(), ip.begin(), ip.end());
    out.insert(out.end(), udp.begin(), udp.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

inline Bytes icmp_frame(const IPv4& src, const IPv4& dst, uint8_t type, uint8_t code) {
    Bytes out = ethernet(ETHERTYPE_IPV4);
    Bytes ip = ipv4_header(PROTO_ICMP, src, dst, 8);
    out.insert(out.end(), ip.begin(), ip.end());
    out.push_back(type);
    out.push_back(code);
    put_u16(out, 0xf7ff);                       // checksum
    put_u32(out, 0x00010001);                   // id / sequence
    return out;
}

inline Bytes arp_frame(uint16_t opcode, const IPv4& sender, const IPv4& target) {
    Bytes out = ethernet(ETHERTYPE_ARP);
    put_u16(out, 1);                            // Ethernet
    put_u16(out, ETHERTYPE_IPV4);
    out.push_back(6);
    out.push_back(4);
    put_u16(out, opcode);
    const uint8_t sender_mac[] = {0x00, 0x11, 0x22, 0x33, 0x44, 0x55};
    const uint8_t target_mac[] = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    put_bytes(out, sender_mac, 6);
    put_bytes(out, sender.data(), 4);
    put_bytes(out, target_mac, 6);
    put_bytes(out, target.data(), 4);
    return out;
}

// IPv6 (fe80::1 -> fe80::2) carrying UDP
inline Bytes ipv6_udp_frame(uint16_t sport, uint16_t dport) {
    Bytes out = ethernet(ETHERTYPE_IPV6);
    put_u32(out, 0x60000000);                   // version 6, tc 0, flow 0
    put_u16(out, 8);                            // payload length
    out.push_back(PROTO_UDP);
    out.push_back(64);                          // hop limit
    uint8_t src[16] = {0xfe, 0x80};
    uint8_t dst[16] = {0xfe, 0x80};
    src[15] = 1;
    dst[15] = 2;
    put_bytes(out, src, 16);
    put_bytes(out, dst, 16);
    Bytes udp = udp_header(sport, dport, 0);
    out.insert(out.end(), udp.begin(), udp.end());
    return out;
}

// Frame of exactly `len` bytes with a recognizable byte pattern
inline Bytes patterned_frame(size_t len, uint8_t seed = 0) {
    Bytes out(len);
    for (size_t i = 0; i < len; ++i) {
        out[i] = static_cast<uint8_t>(seed + i);
    }
    return out;
}

// Unique directory under the system temp path, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "sniff-test") {
        std::string pattern =
            (std::filesystem::temp_directory_path() / (prefix + "-XXXXXX")).string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) != nullptr) {
            path_ = buf.data();
        }
    }

    ~TempDir() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

// Local wall-clock instant from calendar fields
inline std::chrono::system_clock::time_point local_time(int year, int month, int day,
                                                        int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

// Delivers frames synchronously from the test thread
class FakeCaptureSource : public CaptureSource {
public:
    explicit FakeCaptureSource(std::string name = "fake0", bool open_ok = true)
        : name_(std::move(name)), open_ok_(open_ok) {}

    bool open() override {
        if (!open_ok_) {
            error_ = "no such device";
            return false;
        }
        open_ = true;
        return true;
    }

    bool start(FrameHandler handler) override {
        handler_ = std::move(handler);
        started_++;
        capturing_.store(true);
        return true;
    }

    void stop() override {
        stopped_++;
        capturing_.store(false);
    }
    void close() override { open_ = false; }

    bool is_open() const override { return open_; }
    bool is_capturing() const override { return capturing_.load(); }
    std::string get_error() const override { return error_; }
    std::string get_interface_name() const override { return name_; }

    std::optional<uint64_t> read_kernel_drops() const override {
        int64_t v = kernel_drops_.load();
        if (v < 0) return std::nullopt;
        return static_cast<uint64_t>(v);
    }

    void set_kernel_drops(int64_t value) { kernel_drops_.store(value); }

    // The delivery loop dies the way a vanished device ends pcap_dispatch
    void fail(const std::string& error) {
        error_ = error;
        capturing_.store(false);
    }

    void deliver(const Bytes& frame, uint32_t ts_sec = 1700000000, uint32_t ts_usec = 0) {
        if (handler_) {
            handler_(ts_sec, ts_usec, frame.data(), static_cast<uint32_t>(frame.size()),
                     static_cast<uint32_t>(frame.size()));
        }
    }

    int started() const { return started_; }
    int stopped() const { return stopped_; }

private:
    std::string name_;
    bool open_ok_;
    bool open_ = false;
    std::string error_;
    FrameHandler handler_;
    std::atomic<int64_t> kernel_drops_{-1};
    std::atomic<bool> capturing_{false};
    int started_ = 0;
    int stopped_ = 0;
};

}  // namespace testutil
