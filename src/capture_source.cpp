/*
 * capture_source.cpp - libpcap-based frame source implementation
 *
 * Handles opening network interfaces, running the capture loop in a background
 * thread, and handing each frame to the engine's handler. Uses pcap_dispatch()
 * with a short read timeout so stop() is observed promptly.
 */

#include "capture_source.hpp"
#include "logger.hpp"
#include <arpa/inet.h>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>

PcapCaptureSource::PcapCaptureSource(CaptureOptions options)
    : options_(std::move(options)) {}

PcapCaptureSource::~PcapCaptureSource() {
    stop();
    close();
}

std::vector<NetworkInterface> PcapCaptureSource::get_all_interfaces() {
    std::vector<NetworkInterface> interfaces;
    pcap_if_t* all_devs;
    char errbuf[PCAP_ERRBUF_SIZE];

    if (pcap_findalldevs(&all_devs, errbuf) == -1) {
        logger::error(std::string("pcap_findalldevs: ") + errbuf);
        return interfaces;
    }

    for (pcap_if_t* dev = all_devs; dev != nullptr; dev = dev->next) {
        NetworkInterface iface;
        iface.name = dev->name;

        if (dev->description) {
            iface.description = dev->description;
        }

        iface.is_loopback = (dev->flags & PCAP_IF_LOOPBACK) != 0;
        iface.is_up = (dev->flags & PCAP_IF_UP) != 0;

        for (pcap_addr_t* addr = dev->addresses; addr != nullptr; addr = addr->next) {
            if (addr->addr == nullptr) continue;

            char buf[INET6_ADDRSTRLEN];
            if (addr->addr->sa_family == AF_INET) {
                auto* sin = reinterpret_cast<struct sockaddr_in*>(addr->addr);
                inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
                iface.addresses.push_back(buf);
            } else if (addr->addr->sa_family == AF_INET6) {
                auto* sin6 = reinterpret_cast<struct sockaddr_in6*>(addr->addr);
                inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
                iface.addresses.push_back(buf);
            }
        }

        interfaces.push_back(std::move(iface));
    }

    pcap_freealldevs(all_devs);
    return interfaces;
}

bool PcapCaptureSource::open() {
    if (handle_) {
        close();
    }

    char errbuf[PCAP_ERRBUF_SIZE];
    handle_ = pcap_create(options_.interface_name.c_str(), errbuf);
    if (handle_ == nullptr) {
        set_error(errbuf);
        return false;
    }

    pcap_set_snaplen(handle_, static_cast<int>(options_.snaplen));
    pcap_set_promisc(handle_, options_.promisc ? 1 : 0);
    pcap_set_timeout(handle_, options_.timeout_ms);
    pcap_set_buffer_size(handle_, options_.buffer_size);

    int status = pcap_activate(handle_);
    if (status < 0) {
        set_error(std::string("pcap_activate: ") + pcap_geterr(handle_));
        pcap_close(handle_);
        handle_ = nullptr;
        return false;
    }
    if (status > 0) {
        // Warnings such as PCAP_WARNING_PROMISC_NOTSUP are non-fatal
        logger::warn(std::string("pcap_activate warning on ") + options_.interface_name +
                     ": " + pcap_statustostr(status));
    }

    if (!options_.bpf_filter.empty()) {
        struct bpf_program program;
        if (pcap_compile(handle_, &program, options_.bpf_filter.c_str(), 1,
                         PCAP_NETMASK_UNKNOWN) == -1) {
            set_error(std::string("invalid filter: ") + pcap_geterr(handle_));
            pcap_close(handle_);
            handle_ = nullptr;
            return false;
        }
        int rc = pcap_setfilter(handle_, &program);
        pcap_freecode(&program);
        if (rc == -1) {
            set_error(std::string("pcap_setfilter: ") + pcap_geterr(handle_));
            pcap_close(handle_);
            handle_ = nullptr;
            return false;
        }
    }

    set_error("");
    return true;
}

bool PcapCaptureSource::start(FrameHandler handler) {
    if (!handle_) {
        set_error("capture source not open");
        return false;
    }
    if (running_.load()) {
        return true;
    }
    // A loop that ended on a device error still has to be joined
    if (capture_thread_.joinable()) {
        capture_thread_.join();
    }

    handler_ = std::move(handler);
    running_.store(true);
    capture_thread_ = std::thread([this]() {
        capture_loop();
    });
    return true;
}

void PcapCaptureSource::stop() {
    if (running_.exchange(false) && handle_) {
        pcap_breakloop(handle_);
    }

    if (capture_thread_.joinable()) {
        capture_thread_.join();
    }
}

void PcapCaptureSource::close() {
    stop();

    if (handle_) {
        pcap_close(handle_);
        handle_ = nullptr;
    }
}

void PcapCaptureSource::capture_loop() {
    while (running_.load()) {
        int result = pcap_dispatch(handle_, 64, packet_callback,
                                   reinterpret_cast<u_char*>(this));

        if (result == PCAP_ERROR) {
            std::string error = pcap_geterr(handle_);
            set_error(error);
            logger::error("capture error on " + options_.interface_name + ": " + error);
            break;
        }

        // pcap_breakloop() was called
        if (result == PCAP_ERROR_BREAK) {
            break;
        }

        if (result == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    running_.store(false);
}

std::string PcapCaptureSource::get_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return error_;
}

void PcapCaptureSource::set_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    error_ = error;
}

void PcapCaptureSource::packet_callback(u_char* user,
                                        const struct pcap_pkthdr* header,
                                        const u_char* data) {
    auto* self = reinterpret_cast<PcapCaptureSource*>(user);
    if (!self->handler_) return;

    self->handler_(static_cast<uint32_t>(header->ts.tv_sec),
                   static_cast<uint32_t>(header->ts.tv_usec),
                   data, header->caplen, header->len);
}

std::optional<uint64_t> PcapCaptureSource::read_kernel_drops() const {
    return read_interface_rx_drops(options_.interface_name);
}

std::optional<uint64_t> read_interface_rx_drops(const std::string& interface_name,
                                                const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    // "  eth0: bytes packets errs drop fifo ..." after two header lines
    std::string line;
    while (std::getline(file, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name = line.substr(0, colon);
        size_t start = name.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        name = name.substr(start);
        if (name != interface_name) continue;

        std::istringstream iss(line.substr(colon + 1));
        uint64_t bytes = 0, packets = 0, errs = 0, drop = 0;
        if (!(iss >> bytes >> packets >> errs >> drop)) {
            return std::nullopt;
        }
        return drop;
    }

    return std::nullopt;
}
