/*
 * protocol_stats_module.cpp - Protocol statistics and anomaly heuristics
 */

#include "protocol_stats_module.hpp"
#include "logger.hpp"
#include "packet.hpp"
#include "pcap_file.hpp"
#include <algorithm>
#include <chrono>
#include <set>

namespace {

double wall_seconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

struct SourceState {
    uint64_t packets = 0;
    std::set<uint16_t> dst_ports;
    bool saw_tcp = false;
    bool saw_udp = false;
    std::optional<Detection> port_scan;
    std::optional<Detection> high_rate;
};

std::string scan_protocol(const SourceState& state) {
    if (state.saw_tcp && state.saw_udp) return "TCP/UDP";
    return state.saw_udp ? "UDP" : "TCP";
}

}

ModuleResult ProtocolStatsModule::analyze(const std::string& pcap_path,
                                          const std::string& output_dir,
                                          const std::string& interface_name,
                                          const std::string& time_window) {
    ModuleResult result;
    Summary& summary = result.summary;
    std::vector<Detection>& detections = result.detections;
    summary.module_name = name();
    summary.interface_name = interface_name;
    summary.time_window = time_window;
    summary.pcap_file = pcap_path;
    summary.start_time = wall_seconds();

    std::map<std::string, uint64_t> proto_counts;
    std::map<std::string, uint64_t> src_counts;
    std::map<std::string, uint64_t> dst_counts;
    std::map<std::string, SourceState> sources;

    PcapReader reader(pcap_path);
    if (!reader.open()) {
        logger::error("protocol_stats: " + reader.get_error());
        summary.add_error("PCAP read error: " + reader.get_error());
    } else {
        while (auto frame = reader.read_packet()) {
            summary.total_packets++;

            DecodedPacket pkt = decode_packet(*frame);
            summary.analyzed_packets++;

            proto_counts[pkt.protocol_name]++;
            if (!pkt.dst_addr.empty()) {
                dst_counts[pkt.dst_addr]++;
            }
            if (pkt.src_addr.empty()) {
                continue;
            }
            src_counts[pkt.src_addr]++;

            SourceState& src = sources[pkt.src_addr];
            src.packets++;

            if (pkt.dst_port != 0) {
                src.dst_ports.insert(pkt.dst_port);
                src.saw_tcp = src.saw_tcp || pkt.tcp.has_value();
                src.saw_udp = src.saw_udp || pkt.udp.has_value();
            }

            if (!src.port_scan && src.dst_ports.size() >= PORT_SCAN_THRESHOLD) {
                Detection det;
                det.stt = frame->seq;
                det.ts_sec = frame->ts_sec;
                det.label = "port-scan";
                det.src = pkt.src_addr;
                det.dst = "multiple";
                src.port_scan = det;
            }

            if (!src.high_rate && src.packets >= HIGH_RATE_THRESHOLD) {
                Detection det;
                det.stt = frame->seq;
                det.ts_sec = frame->ts_sec;
                det.label = "high-rate-source";
                det.src = pkt.src_addr;
                src.high_rate = det;
            }
        }
    }

    // Final counts are only known after the whole file is read
    for (auto& [addr, state] : sources) {
        if (state.port_scan) {
            Detection det = *state.port_scan;
            det.proto = scan_protocol(state);
            det.dport = static_cast<uint16_t>(std::min<size_t>(state.dst_ports.size(), 65535));
            det.details["unique_ports"] = state.dst_ports.size();
            detections.push_back(std::move(det));
        }
    }
    for (auto& [addr, state] : sources) {
        if (state.high_rate) {
            Detection det = *state.high_rate;
            det.details["packet_count"] = state.packets;
            detections.push_back(std::move(det));
        }
    }

    // Frame order; a frame that trips both heuristics lists them by label
    std::sort(detections.begin(), detections.end(), [](const Detection& a, const Detection& b) {
        if (a.stt != b.stt) return a.stt < b.stt;
        return a.label < b.label;
    });

    uint64_t scans = 0;
    uint64_t high_rate = 0;
    for (const auto& det : detections) {
        if (det.label == "port-scan") scans++;
        else high_rate++;
    }

    summary.total_hits = detections.size();
    summary.labels["port-scan"] = scans;
    summary.labels["high-rate-source"] = high_rate;
    for (const auto& [proto, count] : most_common(proto_counts, SUMMARY_TOP_N)) {
        summary.labels["proto_" + proto] = count;
    }
    summary.top_sources = most_common(src_counts, SUMMARY_TOP_N);
    summary.top_destinations = most_common(dst_counts, SUMMARY_TOP_N);

    summary.end_time = wall_seconds();
    summary.duration_sec = summary.end_time - summary.start_time;

    if (!write_output(output_dir, interface_name, time_window, summary, detections)) {
        logger::warn("protocol_stats: artifacts for " + pcap_path + " incomplete");
    }
    return result;
}
