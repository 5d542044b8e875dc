/*
 * protocol_stats_module.hpp - Built-in protocol statistics module
 *
 * Counts frames per protocol and per endpoint and flags two simple patterns:
 *   port-scan         a source reaching PORT_SCAN_THRESHOLD distinct
 *                     destination ports
 *   high-rate-source  a source sending HIGH_RATE_THRESHOLD frames
 *
 * Each detection carries the sequence number and timestamp of the frame that
 * crossed the threshold.
 */

#pragma once

#include "analysis_module.hpp"

class ProtocolStatsModule : public AnalysisModule {
public:
    static constexpr size_t PORT_SCAN_THRESHOLD = 20;
    static constexpr uint64_t HIGH_RATE_THRESHOLD = 1000;

    std::string name() const override { return "protocol_stats"; }
    std::string description() const override {
        return "Protocol distribution, top talkers and simple anomaly detection";
    }
    std::string version() const override { return "1.0.0"; }

    ModuleResult analyze(const std::string& pcap_path,
                         const std::string& output_dir,
                         const std::string& interface_name,
                         const std::string& time_window) override;
};
