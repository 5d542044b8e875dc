/*
 * analysis_module.hpp - Offline analysis module interface
 *
 * An AnalysisModule inspects one closed capture file and writes its own
 * artifacts under {output_dir}/{module_name}/{YYYY-MM-DD}/:
 *
 *     {interface}_{time_window}.summary.json   always
 *     {interface}_{time_window}.index.jsonl    one JSON object per detection,
 *                                              only when there are detections
 *
 * A later segment of the same hour ({interface}_{time_window}.{N}.pcap) keeps
 * its ".{N}" suffix in the artifact names.
 *
 * The base class provides the output helpers; subclasses implement name() and
 * analyze().
 */

#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

constexpr size_t SUMMARY_TOP_N = 10;
constexpr size_t SUMMARY_MAX_ERRORS = 10;

// One finding. `details` must be a JSON object; its keys are merged into the
// detection line next to the fixed fields.
struct Detection {
    uint64_t stt = 0;           // Frame sequence number in the file
    uint64_t ts_sec = 0;
    std::string label;
    std::string src;
    std::string dst;
    uint16_t sport = 0;
    uint16_t dport = 0;
    std::string proto;
    nlohmann::json details = nlohmann::json::object();

    nlohmann::json to_json() const;
    static Detection from_json(const nlohmann::json& j);
};

using TalkerList = std::vector<std::pair<std::string, uint64_t>>;

// Per-file result of one module
struct Summary {
    std::string module_name;
    std::string interface_name;
    std::string time_window;    // YYYY-MM-DD_HH
    std::string pcap_file;

    uint64_t total_packets = 0;
    uint64_t analyzed_packets = 0;
    uint64_t total_hits = 0;

    std::map<std::string, uint64_t> labels;
    TalkerList top_sources;
    TalkerList top_destinations;

    double start_time = 0.0;
    double end_time = 0.0;
    double duration_sec = 0.0;

    std::vector<std::string> errors;

    // Append an error unless SUMMARY_MAX_ERRORS are already recorded
    void add_error(const std::string& message);

    nlohmann::json to_json() const;
    static Summary from_json(const nlohmann::json& j);
};

// What analyze() hands back: the summary plus the detections in frame order,
// exactly as written to the artifacts
struct ModuleResult {
    Summary summary;
    std::vector<Detection> detections;
};

class AnalysisModule {
public:
    virtual ~AnalysisModule() = default;

    // Lowercase identifier, also the output subdirectory
    virtual std::string name() const = 0;
    virtual std::string description() const { return "No description"; }
    virtual std::string version() const { return "1.0.0"; }

    // Analyze `pcap_path` and write artifacts under `output_dir`
    virtual ModuleResult analyze(const std::string& pcap_path,
                                 const std::string& output_dir,
                                 const std::string& interface_name,
                                 const std::string& time_window) = 0;

    // {base_dir}/{name}/{date of time_window}, created if missing.
    // nullopt if the directory cannot be created.
    std::optional<std::string> get_output_dir(const std::string& base_dir,
                                              const std::string& time_window) const;

    static std::string get_output_basename(const std::string& interface_name,
                                           const std::string& time_window,
                                           const std::string& pcap_path = "");

    bool write_summary(const std::string& dir, const std::string& basename,
                       const Summary& summary) const;
    bool write_detections(const std::string& dir, const std::string& basename,
                          const std::vector<Detection>& detections) const;

    // Summary always, detections only when non-empty. Artifact names follow
    // summary.pcap_file.
    bool write_output(const std::string& output_dir,
                      const std::string& interface_name,
                      const std::string& time_window,
                      const Summary& summary,
                      const std::vector<Detection>& detections) const;
};

// Parse a .summary.json artifact
std::optional<Summary> read_summary(const std::string& filepath);

// Parse a .index.jsonl artifact; blank and malformed lines are skipped
std::vector<Detection> read_detections(const std::string& filepath);

// Highest counts first, ties by key, at most `limit` entries
TalkerList most_common(const std::map<std::string, uint64_t>& counts, size_t limit);
