/*
 * analysis_module.cpp - Module output helpers and artifact parsing
 */

#include "analysis_module.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using json = nlohmann::json;

namespace {

const char* const DETECTION_FIELDS[] = {
    "stt", "ts_sec", "label", "src", "dst", "sport", "dport", "proto"
};

bool is_detection_field(const std::string& key) {
    for (const char* field : DETECTION_FIELDS) {
        if (key == field) return true;
    }
    return false;
}

json talkers_to_json(const TalkerList& talkers) {
    json arr = json::array();
    for (const auto& [addr, count] : talkers) {
        arr.push_back(json::array({addr, count}));
    }
    return arr;
}

TalkerList talkers_from_json(const json& j) {
    TalkerList talkers;
    if (!j.is_array()) return talkers;
    for (const auto& entry : j) {
        if (entry.is_array() && entry.size() == 2 &&
            entry[0].is_string() && entry[1].is_number_unsigned()) {
            talkers.emplace_back(entry[0].get<std::string>(), entry[1].get<uint64_t>());
        }
    }
    return talkers;
}

}

// --- Detection ---

json Detection::to_json() const {
    json j = {
        {"stt", stt},
        {"ts_sec", ts_sec},
        {"label", label},
        {"src", src},
        {"dst", dst},
        {"sport", sport},
        {"dport", dport},
        {"proto", proto},
    };
    if (details.is_object()) {
        for (auto it = details.begin(); it != details.end(); ++it) {
            // Fixed fields win over same-named details
            if (!is_detection_field(it.key())) {
                j[it.key()] = it.value();
            }
        }
    }
    return j;
}

Detection Detection::from_json(const json& j) {
    Detection d;
    d.stt = j.value("stt", uint64_t{0});
    d.ts_sec = j.value("ts_sec", uint64_t{0});
    d.label = j.value("label", std::string());
    d.src = j.value("src", std::string());
    d.dst = j.value("dst", std::string());
    d.sport = j.value("sport", uint16_t{0});
    d.dport = j.value("dport", uint16_t{0});
    d.proto = j.value("proto", std::string());
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!is_detection_field(it.key())) {
            d.details[it.key()] = it.value();
        }
    }
    return d;
}

// --- Summary ---

void Summary::add_error(const std::string& message) {
    if (errors.size() < SUMMARY_MAX_ERRORS) {
        errors.push_back(message);
    }
}

json Summary::to_json() const {
    return json{
        {"module_name", module_name},
        {"interface", interface_name},
        {"time_window", time_window},
        {"pcap_file", pcap_file},
        {"total_packets", total_packets},
        {"analyzed_packets", analyzed_packets},
        {"total_hits", total_hits},
        {"labels", labels},
        {"top_sources", talkers_to_json(top_sources)},
        {"top_destinations", talkers_to_json(top_destinations)},
        {"start_time", start_time},
        {"end_time", end_time},
        {"duration_sec", duration_sec},
        {"errors", errors},
    };
}

Summary Summary::from_json(const json& j) {
    Summary s;
    s.module_name = j.value("module_name", std::string());
    s.interface_name = j.value("interface", std::string());
    s.time_window = j.value("time_window", std::string());
    s.pcap_file = j.value("pcap_file", std::string());
    s.total_packets = j.value("total_packets", uint64_t{0});
    s.analyzed_packets = j.value("analyzed_packets", uint64_t{0});
    s.total_hits = j.value("total_hits", uint64_t{0});
    s.labels = j.value("labels", std::map<std::string, uint64_t>());
    if (j.contains("top_sources")) s.top_sources = talkers_from_json(j["top_sources"]);
    if (j.contains("top_destinations")) s.top_destinations = talkers_from_json(j["top_destinations"]);
    s.start_time = j.value("start_time", 0.0);
    s.end_time = j.value("end_time", 0.0);
    s.duration_sec = j.value("duration_sec", 0.0);
    s.errors = j.value("errors", std::vector<std::string>());
    return s;
}

// --- AnalysisModule output helpers ---

std::optional<std::string> AnalysisModule::get_output_dir(const std::string& base_dir,
                                                          const std::string& time_window) const {
    std::string date = time_window.substr(0, time_window.find('_'));
    fs::path dir = fs::path(base_dir) / name() / date;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        logger::error("cannot create " + dir.string() + ": " + ec.message());
        return std::nullopt;
    }
    return dir.string();
}

std::string AnalysisModule::get_output_basename(const std::string& interface_name,
                                                const std::string& time_window,
                                                const std::string& pcap_path) {
    std::string basename = interface_name + "_" + time_window;

    // Carry over a segment suffix: {basename}.{N}.pcap -> {basename}.{N}
    std::string stem = fs::path(pcap_path).stem().string();
    if (stem.size() > basename.size() + 1 && stem.compare(0, basename.size(), basename) == 0 &&
        stem[basename.size()] == '.') {
        std::string segment = stem.substr(basename.size() + 1);
        if (std::all_of(segment.begin(), segment.end(),
                        [](unsigned char c) { return std::isdigit(c); })) {
            basename += "." + segment;
        }
    }
    return basename;
}

bool AnalysisModule::write_summary(const std::string& dir, const std::string& basename,
                                   const Summary& summary) const {
    fs::path path = fs::path(dir) / (basename + ".summary.json");
    std::ofstream file(path);
    if (!file.is_open()) {
        logger::error("cannot write summary " + path.string());
        return false;
    }
    file << summary.to_json().dump(2) << "\n";
    if (!file) {
        logger::error("error writing summary " + path.string());
        return false;
    }
    logger::debug("wrote summary " + path.string());
    return true;
}

bool AnalysisModule::write_detections(const std::string& dir, const std::string& basename,
                                      const std::vector<Detection>& detections) const {
    if (detections.empty()) {
        return true;
    }

    fs::path path = fs::path(dir) / (basename + ".index.jsonl");
    std::ofstream file(path);
    if (!file.is_open()) {
        logger::error("cannot write detections " + path.string());
        return false;
    }
    for (const auto& det : detections) {
        file << det.to_json().dump() << "\n";
    }
    if (!file) {
        logger::error("error writing detections " + path.string());
        return false;
    }
    logger::debug("wrote " + std::to_string(detections.size()) + " detections to " +
                  path.string());
    return true;
}

bool AnalysisModule::write_output(const std::string& output_dir,
                                  const std::string& interface_name,
                                  const std::string& time_window,
                                  const Summary& summary,
                                  const std::vector<Detection>& detections) const {
    auto dir = get_output_dir(output_dir, time_window);
    if (!dir) {
        return false;
    }
    std::string basename = get_output_basename(interface_name, time_window, summary.pcap_file);

    bool ok = write_summary(*dir, basename, summary);
    if (!write_detections(*dir, basename, detections)) {
        ok = false;
    }
    return ok;
}

// --- artifact readers ---

std::optional<Summary> read_summary(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        logger::warn("cannot open summary " + filepath);
        return std::nullopt;
    }

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        logger::warn("malformed summary " + filepath);
        return std::nullopt;
    }

    try {
        return Summary::from_json(j);
    } catch (const json::exception& e) {
        logger::warn("malformed summary " + filepath + ": " + e.what());
        return std::nullopt;
    }
}

std::vector<Detection> read_detections(const std::string& filepath) {
    std::vector<Detection> detections;
    std::ifstream file(filepath);
    if (!file.is_open()) {
        logger::warn("cannot open detections " + filepath);
        return detections;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) continue;

        try {
            detections.push_back(Detection::from_json(j));
        } catch (const json::exception&) {
            // Wrong field types: skip the line like any other malformed one
            continue;
        }
    }
    return detections;
}

TalkerList most_common(const std::map<std::string, uint64_t>& counts, size_t limit) {
    TalkerList sorted(counts.begin(), counts.end());
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });
    if (sorted.size() > limit) {
        sorted.resize(limit);
    }
    return sorted;
}
