/*
 * pcap_file.hpp - Capture file writer and reader
 *
 * Reads and writes the classic pcap file format: a 24-byte global header
 * followed by (16-byte record header + captured bytes) pairs. The magic number
 * selects the byte order for every other multi-byte field in the file.
 *
 * PcapWriter buffers records in memory and hands them to the OS in a single
 * write once `batch_size` records have accumulated, or on flush()/close().
 * PcapReader yields frames in file order with reader-local sequence numbers
 * and treats a short read at the end of the file as a clean end of stream.
 */

#pragma once

#include "packet.hpp"
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

constexpr uint32_t PCAP_MAGIC = 0xa1b2c3d4;
constexpr uint32_t PCAP_MAGIC_SWAPPED = 0xd4c3b2a1;
constexpr uint16_t PCAP_VERSION_MAJOR = 2;
constexpr uint16_t PCAP_VERSION_MINOR = 4;
constexpr uint32_t PCAP_LINKTYPE_ETHERNET = 1;
constexpr size_t PCAP_GLOBAL_HEADER_LEN = 24;
constexpr size_t PCAP_RECORD_HEADER_LEN = 16;
constexpr uint32_t PCAP_MAX_RECORD_LEN = 262144;

constexpr uint32_t DEFAULT_SNAPLEN = 1518;
constexpr size_t DEFAULT_BATCH_SIZE = 100;

enum class ByteOrder { LITTLE, BIG };

struct PcapGlobalHeader {
    uint32_t magic = PCAP_MAGIC;
    uint16_t version_major = PCAP_VERSION_MAJOR;
    uint16_t version_minor = PCAP_VERSION_MINOR;
    int32_t thiszone = 0;
    uint32_t sigfigs = 0;
    uint32_t snaplen = DEFAULT_SNAPLEN;
    uint32_t linktype = PCAP_LINKTYPE_ETHERNET;
};

class PcapWriter {
public:
    PcapWriter(const std::string& filepath,
               uint32_t snaplen = DEFAULT_SNAPLEN,
               size_t batch_size = DEFAULT_BATCH_SIZE,
               ByteOrder order = ByteOrder::LITTLE,
               uint32_t linktype = PCAP_LINKTYPE_ETHERNET);
    ~PcapWriter();

    // Non-copyable
    PcapWriter(const PcapWriter&) = delete;
    PcapWriter& operator=(const PcapWriter&) = delete;

    // Create the file and write the global header
    bool open();

    // Buffer one record. caplen = min(len, snaplen); origlen defaults to len.
    bool write_packet(uint32_t ts_sec, uint32_t ts_usec,
                      const uint8_t* data, size_t len,
                      std::optional<uint32_t> origlen = std::nullopt);
    bool write_frame(const RawFrame& frame);

    bool flush();
    bool close();

    bool is_open() const { return fd_ >= 0; }
    std::string get_error() const { return error_; }
    const std::string& filepath() const { return filepath_; }
    uint32_t snaplen() const { return snaplen_; }
    uint64_t packet_count() const { return packet_count_; }
    uint64_t byte_count() const { return byte_count_; }
    size_t pending_packets() const { return pending_packets_; }

private:
    void put_u16(uint16_t value);
    void put_u32(uint32_t value);
    bool write_all(const uint8_t* data, size_t len);
    bool flush_buffer();

    std::string filepath_;
    uint32_t snaplen_;
    size_t batch_size_;
    ByteOrder order_;
    uint32_t linktype_;

    int fd_ = -1;
    bool closed_ = false;
    std::vector<uint8_t> buffer_;
    size_t pending_packets_ = 0;
    uint64_t packet_count_ = 0;
    uint64_t byte_count_ = 0;
    std::string error_;
};

class PcapReader {
public:
    explicit PcapReader(const std::string& filepath);

    // Open the file and validate the global header
    bool open();
    void close();

    // Next frame in file order, or nullopt at end of file
    std::optional<RawFrame> read_packet();

    // Restart from the first record; sequence numbers restart at 1
    bool rewind();

    bool is_open() const { return file_.is_open(); }
    bool big_endian() const { return big_endian_; }
    const std::optional<PcapGlobalHeader>& header() const { return header_; }
    std::string get_error() const { return error_; }

private:
    uint16_t get_u16(const uint8_t* p) const;
    uint32_t get_u32(const uint8_t* p) const;

    std::string filepath_;
    std::ifstream file_;
    std::optional<PcapGlobalHeader> header_;
    bool big_endian_ = false;
    uint64_t next_seq_ = 1;
    std::string error_;
};

struct PcapFileInfo {
    std::string filepath;
    uint64_t size_bytes = 0;
    uint64_t packet_count = 0;
    uint64_t total_bytes = 0;       // Sum of captured lengths
    double first_timestamp = 0.0;
    double last_timestamp = 0.0;
    double duration = 0.0;
    uint32_t snaplen = 0;
};

// Number of complete records in a file, nullopt if it cannot be opened
std::optional<uint64_t> count_packets(const std::string& filepath);

// Summary of a file, nullopt if it is missing or not a capture file
std::optional<PcapFileInfo> get_pcap_info(const std::string& filepath);
