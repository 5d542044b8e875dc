/*
 * pcap_file.cpp - Capture file writer and reader implementation
 *
 * The writer serialises headers field by field in the chosen byte order rather
 * than dumping structs, so the output does not depend on host endianness.
 */

#include "pcap_file.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

// PcapWriter implementation

PcapWriter::PcapWriter(const std::string& filepath, uint32_t snaplen,
                       size_t batch_size, ByteOrder order, uint32_t linktype)
    : filepath_(filepath),
      snaplen_(snaplen),
      batch_size_(std::max<size_t>(batch_size, 1)),
      order_(order),
      linktype_(linktype) {}

PcapWriter::~PcapWriter() {
    close();
}

bool PcapWriter::open() {
    if (fd_ >= 0) {
        return true;
    }

    fd_ = ::open(filepath_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        error_ = "open " + filepath_ + ": " + std::strerror(errno);
        return false;
    }
    closed_ = false;

    // Global header goes out immediately, ahead of any record
    buffer_.clear();
    put_u32(PCAP_MAGIC);
    put_u16(PCAP_VERSION_MAJOR);
    put_u16(PCAP_VERSION_MINOR);
    put_u32(0);  // thiszone
    put_u32(0);  // sigfigs
    put_u32(snaplen_);
    put_u32(linktype_);

    return flush_buffer();
}

void PcapWriter::put_u16(uint16_t value) {
    if (order_ == ByteOrder::LITTLE) {
        buffer_.push_back(static_cast<uint8_t>(value));
        buffer_.push_back(static_cast<uint8_t>(value >> 8));
    } else {
        buffer_.push_back(static_cast<uint8_t>(value >> 8));
        buffer_.push_back(static_cast<uint8_t>(value));
    }
}

void PcapWriter::put_u32(uint32_t value) {
    if (order_ == ByteOrder::LITTLE) {
        for (int shift = 0; shift <= 24; shift += 8) {
            buffer_.push_back(static_cast<uint8_t>(value >> shift));
        }
    } else {
        for (int shift = 24; shift >= 0; shift -= 8) {
            buffer_.push_back(static_cast<uint8_t>(value >> shift));
        }
    }
}

bool PcapWriter::write_packet(uint32_t ts_sec, uint32_t ts_usec,
                              const uint8_t* data, size_t len,
                              std::optional<uint32_t> origlen) {
    if (closed_ || fd_ < 0) {
        return false;
    }

    uint32_t caplen = static_cast<uint32_t>(std::min<size_t>(len, snaplen_));
    uint32_t orig = origlen.value_or(static_cast<uint32_t>(len));
    if (orig < caplen) {
        orig = caplen;
    }

    put_u32(ts_sec);
    put_u32(ts_usec);
    put_u32(caplen);
    put_u32(orig);
    buffer_.insert(buffer_.end(), data, data + caplen);

    pending_packets_++;
    packet_count_++;
    byte_count_ += caplen;

    if (pending_packets_ >= batch_size_) {
        return flush_buffer();
    }
    return true;
}

bool PcapWriter::write_frame(const RawFrame& frame) {
    uint32_t origlen = frame.origlen ? frame.origlen : static_cast<uint32_t>(frame.data.size());
    return write_packet(frame.ts_sec, frame.ts_usec, frame.data.data(), frame.data.size(), origlen);
}

bool PcapWriter::write_all(const uint8_t* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd_, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            error_ = "write " + filepath_ + ": " + std::strerror(errno);
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

bool PcapWriter::flush_buffer() {
    if (buffer_.empty() || fd_ < 0) {
        return true;
    }

    bool ok = write_all(buffer_.data(), buffer_.size());
    // A failed batch is dropped rather than retried so the buffer stays bounded
    buffer_.clear();
    pending_packets_ = 0;
    return ok;
}

bool PcapWriter::flush() {
    return flush_buffer();
}

bool PcapWriter::close() {
    if (closed_ || fd_ < 0) {
        return true;
    }
    closed_ = true;

    bool ok = flush_buffer();
    if (::close(fd_) != 0 && ok) {
        error_ = "close " + filepath_ + ": " + std::strerror(errno);
        ok = false;
    }
    fd_ = -1;
    return ok;
}

// PcapReader implementation

PcapReader::PcapReader(const std::string& filepath) : filepath_(filepath) {}

bool PcapReader::open() {
    close();

    file_.open(filepath_, std::ios::binary);
    if (!file_.is_open()) {
        error_ = "cannot open " + filepath_;
        return false;
    }

    uint8_t raw[PCAP_GLOBAL_HEADER_LEN];
    file_.read(reinterpret_cast<char*>(raw), sizeof(raw));
    if (file_.gcount() < static_cast<std::streamsize>(sizeof(raw))) {
        error_ = "invalid capture file (too short): " + filepath_;
        file_.close();
        return false;
    }

    // Magic read as little-endian decides the order of everything after it
    uint32_t magic = static_cast<uint32_t>(raw[0]) |
                     (static_cast<uint32_t>(raw[1]) << 8) |
                     (static_cast<uint32_t>(raw[2]) << 16) |
                     (static_cast<uint32_t>(raw[3]) << 24);
    if (magic == PCAP_MAGIC) {
        big_endian_ = false;
    } else if (magic == PCAP_MAGIC_SWAPPED) {
        big_endian_ = true;
    } else {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "0x%08x", magic);
        error_ = std::string("invalid capture file magic ") + buf + ": " + filepath_;
        file_.close();
        return false;
    }

    PcapGlobalHeader header;
    header.magic = PCAP_MAGIC;
    header.version_major = get_u16(raw + 4);
    header.version_minor = get_u16(raw + 6);
    header.thiszone = static_cast<int32_t>(get_u32(raw + 8));
    header.sigfigs = get_u32(raw + 12);
    header.snaplen = get_u32(raw + 16);
    header.linktype = get_u32(raw + 20);
    header_ = header;

    next_seq_ = 1;
    error_.clear();
    return true;
}

void PcapReader::close() {
    if (file_.is_open()) {
        file_.close();
    }
    file_.clear();
    header_.reset();
}

uint16_t PcapReader::get_u16(const uint8_t* p) const {
    if (big_endian_) {
        return static_cast<uint16_t>((p[0] << 8) | p[1]);
    }
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t PcapReader::get_u32(const uint8_t* p) const {
    if (big_endian_) {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    }
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

std::optional<RawFrame> PcapReader::read_packet() {
    if (!file_.is_open()) {
        return std::nullopt;
    }

    uint8_t raw[PCAP_RECORD_HEADER_LEN];
    file_.read(reinterpret_cast<char*>(raw), sizeof(raw));
    if (file_.gcount() < static_cast<std::streamsize>(sizeof(raw))) {
        return std::nullopt;
    }

    RawFrame frame;
    frame.ts_sec = get_u32(raw);
    frame.ts_usec = get_u32(raw + 4);
    frame.caplen = get_u32(raw + 8);
    frame.origlen = get_u32(raw + 12);

    // A record longer than any sane snaplen means a corrupt or foreign file
    uint32_t limit = std::max<uint32_t>(header_ ? header_->snaplen : 0, PCAP_MAX_RECORD_LEN);
    if (frame.caplen > limit) {
        error_ = "record length exceeds limit: " + filepath_;
        return std::nullopt;
    }

    frame.data.resize(frame.caplen);
    if (frame.caplen > 0) {
        file_.read(reinterpret_cast<char*>(frame.data.data()), frame.caplen);
        if (file_.gcount() < static_cast<std::streamsize>(frame.caplen)) {
            return std::nullopt;
        }
    }

    frame.seq = next_seq_++;
    return frame;
}

bool PcapReader::rewind() {
    if (!file_.is_open()) {
        return open();
    }

    file_.clear();
    file_.seekg(static_cast<std::streamoff>(PCAP_GLOBAL_HEADER_LEN), std::ios::beg);
    if (!file_) {
        error_ = "seek failed: " + filepath_;
        return false;
    }
    next_seq_ = 1;
    return true;
}

// File utilities

std::optional<uint64_t> count_packets(const std::string& filepath) {
    PcapReader reader(filepath);
    if (!reader.open()) {
        return std::nullopt;
    }

    uint64_t count = 0;
    while (reader.read_packet()) {
        count++;
    }
    return count;
}

std::optional<PcapFileInfo> get_pcap_info(const std::string& filepath) {
    struct stat st;
    if (stat(filepath.c_str(), &st) != 0) {
        return std::nullopt;
    }

    PcapReader reader(filepath);
    if (!reader.open()) {
        return std::nullopt;
    }

    PcapFileInfo info;
    info.filepath = filepath;
    info.size_bytes = static_cast<uint64_t>(st.st_size);
    info.snaplen = reader.header() ? reader.header()->snaplen : 0;

    bool first = true;
    while (auto frame = reader.read_packet()) {
        double ts = frame->ts_sec + frame->ts_usec / 1e6;
        if (first) {
            info.first_timestamp = ts;
            first = false;
        }
        info.last_timestamp = ts;
        info.packet_count++;
        info.total_bytes += frame->caplen;
    }

    if (info.packet_count > 0) {
        info.duration = info.last_timestamp - info.first_timestamp;
    }
    return info;
}
