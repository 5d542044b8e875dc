/*
 * packet.hpp - Raw frames and protocol header decoding
 *
 * Defines RawFrame, the unit of captured data passed through the pipeline,
 * and DecodedPacket, the layered view produced from a frame's bytes. Supports
 * Ethernet (with one 802.1Q VLAN tag), IPv4, IPv6, ARP, TCP, UDP and ICMP.
 *
 * decode_packet() never fails: a header that is missing or truncated is simply
 * absent from the result, and decoding stops at that layer. Checksums are
 * extracted but never validated.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Protocol numbers
constexpr uint8_t PROTO_ICMP = 1;
constexpr uint8_t PROTO_TCP = 6;
constexpr uint8_t PROTO_UDP = 17;
constexpr uint8_t PROTO_ICMPV6 = 58;

// EtherTypes
constexpr uint16_t ETHERTYPE_IPV4 = 0x0800;
constexpr uint16_t ETHERTYPE_ARP = 0x0806;
constexpr uint16_t ETHERTYPE_IPV6 = 0x86DD;
constexpr uint16_t ETHERTYPE_VLAN = 0x8100;

// TCP Flags
constexpr uint8_t TCP_FIN = 0x01;
constexpr uint8_t TCP_SYN = 0x02;
constexpr uint8_t TCP_RST = 0x04;
constexpr uint8_t TCP_PSH = 0x08;
constexpr uint8_t TCP_ACK = 0x10;
constexpr uint8_t TCP_URG = 0x20;
constexpr uint8_t TCP_ECE = 0x40;
constexpr uint8_t TCP_CWR = 0x80;

// ARP operations
constexpr uint16_t ARP_REQUEST = 1;
constexpr uint16_t ARP_REPLY = 2;

// Header sizes
constexpr size_t ETHERNET_HEADER_LEN = 14;
constexpr size_t VLAN_TAG_LEN = 4;
constexpr size_t IPV4_MIN_HEADER_LEN = 20;
constexpr size_t IPV6_HEADER_LEN = 40;
constexpr size_t TCP_MIN_HEADER_LEN = 20;
constexpr size_t UDP_HEADER_LEN = 8;
constexpr size_t ICMP_HEADER_LEN = 8;
constexpr size_t ARP_HEADER_LEN = 28;

// One captured frame. Sequence numbers are assigned at ingestion (or by a
// file reader) and are strictly increasing within their session.
struct RawFrame {
    uint64_t seq = 0;
    uint32_t ts_sec = 0;
    uint32_t ts_usec = 0;
    uint32_t caplen = 0;
    uint32_t origlen = 0;
    std::vector<uint8_t> data;
};

// Packet header structures (packed for direct memory mapping)
#pragma pack(push, 1)

struct EthernetHeader {
    uint8_t dst_mac[6];
    uint8_t src_mac[6];
    uint16_t ether_type;
};

struct IPv4Header {
    uint8_t version_ihl;
    uint8_t tos;
    uint16_t total_length;
    uint16_t identification;
    uint16_t flags_fragment;
    uint8_t ttl;
    uint8_t protocol;
    uint16_t checksum;
    uint32_t src_addr;
    uint32_t dst_addr;
};

struct IPv6Header {
    uint32_t version_class_flow;
    uint16_t payload_length;
    uint8_t next_header;
    uint8_t hop_limit;
    uint8_t src_addr[16];
    uint8_t dst_addr[16];
};

struct TCPHeader {
    uint16_t src_port;
    uint16_t dst_port;
    uint32_t seq_num;
    uint32_t ack_num;
    uint8_t data_offset;
    uint8_t flags;
    uint16_t window;
    uint16_t checksum;
    uint16_t urgent_ptr;
};

struct UDPHeader {
    uint16_t src_port;
    uint16_t dst_port;
    uint16_t length;
    uint16_t checksum;
};

struct ICMPHeader {
    uint8_t type;
    uint8_t code;
    uint16_t checksum;
    uint32_t rest;
};

struct ARPHeader {
    uint16_t hw_type;
    uint16_t proto_type;
    uint8_t hw_size;
    uint8_t proto_size;
    uint16_t opcode;
    uint8_t sender_mac[6];
    uint8_t sender_ip[4];
    uint8_t target_mac[6];
    uint8_t target_ip[4];
};

#pragma pack(pop)

// Decoded layers, all fields in host byte order

struct EthernetLayer {
    std::array<uint8_t, 6> dst_mac{};
    std::array<uint8_t, 6> src_mac{};
    uint16_t ether_type = 0;       // Real ethertype, after any VLAN tag
    bool vlan_tagged = false;
    uint16_t vlan_id = 0;
    size_t header_length = 0;      // 14, or 18 with a VLAN tag
};

struct IPv4Layer {
    uint8_t version = 0;
    size_t header_length = 0;      // IHL * 4
    uint8_t tos = 0;
    uint16_t total_length = 0;
    uint16_t identification = 0;
    uint8_t flags = 0;             // 3 bits
    uint16_t fragment_offset = 0;  // 13 bits
    uint8_t ttl = 0;
    uint8_t protocol = 0;
    uint16_t checksum = 0;
    std::string src_ip;
    std::string dst_ip;
};

struct IPv6Layer {
    uint8_t version = 0;
    uint8_t traffic_class = 0;
    uint32_t flow_label = 0;
    uint16_t payload_length = 0;
    uint8_t next_header = 0;
    uint8_t hop_limit = 0;
    std::string src_ip;
    std::string dst_ip;
};

struct TCPLayer {
    uint16_t src_port = 0;
    uint16_t dst_port = 0;
    uint32_t seq = 0;
    uint32_t ack = 0;
    size_t header_length = 0;      // data offset * 4
    uint8_t reserved = 0;
    uint8_t flags = 0;
    uint16_t window = 0;
    uint16_t checksum = 0;
    uint16_t urgent = 0;
};

struct UDPLayer {
    uint16_t src_port = 0;
    uint16_t dst_port = 0;
    uint16_t length = 0;
    uint16_t checksum = 0;
};

struct ICMPLayer {
    uint8_t type = 0;
    uint8_t code = 0;
    uint16_t checksum = 0;
};

struct ARPLayer {
    uint16_t hw_type = 0;
    uint16_t proto_type = 0;
    uint8_t hw_size = 0;
    uint8_t proto_size = 0;
    uint16_t opcode = 0;
    std::array<uint8_t, 6> sender_mac{};
    std::string sender_ip;
    std::array<uint8_t, 6> target_mac{};
    std::string target_ip;
};

struct DecodedPacket {
    std::optional<EthernetLayer> ethernet;
    std::optional<IPv4Layer> ipv4;
    std::optional<IPv6Layer> ipv6;
    std::optional<TCPLayer> tcp;
    std::optional<UDPLayer> udp;
    std::optional<ICMPLayer> icmp;
    std::optional<ARPLayer> arp;

    // Summary fields
    std::string protocol_name = "UNKNOWN";
    std::string src_addr;
    std::string dst_addr;
    uint16_t src_port = 0;
    uint16_t dst_port = 0;
    std::string info;
    std::vector<uint8_t> payload;

    std::string summary() const;
};

// Per-layer decoders. Each returns nullopt when fewer bytes remain than the
// layer needs, which tells the caller to stop descending.
std::optional<EthernetLayer> decode_ethernet(const uint8_t* data, size_t len);
std::optional<IPv4Layer> decode_ipv4(const uint8_t* data, size_t len);
std::optional<IPv6Layer> decode_ipv6(const uint8_t* data, size_t len);
std::optional<TCPLayer> decode_tcp(const uint8_t* data, size_t len);
std::optional<UDPLayer> decode_udp(const uint8_t* data, size_t len);
std::optional<ICMPLayer> decode_icmp(const uint8_t* data, size_t len);
std::optional<ARPLayer> decode_arp(const uint8_t* data, size_t len);

// Decode a full frame
DecodedPacket decode_packet(const uint8_t* data, size_t len);
DecodedPacket decode_packet(const RawFrame& frame);

// Name lookups for display
std::vector<std::string> tcp_flag_names(uint8_t flags);
std::string tcp_flags_str(uint8_t flags);
std::string format_mac(const std::array<uint8_t, 6>& mac);
std::string port_name(uint16_t port);
std::string ethertype_name(uint16_t ether_type);
std::string ip_protocol_name(uint8_t protocol);
std::string icmp_type_name(uint8_t type);
std::string arp_op_name(uint16_t opcode);
