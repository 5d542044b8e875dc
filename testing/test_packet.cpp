/*
 * test_packet.cpp - Unit tests for the protocol decoder
 *
 * Uses the attest.h single-header testing framework with synthetic frames
 * built in memory.
 */

#define ATTEST_IMPLEMENTATION
#include "attest.h"

#include <string>
#include <vector>

#include "../src/packet.hpp"
#include "test_helpers.hpp"

using namespace testutil;

static const IPv4 HOST_A = {192, 168, 1, 10};
static const IPv4 HOST_B = {10, 0, 0, 1};

// =============================================================================
// Ethernet / VLAN
// =============================================================================

REGISTER_TEST(decode_too_short_for_ethernet)
{
    uint8_t data[] = {0x00, 0x01, 0x02};
    DecodedPacket pkt = decode_packet(data, sizeof(data));
    ATTEST_FALSE(pkt.ethernet.has_value());
    ATTEST_FALSE(pkt.ipv4.has_value());
    ATTEST_EQUAL(pkt.protocol_name, "UNKNOWN");
}

REGISTER_TEST(decode_ethernet_only)
{
    Bytes frame = ethernet(0x0000);
    DecodedPacket pkt = decode_packet(frame.data(), frame.size());
    ATTEST_TRUE(pkt.ethernet.has_value());
    ATTEST_EQUAL(pkt.ethernet->ether_type, 0x0000);
    ATTEST_EQUAL(pkt.ethernet->header_length, 14u);

    std::array<uint8_t, 6> expected_dst = {0xff, 0xff, 0xff, 0xff, 0xff, 0xff};
    std::array<uint8_t, 6> expected_src = {0x00, 0x11, 0x22, 0x33, 0x44, 0x55};
    ATTEST_TRUE(pkt.ethernet->dst_mac == expected_dst);
    ATTEST_TRUE(pkt.ethernet->src_mac == expected_src);
    ATTEST_EQUAL(pkt.protocol_name, "UNKNOWN");
}

REGISTER_TEST(decode_vlan_tagged_frame)
{
    Bytes payload = {0xde, 0xad};
    Bytes tagged = tcp_frame(HOST_A, HOST_B, 40000, 80, TCP_SYN, payload, 0x2064);
    Bytes plain = tcp_frame(HOST_A, HOST_B, 40000, 80, TCP_SYN, payload);

    DecodedPacket pkt = decode_packet(tagged.data(), tagged.size());
    ATTEST_TRUE(pkt.ethernet.has_value());
    ATTEST_TRUE(pkt.ethernet->vlan_tagged);
    ATTEST_EQUAL(pkt.ethernet->vlan_id, 0x064);
    ATTEST_EQUAL(pkt.ethernet->ether_type, ETHERTYPE_IPV4);
    ATTEST_EQUAL(pkt.ethernet->header_length, 18u);
    ATTEST_TRUE(pkt.ipv4.has_value());
    ATTEST_TRUE(pkt.tcp.has_value());

    DecodedPacket untagged = decode_packet(plain.data(), plain.size());
    ATTEST_FALSE(untagged.ethernet->vlan_tagged);
    ATTEST_EQUAL(untagged.ethernet->header_length, 14u);
    ATTEST_TRUE(pkt.payload == untagged.payload);
}

REGISTER_TEST(decode_vlan_tag_truncated)
{
    Bytes frame = ethernet(ETHERTYPE_IPV4, 5);
    frame.resize(16);
    DecodedPacket pkt = decode_packet(frame.data(), frame.size());
    ATTEST_FALSE(pkt.ethernet.has_value());
}

// =============================================================================
// IPv4 / TCP
// =============================================================================

REGISTER_TEST(decode_ipv4_tcp_fields)
{
    Bytes payload = {'G', 'E', 'T', ' '};
    Bytes frame = tcp_frame(HOST_A, HOST_B, 51000, 80, TCP_PSH | TCP_ACK, payload);
    DecodedPacket pkt = decode_packet(frame.data(), frame.size());

    ATTEST_TRUE(pkt.ipv4.has_value());
    ATTEST_EQUAL(pkt.ipv4->version, 4);
    ATTEST_EQUAL(pkt.ipv4->header_length, 20u);
    ATTEST_EQUAL(pkt.ipv4->total_length, 44);
    ATTEST_EQUAL(pkt.ipv4->identification, 0x1234);
    ATTEST_EQUAL(pkt.ipv4->flags, 2);
    ATTEST_EQUAL(pkt.ipv4->fragment_offset, 0);
    ATTEST_EQUAL(pkt.ipv4->ttl, 64);
    ATTEST_EQUAL(pkt.ipv4->checksum, 0xbeef);
    ATTEST_EQUAL(pkt.ipv4->src_ip, "192.168.1.10");
    ATTEST_EQUAL(pkt.ipv4->dst_ip, "10.0.0.1");

    ATTEST_TRUE(pkt.tcp.has_value());
    ATTEST_FALSE(pkt.udp.has_value());
    ATTEST_FALSE(pkt.icmp.has_value());
    ATTEST_EQUAL(pkt.tcp->src_port, 51000);
    ATTEST_EQUAL(pkt.tcp->dst_port, 80);
    ATTEST_EQUAL(pkt.tcp->seq, 1000u);
    ATTEST_EQUAL(pkt.tcp->header_length, 20u);
    ATTEST_EQUAL(pkt.tcp->window, 65535);

    ATTEST_EQUAL(pkt.protocol_name, "TCP");
    ATTEST_EQUAL(pkt.src_addr, "192.168.1.10");
    ATTEST_EQUAL(pkt.dst_addr, "10.0.0.1");
    ATTEST_EQUAL(pkt.src_port, 51000);
    ATTEST_EQUAL(pkt.dst_port, 80);
    ATTEST_TRUE(pkt.payload == payload);
}

REGISTER_TEST(decode_tcp_info_line)
{
    Bytes frame = tcp_frame(HOST_A, HOST_B, 51000, 443, TCP_SYN);
    DecodedPacket pkt = decode_packet(frame.data(), frame.size());
    ATTEST_EQUAL(pkt.info, "51000 -> 443 (HTTPS) [SYN] Seq=1000");
}

REGISTER_TEST(decode_tcp_info_prefers_source_service)
{
    Bytes frame = tcp_frame(HOST_B, HOST_A, 22, 80, TCP_ACK);
    DecodedPacket pkt = decode_packet(frame.data(), frame.size());
    ATTEST_EQUAL(pkt.info, "22 -> 80 (SSH) [ACK] Seq=1000");
}

REGISTER_TEST(decode_tcp_truncated_stops_descending)
{
    Bytes frame = tcp_frame(HOST_A, HOST_B, 1234, 80, TCP_SYN);
    frame.resize(14 + 20 + 10);
    DecodedPacket pkt = decode_packet(frame.data(), frame.size());
    ATTEST_TRUE(pkt.ipv4.has_value());
    ATTEST_FALSE(pkt.tcp.has_value());
    ATTEST_EQUAL(pkt.src_port, 0);
    ATTEST_TRUE(pkt.payload.empty());
}

REGISTER_TEST(decode_ipv4_bad_ihl)
{
    Bytes frame = tcp_frame(HOST_A, HOST_B, 1234, 80, TCP_SYN);
    frame[14] = 0x44;   // IHL 4 (16 bytes) is below the minimum
    DecodedPacket pkt = decode_packet(frame.data(), frame.size());
    ATTEST_TRUE(pkt.ethernet.has_value());
    ATTEST_FALSE(pkt.ipv4.has_value());
    ATTEST_FALSE(pkt.tcp.has_value());
}

// =============================================================================
// TCP flags
// =============================================================================

REGISTER_TEST(tcp_flags_syn_ack)
{
    std::vector<std::string> flags = tcp_flag_names(0x12);
    ATTEST_EQUAL(flags.size(), 2u);
    ATTEST_EQUAL(flags[0], "SYN");
    ATTEST_EQUAL(flags[1], "ACK");
}

REGISTER_TEST(tcp_flags_all_in_bit_order)
{
    std::vector<std::string> flags = tcp_flag_names(0xff);
    std::vector<std::string> expected = {"FIN", "SYN", "RST", "PSH", "ACK", "URG", "ECE", "CWR"};
    ATTEST_TRUE(flags == expected);
}

REGISTER_TEST(tcp_flags_str_format)
{
    ATTEST_EQUAL(tcp_flags_str(TCP_SYN | TCP_ACK), "[SYN,ACK]");
    ATTEST_EQUAL(tcp_flags_str(TCP_FIN), "[FIN]");
    ATTEST_EQUAL(tcp_flags_str(0), "");
}

// =============================================================================
// UDP / ICMP / ARP / IPv6
// =============================================================================

REGISTER_TEST(decode_udp_dns)
{
    Bytes payload(12, 0xab);
    Bytes frame = udp_frame(HOST_A, HOST_B, 53000, 53, payload);
    DecodedPacket pkt = decode_packet(frame.data(), frame.size());

    ATTEST_TRUE(pkt.udp.has_value());
    ATTEST_FALSE(pkt.tcp.has_value());
    ATTEST_EQUAL(pkt.udp->length, 20);
    ATTEST_EQUAL(pkt.protocol_name, "UDP");
    ATTEST_EQUAL(pkt.dst_port, 53);
    ATTEST_EQUAL(pkt.info, "53000 -> 53 (DNS) Len=20");
    ATTEST_EQUAL(pkt.payload.size(), 12u);
}

REGISTER_TEST(decode_icmp_echo_request)
{
    Bytes frame = icmp_frame(HOST_A, HOST_B, 8, 0);
    DecodedPacket pkt = decode_packet(frame.data(), frame.size());

    ATTEST_TRUE(pkt.icmp.has_value());
    ATTEST_EQUAL(pkt.icmp->type, 8);
    ATTEST_EQUAL(pkt.icmp->code, 0);
    ATTEST_EQUAL(pkt.icmp->checksum, 0xf7ff);
    ATTEST_EQUAL(pkt.protocol_name, "ICMP");
    ATTEST_EQUAL(pkt.info, "Echo Request (code=0)");
    ATTEST_EQUAL(pkt.src_port, 0);
}

REGISTER_TEST(decode_arp_request)
{
    Bytes frame = arp_frame(ARP_REQUEST, HOST_A, HOST_B);
    DecodedPacket pkt = decode_packet(frame.data(), frame.size());

    ATTEST_TRUE(pkt.arp.has_value());
    ATTEST_FALSE(pkt.ipv4.has_value());
    ATTEST_EQUAL(pkt.arp->opcode, ARP_REQUEST);
    ATTEST_EQUAL(pkt.arp->hw_size, 6);
    ATTEST_EQUAL(pkt.arp->proto_size, 4);
    ATTEST_EQUAL(pkt.arp->sender_ip, "192.168.1.10");
    ATTEST_EQUAL(pkt.arp->target_ip, "10.0.0.1");
    ATTEST_EQUAL(pkt.protocol_name, "ARP");
    ATTEST_EQUAL(pkt.info, "Request: 192.168.1.10 -> 10.0.0.1");
}

REGISTER_TEST(decode_ipv6_udp)
{
    Bytes frame = ipv6_udp_frame(546, 547);
    DecodedPacket pkt = decode_packet(frame.data(), frame.size());

    ATTEST_TRUE(pkt.ipv6.has_value());
    ATTEST_FALSE(pkt.ipv4.has_value());
    ATTEST_EQUAL(pkt.ipv6->version, 6);
    ATTEST_EQUAL(pkt.ipv6->payload_length, 8);
    ATTEST_EQUAL(pkt.ipv6->next_header, PROTO_UDP);
    ATTEST_EQUAL(pkt.ipv6->hop_limit, 64);
    ATTEST_EQUAL(pkt.ipv6->src_ip, "fe80::1");
    ATTEST_EQUAL(pkt.ipv6->dst_ip, "fe80::2");
    ATTEST_TRUE(pkt.udp.has_value());
    ATTEST_EQUAL(pkt.protocol_name, "UDP");
    ATTEST_EQUAL(pkt.src_port, 546);
}

REGISTER_TEST(decode_raw_frame_overload)
{
    RawFrame frame;
    frame.seq = 7;
    frame.data = udp_frame(HOST_A, HOST_B, 1000, 123);
    frame.caplen = static_cast<uint32_t>(frame.data.size());
    frame.origlen = frame.caplen;

    DecodedPacket pkt = decode_packet(frame);
    ATTEST_EQUAL(pkt.protocol_name, "UDP");
    ATTEST_EQUAL(pkt.info, "1000 -> 123 (NTP) Len=8");
}

// =============================================================================
// Name tables
// =============================================================================

REGISTER_TEST(name_tables)
{
    ATTEST_EQUAL(port_name(80), "HTTP");
    ATTEST_EQUAL(port_name(6379), "Redis");
    ATTEST_EQUAL(port_name(1), "");
    ATTEST_EQUAL(ethertype_name(ETHERTYPE_IPV6), "IPv6");
    ATTEST_EQUAL(ethertype_name(0x88cc), "0x88cc");
    ATTEST_EQUAL(ip_protocol_name(PROTO_ICMPV6), "ICMPv6");
    ATTEST_EQUAL(ip_protocol_name(47), "47");
    ATTEST_EQUAL(icmp_type_name(11), "Time Exceeded");
    ATTEST_EQUAL(icmp_type_name(42), "Type 42");
    ATTEST_EQUAL(arp_op_name(ARP_REPLY), "Reply");
    ATTEST_EQUAL(arp_op_name(9), "Op 9");
}

REGISTER_TEST(format_mac_address)
{
    std::array<uint8_t, 6> mac = {0x00, 0x1a, 0x2b, 0x3c, 0x4d, 0xff};
    ATTEST_EQUAL(format_mac(mac), "00:1a:2b:3c:4d:ff");
}

REGISTER_TEST(summary_line_tcp)
{
    Bytes frame = tcp_frame(HOST_A, HOST_B, 51000, 8080, TCP_SYN);
    DecodedPacket pkt = decode_packet(frame.data(), frame.size());
    ATTEST_EQUAL(pkt.summary(),
                 "TCP 192.168.1.10:51000 -> 10.0.0.1:8080 51000 -> 8080 (HTTP-ALT) [SYN] Seq=1000");
}
