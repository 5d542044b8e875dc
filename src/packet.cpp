/*
 * packet.cpp - Protocol header decoding implementation
 *
 * Implements decoding for:
 * - Layer 2: Ethernet, VLAN (802.1Q, single tag)
 * - Layer 3: IPv4, IPv6 (fixed header only), ARP
 * - Layer 4: TCP, UDP, ICMP
 *
 * Headers are read through the packed wire structs after a length check, so
 * truncated frames never read past the captured bytes.
 */

#include "packet.hpp"
#include <arpa/inet.h>
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace {

std::string ipv4_to_string(const void* addr) {
    char buf[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, addr, buf, sizeof(buf));
    return buf;
}

std::string ipv6_to_string(const void* addr) {
    char buf[INET6_ADDRSTRLEN];
    inet_ntop(AF_INET6, addr, buf, sizeof(buf));
    return buf;
}

// "(HTTP)" style annotation, preferring the source port's service name
std::string service_annotation(uint16_t src_port, uint16_t dst_port) {
    std::string name = port_name(src_port);
    if (name.empty()) {
        name = port_name(dst_port);
    }
    return name.empty() ? "" : " (" + name + ")";
}

void take_payload(DecodedPacket& result, const uint8_t* data, size_t len, size_t offset) {
    if (offset < len) {
        result.payload.assign(data + offset, data + len);
    }
}

// Layer 4, shared by IPv4 and IPv6
void decode_transport(DecodedPacket& result, uint8_t protocol,
                      const uint8_t* data, size_t len, size_t offset) {
    const uint8_t* l4 = data + offset;
    size_t remaining = len - offset;

    if (protocol == PROTO_TCP) {
        auto tcp = decode_tcp(l4, remaining);
        if (!tcp) return;

        result.protocol_name = "TCP";
        result.src_port = tcp->src_port;
        result.dst_port = tcp->dst_port;

        std::ostringstream oss;
        oss << tcp->src_port << " -> " << tcp->dst_port
            << service_annotation(tcp->src_port, tcp->dst_port);
        std::string flags = tcp_flags_str(tcp->flags);
        if (!flags.empty()) {
            oss << " " << flags;
        }
        oss << " Seq=" << tcp->seq;
        result.info = oss.str();

        take_payload(result, data, len, offset + std::max(tcp->header_length, TCP_MIN_HEADER_LEN));
        result.tcp = std::move(tcp);
    } else if (protocol == PROTO_UDP) {
        auto udp = decode_udp(l4, remaining);
        if (!udp) return;

        result.protocol_name = "UDP";
        result.src_port = udp->src_port;
        result.dst_port = udp->dst_port;

        std::ostringstream oss;
        oss << udp->src_port << " -> " << udp->dst_port
            << service_annotation(udp->src_port, udp->dst_port)
            << " Len=" << udp->length;
        result.info = oss.str();

        take_payload(result, data, len, offset + UDP_HEADER_LEN);
        result.udp = std::move(udp);
    } else if (protocol == PROTO_ICMP) {
        auto icmp = decode_icmp(l4, remaining);
        if (!icmp) return;

        result.protocol_name = "ICMP";
        result.info = icmp_type_name(icmp->type) + " (code=" + std::to_string(icmp->code) + ")";

        take_payload(result, data, len, offset + ICMP_HEADER_LEN);
        result.icmp = std::move(icmp);
    }
}

}  // namespace

std::optional<EthernetLayer> decode_ethernet(const uint8_t* data, size_t len) {
    if (len < sizeof(EthernetHeader)) {
        return std::nullopt;
    }

    const auto* eth = reinterpret_cast<const EthernetHeader*>(data);
    EthernetLayer layer;
    std::copy(eth->dst_mac, eth->dst_mac + 6, layer.dst_mac.begin());
    std::copy(eth->src_mac, eth->src_mac + 6, layer.src_mac.begin());
    layer.ether_type = ntohs(eth->ether_type);
    layer.header_length = ETHERNET_HEADER_LEN;

    // 802.1Q: TCI(2) + real ethertype(2) follow the tag value
    if (layer.ether_type == ETHERTYPE_VLAN) {
        if (len < ETHERNET_HEADER_LEN + VLAN_TAG_LEN) {
            return std::nullopt;
        }
        uint16_t tci;
        uint16_t real_type;
        std::memcpy(&tci, data + ETHERNET_HEADER_LEN, sizeof(tci));
        std::memcpy(&real_type, data + ETHERNET_HEADER_LEN + 2, sizeof(real_type));

        layer.vlan_tagged = true;
        layer.vlan_id = ntohs(tci) & 0x0FFF;
        layer.ether_type = ntohs(real_type);
        layer.header_length = ETHERNET_HEADER_LEN + VLAN_TAG_LEN;
    }

    return layer;
}

std::optional<IPv4Layer> decode_ipv4(const uint8_t* data, size_t len) {
    if (len < sizeof(IPv4Header)) {
        return std::nullopt;
    }

    const auto* ip = reinterpret_cast<const IPv4Header*>(data);
    IPv4Layer layer;
    layer.version = (ip->version_ihl >> 4) & 0x0F;
    layer.header_length = static_cast<size_t>(ip->version_ihl & 0x0F) * 4;

    if (layer.version != 4 || layer.header_length < IPV4_MIN_HEADER_LEN ||
        layer.header_length > len) {
        return std::nullopt;
    }

    uint16_t flags_fragment = ntohs(ip->flags_fragment);
    layer.tos = ip->tos;
    layer.total_length = ntohs(ip->total_length);
    layer.identification = ntohs(ip->identification);
    layer.flags = (flags_fragment >> 13) & 0x07;
    layer.fragment_offset = flags_fragment & 0x1FFF;
    layer.ttl = ip->ttl;
    layer.protocol = ip->protocol;
    layer.checksum = ntohs(ip->checksum);
    layer.src_ip = ipv4_to_string(&ip->src_addr);
    layer.dst_ip = ipv4_to_string(&ip->dst_addr);

    return layer;
}

std::optional<IPv6Layer> decode_ipv6(const uint8_t* data, size_t len) {
    if (len < sizeof(IPv6Header)) {
        return std::nullopt;
    }

    const auto* ip6 = reinterpret_cast<const IPv6Header*>(data);
    uint32_t first_word = ntohl(ip6->version_class_flow);

    IPv6Layer layer;
    layer.version = (first_word >> 28) & 0x0F;
    if (layer.version != 6) {
        return std::nullopt;
    }

    layer.traffic_class = (first_word >> 20) & 0xFF;
    layer.flow_label = first_word & 0xFFFFF;
    layer.payload_length = ntohs(ip6->payload_length);
    layer.next_header = ip6->next_header;
    layer.hop_limit = ip6->hop_limit;
    layer.src_ip = ipv6_to_string(ip6->src_addr);
    layer.dst_ip = ipv6_to_string(ip6->dst_addr);

    return layer;
}

std::optional<TCPLayer> decode_tcp(const uint8_t* data, size_t len) {
    if (len < sizeof(TCPHeader)) {
        return std::nullopt;
    }

    const auto* tcp = reinterpret_cast<const TCPHeader*>(data);
    TCPLayer layer;
    layer.src_port = ntohs(tcp->src_port);
    layer.dst_port = ntohs(tcp->dst_port);
    layer.seq = ntohl(tcp->seq_num);
    layer.ack = ntohl(tcp->ack_num);
    layer.header_length = static_cast<size_t>((tcp->data_offset >> 4) & 0x0F) * 4;
    layer.reserved = tcp->data_offset & 0x0F;
    layer.flags = tcp->flags;
    layer.window = ntohs(tcp->window);
    layer.checksum = ntohs(tcp->checksum);
    layer.urgent = ntohs(tcp->urgent_ptr);

    return layer;
}

std::optional<UDPLayer> decode_udp(const uint8_t* data, size_t len) {
    if (len < sizeof(UDPHeader)) {
        return std::nullopt;
    }

    const auto* udp = reinterpret_cast<const UDPHeader*>(data);
    UDPLayer layer;
    layer.src_port = ntohs(udp->src_port);
    layer.dst_port = ntohs(udp->dst_port);
    layer.length = ntohs(udp->length);
    layer.checksum = ntohs(udp->checksum);

    return layer;
}

std::optional<ICMPLayer> decode_icmp(const uint8_t* data, size_t len) {
    if (len < sizeof(ICMPHeader)) {
        return std::nullopt;
    }

    const auto* icmp = reinterpret_cast<const ICMPHeader*>(data);
    ICMPLayer layer;
    layer.type = icmp->type;
    layer.code = icmp->code;
    layer.checksum = ntohs(icmp->checksum);

    return layer;
}

std::optional<ARPLayer> decode_arp(const uint8_t* data, size_t len) {
    if (len < sizeof(ARPHeader)) {
        return std::nullopt;
    }

    const auto* arp = reinterpret_cast<const ARPHeader*>(data);
    ARPLayer layer;
    layer.hw_type = ntohs(arp->hw_type);
    layer.proto_type = ntohs(arp->proto_type);
    layer.hw_size = arp->hw_size;
    layer.proto_size = arp->proto_size;
    layer.opcode = ntohs(arp->opcode);
    std::copy(arp->sender_mac, arp->sender_mac + 6, layer.sender_mac.begin());
    std::copy(arp->target_mac, arp->target_mac + 6, layer.target_mac.begin());
    layer.sender_ip = ipv4_to_string(arp->sender_ip);
    layer.target_ip = ipv4_to_string(arp->target_ip);

    return layer;
}

DecodedPacket decode_packet(const uint8_t* data, size_t len) {
    DecodedPacket result;

    auto eth = decode_ethernet(data, len);
    if (!eth) {
        return result;
    }
    size_t offset = eth->header_length;
    uint16_t ether_type = eth->ether_type;
    result.ethernet = std::move(eth);

    if (ether_type == ETHERTYPE_IPV4) {
        auto ip = decode_ipv4(data + offset, len - offset);
        if (!ip) return result;

        result.src_addr = ip->src_ip;
        result.dst_addr = ip->dst_ip;
        result.protocol_name = ip_protocol_name(ip->protocol);
        offset += ip->header_length;
        uint8_t protocol = ip->protocol;
        result.ipv4 = std::move(ip);

        decode_transport(result, protocol, data, len, offset);
    } else if (ether_type == ETHERTYPE_IPV6) {
        auto ip6 = decode_ipv6(data + offset, len - offset);
        if (!ip6) return result;

        result.src_addr = ip6->src_ip;
        result.dst_addr = ip6->dst_ip;
        result.protocol_name = "IPv6";
        offset += IPV6_HEADER_LEN;
        uint8_t next_header = ip6->next_header;
        result.ipv6 = std::move(ip6);

        decode_transport(result, next_header, data, len, offset);
    } else if (ether_type == ETHERTYPE_ARP) {
        auto arp = decode_arp(data + offset, len - offset);
        if (!arp) return result;

        result.protocol_name = "ARP";
        result.src_addr = arp->sender_ip;
        result.dst_addr = arp->target_ip;
        result.info = arp_op_name(arp->opcode) + ": " + arp->sender_ip + " -> " + arp->target_ip;
        result.arp = std::move(arp);
    }

    return result;
}

DecodedPacket decode_packet(const RawFrame& frame) {
    return decode_packet(frame.data.data(), frame.data.size());
}

std::string DecodedPacket::summary() const {
    std::ostringstream oss;
    oss << protocol_name;

    if (!src_addr.empty() || !dst_addr.empty()) {
        oss << " " << (src_addr.empty() ? "-" : src_addr);
        if (src_port) oss << ":" << src_port;
        oss << " -> " << (dst_addr.empty() ? "-" : dst_addr);
        if (dst_port) oss << ":" << dst_port;
    } else if (ethernet) {
        oss << " " << format_mac(ethernet->src_mac) << " -> " << format_mac(ethernet->dst_mac);
    }

    if (!info.empty()) {
        oss << " " << info;
    }
    return oss.str();
}

std::vector<std::string> tcp_flag_names(uint8_t flags) {
    static const std::pair<uint8_t, const char*> names[] = {
        {TCP_FIN, "FIN"}, {TCP_SYN, "SYN"}, {TCP_RST, "RST"}, {TCP_PSH, "PSH"},
        {TCP_ACK, "ACK"}, {TCP_URG, "URG"}, {TCP_ECE, "ECE"}, {TCP_CWR, "CWR"},
    };

    std::vector<std::string> result;
    for (const auto& [bit, name] : names) {
        if (flags & bit) {
            result.emplace_back(name);
        }
    }
    return result;
}

std::string tcp_flags_str(uint8_t flags) {
    std::vector<std::string> names = tcp_flag_names(flags);
    if (names.empty()) return "";

    std::string out = "[";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ",";
        out += names[i];
    }
    return out + "]";
}

std::string format_mac(const std::array<uint8_t, 6>& mac) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < 6; ++i) {
        if (i > 0) oss << ":";
        oss << std::setw(2) << static_cast<int>(mac[i]);
    }
    return oss.str();
}

std::string port_name(uint16_t port) {
    static const std::unordered_map<uint16_t, std::string> well_known = {
        {20, "FTP-DATA"}, {21, "FTP"}, {22, "SSH"}, {23, "TELNET"},
        {25, "SMTP"}, {53, "DNS"}, {67, "DHCP-S"}, {68, "DHCP-C"},
        {80, "HTTP"}, {110, "POP3"}, {123, "NTP"}, {143, "IMAP"},
        {443, "HTTPS"}, {445, "SMB"}, {993, "IMAPS"}, {995, "POP3S"},
        {3306, "MySQL"}, {3389, "RDP"}, {5432, "PostgreSQL"}, {6379, "Redis"},
        {8080, "HTTP-ALT"}, {8443, "HTTPS-ALT"},
    };

    auto it = well_known.find(port);
    return it == well_known.end() ? "" : it->second;
}

std::string ethertype_name(uint16_t ether_type) {
    switch (ether_type) {
        case ETHERTYPE_IPV4: return "IPv4";
        case ETHERTYPE_ARP: return "ARP";
        case ETHERTYPE_IPV6: return "IPv6";
        case ETHERTYPE_VLAN: return "VLAN";
        default: {
            std::ostringstream oss;
            oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << ether_type;
            return oss.str();
        }
    }
}

std::string ip_protocol_name(uint8_t protocol) {
    switch (protocol) {
        case PROTO_ICMP: return "ICMP";
        case PROTO_TCP: return "TCP";
        case PROTO_UDP: return "UDP";
        case PROTO_ICMPV6: return "ICMPv6";
        default: return std::to_string(protocol);
    }
}

std::string icmp_type_name(uint8_t type) {
    switch (type) {
        case 0: return "Echo Reply";
        case 3: return "Destination Unreachable";
        case 5: return "Redirect";
        case 8: return "Echo Request";
        case 11: return "Time Exceeded";
        default: return "Type " + std::to_string(type);
    }
}

std::string arp_op_name(uint16_t opcode) {
    switch (opcode) {
        case ARP_REQUEST: return "Request";
        case ARP_REPLY: return "Reply";
        default: return "Op " + std::to_string(opcode);
    }
}
