#include "SnmpClient.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <map>
#include <poll.h>
#include <sstream>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace hearth::scanner
{
    namespace
    {
        constexpr uint8_t BER_INTEGER = 0x02;
        constexpr uint8_t BER_OCTET_STRING = 0x04;
        constexpr uint8_t BER_NULL = 0x05;
        constexpr uint8_t BER_OID = 0x06;
        constexpr uint8_t BER_SEQUENCE = 0x30;
        constexpr uint8_t PDU_GET_NEXT = 0xA1;
        constexpr uint8_t PDU_RESPONSE = 0xA2;
        constexpr uint8_t NO_SUCH_OBJECT = 0x80;
        constexpr uint8_t NO_SUCH_INSTANCE = 0x81;
        constexpr uint8_t END_OF_MIB_VIEW = 0x82;
        constexpr int SNMP_V2C = 1;
        constexpr size_t MAX_WALK_STEPS = 10000;

        class UdpSocket
        {
        public:
            UdpSocket() : m_fd(socket(AF_INET, SOCK_DGRAM, 0)) {}
            ~UdpSocket()
            {
                if (m_fd >= 0)
                    close(m_fd);
            }
            UdpSocket(const UdpSocket &) = delete;
            UdpSocket &operator=(const UdpSocket &) = delete;

            int Fd() const { return m_fd; }

        private:
            int m_fd;
        };

        void AppendLength(std::vector<uint8_t> &buf, size_t len)
        {
            if (len < 0x80)
            {
                buf.push_back(static_cast<uint8_t>(len));
            }
            else if (len <= 0xFF)
            {
                buf.push_back(0x81);
                buf.push_back(static_cast<uint8_t>(len));
            }
            else
            {
                buf.push_back(0x82);
                buf.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
                buf.push_back(static_cast<uint8_t>(len & 0xFF));
            }
        }

        void AppendTLV(std::vector<uint8_t> &buf, uint8_t type, const std::vector<uint8_t> &value)
        {
            buf.push_back(type);
            AppendLength(buf, value.size());
            buf.insert(buf.end(), value.begin(), value.end());
        }

        void AppendInteger(std::vector<uint8_t> &buf, int32_t value)
        {
            const uint32_t raw = static_cast<uint32_t>(value);
            std::vector<uint8_t> bytes;
            for (int shift = 24; shift >= 0; shift -= 8)
                bytes.push_back(static_cast<uint8_t>((raw >> shift) & 0xFF));

            while (bytes.size() > 1 &&
                   ((bytes[0] == 0x00 && !(bytes[1] & 0x80)) || (bytes[0] == 0xFF && (bytes[1] & 0x80))))
                bytes.erase(bytes.begin());

            AppendTLV(buf, BER_INTEGER, bytes);
        }

        void AppendString(std::vector<uint8_t> &buf, const std::string &str)
        {
            AppendTLV(buf, BER_OCTET_STRING, std::vector<uint8_t>(str.begin(), str.end()));
        }

        void AppendSubIdentifier(std::vector<uint8_t> &buf, uint32_t arc)
        {
            uint8_t groups[5];
            int count = 0;
            do
            {
                groups[count++] = static_cast<uint8_t>(arc & 0x7F);
                arc >>= 7;
            } while (arc != 0);

            for (int i = count - 1; i >= 0; --i)
                buf.push_back(static_cast<uint8_t>(groups[i] | (i > 0 ? 0x80 : 0x00)));
        }

        void AppendOid(std::vector<uint8_t> &buf, const Oid &oid)
        {
            std::vector<uint8_t> encoded;
            AppendSubIdentifier(encoded, oid[0] * 40 + oid[1]);
            for (size_t i = 2; i < oid.size(); ++i)
                AppendSubIdentifier(encoded, oid[i]);
            AppendTLV(buf, BER_OID, encoded);
        }

        struct Tlv
        {
            uint8_t type = 0;
            size_t start = 0;
            size_t length = 0;
        };

        bool ReadTlv(const std::vector<uint8_t> &data, size_t &pos, size_t end, Tlv &out)
        {
            if (pos + 2 > end)
                return false;
            out.type = data[pos++];
            uint8_t first = data[pos++];

            size_t len = first;
            if (first & 0x80)
            {
                size_t n = first & 0x7F;
                if (n == 0 || n > 4 || pos + n > end)
                    return false;
                len = 0;
                for (size_t i = 0; i < n; ++i)
                    len = (len << 8) | data[pos++];
            }

            if (len > end - pos)
                return false;
            out.start = pos;
            out.length = len;
            pos += len;
            return true;
        }

        bool ReadInteger(const std::vector<uint8_t> &data, const Tlv &tlv, int64_t &out)
        {
            if (tlv.type != BER_INTEGER || tlv.length == 0 || tlv.length > 8)
                return false;
            int64_t value = (data[tlv.start] & 0x80) ? -1 : 0;
            for (size_t i = 0; i < tlv.length; ++i)
                value = static_cast<int64_t>((static_cast<uint64_t>(value) << 8) | data[tlv.start + i]);
            out = value;
            return true;
        }

        bool ReadOid(const std::vector<uint8_t> &data, const Tlv &tlv, Oid &out)
        {
            if (tlv.type != BER_OID || tlv.length == 0)
                return false;

            std::vector<uint32_t> subids;
            uint64_t current = 0;
            for (size_t i = 0; i < tlv.length; ++i)
            {
                uint8_t b = data[tlv.start + i];
                current = (current << 7) | (b & 0x7F);
                if (current > 0xFFFFFFFFull)
                    return false;
                if (!(b & 0x80))
                {
                    subids.push_back(static_cast<uint32_t>(current));
                    current = 0;
                }
            }
            if (subids.empty() || (data[tlv.start + tlv.length - 1] & 0x80))
                return false;

            out.clear();
            uint32_t first = subids[0];
            if (first < 40)
            {
                out.push_back(0);
                out.push_back(first);
            }
            else if (first < 80)
            {
                out.push_back(1);
                out.push_back(first - 40);
            }
            else
            {
                out.push_back(2);
                out.push_back(first - 80);
            }
            out.insert(out.end(), subids.begin() + 1, subids.end());
            return true;
        }

        bool HasPrefix(const Oid &oid, const Oid &prefix)
        {
            return oid.size() > prefix.size() && std::equal(prefix.begin(), prefix.end(), oid.begin());
        }

        Oid Suffix(const Oid &oid, const Oid &prefix)
        {
            return Oid(oid.begin() + static_cast<std::ptrdiff_t>(prefix.size()), oid.end());
        }

        std::string PrintableText(const std::vector<uint8_t> &value)
        {
            std::string text;
            for (uint8_t c : value)
            {
                if (c >= 32 && c <= 126)
                    text.push_back(static_cast<char>(c));
            }
            return text;
        }
    }

    SnmpClient::SnmpClient(std::chrono::milliseconds timeout, int retries)
        : m_timeout(timeout), m_retries(std::max(retries, 0)), m_nextRequestId(1)
    {
    }

    std::optional<Oid> SnmpClient::ParseOid(const std::string &text)
    {
        Oid oid;
        std::string part;
        std::stringstream ss(text.size() > 0 && text[0] == '.' ? text.substr(1) : text);
        while (std::getline(ss, part, '.'))
        {
            if (part.empty() || part.find_first_not_of("0123456789") != std::string::npos || part.size() > 10)
                return std::nullopt;
            unsigned long long arc = std::stoull(part);
            if (arc > 0xFFFFFFFFull)
                return std::nullopt;
            oid.push_back(static_cast<uint32_t>(arc));
        }
        if (oid.size() < 2 || oid[0] > 2 || (oid[0] < 2 && oid[1] >= 40))
            return std::nullopt;
        return oid;
    }

    std::string SnmpClient::FormatOid(const Oid &oid)
    {
        std::string out;
        for (size_t i = 0; i < oid.size(); ++i)
        {
            if (i)
                out.push_back('.');
            out += std::to_string(oid[i]);
        }
        return out;
    }

    std::vector<uint8_t> SnmpClient::EncodeGetNext(const std::string &community, int32_t requestId, const Oid &oid)
    {
        std::vector<uint8_t> var_bind;
        AppendOid(var_bind, oid);
        var_bind.push_back(BER_NULL);
        var_bind.push_back(0x00);

        std::vector<uint8_t> var_bind_list;
        AppendTLV(var_bind_list, BER_SEQUENCE, var_bind);

        std::vector<uint8_t> pdu_body;
        AppendInteger(pdu_body, requestId);
        AppendInteger(pdu_body, 0); // error-status
        AppendInteger(pdu_body, 0); // error-index
        AppendTLV(pdu_body, BER_SEQUENCE, var_bind_list);

        std::vector<uint8_t> message;
        AppendInteger(message, SNMP_V2C);
        AppendString(message, community);
        AppendTLV(message, PDU_GET_NEXT, pdu_body);

        std::vector<uint8_t> packet;
        AppendTLV(packet, BER_SEQUENCE, message);
        return packet;
    }

    std::optional<SnmpResponse> SnmpClient::DecodeResponse(const std::vector<uint8_t> &packet)
    {
        size_t pos = 0;
        Tlv outer;
        if (!ReadTlv(packet, pos, packet.size(), outer) || outer.type != BER_SEQUENCE)
            return std::nullopt;

        pos = outer.start;
        const size_t outerEnd = outer.start + outer.length;

        Tlv version, community, pdu;
        if (!ReadTlv(packet, pos, outerEnd, version) || version.type != BER_INTEGER)
            return std::nullopt;
        if (!ReadTlv(packet, pos, outerEnd, community) || community.type != BER_OCTET_STRING)
            return std::nullopt;
        if (!ReadTlv(packet, pos, outerEnd, pdu) || pdu.type != PDU_RESPONSE)
            return std::nullopt;

        pos = pdu.start;
        const size_t pduEnd = pdu.start + pdu.length;

        Tlv reqId, errStatus, errIndex, bindings;
        int64_t reqIdValue = 0, errStatusValue = 0, errIndexValue = 0;
        if (!ReadTlv(packet, pos, pduEnd, reqId) || !ReadInteger(packet, reqId, reqIdValue))
            return std::nullopt;
        if (!ReadTlv(packet, pos, pduEnd, errStatus) || !ReadInteger(packet, errStatus, errStatusValue))
            return std::nullopt;
        if (!ReadTlv(packet, pos, pduEnd, errIndex) || !ReadInteger(packet, errIndex, errIndexValue))
            return std::nullopt;
        if (!ReadTlv(packet, pos, pduEnd, bindings) || bindings.type != BER_SEQUENCE)
            return std::nullopt;

        SnmpResponse response;
        response.request_id = static_cast<int32_t>(reqIdValue);
        response.error_status = static_cast<int>(errStatusValue);

        pos = bindings.start;
        const size_t bindingsEnd = bindings.start + bindings.length;
        while (pos < bindingsEnd)
        {
            Tlv bind;
            if (!ReadTlv(packet, pos, bindingsEnd, bind) || bind.type != BER_SEQUENCE)
                return std::nullopt;

            size_t inner = bind.start;
            const size_t bindEnd = bind.start + bind.length;
            Tlv name, value;
            if (!ReadTlv(packet, inner, bindEnd, name) || !ReadTlv(packet, inner, bindEnd, value))
                return std::nullopt;

            SnmpVarBind vb;
            if (!ReadOid(packet, name, vb.oid))
                return std::nullopt;
            vb.type = value.type;
            vb.value.assign(packet.begin() + static_cast<std::ptrdiff_t>(value.start),
                            packet.begin() + static_cast<std::ptrdiff_t>(value.start + value.length));
            response.bindings.push_back(std::move(vb));
        }
        return response;
    }

    std::optional<SnmpResponse> SnmpClient::Request(const std::string &ip, const std::vector<uint8_t> &packet, int32_t requestId)
    {
        sockaddr_in servaddr;
        std::memset(&servaddr, 0, sizeof(servaddr));
        servaddr.sin_family = AF_INET;
        servaddr.sin_port = htons(161);
        if (inet_pton(AF_INET, ip.c_str(), &servaddr.sin_addr) != 1)
            throw std::runtime_error("invalid SNMP target address " + ip);

        for (int attempt = 0; attempt <= m_retries; ++attempt)
        {
            UdpSocket sock;
            if (sock.Fd() < 0)
                throw std::runtime_error(std::string("socket() failed: ") + std::strerror(errno));

            ssize_t sent = sendto(sock.Fd(), packet.data(), packet.size(), 0,
                                  reinterpret_cast<const sockaddr *>(&servaddr), sizeof(servaddr));
            if (sent < 0)
                throw std::runtime_error(std::string("sendto() failed: ") + std::strerror(errno));

            const auto deadline = std::chrono::steady_clock::now() + m_timeout;
            while (true)
            {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0)
                    break;

                pollfd pfd{sock.Fd(), POLLIN, 0};
                if (poll(&pfd, 1, static_cast<int>(remaining.count())) <= 0)
                    break;

                std::vector<uint8_t> buffer(65535);
                ssize_t n = recv(sock.Fd(), buffer.data(), buffer.size(), 0);
                if (n <= 0)
                    break;
                buffer.resize(static_cast<size_t>(n));

                auto response = DecodeResponse(buffer);
                if (response && response->request_id == requestId)
                    return response;
            }
        }
        return std::nullopt;
    }

    std::vector<SnmpVarBind> SnmpClient::Walk(const std::string &ip, const std::string &community, const Oid &root)
    {
        std::vector<SnmpVarBind> results;
        Oid current = root;

        for (size_t step = 0; step < MAX_WALK_STEPS; ++step)
        {
            const int32_t requestId = m_nextRequestId++;
            auto response = Request(ip, EncodeGetNext(community, requestId, current), requestId);
            if (!response)
            {
                if (step == 0)
                    throw std::runtime_error("no response from " + ip);
                std::cerr << "[Snmp] WARNING: walk of " << FormatOid(root) << " on " << ip
                          << " stopped early after " << results.size() << " entries\n";
                break;
            }

            if (response->error_status != 0 || response->bindings.empty())
                break;

            const SnmpVarBind &vb = response->bindings.front();
            if (vb.type == NO_SUCH_OBJECT || vb.type == NO_SUCH_INSTANCE || vb.type == END_OF_MIB_VIEW)
                break;
            if (!HasPrefix(vb.oid, root))
                break;
            if (!std::lexicographical_compare(current.begin(), current.end(), vb.oid.begin(), vb.oid.end()))
            {
                std::cerr << "[Snmp] WARNING: agent " << ip << " returned a non-increasing OID, walk aborted\n";
                break;
            }

            current = vb.oid;
            results.push_back(vb);
        }
        return results;
    }

    std::vector<Observation> SnmpClient::ParseClientTable(const Oid &physRoot,
                                                          const std::vector<SnmpVarBind> &phys,
                                                          const Oid &hostnameRoot,
                                                          const std::vector<SnmpVarBind> &hostnames)
    {
        std::map<Oid, std::string> names;
        for (const auto &vb : hostnames)
        {
            if (vb.type != BER_OCTET_STRING || !HasPrefix(vb.oid, hostnameRoot))
                continue;
            std::string text = PrintableText(vb.value);
            if (!text.empty())
                names[Suffix(vb.oid, hostnameRoot)] = text;
        }

        std::vector<Observation> observations;
        for (const auto &vb : phys)
        {
            if (vb.type != BER_OCTET_STRING || vb.value.size() != 6 || !HasPrefix(vb.oid, physRoot))
                continue;

            Oid suffix = Suffix(vb.oid, physRoot);
            if (suffix.size() < 4)
                continue;

            bool validIp = true;
            std::string ip;
            for (size_t i = suffix.size() - 4; i < suffix.size(); ++i)
            {
                if (suffix[i] > 255)
                    validIp = false;
                if (!ip.empty())
                    ip.push_back('.');
                ip += std::to_string(suffix[i]);
            }
            if (!validIp)
                continue;

            char mac[18];
            std::snprintf(mac, sizeof(mac), "%02X:%02X:%02X:%02X:%02X:%02X",
                          vb.value[0], vb.value[1], vb.value[2], vb.value[3], vb.value[4], vb.value[5]);

            Observation obs;
            obs.mac = mac;
            obs.ip = ip;
            obs.source = ObservationKind::Snmp;
            auto name = names.find(suffix);
            if (name != names.end())
                obs.hostname = name->second;
            observations.push_back(std::move(obs));
        }
        return observations;
    }

    std::vector<Observation> SnmpClient::FetchClientTable(const std::string &target_ip,
                                                          const std::string &community,
                                                          const std::string &physOid,
                                                          const std::string &hostnameOid)
    {
        auto physRoot = ParseOid(physOid);
        if (!physRoot)
        {
            std::cerr << "[Snmp] WARNING: invalid OID '" << physOid << "'\n";
            return {};
        }

        std::vector<SnmpVarBind> phys;
        try
        {
            phys = Walk(target_ip, community, *physRoot);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Snmp] WARNING: client table fetch from " << target_ip << " failed: " << e.what() << "\n";
            return {};
        }

        Oid nameRoot;
        std::vector<SnmpVarBind> names;
        if (!hostnameOid.empty())
        {
            auto parsed = ParseOid(hostnameOid);
            if (!parsed)
            {
                std::cerr << "[Snmp] WARNING: invalid hostname OID '" << hostnameOid << "'\n";
            }
            else
            {
                nameRoot = *parsed;
                try
                {
                    names = Walk(target_ip, community, nameRoot);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[Snmp] WARNING: hostname column from " << target_ip << " unavailable: " << e.what() << "\n";
                }
            }
        }

        auto observations = ParseClientTable(*physRoot, phys, nameRoot, names);
        std::cout << "[Snmp] " << target_ip << " reported " << observations.size() << " clients\n";
        return observations;
    }
}
