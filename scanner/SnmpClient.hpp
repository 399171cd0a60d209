#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Observation.hpp"

namespace hearth::scanner
{
    using Oid = std::vector<uint32_t>;

    struct SnmpVarBind
    {
        Oid oid;
        uint8_t type = 0;
        std::vector<uint8_t> value;
    };

    struct SnmpResponse
    {
        int32_t request_id = 0;
        int error_status = 0;
        std::vector<SnmpVarBind> bindings;
    };

    /*
      Minimal SNMPv2c client: GETNEXT over UDP/161 with hand-encoded BER.
      Every request opens its own socket and closes it before returning.
    */
    class SnmpClient
    {
    public:
        SnmpClient(std::chrono::milliseconds timeout, int retries);

        // Walks every binding under root. Throws std::runtime_error when the
        // agent never answers the first request; a failure mid-walk ends the
        // walk with what was collected.
        std::vector<SnmpVarBind> Walk(const std::string &ip, const std::string &community, const Oid &root);

        // ipNetToMediaPhysAddress walk (+ optional hostname column). Never
        // throws; failures log a warning and return nothing.
        std::vector<Observation> FetchClientTable(const std::string &target_ip,
                                                  const std::string &community,
                                                  const std::string &physOid,
                                                  const std::string &hostnameOid = "");

        static std::optional<Oid> ParseOid(const std::string &text);
        static std::string FormatOid(const Oid &oid);

        static std::vector<uint8_t> EncodeGetNext(const std::string &community, int32_t requestId, const Oid &oid);
        static std::optional<SnmpResponse> DecodeResponse(const std::vector<uint8_t> &packet);

        // Joins the two walked columns by index suffix. The IP is the last
        // four arcs of the physical-address OID, the MAC its 6-octet value.
        static std::vector<Observation> ParseClientTable(const Oid &physRoot,
                                                         const std::vector<SnmpVarBind> &phys,
                                                         const Oid &hostnameRoot,
                                                         const std::vector<SnmpVarBind> &hostnames);

    private:
        std::optional<SnmpResponse> Request(const std::string &ip, const std::vector<uint8_t> &packet, int32_t requestId);

        std::chrono::milliseconds m_timeout;
        int m_retries;
        int32_t m_nextRequestId;
    };
}
