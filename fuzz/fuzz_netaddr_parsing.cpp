// Fuzz target for candidate address and CIDR range parsing
// Tests ParseCandidate, ParseIPPort, ValidateAndNormalizeIP and IPNetwork
//
// Every record of an input file and every --subnet value goes through this
// code. Bugs here can:
// - Report one proxy twice (IPv4-mapped normalization mismatch)
// - Probe addresses outside the requested range
// - Crash on malformed records (exception leaks, overflow in host math)
//
// Target code:
// - src/util/netaddress.cpp (ValidateAndNormalizeIP, ParseIPPort, IPNetwork)
// - src/scan/candidate.cpp (ParseCandidate)

#include "scan/candidate.hpp"
#include "util/netaddress.hpp"
#include "fuzz_input.hpp"

#include <cstdint>
#include <cstddef>
#include <string>

using namespace proxyscan::scan;
using namespace proxyscan::util;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 2) return 0;

    FuzzInput input(data, size);
    uint8_t mode = input.read<uint8_t>();

    // TEST 1: ParseCandidate with arbitrary records
    if ((mode & 0x03) == 0) {
        uint16_t default_port = input.read<uint16_t>();
        std::string text = input.read_remaining();

        try {
            auto candidate = ParseCandidate(text, default_port);
            if (candidate) {
                // Printed form must parse back to the same endpoint
                auto again = ParseCandidate(candidate->ToString(), default_port);
                if (!again || !(*again == *candidate)) {
                    __builtin_trap();
                }
                // Mapped addresses are always folded to IPv4
                if (candidate->address.is_v6() && candidate->address.to_v6().is_v4_mapped()) {
                    __builtin_trap();
                }
            }
        } catch (...) {
            // ParseCandidate returns nullopt on error; it must never throw
            __builtin_trap();
        }
    }

    // TEST 2: ParseIPPort agrees with ValidateAndNormalizeIP
    if ((mode & 0x03) == 1) {
        std::string address_port = input.read_remaining();

        try {
            std::string out_ip;
            uint16_t out_port = 0;
            if (ParseIPPort(address_port, out_ip, out_port)) {
                auto normalized = ValidateAndNormalizeIP(out_ip);
                if (!normalized || *normalized != out_ip) {
                    __builtin_trap();
                }
                // Printed form parses back to the same port
                std::string again_ip;
                uint16_t again_port = 0;
                const std::string printed = out_ip.find(':') != std::string::npos
                                                ? "[" + out_ip + "]:" + std::to_string(out_port)
                                                : out_ip + ":" + std::to_string(out_port);
                if (!ParseIPPort(printed, again_ip, again_port) || again_ip != out_ip || again_port != out_port) {
                    __builtin_trap();
                }
            }
        } catch (...) {
            __builtin_trap();
        }
    }

    // TEST 3: IPNetwork::Parse with arbitrary strings
    if ((mode & 0x03) == 2) {
        std::string cidr = input.read_remaining();

        try {
            auto network = IPNetwork::Parse(cidr);
            if (network) {
                if (network->host_count() == 0 || network->host_count() > IPNetwork::MAX_HOSTS) {
                    __builtin_trap();
                }
                // Canonical form parses to the same range
                auto again = IPNetwork::Parse(network->ToString());
                if (!again || again->network() != network->network() ||
                    again->prefix_length() != network->prefix_length()) {
                    __builtin_trap();
                }
            }
        } catch (...) {
            __builtin_trap();
        }
    }

    // TEST 4: Host enumeration stays inside the range
    if ((mode & 0x03) == 3 && size >= 14) {
        uint8_t oct1 = input.read<uint8_t>();
        uint8_t oct2 = input.read<uint8_t>();
        uint8_t oct3 = input.read<uint8_t>();
        uint8_t oct4 = input.read<uint8_t>();
        uint8_t prefix = input.read<uint8_t>() % 33;
        uint64_t index = input.read<uint64_t>();

        std::string cidr = std::to_string(oct1) + "." + std::to_string(oct2) + "." + std::to_string(oct3) + "." +
                           std::to_string(oct4) + "/" + std::to_string(prefix);

        try {
            auto network = IPNetwork::Parse(cidr);
            if (!network) {
                __builtin_trap();  // every dotted quad with prefix 0..32 is valid
            }
            index %= network->host_count();
            auto host = network->host_at(index);
            if (!host.is_v4()) {
                __builtin_trap();
            }
            uint32_t mask = prefix == 0 ? 0 : (0xFFFFFFFFu << (32 - prefix));
            if ((host.to_v4().to_uint() & mask) != network->network().to_v4().to_uint()) {
                __builtin_trap();
            }
            // Network and broadcast addresses are never handed out below /31
            if (prefix < 31) {
                uint32_t h = host.to_v4().to_uint();
                uint32_t base = network->network().to_v4().to_uint();
                if (h == base || h == (base | ~mask)) {
                    __builtin_trap();
                }
            }
        } catch (...) {
            __builtin_trap();
        }
    }

    return 0;
}
