// Fuzz target for the proxied HTTP response parser
// Tests HttpResponseParser::Feed / FinishEof with arbitrary bytes and splits
//
// Every candidate that accepts a connection can send anything back. The
// parser must stay within its header and body limits, never throw, and
// produce the same result however the input is split across reads.
//
// Target code:
// - src/verify/http_message.cpp

#include "verify/http_message.hpp"
#include "fuzz_input.hpp"

#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <string>

using namespace proxyscan::verify;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 2) return 0;

    FuzzInput input(data, size);
    uint8_t split = input.read<uint8_t>();
    std::string response = input.read_remaining();

    try {
        HttpResponseParser whole;
        whole.Feed(response.data(), response.size());
        whole.FinishEof();

        HttpResponseParser pieces;
        size_t step = static_cast<size_t>(split % 16) + 1;
        for (size_t pos = 0; pos < response.size() && !pieces.failed(); pos += step) {
            pieces.Feed(response.data() + pos, std::min(step, response.size() - pos));
        }
        pieces.FinishEof();

        if (whole.complete() != pieces.complete() || whole.failed() != pieces.failed()) {
            __builtin_trap();
        }
        if (whole.complete()) {
            if (whole.status_code() != pieces.status_code() || whole.body() != pieces.body()) {
                __builtin_trap();
            }
            if (whole.body().size() > HttpResponseParser::MAX_BODY_SIZE) {
                __builtin_trap();
            }
            if (whole.status_code() < 200 || whole.status_code() > 999) {
                __builtin_trap();
            }
        }
        if (whole.failed() && whole.error().empty()) {
            __builtin_trap();
        }
    } catch (...) {
        // The parser reports errors through failed()/error()
        __builtin_trap();
    }

    return 0;
}
