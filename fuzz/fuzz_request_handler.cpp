/**
 * @file  fuzz_request_handler.cpp
 * @brief libFuzzer target for RequestHandler::calculate (JSON body → response)
 *
 * Build:
 *   cmake -DEFE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_request_handler
 *
 * Run for 60 seconds:
 *   ./fuzz_request_handler -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception escapes for any byte sequence.
 *   2. Status is one of 200, 400, 500, 501.
 *   3. The body is never empty and always carries `calculation_time`.
 *   4. A 200 response always carries Cache-Control; an error never does.
 *   5. The cache never grows beyond its capacity.
 *
 * Fuzzer strategy:
 *   Input is used directly as the request body.  One handler and cache
 *   persist across inputs so cache hits and FIFO eviction are exercised.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "efe/http.hpp"
#include "efe/log.hpp"

using namespace efe;

namespace {

struct Harness {
    Harness() { log::set_level(log::Level::Off); }

    cache::FifoResultCache          cache{8};
    dispatch::CalculationDispatcher dispatcher{cache};
    http::RequestHandler            handler{dispatcher};
};

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static Harness h;

    const std::string_view body{reinterpret_cast<const char*>(data), size};
    const auto r = h.handler.calculate(body);

    assert(r.status == 200 || r.status == 400 || r.status == 500 || r.status == 501);
    assert(!r.body.empty());
    assert(r.body.find("\"calculation_time\"") != std::string::npos);
    assert(r.header("Cache-Control").has_value() == (r.status == 200));
    assert(h.cache.size() <= h.cache.capacity());

    return 0;
}
