// SPDX-License-Identifier: Apache-2.0
// unit_framing.cpp
// Frame parser: split delivery, chunked random payloads, truncation and corrupt length prefixes.
#include "common/framing.hpp"

#include <arpa/inet.h>

#include <cassert>
#include <cstring>
#include <iostream>
#include <random>
#include <string>

using namespace reef::netutil;

static std::string raw_prefix(uint32_t len)
{
    uint32_t net = htonl(len);
    std::string s(4, '\0');
    std::memcpy(s.data(), &net, 4);
    return s;
}

int main()
{
    // Two frames delivered in halves.
    {
        std::string p1 = "hello";
        std::string p2 = std::string(100, 'x');
        std::string all = build_frame(p1) + build_frame(p2);
        size_t half = all.size() / 2;
        FrameParseState st;
        st.feed(all.data(), half);
        std::string out;
        assert(try_extract(st, out) == FrameStatus::ready && out == p1);
        assert(try_extract(st, out) == FrameStatus::incomplete);
        st.feed(all.data() + half, all.size() - half);
        assert(try_extract(st, out) == FrameStatus::ready && out == p2);
        assert(try_extract(st, out) == FrameStatus::incomplete);
        assert(st.buffer.empty());
    }
    // Random payloads fed in small chunks round-trip intact.
    {
        std::mt19937 rng(12345);
        for (int c = 0; c < 100; ++c) {
            size_t len = std::uniform_int_distribution<size_t>{1, 2048}(rng);
            std::string payload(len, '\0');
            for (auto &ch : payload)
                ch = static_cast<char>(rng());
            auto frame = build_frame(payload);
            FrameParseState st;
            size_t chunk = static_cast<size_t>(c % 17) + 1;
            std::string out;
            int got = 0;
            for (size_t i = 0; i < frame.size(); i += chunk) {
                st.feed(frame.data() + i, std::min(chunk, frame.size() - i));
                while (try_extract(st, out) == FrameStatus::ready) {
                    assert(out == payload);
                    ++got;
                }
            }
            assert(got == 1);
        }
    }
    // Truncated frame never yields output.
    {
        auto frame = build_frame(std::string(300, 'y'));
        FrameParseState st;
        st.feed(frame.data(), frame.size() - 1);
        std::string out;
        assert(try_extract(st, out) == FrameStatus::incomplete);
    }
    // A zero length is an empty payload and the stream continues after it.
    {
        FrameParseState st;
        auto zero = raw_prefix(0);
        st.feed(zero.data(), zero.size());
        auto next = build_frame("hi");
        st.feed(next.data(), next.size());
        std::string out = "stale";
        assert(try_extract(st, out) == FrameStatus::ready && out.empty());
        assert(try_extract(st, out) == FrameStatus::ready && out == "hi");
        assert(try_extract(st, out) == FrameStatus::incomplete);
    }
    // Oversize lengths are invalid; the 1 MB bound itself is accepted.
    {
        std::string out;

        FrameParseState big;
        auto huge = raw_prefix(kMaxFrameBytes + 1);
        big.feed(huge.data(), huge.size());
        assert(try_extract(big, out) == FrameStatus::invalid);

        FrameParseState edge;
        auto max = raw_prefix(kMaxFrameBytes);
        edge.feed(max.data(), max.size());
        assert(try_extract(edge, out) == FrameStatus::incomplete);
    }
    // append_frame batches frames back to back.
    {
        std::string batch;
        append_frame(batch, "a");
        append_frame(batch, "bc");
        assert(batch.size() == 4 + 1 + 4 + 2);
        FrameParseState st;
        st.feed(batch.data(), batch.size());
        std::string out;
        assert(try_extract(st, out) == FrameStatus::ready && out == "a");
        assert(try_extract(st, out) == FrameStatus::ready && out == "bc");
    }
    std::cout << "unit_framing OK" << std::endl;
    return 0;
}
