// SPDX-License-Identifier: Apache-2.0
// Length-prefixed framing: 4-byte big-endian payload size followed by the payload.
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace reef::netutil {

// Upper bound on a single payload (1 MB). Larger declared sizes are treated as corrupt streams.
inline constexpr uint32_t kMaxFrameBytes = 1'000'000;

inline void append_frame(std::string &out, std::string_view payload)
{
    uint32_t net = htonl(static_cast<uint32_t>(payload.size()));
    size_t offset = out.size();
    out.resize(offset + 4 + payload.size());
    std::memcpy(out.data() + offset, &net, 4);
    std::memcpy(out.data() + offset + 4, payload.data(), payload.size());
}

inline std::string build_frame(std::string_view payload)
{
    std::string frame;
    frame.reserve(4 + payload.size());
    append_frame(frame, payload);
    return frame;
}

enum class FrameStatus
{
    incomplete, // need more bytes
    ready, // one payload extracted
    invalid // declared length exceeds kMaxFrameBytes
};

struct FrameParseState
{
    std::vector<char> buffer; // accumulated unconsumed bytes
    uint32_t expected_len{0};
    bool have_len{false};

    void feed(const char *data, size_t n) { buffer.insert(buffer.end(), data, data + n); }
};

// Extract at most one payload. Once invalid is returned the stream cannot be resynchronised.
inline FrameStatus try_extract(FrameParseState &st, std::string &out)
{
    if (!st.have_len) {
        if (st.buffer.size() < 4)
            return FrameStatus::incomplete;
        uint32_t net;
        std::memcpy(&net, st.buffer.data(), 4);
        uint32_t len = ntohl(net);
        if (len > kMaxFrameBytes)
            return FrameStatus::invalid;
        st.expected_len = len;
        st.have_len = true;
    }
    if (st.buffer.size() < 4 + static_cast<size_t>(st.expected_len))
        return FrameStatus::incomplete;
    out.assign(st.buffer.data() + 4, st.expected_len);
    st.buffer.erase(st.buffer.begin(), st.buffer.begin() + 4 + st.expected_len);
    st.have_len = false;
    st.expected_len = 0;
    return FrameStatus::ready;
}

} // namespace reef::netutil
