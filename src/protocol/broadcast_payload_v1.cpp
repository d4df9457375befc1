#include "markerlink/protocol/broadcast_payload_v1.hpp"

#include <charconv>
#include <cstring>

#include <FrameKit/Debug/Log.h>

namespace markerlink::protocol {

    namespace {

        std::string_view FirstSegment(std::string_view payload) {
            size_t pos = 0;
            while (pos < payload.size()) {
                const size_t end = payload.find(kTokenDelimiter, pos);
                const size_t stop = (end == std::string_view::npos) ? payload.size() : end;
                if (stop > pos) return payload.substr(pos, stop - pos);
                pos = stop + 1;
            }
            return {};
        }

        bool IsBlank(char c) {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n';
        }

        // Surrounding whitespace and a leading '+' are accepted.
        bool ParseInt32(std::string_view text, int32_t& out) {
            while (!text.empty() && IsBlank(text.front())) text.remove_prefix(1);
            while (!text.empty() && IsBlank(text.back())) text.remove_suffix(1);

            const char* first = text.data();
            const char* last = text.data() + text.size();
            if (first != last && *first == '+') {
                ++first;
                if (first != last && *first == '-') return false;
            }
            if (first == last) return false;

            int32_t v = 0;
            const auto r = std::from_chars(first, last, v, 10);
            if (r.ec != std::errc() || r.ptr != last) return false;

            out = v;
            return true;
        }

    } // namespace

    std::string EncodeMarkerToken(int32_t token)
    {
        std::string s;
        s.reserve(13);
        s.push_back(kTokenDelimiter);
        s.append(std::to_string(token));
        s.push_back(kTokenDelimiter);
        return s;
    }

    bool DecodeMarkerToken(std::string_view payload, int32_t& out)
    {
        const std::string_view seg = FirstSegment(payload);
        if (seg.empty()) return false;

        if (!ParseInt32(seg, out)) {
            FK_WARN("[Codec] Error parsing broadcast data: '{}'", std::string(seg));
            return false;
        }
        return true;
    }

    void EncodeDiscoveryPayload(const DiscoveryPreambleV1& preamble, std::string_view text,
        std::vector<uint8_t>& out)
    {
        out.resize(sizeof(DiscoveryPreambleV1) + text.size());
        std::memcpy(out.data(), &preamble, sizeof(DiscoveryPreambleV1));
        if (!text.empty()) {
            std::memcpy(out.data() + sizeof(DiscoveryPreambleV1), text.data(), text.size());
        }
    }

    bool DecodeDiscoveryPayload(const uint8_t* data, size_t size,
        DiscoveryPreambleV1& out_preamble, std::string& out_text)
    {
        if (!data || size < sizeof(DiscoveryPreambleV1)) return false;

        std::memcpy(&out_preamble, data, sizeof(DiscoveryPreambleV1));
        out_text.assign(reinterpret_cast<const char*>(data) + sizeof(DiscoveryPreambleV1),
            size - sizeof(DiscoveryPreambleV1));
        return true;
    }

} // namespace markerlink::protocol
