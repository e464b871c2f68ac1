#include <algorithm>

#include "proto/envelope.hpp"
#include "util/log.hpp"

namespace envelope
{

static Bytes::iterator find_seq(Bytes::iterator first, Bytes::iterator last, std::string_view s)
{
    return std::search(first, last, s.begin(), s.end(),
                       [](std::uint8_t a, char b) { return a == static_cast<std::uint8_t>(b); });
}

Bytes wrap(const Bytes &body, std::string_view start, std::string_view end)
{
    Bytes out;
    out.reserve(start.size() + body.size() + end.size());
    out.insert(out.end(), start.begin(), start.end());
    out.insert(out.end(), body.begin(), body.end());
    out.insert(out.end(), end.begin(), end.end());
    return out;
}

std::optional<Bytes> take_message(Bytes &buf, std::string_view start, std::string_view end)
{
    if (start.empty() || end.empty())
        return std::nullopt;

    auto s = find_seq(buf.begin(), buf.end(), start);
    if (s == buf.end())
    {
        // keep a tail that could be the beginning of a split start sentinel
        const std::size_t keep = std::min(buf.size(), start.size() - 1);
        if (buf.size() > keep)
        {
            LOG_DEBUG("take_message: dropping %zu bytes without start sentinel",
                      buf.size() - keep);
            buf.erase(buf.begin(), buf.end() - static_cast<std::ptrdiff_t>(keep));
        }
        return std::nullopt;
    }
    if (s != buf.begin())
    {
        LOG_DEBUG("take_message: dropping %zu bytes before start sentinel",
                  static_cast<std::size_t>(s - buf.begin()));
        buf.erase(buf.begin(), s);
    }

    const auto body_begin = buf.begin() + static_cast<std::ptrdiff_t>(start.size());
    auto       e          = find_seq(body_begin, buf.end(), end);
    if (e == buf.end())
        return std::nullopt;  // not complete yet

    Bytes body(body_begin, e);
    buf.erase(buf.begin(), e + static_cast<std::ptrdiff_t>(end.size()));
    return body;
}

}  // namespace envelope
