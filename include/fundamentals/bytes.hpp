#pragma once
#include <concepts>
#include <bit>
#include <span>
#include <vector>
#include <cstring>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <memory>
#include <type_traits>

namespace bytes
{

using buffer_t = std::vector<uint8_t>;

template<class Ty>
concept byte_like = sizeof(Ty) == 1 && std::is_trivial_v<Ty>;

constexpr auto endify(std::integral auto i)
{
    if constexpr(std::endian::native == std::endian::little)
    {
        return std::byteswap(i);
    }
    else
    {
        return i;
    }
}

// Big-endian read; caller guarantees from.size() >= sizeof(Ty).
template<std::integral Ty = uint32_t, byte_like B>
Ty to_int(std::span<const B> from)
{
    Ty ret = 0;
    std::memcpy(std::addressof(ret), from.data(), sizeof(Ty));
    return endify(ret);
}

template<byte_like To, std::integral From>
void from_int(std::span<To> to, From val)
{
    val = endify(val);
    std::memcpy(to.data(), std::addressof(val), sizeof(From));
}

template<std::integral Ty>
void append_int(buffer_t& out, Ty val)
{
    const auto off = out.size();
    out.resize(off + sizeof(Ty));
    from_int(std::span<uint8_t>(out).subspan(off), val);
}

// u32 big-endian length, then the bytes
inline void append_lp(buffer_t& out, std::span<const uint8_t> field)
{
    append_int(out, static_cast<uint32_t>(field.size()));
    out.insert(out.end(), field.begin(), field.end());
}

inline void append_lp(buffer_t& out, std::string_view field)
{
    append_int(out, static_cast<uint32_t>(field.size()));
    out.insert(out.end(), field.begin(), field.end());
}

inline buffer_t to_bytes(std::string_view sv)
{
    return buffer_t(sv.begin(), sv.end());
}

inline std::string to_string(std::span<const uint8_t> sp)
{
    return std::string(sp.begin(), sp.end());
}

/**
 * Forward-only cursor over a byte span. Every read is bounds-checked and
 * yields nullopt instead of reading past the end.
 */
class Reader
{
public:
    explicit Reader(std::span<const uint8_t> data) : buf(data) {}

    template<std::integral Ty>
    std::optional<Ty> read_int()
    {
        if (buf.size() < sizeof(Ty))
        {
            return std::nullopt;
        }
        Ty val = to_int<Ty>(buf);
        buf = buf.subspan(sizeof(Ty));
        return val;
    }

    std::optional<std::span<const uint8_t>> read(size_t n)
    {
        if (buf.size() < n)
        {
            return std::nullopt;
        }
        auto out = buf.subspan(0, n);
        buf = buf.subspan(n);
        return out;
    }

    std::optional<std::span<const uint8_t>> read_lp()
    {
        auto len = read_int<uint32_t>();
        if (!len)
        {
            return std::nullopt;
        }
        return read(*len);
    }

    [[nodiscard]] size_t remaining() const { return buf.size(); }
    [[nodiscard]] bool empty() const { return buf.empty(); }

private:
    std::span<const uint8_t> buf;
};

} // namespace bytes
