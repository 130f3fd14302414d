#include "capsule/codec.hpp"

#include <algorithm>
#include <string>

namespace capsule
{

using namespace bytes;

namespace {

std::unexpected<Error> malformed(std::string_view what)
{
    return fail(errc::storage, std::string("malformed capsule record: ") + std::string(what));
}

} // namespace

buffer_t CapsuleCodec::encode(const Capsule& capsule)
{
    buffer_t out;
    out.reserve(magic.size() + 7 * sizeof(uint32_t) +
                datetime::timestamp_len + datetime::date_len +
                capsule.encapsulated_key.size() + capsule.nonce.size() +
                capsule.ciphertext.size() + capsule.tag.size() + capsule.signature.size());

    out.insert(out.end(), magic.begin(), magic.end());
    append_lp(out, datetime::format_timestamp(capsule.created_at));
    append_lp(out, datetime::format_date(capsule.unlock_date));
    append_lp(out, capsule.encapsulated_key);
    append_lp(out, capsule.nonce);
    append_lp(out, capsule.ciphertext);
    append_lp(out, capsule.tag);
    append_lp(out, capsule.signature);
    return out;
}

Result<Capsule> CapsuleCodec::decode(std::span<const uint8_t> record)
{
    Reader rd(record);

    auto head = rd.read(magic.size());
    if (!head || !std::ranges::equal(*head, magic, {}, {}, [](char c) { return static_cast<uint8_t>(c); }))
    {
        return malformed("bad magic");
    }

    auto created_raw = rd.read_lp();
    auto unlock_raw = rd.read_lp();
    auto kem_ct = rd.read_lp();
    auto nonce = rd.read_lp();
    auto ct = rd.read_lp();
    auto tag = rd.read_lp();
    auto sig = rd.read_lp();

    if (!created_raw || !unlock_raw || !kem_ct || !nonce || !ct || !tag || !sig)
    {
        return malformed("truncated");
    }
    if (!rd.empty())
    {
        return malformed("trailing bytes");
    }
    if (nonce->size() != crypto::AES256GCM::nonce_sz || tag->size() != crypto::AES256GCM::tag_sz)
    {
        return malformed("bad nonce or tag size");
    }

    auto created_at = datetime::parse_timestamp(bytes::to_string(*created_raw));
    auto unlock_date = datetime::parse_date(bytes::to_string(*unlock_raw));
    if (!created_at || !unlock_date)
    {
        return malformed("bad date field");
    }

    Capsule capsule;
    capsule.created_at = *created_at;
    capsule.unlock_date = *unlock_date;
    capsule.encapsulated_key.assign(kem_ct->begin(), kem_ct->end());
    std::ranges::copy(*nonce, capsule.nonce.begin());
    capsule.ciphertext.assign(ct->begin(), ct->end());
    std::ranges::copy(*tag, capsule.tag.begin());
    capsule.signature.assign(sig->begin(), sig->end());
    return capsule;
}

buffer_t CapsuleCodec::associated_data(timestamp_t created_at, date_t unlock_date)
{
    return bytes::to_bytes(datetime::format_timestamp(created_at) + datetime::format_date(unlock_date));
}

buffer_t CapsuleCodec::signing_payload(const Capsule& capsule)
{
    buffer_t out;
    append_lp(out, signing_context);
    append_lp(out, capsule.encapsulated_key);
    append_lp(out, capsule.nonce);
    append_lp(out, capsule.ciphertext);
    append_lp(out, capsule.tag);
    append_lp(out, datetime::format_timestamp(capsule.created_at));
    append_lp(out, datetime::format_date(capsule.unlock_date));
    return out;
}

} // namespace capsule
