#include "inkforge/libutil/hash.hh"

namespace inkforge {

static const std::string base16Chars = "0123456789abcdef";

std::string Hash::to_string() const
{
    std::string buf;
    buf.reserve(sha256HashSize * 2);
    for (unsigned int i = 0; i < sha256HashSize; i++) {
        buf.push_back(base16Chars[hash[i] >> 4]);
        buf.push_back(base16Chars[hash[i] & 0x0f]);
    }
    return buf;
}


static detail::EvpMdCtxPtr start()
{
    detail::EvpMdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw Error("failed to create message digest context");
    }

    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), NULL)) {
        throw Error("failed to initialize message digest");
    }

    return ctx;
}


static void update(detail::EvpMdCtxPtr & ctx, std::string_view data)
{
    if (!EVP_DigestUpdate(ctx.get(), data.data(), data.size())) {
        throw Error("failed to update message digest with %1% bytes", data.size());
    }
}


static void finish(detail::EvpMdCtxPtr & ctx, unsigned char * hash)
{
    if (!EVP_DigestFinal_ex(ctx.get(), hash, NULL)) {
        throw Error("failed to finalize message digest");
    }
}


Hash hashString(std::string_view s)
{
    Hash hash;
    detail::EvpMdCtxPtr ctx = start();
    update(ctx, s);
    finish(ctx, hash.hash);
    return hash;
}

}
