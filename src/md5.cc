/*/////////////////////////////////////////////////////////////////////////////
/// @summary Implements the streaming MD5 accumulator on top of the OpenSSL
/// EVP digest interface.
///////////////////////////////////////////////////////////////////////////80*/

/*////////////////
//   Includes   //
////////////////*/
#include <openssl/evp.h>

#include "uringsum/common.h"
#include "uringsum/bridge.h"
#include "uringsum/md5.h"

static_assert(MD5_DIGEST_SIZE == URINGSUM_DIGEST_SIZE, "result digest size must match MD5");

/*////////////////////////
//   Public Functions   //
////////////////////////*/
md5_accumulator_t::md5_accumulator_t(void)
    :
    Context(EVP_MD_CTX_new()),
    Finalized(false)
{
    if (Context != NULL && EVP_DigestInit_ex(Context, EVP_md5(), NULL) != 1)
    {   // leave the accumulator closed; update() and finalize() will fail.
        EVP_MD_CTX_free(Context);
        Context = NULL;
    }
}

md5_accumulator_t::~md5_accumulator_t(void)
{
    if (Context != NULL) EVP_MD_CTX_free(Context);
    Context = NULL;
}

md5_accumulator_t::md5_accumulator_t(md5_accumulator_t &&other)
    :
    Context(other.Context),
    Finalized(other.Finalized)
{
    other.Context   = NULL;
    other.Finalized = false;
}

md5_accumulator_t& md5_accumulator_t::operator =(md5_accumulator_t &&other)
{
    if (this != &other)
    {
        if (Context != NULL) EVP_MD_CTX_free(Context);
        Context         = other.Context;
        Finalized       = other.Finalized;
        other.Context   = NULL;
        other.Finalized = false;
    }
    return *this;
}

bool md5_accumulator_t::reset(void)
{
    if (Context == NULL)
    {   // construction failed, or the context was moved out.
        if ((Context = EVP_MD_CTX_new()) == NULL)
            return false;
    }
    if (EVP_DigestInit_ex(Context, EVP_md5(), NULL) != 1)
        return false;
    Finalized = false;
    return true;
}

bool md5_accumulator_t::update(void const *data, size_t size)
{
    if (is_open() == false)
        return false;
    if (size == 0)
        return true;
    return (EVP_DigestUpdate(Context, data, size) == 1);
}

bool md5_accumulator_t::finalize(uint8_t digest[MD5_DIGEST_SIZE])
{
    unsigned int size = 0;
    if (is_open() == false)
        return false;
    Finalized = true;
    if (EVP_DigestFinal_ex(Context, digest, &size) != 1)
        return false;
    return (size == MD5_DIGEST_SIZE);
}

bool md5_buffer(void const *data, size_t size, uint8_t digest[MD5_DIGEST_SIZE])
{
    md5_accumulator_t md5;
    if (md5.update(data, size) == false)
        return false;
    return md5.finalize(digest);
}

char* md5_format_hex(uint8_t const digest[MD5_DIGEST_SIZE], char hex[MD5_HEX_SIZE])
{
    static char const DIGITS[] = "0123456789abcdef";
    for (size_t i = 0; i < MD5_DIGEST_SIZE; ++i)
    {
        hex[i * 2 + 0] = DIGITS[(digest[i] >> 4) & 0x0F];
        hex[i * 2 + 1] = DIGITS[(digest[i] >> 0) & 0x0F];
    }
    hex[MD5_DIGEST_SIZE * 2] = '\0';
    return hex;
}
