#ifndef _PTRK_SHA1_H
#define _PTRK_SHA1_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "ptrk/def.h"
#include "ptrk/types.h"
#include <stddef.h>
#include <stdint.h>
#include <string.h>
#include <string>
// ---------------------------------------------------------
// openssl
// ---------------------------------------------------------
#include <openssl/evp.h>
namespace ns_ptrk {
//! ----------------------------------------------------------------------------
//! \class sha1
//! \details streaming sha1 -update with each block in order then finish
//! ----------------------------------------------------------------------------
class sha1
{
public:
        // -------------------------------------------------
        // constructor
        // -------------------------------------------------
        sha1():
                m_ctx(nullptr),
                m_finished(false),
                m_error(false),
                m_len(0)
        {
#if OPENSSL_VERSION_NUMBER >= 0x10100000L
                m_ctx = EVP_MD_CTX_new();
#else
                m_ctx = EVP_MD_CTX_create();
#endif
                memset(m_hash, 0, sizeof(m_hash));
                if (!m_ctx ||
                    (EVP_DigestInit_ex(m_ctx, EVP_sha1(), nullptr) != 1))
                {
                        m_error = true;
                }
        }
        // -------------------------------------------------
        // destructor
        // -------------------------------------------------
        ~sha1()
        {
                if (nullptr != m_ctx)
                {
#if OPENSSL_VERSION_NUMBER >= 0x10100000L
                        EVP_MD_CTX_free(m_ctx);
#else
                        EVP_MD_CTX_destroy(m_ctx);
#endif
                }
        }
        // -------------------------------------------------
        // update
        // -------------------------------------------------
        int32_t update(const uint8_t* a_buf, size_t a_len)
        {
                if (m_error ||
                    m_finished)
                {
                        return PTRK_STATUS_ERROR;
                }
                if (!a_len)
                {
                        return PTRK_STATUS_OK;
                }
                if (EVP_DigestUpdate(m_ctx, a_buf, a_len) != 1)
                {
                        m_error = true;
                        return PTRK_STATUS_ERROR;
                }
                m_len += a_len;
                return PTRK_STATUS_OK;
        }
        int32_t update(const uint8_vec_t& a_buf)
        {
                return update(a_buf.data(), a_buf.size());
        }
        // -------------------------------------------------
        // finish
        // -------------------------------------------------
        int32_t finish()
        {
                if (m_error)
                {
                        return PTRK_STATUS_ERROR;
                }
                if (m_finished)
                {
                        return PTRK_STATUS_OK;
                }
                if (EVP_DigestFinal_ex(m_ctx, m_hash, nullptr) != 1)
                {
                        m_error = true;
                        return PTRK_STATUS_ERROR;
                }
                m_finished = true;
                return PTRK_STATUS_OK;
        }
        // -------------------------------------------------
        // copy out digest (finishes if not already)
        // -------------------------------------------------
        int32_t get_id(id_t& ao_id)
        {
                int32_t l_s;
                l_s = finish();
                if (l_s != PTRK_STATUS_OK)
                {
                        return PTRK_STATUS_ERROR;
                }
                memcpy(ao_id.m_data, m_hash, sizeof(ao_id.m_data));
                return PTRK_STATUS_OK;
        }
        // -------------------------------------------------
        // bytes hashed so far
        // -------------------------------------------------
        size_t get_len(void) const { return m_len; }
private:
        // -------------------------------------------------
        // private methods
        // -------------------------------------------------
        sha1(const sha1&);
        sha1& operator=(const sha1&);
        // -------------------------------------------------
        // private members
        // -------------------------------------------------
        EVP_MD_CTX* m_ctx;
        bool m_finished;
        bool m_error;
        size_t m_len;
        uint8_t m_hash[PTRK_SHA1_SIZE];
};
}
#endif
