//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
// ---------------------------------------------------------
// internal
// ---------------------------------------------------------
#include "ptrk/def.h"
#include "support/util.h"
#include "support/trace.h"
#include "support/ndebug.h"
// ---------------------------------------------------------
// std libs
// ---------------------------------------------------------
#include <stdio.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <ctype.h>
#include <errno.h>
#include <sys/types.h>
#include <sys/stat.h>
//! ----------------------------------------------------------------------------
//! globals
//! ----------------------------------------------------------------------------
char g_ptrk_err_msg[PTRK_ERR_LEN] = "";
namespace ns_ptrk
{
//! ----------------------------------------------------------------------------
//! \details: read entire file into newly allocated buffer (caller frees)
//! \return:  PTRK_STATUS_OK on success
//! \param:   a_file path
//! \param:   a_buf  output buffer (null terminated)
//! \param:   a_len  output length (excluding terminator)
//! ----------------------------------------------------------------------------
int32_t read_file(const char *a_file, char **a_buf, size_t *a_len)
{
        if (!a_file ||
            !a_buf ||
            !a_len)
        {
                return PTRK_STATUS_ERROR;
        }
        struct stat l_stat;
        int32_t l_status = PTRK_STATUS_OK;
        l_status = stat(a_file, &l_stat);
        if (l_status != 0)
        {
                PTRK_PERROR("error performing stat on file: %s.  Reason: %s", a_file, strerror(errno));
                return PTRK_STATUS_ERROR;
        }
        if (!(l_stat.st_mode & S_IFREG))
        {
                PTRK_PERROR("error opening file: %s.  Reason: is NOT a regular file", a_file);
                return PTRK_STATUS_ERROR;
        }
        FILE * l_file;
        l_file = fopen(a_file,"r");
        if (NULL == l_file)
        {
                PTRK_PERROR("error opening file: %s.  Reason: %s", a_file, strerror(errno));
                return PTRK_STATUS_ERROR;
        }
        size_t l_size = (size_t)l_stat.st_size;
        char *l_buf;
        l_buf = (char *)malloc(sizeof(char)*l_size+1);
        if (!l_buf)
        {
                PTRK_PERROR("error allocating %zu bytes for file: %s", l_size, a_file);
                fclose(l_file);
                return PTRK_STATUS_ERROR;
        }
        size_t l_read_size;
        l_read_size = fread(l_buf, 1, l_size, l_file);
        if (l_read_size != l_size)
        {
                PTRK_PERROR("error performing fread.  Reason: %s [%zu:%zu]", strerror(errno), l_read_size, l_size);
                free(l_buf);
                fclose(l_file);
                return PTRK_STATUS_ERROR;
        }
        l_buf[l_size] = '\0';
        l_status = fclose(l_file);
        if (PTRK_STATUS_OK != l_status)
        {
                PTRK_PERROR("error performing fclose.  Reason: %s", strerror(errno));
                free(l_buf);
                return PTRK_STATUS_ERROR;
        }
        *a_buf = l_buf;
        *a_len = l_size;
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bin2hex(char** ao_out, const uint8_t* a_bin, size_t a_len)
{
        if ((a_bin == NULL) ||
            (a_len == 0))
        {
                return PTRK_STATUS_ERROR;
        }
        // -------------------------------------------------
        // alloc
        // -------------------------------------------------
        *ao_out = (char*)malloc(a_len*2+1);
        if (!*ao_out)
        {
                return PTRK_STATUS_ERROR;
        }
        // -------------------------------------------------
        // set
        // -------------------------------------------------
        char* l_out = *ao_out;
        size_t j = 0;
        for (size_t i=0; i < a_len; ++i, j+=2)
        {
                l_out[j]   = "0123456789abcdef"[a_bin[i] >> 4];
                l_out[j+1] = "0123456789abcdef"[a_bin[i] & 0x0F];
        }
        l_out[a_len*2] = '\0';
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bin2hex_str(std::string& ao_out, const uint8_t* a_bin, size_t a_len)
{
        char* l_buf = nullptr;
        int32_t l_s = 0;
        l_s = bin2hex(&l_buf, a_bin, a_len);
        if (l_s != PTRK_STATUS_OK)
        {
                if (l_buf) { free(l_buf); l_buf = nullptr; }
                return PTRK_STATUS_ERROR;
        }
        ao_out.assign(l_buf);
        if (l_buf) { free(l_buf); l_buf = nullptr; }
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: decode hex string -ao_bin must hold a_hex_len/2 bytes
//! \return:  PTRK_STATUS_OK on success
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t hex2bin(uint8_t* ao_bin,
                size_t& ao_bin_len,
                const char* a_hex,
                const size_t a_hex_len)
{
        if ((ao_bin == NULL) ||
            (a_hex == NULL) ||
            (a_hex_len == 0) ||
            (a_hex_len % 2))
        {
                return PTRK_STATUS_ERROR;
        }
        ao_bin_len = 0;
#define _HEX_TO_INT(_c) (uint8_t)(((_c) & 0xf) + ((_c) >> 6) * 9)
        const char* l_hex = a_hex;
        for (size_t i=0; i < a_hex_len; i+=2)
        {
                if (!isxdigit((unsigned char)l_hex[0]) ||
                    !isxdigit((unsigned char)l_hex[1]))
                {
                        return PTRK_STATUS_ERROR;
                }
                uint8_t l_hi = _HEX_TO_INT(l_hex[0]);
                uint8_t l_lo = _HEX_TO_INT(l_hex[1]);
                ao_bin[ao_bin_len] = (l_hi << 4) | l_lo;
                l_hex += 2;
                ++ao_bin_len;
        }
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: 40 char hex -> digest
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t str2id(id_t& ao_id, const std::string& a_hex)
{
        if (a_hex.length() != PTRK_SHA1_SIZE_HEX)
        {
                return PTRK_STATUS_ERROR;
        }
        size_t l_len = 0;
        return hex2bin(ao_id.m_data, l_len, a_hex.c_str(), a_hex.length());
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string id2str(const id_t& a_id)
{
        std::string l_str;
        int32_t l_s_b2;
        l_s_b2 = bin2hex_str(l_str, a_id.m_data, sizeof(a_id));
        UNUSED(l_s_b2);
        return l_str;
}
}
