#ifndef _PTRK_UTIL_H
#define _PTRK_UTIL_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "ptrk/types.h"
#include <stddef.h>
#include <stdint.h>
#include <string>
//! ----------------------------------------------------------------------------
//! methods
//! ----------------------------------------------------------------------------
namespace ns_ptrk
{
int32_t read_file(const char* a_file, char** a_buf, size_t* a_len);
int32_t bin2hex(char** ao_out, const uint8_t* a_bin, size_t a_len);
int32_t bin2hex_str(std::string& ao_out, const uint8_t* a_bin, size_t a_len);
int32_t hex2bin(uint8_t* ao_bin, size_t& ao_bin_len, const char* a_hex, const size_t a_hex_len);
int32_t str2id(id_t& ao_id, const std::string& a_hex);
std::string id2str(const id_t& a_id);
}
#endif
