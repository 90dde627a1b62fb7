#ifndef _PTRK_BENCODE_H
#define _PTRK_BENCODE_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
// ---------------------------------------------------------
// ptrk external
// ---------------------------------------------------------
#include "ptrk/def.h"
// ---------------------------------------------------------
// std libs
// ---------------------------------------------------------
#include <stddef.h>
#include <stdint.h>
#include <list>
#include <map>
#include <string>
namespace ns_ptrk {
//! ----------------------------------------------------------------------------
//! enum
//! ----------------------------------------------------------------------------
typedef enum {
  BE_OBJ_NONE = 0,
  BE_OBJ_STRING,
  BE_OBJ_INT,
  BE_OBJ_LIST,
  BE_OBJ_DICT,
} be_obj_type_t;
//! ----------------------------------------------------------------------------
//! types
//! ----------------------------------------------------------------------------
typedef void* be_obj_ptr_t;
// -----------------------------------------------
// raw obj
// m_ptr/m_len: encoded span of obj within source
// buffer (ie for computing info hash)
// -----------------------------------------------
typedef struct _be_obj {
  be_obj_type_t m_type;
  be_obj_ptr_t m_obj;
  const char* m_ptr;
  size_t m_len;
  _be_obj():
    m_type(BE_OBJ_NONE),
    m_obj(nullptr),
    m_ptr(nullptr),
    m_len(0)
  {}
} be_obj_t;
// -----------------------------------------------
// string -points into decoder buffer
// -----------------------------------------------
typedef struct _be_string {
  const char* m_data;
  size_t m_len;
  _be_string():
    m_data(nullptr),
    m_len(0)
  {}
} be_string_t;
typedef std::map<std::string, be_obj_t> be_dict_t;
typedef std::list<be_obj_t> be_list_t;
typedef int64_t be_int_t;
//! ----------------------------------------------------------------------------
//! \class bdecode
//! \details decodes a bencoded dict (ie metainfo file) -objects reference the
//!          buffer owned by the decoder and are freed with it
//! ----------------------------------------------------------------------------
class bdecode {
 public:
  // -------------------------------------------------
  // public methods
  // -------------------------------------------------
  bdecode(void);
  ~bdecode(void);
  int32_t init(const char* a_file);
  int32_t init(const char* a_buf, size_t a_len);
  // -------------------------------------------------
  // lookups
  // -------------------------------------------------
  static const be_obj_t* find(const be_dict_t& a_dict, const std::string& a_key, be_obj_type_t a_type);
  static int32_t get_int(const be_dict_t& a_dict, const std::string& a_key, be_int_t& ao_int);
  static int32_t get_str(const be_dict_t& a_dict, const std::string& a_key, std::string& ao_str);
  // -------------------------------------------------
  // public members
  // -------------------------------------------------
  be_dict_t m_dict;

 private:
  // -------------------------------------------------
  // private methods
  // -------------------------------------------------
  // disallow copy/assign
  bdecode(const bdecode&);
  bdecode& operator=(const bdecode&);
  int32_t init(void);
  // -------------------------------------------------
  // parsing
  // -------------------------------------------------
  int32_t parse_obj(be_obj_t& ao_obj, uint32_t a_depth);
  int32_t parse_dict(be_dict_t& ao_dict, uint32_t a_depth);
  int32_t parse_string(be_string_t& ao_string);
  int32_t parse_list(be_list_t& ao_list, uint32_t a_depth);
  int32_t parse_int(be_int_t& ao_int);
  int32_t parse_len(size_t& ao_len);
  size_t left(void) const { return m_buf_len - m_cur_off; }
  // -------------------------------------------------
  // private members
  // -------------------------------------------------
  char* m_buf;
  size_t m_buf_len;
  // -------------------------------------------------
  // parsing
  // -------------------------------------------------
  size_t m_cur_off;
  const char* m_cur_ptr;
};
}  // namespace ns_ptrk
#endif
