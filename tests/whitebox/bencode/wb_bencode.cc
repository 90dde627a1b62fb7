//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <string>
#include "bencode/bencode.h"
#include "catch2/catch.hpp"
#include "ptrk/def.h"
#include "support/ndebug.h"
//! ----------------------------------------------------------------------------
//! \details: decode buffer
//! ----------------------------------------------------------------------------
static int32_t _decode(ns_ptrk::bdecode& a_bd, const std::string& a_str)
{
  return a_bd.init(a_str.data(), a_str.length());
}
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE("bencode", "[bencode]") {
  // -------------------------------------------------
  // all types
  // -------------------------------------------------
  SECTION("bdecode types") {
    std::string l_buf = "d3:cow3:moo5:emptyd0:0:e3:inti-17e4:spaml1:a1:bi42ee4:zeroi0ee";
    ns_ptrk::bdecode l_bd;
    int32_t l_s;
    l_s = _decode(l_bd, l_buf);
    REQUIRE((l_s == PTRK_STATUS_OK));
    REQUIRE((l_bd.m_dict.size() == 5));
    std::string l_str;
    REQUIRE((ns_ptrk::bdecode::get_str(l_bd.m_dict, "cow", l_str) == PTRK_STATUS_OK));
    REQUIRE((l_str == "moo"));
    ns_ptrk::be_int_t l_int = 0;
    REQUIRE((ns_ptrk::bdecode::get_int(l_bd.m_dict, "int", l_int) == PTRK_STATUS_OK));
    REQUIRE((l_int == -17));
    REQUIRE((ns_ptrk::bdecode::get_int(l_bd.m_dict, "zero", l_int) == PTRK_STATUS_OK));
    REQUIRE((l_int == 0));
    // -----------------------------------------
    // wrong type
    // -----------------------------------------
    REQUIRE((ns_ptrk::bdecode::get_int(l_bd.m_dict, "cow", l_int) == PTRK_STATUS_ERROR));
    REQUIRE((ns_ptrk::bdecode::find(l_bd.m_dict, "missing", ns_ptrk::BE_OBJ_INT) == nullptr));
    // -----------------------------------------
    // list
    // -----------------------------------------
    const ns_ptrk::be_obj_t* l_obj;
    l_obj = ns_ptrk::bdecode::find(l_bd.m_dict, "spam", ns_ptrk::BE_OBJ_LIST);
    REQUIRE((l_obj != nullptr));
    const ns_ptrk::be_list_t& l_list = *((const ns_ptrk::be_list_t*)l_obj->m_obj);
    REQUIRE((l_list.size() == 3));
    REQUIRE((l_list.front().m_type == ns_ptrk::BE_OBJ_STRING));
    REQUIRE((l_list.back().m_type == ns_ptrk::BE_OBJ_INT));
    REQUIRE((*((const ns_ptrk::be_int_t*)l_list.back().m_obj) == 42));
    // -----------------------------------------
    // encoded span
    // -----------------------------------------
    REQUIRE((std::string(l_obj->m_ptr, l_obj->m_len) == "l1:a1:bi42ee"));
    // -----------------------------------------
    // nested dict w/ empty key/value
    // -----------------------------------------
    l_obj = ns_ptrk::bdecode::find(l_bd.m_dict, "empty", ns_ptrk::BE_OBJ_DICT);
    REQUIRE((l_obj != nullptr));
    const ns_ptrk::be_dict_t& l_dict = *((const ns_ptrk::be_dict_t*)l_obj->m_obj);
    REQUIRE((ns_ptrk::bdecode::get_str(l_dict, "", l_str) == PTRK_STATUS_OK));
    REQUIRE((l_str.empty()));
  }
  // -------------------------------------------------
  // binary strings
  // -------------------------------------------------
  SECTION("bdecode binary") {
    std::string l_buf = "d3:bin4:";
    l_buf += std::string("\x00\xff\x01:", 4);
    l_buf += "e";
    ns_ptrk::bdecode l_bd;
    REQUIRE((_decode(l_bd, l_buf) == PTRK_STATUS_OK));
    std::string l_str;
    REQUIRE((ns_ptrk::bdecode::get_str(l_bd.m_dict, "bin", l_str) == PTRK_STATUS_OK));
    REQUIRE((l_str.length() == 4));
    REQUIRE((l_str[0] == '\0'));
    REQUIRE(((unsigned char)l_str[1] == 0xff));
  }
  // -------------------------------------------------
  // malformed
  // -------------------------------------------------
  SECTION("bdecode invalid") {
    const char* l_bad[] = {
      "",
      "l1:ae",
      "d3:cow",
      "d3:cow3:moo",
      "d3:cow10:mooe",
      "d3:cowi-0ee",
      "d3:cowi03ee",
      "d3:cowiee",
      "d3:cowi1-2ee",
      "d3:cowi12",
      "d3:cowx3:mooe",
      "d3:cow3:moo3:cow3:baae",
      "d3:cowl1:ae",
      "d3cow3:mooe",
      "di1ei2ee",
    };
    for (auto && i_b : l_bad) {
      ns_ptrk::bdecode l_bd;
      std::string l_str = i_b;
      int32_t l_s;
      if (l_str.empty()) {
        l_s = l_bd.init(l_str.data(), 0);
      } else {
        l_s = _decode(l_bd, l_str);
      }
      INFO("input: " << l_str);
      REQUIRE((l_s == PTRK_STATUS_ERROR));
      REQUIRE((l_bd.m_dict.empty()));
    }
  }
  // -------------------------------------------------
  // nesting limit
  // -------------------------------------------------
  SECTION("bdecode depth") {
    std::string l_deep = "d1:a";
    for (int i_d = 0; i_d < 100; ++i_d) { l_deep += "l"; }
    for (int i_d = 0; i_d < 100; ++i_d) { l_deep += "e"; }
    l_deep += "e";
    ns_ptrk::bdecode l_bd;
    REQUIRE((_decode(l_bd, l_deep) == PTRK_STATUS_ERROR));
    std::string l_ok = "d1:alllleeeee";
    ns_ptrk::bdecode l_bd_ok;
    REQUIRE((_decode(l_bd_ok, l_ok) == PTRK_STATUS_OK));
  }
}
