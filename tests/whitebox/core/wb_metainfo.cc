//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <string.h>
#include <string>
#include "catch2/catch.hpp"
#include "ptrk/def.h"
#include "ptrk/types.h"
#include "core/metainfo.h"
#include "support/sha1.h"
#include "support/util.h"
//! ----------------------------------------------------------------------------
//! \details: sha1 of buffer
//! ----------------------------------------------------------------------------
static ns_ptrk::id_t _hash(const char* a_buf, size_t a_len)
{
  ns_ptrk::id_t l_id;
  memset(l_id.m_data, 0, sizeof(l_id.m_data));
  ns_ptrk::sha1 l_sha1;
  l_sha1.update((const uint8_t*)a_buf, a_len);
  l_sha1.get_id(l_id);
  return l_id;
}
//! ----------------------------------------------------------------------------
//! \details: raw digest string for "pieces"
//! ----------------------------------------------------------------------------
static std::string _raw(const ns_ptrk::id_t& a_id)
{
  return std::string((const char*)a_id.m_data, sizeof(a_id.m_data));
}
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE("metainfo", "[metainfo]") {
  // -------------------------------------------------
  // direct
  // -------------------------------------------------
  SECTION("direct init") {
    ns_ptrk::id_vector_t l_pieces(3);
    for (size_t i_p = 0; i_p < l_pieces.size(); ++i_p) {
      memset(l_pieces[i_p].m_data, (int)i_p + 1, sizeof(l_pieces[i_p].m_data));
    }
    ns_ptrk::metainfo l_mi;
    REQUIRE((l_mi.init(16384, 40000, l_pieces) == PTRK_STATUS_OK));
    REQUIRE((l_mi.is_init()));
    REQUIRE((l_mi.get_num_pieces() == 3));
    REQUIRE((l_mi.get_piece_size(0) == 16384));
    REQUIRE((l_mi.get_piece_size(1) == 16384));
    REQUIRE((l_mi.get_piece_size(2) == 40000 - 2*16384));
    REQUIRE((l_mi.get_piece_size(3) == 0));
    REQUIRE((l_mi.get_piece_offset(2) == 32768));
    ns_ptrk::id_t l_id;
    REQUIRE((l_mi.get_piece_hash(1, l_id) == PTRK_STATUS_OK));
    REQUIRE((memcmp(l_id.m_data, l_pieces[1].m_data, sizeof(l_id.m_data)) == 0));
    REQUIRE((l_mi.get_piece_hash(3, l_id) == PTRK_STATUS_ERROR));
    // -----------------------------------------
    // exact multiple -last piece full
    // -----------------------------------------
    ns_ptrk::id_vector_t l_two(l_pieces.begin(), l_pieces.begin() + 2);
    REQUIRE((l_mi.init(16384, 32768, l_two) == PTRK_STATUS_OK));
    REQUIRE((l_mi.get_piece_size(1) == 16384));
  }
  // -------------------------------------------------
  // direct w/ bad values
  // -------------------------------------------------
  SECTION("direct init invalid") {
    ns_ptrk::id_vector_t l_pieces(2);
    ns_ptrk::metainfo l_mi;
    REQUIRE((l_mi.init(0, 100, l_pieces) == PTRK_STATUS_ERROR));
    REQUIRE((l_mi.init(16384, 100, l_pieces) == PTRK_STATUS_ERROR));
    REQUIRE((l_mi.init(16384, 40000, l_pieces) == PTRK_STATUS_ERROR));
    REQUIRE((l_mi.is_init() == false));
    REQUIRE((l_mi.get_num_pieces() == 0));
  }
  // -------------------------------------------------
  // single file torrent
  // -------------------------------------------------
  SECTION("bdecode single file") {
    ns_ptrk::id_t l_p0 = _hash("a", 1);
    ns_ptrk::id_t l_p1 = _hash("b", 1);
    std::string l_info;
    l_info += "d6:lengthi20000e4:name8:test.bin12:piece lengthi16384e6:pieces40:";
    l_info += _raw(l_p0);
    l_info += _raw(l_p1);
    l_info += "e";
    std::string l_buf = "d8:announce14:http://tracker4:info" + l_info + "e";
    ns_ptrk::metainfo l_mi;
    REQUIRE((l_mi.init(l_buf.data(), l_buf.length()) == PTRK_STATUS_OK));
    REQUIRE((l_mi.get_name() == "test.bin"));
    REQUIRE((l_mi.get_length() == 20000));
    REQUIRE((l_mi.get_piece_length() == 16384));
    REQUIRE((l_mi.get_num_pieces() == 2));
    REQUIRE((l_mi.get_piece_size(1) == 3616));
    REQUIRE((l_mi.get_files().empty()));
    ns_ptrk::id_t l_id;
    REQUIRE((l_mi.get_piece_hash(1, l_id) == PTRK_STATUS_OK));
    REQUIRE((ns_ptrk::id2str(l_id) == ns_ptrk::id2str(l_p1)));
    // -----------------------------------------
    // info hash over encoded info dict
    // -----------------------------------------
    ns_ptrk::id_t l_ih = _hash(l_info.data(), l_info.length());
    REQUIRE((ns_ptrk::id2str(l_mi.get_info_hash()) == ns_ptrk::id2str(l_ih)));
  }
  // -------------------------------------------------
  // multi file torrent
  // -------------------------------------------------
  SECTION("bdecode multi file") {
    std::string l_buf;
    l_buf += "d4:infod5:filesl";
    l_buf += "d6:lengthi100e4:pathl1:a5:b.binee";
    l_buf += "d6:lengthi50e4:pathl1:cee";
    l_buf += "e4:name3:dir12:piece lengthi16384e6:pieces20:";
    l_buf += _raw(_hash("x", 1));
    l_buf += "ee";
    ns_ptrk::metainfo l_mi;
    REQUIRE((l_mi.init(l_buf.data(), l_buf.length()) == PTRK_STATUS_OK));
    REQUIRE((l_mi.get_length() == 150));
    REQUIRE((l_mi.get_num_pieces() == 1));
    REQUIRE((l_mi.get_piece_size(0) == 150));
    REQUIRE((l_mi.get_files().size() == 2));
    const ns_ptrk::files_t& l_f = l_mi.get_files().front();
    REQUIRE((l_f.m_len == 100));
    REQUIRE((l_f.m_path.size() == 2));
    REQUIRE((l_f.m_path.back() == "b.bin"));
  }
  // -------------------------------------------------
  // malformed
  // -------------------------------------------------
  SECTION("bdecode invalid") {
    ns_ptrk::metainfo l_mi;
    std::string l_raw = _raw(_hash("a", 1));
    // missing info
    std::string l_buf = "d4:name3:abce";
    REQUIRE((l_mi.init(l_buf.data(), l_buf.length()) == PTRK_STATUS_ERROR));
    // pieces not multiple of 20
    l_buf = "d4:infod6:lengthi10e12:piece lengthi16384e6:pieces3:abcee";
    REQUIRE((l_mi.init(l_buf.data(), l_buf.length()) == PTRK_STATUS_ERROR));
    // piece length 0
    l_buf = "d4:infod6:lengthi10e12:piece lengthi0e6:pieces20:" + l_raw + "ee";
    REQUIRE((l_mi.init(l_buf.data(), l_buf.length()) == PTRK_STATUS_ERROR));
    // digest count != ceil(length/piece length)
    l_buf = "d4:infod6:lengthi20000e12:piece lengthi16384e6:pieces20:" + l_raw + "ee";
    REQUIRE((l_mi.init(l_buf.data(), l_buf.length()) == PTRK_STATUS_ERROR));
    // no length or files
    l_buf = "d4:infod12:piece lengthi16384e6:pieces20:" + l_raw + "ee";
    REQUIRE((l_mi.init(l_buf.data(), l_buf.length()) == PTRK_STATUS_ERROR));
    // truncated
    l_buf = "d4:infod6:lengthi10e";
    REQUIRE((l_mi.init(l_buf.data(), l_buf.length()) == PTRK_STATUS_ERROR));
    REQUIRE((l_mi.is_init() == false));
    // missing file
    REQUIRE((l_mi.init("/does/not/exist.torrent") == PTRK_STATUS_ERROR));
  }
  // -------------------------------------------------
  // malformed "files" entries
  // -------------------------------------------------
  SECTION("bdecode invalid files") {
    std::string l_tail = "e4:name3:dir12:piece lengthi16384e6:pieces20:" + _raw(_hash("x", 1)) + "ee";
    const char* l_bad[] = {
      // escapes directory
      "d6:lengthi10e4:pathl2:..1:aee",
      // empty element
      "d6:lengthi10e4:pathl0:1:aee",
      // separator in element
      "d6:lengthi10e4:pathl6:../etcee",
      // empty path
      "d6:lengthi10e4:pathlee",
      // missing path
      "d6:lengthi10ee",
      // path element not a string
      "d6:lengthi10e4:pathli1eee",
      // entry not a dict
      "i10e",
    };
    for (auto && i_b : l_bad) {
      std::string l_buf = "d4:infod5:filesl" + std::string(i_b) + l_tail;
      INFO("files entry: " << i_b);
      ns_ptrk::metainfo l_mi;
      REQUIRE((l_mi.init(l_buf.data(), l_buf.length()) == PTRK_STATUS_ERROR));
      REQUIRE((l_mi.is_init() == false));
    }
    // -----------------------------------------
    // nested path ok
    // -----------------------------------------
    std::string l_ok = "d4:infod5:filesld6:lengthi10e4:pathl3:sub5:a.binee" + l_tail;
    ns_ptrk::metainfo l_mi;
    REQUIRE((l_mi.init(l_ok.data(), l_ok.length()) == PTRK_STATUS_OK));
    REQUIRE((l_mi.get_files().front().m_path.size() == 2));
  }
}
