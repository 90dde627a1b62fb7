//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <string>
#include "catch2/catch.hpp"
#include "ptrk/def.h"
#include "ptrk/types.h"
#include "support/ndebug.h"
#include "support/util.h"
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE("util test", "[util]") {
  // -------------------------------------------------
  // hex to binary
  // -------------------------------------------------
  SECTION("hex2bin") {
    std::string l_hex = "7d8f057f09bd5cc4fc3577603577119728974b9a";
    uint8_t l_buf[20];
    size_t l_buf_len = 0;
    int32_t l_s;
    // -----------------------------------------
    // convert hex to binary
    // -----------------------------------------
    l_s = ns_ptrk::hex2bin(l_buf, l_buf_len, l_hex.c_str(), l_hex.length());
    REQUIRE((l_s == PTRK_STATUS_OK));
    REQUIRE((l_buf_len == 20));
    REQUIRE((l_buf[0] == 0x7d));
    REQUIRE((l_buf[19] == 0x9a));
    // -----------------------------------------
    // convert binary back to hex
    // -----------------------------------------
    char* l_hex_out = nullptr;
    l_s = ns_ptrk::bin2hex(&l_hex_out, l_buf, l_buf_len);
    REQUIRE((l_s == PTRK_STATUS_OK));
    std::string l_cmp = l_hex_out;
    REQUIRE((l_cmp == l_hex));
    if (l_hex_out) {
      free(l_hex_out);
      l_hex_out = nullptr;
    }
    // -----------------------------------------
    // upper case accepted
    // -----------------------------------------
    l_s = ns_ptrk::hex2bin(l_buf, l_buf_len, "ABcd", 4);
    REQUIRE((l_s == PTRK_STATUS_OK));
    REQUIRE((l_buf_len == 2));
    REQUIRE((l_buf[0] == 0xab));
    REQUIRE((l_buf[1] == 0xcd));
  }
  // -------------------------------------------------
  // bad hex
  // -------------------------------------------------
  SECTION("hex2bin invalid") {
    uint8_t l_buf[20];
    size_t l_buf_len = 0;
    REQUIRE((ns_ptrk::hex2bin(l_buf, l_buf_len, "abc", 3) == PTRK_STATUS_ERROR));
    REQUIRE((ns_ptrk::hex2bin(l_buf, l_buf_len, "zz", 2) == PTRK_STATUS_ERROR));
    REQUIRE((ns_ptrk::hex2bin(l_buf, l_buf_len, "", 0) == PTRK_STATUS_ERROR));
  }
  // -------------------------------------------------
  // digest strings
  // -------------------------------------------------
  SECTION("id2str") {
    ns_ptrk::id_t l_id;
    std::string l_hex = "a9993e364706816aba3e25717850c26c9cd0d89d";
    REQUIRE((ns_ptrk::str2id(l_id, l_hex) == PTRK_STATUS_OK));
    REQUIRE((l_id.m_data[0] == 0xa9));
    REQUIRE((ns_ptrk::id2str(l_id) == l_hex));
    REQUIRE((ns_ptrk::str2id(l_id, "a9993e") == PTRK_STATUS_ERROR));
  }
  // -------------------------------------------------
  // read file
  // -------------------------------------------------
  SECTION("read_file") {
    char l_path[] = "/tmp/wb_util_XXXXXX";
    int l_fd = mkstemp(l_path);
    REQUIRE((l_fd >= 0));
    const char l_content[] = "d3:cow3:mooe";
    ssize_t l_w = write(l_fd, l_content, sizeof(l_content) - 1);
    REQUIRE((l_w == (ssize_t)(sizeof(l_content) - 1)));
    close(l_fd);
    char* l_buf = nullptr;
    size_t l_len = 0;
    REQUIRE((ns_ptrk::read_file(l_path, &l_buf, &l_len) == PTRK_STATUS_OK));
    REQUIRE((l_len == sizeof(l_content) - 1));
    REQUIRE((memcmp(l_buf, l_content, l_len) == 0));
    free(l_buf);
    unlink(l_path);
    l_buf = nullptr;
    REQUIRE((ns_ptrk::read_file("/does/not/exist", &l_buf, &l_len) == PTRK_STATUS_ERROR));
  }
}
