//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <string.h>
#include <algorithm>
#include <string>
#include "catch2/catch.hpp"
#include "ptrk/def.h"
#include "ptrk/types.h"
#include "support/sha1.h"
#include "support/util.h"
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE("sha1 test", "[sha1]") {
  // -------------------------------------------------
  // FIPS 180 vectors
  // -------------------------------------------------
  SECTION("known digests") {
    ns_ptrk::id_t l_id;
    ns_ptrk::sha1 l_abc;
    REQUIRE((l_abc.update((const uint8_t*)"abc", 3) == PTRK_STATUS_OK));
    REQUIRE((l_abc.get_id(l_id) == PTRK_STATUS_OK));
    REQUIRE((ns_ptrk::id2str(l_id) == "a9993e364706816aba3e25717850c26c9cd0d89d"));
    ns_ptrk::sha1 l_empty;
    REQUIRE((l_empty.get_id(l_id) == PTRK_STATUS_OK));
    REQUIRE((ns_ptrk::id2str(l_id) == "da39a3ee5e6b4b0d3255bfef95601890afd80709"));
    REQUIRE((l_empty.get_len() == 0));
  }
  // -------------------------------------------------
  // streaming
  // -------------------------------------------------
  SECTION("streaming equals one shot") {
    std::string l_msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    ns_ptrk::id_t l_one;
    ns_ptrk::sha1 l_h1;
    REQUIRE((l_h1.update((const uint8_t*)l_msg.data(), l_msg.length()) == PTRK_STATUS_OK));
    REQUIRE((l_h1.get_id(l_one) == PTRK_STATUS_OK));
    REQUIRE((ns_ptrk::id2str(l_one) == "84983e441c3bd26ebaae4aa1f95129e5e54670f1"));
    ns_ptrk::id_t l_str;
    ns_ptrk::sha1 l_h2;
    for (size_t i_c = 0; i_c < l_msg.length(); i_c += 7) {
      size_t l_len = std::min((size_t)7, l_msg.length() - i_c);
      REQUIRE((l_h2.update((const uint8_t*)l_msg.data() + i_c, l_len) == PTRK_STATUS_OK));
    }
    REQUIRE((l_h2.get_len() == l_msg.length()));
    REQUIRE((l_h2.get_id(l_str) == PTRK_STATUS_OK));
    REQUIRE((memcmp(l_one.m_data, l_str.m_data, sizeof(l_one.m_data)) == 0));
    // -----------------------------------------
    // finished -no more updates
    // -----------------------------------------
    REQUIRE((l_h2.update((const uint8_t*)"x", 1) == PTRK_STATUS_ERROR));
  }
}
