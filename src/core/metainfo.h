#ifndef _PTRK_METAINFO_H
#define _PTRK_METAINFO_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stddef.h>
#include <stdint.h>
#include <string>
#include "ptrk/types.h"
#include "bencode/bencode.h"
namespace ns_ptrk {
//! ----------------------------------------------------------------------------
//! \class metainfo
//! \details piece metadata -piece sizes and expected sha1 per piece id
//! ----------------------------------------------------------------------------
class metainfo {
public:
        // -------------------------------------------------
        // public methods
        // -------------------------------------------------
        metainfo(void);
        ~metainfo(void);
        // -------------------------------------------------
        // init from metainfo (.torrent) file/buffer
        // -------------------------------------------------
        int32_t init(const char* a_file);
        int32_t init(const char* a_buf, size_t a_len);
        // -------------------------------------------------
        // init directly
        // -------------------------------------------------
        int32_t init(uint32_t a_piece_length, uint64_t a_length, const id_vector_t& a_pieces);
        // -------------------------------------------------
        // piece lookups
        // -------------------------------------------------
        int32_t get_piece_hash(piece_id_t a_id, id_t& ao_id) const;
        uint32_t get_piece_size(piece_id_t a_id) const;
        uint64_t get_piece_offset(piece_id_t a_id) const;
        // -------------------------------------------------
        // getters
        // -------------------------------------------------
        bool is_init(void) const { return m_init; }
        const std::string& get_name(void) const { return m_name; }
        uint64_t get_length(void) const { return m_length; }
        uint32_t get_piece_length(void) const { return m_piece_length; }
        size_t get_num_pieces(void) const { return m_pieces.size(); }
        const id_vector_t& get_pieces(void) const { return m_pieces; }
        const files_list_t& get_files(void) const { return m_files; }
        const id_t& get_info_hash(void) const { return m_info_hash; }
private:
        // -------------------------------------------------
        // private methods
        // -------------------------------------------------
        // disallow copy/assign
        metainfo(const metainfo&);
        metainfo& operator=(const metainfo&);
        void reset(void);
        int32_t init(const bdecode& a_be);
        int32_t parse_info(const be_dict_t& a_dict);
        int32_t validate(void);
        // -------------------------------------------------
        // private members
        // -------------------------------------------------
        bool m_init;
        std::string m_name;
        uint64_t m_length;
        uint32_t m_piece_length;
        id_vector_t m_pieces;
        files_list_t m_files;
        id_t m_info_hash;
};
}
#endif
