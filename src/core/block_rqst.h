#ifndef _PTRK_BLOCK_RQST_H
#define _PTRK_BLOCK_RQST_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "ptrk/types.h"
#include <stdint.h>
#include <utility>
#include <vector>
namespace ns_ptrk {
//! ----------------------------------------------------------------------------
//! internal fwd decl's
//! ----------------------------------------------------------------------------
class piece_tracker;
//! ----------------------------------------------------------------------------
//! \pending_block_rqst
//! \details request sent (off/len within piece) but not yet satisfied
//! ----------------------------------------------------------------------------
typedef struct _pending_block_rqst {
        uint32_t m_off;
        uint32_t m_len;
        _pending_block_rqst():
                m_off(0),
                m_len(0)
        {}
        _pending_block_rqst(uint32_t a_off, uint32_t a_len):
                m_off(a_off),
                m_len(a_len)
        {}
        bool matches(uint32_t a_off, uint32_t a_len) const
        {
                return (m_off == a_off) && (m_len == a_len);
        }
} pending_block_rqst_t;
typedef std::vector<pending_block_rqst_t> pending_block_rqst_vec_t;
//! ----------------------------------------------------------------------------
//! \completed_block_rqst
//! \details block received from peer -owns payload
//! ----------------------------------------------------------------------------
typedef struct _completed_block_rqst {
        uint32_t m_off;
        uint32_t m_len;
        uint8_vec_t m_data;
        _completed_block_rqst():
                m_off(0),
                m_len(0),
                m_data()
        {}
        _completed_block_rqst(uint32_t a_off, uint32_t a_len, const uint8_t* a_buf):
                m_off(a_off),
                m_len(a_len),
                m_data(a_buf, a_buf + a_len)
        {}
        _completed_block_rqst(uint32_t a_off, uint32_t a_len, uint8_vec_t&& a_data):
                m_off(a_off),
                m_len(a_len),
                m_data(std::move(a_data))
        {}
} completed_block_rqst_t;
typedef std::vector<completed_block_rqst_t> completed_block_rqst_vec_t;
//! ----------------------------------------------------------------------------
//! \class validated_piece
//! \details blocks of a piece sorted by offset and proven to match the
//!          expected digest -only populated by piece_tracker::validate
//! ----------------------------------------------------------------------------
class validated_piece {
public:
        validated_piece(void):
                m_id(0),
                m_blocks()
        {}
        piece_id_t get_piece_id(void) const { return m_id; }
        const completed_block_rqst_vec_t& get_blocks(void) const { return m_blocks; }
        // -------------------------------------------------
        // sum of block lengths
        // -------------------------------------------------
        size_t get_len(void) const
        {
                size_t l_len = 0;
                for (auto && i_b : m_blocks)
                {
                        l_len += i_b.m_data.size();
                }
                return l_len;
        }
        // -------------------------------------------------
        // concatenate blocks in order
        // -------------------------------------------------
        void get_data(uint8_vec_t& ao_data) const
        {
                ao_data.clear();
                ao_data.reserve(get_len());
                for (auto && i_b : m_blocks)
                {
                        ao_data.insert(ao_data.end(), i_b.m_data.begin(), i_b.m_data.end());
                }
        }
private:
        friend class piece_tracker;
        piece_id_t m_id;
        completed_block_rqst_vec_t m_blocks;
};
}
#endif
