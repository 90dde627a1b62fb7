#ifndef _PTRK_PIECE_TRACKER_H
#define _PTRK_PIECE_TRACKER_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "ptrk/def.h"
#include "ptrk/types.h"
#include "core/block_rqst.h"
#include <stddef.h>
#include <stdint.h>
namespace ns_ptrk {
//! ----------------------------------------------------------------------------
//! internal fwd decl's
//! ----------------------------------------------------------------------------
class metainfo;
//! ----------------------------------------------------------------------------
//! \class piece_tracker
//! \details download state of a single piece:
//!   - schedules block requests into a bounded window
//!   - matches completed blocks against pending requests
//!   - validates reassembled piece against expected sha1
//!   owned by a single driver -no locking.
//! ----------------------------------------------------------------------------
class piece_tracker {
public:
        // -------------------------------------------------
        // types
        // -------------------------------------------------
        typedef enum {
                STATE_ACTIVE = 0,
                STATE_CONSUMED
        } state_t;
        // -------------------------------------------------
        // public methods
        // -------------------------------------------------
        piece_tracker(piece_id_t a_id,
                      uint32_t a_piece_size,
                      uint32_t a_block_size = PTRK_BLOCK_SIZE,
                      uint32_t a_max_pending = PTRK_MAX_PENDING_RQSTS);
        ~piece_tracker(void);
        // -------------------------------------------------
        // scheduling
        // -------------------------------------------------
        int32_t next_rqsts(pending_block_rqst_vec_t& ao_vec);
        // -------------------------------------------------
        // completion
        // -------------------------------------------------
        int32_t complete(completed_block_rqst_t& a_rqst, bool& ao_done);
        // -------------------------------------------------
        // stale request replacement (driver timeouts)
        // -------------------------------------------------
        int32_t rm_pending(uint32_t a_off, uint32_t a_len);
        int32_t add_pending(uint32_t a_off, uint32_t a_len);
        // -------------------------------------------------
        // validation -consumes tracker
        // -------------------------------------------------
        int32_t validate(validated_piece& ao_piece, const metainfo& a_metainfo);
        // -------------------------------------------------
        // getters
        // -------------------------------------------------
        piece_id_t get_piece_id(void) const { return m_id; }
        uint32_t get_piece_size(void) const { return m_piece_size; }
        uint32_t get_block_size(void) const { return m_block_size; }
        uint32_t get_max_pending(void) const { return m_max_pending; }
        uint32_t get_offset(void) const { return m_offset; }
        uint32_t get_remaining(void) const { return m_remaining; }
        state_t get_state(void) const { return m_state; }
        bool is_done(void) const { return (m_remaining == 0); }
        const pending_block_rqst_vec_t& get_pending(void) const { return m_pending; }
        const completed_block_rqst_vec_t& get_completed(void) const { return m_completed; }
        // -------------------------------------------------
        // stats
        // -------------------------------------------------
        uint64_t get_stat_num_blocks_rqstd(void) const { return m_stat_num_blocks_rqstd; }
        uint64_t get_stat_num_blocks_recvd(void) const { return m_stat_num_blocks_recvd; }
        uint64_t get_stat_num_blocks_rejected(void) const { return m_stat_num_blocks_rejected; }
        uint64_t get_stat_num_blocks_removed(void) const { return m_stat_num_blocks_removed; }
private:
        // -------------------------------------------------
        // private methods
        // -------------------------------------------------
        // -------------------------------------------------
        // disallow copy/assign
        // -------------------------------------------------
        piece_tracker(const piece_tracker&);
        piece_tracker& operator=(const piece_tracker&);
        int32_t next_rqst(pending_block_rqst_t& ao_rqst);
        int32_t check_active(const char* a_op) const;
        pending_block_rqst_vec_t::iterator find_pending(uint32_t a_off, uint32_t a_len);
        bool has_completed(uint32_t a_off, uint32_t a_len) const;
        // -------------------------------------------------
        // private members
        // -------------------------------------------------
        piece_id_t m_id;
        uint32_t m_piece_size;
        uint32_t m_block_size;
        uint32_t m_max_pending;
        // -------------------------------------------------
        // bytes scheduled so far
        // -------------------------------------------------
        uint32_t m_offset;
        // -------------------------------------------------
        // bytes not yet completed
        // -------------------------------------------------
        uint32_t m_remaining;
        state_t m_state;
        pending_block_rqst_vec_t m_pending;
        completed_block_rqst_vec_t m_completed;
        // -------------------------------------------------
        // stats
        // -------------------------------------------------
        uint64_t m_stat_num_blocks_rqstd;
        uint64_t m_stat_num_blocks_recvd;
        uint64_t m_stat_num_blocks_rejected;
        uint64_t m_stat_num_blocks_removed;
};
}
#endif
