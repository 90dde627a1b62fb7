//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "ptrk/def.h"
#include "support/trace.h"
#include "support/ndebug.h"
#include "support/sha1.h"
#include "support/util.h"
#include "core/metainfo.h"
#include "core/piece_tracker.h"
#include <string.h>
#include <algorithm>
#include <utility>
namespace ns_ptrk {
//! ----------------------------------------------------------------------------
//! \details: order completed blocks by offset
//! ----------------------------------------------------------------------------
static bool _cmp_off(const completed_block_rqst_t& a_lhs,
                     const completed_block_rqst_t& a_rhs)
{
        return a_lhs.m_off < a_rhs.m_off;
}
//! ----------------------------------------------------------------------------
//! \details: zero block size or window falls back to defaults
//! \return:  NA
//! \param:   a_id          piece id (index into metainfo pieces)
//! \param:   a_piece_size  length of piece in bytes
//! \param:   a_block_size  request length
//! \param:   a_max_pending window capacity
//! ----------------------------------------------------------------------------
piece_tracker::piece_tracker(piece_id_t a_id,
                             uint32_t a_piece_size,
                             uint32_t a_block_size,
                             uint32_t a_max_pending):
        m_id(a_id),
        m_piece_size(a_piece_size),
        m_block_size(a_block_size),
        m_max_pending(a_max_pending),
        m_offset(0),
        m_remaining(a_piece_size),
        m_state(STATE_ACTIVE),
        m_pending(),
        m_completed(),
        m_stat_num_blocks_rqstd(0),
        m_stat_num_blocks_recvd(0),
        m_stat_num_blocks_rejected(0),
        m_stat_num_blocks_removed(0)
{
        if (!m_block_size)
        {
                TRC_WARN("[PIECE: %u] block size == 0 -using default: %u", m_id, PTRK_BLOCK_SIZE);
                m_block_size = PTRK_BLOCK_SIZE;
        }
        if (!m_max_pending)
        {
                TRC_WARN("[PIECE: %u] max pending == 0 -using default: %u", m_id, PTRK_MAX_PENDING_RQSTS);
                m_max_pending = PTRK_MAX_PENDING_RQSTS;
        }
        m_pending.reserve(m_max_pending);
        m_completed.reserve((m_piece_size / m_block_size) + 1);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
piece_tracker::~piece_tracker(void)
{
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t piece_tracker::check_active(const char* a_op) const
{
        if (m_state != STATE_ACTIVE)
        {
                TRC_ERROR("[PIECE: %u] %s called on consumed piece tracker", m_id, a_op);
                return PTRK_STATUS_ERROR;
        }
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: next block boundary -full block while more than a block
//!           remains unscheduled, then the (possibly short) remainder
//! \return:  PTRK_STATUS_OK if block set
//!           PTRK_STATUS_DONE if all bytes scheduled
//! \param:   ao_rqst block
//! ----------------------------------------------------------------------------
int32_t piece_tracker::next_rqst(pending_block_rqst_t& ao_rqst)
{
        uint32_t l_remaining = m_piece_size - m_offset;
        if (l_remaining > m_block_size)
        {
                ao_rqst.m_off = m_offset;
                ao_rqst.m_len = m_block_size;
                m_offset += m_block_size;
                return PTRK_STATUS_OK;
        }
        // -------------------------------------------------
        // last block
        // -------------------------------------------------
        if (l_remaining > 0)
        {
                ao_rqst.m_off = m_offset;
                ao_rqst.m_len = l_remaining;
                m_offset += l_remaining;
                return PTRK_STATUS_OK;
        }
        return PTRK_STATUS_DONE;
}
//! ----------------------------------------------------------------------------
//! \details: refill request window
//! \return:  PTRK_STATUS_OK on success
//! \param:   ao_vec newly created requests are appended (only those)
//! ----------------------------------------------------------------------------
int32_t piece_tracker::next_rqsts(pending_block_rqst_vec_t& ao_vec)
{
        int32_t l_s;
        l_s = check_active("next_rqsts");
        if (l_s != PTRK_STATUS_OK)
        {
                return PTRK_STATUS_ERROR;
        }
        // TODO: size window from observed peer throughput
        while (m_pending.size() < m_max_pending)
        {
                pending_block_rqst_t l_br;
                l_s = next_rqst(l_br);
                if (l_s == PTRK_STATUS_DONE)
                {
                        break;
                }
                m_pending.push_back(l_br);
                ao_vec.push_back(l_br);
                ++m_stat_num_blocks_rqstd;
                TRC_VERBOSE("[PIECE: %u] REQUEST [OFF: %u] [LEN: %u]", m_id, l_br.m_off, l_br.m_len);
        }
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
pending_block_rqst_vec_t::iterator piece_tracker::find_pending(uint32_t a_off, uint32_t a_len)
{
        pending_block_rqst_vec_t::iterator i_br = m_pending.begin();
        for (; i_br != m_pending.end(); ++i_br)
        {
                if (i_br->matches(a_off, a_len))
                {
                        break;
                }
        }
        return i_br;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
bool piece_tracker::has_completed(uint32_t a_off, uint32_t a_len) const
{
        for (auto && i_b : m_completed)
        {
                if ((i_b.m_off == a_off) &&
                    (i_b.m_len == a_len))
                {
                        return true;
                }
        }
        return false;
}
//! ----------------------------------------------------------------------------
//! \details: record received block -must exactly match a pending request
//! \return:  PTRK_STATUS_OK on success (payload moved out of a_rqst)
//!           PTRK_STATUS_UNKNOWN_BLOCK if not pending (a_rqst untouched)
//!           PTRK_STATUS_ERROR if tracker consumed
//! \param:   a_rqst  received block
//! \param:   ao_done true if all bytes of piece received
//! ----------------------------------------------------------------------------
int32_t piece_tracker::complete(completed_block_rqst_t& a_rqst, bool& ao_done)
{
        ao_done = false;
        int32_t l_s;
        l_s = check_active("complete");
        if (l_s != PTRK_STATUS_OK)
        {
                return PTRK_STATUS_ERROR;
        }
        // -------------------------------------------------
        // payload must be exactly the requested length
        // -------------------------------------------------
        if (a_rqst.m_data.size() != a_rqst.m_len)
        {
                ++m_stat_num_blocks_rejected;
                TRC_WARN("[PIECE: %u] REJECT [OFF: %u] [LEN: %u] payload length: %zu",
                         m_id,
                         a_rqst.m_off,
                         a_rqst.m_len,
                         a_rqst.m_data.size());
                ao_done = is_done();
                return PTRK_STATUS_UNKNOWN_BLOCK;
        }
        pending_block_rqst_vec_t::iterator i_br = find_pending(a_rqst.m_off, a_rqst.m_len);
        if (i_br == m_pending.end())
        {
                ++m_stat_num_blocks_rejected;
                TRC_WARN("[PIECE: %u] REJECT [OFF: %u] [LEN: %u] unrecognized block",
                         m_id,
                         a_rqst.m_off,
                         a_rqst.m_len);
                ao_done = is_done();
                return PTRK_STATUS_UNKNOWN_BLOCK;
        }
        m_pending.erase(i_br);
        m_remaining -= a_rqst.m_len;
        m_completed.push_back(completed_block_rqst_t(a_rqst.m_off, a_rqst.m_len, std::move(a_rqst.m_data)));
        a_rqst.m_data.clear();
        ++m_stat_num_blocks_recvd;
        TRC_VERBOSE("[PIECE: %u] RECV [OFF: %u] [LEN: %u] [REMAINING: %u]",
                    m_id,
                    a_rqst.m_off,
                    a_rqst.m_len,
                    m_remaining);
        ao_done = is_done();
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: drop pending request (ie timed out) -frees window slot
//! \return:  PTRK_STATUS_OK on success
//!           PTRK_STATUS_UNKNOWN_BLOCK if not pending
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t piece_tracker::rm_pending(uint32_t a_off, uint32_t a_len)
{
        int32_t l_s;
        l_s = check_active("rm_pending");
        if (l_s != PTRK_STATUS_OK)
        {
                return PTRK_STATUS_ERROR;
        }
        pending_block_rqst_vec_t::iterator i_br = find_pending(a_off, a_len);
        if (i_br == m_pending.end())
        {
                return PTRK_STATUS_UNKNOWN_BLOCK;
        }
        m_pending.erase(i_br);
        ++m_stat_num_blocks_removed;
        TRC_DEBUG("[PIECE: %u] REMOVE [OFF: %u] [LEN: %u]", m_id, a_off, a_len);
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: re-request a previously scheduled block that is neither
//!           pending nor completed (ie after rm_pending)
//! \return:  PTRK_STATUS_OK on success
//!           PTRK_STATUS_AGAIN if window full
//!           PTRK_STATUS_ERROR if block invalid/not schedulable
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t piece_tracker::add_pending(uint32_t a_off, uint32_t a_len)
{
        int32_t l_s;
        l_s = check_active("add_pending");
        if (l_s != PTRK_STATUS_OK)
        {
                return PTRK_STATUS_ERROR;
        }
        if (m_pending.size() >= m_max_pending)
        {
                return PTRK_STATUS_AGAIN;
        }
        // -------------------------------------------------
        // must be a block boundary already scheduled
        // -------------------------------------------------
        if ((a_off % m_block_size) ||
            (a_off >= m_offset))
        {
                TRC_ERROR("[PIECE: %u] add [OFF: %u] not a scheduled block boundary [SCHEDULED: %u]",
                          m_id,
                          a_off,
                          m_offset);
                return PTRK_STATUS_ERROR;
        }
        uint32_t l_exp_len = std::min(m_block_size, m_piece_size - a_off);
        if (a_len != l_exp_len)
        {
                TRC_ERROR("[PIECE: %u] add [OFF: %u] [LEN: %u] expected length: %u",
                          m_id,
                          a_off,
                          a_len,
                          l_exp_len);
                return PTRK_STATUS_ERROR;
        }
        if ((find_pending(a_off, a_len) != m_pending.end()) ||
            has_completed(a_off, a_len))
        {
                TRC_ERROR("[PIECE: %u] add [OFF: %u] [LEN: %u] already pending or completed",
                          m_id,
                          a_off,
                          a_len);
                return PTRK_STATUS_ERROR;
        }
        m_pending.push_back(pending_block_rqst_t(a_off, a_len));
        ++m_stat_num_blocks_rqstd;
        TRC_DEBUG("[PIECE: %u] RE-REQUEST [OFF: %u] [LEN: %u]", m_id, a_off, a_len);
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: sort blocks, sha1 in order, compare w/ expected digest.
//!           tracker is consumed on return of OK or INVALID.
//! \return:  PTRK_STATUS_OK      ao_piece set
//!           PTRK_STATUS_INVALID digest mismatch -data discarded
//!           PTRK_STATUS_ERROR   consumed/incomplete/hash failure
//! \param:   ao_piece   validated piece
//! \param:   a_metainfo expected digests
//! ----------------------------------------------------------------------------
int32_t piece_tracker::validate(validated_piece& ao_piece, const metainfo& a_metainfo)
{
        int32_t l_s;
        l_s = check_active("validate");
        if (l_s != PTRK_STATUS_OK)
        {
                return PTRK_STATUS_ERROR;
        }
        if (m_remaining)
        {
                TRC_ERROR("[PIECE: %u] validate with %u bytes remaining", m_id, m_remaining);
                return PTRK_STATUS_ERROR;
        }
        // -------------------------------------------------
        // blocks may arrive out of order
        // -------------------------------------------------
        std::sort(m_completed.begin(), m_completed.end(), _cmp_off);
        // -------------------------------------------------
        // calc sha1
        // -------------------------------------------------
        id_t l_sha1_act;
        sha1 l_sha1;
        for (auto && i_b : m_completed)
        {
                l_s = l_sha1.update(i_b.m_data);
                if (l_s != PTRK_STATUS_OK)
                {
                        TRC_ERROR("[PIECE: %u] performing sha1 update", m_id);
                        return PTRK_STATUS_ERROR;
                }
        }
        l_s = l_sha1.get_id(l_sha1_act);
        if (l_s != PTRK_STATUS_OK)
        {
                TRC_ERROR("[PIECE: %u] performing sha1 finish", m_id);
                return PTRK_STATUS_ERROR;
        }
        // -------------------------------------------------
        // expected -piece ids are issued from the same
        // metainfo, a miss means ids are broken elsewhere
        // -------------------------------------------------
        id_t l_sha1_exp;
        l_s = a_metainfo.get_piece_hash(m_id, l_sha1_exp);
        if (l_s != PTRK_STATUS_OK)
        {
                NDBG_ABORT("internal error: piece tracker has piece id[%u] not in metainfo[%zu pieces]",
                           m_id,
                           a_metainfo.get_num_pieces());
        }
        m_state = STATE_CONSUMED;
        // -------------------------------------------------
        // invalid
        // -------------------------------------------------
        if (memcmp(l_sha1_act.m_data, l_sha1_exp.m_data, sizeof(l_sha1_exp.m_data)) != 0)
        {
                TRC_WARN("invalid sha1[piece: %u] actual: %s != expected: %s",
                         m_id,
                         id2str(l_sha1_act).c_str(),
                         id2str(l_sha1_exp).c_str());
                completed_block_rqst_vec_t().swap(m_completed);
                m_pending.clear();
                return PTRK_STATUS_INVALID;
        }
        ao_piece.m_id = m_id;
        ao_piece.m_blocks.clear();
        ao_piece.m_blocks.swap(m_completed);
        m_pending.clear();
        TRC_DEBUG("[PIECE: %u] VALIDATE [BLOCKS: %zu] [LEN: %u]",
                  m_id,
                  ao_piece.m_blocks.size(),
                  m_piece_size);
        return PTRK_STATUS_OK;
}
}
