//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "ptrk/def.h"
#include "support/trace.h"
#include "support/ndebug.h"
#include "support/sha1.h"
#include "support/util.h"
#include "core/metainfo.h"
#include <string.h>
#include <limits>
namespace ns_ptrk {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
metainfo::metainfo(void):
        m_init(false),
        m_name(),
        m_length(0),
        m_piece_length(0),
        m_pieces(),
        m_files(),
        m_info_hash()
{
        memset(m_info_hash.m_data, 0, sizeof(m_info_hash.m_data));
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
metainfo::~metainfo(void)
{
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void metainfo::reset(void)
{
        m_init = false;
        m_name.clear();
        m_length = 0;
        m_piece_length = 0;
        m_pieces.clear();
        m_files.clear();
        memset(m_info_hash.m_data, 0, sizeof(m_info_hash.m_data));
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t metainfo::init(const char* a_file)
{
        int32_t l_s;
        bdecode l_be;
        l_s = l_be.init(a_file);
        if (l_s != PTRK_STATUS_OK)
        {
                TRC_ERROR("performing bdecode init [FILE: %s]", a_file ? a_file : "__null__");
                return PTRK_STATUS_ERROR;
        }
        return init(l_be);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t metainfo::init(const char* a_buf, size_t a_len)
{
        int32_t l_s;
        bdecode l_be;
        l_s = l_be.init(a_buf, a_len);
        if (l_s != PTRK_STATUS_OK)
        {
                TRC_ERROR("performing bdecode init");
                return PTRK_STATUS_ERROR;
        }
        return init(l_be);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t metainfo::init(uint32_t a_piece_length,
                       uint64_t a_length,
                       const id_vector_t& a_pieces)
{
        reset();
        m_piece_length = a_piece_length;
        m_length = a_length;
        m_pieces = a_pieces;
        int32_t l_s;
        l_s = validate();
        if (l_s != PTRK_STATUS_OK)
        {
                reset();
                return PTRK_STATUS_ERROR;
        }
        m_init = true;
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t metainfo::init(const bdecode& a_be)
{
        reset();
        // -------------------------------------------------
        // find info
        // -------------------------------------------------
        const be_obj_t* l_info;
        l_info = bdecode::find(a_be.m_dict, "info", BE_OBJ_DICT);
        if (!l_info)
        {
                TRC_ERROR("missing info section in torrent");
                return PTRK_STATUS_ERROR;
        }
        // -------------------------------------------------
        // info hash -sha1 of encoded info dict
        // -------------------------------------------------
        int32_t l_s;
        sha1 l_sha1;
        l_s = l_sha1.update((const uint8_t*)l_info->m_ptr, l_info->m_len);
        if (l_s == PTRK_STATUS_OK)
        {
                l_s = l_sha1.get_id(m_info_hash);
        }
        if (l_s != PTRK_STATUS_OK)
        {
                TRC_ERROR("performing sha1 of info dict");
                return PTRK_STATUS_ERROR;
        }
        // -------------------------------------------------
        // parse info
        // -------------------------------------------------
        l_s = parse_info(*((const be_dict_t*)l_info->m_obj));
        if (l_s != PTRK_STATUS_OK)
        {
                TRC_ERROR("performing parse_info");
                reset();
                return PTRK_STATUS_ERROR;
        }
        l_s = validate();
        if (l_s != PTRK_STATUS_OK)
        {
                reset();
                return PTRK_STATUS_ERROR;
        }
        m_init = true;
        TRC_DEBUG("[NAME: %s] [INFO_HASH: %s] [LENGTH: %lu] [PIECE_LENGTH: %u] [PIECES: %zu]",
                  m_name.c_str(),
                  id2str(m_info_hash).c_str(),
                  (unsigned long)m_length,
                  m_piece_length,
                  m_pieces.size());
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t metainfo::parse_info(const be_dict_t& a_dict)
{
        int32_t l_s;
        // -------------------------------------------------
        // name (optional)
        // -------------------------------------------------
        l_s = bdecode::get_str(a_dict, "name", m_name);
        UNUSED(l_s);
        // -------------------------------------------------
        // piece length
        // -------------------------------------------------
        be_int_t l_int = 0;
        l_s = bdecode::get_int(a_dict, "piece length", l_int);
        if (l_s != PTRK_STATUS_OK)
        {
                TRC_ERROR("missing or invalid 'piece length'");
                return PTRK_STATUS_ERROR;
        }
        if ((l_int <= 0) ||
            (l_int > (be_int_t)std::numeric_limits<uint32_t>::max()))
        {
                TRC_ERROR("'piece length' out of range: %ld", (long)l_int);
                return PTRK_STATUS_ERROR;
        }
        m_piece_length = (uint32_t)l_int;
        // -------------------------------------------------
        // pieces
        // -------------------------------------------------
        const be_obj_t* l_obj;
        l_obj = bdecode::find(a_dict, "pieces", BE_OBJ_STRING);
        if (!l_obj)
        {
                TRC_ERROR("missing or invalid 'pieces'");
                return PTRK_STATUS_ERROR;
        }
        const be_string_t& l_str = *((const be_string_t*)l_obj->m_obj);
        if (l_str.m_len % sizeof(id_t))
        {
                TRC_ERROR("'pieces' length[%zu] not a multiple of %zu",
                          l_str.m_len,
                          sizeof(id_t));
                return PTRK_STATUS_ERROR;
        }
        size_t l_num_pieces = l_str.m_len/(sizeof(id_t));
        m_pieces.reserve(l_num_pieces);
        for (size_t i_h = 0; i_h < l_num_pieces; ++i_h)
        {
                id_t l_id;
                memcpy(l_id.m_data, l_str.m_data + (i_h*sizeof(id_t)), sizeof(id_t));
                m_pieces.push_back(l_id);
        }
        // -------------------------------------------------
        // length -single file
        // -------------------------------------------------
        l_s = bdecode::get_int(a_dict, "length", l_int);
        if (l_s == PTRK_STATUS_OK)
        {
                if (l_int < 0)
                {
                        TRC_ERROR("negative 'length'");
                        return PTRK_STATUS_ERROR;
                }
                m_length = (uint64_t)l_int;
                return PTRK_STATUS_OK;
        }
        // -------------------------------------------------
        // files -multi file: length is sum
        // -------------------------------------------------
        l_obj = bdecode::find(a_dict, "files", BE_OBJ_LIST);
        if (!l_obj)
        {
                TRC_ERROR("missing 'length' and 'files'");
                return PTRK_STATUS_ERROR;
        }
        const be_list_t& l_list = *((const be_list_t*)l_obj->m_obj);
        for (auto && i_m : l_list)
        {
                if (i_m.m_type != BE_OBJ_DICT)
                {
                        TRC_ERROR("'files' entry is not a dict");
                        return PTRK_STATUS_ERROR;
                }
                const be_dict_t& l_file_dict = *((const be_dict_t*)i_m.m_obj);
                be_int_t l_len = 0;
                l_s = bdecode::get_int(l_file_dict, "length", l_len);
                if ((l_s != PTRK_STATUS_OK) ||
                    (l_len < 0))
                {
                        TRC_ERROR("missing or invalid file 'length'");
                        return PTRK_STATUS_ERROR;
                }
                files_t l_file;
                l_file.m_len = (size_t)l_len;
                const be_obj_t* l_path = bdecode::find(l_file_dict, "path", BE_OBJ_LIST);
                if (!l_path)
                {
                        TRC_ERROR("missing or invalid file 'path'");
                        return PTRK_STATUS_ERROR;
                }
                const be_list_t& l_plist = *((const be_list_t*)l_path->m_obj);
                for (auto && i_p : l_plist)
                {
                        if (i_p.m_type != BE_OBJ_STRING)
                        {
                                TRC_ERROR("file 'path' element is not a string");
                                return PTRK_STATUS_ERROR;
                        }
                        const be_string_t& l_pstr = *((const be_string_t*)i_p.m_obj);
                        std::string l_elem(l_pstr.m_data, l_pstr.m_len);
                        // -------------------------------------
                        // path stays below torrent directory
                        // -------------------------------------
                        if (l_elem.empty() ||
                            (l_elem == ".") ||
                            (l_elem == "..") ||
                            (l_elem.find('/') != std::string::npos) ||
                            (l_elem.find('\0') != std::string::npos))
                        {
                                TRC_ERROR("invalid file 'path' element: '%s'", l_elem.c_str());
                                return PTRK_STATUS_ERROR;
                        }
                        l_file.m_path.push_back(l_elem);
                }
                if (l_file.m_path.empty())
                {
                        TRC_ERROR("empty file 'path'");
                        return PTRK_STATUS_ERROR;
                }
                m_length += (uint64_t)l_len;
                m_files.push_back(l_file);
        }
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: check number of digests agrees with length/piece length
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t metainfo::validate(void)
{
        if (!m_piece_length)
        {
                TRC_ERROR("piece length == 0");
                return PTRK_STATUS_ERROR;
        }
        uint64_t l_exp = (m_length / m_piece_length) +
                         ((m_length % m_piece_length) != 0);
        if (l_exp != (uint64_t)m_pieces.size())
        {
                TRC_ERROR("number of pieces[%zu] != expected[%lu] for [LENGTH: %lu] [PIECE_LENGTH: %u]",
                          m_pieces.size(),
                          (unsigned long)l_exp,
                          (unsigned long)m_length,
                          m_piece_length);
                return PTRK_STATUS_ERROR;
        }
        if (l_exp > (uint64_t)std::numeric_limits<piece_id_t>::max())
        {
                TRC_ERROR("number of pieces exceeds piece id range");
                return PTRK_STATUS_ERROR;
        }
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: expected digest for piece id
//! \return:  PTRK_STATUS_OK if id in table
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t metainfo::get_piece_hash(piece_id_t a_id, id_t& ao_id) const
{
        if (a_id >= m_pieces.size())
        {
                TRC_ERROR("piece[%u] >= number of pieces[%zu]", a_id, m_pieces.size());
                return PTRK_STATUS_ERROR;
        }
        memcpy(ao_id.m_data, m_pieces[a_id].m_data, sizeof(ao_id.m_data));
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: size of piece -last piece may be short
//! \return:  size or 0 if id out of range
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint32_t metainfo::get_piece_size(piece_id_t a_id) const
{
        if (a_id >= m_pieces.size())
        {
                return 0;
        }
        if (a_id == (m_pieces.size()-1))
        {
                uint64_t l_mod = m_length % m_piece_length;
                if (l_mod)
                {
                        return (uint32_t)l_mod;
                }
        }
        return m_piece_length;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint64_t metainfo::get_piece_offset(piece_id_t a_id) const
{
        return (uint64_t)a_id*(uint64_t)m_piece_length;
}
}
