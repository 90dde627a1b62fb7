//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "bencode/bencode.h"
#include "support/util.h"
#include "support/trace.h"
#include "support/ndebug.h"
// ---------------------------------------------------------
// std libs
// ---------------------------------------------------------
#include <stdlib.h>
#include <string.h>
#include <ctype.h>
#include <errno.h>
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#define _MAX_DEPTH 64
#define _MAX_INT_DIGITS 20
//! ----------------------------------------------------------------------------
//! macros
//! ----------------------------------------------------------------------------
#define _INCR_PTR() do { \
        ++m_cur_off; \
        ++m_cur_ptr; \
} while(0)
#define _INCR_PTR_BY(_len) do { \
        m_cur_off += _len; \
        m_cur_ptr += _len; \
} while(0)
#define _CUR_CHR() (left() ? *m_cur_ptr : '\0')
namespace ns_ptrk {
//! ----------------------------------------------------------------------------
//! "bencoding types"
//! ref: http://www.bittorrent.org/beps/bep_0003.html
//! ----------------------------------------------------------------------------
//! strings:  <base ten length>:<bytes>           4:spam
//! integers: i<base ten>e (no leading zeros/-0)   i3e i-3e i0e
//! lists:    l<elements>e                         l4:spam4:eggse
//! dicts:    d<string key><value>...e             d3:cow3:mooe
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! static util
//! ----------------------------------------------------------------------------
static void delete_obj(be_obj_t& ao_obj);
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static void delete_list(be_list_t& ao_list)
{
        for(auto && i_m : ao_list)
        {
                delete_obj(i_m);
        }
        ao_list.clear();
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static void delete_dict(be_dict_t& ao_dict)
{
        for(auto && i_m : ao_dict)
        {
                delete_obj(i_m.second);
        }
        ao_dict.clear();
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static void delete_obj(be_obj_t& ao_obj)
{
        switch (ao_obj.m_type)
        {
        case BE_OBJ_INT:
        {
                delete (be_int_t*)ao_obj.m_obj;
                break;
        }
        case BE_OBJ_STRING:
        {
                delete (be_string_t*)ao_obj.m_obj;
                break;
        }
        case BE_OBJ_LIST:
        {
                be_list_t* l_obj = (be_list_t*)ao_obj.m_obj;
                delete_list(*l_obj);
                delete l_obj;
                break;
        }
        case BE_OBJ_DICT:
        {
                be_dict_t* l_obj = (be_dict_t*)ao_obj.m_obj;
                delete_dict(*l_obj);
                delete l_obj;
                break;
        }
        default:
        {
                break;
        }
        }
        ao_obj.m_obj = nullptr;
        ao_obj.m_type = BE_OBJ_NONE;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
bdecode::bdecode(void):
        m_dict(),
        m_buf(nullptr),
        m_buf_len(0),
        m_cur_off(0),
        m_cur_ptr(nullptr)
{
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
bdecode::~bdecode(void)
{
        delete_dict(m_dict);
        if (m_buf)
        {
                free(m_buf);
                m_buf = nullptr;
                m_buf_len = 0;
        }
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::init(void)
{
        delete_dict(m_dict);
        m_cur_off = 0;
        m_cur_ptr = m_buf;
        // -------------------------------------------------
        // verify dict
        // -------------------------------------------------
        if (_CUR_CHR() != 'd')
        {
                TRC_ERROR("buffer does not appear to bdecode a dict -no preceding 'd'");
                return PTRK_STATUS_ERROR;
        }
        int32_t l_s;
        _INCR_PTR();
        l_s = parse_dict(m_dict, 1);
        if (l_s != PTRK_STATUS_OK)
        {
                TRC_ERROR("performing parse_dict [OFF: %zu]", m_cur_off);
                delete_dict(m_dict);
                return PTRK_STATUS_ERROR;
        }
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::init(const char* a_buf, size_t a_len)
{
        if (!a_buf ||
            !a_len)
        {
                return PTRK_STATUS_ERROR;
        }
        if (m_buf) { free(m_buf); m_buf = nullptr; m_buf_len = 0; }
        // -------------------------------------------------
        // copy in
        // -------------------------------------------------
        m_buf = (char *)malloc(sizeof(char)*a_len);
        if (!m_buf)
        {
                return PTRK_STATUS_ERROR;
        }
        memcpy(m_buf, a_buf, a_len);
        m_buf_len = a_len;
        return init();
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::init(const char* a_file)
{
        if (m_buf) { free(m_buf); m_buf = nullptr; m_buf_len = 0; }
        int32_t l_s;
        l_s = read_file(a_file, &m_buf, &m_buf_len);
        if (l_s != PTRK_STATUS_OK)
        {
                TRC_ERROR("performing read_file [FILE: %s]", a_file ? a_file : "__null__");
                return PTRK_STATUS_ERROR;
        }
        return init();
}
//! ----------------------------------------------------------------------------
//! \details: find key in dict if of type
//! \return:  obj or nullptr
//! \param:   TODO
//! ----------------------------------------------------------------------------
const be_obj_t* bdecode::find(const be_dict_t& a_dict,
                              const std::string& a_key,
                              be_obj_type_t a_type)
{
        be_dict_t::const_iterator i_obj = a_dict.find(a_key);
        if (i_obj == a_dict.end())
        {
                return nullptr;
        }
        if (i_obj->second.m_type != a_type)
        {
                return nullptr;
        }
        return &(i_obj->second);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::get_int(const be_dict_t& a_dict,
                         const std::string& a_key,
                         be_int_t& ao_int)
{
        const be_obj_t* l_obj = find(a_dict, a_key, BE_OBJ_INT);
        if (!l_obj)
        {
                return PTRK_STATUS_ERROR;
        }
        ao_int = *((const be_int_t*)l_obj->m_obj);
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::get_str(const be_dict_t& a_dict,
                         const std::string& a_key,
                         std::string& ao_str)
{
        const be_obj_t* l_obj = find(a_dict, a_key, BE_OBJ_STRING);
        if (!l_obj)
        {
                return PTRK_STATUS_ERROR;
        }
        const be_string_t& l_str = *((const be_string_t*)l_obj->m_obj);
        ao_str.assign(l_str.m_data, l_str.m_len);
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::parse_len(size_t& ao_len)
{
        // -------------------------------------------------
        // expect length
        // -------------------------------------------------
        size_t l_digits = 0;
        ao_len = 0;
        while (isdigit((unsigned char)_CUR_CHR()))
        {
                size_t l_d = (size_t)(*m_cur_ptr - '0');
                ao_len = ao_len*10 + l_d;
                if (ao_len > m_buf_len)
                {
                        TRC_ERROR("string length exceeds buffer");
                        return PTRK_STATUS_ERROR;
                }
                ++l_digits;
                _INCR_PTR();
        }
        if (!l_digits)
        {
                TRC_ERROR("missing string length");
                return PTRK_STATUS_ERROR;
        }
        // -------------------------------------------------
        // find skip delim
        // -------------------------------------------------
        if (_CUR_CHR() != ':')
        {
                TRC_ERROR("cur_ptr != :");
                return PTRK_STATUS_ERROR;
        }
        _INCR_PTR();
        if (ao_len > left())
        {
                TRC_ERROR("string length[%zu] > left[%zu]", ao_len, left());
                return PTRK_STATUS_ERROR;
        }
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::parse_obj(be_obj_t& ao_obj, uint32_t a_depth)
{
        if (a_depth > _MAX_DEPTH)
        {
                TRC_ERROR("nesting depth > %d", _MAX_DEPTH);
                return PTRK_STATUS_ERROR;
        }
        int32_t l_s = PTRK_STATUS_OK;
        char l_type = _CUR_CHR();
        ao_obj.m_ptr = m_cur_ptr;
        // -------------------------------------------------
        // string
        // -------------------------------------------------
        if (isdigit((unsigned char)l_type))
        {
                be_string_t* l_str = new be_string_t();
                l_s = parse_string(*l_str);
                if (l_s != PTRK_STATUS_OK)
                {
                        delete l_str;
                        return PTRK_STATUS_ERROR;
                }
                ao_obj.m_type = BE_OBJ_STRING;
                ao_obj.m_obj = l_str;
        }
        // -------------------------------------------------
        // integer
        // -------------------------------------------------
        else if (l_type == 'i')
        {
                _INCR_PTR();
                be_int_t* l_int = new be_int_t();
                l_s = parse_int(*l_int);
                if (l_s != PTRK_STATUS_OK)
                {
                        delete l_int;
                        return PTRK_STATUS_ERROR;
                }
                ao_obj.m_type = BE_OBJ_INT;
                ao_obj.m_obj = l_int;
        }
        // -------------------------------------------------
        // list
        // -------------------------------------------------
        else if (l_type == 'l')
        {
                _INCR_PTR();
                be_list_t* l_list = new be_list_t();
                l_s = parse_list(*l_list, a_depth+1);
                if (l_s != PTRK_STATUS_OK)
                {
                        delete_list(*l_list);
                        delete l_list;
                        return PTRK_STATUS_ERROR;
                }
                ao_obj.m_type = BE_OBJ_LIST;
                ao_obj.m_obj = l_list;
        }
        // -------------------------------------------------
        // dictionary
        // -------------------------------------------------
        else if (l_type == 'd')
        {
                _INCR_PTR();
                be_dict_t* l_dict = new be_dict_t();
                l_s = parse_dict(*l_dict, a_depth+1);
                if (l_s != PTRK_STATUS_OK)
                {
                        delete_dict(*l_dict);
                        delete l_dict;
                        return PTRK_STATUS_ERROR;
                }
                ao_obj.m_type = BE_OBJ_DICT;
                ao_obj.m_obj = l_dict;
        }
        else
        {
                TRC_ERROR("unrecognized type [OFF: %zu]", m_cur_off);
                return PTRK_STATUS_ERROR;
        }
        ao_obj.m_len = (size_t)(m_cur_ptr - ao_obj.m_ptr);
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::parse_int(be_int_t& ao_int)
{
        // -------------------------------------------------
        // read up to 'e'
        // -------------------------------------------------
        std::string l_num;
        while ((_CUR_CHR() == '-') ||
               isdigit((unsigned char)_CUR_CHR()))
        {
                l_num += *m_cur_ptr;
                if (l_num.length() > _MAX_INT_DIGITS)
                {
                        TRC_ERROR("integer too long");
                        return PTRK_STATUS_ERROR;
                }
                _INCR_PTR();
        }
        if (_CUR_CHR() != 'e')
        {
                TRC_ERROR("m_cur_ptr != 'e'");
                return PTRK_STATUS_ERROR;
        }
        _INCR_PTR();
        // -------------------------------------------------
        // i-0e and leading zeros are invalid
        // -------------------------------------------------
        if (l_num.empty() ||
            (l_num == "-") ||
            (l_num == "-0") ||
            (l_num.find('-', 1) != std::string::npos) ||
            ((l_num.length() > 1) && (l_num[0] == '0')) ||
            ((l_num.length() > 2) && (l_num[0] == '-') && (l_num[1] == '0')))
        {
                TRC_ERROR("invalid integer: %s", l_num.c_str());
                return PTRK_STATUS_ERROR;
        }
        errno = 0;
        ao_int = strtoll(l_num.c_str(), nullptr, 10);
        if (errno != 0)
        {
                TRC_ERROR("performing strtoll errno != 0 [%d]", errno);
                return PTRK_STATUS_ERROR;
        }
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::parse_string(be_string_t& ao_string)
{
        int32_t l_s;
        size_t l_len;
        l_s = parse_len(l_len);
        if (l_s != PTRK_STATUS_OK)
        {
                return PTRK_STATUS_ERROR;
        }
        ao_string.m_data = m_cur_ptr;
        ao_string.m_len = l_len;
        _INCR_PTR_BY(l_len);
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::parse_list(be_list_t& ao_list, uint32_t a_depth)
{
        int32_t l_s;
        while (true)
        {
                if (!left())
                {
                        TRC_ERROR("unterminated list");
                        return PTRK_STATUS_ERROR;
                }
                if (*m_cur_ptr == 'e')
                {
                        _INCR_PTR();
                        break;
                }
                be_obj_t l_be_obj;
                l_s = parse_obj(l_be_obj, a_depth);
                if (l_s != PTRK_STATUS_OK)
                {
                        return PTRK_STATUS_ERROR;
                }
                ao_list.push_back(l_be_obj);
        }
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::parse_dict(be_dict_t& a_be_dict, uint32_t a_depth)
{
        int32_t l_s;
        while (true)
        {
                if (!left())
                {
                        TRC_ERROR("unterminated dict");
                        return PTRK_STATUS_ERROR;
                }
                if (*m_cur_ptr == 'e')
                {
                        _INCR_PTR();
                        break;
                }
                // -----------------------------------------
                // read in key
                // -----------------------------------------
                be_string_t l_key;
                l_s = parse_string(l_key);
                if (l_s != PTRK_STATUS_OK)
                {
                        return PTRK_STATUS_ERROR;
                }
                std::string l_key_str;
                l_key_str.assign(l_key.m_data, l_key.m_len);
                if (a_be_dict.find(l_key_str) != a_be_dict.end())
                {
                        TRC_ERROR("duplicate dict key: %s", l_key_str.c_str());
                        return PTRK_STATUS_ERROR;
                }
                // -----------------------------------------
                // parse obj
                // -----------------------------------------
                be_obj_t l_be_obj;
                l_s = parse_obj(l_be_obj, a_depth);
                if (l_s != PTRK_STATUS_OK)
                {
                        return PTRK_STATUS_ERROR;
                }
                a_be_dict[l_key_str] = l_be_obj;
        }
        return PTRK_STATUS_OK;
}
}
