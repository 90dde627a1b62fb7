//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stdio.h>
#include <stdlib.h>
#include <getopt.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <string.h>
#include <time.h>
#include <string>
#include <vector>
#include <algorithm>
#include <random>
// ---------------------------------------------------------
// external ptrk includes
// ---------------------------------------------------------
#include "ptrk/def.h"
#include "ptrk/types.h"
// ---------------------------------------------------------
// internal ptrk includes
// ---------------------------------------------------------
#include "core/metainfo.h"
#include "core/piece_tracker.h"
#include "support/trace.h"
#include "support/ndebug.h"
#include "support/util.h"
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#ifndef STATUS_OK
#define STATUS_OK 0
#endif
#ifndef STATUS_ERROR
#define STATUS_ERROR -1
#endif
//! ----------------------------------------------------------------------------
//! types
//! ----------------------------------------------------------------------------
// ---------------------------------------------------------
// file backing a span of the torrent payload
// ---------------------------------------------------------
typedef struct _data_file {
        std::string m_path;
        int m_fd;
        uint64_t m_off;
        uint64_t m_len;
        _data_file():
                m_path(),
                m_fd(-1),
                m_off(0),
                m_len(0)
        {}
} data_file_t;
typedef std::vector<data_file_t> data_file_vec_t;
// ---------------------------------------------------------
// verification run
// ---------------------------------------------------------
typedef struct _verify_ctx {
        data_file_vec_t m_files;
        uint32_t m_block_size;
        uint32_t m_max_pending;
        bool m_shuffle;
        std::mt19937 m_rand;
        uint64_t m_num_blocks_rqstd;
        uint64_t m_num_blocks_recvd;
        _verify_ctx():
                m_files(),
                m_block_size(PTRK_BLOCK_SIZE),
                m_max_pending(PTRK_MAX_PENDING_RQSTS),
                m_shuffle(false),
                m_rand((uint32_t)time(nullptr)),
                m_num_blocks_rqstd(0),
                m_num_blocks_recvd(0)
        {}
} verify_ctx_t;
//! ----------------------------------------------------------------------------
//! \details: open file(s) backing torrent payload
//!           single file: a_path is the file
//!           multi file:  a_path is the directory containing "path" entries
//! \return:  STATUS_OK on success
//!           STATUS_ERROR on error
//! \param:   ao_ctx   run context
//! \param:   a_mi     metainfo
//! \param:   a_path   data file/directory
//! ----------------------------------------------------------------------------
static int32_t _open_data(verify_ctx_t& ao_ctx,
                          const ns_ptrk::metainfo& a_mi,
                          const std::string& a_path)
{
        const ns_ptrk::files_list_t& l_fl = a_mi.get_files();
        if (l_fl.empty())
        {
                data_file_t l_df;
                l_df.m_path = a_path;
                l_df.m_len = a_mi.get_length();
                ao_ctx.m_files.push_back(l_df);
        }
        else
        {
                uint64_t l_off = 0;
                for (auto && i_f : l_fl)
                {
                        data_file_t l_df;
                        l_df.m_path = a_path;
                        for (auto && i_p : i_f.m_path)
                        {
                                l_df.m_path += "/";
                                l_df.m_path += i_p;
                        }
                        l_df.m_off = l_off;
                        l_df.m_len = i_f.m_len;
                        l_off += i_f.m_len;
                        ao_ctx.m_files.push_back(l_df);
                }
        }
        for (auto && i_df : ao_ctx.m_files)
        {
                i_df.m_fd = open(i_df.m_path.c_str(), O_RDONLY);
                if (i_df.m_fd < 0)
                {
                        PTRK_PERROR("error opening file: %s.  Reason: %s",
                                    i_df.m_path.c_str(),
                                    strerror(errno));
                        return STATUS_ERROR;
                }
        }
        return STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static void _close_data(verify_ctx_t& a_ctx)
{
        for (auto && i_df : a_ctx.m_files)
        {
                if (i_df.m_fd >= 0)
                {
                        close(i_df.m_fd);
                        i_df.m_fd = -1;
                }
        }
}
//! ----------------------------------------------------------------------------
//! \details: read payload span [a_off, a_off + a_len) -spans may cross files.
//!           bytes missing from short files are zero filled (fail hash).
//! \return:  STATUS_OK on success
//!           STATUS_ERROR on error
//! \param:   ao_data  output buffer
//! ----------------------------------------------------------------------------
static int32_t _read_data(const verify_ctx_t& a_ctx,
                          uint64_t a_off,
                          uint32_t a_len,
                          ns_ptrk::uint8_vec_t& ao_data)
{
        ao_data.assign(a_len, 0);
        uint64_t l_end = a_off + a_len;
        for (auto && i_df : a_ctx.m_files)
        {
                uint64_t l_df_end = i_df.m_off + i_df.m_len;
                if ((l_df_end <= a_off) ||
                    (i_df.m_off >= l_end))
                {
                        continue;
                }
                uint64_t l_beg = std::max(a_off, i_df.m_off);
                uint64_t l_fin = std::min(l_end, l_df_end);
                size_t l_left = (size_t)(l_fin - l_beg);
                uint8_t* l_dst = ao_data.data() + (l_beg - a_off);
                off_t l_foff = (off_t)(l_beg - i_df.m_off);
                while (l_left)
                {
                        ssize_t l_s;
                        errno = 0;
                        l_s = pread(i_df.m_fd, l_dst, l_left, l_foff);
                        if (l_s < 0)
                        {
                                if (errno == EINTR)
                                {
                                        continue;
                                }
                                PTRK_PERROR("error reading file: %s.  Reason: %s",
                                            i_df.m_path.c_str(),
                                            strerror(errno));
                                return STATUS_ERROR;
                        }
                        // ---------------------------------
                        // eof -file shorter than expected
                        // ---------------------------------
                        if (l_s == 0)
                        {
                                TRC_DEBUG("short file: %s at offset: %ld", i_df.m_path.c_str(), (long)l_foff);
                                break;
                        }
                        l_dst += l_s;
                        l_foff += l_s;
                        l_left -= (size_t)l_s;
                }
        }
        return STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: drive a tracker for one piece: request batches, "receive" each
//!           batch (optionally out of order) from the data file, validate.
//! \return:  PTRK_STATUS_OK      piece valid
//!           PTRK_STATUS_INVALID piece digest mismatch
//!           PTRK_STATUS_ERROR   on error
//! \param:   a_ctx  run context
//! \param:   a_mi   metainfo
//! \param:   a_id   piece id
//! ----------------------------------------------------------------------------
static int32_t _verify_piece(verify_ctx_t& a_ctx,
                             const ns_ptrk::metainfo& a_mi,
                             ns_ptrk::piece_id_t a_id)
{
        int32_t l_s;
        uint32_t l_size = a_mi.get_piece_size(a_id);
        uint64_t l_base = a_mi.get_piece_offset(a_id);
        ns_ptrk::piece_tracker l_pt(a_id, l_size, a_ctx.m_block_size, a_ctx.m_max_pending);
        bool l_done = false;
        while (!l_done)
        {
                ns_ptrk::pending_block_rqst_vec_t l_batch;
                l_s = l_pt.next_rqsts(l_batch);
                if (l_s != PTRK_STATUS_OK)
                {
                        TRC_ERROR("performing next_rqsts [PIECE: %u]", a_id);
                        return PTRK_STATUS_ERROR;
                }
                if (l_batch.empty())
                {
                        TRC_ERROR("no requests for incomplete piece [PIECE: %u] [REMAINING: %u]",
                                  a_id,
                                  l_pt.get_remaining());
                        return PTRK_STATUS_ERROR;
                }
                // -----------------------------------------
                // arrival order
                // -----------------------------------------
                if (a_ctx.m_shuffle)
                {
                        std::shuffle(l_batch.begin(), l_batch.end(), a_ctx.m_rand);
                }
                for (auto && i_br : l_batch)
                {
                        ns_ptrk::completed_block_rqst_t l_cb;
                        l_cb.m_off = i_br.m_off;
                        l_cb.m_len = i_br.m_len;
                        l_s = _read_data(a_ctx, l_base + i_br.m_off, i_br.m_len, l_cb.m_data);
                        if (l_s != STATUS_OK)
                        {
                                return PTRK_STATUS_ERROR;
                        }
                        l_s = l_pt.complete(l_cb, l_done);
                        if (l_s != PTRK_STATUS_OK)
                        {
                                TRC_ERROR("performing complete [PIECE: %u] [OFF: %u] [LEN: %u]",
                                          a_id,
                                          i_br.m_off,
                                          i_br.m_len);
                                return PTRK_STATUS_ERROR;
                        }
                }
        }
        a_ctx.m_num_blocks_rqstd += l_pt.get_stat_num_blocks_rqstd();
        a_ctx.m_num_blocks_recvd += l_pt.get_stat_num_blocks_recvd();
        ns_ptrk::validated_piece l_vp;
        l_s = l_pt.validate(l_vp, a_mi);
        return l_s;
}
//! ----------------------------------------------------------------------------
//! \details: Print the version.
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void print_version(FILE* a_stream, int a_exit_code)
{
        // print out the version information
        fprintf(a_stream, "ptrk piece download tracker.\n");
        fprintf(a_stream, "    Version: %s\n", PTRK_VERSION);
        exit(a_exit_code);
}
//! ----------------------------------------------------------------------------
//! \details: Print the command line help.
//! \return:  NA
//! \param:   a_stream FILE *
//! \param:   a_exit_code exit code
//! ----------------------------------------------------------------------------
static void print_usage(FILE* a_stream, int a_exit_code)
{
        fprintf(a_stream, "Usage: ptrk [options]\n");
        fprintf(a_stream, "Options:\n");
        fprintf(a_stream, "  -h, --help           display this help and exit.\n");
        fprintf(a_stream, "  -v, --version        display the version number and exit.\n");
        fprintf(a_stream, "  -t, --torrent        torrent file.\n");
        fprintf(a_stream, "  -f, --file           data file (directory for multi-file torrents).\n");
        fprintf(a_stream, "  -i, --info-hash      expected info hash (hex) of torrent.\n");
        fprintf(a_stream, "  -w, --window         max pending block requests (default: %d)\n", PTRK_MAX_PENDING_RQSTS);
        fprintf(a_stream, "  -b, --block-size     block request size (default: %d)\n", PTRK_BLOCK_SIZE);
        fprintf(a_stream, "  -s, --shuffle        complete blocks of each batch out of order\n");
        fprintf(a_stream, "  -p, --piece          verify single piece <id>\n");
        fprintf(a_stream, "  \n");
        fprintf(a_stream, "Debug Options:\n");
        fprintf(a_stream, "  -T, --trace          tracing (none/error/warn/debug/verbose/all) (default: none)\n");
        fprintf(a_stream, "  -E, --error-log      log errors to file <file>\n");
        fprintf(a_stream, "  \n");
        exit(a_exit_code);
}
//! ----------------------------------------------------------------------------
//! \details main
//! \return  0 if all verified pieces are valid
//!          -1 on error or invalid piece(s)
//! \param   argc/argv...
//! ----------------------------------------------------------------------------
int main(int argc, char** argv)
{
        // -------------------------------------------------
        // vars
        // -------------------------------------------------
        bool l_trace = false;
        ns_ptrk::trc_log_level_set(ns_ptrk::TRC_LOG_LEVEL_NONE);
        verify_ctx_t l_ctx;
        int32_t l_s;
        std::string l_path;
        std::string l_data;
        std::string l_error_log;
        std::string l_info_hash;
        bool l_single = false;
        ns_ptrk::piece_id_t l_single_id = 0;
        // -------------------------------------------------
        // Get args...
        // -------------------------------------------------
        char l_opt = '\0';
        std::string l_arg;
        int l_opt_index = 0;
        static struct option l_long_opt[] = {
                { "help",        no_argument,       0, 'h' },
                { "version",     no_argument,       0, 'v' },
                { "torrent",     required_argument, 0, 't' },
                { "file",        required_argument, 0, 'f' },
                { "info-hash",   required_argument, 0, 'i' },
                { "window",      required_argument, 0, 'w' },
                { "block-size",  required_argument, 0, 'b' },
                { "shuffle",     no_argument,       0, 's' },
                { "piece",       required_argument, 0, 'p' },
                { "trace",       required_argument, 0, 'T' },
                { "error-log",   required_argument, 0, 'E' },
                // Sentinel
                { 0,             0,                 0,  0  }
        };
        // -------------------------------------------------
        // args...
        // -------------------------------------------------
        std::string l_short_arg_list;
        l_short_arg_list += "hvt:f:i:w:b:sp:T:E:";
        while(((unsigned char)l_opt != 255))
        {
                l_opt = getopt_long_only(argc, argv, l_short_arg_list.c_str(), l_long_opt, &l_opt_index);
                if (optarg)
                {
                        l_arg = std::string(optarg);
                }
                else
                {
                        l_arg.clear();
                }
                switch (l_opt)
                {
                // -----------------------------------------
                // Help
                // -----------------------------------------
                case 'h':
                {
                        print_usage(stdout, 0);
                        break;
                }
                // -----------------------------------------
                // version
                // -----------------------------------------
                case 'v':
                {
                        print_version(stdout, 0);
                        break;
                }
                // -----------------------------------------
                // torrent file
                // -----------------------------------------
                case 't':
                {
                        l_path = l_arg;
                        break;
                }
                // -----------------------------------------
                // data file
                // -----------------------------------------
                case 'f':
                {
                        l_data = l_arg;
                        break;
                }
                // -----------------------------------------
                // info hash
                // -----------------------------------------
                case 'i':
                {
                        l_info_hash = l_arg;
                        break;
                }
                // -----------------------------------------
                // window
                // -----------------------------------------
                case 'w':
                {
                        int l_val;
                        l_val = atoi(l_arg.c_str());
                        if ((l_val < 1) ||
                            (l_val > 1024))
                        {
                                NDBG_OUTPUT("Error bad window value: %d.\n", l_val);
                                print_usage(stdout, STATUS_ERROR);
                        }
                        l_ctx.m_max_pending = (uint32_t)l_val;
                        break;
                }
                // -----------------------------------------
                // block size
                // -----------------------------------------
                case 'b':
                {
                        long l_val;
                        l_val = strtol(l_arg.c_str(), nullptr, 10);
                        if ((l_val < 1) ||
                            (l_val > (16*1024*1024)))
                        {
                                NDBG_OUTPUT("Error bad block size value: %ld.\n", l_val);
                                print_usage(stdout, STATUS_ERROR);
                        }
                        l_ctx.m_block_size = (uint32_t)l_val;
                        break;
                }
                // -----------------------------------------
                // shuffle
                // -----------------------------------------
                case 's':
                {
                        l_ctx.m_shuffle = true;
                        break;
                }
                // -----------------------------------------
                // single piece
                // -----------------------------------------
                case 'p':
                {
                        char* l_end = nullptr;
                        unsigned long l_val;
                        errno = 0;
                        l_val = strtoul(l_arg.c_str(), &l_end, 10);
                        if (errno ||
                            l_arg.empty() ||
                            (l_end && *l_end != '\0') ||
                            (l_val > 0xFFFFFFFFUL))
                        {
                                NDBG_OUTPUT("Error bad piece value: %s.\n", l_arg.c_str());
                                print_usage(stdout, STATUS_ERROR);
                        }
                        l_single = true;
                        l_single_id = (ns_ptrk::piece_id_t)l_val;
                        break;
                }
                // -----------------------------------------
                // trace
                // -----------------------------------------
#define ELIF_TRACE_STR(_level) else if (strncasecmp(_level, l_arg.c_str(), sizeof(_level)) == 0)
                case 'T':
                {
                        if (0) {}
                        ELIF_TRACE_STR("error") { ns_ptrk::trc_log_level_set(ns_ptrk::TRC_LOG_LEVEL_ERROR); l_trace = true; }
                        ELIF_TRACE_STR("warn") { ns_ptrk::trc_log_level_set(ns_ptrk::TRC_LOG_LEVEL_WARN); l_trace = true; }
                        ELIF_TRACE_STR("debug") { ns_ptrk::trc_log_level_set(ns_ptrk::TRC_LOG_LEVEL_DEBUG); l_trace = true; }
                        ELIF_TRACE_STR("verbose") { ns_ptrk::trc_log_level_set(ns_ptrk::TRC_LOG_LEVEL_VERBOSE); l_trace = true; }
                        ELIF_TRACE_STR("all") { ns_ptrk::trc_log_level_set(ns_ptrk::TRC_LOG_LEVEL_ALL); l_trace = true; }
                        else
                        {
                                ns_ptrk::trc_log_level_set(ns_ptrk::TRC_LOG_LEVEL_NONE);
                        }
                        break;
                }
                // -----------------------------------------
                // error-log
                // -----------------------------------------
                case 'E':
                {
                        l_error_log = l_arg;
                        break;
                }
                // -----------------------------------------
                // ?
                // -----------------------------------------
                case '?':
                {
                        // ---------------------------------
                        // Required argument was missing
                        // '?' is provided when the 3rd arg
                        // to getopt_long does not begin with
                        //':', and preceeded by an automatic
                        // error message.
                        // ---------------------------------
                        NDBG_ERROR_AT("unrecognized argument.  Exiting.\n");
                        return STATUS_ERROR;
                }
                // -----------------------------------------
                // default
                // -----------------------------------------
                default:
                {
                        break;
                }
                }
        }
        // -------------------------------------------------
        // error logging
        // -------------------------------------------------
        if (!l_error_log.empty())
        {
                l_s = ns_ptrk::trc_log_file_open(l_error_log);
                if (l_s != PTRK_STATUS_OK)
                {
                        NDBG_ERROR_AT("error opening log file: %s\n", l_error_log.c_str());
                        return STATUS_ERROR;
                }
        }
        else if (l_trace)
        {
                ns_ptrk::trc_log_file_open("/dev/stdout");
        }
        // -------------------------------------------------
        // check for files
        // -------------------------------------------------
        if (l_path.empty() ||
            l_data.empty())
        {
                NDBG_ERROR_AT("Error torrent file and data file must be specified.\n");
                print_usage(stderr, STATUS_ERROR);
        }
        // -------------------------------------------------
        // metainfo
        // -------------------------------------------------
        ns_ptrk::metainfo l_mi;
        l_s = l_mi.init(l_path.c_str());
        if (l_s != PTRK_STATUS_OK)
        {
                NDBG_ERROR_AT("error reading torrent file: %s\n", l_path.c_str());
                return STATUS_ERROR;
        }
        // -------------------------------------------------
        // check torrent is the one expected
        // -------------------------------------------------
        if (!l_info_hash.empty())
        {
                ns_ptrk::id_t l_exp;
                l_s = ns_ptrk::str2id(l_exp, l_info_hash);
                if (l_s != PTRK_STATUS_OK)
                {
                        NDBG_ERROR_AT("bad info hash: %s (expected %d hex chars)\n",
                                      l_info_hash.c_str(),
                                      PTRK_SHA1_SIZE_HEX);
                        return STATUS_ERROR;
                }
                if (memcmp(l_exp.m_data, l_mi.get_info_hash().m_data, sizeof(l_exp.m_data)) != 0)
                {
                        NDBG_ERROR_AT("info hash mismatch: torrent: %s != expected: %s\n",
                                      ns_ptrk::id2str(l_mi.get_info_hash()).c_str(),
                                      ns_ptrk::id2str(l_exp).c_str());
                        return STATUS_ERROR;
                }
        }
        if (l_single &&
            (l_single_id >= l_mi.get_num_pieces()))
        {
                NDBG_ERROR_AT("piece %u out of range (number of pieces: %zu)\n",
                              l_single_id,
                              l_mi.get_num_pieces());
                return STATUS_ERROR;
        }
        NDBG_OUTPUT("%sVerifying%s: %s%s%s\n",
                    ANSI_COLOR_FG_CYAN, ANSI_COLOR_OFF,
                    ANSI_COLOR_FG_WHITE, l_mi.get_name().c_str(), ANSI_COLOR_OFF);
        NDBG_OUTPUT("  info hash:    %s\n", ns_ptrk::id2str(l_mi.get_info_hash()).c_str());
        NDBG_OUTPUT("  length:       %lu\n", (unsigned long)l_mi.get_length());
        NDBG_OUTPUT("  piece length: %u\n", l_mi.get_piece_length());
        NDBG_OUTPUT("  pieces:       %zu\n", l_mi.get_num_pieces());
        NDBG_OUTPUT("  block size:   %u\n", l_ctx.m_block_size);
        NDBG_OUTPUT("  window:       %u\n", l_ctx.m_max_pending);
        // -------------------------------------------------
        // data
        // -------------------------------------------------
        int32_t l_ret = STATUS_OK;
        ns_ptrk::piece_id_t l_beg = 0;
        ns_ptrk::piece_id_t l_end = (ns_ptrk::piece_id_t)l_mi.get_num_pieces();
        uint64_t l_num_valid = 0;
        uint64_t l_num_invalid = 0;
        uint64_t l_num_total = 0;
        l_s = _open_data(l_ctx, l_mi, l_data);
        if (l_s != STATUS_OK)
        {
                NDBG_ERROR_AT("%s\n", g_ptrk_err_msg);
                l_ret = STATUS_ERROR;
                goto cleanup;
        }
        if (l_single)
        {
                l_beg = l_single_id;
                l_end = l_single_id + 1;
        }
        l_num_total = l_end - l_beg;
        // -------------------------------------------------
        // verify each piece
        // -------------------------------------------------
        NDBG_OUTPUT("+----------+------------+----------+\n");
        NDBG_OUTPUT("| %sPiece%s    | %sSize%s       | %sStatus%s   |\n",
                    ANSI_COLOR_FG_YELLOW, ANSI_COLOR_OFF,
                    ANSI_COLOR_FG_BLUE, ANSI_COLOR_OFF,
                    ANSI_COLOR_FG_MAGENTA, ANSI_COLOR_OFF);
        NDBG_OUTPUT("+----------+------------+----------+\n");
        for (ns_ptrk::piece_id_t i_p = l_beg; i_p < l_end; ++i_p)
        {
                l_s = _verify_piece(l_ctx, l_mi, i_p);
                const char* l_status_str = "";
                const char* l_status_color = ANSI_COLOR_OFF;
                if (l_s == PTRK_STATUS_OK)
                {
                        ++l_num_valid;
                        l_status_str = "VALID";
                        l_status_color = ANSI_COLOR_FG_GREEN;
                }
                else if (l_s == PTRK_STATUS_INVALID)
                {
                        ++l_num_invalid;
                        l_status_str = "INVALID";
                        l_status_color = ANSI_COLOR_FG_RED;
                }
                else
                {
                        NDBG_OUTPUT("\n");
                        NDBG_ERROR_AT("error verifying piece: %u\n", i_p);
                        if (g_ptrk_err_msg[0])
                        {
                                NDBG_ERROR_AT("%s\n", g_ptrk_err_msg);
                        }
                        l_ret = STATUS_ERROR;
                        goto cleanup;
                }
                NDBG_OUTPUT("| %8u | %10u | %s%-8s%s |%s",
                            i_p,
                            l_mi.get_piece_size(i_p),
                            l_status_color,
                            l_status_str,
                            ANSI_COLOR_OFF,
                            (l_s == PTRK_STATUS_INVALID) ? "\n" : "\r");
        }
        NDBG_OUTPUT("\n");
        NDBG_OUTPUT("+----------+------------+----------+\n");
        // -------------------------------------------------
        // summary
        // -------------------------------------------------
        NDBG_OUTPUT("blocks requested: %lu received: %lu\n",
                    (unsigned long)l_ctx.m_num_blocks_rqstd,
                    (unsigned long)l_ctx.m_num_blocks_recvd);
        NDBG_OUTPUT("pieces valid: %s%lu%s invalid: %s%lu%s total: %lu\n",
                    ANSI_COLOR_FG_GREEN, (unsigned long)l_num_valid, ANSI_COLOR_OFF,
                    l_num_invalid ? ANSI_COLOR_FG_RED : ANSI_COLOR_OFF, (unsigned long)l_num_invalid, ANSI_COLOR_OFF,
                    (unsigned long)l_num_total);
        if (l_num_valid != l_num_total)
        {
                l_ret = STATUS_ERROR;
        }
cleanup:
        _close_data(l_ctx);
        ns_ptrk::trc_log_file_close();
        return l_ret;
}
