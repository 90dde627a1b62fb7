//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "ptrk/def.h"
#include "support/trace.h"
#include <errno.h>
#include <string.h>
namespace ns_ptrk {
//! ----------------------------------------------------------------------------
//! globals
//! ----------------------------------------------------------------------------
static trc_log_level_t g_trc_log_level = TRC_LOG_LEVEL_NONE;
static FILE* g_trc_log_file = nullptr;
static bool g_trc_log_file_owned = false;
//! ----------------------------------------------------------------------------
//! \details: set trace level -messages at or below level are written
//! \return:  NA
//! \param:   a_level level
//! ----------------------------------------------------------------------------
void trc_log_level_set(trc_log_level_t a_level)
{
        g_trc_log_level = a_level;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
trc_log_level_t trc_log_level_get(void)
{
        return g_trc_log_level;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
bool trc_log_level_enabled(trc_log_level_t a_level)
{
        if (a_level == TRC_LOG_LEVEL_NONE)
        {
                return false;
        }
        return (a_level <= g_trc_log_level);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
const char* trc_log_level_str(trc_log_level_t a_level)
{
        switch(a_level)
        {
        case TRC_LOG_LEVEL_ERROR:   { return "[ERROR]  "; }
        case TRC_LOG_LEVEL_WARN:    { return "[WARN]   "; }
        case TRC_LOG_LEVEL_DEBUG:   { return "[DEBUG]  "; }
        case TRC_LOG_LEVEL_VERBOSE: { return "[VERBOSE]"; }
        case TRC_LOG_LEVEL_ALL:     { return "[ALL]    "; }
        default:
        {
                break;
        }
        }
        return "[NONE]   ";
}
//! ----------------------------------------------------------------------------
//! \details: route trace output to file -stdout/stderr are not closed
//! \return:  PTRK_STATUS_OK on success
//! \param:   a_file path
//! ----------------------------------------------------------------------------
int32_t trc_log_file_open(const std::string& a_file)
{
        int32_t l_s;
        l_s = trc_log_file_close();
        if (l_s != PTRK_STATUS_OK)
        {
                return PTRK_STATUS_ERROR;
        }
        if (a_file == "/dev/stdout")
        {
                g_trc_log_file = stdout;
                return PTRK_STATUS_OK;
        }
        if (a_file == "/dev/stderr")
        {
                g_trc_log_file = stderr;
                return PTRK_STATUS_OK;
        }
        errno = 0;
        g_trc_log_file = fopen(a_file.c_str(), "a");
        if (!g_trc_log_file)
        {
                fprintf(stderr, "error opening trace log file: %s.  Reason: %s\n",
                        a_file.c_str(),
                        strerror(errno));
                return PTRK_STATUS_ERROR;
        }
        g_trc_log_file_owned = true;
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t trc_log_file_close(void)
{
        if (g_trc_log_file &&
            g_trc_log_file_owned)
        {
                int l_s;
                l_s = fclose(g_trc_log_file);
                g_trc_log_file = nullptr;
                g_trc_log_file_owned = false;
                if (l_s != 0)
                {
                        return PTRK_STATUS_ERROR;
                }
        }
        g_trc_log_file = nullptr;
        return PTRK_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: current trace output -falls back to stderr when unset
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
FILE* trc_log_file(void)
{
        if (!g_trc_log_file)
        {
                return stderr;
        }
        return g_trc_log_file;
}
}
