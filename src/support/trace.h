#ifndef _PTRK_TRACE_H
#define _PTRK_TRACE_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stdio.h>
#include <stdint.h>
#include <string>
//! ----------------------------------------------------------------------------
//! macros
//! ----------------------------------------------------------------------------
#ifndef TRC_OUTPUT
#define TRC_OUTPUT(...) do { \
        FILE* _trc_file = ns_ptrk::trc_log_file(); \
        if (_trc_file) { \
                fprintf(_trc_file, __VA_ARGS__); \
                fflush(_trc_file); \
        } \
} while(0)
#endif
// ---------------------------------------------------------
// leveled
// ---------------------------------------------------------
#define TRC_PRINT(_level, _fmt, ...) do { \
        if (ns_ptrk::trc_log_level_enabled(_level)) { \
                TRC_OUTPUT("%s %s:%s.%d: " _fmt "\n", \
                           ns_ptrk::trc_log_level_str(_level), \
                           __FILE__, __FUNCTION__, __LINE__, \
                           ##__VA_ARGS__); \
        } \
} while(0)
#define TRC_ERROR(_fmt, ...)   TRC_PRINT(ns_ptrk::TRC_LOG_LEVEL_ERROR, _fmt, ##__VA_ARGS__)
#define TRC_WARN(_fmt, ...)    TRC_PRINT(ns_ptrk::TRC_LOG_LEVEL_WARN, _fmt, ##__VA_ARGS__)
#define TRC_DEBUG(_fmt, ...)   TRC_PRINT(ns_ptrk::TRC_LOG_LEVEL_DEBUG, _fmt, ##__VA_ARGS__)
#define TRC_VERBOSE(_fmt, ...) TRC_PRINT(ns_ptrk::TRC_LOG_LEVEL_VERBOSE, _fmt, ##__VA_ARGS__)
#define TRC_ALL(_fmt, ...)     TRC_PRINT(ns_ptrk::TRC_LOG_LEVEL_ALL, _fmt, ##__VA_ARGS__)
namespace ns_ptrk {
//! ----------------------------------------------------------------------------
//! trace levels
//! ----------------------------------------------------------------------------
typedef enum {
        TRC_LOG_LEVEL_NONE = 0,
        TRC_LOG_LEVEL_ERROR,
        TRC_LOG_LEVEL_WARN,
        TRC_LOG_LEVEL_DEBUG,
        TRC_LOG_LEVEL_VERBOSE,
        TRC_LOG_LEVEL_ALL
} trc_log_level_t;
//! ----------------------------------------------------------------------------
//! prototypes
//! ----------------------------------------------------------------------------
void trc_log_level_set(trc_log_level_t a_level);
trc_log_level_t trc_log_level_get(void);
bool trc_log_level_enabled(trc_log_level_t a_level);
const char* trc_log_level_str(trc_log_level_t a_level);
int32_t trc_log_file_open(const std::string& a_file);
int32_t trc_log_file_close(void);
FILE* trc_log_file(void);
}
#endif
