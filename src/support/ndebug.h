#ifndef _PTRK_NDEBUG_H
#define _PTRK_NDEBUG_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "support/trace.h"
#include <stdio.h>
#include <stdlib.h>
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#define NDBG_NUM_BACKTRACE_IN_TAG 20
#define NDBG_MAX_BACKTRACE_TAG_SIZE 8192
//! ----------------------------------------------------------------------------
//! ansi color codes
//! ----------------------------------------------------------------------------
#define ANSI_COLOR_OFF          "\033[0m"
#define ANSI_COLOR_FG_BLACK     "\033[01;30m"
#define ANSI_COLOR_FG_RED       "\033[01;31m"
#define ANSI_COLOR_FG_GREEN     "\033[01;32m"
#define ANSI_COLOR_FG_YELLOW    "\033[01;33m"
#define ANSI_COLOR_FG_BLUE      "\033[01;34m"
#define ANSI_COLOR_FG_MAGENTA   "\033[01;35m"
#define ANSI_COLOR_FG_CYAN      "\033[01;36m"
#define ANSI_COLOR_FG_WHITE     "\033[01;37m"
#define ANSI_COLOR_BG_RED       "\033[01;41m"
#define ANSI_COLOR_BG_GREEN     "\033[01;42m"
#define ANSI_COLOR_BG_BLUE      "\033[01;44m"
//! ----------------------------------------------------------------------------
//! macros
//! ----------------------------------------------------------------------------
#ifndef UNUSED
#define UNUSED(x) ( (void)(x) )
#endif
#ifndef NDBG_OUTPUT
#define NDBG_OUTPUT(...) \
                do { \
                        fprintf(stdout, __VA_ARGS__); \
                        fflush(stdout); \
                } while(0)
#endif
#ifndef NDBG_PRINT
#define NDBG_PRINT(...) \
                do { \
                        fprintf(stdout, "%s:%s.%d: ", __FILE__, __FUNCTION__, __LINE__); \
                        fprintf(stdout, __VA_ARGS__);               \
                        fflush(stdout); \
                } while(0)
#endif
#ifndef NDBG_ERROR_AT
#define NDBG_ERROR_AT(...) \
                do { \
                        fprintf(stderr, "%s:%s.%d: %sERROR%s ", __FILE__, __FUNCTION__, __LINE__, \
                                ANSI_COLOR_FG_RED, ANSI_COLOR_OFF); \
                        fprintf(stderr, __VA_ARGS__); \
                        fflush(stderr); \
                } while(0)
#endif
#ifndef NDBG_PRINT_BT
#define NDBG_PRINT_BT() ns_ptrk::print_bt(__FILE__, __FUNCTION__, __LINE__)
#endif
// ---------------------------------------------------------
// unrecoverable: trace, write to stderr, dump stack, abort
// ---------------------------------------------------------
#ifndef NDBG_ABORT
#define NDBG_ABORT(...) \
                do { \
                        TRC_ERROR(__VA_ARGS__); \
                        fprintf(stderr, "%sFATAL%s %s:%s.%d: ", \
                                ANSI_COLOR_BG_RED, ANSI_COLOR_OFF, \
                                __FILE__, __FUNCTION__, __LINE__); \
                        fprintf(stderr, __VA_ARGS__); \
                        fprintf(stderr, "\n"); \
                        fflush(stderr); \
                        NDBG_PRINT_BT(); \
                        abort(); \
                } while(0)
#endif
namespace ns_ptrk {
//! ----------------------------------------------------------------------------
//! prototypes
//! ----------------------------------------------------------------------------
void print_bt(const char* a_file, const char* a_func, const int a_line);
}
#endif
