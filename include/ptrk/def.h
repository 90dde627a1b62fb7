#ifndef _PTRK_DEF_H_
#define _PTRK_DEF_H_
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#ifndef PTRK_STATUS_OK
  #define PTRK_STATUS_OK 0
#endif
#ifndef PTRK_STATUS_ERROR
  #define PTRK_STATUS_ERROR -1
#endif
#ifndef PTRK_STATUS_AGAIN
  #define PTRK_STATUS_AGAIN -2
#endif
#ifndef PTRK_STATUS_DONE
  #define PTRK_STATUS_DONE -4
#endif
// ---------------------------------------------------------
// completion for (offset, size) not pending
// ---------------------------------------------------------
#ifndef PTRK_STATUS_UNKNOWN_BLOCK
  #define PTRK_STATUS_UNKNOWN_BLOCK -5
#endif
// ---------------------------------------------------------
// piece digest mismatch
// ---------------------------------------------------------
#ifndef PTRK_STATUS_INVALID
  #define PTRK_STATUS_INVALID -6
#endif
#ifndef PTRK_ERR_LEN
  #define PTRK_ERR_LEN 4096
#endif
#ifndef PTRK_VERSION
  #define PTRK_VERSION "0.1.0"
#endif
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#define PTRK_BLOCK_SIZE                  (16*1024)
#define PTRK_MAX_PENDING_RQSTS                   5
#define PTRK_SHA1_SIZE                          20
#define PTRK_SHA1_SIZE_HEX                      40
//! ----------------------------------------------------------------------------
//! macros
//! ----------------------------------------------------------------------------
#ifndef PTRK_PERROR
#define PTRK_PERROR(...) do { \
    TRC_ERROR(__VA_ARGS__); \
    snprintf(g_ptrk_err_msg, PTRK_ERR_LEN, __VA_ARGS__); \
} while(0)
#endif
//! ----------------------------------------------------------------------------
//! global extern
//! ----------------------------------------------------------------------------
extern char g_ptrk_err_msg[PTRK_ERR_LEN];
#endif
