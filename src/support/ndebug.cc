//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "ndebug.h"
#include <stddef.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>
// support backtrace
#include <execinfo.h>
// support demangled symbols
#include <cxxabi.h>
namespace ns_ptrk {
//! ----------------------------------------------------------------------------
//! \details: render current stack into ao_stack_str (skips own frames)
//! \return:  0
//! \param:   ao_stack_str buffer of NDBG_MAX_BACKTRACE_TAG_SIZE
//! ----------------------------------------------------------------------------
static int get_stack_string(char* ao_stack_str, size_t a_len) {
  void* l_stack_addrs[NDBG_NUM_BACKTRACE_IN_TAG] = {(void*)0};
  int l_stack_depth = backtrace(l_stack_addrs, NDBG_NUM_BACKTRACE_IN_TAG);
  char** l_stack_strings = backtrace_symbols(l_stack_addrs, l_stack_depth);
  ao_stack_str[0] = '\0';
  if (!l_stack_strings) {
    return 0;
  }
  size_t l_used = 0;
  // skip 0 -get_stack_string and 1 -print_bt
  for (int i = 2; i < l_stack_depth; i++) {
    std::string l_entry(l_stack_strings[i]);
    std::string l_name = l_entry;
    size_t l_open_paren = l_entry.find('(');
    size_t l_plus = l_entry.find('+', l_open_paren);
    if ((l_open_paren != std::string::npos) &&
        (l_plus != std::string::npos) &&
        (l_plus > l_open_paren + 1)) {
      int l_s = 0;
      std::string l_mangled = l_entry.substr(l_open_paren + 1, l_plus - l_open_paren - 1);
      char* l_pretty_name = abi::__cxa_demangle(l_mangled.c_str(), 0, 0, &l_s);
      if (l_pretty_name) {
        l_name = l_pretty_name;
        free(l_pretty_name);
      }
    }
    int l_n = snprintf(ao_stack_str + l_used, a_len - l_used, "%sFrm[%d]:%s%s%s\n",
                       (i == 2) ? ANSI_COLOR_FG_RED : ANSI_COLOR_FG_BLUE, i - 2,
                       ANSI_COLOR_FG_GREEN, l_name.c_str(), ANSI_COLOR_OFF);
    if ((l_n < 0) ||
        ((size_t)l_n >= (a_len - l_used))) {
      break;
    }
    l_used += (size_t)l_n;
  }
  free(l_stack_strings);
  return 0;
}
//! ----------------------------------------------------------------------------
//! \details: print backtrace to stderr
//! \return:  NA
//! \param:   a_file/a_func/a_line call site
//! ----------------------------------------------------------------------------
void print_bt(const char* a_file, const char* a_func, const int a_line) {
  char l_func_str[NDBG_MAX_BACKTRACE_TAG_SIZE] = "";
  get_stack_string(l_func_str, sizeof(l_func_str));
  fprintf(stderr, "%s=====>> B A C K T R A C E <<=====%s \n(%s%s::%s%s::%d)\n",
          ANSI_COLOR_BG_BLUE, ANSI_COLOR_OFF, ANSI_COLOR_FG_YELLOW, a_file,
          a_func, ANSI_COLOR_OFF, a_line);
  fprintf(stderr, "%s\n", l_func_str);
  fflush(stderr);
}
}  // namespace ns_ptrk
