/*
 * Copyright (c) 2003-2023, John Wiegley.  All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 * - Redistributions of source code must retain the above copyright
 *   notice, this list of conditions and the following disclaimer.
 *
 * - Redistributions in binary form must reproduce the above copyright
 *   notice, this list of conditions and the following disclaimer in the
 *   documentation and/or other materials provided with the distribution.
 *
 * - Neither the name of New Artisans LLC nor the names of its
 *   contributors may be used to endorse or promote products derived from
 *   this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
 * OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 * LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
 * DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
 * THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/**
 * @addtogroup report
 */

/**
 * @file   global.h
 * @author John Wiegley
 *
 * @ingroup report
 *
 * @brief The command-line driver.
 *
 * global_scope_t owns the program's options, reads them from the
 * environment and the command line, and beautifies each file it is
 * given.  A failure on one file is reported and does not prevent the
 * remaining files from being processed.
 */
#ifndef _GLOBAL_H
#define _GLOBAL_H

#include "option.h"
#include "beautify.h"

namespace beautifier {

class global_scope_t : public noncopyable, public option_scope_t
{
public:
  global_scope_t(char ** envp);

  void         read_environment_settings(char * envp[]);
  strings_list read_command_arguments(strings_list args);

  config_t config() const {
    config_t conf;
    conf.inplace = HANDLED(inplace);
    return conf;
  }

  /**
   * Beautify every file named in \p args ("-" is standard input).
   *
   * @return 0 when every file was processed, 1 otherwise.
   */
  int  execute(strings_list args);
  void beautify_file(const string& name);

  void report_error(const std::exception& err);

  void show_version_info(std::ostream& out) {
    out <<
      "ledger-beautifier " << Beautifier_VERSION_MAJOR << '.'
                           << Beautifier_VERSION_MINOR << '.'
                           << Beautifier_VERSION_PATCH
                           << Beautifier_VERSION_PRERELEASE;
    if (Beautifier_VERSION_DATE != 0)
      out << '-' << Beautifier_VERSION_DATE;
    out << _(", a canonical layout for ledger journals");
    out << std::endl;
  }

  void show_help(std::ostream& out);

  virtual option_base_t * lookup_option(const char * p);

  OPTION(global_scope_t, debug_);

  OPTION_(global_scope_t, help, DO() { // -h
      parent->show_help(std::cout);
      throw error_count(0, "");     // exit immediately
    });

  OPTION(global_scope_t, inplace); // -i
  OPTION(global_scope_t, trace_);
  OPTION(global_scope_t, verbose);

  OPTION_(global_scope_t, version, DO() { // -v
      parent->show_version_info(std::cout);
      throw error_count(0, "");     // exit immediately
    });
};

/**
 * Set up logging from --verbose, --debug and --trace before anything
 * else looks at the command line.
 */
void handle_debug_options(int argc, char * argv[]);

} // namespace beautifier

#endif // _GLOBAL_H
