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

#include <system.hh>

#include "global.h"

namespace beautifier {

global_scope_t::global_scope_t(char ** envp)
{
  // Options are read from the environment (LEDGER_BEAUTIFIER_<option>)
  // first, so that the command line may override them.
  if (envp)
    read_environment_settings(envp);
}

void global_scope_t::report_error(const std::exception& err)
{
  std::cout.flush();            // first display anything that was pending

  if (caught_signal == NONE_CAUGHT) {
    // Display any pending error context information
    string context = error_context();
    if (! context.empty())
      std::cerr << context << std::endl;

    std::cerr << _("Error: ") << err.what() << std::endl;
  } else {
    caught_signal = NONE_CAUGHT;
  }
}

int global_scope_t::execute(strings_list args)
{
  if (args.empty())
    args.push_back("-");

  if (HANDLED(inplace))
    for (const string& name : args)
      if (name == "-")
        throw_(option_error,
               _("--inplace cannot be used when reading standard input"));

  int status = 0;

  for (const string& name : args) {
    try {
      beautify_file(name);
    }
    catch (const std::exception& err) {
      if (caught_signal != NONE_CAUGHT)
        throw;

      string current_context = error_context();
      if (name == "-")
        add_error_context(_("While beautifying standard input:"));
      else
        add_error_context(_f("While beautifying file %1%:") % path(name));
      if (! current_context.empty())
        add_error_context(current_context);

      report_error(err);
      status = 1;
    }
  }

  return status;
}

void global_scope_t::beautify_file(const string& name)
{
  if (name == "-") {
    string text((std::istreambuf_iterator<char>(std::cin)),
                std::istreambuf_iterator<char>());
    beautify(text, config(), std::cout);
    return;
  }

  path pathname(name);

  INFO_START(file, "Beautified file " << pathname);

  string text      = read_file(pathname);
  string formatted = beautify(text, config(), std::cout);

  if (HANDLED(inplace)) {
    if (formatted == text)
      INFO("File " << pathname << " is already formatted");
    else
      write_file(pathname, formatted);
  }

  INFO_FINISH(file);
}

void global_scope_t::show_help(std::ostream& out)
{
  out << _("Usage: ledger-beautifier [OPTIONS] [FILE...]\n\
\n\
Rewrite ledger journal files in a canonical layout.  With no FILE, or\n\
when FILE is -, read standard input.\n\
\n\
Options:\n\
  -i, --inplace        rewrite each FILE instead of printing it\n\
  -h, --help           print this help and exit\n\
  -v, --version        print version information and exit\n\
      --verbose        log progress to standard error\n\
      --debug CATEGORY log debug messages whose category matches CATEGORY\n\
      --trace LEVEL    log trace messages up to LEVEL\n\
\n\
Any option may also be given in the environment, as in\n\
LEDGER_BEAUTIFIER_INPLACE=1.\n");
}

option_base_t * global_scope_t::lookup_option(const char * p)
{
  switch (*p) {
  case 'd':
    OPT(debug_);
    break;
  case 'h':
    OPT_(help);
    break;
  case 'i':
    OPT_(inplace);
    break;
  case 't':
    OPT(trace_);
    break;
  case 'v':
    OPT(verbose);
    else OPT_(version);
    break;
  }
  return NULL;
}

void global_scope_t::read_environment_settings(char * envp[])
{
  TRACE_START(environment, 1, "Processed environment variables");

  process_environment(const_cast<const char **>(envp), "LEDGER_BEAUTIFIER_",
                      *this);

  TRACE_FINISH(environment, 1);
}

strings_list global_scope_t::read_command_arguments(strings_list args)
{
  TRACE_START(arguments, 1, "Processed command-line arguments");

  strings_list remaining = process_arguments(args, *this);

  TRACE_FINISH(arguments, 1);

  return remaining;
}

void handle_debug_options(int argc, char * argv[])
{
  for (int i = 1; i < argc; i++) {
    if (argv[i][0] == '-') {
      if (std::strcmp(argv[i], "--") == 0) {
        break;
      }
      else if (std::strcmp(argv[i], "--verbose") == 0) {
        _log_level = LOG_INFO;
      }
      else if (i + 1 < argc && std::strcmp(argv[i], "--debug") == 0) {
#if DEBUG_ON
        _log_level    = LOG_DEBUG;
        _log_category = argv[i + 1];
#endif
        i++;
      }
      else if (i + 1 < argc && std::strcmp(argv[i], "--trace") == 0) {
#if TRACING_ON
        _log_level   = LOG_TRACE;
        try {
          _trace_level = boost::lexical_cast<uint16_t>(argv[i + 1]);
        }
        catch (const boost::bad_lexical_cast&) {
          throw std::logic_error(_("Argument to --trace must be an integer"));
        }
#endif
        i++;
      }
    }
  }
}

} // namespace beautifier
