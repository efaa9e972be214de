/*
 * Copyright (c) 2003-2018, John Wiegley.  All rights reserved.
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
#include "ptree.h"

namespace beanprint {

namespace {
  bool option_takes_value(const string& name)
  {
    return name == "output" || name == "debug" || name == "trace";
  }
}

strings_list global_scope_t::read_command_arguments(strings_list args)
{
  bool anywhere = true;

  strings_list remaining;

  for (strings_list::iterator i = args.begin();
       i != args.end();
       i++) {
    DEBUG("option.args", "Examining argument '" << *i << "'");

    if (! anywhere || (*i)[0] != '-' || *i == "-") {
      DEBUG("option.args", "  adding to list of real args");
      remaining.push_back(*i);
      continue;
    }

    string           name;
    optional<string> value;

    // --long-option or -s
    if ((*i)[1] == '-') {
      if ((*i).length() == 2) {
        DEBUG("option.args", "  it's a --, ending options processing");
        anywhere = false;
        continue;
      }

      name = (*i).substr(2);
      string::size_type eq = name.find('=');
      if (eq != string::npos) {
        value = name.substr(eq + 1);
        name.erase(eq);
        DEBUG("option.args", "  read option value from option: " << *value);
      }
    }
    else if ((*i).length() == 2) {
      switch ((*i)[1]) {
      case 'o': name = "output";  break;
      case 'v': name = "verbose"; break;
      case 'h': name = "help";    break;
      default:
        throw_(option_error, _f("Illegal option %1%") % *i);
      }
    }
    else {
      throw_(option_error, _f("Illegal option %1%") % *i);
    }

    if (option_takes_value(name) && ! value) {
      if (++i == args.end())
        throw_(option_error, _f("Missing option argument for --%1%") % name);
      value = *i;
      DEBUG("option.args", "  read option value from arg: " << *value);
    }

    if (name == "output") {
      output_file = path(*value);
    }
    else if (name == "skip-unsupported") {
      skip_unsupported = true;
    }
    else if (name == "help") {
      show_help(std::cout);
      throw error_count(0, "");     // exit immediately
    }
    else if (name == "version") {
      show_version_info(std::cout);
      throw error_count(0, "");     // exit immediately
    }
    else if (name == "verbose" || name == "debug" || name == "trace") {
      // logging options are applied by handle_debug_options before this
    }
    else {
      throw_(option_error, _f("Illegal option --%1%") % name);
    }
  }

  return remaining;
}

void global_scope_t::render_file(const path& pathname, std::ostream& out)
{
  journal_file_t file(pathname == "-" ?
                      read_journal(std::cin) : read_journal(pathname));

  if (skip_unsupported) {
    if (std::size_t count = file.remove_unsupported())
      warning_(_f("Skipped %1% unsupported directives in %2%")
               % count % pathname);
  }

  try {
    renderer.render(file, out);
    if (! out.flush())
      throw_(io_error, _("Failed to flush the output stream"));
  }
  catch (const render_error&) {
    add_error_context(_f("While rendering %1%") % pathname);
    throw;
  }
}

int global_scope_t::execute_command(const strings_list& files)
{
  if (files.empty())
    throw_(option_error, _("No journal files were specified"));

  if (output_file) {
    INFO("Output file is " << output_file->string());

    ofstream out(*output_file);
    if (! out.good())
      throw_(std::runtime_error,
             _f("Cannot write output file %1%") % *output_file);

    foreach (const string& file, files)
      render_file(path(file), out);
  } else {
    foreach (const string& file, files)
      render_file(path(file), std::cout);
  }

  return 0;
}

void global_scope_t::report_error(const std::exception& err)
{
  std::cout.flush();            // first display anything that was pending

  // Display any pending error context information
  string context = error_context();
  if (! context.empty())
    std::cerr << context << std::endl;

  std::cerr << _("Error: ") << err.what() << std::endl;
}

void global_scope_t::show_help(std::ostream& out)
{
  out << _("\
Usage: beanprint [options] FILE...\n\
\n\
Writes each structured (JSON) ledger FILE as beancount text.  Use - to\n\
read from standard input.\n\
\n\
Options:\n\
  -o, --output FILE       write to FILE instead of standard output\n\
      --skip-unsupported  drop directives that cannot be rendered\n\
  -v, --verbose           log progress messages\n\
      --debug CATEGORY    log debug messages for categories matching CATEGORY\n\
      --trace LEVEL       log trace messages up to LEVEL\n\
      --version           show version information\n\
  -h, --help              show this help\n");
}

namespace {
  void raise_log_level(const log_level_t level)
  {
    if (_log_level < level)
      _log_level = level;
  }

  void set_debug_category(const char * category)
  {
#if DEBUG_ON
    raise_log_level(LOG_DEBUG);
    _log_category    = category;
    _log_category_re = none;
#endif
  }

  void set_trace_level(const char * level)
  {
#if TRACING_ON
    raise_log_level(LOG_TRACE);
    try {
      _trace_level = boost::lexical_cast<uint16_t>(level);
    }
    catch (const boost::bad_lexical_cast&) {
      throw std::logic_error(_("Argument to --trace must be an integer"));
    }
#endif
  }
}

void handle_debug_options(int argc, char * argv[])
{
  for (int i = 1; i < argc; i++) {
    const char * arg = argv[i];

    if (std::strcmp(arg, "--") == 0)
      break;                    // the rest are file names
    if (arg[0] != '-')
      continue;

    if (std::strcmp(arg, "--verbose") == 0 ||
        std::strcmp(arg, "-v") == 0) {
      raise_log_level(LOG_INFO);
    }
    else if (std::strncmp(arg, "--debug=", 8) == 0) {
      set_debug_category(arg + 8);
    }
    else if (i + 1 < argc && std::strcmp(arg, "--debug") == 0) {
      set_debug_category(argv[++i]);
    }
    else if (std::strncmp(arg, "--trace=", 8) == 0) {
      set_trace_level(arg + 8);
    }
    else if (i + 1 < argc && std::strcmp(arg, "--trace") == 0) {
      set_trace_level(argv[++i]);
    }
    else if (i + 1 < argc && std::strcmp(arg, "--output") == 0) {
      i++;                      // skip a file name that starts with '-'
    }
    else if (i + 1 < argc && std::strcmp(arg, "-o") == 0) {
      i++;
    }
  }
}

} // namespace beanprint
