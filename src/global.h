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

/**
 * @addtogroup report
 */

/**
 * @file   global.h
 * @author John Wiegley
 *
 * @ingroup report
 */
#ifndef _GLOBAL_H
#define _GLOBAL_H

#include "print.h"

namespace beanprint {

DECLARE_EXCEPTION(option_error, std::runtime_error);

class global_scope_t : public noncopyable
{
  renderer_t renderer;

public:
  optional<path> output_file;
  bool           skip_unsupported;

  global_scope_t() : skip_unsupported(false) {}

  /**
   * Handles every option in args and returns the remaining arguments,
   * i.e. the journal files to render.
   */
  strings_list read_command_arguments(strings_list args);

  /**
   * Renders each file in turn to the output, returning the process
   * status.
   */
  int execute_command(const strings_list& files);

  void render_file(const path& pathname, std::ostream& out);

  void report_error(const std::exception& err);

  void show_version_info(std::ostream& out) {
    out << "beanprint " << version;
    out << _(", writes structured ledgers as beancount text");
    out <<
      _("\n\nCopyright (c) 2003-2018, John Wiegley.  All rights reserved.\n\n\
This program is made available under the terms of the BSD Public License.");
    out << std::endl;
  }

  void show_help(std::ostream& out);
};

void handle_debug_options(int argc, char * argv[]);

} // namespace beanprint

#endif // _GLOBAL_H
