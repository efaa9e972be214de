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

#include "journal.h"

namespace beanprint {

namespace {
  std::size_t remove_unsupported_directives(directives_list& directives)
  {
    directives_list::iterator i =
      std::remove_if(directives.begin(), directives.end(), is_unsupported);
    std::size_t count =
      static_cast<std::size_t>(std::distance(i, directives.end()));
    directives.erase(i, directives.end());

    DEBUG("journal.filter", "Removed " << count << " unsupported directives");
    return count;
  }
}

std::size_t journal_file_t::remove_unsupported()
{
  return remove_unsupported_directives(directives);
}

void journal_t::add(const journal_file_t& file)
{
  DEBUG("journal.add", "Adding " << file.directives.size()
        << " directives from "
        << (file.filename ? file.filename->string() : string("<stream>")));

  directives.insert(directives.end(),
                    file.directives.begin(), file.directives.end());
}

std::size_t journal_t::remove_unsupported()
{
  return remove_unsupported_directives(directives);
}

} // namespace beanprint
