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
 * @addtogroup util
 */

/**
 * @file   stream.h
 * @author John Wiegley, Omari Norman
 *
 * @ingroup util
 *
 * @brief Abstractions for where formatted output goes.
 *
 * A formatted journal is either collected in memory, so that it can
 * replace the file it came from once it is complete, or sent straight
 * to an output stream as it is produced.  Both kinds of sink receive
 * exactly the same sequence of writes.
 */
#ifndef _STREAM_H
#define _STREAM_H

#include "utils.h"

namespace beautifier {

/**
 * @brief Destination for formatted text
 */
class output_sink_t : public noncopyable
{
public:
  virtual ~output_sink_t() {}

  virtual void write(const string& str) = 0;
  virtual void flush() {}
};

/**
 * @brief Accumulates all output in a string
 */
class buffer_sink_t : public output_sink_t
{
  string buffer;

public:
  explicit buffer_sink_t(std::size_t reserve = 0) {
    buffer.reserve(reserve);
  }

  virtual void write(const string& str) {
    buffer.append(str);
  }

  const string& str() const {
    return buffer;
  }
};

/**
 * @brief Writes output directly to an ostream
 *
 * The ostream is not owned by the sink.  Any failure to write is
 * reported by flush().
 */
class stream_sink_t : public output_sink_t
{
  std::ostream * os;

public:
  explicit stream_sink_t(std::ostream& out) : os(&out) {}

  virtual void write(const string& str) {
    *os << str;
  }
  virtual void flush();
};

} // namespace beautifier

#endif // _STREAM_H
