//
// Copyright (c) 2006-present Benjamin Kaufmann
//
// This file is part of Grasp.
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to
// deal in the Software without restriction, including without limitation the
// rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
// sell copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
//
#include <grasp/event.h>

#include <potassco/bits.h>

#include <cstdarg>
#include <cstdio>
#include <iterator>

namespace Grasp {
/////////////////////////////////////////////////////////////////////////////////////////
// Event
/////////////////////////////////////////////////////////////////////////////////////////
uint32_t Event::nextId() {
    static uint32_t id_s = 0;
    return id_s++;
}
/////////////////////////////////////////////////////////////////////////////////////////
// EventHandler
/////////////////////////////////////////////////////////////////////////////////////////
EventHandler::EventHandler(Event::Verbosity verbosity) : verb_(0) {
    if (uint32_t x = verbosity) {
        uint32_t r = (x | (x << 4) | (x << 8));
        verb_      = static_cast<uint16_t>(r);
    }
}
EventHandler::~EventHandler() = default;
void EventHandler::setVerbosity(Event::Subsystem sys, Event::Verbosity verb) {
    uint32_t s = static_cast<uint32_t>(sys) << verb_shift;
    uint32_t r = verb_;
    Potassco::store_clear_mask(r, verb_mask << s);
    Potassco::store_set_mask(r, static_cast<uint32_t>(verb) << s);
    verb_ = static_cast<uint16_t>(r);
}
/////////////////////////////////////////////////////////////////////////////////////////
// reporting helpers
/////////////////////////////////////////////////////////////////////////////////////////
POTASSCO_ATTRIBUTE_FORMAT(3, 4) void warnFmt(EventHandler* handler, Event::Subsystem sys, const char* fmt, ...) {
    if (handler && fmt && *fmt) {
        va_list args;
        va_start(args, fmt);
        char msg[1024];
        std::vsnprintf(msg, std::size(msg), fmt, args);
        va_end(args);
        handler->dispatch(LogEvent(sys, Event::verbosity_quiet, LogEvent::warning, msg));
    }
}
void report(EventHandler* handler, Event::Subsystem sys, Event::Verbosity v, const char* what) {
    if (handler) {
        handler->dispatch(LogEvent(sys, v, LogEvent::message, what));
    }
}
} // namespace Grasp
