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
#pragma once

#include <grasp/graspfwd.h>

#include <potassco/platform.h>

#include <type_traits>

/*!
 * \file
 * \brief Types for reporting progress and problems to interested clients.
 */
namespace Grasp {

//! Base class for library events.
struct Event {
    template <typename T>
    struct Id {
        static const uint32_t id_s;
    };

    //! Set of known event sources.
    enum Subsystem { subsystem_parse = 0, subsystem_build = 1, subsystem_write = 2 };
    //! Possible verbosity levels.
    enum Verbosity { verbosity_quiet = 0, verbosity_low = 1, verbosity_high = 2, verbosity_max = 3 };
    template <typename SelfType>
    Event(SelfType*, Subsystem sys, Verbosity verbosity)
        : system(sys)
        , verb(verbosity)
        , op(0)
        , id(eventId<SelfType>()) {
        static_assert(std::is_base_of_v<Event, SelfType>);
    }
    static uint32_t nextId();
    template <typename T>
    static uint32_t eventId() {
        return Id<T>::id_s;
    }

    uint32_t system : 2;  //!< One of Event::Subsystem - subsystem that produced the event.
    uint32_t verb   : 2;  //!< One of Event::Verbosity - the verbosity level of this event.
    uint32_t op     : 8;  //!< Operation that triggered the event.
    uint32_t id     : 16; //!< Type id of event.
};
template <typename T>
const uint32_t Event::Id<T>::id_s = Event::nextId();

template <typename ToType>
const ToType* event_cast(const Event& ev) {
    return ev.id == Event::eventId<ToType>() ? static_cast<const ToType*>(&ev) : nullptr;
}

//! Event type for log or warning messages.
struct LogEvent : Event {
    enum Type { message = 'M', warning = 'W' };
    LogEvent(Subsystem sys, Verbosity v, Type t, const char* what) : Event(this, sys, v), msg(what) {
        op = static_cast<uint32_t>(t);
    }
    [[nodiscard]] bool isWarning() const { return op == static_cast<uint32_t>(warning); }
    const char*        msg;
};

//! Event type reporting a resource that was completely read or written.
struct ResourceEvent : Event {
    enum Operation { op_read = 'R', op_write = 'W' };
    ResourceEvent(Subsystem sys, Operation o, const char* res, uint32_t n, uint32_t e)
        : Event(this, sys, verbosity_low)
        , name(res)
        , nodes(n)
        , edges(e) {
        op = static_cast<uint32_t>(o);
    }
    [[nodiscard]] bool isWrite() const { return op == static_cast<uint32_t>(op_write); }
    const char*        name;
    uint32_t           nodes;
    uint32_t           edges;
};

//! Base class for event handlers.
class EventHandler {
public:
    //! Creates a handler for events with given verbosity or lower.
    explicit EventHandler(Event::Verbosity verbosity = Event::verbosity_quiet);
    virtual ~EventHandler();
    EventHandler(const EventHandler&)            = delete;
    EventHandler& operator=(const EventHandler&) = delete;

    //! Sets the verbosity for the given event source.
    /*!
     * Events with higher verbosity are not dispatched to this handler.
     */
    void                   setVerbosity(Event::Subsystem sys, Event::Verbosity verb);
    [[nodiscard]] uint32_t verbosity(Event::Subsystem sys) const {
        return (static_cast<uint32_t>(verb_) >> (static_cast<uint32_t>(sys) << verb_shift)) & verb_mask;
    }
    //! Calls onEvent(ev) if ev has acceptable verbosity.
    void dispatch(const Event& ev) {
        if (ev.verb <= verbosity(static_cast<Event::Subsystem>(ev.system))) {
            onEvent(ev);
        }
    }
    virtual void onEvent(const Event& /* ev */) {}

private:
    static constexpr auto verb_mask  = 15u;
    static constexpr auto verb_shift = 2u;

    uint16_t verb_;
};

//! Dispatches a warning built from fmt to handler if handler is not null.
void warnFmt(EventHandler* handler, Event::Subsystem sys, const char* fmt, ...) POTASSCO_ATTRIBUTE_FORMAT(3, 4);
//! Dispatches an informational message to handler if handler is not null.
void report(EventHandler* handler, Event::Subsystem sys, Event::Verbosity v, const char* what);

} // namespace Grasp
