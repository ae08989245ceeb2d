#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// -----------------------------------------------------------------------------
// Parse events delivered by a markup tokenizer.
// -----------------------------------------------------------------------------

namespace sax2md {

    using Attrs = std::vector<std::pair<std::string, std::string>>;

    struct OpenEvent {
        std::string name;
        Attrs attrs;
    };

    struct TextEvent {
        std::string value;
    };

    struct CloseEvent {
        std::string name;
    };

    using Event = std::variant<OpenEvent, TextEvent, CloseEvent>;

    class EventSink {
    public:
        virtual ~EventSink() = default;
        virtual void on_open(std::string_view name, const Attrs& attrs) = 0;
        virtual void on_text(std::string_view value) = 0;
        virtual void on_close(std::string_view name) = 0;
    };

    // Replays a recorded sequence into a sink.
    inline void replay(const std::vector<Event>& events, EventSink& sink) {
        for (const auto& ev : events) {
            if (auto* o = std::get_if<OpenEvent>(&ev)) sink.on_open(o->name, o->attrs);
            else if (auto* t = std::get_if<TextEvent>(&ev)) sink.on_text(t->value);
            else if (auto* c = std::get_if<CloseEvent>(&ev)) sink.on_close(c->name);
        }
    }

    // Sink that records every event, used to inspect what a tokenizer produced.
    class EventLog : public EventSink {
    public:
        std::vector<Event> events;

        void on_open(std::string_view name, const Attrs& attrs) override {
            events.push_back(OpenEvent{std::string(name), attrs});
        }
        void on_text(std::string_view value) override {
            events.push_back(TextEvent{std::string(value)});
        }
        void on_close(std::string_view name) override {
            events.push_back(CloseEvent{std::string(name)});
        }
    };

}
