#ifndef LASERCUT_PROCESS_MESSAGE_SINK_HPP
#define LASERCUT_PROCESS_MESSAGE_SINK_HPP

#include "processing_options.hpp"
#include <string>
#include <vector>

namespace lasercut {

struct ProcessMessage {
    std::string text;
    bool is_debug_only = true;

    bool operator==(const ProcessMessage& other) const = default;
};

// Destination for processing messages
class MessageSink {
public:
    virtual ~MessageSink() = default;
    virtual void write(const ProcessMessage& message) = 0;
};

// Forwards to a user callback when debug_mode is on or the message is
// always visible. A missing callback drops everything.
class CallbackSink : public MessageSink {
public:
    CallbackSink(MessageCallback callback, bool debug_mode);

    void write(const ProcessMessage& message) override;

private:
    MessageCallback callback_;
    bool debug_mode_;
};

// Keeps every message in order, then hands it to the wrapped sink
class RecordingSink : public MessageSink {
public:
    explicit RecordingSink(MessageSink& inner);

    void write(const ProcessMessage& message) override;

    const std::vector<ProcessMessage>& messages() const { return messages_; }
    std::vector<ProcessMessage> take_messages();

private:
    MessageSink& inner_;
    std::vector<ProcessMessage> messages_;
};

// Front end used by the pipeline. Every message is also traced to the spdlog
// logger at debug level, so it never duplicates what the callback prints.
class MessageLog {
public:
    explicit MessageLog(MessageSink& sink);

    void debug(const std::string& text);   // debug-only
    void always(const std::string& text);  // always visible
    void write(const ProcessMessage& message);

private:
    MessageSink& sink_;
};

}  // namespace lasercut

#endif // LASERCUT_PROCESS_MESSAGE_SINK_HPP
