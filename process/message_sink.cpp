#include "message_sink.hpp"
#include <common/logging.hpp>

namespace lasercut {

CallbackSink::CallbackSink(MessageCallback callback, bool debug_mode)
    : callback_(std::move(callback)), debug_mode_(debug_mode) {}

void CallbackSink::write(const ProcessMessage& message) {
    if (callback_ && (debug_mode_ || !message.is_debug_only)) {
        callback_(message.text, message.is_debug_only);
    }
}

RecordingSink::RecordingSink(MessageSink& inner) : inner_(inner) {}

void RecordingSink::write(const ProcessMessage& message) {
    messages_.push_back(message);
    inner_.write(message);
}

std::vector<ProcessMessage> RecordingSink::take_messages() {
    std::vector<ProcessMessage> taken = std::move(messages_);
    messages_.clear();
    return taken;
}

MessageLog::MessageLog(MessageSink& sink) : sink_(sink) {}

void MessageLog::debug(const std::string& text) {
    write({text, true});
}

void MessageLog::always(const std::string& text) {
    write({text, false});
}

void MessageLog::write(const ProcessMessage& message) {
    // Callers print visible messages themselves; the logger only traces them
    logging::get_logger()->debug("{}{}", message.is_debug_only ? "" : "[message] ", message.text);
    sink_.write(message);
}

}  // namespace lasercut
