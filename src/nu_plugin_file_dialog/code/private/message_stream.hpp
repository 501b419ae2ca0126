#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string_view>

#include "nu_value.hpp"

namespace nu_plugin_file_dialog
{

// The engine sent bytes that are not a message. The channel cannot be resynchronized after this.
class ProtocolError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// JSON plugin encoding: the plugin announces "json" once, then both sides write one JSON value per line
class MessageStream
{
public:
    MessageStream(std::istream& input, std::ostream& output) : input_(input), output_(output) {}

    // Length-prefixed encoding name, sent once before any message
    void WriteEncoding(std::string_view encoding);

    void Write(const Json& message);

    // Returns nullopt at end of input. Throws ProtocolError on malformed JSON.
    [[nodiscard]] std::optional<Json> Read();

private:
    std::istream& input_;
    std::ostream& output_;
};

}  // namespace nu_plugin_file_dialog
