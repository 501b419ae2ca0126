#include "message_stream.hpp"

#include <fmt/format.h>

#include "klgl/error_handling.hpp"

namespace nu_plugin_file_dialog
{

void MessageStream::WriteEncoding(std::string_view encoding)
{
    klgl::ErrorHandling::Ensure(encoding.size() < 256, "Encoding name \"{}\" is too long", encoding);

    output_.put(static_cast<char>(encoding.size()));
    output_.write(encoding.data(), static_cast<std::streamsize>(encoding.size()));
    output_.flush();
}

void MessageStream::Write(const Json& message)
{
    // Paths that are not valid UTF-8 get replacement characters instead of failing the whole response
    output_ << message.dump(-1, ' ', false, Json::error_handler_t::replace) << '\n';
    output_.flush();

    klgl::ErrorHandling::Ensure(output_.good(), "Failed to write a message to the engine");
}

std::optional<Json> MessageStream::Read()
{
    input_ >> std::ws;
    if (input_.peek() == std::istream::traits_type::eof()) return std::nullopt;

    Json message;
    try
    {
        input_ >> message;
    }
    catch (const Json::parse_error& ex)
    {
        throw ProtocolError(fmt::format("Malformed message from the engine: {}", ex.what()));
    }

    return message;
}

}  // namespace nu_plugin_file_dialog
