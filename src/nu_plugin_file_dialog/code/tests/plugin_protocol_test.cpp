#include <gtest/gtest.h>

#include <variant>

#include "evaluated_call.hpp"
#include "labeled_error.hpp"
#include "plugin_protocol.hpp"
#include "test_helpers.hpp"

namespace nu_plugin_file_dialog::test
{

using namespace protocol;  // NOLINT

TEST(PluginProtocolTest, DecodesHello)
{
    const auto input = DecodeInput(Json::parse(R"({"Hello": {"protocol": "nu-plugin", "version": "0.102.0", "features": []}})"));
    ASSERT_TRUE(input.has_value()) << input.error();

    const auto* hello = std::get_if<Hello>(&input.value());
    ASSERT_NE(hello, nullptr);
    EXPECT_EQ(hello->protocol, "nu-plugin");
    EXPECT_EQ(hello->version, "0.102.0");
}

TEST(PluginProtocolTest, DecodesCalls)
{
    const auto metadata = DecodeInput(Json::parse(R"({"Call": [3, "Metadata"]})"));
    ASSERT_TRUE(metadata.has_value());
    const auto& metadata_call = std::get<Call>(metadata.value());
    EXPECT_EQ(metadata_call.id, 3u);
    EXPECT_TRUE(std::holds_alternative<MetadataCall>(metadata_call.payload));

    const auto signature = DecodeInput(Json::parse(R"({"Call": [4, "Signature"]})"));
    ASSERT_TRUE(signature.has_value());
    EXPECT_TRUE(std::holds_alternative<SignatureCall>(std::get<Call>(signature.value()).payload));

    const auto run = DecodeInput(Json::parse(R"({"Call": [5, {"Run": {"name": "file-dialog", "call": {"head": {"start": 0, "end": 11}, "positional": [], "named": []}, "input": "Empty"}}]})"));
    ASSERT_TRUE(run.has_value()) << run.error();
    const auto& run_call = std::get<Call>(run.value());
    EXPECT_EQ(run_call.id, 5u);
    const auto* run_payload = std::get_if<RunCall>(&run_call.payload);
    ASSERT_NE(run_payload, nullptr);
    EXPECT_EQ(run_payload->name, "file-dialog");
    EXPECT_EQ(run_payload->input, "Empty");

    const auto custom = DecodeInput(Json::parse(R"({"Call": [6, {"CustomValueOp": [null, "ToBaseValue"]}]})"));
    ASSERT_TRUE(custom.has_value());
    EXPECT_TRUE(std::holds_alternative<CustomValueOpCall>(std::get<Call>(custom.value()).payload));
}

TEST(PluginProtocolTest, DecodesGoodbyeAndIgnoredMessages)
{
    const auto goodbye = DecodeInput(Json("Goodbye"));
    ASSERT_TRUE(goodbye.has_value());
    EXPECT_TRUE(std::holds_alternative<Goodbye>(goodbye.value()));

    const auto signal = DecodeInput(Json::parse(R"({"Signal": "Interrupt"})"));
    ASSERT_TRUE(signal.has_value());
    const auto* ignored = std::get_if<Ignored>(&signal.value());
    ASSERT_NE(ignored, nullptr);
    EXPECT_EQ(ignored->kind, "Signal");
}

TEST(PluginProtocolTest, DecodesEngineCallResponses)
{
    const auto value = DecodeInput(
        Json::parse(R"({"EngineCallResponse": [2, {"PipelineData": {"Value": [{"String": {"val": "/home", "span": {"start": 0, "end": 0}}}, null]}}]})"));
    ASSERT_TRUE(value.has_value()) << value.error();
    const auto& value_response = std::get<EngineCallResponse>(value.value());
    EXPECT_EQ(value_response.id, 2u);
    ASSERT_TRUE(value_response.result.has_value());
    EXPECT_EQ(NuValue::AsString(*value_response.result), "/home");

    const auto error = DecodeInput(
        Json::parse(R"({"EngineCallResponse": [3, {"Error": {"GenericError": {"error": "x", "msg": "no cwd"}}}]})"));
    ASSERT_TRUE(error.has_value()) << error.error();
    const auto& error_response = std::get<EngineCallResponse>(error.value());
    EXPECT_EQ(error_response.id, 3u);
    ASSERT_FALSE(error_response.result.has_value());
    EXPECT_EQ(error_response.result.error(), "no cwd");
}

TEST(PluginProtocolTest, RejectsMalformedMessages)
{
    EXPECT_FALSE(DecodeInput(Json::parse(R"({"Call": [1]})")).has_value());
    EXPECT_FALSE(DecodeInput(Json::parse(R"({"Call": ["one", "Metadata"]})")).has_value());
    EXPECT_FALSE(DecodeInput(Json::parse(R"({"Call": [1, "Explode"]})")).has_value());
    EXPECT_FALSE(DecodeInput(Json::parse(R"({"Hello": {"protocol": "nu-plugin"}})")).has_value());
    EXPECT_FALSE(DecodeInput(Json::parse(R"({"Hello": 1, "Call": 2})")).has_value());
    EXPECT_FALSE(DecodeInput(Json::parse("42")).has_value());
}

TEST(PluginProtocolTest, CompatibilityComparesMajorAndMinor)
{
    const std::string version(kNuVersion);
    const std::string major_minor = version.substr(0, version.rfind('.'));

    EXPECT_TRUE(CheckCompatibility({.protocol = "nu-plugin", .version = version}).has_value());
    EXPECT_TRUE(CheckCompatibility({.protocol = "nu-plugin", .version = major_minor + ".99"}).has_value());
    EXPECT_FALSE(CheckCompatibility({.protocol = "nu-plugin", .version = "999.0.0"}).has_value());
    EXPECT_FALSE(CheckCompatibility({.protocol = "nu-plugin", .version = "garbage"}).has_value());
    EXPECT_FALSE(CheckCompatibility({.protocol = "other", .version = version}).has_value());
}

TEST(PluginProtocolTest, ExtractsPipelineValue)
{
    const Json with_metadata = Json::parse(R"({"Value": [{"Nothing": {"span": {"start": 0, "end": 0}}}, null]})");
    const auto value = ExtractPipelineValue(with_metadata);
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(value->contains("Nothing"));

    const Json bare = Json::parse(R"({"Value": {"Bool": {"val": true, "span": {"start": 0, "end": 0}}}})");
    const auto bare_value = ExtractPipelineValue(bare);
    ASSERT_TRUE(bare_value.has_value());
    EXPECT_EQ(NuValue::AsBool(*bare_value), true);

    EXPECT_FALSE(ExtractPipelineValue(Json("Empty")).has_value());
    EXPECT_FALSE(ExtractPipelineValue(Json::parse(R"({"ListStream": {}})")).has_value());
}

TEST(PluginProtocolTest, SerializesLabeledError)
{
    const Json json = MakeErrorResponse(
        4,
        LabeledError("Cannot select multiple directories").WithLabel("here", {.start = 1, .end = 2}).WithHelp("pick one"));

    const Json& error = json.at("CallResponse").at(1).at("Error");
    EXPECT_EQ(error.at("msg"), "Cannot select multiple directories");
    EXPECT_EQ(error.at("labels"), Json::parse(R"([{"text": "here", "span": {"start": 1, "end": 2}}])"));
    EXPECT_EQ(error.at("help"), "pick one");
    EXPECT_TRUE(error.at("code").is_null());
    EXPECT_TRUE(error.at("url").is_null());
    EXPECT_TRUE(error.at("inner").empty());
}

TEST(PluginProtocolTest, ErrorMessageFromShellError)
{
    EXPECT_EQ(ErrorMessageFromJson(Json("plain")), "plain");
    EXPECT_EQ(ErrorMessageFromJson(Json::parse(R"({"msg": "labeled"})")), "labeled");
    EXPECT_EQ(ErrorMessageFromJson(Json::parse(R"({"IOError": {"msg": "denied"}})")), "denied");
    EXPECT_EQ(ErrorMessageFromJson(Json::parse(R"({"NotFound": {}})")), "NotFound");
}

TEST(EvaluatedCallTest, FlagsAndValues)
{
    const EvaluatedCall call = CallBuilder{}
                                   .Switch("multiple")
                                   .Flag("dir-only", NuValue::Bool(false, kHeadSpan))
                                   .Flag("title", StringValue("Pick"))
                                   .Build();

    EXPECT_TRUE(call.HasFlag("multiple"));
    EXPECT_FALSE(call.HasFlag("dir-only"));
    EXPECT_FALSE(call.HasFlag("save"));

    const auto title = call.GetFlagValue("title");
    ASSERT_TRUE(title.has_value());
    EXPECT_EQ(NuValue::AsString(*title), "Pick");
    EXPECT_FALSE(call.GetFlagValue("multiple").has_value());

    EXPECT_EQ(call.FlagSpan("title"), CallBuilder::FlagSpan(2));
    EXPECT_EQ(call.FlagSpan("save"), kHeadSpan);
}

TEST(EvaluatedCallTest, RejectsMalformedCall)
{
    EXPECT_FALSE(EvaluatedCall::FromJson(Json::parse(R"({"positional": [], "named": []})")).has_value());
    EXPECT_FALSE(
        EvaluatedCall::FromJson(Json::parse(R"({"head": {"start": 0, "end": 1}, "positional": [], "named": [1]})"))
            .has_value());
}

}  // namespace nu_plugin_file_dialog::test
