#include <gtest/gtest.h>

#include "file_dialog_command.hpp"
#include "path_helpers.hpp"
#include "test_helpers.hpp"

namespace nu_plugin_file_dialog::test
{

class FileDialogCommandTest : public ::testing::Test
{
protected:
    FileDialogCommandTest()
        : state_(std::make_shared<FakeDialogBackend::State>()),
          command_(std::make_unique<FakeDialogBackend>(state_)),
          engine_(std::filesystem::temp_directory_path())
    {
    }

    tl::expected<Json, LabeledError> Run(const CallBuilder& builder)
    {
        return command_.Run(engine_, builder.Build(), Json("Empty"));
    }

    static std::string Utf8(const std::filesystem::path& path) { return PathHelpers::PathToUTF8(path); }

    std::shared_ptr<FakeDialogBackend::State> state_;
    FileDialogCommand command_;
    FakeEngine engine_;
};

TEST_F(FileDialogCommandTest, SingleSelectionIsString)
{
    const auto selected = std::filesystem::temp_directory_path() / "picture.png";
    state_->paths = {selected};

    const auto result = Run(CallBuilder{});
    ASSERT_TRUE(result.has_value()) << result.error().msg;
    EXPECT_EQ(NuValue::AsString(*result), Utf8(selected));
    EXPECT_EQ(NuValue::GetSpan(*result), kHeadSpan);
}

TEST_F(FileDialogCommandTest, MultipleWithOneSelectionIsStillList)
{
    const auto selected = std::filesystem::temp_directory_path() / "picture.png";
    state_->paths = {selected};

    const auto result = Run(CallBuilder{}.Switch("multiple"));
    ASSERT_TRUE(result.has_value()) << result.error().msg;

    const Json* list = NuValue::AsList(*result);
    ASSERT_NE(list, nullptr) << result->dump();
    ASSERT_EQ(list->size(), 1u);
    EXPECT_EQ(NuValue::AsString(list->at(0)), Utf8(selected));
}

TEST_F(FileDialogCommandTest, MultipleKeepsSelectionOrder)
{
    const auto dir = std::filesystem::temp_directory_path();
    state_->paths = {dir / "b.png", dir / "a.png", dir / "c.png"};

    const auto result = Run(CallBuilder{}.Switch("multiple"));
    ASSERT_TRUE(result.has_value());

    const Json* list = NuValue::AsList(*result);
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(list->size(), 3u);
    EXPECT_EQ(NuValue::AsString(list->at(0)), Utf8(dir / "b.png"));
    EXPECT_EQ(NuValue::AsString(list->at(1)), Utf8(dir / "a.png"));
    EXPECT_EQ(NuValue::AsString(list->at(2)), Utf8(dir / "c.png"));
}

TEST_F(FileDialogCommandTest, CancelIsEmptyStringNotError)
{
    const auto result = Run(CallBuilder{});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(NuValue::AsString(*result), "");
}

TEST_F(FileDialogCommandTest, CancelWithMultipleIsEmptyList)
{
    const auto result = Run(CallBuilder{}.Switch("multiple"));
    ASSERT_TRUE(result.has_value());

    const Json* list = NuValue::AsList(*result);
    ASSERT_NE(list, nullptr);
    EXPECT_TRUE(list->empty());
}

TEST_F(FileDialogCommandTest, BackendFailureIsEmptyResult)
{
    state_->fail = true;

    const auto single = Run(CallBuilder{}.Switch("dir-only"));
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(NuValue::AsString(*single), "");

    const auto multiple = Run(CallBuilder{}.Switch("multiple"));
    ASSERT_TRUE(multiple.has_value());
    ASSERT_NE(NuValue::AsList(*multiple), nullptr);
    EXPECT_TRUE(NuValue::AsList(*multiple)->empty());
}

TEST_F(FileDialogCommandTest, RequestIsForwardedToBackend)
{
    Json filters = Json::object();
    filters["CSV"] = StringList({"csv"});

    const auto result = Run(CallBuilder{}
                                .Switch("save")
                                .Flag("title", StringValue("Export"))
                                .Flag("default-name", StringValue("report.csv"))
                                .Flag("filter", NuValue::Record(std::move(filters), kHeadSpan)));
    ASSERT_TRUE(result.has_value()) << result.error().msg;

    ASSERT_EQ(state_->requests.size(), 1u);
    const DialogRequest& request = state_->requests.front();
    EXPECT_EQ(request.mode, DialogMode::SaveFile);
    EXPECT_EQ(request.title, "Export");
    EXPECT_EQ(request.default_name, "report.csv");
    ASSERT_TRUE(request.default_path.has_value());
    EXPECT_EQ(Utf8(*request.default_path), Utf8(std::filesystem::temp_directory_path()));
    ASSERT_EQ(request.filters.size(), 1u);
    EXPECT_EQ(request.filters[0].name, "CSV");
    EXPECT_EQ(engine_.current_dir_requests, 1);
}

TEST_F(FileDialogCommandTest, UsageErrorDoesNotShowDialog)
{
    const auto result = Run(CallBuilder{}.Switch("multiple").Switch("dir-only"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().msg, "Cannot select multiple directories");
    EXPECT_TRUE(state_->requests.empty());
}

TEST_F(FileDialogCommandTest, CurrentDirFailureIsError)
{
    engine_.fail = true;

    const auto result = Run(CallBuilder{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().msg, "Could not get the current directory");
    ASSERT_EQ(result.error().labels.size(), 1u);
    EXPECT_EQ(result.error().labels[0].text, "engine went away");
    EXPECT_TRUE(state_->requests.empty());
}

TEST(FileDialogSignatureTest, DescribesAllFlags)
{
    const CommandSignature signature = FileDialogCommand::MakeSignature();
    EXPECT_EQ(signature.GetName(), "file-dialog");

    const std::vector<std::pair<std::string, char>> expected_flags{
        {"help", 'h'},
        {"multiple", 'm'},
        {"dir-only", 'd'},
        {"save", 's'},
        {"base-dir", 'b'},
        {"title", 't'},
        {"filter", 'f'},
        {"default-name", 'n'},
    };

    for (const auto& [long_name, short_name] : expected_flags)
    {
        const CommandFlag* flag = signature.FindFlag(long_name);
        ASSERT_NE(flag, nullptr) << long_name;
        EXPECT_EQ(flag->short_name, short_name) << long_name;
    }

    EXPECT_TRUE(signature.FindFlag("multiple")->shape.is_null());
    EXPECT_EQ(signature.FindFlag("base-dir")->shape, nu_shapes::Directory());
    EXPECT_EQ(signature.FindFlag("filter")->shape, nu_shapes::AnyRecord());
}

TEST(FileDialogSignatureTest, SerializesPluginSignature)
{
    const Json json = FileDialogCommand::MakeSignature().ToJson();

    const Json& sig = json.at("sig");
    EXPECT_EQ(sig.at("name"), "file-dialog");
    EXPECT_EQ(sig.at("description"), "Select file(s) using the native dialog");
    EXPECT_EQ(sig.at("category"), "FileSystem");

    const Json& io_types = sig.at("input_output_types");
    ASSERT_EQ(io_types.size(), 2u);
    EXPECT_EQ(io_types[0], Json::array({"Nothing", "String"}));
    EXPECT_EQ(io_types[1], Json::parse(R"(["Nothing", {"List": "String"}])"));

    const Json& named = sig.at("named");
    ASSERT_EQ(named.size(), 8u);
    EXPECT_EQ(named[1].at("long"), "multiple");
    EXPECT_EQ(named[1].at("short"), "m");
    EXPECT_TRUE(named[1].at("arg").is_null());
    EXPECT_EQ(named[4].at("arg"), "Directory");

    ASSERT_EQ(json.at("examples").size(), 2u);
    EXPECT_EQ(
        json.at("examples")[0].at("example"),
        "file-dialog -m -b ~/Images -f {Normal: [png, jpg], Weird: [webp]}");
}

}  // namespace nu_plugin_file_dialog::test
