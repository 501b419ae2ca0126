#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "dialog_backend.hpp"
#include "plugin_server.hpp"

namespace nu_plugin_file_dialog
{

class FileDialogCommand : public IPluginCommand
{
public:
    static constexpr std::string_view kName = "file-dialog";

    explicit FileDialogCommand(std::unique_ptr<IDialogBackend> backend);

    [[nodiscard]] const CommandSignature& GetSignature() const override { return signature_; }

    [[nodiscard]] tl::expected<Json, LabeledError>
    Run(IEngineInterface& engine, const EvaluatedCall& call, const Json& input) override;

    [[nodiscard]] static CommandSignature MakeSignature();

    // Open-multiple gives a list even for a single path, other modes a string. Empty paths mean cancellation.
    [[nodiscard]] static Json MakeResultValue(DialogMode mode, const std::vector<fs::path>& paths, const Span& span);

private:
    [[nodiscard]] std::vector<fs::path> ShowDialog(const DialogRequest& request);

    std::unique_ptr<IDialogBackend> backend_;
    CommandSignature signature_;
};

}  // namespace nu_plugin_file_dialog
