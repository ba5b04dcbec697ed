// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <tyde/core/config.hpp>
#include <tyde/core/likely.h>
#include <tyde/decode/decode_error.hpp>
#include <tyde/decode/fmt/decode_error_fmt.hpp>
#include <tyde/decode/value.hpp>
#include <tyde/schema/schema.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

TYDE_ANONYMOUS_NAMESPACE_BEGIN

std::unordered_map<std::string, quill::LogLevel> const log_level_map = {
    {"trace", quill::LogLevel::TraceL1},
    {"debug", quill::LogLevel::Debug},
    {"info", quill::LogLevel::Info},
    {"warning", quill::LogLevel::Warning},
    {"error", quill::LogLevel::Error},
    {"critical", quill::LogLevel::Critical},
    {"none", quill::LogLevel::None}};

// process exit status, the worst outcome over all inputs
enum class CheckStatus : int
{
    Valid = 0,
    Invalid = 1,
    Unusable = 2,
};

std::optional<Value> load_json(fs::path const &path)
{
    std::ifstream ifile{path};
    if (TYDE_UNLIKELY(!ifile)) {
        LOG_ERROR("cannot open {}", path.string());
        return std::nullopt;
    }
    try {
        return Value::parse(ifile);
    }
    catch (nlohmann::json::parse_error const &e) {
        LOG_ERROR("cannot parse {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

CheckStatus check(
    Decoder<Value> const &decoder, fs::path const &input, bool const quiet)
{
    auto const document = load_json(input);
    if (!document.has_value()) {
        return CheckStatus::Unusable;
    }
    auto const result = decoder.decode(*document);
    if (result.has_error()) {
        auto const &error = result.assume_error();
        LOG_ERROR(
            "{} is invalid, {} error(s):\n{}",
            input.string(),
            error.leaves().size(),
            error);
        return CheckStatus::Invalid;
    }
    LOG_INFO("{} is valid", input.string());
    if (!quiet) {
        std::cout << result.assume_value().dump(2) << std::endl;
    }
    return CheckStatus::Valid;
}

CheckStatus check_all(
    fs::path const &schema_path,
    std::vector<fs::path> const &inputs,
    bool const quiet)
{
    auto const schema_document = load_json(schema_path);
    if (!schema_document.has_value()) {
        return CheckStatus::Unusable;
    }
    auto const decoder = schema::compile(*schema_document);
    if (decoder.has_error()) {
        LOG_ERROR(
            "schema {} is invalid:\n{}",
            schema_path.string(),
            decoder.assume_error());
        return CheckStatus::Unusable;
    }
    LOG_DEBUG("compiled schema {}", schema_path.string());

    auto worst = CheckStatus::Valid;
    for (auto const &input : inputs) {
        worst = std::max(worst, check(decoder.assume_value(), input, quiet));
    }
    LOG_INFO("checked {} document(s)", inputs.size());
    return worst;
}

TYDE_ANONYMOUS_NAMESPACE_END

int main(int const argc, char const *argv[])
{
    using namespace tyde;

    CLI::App cli{"tyde_check"};
    cli.option_defaults()->always_capture_default();

    fs::path schema_path;
    std::vector<fs::path> inputs;
    bool quiet = false;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--schema", schema_path, "schema document")->required();
    cli.add_option("inputs", inputs, "documents to check against the schema")
        ->required();
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_flag("-q,--quiet", quiet, "do not print the normalized documents");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        cli.exit(e);
        return static_cast<int>(CheckStatus::Unusable);
    }

    // stdout carries only the normalized documents
    auto stderr_handler = quill::stderr_handler();
    stderr_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stderr_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto const status = check_all(schema_path, inputs, quiet);
    quill::flush();
    return static_cast<int>(status);
}
