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

#include "scenario.hpp"

#include <accrual/core/log_level_map.hpp>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

int main(int const argc, char const *argv[])
{
    using namespace accrual;

    CLI::App cli{"accrual_replay"};
    cli.option_defaults()->always_capture_default();

    std::filesystem::path scenario_path{};
    std::filesystem::path output_path{};
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--scenario", scenario_path, "scenario json file")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option(
        "--output",
        output_path,
        "path to write the replay report to, stdout when not given");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::RequiredError const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    ReplayReport report;
    try {
        std::ifstream ifile{scenario_path};
        if (!ifile) {
            throw std::runtime_error("cannot open scenario file");
        }
        auto const scenario = parse_scenario(nlohmann::json::parse(ifile));
        LOG_INFO(
            "replaying {} calls from {}",
            scenario.calls.size(),
            scenario_path.string());
        report = replay_scenario(scenario);
    }
    catch (std::exception const &e) {
        LOG_ERROR("{}: {}", scenario_path.string(), e.what());
        quill::flush();
        return EXIT_FAILURE;
    }

    if (output_path.empty()) {
        quill::flush();
        std::cout << report.json.dump(2) << std::endl;
    }
    else {
        std::ofstream ofile{output_path};
        ofile << report.json.dump(2) << std::endl;
        if (!ofile) {
            LOG_ERROR("failed to write report to {}", output_path.string());
            quill::flush();
            return EXIT_FAILURE;
        }
        LOG_INFO("report written to {}", output_path.string());
    }

    if (report.violations != 0) {
        LOG_ERROR("{} calls did not meet expectations", report.violations);
        quill::flush();
        return EXIT_FAILURE;
    }

    quill::flush();
    return EXIT_SUCCESS;
}
