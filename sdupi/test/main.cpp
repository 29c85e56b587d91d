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

#include <sdupi/core/config.hpp>
#include <sdupi/core/log_level_map.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <gtest/gtest.h>

int main(int argc, char *argv[])
{
    using namespace sdupi;
    testing::InitGoogleTest(&argc, argv); // Process GoogleTest flags.

    auto log_level = quill::LogLevel::None;

    CLI::App app{"sdupi unit tests runner"};
    app.add_option(
           "--log_level",
           log_level,
           "Logging level: debug, info, warning, error, critical or none")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    CLI11_PARSE(app, argc, argv);

    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    int return_code = RUN_ALL_TESTS();

    if (::testing::UnitTest::GetInstance()->test_to_run_count() == 0) {
        LOG_ERROR("No tests were run.");
        return_code = -1;
    }

    quill::flush();

    return return_code;
}
